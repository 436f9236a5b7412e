#pragma once

#include <memory>
#include <vector>

#include "internal/notify/change_notifier.hpp"

namespace infragraph::notify {

/*
  Events queued while a transaction is open.

  Flush() hands them to the notifier in queue order; it must only be called
  after the transaction committed. A batch destroyed without Flush()
  publishes nothing.
*/
class NotificationBatch {
 public:
  explicit NotificationBatch(std::shared_ptr<ChangeNotifier> notifier);

  NotificationBatch(const NotificationBatch&)            = delete;
  NotificationBatch& operator=(const NotificationBatch&) = delete;

  void Queue(ChangeEvent event);

  // Returns the number of events published.
  std::size_t Flush();

  void Discard();

  std::size_t Size() const {
    return pending_.size();
  }

 private:
  std::shared_ptr<ChangeNotifier> notifier_;
  std::vector<ChangeEvent>        pending_;
};

} // namespace infragraph::notify
