#pragma once

#include <cstdint>
#include <map>
#include <mutex>

#include "internal/notify/change_notifier.hpp"

namespace infragraph::notify {

/*
  In-process fan-out to subscribed sinks.

  Sinks run on the publishing thread, in subscription order. A throwing
  sink is logged and skipped; the remaining sinks still receive the event.
*/
class NotifierHub final : public ChangeNotifier {
 public:
  using SubscriptionId = std::uint64_t;

  SubscriptionId Subscribe(ChangeSink sink);
  bool           Unsubscribe(SubscriptionId id);

  std::size_t SubscriberCount() const;

  void Publish(const ChangeEvent& event) override;

 private:
  mutable std::mutex                   mutex_;
  std::map<SubscriptionId, ChangeSink> sinks_;
  SubscriptionId                       next_id_ = 1;
};

} // namespace infragraph::notify
