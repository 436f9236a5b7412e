#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/notify/notification_batch.hpp"

namespace infragraph::core {

/*
  One repository transaction plus the change events it produces.

  Events queued through Queue() reach the notifier only after Commit()
  succeeded. Destroying an uncommitted unit of work rolls the transaction
  back and drops its events.
*/
class UnitOfWork {
 public:
  enum class Mode {
    kReadWrite,
    kReadOnly,
  };

  UnitOfWork(db::Repository& repository, std::shared_ptr<notify::ChangeNotifier> notifier, Mode mode = Mode::kReadWrite);

  UnitOfWork(const UnitOfWork&)            = delete;
  UnitOfWork& operator=(const UnitOfWork&) = delete;

  db::Repository& Repository() {
    return repository_;
  }
  db::Transaction& Tx() {
    return *tx_;
  }

  bool IsReadOnly() const {
    return mode_ == Mode::kReadOnly;
  }

  void Queue(notify::ChangeEvent event);

  // Throws util::Conflict / util::PersistenceError when the backend refuses.
  void Commit();

 private:
  db::Repository&                  repository_;
  std::unique_ptr<db::Transaction> tx_;
  notify::NotificationBatch        batch_;
  Mode                             mode_;
};

} // namespace infragraph::core
