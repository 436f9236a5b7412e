#include "internal/core/unit_of_work.hpp"

#include <stdexcept>

#include "internal/core/db_errors.hpp"
#include "internal/observability/spans.hpp"

namespace infragraph::core {

UnitOfWork::UnitOfWork(db::Repository& repository, std::shared_ptr<notify::ChangeNotifier> notifier, Mode mode)
    : repository_(repository), batch_(std::move(notifier)), mode_(mode) {
  try {
    tx_ = mode_ == Mode::kReadOnly ? repository_.BeginRead() : repository_.Begin();
  } catch (const db::DbError& e) {
    RethrowDbError(e, "begin transaction");
  }
}

void UnitOfWork::Queue(notify::ChangeEvent event) {
  if (IsReadOnly()) {
    throw std::logic_error("change event queued in a read-only unit of work");
  }
  batch_.Queue(std::move(event));
}

void UnitOfWork::Commit() {
  try {
    tx_->Commit();
  } catch (const db::DbError& e) {
    batch_.Discard();
    RethrowDbError(e, "commit");
  }

  observability::Metrics::Instance().AddPublishedEvents(batch_.Flush());
}

} // namespace infragraph::core
