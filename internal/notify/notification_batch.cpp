#include "internal/notify/notification_batch.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace infragraph::notify {

NotificationBatch::NotificationBatch(std::shared_ptr<ChangeNotifier> notifier) : notifier_(std::move(notifier)) {
}

void NotificationBatch::Queue(ChangeEvent event) {
  pending_.push_back(std::move(event));
}

std::size_t NotificationBatch::Flush() {
  auto events = std::move(pending_);
  pending_.clear();
  if (!notifier_) {
    return 0;
  }

  std::size_t published = 0;
  for (const auto& event : events) {
    // the mutation is committed; a failing consumer must not undo that
    try {
      notifier_->Publish(event);
      ++published;
    } catch (const std::exception& e) {
      INFRAGRAPH_LOG_ERROR("change notification failed", {observability::StringField("kind", ToString(event.kind)),
                                                           observability::StringField("object_id", event.object_id),
                                                           observability::StringField("error", e.what())});
    }
  }
  return published;
}

void NotificationBatch::Discard() {
  pending_.clear();
}

} // namespace infragraph::notify
