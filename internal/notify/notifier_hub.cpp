#include "internal/notify/notifier_hub.hpp"

#include <exception>
#include <vector>

#include "internal/observability/logging.hpp"

namespace infragraph::notify {

NotifierHub::SubscriptionId NotifierHub::Subscribe(ChangeSink sink) {
  std::lock_guard lock(mutex_);
  auto            id = next_id_++;
  sinks_.emplace(id, std::move(sink));
  return id;
}

bool NotifierHub::Unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  return sinks_.erase(id) > 0;
}

std::size_t NotifierHub::SubscriberCount() const {
  std::lock_guard lock(mutex_);
  return sinks_.size();
}

void NotifierHub::Publish(const ChangeEvent& event) {
  // copy so sinks may (un)subscribe while being called
  std::vector<ChangeSink> sinks;
  {
    std::lock_guard lock(mutex_);
    sinks.reserve(sinks_.size());
    for (const auto& [_, sink] : sinks_) sinks.push_back(sink);
  }

  for (const auto& sink : sinks) {
    try {
      sink(event);
    } catch (const std::exception& e) {
      INFRAGRAPH_LOG_WARN("change subscriber failed", {observability::StringField("object_id", event.object_id),
                                                       observability::StringField("error", e.what())});
    }
  }
}

} // namespace infragraph::notify
