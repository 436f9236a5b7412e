#include "internal/notify/logging_notifier.hpp"

#include "internal/observability/logging.hpp"

namespace infragraph::notify {

void LoggingNotifier::Publish(const ChangeEvent& event) {
  INFRAGRAPH_LOG_INFO("change", {observability::StringField("kind", ToString(event.kind)),
                                 observability::StringField("object_id", event.object_id),
                                 observability::StringField("workspace_id", event.workspace_id),
                                 observability::StringField("tier", model::ToString(event.tier)),
                                 observability::IntField("version", static_cast<std::int64_t>(event.version)),
                                 observability::BoolField("deleted", event.deleted)});
}

} // namespace infragraph::notify
