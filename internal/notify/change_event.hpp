#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/tier.hpp"

namespace infragraph::notify {

enum class EventKind : std::uint8_t {
  kEntity,
  kNode,
  kEdge,
  kChangeSet,
  kEditSession,
};

constexpr std::string_view ToString(EventKind kind) {
  switch (kind) {
    case EventKind::kEntity:
      return "entity";
    case EventKind::kNode:
      return "node";
    case EventKind::kEdge:
      return "edge";
    case EventKind::kChangeSet:
      return "change_set";
    case EventKind::kEditSession:
    default:
      return "edit_session";
  }
}

/*
  One committed mutation.

  For versioned records payload_json holds the new body (absent when
  deleted). For change sets / edit sessions it holds the lifecycle record
  and tier is the tier the lifecycle step touched.
*/
struct ChangeEvent {
  EventKind                  kind = EventKind::kEntity;
  std::string                object_id;
  std::string                workspace_id;
  model::TierKey             tier;
  std::optional<std::string> payload_json;
  bool                       deleted = false;
  std::uint64_t              version = 0;
};

// Callable sink for change events.
using ChangeSink = std::function<void(const ChangeEvent&)>;

} // namespace infragraph::notify
