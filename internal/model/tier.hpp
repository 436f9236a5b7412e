#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace infragraph::model {

enum class TierKind : std::uint8_t {
  kHead        = 0,
  kChangeSet   = 1,
  kEditSession = 2,
};

constexpr std::string_view ToString(TierKind kind) {
  switch (kind) {
    case TierKind::kChangeSet:
      return "change_set";
    case TierKind::kEditSession:
      return "edit_session";
    case TierKind::kHead:
    default:
      return "head";
  }
}

/*
  Tier discriminator of a stored row.

  Head has no id. ChangeSet and EditSession carry the id of the owning
  change set / edit session.
*/
struct TierKey {
  TierKind    kind = TierKind::kHead;
  std::string id;

  static TierKey Head() {
    return {};
  }
  static TierKey ChangeSet(std::string change_set_id) {
    return {TierKind::kChangeSet, std::move(change_set_id)};
  }
  static TierKey EditSession(std::string edit_session_id) {
    return {TierKind::kEditSession, std::move(edit_session_id)};
  }

  bool IsHead() const {
    return kind == TierKind::kHead;
  }

  bool operator==(const TierKey&) const = default;
};

// "head", "change_set:<id>", "edit_session:<id>"
std::string ToString(const TierKey& tier);

std::optional<TierKind> TierKindFromInt(int value);

/*
  Record kinds sharing the versioned row layout.
*/
enum class RecordKind : std::uint8_t {
  kEntity = 1,
  kNode   = 2,
  kEdge   = 3,
};

constexpr std::string_view ToString(RecordKind kind) {
  switch (kind) {
    case RecordKind::kNode:
      return "node";
    case RecordKind::kEdge:
      return "edge";
    case RecordKind::kEntity:
    default:
      return "entity";
  }
}

std::optional<RecordKind> RecordKindFromInt(int value);

}  // namespace infragraph::model
