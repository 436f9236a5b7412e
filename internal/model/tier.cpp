#include "internal/model/tier.hpp"

namespace infragraph::model {

std::string ToString(const TierKey& tier) {
  if (tier.kind == TierKind::kHead) {
    return std::string(ToString(tier.kind));
  }
  return std::string(ToString(tier.kind)) + ":" + tier.id;
}

std::optional<TierKind> TierKindFromInt(int value) {
  switch (value) {
    case static_cast<int>(TierKind::kHead):
      return TierKind::kHead;
    case static_cast<int>(TierKind::kChangeSet):
      return TierKind::kChangeSet;
    case static_cast<int>(TierKind::kEditSession):
      return TierKind::kEditSession;
    default:
      return std::nullopt;
  }
}

std::optional<RecordKind> RecordKindFromInt(int value) {
  switch (value) {
    case static_cast<int>(RecordKind::kEntity):
      return RecordKind::kEntity;
    case static_cast<int>(RecordKind::kNode):
      return RecordKind::kNode;
    case static_cast<int>(RecordKind::kEdge):
      return RecordKind::kEdge;
    default:
      return std::nullopt;
  }
}

}  // namespace infragraph::model
