#pragma once

#include <cstdint>
#include <string>

#include "infragraph/v1.hpp"
#include "internal/model/record_traits.hpp"
#include "internal/model/tier.hpp"

namespace infragraph::model {

struct Audit {
  std::uint64_t version       = 0;
  std::uint64_t created_at_ms = 0;
  std::uint64_t updated_at_ms = 0;
};

/*
  One resolved row of the versioned graph.

  Entity, Node and Edge differ only in their payload schema; the tier
  resolution logic is shared and parameterized by Body through RecordTraits.
*/
template <typename Body>
struct VersionedRecord {
  using BodyType = Body;

  std::string object_id;
  std::string workspace_id;
  TierKey     tier;
  Body        body;
  Audit       audit;

  const std::string& Kind() const {
    return RecordTraits<Body>::KindTag(body);
  }
};

using Entity = VersionedRecord<v1::EntityBody>;
using Node   = VersionedRecord<v1::NodeBody>;
using Edge   = VersionedRecord<v1::EdgeBody>;

}  // namespace infragraph::model
