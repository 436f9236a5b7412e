#pragma once

#include <cstdint>
#include <string>

#include "internal/model/tier.hpp"

namespace infragraph::db::model {

using infragraph::model::RecordKind;
using infragraph::model::TierKey;

/*
  Persistent versioned row.

  Layout: (object_id, tier discriminator, payload, audit metadata).

  - payload is the JSON document of the record's body message; kind_tag is
    the declared kind it must decode against.
  - tail/head_object_id are denormalized from edge payloads so successor
    scans stay index lookups. Empty for entities and nodes.
  - deleted marks a tombstone: the object is removed at this tier.
*/

struct RecordRow {
  RecordKind  record_kind = RecordKind::kEntity;
  std::string object_id;
  TierKey     tier;

  std::string workspace_id;
  std::string kind_tag;

  std::string tail_object_id;
  std::string head_object_id;

  std::string payload;
  bool        deleted = false;

  // audit
  uint64_t version       = 0;
  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace infragraph::db::model
