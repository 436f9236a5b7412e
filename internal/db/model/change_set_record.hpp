#pragma once

#include <cstdint>
#include <string>

#include "infragraph/v1/change_set.pb.h"

namespace infragraph::db::model {

struct ChangeSetRecord {
  std::string id;
  std::string name;
  std::string workspace_id;

  infragraph::v1::ChangeSetStatus status = infragraph::v1::CHANGE_SET_STATUS_UNSPECIFIED;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace infragraph::db::model
