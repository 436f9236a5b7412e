#pragma once

#include <cstdint>
#include <string>

#include "infragraph/v1/change_set.pb.h"

namespace infragraph::db::model {

struct EditSessionRecord {
  std::string id;
  std::string name;
  std::string change_set_id;
  std::string workspace_id;

  infragraph::v1::EditSessionStatus status = infragraph::v1::EDIT_SESSION_STATUS_UNSPECIFIED;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace infragraph::db::model
