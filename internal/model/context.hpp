#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/tier.hpp"

namespace infragraph::model {

/*
  Explicit read/write context threaded through every call.

  Reads resolve along ResolutionChain(): edit session row, then change set
  row, then head. Writes land on the most specific tier given.
*/
struct Context {
  std::string                workspace_id;
  std::optional<std::string> change_set_id;
  std::optional<std::string> edit_session_id;

  static Context Head(std::string workspace_id = {});
  static Context ForChangeSet(std::string workspace_id, std::string change_set_id);
  static Context ForEditSession(std::string workspace_id, std::string change_set_id, std::string edit_session_id);

  std::vector<TierKey> ResolutionChain() const;
};

std::string Describe(const Context& ctx);

}  // namespace infragraph::model
