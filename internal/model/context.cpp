#include "internal/model/context.hpp"

namespace infragraph::model {

Context Context::Head(std::string workspace_id) {
  Context ctx;
  ctx.workspace_id = std::move(workspace_id);
  return ctx;
}

Context Context::ForChangeSet(std::string workspace_id, std::string change_set_id) {
  Context ctx;
  ctx.workspace_id  = std::move(workspace_id);
  ctx.change_set_id = std::move(change_set_id);
  return ctx;
}

Context Context::ForEditSession(std::string workspace_id, std::string change_set_id, std::string edit_session_id) {
  Context ctx;
  ctx.workspace_id    = std::move(workspace_id);
  ctx.change_set_id   = std::move(change_set_id);
  ctx.edit_session_id = std::move(edit_session_id);
  return ctx;
}

std::vector<TierKey> Context::ResolutionChain() const {
  std::vector<TierKey> chain;
  chain.reserve(3);
  if (edit_session_id) {
    chain.push_back(TierKey::EditSession(*edit_session_id));
  }
  if (change_set_id) {
    chain.push_back(TierKey::ChangeSet(*change_set_id));
  }
  chain.push_back(TierKey::Head());
  return chain;
}

std::string Describe(const Context& ctx) {
  std::string out = "workspace=" + (ctx.workspace_id.empty() ? std::string("*") : ctx.workspace_id);
  if (ctx.change_set_id) {
    out += " change_set=" + *ctx.change_set_id;
  }
  if (ctx.edit_session_id) {
    out += " edit_session=" + *ctx.edit_session_id;
  }
  return out;
}

}  // namespace infragraph::model
