#include "internal/graph/edge_kind_registry.hpp"

#include "internal/model/record_traits.hpp"
#include "internal/util/errors.hpp"

namespace infragraph::graph {

EdgeKindSpec Require(const EdgeKindRegistry& registry, const std::string& name) {
  auto declared = registry.Find(name);
  if (!declared) {
    throw util::InvalidArgument("unknown edge kind '" + name + "'");
  }
  return *declared;
}

std::vector<EdgeKindSpec> BuiltinEdgeKinds() {
  return {
      {std::string(model::kIncludesEdge), true},
      {"Configures", false},
      {"Deployment", true},
      {"Component", true},
  };
}

StaticEdgeKindRegistry::StaticEdgeKindRegistry() : StaticEdgeKindRegistry(BuiltinEdgeKinds()) {
}

StaticEdgeKindRegistry::StaticEdgeKindRegistry(const std::vector<EdgeKindSpec>& kinds) {
  for (const auto& kind : kinds) {
    if (kind.name.empty()) {
      throw util::InvalidArgument("edge kind name must not be empty");
    }
    if (!kinds_.emplace(kind.name, kind).second) {
      throw util::InvalidArgument("edge kind '" + kind.name + "' declared twice");
    }
  }
}

std::shared_ptr<StaticEdgeKindRegistry> StaticEdgeKindRegistry::FromConfig(const infragraph::runtime::config::GraphConfig& config) {
  if (config.edge_kinds().empty()) {
    return std::make_shared<StaticEdgeKindRegistry>();
  }

  std::vector<EdgeKindSpec> kinds;
  kinds.reserve(config.edge_kinds_size());
  for (const auto& kind : config.edge_kinds()) {
    kinds.push_back({kind.name(), kind.acyclic()});
  }
  return std::make_shared<StaticEdgeKindRegistry>(kinds);
}

std::optional<EdgeKindSpec> StaticEdgeKindRegistry::Find(const std::string& name) const {
  auto it = kinds_.find(name);
  if (it == kinds_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<EdgeKindSpec> StaticEdgeKindRegistry::List() const {
  std::vector<EdgeKindSpec> out;
  out.reserve(kinds_.size());
  for (const auto& [name, kind] : kinds_) {
    out.push_back(kind);
  }
  return out;
}

} // namespace infragraph::graph
