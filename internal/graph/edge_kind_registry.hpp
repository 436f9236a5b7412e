#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"

namespace infragraph::graph {

struct EdgeKindSpec {
  std::string name;
  bool        acyclic = false;
};

/*
  Declares the edge kinds the services accept.

  The store treats edge kinds as opaque strings; only the services consult
  the registry, and they enforce the acyclic constraint themselves.
*/
class EdgeKindRegistry {
 public:
  virtual ~EdgeKindRegistry() = default;

  virtual std::optional<EdgeKindSpec> Find(const std::string& name) const = 0;

  // Ordered by name.
  virtual std::vector<EdgeKindSpec> List() const = 0;
};

// Throws util::InvalidArgument for an undeclared kind.
EdgeKindSpec Require(const EdgeKindRegistry& registry, const std::string& name);

// Includes, Configures, Deployment, Component.
std::vector<EdgeKindSpec> BuiltinEdgeKinds();

class StaticEdgeKindRegistry final : public EdgeKindRegistry {
 public:
  StaticEdgeKindRegistry();
  explicit StaticEdgeKindRegistry(const std::vector<EdgeKindSpec>& kinds);

  // An empty edge_kinds list yields the built-in kinds.
  static std::shared_ptr<StaticEdgeKindRegistry> FromConfig(const infragraph::runtime::config::GraphConfig& config);

  std::optional<EdgeKindSpec> Find(const std::string& name) const override;
  std::vector<EdgeKindSpec>   List() const override;

 private:
  std::map<std::string, EdgeKindSpec> kinds_;
};

} // namespace infragraph::graph
