#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

using infragraph::model::Context;

int main(int argc, char** argv) {
  // Optional config path; the in-memory backend is used otherwise.
  infragraph::runtime::config::RuntimeConfig config;
  if (argc > 1) {
    config = infragraph::config::ConfigLoader::LoadFromYaml(argv[1]);
  }

  auto rt = infragraph::factory::BuildRuntime(config);

  rt.notifier->Subscribe([](const infragraph::notify::ChangeEvent& event) {
    std::cout << "event " << infragraph::notify::ToString(event.kind) << " " << event.object_id << " @ " << infragraph::model::ToString(event.tier)
              << (event.deleted ? " (deleted)" : "") << '\n';
  });

  const std::string workspace = "workspace-1";

  // Open a change set and an edit session inside it.
  const auto change_set = rt.change_sets->New(workspace, "example");
  const auto session    = rt.edit_sessions->New(change_set.id(), workspace);

  const auto in_session    = Context::ForEditSession(workspace, change_set.id(), session.id());
  const auto in_change_set = Context::ForChangeSet(workspace, change_set.id());

  // Draft an application; only the session sees it.
  const auto app = rt.store->WriteEntity("app-1", in_session, [](infragraph::v1::EntityBody& body) {
    body.set_entity_type("application");
    body.set_name("app-1");
    body.mutable_application()->set_description("example application");
  });
  std::cout << "drafted " << app.object_id << " version " << app.audit.version << '\n';

  try {
    rt.store->ResolveEntity("app-1", in_change_set);
    std::cerr << "draft leaked into the change set\n";
    return 1;
  } catch (const infragraph::util::NotFound&) {
    std::cout << "change set does not see the draft yet\n";
  }

  // Save folds the draft into the change set; apply publishes it at head.
  rt.edit_sessions->Save(session.id());
  std::cout << "change set sees: " << rt.store->ResolveEntity("app-1", in_change_set).body.name() << '\n';

  rt.change_sets->Apply(change_set.id());
  std::cout << "head sees: " << rt.store->ResolveEntity("app-1", Context::Head(workspace)).body.name() << '\n';

  try {
    rt.change_sets->Apply(change_set.id());
  } catch (const infragraph::util::InvalidState& e) {
    std::cout << "second apply rejected: " << e.what() << '\n';
  }

  return 0;
}
