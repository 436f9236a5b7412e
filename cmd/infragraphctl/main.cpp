#include <google/protobuf/util/json_util.h>

#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/record_traits.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

using infragraph::model::Context;

static void Usage() {
  std::cout << "Usage:\n"
            << "  infragraphctl --config <config.yaml> changeset new <workspace> [name]\n"
            << "  infragraphctl --config <config.yaml> changeset get|apply|abandon <change_set_id>\n"
            << "  infragraphctl --config <config.yaml> changeset list <workspace> [open|applied]\n"
            << "  infragraphctl --config <config.yaml> session new <change_set_id> [name]\n"
            << "  infragraphctl --config <config.yaml> session save|cancel <edit_session_id>\n"
            << "  infragraphctl --config <config.yaml> entity put <workspace> <entity_type> <name> [--id <object_id>] [ctx]\n"
            << "  infragraphctl --config <config.yaml> entity get|delete <workspace> <object_id> [ctx]\n"
            << "  infragraphctl --config <config.yaml> entity list <workspace> [entity_type] [ctx]\n"
            << "  infragraphctl --config <config.yaml> entity diff <workspace> <object_id> --cs <change_set_id> [--es <edit_session_id>]\n"
            << "  infragraphctl --config <config.yaml> edge put <workspace> <edge_kind> <tail_id> <head_id> [ctx]\n"
            << "  infragraphctl --config <config.yaml> successors <workspace> <edge_kind> <object_id> [ctx]\n"
            << "  infragraphctl --config <config.yaml> app create <workspace> <name>\n"
            << "  infragraphctl --config <config.yaml> app list <workspace>\n"
            << "  infragraphctl --config <config.yaml> app context <workspace> <application_id>\n"
            << "  infragraphctl --config <config.yaml> app entities <workspace> <application_id> [ctx]\n"
            << "\n"
            << "  ctx: [--cs <change_set_id>] [--es <edit_session_id>]\n";
}

namespace {

class UsageError : public std::runtime_error {
 public:
  explicit UsageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

struct Args {
  std::vector<std::string>           positional;
  std::map<std::string, std::string> options;

  const std::string& At(std::size_t i) const {
    if (i >= positional.size()) {
      throw UsageError("missing argument");
    }
    return positional[i];
  }

  std::string Opt(std::size_t i) const {
    return i < positional.size() ? positional[i] : std::string{};
  }

  Context ContextFor(const std::string& workspace_id) const {
    Context ctx = Context::Head(workspace_id);
    if (auto it = options.find("cs"); it != options.end()) {
      ctx.change_set_id = it->second;
    }
    if (auto it = options.find("es"); it != options.end()) {
      ctx.edit_session_id = it->second;
    }
    return ctx;
  }
};

Args Parse(int argc, char** argv, int first) {
  Args args;
  for (int i = first; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg.rfind("--", 0) == 0) {
      if (i + 1 >= argc) {
        throw UsageError("option " + arg + " needs a value");
      }
      args.options[arg.substr(2)] = argv[++i];
      continue;
    }
    args.positional.push_back(std::move(arg));
  }
  return args;
}

void Print(const google::protobuf::Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("render " + std::string(message.GetTypeName()) + ": " + std::string(status.message()));
  }
  std::cout << json << "\n";
}

template <typename Record>
void PrintRecord(const Record& record) {
  std::cout << record.object_id << " tier=" << infragraph::model::ToString(record.tier) << " version=" << record.audit.version << " ";
  Print(record.body);
}

int ChangeSetCommand(infragraph::factory::Runtime& rt, const Args& args) {
  const auto& sub = args.At(1);
  if (sub == "new") {
    Print(rt.change_sets->New(args.At(2), args.Opt(3)));
  } else if (sub == "get") {
    Print(rt.change_sets->Get(args.At(2)));
  } else if (sub == "apply") {
    Print(rt.change_sets->Apply(args.At(2)));
  } else if (sub == "abandon") {
    Print(rt.change_sets->Abandon(args.At(2)));
  } else if (sub == "list") {
    const auto which = args.Opt(3).empty() ? std::string("open") : args.Opt(3);
    if (which != "open" && which != "applied") {
      throw UsageError("list filter must be open or applied");
    }
    for (const auto& change_set : which == "open" ? rt.change_sets->ListOpen(args.At(2)) : rt.change_sets->ListApplied(args.At(2))) {
      Print(change_set);
    }
  } else {
    throw UsageError("unknown changeset command: " + sub);
  }
  return 0;
}

int SessionCommand(infragraph::factory::Runtime& rt, const Args& args) {
  const auto& sub = args.At(1);
  if (sub == "new") {
    Print(rt.edit_sessions->New(args.At(2), {}, args.Opt(3)));
  } else if (sub == "save") {
    Print(rt.edit_sessions->Save(args.At(2)));
  } else if (sub == "cancel") {
    Print(rt.edit_sessions->Cancel(args.At(2)));
  } else {
    throw UsageError("unknown session command: " + sub);
  }
  return 0;
}

int EntityCommand(infragraph::factory::Runtime& rt, const Args& args) {
  const auto& sub = args.At(1);
  const auto  ctx = args.ContextFor(args.At(2));

  if (sub == "put") {
    const auto  entity_type = args.At(3);
    const auto  name        = args.At(4);
    const auto  it          = args.options.find("id");
    const auto  object_id   = it == args.options.end() ? std::string{} : it->second;
    PrintRecord(rt.store->WriteEntity(object_id, ctx, [&](infragraph::v1::EntityBody& body) {
      body.set_entity_type(entity_type);
      body.set_name(name);
      if (body.properties_case() == infragraph::v1::EntityBody::PROPERTIES_NOT_SET) {
        if (entity_type == infragraph::model::kApplicationType) body.mutable_application();
        if (entity_type == infragraph::model::kSystemType) body.mutable_system();
        if (entity_type == infragraph::model::kServiceType) body.mutable_service();
      }
    }));
  } else if (sub == "get") {
    PrintRecord(rt.store->ResolveEntity(args.At(3), ctx));
  } else if (sub == "delete") {
    rt.node_service->DeleteObject(ctx, args.At(3));
    std::cout << "deleted\n";
  } else if (sub == "list") {
    for (const auto& entity : rt.store->ListEntities(ctx, args.Opt(3))) {
      PrintRecord(entity);
    }
  } else if (sub == "diff") {
    const auto diff = rt.store->Diff<infragraph::v1::EntityBody>(args.At(3), ctx);
    std::cout << (diff.head_json().empty() ? diff.current_json() : diff.diff()) << "\n";
  } else {
    throw UsageError("unknown entity command: " + sub);
  }
  return 0;
}

int AppCommand(infragraph::factory::Runtime& rt, const Args& args) {
  const auto& sub       = args.At(1);
  const auto& workspace = args.At(2);
  if (sub == "create") {
    Print(rt.application_service->Create(workspace, args.At(3)));
  } else if (sub == "list") {
    for (const auto& entry : rt.application_service->List(workspace)) {
      Print(entry);
    }
  } else if (sub == "context") {
    Print(rt.application_service->Context(args.At(3), workspace));
  } else if (sub == "entities") {
    Print(rt.application_service->AllEntities(args.At(3), args.ContextFor(workspace)));
  } else {
    throw UsageError("unknown app command: " + sub);
  }
  return 0;
}

int Run(infragraph::factory::Runtime& rt, const Args& args) {
  const auto& cmd = args.At(0);
  if (cmd == "changeset") return ChangeSetCommand(rt, args);
  if (cmd == "session") return SessionCommand(rt, args);
  if (cmd == "entity") return EntityCommand(rt, args);
  if (cmd == "app") return AppCommand(rt, args);

  if (cmd == "edge") {
    if (args.At(1) != "put") {
      throw UsageError("unknown edge command: " + args.At(1));
    }
    PrintRecord(rt.node_service->Connect(args.ContextFor(args.At(2)), args.At(3), args.At(4), args.At(5)));
    return 0;
  }

  if (cmd == "successors") {
    for (const auto& edge : rt.traversal->Successors(args.At(2), args.At(3), args.ContextFor(args.At(1)))) {
      PrintRecord(edge);
    }
    return 0;
  }

  throw UsageError("unknown command: " + cmd);
}

void Shutdown() {
  infragraph::observability::ShutdownLogging();
  infragraph::observability::ShutdownMetrics();
  infragraph::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  Args args;
  try {
    args = Parse(argc, argv, 3);
    args.At(0);
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n";
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = infragraph::config::ConfigLoader::LoadFromYaml(argv[2]);

    infragraph::observability::InitializeTracing(config);
    infragraph::observability::InitializeMetrics(config);
    infragraph::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build engine and run the command
    // ------------------------------------------------------------
    auto runtime = infragraph::factory::BuildRuntime(config);
    const int rc = Run(runtime, args);

    Shutdown();
    return rc;
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n";
    Usage();
    Shutdown();
    return 1;
  } catch (const std::exception& e) {
    INFRAGRAPH_LOG_ERROR("command failed", {infragraph::observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    Shutdown();
    return 2;
  }
}
