#include "verikit/config/task_catalog.hpp"

#include <cstdint>
#include <utility>

namespace verikit {
namespace config {

#define VK_CATALOG_STATUS(message)                                                       \
  api::Status::FromModule(api::StatusCode::kInvalidArgument, (message), api::ErrorModule::kConfig, \
                          api::detail::kConfigCatalogMalformed)

namespace {

task::TaskDeclaration Declare(const std::string& name, task::TaskKind kind,
                              const std::string& target, const std::vector<std::string>& deps) {
  task::TaskDeclaration decl;
  decl.name = name;
  decl.kind = kind;
  decl.target = target;
  decl.dependencies = deps;
  return decl;
}

std::vector<std::string> Deps(const char* a = NULL, const char* b = NULL) {
  std::vector<std::string> deps;
  if (a != NULL) deps.push_back(a);
  if (b != NULL) deps.push_back(b);
  return deps;
}

bool ReadStringArray(const json::Json& value, std::vector<std::string>* out) {
  if (!value.is_array()) return false;
  for (json::Json::const_iterator it = value.begin(); it != value.end(); ++it) {
    if (!it->is_string()) return false;
    out->push_back(it->get<std::string>());
  }
  return true;
}

api::Status ReadInvocation(const std::string& kind_name, const json::Json& value,
                           Invocation* out) {
  if (!value.is_object()) return VK_CATALOG_STATUS("invocation '" + kind_name + "' is not an object");
  json::Json::const_iterator program = value.find("program");
  if (program == value.end() || !program->is_string() || program->get<std::string>().empty()) {
    return VK_CATALOG_STATUS("invocation '" + kind_name + "' has no program");
  }
  out->program = program->get<std::string>();
  json::Json::const_iterator args = value.find("args");
  if (args != value.end() && !ReadStringArray(*args, &out->args)) {
    return VK_CATALOG_STATUS("invocation '" + kind_name + "': args must be an array of strings");
  }
  return api::Status::Ok();
}

api::Status ReadTask(std::size_t position, const json::Json& value, task::TaskDeclaration* out) {
  const std::string where = "tasks[" + std::to_string(position) + "]";
  if (!value.is_object()) return VK_CATALOG_STATUS(where + " is not an object");

  json::Json::const_iterator name = value.find("name");
  if (name == value.end() || !name->is_string() || name->get<std::string>().empty()) {
    return VK_CATALOG_STATUS(where + " has no name");
  }
  out->name = name->get<std::string>();
  const std::string task_where = where + " (" + out->name + ")";

  json::Json::const_iterator kind = value.find("kind");
  if (kind != value.end()) {
    if (!kind->is_string() || !task::ParseTaskKind(kind->get<std::string>(), &out->kind)) {
      return VK_CATALOG_STATUS(task_where + ": unknown kind");
    }
  }

  json::Json::const_iterator target = value.find("target");
  if (target != value.end()) {
    if (!target->is_string()) return VK_CATALOG_STATUS(task_where + ": target must be a string");
    out->target = target->get<std::string>();
  }

  json::Json::const_iterator deps = value.find("deps");
  if (deps != value.end() && !ReadStringArray(*deps, &out->dependencies)) {
    return VK_CATALOG_STATUS(task_where + ": deps must be an array of strings");
  }

  json::Json::const_iterator args = value.find("args");
  if (args != value.end() && !ReadStringArray(*args, &out->extra_args)) {
    return VK_CATALOG_STATUS(task_where + ": args must be an array of strings");
  }

  json::Json::const_iterator timeout = value.find("timeout");
  if (timeout != value.end()) {
    if (!timeout->is_number_unsigned() || timeout->get<std::uint64_t>() > 0xFFFFFFFFull) {
      return VK_CATALOG_STATUS(task_where + ": timeout must be a non-negative number of seconds");
    }
    out->timeout_seconds = static_cast<std::uint32_t>(timeout->get<std::uint64_t>());
  }

  json::Json::const_iterator params = value.find("params");
  if (params != value.end()) {
    if (!params->is_object()) return VK_CATALOG_STATUS(task_where + ": params must be an object");
    for (json::Json::const_iterator it = params->begin(); it != params->end(); ++it) {
      if (!it.value().is_string()) {
        return VK_CATALOG_STATUS(task_where + ": param '" + it.key() + "' must be a string");
      }
      out->params[it.key()] = it.value().get<std::string>();
    }
  }
  return api::Status::Ok();
}

}  // namespace

InvocationTable DefaultInvocations() {
  InvocationTable table;

  Invocation proof;
  proof.program = "tlapm";
  proof.args.push_back("--verbose");
  proof.args.push_back("--timing");
  proof.args.push_back("--stats");
  proof.args.push_back("{target}");
  table[task::TaskKind::kProof] = proof;

  Invocation model;
  model.program = "java";
  const char* const model_args[] = {"-cp", "{tla2tools}", "tlc2.TLC", "-config", "{target}",
                                    "-workers", "auto", "-cleanup", "{spec}"};
  for (size_t i = 0; i < sizeof(model_args) / sizeof(model_args[0]); ++i) {
    model.args.push_back(model_args[i]);
  }
  table[task::TaskKind::kModelCheck] = model;

  Invocation test;
  test.program = "cargo";
  test.args.push_back("test");
  test.args.push_back("--release");
  test.args.push_back("{target}");
  table[task::TaskKind::kTestHarness] = test;

  Invocation custom;
  custom.program = "{target}";
  table[task::TaskKind::kCustom] = custom;
  return table;
}

TaskCatalog DefaultCatalog() {
  TaskCatalog catalog;
  catalog.invocations = DefaultInvocations();
  std::vector<task::TaskDeclaration>& tasks = catalog.tasks;

  // Proof modules, each building on the previous one.
  tasks.push_back(Declare("Types", task::TaskKind::kProof, "proofs/Types.tla", Deps()));
  tasks.push_back(Declare("Utils", task::TaskKind::kProof, "proofs/Utils.tla", Deps("Types")));
  tasks.push_back(Declare("Safety", task::TaskKind::kProof, "proofs/Safety.tla", Deps("Utils")));
  tasks.push_back(
      Declare("Liveness", task::TaskKind::kProof, "proofs/Liveness.tla", Deps("Safety")));
  tasks.push_back(
      Declare("Resilience", task::TaskKind::kProof, "proofs/Resilience.tla", Deps("Liveness")));
  tasks.push_back(Declare("WhitepaperTheorems", task::TaskKind::kProof,
                          "proofs/WhitepaperTheorems.tla", Deps("Resilience")));

  // Model configurations, smallest first, with per-configuration time caps.
  struct ModelEntry {
    const char* config;
    const char* dependency;
    std::uint32_t timeout_seconds;
  };
  const ModelEntry models[] = {{"Small", NULL, 600},
                               {"Medium", "model_Small", 1800},
                               {"Boundary", NULL, 0},
                               {"EdgeCase", NULL, 0},
                               {"LargeScale", "model_Medium", 3600},
                               {"Adversarial", "model_Small", 3600}};
  for (size_t i = 0; i < sizeof(models) / sizeof(models[0]); ++i) {
    task::TaskDeclaration decl =
        Declare(std::string("model_") + models[i].config, task::TaskKind::kModelCheck,
                std::string("models/") + models[i].config + ".cfg", Deps(models[i].dependency));
    decl.timeout_seconds = models[i].timeout_seconds;
    decl.params["spec"] = "specs/Alpenglow.tla";
    decl.params["tla2tools"] = "tools/tla2tools.jar";
    tasks.push_back(decl);
  }

  // Stateright harnesses.
  const char* const harnesses[] = {"safety_properties", "liveness_properties",
                                   "byzantine_resilience", "sampling_verification"};
  for (size_t i = 0; i < sizeof(harnesses) / sizeof(harnesses[0]); ++i) {
    tasks.push_back(Declare(std::string("stateright_") + harnesses[i],
                            task::TaskKind::kTestHarness, harnesses[i], Deps()));
  }
  tasks.push_back(Declare("stateright_cross_validation", task::TaskKind::kTestHarness,
                          "cross_validation",
                          Deps("stateright_safety_properties", "stateright_liveness_properties")));
  return catalog;
}

api::Result<TaskCatalog> ParseTaskCatalog(const json::Json& document) {
  if (!document.is_object()) {
    return api::Result<TaskCatalog>(VK_CATALOG_STATUS("catalog must be a JSON object"));
  }

  TaskCatalog catalog;
  catalog.invocations = DefaultInvocations();

  json::Json::const_iterator invocations = document.find("invocations");
  if (invocations != document.end()) {
    if (!invocations->is_object()) {
      return api::Result<TaskCatalog>(VK_CATALOG_STATUS("'invocations' must be an object"));
    }
    for (json::Json::const_iterator it = invocations->begin(); it != invocations->end(); ++it) {
      task::TaskKind kind = task::TaskKind::kCustom;
      if (!task::ParseTaskKind(it.key(), &kind)) {
        return api::Result<TaskCatalog>(
            VK_CATALOG_STATUS("unknown invocation kind '" + it.key() + "'"));
      }
      Invocation invocation;
      api::Status st = ReadInvocation(it.key(), it.value(), &invocation);
      if (!st.ok()) return api::Result<TaskCatalog>(st);
      catalog.invocations[kind] = invocation;
    }
  }

  json::Json::const_iterator tasks = document.find("tasks");
  if (tasks == document.end() || !tasks->is_array()) {
    return api::Result<TaskCatalog>(VK_CATALOG_STATUS("'tasks' must be an array"));
  }
  std::size_t position = 0;
  for (json::Json::const_iterator it = tasks->begin(); it != tasks->end(); ++it, ++position) {
    task::TaskDeclaration decl;
    api::Status st = ReadTask(position, *it, &decl);
    if (!st.ok()) return api::Result<TaskCatalog>(st);
    catalog.tasks.push_back(decl);
  }
  return api::Result<TaskCatalog>(std::move(catalog));
}

api::Result<TaskCatalog> LoadTaskCatalog(const std::string& path) {
  api::Result<json::Json> document = json::JsonCodec::LoadFile(path);
  if (!document.ok()) {
    return api::Result<TaskCatalog>(VK_CATALOG_STATUS(document.status().message()));
  }
  api::Result<TaskCatalog> catalog = ParseTaskCatalog(document.value());
  if (!catalog.ok()) {
    return api::Result<TaskCatalog>(VK_CATALOG_STATUS(path + ": " + catalog.status().message()));
  }
  return catalog;
}

#undef VK_CATALOG_STATUS

}  // namespace config
}  // namespace verikit
