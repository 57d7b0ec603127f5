#pragma once

#include <map>
#include <string>
#include <vector>

#include "verikit/api/export.hpp"
#include "verikit/api/status.hpp"
#include "verikit/json/json_codec.hpp"
#include "verikit/task/task_types.hpp"

namespace verikit {
namespace config {

// Command line template for one task kind. Both program and args may use
// the placeholders {target}, {task}, {timeout}, {log_dir} and any key of the
// task's params.
struct Invocation {
  std::string program;
  std::vector<std::string> args;
};

typedef std::map<task::TaskKind, Invocation> InvocationTable;

struct TaskCatalog {
  std::vector<task::TaskDeclaration> tasks;  // declaration order
  InvocationTable invocations;
};

// Proof modules, TLC model configurations and Stateright harnesses of the
// Alpenglow verification suite.
VERIKIT_API TaskCatalog DefaultCatalog();

VERIKIT_API InvocationTable DefaultInvocations();

// {"invocations": {...}, "tasks": [...]}. Missing invocation kinds fall back
// to DefaultInvocations(). CONFIG_CATALOG_MALFORMED on structural errors.
VERIKIT_API api::Result<TaskCatalog> ParseTaskCatalog(const json::Json& document);

VERIKIT_API api::Result<TaskCatalog> LoadTaskCatalog(const std::string& path);

}  // namespace config
}  // namespace verikit
