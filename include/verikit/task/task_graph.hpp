#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "verikit/api/export.hpp"
#include "verikit/api/status.hpp"
#include "verikit/task/task_types.hpp"

namespace verikit {
namespace task {

// Immutable dependency graph over declared tasks. Nodes live in one vector
// and refer to each other by TaskIndex.
class VERIKIT_API TaskGraph {
 public:
  struct Node {
    TaskDeclaration declaration;
    std::vector<TaskIndex> dependencies;
    std::vector<TaskIndex> dependents;
  };

  TaskGraph() {}

  // Validates and indexes the declarations.
  // Errors:
  // - GRAPH_DUPLICATE_TASK: a name is declared twice.
  // - GRAPH_UNKNOWN_DEPENDENCY: a dependency names an undeclared task.
  // - GRAPH_CYCLE_DETECTED: the dependency relation is cyclic; the message
  //   carries the cycle path, e.g. "A -> B -> A".
  static api::Result<TaskGraph> Build(const std::vector<TaskDeclaration>& declarations);

  // Requested names plus all direct and indirect dependencies, ascending by
  // index. GRAPH_UNKNOWN_TASK if a name is not declared.
  api::Result<std::vector<TaskIndex> > TransitiveClosure(
      const std::vector<std::string>& names) const;

  api::Result<TaskIndex> Find(const std::string& name) const;
  bool Contains(const std::string& name) const { return index_.count(name) != 0; }

  std::size_t size() const { return nodes_.size(); }
  bool empty() const { return nodes_.empty(); }
  const Node& node(TaskIndex index) const { return nodes_[index]; }
  const std::string& name(TaskIndex index) const { return nodes_[index].declaration.name; }
  const std::vector<TaskIndex>& dependencies(TaskIndex index) const {
    return nodes_[index].dependencies;
  }
  const std::vector<TaskIndex>& dependents(TaskIndex index) const {
    return nodes_[index].dependents;
  }

  std::vector<std::string> Names() const;

 private:
  api::Status DetectCycle() const;

  std::vector<Node> nodes_;
  std::unordered_map<std::string, TaskIndex> index_;
};

}  // namespace task
}  // namespace verikit
