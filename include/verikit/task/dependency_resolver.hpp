#pragma once

#include <string>
#include <vector>

#include "verikit/api/export.hpp"
#include "verikit/api/status.hpp"
#include "verikit/task/task_graph.hpp"

namespace verikit {
namespace task {

// Requested-name sentinel that expands to every declared task.
VERIKIT_API extern const char* const kAllTasks;

class VERIKIT_API DependencyResolver {
 public:
  // Topological order over task_set: every task appears after the members of
  // task_set it depends on. Dependencies outside task_set are not considered.
  // Among tasks whose dependencies are satisfied, the lowest declaration index
  // goes first. Duplicates in task_set are ignored.
  static api::Result<std::vector<TaskIndex> > Order(const TaskGraph& graph,
                                                    const std::vector<TaskIndex>& task_set);

  // Closure of the requested names followed by Order(). A single kAllTasks
  // entry selects the whole graph.
  static api::Result<std::vector<TaskIndex> > Plan(const TaskGraph& graph,
                                                   const std::vector<std::string>& names);

  // Expands kAllTasks; other names are returned unchanged.
  static std::vector<std::string> ExpandRequest(const TaskGraph& graph,
                                                const std::vector<std::string>& names);
};

}  // namespace task
}  // namespace verikit
