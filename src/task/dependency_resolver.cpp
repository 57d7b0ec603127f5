#include "verikit/task/dependency_resolver.hpp"

#include <set>

namespace verikit {
namespace task {

const char* const kAllTasks = "all";

api::Result<std::vector<TaskIndex> > DependencyResolver::Order(
    const TaskGraph& graph, const std::vector<TaskIndex>& task_set) {
  std::vector<bool> member(graph.size(), false);
  std::vector<TaskIndex> members;
  for (std::size_t i = 0; i < task_set.size(); ++i) {
    const TaskIndex idx = task_set[i];
    if (idx >= graph.size()) {
      return api::Result<std::vector<TaskIndex> >(api::Status::FromModule(
          api::StatusCode::kNotFound, "task index out of range", api::ErrorModule::kGraph,
          api::detail::kGraphUnknownTask));
    }
    if (member[idx]) continue;
    member[idx] = true;
    members.push_back(idx);
  }

  std::vector<std::size_t> unresolved(graph.size(), 0);
  std::set<TaskIndex> ready;
  for (std::size_t i = 0; i < members.size(); ++i) {
    const std::vector<TaskIndex>& deps = graph.dependencies(members[i]);
    for (std::size_t d = 0; d < deps.size(); ++d) {
      if (member[deps[d]]) ++unresolved[members[i]];
    }
    if (unresolved[members[i]] == 0) ready.insert(members[i]);
  }

  std::vector<TaskIndex> order;
  order.reserve(members.size());
  while (!ready.empty()) {
    const TaskIndex next = *ready.begin();
    ready.erase(ready.begin());
    order.push_back(next);
    const std::vector<TaskIndex>& dependents = graph.dependents(next);
    for (std::size_t d = 0; d < dependents.size(); ++d) {
      const TaskIndex dependent = dependents[d];
      if (!member[dependent]) continue;
      if (--unresolved[dependent] == 0) ready.insert(dependent);
    }
  }

  if (order.size() != members.size()) {
    return api::Result<std::vector<TaskIndex> >(api::Status::FromModule(
        api::StatusCode::kInvalidArgument, "task set contains a dependency cycle",
        api::ErrorModule::kGraph, api::detail::kGraphCycleDetected));
  }
  return api::Result<std::vector<TaskIndex> >(order);
}

std::vector<std::string> DependencyResolver::ExpandRequest(const TaskGraph& graph,
                                                           const std::vector<std::string>& names) {
  for (std::size_t i = 0; i < names.size(); ++i) {
    if (names[i] == kAllTasks && !graph.Contains(kAllTasks)) return graph.Names();
  }
  return names;
}

api::Result<std::vector<TaskIndex> > DependencyResolver::Plan(
    const TaskGraph& graph, const std::vector<std::string>& names) {
  api::Result<std::vector<TaskIndex> > closure =
      graph.TransitiveClosure(ExpandRequest(graph, names));
  if (!closure.ok()) return closure;
  return Order(graph, closure.value());
}

}  // namespace task
}  // namespace verikit
