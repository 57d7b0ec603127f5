#include "verikit/task/task_graph.hpp"

#include <algorithm>
#include <utility>

namespace verikit {
namespace task {

#define VK_GRAPH_STATUS(code, message, detail_id) \
  api::Status::FromModule((code), (message), api::ErrorModule::kGraph, (detail_id))

namespace {

enum class VisitState : unsigned char { kUnvisited = 0, kInProgress = 1, kDone = 2 };

}  // namespace

api::Result<TaskGraph> TaskGraph::Build(const std::vector<TaskDeclaration>& declarations) {
  TaskGraph graph;
  graph.nodes_.reserve(declarations.size());

  for (std::size_t i = 0; i < declarations.size(); ++i) {
    const std::string& name = declarations[i].name;
    if (name.empty()) {
      return api::Result<TaskGraph>(VK_GRAPH_STATUS(api::StatusCode::kInvalidArgument,
                                                    "task name is empty",
                                                    api::detail::kNone));
    }
    if (!graph.index_.insert(std::make_pair(name, i)).second) {
      return api::Result<TaskGraph>(VK_GRAPH_STATUS(api::StatusCode::kInvalidArgument,
                                                    "task declared twice: " + name,
                                                    api::detail::kGraphDuplicateTask));
    }
    Node node;
    node.declaration = declarations[i];
    graph.nodes_.push_back(node);
  }

  for (TaskIndex i = 0; i < graph.nodes_.size(); ++i) {
    const std::vector<std::string>& deps = graph.nodes_[i].declaration.dependencies;
    for (std::size_t d = 0; d < deps.size(); ++d) {
      std::unordered_map<std::string, TaskIndex>::const_iterator it = graph.index_.find(deps[d]);
      if (it == graph.index_.end()) {
        return api::Result<TaskGraph>(VK_GRAPH_STATUS(
            api::StatusCode::kNotFound,
            "task '" + graph.name(i) + "' depends on undeclared task '" + deps[d] + "'",
            api::detail::kGraphUnknownDependency));
      }
      std::vector<TaskIndex>& edges = graph.nodes_[i].dependencies;
      if (std::find(edges.begin(), edges.end(), it->second) != edges.end()) continue;
      edges.push_back(it->second);
      graph.nodes_[it->second].dependents.push_back(i);
    }
  }

  api::Status cycle = graph.DetectCycle();
  if (!cycle.ok()) return api::Result<TaskGraph>(cycle);
  return api::Result<TaskGraph>(std::move(graph));
}

api::Status TaskGraph::DetectCycle() const {
  std::vector<VisitState> state(nodes_.size(), VisitState::kUnvisited);
  // Explicit stack of (node, next dependency to visit); the in-progress nodes
  // on it form the current path.
  std::vector<std::pair<TaskIndex, std::size_t> > stack;

  for (TaskIndex root = 0; root < nodes_.size(); ++root) {
    if (state[root] != VisitState::kUnvisited) continue;
    state[root] = VisitState::kInProgress;
    stack.push_back(std::make_pair(root, static_cast<std::size_t>(0)));

    while (!stack.empty()) {
      const TaskIndex current = stack.back().first;
      std::size_t& next = stack.back().second;
      const std::vector<TaskIndex>& deps = nodes_[current].dependencies;
      if (next == deps.size()) {
        state[current] = VisitState::kDone;
        stack.pop_back();
        continue;
      }
      const TaskIndex dep = deps[next++];
      if (state[dep] == VisitState::kDone) continue;
      if (state[dep] == VisitState::kInProgress) {
        std::string path;
        std::size_t start = stack.size();
        while (start > 0 && stack[start - 1].first != dep) --start;
        for (std::size_t i = start == 0 ? 0 : start - 1; i < stack.size(); ++i) {
          path += name(stack[i].first);
          path += " -> ";
        }
        path += name(dep);
        return VK_GRAPH_STATUS(api::StatusCode::kInvalidArgument,
                               "dependency cycle: " + path,
                               api::detail::kGraphCycleDetected);
      }
      state[dep] = VisitState::kInProgress;
      stack.push_back(std::make_pair(dep, static_cast<std::size_t>(0)));
    }
  }
  return api::Status::Ok();
}

api::Result<std::vector<TaskIndex> > TaskGraph::TransitiveClosure(
    const std::vector<std::string>& names) const {
  std::vector<bool> included(nodes_.size(), false);
  std::vector<TaskIndex> pending;

  for (std::size_t i = 0; i < names.size(); ++i) {
    api::Result<TaskIndex> found = Find(names[i]);
    if (!found.ok()) return api::Result<std::vector<TaskIndex> >(found.status());
    if (!included[found.value()]) {
      included[found.value()] = true;
      pending.push_back(found.value());
    }
  }

  while (!pending.empty()) {
    const TaskIndex current = pending.back();
    pending.pop_back();
    const std::vector<TaskIndex>& deps = nodes_[current].dependencies;
    for (std::size_t d = 0; d < deps.size(); ++d) {
      if (included[deps[d]]) continue;
      included[deps[d]] = true;
      pending.push_back(deps[d]);
    }
  }

  std::vector<TaskIndex> closure;
  for (TaskIndex i = 0; i < included.size(); ++i) {
    if (included[i]) closure.push_back(i);
  }
  return api::Result<std::vector<TaskIndex> >(closure);
}

api::Result<TaskIndex> TaskGraph::Find(const std::string& name) const {
  std::unordered_map<std::string, TaskIndex>::const_iterator it = index_.find(name);
  if (it == index_.end()) {
    return api::Result<TaskIndex>(VK_GRAPH_STATUS(api::StatusCode::kNotFound,
                                                  "unknown task: " + name,
                                                  api::detail::kGraphUnknownTask));
  }
  return api::Result<TaskIndex>(it->second);
}

std::vector<std::string> TaskGraph::Names() const {
  std::vector<std::string> names;
  names.reserve(nodes_.size());
  for (std::size_t i = 0; i < nodes_.size(); ++i) names.push_back(nodes_[i].declaration.name);
  return names;
}

#undef VK_GRAPH_STATUS

}  // namespace task
}  // namespace verikit
