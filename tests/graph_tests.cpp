#include "verikit/verikit.hpp"

#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

namespace {

verikit::task::TaskDeclaration Decl(const std::string& name,
                                    const std::vector<std::string>& deps = std::vector<std::string>()) {
  verikit::task::TaskDeclaration decl;
  decl.name = name;
  decl.dependencies = deps;
  return decl;
}

std::vector<std::string> Names(const char* a = NULL, const char* b = NULL, const char* c = NULL) {
  std::vector<std::string> out;
  if (a != NULL) out.push_back(a);
  if (b != NULL) out.push_back(b);
  if (c != NULL) out.push_back(c);
  return out;
}

// Types -> Utils -> Safety -> Liveness -> Resilience -> WhitepaperTheorems
std::vector<verikit::task::TaskDeclaration> ProofChain() {
  std::vector<verikit::task::TaskDeclaration> decls;
  decls.push_back(Decl("Types"));
  decls.push_back(Decl("Utils", Names("Types")));
  decls.push_back(Decl("Safety", Names("Utils")));
  decls.push_back(Decl("Liveness", Names("Safety")));
  decls.push_back(Decl("Resilience", Names("Liveness")));
  decls.push_back(Decl("WhitepaperTheorems", Names("Resilience")));
  return decls;
}

std::vector<std::string> OrderNames(const verikit::task::TaskGraph& graph,
                                    const std::vector<verikit::task::TaskIndex>& order) {
  std::vector<std::string> out;
  for (std::size_t i = 0; i < order.size(); ++i) out.push_back(graph.name(order[i]));
  return out;
}

bool RespectsDependencies(const verikit::task::TaskGraph& graph,
                          const std::vector<verikit::task::TaskIndex>& order) {
  std::vector<std::size_t> position(graph.size(), order.size());
  for (std::size_t i = 0; i < order.size(); ++i) position[order[i]] = i;
  for (std::size_t i = 0; i < order.size(); ++i) {
    const std::vector<verikit::task::TaskIndex>& deps = graph.dependencies(order[i]);
    for (std::size_t d = 0; d < deps.size(); ++d) {
      if (position[deps[d]] != order.size() && position[deps[d]] >= i) return false;
    }
  }
  return true;
}

}  // namespace

bool TestBuildValidGraph() {
  verikit::api::Result<verikit::task::TaskGraph> graph =
      verikit::task::TaskGraph::Build(ProofChain());
  if (!graph.ok()) return false;
  if (graph.value().size() != 6) return false;
  verikit::api::Result<verikit::task::TaskIndex> safety = graph.value().Find("Safety");
  if (!safety.ok() || safety.value() != 2) return false;
  if (graph.value().dependents(1).size() != 1 || graph.value().dependents(1)[0] != 2) return false;
  return graph.value().Contains("Types") && !graph.value().Contains("Missing");
}

bool TestUnknownDependency() {
  std::vector<verikit::task::TaskDeclaration> decls;
  decls.push_back(Decl("A", Names("Ghost")));
  verikit::api::Result<verikit::task::TaskGraph> graph = verikit::task::TaskGraph::Build(decls);
  if (graph.ok()) return false;
  return graph.status().Is(verikit::api::ErrorModule::kGraph,
                           verikit::api::detail::kGraphUnknownDependency) &&
         graph.status().message().find("Ghost") != std::string::npos;
}

bool TestDuplicateTask() {
  std::vector<verikit::task::TaskDeclaration> decls;
  decls.push_back(Decl("A"));
  decls.push_back(Decl("A"));
  verikit::api::Result<verikit::task::TaskGraph> graph = verikit::task::TaskGraph::Build(decls);
  return !graph.ok() && graph.status().Is(verikit::api::ErrorModule::kGraph,
                                          verikit::api::detail::kGraphDuplicateTask);
}

bool TestCycleDetected() {
  std::vector<verikit::task::TaskDeclaration> decls;
  decls.push_back(Decl("Root"));
  decls.push_back(Decl("A", Names("Root", "C")));
  decls.push_back(Decl("B", Names("A")));
  decls.push_back(Decl("C", Names("B")));
  verikit::api::Result<verikit::task::TaskGraph> graph = verikit::task::TaskGraph::Build(decls);
  if (graph.ok()) return false;
  if (!graph.status().Is(verikit::api::ErrorModule::kGraph,
                         verikit::api::detail::kGraphCycleDetected)) {
    return false;
  }
  const std::string& message = graph.status().message();
  return message.find("A -> C -> B -> A") != std::string::npos;
}

bool TestSelfDependencyIsCycle() {
  std::vector<verikit::task::TaskDeclaration> decls;
  decls.push_back(Decl("Loop", Names("Loop")));
  verikit::api::Result<verikit::task::TaskGraph> graph = verikit::task::TaskGraph::Build(decls);
  return !graph.ok() && graph.status().Is(verikit::api::ErrorModule::kGraph,
                                          verikit::api::detail::kGraphCycleDetected);
}

bool TestTransitiveClosure() {
  verikit::api::Result<verikit::task::TaskGraph> graph =
      verikit::task::TaskGraph::Build(ProofChain());
  if (!graph.ok()) return false;
  verikit::api::Result<std::vector<verikit::task::TaskIndex> > closure =
      graph.value().TransitiveClosure(Names("Safety"));
  if (!closure.ok() || closure.value().size() != 3) return false;
  if (closure.value()[0] != 0 || closure.value()[1] != 1 || closure.value()[2] != 2) return false;

  closure = graph.value().TransitiveClosure(Names("Nope"));
  return !closure.ok() && closure.status().Is(verikit::api::ErrorModule::kGraph,
                                              verikit::api::detail::kGraphUnknownTask);
}

bool TestPlanSafetyScenario() {
  verikit::api::Result<verikit::task::TaskGraph> graph =
      verikit::task::TaskGraph::Build(ProofChain());
  if (!graph.ok()) return false;
  verikit::api::Result<std::vector<verikit::task::TaskIndex> > plan =
      verikit::task::DependencyResolver::Plan(graph.value(), Names("Safety"));
  if (!plan.ok()) return false;
  const std::vector<std::string> names = OrderNames(graph.value(), plan.value());
  return names == Names("Types", "Utils", "Safety");
}

bool TestPlanAllSentinel() {
  verikit::api::Result<verikit::task::TaskGraph> graph =
      verikit::task::TaskGraph::Build(ProofChain());
  if (!graph.ok()) return false;
  verikit::api::Result<std::vector<verikit::task::TaskIndex> > plan =
      verikit::task::DependencyResolver::Plan(graph.value(), Names(verikit::task::kAllTasks));
  if (!plan.ok() || plan.value().size() != 6) return false;
  const std::vector<std::string> expanded =
      verikit::task::DependencyResolver::ExpandRequest(graph.value(), Names("all"));
  return expanded.size() == 6 && expanded[5] == "WhitepaperTheorems";
}

bool TestOrderTieBreakByDeclaration() {
  // D and B are independent roots declared after C; C depends on A.
  std::vector<verikit::task::TaskDeclaration> decls;
  decls.push_back(Decl("A"));
  decls.push_back(Decl("C", Names("A")));
  decls.push_back(Decl("D"));
  decls.push_back(Decl("B"));
  verikit::api::Result<verikit::task::TaskGraph> graph = verikit::task::TaskGraph::Build(decls);
  if (!graph.ok()) return false;
  std::vector<verikit::task::TaskIndex> set;
  set.push_back(3);
  set.push_back(1);
  set.push_back(0);
  set.push_back(2);
  set.push_back(1);  // duplicate is ignored
  verikit::api::Result<std::vector<verikit::task::TaskIndex> > order =
      verikit::task::DependencyResolver::Order(graph.value(), set);
  if (!order.ok()) return false;
  std::vector<std::string> expected;
  expected.push_back("A");
  expected.push_back("C");
  expected.push_back("D");
  expected.push_back("B");
  return OrderNames(graph.value(), order.value()) == expected;
}

bool TestOrderPropertyOnDiamonds() {
  // Layered graph: every node of layer k depends on two nodes of layer k-1.
  std::vector<verikit::task::TaskDeclaration> decls;
  const int layers = 6;
  const int width = 5;
  for (int layer = 0; layer < layers; ++layer) {
    for (int i = 0; i < width; ++i) {
      std::vector<std::string> deps;
      if (layer > 0) {
        deps.push_back("n" + std::to_string(layer - 1) + "_" + std::to_string(i));
        deps.push_back("n" + std::to_string(layer - 1) + "_" + std::to_string((i + 2) % width));
      }
      decls.push_back(Decl("n" + std::to_string(layer) + "_" + std::to_string(i), deps));
    }
  }
  // Reverse the declaration order so the tie break cannot hide mistakes.
  std::vector<verikit::task::TaskDeclaration> reversed(decls.rbegin(), decls.rend());
  verikit::api::Result<verikit::task::TaskGraph> graph = verikit::task::TaskGraph::Build(reversed);
  if (!graph.ok()) return false;

  for (int i = 0; i < width; ++i) {
    const std::string top = "n" + std::to_string(layers - 1) + "_" + std::to_string(i);
    verikit::api::Result<std::vector<verikit::task::TaskIndex> > plan =
        verikit::task::DependencyResolver::Plan(graph.value(), Names(top.c_str()));
    if (!plan.ok()) return false;
    if (!RespectsDependencies(graph.value(), plan.value())) return false;
    if (graph.value().name(plan.value().back()) != top) return false;
  }
  verikit::api::Result<std::vector<verikit::task::TaskIndex> > all =
      verikit::task::DependencyResolver::Plan(graph.value(), Names("all"));
  return all.ok() && all.value().size() == decls.size() &&
         RespectsDependencies(graph.value(), all.value());
}

bool TestDefaultCatalogBuilds() {
  const verikit::config::TaskCatalog catalog = verikit::config::DefaultCatalog();
  verikit::api::Result<verikit::task::TaskGraph> graph =
      verikit::task::TaskGraph::Build(catalog.tasks);
  if (!graph.ok()) return false;
  verikit::api::Result<std::vector<verikit::task::TaskIndex> > plan =
      verikit::task::DependencyResolver::Plan(graph.value(), Names("Safety"));
  if (!plan.ok()) return false;
  return OrderNames(graph.value(), plan.value()) == Names("Types", "Utils", "Safety");
}

int main() {
  struct TestCase {
    const char* name;
    bool (*fn)();
  };

  const TestCase tests[] = {
      {"build_valid_graph", TestBuildValidGraph},
      {"unknown_dependency", TestUnknownDependency},
      {"duplicate_task", TestDuplicateTask},
      {"cycle_detected", TestCycleDetected},
      {"self_dependency_is_cycle", TestSelfDependencyIsCycle},
      {"transitive_closure", TestTransitiveClosure},
      {"plan_safety_scenario", TestPlanSafetyScenario},
      {"plan_all_sentinel", TestPlanAllSentinel},
      {"order_tie_break_by_declaration", TestOrderTieBreakByDeclaration},
      {"order_property_on_diamonds", TestOrderPropertyOnDiamonds},
      {"default_catalog_builds", TestDefaultCatalogBuilds},
  };

  int failed = 0;
  for (std::size_t i = 0; i < sizeof(tests) / sizeof(tests[0]); ++i) {
    std::printf("[RUN ] %s\n", tests[i].name);
    std::fflush(stdout);
    bool ok = tests[i].fn();
    std::cout << (ok ? "[PASS] " : "[FAIL] ") << tests[i].name << "\n";
    std::fflush(stdout);
    if (!ok) ++failed;
  }

  return failed == 0 ? 0 : 1;
}
