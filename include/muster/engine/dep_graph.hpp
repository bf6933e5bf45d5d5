#pragma once

#include <muster/result.hpp>
#include <muster/graph.hpp>
#include <muster/engine/catalog.hpp>
#include <muster/engine/issue.hpp>
#include <muster/engine/resolver.hpp>

#include <string>
#include <vector>
#include <optional>

namespace muster {

// Hard: provider must start before dependent. Soft: ordering preference only.
enum class EdgeKind { Hard, Soft };

struct DependencyEdge {
    std::string from;
    std::string to;
    EdgeKind kind;
};

// What the graph stage hands to the aggregator
struct GraphOutcome {
    std::vector<Issue> issues;                             // resolution issues plus any cycle
    std::optional<std::vector<std::string>> startup_order; // absent when a cycle was found
};

// Directed graph over the enabled services, rebuilt from scratch for every
// enabled set. Nodes are in catalog order.
class DependencyGraph {
public:
    static DependencyGraph build(const Catalog& catalog,
                                 const std::vector<std::string>& enabled);

    // Enabled services known to the catalog, in catalog order
    const std::vector<std::string>& services() const { return services_; }

    const std::vector<ResolvedDependency>& resolved() const { return resolved_; }
    const ResolvedDependency* find(const std::string& service) const;

    // Unknown/duplicate services, missing capabilities, conflicts, missing optionals
    const std::vector<Issue>& issues() const { return issues_; }

    std::vector<DependencyEdge> edges() const;

    // First cycle over hard edges, each service followed by one it requires
    std::optional<std::vector<std::string>> detect_cycle() const;

    // Kahn's sort over hard edges, soft edges break ties.
    // Cycle error carries the same message as the detector.
    Result<std::vector<std::string>> startup_order() const;

    GraphOutcome outcome() const;

    // Services that (transitively) depend on root, as a tree
    std::string dependents_tree(const std::string& root) const;

    const GraphMap<EdgeKind>& graph() const { return graph_; }

private:
    DependencyGraph() = default;

    GraphMap<EdgeKind> graph_;
    std::vector<std::string> services_;
    std::vector<ResolvedDependency> resolved_;
    std::vector<Issue> issues_;
};

// "dependency cycle detected: a -> b -> c -> a"
std::string format_cycle(const std::vector<std::string>& path);

} // namespace muster
