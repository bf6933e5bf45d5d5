#include <muster/engine/dep_graph.hpp>
#include <muster/log.hpp>

#include <algorithm>
#include <unordered_set>

namespace muster {

static bool is_hard(const EdgeKind& k) { return k == EdgeKind::Hard; }
static bool is_soft(const EdgeKind& k) { return k == EdgeKind::Soft; }

static std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

std::string format_cycle(const std::vector<std::string>& path) {
    std::string msg = "dependency cycle detected: " + join(path, " -> ");
    if (!path.empty()) {
        msg += " -> ";
        msg += path.front();
    }
    return msg;
}

// ---------------------------------------------------------------------------
// build()
// ---------------------------------------------------------------------------

DependencyGraph DependencyGraph::build(const Catalog& catalog,
                                       const std::vector<std::string>& enabled)
{
    DependencyGraph dg;

    // Screen the enabled list
    std::unordered_set<std::string> seen;
    std::unordered_set<std::string> reported;
    for (const auto& name : enabled) {
        if (!seen.insert(name).second) {
            if (reported.insert(name).second) {
                dg.issues_.push_back(Issue::fatal(Issue::DuplicateService, name,
                    "service '" + name + "' is enabled more than once"));
            }
            continue;
        }
        if (!catalog.contains(name)) {
            dg.issues_.push_back(Issue::fatal(Issue::UnknownService, name,
                "service '" + name + "' is enabled but not in the catalog"));
            continue;
        }
        dg.services_.push_back(name);
    }
    std::sort(dg.services_.begin(), dg.services_.end(),
              [&](const std::string& a, const std::string& b) {
                  return catalog.rank(a) < catalog.rank(b);
              });

    for (const auto& name : dg.services_) {
        dg.graph_.add_node(name);
    }

    // Resolve capabilities
    CapabilityResolver resolver(catalog, dg.services_);
    for (const auto& name : dg.services_) {
        auto r = resolver.resolve(name);
        if (r.is_err()) {
            // Screened above; only reachable if the catalog changed under us
            dg.issues_.push_back(Issue::fatal(Issue::UnknownService, name,
                r.error().message));
            continue;
        }
        ResolvedDependency rd = std::move(r).value();

        for (const auto& cap : rd.missing) {
            std::string msg = "service '" + name + "' requires capability '" + cap +
                              "' but no enabled service provides it";
            const auto& could = resolver.candidates(cap);
            if (!could.empty()) {
                msg += " (enable one of: " + join(could, ", ") + ")";
            }
            dg.issues_.push_back(Issue::fatal(Issue::MissingRequiredCapability,
                                              name, msg));
        }

        for (const auto& cap : rd.missing_optional) {
            std::vector<std::string> could;
            for (const auto& c : resolver.candidates(cap)) {
                if (c != name) could.push_back(c);
            }
            std::string msg = "service '" + name + "' could benefit from capability '" +
                              cap + "'";
            if (could.empty()) {
                msg += ", but no known service provides it";
            } else {
                msg += ", provided by: " + join(could, ", ");
            }
            dg.issues_.push_back(Issue::warning(Issue::MissingOptionalCapability,
                                                name, msg, could));
        }

        for (const auto& p : rd.required) {
            dg.graph_.add_edge(p, name, EdgeKind::Hard);
        }
        for (const auto& a : rd.after) {
            dg.graph_.add_edge(a, name, EdgeKind::Soft);
        }

        dg.resolved_.push_back(std::move(rd));
    }

    // Conflicts: one issue per enabled pair, declared on either side
    for (size_t i = 0; i < dg.services_.size(); ++i) {
        const ServiceDescriptor* a = catalog.find(dg.services_[i]);
        for (size_t j = i + 1; j < dg.services_.size(); ++j) {
            const ServiceDescriptor* b = catalog.find(dg.services_[j]);
            if (!a->conflicts_with(b->name) && !b->conflicts_with(a->name)) continue;
            dg.issues_.push_back(Issue::fatal(Issue::ConflictingServices, a->name,
                "services '" + a->name + "' and '" + b->name +
                "' conflict and cannot both be enabled",
                {b->name}));
        }
    }

    log::debug("dependency graph: %zu services, %zu edges, %zu issues",
               dg.services_.size(), dg.graph_.inner().edge_count(),
               dg.issues_.size());
    return dg;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

const ResolvedDependency* DependencyGraph::find(const std::string& service) const {
    for (const auto& rd : resolved_) {
        if (rd.service == service) return &rd;
    }
    return nullptr;
}

std::vector<DependencyEdge> DependencyGraph::edges() const {
    std::vector<DependencyEdge> out;
    const auto& g = graph_.inner();
    for (size_t u = 0; u < g.node_count(); ++u) {
        for (const auto& e : g.successors(u)) {
            out.push_back({g.node(e.from), g.node(e.to), e.data});
        }
    }
    return out;
}

std::optional<std::vector<std::string>> DependencyGraph::detect_cycle() const {
    // Edges run provider -> dependent; walk them backwards so the path
    // reads dependent -> provider
    return graph_.find_cycle(is_hard, GraphMap<EdgeKind>::Direction::Backward);
}

Result<std::vector<std::string>> DependencyGraph::startup_order() const {
    auto order = graph_.topological_sort(is_hard, is_soft);
    if (order.is_ok()) return order;

    auto cycle = detect_cycle();
    if (!cycle) return std::move(order).error();
    return MusterError{MusterError::Cycle, format_cycle(*cycle),
        "break the cycle by removing one of the required capabilities"};
}

GraphOutcome DependencyGraph::outcome() const {
    GraphOutcome out;
    out.issues = issues_;

    auto cycle = detect_cycle();
    if (cycle) {
        std::vector<std::string> rest(cycle->begin() + 1, cycle->end());
        out.issues.push_back(Issue::fatal(Issue::CyclicDependency, cycle->front(),
                                          format_cycle(*cycle), rest));
        return out;
    }

    auto order = startup_order();
    if (order.is_ok()) {
        out.startup_order = std::move(order).value();
    } else {
        out.issues.push_back(Issue::fatal(Issue::CyclicDependency, "",
                                          order.error().message));
    }
    return out;
}

std::string DependencyGraph::dependents_tree(const std::string& root) const {
    return graph_.tree_display(root, is_hard);
}

} // namespace muster
