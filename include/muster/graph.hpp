#pragma once

#include <muster/result.hpp>
#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include <set>
#include <optional>
#include <algorithm>
#include <functional>
#include <sstream>

namespace muster {

// ---------------------------------------------------------------------------
// Graph<NodeData, EdgeData>: directed graph with adjacency list
//
// Node ids are dense and assigned in insertion order. Every traversal below
// visits nodes and edges in insertion order, so results are reproducible.
// ---------------------------------------------------------------------------

template<typename NodeData, typename EdgeData = std::monostate>
class Graph {
public:
    using NodeId = size_t;
    using EdgeFilter = std::function<bool(const EdgeData&)>;

    struct Edge {
        NodeId from;
        NodeId to;
        EdgeData data;
    };

    // Forward follows edges from -> to, Backward walks them to -> from
    enum class Direction { Forward, Backward };

    NodeId add_node(NodeData data) {
        NodeId id = nodes_.size();
        nodes_.push_back(std::move(data));
        adj_.push_back({});
        radj_.push_back({});
        redges_.push_back({});
        return id;
    }

    void add_edge(NodeId from, NodeId to, EdgeData data = {}) {
        adj_[from].push_back({from, to, data});
        radj_[to].push_back(from);
        redges_[to].push_back({from, to, std::move(data)});
    }

    bool has_edge(NodeId from, NodeId to) const {
        for (const auto& e : adj_[from]) {
            if (e.to == to) return true;
        }
        return false;
    }

    size_t node_count() const { return nodes_.size(); }

    size_t edge_count() const {
        size_t n = 0;
        for (const auto& edges : adj_) n += edges.size();
        return n;
    }

    const NodeData& node(NodeId id) const { return nodes_[id]; }
    NodeData& node(NodeId id) { return nodes_[id]; }

    const std::vector<Edge>& successors(NodeId id) const { return adj_[id]; }
    const std::vector<NodeId>& predecessors(NodeId id) const { return radj_[id]; }

    size_t in_degree(NodeId id) const { return radj_[id].size(); }
    size_t out_degree(NodeId id) const { return adj_[id].size(); }

    // Topological sort using Kahn's algorithm over the edges accepted by
    // `follow` (all edges when empty).
    //
    // Ready nodes are taken lowest id first. When `prefer` is given, a ready
    // node with an unplaced `prefer` predecessor yields to ready nodes
    // without one; `prefer` edges never block or fail the sort.
    Result<std::vector<NodeId>> topological_sort(const EdgeFilter& follow = {},
                                                 const EdgeFilter& prefer = {}) const {
        size_t n = nodes_.size();
        std::vector<size_t> in_deg(n, 0);
        std::vector<size_t> pending_pref(n, 0);
        for (NodeId u = 0; u < n; ++u) {
            for (const auto& e : adj_[u]) {
                if (accepts(follow, e.data)) {
                    ++in_deg[e.to];
                } else if (prefer && prefer(e.data) && e.to != u) {
                    ++pending_pref[e.to];
                }
            }
        }

        std::set<NodeId> ready_free;
        std::set<NodeId> ready_waiting;
        auto make_ready = [&](NodeId id) {
            if (pending_pref[id] == 0) ready_free.insert(id);
            else ready_waiting.insert(id);
        };
        for (NodeId i = 0; i < n; ++i) {
            if (in_deg[i] == 0) make_ready(i);
        }

        std::vector<NodeId> order;
        order.reserve(n);
        while (!ready_free.empty() || !ready_waiting.empty()) {
            auto& pool = ready_free.empty() ? ready_waiting : ready_free;
            NodeId u = *pool.begin();
            pool.erase(pool.begin());
            order.push_back(u);

            for (const auto& e : adj_[u]) {
                if (accepts(follow, e.data)) {
                    if (--in_deg[e.to] == 0) make_ready(e.to);
                } else if (prefer && prefer(e.data) && e.to != u) {
                    if (--pending_pref[e.to] == 0 && ready_waiting.erase(e.to)) {
                        ready_free.insert(e.to);
                    }
                }
            }
        }

        if (order.size() != n) {
            return MusterError{MusterError::Cycle,
                "graph contains a cycle"};
        }
        return Result<std::vector<NodeId>>::ok(std::move(order));
    }

    // Depth-first cycle search over the edges accepted by `follow`, walked
    // in direction `dir`. Returns the first cycle found, from its entry node
    // through the node that closes it, in visitation order. Self-loops
    // yield one node.
    std::optional<std::vector<NodeId>> find_cycle(const EdgeFilter& follow = {},
                                                  Direction dir = Direction::Forward) const {
        std::vector<Mark> marks(nodes_.size(), Mark::Unseen);
        std::vector<NodeId> path;
        for (NodeId root = 0; root < nodes_.size(); ++root) {
            if (marks[root] != Mark::Unseen) continue;
            auto cycle = find_cycle_impl(root, follow, dir, marks, path);
            if (cycle) return cycle;
        }
        return std::nullopt;
    }

    bool has_cycle(const EdgeFilter& follow = {}) const {
        return find_cycle(follow).has_value();
    }

    // Tree display: format the graph reachable from root as a string.
    // to_string_fn converts NodeData to a display string.
    std::string tree_display(
        NodeId root,
        std::function<std::string(const NodeData&)> to_string_fn,
        const EdgeFilter& follow = {}) const
    {
        std::ostringstream out;
        std::unordered_set<NodeId> visited;
        tree_display_impl(root, "", true, visited, to_string_fn, follow, out);
        return out.str();
    }

private:
    enum class Mark { Unseen, OnPath, Done };

    std::vector<NodeData> nodes_;
    std::vector<std::vector<Edge>> adj_;
    std::vector<std::vector<NodeId>> radj_;
    std::vector<std::vector<Edge>> redges_;

    static bool accepts(const EdgeFilter& follow, const EdgeData& data) {
        return !follow || follow(data);
    }

    std::optional<std::vector<NodeId>> find_cycle_impl(
        NodeId u,
        const EdgeFilter& follow,
        Direction dir,
        std::vector<Mark>& marks,
        std::vector<NodeId>& path) const
    {
        marks[u] = Mark::OnPath;
        path.push_back(u);
        const auto& edges = dir == Direction::Forward ? adj_[u] : redges_[u];
        for (const auto& e : edges) {
            if (!accepts(follow, e.data)) continue;
            NodeId next = dir == Direction::Forward ? e.to : e.from;
            if (marks[next] == Mark::OnPath) {
                auto start = std::find(path.begin(), path.end(), next);
                return std::vector<NodeId>(start, path.end());
            }
            if (marks[next] == Mark::Unseen) {
                auto cycle = find_cycle_impl(next, follow, dir, marks, path);
                if (cycle) return cycle;
            }
        }
        path.pop_back();
        marks[u] = Mark::Done;
        return std::nullopt;
    }

    void tree_display_impl(
        NodeId u,
        const std::string& prefix,
        bool is_last,
        std::unordered_set<NodeId>& visited,
        std::function<std::string(const NodeData&)>& to_string_fn,
        const EdgeFilter& follow,
        std::ostringstream& out) const
    {
        out << prefix;
        if (!prefix.empty()) {
            out << (is_last ? "└── " : "├── ");
        }
        out << to_string_fn(nodes_[u]);

        if (!visited.insert(u).second) {
            out << " (*)\n";
            return;
        }
        out << "\n";

        std::vector<NodeId> children;
        for (const auto& e : adj_[u]) {
            if (accepts(follow, e.data)) children.push_back(e.to);
        }
        for (size_t i = 0; i < children.size(); ++i) {
            std::string child_prefix = prefix;
            if (!prefix.empty()) {
                child_prefix += (is_last ? "    " : "│   ");
            } else {
                child_prefix = " ";
            }
            tree_display_impl(children[i], child_prefix,
                              i == children.size() - 1,
                              visited, to_string_fn, follow, out);
        }
    }
};

// ---------------------------------------------------------------------------
// GraphMap: string-keyed convenience wrapper
// ---------------------------------------------------------------------------

template<typename EdgeData = std::monostate>
class GraphMap {
public:
    using NodeId = typename Graph<std::string, EdgeData>::NodeId;
    using EdgeFilter = typename Graph<std::string, EdgeData>::EdgeFilter;
    using Direction = typename Graph<std::string, EdgeData>::Direction;

    NodeId add_node(const std::string& name) {
        auto it = name_to_id_.find(name);
        if (it != name_to_id_.end()) return it->second;
        NodeId id = graph_.add_node(name);
        name_to_id_[name] = id;
        return id;
    }

    // Returns true if the node exists
    bool has_node(const std::string& name) const {
        return name_to_id_.count(name) > 0;
    }

    NodeId node_id(const std::string& name) const {
        return name_to_id_.at(name);
    }

    void add_edge(const std::string& from, const std::string& to,
                  EdgeData data = {}) {
        NodeId f = add_node(from);
        NodeId t = add_node(to);
        graph_.add_edge(f, t, std::move(data));
    }

    Result<std::vector<std::string>> topological_sort(const EdgeFilter& follow = {},
                                                      const EdgeFilter& prefer = {}) const {
        auto r = graph_.topological_sort(follow, prefer);
        if (r.is_err()) return std::move(r).error();
        return Result<std::vector<std::string>>::ok(names(r.value()));
    }

    std::optional<std::vector<std::string>> find_cycle(const EdgeFilter& follow = {},
                                                       Direction dir = Direction::Forward) const {
        auto cycle = graph_.find_cycle(follow, dir);
        if (!cycle) return std::nullopt;
        return names(*cycle);
    }

    bool has_cycle(const EdgeFilter& follow = {}) const {
        return graph_.has_cycle(follow);
    }

    size_t node_count() const { return graph_.node_count(); }

    std::string tree_display(const std::string& root,
                             const EdgeFilter& follow = {}) const {
        auto it = name_to_id_.find(root);
        if (it == name_to_id_.end()) return "";
        return graph_.tree_display(it->second,
            [](const std::string& s) { return s; }, follow);
    }

    const Graph<std::string, EdgeData>& inner() const { return graph_; }

private:
    Graph<std::string, EdgeData> graph_;
    std::unordered_map<std::string, NodeId> name_to_id_;

    std::vector<std::string> names(const std::vector<NodeId>& ids) const {
        std::vector<std::string> out;
        out.reserve(ids.size());
        for (auto id : ids) out.push_back(graph_.node(id));
        return out;
    }
};

} // namespace muster
