#include <catch2/catch.hpp>
#include <muster/graph.hpp>
#include <muster/engine/catalog.hpp>
#include <muster/engine/dep_graph.hpp>
#include <chrono>

using namespace muster;

namespace {

enum class Link { Hard, Soft };

} // namespace

TEST_CASE("graph perf: topo sort 10K chain under 100ms", "[graph][bench]") {
    Graph<int, Link> g;
    for (int i = 0; i < 10000; ++i) {
        g.add_node(i);
    }
    for (int i = 0; i < 9999; ++i) {
        g.add_edge(i, i + 1, Link::Hard);
    }
    // Soft edges in the opposite direction must not change the result
    for (int i = 0; i + 2 < 10000; i += 2) {
        g.add_edge(i + 2, i, Link::Soft);
    }

    auto start = std::chrono::high_resolution_clock::now();
    auto r = g.topological_sort(
        [](const Link& l) { return l == Link::Hard; },
        [](const Link& l) { return l == Link::Soft; });
    auto end = std::chrono::high_resolution_clock::now();

    REQUIRE(r.is_ok());
    REQUIRE(r.value().size() == 10000);
    REQUIRE(r.value().front() == 0);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    INFO("Topo sort 10K chain: " << ms << " ms");
    REQUIRE(ms < 100);
}

TEST_CASE("graph perf: cycle detection 10K nodes under 100ms", "[graph][bench]") {
    Graph<int> g;
    for (int i = 0; i < 10000; ++i) {
        g.add_node(i);
    }
    for (int i = 0; i < 9999; ++i) {
        g.add_edge(i, i + 1);
    }
    g.add_edge(9999, 0);

    auto start = std::chrono::high_resolution_clock::now();
    auto cycle = g.find_cycle();
    auto end = std::chrono::high_resolution_clock::now();

    REQUIRE(cycle.has_value());
    REQUIRE(cycle->size() == 10000);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    INFO("Cycle detection 10K: " << ms << " ms");
    REQUIRE(ms < 100);
}

TEST_CASE("graph perf: 2K-service catalog resolves under 500ms", "[graph][bench]") {
    // svc_i provides cap_i and requires cap_{i-1}; layers of ten share an after
    Catalog catalog;
    std::vector<std::string> enabled;
    for (int i = 0; i < 2000; ++i) {
        ServiceDescriptor d;
        d.name = "svc_" + std::to_string(i);
        d.provides = {"cap_" + std::to_string(i)};
        if (i > 0) d.required = {"cap_" + std::to_string(i - 1)};
        if (i >= 10) d.after = {"svc_" + std::to_string(i - 10)};
        REQUIRE(catalog.add(d).is_ok());
        enabled.push_back(d.name);
    }

    auto start = std::chrono::high_resolution_clock::now();
    auto graph = DependencyGraph::build(catalog, enabled);
    auto outcome = graph.outcome();
    auto end = std::chrono::high_resolution_clock::now();

    REQUIRE(outcome.issues.empty());
    REQUIRE(outcome.startup_order.has_value());
    REQUIRE(outcome.startup_order->size() == 2000);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    INFO("Resolve 2K services: " << ms << " ms");
    REQUIRE(ms < 500);
}
