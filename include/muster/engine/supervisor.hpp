#pragma once

#include <muster/engine/dep_graph.hpp>

#include <string>
#include <vector>

namespace muster {

// Ordering and negative constraints for one supervised unit
struct UnitDependencies {
    std::string service;
    std::vector<std::string> wants;      // hard providers
    std::vector<std::string> after;      // hard providers, then enabled soft targets
    std::vector<std::string> conflicts;  // as declared
};

// One entry per enabled service, in catalog order
std::vector<UnitDependencies> unit_dependencies(const DependencyGraph& graph);

// Wants=/After=/Conflicts= lines with ".service" names; empty lists omitted
std::string format_unit(const UnitDependencies& unit);

} // namespace muster
