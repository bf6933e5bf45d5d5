#include <muster/engine/supervisor.hpp>

#include <algorithm>

namespace muster {

std::vector<UnitDependencies> unit_dependencies(const DependencyGraph& graph) {
    std::vector<UnitDependencies> units;
    units.reserve(graph.resolved().size());

    for (const auto& rd : graph.resolved()) {
        UnitDependencies unit;
        unit.service = rd.service;
        unit.wants = rd.required;
        unit.after = rd.required;
        for (const auto& a : rd.after) {
            if (std::find(unit.after.begin(), unit.after.end(), a) == unit.after.end()) {
                unit.after.push_back(a);
            }
        }
        unit.conflicts = rd.conflicts;
        units.push_back(std::move(unit));
    }
    return units;
}

static void emit(std::string& out, const char* key,
                 const std::vector<std::string>& names) {
    if (names.empty()) return;
    out += key;
    out += "=";
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += " ";
        out += names[i];
        out += ".service";
    }
    out += "\n";
}

std::string format_unit(const UnitDependencies& unit) {
    std::string out;
    emit(out, "Wants", unit.wants);
    emit(out, "After", unit.after);
    emit(out, "Conflicts", unit.conflicts);
    return out;
}

} // namespace muster
