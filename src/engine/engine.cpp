#include <muster/engine/engine.hpp>
#include <muster/config.hpp>
#include <muster/log.hpp>

namespace muster {

Plan plan(const Catalog& catalog,
          const std::vector<ServiceInstance>& instances,
          const ValidationPolicy& policy)
{
    std::vector<std::string> enabled;
    enabled.reserve(instances.size());
    for (const auto& inst : instances) {
        enabled.push_back(inst.name);
    }
    log::debug("planning %zu enabled services against a catalog of %zu",
               enabled.size(), catalog.size());

    auto graph = DependencyGraph::build(catalog, enabled);
    auto issues = validate(instances, policy);

    Plan result;
    result.report = aggregate(graph.outcome(), issues);
    if (result.report.ok()) {
        result.units = unit_dependencies(graph);
        log::debug("startup order resolved for %zu services",
                   result.report.startup_order->size());
    } else {
        log::debug("configuration rejected: %zu fatal issues",
                   result.report.fatal.size());
    }
    return result;
}

Result<std::vector<ServiceInstance>> planned_instances(const Config& config,
                                                       const Catalog& catalog)
{
    auto instances = config.enabled_instances();
    if (!config.auto_enable) {
        return Result<std::vector<ServiceInstance>>::ok(std::move(instances));
    }

    std::vector<std::string> names;
    for (const auto& inst : instances) {
        // Unknown names are reported by the graph stage instead
        if (catalog.contains(inst.name)) names.push_back(inst.name);
    }
    auto expanded = auto_enable(catalog, names);
    MUSTER_TRY(expanded);
    for (const auto& name : expanded.value()) {
        bool present = false;
        for (const auto& inst : instances) {
            if (inst.name == name) { present = true; break; }
        }
        if (present) continue;
        // Settings come from a configured but disabled entry
        auto inst = config.disabled_instance(name);
        if (!inst) {
            log::warn("cannot auto-enable '%s': no [services.%s] settings",
                      name.c_str(), name.c_str());
            continue;
        }
        log::info("auto-enabling '%s'", name.c_str());
        instances.push_back(std::move(*inst));
    }
    return Result<std::vector<ServiceInstance>>::ok(std::move(instances));
}

Result<Plan> plan_from_config(const Config& config) {
    auto catalog = config.build_catalog();
    MUSTER_TRY(catalog);

    auto instances = planned_instances(config, catalog.value());
    MUSTER_TRY(instances);

    return Result<Plan>::ok(plan(catalog.value(), instances.value(), config.policy));
}

} // namespace muster
