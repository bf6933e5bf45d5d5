#pragma once

#include <muster/result.hpp>
#include <muster/engine/catalog.hpp>
#include <muster/engine/instance.hpp>
#include <muster/engine/validator.hpp>
#include <muster/engine/diagnostics.hpp>
#include <muster/engine/supervisor.hpp>

#include <vector>

namespace muster {

struct Config;

struct Plan {
    Report report;
    // Supervisor directives; empty when the report has fatal issues
    std::vector<UnitDependencies> units;
};

// Resolve and validate one full configuration. Pure: no I/O, no state kept
// between calls, identical input gives identical output.
Plan plan(const Catalog& catalog,
          const std::vector<ServiceInstance>& instances,
          const ValidationPolicy& policy = {});

// Enabled instances of a configuration, followed by the providers
// auto-enable adds when [resolve] auto-enable is set
Result<std::vector<ServiceInstance>> planned_instances(const Config& config,
                                                       const Catalog& catalog);

// Catalog, planned instances and policy taken from a loaded configuration
Result<Plan> plan_from_config(const Config& config);

} // namespace muster
