#pragma once

#include <muster/result.hpp>
#include <muster/engine/catalog.hpp>
#include <muster/engine/instance.hpp>
#include <muster/engine/validator.hpp>
#include <string>
#include <vector>
#include <map>
#include <optional>

namespace muster {

// [services.<name>] section
struct ServiceEntry {
    bool enable = false;
    ServiceInstance instance;
};

// Layered configuration: global > project > local
// Lower layers override higher layers (local wins over project wins over global)
struct Config {
    ValidationPolicy policy;
    // Track which policy fields were explicitly set (for merge)
    bool min_port_set = false;
    bool max_port_set = false;
    bool privileged_ports_set = false;
    bool default_domains_set = false;
    bool dev_tlds_set = false;
    bool require_absolute_data_dir_set = false;

    // [catalog]
    bool builtin_catalog = true;
    bool builtin_catalog_set = false;
    std::vector<ServiceDescriptor> catalog;   // additions and overrides, key order

    // [resolve]
    bool auto_enable = false;
    bool auto_enable_set = false;

    std::map<std::string, ServiceEntry> services;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string; source names the origin in error messages
    static Result<Config> parse(const std::string& toml_str,
                                const std::string& source = "");

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> project -> local
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project,
                            const std::optional<Config>& local);

    // Built-in descriptors (unless disabled) with [catalog.services] applied
    Result<Catalog> build_catalog() const;

    // Services with enable = true, in key order
    std::vector<ServiceInstance> enabled_instances() const;

    // Settings of a configured service that is not enabled
    std::optional<ServiceInstance> disabled_instance(const std::string& name) const;
};

// Discover the global config file path: ~/.muster/config.toml
std::string global_config_path();

} // namespace muster
