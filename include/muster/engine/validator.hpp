#pragma once

#include <muster/engine/instance.hpp>
#include <muster/engine/issue.hpp>

#include <string>
#include <vector>

namespace muster {

struct ValidationPolicy {
    int min_port = 1024;
    int max_port = 65535;
    // Below min_port, accepted only for instances with allow_privileged_port
    std::vector<int> privileged_ports = {80, 443};
    // Placeholder domains that should be replaced before going live
    std::vector<std::string> default_domains = {"example.com", "example.org", "example.net"};
    // Top-level domains that do not look like production
    std::vector<std::string> dev_tlds = {
        "local", "localhost", "test", "internal", "lan", "home", "invalid", "example"
    };
    bool require_absolute_data_dir = true;
};

// Cross-service checks over every enabled instance. Independent of the
// dependency graph; every rule runs over the full set.
std::vector<Issue> validate(const std::vector<ServiceInstance>& instances,
                            const ValidationPolicy& policy = {});

// Labels, a dot, then an alphabetic TLD of two or more letters;
// only letters, digits, '-' and '.' allowed
bool is_valid_domain(const std::string& domain);

} // namespace muster
