#pragma once

#include <muster/result.hpp>
#include <muster/engine/catalog.hpp>

#include <string>
#include <vector>
#include <unordered_set>

namespace muster {

// Dependencies of one enabled service, resolved against the enabled set
struct ResolvedDependency {
    std::string service;
    std::vector<std::string> required;          // enabled providers of required capabilities
    std::vector<std::string> after;             // soft targets that are enabled
    std::vector<std::string> conflicts;         // declared conflicts, unfiltered
    std::vector<std::string> provides;
    std::vector<std::string> missing;           // required capabilities nobody enabled provides
    std::vector<std::string> missing_optional;  // optional capabilities nobody enabled provides
};

class CapabilityResolver {
public:
    CapabilityResolver(const Catalog& catalog,
                       const std::vector<std::string>& enabled);

    // Enabled providers of a capability, in catalog order (may be empty)
    std::vector<std::string> find_providers(const std::string& capability) const;

    // Every catalog provider of a capability, enabled or not
    const std::vector<std::string>& candidates(const std::string& capability) const;

    // NotFound if the service is not in the catalog
    Result<ResolvedDependency> resolve(const std::string& service) const;

    bool is_enabled(const std::string& service) const;

    const Catalog& catalog() const { return catalog_; }

private:
    const Catalog& catalog_;
    std::unordered_set<std::string> enabled_;

    // Providers other than `self`; true in `self_provides` if self is one
    std::vector<std::string> providers_except(const std::string& capability,
                                              const std::string& self,
                                              bool& self_provides) const;
};

// Expand requested services with providers for their unmet requirements,
// transitively. Picks the first non-conflicting catalog provider for each
// unmet capability; capabilities nobody can satisfy are left for resolution
// to report. Result is in catalog order.
Result<std::vector<std::string>> auto_enable(const Catalog& catalog,
                                             const std::vector<std::string>& requested);

} // namespace muster
