#include <muster/engine/resolver.hpp>
#include <muster/log.hpp>

#include <algorithm>

namespace muster {

// ---------------------------------------------------------------------------
// Constructor
// ---------------------------------------------------------------------------

CapabilityResolver::CapabilityResolver(const Catalog& catalog,
                                       const std::vector<std::string>& enabled)
    : catalog_(catalog), enabled_(enabled.begin(), enabled.end()) {}

bool CapabilityResolver::is_enabled(const std::string& service) const {
    return enabled_.count(service) > 0;
}

// ---------------------------------------------------------------------------
// Provider lookup
// ---------------------------------------------------------------------------

std::vector<std::string> CapabilityResolver::find_providers(
    const std::string& capability) const
{
    std::vector<std::string> result;
    for (const auto& name : catalog_.providers_of(capability)) {
        if (is_enabled(name)) result.push_back(name);
    }
    return result;
}

const std::vector<std::string>& CapabilityResolver::candidates(
    const std::string& capability) const
{
    return catalog_.providers_of(capability);
}

std::vector<std::string> CapabilityResolver::providers_except(
    const std::string& capability,
    const std::string& self,
    bool& self_provides) const
{
    self_provides = false;
    std::vector<std::string> result;
    for (auto& name : find_providers(capability)) {
        if (name == self) {
            self_provides = true;
            continue;
        }
        result.push_back(std::move(name));
    }
    return result;
}

// ---------------------------------------------------------------------------
// resolve()
// ---------------------------------------------------------------------------

Result<ResolvedDependency> CapabilityResolver::resolve(const std::string& service) const {
    const ServiceDescriptor* desc = catalog_.find(service);
    if (!desc) {
        return MusterError{MusterError::NotFound,
            "service '" + service + "' is not in the catalog"};
    }

    ResolvedDependency rd;
    rd.service = service;
    rd.provides = desc->provides;
    rd.conflicts = desc->conflicts;

    std::unordered_set<std::string> seen;
    for (const auto& cap : desc->required) {
        bool self_provides = false;
        auto providers = providers_except(cap, service, self_provides);
        if (providers.empty() && !self_provides) {
            rd.missing.push_back(cap);
            continue;
        }
        for (auto& p : providers) {
            if (seen.insert(p).second) rd.required.push_back(std::move(p));
        }
    }
    std::sort(rd.required.begin(), rd.required.end(),
              [&](const std::string& a, const std::string& b) {
                  return catalog_.rank(a) < catalog_.rank(b);
              });

    for (const auto& target : desc->after) {
        if (target != service && is_enabled(target)) {
            rd.after.push_back(target);
        }
    }

    for (const auto& cap : desc->optional) {
        bool self_provides = false;
        auto providers = providers_except(cap, service, self_provides);
        if (providers.empty() && !self_provides) {
            rd.missing_optional.push_back(cap);
        }
    }

    return Result<ResolvedDependency>::ok(std::move(rd));
}

// ---------------------------------------------------------------------------
// auto_enable()
// ---------------------------------------------------------------------------

static bool clashes(const Catalog& catalog,
                    const std::string& candidate,
                    const std::vector<std::string>& current) {
    const ServiceDescriptor* cd = catalog.find(candidate);
    for (const auto& name : current) {
        const ServiceDescriptor* d = catalog.find(name);
        if (cd->conflicts_with(name) || (d && d->conflicts_with(candidate))) {
            return true;
        }
    }
    return false;
}

Result<std::vector<std::string>> auto_enable(const Catalog& catalog,
                                             const std::vector<std::string>& requested)
{
    std::vector<std::string> current;
    for (const auto& name : requested) {
        if (!catalog.contains(name)) {
            return MusterError{MusterError::NotFound,
                "cannot auto-enable dependencies of unknown service '" + name + "'"};
        }
        if (std::find(current.begin(), current.end(), name) == current.end()) {
            current.push_back(name);
        }
    }

    // Grows by at least one service per pass, bounded by catalog size
    bool changed = true;
    while (changed) {
        changed = false;
        CapabilityResolver resolver(catalog, current);
        for (size_t i = 0; i < current.size() && !changed; ++i) {
            auto rd = resolver.resolve(current[i]);
            MUSTER_TRY(rd);
            for (const auto& cap : rd.value().missing) {
                for (const auto& candidate : catalog.providers_of(cap)) {
                    if (clashes(catalog, candidate, current)) continue;
                    log::debug("auto-enabling '%s' to provide '%s' for '%s'",
                               candidate.c_str(), cap.c_str(), current[i].c_str());
                    current.push_back(candidate);
                    changed = true;
                    break;
                }
                if (changed) break;
            }
        }
    }

    std::sort(current.begin(), current.end(),
              [&](const std::string& a, const std::string& b) {
                  return catalog.rank(a) < catalog.rank(b);
              });
    return Result<std::vector<std::string>>::ok(std::move(current));
}

} // namespace muster
