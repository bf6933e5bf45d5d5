#pragma once

#include <muster/result.hpp>
#include <string>
#include <vector>
#include <unordered_map>

namespace muster {

// Static description of one service kind. Lists keep declaration order.
struct ServiceDescriptor {
    std::string name;
    std::vector<std::string> provides;    // capabilities offered
    std::vector<std::string> required;    // capabilities that must have an enabled provider
    std::vector<std::string> after;       // soft ordering: start after these services if enabled
    std::vector<std::string> conflicts;   // services that must not be enabled alongside
    std::vector<std::string> optional;    // capabilities used when available

    bool provides_capability(const std::string& capability) const;
    bool conflicts_with(const std::string& service) const;
};

// Registry of known services. Registration order is the catalog order used
// for every deterministic tie-break downstream.
class Catalog {
public:
    static constexpr size_t npos = static_cast<size_t>(-1);

    // Fails with Duplicate if the name is already registered
    Status add(ServiceDescriptor descriptor);

    // Replace in place (rank kept) or append
    void upsert(ServiceDescriptor descriptor);

    const ServiceDescriptor* find(const std::string& name) const;
    bool contains(const std::string& name) const;

    // Registration index of a service, npos if unknown
    size_t rank(const std::string& name) const;

    // Every registered provider of a capability, in catalog order
    const std::vector<std::string>& providers_of(const std::string& capability) const;

    const std::vector<ServiceDescriptor>& services() const { return services_; }
    size_t size() const { return services_.size(); }

    // Stock descriptors for the supported microservices
    static Catalog builtin();

private:
    std::vector<ServiceDescriptor> services_;
    std::unordered_map<std::string, size_t> index_;
    std::unordered_map<std::string, std::vector<std::string>> providers_;

    void rebuild_providers();
};

} // namespace muster
