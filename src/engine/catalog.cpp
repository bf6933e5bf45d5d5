#include <muster/engine/catalog.hpp>
#include <algorithm>
#include <unordered_set>

namespace muster {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static void dedupe(std::vector<std::string>& items) {
    std::unordered_set<std::string> seen;
    items.erase(std::remove_if(items.begin(), items.end(),
                               [&](const std::string& s) {
                                   return !seen.insert(s).second;
                               }),
                items.end());
}

static void normalize(ServiceDescriptor& d) {
    dedupe(d.provides);
    dedupe(d.required);
    dedupe(d.after);
    dedupe(d.conflicts);
    dedupe(d.optional);
}

static bool contains_name(const std::vector<std::string>& items,
                          const std::string& name) {
    return std::find(items.begin(), items.end(), name) != items.end();
}

// ---------------------------------------------------------------------------
// ServiceDescriptor
// ---------------------------------------------------------------------------

bool ServiceDescriptor::provides_capability(const std::string& capability) const {
    return contains_name(provides, capability);
}

bool ServiceDescriptor::conflicts_with(const std::string& service) const {
    return contains_name(conflicts, service);
}

// ---------------------------------------------------------------------------
// Catalog
// ---------------------------------------------------------------------------

Status Catalog::add(ServiceDescriptor descriptor) {
    if (descriptor.name.empty()) {
        return MusterError{MusterError::InvalidArg,
            "service descriptor has an empty name"};
    }
    if (index_.count(descriptor.name)) {
        return MusterError{MusterError::Duplicate,
            "service '" + descriptor.name + "' is already registered",
            "use upsert() to replace an existing descriptor"};
    }

    normalize(descriptor);
    index_[descriptor.name] = services_.size();
    for (const auto& cap : descriptor.provides) {
        providers_[cap].push_back(descriptor.name);
    }
    services_.push_back(std::move(descriptor));
    return ok_status();
}

void Catalog::upsert(ServiceDescriptor descriptor) {
    auto it = index_.find(descriptor.name);
    if (it == index_.end()) {
        // Cannot fail: name is new
        (void)add(std::move(descriptor));
        return;
    }
    normalize(descriptor);
    services_[it->second] = std::move(descriptor);
    rebuild_providers();
}

void Catalog::rebuild_providers() {
    providers_.clear();
    for (const auto& svc : services_) {
        for (const auto& cap : svc.provides) {
            providers_[cap].push_back(svc.name);
        }
    }
}

const ServiceDescriptor* Catalog::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &services_[it->second];
}

bool Catalog::contains(const std::string& name) const {
    return index_.count(name) > 0;
}

size_t Catalog::rank(const std::string& name) const {
    auto it = index_.find(name);
    return it == index_.end() ? npos : it->second;
}

const std::vector<std::string>& Catalog::providers_of(const std::string& capability) const {
    static const std::vector<std::string> none;
    auto it = providers_.find(capability);
    return it == providers_.end() ? none : it->second;
}

// ---------------------------------------------------------------------------
// builtin()
// ---------------------------------------------------------------------------

Catalog Catalog::builtin() {
    // name, provides, required, after, conflicts, optional
    static const ServiceDescriptor stock[] = {
        // Databases
        {"postgres", {"database.postgres"}, {}, {}, {}, {}},
        {"redis", {"database.redis", "cache"}, {}, {}, {}, {}},

        // Web applications
        {"gitea", {"git.server", "web.service"},
            {"database.postgres"}, {"postgres"}, {}, {"reverse_proxy"}},
        {"mastodon", {"social.server", "web.service"},
            {"database.postgres", "database.redis"}, {"postgres", "redis"}, {},
            {"reverse_proxy"}},
        {"matrix-synapse", {"chat.server", "web.service"},
            {"database.postgres"}, {"postgres"}, {}, {"reverse_proxy"}},
        {"vaultwarden", {"password.manager", "web.service"},
            {}, {}, {}, {"database.postgres", "reverse_proxy"}},

        // Reverse proxies
        {"traefik", {"reverse_proxy", "load_balancer"},
            {}, {}, {"haproxy", "nginx"}, {}},
        {"haproxy", {"reverse_proxy", "load_balancer"},
            {}, {}, {"traefik", "nginx"}, {}},
        {"nginx", {"reverse_proxy", "web.server"},
            {}, {}, {"traefik", "haproxy"}, {}},

        // Monitoring
        {"prometheus", {"monitoring.metrics"}, {}, {}, {}, {}},
        {"grafana", {"monitoring.visualization"},
            {}, {}, {}, {"monitoring.metrics"}},

        // Authentication
        {"keycloak", {"auth.server", "sso"},
            {"database.postgres"}, {"postgres"}, {}, {"reverse_proxy"}},

        // Orchestration
        {"consul", {"service.discovery", "kv.store"}, {}, {}, {}, {}},
        {"nomad", {"container.orchestration"},
            {}, {}, {"kubernetes"}, {"service.discovery"}},

        // Media and home automation
        {"jellyfin", {"media.server"},
            {}, {}, {"plex", "emby"}, {"reverse_proxy"}},
        {"home-assistant", {"home.automation"},
            {}, {}, {}, {"database.postgres", "reverse_proxy"}},
    };

    Catalog catalog;
    for (const auto& d : stock) {
        catalog.upsert(d);
    }
    return catalog;
}

} // namespace muster
