#include <muster/engine/validator.hpp>
#include <muster/log.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>

namespace muster {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    return s;
}

static std::string tld_of(const std::string& domain) {
    auto dot = domain.rfind('.');
    return dot == std::string::npos ? domain : domain.substr(dot + 1);
}

// Lexically normalized, without trailing separators, so /a/b/ == /a/./b
static std::string normalize_dir(const std::string& dir) {
    std::string norm = fs::path(dir).lexically_normal().generic_string();
    while (norm.size() > 1 && norm.back() == '/') norm.pop_back();
    return norm;
}

bool is_valid_domain(const std::string& domain) {
    auto dot = domain.rfind('.');
    if (dot == std::string::npos || dot == 0) return false;

    for (size_t i = 0; i < dot; ++i) {
        char c = domain[i];
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '.') {
            return false;
        }
    }

    std::string tld = domain.substr(dot + 1);
    if (tld.size() < 2) return false;
    for (char c : tld) {
        if (!std::isalpha(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Per-instance checks
// ---------------------------------------------------------------------------

static void check_port_range(const ServiceInstance& svc,
                             const ValidationPolicy& policy,
                             std::vector<Issue>& out) {
    if (svc.port >= policy.min_port && svc.port <= policy.max_port) return;

    bool listed = std::find(policy.privileged_ports.begin(),
                            policy.privileged_ports.end(),
                            svc.port) != policy.privileged_ports.end();
    if (listed && svc.allow_privileged_port) return;

    std::string msg = "service '" + svc.name + "' port " + std::to_string(svc.port) +
                      " must be between " + std::to_string(policy.min_port) + "-" +
                      std::to_string(policy.max_port) + " (non-privileged range)";
    if (listed) {
        msg += "; set allow-privileged-port to bind it";
    }
    out.push_back(Issue::fatal(Issue::PortOutOfRange, svc.name, msg));
}

static void check_data_dir(const ServiceInstance& svc,
                           const ValidationPolicy& policy,
                           std::vector<Issue>& out) {
    if (!policy.require_absolute_data_dir) return;
    if (!svc.data_dir.empty() && fs::path(svc.data_dir).is_absolute()) return;
    out.push_back(Issue::fatal(Issue::DataDirNotAbsolute, svc.name,
        "service '" + svc.name + "' data directory '" + svc.data_dir +
        "' must be an absolute path"));
}

static void check_domain(const ServiceInstance& svc,
                         const ValidationPolicy& policy,
                         std::vector<Issue>& out) {
    if (!svc.domain) return;
    const std::string& domain = *svc.domain;

    if (!is_valid_domain(domain)) {
        out.push_back(Issue::fatal(Issue::InvalidDomainFormat, svc.name,
            "service '" + svc.name + "' domain '" + domain +
            "' is not a valid domain name format"));
        return;
    }

    std::string d = lower(domain);
    std::string tld = tld_of(d);
    bool dev_like = std::any_of(policy.dev_tlds.begin(), policy.dev_tlds.end(),
                                [&](const std::string& t) { return lower(t) == tld; });
    if (svc.mode == Mode::Dev && !dev_like) {
        out.push_back(Issue::warning(Issue::DevModeWithProdLikeDomain, svc.name,
            "service '" + svc.name + "' is in dev mode but domain '" + domain +
            "' looks like production"));
    }

    for (const auto& placeholder : policy.default_domains) {
        std::string p = lower(placeholder);
        if (d == p || ends_with(d, "." + p)) {
            out.push_back(Issue::warning(Issue::DefaultDomainUnchanged, svc.name,
                "service '" + svc.name + "' is using default domain '" + domain +
                "', should be changed for production"));
            break;
        }
    }
}

static void check_database(const ServiceInstance& svc, std::vector<Issue>& out) {
    if (!svc.database) return;
    const DatabaseConfig& db = *svc.database;

    if (db.needs_password() && !db.password_file) {
        out.push_back(Issue::fatal(Issue::MissingDatabaseCredential, svc.name,
            "service '" + svc.name + "' database type '" +
            database_kind_name(db.kind) + "' requires passwordFile to be set"));
    }

    if (db.needs_password() && !db.is_local() && !db.tls) {
        out.push_back(Issue::warning(Issue::UnencryptedDatabaseLink, svc.name,
            "service '" + svc.name + "' database connection to '" + db.host +
            "' should use encryption"));
    }
}

static void check_ssl(const ServiceInstance& svc, std::vector<Issue>& out) {
    if (!svc.ssl) return;
    const SslConfig& ssl = *svc.ssl;

    if (ssl.enabled && !ssl.acme_host &&
        (!ssl.certificate || !ssl.certificate_key)) {
        out.push_back(Issue::fatal(Issue::InconsistentSslConfig, svc.name,
            "service '" + svc.name + "' SSL enabled without ACME requires both "
            "certificate and certificateKey paths"));
    }

    if (!ssl.enabled && svc.mode == Mode::Prod) {
        out.push_back(Issue::warning(Issue::SslDisabledInProd, svc.name,
            "service '" + svc.name + "' has SSL disabled in production mode"));
    }
}

// ---------------------------------------------------------------------------
// Cross-instance checks
// ---------------------------------------------------------------------------

template<typename Key, typename KeyFn, typename EmitFn>
static void check_unique(const std::vector<ServiceInstance>& instances,
                         KeyFn key_of, EmitFn emit) {
    // key -> services seen so far, in input order
    std::map<Key, std::vector<const ServiceInstance*>> owners;
    for (const auto& svc : instances) {
        auto& prior = owners[key_of(svc)];
        for (const ServiceInstance* other : prior) {
            if (other->name != svc.name) emit(*other, svc);
        }
        prior.push_back(&svc);
    }
}

// ---------------------------------------------------------------------------
// validate()
// ---------------------------------------------------------------------------

std::vector<Issue> validate(const std::vector<ServiceInstance>& instances,
                            const ValidationPolicy& policy)
{
    std::vector<Issue> issues;

    for (const auto& svc : instances) {
        check_port_range(svc, policy, issues);
    }

    check_unique<int>(instances,
        [](const ServiceInstance& s) { return s.port; },
        [&](const ServiceInstance& first, const ServiceInstance& second) {
            issues.push_back(Issue::fatal(Issue::PortCollision, second.name,
                "port " + std::to_string(second.port) +
                " is already used by service '" + first.name +
                "', cannot assign to '" + second.name + "'",
                {first.name}));
        });

    for (const auto& svc : instances) {
        check_data_dir(svc, policy, issues);
    }

    check_unique<std::string>(instances,
        [](const ServiceInstance& s) { return normalize_dir(s.data_dir); },
        [&](const ServiceInstance& first, const ServiceInstance& second) {
            if (second.data_dir.empty()) return;
            issues.push_back(Issue::fatal(Issue::DataDirCollision, second.name,
                "data directory '" + second.data_dir +
                "' is already used by service '" + first.name +
                "', cannot assign to '" + second.name + "'",
                {first.name}));
        });

    for (const auto& svc : instances) {
        check_domain(svc, policy, issues);
        check_database(svc, issues);
        check_ssl(svc, issues);
    }

    log::debug("validated %zu instances: %zu issues", instances.size(), issues.size());
    return issues;
}

} // namespace muster
