#include <muster/config.hpp>
#include <muster/log.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <limits>

namespace muster {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

namespace {

struct Reader {
    std::string source;

    int line_of(const toml::node* node) const {
        return node ? static_cast<int>(node->source().begin.line) : 0;
    }

    MusterError error(const toml::node* node, const std::string& msg,
                      const std::string& hint = "") const {
        return MusterError{MusterError::Config, msg, hint, source, line_of(node)};
    }

    void warn_unknown(const std::string& key, const std::string& section) const {
        log::warn("%s: ignoring unknown key '%s' in [%s]",
                  source.empty() ? "<config>" : source.c_str(),
                  key.c_str(), section.c_str());
    }

    Result<std::vector<std::string>> strings(const toml::node& node,
                                             const std::string& key) const {
        const toml::array* arr = node.as_array();
        if (!arr) {
            return error(&node, "'" + key + "' must be an array of strings");
        }
        std::vector<std::string> out;
        for (const auto& elem : *arr) {
            auto s = elem.value<std::string>();
            if (!s) {
                return error(&elem, "'" + key + "' must contain only strings");
            }
            out.push_back(*s);
        }
        return Result<std::vector<std::string>>::ok(std::move(out));
    }

    Result<std::vector<int>> ints(const toml::node& node,
                                  const std::string& key) const {
        const toml::array* arr = node.as_array();
        if (!arr) {
            return error(&node, "'" + key + "' must be an array of integers");
        }
        std::vector<int> out;
        for (const auto& elem : *arr) {
            auto v = integer(elem, key);
            MUSTER_TRY(v);
            out.push_back(v.value());
        }
        return Result<std::vector<int>>::ok(std::move(out));
    }

    Result<int> integer(const toml::node& node, const std::string& key) const {
        auto v = node.value<int64_t>();
        if (!v || !node.is_integer()) {
            return error(&node, "'" + key + "' must be an integer");
        }
        if (*v < std::numeric_limits<int>::min() ||
            *v > std::numeric_limits<int>::max()) {
            return error(&node, "'" + key + "' is out of range");
        }
        return Result<int>::ok(static_cast<int>(*v));
    }

    Result<bool> boolean(const toml::node& node, const std::string& key) const {
        auto v = node.value<bool>();
        if (!v || !node.is_boolean()) {
            return error(&node, "'" + key + "' must be true or false");
        }
        return Result<bool>::ok(*v);
    }

    Result<std::string> string(const toml::node& node, const std::string& key) const {
        auto v = node.value<std::string>();
        if (!v || !node.is_string()) {
            return error(&node, "'" + key + "' must be a string");
        }
        return Result<std::string>::ok(*v);
    }
};

// Assigns a parsed value or propagates its error
#define MUSTER_ASSIGN(target, expr) \
    do { \
        auto _muster_v = (expr); \
        if (_muster_v.is_err()) return std::move(_muster_v).error(); \
        target = std::move(_muster_v).value(); \
    } while(0)

Status parse_policy(const Reader& rd, const toml::table& tbl, Config& cfg) {
    for (const auto& [key, val] : tbl) {
        std::string k(key.str());
        if (k == "min-port") {
            MUSTER_ASSIGN(cfg.policy.min_port, rd.integer(val, k));
            cfg.min_port_set = true;
        } else if (k == "max-port") {
            MUSTER_ASSIGN(cfg.policy.max_port, rd.integer(val, k));
            cfg.max_port_set = true;
        } else if (k == "privileged-ports") {
            MUSTER_ASSIGN(cfg.policy.privileged_ports, rd.ints(val, k));
            cfg.privileged_ports_set = true;
        } else if (k == "default-domains") {
            MUSTER_ASSIGN(cfg.policy.default_domains, rd.strings(val, k));
            cfg.default_domains_set = true;
        } else if (k == "dev-tlds") {
            MUSTER_ASSIGN(cfg.policy.dev_tlds, rd.strings(val, k));
            cfg.dev_tlds_set = true;
        } else if (k == "require-absolute-data-dir") {
            MUSTER_ASSIGN(cfg.policy.require_absolute_data_dir, rd.boolean(val, k));
            cfg.require_absolute_data_dir_set = true;
        } else {
            rd.warn_unknown(k, "policy");
        }
    }
    if (cfg.policy.min_port > cfg.policy.max_port) {
        return rd.error(&tbl, "policy min-port is greater than max-port");
    }
    return ok_status();
}

Result<ServiceDescriptor> parse_descriptor(const Reader& rd,
                                           const std::string& name,
                                           const toml::node& node) {
    const toml::table* tbl = node.as_table();
    if (!tbl) {
        return rd.error(&node, "catalog entry '" + name + "' must be a table");
    }
    ServiceDescriptor d;
    d.name = name;
    for (const auto& [key, val] : *tbl) {
        std::string k(key.str());
        if (k == "provides")       MUSTER_ASSIGN(d.provides, rd.strings(val, k));
        else if (k == "requires")  MUSTER_ASSIGN(d.required, rd.strings(val, k));
        else if (k == "after")     MUSTER_ASSIGN(d.after, rd.strings(val, k));
        else if (k == "conflicts") MUSTER_ASSIGN(d.conflicts, rd.strings(val, k));
        else if (k == "optional")  MUSTER_ASSIGN(d.optional, rd.strings(val, k));
        else rd.warn_unknown(k, "catalog.services." + name);
    }
    return Result<ServiceDescriptor>::ok(std::move(d));
}

Status parse_catalog(const Reader& rd, const toml::table& tbl, Config& cfg) {
    for (const auto& [key, val] : tbl) {
        std::string k(key.str());
        if (k == "builtin") {
            MUSTER_ASSIGN(cfg.builtin_catalog, rd.boolean(val, k));
            cfg.builtin_catalog_set = true;
        } else if (k == "services") {
            const toml::table* services = val.as_table();
            if (!services) {
                return rd.error(&val, "[catalog.services] must be a table");
            }
            for (const auto& [name, entry] : *services) {
                std::string svc(name.str());
                auto d = parse_descriptor(rd, svc, entry).map_err([&](MusterError e) {
                    e.note("while reading [catalog.services." + svc + "]");
                    return e;
                });
                MUSTER_TRY(d);
                cfg.catalog.push_back(std::move(d).value());
            }
        } else {
            rd.warn_unknown(k, "catalog");
        }
    }
    return ok_status();
}

Result<DatabaseConfig> parse_database(const Reader& rd, const std::string& svc,
                                      const toml::node& node) {
    const toml::table* tbl = node.as_table();
    if (!tbl) {
        return rd.error(&node, "[services." + svc + ".database] must be a table");
    }
    DatabaseConfig db;
    for (const auto& [key, val] : *tbl) {
        std::string k(key.str());
        if (k == "type") {
            std::string text;
            MUSTER_ASSIGN(text, rd.string(val, k));
            auto kind = parse_database_kind(text);
            if (kind.is_err()) {
                return rd.error(&val, kind.error().message, kind.error().hint);
            }
            db.kind = kind.value();
        } else if (k == "host") {
            MUSTER_ASSIGN(db.host, rd.string(val, k));
        } else if (k == "port") {
            int port = 0;
            MUSTER_ASSIGN(port, rd.integer(val, k));
            db.port = port;
        } else if (k == "name") {
            MUSTER_ASSIGN(db.name, rd.string(val, k));
        } else if (k == "user") {
            MUSTER_ASSIGN(db.user, rd.string(val, k));
        } else if (k == "password-file") {
            std::string path;
            MUSTER_ASSIGN(path, rd.string(val, k));
            db.password_file = path;
        } else if (k == "tls") {
            MUSTER_ASSIGN(db.tls, rd.boolean(val, k));
        } else {
            rd.warn_unknown(k, "services." + svc + ".database");
        }
    }
    return Result<DatabaseConfig>::ok(std::move(db));
}

Result<SslConfig> parse_ssl(const Reader& rd, const std::string& svc,
                            const toml::node& node) {
    const toml::table* tbl = node.as_table();
    if (!tbl) {
        return rd.error(&node, "[services." + svc + ".ssl] must be a table");
    }
    SslConfig ssl;
    for (const auto& [key, val] : *tbl) {
        std::string k(key.str());
        std::string text;
        if (k == "enable") {
            MUSTER_ASSIGN(ssl.enabled, rd.boolean(val, k));
        } else if (k == "certificate") {
            MUSTER_ASSIGN(text, rd.string(val, k));
            ssl.certificate = text;
        } else if (k == "certificate-key") {
            MUSTER_ASSIGN(text, rd.string(val, k));
            ssl.certificate_key = text;
        } else if (k == "acme-host") {
            MUSTER_ASSIGN(text, rd.string(val, k));
            ssl.acme_host = text;
        } else {
            rd.warn_unknown(k, "services." + svc + ".ssl");
        }
    }
    return Result<SslConfig>::ok(std::move(ssl));
}

Result<ServiceEntry> parse_service(const Reader& rd, const std::string& name,
                                   const toml::node& node) {
    const toml::table* tbl = node.as_table();
    if (!tbl) {
        return rd.error(&node, "[services." + name + "] must be a table");
    }

    ServiceEntry entry;
    ServiceInstance& inst = entry.instance;
    inst.name = name;
    inst.data_dir = "/var/lib/" + name;
    bool has_port = false;

    for (const auto& [key, val] : *tbl) {
        std::string k(key.str());
        if (k == "enable") {
            MUSTER_ASSIGN(entry.enable, rd.boolean(val, k));
        } else if (k == "port") {
            MUSTER_ASSIGN(inst.port, rd.integer(val, k));
            has_port = true;
        } else if (k == "data-dir") {
            MUSTER_ASSIGN(inst.data_dir, rd.string(val, k));
        } else if (k == "domain") {
            std::string domain;
            MUSTER_ASSIGN(domain, rd.string(val, k));
            inst.domain = domain;
        } else if (k == "mode") {
            std::string text;
            MUSTER_ASSIGN(text, rd.string(val, k));
            auto mode = parse_mode(text);
            if (mode.is_err()) {
                return rd.error(&val, mode.error().message, mode.error().hint);
            }
            inst.mode = mode.value();
        } else if (k == "allow-privileged-port") {
            MUSTER_ASSIGN(inst.allow_privileged_port, rd.boolean(val, k));
        } else if (k == "database") {
            MUSTER_ASSIGN(inst.database, parse_database(rd, name, val));
        } else if (k == "ssl") {
            MUSTER_ASSIGN(inst.ssl, parse_ssl(rd, name, val));
        } else {
            rd.warn_unknown(k, "services." + name);
        }
    }

    if (!has_port) {
        return rd.error(&node, "service '" + name + "' is missing 'port'",
                        "add: port = <number>");
    }
    return Result<ServiceEntry>::ok(std::move(entry));
}

#undef MUSTER_ASSIGN

} // namespace

// ---------------------------------------------------------------------------
// parse() / load()
// ---------------------------------------------------------------------------

Result<Config> Config::parse(const std::string& toml_str, const std::string& source) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, source);
    } catch (const toml::parse_error& e) {
        return MusterError{MusterError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", source, static_cast<int>(e.source().begin.line)};
    }

    Reader rd{source};
    Config cfg;

    for (const auto& [key, val] : doc) {
        std::string k(key.str());
        if (k == "policy" || k == "catalog" || k == "resolve" || k == "services") {
            if (!val.is_table()) {
                return rd.error(&val, "[" + k + "] must be a table");
            }
        } else {
            rd.warn_unknown(k, "<root>");
        }
    }

    // [policy]
    if (auto policy = doc["policy"].as_table()) {
        MUSTER_TRY(parse_policy(rd, *policy, cfg));
    }

    // [catalog]
    if (auto catalog = doc["catalog"].as_table()) {
        MUSTER_TRY(parse_catalog(rd, *catalog, cfg));
    }

    // [resolve]
    if (auto resolve = doc["resolve"].as_table()) {
        for (const auto& [key, val] : *resolve) {
            std::string k(key.str());
            if (k == "auto-enable") {
                auto v = rd.boolean(val, k);
                MUSTER_TRY(v);
                cfg.auto_enable = v.value();
                cfg.auto_enable_set = true;
            } else {
                rd.warn_unknown(k, "resolve");
            }
        }
    }

    // [services.<name>]
    if (auto services = doc["services"].as_table()) {
        for (const auto& [key, val] : *services) {
            std::string name(key.str());
            auto entry = parse_service(rd, name, val).map_err([&](MusterError e) {
                e.note("while reading [services." + name + "]");
                return e;
            });
            MUSTER_TRY(entry);
            cfg.services[name] = std::move(entry).value();
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return MusterError{MusterError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str(), path);
}

// ---------------------------------------------------------------------------
// Layering
// ---------------------------------------------------------------------------

void Config::merge(const Config& other) {
    // Policy: other overrides only explicitly-set fields
    if (other.min_port_set) {
        policy.min_port = other.policy.min_port;
        min_port_set = true;
    }
    if (other.max_port_set) {
        policy.max_port = other.policy.max_port;
        max_port_set = true;
    }
    if (other.privileged_ports_set) {
        policy.privileged_ports = other.policy.privileged_ports;
        privileged_ports_set = true;
    }
    if (other.default_domains_set) {
        policy.default_domains = other.policy.default_domains;
        default_domains_set = true;
    }
    if (other.dev_tlds_set) {
        policy.dev_tlds = other.policy.dev_tlds;
        dev_tlds_set = true;
    }
    if (other.require_absolute_data_dir_set) {
        policy.require_absolute_data_dir = other.policy.require_absolute_data_dir;
        require_absolute_data_dir_set = true;
    }

    if (other.builtin_catalog_set) {
        builtin_catalog = other.builtin_catalog;
        builtin_catalog_set = true;
    }
    if (other.auto_enable_set) {
        auto_enable = other.auto_enable;
        auto_enable_set = true;
    }

    // Catalog entries: other overrides this per-service
    for (const auto& d : other.catalog) {
        bool replaced = false;
        for (auto& mine : catalog) {
            if (mine.name == d.name) {
                mine = d;
                replaced = true;
                break;
            }
        }
        if (!replaced) catalog.push_back(d);
    }

    // Services: other overrides this per-service
    for (const auto& [name, entry] : other.services) {
        services[name] = entry;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

// ---------------------------------------------------------------------------
// Views
// ---------------------------------------------------------------------------

Result<Catalog> Config::build_catalog() const {
    Catalog result = builtin_catalog ? Catalog::builtin() : Catalog{};
    for (const auto& d : catalog) {
        if (d.name.empty()) {
            return MusterError{MusterError::Config,
                "catalog entry with an empty service name"};
        }
        result.upsert(d);
    }
    return Result<Catalog>::ok(std::move(result));
}

std::vector<ServiceInstance> Config::enabled_instances() const {
    std::vector<ServiceInstance> out;
    for (const auto& [name, entry] : services) {
        if (entry.enable) out.push_back(entry.instance);
    }
    return out;
}

std::optional<ServiceInstance> Config::disabled_instance(const std::string& name) const {
    auto it = services.find(name);
    if (it == services.end() || it->second.enable) return std::nullopt;
    return it->second.instance;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.muster/config.toml";
}

} // namespace muster
