#include <catch2/catch.hpp>
#include <muster/config.hpp>

#include <cstdlib>

using namespace muster;

static std::string fixtures_dir() {
    const char* src = std::getenv("MUSTER_SOURCE_DIR");
    if (src) return std::string(src) + "/tests/fixtures";
    return "../tests/fixtures";
}

// ===== Parsing =====

TEST_CASE("parse empty config", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().services.empty());
    REQUIRE(r.value().catalog.empty());
    REQUIRE(r.value().builtin_catalog);
    REQUIRE_FALSE(r.value().auto_enable);
    REQUIRE(r.value().policy.min_port == 1024);
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("[services\nport = ", "bad.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == MusterError::Parse);
    REQUIRE(r.error().file == "bad.toml");
    REQUIRE(r.error().message.find("config TOML parse error") == 0);
}

TEST_CASE("parse service with defaults", "[config]") {
    auto r = Config::parse(R"(
[services.gitea]
enable = true
port = 3000
)");
    REQUIRE(r.is_ok());
    const auto& entry = r.value().services.at("gitea");
    REQUIRE(entry.enable);
    REQUIRE(entry.instance.name == "gitea");
    REQUIRE(entry.instance.port == 3000);
    REQUIRE(entry.instance.data_dir == "/var/lib/gitea");
    REQUIRE(entry.instance.mode == Mode::Prod);
    REQUIRE_FALSE(entry.instance.domain.has_value());
    REQUIRE_FALSE(entry.instance.database.has_value());
    REQUIRE_FALSE(entry.instance.ssl.has_value());
}

TEST_CASE("parse service with database and ssl", "[config]") {
    auto r = Config::parse(R"(
[services.keycloak]
enable = true
port = 8080
data-dir = "/srv/keycloak"
domain = "sso.mycompany.com"
mode = "dev"

[services.keycloak.database]
type = "postgres"
host = "db.mycompany.com"
port = 5432
name = "kc"
user = "kc"
password-file = "/run/secrets/kc"
tls = true

[services.keycloak.ssl]
enable = true
certificate = "/etc/ssl/kc.pem"
certificate-key = "/etc/ssl/kc.key"
)");
    REQUIRE(r.is_ok());
    const auto& inst = r.value().services.at("keycloak").instance;
    REQUIRE(inst.data_dir == "/srv/keycloak");
    REQUIRE(*inst.domain == "sso.mycompany.com");
    REQUIRE(inst.mode == Mode::Dev);

    REQUIRE(inst.database.has_value());
    REQUIRE(inst.database->kind == DatabaseKind::Postgres);
    REQUIRE(inst.database->host == "db.mycompany.com");
    REQUIRE(*inst.database->port == 5432);
    REQUIRE(inst.database->name == "kc");
    REQUIRE(*inst.database->password_file == "/run/secrets/kc");
    REQUIRE(inst.database->tls);

    REQUIRE(inst.ssl.has_value());
    REQUIRE(inst.ssl->enabled);
    REQUIRE(*inst.ssl->certificate == "/etc/ssl/kc.pem");
    REQUIRE(*inst.ssl->certificate_key == "/etc/ssl/kc.key");
    REQUIRE_FALSE(inst.ssl->acme_host.has_value());
}

TEST_CASE("parse policy, catalog and resolve sections", "[config]") {
    auto r = Config::parse(R"(
[policy]
min-port = 2000
max-port = 9000
privileged-ports = [80]
default-domains = ["placeholder.dev"]
dev-tlds = ["lan"]
require-absolute-data-dir = false

[catalog]
builtin = false

[catalog.services.api]
provides = ["backend"]
requires = ["storage"]
after = ["db"]
conflicts = ["legacy-api"]
optional = ["cache"]

[resolve]
auto-enable = true
)");
    REQUIRE(r.is_ok());
    const Config& cfg = r.value();
    REQUIRE(cfg.policy.min_port == 2000);
    REQUIRE(cfg.policy.max_port == 9000);
    REQUIRE(cfg.policy.privileged_ports == std::vector<int>{80});
    REQUIRE(cfg.policy.default_domains == std::vector<std::string>{"placeholder.dev"});
    REQUIRE(cfg.policy.dev_tlds == std::vector<std::string>{"lan"});
    REQUIRE_FALSE(cfg.policy.require_absolute_data_dir);
    REQUIRE(cfg.min_port_set);
    REQUIRE(cfg.dev_tlds_set);

    REQUIRE_FALSE(cfg.builtin_catalog);
    REQUIRE(cfg.catalog.size() == 1);
    const auto& d = cfg.catalog[0];
    REQUIRE(d.name == "api");
    REQUIRE(d.provides == std::vector<std::string>{"backend"});
    REQUIRE(d.required == std::vector<std::string>{"storage"});
    REQUIRE(d.after == std::vector<std::string>{"db"});
    REQUIRE(d.conflicts == std::vector<std::string>{"legacy-api"});
    REQUIRE(d.optional == std::vector<std::string>{"cache"});

    REQUIRE(cfg.auto_enable);
}

TEST_CASE("service without a port is a config error", "[config]") {
    auto r = Config::parse("[services.gitea]\nenable = true\n", "Muster.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == MusterError::Config);
    REQUIRE(r.error().message == "service 'gitea' is missing 'port'");
    REQUIRE(r.error().hint == "add: port = <number>");
    REQUIRE(r.error().file == "Muster.toml");
    REQUIRE(r.error().notes.size() == 1);
}

TEST_CASE("errors outside a service section carry no note", "[config]") {
    auto r = Config::parse("[policy]\nmin-port = \"low\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().notes.empty());
}

TEST_CASE("bad values point at their line", "[config]") {
    SECTION("mode") {
        auto r = Config::parse("[services.gitea]\nport = 3000\nmode = \"staging\"\n", "m.toml");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == MusterError::Config);
        REQUIRE(r.error().line == 3);
        REQUIRE(r.error().notes == std::vector<std::string>{"while reading [services.gitea]"});
        REQUIRE(r.error().format().find("--> m.toml:3\n  = note: while reading [services.gitea]")
                != std::string::npos);
    }
    SECTION("database type") {
        auto r = Config::parse(
            "[services.gitea]\nport = 3000\n[services.gitea.database]\ntype = \"oracle\"\n");
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == MusterError::Config);
        REQUIRE(r.error().line == 4);
    }
    SECTION("wrong value type") {
        auto r = Config::parse("[services.gitea]\nport = \"3000\"\n");
        REQUIRE(r.is_err());
        REQUIRE(r.error().message == "'port' must be an integer");
    }
    SECTION("non-string list entry") {
        auto r = Config::parse("[catalog.services.x]\nprovides = [\"a\", 1]\n");
        REQUIRE(r.is_err());
        REQUIRE(r.error().message == "'provides' must contain only strings");
        REQUIRE(r.error().notes ==
                std::vector<std::string>{"while reading [catalog.services.x]"});
    }
}

TEST_CASE("top-level sections must be tables", "[config]") {
    auto r = Config::parse("services = 3\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message == "[services] must be a table");
}

TEST_CASE("inverted port range is rejected", "[config]") {
    auto r = Config::parse("[policy]\nmin-port = 9000\nmax-port = 8000\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == MusterError::Config);
}

TEST_CASE("unknown keys are ignored", "[config]") {
    auto r = Config::parse(R"(
colour = "blue"
[services.gitea]
port = 3000
theme = "dark"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().services.count("gitea") == 1);
}

// ===== Merge =====

TEST_CASE("merge overrides only explicitly set policy fields", "[config]") {
    auto base = Config::parse("[policy]\nmin-port = 2000\nmax-port = 9000\n").value();
    auto over = Config::parse("[policy]\nmax-port = 10000\n").value();

    base.merge(over);
    REQUIRE(base.policy.min_port == 2000);
    REQUIRE(base.policy.max_port == 10000);
}

TEST_CASE("merge replaces services and catalog entries by name", "[config]") {
    auto base = Config::parse(R"(
[catalog.services.api]
provides = ["backend"]
[services.gitea]
enable = true
port = 3000
[services.redis]
port = 6379
)").value();
    auto over = Config::parse(R"(
[catalog.services.api]
provides = ["backend", "graphql"]
[catalog.services.worker]
requires = ["backend"]
[services.gitea]
enable = false
port = 3100
)").value();

    base.merge(over);
    REQUIRE(base.catalog.size() == 2);
    REQUIRE(base.catalog[0].provides == std::vector<std::string>{"backend", "graphql"});
    REQUIRE(base.catalog[1].name == "worker");
    REQUIRE_FALSE(base.services.at("gitea").enable);
    REQUIRE(base.services.at("gitea").instance.port == 3100);
    REQUIRE(base.services.count("redis") == 1);
}

TEST_CASE("effective applies global, project, local in order", "[config]") {
    auto global = Config::parse("[resolve]\nauto-enable = true\n[policy]\nmin-port = 1500\n").value();
    auto project = Config::parse("[policy]\nmin-port = 2000\n").value();
    auto local = Config::parse("[resolve]\nauto-enable = false\n").value();

    auto cfg = Config::effective(global, project, local);
    REQUIRE(cfg.policy.min_port == 2000);
    REQUIRE_FALSE(cfg.auto_enable);

    auto no_local = Config::effective(global, project, std::nullopt);
    REQUIRE(no_local.auto_enable);

    auto nothing = Config::effective(std::nullopt, std::nullopt, std::nullopt);
    REQUIRE(nothing.policy.min_port == 1024);
}

// ===== Views =====

TEST_CASE("build_catalog layers entries over the builtin catalog", "[config]") {
    auto cfg = Config::parse(R"(
[catalog.services.gitea]
provides = ["git.server"]
requires = ["database.redis"]
[catalog.services.forgejo]
provides = ["git.server"]
)").value();

    auto catalog = cfg.build_catalog();
    REQUIRE(catalog.is_ok());
    REQUIRE(catalog.value().size() == 17);
    REQUIRE(catalog.value().rank("gitea") == 2);
    REQUIRE(catalog.value().find("gitea")->required ==
            std::vector<std::string>{"database.redis"});
    REQUIRE(catalog.value().rank("forgejo") == 16);
}

TEST_CASE("build_catalog without builtin entries", "[config]") {
    auto cfg = Config::parse("[catalog]\nbuiltin = false\n[catalog.services.api]\n").value();
    auto catalog = cfg.build_catalog();
    REQUIRE(catalog.is_ok());
    REQUIRE(catalog.value().size() == 1);
    REQUIRE(catalog.value().contains("api"));
}

TEST_CASE("enabled and disabled instances", "[config]") {
    auto cfg = Config::parse(R"(
[services.redis]
port = 6379
[services.gitea]
enable = true
port = 3000
[services.postgres]
enable = true
port = 5432
)").value();

    auto enabled = cfg.enabled_instances();
    REQUIRE(enabled.size() == 2);
    REQUIRE(enabled[0].name == "gitea");
    REQUIRE(enabled[1].name == "postgres");

    REQUIRE(cfg.disabled_instance("redis").has_value());
    REQUIRE(cfg.disabled_instance("redis")->port == 6379);
    REQUIRE_FALSE(cfg.disabled_instance("gitea").has_value());
    REQUIRE_FALSE(cfg.disabled_instance("nginx").has_value());
}

// ===== Loading =====

TEST_CASE("load missing file is an IO error", "[config]") {
    auto r = Config::load(fixtures_dir() + "/does-not-exist.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == MusterError::IO);
}

TEST_CASE("load fixture file", "[config]") {
    auto r = Config::load(fixtures_dir() + "/site.toml");
    REQUIRE(r.is_ok());
    const Config& cfg = r.value();
    REQUIRE(cfg.policy.dev_tlds == std::vector<std::string>{"local", "test"});
    REQUIRE(cfg.services.size() == 5);
    REQUIRE(cfg.enabled_instances().size() == 4);
    REQUIRE(cfg.services.at("traefik").instance.allow_privileged_port);
    REQUIRE(cfg.services.at("matrix-synapse").instance.data_dir == "/srv/matrix");
}

TEST_CASE("global_config_path lives under the home directory", "[config]") {
    auto path = global_config_path();
    if (std::getenv("HOME")) {
        REQUIRE(path.size() >= 20);
        REQUIRE(path.substr(path.size() - 20) == "/.muster/config.toml");
    }
}
