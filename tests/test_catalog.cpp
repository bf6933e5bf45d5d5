#include <catch2/catch.hpp>
#include <muster/engine/catalog.hpp>

using namespace muster;

TEST_CASE("catalog add registers in order", "[catalog]") {
    Catalog c;
    REQUIRE(c.add({"postgres", {"database.postgres"}, {}, {}, {}, {}}).is_ok());
    REQUIRE(c.add({"gitea", {"git.server"}, {"database.postgres"}, {}, {}, {}}).is_ok());

    REQUIRE(c.size() == 2);
    REQUIRE(c.contains("gitea"));
    REQUIRE_FALSE(c.contains("redis"));
    REQUIRE(c.rank("postgres") == 0);
    REQUIRE(c.rank("gitea") == 1);
    REQUIRE(c.rank("redis") == Catalog::npos);
    REQUIRE(c.find("gitea")->required == std::vector<std::string>{"database.postgres"});
    REQUIRE(c.find("redis") == nullptr);
}

TEST_CASE("catalog add rejects duplicates and empty names", "[catalog]") {
    Catalog c;
    REQUIRE(c.add({"redis", {"cache"}, {}, {}, {}, {}}).is_ok());

    auto dup = c.add({"redis", {"database.redis"}, {}, {}, {}, {}});
    REQUIRE(dup.is_err());
    REQUIRE(dup.error().code == MusterError::Duplicate);
    REQUIRE(c.find("redis")->provides == std::vector<std::string>{"cache"});

    auto empty = c.add({});
    REQUIRE(empty.is_err());
    REQUIRE(empty.error().code == MusterError::InvalidArg);
}

TEST_CASE("catalog drops repeated list entries", "[catalog]") {
    Catalog c;
    REQUIRE(c.add({"svc", {"a", "b", "a"}, {"x", "x"}, {}, {"y", "y"}, {}}).is_ok());
    REQUIRE(c.find("svc")->provides == std::vector<std::string>{"a", "b"});
    REQUIRE(c.find("svc")->required == std::vector<std::string>{"x"});
    REQUIRE(c.providers_of("a") == std::vector<std::string>{"svc"});
}

TEST_CASE("catalog providers_of lists providers in catalog order", "[catalog]") {
    Catalog c;
    REQUIRE(c.add({"nginx", {"reverse_proxy"}, {}, {}, {}, {}}).is_ok());
    REQUIRE(c.add({"traefik", {"reverse_proxy", "load_balancer"}, {}, {}, {}, {}}).is_ok());

    REQUIRE(c.providers_of("reverse_proxy") ==
            std::vector<std::string>{"nginx", "traefik"});
    REQUIRE(c.providers_of("load_balancer") == std::vector<std::string>{"traefik"});
    REQUIRE(c.providers_of("nothing").empty());
}

TEST_CASE("catalog upsert replaces in place and keeps rank", "[catalog]") {
    Catalog c;
    REQUIRE(c.add({"a", {"x"}, {}, {}, {}, {}}).is_ok());
    REQUIRE(c.add({"b", {"y"}, {}, {}, {}, {}}).is_ok());

    c.upsert({"a", {"z"}, {}, {}, {}, {}});
    REQUIRE(c.rank("a") == 0);
    REQUIRE(c.size() == 2);
    REQUIRE(c.providers_of("x").empty());
    REQUIRE(c.providers_of("z") == std::vector<std::string>{"a"});

    c.upsert({"c", {"x"}, {}, {}, {}, {}});
    REQUIRE(c.rank("c") == 2);
    REQUIRE(c.providers_of("x") == std::vector<std::string>{"c"});
}

TEST_CASE("descriptor helpers", "[catalog]") {
    ServiceDescriptor d{"traefik", {"reverse_proxy"}, {}, {}, {"nginx"}, {}};
    REQUIRE(d.provides_capability("reverse_proxy"));
    REQUIRE_FALSE(d.provides_capability("web.server"));
    REQUIRE(d.conflicts_with("nginx"));
    REQUIRE_FALSE(d.conflicts_with("haproxy"));
}

TEST_CASE("builtin catalog carries the stock services", "[catalog]") {
    auto c = Catalog::builtin();
    REQUIRE(c.size() == 16);
    REQUIRE(c.services().front().name == "postgres");
    REQUIRE(c.services().back().name == "home-assistant");

    const auto* mastodon = c.find("mastodon");
    REQUIRE(mastodon != nullptr);
    REQUIRE(mastodon->required ==
            std::vector<std::string>{"database.postgres", "database.redis"});
    REQUIRE(mastodon->after == std::vector<std::string>{"postgres", "redis"});

    REQUIRE(c.providers_of("reverse_proxy") ==
            std::vector<std::string>{"traefik", "haproxy", "nginx"});
    REQUIRE(c.providers_of("cache") == std::vector<std::string>{"redis"});
    REQUIRE(c.find("nginx")->conflicts_with("traefik"));
    REQUIRE(c.find("grafana")->optional ==
            std::vector<std::string>{"monitoring.metrics"});
}
