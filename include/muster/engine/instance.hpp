#pragma once

#include <muster/result.hpp>
#include <string>
#include <optional>

namespace muster {

enum class Mode { Dev, Prod };

enum class DatabaseKind { Sqlite3, Mysql, Postgres, Redis };

struct DatabaseConfig {
    DatabaseKind kind = DatabaseKind::Sqlite3;
    std::string host = "localhost";
    std::optional<int> port;
    std::string name = "app";
    std::string user = "app";
    std::optional<std::string> password_file;
    bool tls = false;             // connection to a remote host is encrypted

    // mysql and postgres authenticate with a password
    bool needs_password() const;
    // localhost, loopback addresses and unix socket paths
    bool is_local() const;
};

struct SslConfig {
    bool enabled = true;
    std::optional<std::string> certificate;
    std::optional<std::string> certificate_key;
    std::optional<std::string> acme_host;
};

// Runtime settings of one enabled service
struct ServiceInstance {
    std::string name;
    int port = 0;
    std::string data_dir;
    std::optional<std::string> domain;
    std::optional<DatabaseConfig> database;
    std::optional<SslConfig> ssl;
    Mode mode = Mode::Prod;
    bool allow_privileged_port = false;   // may bind a policy-listed port below the range
};

const char* mode_name(Mode mode);
Result<Mode> parse_mode(const std::string& text);

const char* database_kind_name(DatabaseKind kind);
Result<DatabaseKind> parse_database_kind(const std::string& text);

} // namespace muster
