#include <muster/engine/instance.hpp>

namespace muster {

bool DatabaseConfig::needs_password() const {
    return kind == DatabaseKind::Mysql || kind == DatabaseKind::Postgres;
}

bool DatabaseConfig::is_local() const {
    if (host.empty()) return true;
    if (host[0] == '/') return true;   // unix socket directory
    return host == "localhost" || host == "127.0.0.1" || host == "::1";
}

const char* mode_name(Mode mode) {
    switch (mode) {
        case Mode::Dev:  return "dev";
        case Mode::Prod: return "prod";
    }
    return "?";
}

Result<Mode> parse_mode(const std::string& text) {
    if (text == "dev") return Result<Mode>::ok(Mode::Dev);
    if (text == "prod") return Result<Mode>::ok(Mode::Prod);
    return MusterError{MusterError::InvalidArg,
        "unknown mode '" + text + "'",
        "expected 'dev' or 'prod'"};
}

const char* database_kind_name(DatabaseKind kind) {
    switch (kind) {
        case DatabaseKind::Sqlite3:  return "sqlite3";
        case DatabaseKind::Mysql:    return "mysql";
        case DatabaseKind::Postgres: return "postgres";
        case DatabaseKind::Redis:    return "redis";
    }
    return "?";
}

Result<DatabaseKind> parse_database_kind(const std::string& text) {
    static const DatabaseKind all[] = {
        DatabaseKind::Sqlite3, DatabaseKind::Mysql,
        DatabaseKind::Postgres, DatabaseKind::Redis
    };
    for (auto kind : all) {
        if (text == database_kind_name(kind)) {
            return Result<DatabaseKind>::ok(kind);
        }
    }
    return MusterError{MusterError::InvalidArg,
        "unknown database type '" + text + "'",
        "expected one of: sqlite3, mysql, postgres, redis"};
}

} // namespace muster
