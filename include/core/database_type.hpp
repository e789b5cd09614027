#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string_view>
#include <unordered_map>

namespace polydb {

namespace keys {
    inline constexpr std::string_view POSTGRES = "postgres";
    inline constexpr std::string_view POSTGRESQL = "postgresql";
    inline constexpr std::string_view PG = "pg";
    inline constexpr std::string_view MYSQL = "mysql";
    inline constexpr std::string_view MARIADB = "mariadb";
    inline constexpr std::string_view SQLITE = "sqlite";
    inline constexpr std::string_view SQLITE3 = "sqlite3";
    inline constexpr std::string_view REDIS = "redis";
}

/**
 * @brief Closed set of supported backends
 *
 * Every dispatch over this enum is a switch without a default case,
 * so adding a backend is a -Wswitch diagnostic at every site.
 */
enum class DatabaseType {
    POSTGRESQL,
    MYSQL,
    SQLITE,
    REDIS,
};

[[nodiscard]] inline std::string_view database_type_to_string(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return keys::POSTGRESQL;
        case DatabaseType::MYSQL: return keys::MYSQL;
        case DatabaseType::SQLITE: return keys::SQLITE;
        case DatabaseType::REDIS: return keys::REDIS;
    }
    return "unknown";
}

[[nodiscard]] inline bool is_relational(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL:
        case DatabaseType::MYSQL:
        case DatabaseType::SQLITE:
            return true;
        case DatabaseType::REDIS:
            return false;
    }
    return false;
}

[[nodiscard]] inline std::optional<DatabaseType> parse_database_type(std::string_view type_str) {
    static const std::unordered_map<std::string_view, DatabaseType> lookup = {
        {keys::POSTGRESQL, DatabaseType::POSTGRESQL},
        {keys::POSTGRES,   DatabaseType::POSTGRESQL},
        {keys::PG,         DatabaseType::POSTGRESQL},
        {keys::MYSQL,      DatabaseType::MYSQL},
        {keys::MARIADB,    DatabaseType::MYSQL},
        {keys::SQLITE,     DatabaseType::SQLITE},
        {keys::SQLITE3,    DatabaseType::SQLITE},
        {keys::REDIS,      DatabaseType::REDIS},
    };

    if (const auto it = lookup.find(type_str); it != lookup.end()) {
        return it->second;
    }

    // Case-insensitive fallback, only when the direct lookup misses
    for (const auto& [key, value] : lookup) {
        if (key.size() == type_str.size()) {
            const bool match = std::equal(key.begin(), key.end(), type_str.begin(),
                [](char a, char b) { return std::tolower(a) == std::tolower(b); });
            if (match) return value;
        }
    }

    return std::nullopt;
}

} // namespace polydb
