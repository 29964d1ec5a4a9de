#pragma once

#include <algorithm>
#include <cctype>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>

namespace schemagraph {

namespace keys {
    inline constexpr std::string_view POSTGRES = "postgres";
    inline constexpr std::string_view POSTGRESQL = "postgresql";
    inline constexpr std::string_view PG = "pg";
    inline constexpr std::string_view MYSQL = "mysql";
    inline constexpr std::string_view MARIADB = "mariadb";
    inline constexpr std::string_view MSSQL = "mssql";
    inline constexpr std::string_view SQLSERVER = "sqlserver";
    inline constexpr std::string_view ORACLE = "oracle";
    inline constexpr std::string_view REDSHIFT = "redshift";
    inline constexpr std::string_view SYBASE = "sybase";
    inline constexpr std::string_view DB2 = "db2";
    inline constexpr std::string_view GENERIC = "generic";
}

enum class DatabaseType {
    POSTGRESQL,
    MYSQL,
    MSSQL,
    ORACLE,
    REDSHIFT,
    SYBASE,
    DB2,
    GENERIC,
};

[[nodiscard]] inline std::string_view database_type_to_string(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return keys::POSTGRESQL;
        case DatabaseType::MYSQL: return keys::MYSQL;
        case DatabaseType::MSSQL: return keys::MSSQL;
        case DatabaseType::ORACLE: return keys::ORACLE;
        case DatabaseType::REDSHIFT: return keys::REDSHIFT;
        case DatabaseType::SYBASE: return keys::SYBASE;
        case DatabaseType::DB2: return keys::DB2;
        case DatabaseType::GENERIC: return keys::GENERIC;
    }
    return "unknown";
}

[[nodiscard]] inline DatabaseType parse_database_type(std::string_view type_str) {
    static const std::unordered_map<std::string_view, DatabaseType> lookup = {
        {keys::POSTGRESQL, DatabaseType::POSTGRESQL},
        {keys::POSTGRES,   DatabaseType::POSTGRESQL},
        {keys::PG,         DatabaseType::POSTGRESQL},
        {keys::MYSQL,      DatabaseType::MYSQL},
        {keys::MARIADB,    DatabaseType::MYSQL},
        {keys::MSSQL,      DatabaseType::MSSQL},
        {keys::SQLSERVER,  DatabaseType::MSSQL},
        {keys::ORACLE,     DatabaseType::ORACLE},
        {keys::REDSHIFT,   DatabaseType::REDSHIFT},
        {keys::SYBASE,     DatabaseType::SYBASE},
        {keys::DB2,        DatabaseType::DB2},
        {keys::GENERIC,    DatabaseType::GENERIC},
    };

    if (const auto it = lookup.find(type_str); it != lookup.end()) {
        return it->second;
    }

    // Case-insensitive fallback, only when the direct lookup misses
    for (const auto& [key, value] : lookup) {
        if (key.size() == type_str.size()) {
            const bool match = std::equal(key.begin(), key.end(), type_str.begin(),
                [](char a, char b) {
                    return std::tolower(static_cast<unsigned char>(a)) ==
                           std::tolower(static_cast<unsigned char>(b));
                });
            if (match) return value;
        }
    }

    throw std::runtime_error(std::format("Unknown database type: {}", type_str));
}

} // namespace schemagraph
