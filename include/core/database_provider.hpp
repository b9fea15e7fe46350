#pragma once

#include "core/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace querywatch {

namespace keys {
    inline constexpr std::string_view AUTO = "auto";
    inline constexpr std::string_view SQLSERVER = "sqlserver";
    inline constexpr std::string_view MSSQL = "mssql";
    inline constexpr std::string_view POSTGRES = "postgres";
    inline constexpr std::string_view POSTGRESQL = "postgresql";
    inline constexpr std::string_view PG = "pg";
    inline constexpr std::string_view MYSQL = "mysql";
    inline constexpr std::string_view MARIADB = "mariadb";
    inline constexpr std::string_view ORACLE = "oracle";
    inline constexpr std::string_view SQLITE = "sqlite";
}

/// Provider names as they appear in reports
[[nodiscard]] inline std::string_view provider_to_string(DatabaseProvider provider) {
    switch (provider) {
        case DatabaseProvider::SQL_SERVER: return "SqlServer";
        case DatabaseProvider::POSTGRESQL: return "PostgreSQL";
        case DatabaseProvider::MYSQL:      return "MySQL";
        case DatabaseProvider::ORACLE:     return "Oracle";
        case DatabaseProvider::SQLITE:     return "SQLite";
        case DatabaseProvider::OTHER:      return "Other";
        case DatabaseProvider::AUTO:       return "Auto";
        default:                           return "Unknown";
    }
}

/**
 * @brief Parse a configured provider name (case-insensitive)
 * @return nullopt for unrecognized names
 */
[[nodiscard]] inline std::optional<DatabaseProvider> parse_provider(std::string_view name) {
    static const std::unordered_map<std::string_view, DatabaseProvider> lookup = {
        {keys::AUTO,       DatabaseProvider::AUTO},
        {keys::SQLSERVER,  DatabaseProvider::SQL_SERVER},
        {keys::MSSQL,      DatabaseProvider::SQL_SERVER},
        {keys::POSTGRESQL, DatabaseProvider::POSTGRESQL},
        {keys::POSTGRES,   DatabaseProvider::POSTGRESQL},
        {keys::PG,         DatabaseProvider::POSTGRESQL},
        {keys::MYSQL,      DatabaseProvider::MYSQL},
        {keys::MARIADB,    DatabaseProvider::MYSQL},
        {keys::ORACLE,     DatabaseProvider::ORACLE},
        {keys::SQLITE,     DatabaseProvider::SQLITE},
    };

    if (const auto it = lookup.find(name); it != lookup.end()) {
        return it->second;
    }

    for (const auto& [key, value] : lookup) {
        if (key.size() == name.size()) {
            const bool match = std::equal(key.begin(), key.end(), name.begin(),
                [](char a, char b) {
                    return std::tolower(static_cast<unsigned char>(a)) ==
                           std::tolower(static_cast<unsigned char>(b));
                });
            if (match) return value;
        }
    }
    return std::nullopt;
}

/**
 * @brief Guess the provider from the shape of a connection string
 *
 * URI schemes win; otherwise keyword styles are recognized:
 *   "host=... dbname=..."              -> PostgreSQL (libpq keyword/value)
 *   "Server=...;Database=..."          -> SQL Server (ADO-style)
 */
[[nodiscard]] DatabaseProvider detect_provider(std::string_view connection_string);

/**
 * @brief Mask passwords in a connection string for log output
 *
 * "postgresql://app:secret@db/shop"  -> "postgresql://app:***@db/shop"
 * "host=db password=secret"          -> "host=db password=***"
 * "Server=db;Pwd=secret;"            -> "Server=db;Pwd=***;"
 */
[[nodiscard]] std::string redact_connection_string(std::string_view connection_string);

// ============================================================================
// Plan Format Descriptors
// ============================================================================

[[nodiscard]] inline std::string_view plan_format_extension(PlanFormat format) {
    switch (format) {
        case PlanFormat::JSON: return "json";
        case PlanFormat::XML:  return "xml";
        default:               return "txt";
    }
}

[[nodiscard]] inline std::string_view plan_format_content_type(PlanFormat format) {
    switch (format) {
        case PlanFormat::JSON: return "application/json";
        case PlanFormat::XML:  return "application/xml";
        default:               return "text/plain";
    }
}

[[nodiscard]] inline std::string_view plan_format_description(PlanFormat format) {
    switch (format) {
        case PlanFormat::JSON: return "JSON";
        case PlanFormat::XML:  return "XML";
        default:               return "Plain Text";
    }
}

} // namespace querywatch
