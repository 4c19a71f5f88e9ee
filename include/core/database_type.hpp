#pragma once

#include "core/utils.hpp"

#include <format>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace tpccgw {

namespace keys {
    inline constexpr std::string_view POSTGRES = "postgres";
    inline constexpr std::string_view POSTGRESQL = "postgresql";
    inline constexpr std::string_view PG = "pg";
    inline constexpr std::string_view SPANNER = "spanner";
    inline constexpr std::string_view GOOGLE_SPANNER = "google_spanner";
    inline constexpr std::string_view PGADAPTER = "pgadapter";
}

/**
 * @brief Backends reachable over the PostgreSQL wire protocol
 *
 * SPANNER is Cloud Spanner's PostgreSQL interface (PGAdapter or the
 * emulator); it shares the libpq driver and differs only in dialect.
 */
enum class DatabaseType {
    POSTGRESQL,
    SPANNER,
};

[[nodiscard]] inline std::string_view database_type_to_string(DatabaseType type) {
    switch (type) {
        case DatabaseType::POSTGRESQL: return keys::POSTGRESQL;
        case DatabaseType::SPANNER: return keys::SPANNER;
        default: return "unknown";
    }
}

/// Accepts the aliases in keys::, case-insensitively; throws for anything else
[[nodiscard]] inline DatabaseType parse_database_type(std::string_view type_str) {
    static constexpr std::pair<std::string_view, DatabaseType> kAliases[] = {
        {keys::POSTGRESQL,     DatabaseType::POSTGRESQL},
        {keys::POSTGRES,       DatabaseType::POSTGRESQL},
        {keys::PG,             DatabaseType::POSTGRESQL},
        {keys::SPANNER,        DatabaseType::SPANNER},
        {keys::GOOGLE_SPANNER, DatabaseType::SPANNER},
        {keys::PGADAPTER,      DatabaseType::SPANNER},
    };

    for (const auto& [alias, type] : kAliases) {
        if (utils::iequals(alias, type_str)) return type;
    }
    throw std::runtime_error(std::format("Unknown database type: {}", type_str));
}

} // namespace tpccgw
