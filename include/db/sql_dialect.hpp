#pragma once

#include "core/database_type.hpp"
#include <string>

namespace tpccgw {

/**
 * @brief Per-backend statement fragments
 *
 * Everything that differs between backends reachable over the PostgreSQL
 * wire protocol lives here, so protocol and harness code stays dialect-free.
 */
struct SqlDialect {
    DatabaseType type = DatabaseType::POSTGRESQL;
    std::string provider_name;

    // Transaction control
    std::string begin_read_only;        // snapshot read
    std::string begin_read_write;
    std::string commit = "COMMIT";
    std::string rollback = "ROLLBACK";

    // DDL column types for ephemeral harness tables
    std::string bigint_type;
    std::string numeric_type;
    std::string short_text_type;        // printf-style, %d replaced by length
    std::string timestamp_type;
    std::string current_timestamp;

    /// Connectivity check query
    std::string health_check = "SELECT 1";

    /// "VARCHAR(20)" / "varchar(20)"
    [[nodiscard]] std::string text_type(int length) const;

    [[nodiscard]] static SqlDialect postgresql();

    /// Cloud Spanner, PostgreSQL interface
    [[nodiscard]] static SqlDialect spanner();

    [[nodiscard]] static SqlDialect for_type(DatabaseType type);
};

} // namespace tpccgw
