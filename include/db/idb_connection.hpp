#pragma once

#include "core/column_type.hpp"
#include "core/parameter_translator.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <memory>
#include <optional>

namespace tpccgw {

/**
 * @brief Raw result of one statement execution
 *
 * Returned by IDbConnection::execute(). Owns the result data (copied out of
 * the native result handle before execute() returns). Cells are the driver's
 * text rendering; nullopt is SQL NULL.
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;
    std::string sqlstate;           // five-character SQLSTATE on failure, may be empty

    // For SELECT; column metadata may be absent for some drivers/statements
    std::vector<std::string> column_names;
    std::vector<ColumnTypeInfo> column_types;
    std::vector<std::vector<std::optional<std::string>>> rows;

    // For DML
    uint64_t affected_rows = 0;

    bool has_rows = false;

    static DbResultSet failure(std::string message, std::string state = {}) {
        DbResultSet r;
        r.success = false;
        r.error_message = std::move(message);
        r.sqlstate = std::move(state);
        return r;
    }
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle. Not thread-safe: the gateway
 * issues one request at a time.
 *
 * Does NOT expose native handles to prevent leaking backend types.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute one SQL statement with bound $N parameters
     * @param sql SQL text using $1..$N markers
     * @param params params.values[0] binds $1; empty for parameterless text
     * @return Result set with rows or affected count
     */
    [[nodiscard]] virtual DbResultSet execute(
        const std::string& sql, const ParameterSet& params) = 0;

    /**
     * @brief Check if the connection is healthy
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    /**
     * @brief Check if connection is in a valid state (connected)
     */
    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Close the connection and release resources
     */
    virtual void close() = 0;
};

} // namespace tpccgw
