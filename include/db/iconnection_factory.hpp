#pragma once

#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace tpccgw {

/**
 * @brief Abstract factory for creating database connections
 *
 * Each backend provides its own factory that wraps the native connect call.
 * The connection string is opaque to the core.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Create a new database connection
     * @param connection_string Backend-specific connection string
     * @param error_out Receives the driver's message when connecting fails
     * @return New connection, or nullptr on failure
     */
    [[nodiscard]] virtual std::unique_ptr<IDbConnection> create(
        const std::string& connection_string, std::string& error_out) = 0;
};

} // namespace tpccgw
