#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <string>

namespace tpccgw {

/**
 * @brief PostgreSQL-wire connection implementing IDbConnection
 *
 * Wraps PGconn* and provides the backend-agnostic interface. All libpq
 * calls are encapsulated here. Used for both PostgreSQL and Spanner's
 * PostgreSQL interface.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql, const ParameterSet& params) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    void close() override;

private:
    /**
     * @brief Process a SELECT result (PGRES_TUPLES_OK)
     */
    static DbResultSet process_tuples_result(PGresult* res);

    /**
     * @brief Process a command result (PGRES_COMMAND_OK)
     */
    static DbResultSet process_command_result(PGresult* res);

    /**
     * @brief Build a failure from an error result, SQLSTATE included
     */
    DbResultSet process_error_result(PGresult* res);

    PGconn* conn_;
};

/**
 * @brief PostgreSQL connection factory
 *
 * Creates PgConnection instances using PQconnectdb. Sessions are pinned to
 * UTC so timestamp text is stable across servers.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    explicit PgConnectionFactory(bool set_utc_timezone = true)
        : set_utc_timezone_(set_utc_timezone) {}

    std::unique_ptr<IDbConnection> create(
        const std::string& connection_string, std::string& error_out) override;

private:
    bool set_utc_timezone_;
};

} // namespace tpccgw
