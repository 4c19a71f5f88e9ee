#include "db/postgresql/pg_connection.hpp"
#include "db/postgresql/pg_type_map.hpp"
#include "core/utils.hpp"
#include <cstring>
#include <format>

namespace tpccgw {

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql, const ParameterSet& params) {
    if (!conn_) {
        return DbResultSet::failure("Connection is null", "08003");
    }

    PGresult* res = nullptr;

    if (params.empty()) {
        res = PQexec(conn_, sql.c_str());
    } else {
        const int n = static_cast<int>(params.size());
        std::vector<Oid> types(n);
        std::vector<std::optional<std::string>> texts(n);
        std::vector<const char*> values(n);

        for (int i = 0; i < n; ++i) {
            const auto& p = params.values[i];
            types[i] = static_cast<Oid>(PgTypeMap::param_type_to_oid(p.type));
            texts[i] = p.wire_text();
            values[i] = texts[i] ? texts[i]->c_str() : nullptr;
        }

        res = PQexecParams(conn_, sql.c_str(), n, types.data(), values.data(),
                           nullptr, nullptr, 0);
    }

    if (!res) {
        return DbResultSet::failure(PQerrorMessage(conn_),
            PQstatus(conn_) == CONNECTION_BAD ? "08006" : "");
    }

    const ExecStatusType status = PQresultStatus(res);

    DbResultSet result;
    if (status == PGRES_TUPLES_OK) {
        result = process_tuples_result(res);
    } else if (status == PGRES_COMMAND_OK || status == PGRES_EMPTY_QUERY) {
        result = process_command_result(res);
    } else {
        result = process_error_result(res);
    }

    PQclear(res);
    return result;
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_) {
        return false;
    }

    if (PQstatus(conn_) != CONNECTION_OK) {
        return false;
    }

    PGresult* res = PQexec(conn_, health_check_query.c_str());
    if (!res) {
        return false;
    }

    const ExecStatusType status = PQresultStatus(res);
    PQclear(res);

    return (status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK);
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

void PgConnection::close() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res);
    result.column_names.reserve(ncols);
    result.column_types.reserve(ncols);
    for (int i = 0; i < ncols; i++) {
        const char* name = PQfname(res, i);
        result.column_names.emplace_back(name ? name : "");
        result.column_types.push_back(
            PgTypeMap::build_type_info(static_cast<uint32_t>(PQftype(res, i))));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(nrows);

    for (int i = 0; i < nrows; i++) {
        std::vector<std::optional<std::string>> row;
        row.reserve(ncols);
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(res, i, j),
                                             static_cast<size_t>(PQgetlength(res, i, j))));
            }
        }
        result.rows.push_back(std::move(row));
    }

    return result;
}

DbResultSet PgConnection::process_command_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = false;

    const char* affected = PQcmdTuples(res);
    if (affected && std::strlen(affected) > 0) {
        result.affected_rows = utils::parse_int<uint64_t>(affected, uint64_t{0});
    }

    return result;
}

DbResultSet PgConnection::process_error_result(PGresult* res) {
    const char* state = PQresultErrorField(res, PG_DIAG_SQLSTATE);
    std::string sqlstate = state ? state : "";

    const char* msg = PQresultErrorMessage(res);
    std::string message = (msg && *msg) ? msg : PQerrorMessage(conn_);

    // Dropped connections surface without a server-side SQLSTATE
    if (sqlstate.empty() && PQstatus(conn_) == CONNECTION_BAD) {
        sqlstate = "08006";
    }

    return DbResultSet::failure(utils::trim(message), std::move(sqlstate));
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(
    const std::string& connection_string, std::string& error_out) {

    PGconn* conn = PQconnectdb(connection_string.c_str());

    if (!conn) {
        error_out = "Failed to allocate PGconn";
        utils::log::error(error_out);
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        error_out = utils::trim(PQerrorMessage(conn));
        utils::log::error(std::format("Failed to connect: {}", error_out));
        PQfinish(conn);
        return nullptr;
    }

    auto connection = std::make_unique<PgConnection>(conn);

    if (set_utc_timezone_) {
        const auto tz = connection->execute("SET TIME ZONE 'UTC'", ParameterSet{});
        if (!tz.success) {
            utils::log::warn(std::format("Could not pin session time zone to UTC: {}",
                                         tz.error_message));
        }
    }

    return connection;
}

} // namespace tpccgw
