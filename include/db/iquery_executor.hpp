#pragma once

#include "core/types.hpp"
#include "core/parameter_translator.hpp"
#include "db/sql_dialect.hpp"

#include <functional>
#include <string>
#include <vector>

namespace tpccgw {

/**
 * @brief Statement surface available inside one transaction
 *
 * Handed to transaction bodies by IQueryExecutor::run_in_transaction().
 * Failures come back as values; nothing here throws.
 */
class ITransactionContext {
public:
    virtual ~ITransactionContext() = default;

    /// Run a read inside the enclosing transaction
    [[nodiscard]] virtual QueryResult query(
        const Query& query, const ParamSource& params = {}) = 0;

    /// Run a write; rejected with INVALID_INPUT in a read-only transaction
    [[nodiscard]] virtual MutationResult execute(
        const Query& query, const ParamSource& params = {}) = 0;

    [[nodiscard]] virtual TxnMode mode() const = 0;
};

/**
 * @brief Outcome of a transaction body and of the transaction itself
 *
 * A body returns commit() to request COMMIT or abort() to roll back.
 * run_in_transaction() returns committed == true only when COMMIT succeeded.
 */
struct TxnResult {
    bool committed = false;
    ErrorCategory error_category = ErrorCategory::NONE;
    std::string error_message;
    uint32_t attempts = 0;

    static TxnResult commit() {
        TxnResult r;
        r.committed = true;
        return r;
    }

    static TxnResult abort(ErrorCategory category, std::string message) {
        TxnResult r;
        r.committed = false;
        r.error_category = category;
        r.error_message = std::move(message);
        return r;
    }
};

/**
 * @brief Transaction body
 *
 * May run more than once when the backend reports a transient conflict:
 * bodies must reset any state they capture at the start of each run.
 */
using TxnBody = std::function<TxnResult(ITransactionContext&)>;

/// One statement of a grouped mutation
struct Statement {
    Query query;
    ParamSource params;
};

/**
 * @brief Query execution contract
 *
 * - execute_query: read-only, point-in-time consistent, never mutates
 * - execute_dml:   one statement in its own read-write transaction,
 *                  committed before return
 * - execute_ddl:   schema change outside any transaction, blocks until done
 *
 * Backend errors never escape as exceptions; they come back as failure
 * values carrying an ErrorCategory.
 */
class IQueryExecutor {
public:
    virtual ~IQueryExecutor() = default;

    [[nodiscard]] virtual QueryResult execute_query(
        const Query& query, const ParamSource& params = {}) = 0;

    [[nodiscard]] virtual MutationResult execute_dml(
        const Query& query, const ParamSource& params = {}) = 0;

    [[nodiscard]] virtual MutationResult execute_ddl(const std::string& sql) = 0;

    /**
     * @brief Run a body inside one transaction
     *
     * Commits when the body returns commit(); rolls back when it returns
     * abort() or throws. Transient conflicts re-run the body up to the
     * configured attempt limit.
     */
    [[nodiscard]] virtual TxnResult run_in_transaction(
        const TxnBody& body, TxnMode mode) = 0;

    /**
     * @brief Apply a group of mutations atomically
     *
     * Either every statement takes effect or none does. affected_rows is
     * the sum over all statements.
     */
    [[nodiscard]] virtual MutationResult execute_in_transaction(
        const std::vector<Statement>& statements) = 0;

    /// Round-trip a trivial statement
    [[nodiscard]] virtual bool test_connection() = 0;

    /// Drop the current session and open a fresh one
    [[nodiscard]] virtual bool reconnect() = 0;

    [[nodiscard]] virtual std::string provider_name() const = 0;

    [[nodiscard]] virtual const SqlDialect& dialect() const = 0;
};

} // namespace tpccgw
