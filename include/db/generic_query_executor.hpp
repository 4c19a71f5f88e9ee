#pragma once

#include "core/event_sink.hpp"
#include "db/iquery_executor.hpp"
#include "db/iconnection_factory.hpp"
#include "db/sql_dialect.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace tpccgw {

/**
 * @brief Bounded retry with exponential backoff
 *
 * Applies to TRANSIENT and CONNECTIVITY failures only. max_attempts = 1
 * disables retry.
 */
struct RetryPolicy {
    uint32_t max_attempts = 3;
    std::chrono::milliseconds base_backoff{50};
    std::chrono::milliseconds max_backoff{1000};

    /// Delay before attempt (attempt + 1); attempt is 1-based
    [[nodiscard]] std::chrono::milliseconds backoff_after(uint32_t attempt) const {
        if (attempt == 0) return std::chrono::milliseconds{0};
        const uint32_t shift = std::min<uint32_t>(attempt - 1, 16);
        const auto delay = base_backoff * (int64_t{1} << shift);
        return std::min(delay, max_backoff);
    }
};

/**
 * @brief Backend-agnostic implementation of the execution contract
 *
 * Owns one lazily opened connection from an IConnectionFactory. Every
 * statement is translated, bound, run and normalized here; transaction
 * begin statements come from the SqlDialect.
 */
class GenericQueryExecutor : public IQueryExecutor {
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    struct Config {
        std::string connection_string;
        std::string provider_name;      // empty: use the dialect's
        RetryPolicy retry;
    };

    GenericQueryExecutor(
        std::shared_ptr<IConnectionFactory> factory,
        SqlDialect dialect,
        Config config,
        std::shared_ptr<IEventSink> events = nullptr);

    ~GenericQueryExecutor() override;

    GenericQueryExecutor(const GenericQueryExecutor&) = delete;
    GenericQueryExecutor& operator=(const GenericQueryExecutor&) = delete;

    QueryResult execute_query(const Query& query, const ParamSource& params = {}) override;
    MutationResult execute_dml(const Query& query, const ParamSource& params = {}) override;
    MutationResult execute_ddl(const std::string& sql) override;
    TxnResult run_in_transaction(const TxnBody& body, TxnMode mode) override;
    MutationResult execute_in_transaction(const std::vector<Statement>& statements) override;
    bool test_connection() override;
    bool reconnect() override;
    std::string provider_name() const override;
    const SqlDialect& dialect() const override { return dialect_; }

    /// Replace the backoff sleep (tests run without delays)
    void set_sleep_fn(SleepFn fn) { sleep_ = std::move(fn); }

private:
    class Context;

    /// Returns the live connection, opening one if needed; nullptr on failure
    IDbConnection* ensure_connection(std::string& error_out);

    /// Forget a connection that reported itself broken
    void drop_if_broken();

    /// ROLLBACK, logging (not returning) a failure
    void rollback_quietly(IDbConnection* conn);

    /// One attempt: BEGIN, body, COMMIT / ROLLBACK
    TxnResult attempt_transaction(const TxnBody& body, TxnMode mode);

    std::shared_ptr<IConnectionFactory> factory_;
    SqlDialect dialect_;
    Config config_;
    std::shared_ptr<IEventSink> events_;
    std::unique_ptr<IDbConnection> connection_;
    SleepFn sleep_;
};

} // namespace tpccgw
