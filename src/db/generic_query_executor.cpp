#include "db/generic_query_executor.hpp"
#include "db/error_classifier.hpp"
#include "db/result_normalizer.hpp"
#include "core/utils.hpp"
#include <format>
#include <thread>

namespace tpccgw {

namespace {
constexpr std::string_view kComponent = "executor";
} // anonymous namespace

// ============================================================================
// Transaction Context
// ============================================================================

/**
 * @brief Statement runner bound to one open transaction
 *
 * Remembers the category of the last backend failure so a body that
 * aborts because of a conflict can be retried.
 */
class GenericQueryExecutor::Context : public ITransactionContext {
public:
    Context(IDbConnection* conn, TxnMode mode, IEventSink& events)
        : conn_(conn), mode_(mode), events_(events) {}

    QueryResult query(const Query& query, const ParamSource& params) override {
        utils::Timer timer;

        auto translated = ParameterTranslator::translate(query, params);
        if (translated.is_error()) {
            events_.warn(kComponent, std::format("Translation failed: {}",
                                                 translated.error_message()));
            return QueryResult::failure(translated.error_category(),
                                        translated.error_message());
        }

        const auto& tq = translated.value();
        auto raw = conn_->execute(tq.sql, tq.params);
        if (!raw.success) {
            const auto category = classify_db_error(raw.sqlstate, raw.error_message);
            last_failure_ = category;
            events_.debug(kComponent, std::format("Query failed ({}): {}",
                error_category_to_string(category), raw.error_message));
            return QueryResult::failure(category, raw.error_message);
        }

        QueryResult result;
        result.success = true;
        result.column_names = ResultNormalizer::column_names(raw, tq.sql);
        result.rows = ResultNormalizer::normalize(raw, tq.sql);
        result.execution_time = timer.elapsed_us();
        return result;
    }

    MutationResult execute(const Query& query, const ParamSource& params) override {
        utils::Timer timer;

        if (mode_ == TxnMode::READ_ONLY) {
            return MutationResult::failure(ErrorCategory::INVALID_INPUT,
                "Write rejected inside a read-only transaction");
        }

        auto translated = ParameterTranslator::translate(query, params);
        if (translated.is_error()) {
            events_.warn(kComponent, std::format("Translation failed: {}",
                                                 translated.error_message()));
            return MutationResult::failure(translated.error_category(),
                                           translated.error_message());
        }

        const auto& tq = translated.value();
        auto raw = conn_->execute(tq.sql, tq.params);
        if (!raw.success) {
            const auto category = classify_db_error(raw.sqlstate, raw.error_message);
            last_failure_ = category;
            events_.debug(kComponent, std::format("Statement failed ({}): {}",
                error_category_to_string(category), raw.error_message));
            return MutationResult::failure(category, raw.error_message);
        }

        MutationResult result;
        result.success = true;
        result.affected_rows = raw.affected_rows;
        result.execution_time = timer.elapsed_us();
        return result;
    }

    TxnMode mode() const override { return mode_; }

    [[nodiscard]] ErrorCategory last_failure() const { return last_failure_; }

private:
    IDbConnection* conn_;
    TxnMode mode_;
    IEventSink& events_;
    ErrorCategory last_failure_ = ErrorCategory::NONE;
};

// ============================================================================
// GenericQueryExecutor
// ============================================================================

GenericQueryExecutor::GenericQueryExecutor(
    std::shared_ptr<IConnectionFactory> factory,
    SqlDialect dialect,
    Config config,
    std::shared_ptr<IEventSink> events)
    : factory_(std::move(factory)),
      dialect_(std::move(dialect)),
      config_(std::move(config)),
      events_(sink_or_null(std::move(events))),
      sleep_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {
    if (config_.retry.max_attempts == 0) {
        config_.retry.max_attempts = 1;
    }
}

GenericQueryExecutor::~GenericQueryExecutor() {
    if (connection_) {
        connection_->close();
    }
}

std::string GenericQueryExecutor::provider_name() const {
    return config_.provider_name.empty() ? dialect_.provider_name : config_.provider_name;
}

IDbConnection* GenericQueryExecutor::ensure_connection(std::string& error_out) {
    if (connection_ && connection_->is_connected()) {
        return connection_.get();
    }
    connection_.reset();

    std::string error;
    auto conn = factory_->create(config_.connection_string, error);
    if (!conn) {
        error_out = error.empty() ? "Failed to open backend connection" : error;
        events_->error(kComponent, std::format("Connection to {} failed: {}",
                                               provider_name(), error_out));
        return nullptr;
    }

    events_->info(kComponent, std::format("Connected to {}", provider_name()));
    connection_ = std::move(conn);
    return connection_.get();
}

void GenericQueryExecutor::drop_if_broken() {
    if (connection_ && !connection_->is_connected()) {
        events_->warn(kComponent, "Dropping broken connection");
        connection_.reset();
    }
}

void GenericQueryExecutor::rollback_quietly(IDbConnection* conn) {
    const auto rb = conn->execute(dialect_.rollback, ParameterSet{});
    if (!rb.success) {
        events_->warn(kComponent, std::format("Rollback failed: {}", rb.error_message));
    }
}

// ----------------------------------------------------------------------------
// Transactions
// ----------------------------------------------------------------------------

TxnResult GenericQueryExecutor::attempt_transaction(const TxnBody& body, TxnMode mode) {
    std::string conn_error;
    IDbConnection* conn = ensure_connection(conn_error);
    if (!conn) {
        return TxnResult::abort(ErrorCategory::CONNECTIVITY, conn_error);
    }

    const auto& begin_sql = (mode == TxnMode::READ_ONLY)
        ? dialect_.begin_read_only
        : dialect_.begin_read_write;

    const auto begin = conn->execute(begin_sql, ParameterSet{});
    if (!begin.success) {
        const auto category = classify_db_error(begin.sqlstate, begin.error_message);
        drop_if_broken();
        return TxnResult::abort(category,
            std::format("Failed to begin transaction: {}", begin.error_message));
    }

    Context ctx(conn, mode, *events_);
    TxnResult outcome;
    try {
        outcome = body(ctx);
    } catch (const std::exception& e) {
        outcome = TxnResult::abort(ErrorCategory::INTERNAL_ERROR,
            std::format("Transaction body threw: {}", e.what()));
    }

    if (!outcome.committed) {
        // A body that bails out after a conflict keeps the conflict's category
        if (outcome.error_category == ErrorCategory::NONE) {
            outcome.error_category = ctx.last_failure() != ErrorCategory::NONE
                ? ctx.last_failure()
                : ErrorCategory::EXECUTION_ERROR;
        }
        rollback_quietly(conn);
        drop_if_broken();
        return outcome;
    }

    const auto commit = conn->execute(dialect_.commit, ParameterSet{});
    if (!commit.success) {
        const auto category = classify_db_error(commit.sqlstate, commit.error_message);
        rollback_quietly(conn);
        drop_if_broken();
        // Session lost while COMMIT was in flight: the server may have applied
        // it, so the body must not run again
        if (category == ErrorCategory::CONNECTIVITY && mode == TxnMode::READ_WRITE) {
            events_->error(kComponent, std::format(
                "Commit outcome unknown after connection loss: {}", commit.error_message));
            return TxnResult::abort(ErrorCategory::EXECUTION_ERROR,
                std::format("Commit outcome unknown: {}", commit.error_message));
        }
        return TxnResult::abort(category,
            std::format("Commit failed: {}", commit.error_message));
    }

    return TxnResult::commit();
}

TxnResult GenericQueryExecutor::run_in_transaction(const TxnBody& body, TxnMode mode) {
    const auto& retry = config_.retry;
    TxnResult result;

    for (uint32_t attempt = 1; attempt <= retry.max_attempts; ++attempt) {
        result = attempt_transaction(body, mode);
        result.attempts = attempt;

        if (result.committed || !is_retryable(result.error_category) ||
            attempt == retry.max_attempts) {
            break;
        }

        const auto delay = retry.backoff_after(attempt);
        events_->warn(kComponent, std::format(
            "{} transaction attempt {}/{} failed ({}): {}; retrying in {}ms",
            txn_mode_to_string(mode), attempt, retry.max_attempts,
            error_category_to_string(result.error_category),
            result.error_message, delay.count()));
        sleep_(delay);
    }

    if (!result.committed) {
        events_->debug(kComponent, std::format("Transaction rolled back after {} attempt(s): {}",
                                               result.attempts, result.error_message));
    }
    return result;
}

// ----------------------------------------------------------------------------
// Reads and Writes
// ----------------------------------------------------------------------------

QueryResult GenericQueryExecutor::execute_query(const Query& query, const ParamSource& params) {
    utils::Timer timer;
    QueryResult result;

    const auto txn = run_in_transaction([&](ITransactionContext& ctx) {
        result = ctx.query(query, params);
        if (!result.success) {
            return TxnResult::abort(result.error_category, result.error_message);
        }
        return TxnResult::commit();
    }, TxnMode::READ_ONLY);

    if (!txn.committed) {
        result = QueryResult::failure(txn.error_category, txn.error_message);
        events_->error(kComponent, std::format("Query failed: {}", txn.error_message));
    }
    result.execution_time = timer.elapsed_us();
    return result;
}

MutationResult GenericQueryExecutor::execute_dml(const Query& query, const ParamSource& params) {
    utils::Timer timer;
    MutationResult result;

    const auto txn = run_in_transaction([&](ITransactionContext& ctx) {
        result = ctx.execute(query, params);
        if (!result.success) {
            return TxnResult::abort(result.error_category, result.error_message);
        }
        return TxnResult::commit();
    }, TxnMode::READ_WRITE);

    if (!txn.committed) {
        result = MutationResult::failure(txn.error_category, txn.error_message);
        events_->error(kComponent, std::format("Mutation failed: {}", txn.error_message));
    }
    result.execution_time = timer.elapsed_us();
    return result;
}

MutationResult GenericQueryExecutor::execute_in_transaction(const std::vector<Statement>& statements) {
    utils::Timer timer;
    uint64_t affected = 0;

    const auto txn = run_in_transaction([&](ITransactionContext& ctx) {
        affected = 0;
        for (size_t i = 0; i < statements.size(); ++i) {
            const auto r = ctx.execute(statements[i].query, statements[i].params);
            if (!r.success) {
                return TxnResult::abort(r.error_category,
                    std::format("Statement {} of {} failed: {}",
                                i + 1, statements.size(), r.error_message));
            }
            affected += r.affected_rows;
        }
        return TxnResult::commit();
    }, TxnMode::READ_WRITE);

    MutationResult result;
    if (txn.committed) {
        result.success = true;
        result.affected_rows = affected;
    } else {
        result = MutationResult::failure(txn.error_category, txn.error_message);
        events_->info(kComponent, std::format("Grouped mutation rolled back: {}",
                                              txn.error_message));
    }
    result.execution_time = timer.elapsed_us();
    return result;
}

MutationResult GenericQueryExecutor::execute_ddl(const std::string& sql) {
    utils::Timer timer;

    std::string conn_error;
    IDbConnection* conn = ensure_connection(conn_error);
    if (!conn) {
        return MutationResult::failure(ErrorCategory::CONNECTIVITY, conn_error);
    }

    const auto raw = conn->execute(sql, ParameterSet{});
    if (!raw.success) {
        const auto category = classify_db_error(raw.sqlstate, raw.error_message);
        drop_if_broken();
        events_->error(kComponent, std::format("DDL failed: {}", raw.error_message));
        return MutationResult::failure(category, raw.error_message);
    }

    MutationResult result;
    result.success = true;
    result.execution_time = timer.elapsed_us();
    return result;
}

// ----------------------------------------------------------------------------
// Session Management
// ----------------------------------------------------------------------------

bool GenericQueryExecutor::test_connection() {
    std::string conn_error;
    IDbConnection* conn = ensure_connection(conn_error);
    if (!conn) {
        return false;
    }
    const bool healthy = conn->is_healthy(dialect_.health_check);
    if (!healthy) {
        events_->warn(kComponent, "Health check failed");
        drop_if_broken();
    }
    return healthy;
}

bool GenericQueryExecutor::reconnect() {
    if (connection_) {
        connection_->close();
        connection_.reset();
    }
    std::string conn_error;
    return ensure_connection(conn_error) != nullptr;
}

} // namespace tpccgw
