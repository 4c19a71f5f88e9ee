#pragma once

#include "core/event_sink.hpp"
#include "core/utils.hpp"
#include "db/generic_query_executor.hpp"
#include "db/iconnection_factory.hpp"
#include "db/idb_connection.hpp"
#include "db/sql_dialect.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tpccgw::testing {

using Cells = std::vector<std::vector<std::optional<std::string>>>;

/**
 * @brief Build a driver result set from text cells
 *
 * Column types are inferred from the first non-null cell of each column:
 * integer text -> BIGINT, decimal text -> NUMERIC, anything else -> TEXT.
 */
inline DbResultSet make_rows(std::vector<std::string> columns, Cells rows) {
    DbResultSet r;
    r.success = true;
    r.has_rows = true;
    r.column_names = std::move(columns);
    for (size_t c = 0; c < r.column_names.size(); ++c) {
        GenericColumnType type = GenericColumnType::TEXT;
        for (const auto& row : rows) {
            if (c >= row.size() || !row[c]) continue;
            if (utils::try_parse_int<int64_t>(*row[c])) {
                type = GenericColumnType::BIGINT;
            } else if (utils::try_parse_double(*row[c])) {
                type = GenericColumnType::NUMERIC;
            }
            break;
        }
        r.column_types.emplace_back(type, 0, column_type_name(type));
    }
    r.rows = std::move(rows);
    return r;
}

inline DbResultSet make_affected(uint64_t n) {
    DbResultSet r;
    r.success = true;
    r.affected_rows = n;
    return r;
}

/**
 * @brief Scripted backend shared by every connection a factory opens
 *
 * Each statement is matched against the rules in insertion order by
 * substring; the first rule with uses left answers it. Unmatched statements
 * (BEGIN, COMMIT, ...) succeed with no rows. Every statement is logged.
 */
class Script {
public:
    struct Rule {
        std::string pattern;
        DbResultSet result;
        int remaining = -1;         // -1: unlimited
    };

    struct Executed {
        std::string sql;
        ParameterSet params;
    };

    Script& on(std::string pattern, DbResultSet result, int times = -1) {
        rules_.push_back({std::move(pattern), std::move(result), times});
        return *this;
    }

    Script& rows(std::string pattern, std::vector<std::string> columns, Cells cells, int times = -1) {
        return on(std::move(pattern), make_rows(std::move(columns), std::move(cells)), times);
    }

    Script& affects(std::string pattern, uint64_t n, int times = -1) {
        return on(std::move(pattern), make_affected(n), times);
    }

    Script& fail(std::string pattern, std::string sqlstate, std::string message, int times = -1) {
        return on(std::move(pattern), DbResultSet::failure(std::move(message), std::move(sqlstate)), times);
    }

    DbResultSet respond(const std::string& sql, const ParameterSet& params) {
        log.push_back({sql, params});
        for (auto& rule : rules_) {
            if (rule.remaining == 0) continue;
            if (sql.find(rule.pattern) == std::string::npos) continue;
            if (rule.remaining > 0) --rule.remaining;
            return rule.result;
        }
        DbResultSet ok;
        ok.success = true;
        return ok;
    }

    [[nodiscard]] size_t count(std::string_view pattern) const {
        size_t n = 0;
        for (const auto& e : log) {
            if (e.sql.find(pattern) != std::string::npos) ++n;
        }
        return n;
    }

    [[nodiscard]] bool executed(std::string_view pattern) const { return count(pattern) > 0; }

    /// First logged statement containing `pattern`, or nullptr
    [[nodiscard]] const Executed* find(std::string_view pattern) const {
        for (const auto& e : log) {
            if (e.sql.find(pattern) != std::string::npos) return &e;
        }
        return nullptr;
    }

    /// Position of the first statement containing `pattern`, or -1
    [[nodiscard]] int index_of(std::string_view pattern) const {
        for (size_t i = 0; i < log.size(); ++i) {
            if (log[i].sql.find(pattern) != std::string::npos) return static_cast<int>(i);
        }
        return -1;
    }

    std::vector<Executed> log;
    int connects = 0;
    int connect_failures = 0;       // next N factory calls fail
    bool healthy = true;

private:
    std::vector<Rule> rules_;
};

class ScriptedConnection : public IDbConnection {
public:
    explicit ScriptedConnection(std::shared_ptr<Script> script) : script_(std::move(script)) {}

    DbResultSet execute(const std::string& sql, const ParameterSet& params) override {
        if (!connected_) {
            return DbResultSet::failure("connection is closed", "08003");
        }
        auto result = script_->respond(sql, params);
        if (!result.success && result.sqlstate.starts_with("08")) {
            connected_ = false;
        }
        return result;
    }

    bool is_healthy(const std::string& /*health_check_query*/) override {
        return connected_ && script_->healthy;
    }

    bool is_connected() const override { return connected_; }

    void close() override { connected_ = false; }

private:
    std::shared_ptr<Script> script_;
    bool connected_ = true;
};

class ScriptedConnectionFactory : public IConnectionFactory {
public:
    explicit ScriptedConnectionFactory(std::shared_ptr<Script> script) : script_(std::move(script)) {}

    std::unique_ptr<IDbConnection> create(const std::string& /*connection_string*/,
                                          std::string& error_out) override {
        ++script_->connects;
        if (script_->connect_failures > 0) {
            --script_->connect_failures;
            error_out = "could not connect to server: Connection refused";
            return nullptr;
        }
        return std::make_unique<ScriptedConnection>(script_);
    }

private:
    std::shared_ptr<Script> script_;
};

/**
 * @brief Collects events for assertions
 */
class RecordingEventSink : public IEventSink {
public:
    void emit(const Event& event) override { events.push_back(event); }

    [[nodiscard]] size_t count(EventLevel level) const {
        size_t n = 0;
        for (const auto& e : events) {
            if (e.level == level) ++n;
        }
        return n;
    }

    [[nodiscard]] bool contains(std::string_view text) const {
        for (const auto& e : events) {
            if (e.message.find(text) != std::string::npos) return true;
        }
        return false;
    }

    std::vector<Event> events;
};

/// Executor over a scripted backend; backoff sleeps are skipped
inline std::shared_ptr<GenericQueryExecutor> make_executor(
    std::shared_ptr<Script> script,
    RetryPolicy retry = {},
    SqlDialect dialect = SqlDialect::postgresql(),
    std::shared_ptr<IEventSink> events = nullptr) {
    auto executor = std::make_shared<GenericQueryExecutor>(
        std::make_shared<ScriptedConnectionFactory>(std::move(script)),
        std::move(dialect),
        GenericQueryExecutor::Config{"host=scripted", "", retry},
        std::move(events));
    executor->set_sleep_fn([](std::chrono::milliseconds) {});
    return executor;
}

} // namespace tpccgw::testing
