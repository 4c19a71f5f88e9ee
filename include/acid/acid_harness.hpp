#pragma once

#include "core/event_sink.hpp"
#include "core/json.hpp"
#include "db/iquery_executor.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace tpccgw {

// ============================================================================
// Session Namespace
// ============================================================================

/**
 * @brief Ephemeral accounts / transactions / audit tables for one test run
 *
 * Table names carry the session id so concurrent harness runs against the
 * same database never collide. Tables created by provision() are dropped
 * by teardown() or, at the latest, by the destructor; drop failures are
 * reported as warnings and never raised.
 */
class SessionNamespace {
public:
    SessionNamespace(IQueryExecutor& executor, IEventSink& events, int64_t session_id);
    ~SessionNamespace();

    SessionNamespace(const SessionNamespace&) = delete;
    SessionNamespace& operator=(const SessionNamespace&) = delete;

    /// Create the three tables and seed accounts 1, 2 and 3
    [[nodiscard]] MutationResult provision();

    void teardown();

    [[nodiscard]] const std::string& accounts() const { return accounts_; }
    [[nodiscard]] const std::string& transactions() const { return transactions_; }
    [[nodiscard]] const std::string& audit() const { return audit_; }

    [[nodiscard]] const std::vector<std::string>& created_tables() const { return created_; }

private:
    IQueryExecutor& executor_;
    IEventSink& events_;
    std::string accounts_;
    std::string transactions_;
    std::string audit_;
    std::vector<std::string> created_;
};

// ============================================================================
// Reports
// ============================================================================

struct CheckResult {
    std::string name;
    bool passed = false;
    std::string details;
};

struct TestResult {
    std::string name;
    bool passed = false;
    std::string description;
    double duration_ms = 0.0;
    std::string details;
    std::vector<CheckResult> checks;
    std::string error;              // setup or scenario failure

    [[nodiscard]] const char* status() const { return passed ? "passed" : "failed"; }
    [[nodiscard]] Json to_json() const;
};

struct SuiteReport {
    std::string provider;
    int64_t test_session_id = 0;
    std::vector<std::pair<std::string, TestResult>> tests;   // property -> result, run order
    double duration_ms = 0.0;

    [[nodiscard]] size_t passed() const;
    [[nodiscard]] size_t failed() const { return tests.size() - passed(); }
    [[nodiscard]] double success_rate() const;
    [[nodiscard]] Json to_json() const;
};

// ============================================================================
// Harness
// ============================================================================

/**
 * @brief Verifies atomicity, consistency, isolation and durability against
 *        the live backend
 *
 * Every test provisions its own session namespace and tears it down
 * whatever the outcome. Only the executor contract is used, so the same
 * harness runs against every registered backend.
 */
class AcidHarness {
public:
    using SleepFn = std::function<void(std::chrono::milliseconds)>;

    static constexpr double kBalanceTolerance = 0.01;

    struct Options {
        std::chrono::milliseconds durability_delay{100};
        int64_t session_id = 0;             // 0: derive from the clock
    };

    AcidHarness(std::shared_ptr<IQueryExecutor> executor,
                Options options,
                std::shared_ptr<IEventSink> events = nullptr);

    /// Debit, credit and a duplicate key as one group; balances must not move
    [[nodiscard]] TestResult test_atomicity();

    /// Duplicate key, NULL key and wrong-typed key are all rejected
    [[nodiscard]] TestResult test_consistency();

    /// Read-after-write visibility and optimistic version checks
    [[nodiscard]] TestResult test_isolation();

    /// Committed rows survive a delay and a fresh session
    [[nodiscard]] TestResult test_durability();

    [[nodiscard]] SuiteReport run_all();

    [[nodiscard]] int64_t session_id() const { return session_id_; }

    void set_sleep_fn(SleepFn fn) { sleep_ = std::move(fn); }

private:
    using Scenario = std::function<void(SessionNamespace&, TestResult&)>;

    /// Provision, run, tear down, time
    TestResult run_test(std::string name, std::string description, const Scenario& scenario);

    std::shared_ptr<IQueryExecutor> executor_;
    Options options_;
    std::shared_ptr<IEventSink> events_;
    int64_t session_id_;
    SleepFn sleep_;
};

} // namespace tpccgw
