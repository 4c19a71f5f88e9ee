#include "acid/acid_harness.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <format>
#include <iterator>
#include <thread>

namespace tpccgw {

namespace {

constexpr std::string_view kComponent = "acid";

struct SeedAccount {
    int64_t id;
    double balance;
};

constexpr SeedAccount kSeedAccounts[] = {
    {1, 1000.00},
    {2, 500.00},
    {3, 750.00},
};

constexpr int64_t kDurabilityAccount = 999;
constexpr double kDurabilityBalance = 12345.67;

bool near(double a, double b) {
    return std::abs(a - b) <= AcidHarness::kBalanceTolerance;
}

std::string describe_balances(const ResultSet& rows) {
    std::string out;
    for (const auto& row : rows) {
        if (!out.empty()) out += ", ";
        out += std::format("{}={:.2f}", row.get_int("account_id").value_or(0),
                           row.get_double("balance").value_or(0.0));
    }
    return "[" + out + "]";
}

Json checks_to_json(const std::vector<CheckResult>& checks) {
    Json arr = Json::array();
    for (const auto& c : checks) {
        Json j = Json::object();
        j["name"] = c.name;
        j["passed"] = c.passed;
        if (!c.details.empty()) j["details"] = c.details;
        arr.push_back(std::move(j));
    }
    return arr;
}

} // anonymous namespace

// ============================================================================
// SessionNamespace
// ============================================================================

SessionNamespace::SessionNamespace(IQueryExecutor& executor, IEventSink& events, int64_t session_id)
    : executor_(executor),
      events_(events),
      accounts_(std::format("acid_test_accounts_{}", session_id)),
      transactions_(std::format("acid_test_transactions_{}", session_id)),
      audit_(std::format("acid_test_audit_{}", session_id)) {}

SessionNamespace::~SessionNamespace() {
    teardown();
}

MutationResult SessionNamespace::provision() {
    const auto& d = executor_.dialect();

    const std::pair<const std::string*, std::string> tables[] = {
        {&accounts_, std::format(
            "CREATE TABLE {} ("
            "account_id {} NOT NULL PRIMARY KEY, "
            "balance {} NOT NULL, "
            "version {} NOT NULL DEFAULT 1, "
            "created_at {} NOT NULL DEFAULT {})",
            accounts_, d.bigint_type, d.numeric_type, d.bigint_type,
            d.timestamp_type, d.current_timestamp)},
        {&transactions_, std::format(
            "CREATE TABLE {} ("
            "txn_id {} NOT NULL PRIMARY KEY, "
            "from_account {} NOT NULL, "
            "to_account {} NOT NULL, "
            "amount {} NOT NULL, "
            "status {} NOT NULL, "
            "created_at {} NOT NULL DEFAULT {})",
            transactions_, d.bigint_type, d.bigint_type, d.bigint_type, d.numeric_type,
            d.text_type(20), d.timestamp_type, d.current_timestamp)},
        {&audit_, std::format(
            "CREATE TABLE {} ("
            "audit_id {} NOT NULL PRIMARY KEY, "
            "table_name {} NOT NULL, "
            "operation {} NOT NULL, "
            "record_id {} NOT NULL, "
            "timestamp {} NOT NULL DEFAULT {})",
            audit_, d.bigint_type, d.text_type(50), d.text_type(20), d.bigint_type,
            d.timestamp_type, d.current_timestamp)},
    };

    for (const auto& [name, ddl] : tables) {
        auto r = executor_.execute_ddl(ddl);
        if (!r.success) {
            events_.error(kComponent, std::format("Failed to create {}: {}", *name, r.error_message));
            return r;
        }
        created_.push_back(*name);
        events_.debug(kComponent, std::format("Created {}", *name));
    }

    std::vector<Statement> seed;
    for (const auto& account : kSeedAccounts) {
        seed.push_back({
            Query::named(std::format(
                "INSERT INTO {} (account_id, balance) VALUES (@id, CAST(@balance AS NUMERIC))",
                accounts_)),
            NamedParams{}.set("id", account.id).set("balance", account.balance)
        });
    }
    auto r = executor_.execute_in_transaction(seed);
    if (!r.success) {
        events_.error(kComponent, std::format("Failed to seed {}: {}", accounts_, r.error_message));
    }
    return r;
}

void SessionNamespace::teardown() {
    // Reverse creation order
    for (auto it = created_.rbegin(); it != created_.rend(); ++it) {
        const auto r = executor_.execute_ddl(std::format("DROP TABLE {}", *it));
        if (r.success) {
            events_.debug(kComponent, std::format("Dropped {}", *it));
        } else {
            events_.warn(kComponent, std::format("Could not drop {}: {}", *it, r.error_message));
        }
    }
    created_.clear();
}

// ============================================================================
// Reports
// ============================================================================

namespace {

/// Whole milliseconds for human readers, e.g. "1234 ms"
std::string duration_text(double ms) {
    return std::format("{} ms", std::llround(ms));
}

} // anonymous namespace

Json TestResult::to_json() const {
    Json j = Json::object();
    j["test_name"] = name;
    j["status"] = status();
    j["description"] = description;
    j["duration_ms"] = duration_ms;
    j["duration"] = duration_text(duration_ms);
    j["details"] = details;
    j["checks"] = checks_to_json(checks);
    if (!error.empty()) j["error"] = error;
    return j;
}

size_t SuiteReport::passed() const {
    size_t n = 0;
    for (const auto& [_, t] : tests) {
        if (t.passed) ++n;
    }
    return n;
}

double SuiteReport::success_rate() const {
    if (tests.empty()) return 0.0;
    return static_cast<double>(passed()) * 100.0 / static_cast<double>(tests.size());
}

Json SuiteReport::to_json() const {
    Json j = Json::object();
    j["provider"] = provider;
    j["test_session_id"] = test_session_id;

    Json t = Json::object();
    for (const auto& [property, result] : tests) {
        t[property] = result.to_json();
    }
    j["tests"] = std::move(t);

    Json s = Json::object();
    s["total_tests"] = tests.size();
    s["passed_tests"] = passed();
    s["failed_tests"] = failed();
    s["success_rate"] = success_rate();
    s["duration_ms"] = duration_ms;
    s["duration"] = duration_text(duration_ms);
    j["summary"] = std::move(s);
    return j;
}

// ============================================================================
// AcidHarness
// ============================================================================

AcidHarness::AcidHarness(std::shared_ptr<IQueryExecutor> executor,
                         Options options,
                         std::shared_ptr<IEventSink> events)
    : executor_(std::move(executor)),
      options_(options),
      events_(sink_or_null(std::move(events))),
      session_id_(options.session_id != 0 ? options.session_id : utils::epoch_millis()),
      sleep_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {}

TestResult AcidHarness::run_test(std::string name, std::string description, const Scenario& scenario) {
    TestResult result;
    result.name = std::move(name);
    result.description = std::move(description);

    events_->info(kComponent, std::format("Running {} against {}", result.name,
                                          executor_->provider_name()));
    utils::Timer timer;
    {
        SessionNamespace ns(*executor_, *events_, session_id_);
        const auto setup = ns.provision();
        if (!setup.success) {
            result.error = std::format("Failed to set up test environment: {}", setup.error_message);
        } else {
            try {
                scenario(ns, result);
            } catch (const std::exception& e) {
                result.passed = false;
                result.error = e.what();
            }
        }
    }
    result.duration_ms = timer.elapsed_ms_f();

    if (result.passed) {
        events_->info(kComponent, std::format("{} passed", result.name));
    } else {
        events_->warn(kComponent, std::format("{} failed{}", result.name,
            result.error.empty() ? "" : ": " + result.error));
    }
    return result;
}

TestResult AcidHarness::test_atomicity() {
    return run_test("Atomicity Test", "Transaction rollback on failure",
                    [this](SessionNamespace& ns, TestResult& result) {
        const auto balances_sql = Query::plain(std::format(
            "SELECT account_id, balance FROM {} ORDER BY account_id", ns.accounts()));

        const auto initial = executor_->execute_query(balances_sql);
        if (!initial.success) {
            result.error = std::format("Initial balance read failed: {}", initial.error_message);
            return;
        }

        const double transfer = 200.00;
        const std::vector<Statement> group = {
            {Query::named(std::format(
                "UPDATE {} SET balance = balance - CAST(@amount AS NUMERIC) WHERE account_id = @id",
                ns.accounts())),
             NamedParams{}.set("amount", transfer).set("id", int64_t{1})},
            {Query::named(std::format(
                "UPDATE {} SET balance = balance + CAST(@amount AS NUMERIC) WHERE account_id = @id",
                ns.accounts())),
             NamedParams{}.set("amount", transfer).set("id", int64_t{2})},
            // Primary key collision forces the group to fail
            {Query::plain(std::format(
                "INSERT INTO {} (account_id, balance) VALUES (1, 999.99)", ns.accounts())),
             {}},
        };

        const auto grouped = executor_->execute_in_transaction(group);
        result.checks.push_back({"Grouped transaction rejected", !grouped.success,
            grouped.success ? "transaction committed despite duplicate key"
                            : grouped.error_message});

        const auto final_rows = executor_->execute_query(balances_sql);
        if (!final_rows.success) {
            result.error = std::format("Final balance read failed: {}", final_rows.error_message);
            return;
        }

        bool unchanged = initial.rows.size() == final_rows.rows.size();
        for (size_t i = 0; unchanged && i < initial.rows.size(); ++i) {
            unchanged = near(initial.rows[i].get_double("balance").value_or(0.0),
                             final_rows.rows[i].get_double("balance").value_or(0.0));
        }
        result.checks.push_back({"Balances unchanged", unchanged, ""});

        result.details = std::format("Initial: {}, Final: {}",
            describe_balances(initial.rows), describe_balances(final_rows.rows));
        result.passed = !grouped.success && unchanged;
    });
}

TestResult AcidHarness::test_consistency() {
    return run_test("Consistency Test", "Database constraints are enforced",
                    [this](SessionNamespace& ns, TestResult& result) {
        const std::pair<const char*, std::string> violations[] = {
            {"Primary Key Constraint",
             std::format("INSERT INTO {} (account_id, balance) VALUES (1, 999.99)", ns.accounts())},
            {"NOT NULL Constraint",
             std::format("INSERT INTO {} (account_id, balance) VALUES (NULL, 100.00)", ns.accounts())},
            {"Data Type Constraint",
             std::format("INSERT INTO {} (account_id, balance) VALUES ('invalid', 100.00)", ns.accounts())},
        };

        bool all_rejected = true;
        for (const auto& [check, sql] : violations) {
            const auto r = executor_->execute_dml(Query::plain(sql));
            if (r.success) {
                all_rejected = false;
                result.checks.push_back({check, false, "violating row was accepted"});
            } else {
                result.checks.push_back({check, true, std::format("{}: {}",
                    error_category_to_string(r.error_category), r.error_message)});
            }
        }

        const auto count = executor_->execute_query(Query::plain(
            std::format("SELECT COUNT(*) AS count FROM {}", ns.accounts())));
        if (!count.success) {
            result.error = std::format("Row count failed: {}", count.error_message);
            return;
        }
        const int64_t rows = count.empty() ? -1 : count.first()->get_int("count").value_or(-1);
        const bool intact = rows == static_cast<int64_t>(std::size(kSeedAccounts));
        result.checks.push_back({"Row count unchanged", intact, std::format("{} rows", rows)});

        result.details = std::format("Final count: {}", rows);
        result.passed = all_rejected && intact;
    });
}

TestResult AcidHarness::test_isolation() {
    return run_test("Isolation Test", "Concurrent transactions don't interfere",
                    [this](SessionNamespace& ns, TestResult& result) {
        const auto balance_sql = Query::named(std::format(
            "SELECT balance, version FROM {} WHERE account_id = @id", ns.accounts()));

        // Read-after-write visibility
        const auto before = executor_->execute_query(balance_sql, NamedParams{}.set("id", int64_t{1}));
        if (!before.success || before.empty()) {
            result.error = std::format("Balance read failed: {}",
                before.success ? "account 1 missing" : before.error_message);
            return;
        }
        const double initial = before.first()->get_double("balance").value_or(0.0);

        const auto credit = executor_->execute_dml(Query::named(std::format(
            "UPDATE {} SET balance = balance + 100 WHERE account_id = @id", ns.accounts())),
            NamedParams{}.set("id", int64_t{1}));

        const auto after = executor_->execute_query(balance_sql, NamedParams{}.set("id", int64_t{1}));
        const double updated = after.success && !after.empty()
            ? after.first()->get_double("balance").value_or(0.0) : 0.0;
        const bool visible = credit.success && after.success && near(updated, initial + 100.0);
        result.checks.push_back({"Read Consistency", visible,
            std::format("Initial: {:.2f}, Updated: {:.2f}", initial, updated)});

        // Optimistic version check
        const auto current = executor_->execute_query(balance_sql, NamedParams{}.set("id", int64_t{2}));
        if (!current.success || current.empty()) {
            result.error = std::format("Version read failed: {}",
                current.success ? "account 2 missing" : current.error_message);
            return;
        }
        const int64_t version = current.first()->get_int("version").value_or(0);

        const auto versioned_update = Query::named(std::format(
            "UPDATE {} SET balance = balance + 50, version = version + 1 "
            "WHERE account_id = @id AND version = @version", ns.accounts()));
        const auto fresh = executor_->execute_dml(versioned_update,
            NamedParams{}.set("id", int64_t{2}).set("version", version));
        const bool fresh_ok = fresh.success && fresh.affected_rows == 1;
        result.checks.push_back({"Version Control", fresh_ok, fresh.success
            ? std::format("{} row(s) updated at version {}", fresh.affected_rows, version)
            : fresh.error_message});

        const auto stale = executor_->execute_dml(versioned_update,
            NamedParams{}.set("id", int64_t{2}).set("version", version));
        const bool stale_ok = stale.success && stale.affected_rows == 0;
        result.checks.push_back({"Stale Version Rejected", stale_ok, stale.success
            ? std::format("{} row(s) updated with stale version {}", stale.affected_rows, version)
            : stale.error_message});

        result.details = std::format("Read consistency: {}, version control: {}, stale version: {}",
            utils::booltostr(visible), utils::booltostr(fresh_ok), utils::booltostr(stale_ok));
        result.passed = visible && fresh_ok && stale_ok;
    });
}

TestResult AcidHarness::test_durability() {
    return run_test("Durability Test", "Committed data persists after system restart",
                    [this](SessionNamespace& ns, TestResult& result) {
        const std::vector<Statement> writes = {
            {Query::named(std::format(
                "INSERT INTO {} (account_id, balance) VALUES (@id, CAST(@balance AS NUMERIC))",
                ns.accounts())),
             NamedParams{}.set("id", kDurabilityAccount).set("balance", kDurabilityBalance)},
            {Query::named(std::format(
                "INSERT INTO {} (audit_id, table_name, operation, record_id) "
                "VALUES (@id, @table, @operation, @id)", ns.audit())),
             NamedParams{}.set("id", kDurabilityAccount)
                          .set("table", std::string("accounts"))
                          .set("operation", std::string("INSERT"))},
        };

        const auto committed = executor_->execute_in_transaction(writes);
        if (!committed.success) {
            result.error = std::format("Durability writes failed: {}", committed.error_message);
            return;
        }

        sleep_(options_.durability_delay);
        const bool reconnected = executor_->reconnect();
        result.checks.push_back({"Fresh session", reconnected,
            reconnected ? "reconnected" : "reconnect failed"});
        if (!reconnected) {
            result.error = "Could not open a fresh session";
            return;
        }

        const auto account = executor_->execute_query(Query::named(std::format(
            "SELECT account_id, balance FROM {} WHERE account_id = @id", ns.accounts())),
            NamedParams{}.set("id", kDurabilityAccount));
        const bool data_persisted = account.success && !account.empty() &&
            near(account.first()->get_double("balance").value_or(0.0), kDurabilityBalance);
        result.checks.push_back({"Data persisted", data_persisted,
            account.success ? describe_balances(account.rows) : account.error_message});

        const auto audit = executor_->execute_query(Query::named(std::format(
            "SELECT audit_id, operation FROM {} WHERE record_id = @id", ns.audit())),
            NamedParams{}.set("id", kDurabilityAccount));
        const bool audit_persisted = audit.success && !audit.empty() &&
            audit.first()->get_string("operation").value_or("") == "INSERT";
        result.checks.push_back({"Audit persisted", audit_persisted,
            audit.success ? std::format("{} row(s)", audit.rows.size()) : audit.error_message});

        result.details = std::format("Data persisted: {}, Audit persisted: {}",
            utils::booltostr(data_persisted), utils::booltostr(audit_persisted));
        result.passed = data_persisted && audit_persisted;
    });
}

SuiteReport AcidHarness::run_all() {
    SuiteReport report;
    report.provider = executor_->provider_name();
    report.test_session_id = session_id_;

    utils::Timer timer;
    report.tests.emplace_back("atomicity", test_atomicity());
    report.tests.emplace_back("consistency", test_consistency());
    report.tests.emplace_back("isolation", test_isolation());
    report.tests.emplace_back("durability", test_durability());
    report.duration_ms = timer.elapsed_ms_f();

    events_->info(kComponent, std::format("ACID suite completed: {}/{} passed ({:.1f}%) in {:.0f} ms",
        report.passed(), report.tests.size(), report.success_rate(), report.duration_ms));
    return report;
}

} // namespace tpccgw
