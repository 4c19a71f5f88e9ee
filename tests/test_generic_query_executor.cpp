#include <catch2/catch_test_macros.hpp>
#include "db/generic_query_executor.hpp"
#include "mocks/mock_db_connection.hpp"

#include <stdexcept>

using namespace tpccgw;
using namespace tpccgw::testing;

TEST_CASE("GenericQueryExecutor reads", "[executor]") {
    auto script = std::make_shared<Script>();
    auto executor = make_executor(script);

    SECTION("Read runs inside a read-only snapshot") {
        script->rows("FROM warehouse", {"w_name", "w_ytd"}, {{"W1", "300000.00"}});

        NamedParams p;
        p.set("w_id", 1);
        auto r = executor->execute_query(
            Query::named("SELECT w_name, w_ytd FROM warehouse WHERE w_id = @w_id"), p);

        REQUIRE(r.success);
        REQUIRE(r.rows.size() == 1);
        REQUIRE(r.rows[0].get_string("w_name") == "W1");
        REQUIRE(r.rows[0].get_double("w_ytd") == 300000.0);
        REQUIRE(r.column_names == std::vector<std::string>{"w_name", "w_ytd"});

        REQUIRE(script->log.size() == 3);
        REQUIRE(script->log[0].sql == "BEGIN ISOLATION LEVEL REPEATABLE READ READ ONLY");
        REQUIRE(script->log[1].sql == "SELECT w_name, w_ytd FROM warehouse WHERE w_id = $1");
        REQUIRE(script->log[1].params.at_position(1).value == Value{int64_t{1}});
        REQUIRE(script->log[2].sql == "COMMIT");
    }

    SECTION("No match is an empty success") {
        auto r = executor->execute_query(Query::plain("SELECT 1 FROM item WHERE false"));
        REQUIRE(r.success);
        REQUIRE(r.empty());
        REQUIRE(r.first() == nullptr);
    }

    SECTION("Backend failure is an explicit error, not an empty result") {
        script->fail("FROM missing_table", "42P01", "relation \"missing_table\" does not exist");
        auto r = executor->execute_query(Query::plain("SELECT * FROM missing_table"));
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error_category == ErrorCategory::EXECUTION_ERROR);
        REQUIRE(r.error_message.find("missing_table") != std::string::npos);
        REQUIRE(script->executed("ROLLBACK"));
        REQUIRE_FALSE(script->executed("COMMIT"));
    }

    SECTION("Translation error never reaches the backend") {
        auto r = executor->execute_query(Query::named("SELECT @missing"));
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error_category == ErrorCategory::TRANSLATION);
        REQUIRE_FALSE(script->executed("@missing"));
        REQUIRE_FALSE(script->executed("$1"));
    }
}

TEST_CASE("GenericQueryExecutor retry", "[executor][retry]") {
    auto script = std::make_shared<Script>();
    RetryPolicy retry;
    retry.max_attempts = 3;
    auto executor = make_executor(script, retry);

    SECTION("Serialization failure is retried until it succeeds") {
        script->fail("UPDATE district", "40001", "could not serialize access", 2);
        script->affects("UPDATE district", 1);

        auto r = executor->execute_dml(
            Query::named("UPDATE district SET d_ytd = d_ytd + 1 WHERE d_id = @d_id"),
            NamedParams{}.set("d_id", 1));

        REQUIRE(r.success);
        REQUIRE(r.affected_rows == 1);
        REQUIRE(script->count("UPDATE district") == 3);
        REQUIRE(script->count("ROLLBACK") == 2);
        REQUIRE(script->count("COMMIT") == 1);
    }

    SECTION("Attempts are bounded") {
        script->fail("UPDATE district", "40001", "could not serialize access");

        TxnResult txn = executor->run_in_transaction([](ITransactionContext& ctx) {
            auto r = ctx.execute(Query::plain("UPDATE district SET d_ytd = 0"));
            if (!r.success) return TxnResult::abort(r.error_category, r.error_message);
            return TxnResult::commit();
        }, TxnMode::READ_WRITE);

        REQUIRE_FALSE(txn.committed);
        REQUIRE(txn.attempts == 3);
        REQUIRE(txn.error_category == ErrorCategory::TRANSIENT);
        REQUIRE(script->count("UPDATE district") == 3);
    }

    SECTION("Constraint violations are not retried") {
        script->fail("INSERT INTO orders", "23505", "duplicate key value violates unique constraint");
        auto r = executor->execute_dml(Query::plain("INSERT INTO orders VALUES (1)"));
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error_category == ErrorCategory::CONSTRAINT_VIOLATION);
        REQUIRE(script->count("INSERT INTO orders") == 1);
    }

    SECTION("Body bailing out after a conflict keeps the conflict category") {
        script->fail("SELECT d_next_o_id", "40P01", "deadlock detected", 1);
        script->rows("SELECT d_next_o_id", {"d_next_o_id"}, {{"3001"}});

        int runs = 0;
        TxnResult txn = executor->run_in_transaction([&](ITransactionContext& ctx) {
            ++runs;
            auto r = ctx.query(Query::plain("SELECT d_next_o_id FROM district"));
            if (!r.success) return TxnResult{};
            return TxnResult::commit();
        }, TxnMode::READ_WRITE);

        REQUIRE(txn.committed);
        REQUIRE(runs == 2);
        REQUIRE(txn.attempts == 2);
    }

    SECTION("max_attempts of zero still runs once") {
        RetryPolicy none;
        none.max_attempts = 0;
        auto single = make_executor(script, none);
        script->fail("UPDATE x", "40001", "conflict");
        auto r = single->execute_dml(Query::plain("UPDATE x SET a = 1"));
        REQUIRE_FALSE(r.success);
        REQUIRE(script->count("UPDATE x") == 1);
    }

    SECTION("Backoff doubles and is capped") {
        RetryPolicy p;
        p.base_backoff = std::chrono::milliseconds(50);
        p.max_backoff = std::chrono::milliseconds(150);
        REQUIRE(p.backoff_after(1).count() == 50);
        REQUIRE(p.backoff_after(2).count() == 100);
        REQUIRE(p.backoff_after(3).count() == 150);
        REQUIRE(p.backoff_after(0).count() == 0);
    }
}

TEST_CASE("GenericQueryExecutor transactions", "[executor][transaction]") {
    auto script = std::make_shared<Script>();
    auto events = std::make_shared<RecordingEventSink>();
    auto executor = make_executor(script, RetryPolicy{}, SqlDialect::postgresql(), events);

    SECTION("Writes are rejected in a read-only transaction") {
        MutationResult write;
        TxnResult txn = executor->run_in_transaction([&](ITransactionContext& ctx) {
            write = ctx.execute(Query::plain("DELETE FROM new_order"));
            return TxnResult::commit();
        }, TxnMode::READ_ONLY);

        REQUIRE(txn.committed);
        REQUIRE_FALSE(write.success);
        REQUIRE(write.error_category == ErrorCategory::INVALID_INPUT);
        REQUIRE_FALSE(script->executed("DELETE FROM new_order"));
    }

    SECTION("A throwing body rolls back") {
        TxnResult txn = executor->run_in_transaction([](ITransactionContext& ctx) -> TxnResult {
            (void)ctx.execute(Query::plain("UPDATE stock SET s_quantity = 0"));
            throw std::runtime_error("boom");
        }, TxnMode::READ_WRITE);

        REQUIRE_FALSE(txn.committed);
        REQUIRE(txn.error_category == ErrorCategory::INTERNAL_ERROR);
        REQUIRE(txn.error_message.find("boom") != std::string::npos);
        REQUIRE(script->executed("ROLLBACK"));
        REQUIRE_FALSE(script->executed("COMMIT"));
    }

    SECTION("Grouped mutation applies all or nothing") {
        script->affects("UPDATE accounts", 1);
        script->fail("INSERT INTO accounts", "23505", "duplicate key value");

        std::vector<Statement> group{
            {Query::named("UPDATE accounts SET balance = balance - @amount WHERE id = @id"),
             NamedParams{}.set("amount", 100.0).set("id", 1)},
            {Query::named("UPDATE accounts SET balance = balance + @amount WHERE id = @id"),
             NamedParams{}.set("amount", 100.0).set("id", 2)},
            {Query::plain("INSERT INTO accounts VALUES (1, 999.99)"), {}},
        };
        auto r = executor->execute_in_transaction(group);

        REQUIRE_FALSE(r.success);
        REQUIRE(r.error_category == ErrorCategory::CONSTRAINT_VIOLATION);
        REQUIRE(r.error_message.find("Statement 3 of 3") != std::string::npos);
        REQUIRE(script->executed("ROLLBACK"));
        REQUIRE_FALSE(script->executed("COMMIT"));
    }

    SECTION("Grouped mutation sums affected rows") {
        script->affects("UPDATE accounts", 1);
        std::vector<Statement> group{
            {Query::plain("UPDATE accounts SET balance = 1 WHERE id = 1"), {}},
            {Query::plain("UPDATE accounts SET balance = 2 WHERE id = 2"), {}},
        };
        auto r = executor->execute_in_transaction(group);
        REQUIRE(r.success);
        REQUIRE(r.affected_rows == 2);
    }

    SECTION("DDL runs outside a transaction") {
        auto r = executor->execute_ddl("CREATE TABLE t (id BIGINT PRIMARY KEY)");
        REQUIRE(r.success);
        REQUIRE(script->log.size() == 1);
        REQUIRE_FALSE(script->executed("BEGIN"));
    }

    SECTION("Commit failure is reported") {
        script->fail("COMMIT", "23503", "deferred constraint violated");
        auto r = executor->execute_dml(Query::plain("DELETE FROM item"));
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error_category == ErrorCategory::CONSTRAINT_VIOLATION);
        REQUIRE(r.error_message.find("Commit failed") != std::string::npos);
    }

    SECTION("Connection lost during commit is not retried") {
        script->affects("UPDATE customer", 1);
        script->fail("COMMIT", "08006", "server closed the connection unexpectedly", 1);

        auto r = executor->execute_dml(Query::plain("UPDATE customer SET c_balance = 0"));

        REQUIRE_FALSE(r.success);
        REQUIRE(r.error_category == ErrorCategory::EXECUTION_ERROR);
        REQUIRE(r.error_message.find("Commit outcome unknown") != std::string::npos);
        REQUIRE(script->count("UPDATE customer") == 1);
        REQUIRE(script->count("COMMIT") == 1);
        REQUIRE(events->contains("Commit outcome unknown"));
    }

    SECTION("Serialization failure at commit is still retried") {
        script->fail("COMMIT", "40001", "could not serialize access", 1);

        auto r = executor->execute_dml(Query::plain("UPDATE district SET d_ytd = 0"));

        REQUIRE(r.success);
        REQUIRE(script->count("UPDATE district") == 2);
    }
}

TEST_CASE("GenericQueryExecutor sessions", "[executor][connection]") {
    auto script = std::make_shared<Script>();
    auto events = std::make_shared<RecordingEventSink>();
    RetryPolicy retry;
    retry.max_attempts = 2;
    auto executor = make_executor(script, retry, SqlDialect::spanner(), events);

    SECTION("Connection is opened lazily and reused") {
        REQUIRE(script->connects == 0);
        REQUIRE(executor->execute_query(Query::plain("SELECT 1")).success);
        REQUIRE(executor->execute_query(Query::plain("SELECT 2")).success);
        REQUIRE(script->connects == 1);
        REQUIRE(script->log[0].sql == "BEGIN READ ONLY");
    }

    SECTION("Connect failure is a connectivity error after retries") {
        script->connect_failures = 5;
        auto r = executor->execute_query(Query::plain("SELECT 1"));
        REQUIRE_FALSE(r.success);
        REQUIRE(r.error_category == ErrorCategory::CONNECTIVITY);
        REQUIRE(script->connects == 2);
        REQUIRE(events->count(EventLevel::ERROR) > 0);
    }

    SECTION("Dropped connection is replaced on retry") {
        script->fail("SELECT c_balance", "08006", "server closed the connection unexpectedly", 1);
        script->rows("SELECT c_balance", {"c_balance"}, {{"10.00"}});

        auto r = executor->execute_query(Query::plain("SELECT c_balance FROM customer"));
        REQUIRE(r.success);
        REQUIRE(script->connects == 2);
        REQUIRE(events->contains("Dropping broken connection"));
    }

    SECTION("Reconnect opens a fresh session") {
        REQUIRE(executor->test_connection());
        REQUIRE(executor->reconnect());
        REQUIRE(script->connects == 2);
    }

    SECTION("Unhealthy backend fails the connection check") {
        script->healthy = false;
        REQUIRE_FALSE(executor->test_connection());
    }

    SECTION("Provider name comes from the dialect unless configured") {
        REQUIRE(executor->provider_name() == "Google Spanner");
        GenericQueryExecutor named(std::make_shared<ScriptedConnectionFactory>(script),
                                   SqlDialect::postgresql(),
                                   GenericQueryExecutor::Config{"host=x", "AlloyDB", {}});
        REQUIRE(named.provider_name() == "AlloyDB");
    }
}
