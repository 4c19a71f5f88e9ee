#include <catch2/catch_test_macros.hpp>
#include "tpcc/transaction_plan.hpp"
#include "tpcc/protocol_support.hpp"
#include "mocks/mock_db_connection.hpp"

using namespace tpccgw;
using namespace tpccgw::testing;

TEST_CASE("TransactionPlan", "[transaction_plan]") {

    SECTION("Happy path") {
        TransactionPlan plan("payment");
        REQUIRE(plan.state() == PlanState::STARTED);
        REQUIRE_FALSE(plan.writes_allowed());

        REQUIRE(plan.advance(PlanState::READS_COMPLETE));
        REQUIRE_FALSE(plan.writes_allowed());
        REQUIRE(plan.advance(PlanState::VALIDATED));
        REQUIRE(plan.writes_allowed());
        REQUIRE(plan.advance(PlanState::WRITES_COMPLETE));
        REQUIRE_FALSE(plan.writes_allowed());
        REQUIRE(plan.protocol() == "payment");
    }

    SECTION("Writes cannot be reached without validation") {
        TransactionPlan plan("new_order");
        REQUIRE_FALSE(plan.advance(PlanState::WRITES_COMPLETE));
        REQUIRE(plan.advance(PlanState::READS_COMPLETE));
        REQUIRE_FALSE(plan.advance(PlanState::WRITES_COMPLETE));
        REQUIRE(plan.state() == PlanState::READS_COMPLETE);
    }

    SECTION("Abort names the reason and is terminal") {
        TransactionPlan plan("payment");
        plan.abort(ErrorCategory::NOT_FOUND, "Customer 1/1/99 not found");
        REQUIRE(plan.aborted());
        REQUIRE(plan.abort_category() == ErrorCategory::NOT_FOUND);
        REQUIRE(plan.abort_reason() == "Customer 1/1/99 not found");

        plan.abort(ErrorCategory::EXECUTION_ERROR, "later");
        REQUIRE(plan.abort_reason() == "Customer 1/1/99 not found");
        REQUIRE_FALSE(plan.advance(PlanState::READS_COMPLETE));
    }

    SECTION("Completed plan cannot abort") {
        TransactionPlan plan("delivery");
        REQUIRE(plan.advance(PlanState::READS_COMPLETE));
        REQUIRE(plan.advance(PlanState::VALIDATED));
        REQUIRE(plan.advance(PlanState::WRITES_COMPLETE));
        plan.abort(ErrorCategory::TRANSIENT, "x");
        REQUIRE(plan.state() == PlanState::WRITES_COMPLETE);
    }

    SECTION("Reset for a retried run") {
        TransactionPlan plan("payment");
        plan.record_step("read customer");
        plan.abort(ErrorCategory::TRANSIENT, "conflict");
        plan.reset();
        REQUIRE(plan.state() == PlanState::STARTED);
        REQUIRE(plan.steps().empty());
        REQUIRE(plan.abort_category() == ErrorCategory::NONE);
        REQUIRE(plan.abort_reason().empty());
    }

    SECTION("State names") {
        REQUIRE(std::string(plan_state_to_string(PlanState::VALIDATED)) == "VALIDATED");
        REQUIRE(std::string(plan_state_to_string(PlanState::ABORTED)) == "ABORTED");
    }
}

TEST_CASE("TransactionPlan gates protocol bodies", "[transaction_plan]") {

    SECTION("Rejected transition aborts as an internal error") {
        TransactionPlan plan("payment");
        TxnResult failure;
        REQUIRE_FALSE(detail::advance_plan(plan, PlanState::VALIDATED, failure));
        REQUIRE(plan.aborted());
        REQUIRE(failure.error_category == ErrorCategory::INTERNAL_ERROR);
        REQUIRE(failure.error_message == "payment plan cannot move from STARTED to VALIDATED");
    }

    SECTION("Writes before validation are refused") {
        TransactionPlan plan("delivery");
        TxnResult failure;
        REQUIRE(detail::advance_plan(plan, PlanState::READS_COMPLETE, failure));
        REQUIRE_FALSE(detail::writes_permitted(plan, failure));
        REQUIRE(failure.error_message == "delivery plan attempted writes in state READS_COMPLETE");
        REQUIRE(plan.abort_category() == ErrorCategory::INTERNAL_ERROR);
    }

    SECTION("Unvalidated body never reaches the backend write") {
        auto script = std::make_shared<Script>();
        auto executor = make_executor(script);
        TransactionPlan plan("new_order");

        const auto txn = executor->run_in_transaction([&](ITransactionContext& ctx) {
            plan.reset();
            TxnResult failure;
            if (!detail::writes_permitted(plan, failure)) return failure;
            (void)ctx.execute(Query::plain("UPDATE district SET d_next_o_id = 1"));
            return TxnResult::commit();
        }, TxnMode::READ_WRITE);

        REQUIRE_FALSE(txn.committed);
        REQUIRE(txn.error_category == ErrorCategory::INTERNAL_ERROR);
        REQUIRE(txn.attempts == 1);
        REQUIRE_FALSE(script->executed("UPDATE district"));
        REQUIRE(script->executed("ROLLBACK"));
    }

    SECTION("Trace carries the final state and steps") {
        TransactionPlan plan("order_status");
        plan.record_step("read customer");
        TxnResult failure;
        REQUIRE(detail::advance_plan(plan, PlanState::READS_COMPLETE, failure));

        const auto trace = detail::trace_of(plan);
        REQUIRE(trace.state == "READS_COMPLETE");
        REQUIRE(trace.steps == std::vector<std::string>{"read customer"});
        REQUIRE(trace.to_json()["state"] == "READS_COMPLETE");
    }
}
