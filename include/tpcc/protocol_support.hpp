#pragma once

#include "db/iquery_executor.hpp"
#include "tpcc/outcomes.hpp"
#include "tpcc/transaction_plan.hpp"

#include <format>
#include <string>
#include <string_view>

namespace tpccgw::detail {

/// Abort a plan and its transaction because a statement failed
[[nodiscard]] inline TxnResult abort_on_failure(
    TransactionPlan& plan, ErrorCategory category,
    std::string_view step, const std::string& message) {
    auto reason = std::format("{} failed: {}", step, message);
    plan.abort(category, reason);
    return TxnResult::abort(category, std::move(reason));
}

/// Abort a plan and its transaction because a required entity is missing
[[nodiscard]] inline TxnResult abort_not_found(TransactionPlan& plan, std::string what) {
    auto reason = std::format("{} not found", what);
    plan.abort(ErrorCategory::NOT_FOUND, reason);
    return TxnResult::abort(ErrorCategory::NOT_FOUND, std::move(reason));
}

/// Move the plan forward; a transition the plan rejects aborts as an internal error
[[nodiscard]] inline bool advance_plan(TransactionPlan& plan, PlanState to, TxnResult& failure) {
    const auto from = plan.state();
    if (plan.advance(to)) return true;
    auto reason = std::format("{} plan cannot move from {} to {}",
        plan.protocol(), plan_state_to_string(from), plan_state_to_string(to));
    plan.abort(ErrorCategory::INTERNAL_ERROR, reason);
    failure = TxnResult::abort(ErrorCategory::INTERNAL_ERROR, std::move(reason));
    return false;
}

/// Gate a write block: only a VALIDATED plan may write
[[nodiscard]] inline bool writes_permitted(TransactionPlan& plan, TxnResult& failure) {
    if (plan.writes_allowed()) return true;
    auto reason = std::format("{} plan attempted writes in state {}",
        plan.protocol(), plan_state_to_string(plan.state()));
    plan.abort(ErrorCategory::INTERNAL_ERROR, reason);
    failure = TxnResult::abort(ErrorCategory::INTERNAL_ERROR, std::move(reason));
    return false;
}

/// Snapshot of the last run of `plan` for the protocol outcome
[[nodiscard]] inline PlanTrace trace_of(const TransactionPlan& plan) {
    return PlanTrace{plan_state_to_string(plan.state()), plan.steps()};
}

/// Append every column of `from` to `into`
inline void merge_row(ResultRow& into, const ResultRow& from) {
    for (const auto& [name, value] : from.columns()) {
        into.set(name, value);
    }
}

/// Read one aggregate row inside a transaction; aborts the body on failure
template<typename Params>
[[nodiscard]] bool read_single(ITransactionContext& ctx, const std::string& sql,
                               const Params& params, ResultRow& into, TxnResult& failure,
                               std::string_view what) {
    const auto r = ctx.query(Query::named(sql), params);
    if (!r.success) {
        failure = TxnResult::abort(r.error_category,
            std::format("{} query failed: {}", what, r.error_message));
        return false;
    }
    if (const auto* row = r.first()) {
        merge_row(into, *row);
    }
    return true;
}

} // namespace tpccgw::detail
