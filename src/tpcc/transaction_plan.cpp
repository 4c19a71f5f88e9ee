#include "tpcc/transaction_plan.hpp"

namespace tpccgw {

bool TransactionPlan::is_valid_transition(PlanState from, PlanState to) {
    switch (from) {
        case PlanState::STARTED:
            return to == PlanState::READS_COMPLETE || to == PlanState::ABORTED;
        case PlanState::READS_COMPLETE:
            return to == PlanState::VALIDATED || to == PlanState::ABORTED;
        case PlanState::VALIDATED:
            return to == PlanState::WRITES_COMPLETE || to == PlanState::ABORTED;
        case PlanState::WRITES_COMPLETE:
        case PlanState::ABORTED:
            return false; // Terminal states
        default:
            return false;
    }
}

bool TransactionPlan::advance(PlanState to) {
    if (!is_valid_transition(state_, to)) return false;
    state_ = to;
    return true;
}

void TransactionPlan::abort(ErrorCategory category, std::string reason) {
    if (!is_valid_transition(state_, PlanState::ABORTED)) return;
    state_ = PlanState::ABORTED;
    abort_category_ = category;
    abort_reason_ = std::move(reason);
}

void TransactionPlan::reset() {
    state_ = PlanState::STARTED;
    steps_.clear();
    abort_category_ = ErrorCategory::NONE;
    abort_reason_.clear();
}

} // namespace tpccgw
