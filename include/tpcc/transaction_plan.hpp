#pragma once

#include "core/error.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace tpccgw {

// Protocol progress (explicit state machine)
enum class PlanState : uint8_t {
    STARTED,
    READS_COMPLETE,
    VALIDATED,
    WRITES_COMPLETE,
    ABORTED
};

[[nodiscard]] inline const char* plan_state_to_string(PlanState s) {
    switch (s) {
        case PlanState::STARTED:         return "STARTED";
        case PlanState::READS_COMPLETE:  return "READS_COMPLETE";
        case PlanState::VALIDATED:       return "VALIDATED";
        case PlanState::WRITES_COMPLETE: return "WRITES_COMPLETE";
        case PlanState::ABORTED:         return "ABORTED";
        default:                         return "UNKNOWN";
    }
}

/**
 * @brief Ordered read/compute/write progress of one TPC-C protocol run
 *
 * STARTED -> READS_COMPLETE -> VALIDATED -> WRITES_COMPLETE
 *        \________________\____________\--> ABORTED
 *
 * Writes are only permitted once VALIDATED; a plan that failed a read
 * aborts with the missing entity named and never reaches its writes.
 */
class TransactionPlan {
public:
    explicit TransactionPlan(std::string protocol) : protocol_(std::move(protocol)) {}

    [[nodiscard]] static bool is_valid_transition(PlanState from, PlanState to);

    /// Move to `to`; false (state unchanged) when the transition is invalid
    bool advance(PlanState to);

    /// Enter ABORTED with a reason; no-op once terminal
    void abort(ErrorCategory category, std::string reason);

    /// Back to STARTED for a retried run
    void reset();

    void record_step(std::string step) { steps_.push_back(std::move(step)); }

    [[nodiscard]] bool writes_allowed() const { return state_ == PlanState::VALIDATED; }
    [[nodiscard]] bool aborted() const { return state_ == PlanState::ABORTED; }

    [[nodiscard]] PlanState state() const { return state_; }
    [[nodiscard]] const std::string& protocol() const { return protocol_; }
    [[nodiscard]] const std::vector<std::string>& steps() const { return steps_; }
    [[nodiscard]] ErrorCategory abort_category() const { return abort_category_; }
    [[nodiscard]] const std::string& abort_reason() const { return abort_reason_; }

private:
    std::string protocol_;
    PlanState state_ = PlanState::STARTED;
    std::vector<std::string> steps_;
    ErrorCategory abort_category_ = ErrorCategory::NONE;
    std::string abort_reason_;
};

} // namespace tpccgw
