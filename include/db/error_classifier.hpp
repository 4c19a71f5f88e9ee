#pragma once

#include "core/error.hpp"
#include <string_view>

namespace tpccgw {

/**
 * @brief Classify a backend failure into an ErrorCategory
 *
 * SQLSTATE decides when present:
 *   08xxx, 57P01-57P03   -> CONNECTIVITY
 *   40001, 40P01         -> TRANSIENT
 *   23xxx, 22xxx         -> CONSTRAINT_VIOLATION
 *   42P01 (missing table)-> EXECUTION_ERROR
 * Otherwise the message is matched against known connectivity and
 * transient patterns; everything else is EXECUTION_ERROR.
 */
[[nodiscard]] ErrorCategory classify_db_error(std::string_view sqlstate, std::string_view message);

/// TRANSIENT and CONNECTIVITY failures are worth another attempt
[[nodiscard]] inline bool is_retryable(ErrorCategory category) {
    return category == ErrorCategory::TRANSIENT || category == ErrorCategory::CONNECTIVITY;
}

} // namespace tpccgw
