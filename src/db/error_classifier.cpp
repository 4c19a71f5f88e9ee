#include "db/error_classifier.hpp"
#include "core/utils.hpp"

#include <array>

namespace tpccgw {

ErrorCategory classify_db_error(std::string_view sqlstate, std::string_view message) {
    if (sqlstate.size() == 5) {
        const auto cls = sqlstate.substr(0, 2);
        if (cls == "08") return ErrorCategory::CONNECTIVITY;
        if (sqlstate == "57P01" || sqlstate == "57P02" || sqlstate == "57P03") {
            return ErrorCategory::CONNECTIVITY;
        }
        if (sqlstate == "40001" || sqlstate == "40P01") return ErrorCategory::TRANSIENT;
        if (cls == "23" || cls == "22") return ErrorCategory::CONSTRAINT_VIOLATION;
        return ErrorCategory::EXECUTION_ERROR;
    }

    const std::string lower = utils::to_lower(message);

    static constexpr std::array<std::string_view, 7> kConnectivityPatterns = {
        "connection refused",
        "could not connect",
        "server closed the connection",
        "connection reset",
        "no connection to the server",
        "terminating connection",
        "broken pipe",
    };
    for (const auto p : kConnectivityPatterns) {
        if (lower.find(p) != std::string::npos) return ErrorCategory::CONNECTIVITY;
    }

    static constexpr std::array<std::string_view, 4> kTransientPatterns = {
        "deadlock",
        "serialization failure",
        "could not serialize",
        "transaction was aborted",
    };
    for (const auto p : kTransientPatterns) {
        if (lower.find(p) != std::string::npos) return ErrorCategory::TRANSIENT;
    }

    static constexpr std::array<std::string_view, 4> kConstraintPatterns = {
        "duplicate key",
        "violates not-null",
        "violates unique",
        "invalid input syntax",
    };
    for (const auto p : kConstraintPatterns) {
        if (lower.find(p) != std::string::npos) return ErrorCategory::CONSTRAINT_VIOLATION;
    }

    return ErrorCategory::EXECUTION_ERROR;
}

} // namespace tpccgw
