#pragma once

#include "core/error.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace tpccgw {

// ============================================================================
// Row Values
// ============================================================================

/**
 * @brief A single normalized cell value
 *
 * Timestamps never appear as a distinct alternative: the normalizer renders
 * them as ISO-8601 strings before rows leave the execution layer.
 */
using Value = std::variant<std::monostate, bool, int64_t, double, std::string>;

[[nodiscard]] inline bool is_null(const Value& v) {
    return std::holds_alternative<std::monostate>(v);
}

/**
 * @brief Ordered column-name -> value mapping for one result row
 *
 * Column order follows the projection. Lookups are linear; rows are narrow.
 */
class ResultRow {
public:
    using Column = std::pair<std::string, Value>;

    ResultRow() = default;
    ResultRow(std::initializer_list<Column> columns) : columns_(columns) {}

    void set(std::string name, Value value) {
        for (auto& [n, v] : columns_) {
            if (n == name) {
                v = std::move(value);
                return;
            }
        }
        columns_.emplace_back(std::move(name), std::move(value));
    }

    [[nodiscard]] const Value* find(std::string_view name) const {
        for (const auto& [n, v] : columns_) {
            if (n == name) return &v;
        }
        return nullptr;
    }

    [[nodiscard]] bool contains(std::string_view name) const { return find(name) != nullptr; }

    /// Integer view: int64 as-is, double truncated, numeric text parsed
    [[nodiscard]] std::optional<int64_t> get_int(std::string_view name) const;

    /// Floating view: double as-is, int64 widened, numeric text parsed
    [[nodiscard]] std::optional<double> get_double(std::string_view name) const;

    /// Text view: strings as-is, other non-null values rendered
    [[nodiscard]] std::optional<std::string> get_string(std::string_view name) const;

    [[nodiscard]] const std::vector<Column>& columns() const { return columns_; }
    [[nodiscard]] size_t size() const { return columns_.size(); }
    [[nodiscard]] bool empty() const { return columns_.empty(); }

private:
    std::vector<Column> columns_;
};

using ResultSet = std::vector<ResultRow>;

/// Render a value as text (null -> "", bool -> "true"/"false")
[[nodiscard]] std::string value_to_string(const Value& v);

// ============================================================================
// Execution Results
// ============================================================================

/**
 * @brief Outcome of a read-only query
 *
 * A failed read is never represented as an empty row set: callers check
 * success first, and an empty `rows` on success means "no match".
 */
struct QueryResult {
    bool success = false;
    ErrorCategory error_category = ErrorCategory::NONE;
    std::string error_message;

    std::vector<std::string> column_names;
    ResultSet rows;

    std::chrono::microseconds execution_time{0};

    [[nodiscard]] bool empty() const { return rows.empty(); }

    [[nodiscard]] const ResultRow* first() const {
        return rows.empty() ? nullptr : &rows.front();
    }

    static QueryResult failure(ErrorCategory category, std::string message) {
        QueryResult r;
        r.success = false;
        r.error_category = category;
        r.error_message = std::move(message);
        return r;
    }
};

/**
 * @brief Outcome of a data mutation
 *
 * affected_rows is diagnostic only; callers must not branch on it unless
 * the statement's contract says so (optimistic version checks).
 */
struct MutationResult {
    bool success = false;
    ErrorCategory error_category = ErrorCategory::NONE;
    std::string error_message;
    uint64_t affected_rows = 0;
    std::chrono::microseconds execution_time{0};

    static MutationResult failure(ErrorCategory category, std::string message) {
        MutationResult r;
        r.success = false;
        r.error_category = category;
        r.error_message = std::move(message);
        return r;
    }
};

// ============================================================================
// Transaction Modes
// ============================================================================

enum class TxnMode {
    READ_ONLY,      // point-in-time snapshot, writes rejected
    READ_WRITE
};

[[nodiscard]] inline const char* txn_mode_to_string(TxnMode mode) {
    return mode == TxnMode::READ_ONLY ? "read_only" : "read_write";
}

} // namespace tpccgw
