#pragma once

#include "core/parameter_translator.hpp"
#include "core/types.hpp"
#include "db/iquery_executor.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tpccgw {

// ============================================================================
// Predicates
// ============================================================================

/**
 * @brief One optional WHERE fragment
 *
 * Inactive predicates are left out of both the count and the page query.
 * A parameterless predicate ("no.no_o_id IS NULL") has an empty name.
 */
struct FilterPredicate {
    std::string fragment;       // "o.o_w_id = @w_id"
    std::string param_name;     // "w_id"
    TypedParam value;
    bool active = false;

    /// Active only when the value is present
    template<typename T>
    static FilterPredicate if_present(std::string fragment, std::string name,
                                      const std::optional<T>& value) {
        FilterPredicate p;
        p.fragment = std::move(fragment);
        p.param_name = std::move(name);
        p.active = value.has_value();
        if (value) p.value = coerce_value(*value);
        return p;
    }

    /// Parameterless fragment, active when the condition holds
    static FilterPredicate when(bool condition, std::string fragment) {
        FilterPredicate p;
        p.fragment = std::move(fragment);
        p.active = condition;
        return p;
    }
};

// ============================================================================
// Paged Query
// ============================================================================

/**
 * @brief The fixed parts of a filtered listing
 */
struct PagedQuerySpec {
    std::string select_list;    // "o.o_id, o.o_w_id, ..."
    std::string from_clause;    // "orders o JOIN customer c ON ..."
    std::string order_by;       // "o.o_entry_d DESC"
};

/**
 * @brief The paired statements and their shared parameter source
 *
 * page_params is count_params plus limit and offset.
 */
struct PagedQueries {
    Query count_query;
    Query page_query;
    NamedParams count_params;
    NamedParams page_params;
};

/**
 * @brief One page of a listing plus pagination metadata
 */
struct Page {
    bool success = false;
    ErrorCategory error_category = ErrorCategory::NONE;
    std::string error;

    ResultSet items;
    int64_t total_count = 0;
    int64_t limit = 0;
    int64_t offset = 0;
    bool has_next = false;      // offset + limit < total_count
    bool has_prev = false;      // offset > 0

    static Page failure(ErrorCategory category, std::string message, int64_t limit, int64_t offset) {
        Page p;
        p.error_category = category;
        p.error = std::move(message);
        p.limit = limit;
        p.offset = offset;
        return p;
    }
};

/**
 * @brief Builds the COUNT query and the LIMIT/OFFSET page query from one
 *        predicate list
 *
 * Both statements share the same predicates in the same order, so the
 * total and the page are always computed over the same row set. With no
 * active predicate the WHERE clause is omitted entirely.
 */
class FilterQueryBuilder {
public:
    explicit FilterQueryBuilder(PagedQuerySpec spec) : spec_(std::move(spec)) {}

    FilterQueryBuilder& where(FilterPredicate predicate) {
        predicates_.push_back(std::move(predicate));
        return *this;
    }

    /// "WHERE a AND b", or empty when no predicate is active
    [[nodiscard]] std::string where_clause() const;

    [[nodiscard]] PagedQueries build(int64_t limit, int64_t offset) const;

    /**
     * @brief Run count then page inside one read-only snapshot
     *
     * limit must be >= 1 and offset >= 0 (INVALID_INPUT otherwise).
     */
    [[nodiscard]] Page run(IQueryExecutor& executor, int64_t limit, int64_t offset) const;

private:
    PagedQuerySpec spec_;
    std::vector<FilterPredicate> predicates_;
};

// ============================================================================
// Aggregation Conditions
// ============================================================================

/**
 * @brief "WHERE 1=1" condition accumulator for statistics queries
 *
 * Statistics paths append further fixed conditions after the optional
 * ones ("{where} AND s_quantity = 0"), which the vacuous base keeps valid.
 */
class ConditionBuilder {
public:
    template<typename T>
    ConditionBuilder& add_if(const std::optional<T>& value, std::string fragment, std::string name) {
        if (value) {
            conditions_.push_back(std::move(fragment));
            params_.set(std::move(name), *value);
        }
        return *this;
    }

    [[nodiscard]] std::string where_clause() const;

    /// where_clause() plus one more fixed condition
    [[nodiscard]] std::string where_clause_and(const std::string& extra) const;

    [[nodiscard]] const NamedParams& params() const { return params_; }

private:
    std::vector<std::string> conditions_;
    NamedParams params_;
};

} // namespace tpccgw
