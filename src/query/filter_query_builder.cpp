#include "query/filter_query_builder.hpp"
#include <algorithm>
#include <format>

namespace tpccgw {

// ============================================================================
// FilterQueryBuilder
// ============================================================================

std::string FilterQueryBuilder::where_clause() const {
    std::string clause;
    for (const auto& p : predicates_) {
        if (!p.active) continue;
        clause += clause.empty() ? "WHERE " : " AND ";
        clause += p.fragment;
    }
    return clause;
}

PagedQueries FilterQueryBuilder::build(int64_t limit, int64_t offset) const {
    PagedQueries out;

    for (const auto& p : predicates_) {
        if (!p.active || p.param_name.empty()) continue;
        out.count_params.set(p.param_name, p.value);
        out.page_params.set(p.param_name, p.value);
    }
    out.page_params.set("limit", limit);
    out.page_params.set("offset", offset);

    const auto where = where_clause();
    const auto where_part = where.empty() ? std::string{} : " " + where;

    out.count_query = Query::named(std::format(
        "SELECT COUNT(*) AS total_count FROM {}{}", spec_.from_clause, where_part));

    std::string page = std::format("SELECT {} FROM {}{}",
                                   spec_.select_list, spec_.from_clause, where_part);
    if (!spec_.order_by.empty()) {
        page += " ORDER BY " + spec_.order_by;
    }
    page += " LIMIT @limit OFFSET @offset";
    out.page_query = Query::named(std::move(page));

    return out;
}

Page FilterQueryBuilder::run(IQueryExecutor& executor, int64_t limit, int64_t offset) const {
    if (limit < 1) {
        return Page::failure(ErrorCategory::INVALID_INPUT,
            std::format("limit must be at least 1, got {}", limit), limit, offset);
    }
    if (offset < 0) {
        return Page::failure(ErrorCategory::INVALID_INPUT,
            std::format("offset must not be negative, got {}", offset), limit, offset);
    }

    const auto queries = build(limit, offset);
    Page page;

    const auto txn = executor.run_in_transaction([&](ITransactionContext& ctx) {
        page = Page{};
        page.limit = limit;
        page.offset = offset;

        const auto count = ctx.query(queries.count_query, queries.count_params);
        if (!count.success) {
            return TxnResult::abort(count.error_category,
                std::format("Count query failed: {}", count.error_message));
        }
        const auto* row = count.first();
        page.total_count = std::max<int64_t>(0, row ? row->get_int("total_count").value_or(0) : 0);

        auto items = ctx.query(queries.page_query, queries.page_params);
        if (!items.success) {
            return TxnResult::abort(items.error_category,
                std::format("Page query failed: {}", items.error_message));
        }
        page.items = std::move(items.rows);
        return TxnResult::commit();
    }, TxnMode::READ_ONLY);

    if (!txn.committed) {
        return Page::failure(txn.error_category, txn.error_message, limit, offset);
    }

    page.success = true;
    // offset >= 0 and total_count >= 0, so the subtraction cannot overflow
    page.has_next = limit < page.total_count - offset;
    page.has_prev = offset > 0;
    return page;
}

// ============================================================================
// ConditionBuilder
// ============================================================================

std::string ConditionBuilder::where_clause() const {
    std::string clause = "WHERE 1=1";
    for (const auto& c : conditions_) {
        clause += " AND ";
        clause += c;
    }
    return clause;
}

std::string ConditionBuilder::where_clause_and(const std::string& extra) const {
    return where_clause() + " AND " + extra;
}

} // namespace tpccgw
