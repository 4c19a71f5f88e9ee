#include "tpcc/inventory_service.hpp"
#include "tpcc/protocol_support.hpp"
#include "core/utils.hpp"

#include <format>

namespace tpccgw {

namespace {

constexpr std::string_view kComponent = "inventory";

/// Substring pattern for LIKE ... ESCAPE '\'; wildcards in the term match literally
std::string like_pattern(const std::string& term) {
    std::string escaped;
    for (char c : utils::trim(term)) {
        if (c == '\\' || c == '%' || c == '_') escaped += '\\';
        escaped += c;
    }
    return std::format("%{}%", escaped);
}

} // anonymous namespace

InventoryService::InventoryService(std::shared_ptr<IQueryExecutor> executor,
                                   TpccConfig config,
                                   std::shared_ptr<IEventSink> events)
    : executor_(std::move(executor)),
      config_(std::move(config)),
      events_(sink_or_null(std::move(events))) {}

// ============================================================================
// Stock-Level
// ============================================================================

StockLevelOutcome InventoryService::stock_level(
    int64_t warehouse_id, int64_t district_id, int64_t threshold) {

    StockLevelOutcome out;
    out.warehouse_id = warehouse_id;
    out.district_id = district_id;
    out.threshold = threshold;
    out.window = config_.stock_level_window;

    if (threshold < 0) {
        out.fail(ErrorCategory::INVALID_INPUT, "Threshold must not be negative");
        return out;
    }

    // Each step is its own snapshot read: a rejected join must not poison
    // the statement that replaces it.
    const auto district = executor_->execute_query(Query::named(
        "SELECT d_next_o_id FROM district WHERE d_w_id = @w_id AND d_id = @d_id"),
        NamedParams{}.set("w_id", warehouse_id).set("d_id", district_id));
    if (!district.success) {
        return fallback_count(std::move(out),
                              std::format("District lookup failed: {}", district.error_message));
    }
    if (district.empty()) {
        return fallback_count(std::move(out),
                              std::format("District {}/{} not found", warehouse_id, district_id));
    }

    const int64_t next_o_id = district.first()->get_int("d_next_o_id").value_or(0);
    const auto windowed = executor_->execute_query(Query::named(R"(
        SELECT COUNT(DISTINCT s.s_i_id) AS low_stock
        FROM order_line ol
        JOIN stock s ON s.s_i_id = ol.ol_i_id AND s.s_w_id = ol.ol_w_id
        WHERE ol.ol_w_id = @w_id
          AND ol.ol_d_id = @d_id
          AND ol.ol_o_id >= @min_o_id
          AND ol.ol_o_id < @next_o_id
          AND s.s_quantity < @threshold)"),
        NamedParams{}.set("w_id", warehouse_id)
                     .set("d_id", district_id)
                     .set("min_o_id", next_o_id - config_.stock_level_window)
                     .set("next_o_id", next_o_id)
                     .set("threshold", threshold));
    if (!windowed.success) {
        return fallback_count(std::move(out),
                              std::format("Recent-order count failed: {}", windowed.error_message));
    }

    out.method = StockLevelMethod::RECENT_ORDERS;
    out.low_stock_count = windowed.empty() ? 0 : windowed.first()->get_int("low_stock").value_or(0);
    out.success = true;
    return out;
}

StockLevelOutcome InventoryService::fallback_count(StockLevelOutcome out, std::string reason) {
    events_->warn(kComponent, std::format("Stock-Level {}/{} using warehouse-wide count: {}",
        out.warehouse_id, out.district_id, reason));

    const auto count = executor_->execute_query(Query::named(
        "SELECT COUNT(*) AS low_stock FROM stock WHERE s_w_id = @w_id AND s_quantity < @threshold"),
        NamedParams{}.set("w_id", out.warehouse_id).set("threshold", out.threshold));
    if (!count.success) {
        out.fail(count.error_category,
                 std::format("{}; warehouse-wide count failed: {}", reason, count.error_message));
        return out;
    }

    out.method = StockLevelMethod::WAREHOUSE_FALLBACK;
    out.fallback_reason = std::move(reason);
    out.low_stock_count = count.empty() ? 0 : count.first()->get_int("low_stock").value_or(0);
    out.success = true;
    return out;
}

// ============================================================================
// Reporting
// ============================================================================

Page InventoryService::inventory(
    std::optional<int64_t> warehouse_id,
    std::optional<int64_t> low_stock_threshold,
    std::optional<std::string> item_search,
    int64_t limit, int64_t offset) {

    std::optional<std::string> pattern;
    if (item_search && !utils::trim(*item_search).empty()) {
        pattern = like_pattern(*item_search);
    }

    FilterQueryBuilder builder({
        "s.s_i_id, s.s_w_id, s.s_quantity, s.s_ytd, s.s_order_cnt, s.s_remote_cnt, "
        "i.i_name, i.i_price, w.w_name",
        "stock s JOIN item i ON i.i_id = s.s_i_id JOIN warehouse w ON w.w_id = s.s_w_id",
        "s.s_w_id, s.s_i_id"
    });
    builder.where(FilterPredicate::if_present("s.s_w_id = @w_id", "w_id", warehouse_id))
           .where(FilterPredicate::if_present("s.s_quantity < @threshold", "threshold", low_stock_threshold))
           .where(FilterPredicate::if_present("LOWER(i.i_name) LIKE LOWER(@search) ESCAPE '\\'", "search", pattern));

    auto page = builder.run(*executor_, limit, offset);
    if (!page.success) {
        events_->error(kComponent, std::format("Inventory listing failed: {}", page.error));
    }
    return page;
}

ListOutcome InventoryService::low_stock_items(
    std::optional<int64_t> warehouse_id, int64_t threshold, int64_t limit) {

    ListOutcome out;
    NamedParams params;
    params.set("threshold", threshold).set("limit", limit);
    std::string warehouse_filter;
    if (warehouse_id) {
        warehouse_filter = " AND s.s_w_id = @w_id";
        params.set("w_id", *warehouse_id);
    }

    auto r = executor_->execute_query(Query::named(std::format(R"(
        SELECT s.s_i_id, s.s_w_id, s.s_quantity, s.s_ytd, s.s_order_cnt,
               i.i_name, i.i_price, i.i_data,
               w.w_name
        FROM stock s
        JOIN item i ON i.i_id = s.s_i_id
        JOIN warehouse w ON w.w_id = s.s_w_id
        WHERE s.s_quantity < @threshold{}
        ORDER BY s.s_quantity ASC
        LIMIT @limit)", warehouse_filter)), params);

    if (!r.success) {
        out.fail(r.error_category, r.error_message);
        return out;
    }
    out.success = true;
    out.rows = std::move(r.rows);
    return out;
}

DetailOutcome InventoryService::item_details(int64_t item_id) {
    DetailOutcome out;
    NamedParams key;
    key.set("i_id", item_id);

    const auto txn = executor_->run_in_transaction([&](ITransactionContext& ctx) {
        out = DetailOutcome{};

        const auto item = ctx.query(Query::named(R"(
            SELECT i.i_id, i.i_im_id, i.i_name, i.i_price, i.i_data,
                   COUNT(s.s_w_id) AS warehouse_count,
                   AVG(s.s_quantity) AS avg_stock,
                   MIN(s.s_quantity) AS min_stock,
                   MAX(s.s_quantity) AS max_stock,
                   SUM(s.s_ytd) AS total_ytd,
                   SUM(s.s_order_cnt) AS total_orders
            FROM item i
            LEFT JOIN stock s ON s.s_i_id = i.i_id
            WHERE i.i_id = @i_id
            GROUP BY i.i_id, i.i_im_id, i.i_name, i.i_price, i.i_data)"), key);
        if (!item.success) {
            return TxnResult::abort(item.error_category, item.error_message);
        }
        if (item.empty()) {
            return TxnResult::abort(ErrorCategory::NOT_FOUND, "Item not found");
        }
        out.record = *item.first();

        auto stock = ctx.query(Query::named(R"(
            SELECT s.s_w_id, s.s_quantity, s.s_ytd, s.s_order_cnt, s.s_remote_cnt,
                   w.w_name, w.w_city, w.w_state
            FROM stock s
            JOIN warehouse w ON w.w_id = s.s_w_id
            WHERE s.s_i_id = @i_id
            ORDER BY s.s_w_id)"), key);
        if (!stock.success) {
            return TxnResult::abort(stock.error_category, stock.error_message);
        }
        out.collections.emplace_back("stock_by_warehouse", std::move(stock.rows));
        return TxnResult::commit();
    }, TxnMode::READ_ONLY);

    if (!txn.committed) {
        out = DetailOutcome{};
        out.fail(txn.error_category, txn.error_message);
        return out;
    }
    out.success = true;
    return out;
}

DetailOutcome InventoryService::inventory_statistics(std::optional<int64_t> warehouse_id) {
    DetailOutcome out;

    ConditionBuilder plain;
    plain.add_if(warehouse_id, "s_w_id = @w_id", "w_id");
    ConditionBuilder aliased;
    aliased.add_if(warehouse_id, "s.s_w_id = @w_id", "w_id");

    const auto txn = executor_->run_in_transaction([&](ITransactionContext& ctx) {
        out = DetailOutcome{};
        TxnResult failure;
        ResultRow scratch;

        if (!detail::read_single(ctx,
                std::format("SELECT COUNT(*) AS total_stock_records, "
                            "AVG(s_quantity) AS avg_stock_quantity FROM stock {}",
                            plain.where_clause()),
                plain.params(), scratch, failure, "Stock totals")) {
            return failure;
        }
        if (!detail::read_single(ctx,
                std::format("SELECT COUNT(*) AS low_stock_items FROM stock {}",
                            plain.where_clause_and(std::format("s_quantity < {}", kLowStockThreshold))),
                plain.params(), scratch, failure, "Low stock")) {
            return failure;
        }
        if (!detail::read_single(ctx,
                std::format("SELECT COUNT(*) AS out_of_stock_items FROM stock {}",
                            plain.where_clause_and("s_quantity = 0")),
                plain.params(), scratch, failure, "Out of stock")) {
            return failure;
        }
        if (!detail::read_single(ctx,
                std::format("SELECT SUM(s.s_quantity * i.i_price) AS total_inventory_value "
                            "FROM stock s JOIN item i ON i.i_id = s.s_i_id {}",
                            aliased.where_clause()),
                aliased.params(), scratch, failure, "Inventory value")) {
            return failure;
        }

        out.record.set("total_stock_records", scratch.get_int("total_stock_records").value_or(0));
        out.record.set("low_stock_items", scratch.get_int("low_stock_items").value_or(0));
        out.record.set("out_of_stock_items", scratch.get_int("out_of_stock_items").value_or(0));
        out.record.set("avg_stock_quantity", scratch.get_double("avg_stock_quantity").value_or(0.0));
        out.record.set("total_inventory_value",
                       round_cents(scratch.get_double("total_inventory_value").value_or(0.0)));

        auto top = ctx.query(Query::named(std::format(R"(
            SELECT s.s_i_id, i.i_name, s.s_order_cnt, s.s_quantity
            FROM stock s
            JOIN item i ON i.i_id = s.s_i_id
            {}
            ORDER BY s.s_order_cnt DESC
            LIMIT 5)", aliased.where_clause())), aliased.params());
        if (!top.success) {
            return TxnResult::abort(top.error_category, top.error_message);
        }
        out.collections.emplace_back("top_ordered_items", std::move(top.rows));
        return TxnResult::commit();
    }, TxnMode::READ_ONLY);

    if (!txn.committed) {
        out = DetailOutcome{};
        out.fail(txn.error_category, txn.error_message);
        events_->error(kComponent, std::format("Inventory statistics failed: {}", txn.error_message));
        return out;
    }
    out.success = true;
    return out;
}

ListOutcome InventoryService::search_items(const std::string& term, int64_t limit) {
    ListOutcome out;
    if (utils::trim(term).empty()) {
        out.fail(ErrorCategory::INVALID_INPUT, "Search term must not be empty");
        return out;
    }

    auto r = executor_->execute_query(Query::named(R"(
        SELECT i.i_id, i.i_name, i.i_price, i.i_data,
               COUNT(s.s_w_id) AS warehouse_count,
               AVG(s.s_quantity) AS avg_stock,
               MIN(s.s_quantity) AS min_stock
        FROM item i
        LEFT JOIN stock s ON s.s_i_id = i.i_id
        WHERE LOWER(i.i_name) LIKE LOWER(@search) ESCAPE '\'
           OR LOWER(i.i_data) LIKE LOWER(@search) ESCAPE '\'
        GROUP BY i.i_id, i.i_name, i.i_price, i.i_data
        ORDER BY i.i_name
        LIMIT @limit)"),
        NamedParams{}.set("search", like_pattern(term)).set("limit", limit));

    if (!r.success) {
        out.fail(r.error_category, r.error_message);
        return out;
    }
    out.success = true;
    out.rows = std::move(r.rows);
    return out;
}

DetailOutcome InventoryService::warehouse_summary(int64_t warehouse_id) {
    DetailOutcome out;
    NamedParams key;
    key.set("w_id", warehouse_id);

    const auto txn = executor_->run_in_transaction([&](ITransactionContext& ctx) {
        out = DetailOutcome{};

        const auto warehouse = ctx.query(Query::named(
            "SELECT w_name, w_city, w_state FROM warehouse WHERE w_id = @w_id"), key);
        if (!warehouse.success) {
            return TxnResult::abort(warehouse.error_category, warehouse.error_message);
        }
        if (warehouse.empty()) {
            return TxnResult::abort(ErrorCategory::NOT_FOUND, "Warehouse not found");
        }
        out.record = *warehouse.first();

        TxnResult failure;
        if (!detail::read_single(ctx, std::format(R"(
                SELECT COUNT(*) AS total_items,
                       SUM(s.s_quantity) AS total_quantity,
                       AVG(s.s_quantity) AS avg_quantity,
                       COUNT(CASE WHEN s.s_quantity < {0} THEN 1 END) AS low_stock_count,
                       COUNT(CASE WHEN s.s_quantity = 0 THEN 1 END) AS out_of_stock_count,
                       SUM(s.s_ytd) AS total_ytd,
                       SUM(s.s_order_cnt) AS total_orders,
                       SUM(s.s_quantity * i.i_price) AS total_value
                FROM stock s
                JOIN item i ON i.i_id = s.s_i_id
                WHERE s.s_w_id = @w_id)", kLowStockThreshold),
                key, out.record, failure, "Warehouse stock summary")) {
            return failure;
        }
        return TxnResult::commit();
    }, TxnMode::READ_ONLY);

    if (!txn.committed) {
        out = DetailOutcome{};
        out.fail(txn.error_category, txn.error_message);
        return out;
    }
    out.success = true;
    return out;
}

} // namespace tpccgw
