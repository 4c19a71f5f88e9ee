#pragma once

#include "core/event_sink.hpp"
#include "db/iquery_executor.hpp"
#include "query/filter_query_builder.hpp"
#include "tpcc/outcomes.hpp"
#include "tpcc/tpcc_config.hpp"

#include <memory>
#include <optional>
#include <string>

namespace tpccgw {

/**
 * @brief Stock-Level protocol and inventory reporting
 */
class InventoryService {
public:
    static constexpr int64_t kLowStockThreshold = 10;

    InventoryService(std::shared_ptr<IQueryExecutor> executor,
                     TpccConfig config,
                     std::shared_ptr<IEventSink> events = nullptr);

    /**
     * @brief Distinct items below `threshold` among the district's recent orders
     *
     * The window is the last stock_level_window order ids before
     * d_next_o_id. When the district cannot be read or the windowed join is
     * rejected, a warehouse-wide count is returned instead and the outcome
     * is labelled WAREHOUSE_FALLBACK with the reason.
     */
    [[nodiscard]] StockLevelOutcome stock_level(
        int64_t warehouse_id, int64_t district_id, int64_t threshold);

    /// Stock rows filtered by warehouse, quantity below threshold, item name substring
    [[nodiscard]] Page inventory(
        std::optional<int64_t> warehouse_id,
        std::optional<int64_t> low_stock_threshold,
        std::optional<std::string> item_search,
        int64_t limit, int64_t offset);

    [[nodiscard]] ListOutcome low_stock_items(
        std::optional<int64_t> warehouse_id, int64_t threshold, int64_t limit);

    /// Item with stock aggregates, plus per-warehouse stock
    [[nodiscard]] DetailOutcome item_details(int64_t item_id);

    [[nodiscard]] DetailOutcome inventory_statistics(std::optional<int64_t> warehouse_id);

    /// Case-insensitive substring match on item name or data
    [[nodiscard]] ListOutcome search_items(const std::string& term, int64_t limit);

    [[nodiscard]] DetailOutcome warehouse_summary(int64_t warehouse_id);

private:
    /// Warehouse-wide count used when the windowed count is unavailable
    StockLevelOutcome fallback_count(StockLevelOutcome out, std::string reason);

    std::shared_ptr<IQueryExecutor> executor_;
    TpccConfig config_;
    std::shared_ptr<IEventSink> events_;
};

} // namespace tpccgw
