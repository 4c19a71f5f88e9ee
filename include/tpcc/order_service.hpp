#pragma once

#include "core/event_sink.hpp"
#include "db/iquery_executor.hpp"
#include "query/filter_query_builder.hpp"
#include "tpcc/new_order_transaction.hpp"
#include "tpcc/outcomes.hpp"
#include "tpcc/tpcc_config.hpp"

#include <memory>
#include <optional>
#include <string>

namespace tpccgw {

/**
 * @brief Order-side TPC-C protocols and order reporting
 *
 * New-Order placement is delegated to an INewOrderCapability; this service
 * tags committed orders with the configured region afterwards. Order-Status
 * and Delivery run against the executor directly.
 */
class OrderService {
public:
    OrderService(std::shared_ptr<IQueryExecutor> executor,
                 std::shared_ptr<INewOrderCapability> new_order,
                 TpccConfig config,
                 std::shared_ptr<IEventSink> events = nullptr);

    /**
     * @brief Place an order, then tag it with region_created
     *
     * A tagging failure is logged and reported as region_tagged = false;
     * it never fails the order.
     */
    [[nodiscard]] NewOrderOutcome execute_new_order(const NewOrderRequest& request);

    /// Customer, latest order by entry date, and that order's lines
    [[nodiscard]] OrderStatusOutcome order_status(
        int64_t warehouse_id, int64_t district_id, int64_t customer_id);

    /**
     * @brief Deliver the oldest pending order of a warehouse
     *
     * In APPLY mode removes the new_order marker, sets the carrier, stamps
     * the line delivery dates and credits the customer, all in one
     * transaction. SIMULATE only computes the would-be effect. An empty
     * queue is a success with order_found = false.
     */
    [[nodiscard]] DeliveryOutcome delivery(int64_t warehouse_id, int64_t carrier_id);

    /// status: "New", "Delivered" or empty for both
    [[nodiscard]] Page orders(
        std::optional<int64_t> warehouse_id,
        std::optional<int64_t> district_id,
        std::optional<int64_t> customer_id,
        const std::string& status,
        int64_t limit, int64_t offset);

    [[nodiscard]] DetailOutcome order_details(
        int64_t warehouse_id, int64_t district_id, int64_t order_id);

    [[nodiscard]] ListOutcome recent_orders(int64_t limit);

    /// total, new, delivered, today, average order value
    [[nodiscard]] DetailOutcome order_statistics(std::optional<int64_t> warehouse_id);

    [[nodiscard]] DeliveryMode delivery_mode() const { return config_.delivery_mode; }

private:
    std::shared_ptr<IQueryExecutor> executor_;
    std::shared_ptr<INewOrderCapability> new_order_;
    TpccConfig config_;
    std::shared_ptr<IEventSink> events_;
};

} // namespace tpccgw
