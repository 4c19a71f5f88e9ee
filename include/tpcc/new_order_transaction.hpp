#pragma once

#include "core/event_sink.hpp"
#include "db/iquery_executor.hpp"
#include "tpcc/outcomes.hpp"

#include <memory>

namespace tpccgw {

/**
 * @brief Places a TPC-C order
 *
 * The order service treats order placement as an external capability and
 * only layers region tagging on top of whatever this returns.
 */
class INewOrderCapability {
public:
    virtual ~INewOrderCapability() = default;

    [[nodiscard]] virtual NewOrderOutcome execute(const NewOrderRequest& request) = 0;
};

/**
 * @brief TPC-C New-Order in one read-write transaction
 *
 * Reads warehouse tax, district tax and next order id, customer discount;
 * bumps d_next_o_id; inserts orders and new_order; then per line reads the
 * item, decrements stock (replenishing by 91 when it would fall below 10)
 * and inserts the order_line. An unknown item aborts the whole order.
 */
class NewOrderTransaction : public INewOrderCapability {
public:
    static constexpr int64_t kMaxLines = 15;
    static constexpr int64_t kDistrictsPerWarehouse = 10;

    explicit NewOrderTransaction(std::shared_ptr<IQueryExecutor> executor,
                                 std::shared_ptr<IEventSink> events = nullptr);

    [[nodiscard]] NewOrderOutcome execute(const NewOrderRequest& request) override;

    /// Stock after ordering `quantity` from `current`
    [[nodiscard]] static int64_t replenished_quantity(int64_t current, int64_t quantity);

private:
    std::shared_ptr<IQueryExecutor> executor_;
    std::shared_ptr<IEventSink> events_;
};

} // namespace tpccgw
