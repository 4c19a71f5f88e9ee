#pragma once

#include "core/event_sink.hpp"
#include "db/iquery_executor.hpp"
#include "query/filter_query_builder.hpp"
#include "tpcc/outcomes.hpp"
#include "tpcc/tpcc_config.hpp"

#include <memory>
#include <optional>

namespace tpccgw {

/**
 * @brief TPC-C Payment plus payment reporting
 *
 * Payment reads customer, warehouse and district and applies the three
 * balance/ytd updates inside one read-write transaction. The history row
 * is written afterwards as a best-effort mutation.
 */
class PaymentService {
public:
    PaymentService(std::shared_ptr<IQueryExecutor> executor,
                   TpccConfig config,
                   std::shared_ptr<IEventSink> events = nullptr);

    [[nodiscard]] PaymentOutcome execute_payment(const PaymentRequest& request);

    /**
     * @brief Pre-flight checks without writing
     *
     * amount > 0, amount <= max_payment_amount, customer exists, payment does
     * not push the balance past the credit limit, warehouse/district exist.
     */
    [[nodiscard]] PaymentValidation validate_payment(const PaymentRequest& request);

    [[nodiscard]] Page payment_history(
        std::optional<int64_t> warehouse_id,
        std::optional<int64_t> district_id,
        std::optional<int64_t> customer_id,
        int64_t limit, int64_t offset);

    /// Customer record, last 10 payments, count / total / average
    [[nodiscard]] DetailOutcome customer_payment_summary(
        int64_t warehouse_id, int64_t district_id, int64_t customer_id);

    /// Totals (count, amount, average), today's totals, top 5 customers by ytd
    [[nodiscard]] DetailOutcome payment_statistics(std::optional<int64_t> warehouse_id);

    [[nodiscard]] ListOutcome recent_payments(int64_t limit);

    /// Per-day count / total / average over the last `days` days
    [[nodiscard]] ListOutcome payment_trends(int64_t days);

private:
    std::shared_ptr<IQueryExecutor> executor_;
    TpccConfig config_;
    std::shared_ptr<IEventSink> events_;
};

} // namespace tpccgw
