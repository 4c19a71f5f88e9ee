#pragma once

#include "core/event_sink.hpp"
#include "db/iquery_executor.hpp"
#include "tpcc/outcomes.hpp"

#include <memory>
#include <string>

namespace tpccgw {

struct ConnectionCheck : OutcomeStatus {
    std::string provider;
    std::string message;

    [[nodiscard]] Json to_json() const;
};

/**
 * @brief Connectivity check and dashboard counters
 */
class AnalyticsService {
public:
    explicit AnalyticsService(std::shared_ptr<IQueryExecutor> executor,
                              std::shared_ptr<IEventSink> events = nullptr);

    [[nodiscard]] ConnectionCheck test_connection();

    /**
     * @brief Warehouse, customer, order and item counts
     *
     * A metric whose query fails is reported as 0 with a warning; only a
     * failed connectivity check fails the whole call.
     */
    [[nodiscard]] MetricsOutcome dashboard_metrics();

private:
    std::shared_ptr<IQueryExecutor> executor_;
    std::shared_ptr<IEventSink> events_;
};

} // namespace tpccgw
