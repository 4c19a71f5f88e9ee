#include "tpcc/analytics_service.hpp"

#include <array>
#include <format>
#include <utility>

namespace tpccgw {

namespace {

constexpr std::string_view kComponent = "analytics";

// metric name -> table counted
constexpr std::array<std::pair<const char*, const char*>, 4> kCountedTables{{
    {"total_warehouses", "warehouse"},
    {"total_customers", "customer"},
    {"total_orders", "orders"},
    {"total_items", "item"},
}};

} // anonymous namespace

Json ConnectionCheck::to_json() const {
    Json j = status_json();
    j["provider"] = provider;
    if (!message.empty()) j["message"] = message;
    return j;
}

AnalyticsService::AnalyticsService(std::shared_ptr<IQueryExecutor> executor,
                                   std::shared_ptr<IEventSink> events)
    : executor_(std::move(executor)),
      events_(sink_or_null(std::move(events))) {}

ConnectionCheck AnalyticsService::test_connection() {
    ConnectionCheck out;
    out.provider = executor_->provider_name();
    if (executor_->test_connection()) {
        out.success = true;
        out.message = "Connection successful";
    } else {
        out.fail(ErrorCategory::CONNECTIVITY, "Connection failed");
    }
    return out;
}

MetricsOutcome AnalyticsService::dashboard_metrics() {
    MetricsOutcome out;
    out.provider = executor_->provider_name();

    for (const auto& [metric, _] : kCountedTables) {
        out.metrics.set(metric, int64_t{0});
    }

    if (!executor_->test_connection()) {
        out.fail(ErrorCategory::CONNECTIVITY, "Database connection failed");
        return out;
    }

    for (const auto& [metric, table] : kCountedTables) {
        const auto r = executor_->execute_query(
            Query::plain(std::format("SELECT COUNT(*) AS count FROM {}", table)));
        if (!r.success) {
            auto warning = std::format("Failed to get {}: {}", metric, r.error_message);
            events_->warn(kComponent, warning);
            out.warnings.push_back(std::move(warning));
            continue;
        }
        out.metrics.set(metric, r.empty() ? int64_t{0} : r.first()->get_int("count").value_or(0));
    }

    out.success = true;
    return out;
}

} // namespace tpccgw
