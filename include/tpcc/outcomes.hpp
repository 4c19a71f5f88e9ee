#pragma once

#include "core/error.hpp"
#include "core/json.hpp"
#include "core/types.hpp"
#include "query/filter_query_builder.hpp"

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tpccgw {

/// Money is carried as double and rounded to cents at every computed step
[[nodiscard]] inline double round_cents(double amount) {
    return std::round(amount * 100.0) / 100.0;
}

// ============================================================================
// Common Status
// ============================================================================

/**
 * @brief success / error fields every outcome carries
 *
 * Callers check success first; the remaining fields are meaningful only on
 * success unless documented otherwise.
 */
struct OutcomeStatus {
    bool success = false;
    ErrorCategory error_category = ErrorCategory::NONE;
    std::string error;

    void fail(ErrorCategory category, std::string message) {
        success = false;
        error_category = category;
        error = std::move(message);
    }

    /// {"success": ...} plus "error" / "error_category" on failure
    [[nodiscard]] Json status_json() const;
};

/**
 * @brief Final state and recorded steps of a protocol's TransactionPlan
 */
struct PlanTrace {
    std::string state;
    std::vector<std::string> steps;

    [[nodiscard]] Json to_json() const;
};

// ============================================================================
// Payment
// ============================================================================

struct PaymentRequest {
    int64_t warehouse_id = 0;
    int64_t district_id = 0;
    int64_t customer_id = 0;
    double amount = 0.0;

    // Remote customer (TPC-C 2.5.1.2); defaults to the paying warehouse/district
    std::optional<int64_t> customer_warehouse_id;
    std::optional<int64_t> customer_district_id;

    [[nodiscard]] int64_t c_w_id() const { return customer_warehouse_id.value_or(warehouse_id); }
    [[nodiscard]] int64_t c_d_id() const { return customer_district_id.value_or(district_id); }
};

struct PaymentOutcome : OutcomeStatus {
    PlanTrace plan;

    int64_t warehouse_id = 0;
    int64_t district_id = 0;
    int64_t customer_id = 0;
    double amount = 0.0;

    std::string customer_name;
    std::string warehouse_name;
    std::string district_name;
    std::string credit;

    double previous_balance = 0.0;
    double new_balance = 0.0;
    double ytd_payment = 0.0;
    int64_t payment_cnt = 0;
    double warehouse_ytd = 0.0;
    double district_ytd = 0.0;

    bool history_recorded = false;  // best-effort side write

    [[nodiscard]] Json to_json() const;
};

struct PaymentValidation {
    bool valid = false;
    std::vector<std::string> errors;
    std::optional<ResultRow> customer;
    std::optional<ResultRow> district;

    [[nodiscard]] Json to_json() const;
};

// ============================================================================
// Order-Status
// ============================================================================

struct OrderStatusOutcome : OutcomeStatus {
    PlanTrace plan;

    ResultRow customer;
    ResultRow order;
    ResultSet order_lines;

    [[nodiscard]] Json to_json() const;
};

// ============================================================================
// Stock-Level
// ============================================================================

enum class StockLevelMethod {
    RECENT_ORDERS,          // district's last N orders
    WAREHOUSE_FALLBACK      // whole-warehouse approximation
};

[[nodiscard]] inline const char* stock_level_method_to_string(StockLevelMethod m) {
    return m == StockLevelMethod::RECENT_ORDERS ? "recent_orders" : "warehouse_fallback";
}

struct StockLevelOutcome : OutcomeStatus {
    int64_t warehouse_id = 0;
    int64_t district_id = 0;
    int64_t threshold = 0;
    int64_t low_stock_count = 0;
    int64_t window = 0;
    StockLevelMethod method = StockLevelMethod::RECENT_ORDERS;
    std::string fallback_reason;

    [[nodiscard]] Json to_json() const;
};

// ============================================================================
// Delivery
// ============================================================================

enum class DeliveryMode {
    APPLY,          // perform the delivery writes
    SIMULATE        // compute and report only
};

[[nodiscard]] inline const char* delivery_mode_to_string(DeliveryMode m) {
    return m == DeliveryMode::APPLY ? "apply" : "simulate";
}

/// "apply" / "simulate"; nullopt for anything else
[[nodiscard]] std::optional<DeliveryMode> parse_delivery_mode(std::string_view name);

struct DeliveryOutcome : OutcomeStatus {
    PlanTrace plan;

    DeliveryMode mode = DeliveryMode::APPLY;
    int64_t warehouse_id = 0;
    int64_t carrier_id = 0;

    bool order_found = false;   // false: nothing pending, still a success
    int64_t district_id = 0;
    int64_t order_id = 0;
    int64_t customer_id = 0;
    int64_t line_count = 0;
    double amount = 0.0;
    bool applied = false;       // writes committed (APPLY only)

    [[nodiscard]] Json to_json() const;
};

// ============================================================================
// New-Order
// ============================================================================

struct NewOrderLine {
    int64_t item_id = 0;
    int64_t supply_warehouse_id = 0;    // 0: home warehouse
    int64_t quantity = 0;
};

struct NewOrderRequest {
    int64_t warehouse_id = 0;
    int64_t district_id = 0;
    int64_t customer_id = 0;
    std::vector<NewOrderLine> lines;
};

struct NewOrderLineResult {
    int64_t item_id = 0;
    int64_t supply_warehouse_id = 0;
    int64_t quantity = 0;
    std::string item_name;
    double item_price = 0.0;
    double amount = 0.0;
    int64_t stock_quantity = 0;     // after the decrement
    bool brand_generic_original = false;
};

struct NewOrderOutcome : OutcomeStatus {
    PlanTrace plan;

    int64_t warehouse_id = 0;
    int64_t district_id = 0;
    int64_t customer_id = 0;
    int64_t order_id = 0;
    std::string entry_date;
    double total_amount = 0.0;
    double warehouse_tax = 0.0;
    double district_tax = 0.0;
    double customer_discount = 0.0;
    std::vector<NewOrderLineResult> lines;

    // Filled by the order service after the capability returns
    bool region_tagged = false;
    std::string region;

    [[nodiscard]] Json to_json() const;
};

// ============================================================================
// Reporting
// ============================================================================

/**
 * @brief One primary record plus named nested lists
 */
struct DetailOutcome : OutcomeStatus {
    ResultRow record;
    std::vector<std::pair<std::string, ResultSet>> collections;

    [[nodiscard]] Json to_json(std::string_view record_key) const;
};

struct ListOutcome : OutcomeStatus {
    ResultSet rows;

    [[nodiscard]] Json to_json(std::string_view rows_key) const;
};

/**
 * @brief Named scalar metrics; individual metrics may have degraded to 0
 */
struct MetricsOutcome : OutcomeStatus {
    std::string provider;
    ResultRow metrics;
    std::vector<std::string> warnings;

    [[nodiscard]] Json to_json() const;
};

/// {items_key: [...], total_count, limit, offset, has_next, has_prev}
[[nodiscard]] Json page_to_json(const Page& page, std::string_view items_key);

} // namespace tpccgw
