#include "tpcc/outcomes.hpp"
#include "core/utils.hpp"

namespace tpccgw {

Json OutcomeStatus::status_json() const {
    Json j = Json::object();
    j["success"] = success;
    if (!success) {
        j["error"] = error;
        j["error_category"] = error_category_to_string(error_category);
    }
    return j;
}

Json PlanTrace::to_json() const {
    Json j = Json::object();
    j["state"] = state;
    j["steps"] = steps;
    return j;
}

std::optional<DeliveryMode> parse_delivery_mode(std::string_view name) {
    if (utils::iequals(name, "apply")) return DeliveryMode::APPLY;
    if (utils::iequals(name, "simulate")) return DeliveryMode::SIMULATE;
    return std::nullopt;
}

Json PaymentOutcome::to_json() const {
    Json j = status_json();
    if (!plan.state.empty()) j["plan"] = plan.to_json();
    if (!success) return j;
    j["warehouse_id"] = warehouse_id;
    j["district_id"] = district_id;
    j["customer_id"] = customer_id;
    j["amount"] = amount;
    j["customer_name"] = customer_name;
    j["warehouse_name"] = warehouse_name;
    j["district_name"] = district_name;
    j["credit"] = credit;
    j["previous_balance"] = previous_balance;
    j["new_balance"] = new_balance;
    j["ytd_payment"] = ytd_payment;
    j["payment_cnt"] = payment_cnt;
    j["warehouse_ytd"] = warehouse_ytd;
    j["district_ytd"] = district_ytd;
    j["history_recorded"] = history_recorded;
    return j;
}

Json PaymentValidation::to_json() const {
    Json j = Json::object();
    j["valid"] = valid;
    j["errors"] = errors;
    j["customer"] = customer ? json::from_row(*customer) : Json(nullptr);
    j["district"] = district ? json::from_row(*district) : Json(nullptr);
    return j;
}

Json OrderStatusOutcome::to_json() const {
    Json j = status_json();
    if (!plan.state.empty()) j["plan"] = plan.to_json();
    if (!success) return j;
    j["customer"] = json::from_row(customer);
    j["order"] = json::from_row(order);
    j["order_lines"] = json::from_rows(order_lines);
    return j;
}

Json StockLevelOutcome::to_json() const {
    Json j = status_json();
    if (!success) return j;
    j["warehouse_id"] = warehouse_id;
    j["district_id"] = district_id;
    j["threshold"] = threshold;
    j["low_stock_count"] = low_stock_count;
    j["method"] = stock_level_method_to_string(method);
    if (method == StockLevelMethod::RECENT_ORDERS) {
        j["window"] = window;
    } else {
        j["fallback_reason"] = fallback_reason;
    }
    return j;
}

Json DeliveryOutcome::to_json() const {
    Json j = status_json();
    if (!plan.state.empty()) j["plan"] = plan.to_json();
    if (!success) return j;
    j["mode"] = delivery_mode_to_string(mode);
    j["warehouse_id"] = warehouse_id;
    j["carrier_id"] = carrier_id;
    j["order_found"] = order_found;
    if (order_found) {
        j["district_id"] = district_id;
        j["order_id"] = order_id;
        j["customer_id"] = customer_id;
        j["line_count"] = line_count;
        j["amount"] = amount;
        j["applied"] = applied;
    }
    return j;
}

Json NewOrderOutcome::to_json() const {
    Json j = status_json();
    if (!plan.state.empty()) j["plan"] = plan.to_json();
    if (!success) return j;
    j["warehouse_id"] = warehouse_id;
    j["district_id"] = district_id;
    j["customer_id"] = customer_id;
    j["order_id"] = order_id;
    j["entry_date"] = entry_date;
    j["total_amount"] = total_amount;
    j["warehouse_tax"] = warehouse_tax;
    j["district_tax"] = district_tax;
    j["customer_discount"] = customer_discount;

    Json lines_json = Json::array();
    for (const auto& l : lines) {
        Json lj = Json::object();
        lj["item_id"] = l.item_id;
        lj["supply_warehouse_id"] = l.supply_warehouse_id;
        lj["quantity"] = l.quantity;
        lj["item_name"] = l.item_name;
        lj["item_price"] = l.item_price;
        lj["amount"] = l.amount;
        lj["stock_quantity"] = l.stock_quantity;
        lj["brand_generic"] = l.brand_generic_original ? "B" : "G";
        lines_json.push_back(std::move(lj));
    }
    j["lines"] = std::move(lines_json);
    j["region_tagged"] = region_tagged;
    if (region_tagged) j["region"] = region;
    return j;
}

Json DetailOutcome::to_json(std::string_view record_key) const {
    Json j = status_json();
    if (!success) return j;
    j[std::string(record_key)] = json::from_row(record);
    for (const auto& [name, rows] : collections) {
        j[name] = json::from_rows(rows);
    }
    return j;
}

Json ListOutcome::to_json(std::string_view rows_key) const {
    Json j = status_json();
    j[std::string(rows_key)] = json::from_rows(rows);
    return j;
}

Json MetricsOutcome::to_json() const {
    Json j = status_json();
    j["provider"] = provider;
    j["metrics"] = json::from_row(metrics);
    if (!warnings.empty()) j["warnings"] = warnings;
    return j;
}

Json page_to_json(const Page& page, std::string_view items_key) {
    Json j = Json::object();
    j["success"] = page.success;
    if (!page.success) {
        j["error"] = page.error;
        j["error_category"] = error_category_to_string(page.error_category);
    }
    j[std::string(items_key)] = json::from_rows(page.items);
    j["total_count"] = page.total_count;
    j["limit"] = page.limit;
    j["offset"] = page.offset;
    j["has_next"] = page.has_next;
    j["has_prev"] = page.has_prev;
    return j;
}

} // namespace tpccgw
