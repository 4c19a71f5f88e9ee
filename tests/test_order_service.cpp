#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "tpcc/order_service.hpp"
#include "tpcc/new_order_transaction.hpp"
#include "mocks/mock_db_connection.hpp"

using namespace tpccgw;
using namespace tpccgw::testing;
using Catch::Approx;

namespace {

/// Capability returning a canned outcome
class FixedNewOrder : public INewOrderCapability {
public:
    explicit FixedNewOrder(NewOrderOutcome outcome) : outcome_(std::move(outcome)) {}

    NewOrderOutcome execute(const NewOrderRequest& /*request*/) override {
        ++calls;
        return outcome_;
    }

    int calls = 0;

private:
    NewOrderOutcome outcome_;
};

NewOrderOutcome placed_order() {
    NewOrderOutcome out;
    out.success = true;
    out.warehouse_id = 1;
    out.district_id = 2;
    out.customer_id = 3;
    out.order_id = 3001;
    return out;
}

void script_new_order(Script& s) {
    s.rows("SELECT w_tax FROM warehouse", {"w_tax"}, {{"0.1000"}});
    s.rows("SELECT d_tax, d_next_o_id", {"d_tax", "d_next_o_id"}, {{"0.0500", "3001"}});
    s.rows("SELECT c_discount", {"c_discount", "c_last", "c_credit"}, {{"0.1000", "BARBAR", "GC"}});
    s.affects("UPDATE district", 1);
    s.affects("INSERT INTO orders", 1);
    s.affects("INSERT INTO new_order", 1);
    s.rows("FROM stock", {"s_quantity", "s_data", "dist_info"},
           {{"15", "stock ORIGINAL data", "dist-info-02"}});
    s.affects("UPDATE stock", 1);
    s.affects("INSERT INTO order_line", 1);
    s.affects("UPDATE orders SET region_created", 1);
}

void script_item(Script& s, int times = -1) {
    s.rows("FROM item WHERE i_id", {"i_price", "i_name", "i_data"},
           {{"10.00", "Widget", "item ORIGINAL"}}, times);
}

NewOrderRequest two_line_order() {
    NewOrderRequest req;
    req.warehouse_id = 1;
    req.district_id = 2;
    req.customer_id = 3;
    req.lines = {{101, 0, 3}, {102, 0, 10}};
    return req;
}

TpccConfig region_config() {
    TpccConfig c;
    c.region_name = "us-east1";
    return c;
}

} // anonymous namespace

TEST_CASE("New-Order protocol", "[tpcc][new_order]") {
    auto script = std::make_shared<Script>();
    auto events = std::make_shared<RecordingEventSink>();
    auto executor = make_executor(script, RetryPolicy{}, SqlDialect::postgresql(), events);
    auto capability = std::make_shared<NewOrderTransaction>(executor, events);
    OrderService service(executor, capability, region_config(), events);

    SECTION("Order is placed, stock decremented and tagged") {
        script_new_order(*script);
        script_item(*script);

        const auto out = service.execute_new_order(two_line_order());

        REQUIRE(out.success);
        REQUIRE(out.order_id == 3001);
        REQUIRE(out.lines.size() == 2);
        REQUIRE(out.lines[0].amount == Approx(30.0));
        REQUIRE(out.lines[0].stock_quantity == 12);
        REQUIRE(out.lines[1].amount == Approx(100.0));
        REQUIRE(out.lines[1].stock_quantity == 96);
        REQUIRE(out.lines[0].brand_generic_original);
        REQUIRE(out.total_amount == Approx(134.55));
        REQUIRE(out.plan.state == "WRITES_COMPLETE");
        REQUIRE(out.plan.steps.back() == "order line 2");
        REQUIRE_FALSE(out.entry_date.empty());
        REQUIRE(out.region_tagged);
        REQUIRE(out.region == "us-east1");

        const auto* bump = script->find("UPDATE district SET d_next_o_id");
        REQUIRE(bump->params.at_position(1).value == Value{int64_t{3002}});

        const auto* stock = script->find("FROM stock");
        REQUIRE(stock->sql.find("s_dist_02 AS dist_info") != std::string::npos);

        REQUIRE(script->count("INSERT INTO order_line") == 2);
        REQUIRE(script->index_of("INSERT INTO order_line") < script->index_of("COMMIT"));
        REQUIRE(script->index_of("COMMIT") < script->index_of("region_created"));
    }

    SECTION("Region tag uses the committed order key") {
        script_new_order(*script);
        script_item(*script);
        REQUIRE(service.execute_new_order(two_line_order()).success);

        const auto* tag = script->find("UPDATE orders SET region_created");
        REQUIRE(tag->params.at_position(1).value == Value{std::string("us-east1")});
        REQUIRE(tag->params.at_position(2).value == Value{int64_t{3001}});
    }

    SECTION("Unknown item rolls back the whole order") {
        script_new_order(*script);
        script_item(*script, 1);
        script->rows("FROM item WHERE i_id", {"i_price"}, {});

        const auto out = service.execute_new_order(two_line_order());

        REQUIRE_FALSE(out.success);
        REQUIRE(out.error_category == ErrorCategory::NOT_FOUND);
        REQUIRE(out.error == "Item 102 not found");
        REQUIRE(out.lines.empty());
        REQUIRE(out.order_id == 0);
        REQUIRE(script->executed("INSERT INTO orders"));
        REQUIRE(script->executed("ROLLBACK"));
        REQUIRE_FALSE(script->executed("COMMIT"));
        REQUIRE_FALSE(script->executed("region_created"));
    }

    SECTION("Remote supply warehouse clears all_local") {
        script_new_order(*script);
        script_item(*script);
        auto req = two_line_order();
        req.lines[1].supply_warehouse_id = 4;

        const auto out = service.execute_new_order(req);
        REQUIRE(out.success);
        REQUIRE(out.lines[1].supply_warehouse_id == 4);

        const auto* order = script->find("INSERT INTO orders");
        // o_id, d_id, w_id, c_id, entry_d, ol_cnt, all_local
        REQUIRE(order->params.at_position(7).value == Value{int64_t{0}});
        REQUIRE(order->params.at_position(5).type == ParamType::TIMESTAMP);
    }

    SECTION("Request validation") {
        NewOrderRequest empty = two_line_order();
        empty.lines.clear();
        REQUIRE(service.execute_new_order(empty).error_category == ErrorCategory::INVALID_INPUT);

        NewOrderRequest too_many = two_line_order();
        too_many.lines.assign(16, NewOrderLine{101, 0, 1});
        REQUIRE(service.execute_new_order(too_many).error_category == ErrorCategory::INVALID_INPUT);

        NewOrderRequest bad_district = two_line_order();
        bad_district.district_id = 11;
        REQUIRE(service.execute_new_order(bad_district).error_category == ErrorCategory::INVALID_INPUT);

        NewOrderRequest zero_qty = two_line_order();
        zero_qty.lines[0].quantity = 0;
        REQUIRE(service.execute_new_order(zero_qty).error_category == ErrorCategory::INVALID_INPUT);

        REQUIRE(script->log.empty());
    }

    SECTION("Stock replenishment rule") {
        REQUIRE(NewOrderTransaction::replenished_quantity(50, 5) == 45);
        REQUIRE(NewOrderTransaction::replenished_quantity(15, 5) == 10);
        REQUIRE(NewOrderTransaction::replenished_quantity(14, 5) == 100);
    }
}

TEST_CASE("New-Order region tagging", "[tpcc][new_order]") {
    auto script = std::make_shared<Script>();
    auto events = std::make_shared<RecordingEventSink>();
    auto executor = make_executor(script, RetryPolicy{}, SqlDialect::postgresql(), events);

    SECTION("Tag failure never fails the order") {
        script->fail("region_created", "42703", "column \"region_created\" does not exist");
        auto fixed = std::make_shared<FixedNewOrder>(placed_order());
        OrderService service(executor, fixed, region_config(), events);

        const auto out = service.execute_new_order(two_line_order());
        REQUIRE(out.success);
        REQUIRE_FALSE(out.region_tagged);
        REQUIRE(out.region.empty());
        REQUIRE(events->contains("region tag not applied"));
    }

    SECTION("No matching row leaves the order untagged") {
        script->affects("region_created", 0);
        auto fixed = std::make_shared<FixedNewOrder>(placed_order());
        OrderService service(executor, fixed, region_config(), events);

        const auto out = service.execute_new_order(two_line_order());
        REQUIRE(out.success);
        REQUIRE_FALSE(out.region_tagged);
    }

    SECTION("Failed placement is not tagged") {
        NewOrderOutcome failed;
        failed.fail(ErrorCategory::NOT_FOUND, "Item 9 not found");
        auto fixed = std::make_shared<FixedNewOrder>(failed);
        OrderService service(executor, fixed, region_config(), events);

        const auto out = service.execute_new_order(two_line_order());
        REQUIRE_FALSE(out.success);
        REQUIRE(fixed->calls == 1);
        REQUIRE(script->log.empty());
    }

    SECTION("Missing capability") {
        OrderService service(executor, nullptr, region_config(), events);
        const auto out = service.execute_new_order(two_line_order());
        REQUIRE_FALSE(out.success);
        REQUIRE(out.error_category == ErrorCategory::INTERNAL_ERROR);
    }
}

TEST_CASE("Order-Status protocol", "[tpcc][order_status]") {
    auto script = std::make_shared<Script>();
    auto executor = make_executor(script);
    OrderService service(executor, nullptr, TpccConfig{});

    SECTION("Customer, latest order and its lines") {
        script->rows("c_middle, c_last, c_balance FROM customer",
                     {"c_id", "c_first", "c_middle", "c_last", "c_balance"},
                     {{"3", "Alice", "OE", "BARBAR", "-10.00"}});
        script->rows("ORDER BY o_entry_d DESC, o_id DESC",
                     {"o_id", "o_entry_d", "o_carrier_id", "o_ol_cnt"},
                     {{"3001", "2024-05-01T12:00:00+00:00", std::nullopt, "2"}});
        script->rows("FROM order_line",
                     {"ol_i_id", "ol_supply_w_id", "ol_quantity", "ol_amount", "ol_delivery_d"},
                     {{"101", "1", "3", "30.00", std::nullopt},
                      {"102", "1", "10", "100.00", std::nullopt}});

        const auto out = service.order_status(1, 2, 3);
        REQUIRE(out.success);
        REQUIRE(out.customer.get_string("c_last") == "BARBAR");
        REQUIRE(out.order.get_int("o_id") == 3001);
        REQUIRE(is_null(*out.order.find("o_carrier_id")));
        REQUIRE(out.order_lines.size() == 2);

        const auto* lines = script->find("FROM order_line");
        REQUIRE(lines->params.at_position(3).value == Value{int64_t{3001}});
        REQUIRE(script->log.front().sql == "BEGIN ISOLATION LEVEL REPEATABLE READ READ ONLY");

        const auto j = out.to_json();
        REQUIRE(j["order_lines"].size() == 2);
        REQUIRE(j["order"]["o_carrier_id"].is_null());
    }

    SECTION("Repeated calls on unchanged data read the same thing") {
        script->rows("c_middle, c_last, c_balance FROM customer",
                     {"c_id", "c_first", "c_middle", "c_last", "c_balance"},
                     {{"3", "Alice", "OE", "BARBAR", "-10.00"}});
        script->rows("ORDER BY o_entry_d DESC, o_id DESC",
                     {"o_id", "o_entry_d", "o_carrier_id", "o_ol_cnt"},
                     {{"3001", "2024-05-01T12:00:00+00:00", "4", "1"}});
        script->rows("FROM order_line",
                     {"ol_i_id", "ol_supply_w_id", "ol_quantity", "ol_amount", "ol_delivery_d"},
                     {{"101", "1", "3", "30.00", "2024-05-02T08:00:00+00:00"}});

        const auto first = service.order_status(1, 2, 3);
        const auto writes_after_first = script->count("UPDATE") + script->count("INSERT")
                                      + script->count("DELETE");
        const auto second = service.order_status(1, 2, 3);

        REQUIRE(first.success);
        REQUIRE(second.success);
        REQUIRE(first.to_json() == second.to_json());
        REQUIRE(writes_after_first == 0);
        REQUIRE(script->count("UPDATE") + script->count("INSERT") + script->count("DELETE") == 0);
        REQUIRE(first.plan.state == "READS_COMPLETE");
        REQUIRE(first.plan.steps.size() == 3);
    }

    SECTION("Customer without orders") {
        script->rows("c_middle, c_last, c_balance FROM customer", {"c_id"}, {{"3"}});
        script->rows("ORDER BY o_entry_d DESC, o_id DESC", {"o_id"}, {});

        const auto out = service.order_status(1, 2, 3);
        REQUIRE_FALSE(out.success);
        REQUIRE(out.error_category == ErrorCategory::NOT_FOUND);
        REQUIRE(out.error == "Order for customer 1/2/3 not found");
        REQUIRE_FALSE(script->executed("FROM order_line"));
    }

    SECTION("Unknown customer") {
        const auto out = service.order_status(1, 2, 99);
        REQUIRE_FALSE(out.success);
        REQUIRE(out.error == "Customer 1/2/99 not found");
    }

    SECTION("Read failure is not reported as missing") {
        script->fail("FROM customer", "42P01", "relation \"customer\" does not exist");
        const auto out = service.order_status(1, 2, 3);
        REQUIRE_FALSE(out.success);
        REQUIRE(out.error_category == ErrorCategory::EXECUTION_ERROR);
        REQUIRE(out.error.starts_with("Customer read failed"));
    }
}

TEST_CASE("Delivery protocol", "[tpcc][delivery]") {
    auto script = std::make_shared<Script>();
    auto events = std::make_shared<RecordingEventSink>();
    auto executor = make_executor(script, RetryPolicy{}, SqlDialect::postgresql(), events);

    auto script_pending = [&] {
        script->rows("SELECT no_d_id, no_o_id", {"no_d_id", "no_o_id"}, {{"3", "2101"}});
        script->rows("SELECT o_c_id FROM orders", {"o_c_id"}, {{"7"}});
        script->rows("AS line_count", {"line_count", "amount"}, {{"5", "250.50"}});
    };

    SECTION("Apply mode performs every write in one transaction") {
        script_pending();
        script->affects("DELETE FROM new_order", 1);
        OrderService service(executor, nullptr, TpccConfig{}, events);

        const auto out = service.delivery(1, 4);
        REQUIRE(out.success);
        REQUIRE(out.mode == DeliveryMode::APPLY);
        REQUIRE(out.order_found);
        REQUIRE(out.applied);
        REQUIRE(out.district_id == 3);
        REQUIRE(out.order_id == 2101);
        REQUIRE(out.customer_id == 7);
        REQUIRE(out.line_count == 5);
        REQUIRE(out.amount == Approx(250.50));

        REQUIRE(script->log.front().sql == "BEGIN ISOLATION LEVEL SERIALIZABLE");
        const int del = script->index_of("DELETE FROM new_order");
        REQUIRE(del < script->index_of("SET o_carrier_id"));
        REQUIRE(script->index_of("SET o_carrier_id") < script->index_of("SET ol_delivery_d"));
        REQUIRE(script->index_of("SET ol_delivery_d") < script->index_of("c_delivery_cnt"));
        REQUIRE(script->index_of("c_delivery_cnt") < script->index_of("COMMIT"));

        const auto* carrier = script->find("SET o_carrier_id");
        REQUIRE(carrier->params.at_position(1).value == Value{int64_t{4}});
        const auto* credit = script->find("c_delivery_cnt");
        REQUIRE(credit->params.at_position(1).value == Value{250.50});

        REQUIRE(out.plan.state == "WRITES_COMPLETE");
        REQUIRE(out.plan.steps.back() == "credit customer");
    }

    SECTION("Simulate mode only reads") {
        script_pending();
        TpccConfig config;
        config.delivery_mode = DeliveryMode::SIMULATE;
        OrderService service(executor, nullptr, config, events);

        const auto out = service.delivery(1, 4);
        REQUIRE(out.success);
        REQUIRE(out.mode == DeliveryMode::SIMULATE);
        REQUIRE(out.order_found);
        REQUIRE_FALSE(out.applied);
        REQUIRE(out.amount == Approx(250.50));
        REQUIRE(script->log.front().sql == "BEGIN ISOLATION LEVEL REPEATABLE READ READ ONLY");
        REQUIRE_FALSE(script->executed("DELETE"));
        REQUIRE_FALSE(script->executed("UPDATE"));
        REQUIRE(out.to_json()["mode"] == "simulate");
    }

    SECTION("Empty queue is a success with nothing delivered") {
        script->rows("SELECT no_d_id, no_o_id", {"no_d_id", "no_o_id"}, {});
        OrderService service(executor, nullptr, TpccConfig{}, events);

        const auto out = service.delivery(1, 4);
        REQUIRE(out.success);
        REQUIRE_FALSE(out.order_found);
        REQUIRE_FALSE(out.applied);
        REQUIRE_FALSE(script->executed("DELETE"));
        REQUIRE_FALSE(out.to_json().contains("order_id"));
    }

    SECTION("Order taken by a concurrent delivery is retried then reported") {
        script_pending();
        script->affects("DELETE FROM new_order", 0);
        OrderService service(executor, nullptr, TpccConfig{}, events);

        const auto out = service.delivery(1, 4);
        REQUIRE_FALSE(out.success);
        REQUIRE(out.error_category == ErrorCategory::TRANSIENT);
        REQUIRE_FALSE(out.applied);
        REQUIRE(script->count("DELETE FROM new_order") == 3);
        REQUIRE_FALSE(script->executed("SET o_carrier_id"));
        REQUIRE(out.plan.state == "ABORTED");
    }

    SECTION("Carrier must be 1..10") {
        OrderService service(executor, nullptr, TpccConfig{}, events);
        REQUIRE(service.delivery(1, 0).error_category == ErrorCategory::INVALID_INPUT);
        REQUIRE(service.delivery(1, 11).error_category == ErrorCategory::INVALID_INPUT);
        REQUIRE(script->log.empty());
    }
}

TEST_CASE("Order reporting", "[tpcc][orders]") {
    auto script = std::make_shared<Script>();
    auto executor = make_executor(script);
    OrderService service(executor, nullptr, TpccConfig{});

    SECTION("Status filter selects the new_order predicate") {
        script->rows("COUNT(*) AS total_count", {"total_count"}, {{"2"}});

        auto page = service.orders(1, std::nullopt, std::nullopt, "New", 10, 0);
        REQUIRE(page.success);
        REQUIRE(page.total_count == 2);
        REQUIRE(script->executed("WHERE o.o_w_id = $1 AND no.no_o_id IS NOT NULL"));

        page = service.orders(std::nullopt, std::nullopt, std::nullopt, "delivered", 10, 0);
        REQUIRE(page.success);
        REQUIRE(script->executed("WHERE no.no_o_id IS NULL"));
    }

    SECTION("Unknown status is rejected") {
        const auto page = service.orders(1, std::nullopt, std::nullopt, "shipped", 10, 0);
        REQUIRE_FALSE(page.success);
        REQUIRE(page.error_category == ErrorCategory::INVALID_INPUT);
        REQUIRE(script->log.empty());
    }

    SECTION("Order details with line total") {
        script->rows("WHERE o.o_w_id = $1 AND o.o_d_id = $2 AND o.o_id = $3",
                     {"o_id", "status"}, {{"3001", "New"}});
        script->rows("FROM order_line ol", {"ol_number", "ol_amount"},
                     {{"1", "30.00"}, {"2", "100.25"}});

        const auto out = service.order_details(1, 2, 3001);
        REQUIRE(out.success);
        REQUIRE(*out.record.get_double("total_amount") == Approx(130.25));
        REQUIRE(out.collections[0].first == "order_lines");
        REQUIRE(out.collections[0].second.size() == 2);
    }

    SECTION("Unknown order") {
        const auto out = service.order_details(1, 2, 9999);
        REQUIRE_FALSE(out.success);
        REQUIRE(out.error_category == ErrorCategory::NOT_FOUND);
        REQUIRE(out.error == "Order not found");
    }

    SECTION("Statistics derive delivered orders") {
        script->rows("AS total_orders", {"total_orders"}, {{"10"}});
        script->rows("AS new_orders", {"new_orders"}, {{"4"}});
        script->rows("AS orders_today", {"orders_today"}, {{"2"}});
        script->rows("AS avg_order_value", {"avg_order_value"}, {{"123.456"}});

        const auto out = service.order_statistics(std::nullopt);
        REQUIRE(out.success);
        REQUIRE(out.record.get_int("total_orders") == 10);
        REQUIRE(out.record.get_int("new_orders") == 4);
        REQUIRE(out.record.get_int("delivered_orders") == 6);
        REQUIRE(out.record.get_int("orders_today") == 2);
        REQUIRE(*out.record.get_double("avg_order_value") == Approx(123.46));
    }

    SECTION("Recent orders") {
        script->rows("LIMIT $1", {"o_id", "status"}, {{"1", "Delivered"}});
        const auto out = service.recent_orders(5);
        REQUIRE(out.success);
        REQUIRE(out.rows.size() == 1);
    }
}
