#include "tpcc/order_service.hpp"
#include "tpcc/protocol_support.hpp"
#include "tpcc/transaction_plan.hpp"
#include "core/utils.hpp"

#include <format>

namespace tpccgw {

namespace {

constexpr std::string_view kComponent = "orders";

constexpr const char* kOrderStatusExpr =
    "CASE WHEN no.no_o_id IS NOT NULL THEN 'New' ELSE 'Delivered' END AS status";

} // anonymous namespace

OrderService::OrderService(std::shared_ptr<IQueryExecutor> executor,
                           std::shared_ptr<INewOrderCapability> new_order,
                           TpccConfig config,
                           std::shared_ptr<IEventSink> events)
    : executor_(std::move(executor)),
      new_order_(std::move(new_order)),
      config_(std::move(config)),
      events_(sink_or_null(std::move(events))) {}

// ============================================================================
// New-Order
// ============================================================================

NewOrderOutcome OrderService::execute_new_order(const NewOrderRequest& request) {
    if (!new_order_) {
        NewOrderOutcome out;
        out.fail(ErrorCategory::INTERNAL_ERROR, "No New-Order capability configured");
        return out;
    }

    auto out = new_order_->execute(request);
    if (!out.success) return out;

    const auto tag = executor_->execute_dml(Query::named(
        "UPDATE orders SET region_created = @region "
        "WHERE o_id = @o_id AND o_d_id = @d_id AND o_w_id = @w_id"),
        NamedParams{}.set("region", config_.region_name)
                     .set("o_id", out.order_id)
                     .set("d_id", out.district_id)
                     .set("w_id", out.warehouse_id));

    if (tag.success && tag.affected_rows > 0) {
        out.region_tagged = true;
        out.region = config_.region_name;
    } else {
        events_->warn(kComponent, std::format("Order {} placed but region tag not applied: {}",
            out.order_id, tag.success ? "no matching row" : tag.error_message));
    }
    return out;
}

// ============================================================================
// Order-Status
// ============================================================================

OrderStatusOutcome OrderService::order_status(
    int64_t warehouse_id, int64_t district_id, int64_t customer_id) {

    OrderStatusOutcome out;
    TransactionPlan plan("order_status");

    NamedParams customer_key;
    customer_key.set("w_id", warehouse_id).set("d_id", district_id).set("c_id", customer_id);

    const auto txn = executor_->run_in_transaction([&](ITransactionContext& ctx) {
        plan.reset();
        out = OrderStatusOutcome{};

        const auto customer = ctx.query(Query::named(
            "SELECT c_id, c_first, c_middle, c_last, c_balance FROM customer "
            "WHERE c_w_id = @w_id AND c_d_id = @d_id AND c_id = @c_id"), customer_key);
        if (!customer.success) {
            return detail::abort_on_failure(plan, customer.error_category,
                                            "Customer read", customer.error_message);
        }
        if (customer.empty()) {
            return detail::abort_not_found(plan, std::format("Customer {}/{}/{}",
                warehouse_id, district_id, customer_id));
        }
        out.customer = *customer.first();
        plan.record_step("read customer");

        const auto order = ctx.query(Query::named(R"(
            SELECT o_id, o_entry_d, o_carrier_id, o_ol_cnt
            FROM orders
            WHERE o_w_id = @w_id AND o_d_id = @d_id AND o_c_id = @c_id
            ORDER BY o_entry_d DESC, o_id DESC
            LIMIT 1)"), customer_key);
        if (!order.success) {
            return detail::abort_on_failure(plan, order.error_category,
                                            "Order read", order.error_message);
        }
        if (order.empty()) {
            return detail::abort_not_found(plan, std::format("Order for customer {}/{}/{}",
                warehouse_id, district_id, customer_id));
        }
        out.order = *order.first();
        plan.record_step("read last order");

        const auto order_id = out.order.get_int("o_id");
        if (!order_id) {
            return detail::abort_on_failure(plan, ErrorCategory::EXECUTION_ERROR,
                                            "Order read", "o_id missing from result");
        }

        auto lines = ctx.query(Query::named(R"(
            SELECT ol_i_id, ol_supply_w_id, ol_quantity, ol_amount, ol_delivery_d
            FROM order_line
            WHERE ol_w_id = @w_id AND ol_d_id = @d_id AND ol_o_id = @o_id
            ORDER BY ol_number)"),
            NamedParams{}.set("w_id", warehouse_id)
                         .set("d_id", district_id)
                         .set("o_id", *order_id));
        if (!lines.success) {
            return detail::abort_on_failure(plan, lines.error_category,
                                            "Order line read", lines.error_message);
        }
        out.order_lines = std::move(lines.rows);
        plan.record_step("read order lines");

        TxnResult failure;
        if (!detail::advance_plan(plan, PlanState::READS_COMPLETE, failure)) return failure;
        return TxnResult::commit();
    }, TxnMode::READ_ONLY);

    if (!txn.committed) {
        out = OrderStatusOutcome{};
        out.plan = detail::trace_of(plan);
        out.fail(txn.error_category, txn.error_message);
        return out;
    }
    out.plan = detail::trace_of(plan);
    out.success = true;
    return out;
}

// ============================================================================
// Delivery
// ============================================================================

DeliveryOutcome OrderService::delivery(int64_t warehouse_id, int64_t carrier_id) {
    DeliveryOutcome out;
    out.mode = config_.delivery_mode;
    out.warehouse_id = warehouse_id;
    out.carrier_id = carrier_id;

    if (carrier_id < 1 || carrier_id > 10) {
        out.fail(ErrorCategory::INVALID_INPUT, "Carrier id must be between 1 and 10");
        return out;
    }

    const bool apply = out.mode == DeliveryMode::APPLY;
    TransactionPlan plan("delivery");

    const auto txn = executor_->run_in_transaction([&](ITransactionContext& ctx) {
        plan.reset();
        out.order_found = false;
        out.applied = false;

        const auto pending = ctx.query(Query::named(R"(
            SELECT no_d_id, no_o_id
            FROM new_order
            WHERE no_w_id = @w_id
            ORDER BY no_o_id, no_d_id
            LIMIT 1)"), NamedParams{}.set("w_id", warehouse_id));
        if (!pending.success) {
            return detail::abort_on_failure(plan, pending.error_category,
                                            "Pending order read", pending.error_message);
        }
        TxnResult failure;
        if (pending.empty()) {
            // Nothing queued; still a successful delivery run
            if (!detail::advance_plan(plan, PlanState::READS_COMPLETE, failure)) return failure;
            return TxnResult::commit();
        }
        plan.record_step("read pending order");

        out.order_found = true;
        out.district_id = pending.first()->get_int("no_d_id").value_or(0);
        out.order_id = pending.first()->get_int("no_o_id").value_or(0);

        NamedParams order_key;
        order_key.set("w_id", warehouse_id).set("d_id", out.district_id).set("o_id", out.order_id);

        const auto order = ctx.query(Query::named(
            "SELECT o_c_id FROM orders WHERE o_w_id = @w_id AND o_d_id = @d_id AND o_id = @o_id"),
            order_key);
        if (!order.success) {
            return detail::abort_on_failure(plan, order.error_category,
                                            "Order read", order.error_message);
        }
        if (order.empty()) {
            return detail::abort_not_found(plan, std::format("Order {}/{}/{}",
                warehouse_id, out.district_id, out.order_id));
        }
        out.customer_id = order.first()->get_int("o_c_id").value_or(0);
        plan.record_step("read order");

        const auto totals = ctx.query(Query::named(R"(
            SELECT COUNT(*) AS line_count, COALESCE(SUM(ol_amount), 0) AS amount
            FROM order_line
            WHERE ol_w_id = @w_id AND ol_d_id = @d_id AND ol_o_id = @o_id)"), order_key);
        if (!totals.success) {
            return detail::abort_on_failure(plan, totals.error_category,
                                            "Order line totals", totals.error_message);
        }
        if (const auto* row = totals.first()) {
            out.line_count = row->get_int("line_count").value_or(0);
            out.amount = round_cents(row->get_double("amount").value_or(0.0));
        }
        plan.record_step("read order line totals");
        if (!detail::advance_plan(plan, PlanState::READS_COMPLETE, failure)) return failure;
        if (!detail::advance_plan(plan, PlanState::VALIDATED, failure)) return failure;

        if (!apply) return TxnResult::commit();
        if (!detail::writes_permitted(plan, failure)) return failure;

        const auto removed = ctx.execute(Query::named(
            "DELETE FROM new_order WHERE no_w_id = @w_id AND no_d_id = @d_id AND no_o_id = @o_id"),
            order_key);
        if (!removed.success) {
            return detail::abort_on_failure(plan, removed.error_category,
                                            "New-order delete", removed.error_message);
        }
        if (removed.affected_rows == 0) {
            // Another delivery took this order between the read and the delete
            return detail::abort_on_failure(plan, ErrorCategory::TRANSIENT,
                                            "New-order delete", "order already delivered");
        }
        plan.record_step("delete new_order");

        const auto carrier = ctx.execute(Query::named(
            "UPDATE orders SET o_carrier_id = @carrier_id "
            "WHERE o_w_id = @w_id AND o_d_id = @d_id AND o_id = @o_id"),
            NamedParams{order_key}.set("carrier_id", carrier_id));
        if (!carrier.success) {
            return detail::abort_on_failure(plan, carrier.error_category,
                                            "Carrier update", carrier.error_message);
        }
        plan.record_step("set carrier");

        const auto stamped = ctx.execute(Query::named(
            "UPDATE order_line SET ol_delivery_d = @delivery_d "
            "WHERE ol_w_id = @w_id AND ol_d_id = @d_id AND ol_o_id = @o_id"),
            NamedParams{order_key}.set("delivery_d", utils::now()));
        if (!stamped.success) {
            return detail::abort_on_failure(plan, stamped.error_category,
                                            "Order line update", stamped.error_message);
        }
        plan.record_step("stamp order lines");

        const auto credited = ctx.execute(Query::named(R"(
            UPDATE customer
            SET c_balance = c_balance + @amount, c_delivery_cnt = c_delivery_cnt + 1
            WHERE c_w_id = @w_id AND c_d_id = @d_id AND c_id = @c_id)"),
            NamedParams{}.set("amount", out.amount)
                         .set("w_id", warehouse_id)
                         .set("d_id", out.district_id)
                         .set("c_id", out.customer_id));
        if (!credited.success) {
            return detail::abort_on_failure(plan, credited.error_category,
                                            "Customer update", credited.error_message);
        }
        plan.record_step("credit customer");

        if (!detail::advance_plan(plan, PlanState::WRITES_COMPLETE, failure)) return failure;
        return TxnResult::commit();
    }, apply ? TxnMode::READ_WRITE : TxnMode::READ_ONLY);
    out.plan = detail::trace_of(plan);

    if (!txn.committed) {
        events_->warn(kComponent, std::format("Delivery for warehouse {} failed: {}",
                                              warehouse_id, txn.error_message));
        out.order_found = false;
        out.applied = false;
        out.fail(txn.error_category, txn.error_message);
        return out;
    }

    out.applied = apply && out.order_found;
    if (out.order_found) {
        events_->info(kComponent, std::format("Delivery ({}) of order {}/{}/{}: {} lines, {:.2f}",
            delivery_mode_to_string(out.mode), warehouse_id, out.district_id, out.order_id,
            out.line_count, out.amount));
    } else {
        events_->info(kComponent, std::format("No pending orders for warehouse {}", warehouse_id));
    }
    out.success = true;
    return out;
}

// ============================================================================
// Reporting
// ============================================================================

Page OrderService::orders(
    std::optional<int64_t> warehouse_id,
    std::optional<int64_t> district_id,
    std::optional<int64_t> customer_id,
    const std::string& status,
    int64_t limit, int64_t offset) {

    const bool only_new = utils::iequals(status, "new");
    const bool only_delivered = utils::iequals(status, "delivered");
    if (!status.empty() && !only_new && !only_delivered) {
        return Page::failure(ErrorCategory::INVALID_INPUT,
            std::format("Unknown order status '{}'", status), limit, offset);
    }

    FilterQueryBuilder builder({
        std::format("o.o_id, o.o_w_id, o.o_d_id, o.o_c_id, o.o_entry_d, o.o_carrier_id, "
                    "o.o_ol_cnt, c.c_first, c.c_middle, c.c_last, {}", kOrderStatusExpr),
        "orders o "
        "JOIN customer c ON c.c_w_id = o.o_w_id AND c.c_d_id = o.o_d_id AND c.c_id = o.o_c_id "
        "LEFT JOIN new_order no ON no.no_w_id = o.o_w_id AND no.no_d_id = o.o_d_id AND no.no_o_id = o.o_id",
        "o.o_entry_d DESC, o.o_id DESC"
    });
    builder.where(FilterPredicate::if_present("o.o_w_id = @w_id", "w_id", warehouse_id))
           .where(FilterPredicate::if_present("o.o_d_id = @d_id", "d_id", district_id))
           .where(FilterPredicate::if_present("o.o_c_id = @c_id", "c_id", customer_id))
           .where(FilterPredicate::when(only_new, "no.no_o_id IS NOT NULL"))
           .where(FilterPredicate::when(only_delivered, "no.no_o_id IS NULL"));

    auto page = builder.run(*executor_, limit, offset);
    if (!page.success) {
        events_->error(kComponent, std::format("Order listing failed: {}", page.error));
    }
    return page;
}

DetailOutcome OrderService::order_details(
    int64_t warehouse_id, int64_t district_id, int64_t order_id) {

    DetailOutcome out;
    NamedParams key;
    key.set("w_id", warehouse_id).set("d_id", district_id).set("o_id", order_id);

    const auto txn = executor_->run_in_transaction([&](ITransactionContext& ctx) {
        out = DetailOutcome{};

        const auto order = ctx.query(Query::named(std::format(R"(
            SELECT o.o_id, o.o_w_id, o.o_d_id, o.o_c_id, o.o_entry_d, o.o_carrier_id,
                   o.o_ol_cnt, o.o_all_local, c.c_first, c.c_middle, c.c_last, {}
            FROM orders o
            JOIN customer c ON c.c_w_id = o.o_w_id AND c.c_d_id = o.o_d_id AND c.c_id = o.o_c_id
            LEFT JOIN new_order no ON no.no_w_id = o.o_w_id AND no.no_d_id = o.o_d_id AND no.no_o_id = o.o_id
            WHERE o.o_w_id = @w_id AND o.o_d_id = @d_id AND o.o_id = @o_id)", kOrderStatusExpr)), key);
        if (!order.success) {
            return TxnResult::abort(order.error_category, order.error_message);
        }
        if (order.empty()) {
            return TxnResult::abort(ErrorCategory::NOT_FOUND, "Order not found");
        }
        out.record = *order.first();

        auto lines = ctx.query(Query::named(R"(
            SELECT ol.ol_number, ol.ol_i_id, ol.ol_supply_w_id, ol.ol_quantity,
                   ol.ol_amount, ol.ol_delivery_d, i.i_name, i.i_price
            FROM order_line ol
            JOIN item i ON i.i_id = ol.ol_i_id
            WHERE ol.ol_w_id = @w_id AND ol.ol_d_id = @d_id AND ol.ol_o_id = @o_id
            ORDER BY ol.ol_number)"), key);
        if (!lines.success) {
            return TxnResult::abort(lines.error_category, lines.error_message);
        }

        double total = 0.0;
        for (const auto& line : lines.rows) {
            total += line.get_double("ol_amount").value_or(0.0);
        }
        out.record.set("total_amount", round_cents(total));
        out.collections.emplace_back("order_lines", std::move(lines.rows));
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

ListOutcome OrderService::recent_orders(int64_t limit) {
    ListOutcome out;
    auto r = executor_->execute_query(Query::named(std::format(R"(
        SELECT o.o_id, o.o_w_id, o.o_d_id, o.o_c_id, o.o_entry_d,
               c.c_first, c.c_middle, c.c_last,
               w.w_name, {}
        FROM orders o
        JOIN customer c ON c.c_w_id = o.o_w_id AND c.c_d_id = o.o_d_id AND c.c_id = o.o_c_id
        JOIN warehouse w ON w.w_id = o.o_w_id
        LEFT JOIN new_order no ON no.no_w_id = o.o_w_id AND no.no_d_id = o.o_d_id AND no.no_o_id = o.o_id
        ORDER BY o.o_entry_d DESC
        LIMIT @limit)", kOrderStatusExpr)), NamedParams{}.set("limit", limit));

    if (!r.success) {
        out.fail(r.error_category, r.error_message);
        return out;
    }
    out.success = true;
    out.rows = std::move(r.rows);
    return out;
}

DetailOutcome OrderService::order_statistics(std::optional<int64_t> warehouse_id) {
    DetailOutcome out;

    ConditionBuilder plain;
    plain.add_if(warehouse_id, "o_w_id = @w_id", "w_id");
    ConditionBuilder aliased;
    aliased.add_if(warehouse_id, "o.o_w_id = @w_id", "w_id");

    const auto txn = executor_->run_in_transaction([&](ITransactionContext& ctx) {
        out = DetailOutcome{};
        TxnResult failure;
        ResultRow scratch;

        if (!detail::read_single(ctx,
                std::format("SELECT COUNT(*) AS total_orders FROM orders {}", plain.where_clause()),
                plain.params(), scratch, failure, "Total orders")) {
            return failure;
        }

        if (!detail::read_single(ctx, std::format(
                "SELECT COUNT(*) AS new_orders FROM orders o "
                "JOIN new_order no ON no.no_w_id = o.o_w_id AND no.no_d_id = o.o_d_id "
                "AND no.no_o_id = o.o_id {}", aliased.where_clause()),
                aliased.params(), scratch, failure, "New orders")) {
            return failure;
        }

        if (!detail::read_single(ctx, std::format(
                "SELECT COUNT(*) AS orders_today FROM orders {}",
                plain.where_clause_and("o_entry_d >= CURRENT_DATE")),
                plain.params(), scratch, failure, "Orders today")) {
            return failure;
        }

        if (!detail::read_single(ctx, std::format(R"(
                SELECT AVG(order_totals.total_amount) AS avg_order_value
                FROM (
                    SELECT SUM(ol.ol_amount) AS total_amount
                    FROM order_line ol
                    JOIN orders o ON o.o_w_id = ol.ol_w_id AND o.o_d_id = ol.ol_d_id AND o.o_id = ol.ol_o_id
                    {}
                    GROUP BY ol.ol_w_id, ol.ol_d_id, ol.ol_o_id
                ) AS order_totals)", aliased.where_clause()),
                aliased.params(), scratch, failure, "Average order value")) {
            return failure;
        }

        const int64_t total = scratch.get_int("total_orders").value_or(0);
        const int64_t fresh = scratch.get_int("new_orders").value_or(0);
        out.record.set("total_orders", total);
        out.record.set("new_orders", fresh);
        out.record.set("delivered_orders", total - fresh);
        out.record.set("orders_today", scratch.get_int("orders_today").value_or(0));
        out.record.set("avg_order_value", round_cents(scratch.get_double("avg_order_value").value_or(0.0)));
        return TxnResult::commit();
    }, TxnMode::READ_ONLY);

    if (!txn.committed) {
        out = DetailOutcome{};
        out.fail(txn.error_category, txn.error_message);
        events_->error(kComponent, std::format("Order statistics failed: {}", txn.error_message));
        return out;
    }
    out.success = true;
    return out;
}

} // namespace tpccgw
