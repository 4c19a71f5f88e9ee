#include "tpcc/new_order_transaction.hpp"
#include "tpcc/protocol_support.hpp"
#include "tpcc/transaction_plan.hpp"
#include "core/utils.hpp"

#include <format>

namespace tpccgw {

namespace {

constexpr std::string_view kComponent = "new_order";

bool contains_original(const std::optional<std::string>& data) {
    return data && data->find("ORIGINAL") != std::string::npos;
}

} // anonymous namespace

NewOrderTransaction::NewOrderTransaction(std::shared_ptr<IQueryExecutor> executor,
                                         std::shared_ptr<IEventSink> events)
    : executor_(std::move(executor)),
      events_(sink_or_null(std::move(events))) {}

int64_t NewOrderTransaction::replenished_quantity(int64_t current, int64_t quantity) {
    return current >= quantity + 10 ? current - quantity : current - quantity + 91;
}

NewOrderOutcome NewOrderTransaction::execute(const NewOrderRequest& req) {
    NewOrderOutcome out;
    out.warehouse_id = req.warehouse_id;
    out.district_id = req.district_id;
    out.customer_id = req.customer_id;

    if (req.lines.empty() || static_cast<int64_t>(req.lines.size()) > kMaxLines) {
        out.fail(ErrorCategory::INVALID_INPUT,
                 std::format("An order needs between 1 and {} lines", kMaxLines));
        return out;
    }
    if (req.district_id < 1 || req.district_id > kDistrictsPerWarehouse) {
        out.fail(ErrorCategory::INVALID_INPUT,
                 std::format("District id must be between 1 and {}", kDistrictsPerWarehouse));
        return out;
    }
    for (const auto& line : req.lines) {
        if (line.quantity < 1) {
            out.fail(ErrorCategory::INVALID_INPUT,
                     std::format("Item {} has a non-positive quantity", line.item_id));
            return out;
        }
    }

    // s_dist_01 .. s_dist_10
    const auto dist_column = std::format("s_dist_{:02}", req.district_id);
    bool all_local = true;
    for (const auto& line : req.lines) {
        if (line.supply_warehouse_id != 0 && line.supply_warehouse_id != req.warehouse_id) {
            all_local = false;
        }
    }

    TransactionPlan plan("new_order");

    const auto txn = executor_->run_in_transaction([&](ITransactionContext& ctx) {
        plan.reset();
        out.lines.clear();

        NamedParams district_key;
        district_key.set("w_id", req.warehouse_id).set("d_id", req.district_id);

        const auto warehouse = ctx.query(
            Query::named("SELECT w_tax FROM warehouse WHERE w_id = @w_id"),
            NamedParams{}.set("w_id", req.warehouse_id));
        if (!warehouse.success) {
            return detail::abort_on_failure(plan, warehouse.error_category,
                                            "Warehouse read", warehouse.error_message);
        }
        if (warehouse.empty()) {
            return detail::abort_not_found(plan, std::format("Warehouse {}", req.warehouse_id));
        }
        plan.record_step("read warehouse");

        const auto district = ctx.query(Query::named(
            "SELECT d_tax, d_next_o_id FROM district WHERE d_w_id = @w_id AND d_id = @d_id"),
            district_key);
        if (!district.success) {
            return detail::abort_on_failure(plan, district.error_category,
                                            "District read", district.error_message);
        }
        if (district.empty()) {
            return detail::abort_not_found(plan, std::format("District {}/{}",
                req.warehouse_id, req.district_id));
        }
        plan.record_step("read district");

        const auto customer = ctx.query(Query::named(
            "SELECT c_discount, c_last, c_credit FROM customer "
            "WHERE c_w_id = @w_id AND c_d_id = @d_id AND c_id = @c_id"),
            NamedParams{district_key}.set("c_id", req.customer_id));
        if (!customer.success) {
            return detail::abort_on_failure(plan, customer.error_category,
                                            "Customer read", customer.error_message);
        }
        if (customer.empty()) {
            return detail::abort_not_found(plan, std::format("Customer {}/{}/{}",
                req.warehouse_id, req.district_id, req.customer_id));
        }
        plan.record_step("read customer");

        TxnResult failure;
        if (!detail::advance_plan(plan, PlanState::READS_COMPLETE, failure)) return failure;

        out.warehouse_tax = warehouse.first()->get_double("w_tax").value_or(0.0);
        out.district_tax = district.first()->get_double("d_tax").value_or(0.0);
        out.customer_discount = customer.first()->get_double("c_discount").value_or(0.0);
        out.order_id = district.first()->get_int("d_next_o_id").value_or(0);
        if (out.order_id <= 0) {
            return detail::abort_on_failure(plan, ErrorCategory::EXECUTION_ERROR,
                                            "District read", "d_next_o_id is not set");
        }
        if (!detail::advance_plan(plan, PlanState::VALIDATED, failure)) return failure;
        if (!detail::writes_permitted(plan, failure)) return failure;

        const auto entry = utils::now();
        out.entry_date = utils::format_iso8601_utc(entry);

        const auto bump = ctx.execute(Query::named(
            "UPDATE district SET d_next_o_id = @next_o_id WHERE d_w_id = @w_id AND d_id = @d_id"),
            NamedParams{district_key}.set("next_o_id", out.order_id + 1));
        if (!bump.success) {
            return detail::abort_on_failure(plan, bump.error_category,
                                            "District update", bump.error_message);
        }
        plan.record_step("advance d_next_o_id");

        NamedParams order_key = district_key;
        order_key.set("o_id", out.order_id);

        NamedParams order_row = order_key;
        order_row.set("c_id", req.customer_id)
                 .set("entry_d", entry)
                 .set("ol_cnt", static_cast<int64_t>(req.lines.size()))
                 .set("all_local", static_cast<int64_t>(all_local ? 1 : 0));
        const auto order = ctx.execute(Query::named(R"(
            INSERT INTO orders (o_id, o_d_id, o_w_id, o_c_id, o_entry_d, o_carrier_id, o_ol_cnt, o_all_local)
            VALUES (@o_id, @d_id, @w_id, @c_id, @entry_d, NULL, @ol_cnt, @all_local))"), order_row);
        if (!order.success) {
            return detail::abort_on_failure(plan, order.error_category,
                                            "Order insert", order.error_message);
        }

        const auto marker = ctx.execute(Query::named(
            "INSERT INTO new_order (no_o_id, no_d_id, no_w_id) VALUES (@o_id, @d_id, @w_id)"),
            order_key);
        if (!marker.success) {
            return detail::abort_on_failure(plan, marker.error_category,
                                            "New-order insert", marker.error_message);
        }
        plan.record_step("insert order");

        double line_sum = 0.0;
        int64_t number = 0;
        for (const auto& line : req.lines) {
            ++number;
            const int64_t supply_w = line.supply_warehouse_id != 0
                ? line.supply_warehouse_id : req.warehouse_id;

            const auto item = ctx.query(Query::named(
                "SELECT i_price, i_name, i_data FROM item WHERE i_id = @i_id"),
                NamedParams{}.set("i_id", line.item_id));
            if (!item.success) {
                return detail::abort_on_failure(plan, item.error_category,
                                                "Item read", item.error_message);
            }
            if (item.empty()) {
                return detail::abort_not_found(plan, std::format("Item {}", line.item_id));
            }

            NamedParams stock_key;
            stock_key.set("i_id", line.item_id).set("w_id", supply_w);
            const auto stock = ctx.query(Query::named(std::format(
                "SELECT s_quantity, s_data, {} AS dist_info FROM stock "
                "WHERE s_i_id = @i_id AND s_w_id = @w_id", dist_column)), stock_key);
            if (!stock.success) {
                return detail::abort_on_failure(plan, stock.error_category,
                                                "Stock read", stock.error_message);
            }
            if (stock.empty()) {
                return detail::abort_not_found(plan, std::format("Stock for item {} in warehouse {}",
                    line.item_id, supply_w));
            }

            const auto& i = *item.first();
            const auto& s = *stock.first();

            NewOrderLineResult result;
            result.item_id = line.item_id;
            result.supply_warehouse_id = supply_w;
            result.quantity = line.quantity;
            result.item_name = i.get_string("i_name").value_or("");
            result.item_price = i.get_double("i_price").value_or(0.0);
            result.amount = round_cents(result.item_price * static_cast<double>(line.quantity));
            result.stock_quantity = replenished_quantity(
                s.get_int("s_quantity").value_or(0), line.quantity);
            result.brand_generic_original =
                contains_original(i.get_string("i_data")) && contains_original(s.get_string("s_data"));

            NamedParams stock_update = stock_key;
            stock_update.set("quantity", result.stock_quantity)
                        .set("ordered", line.quantity)
                        .set("remote", static_cast<int64_t>(supply_w != req.warehouse_id ? 1 : 0));
            const auto su = ctx.execute(Query::named(R"(
                UPDATE stock
                SET s_quantity = @quantity, s_ytd = s_ytd + @ordered,
                    s_order_cnt = s_order_cnt + 1, s_remote_cnt = s_remote_cnt + @remote
                WHERE s_i_id = @i_id AND s_w_id = @w_id)"), stock_update);
            if (!su.success) {
                return detail::abort_on_failure(plan, su.error_category,
                                                "Stock update", su.error_message);
            }

            NamedParams line_row = order_key;
            line_row.set("number", number)
                    .set("i_id", line.item_id)
                    .set("supply_w_id", supply_w)
                    .set("quantity", line.quantity)
                    .set("amount", result.amount)
                    .set("dist_info", s.get_string("dist_info").value_or(""));
            const auto li = ctx.execute(Query::named(R"(
                INSERT INTO order_line (ol_o_id, ol_d_id, ol_w_id, ol_number, ol_i_id,
                                        ol_supply_w_id, ol_delivery_d, ol_quantity, ol_amount, ol_dist_info)
                VALUES (@o_id, @d_id, @w_id, @number, @i_id,
                        @supply_w_id, NULL, @quantity, @amount, @dist_info))"), line_row);
            if (!li.success) {
                return detail::abort_on_failure(plan, li.error_category,
                                                "Order line insert", li.error_message);
            }

            plan.record_step(std::format("order line {}", number));
            line_sum += result.amount;
            out.lines.push_back(std::move(result));
        }

        out.total_amount = round_cents(line_sum * (1.0 - out.customer_discount)
                                       * (1.0 + out.warehouse_tax + out.district_tax));
        if (!detail::advance_plan(plan, PlanState::WRITES_COMPLETE, failure)) return failure;
        return TxnResult::commit();
    }, TxnMode::READ_WRITE);

    if (!txn.committed) {
        events_->warn(kComponent, std::format("New-Order {}/{}/{} rolled back: {}",
            req.warehouse_id, req.district_id, req.customer_id, txn.error_message));
        const auto warehouse_id = out.warehouse_id;
        const auto district_id = out.district_id;
        const auto customer_id = out.customer_id;
        out = NewOrderOutcome{};
        out.warehouse_id = warehouse_id;
        out.district_id = district_id;
        out.customer_id = customer_id;
        out.plan = detail::trace_of(plan);
        out.fail(txn.error_category, txn.error_message);
        return out;
    }
    out.plan = detail::trace_of(plan);

    events_->info(kComponent, std::format("Order {} placed in {}/{} with {} lines, total {:.2f}",
        out.order_id, req.warehouse_id, req.district_id, out.lines.size(), out.total_amount));
    out.success = true;
    return out;
}

} // namespace tpccgw
