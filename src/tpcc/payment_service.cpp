#include "tpcc/payment_service.hpp"
#include "tpcc/protocol_support.hpp"
#include "tpcc/transaction_plan.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <format>

namespace tpccgw {

namespace {

constexpr std::string_view kComponent = "payment";

const char* const kCustomerForUpdate = R"(
    SELECT c_first, c_middle, c_last, c_credit, c_credit_lim,
           c_balance, c_ytd_payment, c_payment_cnt
    FROM customer
    WHERE c_w_id = @c_w_id AND c_d_id = @c_d_id AND c_id = @c_id)";

const char* const kWarehouseForUpdate =
    "SELECT w_name, w_ytd FROM warehouse WHERE w_id = @w_id";

const char* const kDistrictForUpdate =
    "SELECT d_name, d_ytd FROM district WHERE d_w_id = @w_id AND d_id = @d_id";

const char* const kUpdateCustomer = R"(
    UPDATE customer
    SET c_balance = @balance, c_ytd_payment = @ytd_payment, c_payment_cnt = @payment_cnt
    WHERE c_w_id = @c_w_id AND c_d_id = @c_d_id AND c_id = @c_id)";

const char* const kUpdateWarehouse =
    "UPDATE warehouse SET w_ytd = @ytd WHERE w_id = @w_id";

const char* const kUpdateDistrict =
    "UPDATE district SET d_ytd = @ytd WHERE d_w_id = @w_id AND d_id = @d_id";

const char* const kInsertHistory = R"(
    INSERT INTO history (h_c_id, h_c_d_id, h_c_w_id, h_d_id, h_w_id, h_date, h_amount, h_data)
    VALUES (@c_id, @c_d_id, @c_w_id, @d_id, @w_id, @h_date, @amount, @h_data))";

std::string join_name(const ResultRow& row) {
    std::string name;
    for (const auto* col : {"c_first", "c_middle", "c_last"}) {
        const auto part = row.get_string(col);
        if (!part || part->empty()) continue;
        if (!name.empty()) name += ' ';
        name += *part;
    }
    return name;
}

} // anonymous namespace

PaymentService::PaymentService(std::shared_ptr<IQueryExecutor> executor,
                               TpccConfig config,
                               std::shared_ptr<IEventSink> events)
    : executor_(std::move(executor)),
      config_(std::move(config)),
      events_(sink_or_null(std::move(events))) {}

// ============================================================================
// Payment Protocol
// ============================================================================

PaymentOutcome PaymentService::execute_payment(const PaymentRequest& req) {
    PaymentOutcome out;
    out.warehouse_id = req.warehouse_id;
    out.district_id = req.district_id;
    out.customer_id = req.customer_id;
    out.amount = round_cents(req.amount);

    if (!std::isfinite(req.amount) || !(round_cents(req.amount) > 0.0)) {
        out.fail(ErrorCategory::INVALID_INPUT, "Payment amount must be a positive number of cents");
        return out;
    }

    TransactionPlan plan("payment");

    const auto txn = executor_->run_in_transaction([&](ITransactionContext& ctx) {
        plan.reset();

        NamedParams customer_key;
        customer_key.set("c_w_id", req.c_w_id())
                    .set("c_d_id", req.c_d_id())
                    .set("c_id", req.customer_id);

        const auto customer = ctx.query(Query::named(kCustomerForUpdate), customer_key);
        if (!customer.success) {
            return detail::abort_on_failure(plan, customer.error_category,
                                            "Customer read", customer.error_message);
        }
        if (customer.empty()) {
            return detail::abort_not_found(plan, std::format("Customer {}/{}/{}",
                req.c_w_id(), req.c_d_id(), req.customer_id));
        }
        plan.record_step("read customer");

        const auto warehouse = ctx.query(Query::named(kWarehouseForUpdate),
                                         NamedParams{}.set("w_id", req.warehouse_id));
        if (!warehouse.success) {
            return detail::abort_on_failure(plan, warehouse.error_category,
                                            "Warehouse read", warehouse.error_message);
        }
        if (warehouse.empty()) {
            return detail::abort_not_found(plan, std::format("Warehouse {}", req.warehouse_id));
        }
        plan.record_step("read warehouse");

        const auto district = ctx.query(Query::named(kDistrictForUpdate),
            NamedParams{}.set("w_id", req.warehouse_id).set("d_id", req.district_id));
        if (!district.success) {
            return detail::abort_on_failure(plan, district.error_category,
                                            "District read", district.error_message);
        }
        if (district.empty()) {
            return detail::abort_not_found(plan, std::format("District {}/{}",
                req.warehouse_id, req.district_id));
        }
        plan.record_step("read district");

        TxnResult failure;
        if (!detail::advance_plan(plan, PlanState::READS_COMPLETE, failure)) return failure;

        // Compute
        const auto& c = *customer.first();
        const auto& w = *warehouse.first();
        const auto& d = *district.first();

        out.customer_name = join_name(c);
        out.credit = c.get_string("c_credit").value_or("");
        out.warehouse_name = w.get_string("w_name").value_or("");
        out.district_name = d.get_string("d_name").value_or("");

        out.previous_balance = c.get_double("c_balance").value_or(0.0);
        out.new_balance = round_cents(out.previous_balance - out.amount);
        out.ytd_payment = round_cents(c.get_double("c_ytd_payment").value_or(0.0) + out.amount);
        out.payment_cnt = c.get_int("c_payment_cnt").value_or(0) + 1;
        out.warehouse_ytd = round_cents(w.get_double("w_ytd").value_or(0.0) + out.amount);
        out.district_ytd = round_cents(d.get_double("d_ytd").value_or(0.0) + out.amount);
        if (!std::isfinite(out.new_balance)) {
            return detail::abort_on_failure(plan, ErrorCategory::INVALID_INPUT,
                                            "Balance computation", "result is not a finite amount");
        }
        if (!detail::advance_plan(plan, PlanState::VALIDATED, failure)) return failure;

        // Writes (all three commit together)
        if (!detail::writes_permitted(plan, failure)) return failure;
        NamedParams customer_update = customer_key;
        customer_update.set("balance", out.new_balance)
                       .set("ytd_payment", out.ytd_payment)
                       .set("payment_cnt", out.payment_cnt);
        const auto cu = ctx.execute(Query::named(kUpdateCustomer), customer_update);
        if (!cu.success) {
            return detail::abort_on_failure(plan, cu.error_category,
                                            "Customer update", cu.error_message);
        }
        plan.record_step("update customer");

        const auto wu = ctx.execute(Query::named(kUpdateWarehouse),
            NamedParams{}.set("ytd", out.warehouse_ytd).set("w_id", req.warehouse_id));
        if (!wu.success) {
            return detail::abort_on_failure(plan, wu.error_category,
                                            "Warehouse update", wu.error_message);
        }
        plan.record_step("update warehouse");

        const auto du = ctx.execute(Query::named(kUpdateDistrict),
            NamedParams{}.set("ytd", out.district_ytd)
                         .set("w_id", req.warehouse_id)
                         .set("d_id", req.district_id));
        if (!du.success) {
            return detail::abort_on_failure(plan, du.error_category,
                                            "District update", du.error_message);
        }
        plan.record_step("update district");

        if (!detail::advance_plan(plan, PlanState::WRITES_COMPLETE, failure)) return failure;
        return TxnResult::commit();
    }, TxnMode::READ_WRITE);
    out.plan = detail::trace_of(plan);

    if (!txn.committed) {
        events_->warn(kComponent, std::format("Payment {}/{}/{} aborted: {}",
            req.warehouse_id, req.district_id, req.customer_id, txn.error_message));
        out.fail(txn.error_category, txn.error_message);
        return out;
    }

    // Best-effort history row, outside the payment transaction
    NamedParams history;
    history.set("c_id", req.customer_id)
           .set("c_d_id", req.c_d_id())
           .set("c_w_id", req.c_w_id())
           .set("d_id", req.district_id)
           .set("w_id", req.warehouse_id)
           .set("h_date", utils::now())
           .set("amount", out.amount)
           .set("h_data", std::format("{}    {}", out.warehouse_name, out.district_name));

    const auto h = executor_->execute_dml(Query::named(kInsertHistory), history);
    out.history_recorded = h.success;
    if (!h.success) {
        events_->warn(kComponent, std::format("Payment committed but history insert failed: {}",
                                              h.error_message));
    }

    events_->info(kComponent, std::format("Payment {}/{}/{} amount {:.2f} -> balance {:.2f}",
        req.warehouse_id, req.district_id, req.customer_id, out.amount, out.new_balance));
    out.success = true;
    return out;
}

// ============================================================================
// Validation
// ============================================================================

PaymentValidation PaymentService::validate_payment(const PaymentRequest& req) {
    PaymentValidation v;

    if (!std::isfinite(req.amount) || !(round_cents(req.amount) > 0.0)) {
        v.errors.emplace_back("Payment amount must be positive");
    }
    if (req.amount > config_.max_payment_amount) {
        v.errors.emplace_back("Payment amount exceeds maximum allowed");
    }

    const auto customer = executor_->execute_query(Query::named(
        "SELECT c_id, c_first, c_last, c_balance, c_credit_lim FROM customer "
        "WHERE c_w_id = @c_w_id AND c_d_id = @c_d_id AND c_id = @c_id"),
        NamedParams{}.set("c_w_id", req.c_w_id())
                     .set("c_d_id", req.c_d_id())
                     .set("c_id", req.customer_id));

    if (!customer.success) {
        v.errors.push_back(std::format("Customer lookup failed: {}", customer.error_message));
    } else if (customer.empty()) {
        v.errors.emplace_back("Customer not found");
    } else {
        const auto& c = *customer.first();
        v.customer = c;
        const double new_balance = c.get_double("c_balance").value_or(0.0) - req.amount;
        if (new_balance < -c.get_double("c_credit_lim").value_or(0.0)) {
            v.errors.emplace_back("Payment would exceed customer credit limit");
        }
    }

    const auto district = executor_->execute_query(Query::named(
        "SELECT d.d_id, w.w_name FROM district d "
        "JOIN warehouse w ON w.w_id = d.d_w_id "
        "WHERE d.d_w_id = @w_id AND d.d_id = @d_id"),
        NamedParams{}.set("w_id", req.warehouse_id).set("d_id", req.district_id));

    if (!district.success) {
        v.errors.push_back(std::format("District lookup failed: {}", district.error_message));
    } else if (district.empty()) {
        v.errors.emplace_back("Warehouse or district not found");
    } else {
        v.district = *district.first();
    }

    v.valid = v.errors.empty();
    return v;
}

// ============================================================================
// Reporting
// ============================================================================

Page PaymentService::payment_history(
    std::optional<int64_t> warehouse_id,
    std::optional<int64_t> district_id,
    std::optional<int64_t> customer_id,
    int64_t limit, int64_t offset) {

    FilterQueryBuilder builder({
        "h.h_c_id, h.h_c_d_id, h.h_c_w_id, h.h_d_id, h.h_w_id, "
        "h.h_date, h.h_amount, h.h_data",
        "history h",
        "h.h_date DESC"
    });
    builder.where(FilterPredicate::if_present("h.h_c_w_id = @w_id", "w_id", warehouse_id))
           .where(FilterPredicate::if_present("h.h_c_d_id = @d_id", "d_id", district_id))
           .where(FilterPredicate::if_present("h.h_c_id = @c_id", "c_id", customer_id));

    auto page = builder.run(*executor_, limit, offset);
    if (!page.success) {
        events_->error(kComponent, std::format("Payment history failed: {}", page.error));
    }
    return page;
}

DetailOutcome PaymentService::customer_payment_summary(
    int64_t warehouse_id, int64_t district_id, int64_t customer_id) {

    DetailOutcome out;
    NamedParams key;
    key.set("w_id", warehouse_id).set("d_id", district_id).set("c_id", customer_id);

    const auto txn = executor_->run_in_transaction([&](ITransactionContext& ctx) {
        out = DetailOutcome{};

        const auto customer = ctx.query(Query::named(R"(
            SELECT c.c_first, c.c_middle, c.c_last, c.c_balance,
                   c.c_ytd_payment, c.c_payment_cnt, c.c_credit, c.c_credit_lim
            FROM customer c
            WHERE c.c_w_id = @w_id AND c.c_d_id = @d_id AND c.c_id = @c_id)"), key);
        if (!customer.success) {
            return TxnResult::abort(customer.error_category, customer.error_message);
        }
        if (customer.empty()) {
            return TxnResult::abort(ErrorCategory::NOT_FOUND,
                std::format("Customer {}/{}/{} not found", warehouse_id, district_id, customer_id));
        }
        out.record = *customer.first();

        auto recent = ctx.query(Query::named(R"(
            SELECT h.h_date, h.h_amount, h.h_data
            FROM history h
            WHERE h.h_c_w_id = @w_id AND h.h_c_d_id = @d_id AND h.h_c_id = @c_id
            ORDER BY h.h_date DESC
            LIMIT 10)"), key);
        if (!recent.success) {
            return TxnResult::abort(recent.error_category, recent.error_message);
        }
        out.collections.emplace_back("recent_payments", std::move(recent.rows));

        TxnResult failure;
        if (!detail::read_single(ctx, R"(
            SELECT COUNT(*) AS total_payments,
                   COALESCE(SUM(h.h_amount), 0) AS total_amount,
                   COALESCE(AVG(h.h_amount), 0) AS avg_amount
            FROM history h
            WHERE h.h_c_w_id = @w_id AND h.h_c_d_id = @d_id AND h.h_c_id = @c_id)",
            key, out.record, failure, "Payment totals")) {
            return failure;
        }
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

DetailOutcome PaymentService::payment_statistics(std::optional<int64_t> warehouse_id) {
    DetailOutcome out;

    ConditionBuilder history_where;
    history_where.add_if(warehouse_id, "h_w_id = @w_id", "w_id");
    ConditionBuilder customer_where;
    customer_where.add_if(warehouse_id, "c.c_w_id = @w_id", "w_id");

    const auto txn = executor_->run_in_transaction([&](ITransactionContext& ctx) {
        out = DetailOutcome{};
        TxnResult failure;

        if (!detail::read_single(ctx, std::format(
                "SELECT COUNT(*) AS total_payments, "
                "COALESCE(SUM(h_amount), 0) AS total_amount, "
                "COALESCE(AVG(h_amount), 0) AS avg_amount "
                "FROM history {}", history_where.where_clause()),
                history_where.params(), out.record, failure, "Payment totals")) {
            return failure;
        }

        if (!detail::read_single(ctx, std::format(
                "SELECT COUNT(*) AS today_payments, "
                "COALESCE(SUM(h_amount), 0) AS today_amount "
                "FROM history {}", history_where.where_clause_and("h_date >= CURRENT_DATE")),
                history_where.params(), out.record, failure, "Today's payments")) {
            return failure;
        }

        auto top = ctx.query(Query::named(std::format(R"(
            SELECT c.c_id, c.c_w_id, c.c_d_id, c.c_first, c.c_middle, c.c_last,
                   c.c_ytd_payment, c.c_payment_cnt
            FROM customer c
            {}
            ORDER BY c.c_ytd_payment DESC
            LIMIT 5)", customer_where.where_clause())), customer_where.params());
        if (!top.success) {
            return TxnResult::abort(top.error_category, top.error_message);
        }
        out.collections.emplace_back("top_customers", std::move(top.rows));
        return TxnResult::commit();
    }, TxnMode::READ_ONLY);

    if (!txn.committed) {
        out = DetailOutcome{};
        out.fail(txn.error_category, txn.error_message);
        events_->error(kComponent, std::format("Payment statistics failed: {}", txn.error_message));
        return out;
    }
    out.success = true;
    return out;
}

ListOutcome PaymentService::recent_payments(int64_t limit) {
    ListOutcome out;
    auto r = executor_->execute_query(Query::named(R"(
        SELECT h.h_date, h.h_amount, h.h_data,
               c.c_first, c.c_middle, c.c_last,
               w.w_name
        FROM history h
        JOIN customer c ON c.c_w_id = h.h_c_w_id AND c.c_d_id = h.h_c_d_id AND c.c_id = h.h_c_id
        JOIN warehouse w ON w.w_id = h.h_w_id
        ORDER BY h.h_date DESC
        LIMIT @limit)"), NamedParams{}.set("limit", limit));

    if (!r.success) {
        out.fail(r.error_category, r.error_message);
        return out;
    }
    out.success = true;
    out.rows = std::move(r.rows);
    return out;
}

ListOutcome PaymentService::payment_trends(int64_t days) {
    ListOutcome out;
    if (days < 1) {
        out.fail(ErrorCategory::INVALID_INPUT, "days must be at least 1");
        return out;
    }

    auto r = executor_->execute_query(Query::named(R"(
        SELECT CAST(h_date AS DATE) AS payment_date,
               COUNT(*) AS payment_count,
               SUM(h_amount) AS total_amount,
               AVG(h_amount) AS avg_amount
        FROM history
        WHERE h_date >= CURRENT_DATE - CAST(@days AS INTEGER)
        GROUP BY CAST(h_date AS DATE)
        ORDER BY payment_date DESC)"), NamedParams{}.set("days", days));

    if (!r.success) {
        out.fail(r.error_category, r.error_message);
        return out;
    }
    out.success = true;
    out.rows = std::move(r.rows);
    return out;
}

} // namespace tpccgw
