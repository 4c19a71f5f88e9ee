#include "core/utils.hpp"
#include "core/database_type.hpp"
#include "core/event_sink.hpp"
#include "core/json.hpp"
#include "config/config_loader.hpp"
#include "db/backend_registry.hpp"
#include "db/generic_query_executor.hpp"
#include "tpcc/analytics_service.hpp"
#include "tpcc/inventory_service.hpp"
#include "tpcc/new_order_transaction.hpp"
#include "tpcc/order_service.hpp"
#include "tpcc/payment_service.hpp"
#include "acid/acid_harness.hpp"

#ifdef ENABLE_POSTGRESQL
#include "db/postgresql/pg_backend.hpp"
#endif

#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace tpccgw;

// =========================================================================
// Explicit Backend Registration
// =========================================================================

static void register_backends() {
    #ifdef ENABLE_POSTGRESQL
    BackendRegistry::instance().register_backend(
        DatabaseType::POSTGRESQL,
        [] { return std::make_unique<PgBackend>(); });
    BackendRegistry::instance().register_backend(
        DatabaseType::SPANNER,
        [] { return std::make_unique<SpannerBackend>(); });
    #endif
}

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

void print_usage(const char* argv0) {
    std::cerr << std::format(
        "Usage: {} <config.toml> <command> [args...]\n"
        "\n"
        "Commands:\n"
        "  check                                    test the backend connection\n"
        "  acid                                     run the ACID conformance suite\n"
        "  payment W D C AMOUNT [C_W C_D]           TPC-C Payment\n"
        "  order-status W D C                       TPC-C Order-Status\n"
        "  delivery W CARRIER                       TPC-C Delivery\n"
        "  stock-level W D THRESHOLD                TPC-C Stock-Level\n"
        "  new-order W D C ITEM:QTY[:SUPPLY_W]...   TPC-C New-Order\n"
        "  orders [W]                               first page of orders\n"
        "  metrics                                  dashboard counters\n",
        argv0);
}

/// Parse argv[index] as an integer; nullopt when absent or malformed
std::optional<int64_t> int_arg(const std::vector<std::string>& args, size_t index) {
    if (index >= args.size()) return std::nullopt;
    return utils::try_parse_int<int64_t>(args[index]);
}

std::optional<NewOrderLine> parse_order_line(const std::string& spec) {
    const auto parts = utils::split(spec, ':');
    if (parts.size() < 2 || parts.size() > 3) return std::nullopt;

    NewOrderLine line;
    const auto item = utils::try_parse_int<int64_t>(parts[0]);
    const auto qty = utils::try_parse_int<int64_t>(parts[1]);
    if (!item || !qty) return std::nullopt;
    line.item_id = *item;
    line.quantity = *qty;
    if (parts.size() == 3) {
        const auto supply = utils::try_parse_int<int64_t>(parts[2]);
        if (!supply) return std::nullopt;
        line.supply_warehouse_id = *supply;
    }
    return line;
}

int emit(const Json& j, bool success) {
    std::cout << j.dump(2) << std::endl;
    return success ? kExitOk : kExitFailed;
}

int usage_error(const std::string& message) {
    utils::log::error(message);
    return kExitUsage;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return kExitUsage;
    }

    try {
        register_backends();

        const std::string config_file = argv[1];
        const std::string command = argv[2];
        const std::vector<std::string> args(argv + 3, argv + argc);

        auto load = ConfigLoader::load_from_file(config_file);
        if (!load.success) {
            utils::log::error(load.error_message);
            return kExitFailed;
        }
        const auto& config = load.config;
        utils::log::set_level(utils::log::parse_level(config.logging.level));

        auto events = std::make_shared<LogEventSink>();
        auto executor = BackendRegistry::instance().create_executor(
            config.backend.type,
            GenericQueryExecutor::Config{
                config.backend.connection_string,
                config.backend.provider_name,
                config.retry},
            events);

        utils::log::info(std::format("tpccgw: {} via {}", command, executor->provider_name()));

        if (command == "check") {
            AnalyticsService analytics(executor, events);
            const auto out = analytics.test_connection();
            return emit(out.to_json(), out.success);
        }

        if (command == "metrics") {
            AnalyticsService analytics(executor, events);
            const auto out = analytics.dashboard_metrics();
            return emit(out.to_json(), out.success);
        }

        if (command == "acid") {
            AcidHarness harness(executor, AcidHarness::Options{config.acid.durability_delay, 0}, events);
            const auto report = harness.run_all();
            return emit(report.to_json(), report.failed() == 0);
        }

        if (command == "payment") {
            const auto w = int_arg(args, 0), d = int_arg(args, 1), c = int_arg(args, 2);
            const auto amount = args.size() > 3 ? utils::try_parse_double(args[3]) : std::nullopt;
            if (!w || !d || !c || !amount) return usage_error("payment needs W D C AMOUNT");

            PaymentRequest req;
            req.warehouse_id = *w;
            req.district_id = *d;
            req.customer_id = *c;
            req.amount = *amount;
            if (args.size() >= 6) {
                req.customer_warehouse_id = int_arg(args, 4);
                req.customer_district_id = int_arg(args, 5);
                if (!req.customer_warehouse_id || !req.customer_district_id) {
                    return usage_error("remote customer needs numeric C_W C_D");
                }
            }

            PaymentService payments(executor, config.tpcc, events);
            const auto out = payments.execute_payment(req);
            return emit(out.to_json(), out.success);
        }

        if (command == "order-status") {
            const auto w = int_arg(args, 0), d = int_arg(args, 1), c = int_arg(args, 2);
            if (!w || !d || !c) return usage_error("order-status needs W D C");

            OrderService orders(executor, nullptr, config.tpcc, events);
            const auto out = orders.order_status(*w, *d, *c);
            return emit(out.to_json(), out.success);
        }

        if (command == "delivery") {
            const auto w = int_arg(args, 0), carrier = int_arg(args, 1);
            if (!w || !carrier) return usage_error("delivery needs W CARRIER");

            OrderService orders(executor, nullptr, config.tpcc, events);
            const auto out = orders.delivery(*w, *carrier);
            return emit(out.to_json(), out.success);
        }

        if (command == "stock-level") {
            const auto w = int_arg(args, 0), d = int_arg(args, 1), threshold = int_arg(args, 2);
            if (!w || !d || !threshold) return usage_error("stock-level needs W D THRESHOLD");

            InventoryService inventory(executor, config.tpcc, events);
            const auto out = inventory.stock_level(*w, *d, *threshold);
            return emit(out.to_json(), out.success);
        }

        if (command == "new-order") {
            const auto w = int_arg(args, 0), d = int_arg(args, 1), c = int_arg(args, 2);
            if (!w || !d || !c || args.size() < 4) {
                return usage_error("new-order needs W D C ITEM:QTY[:SUPPLY_W]...");
            }

            NewOrderRequest req;
            req.warehouse_id = *w;
            req.district_id = *d;
            req.customer_id = *c;
            for (size_t i = 3; i < args.size(); ++i) {
                const auto line = parse_order_line(args[i]);
                if (!line) return usage_error(std::format("Malformed order line '{}'", args[i]));
                req.lines.push_back(*line);
            }

            OrderService orders(executor,
                                std::make_shared<NewOrderTransaction>(executor, events),
                                config.tpcc, events);
            const auto out = orders.execute_new_order(req);
            return emit(out.to_json(), out.success);
        }

        if (command == "orders") {
            std::optional<int64_t> w;
            if (!args.empty()) {
                w = int_arg(args, 0);
                if (!w) return usage_error("orders takes an optional numeric W");
            }

            OrderService orders(executor, nullptr, config.tpcc, events);
            const auto page = orders.orders(w, std::nullopt, std::nullopt, "",
                                            config.tpcc.default_page_limit, 0);
            return emit(page_to_json(page, "orders"), page.success);
        }

        print_usage(argv[0]);
        return usage_error(std::format("Unknown command '{}'", command));

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitFailed;
    }
}
