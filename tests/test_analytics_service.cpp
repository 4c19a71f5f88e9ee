#include <catch2/catch_test_macros.hpp>
#include "tpcc/analytics_service.hpp"
#include "mocks/mock_db_connection.hpp"

using namespace tpccgw;
using namespace tpccgw::testing;

TEST_CASE("Connection check", "[analytics]") {
    auto script = std::make_shared<Script>();
    auto executor = make_executor(script);
    AnalyticsService service(executor);

    SECTION("Healthy backend") {
        const auto out = service.test_connection();
        REQUIRE(out.success);
        REQUIRE(out.provider == "PostgreSQL");
        REQUIRE(out.message == "Connection successful");
        REQUIRE(out.to_json()["provider"] == "PostgreSQL");
    }

    SECTION("Unreachable backend") {
        script->connect_failures = 1;
        const auto out = service.test_connection();
        REQUIRE_FALSE(out.success);
        REQUIRE(out.error_category == ErrorCategory::CONNECTIVITY);
        REQUIRE(out.to_json()["success"] == false);
    }

    SECTION("Unhealthy backend") {
        script->healthy = false;
        REQUIRE_FALSE(service.test_connection().success);
    }
}

TEST_CASE("Dashboard metrics", "[analytics]") {
    auto script = std::make_shared<Script>();
    auto events = std::make_shared<RecordingEventSink>();
    auto executor = make_executor(script, RetryPolicy{}, SqlDialect::spanner(), events);
    AnalyticsService service(executor, events);

    SECTION("All four counts") {
        script->rows("FROM warehouse", {"count"}, {{"2"}});
        script->rows("FROM customer", {"count"}, {{"60000"}});
        script->rows("FROM orders", {"count"}, {{"60000"}});
        script->rows("FROM item", {"count"}, {{"100000"}});

        const auto out = service.dashboard_metrics();
        REQUIRE(out.success);
        REQUIRE(out.provider == "Google Spanner");
        REQUIRE(out.metrics.get_int("total_warehouses") == 2);
        REQUIRE(out.metrics.get_int("total_customers") == 60000);
        REQUIRE(out.metrics.get_int("total_orders") == 60000);
        REQUIRE(out.metrics.get_int("total_items") == 100000);
        REQUIRE(out.warnings.empty());

        const auto j = out.to_json();
        REQUIRE(j["metrics"]["total_items"] == 100000);
        REQUIRE_FALSE(j.contains("warnings"));
    }

    SECTION("Failed metric degrades to zero with a warning") {
        script->rows("FROM warehouse", {"count"}, {{"2"}});
        script->fail("FROM customer", "42P01", "relation \"customer\" does not exist");

        const auto out = service.dashboard_metrics();
        REQUIRE(out.success);
        REQUIRE(out.metrics.get_int("total_warehouses") == 2);
        REQUIRE(out.metrics.get_int("total_customers") == 0);
        REQUIRE(out.warnings.size() == 1);
        REQUIRE(out.warnings[0].starts_with("Failed to get total_customers"));
        REQUIRE(events->count(EventLevel::WARN) >= 1);
        REQUIRE(out.to_json()["warnings"].size() == 1);
    }

    SECTION("Connection failure fails the call") {
        script->connect_failures = 1;

        const auto out = service.dashboard_metrics();
        REQUIRE_FALSE(out.success);
        REQUIRE(out.error_category == ErrorCategory::CONNECTIVITY);
        REQUIRE(out.error == "Database connection failed");
        REQUIRE(out.metrics.get_int("total_orders") == 0);
        REQUIRE_FALSE(script->executed("COUNT"));
    }
}
