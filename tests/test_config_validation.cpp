#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

using namespace tpccgw;

TEST_CASE("ConfigValidation: minimal config uses defaults", "[config][validation]") {
    const std::string toml = R"(
[backend]
connection_string = "host=localhost dbname=tpcc"
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.backend.type == DatabaseType::POSTGRESQL);
    CHECK(result.config.tpcc.stock_level_window == 20);
    CHECK(result.config.tpcc.delivery_mode == DeliveryMode::APPLY);
    CHECK(result.config.tpcc.region_name == "default");
    CHECK(result.config.retry.max_attempts == 3);
    CHECK(result.config.acid.durability_delay.count() == 100);
    CHECK(result.config.logging.level == "info");
}

TEST_CASE("ConfigValidation: full config is read", "[config][validation]") {
    const std::string toml = R"toml(
[service]
region_name = "us-east1"

[backend]
type = "spanner"
connection_string = "host=pgadapter port=5432 dbname=tpcc"
provider_name = "Spanner (PGAdapter)"

[tpcc]
stock_level_window = 40
delivery_mode = "simulate"
max_payment_amount = 5000.0
default_page_limit = 25

[retry]
max_attempts = 5
base_backoff_ms = 10
max_backoff_ms = 200

[acid]
durability_delay_ms = 250

[logging]
level = "debug"
)toml";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    const auto& c = result.config;
    CHECK(c.backend.type == DatabaseType::SPANNER);
    CHECK(c.backend.provider_name == "Spanner (PGAdapter)");
    CHECK(c.tpcc.region_name == "us-east1");
    CHECK(c.tpcc.stock_level_window == 40);
    CHECK(c.tpcc.delivery_mode == DeliveryMode::SIMULATE);
    CHECK(c.tpcc.max_payment_amount == 5000.0);
    CHECK(c.tpcc.default_page_limit == 25);
    CHECK(c.retry.max_attempts == 5);
    CHECK(c.retry.base_backoff.count() == 10);
    CHECK(c.retry.max_backoff.count() == 200);
    CHECK(c.acid.durability_delay.count() == 250);
    CHECK(c.logging.level == "debug");
}

TEST_CASE("ConfigValidation: empty connection_string fails", "[config][validation]") {
    const std::string toml = R"(
[backend]
type = "postgresql"
connection_string = ""
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("connection_string") != std::string::npos);
}

TEST_CASE("ConfigValidation: unknown backend type fails", "[config][validation]") {
    const std::string toml = R"(
[backend]
type = "oracle"
connection_string = "x"
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("oracle") != std::string::npos);
}

TEST_CASE("ConfigValidation: unknown delivery mode fails", "[config][validation]") {
    const std::string toml = R"(
[backend]
connection_string = "x"

[tpcc]
delivery_mode = "maybe"
)";
    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("delivery_mode") != std::string::npos);
}

TEST_CASE("ConfigValidation: every violation is reported", "[config][validation]") {
    const std::string toml = R"(
[backend]
connection_string = "x"

[tpcc]
stock_level_window = 0
max_payment_amount = -1.0
default_page_limit = 0

[retry]
max_attempts = 0
base_backoff_ms = 500
max_backoff_ms = 100

[acid]
durability_delay_ms = -5

[logging]
level = "verbose"
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.starts_with("Config validation failed:"));
    CHECK(result.error_message.find("stock_level_window") != std::string::npos);
    CHECK(result.error_message.find("max_payment_amount") != std::string::npos);
    CHECK(result.error_message.find("default_page_limit") != std::string::npos);
    CHECK(result.error_message.find("max_attempts") != std::string::npos);
    CHECK(result.error_message.find("backoff") != std::string::npos);
    CHECK(result.error_message.find("durability_delay_ms") != std::string::npos);
    CHECK(result.error_message.find("verbose") != std::string::npos);
}

TEST_CASE("ConfigValidation: malformed TOML fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[backend\nconnection_string = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to parse config"));
}

TEST_CASE("ConfigValidation: missing file fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/gateway.toml");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to load config"));
}
