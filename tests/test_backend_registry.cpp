#include <catch2/catch_test_macros.hpp>
#include "db/backend_registry.hpp"
#include "db/postgresql/pg_backend.hpp"

#include <stdexcept>

using namespace tpccgw;

TEST_CASE("BackendRegistry", "[backend]") {
    auto& registry = BackendRegistry::instance();
    registry.clear();

    SECTION("Unregistered type throws") {
        REQUIRE_FALSE(registry.has_backend(DatabaseType::SPANNER));
        REQUIRE_THROWS_AS(registry.create(DatabaseType::SPANNER), std::runtime_error);
    }

    SECTION("Both wire-compatible backends resolve to their dialect") {
        registry.register_backend(DatabaseType::POSTGRESQL, [] { return std::make_unique<PgBackend>(); });
        registry.register_backend(DatabaseType::SPANNER, [] { return std::make_unique<SpannerBackend>(); });

        REQUIRE(registry.registered().size() == 2);

        const auto pg = registry.create(DatabaseType::POSTGRESQL);
        REQUIRE(pg->type() == DatabaseType::POSTGRESQL);
        REQUIRE(pg->dialect().provider_name == "PostgreSQL");

        const auto spanner = registry.create(DatabaseType::SPANNER);
        REQUIRE(spanner->type() == DatabaseType::SPANNER);
        REQUIRE(spanner->dialect().begin_read_only == "BEGIN READ ONLY");
        REQUIRE(spanner->create_connection_factory() != nullptr);
    }

    SECTION("Executor carries the configured provider name") {
        registry.register_backend(DatabaseType::SPANNER, [] { return std::make_unique<SpannerBackend>(); });

        const auto executor = registry.create_executor(
            DatabaseType::SPANNER, GenericQueryExecutor::Config{"host=localhost", "", {}});
        REQUIRE(executor->provider_name() == "Google Spanner");
        REQUIRE(executor->dialect().type == DatabaseType::SPANNER);

        const auto named = registry.create_executor(
            DatabaseType::SPANNER, GenericQueryExecutor::Config{"host=localhost", "Spanner (PGAdapter)", {}});
        REQUIRE(named->provider_name() == "Spanner (PGAdapter)");
    }

    registry.clear();
}
