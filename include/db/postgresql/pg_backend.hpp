#pragma once

#include "db/idb_backend.hpp"

namespace tpccgw {

/**
 * @brief PostgreSQL backend
 *
 * libpq connection factory plus the PostgreSQL dialect.
 */
class PgBackend : public IDbBackend {
public:
    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::POSTGRESQL;
    }

    [[nodiscard]] SqlDialect dialect() const override;

    [[nodiscard]] std::shared_ptr<IConnectionFactory> create_connection_factory() override;
};

/**
 * @brief Cloud Spanner through its PostgreSQL interface
 *
 * Same libpq driver (PGAdapter or the emulator speak the PostgreSQL wire
 * protocol); only the dialect differs.
 */
class SpannerBackend : public IDbBackend {
public:
    [[nodiscard]] DatabaseType type() const override {
        return DatabaseType::SPANNER;
    }

    [[nodiscard]] SqlDialect dialect() const override;

    [[nodiscard]] std::shared_ptr<IConnectionFactory> create_connection_factory() override;
};

} // namespace tpccgw
