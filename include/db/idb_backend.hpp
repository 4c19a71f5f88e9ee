#pragma once

#include "core/database_type.hpp"
#include "core/event_sink.hpp"
#include "db/iconnection_factory.hpp"
#include "db/generic_query_executor.hpp"
#include "db/sql_dialect.hpp"
#include <memory>
#include <string>

namespace tpccgw {

/**
 * @brief Abstract database backend: creates all DB-specific components
 *
 * Each backend provides its connection factory and dialect; the executor
 * itself is shared.
 *
 * Usage:
 *   auto backend = BackendRegistry::instance().create(DatabaseType::POSTGRESQL);
 *   auto executor = backend->create_executor(config, events);
 */
class IDbBackend {
public:
    virtual ~IDbBackend() = default;

    /** @brief Database type this backend supports */
    [[nodiscard]] virtual DatabaseType type() const = 0;

    /** @brief Statement fragments for this backend */
    [[nodiscard]] virtual SqlDialect dialect() const = 0;

    /** @brief Create the connection factory */
    [[nodiscard]] virtual std::shared_ptr<IConnectionFactory> create_connection_factory() = 0;

    /** @brief Wire factory, dialect and config into an executor */
    [[nodiscard]] std::shared_ptr<IQueryExecutor> create_executor(
        GenericQueryExecutor::Config config,
        std::shared_ptr<IEventSink> events = nullptr) {
        return std::make_shared<GenericQueryExecutor>(
            create_connection_factory(), dialect(), std::move(config), std::move(events));
    }
};

} // namespace tpccgw
