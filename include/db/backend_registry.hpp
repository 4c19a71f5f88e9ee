#pragma once

#include "db/idb_backend.hpp"
#include "core/database_type.hpp"
#include <format>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <vector>

namespace tpccgw {

/**
 * @brief DatabaseType -> backend factory
 *
 * main() registers the compiled-in backends once at startup. PostgreSQL
 * and Spanner share the libpq driver, so both entries exist together or
 * not at all.
 */
class BackendRegistry {
public:
    using Factory = std::function<std::unique_ptr<IDbBackend>()>;

    static BackendRegistry& instance() {
        static BackendRegistry registry;
        return registry;
    }

    void register_backend(DatabaseType type, Factory factory) {
        factories_[type] = std::move(factory);
    }

    /// Throws std::runtime_error for a type that was not compiled in
    [[nodiscard]] std::unique_ptr<IDbBackend> create(DatabaseType type) const {
        const auto it = factories_.find(type);
        if (it == factories_.end()) {
            throw std::runtime_error(std::format(
                "Backend '{}' is not compiled in", database_type_to_string(type)));
        }
        return it->second();
    }

    /// Backend executor for `type` with the configured connection and retry
    [[nodiscard]] std::shared_ptr<IQueryExecutor> create_executor(
        DatabaseType type, GenericQueryExecutor::Config config,
        std::shared_ptr<IEventSink> events = nullptr) const {
        return create(type)->create_executor(std::move(config), std::move(events));
    }

    [[nodiscard]] bool has_backend(DatabaseType type) const {
        return factories_.contains(type);
    }

    [[nodiscard]] std::vector<DatabaseType> registered() const {
        std::vector<DatabaseType> out;
        out.reserve(factories_.size());
        for (const auto& [type, _] : factories_) out.push_back(type);
        return out;
    }

    void clear() { factories_.clear(); }

private:
    BackendRegistry() = default;

    std::map<DatabaseType, Factory> factories_;
};

} // namespace tpccgw
