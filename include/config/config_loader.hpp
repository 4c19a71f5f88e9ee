#pragma once

#include "core/database_type.hpp"
#include "db/generic_query_executor.hpp"
#include "tpcc/tpcc_config.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace tpccgw {

// ============================================================================
// Config Sections (mirror the TOML hierarchy)
// ============================================================================

struct BackendConfig {
    DatabaseType type = DatabaseType::POSTGRESQL;
    std::string connection_string;
    std::string provider_name;          // empty: the dialect's name
};

struct AcidConfig {
    std::chrono::milliseconds durability_delay{100};
};

struct LoggingConfig {
    std::string level = "info";
};

struct GatewayConfig {
    BackendConfig backend;
    TpccConfig tpcc;                    // [tpcc] plus [service].region_name
    RetryPolicy retry;
    AcidConfig acid;
    LoggingConfig logging;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

/**
 * @brief Loads gateway.toml
 *
 * String values may reference the environment as ${VAR}; unset variables
 * expand to the empty string, an unclosed "${" is a load error. A top-level
 * `include = "other.toml"` (or an array of paths) is merged underneath the
 * including file, whose values win.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        GatewayConfig config;

        static LoadResult ok(GatewayConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load complete config from TOML file
     * @param config_path Path to gateway.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load complete config from TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Every violated constraint, empty when the config is usable
    [[nodiscard]] static std::vector<std::string> validate_config(const GatewayConfig& config);
};

/// Replace ${VAR} with the environment value; throws on an unclosed "${"
[[nodiscard]] std::string expand_env_vars(const std::string& input);

} // namespace tpccgw
