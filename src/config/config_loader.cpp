#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace tpccgw {

// ============================================================================
// Environment Expansion
// ============================================================================

std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        if (auto* s = val.as_string()) {
            *s = expand_env_vars(s->get());
        } else if (auto* t = val.as_table()) {
            expand_env_vars_recursive(*t);
        } else if (auto* a = val.as_array()) {
            expand_env_vars_in_array(*a);
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto&& elem : arr) {
        if (auto* s = elem.as_string()) {
            *s = expand_env_vars(s->get());
        } else if (auto* t = elem.as_table()) {
            expand_env_vars_recursive(*t);
        } else if (auto* a = elem.as_array()) {
            expand_env_vars_in_array(*a);
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (auto&& [key, val] : overlay) {
        auto* base_table = base[key.str()].as_table();
        if (val.is_table() && base_table) {
            merge_tables(*base_table, *val.as_table());
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10, possible circular include");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (const auto* single = inc_node.as_string()) {
        paths.emplace_back(single->get());
    } else if (const auto* list = inc_node.as_array()) {
        for (auto&& item : *list) {
            if (const auto* s = item.as_string()) {
                paths.emplace_back(s->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included file is the base, the including file wins
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Section extractors ----------------------------------------------------

BackendConfig extract_backend(const toml::table& root) {
    BackendConfig cfg;
    const auto* backend = root["backend"].as_table();
    if (!backend) return cfg;
    const auto& b = *backend;

    // parse_database_type throws on an unknown name; surfaced as a load error
    cfg.type = parse_database_type(b["type"].value_or("postgresql"s));
    cfg.connection_string = b["connection_string"].value_or(""s);
    cfg.provider_name = b["provider_name"].value_or(""s);
    return cfg;
}

TpccConfig extract_tpcc(const toml::table& root) {
    TpccConfig cfg;
    if (const auto* service = root["service"].as_table()) {
        cfg.region_name = (*service)["region_name"].value_or(cfg.region_name);
    }

    const auto* tpcc = root["tpcc"].as_table();
    if (!tpcc) return cfg;
    const auto& t = *tpcc;

    cfg.stock_level_window = t["stock_level_window"].value_or(cfg.stock_level_window);
    cfg.max_payment_amount = t["max_payment_amount"].value_or(cfg.max_payment_amount);
    cfg.default_page_limit = t["default_page_limit"].value_or(cfg.default_page_limit);

    const std::string mode = t["delivery_mode"].value_or("apply"s);
    const auto parsed = parse_delivery_mode(mode);
    if (!parsed) {
        throw std::runtime_error(std::format(
            "tpcc.delivery_mode must be 'apply' or 'simulate', got '{}'", mode));
    }
    cfg.delivery_mode = *parsed;
    return cfg;
}

RetryPolicy extract_retry(const toml::table& root) {
    RetryPolicy cfg;
    const auto* retry = root["retry"].as_table();
    if (!retry) return cfg;
    const auto& r = *retry;

    cfg.max_attempts = static_cast<uint32_t>(r["max_attempts"].value_or(int64_t{3}));
    cfg.base_backoff = std::chrono::milliseconds(r["base_backoff_ms"].value_or(int64_t{50}));
    cfg.max_backoff = std::chrono::milliseconds(r["max_backoff_ms"].value_or(int64_t{1000}));
    return cfg;
}

AcidConfig extract_acid(const toml::table& root) {
    AcidConfig cfg;
    if (const auto* acid = root["acid"].as_table()) {
        cfg.durability_delay = std::chrono::milliseconds(
            (*acid)["durability_delay_ms"].value_or(int64_t{100}));
    }
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* logging = root["logging"].as_table()) {
        cfg.level = (*logging)["level"].value_or("info"s);
    }
    return cfg;
}

GatewayConfig extract_all_sections(const toml::table& tbl) {
    GatewayConfig config;
    config.backend = extract_backend(tbl);
    config.tpcc = extract_tpcc(tbl);
    config.retry = extract_retry(tbl);
    config.acid = extract_acid(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

ConfigLoader::LoadResult validate_and_return(GatewayConfig config) {
    const auto errors = ConfigLoader::validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const GatewayConfig& config) {
    std::vector<std::string> errors;

    if (config.backend.connection_string.empty()) {
        errors.emplace_back("backend.connection_string must not be empty");
    }
    if (config.tpcc.stock_level_window < 1) {
        errors.push_back(std::format("tpcc.stock_level_window must be >= 1, got {}",
                                     config.tpcc.stock_level_window));
    }
    if (config.tpcc.max_payment_amount <= 0.0) {
        errors.emplace_back("tpcc.max_payment_amount must be > 0");
    }
    if (config.tpcc.default_page_limit < 1) {
        errors.emplace_back("tpcc.default_page_limit must be >= 1");
    }
    if (config.retry.max_attempts < 1) {
        errors.emplace_back("retry.max_attempts must be >= 1");
    }
    if (config.retry.base_backoff.count() < 0 || config.retry.max_backoff < config.retry.base_backoff) {
        errors.emplace_back("retry backoff must satisfy 0 <= base_backoff_ms <= max_backoff_ms");
    }
    if (config.acid.durability_delay.count() < 0) {
        errors.emplace_back("acid.durability_delay_ms must be >= 0");
    }

    static const char* const kLevels[] = {"debug", "info", "warn", "warning", "error"};
    bool level_known = false;
    for (const auto* level : kLevels) {
        if (utils::iequals(config.logging.level, level)) level_known = true;
    }
    if (!level_known) {
        errors.push_back(std::format("logging.level '{}' is not one of debug, info, warn, error",
                                     config.logging.level));
    }

    return errors;
}

} // namespace tpccgw
