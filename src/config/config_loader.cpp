#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace tracestore {

// ============================================================================
// TOML Parsing Helpers
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
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

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            s = expand_env_vars(s.get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

template<typename T>
T positive_or(const toml::table& tbl, std::string_view key, T fallback) {
    const auto v = tbl[key].value<int64_t>();
    if (!v) return fallback;
    if (*v <= 0) {
        throw std::runtime_error(std::format("'{}' must be positive, got {}", key, *v));
    }
    return static_cast<T>(*v);
}

template<typename T>
T non_negative_or(const toml::table& tbl, std::string_view key, T fallback) {
    const auto v = tbl[key].value<int64_t>();
    if (!v) return fallback;
    if (*v < 0) {
        throw std::runtime_error(std::format("'{}' must not be negative, got {}", key, *v));
    }
    return static_cast<T>(*v);
}

// ---- Section extractors ----------------------------------------------------

StorageConfig extract_storage(const toml::table& root) {
    StorageConfig cfg;
    const auto* storage = root["storage"].as_table();
    if (!storage) return cfg;
    const auto& s = *storage;

    cfg.connection_string = s["connection_string"].value_or(""s);
    cfg.min_connections = non_negative_or<size_t>(s, "min_connections", cfg.min_connections);
    cfg.max_connections = positive_or<size_t>(s, "max_connections", cfg.max_connections);
    cfg.connection_timeout = std::chrono::milliseconds(
        positive_or<int64_t>(s, "connection_timeout_ms", cfg.connection_timeout.count()));
    cfg.idle_timeout_seconds = non_negative_or<int>(s, "idle_timeout_seconds", cfg.idle_timeout_seconds);
    cfg.max_lifetime_seconds = non_negative_or<int>(s, "max_lifetime_seconds", cfg.max_lifetime_seconds);
    cfg.health_check_query = s["health_check_query"].value_or(cfg.health_check_query);
    cfg.query_timeout_ms = non_negative_or<uint32_t>(s, "query_timeout_ms", cfg.query_timeout_ms);

    if (cfg.min_connections > cfg.max_connections) {
        throw std::runtime_error(std::format("min_connections ({}) exceeds max_connections ({})",
            cfg.min_connections, cfg.max_connections));
    }
    return cfg;
}

ReaderConfig extract_reader(const toml::table& root) {
    ReaderConfig cfg;
    const auto* reader = root["reader"].as_table();
    if (!reader) return cfg;
    const auto& r = *reader;

    cfg.default_num_traces = positive_or<int>(r, "default_num_traces", cfg.default_num_traces);
    cfg.overfetch_factor = positive_or<int>(r, "overfetch_factor", cfg.overfetch_factor);
    cfg.max_parallel_fetches = positive_or<size_t>(r, "max_parallel_fetches", cfg.max_parallel_fetches);
    cfg.request_timeout = std::chrono::milliseconds(
        non_negative_or<int64_t>(r, "request_timeout_ms", cfg.request_timeout.count()));
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    if (!utils::log::parse_level(cfg.level)) {
        throw std::runtime_error(std::format("unknown logging level '{}'", cfg.level));
    }
    return cfg;
}

ConfigLoader::LoadResult extract_all(toml::table& root) {
    expand_env_vars_recursive(root);

    TracestoreConfig config;
    config.storage = extract_storage(root);
    config.reader = extract_reader(root);
    config.logging = extract_logging(root);
    return ConfigLoader::LoadResult::ok(std::move(config));
}

} // anonymous namespace

// ============================================================================
// Section conversions
// ============================================================================

PoolConfig StorageConfig::to_pool_config() const {
    PoolConfig pool;
    pool.connection_string = connection_string;
    pool.min_connections = min_connections;
    pool.max_connections = max_connections;
    pool.connection_timeout = connection_timeout;
    pool.idle_timeout = std::chrono::milliseconds(static_cast<int64_t>(idle_timeout_seconds) * 1000);
    pool.health_check_query = health_check_query;
    pool.max_lifetime = std::chrono::seconds(max_lifetime_seconds);
    pool.query_timeout_ms = query_timeout_ms;
    return pool;
}

ReaderOptions ReaderConfig::to_reader_options(std::chrono::milliseconds acquire_timeout) const {
    ReaderOptions options;
    options.default_num_traces = default_num_traces;
    options.overfetch_factor = overfetch_factor;
    options.max_parallel_fetches = max_parallel_fetches;
    options.acquire_timeout = acquire_timeout;
    return options;
}

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto root = toml::parse_file(config_path);
        return extract_all(root);
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to parse {}: {}", config_path, e.description()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Invalid config {}: {}", config_path, e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto root = toml::parse(toml_content);
        return extract_all(root);
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.description()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Invalid config: {}", e.what()));
    }
}

} // namespace tracestore
