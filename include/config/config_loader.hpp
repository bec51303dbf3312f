#pragma once

#include "db/iconnection_pool.hpp"
#include "spanstore/reader_options.hpp"
#include <chrono>
#include <string>

namespace tracestore {

// ============================================================================
// Config sections (mirror the TOML hierarchy)
// ============================================================================

struct StorageConfig {
    std::string connection_string;
    size_t min_connections = 1;
    size_t max_connections = 8;
    std::chrono::milliseconds connection_timeout{5000};
    int idle_timeout_seconds = 300;
    int max_lifetime_seconds = 3600;
    std::string health_check_query = "SELECT 1";
    uint32_t query_timeout_ms = 30000;

    [[nodiscard]] PoolConfig to_pool_config() const;
};

struct ReaderConfig {
    int default_num_traces = 10;
    int overfetch_factor = 100;
    size_t max_parallel_fetches = 4;
    std::chrono::milliseconds request_timeout{0};   // 0 = no deadline

    [[nodiscard]] ReaderOptions to_reader_options(std::chrono::milliseconds acquire_timeout) const;
};

struct LoggingConfig {
    std::string level = "info";
};

struct TracestoreConfig {
    StorageConfig storage;
    ReaderConfig reader;
    LoggingConfig logging;
};

// ============================================================================
// ConfigLoader - Extract typed config from TOML
// ============================================================================

/**
 * @brief Loads tracestore.toml
 *
 * String values may reference environment variables as ${NAME}; unset
 * variables expand to the empty string.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        TracestoreConfig config;

        static LoadResult ok(TracestoreConfig cfg) {
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

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);
};

} // namespace tracestore
