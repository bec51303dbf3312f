#pragma once

#include "model/query_parameters.hpp"
#include <chrono>
#include <cstddef>

namespace tracestore {

/**
 * @brief Tuning knobs shared by the read-path components
 */
struct ReaderOptions {
    int default_num_traces = kDefaultNumTraces;
    // Rows fetched per requested trace before deduplication
    int overfetch_factor = 100;
    size_t max_parallel_fetches = 4;
    std::chrono::milliseconds acquire_timeout{5000};
};

} // namespace tracestore
