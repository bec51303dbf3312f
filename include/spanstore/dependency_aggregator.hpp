#pragma once

#include "core/error.hpp"
#include "core/request_context.hpp"
#include "db/iconnection_pool.hpp"
#include "model/trace.hpp"
#include "spanstore/reader_options.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

namespace tracestore {

/**
 * @brief Accumulates call counts per (parent service, child service) pair
 *
 * Links keep the order in which their pair was first added.
 */
class DependencyGrouper {
public:
    void add(int64_t parent_id, const std::string& parent,
             int64_t child_id, const std::string& child, uint64_t calls);

    [[nodiscard]] std::vector<DependencyLink> take();

private:
    using Key = std::tuple<int64_t, std::string, int64_t, std::string>;

    struct KeyHash {
        size_t operator()(const Key& k) const;
    };

    std::vector<DependencyLink> links_;
    std::unordered_map<Key, size_t, KeyHash> index_;
};

/**
 * @brief Computes service-to-service call counts from span references
 *
 * Each reference edge counts once for (service of the referencing span,
 * service of the referenced span). The two sides are resolved through
 * separate span/service joins. Only edges whose referencing span starts in
 * [end_time - lookback, end_time] are counted.
 */
class DependencyAggregator {
public:
    DependencyAggregator(std::shared_ptr<IConnectionPool> pool, const ReaderOptions& options);

    [[nodiscard]] Result<std::vector<DependencyLink>> get_dependencies(
        const RequestContext& ctx,
        std::chrono::system_clock::time_point end_time,
        std::chrono::microseconds lookback) const;

private:
    std::shared_ptr<IConnectionPool> pool_;
    ReaderOptions options_;
};

} // namespace tracestore
