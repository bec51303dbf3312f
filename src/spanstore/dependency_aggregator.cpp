#include "spanstore/dependency_aggregator.hpp"
#include "core/utils.hpp"
#include "spanstore/row_codec.hpp"
#include "spanstore/store_session.hpp"
#include <format>
#include <functional>
#include <stdexcept>

namespace tracestore {

namespace {

constexpr const char* kSelectDependencies =
    "SELECT parent_span.service_id AS parent_id, parent_service.service_name AS parent,\n"
    "       child_span.service_id AS child_id, child_service.service_name AS child,\n"
    "       COUNT(*) AS call_count\n"
    "FROM span_refs AS ref\n"
    "JOIN spans AS parent_span ON parent_span.id = ref.source_span_id\n"
    "JOIN services AS parent_service ON parent_service.id = parent_span.service_id\n"
    "JOIN spans AS child_span ON child_span.id = ref.child_span_id\n"
    "JOIN services AS child_service ON child_service.id = child_span.service_id\n"
    "WHERE parent_span.start_time >= $1::timestamptz AND parent_span.start_time <= $2::timestamptz\n"
    "GROUP BY parent_span.service_id, parent_service.service_name,\n"
    "         child_span.service_id, child_service.service_name\n"
    "ORDER BY parent_service.service_name ASC, child_service.service_name ASC";

} // anonymous namespace

// ============================================================================
// DependencyGrouper
// ============================================================================

size_t DependencyGrouper::KeyHash::operator()(const Key& k) const {
    size_t h = std::hash<int64_t>()(std::get<0>(k));
    h = h * 31 + std::hash<std::string>()(std::get<1>(k));
    h = h * 31 + std::hash<int64_t>()(std::get<2>(k));
    h = h * 31 + std::hash<std::string>()(std::get<3>(k));
    return h;
}

void DependencyGrouper::add(int64_t parent_id, const std::string& parent,
                            int64_t child_id, const std::string& child, uint64_t calls) {
    auto [it, inserted] = index_.try_emplace(Key{parent_id, parent, child_id, child}, links_.size());
    if (inserted) {
        links_.push_back(DependencyLink{parent_id, parent, child_id, child, 0});
    }
    links_[it->second].call_count += calls;
}

std::vector<DependencyLink> DependencyGrouper::take() {
    auto links = std::move(links_);
    links_.clear();
    index_.clear();
    return links;
}

// ============================================================================
// DependencyAggregator
// ============================================================================

DependencyAggregator::DependencyAggregator(std::shared_ptr<IConnectionPool> pool, const ReaderOptions& options)
    : pool_(std::move(pool)), options_(options) {}

Result<std::vector<DependencyLink>> DependencyAggregator::get_dependencies(
    const RequestContext& ctx,
    std::chrono::system_clock::time_point end_time,
    std::chrono::microseconds lookback) const {

    const auto start_time = end_time - lookback;
    const std::string context = std::format("get_dependencies window=[{}, {}]",
        utils::format_timestamp_utc(start_time), utils::format_timestamp_utc(end_time));

    if (lookback.count() < 0) {
        return Result<std::vector<DependencyLink>>::error(
            ErrorCategory::INVALID_REQUEST, "lookback must not be negative", context);
    }

    const std::vector<std::string> params = {
        codec::format_timestamp_param(start_time),
        codec::format_timestamp_param(end_time),
    };

    auto rs = StoreSession::run(*pool_, ctx, options_.acquire_timeout, kSelectDependencies, params, context);
    if (rs.is_error()) {
        return Result<std::vector<DependencyLink>>::partial(
            {}, rs.error_category(), rs.error_message(), rs.context());
    }

    DependencyGrouper grouper;
    try {
        for (const auto& row : rs.value().rows) {
            if (row.size() < 5) {
                throw std::invalid_argument(std::format("expected 5 columns, got {}", row.size()));
            }
            grouper.add(codec::parse_bigint(row[0]), row[1],
                        codec::parse_bigint(row[2]), row[3],
                        static_cast<uint64_t>(codec::parse_bigint(row[4])));
        }
    } catch (const std::exception& e) {
        return Result<std::vector<DependencyLink>>::partial(
            grouper.take(), ErrorCategory::INTERNAL_ERROR, std::format("bad dependency row: {}", e.what()), context);
    }

    auto links = grouper.take();
    utils::log::debug(std::format("{}: {} links", context, links.size()));
    return Result<std::vector<DependencyLink>>::ok(std::move(links));
}

} // namespace tracestore
