#pragma once

#include "model/trace.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace tracestore {

/**
 * @brief One decoded span row with its joined service and process data
 */
struct SpanRow {
    int64_t row_id = 0;          // spans.id (storage key, used to attach references)
    Span span;
    std::string service_name;
    std::vector<KeyValue> process_tags;
};

/**
 * @brief Groups span rows into Trace aggregates keyed by trace id
 *
 * Traces and spans keep insertion order. Each trace's process map gets one
 * entry per distinct process id; later spans with an already-seen process id
 * do not add or overwrite an entry.
 */
class TraceGrouper {
public:
    void add(SpanRow row);

    /**
     * @brief Attach an outbound reference to the span stored under source_row_id
     * @return false if no span with that storage id was added
     */
    bool attach_reference(int64_t source_row_id, SpanRef ref);

    [[nodiscard]] size_t trace_count() const { return groups_.size(); }

    [[nodiscard]] const Trace* find(const TraceId& id) const;

    /// Move the traces out, in the order their first span was added
    [[nodiscard]] std::vector<Trace> take();

private:
    struct Group {
        Trace trace;
        std::unordered_set<std::string> process_ids;
    };

    struct SpanLocation {
        size_t group;
        size_t span;
    };

    std::vector<Group> groups_;
    std::unordered_map<TraceId, size_t, TraceIdHash> index_;
    std::unordered_map<int64_t, SpanLocation> span_locations_;
};

} // namespace tracestore
