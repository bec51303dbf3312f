#include "spanstore/trace_grouper.hpp"

namespace tracestore {

void TraceGrouper::add(SpanRow row) {
    const TraceId id = row.span.trace_id;

    auto [it, inserted] = index_.try_emplace(id, groups_.size());
    if (inserted) {
        groups_.emplace_back();
    }
    Group& group = groups_[it->second];

    if (group.process_ids.insert(row.span.process_id).second) {
        group.trace.process_map.push_back(ProcessMapping{
            row.span.process_id,
            Process{std::move(row.service_name), std::move(row.process_tags)},
        });
    }

    span_locations_[row.row_id] = SpanLocation{it->second, group.trace.spans.size()};
    group.trace.spans.push_back(std::move(row.span));
}

bool TraceGrouper::attach_reference(int64_t source_row_id, SpanRef ref) {
    const auto it = span_locations_.find(source_row_id);
    if (it == span_locations_.end()) {
        return false;
    }
    groups_[it->second.group].trace.spans[it->second.span].references.push_back(ref);
    return true;
}

const Trace* TraceGrouper::find(const TraceId& id) const {
    const auto it = index_.find(id);
    return it == index_.end() ? nullptr : &groups_[it->second].trace;
}

std::vector<Trace> TraceGrouper::take() {
    std::vector<Trace> traces;
    traces.reserve(groups_.size());
    for (auto& group : groups_) {
        traces.push_back(std::move(group.trace));
    }
    groups_.clear();
    index_.clear();
    span_locations_.clear();
    return traces;
}

} // namespace tracestore
