#include "model/trace.hpp"
#include "core/utils.hpp"

namespace tracestore {

SpanRefType parse_span_ref_type(const std::string& str) {
    const std::string lower = utils::to_lower(str);
    if (lower == "follows_from" || lower == "follows-from") {
        return SpanRefType::FOLLOWS_FROM;
    }
    return SpanRefType::CHILD_OF;
}

} // namespace tracestore
