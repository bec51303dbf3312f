#include "model/query_parameters.hpp"
#include "core/utils.hpp"
#include <format>

namespace tracestore {

std::string TraceQueryParameters::describe() const {
    std::string out;
    auto append = [&out](const std::string& part) {
        if (!out.empty()) out += ' ';
        out += part;
    };

    if (service_name && !service_name->empty()) append(std::format("service={}", *service_name));
    if (operation_name && !operation_name->empty()) append(std::format("operation={}", *operation_name));
    if (start_time_min) append(std::format("start_min={}", utils::format_timestamp_utc(*start_time_min)));
    if (start_time_max) append(std::format("start_max={}", utils::format_timestamp_utc(*start_time_max)));
    if (duration_min) append(std::format("duration_min={}us", duration_min->count()));
    if (duration_max) append(std::format("duration_max={}us", duration_max->count()));
    for (const auto& [k, v] : tags) {
        append(std::format("tag:{}={}", k, v));
    }
    append(std::format("num_traces={}", num_traces));
    return out;
}

} // namespace tracestore
