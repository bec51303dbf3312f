#include "model/json.hpp"
#include "core/utils.hpp"
#include <algorithm>
#include <format>
#include <limits>
#include <stdexcept>

namespace tracestore {

namespace {

std::string span_id_hex(uint64_t span_id) {
    return std::format("{:016x}", span_id);
}

const char* value_type_name(const KeyValue::Value& v) {
    switch (v.index()) {
        case 0: return "string";
        case 1: return "bool";
        case 2: return "int64";
        case 3: return "float64";
    }
    return "string";
}

} // anonymous namespace

void to_json(nlohmann::json& j, const TraceId& id) {
    j = id.to_hex();
}

void to_json(nlohmann::json& j, const KeyValue& kv) {
    j = nlohmann::json{{"key", kv.key}, {"type", value_type_name(kv.value)}};
    std::visit([&j](const auto& v) { j["value"] = v; }, kv.value);
}

void to_json(nlohmann::json& j, const Process& process) {
    j = nlohmann::json{{"serviceName", process.service_name}, {"tags", process.tags}};
}

void to_json(nlohmann::json& j, const SpanRef& ref) {
    j = nlohmann::json{
        {"refType", span_ref_type_to_string(ref.ref_type)},
        {"traceID", ref.trace_id},
        {"spanID", span_id_hex(ref.span_id)},
    };
}

void to_json(nlohmann::json& j, const Span& span) {
    j = nlohmann::json{
        {"traceID", span.trace_id},
        {"spanID", span_id_hex(span.span_id)},
        {"operationName", span.operation_name},
        {"references", span.references},
        {"flags", span.flags},
        {"startTime", utils::to_unix_micros(span.start_time)},
        {"duration", span.duration.count()},
        {"tags", span.tags},
        {"processID", span.process_id},
    };
}

void to_json(nlohmann::json& j, const Trace& trace) {
    auto processes = nlohmann::json::object();
    for (const auto& m : trace.process_map) {
        processes[m.process_id] = m.process;
    }

    j = nlohmann::json{
        {"traceID", trace.spans.empty() ? std::string{} : trace.spans.front().trace_id.to_hex()},
        {"spans", trace.spans},
        {"processes", std::move(processes)},
    };
}

void to_json(nlohmann::json& j, const DependencyLink& link) {
    j = nlohmann::json{
        {"parent", link.parent},
        {"child", link.child},
        {"callCount", link.call_count},
    };
}

void to_json(nlohmann::json& j, const Operation& op) {
    j = nlohmann::json{{"name", op.name}};
}

std::vector<KeyValue> tags_from_json(const nlohmann::json& obj) {
    std::vector<KeyValue> tags;
    if (obj.is_null()) return tags;
    if (!obj.is_object()) {
        throw std::invalid_argument(std::format("tag column is not a JSON object: {}", obj.dump()));
    }

    tags.reserve(obj.size());
    for (const auto& [key, val] : obj.items()) {
        if (val.is_string()) {
            tags.emplace_back(key, val.get<std::string>());
        } else if (val.is_boolean()) {
            tags.emplace_back(key, val.get<bool>());
        } else if (val.is_number_unsigned() &&
                   val.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            // Out of int64 range: keep the digits rather than wrap
            tags.emplace_back(key, val.dump());
        } else if (val.is_number_integer()) {
            tags.emplace_back(key, val.get<int64_t>());
        } else if (val.is_number_float()) {
            tags.emplace_back(key, val.get<double>());
        } else if (!val.is_null()) {
            tags.emplace_back(key, val.dump());
        }
    }

    std::sort(tags.begin(), tags.end(),
              [](const KeyValue& a, const KeyValue& b) { return a.key < b.key; });
    return tags;
}

nlohmann::json tags_to_json_object(const std::vector<KeyValue>& tags) {
    auto obj = nlohmann::json::object();
    for (const auto& kv : tags) {
        std::visit([&obj, &kv](const auto& v) { obj[kv.key] = v; }, kv.value);
    }
    return obj;
}

} // namespace tracestore
