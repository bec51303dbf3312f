#include "spanstore/row_codec.hpp"
#include "core/utils.hpp"
#include "model/json.hpp"
#include <bit>
#include <format>
#include <stdexcept>

namespace tracestore::codec {

int64_t parse_bigint(const std::string& text) {
    const auto value = utils::try_parse_int<int64_t>(text);
    if (!value) {
        throw std::invalid_argument(std::format("not a bigint: '{}'", text));
    }
    return *value;
}

uint64_t parse_unsigned_id(const std::string& text) {
    return std::bit_cast<uint64_t>(parse_bigint(text));
}

std::string format_unsigned_id(uint64_t id) {
    return std::to_string(std::bit_cast<int64_t>(id));
}

TraceId parse_trace_id(const std::string& low_text, const std::string& high_text) {
    return TraceId(parse_unsigned_id(high_text), parse_unsigned_id(low_text));
}

std::chrono::system_clock::time_point parse_epoch_micros(const std::string& text) {
    return utils::from_unix_micros(parse_bigint(text));
}

std::vector<KeyValue> parse_tags(const std::string& json_text) {
    if (json_text.empty()) {
        return {};
    }
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument(std::format("malformed tag JSON: {}", e.what()));
    }
    return tags_from_json(parsed);
}

std::string format_timestamp_param(const std::chrono::system_clock::time_point& tp) {
    return utils::format_timestamp_utc(tp);
}

} // namespace tracestore::codec
