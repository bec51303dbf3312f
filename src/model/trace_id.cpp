#include "model/trace_id.hpp"
#include "core/utils.hpp"
#include <format>

namespace tracestore {

namespace {

bool is_valid_hex(std::string_view s) {
    for (char c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F'))) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

std::string TraceId::to_hex() const {
    return std::format("{:016x}{:016x}", high, low);
}

std::optional<TraceId> TraceId::from_hex(std::string_view hex) {
    if (hex.empty() || hex.size() > 32 || !is_valid_hex(hex)) {
        return std::nullopt;
    }

    TraceId id;
    if (hex.size() > 16) {
        const auto split = hex.size() - 16;
        const auto high = utils::try_parse_int<uint64_t>(hex.substr(0, split), 16);
        const auto low = utils::try_parse_int<uint64_t>(hex.substr(split), 16);
        if (!high || !low) return std::nullopt;
        id.high = *high;
        id.low = *low;
    } else {
        const auto low = utils::try_parse_int<uint64_t>(hex, 16);
        if (!low) return std::nullopt;
        id.low = *low;
    }
    return id;
}

} // namespace tracestore
