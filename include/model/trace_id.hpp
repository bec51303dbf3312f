#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace tracestore {

/**
 * @brief 128-bit trace identifier split into high/low halves
 *
 * Hex form is 32 lowercase chars, high half first. Parsing accepts 1..32
 * hex chars; inputs of 16 chars or fewer populate only the low half.
 */
struct TraceId {
    uint64_t high = 0;
    uint64_t low = 0;

    TraceId() = default;
    TraceId(uint64_t h, uint64_t l) : high(h), low(l) {}

    [[nodiscard]] bool is_zero() const { return high == 0 && low == 0; }

    [[nodiscard]] std::string to_hex() const;

    [[nodiscard]] static std::optional<TraceId> from_hex(std::string_view hex);

    auto operator<=>(const TraceId&) const = default;
};

struct TraceIdHash {
    size_t operator()(const TraceId& id) const {
        return std::hash<uint64_t>()(id.high) ^ (std::hash<uint64_t>()(id.low) * 0x9e3779b97f4a7c15ULL);
    }
};

} // namespace tracestore
