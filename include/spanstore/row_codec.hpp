#pragma once

#include "model/trace.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace tracestore::codec {

// ============================================================================
// Column decoding / parameter encoding
//
// Unsigned 64-bit ids live bit-for-bit in signed bigint columns. Decoders
// throw std::invalid_argument on malformed text; callers convert that into an
// INTERNAL_ERROR result at the row boundary.
// ============================================================================

[[nodiscard]] int64_t parse_bigint(const std::string& text);

/// Signed bigint text -> unsigned id (two's complement reinterpretation)
[[nodiscard]] uint64_t parse_unsigned_id(const std::string& text);

/// Unsigned id -> signed bigint text suitable for a $N::bigint parameter
[[nodiscard]] std::string format_unsigned_id(uint64_t id);

[[nodiscard]] TraceId parse_trace_id(const std::string& low_text, const std::string& high_text);

/// Microseconds since epoch (bigint text) -> time point
[[nodiscard]] std::chrono::system_clock::time_point parse_epoch_micros(const std::string& text);

/// jsonb object text -> key-sorted tags; empty text (SQL NULL) yields none
[[nodiscard]] std::vector<KeyValue> parse_tags(const std::string& json_text);

/// Timestamp parameter for a $N::timestamptz placeholder
[[nodiscard]] std::string format_timestamp_param(const std::chrono::system_clock::time_point& tp);

} // namespace tracestore::codec
