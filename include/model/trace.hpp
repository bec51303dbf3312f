#pragma once

#include "model/trace_id.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tracestore {

// ============================================================================
// Tags
// ============================================================================

/**
 * @brief One tag: a key with a scalar value (jsonb scalar types only)
 */
struct KeyValue {
    using Value = std::variant<std::string, bool, int64_t, double>;

    std::string key;
    Value value;

    KeyValue() = default;
    KeyValue(std::string k, Value v) : key(std::move(k)), value(std::move(v)) {}

    [[nodiscard]] bool operator==(const KeyValue&) const = default;
};

// ============================================================================
// Process
// ============================================================================

struct Process {
    std::string service_name;
    std::vector<KeyValue> tags;   // sorted by key
};

struct ProcessMapping {
    std::string process_id;
    Process process;
};

// ============================================================================
// Span
// ============================================================================

enum class SpanRefType {
    CHILD_OF,
    FOLLOWS_FROM
};

inline constexpr const char* span_ref_type_to_string(SpanRefType type) {
    return type == SpanRefType::FOLLOWS_FROM ? "FOLLOWS_FROM" : "CHILD_OF";
}

/// Unknown or empty storage values map to CHILD_OF
[[nodiscard]] SpanRefType parse_span_ref_type(const std::string& str);

/**
 * @brief Outbound reference from a span to the span it points at
 */
struct SpanRef {
    TraceId trace_id;
    uint64_t span_id = 0;
    SpanRefType ref_type = SpanRefType::CHILD_OF;
};

struct Span {
    TraceId trace_id;
    uint64_t span_id = 0;
    std::string operation_name;
    std::vector<SpanRef> references;
    uint32_t flags = 0;
    std::chrono::system_clock::time_point start_time;
    std::chrono::microseconds duration{0};
    std::vector<KeyValue> tags;   // sorted by key
    std::string process_id;
};

// ============================================================================
// Trace
// ============================================================================

/**
 * @brief All spans sharing one trace id plus the trace's process map
 *
 * process_map holds exactly one entry per distinct process_id, in the order
 * process ids were first seen among the spans.
 */
struct Trace {
    std::vector<Span> spans;
    std::vector<ProcessMapping> process_map;

    [[nodiscard]] bool empty() const { return spans.empty(); }

    [[nodiscard]] const Process* find_process(const std::string& process_id) const {
        for (const auto& m : process_map) {
            if (m.process_id == process_id) return &m.process;
        }
        return nullptr;
    }
};

// ============================================================================
// Dependencies
// ============================================================================

struct DependencyLink {
    int64_t parent_id = 0;
    std::string parent;
    int64_t child_id = 0;
    std::string child;
    uint64_t call_count = 0;
};

// ============================================================================
// Catalog
// ============================================================================

struct Operation {
    std::string name;

    [[nodiscard]] bool operator==(const Operation&) const = default;
};

} // namespace tracestore
