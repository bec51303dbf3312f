#pragma once

#include "model/trace.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace tracestore {

// ============================================================================
// Output model -> JSON (Jaeger query API shape)
//
// Ids are hex strings, times and durations are microseconds. Picked up by
// nlohmann::json through ADL.
// ============================================================================

void to_json(nlohmann::json& j, const TraceId& id);
void to_json(nlohmann::json& j, const KeyValue& kv);
void to_json(nlohmann::json& j, const Process& process);
void to_json(nlohmann::json& j, const SpanRef& ref);
void to_json(nlohmann::json& j, const Span& span);
void to_json(nlohmann::json& j, const Trace& trace);
void to_json(nlohmann::json& j, const DependencyLink& link);
void to_json(nlohmann::json& j, const Operation& op);

/**
 * @brief Decode a flat JSON object of tags into a key-sorted tag list
 *
 * Nested objects and arrays are kept as their serialized JSON text; null
 * values are skipped.
 * @throws std::invalid_argument if the value is not a JSON object (or null)
 */
[[nodiscard]] std::vector<KeyValue> tags_from_json(const nlohmann::json& obj);

/// Inverse of tags_from_json for string-valued filters
[[nodiscard]] nlohmann::json tags_to_json_object(const std::vector<KeyValue>& tags);

} // namespace tracestore
