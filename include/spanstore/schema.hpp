#pragma once

#include <string_view>

namespace tracestore::schema {

// Filterable columns, qualified by the aliases the reader's queries use
// ("span", "service", "operation").
inline constexpr std::string_view kServiceName   = "service.service_name";
inline constexpr std::string_view kOperationName = "operation.operation_name";
inline constexpr std::string_view kStartTime     = "span.start_time";
inline constexpr std::string_view kDuration      = "span.duration";
inline constexpr std::string_view kSpanTags      = "span.tags";

inline constexpr std::string_view kServiceAlias   = "service";
inline constexpr std::string_view kOperationAlias = "operation";

} // namespace tracestore::schema
