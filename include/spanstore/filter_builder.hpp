#pragma once

#include "model/query_parameters.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace tracestore {

enum class CompareOp {
    EQ,         // =
    GE,         // >=
    LE,         // <=
    TAG_EQ      // ->> key = (jsonb member compared as text)
};

inline constexpr const char* compare_op_to_sql(CompareOp op) {
    switch (op) {
        case CompareOp::EQ:       return "=";
        case CompareOp::GE:       return ">=";
        case CompareOp::LE:       return "<=";
        case CompareOp::TAG_EQ:   return "=";
    }
    return "=";
}

/**
 * @brief One typed (column, operator, value) condition
 *
 * The value is never rendered into SQL text; it is bound as a positional
 * parameter and cast server-side to `cast`. TAG_EQ predicates also bind
 * `key` (one placeholder before the value) and compare the jsonb member's
 * text form, so numeric and boolean tags match their string spelling.
 */
struct Predicate {
    std::string column;
    CompareOp op = CompareOp::EQ;
    std::string value;
    std::string cast;
    std::string key;
};

/// Rendered SQL fragment with the values bound to its placeholders
struct Fragment {
    std::string sql;
    std::vector<std::string> values;
};

/**
 * @brief Builds the conjunctive WHERE clause for trace searches
 *
 * Fragments are emitted only for criteria that are present, in evaluation
 * order: service, operation, start-time min, start-time max, duration min,
 * duration max, then one text comparison per tag (sorted by key). All
 * fragments are ANDed. An empty builder matches every row.
 *
 * Usage:
 *   auto filter = FilterBuilder::from_query(query);
 *   std::string where = filter.render();        // "service.service_name = $1::text AND ..."
 *   auto params = filter.params();              // {"frontend", ...}
 */
class FilterBuilder {
public:
    FilterBuilder() = default;

    [[nodiscard]] static FilterBuilder from_query(const TraceQueryParameters& query);

    /// Append a condition; returns *this for chaining
    FilterBuilder& add(std::string_view column, CompareOp op, std::string value, std::string_view cast);

    /// Append `column ->> key = value` on a jsonb column
    FilterBuilder& add_tag(std::string_view column, std::string key, std::string value);

    [[nodiscard]] bool empty() const { return predicates_.empty(); }
    [[nodiscard]] size_t size() const { return predicates_.size(); }
    [[nodiscard]] const std::vector<Predicate>& predicates() const { return predicates_; }

    /// True if any predicate reads a column of the given table alias
    [[nodiscard]] bool references(std::string_view table_alias) const;

    /**
     * @brief Ordered fragments with their bound values
     * @param first_param Placeholder number of the first fragment ($first_param)
     */
    [[nodiscard]] std::vector<Fragment> fragments(size_t first_param = 1) const;

    /// Fragments joined with " AND "; empty string when there are none
    [[nodiscard]] std::string render(size_t first_param = 1) const;

    /// Bound values in placeholder order
    [[nodiscard]] std::vector<std::string> params() const;

private:
    std::vector<Predicate> predicates_;
};

} // namespace tracestore
