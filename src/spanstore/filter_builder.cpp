#include "spanstore/filter_builder.hpp"
#include "spanstore/row_codec.hpp"
#include "spanstore/schema.hpp"
#include <format>

namespace tracestore {

FilterBuilder FilterBuilder::from_query(const TraceQueryParameters& query) {
    FilterBuilder builder;

    if (query.service_name && !query.service_name->empty()) {
        builder.add(schema::kServiceName, CompareOp::EQ, *query.service_name, "text");
    }
    if (query.operation_name && !query.operation_name->empty()) {
        builder.add(schema::kOperationName, CompareOp::EQ, *query.operation_name, "text");
    }
    if (query.start_time_min) {
        builder.add(schema::kStartTime, CompareOp::GE,
                    codec::format_timestamp_param(*query.start_time_min), "timestamptz");
    }
    if (query.start_time_max) {
        builder.add(schema::kStartTime, CompareOp::LE,
                    codec::format_timestamp_param(*query.start_time_max), "timestamptz");
    }
    if (query.duration_min && query.duration_min->count() > 0) {
        builder.add(schema::kDuration, CompareOp::GE,
                    std::to_string(query.duration_min->count()), "bigint");
    }
    if (query.duration_max && query.duration_max->count() > 0) {
        builder.add(schema::kDuration, CompareOp::LE,
                    std::to_string(query.duration_max->count()), "bigint");
    }
    for (const auto& [key, value] : query.tags) {
        builder.add_tag(schema::kSpanTags, key, value);
    }

    return builder;
}

FilterBuilder& FilterBuilder::add(std::string_view column, CompareOp op,
                                  std::string value, std::string_view cast) {
    predicates_.push_back(Predicate{std::string(column), op, std::move(value), std::string(cast)});
    return *this;
}

FilterBuilder& FilterBuilder::add_tag(std::string_view column, std::string key, std::string value) {
    predicates_.push_back(Predicate{std::string(column), CompareOp::TAG_EQ, std::move(value), "text", std::move(key)});
    return *this;
}

bool FilterBuilder::references(std::string_view table_alias) const {
    for (const auto& p : predicates_) {
        const std::string_view column = p.column;
        if (column.size() > table_alias.size() &&
            column.starts_with(table_alias) &&
            column[table_alias.size()] == '.') {
            return true;
        }
    }
    return false;
}

std::vector<Fragment> FilterBuilder::fragments(size_t first_param) const {
    std::vector<Fragment> out;
    out.reserve(predicates_.size());

    size_t index = first_param;
    for (const auto& p : predicates_) {
        if (p.op == CompareOp::TAG_EQ) {
            const size_t key_index = index++;
            out.push_back(Fragment{
                std::format("{} ->> ${}::text = ${}::{}", p.column, key_index, index++, p.cast),
                {p.key, p.value}});
        } else {
            out.push_back(Fragment{
                std::format("{} {} ${}::{}", p.column, compare_op_to_sql(p.op), index++, p.cast),
                {p.value}});
        }
    }
    return out;
}

std::string FilterBuilder::render(size_t first_param) const {
    std::string where;
    for (const auto& fragment : fragments(first_param)) {
        if (!where.empty()) where += " AND ";
        where += fragment.sql;
    }
    return where;
}

std::vector<std::string> FilterBuilder::params() const {
    std::vector<std::string> out;
    out.reserve(predicates_.size());
    for (const auto& p : predicates_) {
        if (p.op == CompareOp::TAG_EQ) out.push_back(p.key);
        out.push_back(p.value);
    }
    return out;
}

} // namespace tracestore
