#include <catch2/catch_test_macros.hpp>
#include "core/utils.hpp"
#include "spanstore/filter_builder.hpp"
#include "spanstore/trace_id_finder.hpp"

using namespace tracestore;

TEST_CASE("FilterBuilder: empty query produces no predicates", "[filter]") {
    TraceQueryParameters query;
    const auto filter = FilterBuilder::from_query(query);

    CHECK(filter.empty());
    CHECK(filter.render().empty());
    CHECK(filter.params().empty());
    CHECK_FALSE(filter.references("service"));
}

TEST_CASE("FilterBuilder: every field renders with its own placeholder", "[filter]") {
    TraceQueryParameters query;
    query.service_name = "frontend";
    query.operation_name = "GET /";
    query.start_time_min = utils::from_unix_micros(1'000'000);
    query.start_time_max = utils::from_unix_micros(2'000'000);
    query.duration_min = std::chrono::microseconds(100);
    query.duration_max = std::chrono::microseconds(500);
    query.tags["http.status_code"] = "200";

    const auto filter = FilterBuilder::from_query(query);
    REQUIRE(filter.size() == 7);

    CHECK(filter.render() ==
        "service.service_name = $1::text AND "
        "operation.operation_name = $2::text AND "
        "span.start_time >= $3::timestamptz AND "
        "span.start_time <= $4::timestamptz AND "
        "span.duration >= $5::bigint AND "
        "span.duration <= $6::bigint AND "
        "span.tags ->> $7::text = $8::text");

    const auto params = filter.params();
    CHECK(params[0] == "frontend");
    CHECK(params[1] == "GET /");
    CHECK(params[2] == "1970-01-01T00:00:01.000000Z");
    CHECK(params[3] == "1970-01-01T00:00:02.000000Z");
    CHECK(params[4] == "100");
    CHECK(params[5] == "500");
    REQUIRE(params.size() == 8);
    CHECK(params[6] == "http.status_code");
    CHECK(params[7] == "200");
}

TEST_CASE("FilterBuilder: values never appear in the rendered text", "[filter][injection]") {
    TraceQueryParameters query;
    query.service_name = "x'; DROP TABLE spans; --";

    const auto filter = FilterBuilder::from_query(query);
    const auto where = filter.render();

    CHECK(where == "service.service_name = $1::text");
    CHECK(where.find("DROP") == std::string::npos);
    CHECK(filter.params().front() == "x'; DROP TABLE spans; --");
}

TEST_CASE("FilterBuilder: empty strings and zero durations are ignored", "[filter]") {
    TraceQueryParameters query;
    query.service_name = "";
    query.operation_name = "";
    query.duration_min = std::chrono::microseconds(0);
    query.duration_max = std::chrono::microseconds(0);

    CHECK(FilterBuilder::from_query(query).empty());
}

TEST_CASE("FilterBuilder: placeholders start at the requested index", "[filter]") {
    FilterBuilder filter;
    filter.add("span.duration", CompareOp::GE, "10", "bigint")
          .add("span.duration", CompareOp::LE, "20", "bigint");

    CHECK(filter.render(3) == "span.duration >= $3::bigint AND span.duration <= $4::bigint");

    const auto fragments = filter.fragments(1);
    REQUIRE(fragments.size() == 2);
    CHECK(fragments[1].sql == "span.duration <= $2::bigint");
    CHECK(fragments[1].values == std::vector<std::string>{"20"});
}

TEST_CASE("FilterBuilder: references matches the table alias exactly", "[filter]") {
    FilterBuilder filter;
    filter.add("service.service_name", CompareOp::EQ, "a", "text");

    CHECK(filter.references("service"));
    CHECK_FALSE(filter.references("serv"));
    CHECK_FALSE(filter.references("operation"));
}

TEST_CASE("FilterBuilder: one text comparison per tag, key-ordered", "[filter]") {
    TraceQueryParameters query;
    query.tags["b"] = "2";
    query.tags["a"] = "1";

    const auto filter = FilterBuilder::from_query(query);
    REQUIRE(filter.size() == 2);
    CHECK(filter.predicates()[0].op == CompareOp::TAG_EQ);
    CHECK(filter.render() == "span.tags ->> $1::text = $2::text AND span.tags ->> $3::text = $4::text");
    CHECK(filter.params() == std::vector<std::string>{"a", "1", "b", "2"});
}

TEST_CASE("TraceIdFinder: query joins only the tables the filter needs", "[filter][finder]") {
    TraceIdFinder finder(nullptr, ReaderOptions{});

    SECTION("no filter") {
        const auto [sql, params] = finder.build_query(FilterBuilder{}, 1000);
        CHECK(sql.find("JOIN") == std::string::npos);
        CHECK(sql.find("WHERE") == std::string::npos);
        CHECK(sql.find("ORDER BY span.start_time DESC") != std::string::npos);
        CHECK(sql.ends_with("LIMIT $1::bigint"));
        REQUIRE(params.size() == 1);
        CHECK(params[0] == "1000");
    }

    SECTION("service filter") {
        TraceQueryParameters query;
        query.service_name = "frontend";
        const auto [sql, params] = finder.build_query(FilterBuilder::from_query(query), 50);
        CHECK(sql.find("JOIN services AS service") != std::string::npos);
        CHECK(sql.find("JOIN operations") == std::string::npos);
        CHECK(sql.find("WHERE service.service_name = $1::text\n") != std::string::npos);
        CHECK(sql.ends_with("LIMIT $2::bigint"));
        REQUIRE(params.size() == 2);
        CHECK(params[1] == "50");
    }

    SECTION("operation filter") {
        TraceQueryParameters query;
        query.operation_name = "GET /";
        const auto [sql, params] = finder.build_query(FilterBuilder::from_query(query), 50);
        CHECK(sql.find("JOIN operations AS operation") != std::string::npos);
        CHECK(sql.find("JOIN services") == std::string::npos);
    }
}

TEST_CASE("TraceIdFinder: validate rejects inverted ranges", "[filter][finder]") {
    TraceQueryParameters query;
    CHECK(TraceIdFinder::validate(query).empty());

    query.start_time_min = utils::from_unix_micros(2000);
    query.start_time_max = utils::from_unix_micros(1000);
    CHECK_FALSE(TraceIdFinder::validate(query).empty());

    query.start_time_max = utils::from_unix_micros(2000);
    CHECK(TraceIdFinder::validate(query).empty());

    query.duration_min = std::chrono::microseconds(500);
    query.duration_max = std::chrono::microseconds(100);
    CHECK(TraceIdFinder::validate(query).find("duration") != std::string::npos);

    // Zero max means "unbounded"
    query.duration_max = std::chrono::microseconds(0);
    CHECK(TraceIdFinder::validate(query).empty());
}
