#include <catch2/catch_test_macros.hpp>
#include "core/utils.hpp"
#include "model/json.hpp"
#include "model/trace.hpp"
#include "model/trace_id.hpp"
#include "spanstore/row_codec.hpp"
#include <limits>
#include <stdexcept>

using namespace tracestore;

TEST_CASE("TraceId: hex is 32 lowercase digits, high half first", "[model][trace_id]") {
    const TraceId id(0x1, 0xabcdef);
    CHECK(id.to_hex() == "0000000000000001" "0000000000abcdef");
    CHECK(TraceId().is_zero());
    CHECK_FALSE(id.is_zero());
}

TEST_CASE("TraceId: from_hex accepts short and full-width ids", "[model][trace_id]") {
    const auto short_id = TraceId::from_hex("abc");
    REQUIRE(short_id.has_value());
    CHECK(short_id->high == 0);
    CHECK(short_id->low == 0xabc);

    const auto full = TraceId::from_hex("FFFFFFFFFFFFFFFF0000000000000002");
    REQUIRE(full.has_value());
    CHECK(full->high == 0xFFFFFFFFFFFFFFFFULL);
    CHECK(full->low == 2);

    const auto odd = TraceId::from_hex("10000000000000001");
    REQUIRE(odd.has_value());
    CHECK(odd->high == 1);
    CHECK(odd->low == 1);
}

TEST_CASE("TraceId: from_hex rejects malformed input", "[model][trace_id]") {
    CHECK_FALSE(TraceId::from_hex("").has_value());
    CHECK_FALSE(TraceId::from_hex("xyz").has_value());
    CHECK_FALSE(TraceId::from_hex("-1").has_value());
    CHECK_FALSE(TraceId::from_hex(std::string(33, 'a')).has_value());
}

TEST_CASE("Codec: unsigned ids survive signed bigint columns", "[model][codec]") {
    CHECK(codec::format_unsigned_id(0) == "0");
    CHECK(codec::format_unsigned_id(42) == "42");
    CHECK(codec::format_unsigned_id(0xFFFFFFFFFFFFFFFFULL) == "-1");
    CHECK(codec::format_unsigned_id(0x8000000000000000ULL) == "-9223372036854775808");

    CHECK(codec::parse_unsigned_id("-1") == 0xFFFFFFFFFFFFFFFFULL);
    CHECK(codec::parse_unsigned_id("-9223372036854775808") == 0x8000000000000000ULL);

    const auto id = codec::parse_trace_id("-2", "7");
    CHECK(id.high == 7);
    CHECK(id.low == 0xFFFFFFFFFFFFFFFEULL);
}

TEST_CASE("Codec: malformed columns throw invalid_argument", "[model][codec]") {
    CHECK_THROWS_AS(codec::parse_bigint(""), std::invalid_argument);
    CHECK_THROWS_AS(codec::parse_bigint("12abc"), std::invalid_argument);
    CHECK_THROWS_AS(codec::parse_tags("{not json"), std::invalid_argument);
    CHECK_THROWS_AS(codec::parse_tags("[1, 2]"), std::invalid_argument);
}

TEST_CASE("Codec: tags decode typed and sorted by key", "[model][codec]") {
    CHECK(codec::parse_tags("").empty());
    CHECK(codec::parse_tags("{}").empty());

    const auto tags = codec::parse_tags(R"({"z": "last", "error": true, "http.status_code": 500, "ratio": 0.5})");
    REQUIRE(tags.size() == 4);
    CHECK(tags[0] == KeyValue("error", true));
    CHECK(tags[1] == KeyValue("http.status_code", int64_t{500}));
    CHECK(tags[2] == KeyValue("ratio", 0.5));
    CHECK(tags[3] == KeyValue("z", std::string("last")));
}

TEST_CASE("Codec: integers beyond int64 keep their digits", "[model][codec]") {
    const auto tags = codec::parse_tags(R"({"big": 18446744073709551615, "edge": 9223372036854775807})");
    REQUIRE(tags.size() == 2);
    CHECK(tags[0] == KeyValue("big", std::string("18446744073709551615")));
    CHECK(tags[1] == KeyValue("edge", std::numeric_limits<int64_t>::max()));
}

TEST_CASE("Codec: timestamp parameters are UTC with microseconds", "[model][codec]") {
    const auto tp = utils::from_unix_micros(1'700'000'000'000'123);
    CHECK(codec::format_timestamp_param(tp) == "2023-11-14T22:13:20.000123Z");
    CHECK(codec::parse_epoch_micros("1700000000000123") == tp);
}

TEST_CASE("SpanRefType: unknown storage values fall back to CHILD_OF", "[model]") {
    CHECK(parse_span_ref_type("FOLLOWS_FROM") == SpanRefType::FOLLOWS_FROM);
    CHECK(parse_span_ref_type("follows_from") == SpanRefType::FOLLOWS_FROM);
    CHECK(parse_span_ref_type("CHILD_OF") == SpanRefType::CHILD_OF);
    CHECK(parse_span_ref_type("") == SpanRefType::CHILD_OF);
    CHECK(parse_span_ref_type("sibling") == SpanRefType::CHILD_OF);
}

TEST_CASE("JSON: trace renders with hex ids and a processes object", "[model][json]") {
    Trace trace;
    Span span;
    span.trace_id = TraceId(0, 0x10);
    span.span_id = 0xff;
    span.operation_name = "GET /";
    span.flags = 1;
    span.start_time = utils::from_unix_micros(1000);
    span.duration = std::chrono::microseconds(25);
    span.tags = {KeyValue("http.method", std::string("GET"))};
    span.process_id = "p1";
    span.references.push_back(SpanRef{TraceId(0, 0x10), 0xaa, SpanRefType::FOLLOWS_FROM});
    trace.spans.push_back(span);
    trace.process_map.push_back(ProcessMapping{"p1", Process{"frontend", {}}});

    const nlohmann::json j = trace;
    CHECK(j["traceID"] == "00000000000000000000000000000010");
    REQUIRE(j["spans"].size() == 1);
    const auto& s = j["spans"][0];
    CHECK(s["spanID"] == "00000000000000ff");
    CHECK(s["startTime"] == 1000);
    CHECK(s["duration"] == 25);
    CHECK(s["processID"] == "p1");
    CHECK(s["tags"][0]["key"] == "http.method");
    CHECK(s["tags"][0]["type"] == "string");
    CHECK(s["references"][0]["refType"] == "FOLLOWS_FROM");
    CHECK(s["references"][0]["spanID"] == "00000000000000aa");
    CHECK(j["processes"]["p1"]["serviceName"] == "frontend");
}

TEST_CASE("JSON: dependency links carry names and call counts", "[model][json]") {
    const nlohmann::json j = DependencyLink{1, "frontend", 2, "backend", 3};
    CHECK(j["parent"] == "frontend");
    CHECK(j["child"] == "backend");
    CHECK(j["callCount"] == 3);
}
