#include <catch2/catch_test_macros.hpp>
#include "core/utils.hpp"
#include "spanstore/dependency_aggregator.hpp"
#include "spanstore/trace_grouper.hpp"

using namespace tracestore;

namespace {

SpanRow make_row(int64_t row_id, TraceId trace, uint64_t span_id,
                 const std::string& process_id, const std::string& service) {
    SpanRow row;
    row.row_id = row_id;
    row.span.trace_id = trace;
    row.span.span_id = span_id;
    row.span.process_id = process_id;
    row.span.start_time = utils::from_unix_micros(row_id * 1000);
    row.service_name = service;
    return row;
}

} // anonymous namespace

TEST_CASE("TraceGrouper: N spans with K processes give K process entries", "[grouper]") {
    const TraceId id(0, 7);
    TraceGrouper grouper;
    grouper.add(make_row(1, id, 101, "p1", "frontend"));
    grouper.add(make_row(2, id, 102, "p2", "backend"));
    grouper.add(make_row(3, id, 103, "p1", "frontend"));
    grouper.add(make_row(4, id, 104, "p2", "backend"));

    REQUIRE(grouper.trace_count() == 1);
    const Trace* trace = grouper.find(id);
    REQUIRE(trace != nullptr);
    CHECK(trace->spans.size() == 4);
    REQUIRE(trace->process_map.size() == 2);
    CHECK(trace->process_map[0].process_id == "p1");
    CHECK(trace->process_map[1].process_id == "p2");
    REQUIRE(trace->find_process("p2") != nullptr);
    CHECK(trace->find_process("p2")->service_name == "backend");
}

TEST_CASE("TraceGrouper: first occurrence of a process wins", "[grouper]") {
    const TraceId id(0, 7);
    auto first = make_row(1, id, 101, "p1", "frontend");
    first.process_tags = {KeyValue("hostname", std::string("web-1"))};
    auto second = make_row(2, id, 102, "p1", "renamed");
    second.process_tags = {KeyValue("hostname", std::string("web-2"))};

    TraceGrouper grouper;
    grouper.add(std::move(first));
    grouper.add(std::move(second));

    const Trace* trace = grouper.find(id);
    REQUIRE(trace != nullptr);
    REQUIRE(trace->process_map.size() == 1);
    CHECK(trace->process_map[0].process.service_name == "frontend");
    CHECK(trace->process_map[0].process.tags.front() == KeyValue("hostname", std::string("web-1")));
}

TEST_CASE("TraceGrouper: spans group by trace id in first-seen order", "[grouper]") {
    TraceGrouper grouper;
    grouper.add(make_row(1, TraceId(0, 2), 1, "p", "a"));
    grouper.add(make_row(2, TraceId(0, 1), 2, "p", "a"));
    grouper.add(make_row(3, TraceId(0, 2), 3, "p", "a"));

    CHECK(grouper.find(TraceId(0, 3)) == nullptr);

    const auto traces = grouper.take();
    REQUIRE(traces.size() == 2);
    CHECK(traces[0].spans.front().trace_id == TraceId(0, 2));
    CHECK(traces[0].spans.size() == 2);
    CHECK(traces[1].spans.size() == 1);
    CHECK(grouper.trace_count() == 0);
}

TEST_CASE("TraceGrouper: references attach to their source span", "[grouper]") {
    const TraceId id(0, 9);
    TraceGrouper grouper;
    grouper.add(make_row(10, id, 1, "p", "a"));
    grouper.add(make_row(11, id, 2, "p", "a"));

    CHECK(grouper.attach_reference(10, SpanRef{id, 2, SpanRefType::CHILD_OF}));
    CHECK_FALSE(grouper.attach_reference(99, SpanRef{id, 3, SpanRefType::CHILD_OF}));

    const Trace* trace = grouper.find(id);
    REQUIRE(trace != nullptr);
    REQUIRE(trace->spans[0].references.size() == 1);
    CHECK(trace->spans[0].references[0].span_id == 2);
    CHECK(trace->spans[1].references.empty());
}

TEST_CASE("DependencyGrouper: equal service pairs merge their counts", "[grouper][dependencies]") {
    DependencyGrouper grouper;
    grouper.add(1, "frontend", 2, "backend", 3);
    grouper.add(2, "backend", 3, "db", 1);
    grouper.add(1, "frontend", 2, "backend", 2);

    auto links = grouper.take();
    REQUIRE(links.size() == 2);
    CHECK(links[0].parent == "frontend");
    CHECK(links[0].child == "backend");
    CHECK(links[0].call_count == 5);
    CHECK(links[1].parent == "backend");
    CHECK(links[1].call_count == 1);

    // Reusable after take()
    grouper.add(1, "frontend", 2, "backend", 1);
    links = grouper.take();
    REQUIRE(links.size() == 1);
    CHECK(links[0].call_count == 1);
}
