#include <catch2/catch_test_macros.hpp>
#include "mocks/trace_fixtures.hpp"
#include "spanstore/dependency_aggregator.hpp"

using namespace tracestore;
using namespace tracestore::testing;

namespace {

const auto kHour = std::chrono::microseconds(std::chrono::hours(1));

} // anonymous namespace

TEST_CASE("DependencyAggregator: one edge gives one link", "[dependencies]") {
    TraceFixture fx;
    const auto s1 = fx.span(TraceId(0, 1), 1, "a", "call", at_ms(0));
    const auto s2 = fx.span(TraceId(0, 1), 2, "b", "handle", at_ms(1));
    fx.store->add_ref(s1, s2);

    DependencyAggregator aggregator(make_fake_pool(fx.store), ReaderOptions{});

    auto result = aggregator.get_dependencies(background(), at_ms(1000), kHour);
    REQUIRE(result.is_ok());
    REQUIRE(result.value().size() == 1);
    const auto& link = result.value().front();
    CHECK(link.parent == "a");
    CHECK(link.child == "b");
    CHECK(link.parent_id != link.child_id);
    CHECK(link.call_count == 1);

    SECTION("a second edge raises the count") {
        fx.store->add_ref(s1, s2);
        auto again = aggregator.get_dependencies(background(), at_ms(1000), kHour);
        REQUIRE(again.is_ok());
        REQUIRE(again.value().size() == 1);
        CHECK(again.value().front().call_count == 2);
    }

    SECTION("an edge outside the window contributes nothing") {
        const auto old_parent = fx.span(TraceId(0, 2), 3, "a", "call", at_ms(-2 * 3600 * 1000));
        const auto old_child = fx.span(TraceId(0, 2), 4, "b", "handle", at_ms(-2 * 3600 * 1000 + 1));
        fx.store->add_ref(old_parent, old_child);

        auto again = aggregator.get_dependencies(background(), at_ms(1000), kHour);
        REQUIRE(again.is_ok());
        REQUIRE(again.value().size() == 1);
        CHECK(again.value().front().call_count == 1);
    }
}

TEST_CASE("DependencyAggregator: each side resolves its own service", "[dependencies]") {
    TraceFixture fx;
    const auto front = fx.span(TraceId(0, 1), 1, "frontend", "GET /", at_ms(0));
    const auto back = fx.span(TraceId(0, 1), 2, "backend", "query", at_ms(1));
    const auto db = fx.span(TraceId(0, 1), 3, "postgres", "SELECT", at_ms(2));
    const auto back2 = fx.span(TraceId(0, 1), 4, "backend", "query", at_ms(3));
    fx.store->add_ref(front, back);
    fx.store->add_ref(back, db);
    fx.store->add_ref(front, back2);

    DependencyAggregator aggregator(make_fake_pool(fx.store), ReaderOptions{});
    auto result = aggregator.get_dependencies(background(), at_ms(10), kHour);

    REQUIRE(result.is_ok());
    const auto& links = result.value();
    REQUIRE(links.size() == 2);
    CHECK(links[0].parent == "backend");
    CHECK(links[0].child == "postgres");
    CHECK(links[0].call_count == 1);
    CHECK(links[1].parent == "frontend");
    CHECK(links[1].child == "backend");
    CHECK(links[1].call_count == 2);
}

TEST_CASE("DependencyAggregator: window bounds are inclusive", "[dependencies]") {
    TraceFixture fx;
    const auto s1 = fx.span(TraceId(0, 1), 1, "a", "call", at_ms(0));
    const auto s2 = fx.span(TraceId(0, 1), 2, "b", "handle", at_ms(5));
    fx.store->add_ref(s1, s2);
    DependencyAggregator aggregator(make_fake_pool(fx.store), ReaderOptions{});

    // Window ends exactly at the parent's start
    auto at_end = aggregator.get_dependencies(background(), at_ms(0), kHour);
    REQUIRE(at_end.is_ok());
    CHECK(at_end.value().size() == 1);

    // Window starts exactly at the parent's start
    auto at_start = aggregator.get_dependencies(
        background(), at_ms(1), std::chrono::microseconds(std::chrono::milliseconds(1)));
    REQUIRE(at_start.is_ok());
    CHECK(at_start.value().size() == 1);

    // Window ends just before it
    auto before = aggregator.get_dependencies(background(), at_ms(-1), kHour);
    REQUIRE(before.is_ok());
    CHECK(before.value().empty());
}

TEST_CASE("DependencyAggregator: no edges is an empty success", "[dependencies]") {
    TraceFixture fx;
    fx.span(TraceId(0, 1), 1, "a", "call", at_ms(0));
    DependencyAggregator aggregator(make_fake_pool(fx.store), ReaderOptions{});

    auto result = aggregator.get_dependencies(background(), at_ms(10), kHour);
    REQUIRE(result.is_ok());
    CHECK(result.value().empty());
}

TEST_CASE("DependencyAggregator: window is bound as timestamptz parameters", "[dependencies]") {
    TraceFixture fx;
    DependencyAggregator aggregator(make_fake_pool(fx.store), ReaderOptions{});

    auto result = aggregator.get_dependencies(background(), at_ms(0), kHour);
    REQUIRE(result.is_ok());

    const auto executed = fx.store->executed();
    REQUIRE(executed.size() == 1);
    CHECK(executed[0].sql.find("$1::timestamptz") != std::string::npos);
    CHECK(executed[0].params == std::vector<std::string>{
        "2023-11-14T21:13:20.000000Z", "2023-11-14T22:13:20.000000Z"});
}

TEST_CASE("DependencyAggregator: invalid window and storage errors", "[dependencies][errors]") {
    TraceFixture fx;

    SECTION("negative lookback") {
        DependencyAggregator aggregator(make_fake_pool(fx.store), ReaderOptions{});
        auto result = aggregator.get_dependencies(background(), at_ms(0), std::chrono::microseconds(-1));
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::INVALID_REQUEST);
        CHECK(fx.store->executed().empty());
    }

    SECTION("query failure") {
        fx.store->set_fail_hook([](const ExecutedQuery&) -> std::optional<std::string> {
            return "permission denied for table span_refs";
        });
        DependencyAggregator aggregator(make_fake_pool(fx.store), ReaderOptions{});
        auto result = aggregator.get_dependencies(background(), at_ms(0), kHour);
        REQUIRE(result.is_error());
        CHECK(result.error_category() == ErrorCategory::STORAGE_ERROR);
        CHECK(result.error_message() == "permission denied for table span_refs");
        CHECK(result.context().starts_with("get_dependencies window=["));
    }
}
