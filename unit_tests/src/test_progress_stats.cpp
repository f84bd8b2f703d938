#include <catch2/catch.hpp>

#include "handoff/progress_stats.hpp"

#include "unit_test_utils.hpp"

#include <chrono>

using namespace std::chrono_literals;

TEST_CASE("progress reports")
{
    handoff::test::recording_sink sink;
    const handoff::status_key key{"kv_store_node", 1, 2};
    const auto start = handoff::clock_type::now();

    auto stats = handoff::make_transfer_stats(start, 2s);

    SECTION("nothing is reported before the interval elapses")
    {
        stats.bytes = 10;

        CHECK_FALSE(handoff::maybe_send_status(stats, key, sink, start + 1999ms, 2s));
        CHECK(sink.snapshots.empty());
    }

    SECTION("reports are spaced by at least the interval and counters are cumulative")
    {
        auto now = start;

        for (int i = 0; i < 100; ++i) {
            now += 300ms;
            stats.bytes += 100;
            stats.objects += 1;
            handoff::maybe_send_status(stats, key, sink, now, 2s);
        }

        REQUIRE(sink.snapshots.size() >= 2);

        for (std::size_t i = 1; i < sink.snapshots.size(); ++i) {
            const auto& prev = sink.snapshots[i - 1];
            const auto& cur = sink.snapshots[i];

            CHECK(cur.timestamp - prev.timestamp >= 2s);
            CHECK(cur.bytes >= prev.bytes);
            CHECK(cur.objects >= prev.objects);
        }

        CHECK(sink.keys.front().module == "kv_store_node");
        CHECK(sink.keys.front().target_partition == 2);
    }

    SECTION("the next interval starts at the time of the report")
    {
        REQUIRE(handoff::maybe_send_status(stats, key, sink, start + 5s, 2s));
        CHECK(stats.interval_end == start + 7s);
        CHECK(stats.last_update == start + 5s);
        CHECK_FALSE(handoff::maybe_send_status(stats, key, sink, start + 6s, 2s));
    }
}
