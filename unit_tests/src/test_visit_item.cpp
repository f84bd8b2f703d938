#include <catch2/catch.hpp>

#include "handoff/handoff_error_table.h"
#include "handoff/handoff_exception.hpp"
#include "handoff/handoff_visitor.hpp"
#include "handoff/system_error.hpp"

#include "unit_test_utils.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

using namespace std::chrono_literals;

namespace ht = handoff::test;
namespace wire = handoff::wire;

namespace
{
    struct visitor_fixture
    {
        visitor_fixture()
            : wire{std::make_shared<ht::fake_wire>()}
            , connection{wire}
            , clock{10ms}
            , ctx{connection,
                  request,
                  codec,
                  sink,
                  {"kv_store_node", 1, 2},
                  60s,
                  2s,
                  clock.function(),
                  handoff::default_ack_threshold}
        {
            wire->handshaken = true;
            state.stats = handoff::make_transfer_stats(ctx.clock(), 2s);
        }

        auto visit_all(const std::vector<ht::item>& _items) -> void
        {
            for (const auto& i : _items) {
                state = handoff::visit_item(ctx, i.key, i.value, std::move(state));
                REQUIRE(state.ack_count <= handoff::default_ack_threshold);
            }
        }

        std::shared_ptr<ht::fake_wire> wire;
        ht::fake_transport connection;
        handoff::transfer_request request;
        ht::joining_codec codec;
        ht::recording_sink sink;
        ht::stepping_clock clock;
        handoff::visit_context ctx;
        handoff::transfer_state state;
    };
} // anonymous namespace

TEST_CASE("acknowledgment window")
{
    visitor_fixture f;

    SECTION("one keep-alive per full window")
    {
        const auto n = GENERATE(as<std::size_t>{}, 999, 1001, 2500, 3001);

        f.visit_all(ht::make_items(n));

        CHECK(f.wire->keep_alives == n / handoff::default_ack_threshold);
        CHECK(f.wire->objects == n);
        CHECK(f.state.total_sent == n);
        CHECK(f.state.ack_count == n - (n / handoff::default_ack_threshold) * handoff::default_ack_threshold);
        CHECK_FALSE(f.state.error);
    }

    SECTION("the keep-alive precedes the item which overflows the window")
    {
        f.visit_all(ht::make_items(1001));

        REQUIRE(f.wire->sent.size() == 1002);
        CHECK(f.wire->sent[1000].type == wire::message_type::oldsync);
        CHECK(f.wire->sent[1000].payload == "sync");
        CHECK(f.wire->sent[1001].type == wire::message_type::object);
        CHECK(f.wire->sent[1001].payload == "key_1000=value_1000");
        CHECK(f.state.ack_count == 1);
    }

    SECTION("keep-alive bytes are counted")
    {
        f.visit_all(ht::make_items(1001));

        std::uint64_t expected = 0;
        for (const auto& m : f.wire->sent) {
            expected += wire::message_size(m.payload);
        }

        CHECK(f.state.stats.bytes == expected);
        CHECK(f.state.stats.objects == 1001);
    }
}

TEST_CASE("error latch")
{
    visitor_fixture f;

    SECTION("no writes after a failed send and the total is frozen")
    {
        f.wire->stop_after_objects = 1500;
        f.wire->send_error = handoff::make_error_code(SYS_SOCK_WRITE_ERR - EPIPE);

        f.visit_all(ht::make_items(2500));

        CHECK(f.wire->objects == 1500);
        CHECK(f.state.total_sent == 1500);
        CHECK(handoff::get_handoff_error_code(f.state.error) == SYS_SOCK_WRITE_ERR);
        CHECK(f.wire->sent.size() == 1500 + 1);
    }

    SECTION("a failed keep-alive drops the triggering item")
    {
        f.wire->keep_alive = ht::reply_behavior::silence;

        f.visit_all(ht::make_items(1500));

        CHECK(f.wire->objects == 1000);
        CHECK(f.wire->keep_alives == 1);
        CHECK(f.state.total_sent == 1000);
        CHECK(f.state.ack_count == 0);
        CHECK(handoff::is_timeout(f.state.error));
    }

    SECTION("an unexpected keep-alive reply is latched")
    {
        f.wire->keep_alive = ht::reply_behavior::garbage;

        f.visit_all(ht::make_items(1001));

        CHECK(handoff::get_handoff_error_code(f.state.error) == HANDOFF_UNEXPECTED_REPLY);
        CHECK(f.state.total_sent == 1000);
    }

    SECTION("a successful keep-alive clears the error")
    {
        f.state.error = handoff::make_error_code(SYS_SOCK_READ_TIMEDOUT);
        f.state.ack_count = 1000;

        f.state = handoff::exchange_keep_alive(f.ctx, std::move(f.state));

        CHECK_FALSE(f.state.error);
        CHECK(f.state.ack_count == 0);
        CHECK(f.wire->keep_alives == 1);
    }

    SECTION("encoding failures propagate out of the fold")
    {
        f.codec.poison_key = "key_3";

        CHECK_THROWS_AS(f.visit_all(ht::make_items(10)), handoff::exception);
        CHECK(f.wire->objects == 3);
    }
}

TEST_CASE("item filter")
{
    visitor_fixture f;

    // Every even item is accepted.
    f.request.filter = [](std::string_view _key) {
        return std::stoi(std::string{_key.substr(4)}) % 2 == 0;
    };

    f.visit_all(ht::make_items(1500));

    SECTION("filtered items are counted but never sent")
    {
        CHECK(f.wire->objects == 750);
        CHECK(f.state.total_sent == 1500);

        for (const auto& m : f.wire->sent) {
            if (m.type == wire::message_type::object) {
                const auto index = std::stoi(m.payload.substr(4, m.payload.find('=') - 4));
                CHECK(index % 2 == 0);
            }
        }
    }

    SECTION("filtered items do not advance the window")
    {
        CHECK(f.wire->keep_alives == 0);
        CHECK(f.state.ack_count == 750);
        CHECK(f.state.stats.objects == 750);
    }
}

TEST_CASE("a full window is acknowledged before a filtered item")
{
    visitor_fixture f;

    f.request.filter = [](std::string_view _key) { return _key != "key_1000"; };

    f.visit_all(ht::make_items(1001));

    CHECK(f.wire->keep_alives == 1);
    CHECK(f.wire->objects == 1000);
    CHECK(f.state.total_sent == 1001);
    CHECK(f.state.ack_count == 0);
    CHECK_FALSE(f.state.error);
}

TEST_CASE("the running total survives an encoding failure")
{
    visitor_fixture f;
    f.codec.poison_key = "key_1200";

    std::uint64_t total_sent = 0;
    const auto visit = handoff::make_visit_function(f.ctx, total_sent);

    const auto fold = [&visit] {
        handoff::transfer_state state;
        for (const auto& i : ht::make_items(1500)) {
            state = visit(i.key, i.value, std::move(state));
        }
    };

    CHECK_THROWS_AS(fold(), handoff::exception);
    CHECK(total_sent == 1200);
    CHECK(f.wire->objects == 1200);
    CHECK(f.wire->keep_alives == 1);
}

TEST_CASE("progress during a fold")
{
    visitor_fixture f;

    // Every clock read advances 10ms. One read per sent item.
    f.visit_all(ht::make_items(1000));

    REQUIRE_FALSE(f.sink.snapshots.empty());

    for (std::size_t i = 1; i < f.sink.snapshots.size(); ++i) {
        CHECK(f.sink.snapshots[i].timestamp - f.sink.snapshots[i - 1].timestamp >= 2s);
        CHECK(f.sink.snapshots[i].objects > f.sink.snapshots[i - 1].objects);
    }

    CHECK(f.sink.keys.front().source_partition == 1);
}
