#include <catch2/catch.hpp>

#include "handoff/asynchronous_fold_engine.hpp"
#include "handoff/handoff_error_table.h"
#include "handoff/handoff_exception.hpp"
#include "handoff/handoff_sender.hpp"
#include "handoff/thread_pool.hpp"

#include "unit_test_utils.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace ht = handoff::test;

namespace
{
    // Records the thread each fold runs on.
    class thread_recording_engine : public handoff::fold_engine
    {
    public:
        auto fold(const handoff::partition_id&, const handoff::visit_function& _visit, handoff::transfer_state _state)
            -> handoff::transfer_state override
        {
            thread = std::this_thread::get_id();

            if (fail_with_code) {
                THROW(*fail_with_code, "fold aborted");
            }

            return _visit("key", "value", std::move(_state));
        }

        std::thread::id thread;
        std::optional<int> fail_with_code;
    };
} // anonymous namespace

TEST_CASE("asynchronous fold engine")
{
    handoff::thread_pool pool{1};
    thread_recording_engine engine;
    handoff::asynchronous_fold_engine async_engine{engine, pool};

    SECTION("the fold runs on the pool and its result is returned")
    {
        std::thread::id visitor_thread;

        const auto visit = [&visitor_thread](std::string_view, std::string_view, handoff::transfer_state _state) {
            visitor_thread = std::this_thread::get_id();
            ++_state.total_sent;
            return _state;
        };

        const auto state = async_engine.fold(7, visit, {});

        CHECK(state.total_sent == 1);
        CHECK(engine.thread != std::this_thread::get_id());
        CHECK(visitor_thread == engine.thread);
    }

    SECTION("handoff exceptions are rethrown unchanged")
    {
        engine.fail_with_code = HANDOFF_ENCODING_ERR;

        try {
            async_engine.fold(7, [](auto, auto, auto _state) { return _state; }, {});
            FAIL("expected an exception");
        }
        catch (const handoff::exception& e) {
            CHECK(e.code() == HANDOFF_ENCODING_ERR);
        }
    }

    SECTION("other failures become fold engine failures")
    {
        const auto visit = [](std::string_view, std::string_view, handoff::transfer_state) -> handoff::transfer_state {
            throw std::runtime_error{"worker crashed"};
        };

        try {
            async_engine.fold(7, visit, {});
            FAIL("expected an exception");
        }
        catch (const handoff::exception& e) {
            CHECK(e.code() == HANDOFF_FOLD_ENGINE_ERR);
            CHECK(std::string{e.what()}.find("worker crashed") != std::string::npos);
        }
    }
}

TEST_CASE("concurrent transfers")
{
    handoff::thread_pool pool{4};

    struct collaborators
    {
        ht::fixed_resolver resolver;
        ht::vector_fold_engine engine{ht::make_items(1500)};
        ht::joining_codec codec;
        ht::recording_sink sink;
        ht::recording_coordinator parent;
        ht::fake_transport_factory transports;
    };

    std::vector<std::unique_ptr<collaborators>> transfers;
    std::vector<std::future<handoff::transfer_result>> results;

    for (int i = 0; i < 4; ++i) {
        auto& c = *transfers.emplace_back(std::make_unique<collaborators>());

        handoff::transfer_request request;
        request.source_node = "dev1@127.0.0.1";
        request.target_node = "dev2@127.0.0.1";
        request.module = "kv_store_node";
        request.source_partition = i;
        request.target_partition = i;

        if (i == 3) {
            c.transports.wire->handshake = ht::reply_behavior::close;
        }

        results.push_back(handoff::start_sender(pool,
                                                std::move(request),
                                                {c.resolver, c.engine, c.codec, c.sink, c.parent, c.transports},
                                                {}));
    }

    for (int i = 0; i < 4; ++i) {
        REQUIRE(results[i].wait_for(30s) == std::future_status::ready);

        const auto result = results[i].get();

        if (i == 3) {
            CHECK(result.outcome == handoff::transfer_outcome::rejected_max_concurrency);
            CHECK(transfers[i]->parent.size() == 0);
        }
        else {
            CHECK(result.outcome == handoff::transfer_outcome::completed);
            CHECK(result.total_sent == 1500);
            CHECK(transfers[i]->parent.size() == 1);
        }
    }
}
