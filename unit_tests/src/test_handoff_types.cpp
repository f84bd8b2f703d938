#include <catch2/catch.hpp>

#include "handoff/handoff_error_table.h"
#include "handoff/handoff_exception.hpp"
#include "handoff/handoff_outcome.hpp"
#include "handoff/handoff_types.hpp"

#include <string>

TEST_CASE("node identities")
{
    SECTION("split into name and host")
    {
        const auto id = handoff::parse_node_identity("dev1@127.0.0.1");

        CHECK(id.name == "dev1");
        CHECK(id.host == "127.0.0.1");
    }

    SECTION("must contain exactly one name and one host")
    {
        for (const auto* bad : {"dev1", "dev1@host@other", "@host", "dev1@", ""}) {
            try {
                handoff::parse_node_identity(bad);
                FAIL("expected an exception for [" << bad << "]");
            }
            catch (const handoff::exception& e) {
                CHECK(e.code() == HANDOFF_INVALID_NODE_NAME);
            }
        }
    }
}

TEST_CASE("transfer types")
{
    CHECK(handoff::to_transfer_type("repair") == handoff::transfer_type::repair);
    CHECK(std::string{handoff::to_string(handoff::transfer_type::hinted)} == "hinted");
    CHECK_THROWS_AS(handoff::to_transfer_type("rebalance"), handoff::exception);
}

TEST_CASE("item filters")
{
    handoff::transfer_request request;

    SECTION("an absent filter accepts every key")
    {
        CHECK(handoff::accepts(request, "anything"));
    }

    SECTION("a filter decides per key")
    {
        request.filter = [](std::string_view _key) { return _key.substr(0, 2) == "ok"; };

        CHECK(handoff::accepts(request, "ok_1"));
        CHECK_FALSE(handoff::accepts(request, "no_1"));
    }
}

TEST_CASE("shutdown reasons stay distinct")
{
    using handoff::transfer_outcome;

    CHECK(std::string{handoff::shutdown_reason(transfer_outcome::completed)} == "normal");
    CHECK(std::string{handoff::shutdown_reason(transfer_outcome::rejected_max_concurrency)} == "max_concurrency");
    CHECK(std::string{handoff::shutdown_reason(transfer_outcome::timed_out)} == "timeout");
    CHECK(std::string{handoff::shutdown_reason(transfer_outcome::failed_fold_error)} == "error");
    CHECK(std::string{handoff::shutdown_reason(transfer_outcome::failed_unexpected)} == "error");
}
