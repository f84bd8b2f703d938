#include <catch2/catch.hpp>

#include "handoff/handoff_error_table.h"
#include "handoff/handoff_exception.hpp"
#include "handoff/wire_protocol.hpp"

#include <algorithm>
#include <string>

namespace wire = handoff::wire;

using namespace std::string_literals;

TEST_CASE("message tags")
{
    CHECK(static_cast<int>(wire::message_type::init) == 0);
    CHECK(static_cast<int>(wire::message_type::object) == 1);
    CHECK(static_cast<int>(wire::message_type::oldsync) == 2);
    CHECK(static_cast<int>(wire::message_type::sync) == 3);
    CHECK(static_cast<int>(wire::message_type::configure) == 4);

    CHECK(std::string{wire::to_string(wire::message_type::oldsync)} == "OLDSYNC");
}

TEST_CASE("frames")
{
    SECTION("length prefix is big-endian and counts the tag")
    {
        const auto frame = wire::encode_frame(wire::message_type::oldsync, "kv_store_node");

        REQUIRE(frame.size() == 4 + 1 + 13);
        CHECK(frame.substr(0, 4) == "\x00\x00\x00\x0e"s);
        CHECK(frame[4] == '\x02');
        CHECK(frame.substr(5) == "kv_store_node");
    }

    SECTION("an empty payload still carries the tag")
    {
        CHECK(wire::encode_frame(wire::message_type::sync, {}) == "\x00\x00\x00\x01\x03"s);
        CHECK(wire::message_size({}) == 1);
    }

    SECTION("large lengths use every header byte")
    {
        const std::string payload(0x010203, 'x');
        const auto frame = wire::encode_frame(wire::message_type::object, payload);

        unsigned char header[wire::frame_header_size];
        std::copy_n(frame.begin(), wire::frame_header_size, header);

        CHECK(header[0] == 0x00);
        CHECK(header[1] == 0x01);
        CHECK(header[2] == 0x02);
        CHECK(header[3] == 0x04);
        CHECK(wire::decode_frame_length(header) == 0x010204);
    }

    SECTION("sync replies must match the request type and body")
    {
        CHECK(wire::is_sync_reply({wire::message_type::oldsync, "sync"}, wire::message_type::oldsync));
        CHECK_FALSE(wire::is_sync_reply({wire::message_type::sync, "sync"}, wire::message_type::oldsync));
        CHECK_FALSE(wire::is_sync_reply({wire::message_type::oldsync, "nope"}, wire::message_type::oldsync));
    }
}

TEST_CASE("partition ids")
{
    SECTION("are encoded as 20 big-endian bytes")
    {
        const auto bytes = wire::encode_partition_id(1);

        REQUIRE(bytes.size() == 20);
        CHECK(bytes == std::string(19, '\0') + '\x01');
    }

    SECTION("use the full 160-bit range")
    {
        handoff::partition_id top = 1;
        top <<= 159;

        const auto bytes = wire::encode_partition_id(top);
        CHECK(bytes == '\x80' + std::string(19, '\0'));

        const handoff::partition_id max = ~handoff::partition_id{0};
        CHECK(wire::encode_partition_id(max) == std::string(20, '\xff'));
        CHECK(wire::decode_partition_id(std::string(20, '\xff')) == max);
    }

    SECTION("ring positions survive decoding")
    {
        const handoff::partition_id id{"1370157784997721485815954530671515330927436759040"};
        CHECK(wire::decode_partition_id(wire::encode_partition_id(id)) == id);
    }

    SECTION("wrong sizes are rejected")
    {
        CHECK_THROWS_AS(wire::decode_partition_id("short"), handoff::exception);
    }
}
