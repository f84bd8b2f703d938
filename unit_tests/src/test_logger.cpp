#include <catch2/catch.hpp>

#include "handoff/handoff_logger.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/sinks/ringbuffer_sink.h>

#include <memory>
#include <string>

namespace logger = handoff::log;

using json = nlohmann::json;

TEST_CASE("structured logging")
{
    auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
    sink->set_pattern("%v");

    logger::init(true, sink);
    logger::set_server_host("dev1.example.org");
    logger::sender::set_level(logger::level::info);
    logger::network::set_level(logger::level::info);

    SECTION("records are json objects with the standard fields")
    {
        logger::sender::info("Starting {} transfer of {}", "ownership", "kv_store_node");

        const auto records = sink->last_formatted(1);
        REQUIRE(records.size() == 1);

        const auto record = json::parse(records.front());

        CHECK(record.at("log_message") == "Starting ownership transfer of kv_store_node");
        CHECK(record.at("log_category") == "sender");
        CHECK(record.at("log_level") == "info");
        CHECK(record.at("server_host") == "dev1.example.org");
        CHECK(record.contains("server_pid"));
        CHECK(record.contains("server_timestamp"));
    }

    SECTION("key value pairs become fields")
    {
        logger::network::error({{"log_message", "SSL handoff config error."}, {"property", "certfile"}});

        const auto record = json::parse(sink->last_formatted(1).front());

        CHECK(record.at("log_category") == "network");
        CHECK(record.at("property") == "certfile");
    }

    SECTION("records below the category level are dropped")
    {
        logger::sender::debug("not written");

        CHECK(sink->last_formatted().empty());
    }

    logger::deinit();

    SECTION("records are dropped without a logger")
    {
        logger::sender::error("nowhere to go");
        CHECK(sink->last_formatted().empty());
    }
}
