#include <catch2/catch.hpp>

#include "handoff/handoff_error_table.h"
#include "handoff/handoff_exception.hpp"
#include "handoff/handoff_sender.hpp"
#include "handoff/system_error.hpp"
#include "handoff/ssl_options.hpp"
#include "handoff/ssl_transport.hpp"
#include "handoff/tcp_transport.hpp"

#include "unit_test_utils.hpp"

#include <chrono>
#include <optional>
#include <utility>

using namespace std::chrono_literals;

namespace ht = handoff::test;
namespace wire = handoff::wire;

namespace
{
    auto unused_port() -> int
    {
        const int sock = ::socket(AF_INET, SOCK_STREAM, 0);
        REQUIRE(sock >= 0);

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

        REQUIRE(::bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);

        socklen_t len = sizeof(addr);
        ::getsockname(sock, reinterpret_cast<sockaddr*>(&addr), &len);
        ::close(sock);

        return ntohs(addr.sin_port);
    }

    auto run_against(int _port,
                     std::size_t _items,
                     std::chrono::milliseconds _timeout,
                     std::optional<handoff::ssl_options> _ssl = std::nullopt) -> handoff::transfer_result
    {
        handoff::transfer_request request;
        request.source_node = "dev1@127.0.0.1";
        request.target_node = "dev2@127.0.0.1";
        request.module = "kv_store_node";
        request.target_partition = 42;

        handoff::sender_options options;
        options.receive_timeout = _timeout;
        options.connect_timeout = 2s;
        options.ssl = std::move(_ssl);

        ht::fixed_resolver resolver;
        resolver.address = {_port, std::nullopt};

        ht::vector_fold_engine engine{ht::make_items(_items)};
        ht::joining_codec codec;
        ht::recording_sink sink;
        ht::recording_coordinator parent;
        handoff::socket_transport_factory transports;
        handoff::handoff_metrics metrics;

        handoff::handoff_sender sender{request, {resolver, engine, codec, sink, parent, transports}, options, metrics};

        return sender.run();
    }
} // anonymous namespace

TEST_CASE("handoff over a loopback tcp connection")
{
    SECTION("cooperating receiver")
    {
        ht::loopback_receiver receiver{ht::receiver_behavior::cooperate};

        const auto result = run_against(receiver.port(), 2500, 5s);

        CHECK(result.outcome == handoff::transfer_outcome::completed);
        CHECK(result.total_sent == 2500);
        CHECK(receiver.objects() == 2500);
        CHECK(receiver.keep_alives() == 2);
        CHECK(receiver.module() == "kv_store_node");
        CHECK(receiver.target_partition() == wire::encode_partition_id(42));
    }

    SECTION("receiver at its concurrency limit")
    {
        ht::loopback_receiver receiver{ht::receiver_behavior::reject};

        const auto result = run_against(receiver.port(), 10, 5s);

        CHECK(result.outcome == handoff::transfer_outcome::rejected_max_concurrency);
    }

    SECTION("silent receiver")
    {
        ht::loopback_receiver receiver{ht::receiver_behavior::ignore};

        const auto start = std::chrono::steady_clock::now();
        const auto result = run_against(receiver.port(), 10, 200ms);

        CHECK(result.outcome == handoff::transfer_outcome::timed_out);
        CHECK(std::chrono::steady_clock::now() - start >= 200ms);
    }
}

TEST_CASE("tcp transport")
{
    handoff::transport_options options;
    options.connect_timeout = 2s;
    options.send_timeout = 2s;

    SECTION("connection refused")
    {
        try {
            handoff::tcp_transport::connect({"127.0.0.1", unused_port()}, options);
            FAIL("expected connect to fail");
        }
        catch (const handoff::exception& e) {
            CHECK(e.code() / 1000 * 1000 == SYS_SOCK_CONNECT_ERR);
        }
    }

    SECTION("receive honors its timeout")
    {
        ht::loopback_receiver receiver{ht::receiver_behavior::ignore};

        auto connection = handoff::tcp_transport::connect({"127.0.0.1", receiver.port()}, options);
        REQUIRE(connection->protocol() == "tcp");
        REQUIRE_FALSE(connection->send(wire::message_type::oldsync, "kv_store_node"));

        wire::frame frame;
        const auto ec = connection->receive(frame, 100ms);

        CHECK(handoff::get_handoff_error_code(ec) == SYS_SOCK_READ_TIMEDOUT);
    }

    SECTION("a closed peer is reported as closed")
    {
        ht::loopback_receiver receiver{ht::receiver_behavior::reject};

        auto connection = handoff::tcp_transport::connect({"127.0.0.1", receiver.port()}, options);
        REQUIRE_FALSE(connection->send(wire::message_type::oldsync, "kv_store_node"));

        wire::frame frame;
        const auto ec = connection->receive(frame, 2s);

        CHECK(handoff::get_handoff_error_code(ec) == SYS_SOCK_CLOSED);
    }

    SECTION("a closed transport refuses I/O")
    {
        ht::loopback_receiver receiver{ht::receiver_behavior::ignore};

        auto connection = handoff::tcp_transport::connect({"127.0.0.1", receiver.port()}, options);
        connection->close();

        CHECK(handoff::get_handoff_error_code(connection->send(wire::message_type::sync, {})) == SYS_SOCK_NOT_OPEN);
    }
}

TEST_CASE("handoff over a loopback tls connection")
{
    const ht::temporary_directory dir;
    const auto certfile = dir.file("server.pem");
    const auto keyfile = dir.file("server.key");

    ht::write_self_signed_certificate(certfile, keyfile);

    handoff::ssl_options trusting;
    trusting.cacertfile = certfile;
    trusting.verify_peer = true;

    handoff::transport_options options;
    options.connect_timeout = 5s;
    options.send_timeout = 5s;

    SECTION("verified request and acknowledgment")
    {
        ht::loopback_tls_receiver receiver{certfile, keyfile, ht::tls_receiver_behavior::cooperate};
        options.ssl = trusting;

        auto connection = handoff::socket_transport_factory{}.open({"127.0.0.1", receiver.port()}, options);

        REQUIRE(connection->protocol() == "ssl");
        CHECK_FALSE(handoff::request_sync(*connection, wire::message_type::oldsync, "kv_store_node", 5s));
        CHECK(receiver.module() == "kv_store_node");

        connection->close();
    }

    SECTION("complete transfer")
    {
        ht::loopback_tls_receiver receiver{certfile, keyfile, ht::tls_receiver_behavior::cooperate};

        const auto result = run_against(receiver.port(), 2500, 5s, trusting);

        CHECK(result.outcome == handoff::transfer_outcome::completed);
        CHECK(result.total_sent == 2500);
        CHECK(receiver.objects() == 2500);
        CHECK(receiver.keep_alives() == 2);
    }

    SECTION("untrusted server certificate")
    {
        const auto other_certfile = dir.file("other.pem");
        ht::write_self_signed_certificate(other_certfile, dir.file("other.key"));

        ht::loopback_tls_receiver receiver{certfile, keyfile, ht::tls_receiver_behavior::cooperate};

        handoff::ssl_options ssl;
        ssl.cacertfile = other_certfile;
        ssl.verify_peer = true;

        try {
            handoff::ssl_transport::connect({"127.0.0.1", receiver.port()}, ssl, options);
            FAIL("expected the handshake to fail");
        }
        catch (const handoff::exception& e) {
            CHECK(e.code() == SSL_HANDSHAKE_ERROR);
        }
    }

    SECTION("receiver drops the connection during the handshake")
    {
        ht::loopback_tls_receiver receiver{certfile, keyfile, ht::tls_receiver_behavior::drop};

        const auto result = run_against(receiver.port(), 10, 5s, trusting);

        CHECK(result.outcome == handoff::transfer_outcome::failed_unexpected);
        CHECK(result.error_kind == "connect_error");
    }

    SECTION("unusable diffie-hellman parameters")
    {
        handoff::ssl_options ssl;
        ssl.dhfile = certfile;

        try {
            handoff::ssl_transport::connect({"127.0.0.1", unused_port()}, ssl, options);
            FAIL("expected context initialization to fail");
        }
        catch (const handoff::exception& e) {
            CHECK(e.code() == SSL_INIT_ERROR);
        }
    }

    SECTION("tls material removed after configuration falls back to tcp")
    {
        ht::loopback_receiver receiver{ht::receiver_behavior::cooperate};

        handoff::ssl_options ssl;
        ssl.certfile = dir.file("removed.pem");
        options.ssl = ssl;

        auto connection = handoff::socket_transport_factory{}.open({"127.0.0.1", receiver.port()}, options);

        CHECK(connection->protocol() == "tcp");
        CHECK_FALSE(handoff::request_sync(*connection, wire::message_type::oldsync, "kv_store_node", 5s));
    }
}
