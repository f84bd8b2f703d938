#ifndef HANDOFF_TRANSPORT_HPP
#define HANDOFF_TRANSPORT_HPP

/// \file

#include "handoff/ssl_options.hpp"
#include "handoff/wire_protocol.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace handoff
{
    struct endpoint
    {
        std::string host;
        int port{};
    };

    struct transport_options
    {
        std::chrono::milliseconds connect_timeout{15'000};

        // Upper bound on the time a single send may block on a full socket buffer.
        std::chrono::milliseconds send_timeout{60'000};

        // TLS is used if and only if this is set.
        std::optional<ssl_options> ssl;
    };

    /// A connected, blocking, message-framed byte stream to a handoff receiver.
    ///
    /// I/O failures are reported through std::error_code values of the handoff error
    /// category. A transport is owned by exactly one transfer and is never used from two
    /// threads at once.
    class transport
    {
    public:
        transport() = default;

        transport(const transport&) = delete;
        auto operator=(const transport&) -> transport& = delete;

        virtual ~transport() = default;

        /// Writes one frame.
        ///
        /// \retval SYS_SOCK_WRITE_TIMEDOUT If the peer stopped draining the connection.
        /// \retval SYS_SOCK_WRITE_ERR      Plus errno, on any other failure.
        virtual auto send(wire::message_type _type, std::string_view _payload) -> std::error_code = 0;

        /// Blocks until one frame arrives or \p _timeout elapses.
        ///
        /// \retval SYS_SOCK_READ_TIMEDOUT If no complete frame arrived in time.
        /// \retval SYS_SOCK_CLOSED        If the peer closed the connection.
        /// \retval SYS_FRAME_LEN_ERR      If the frame length is out of range.
        /// \retval SYS_SOCK_READ_ERR      Plus errno, on any other failure.
        virtual auto receive(wire::frame& _frame, std::chrono::milliseconds _timeout) -> std::error_code = 0;

        virtual auto close() noexcept -> void = 0;

        /// "tcp" or "ssl".
        virtual auto protocol() const noexcept -> std::string_view = 0;
    }; // class transport

    /// Sends a request of type \p _type and waits for the matching "sync" reply.
    ///
    /// \retval HANDOFF_UNEXPECTED_REPLY If a frame other than the acknowledgment arrives.
    /// \returns Otherwise, the error reported by transport::send() or transport::receive().
    auto request_sync(transport& _transport,
                      wire::message_type _type,
                      std::string_view _payload,
                      std::chrono::milliseconds _timeout) -> std::error_code;

    /// Opens transports. Replaced by fakes in tests.
    class transport_factory
    {
    public:
        virtual ~transport_factory() = default;

        /// \throws handoff::exception If the connection cannot be established.
        virtual auto open(const endpoint& _endpoint, const transport_options& _options)
            -> std::unique_ptr<transport> = 0;
    }; // class transport_factory

    /// Opens TCP connections, upgraded to TLS when ssl options are present.
    class socket_transport_factory : public transport_factory
    {
    public:
        auto open(const endpoint& _endpoint, const transport_options& _options)
            -> std::unique_ptr<transport> override;
    }; // class socket_transport_factory
} // namespace handoff

#endif // HANDOFF_TRANSPORT_HPP
