#ifndef HANDOFF_TCP_TRANSPORT_HPP
#define HANDOFF_TCP_TRANSPORT_HPP

/// \file

#include "handoff/stream_transport.hpp"

#include <memory>

namespace handoff
{
    class tcp_transport : public stream_transport
    {
    public:
        /// Takes ownership of the connected socket \p _socket.
        tcp_transport(int _socket, std::chrono::milliseconds _send_timeout) noexcept
            : stream_transport{_send_timeout}
            , socket_{_socket}
        {
        }

        /// \throws handoff::exception If the connection cannot be established.
        static auto connect(const endpoint& _endpoint, const transport_options& _options)
            -> std::unique_ptr<tcp_transport>;

        ~tcp_transport() override
        {
            close();
        }

        auto close() noexcept -> void override;

        auto protocol() const noexcept -> std::string_view override
        {
            return "tcp";
        }

        auto socket_handle() const noexcept -> int
        {
            return socket_;
        }

    protected:
        auto read_bytes(char* _buffer, std::size_t _length, deadline_type _deadline) -> std::error_code override;

        auto write_bytes(const char* _buffer, std::size_t _length, deadline_type _deadline)
            -> std::error_code override;

    private:
        int socket_;
    }; // class tcp_transport
} // namespace handoff

#endif // HANDOFF_TCP_TRANSPORT_HPP
