#ifndef HANDOFF_SSL_TRANSPORT_HPP
#define HANDOFF_SSL_TRANSPORT_HPP

/// \file

#include "handoff/ssl_options.hpp"
#include "handoff/stream_transport.hpp"

#include <openssl/ssl.h>

#include <memory>

namespace handoff
{
    /// A TLS client connection over a non-blocking socket.
    class ssl_transport : public stream_transport
    {
    public:
        /// Connects, then performs the TLS handshake within the connect timeout.
        ///
        /// \throws handoff::exception SSL_INIT_ERROR, SSL_HANDSHAKE_ERROR or any connect error.
        static auto connect(const endpoint& _endpoint,
                            const ssl_options& _ssl_options,
                            const transport_options& _options) -> std::unique_ptr<ssl_transport>;

        ~ssl_transport() override
        {
            close();
        }

        auto close() noexcept -> void override;

        auto protocol() const noexcept -> std::string_view override
        {
            return "ssl";
        }

    protected:
        auto read_bytes(char* _buffer, std::size_t _length, deadline_type _deadline) -> std::error_code override;

        auto write_bytes(const char* _buffer, std::size_t _length, deadline_type _deadline)
            -> std::error_code override;

    private:
        struct ctx_deleter
        {
            auto operator()(SSL_CTX* _ctx) const noexcept -> void { SSL_CTX_free(_ctx); }
        };

        struct ssl_deleter
        {
            auto operator()(SSL* _ssl) const noexcept -> void { SSL_free(_ssl); }
        };

        using ctx_pointer = std::unique_ptr<SSL_CTX, ctx_deleter>;
        using ssl_pointer = std::unique_ptr<SSL, ssl_deleter>;

        ssl_transport(int _socket, ctx_pointer _ctx, ssl_pointer _ssl, std::chrono::milliseconds _send_timeout) noexcept
            : stream_transport{_send_timeout}
            , socket_{_socket}
            , ctx_{std::move(_ctx)}
            , ssl_{std::move(_ssl)}
        {
        }

        int socket_;
        ctx_pointer ctx_;
        ssl_pointer ssl_;
    }; // class ssl_transport
} // namespace handoff

#endif // HANDOFF_SSL_TRANSPORT_HPP
