#include "handoff/ssl_transport.hpp"

#include "handoff/handoff_at_scope_exit.hpp"
#include "handoff/handoff_error_table.h"
#include "handoff/handoff_exception.hpp"
#include "handoff/handoff_logger.hpp"
#include "handoff/system_error.hpp"

#include <fmt/format.h>

#include <openssl/decoder.h>
#include <openssl/err.h>
#include <openssl/x509.h>

#include <cerrno>
#include <csignal>

namespace
{
    using log_net = handoff::log::network;

    constexpr int verify_depth = 9;

    auto log_ssl_error(const char* _msg) -> void
    {
        char buf[512];

        while (const auto err = ERR_get_error()) {
            ERR_error_string_n(err, buf, sizeof(buf));
            log_net::error("{}. SSL error: {}", _msg, buf);
        }
    } // log_ssl_error

    auto verify_callback(int _ok, X509_STORE_CTX* _store) -> int
    {
        // Log verification problems even when the certificate is accepted.
        if (!_ok) {
            char data[256];

            auto* cert = X509_STORE_CTX_get_current_cert(_store);
            const int depth = X509_STORE_CTX_get_error_depth(_store);
            const int err = X509_STORE_CTX_get_error(_store);

            log_net::warn("problem with certificate at depth [{}]", depth);

            if (cert) {
                X509_NAME_oneline(X509_get_issuer_name(cert), data, sizeof(data));
                log_net::warn("  issuer = {}", data);
                X509_NAME_oneline(X509_get_subject_name(cert), data, sizeof(data));
                log_net::warn("  subject = {}", data);
            }

            log_net::warn("  err {}:{}", err, X509_verify_cert_error_string(err));
        }

        return _ok;
    } // verify_callback

    auto load_dh_params(SSL_CTX* _ctx, const std::string& _file) -> int
    {
        BIO* bio = BIO_new_file(_file.c_str(), "r");
        if (!bio) {
            return -1;
        }

        const auto free_bio = handoff::at_scope_exit{[&bio] { BIO_free(bio); }};
        constexpr const char* format = "PEM";
        constexpr const char* structure = nullptr;
        constexpr const char* keytype = "DH";
        constexpr int selection = 0;

        EVP_PKEY* pkey = nullptr;
        OSSL_DECODER_CTX* dctx =
            OSSL_DECODER_CTX_new_for_pkey(&pkey, format, structure, keytype, selection, nullptr, nullptr);
        if (!dctx) {
            return -1;
        }

        const auto free_decoder_context = handoff::at_scope_exit{[&dctx] { OSSL_DECODER_CTX_free(dctx); }};

        if (0 == OSSL_DECODER_from_bio(dctx, bio) || !pkey) {
            return -1;
        }

        // On success the context owns the key.
        if (SSL_CTX_set0_tmp_dh_pkey(_ctx, pkey) != 1) {
            EVP_PKEY_free(pkey);
            return -1;
        }

        return 0;
    } // load_dh_params

    auto init_context(const handoff::ssl_options& _options) -> SSL_CTX*
    {
        SSL_CTX* ctx = SSL_CTX_new(TLS_client_method());

        if (!ctx) {
            log_ssl_error("cannot allocate SSL context");
            return nullptr;
        }

        SSL_CTX_set_options(ctx, SSL_OP_ALL | SSL_OP_NO_SSLv2 | SSL_OP_NO_SSLv3 | SSL_OP_NO_TLSv1);
        SSL_CTX_set_mode(ctx, SSL_MODE_ENABLE_PARTIAL_WRITE | SSL_MODE_ACCEPT_MOVING_WRITE_BUFFER);

        if (_options.certfile) {
            if (SSL_CTX_use_certificate_chain_file(ctx, _options.certfile->c_str()) != 1) {
                log_ssl_error("couldn't read certificate chain file");
                SSL_CTX_free(ctx);
                return nullptr;
            }

            const auto& keyfile = _options.keyfile ? *_options.keyfile : *_options.certfile;

            if (SSL_CTX_use_PrivateKey_file(ctx, keyfile.c_str(), SSL_FILETYPE_PEM) != 1) {
                log_ssl_error("couldn't read key file");
                SSL_CTX_free(ctx);
                return nullptr;
            }
        }

        if (_options.cacertfile) {
            if (SSL_CTX_load_verify_locations(ctx, _options.cacertfile->c_str(), nullptr) != 1) {
                log_ssl_error("error loading CA certificate file");
                SSL_CTX_free(ctx);
                return nullptr;
            }
        }

        if (SSL_CTX_set_default_verify_paths(ctx) != 1) {
            log_ssl_error("error loading default CA certificate locations");
        }

        if (_options.dhfile && load_dh_params(ctx, *_options.dhfile) < 0) {
            log_ssl_error("error setting Diffie-Hellman parameters");
            SSL_CTX_free(ctx);
            return nullptr;
        }

        const bool verify = _options.cacertfile && _options.verify_peer;
        SSL_CTX_set_verify(ctx, verify ? SSL_VERIFY_PEER : SSL_VERIFY_NONE, verify_callback);
        SSL_CTX_set_verify_depth(ctx, verify_depth);

        return ctx;
    } // init_context

    // Maps the result of an SSL I/O call to "retry after waiting" (empty code plus the
    // direction to wait in) or a terminal error.
    auto classify_ssl_result(SSL* _ssl, int _result, bool _reading, handoff::socket_direction& _wait_for)
        -> std::error_code
    {
        using handoff::make_error_code;

        const int io_errno = errno;
        const int io_error = ERR_peek_error() ? 0 : io_errno;

        switch (SSL_get_error(_ssl, _result)) {
            case SSL_ERROR_WANT_READ:
                _wait_for = handoff::socket_direction::read;
                return {};

            case SSL_ERROR_WANT_WRITE:
                _wait_for = handoff::socket_direction::write;
                return {};

            case SSL_ERROR_ZERO_RETURN:
                return make_error_code(SYS_SOCK_CLOSED);

            case SSL_ERROR_SYSCALL:
                if (io_error == 0 || io_error == ECONNRESET || io_error == EPIPE) {
                    ERR_clear_error();
                    return make_error_code(SYS_SOCK_CLOSED);
                }

                return make_error_code((_reading ? SYS_SOCK_READ_ERR : SYS_SOCK_WRITE_ERR) - io_error);

            default:
                log_ssl_error(_reading ? "SSL_read failed" : "SSL_write failed");
                return make_error_code(_reading ? SYS_SOCK_READ_ERR : SYS_SOCK_WRITE_ERR);
        }
    } // classify_ssl_result
} // anonymous namespace

namespace handoff
{
    auto ssl_transport::connect(const endpoint& _endpoint,
                                const ssl_options& _ssl_options,
                                const transport_options& _options) -> std::unique_ptr<ssl_transport>
    {
        // OpenSSL writes to the socket directly, so a peer reset must not kill the process.
        static const bool sigpipe_ignored = [] {
            return std::signal(SIGPIPE, SIG_IGN) != SIG_ERR;
        }();

        if (!sigpipe_ignored) {
            log_net::warn("cannot ignore SIGPIPE");
        }

        ctx_pointer ctx{init_context(_ssl_options)};

        if (!ctx) {
            THROW(SSL_INIT_ERROR, "couldn't initialize SSL context");
        }

        const int sock = connect_with_timeout(_endpoint, _options.connect_timeout);
        auto close_on_error = true;
        const auto cleanup = at_scope_exit{[&close_on_error, sock] {
            if (close_on_error) {
                close_socket(sock);
            }
        }};

        if (const auto ec = set_nonblocking(sock, true); ec) {
            THROW(SSL_INIT_ERROR, fmt::format("cannot switch socket to non-blocking mode: {}", ec.message()));
        }

        ssl_pointer ssl{SSL_new(ctx.get())};

        if (!ssl || SSL_set_fd(ssl.get(), sock) != 1) {
            log_ssl_error("couldn't create a new SSL socket");
            THROW(SSL_INIT_ERROR, "couldn't initialize SSL socket");
        }

        if (SSL_set_tlsext_host_name(ssl.get(), _endpoint.host.c_str()) != 1) {
            log_ssl_error("error in SSL_set_tlsext_host_name");
            THROW(SSL_INIT_ERROR, fmt::format("cannot set server name [{}]", _endpoint.host));
        }

        const auto deadline = std::chrono::steady_clock::now() + _options.connect_timeout;

        while (true) {
            const int status = SSL_connect(ssl.get());

            if (status == 1) {
                break;
            }

            auto direction = socket_direction::read;

            if (const auto ec = classify_ssl_result(ssl.get(), status, true, direction); ec) {
                THROW(SSL_HANDSHAKE_ERROR,
                      fmt::format("TLS handshake with [{}:{}] failed: {}", _endpoint.host, _endpoint.port, ec.message()));
            }

            if (const auto ec = wait_for_socket(sock, direction, deadline); ec) {
                THROW(is_timeout(ec) ? SYS_SOCK_CONNECT_TIMEDOUT : SSL_HANDSHAKE_ERROR,
                      fmt::format("TLS handshake with [{}:{}] failed: {}", _endpoint.host, _endpoint.port, ec.message()));
            }
        }

        log_net::debug("connected to [{}:{}] over ssl using [{}]", _endpoint.host, _endpoint.port, SSL_get_version(ssl.get()));

        close_on_error = false;

        return std::unique_ptr<ssl_transport>{
            new ssl_transport{sock, std::move(ctx), std::move(ssl), _options.send_timeout}};
    } // connect

    auto ssl_transport::close() noexcept -> void
    {
        if (ssl_) {
            // Best effort close_notify. The socket is non-blocking so this never stalls.
            if (SSL_shutdown(ssl_.get()) < 0) {
                ERR_clear_error();
            }

            ssl_.reset();
        }

        ctx_.reset();

        close_socket(socket_);
        socket_ = -1;
    } // close

    auto ssl_transport::read_bytes(char* _buffer, std::size_t _length, deadline_type _deadline) -> std::error_code
    {
        if (!ssl_) {
            return make_error_code(SYS_SOCK_NOT_OPEN);
        }

        std::size_t bytes_read = 0;

        while (bytes_read < _length) {
            ERR_clear_error();
            errno = 0;

            const int status = SSL_read(ssl_.get(), _buffer + bytes_read, static_cast<int>(_length - bytes_read));

            if (status > 0) {
                bytes_read += static_cast<std::size_t>(status);
                continue;
            }

            auto direction = socket_direction::read;

            if (const auto ec = classify_ssl_result(ssl_.get(), status, true, direction); ec) {
                return ec;
            }

            // Decrypted bytes may already be buffered inside the SSL object.
            if (SSL_pending(ssl_.get()) > 0) {
                continue;
            }

            if (const auto ec = wait_for_socket(socket_, direction, _deadline); ec) {
                return is_timeout(ec) ? make_error_code(SYS_SOCK_READ_TIMEDOUT) : ec;
            }
        }

        return {};
    } // read_bytes

    auto ssl_transport::write_bytes(const char* _buffer, std::size_t _length, deadline_type _deadline)
        -> std::error_code
    {
        if (!ssl_) {
            return make_error_code(SYS_SOCK_NOT_OPEN);
        }

        std::size_t bytes_written = 0;

        while (bytes_written < _length) {
            ERR_clear_error();
            errno = 0;

            const int status =
                SSL_write(ssl_.get(), _buffer + bytes_written, static_cast<int>(_length - bytes_written));

            if (status > 0) {
                bytes_written += static_cast<std::size_t>(status);
                continue;
            }

            auto direction = socket_direction::write;

            if (const auto ec = classify_ssl_result(ssl_.get(), status, false, direction); ec) {
                return ec;
            }

            if (const auto ec = wait_for_socket(socket_, direction, _deadline); ec) {
                return is_timeout(ec) ? make_error_code(SYS_SOCK_WRITE_TIMEDOUT) : ec;
            }
        }

        return {};
    } // write_bytes
} // namespace handoff
