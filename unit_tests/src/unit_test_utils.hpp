#ifndef HANDOFF_UNIT_TEST_UTILS_HPP
#define HANDOFF_UNIT_TEST_UTILS_HPP

#include "handoff/handoff_collaborators.hpp"
#include "handoff/handoff_error_table.h"
#include "handoff/handoff_exception.hpp"
#include "handoff/progress_stats.hpp"
#include "handoff/system_error.hpp"
#include "handoff/transport.hpp"
#include "handoff/wire_protocol.hpp"

#include <boost/filesystem.hpp>

#include <fmt/format.h>

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace handoff::test
{
    //
    // Scripted transport
    //

    // How the fake receiver answers a request which expects an acknowledgment.
    enum class reply_behavior
    {
        acknowledge,
        close,
        silence,
        garbage
    };

    struct sent_message
    {
        wire::message_type type;
        std::string payload;
    };

    // The receiver side of a fake connection. Shared by the transport and the test.
    struct fake_wire
    {
        reply_behavior handshake = reply_behavior::acknowledge;
        reply_behavior keep_alive = reply_behavior::acknowledge;
        reply_behavior final_sync = reply_behavior::acknowledge;

        // Once this many OBJ messages were accepted, every further send fails with send_error.
        std::optional<std::size_t> stop_after_objects;
        std::error_code send_error = make_error_code(SYS_SOCK_WRITE_TIMEDOUT);

        std::vector<sent_message> sent;
        std::size_t objects = 0;
        std::size_t keep_alives = 0;
        std::size_t final_syncs = 0;
        bool closed = false;

        // The first OLDSYNC request is the handshake. Later ones are keep-alives.
        bool handshaken = false;

        auto count(wire::message_type _type) const -> std::size_t
        {
            std::size_t n = 0;
            for (const auto& m : sent) {
                if (m.type == _type) {
                    ++n;
                }
            }
            return n;
        }
    };

    class fake_transport : public transport
    {
    public:
        explicit fake_transport(std::shared_ptr<fake_wire> _wire)
            : wire_{std::move(_wire)}
        {
        }

        auto send(wire::message_type _type, std::string_view _payload) -> std::error_code override
        {
            if (wire_->stop_after_objects && wire_->objects >= *wire_->stop_after_objects) {
                return wire_->send_error;
            }

            wire_->sent.push_back({_type, std::string{_payload}});

            if (_type == wire::message_type::object) {
                ++wire_->objects;
            }

            return {};
        }

        auto receive(wire::frame& _frame, std::chrono::milliseconds) -> std::error_code override
        {
            if (wire_->sent.empty()) {
                return make_error_code(SYS_SOCK_READ_TIMEDOUT);
            }

            const auto& last = wire_->sent.back();

            auto behavior = reply_behavior::silence;

            if (last.type == wire::message_type::oldsync && !wire_->handshaken) {
                wire_->handshaken = true;
                behavior = wire_->handshake;
            }
            else if (last.type == wire::message_type::oldsync) {
                ++wire_->keep_alives;
                behavior = wire_->keep_alive;
            }
            else if (last.type == wire::message_type::sync) {
                ++wire_->final_syncs;
                behavior = wire_->final_sync;
            }

            switch (behavior) {
                case reply_behavior::acknowledge:
                    _frame = {last.type, std::string{wire::sync_body}};
                    return {};

                case reply_behavior::close:
                    return make_error_code(SYS_SOCK_CLOSED);

                case reply_behavior::garbage:
                    _frame = {wire::message_type::configure, "nope"};
                    return {};

                case reply_behavior::silence:
                    break;
            }

            return make_error_code(SYS_SOCK_READ_TIMEDOUT);
        }

        auto close() noexcept -> void override
        {
            wire_->closed = true;
        }

        auto protocol() const noexcept -> std::string_view override
        {
            return "fake";
        }

    private:
        std::shared_ptr<fake_wire> wire_;
    };

    class fake_transport_factory : public transport_factory
    {
    public:
        auto open(const endpoint& _endpoint, const transport_options& _options) -> std::unique_ptr<transport> override
        {
            opened = _endpoint;
            options = _options;

            if (refuse) {
                THROW(SYS_SOCK_CONNECT_ERR - ECONNREFUSED, "connection refused");
            }

            return std::make_unique<fake_transport>(wire);
        }

        std::shared_ptr<fake_wire> wire = std::make_shared<fake_wire>();
        std::optional<endpoint> opened;
        std::optional<transport_options> options;
        bool refuse = false;
    };

    //
    // Collaborators
    //

    struct item
    {
        std::string key;
        std::string value;
    };

    inline auto make_items(std::size_t _count) -> std::vector<item>
    {
        std::vector<item> items;
        items.reserve(_count);

        for (std::size_t i = 0; i < _count; ++i) {
            items.push_back({fmt::format("key_{}", i), fmt::format("value_{}", i)});
        }

        return items;
    }

    class vector_fold_engine : public fold_engine
    {
    public:
        explicit vector_fold_engine(std::vector<item> _items)
            : items_{std::move(_items)}
        {
        }

        auto fold(const partition_id& _partition, const visit_function& _visit, transfer_state _state)
            -> transfer_state override
        {
            partition = _partition;

            for (const auto& i : items_) {
                _state = _visit(i.key, i.value, std::move(_state));
                ++visited;
            }

            if (fail_with) {
                throw std::runtime_error{*fail_with};
            }

            if (storage_error) {
                _state.error = *storage_error;
            }

            return _state;
        }

        std::optional<partition_id> partition;
        std::size_t visited = 0;

        // Raised after every item was visited.
        std::optional<std::string> fail_with;

        // Reported through the accumulator after every item was visited.
        std::optional<std::error_code> storage_error;

    private:
        std::vector<item> items_;
    };

    class joining_codec : public item_codec
    {
    public:
        auto encode(std::string_view _key, std::string_view _value) -> std::string override
        {
            if (_key == poison_key) {
                throw std::runtime_error{"cannot encode"};
            }

            return fmt::format("{}={}", _key, _value);
        }

        std::string poison_key;
    };

    class recording_sink : public status_sink
    {
    public:
        auto report(const status_key& _key, const progress_snapshot& _snapshot) -> void override
        {
            std::lock_guard lock{mutex_};
            keys.push_back(_key);
            snapshots.push_back(_snapshot);
        }

        std::vector<status_key> keys;
        std::vector<progress_snapshot> snapshots;

    private:
        std::mutex mutex_;
    };

    class recording_coordinator : public coordinator
    {
    public:
        auto signal(const handoff_event& _event) -> void override
        {
            std::lock_guard lock{mutex_};
            events.push_back(_event);
        }

        auto size() -> std::size_t
        {
            std::lock_guard lock{mutex_};
            return events.size();
        }

        std::vector<handoff_event> events;

    private:
        std::mutex mutex_;
    };

    class fixed_resolver : public listener_resolver
    {
    public:
        auto resolve(const std::string& _node) -> listener_address override
        {
            queried = _node;

            if (fail) {
                throw std::runtime_error{"node unreachable"};
            }

            return address;
        }

        listener_address address{8099, std::nullopt};
        std::string queried;
        bool fail = false;
    };

    // A clock which advances by a fixed step every time it is read.
    class stepping_clock
    {
    public:
        explicit stepping_clock(std::chrono::milliseconds _step)
            : state_{std::make_shared<state>()}
        {
            state_->step = _step;
        }

        auto function() const -> clock_function
        {
            return [s = state_] {
                std::lock_guard lock{s->mutex};
                const auto now = s->now;
                s->now += s->step;
                return now;
            };
        }

        auto advance(std::chrono::milliseconds _amount) -> void
        {
            std::lock_guard lock{state_->mutex};
            state_->now += _amount;
        }

    private:
        struct state
        {
            std::mutex mutex;
            clock_type::time_point now{std::chrono::seconds{1'000'000}};
            std::chrono::milliseconds step{};
        };

        std::shared_ptr<state> state_;
    };

    //
    // Loopback receiver
    //

    enum class receiver_behavior
    {
        // Implements the receiving side of the protocol.
        cooperate,

        // Reads the first request and closes the connection.
        reject,

        // Reads everything and never replies.
        ignore
    };

    // Returns a listening socket on 127.0.0.1 bound to an ephemeral port.
    inline auto open_loopback_listener(int& _port) -> int
    {
        const int listener = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listener < 0) {
            throw std::runtime_error{"socket"};
        }

        int on = 1;
        ::setsockopt(listener, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;

        if (::bind(listener, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0 || ::listen(listener, 1) < 0) {
            ::close(listener);
            throw std::runtime_error{"bind"};
        }

        socklen_t len = sizeof(addr);
        ::getsockname(listener, reinterpret_cast<sockaddr*>(&addr), &len);
        _port = ntohs(addr.sin_port);

        return listener;
    }

    // Accepts one connection on 127.0.0.1 and plays the receiver on its own thread.
    class loopback_receiver
    {
    public:
        explicit loopback_receiver(receiver_behavior _behavior)
            : behavior_{_behavior}
            , port_{}
            , listener_{open_loopback_listener(port_)}
        {
            thread_ = std::thread{[this] { serve(); }};
        }

        loopback_receiver(const loopback_receiver&) = delete;
        auto operator=(const loopback_receiver&) -> loopback_receiver& = delete;

        ~loopback_receiver()
        {
            ::shutdown(listener_, SHUT_RDWR);
            thread_.join();
            ::close(listener_);
        }

        auto port() const noexcept -> int
        {
            return port_;
        }

        // Valid once the sender has finished.
        auto objects() const noexcept -> std::size_t { return objects_.load(); }
        auto keep_alives() const noexcept -> std::size_t { return keep_alives_.load(); }
        auto module() const -> std::string
        {
            std::lock_guard lock{mutex_};
            return module_;
        }
        auto target_partition() const -> std::string
        {
            std::lock_guard lock{mutex_};
            return target_partition_;
        }

    private:
        auto read_exact(int _socket, char* _buffer, std::size_t _length) -> bool
        {
            std::size_t n = 0;
            while (n < _length) {
                const auto r = ::recv(_socket, _buffer + n, _length - n, 0);
                if (r <= 0) {
                    return false;
                }
                n += static_cast<std::size_t>(r);
            }
            return true;
        }

        auto read_frame(int _socket, wire::frame& _frame) -> bool
        {
            unsigned char header[wire::frame_header_size]{};
            if (!read_exact(_socket, reinterpret_cast<char*>(header), sizeof(header))) {
                return false;
            }

            std::string body(wire::decode_frame_length(header), '\0');
            if (body.empty() || !read_exact(_socket, body.data(), body.size())) {
                return false;
            }

            _frame.type = static_cast<wire::message_type>(static_cast<unsigned char>(body[0]));
            _frame.payload = body.substr(1);
            return true;
        }

        auto reply(int _socket, wire::message_type _type) -> void
        {
            const auto buffer = wire::encode_frame(_type, wire::sync_body);
            ::send(_socket, buffer.data(), buffer.size(), MSG_NOSIGNAL);
        }

        auto serve() -> void
        {
            const int conn = ::accept(listener_, nullptr, nullptr);
            if (conn < 0) {
                return;
            }

            wire::frame frame;
            bool first = true;

            while (read_frame(conn, frame)) {
                if (behavior_ == receiver_behavior::reject) {
                    break;
                }

                if (behavior_ == receiver_behavior::ignore) {
                    continue;
                }

                switch (frame.type) {
                    case wire::message_type::oldsync:
                        if (first) {
                            std::lock_guard lock{mutex_};
                            module_ = frame.payload;
                        }
                        else {
                            ++keep_alives_;
                        }
                        reply(conn, wire::message_type::oldsync);
                        break;

                    case wire::message_type::init: {
                        std::lock_guard lock{mutex_};
                        target_partition_ = frame.payload;
                        break;
                    }

                    case wire::message_type::object:
                        ++objects_;
                        break;

                    case wire::message_type::sync:
                        reply(conn, wire::message_type::sync);
                        break;

                    default:
                        break;
                }

                first = false;
            }

            ::close(conn);
        }

        receiver_behavior behavior_;
        int port_ = 0;
        int listener_ = -1;
        std::thread thread_;
        mutable std::mutex mutex_;
        std::string module_;
        std::string target_partition_;
        std::atomic<std::size_t> objects_{0};
        std::atomic<std::size_t> keep_alives_{0};
    };

    //
    // Loopback TLS receiver
    //

    // A directory which is removed with its contents when the test finishes.
    class temporary_directory
    {
    public:
        temporary_directory()
            : path_{boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("handoff_test_%%%%-%%%%-%%%%")}
        {
            boost::filesystem::create_directories(path_);
        }

        temporary_directory(const temporary_directory&) = delete;
        auto operator=(const temporary_directory&) -> temporary_directory& = delete;

        ~temporary_directory()
        {
            boost::system::error_code ec;
            boost::filesystem::remove_all(path_, ec);
        }

        auto file(const std::string& _name) const -> std::string
        {
            return (path_ / _name).string();
        }

    private:
        boost::filesystem::path path_;
    };

    // Writes a fresh self-signed certificate and its private key as PEM files.
    inline auto write_self_signed_certificate(const std::string& _certfile, const std::string& _keyfile) -> void
    {
        std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key{EVP_RSA_gen(2048), EVP_PKEY_free};
        std::unique_ptr<X509, decltype(&X509_free)> cert{X509_new(), X509_free};

        if (!key || !cert) {
            throw std::runtime_error{"cannot allocate certificate"};
        }

        X509_set_version(cert.get(), 2);
        ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
        X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
        X509_gmtime_adj(X509_getm_notAfter(cert.get()), 3600);
        X509_set_pubkey(cert.get(), key.get());

        auto* name = X509_get_subject_name(cert.get());
        X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
        X509_set_issuer_name(cert.get(), name);

        X509V3_CTX v3{};
        X509V3_set_ctx(&v3, cert.get(), cert.get(), nullptr, nullptr, 0);

        std::unique_ptr<X509_EXTENSION, decltype(&X509_EXTENSION_free)> basic_constraints{
            X509V3_EXT_conf_nid(nullptr, &v3, NID_basic_constraints, "critical,CA:TRUE"), X509_EXTENSION_free};

        if (!basic_constraints || X509_add_ext(cert.get(), basic_constraints.get(), -1) != 1) {
            throw std::runtime_error{"cannot add certificate extension"};
        }

        if (X509_sign(cert.get(), key.get(), EVP_sha256()) == 0) {
            throw std::runtime_error{"cannot sign certificate"};
        }

        std::unique_ptr<BIO, decltype(&BIO_free)> cert_out{BIO_new_file(_certfile.c_str(), "w"), BIO_free};
        std::unique_ptr<BIO, decltype(&BIO_free)> key_out{BIO_new_file(_keyfile.c_str(), "w"), BIO_free};

        if (!cert_out || !key_out ||
            PEM_write_bio_X509(cert_out.get(), cert.get()) != 1 ||
            PEM_write_bio_PrivateKey(key_out.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1)
        {
            throw std::runtime_error{"cannot write certificate"};
        }
    }

    enum class tls_receiver_behavior
    {
        // Completes the TLS handshake and implements the receiving side of the protocol.
        cooperate,

        // Closes the connection before the TLS handshake.
        drop
    };

    // Accepts one TLS connection on 127.0.0.1 and plays the receiver on its own thread.
    class loopback_tls_receiver
    {
    public:
        loopback_tls_receiver(const std::string& _certfile, const std::string& _keyfile, tls_receiver_behavior _behavior)
            : behavior_{_behavior}
            , ctx_{SSL_CTX_new(TLS_server_method()), SSL_CTX_free}
        {
            if (!ctx_ ||
                SSL_CTX_use_certificate_chain_file(ctx_.get(), _certfile.c_str()) != 1 ||
                SSL_CTX_use_PrivateKey_file(ctx_.get(), _keyfile.c_str(), SSL_FILETYPE_PEM) != 1)
            {
                throw std::runtime_error{"cannot initialize server SSL context"};
            }

            listener_ = open_loopback_listener(port_);
            thread_ = std::thread{[this] { serve(); }};
        }

        loopback_tls_receiver(const loopback_tls_receiver&) = delete;
        auto operator=(const loopback_tls_receiver&) -> loopback_tls_receiver& = delete;

        ~loopback_tls_receiver()
        {
            ::shutdown(listener_, SHUT_RDWR);

            if (const int conn = connection_.load(); conn >= 0) {
                ::shutdown(conn, SHUT_RDWR);
            }

            thread_.join();
            ::close(listener_);
        }

        auto port() const noexcept -> int { return port_; }
        auto objects() const noexcept -> std::size_t { return objects_.load(); }
        auto keep_alives() const noexcept -> std::size_t { return keep_alives_.load(); }
        auto module() const -> std::string
        {
            std::lock_guard lock{mutex_};
            return module_;
        }

    private:
        auto read_exact(SSL* _ssl, char* _buffer, std::size_t _length) -> bool
        {
            std::size_t n = 0;
            while (n < _length) {
                const int r = SSL_read(_ssl, _buffer + n, static_cast<int>(_length - n));
                if (r <= 0) {
                    return false;
                }
                n += static_cast<std::size_t>(r);
            }
            return true;
        }

        auto read_frame(SSL* _ssl, wire::frame& _frame) -> bool
        {
            unsigned char header[wire::frame_header_size]{};
            if (!read_exact(_ssl, reinterpret_cast<char*>(header), sizeof(header))) {
                return false;
            }

            const auto length = wire::decode_frame_length(header);
            if (length == 0 || length > 1024 * 1024) {
                return false;
            }

            std::string body(length, '\0');
            if (!read_exact(_ssl, body.data(), body.size())) {
                return false;
            }

            _frame.type = static_cast<wire::message_type>(static_cast<unsigned char>(body[0]));
            _frame.payload = body.substr(1);
            return true;
        }

        auto reply(SSL* _ssl, wire::message_type _type) -> void
        {
            const auto buffer = wire::encode_frame(_type, wire::sync_body);
            SSL_write(_ssl, buffer.data(), static_cast<int>(buffer.size()));
        }

        auto serve() -> void
        {
            const int conn = ::accept(listener_, nullptr, nullptr);
            if (conn < 0) {
                return;
            }

            if (behavior_ == tls_receiver_behavior::drop) {
                ::close(conn);
                return;
            }

            connection_ = conn;

            std::unique_ptr<SSL, decltype(&SSL_free)> ssl{SSL_new(ctx_.get()), SSL_free};

            if (ssl && SSL_set_fd(ssl.get(), conn) == 1 && SSL_accept(ssl.get()) == 1) {
                wire::frame frame;
                bool first = true;

                while (read_frame(ssl.get(), frame)) {
                    switch (frame.type) {
                        case wire::message_type::oldsync:
                            if (first) {
                                std::lock_guard lock{mutex_};
                                module_ = frame.payload;
                            }
                            else {
                                ++keep_alives_;
                            }
                            reply(ssl.get(), wire::message_type::oldsync);
                            break;

                        case wire::message_type::object:
                            ++objects_;
                            break;

                        case wire::message_type::sync:
                            reply(ssl.get(), wire::message_type::sync);
                            break;

                        default:
                            break;
                    }

                    first = false;
                }

                SSL_shutdown(ssl.get());
            }

            ssl.reset();
            connection_ = -1;
            ::close(conn);
        }

        tls_receiver_behavior behavior_;
        std::unique_ptr<SSL_CTX, decltype(&SSL_CTX_free)> ctx_;
        int port_ = 0;
        int listener_ = -1;
        std::atomic<int> connection_{-1};
        std::thread thread_;
        mutable std::mutex mutex_;
        std::string module_;
        std::atomic<std::size_t> objects_{0};
        std::atomic<std::size_t> keep_alives_{0};
    };
} // namespace handoff::test

#endif // HANDOFF_UNIT_TEST_UTILS_HPP
