#include "handoff/socket_utilities.hpp"

#include "handoff/handoff_at_scope_exit.hpp"
#include "handoff/handoff_error_table.h"
#include "handoff/handoff_exception.hpp"
#include "handoff/handoff_logger.hpp"
#include "handoff/system_error.hpp"

#include <fmt/format.h>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <string>

namespace
{
    using log_net = handoff::log::network;

    auto to_timeval(handoff::deadline_type _deadline) -> struct timeval
    {
        using namespace std::chrono;

        struct timeval tv{};

        const auto remaining = duration_cast<microseconds>(_deadline - steady_clock::now());

        if (remaining.count() > 0) {
            tv.tv_sec = static_cast<time_t>(remaining.count() / 1'000'000);
            tv.tv_usec = static_cast<suseconds_t>(remaining.count() % 1'000'000);
        }

        return tv;
    } // to_timeval

    auto is_peer_gone(int _errno) noexcept -> bool
    {
        return _errno == ECONNRESET || _errno == EPIPE;
    }

    // Returns 0 on success, a positive errno on failure and -1 on timeout.
    auto connect_one(int _socket, const struct addrinfo& _addr, handoff::deadline_type _deadline) -> int
    {
        if (const auto ec = handoff::set_nonblocking(_socket, true); ec) {
            return handoff::get_errno(ec);
        }

        if (::connect(_socket, _addr.ai_addr, _addr.ai_addrlen) == 0) {
            return 0;
        }

        if (errno != EINPROGRESS) {
            return errno;
        }

        while (true) {
            fd_set set;
            FD_ZERO(&set);
            FD_SET(_socket, &set);

            auto tv = to_timeval(_deadline);
            const int status = ::select(_socket + 1, nullptr, &set, nullptr, &tv);

            if (status == 0) {
                return -1;
            }

            if (status < 0) {
                if (errno == EINTR) {
                    continue;
                }

                return errno;
            }

            break;
        }

        int error = 0;
        socklen_t len = sizeof(error);

        if (::getsockopt(_socket, SOL_SOCKET, SO_ERROR, &error, &len) < 0) {
            return errno;
        }

        return error;
    } // connect_one
} // anonymous namespace

namespace handoff
{
    auto connect_with_timeout(const endpoint& _endpoint, std::chrono::milliseconds _timeout) -> int
    {
        struct addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_flags = AI_ADDRCONFIG;

        struct addrinfo* results = nullptr;
        const auto port = std::to_string(_endpoint.port);

        if (const int ec = ::getaddrinfo(_endpoint.host.c_str(), port.c_str(), &hints, &results); ec != 0) {
            THROW(SYS_HOST_RESOLUTION_ERR,
                  fmt::format("cannot resolve [{}]: {}", _endpoint.host, ::gai_strerror(ec)));
        }

        const auto free_results = at_scope_exit{[results] { ::freeaddrinfo(results); }};
        const auto deadline = std::chrono::steady_clock::now() + _timeout;

        bool timed_out = false;
        int last_errno = 0;

        for (auto* addr = results; addr; addr = addr->ai_next) {
            const int sock = ::socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);

            if (sock < 0) {
                last_errno = errno;
                continue;
            }

            if (const int status = connect_one(sock, *addr, deadline); status != 0) {
                close_socket(sock);

                if (status < 0) {
                    timed_out = true;
                    break;
                }

                last_errno = status;
                log_net::debug("connect to [{}:{}] failed with errno [{}]", _endpoint.host, _endpoint.port, status);
                continue;
            }

            if (const auto ec = set_nonblocking(sock, false); ec) {
                close_socket(sock);
                THROW(SYS_SOCK_CONNECT_ERR - get_errno(ec),
                      fmt::format("cannot restore blocking mode on socket to [{}:{}]", _endpoint.host, _endpoint.port));
            }

            int on = 1;
            if (::setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &on, sizeof(on)) < 0) {
                log_net::warn("cannot set TCP_NODELAY on socket to [{}:{}]", _endpoint.host, _endpoint.port);
            }

            return sock;
        }

        if (timed_out) {
            THROW(SYS_SOCK_CONNECT_TIMEDOUT,
                  fmt::format("connect to [{}:{}] timed out after [{}] ms", _endpoint.host, _endpoint.port, _timeout.count()));
        }

        THROW(SYS_SOCK_CONNECT_ERR - last_errno,
              fmt::format("cannot connect to [{}:{}]", _endpoint.host, _endpoint.port));
    } // connect_with_timeout

    auto wait_for_socket(int _socket, socket_direction _direction, deadline_type _deadline) -> std::error_code
    {
        const bool reading = _direction == socket_direction::read;

        while (true) {
            fd_set set;
            FD_ZERO(&set);
            FD_SET(_socket, &set);

            auto tv = to_timeval(_deadline);
            const int status = reading ? ::select(_socket + 1, &set, nullptr, nullptr, &tv)
                                       : ::select(_socket + 1, nullptr, &set, nullptr, &tv);

            if (status > 0) {
                return {};
            }

            if (status == 0) {
                return make_error_code(reading ? SYS_SOCK_READ_TIMEDOUT : SYS_SOCK_WRITE_TIMEDOUT);
            }

            if (errno != EINTR) {
                return make_error_code((reading ? SYS_SOCK_READ_ERR : SYS_SOCK_WRITE_ERR) - errno);
            }
        }
    } // wait_for_socket

    auto socket_read(int _socket, char* _buffer, std::size_t _length, deadline_type _deadline) -> std::error_code
    {
        std::size_t bytes_read = 0;

        while (bytes_read < _length) {
            if (const auto ec = wait_for_socket(_socket, socket_direction::read, _deadline); ec) {
                return ec;
            }

            const auto num_bytes = ::recv(_socket, _buffer + bytes_read, _length - bytes_read, 0);

            if (num_bytes < 0) {
                if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                    continue;
                }

                if (is_peer_gone(errno)) {
                    return make_error_code(SYS_SOCK_CLOSED);
                }

                return make_error_code(SYS_SOCK_READ_ERR - errno);
            }

            if (num_bytes == 0) {
                return make_error_code(SYS_SOCK_CLOSED);
            }

            bytes_read += static_cast<std::size_t>(num_bytes);
        }

        return {};
    } // socket_read

    auto socket_write(int _socket, const char* _buffer, std::size_t _length, deadline_type _deadline)
        -> std::error_code
    {
        std::size_t bytes_written = 0;

        while (bytes_written < _length) {
            const auto num_bytes =
                ::send(_socket, _buffer + bytes_written, _length - bytes_written, MSG_NOSIGNAL | MSG_DONTWAIT);

            if (num_bytes < 0) {
                if (errno == EINTR) {
                    continue;
                }

                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    if (const auto ec = wait_for_socket(_socket, socket_direction::write, _deadline); ec) {
                        return ec;
                    }

                    continue;
                }

                if (is_peer_gone(errno)) {
                    return make_error_code(SYS_SOCK_CLOSED);
                }

                return make_error_code(SYS_SOCK_WRITE_ERR - errno);
            }

            bytes_written += static_cast<std::size_t>(num_bytes);
        }

        return {};
    } // socket_write

    auto set_nonblocking(int _socket, bool _enable) -> std::error_code
    {
        const int flags = ::fcntl(_socket, F_GETFL, 0);

        if (flags < 0) {
            return make_error_code(SYS_SOCK_OPEN_ERR - errno);
        }

        const int new_flags = _enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);

        if (::fcntl(_socket, F_SETFL, new_flags) < 0) {
            return make_error_code(SYS_SOCK_OPEN_ERR - errno);
        }

        return {};
    } // set_nonblocking

    auto close_socket(int _socket) noexcept -> void
    {
        if (_socket >= 0) {
            ::close(_socket);
        }
    } // close_socket
} // namespace handoff
