#ifndef HANDOFF_SOCKET_UTILITIES_HPP
#define HANDOFF_SOCKET_UTILITIES_HPP

/// \file

#include "handoff/transport.hpp"

#include <chrono>
#include <cstddef>
#include <system_error>

namespace handoff
{
    using deadline_type = std::chrono::steady_clock::time_point;

    enum class socket_direction
    {
        read,
        write
    };

    /// Resolves \p _endpoint and connects to the first address which accepts within
    /// \p _timeout. The returned socket is in blocking mode.
    ///
    /// \throws handoff::exception SYS_HOST_RESOLUTION_ERR, SYS_SOCK_CONNECT_TIMEDOUT or
    ///                            SYS_SOCK_CONNECT_ERR (plus errno).
    auto connect_with_timeout(const endpoint& _endpoint, std::chrono::milliseconds _timeout) -> int;

    /// Blocks until \p _socket is readable or writable, or \p _deadline passes.
    ///
    /// Returns a default constructed error code when the socket is ready.
    auto wait_for_socket(int _socket, socket_direction _direction, deadline_type _deadline) -> std::error_code;

    /// Reads exactly \p _length bytes unless \p _deadline passes or the peer closes.
    auto socket_read(int _socket, char* _buffer, std::size_t _length, deadline_type _deadline) -> std::error_code;

    /// Writes exactly \p _length bytes unless \p _deadline passes or the write fails.
    /// Never raises SIGPIPE.
    auto socket_write(int _socket, const char* _buffer, std::size_t _length, deadline_type _deadline)
        -> std::error_code;

    auto set_nonblocking(int _socket, bool _enable) -> std::error_code;

    auto close_socket(int _socket) noexcept -> void;
} // namespace handoff

#endif // HANDOFF_SOCKET_UTILITIES_HPP
