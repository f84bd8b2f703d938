#include "handoff/tcp_transport.hpp"

#include "handoff/handoff_error_table.h"
#include "handoff/handoff_logger.hpp"
#include "handoff/system_error.hpp"

namespace handoff
{
    auto tcp_transport::connect(const endpoint& _endpoint, const transport_options& _options)
        -> std::unique_ptr<tcp_transport>
    {
        const int sock = connect_with_timeout(_endpoint, _options.connect_timeout);

        log::network::debug("connected to [{}:{}] over tcp", _endpoint.host, _endpoint.port);

        return std::make_unique<tcp_transport>(sock, _options.send_timeout);
    } // connect

    auto tcp_transport::close() noexcept -> void
    {
        close_socket(socket_);
        socket_ = -1;
    } // close

    auto tcp_transport::read_bytes(char* _buffer, std::size_t _length, deadline_type _deadline) -> std::error_code
    {
        if (socket_ < 0) {
            return make_error_code(SYS_SOCK_NOT_OPEN);
        }

        return socket_read(socket_, _buffer, _length, _deadline);
    } // read_bytes

    auto tcp_transport::write_bytes(const char* _buffer, std::size_t _length, deadline_type _deadline)
        -> std::error_code
    {
        if (socket_ < 0) {
            return make_error_code(SYS_SOCK_NOT_OPEN);
        }

        return socket_write(socket_, _buffer, _length, _deadline);
    } // write_bytes
} // namespace handoff
