#include "handoff/transport.hpp"

#include "handoff/handoff_error_table.h"
#include "handoff/handoff_logger.hpp"
#include "handoff/ssl_transport.hpp"
#include "handoff/system_error.hpp"
#include "handoff/tcp_transport.hpp"

namespace handoff
{
    auto request_sync(transport& _transport,
                      wire::message_type _type,
                      std::string_view _payload,
                      std::chrono::milliseconds _timeout) -> std::error_code
    {
        if (const auto ec = _transport.send(_type, _payload); ec) {
            return ec;
        }

        wire::frame reply;

        if (const auto ec = _transport.receive(reply, _timeout); ec) {
            return ec;
        }

        if (!wire::is_sync_reply(reply, _type)) {
            log::network::error({{"log_message", "unexpected reply to sync request"},
                                 {"request_type", wire::to_string(_type)},
                                 {"reply_type", wire::to_string(reply.type)},
                                 {"reply_size", std::to_string(reply.payload.size())}});
            return make_error_code(HANDOFF_UNEXPECTED_REPLY);
        }

        return {};
    } // request_sync

    auto socket_transport_factory::open(const endpoint& _endpoint, const transport_options& _options)
        -> std::unique_ptr<transport>
    {
        // TLS material is checked again for every connection. Files which disappeared
        // since the options were built disable TLS for this transfer only.
        if (_options.ssl) {
            if (const auto ssl = validate_ssl_options(*_options.ssl); ssl) {
                return ssl_transport::connect(_endpoint, *ssl, _options);
            }
        }

        return tcp_transport::connect(_endpoint, _options);
    } // open
} // namespace handoff
