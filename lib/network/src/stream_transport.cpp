#include "handoff/stream_transport.hpp"

#include "handoff/handoff_error_table.h"
#include "handoff/handoff_logger.hpp"
#include "handoff/system_error.hpp"

namespace
{
    using log_net = handoff::log::network;
} // anonymous namespace

namespace handoff
{
    auto stream_transport::send(wire::message_type _type, std::string_view _payload) -> std::error_code
    {
        const auto buffer = wire::encode_frame(_type, _payload);
        const auto deadline = std::chrono::steady_clock::now() + send_timeout_;

        const auto ec = write_bytes(buffer.data(), buffer.size(), deadline);

        if (ec) {
            log_net::debug("failed to send {} message of [{}] bytes: {}", wire::to_string(_type), buffer.size(), ec.message());
        }

        return ec;
    } // send

    auto stream_transport::receive(wire::frame& _frame, std::chrono::milliseconds _timeout) -> std::error_code
    {
        const auto deadline = std::chrono::steady_clock::now() + _timeout;

        unsigned char header[wire::frame_header_size]{};

        if (const auto ec = read_bytes(reinterpret_cast<char*>(header), sizeof(header), deadline); ec) {
            return ec;
        }

        const auto length = wire::decode_frame_length(header);

        // A reply carries at least its tag.
        if (length == 0 || length > wire::max_reply_size) {
            log_net::error("received frame with invalid length [{}]", length);
            return make_error_code(SYS_FRAME_LEN_ERR);
        }

        std::string body(length, '\0');

        if (const auto ec = read_bytes(body.data(), body.size(), deadline); ec) {
            return ec;
        }

        _frame.type = static_cast<wire::message_type>(static_cast<unsigned char>(body[0]));
        _frame.payload = body.substr(1);

        return {};
    } // receive
} // namespace handoff
