#include "handoff/wire_protocol.hpp"

#include "handoff/handoff_error_table.h"
#include "handoff/handoff_exception.hpp"

#include <fmt/format.h>

namespace handoff::wire
{
    auto to_string(message_type _type) noexcept -> const char*
    {
        // clang-format off
        switch (_type) {
            case message_type::init:      return "INIT";
            case message_type::object:    return "OBJ";
            case message_type::oldsync:   return "OLDSYNC";
            case message_type::sync:      return "SYNC";
            case message_type::configure: return "CONFIGURE";
        }
        // clang-format on

        return "UNKNOWN";
    } // to_string

    auto encode_frame(message_type _type, std::string_view _payload) -> std::string
    {
        const auto length = static_cast<std::uint32_t>(message_size(_payload));

        std::string buffer;
        buffer.reserve(frame_header_size + length);

        buffer.push_back(static_cast<char>((length >> 24) & 0xff));
        buffer.push_back(static_cast<char>((length >> 16) & 0xff));
        buffer.push_back(static_cast<char>((length >> 8) & 0xff));
        buffer.push_back(static_cast<char>(length & 0xff));
        buffer.push_back(static_cast<char>(_type));
        buffer.append(_payload.data(), _payload.size());

        return buffer;
    } // encode_frame

    auto decode_frame_length(const unsigned char (&_header)[frame_header_size]) noexcept -> std::uint32_t
    {
        return (std::uint32_t{_header[0]} << 24) |
               (std::uint32_t{_header[1]} << 16) |
               (std::uint32_t{_header[2]} << 8) |
               std::uint32_t{_header[3]};
    } // decode_frame_length

    auto encode_partition_id(const partition_id& _id) -> std::string
    {
        std::string bytes(partition_id_size, '\0');

        auto value = _id;
        for (auto i = partition_id_size; i > 0; --i) {
            bytes[i - 1] = static_cast<char>(static_cast<unsigned int>(value & 0xff));
            value >>= 8;
        }

        return bytes;
    } // encode_partition_id

    auto decode_partition_id(std::string_view _bytes) -> partition_id
    {
        if (_bytes.size() != partition_id_size) {
            THROW(SYS_INVALID_INPUT_PARAM,
                  fmt::format("partition id must be {} bytes, got {}", partition_id_size, _bytes.size()));
        }

        partition_id id = 0;

        for (const auto c : _bytes) {
            id <<= 8;
            id |= static_cast<unsigned char>(c);
        }

        return id;
    } // decode_partition_id
} // namespace handoff::wire
