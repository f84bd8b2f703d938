#ifndef HANDOFF_WIRE_PROTOCOL_HPP
#define HANDOFF_WIRE_PROTOCOL_HPP

/// \file

#include <boost/multiprecision/cpp_int.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace handoff
{
    /// A ring index. Partition ids occupy the full 160-bit hash space.
    using partition_id = boost::multiprecision::number<
        boost::multiprecision::cpp_int_backend<160,
                                               160,
                                               boost::multiprecision::unsigned_magnitude,
                                               boost::multiprecision::unchecked,
                                               void>>;
} // namespace handoff

/// Frame layout and message tags of the handoff protocol.
///
/// Every message is a frame: a 4-byte big-endian length followed by that many bytes.
/// The first byte of the frame body is the message tag.
namespace handoff::wire
{
    enum class message_type : std::uint8_t
    {
        init      = 0,
        object    = 1,
        // Historical name. Carries the module name on the initial request and doubles as the
        // keep-alive request/acknowledgment. The byte layout must not change.
        oldsync   = 2,
        sync      = 3,
        configure = 4
    };

    // clang-format off
    inline constexpr std::string_view sync_body        = "sync";
    inline constexpr std::size_t frame_header_size     = 4;
    inline constexpr std::size_t partition_id_size     = 20;
    inline constexpr std::uint32_t max_reply_size      = 64 * 1024;
    // clang-format on

    struct frame
    {
        message_type type{};
        std::string payload;
    };

    auto to_string(message_type _type) noexcept -> const char*;

    /// The number of bytes a message occupies inside its frame (tag plus payload).
    inline auto message_size(std::string_view _payload) noexcept -> std::size_t
    {
        return 1 + _payload.size();
    }

    /// Returns the length prefix, tag and payload as one contiguous buffer.
    auto encode_frame(message_type _type, std::string_view _payload) -> std::string;

    /// Decodes the 4-byte big-endian length prefix.
    auto decode_frame_length(const unsigned char (&_header)[frame_header_size]) noexcept -> std::uint32_t;

    /// Encodes a partition id as a fixed-width 160-bit big-endian integer.
    auto encode_partition_id(const partition_id& _id) -> std::string;

    /// Inverse of encode_partition_id().
    ///
    /// \throws handoff::exception If \p _bytes is not exactly partition_id_size bytes.
    auto decode_partition_id(std::string_view _bytes) -> partition_id;

    /// True if \p _frame is an acknowledgment of a request of type \p _type.
    inline auto is_sync_reply(const frame& _frame, message_type _type) noexcept -> bool
    {
        return _frame.type == _type && _frame.payload == sync_body;
    }
} // namespace handoff::wire

#endif // HANDOFF_WIRE_PROTOCOL_HPP
