#ifndef HANDOFF_STREAM_TRANSPORT_HPP
#define HANDOFF_STREAM_TRANSPORT_HPP

/// \file

#include "handoff/socket_utilities.hpp"
#include "handoff/transport.hpp"

namespace handoff
{
    /// Implements message framing on top of a reliable byte stream.
    ///
    /// Derived classes supply the byte-level reads and writes.
    class stream_transport : public transport
    {
    public:
        explicit stream_transport(std::chrono::milliseconds _send_timeout) noexcept
            : send_timeout_{_send_timeout}
        {
        }

        auto send(wire::message_type _type, std::string_view _payload) -> std::error_code override;

        auto receive(wire::frame& _frame, std::chrono::milliseconds _timeout) -> std::error_code override;

    protected:
        virtual auto read_bytes(char* _buffer, std::size_t _length, deadline_type _deadline) -> std::error_code = 0;

        virtual auto write_bytes(const char* _buffer, std::size_t _length, deadline_type _deadline)
            -> std::error_code = 0;

    private:
        std::chrono::milliseconds send_timeout_;
    }; // class stream_transport
} // namespace handoff

#endif // HANDOFF_STREAM_TRANSPORT_HPP
