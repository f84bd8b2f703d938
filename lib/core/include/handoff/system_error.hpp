#ifndef HANDOFF_SYSTEM_ERROR_HPP
#define HANDOFF_SYSTEM_ERROR_HPP

/// \file

#include <string>
#include <system_error>

namespace handoff
{
    /// The error category for handoff error codes.
    ///
    /// Values are negative handoff error codes, optionally carrying an errno value
    /// in the last three digits (e.g. SYS_SOCK_READ_ERR - ECONNRESET).
    class error_category : public std::error_category
    {
    public:
        auto name() const noexcept -> const char* override
        {
            return "handoff";
        }

        /// Returns the name of the handoff error code, followed by the embedded errno
        /// value and its description if one is present.
        auto message(int _condition) const -> std::string override;
    }; // class error_category

    /// Returns the singleton instance of the handoff error category.
    auto handoff_category() noexcept -> const error_category&;

    /// Wraps a handoff error code (possibly carrying an errno value) in a std::error_code.
    auto make_error_code(int _ec) noexcept -> std::error_code;

    /// Returns the handoff error code without the embedded errno value.
    ///
    /// \returns std::numeric_limits<int>::min() if \p _errc does not belong to the
    /// handoff error category.
    auto get_handoff_error_code(const std::error_code& _errc) -> int;

    /// Returns the errno value embedded in the error code.
    ///
    /// \returns std::numeric_limits<int>::min() if \p _errc does not belong to the
    /// handoff error category.
    auto get_errno(const std::error_code& _errc) -> int;

    /// Returns true if \p _errc represents a read or write timeout.
    auto is_timeout(const std::error_code& _errc) -> bool;

    /// Returns true if \p _errc reports that the peer closed or reset the connection.
    auto is_connection_closed(const std::error_code& _errc) -> bool;
} // namespace handoff

#endif // HANDOFF_SYSTEM_ERROR_HPP
