#ifndef HANDOFF_HANDOFF_OUTCOME_HPP
#define HANDOFF_HANDOFF_OUTCOME_HPP

/// \file

#include <cstdint>
#include <string>
#include <system_error>

namespace handoff
{
    enum class sender_state
    {
        connecting,
        handshaking,
        streaming,
        final_syncing,
        completed,
        rejected,
        timed_out,
        failed
    };

    enum class transfer_outcome
    {
        completed,
        rejected_max_concurrency,
        timed_out,
        failed_fold_error,
        failed_unexpected
    };

    auto to_string(sender_state _state) noexcept -> const char*;

    auto to_string(transfer_outcome _outcome) noexcept -> const char*;

    /// The reason reported to the supervisor when the transfer task ends: "normal",
    /// "max_concurrency", "timeout" or "error".
    auto shutdown_reason(transfer_outcome _outcome) noexcept -> const char*;

    struct transfer_result
    {
        transfer_outcome outcome = transfer_outcome::failed_unexpected;

        // Items sent or filtered before the transfer ended.
        std::uint64_t total_sent{};

        // Empty unless the transfer failed.
        std::string error_kind;
        std::string reason;

        // Set when the failure was reported by a transport.
        std::error_code error;

        // Seconds from the start of the fold to the final acknowledgment.
        double elapsed_seconds{};
    };
} // namespace handoff

#endif // HANDOFF_HANDOFF_OUTCOME_HPP
