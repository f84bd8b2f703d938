#ifndef HANDOFF_TRANSFER_STATE_HPP
#define HANDOFF_TRANSFER_STATE_HPP

/// \file

#include "handoff/progress_stats.hpp"

#include <cstddef>
#include <cstdint>
#include <system_error>

namespace handoff
{
    /// Number of items sent between two keep-alive exchanges.
    inline constexpr std::size_t default_ack_threshold = 1000;

    /// The accumulator threaded through a fold.
    ///
    /// Once \p error is set no further I/O is attempted for the remainder of the fold,
    /// except that a successful keep-alive exchange clears it.
    struct transfer_state
    {
        // Items sent since the last keep-alive exchange.
        std::size_t ack_count{};

        std::error_code error;

        // Items sent plus items rejected by the filter.
        std::uint64_t total_sent{};

        transfer_stats stats;
    };
} // namespace handoff

#endif // HANDOFF_TRANSFER_STATE_HPP
