#ifndef HANDOFF_PROGRESS_STATS_HPP
#define HANDOFF_PROGRESS_STATS_HPP

/// \file

#include "handoff/wire_protocol.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace handoff
{
    using clock_type = std::chrono::system_clock;
    using clock_function = std::function<clock_type::time_point()>;

    /// Identifies the transfer a progress report belongs to.
    struct status_key
    {
        std::string module;
        partition_id source_partition = 0;
        partition_id target_partition = 0;
    };

    /// Cumulative counters of one transfer, as of \p timestamp.
    struct progress_snapshot
    {
        std::uint64_t bytes{};
        std::uint64_t objects{};
        clock_type::time_point timestamp;
    };

    /// Receives periodic progress reports.
    class status_sink
    {
    public:
        virtual ~status_sink() = default;

        virtual auto report(const status_key& _key, const progress_snapshot& _snapshot) -> void = 0;
    }; // class status_sink

    struct transfer_stats
    {
        std::uint64_t bytes{};
        std::uint64_t objects{};
        clock_type::time_point last_update;
        clock_type::time_point interval_end;
    };

    /// Returns zeroed counters whose first report is due one \p _interval after \p _now.
    inline auto make_transfer_stats(clock_type::time_point _now, std::chrono::seconds _interval) -> transfer_stats
    {
        return {0, 0, _now, _now + _interval};
    }

    /// Reports \p _stats to \p _sink if the current interval has elapsed, then starts
    /// the next interval at \p _now. Counters are never reset.
    ///
    /// \returns true if a report was sent.
    auto maybe_send_status(transfer_stats& _stats,
                           const status_key& _key,
                           status_sink& _sink,
                           clock_type::time_point _now,
                           std::chrono::seconds _interval) -> bool;
} // namespace handoff

#endif // HANDOFF_PROGRESS_STATS_HPP
