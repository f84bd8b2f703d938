#ifndef HANDOFF_HANDOFF_METRICS_HPP
#define HANDOFF_HANDOFF_METRICS_HPP

#include <atomic>
#include <cstdint>

namespace handoff
{
    /// Process-wide transfer counters.
    struct handoff_metrics
    {
        static auto instance() -> handoff_metrics&;

        std::atomic<std::uint64_t> handoff_timeouts{0};
        std::atomic<std::uint64_t> handoffs_started{0};
        std::atomic<std::uint64_t> handoffs_completed{0};
        std::atomic<std::uint64_t> handoffs_failed{0};
        std::atomic<std::uint64_t> handoffs_rejected{0};
    };
} // namespace handoff

#endif // HANDOFF_HANDOFF_METRICS_HPP
