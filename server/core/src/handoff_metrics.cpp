#include "handoff/handoff_metrics.hpp"

namespace handoff
{
    auto handoff_metrics::instance() -> handoff_metrics&
    {
        static handoff_metrics metrics;
        return metrics;
    } // instance
} // namespace handoff
