#include "handoff/progress_stats.hpp"

#include "handoff/handoff_logger.hpp"

namespace handoff
{
    auto maybe_send_status(transfer_stats& _stats,
                           const status_key& _key,
                           status_sink& _sink,
                           clock_type::time_point _now,
                           std::chrono::seconds _interval) -> bool
    {
        if (_now < _stats.interval_end) {
            return false;
        }

        _stats.last_update = _now;
        _stats.interval_end = _now + _interval;

        try {
            _sink.report(_key, {_stats.bytes, _stats.objects, _now});
        }
        catch (const std::exception& e) {
            log::sender::warn("failed to report progress for [{}]: {}", _key.module, e.what());
        }

        return true;
    } // maybe_send_status
} // namespace handoff
