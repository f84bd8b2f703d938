#include "handoff/handoff_outcome.hpp"

namespace handoff
{
    auto to_string(sender_state _state) noexcept -> const char*
    {
        // clang-format off
        switch (_state) {
            case sender_state::connecting:    return "connecting";
            case sender_state::handshaking:   return "handshaking";
            case sender_state::streaming:     return "streaming";
            case sender_state::final_syncing: return "final_syncing";
            case sender_state::completed:     return "completed";
            case sender_state::rejected:      return "rejected";
            case sender_state::timed_out:     return "timed_out";
            case sender_state::failed:        return "failed";
        }
        // clang-format on

        return "unknown";
    } // to_string

    auto to_string(transfer_outcome _outcome) noexcept -> const char*
    {
        // clang-format off
        switch (_outcome) {
            case transfer_outcome::completed:                return "completed";
            case transfer_outcome::rejected_max_concurrency: return "rejected_max_concurrency";
            case transfer_outcome::timed_out:                return "timed_out";
            case transfer_outcome::failed_fold_error:        return "failed_fold_error";
            case transfer_outcome::failed_unexpected:        return "failed_unexpected";
        }
        // clang-format on

        return "unknown";
    } // to_string

    auto shutdown_reason(transfer_outcome _outcome) noexcept -> const char*
    {
        // clang-format off
        switch (_outcome) {
            case transfer_outcome::completed:                return "normal";
            case transfer_outcome::rejected_max_concurrency: return "max_concurrency";
            case transfer_outcome::timed_out:                return "timeout";
            case transfer_outcome::failed_fold_error:        return "error";
            case transfer_outcome::failed_unexpected:        return "error";
        }
        // clang-format on

        return "error";
    } // shutdown_reason
} // namespace handoff
