#ifndef HANDOFF_SENDER_OPTIONS_HPP
#define HANDOFF_SENDER_OPTIONS_HPP

/// \file

#include "handoff/progress_stats.hpp"
#include "handoff/ssl_options.hpp"
#include "handoff/transfer_state.hpp"

#include <chrono>
#include <cstddef>
#include <optional>

namespace handoff
{
    class configuration;

    struct sender_options
    {
        std::chrono::milliseconds receive_timeout{60'000};
        std::chrono::seconds status_interval{2};
        std::chrono::milliseconds connect_timeout{15'000};

        // Validated TLS material. TLS is used if and only if this is set.
        std::optional<ssl_options> ssl;

        std::size_t ack_threshold = default_ack_threshold;

        clock_function clock = [] { return clock_type::now(); };
    };

    /// Builds sender options from \p _config, using defaults for absent keys.
    ///
    /// TLS options whose files are missing or unreadable are dropped (see
    /// validate_ssl_options()).
    ///
    /// \throws handoff::exception KEY_TYPE_MISMATCH if a key holds a value of the wrong type.
    auto make_sender_options(const configuration& _config) -> sender_options;
} // namespace handoff

#endif // HANDOFF_SENDER_OPTIONS_HPP
