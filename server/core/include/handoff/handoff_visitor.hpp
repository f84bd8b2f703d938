#ifndef HANDOFF_HANDOFF_VISITOR_HPP
#define HANDOFF_HANDOFF_VISITOR_HPP

/// \file

#include "handoff/handoff_collaborators.hpp"
#include "handoff/handoff_types.hpp"
#include "handoff/transfer_state.hpp"
#include "handoff/transport.hpp"

#include <chrono>
#include <cstdint>
#include <string_view>

namespace handoff
{
    /// The read-only environment of a visitor. Outlives the fold.
    struct visit_context
    {
        transport& connection;
        const transfer_request& request;
        item_codec& codec;
        status_sink& sink;
        status_key key;
        std::chrono::milliseconds receive_timeout;
        std::chrono::seconds status_interval;
        clock_function clock;
        std::size_t ack_threshold = default_ack_threshold;
    };

    /// Sends one OLDSYNC keep-alive and waits for its acknowledgment.
    ///
    /// On success the window and the error are reset. On failure the error is latched and
    /// the window is reset.
    auto exchange_keep_alive(const visit_context& _ctx, transfer_state _state) -> transfer_state;

    /// Filters, encodes and sends one item under the current window.
    ///
    /// \throws handoff::exception HANDOFF_ENCODING_ERR if the item cannot be encoded.
    auto send_item(const visit_context& _ctx, std::string_view _key, std::string_view _value, transfer_state _state)
        -> transfer_state;

    /// The per-item step of a transfer.
    ///
    /// Does nothing once an error is latched. When the window is full a keep-alive is
    /// exchanged first and, if it succeeds, the item is sent under the fresh window.
    /// If the keep-alive fails the item is dropped.
    auto visit_item(const visit_context& _ctx, std::string_view _key, std::string_view _value, transfer_state _state)
        -> transfer_state;

    /// Binds visit_item() to \p _ctx for use by a fold engine.
    ///
    /// \p _total_sent tracks the running total of the fold, so it stays accurate when
    /// an item throws and the accumulator is lost.
    auto make_visit_function(const visit_context& _ctx, std::uint64_t& _total_sent) -> visit_function;
} // namespace handoff

#endif // HANDOFF_HANDOFF_VISITOR_HPP
