#ifndef HANDOFF_HANDOFF_SENDER_HPP
#define HANDOFF_HANDOFF_SENDER_HPP

/// \file

#include "handoff/handoff_collaborators.hpp"
#include "handoff/handoff_metrics.hpp"
#include "handoff/handoff_outcome.hpp"
#include "handoff/handoff_types.hpp"
#include "handoff/sender_options.hpp"
#include "handoff/transport.hpp"

#include <future>
#include <string>
#include <system_error>

namespace handoff
{
    class thread_pool;

    /// The services a transfer depends on. Each must outlive the transfer.
    struct sender_collaborators
    {
        listener_resolver& resolver;
        fold_engine& engine;
        item_codec& codec;
        status_sink& sink;
        coordinator& parent;
        transport_factory& transports;
    };

    /// Transfers one partition to one target node.
    ///
    /// \since 1.0
    class handoff_sender
    {
    public:
        handoff_sender(transfer_request _request,
                       sender_collaborators _collaborators,
                       sender_options _options,
                       handoff_metrics& _metrics = handoff_metrics::instance());

        handoff_sender(const handoff_sender&) = delete;
        auto operator=(const handoff_sender&) -> handoff_sender& = delete;

        /// Runs the transfer to completion on the calling thread.
        ///
        /// Never throws. Every failure is classified into the returned result and, where
        /// the outcome requires it, reported to the coordinator exactly once.
        auto run() -> transfer_result;

        auto state() const noexcept -> sender_state
        {
            return state_;
        }

        auto request() const noexcept -> const transfer_request&
        {
            return request_;
        }

    private:
        auto resolve_endpoint() -> endpoint;

        auto set_state(sender_state _state) -> void;

        auto elapsed_seconds(clock_type::time_point _start) const -> double;

        auto notify(const handoff_event& _event) -> void;

        // Terminal transitions.
        auto complete(std::uint64_t _total_sent, double _elapsed) -> transfer_result;
        auto reject(const std::error_code& _ec) -> transfer_result;
        auto time_out(std::uint64_t _total_sent, const std::error_code& _ec) -> transfer_result;
        auto fail_transport(std::uint64_t _total_sent, const std::error_code& _ec) -> transfer_result;
        auto fail_unexpected(std::uint64_t _total_sent,
                             const std::string& _kind,
                             const std::string& _reason,
                             const std::error_code& _ec = {}) -> transfer_result;

        // Emits "<type> transfer of <module> from <src> <part> to <tgt> <part> failed because of <cause>".
        auto log_failure(const std::string& _cause) const -> void;

        transfer_request request_;
        sender_collaborators collaborators_;
        sender_options options_;
        handoff_metrics& metrics_;
        sender_state state_;
        bool signaled_;
    }; // class handoff_sender

    /// Maps a handoff error code to the kind carried by a handoff_error event.
    auto error_kind(int _code) noexcept -> const char*;

    /// Runs a sender on \p _pool.
    ///
    /// The collaborators must outlive the returned future becoming ready.
    auto start_sender(thread_pool& _pool,
                      transfer_request _request,
                      sender_collaborators _collaborators,
                      sender_options _options) -> std::future<transfer_result>;
} // namespace handoff

#endif // HANDOFF_HANDOFF_SENDER_HPP
