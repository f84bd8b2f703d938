#include "handoff/handoff_sender.hpp"

#include "handoff/handoff_error_table.h"
#include "handoff/handoff_exception.hpp"
#include "handoff/handoff_logger.hpp"
#include "handoff/handoff_visitor.hpp"
#include "handoff/system_error.hpp"
#include "handoff/thread_pool.hpp"

#include <fmt/format.h>

#include <memory>
#include <utility>

namespace
{
    using log_sender = handoff::log::sender;

    constexpr std::string_view wildcard_address = "0.0.0.0";

    auto base_code(int _code) noexcept -> int
    {
        return _code / 1000 * 1000;
    } // base_code
} // anonymous namespace

namespace handoff
{
    auto error_kind(int _code) noexcept -> const char*
    {
        switch (base_code(_code)) {
            case HANDOFF_ENCODING_ERR:
                return "encoding_error";

            case HANDOFF_FOLD_ENGINE_ERR:
                return "fold_engine_error";

            case HANDOFF_LISTENER_LOOKUP_ERR:
            case HANDOFF_INVALID_NODE_NAME:
                return "listener_lookup_error";

            case SYS_SOCK_OPEN_ERR:
            case SYS_SOCK_NOT_OPEN:
            case SYS_SOCK_CONNECT_ERR:
            case SYS_SOCK_CONNECT_TIMEDOUT:
            case SYS_HOST_RESOLUTION_ERR:
            case SSL_INIT_ERROR:
            case SSL_HANDSHAKE_ERROR:
            case SSL_CERT_ERROR:
                return "connect_error";

            case HANDOFF_UNEXPECTED_REPLY:
                return "protocol_error";

            default:
                return "error";
        }
    } // error_kind

    handoff_sender::handoff_sender(transfer_request _request,
                                   sender_collaborators _collaborators,
                                   sender_options _options,
                                   handoff_metrics& _metrics)
        : request_{std::move(_request)}
        , collaborators_{_collaborators}
        , options_{std::move(_options)}
        , metrics_{_metrics}
        , state_{sender_state::connecting}
        , signaled_{false}
    {
        if (!options_.clock) {
            options_.clock = [] { return clock_type::now(); };
        }
    } // ctor

    auto handoff_sender::run() -> transfer_result
    {
        ++metrics_.handoffs_started;

        std::uint64_t total_sent = 0;

        try {
            set_state(sender_state::connecting);

            const auto target = resolve_endpoint();
            const transport_options topts{options_.connect_timeout, options_.receive_timeout, options_.ssl};

            auto connection = collaborators_.transports.open(target, topts);

            if (!connection) {
                THROW(SYS_SOCK_NOT_OPEN, fmt::format("no transport to [{}:{}]", target.host, target.port));
            }

            set_state(sender_state::handshaking);

            // The module name rides on the legacy sync request. A receiver which has reached
            // its concurrency limit closes the connection instead of replying.
            if (const auto ec = request_sync(*connection, wire::message_type::oldsync, request_.module, options_.receive_timeout); ec) {
                if (is_timeout(ec)) {
                    return time_out(total_sent, ec);
                }

                if (is_connection_closed(ec)) {
                    return reject(ec);
                }

                if (get_handoff_error_code(ec) == HANDOFF_UNEXPECTED_REPLY) {
                    return fail_unexpected(total_sent, error_kind(ec.value()), ec.message(), ec);
                }

                return fail_transport(total_sent, ec);
            }

            log_sender::info("Starting {} transfer of {} from {} {} to {} {}",
                             to_string(request_.type),
                             request_.module,
                             request_.source_node,
                             request_.source_partition.str(),
                             request_.target_node,
                             request_.target_partition.str());

            if (const auto ec = connection->send(wire::message_type::init, wire::encode_partition_id(request_.target_partition)); ec) {
                return is_timeout(ec) ? time_out(total_sent, ec) : fail_transport(total_sent, ec);
            }

            set_state(sender_state::streaming);

            const auto fold_start = options_.clock();

            const visit_context ctx{*connection,
                                    request_,
                                    collaborators_.codec,
                                    collaborators_.sink,
                                    status_key{request_.module, request_.source_partition, request_.target_partition},
                                    options_.receive_timeout,
                                    options_.status_interval,
                                    options_.clock,
                                    options_.ack_threshold};

            transfer_state initial;
            initial.stats = make_transfer_stats(fold_start, options_.status_interval);

            transfer_state final_state;

            try {
                final_state = collaborators_.engine.fold(request_.source_partition, make_visit_function(ctx, total_sent), std::move(initial));
            }
            catch (const handoff::exception&) {
                throw;
            }
            catch (const std::exception& e) {
                THROW(HANDOFF_FOLD_ENGINE_ERR,
                      fmt::format("fold of partition [{}] failed: {}", request_.source_partition.str(), e.what()));
            }

            total_sent = final_state.total_sent;

            if (final_state.error) {
                return is_timeout(final_state.error) ? time_out(total_sent, final_state.error)
                                                     : fail_transport(total_sent, final_state.error);
            }

            set_state(sender_state::final_syncing);

            // The receiver applies items synchronously, so this acknowledgment means every
            // item has been written on the target.
            log_sender::debug("{} {} Sending final sync", request_.source_partition.str(), request_.module);

            if (const auto ec = request_sync(*connection, wire::message_type::sync, {}, options_.receive_timeout); ec) {
                if (is_timeout(ec)) {
                    return time_out(total_sent, ec);
                }

                if (get_handoff_error_code(ec) == HANDOFF_UNEXPECTED_REPLY) {
                    return fail_unexpected(total_sent, error_kind(ec.value()), ec.message(), ec);
                }

                return fail_transport(total_sent, ec);
            }

            log_sender::debug("{} {} Final sync received", request_.source_partition.str(), request_.module);

            return complete(total_sent, elapsed_seconds(fold_start));
        }
        catch (const handoff::exception& e) {
            return fail_unexpected(total_sent, error_kind(static_cast<int>(e.code())), e.client_display_what());
        }
        catch (const std::exception& e) {
            return fail_unexpected(total_sent, "error", e.what());
        }
    } // run

    auto handoff_sender::resolve_endpoint() -> endpoint
    {
        const auto identity = parse_node_identity(request_.target_node);

        listener_address address;

        try {
            address = collaborators_.resolver.resolve(request_.target_node);
        }
        catch (const handoff::exception& e) {
            THROW(HANDOFF_LISTENER_LOOKUP_ERR,
                  fmt::format("cannot find handoff listener of [{}]: {}", request_.target_node, e.client_display_what()));
        }
        catch (const std::exception& e) {
            THROW(HANDOFF_LISTENER_LOOKUP_ERR,
                  fmt::format("cannot find handoff listener of [{}]: {}", request_.target_node, e.what()));
        }

        if (!address.ip || address.ip->empty() || *address.ip == wildcard_address) {
            return {identity.host, address.port};
        }

        return {*address.ip, address.port};
    } // resolve_endpoint

    auto handoff_sender::set_state(sender_state _state) -> void
    {
        log_sender::trace("{} transfer of {} to {}: {} -> {}",
                          to_string(request_.type),
                          request_.module,
                          request_.target_node,
                          to_string(state_),
                          to_string(_state));
        state_ = _state;
    } // set_state

    auto handoff_sender::elapsed_seconds(clock_type::time_point _start) const -> double
    {
        return std::chrono::duration<double>(options_.clock() - _start).count();
    } // elapsed_seconds

    auto handoff_sender::notify(const handoff_event& _event) -> void
    {
        if (signaled_) {
            return;
        }

        signaled_ = true;

        try {
            collaborators_.parent.signal(_event);
        }
        catch (const std::exception& e) {
            log_sender::error("failed to signal coordinator of {} transfer of {}: {}",
                              to_string(request_.type),
                              request_.module,
                              e.what());
        }
    } // notify

    auto handoff_sender::complete(std::uint64_t _total_sent, double _elapsed) -> transfer_result
    {
        set_state(sender_state::completed);
        ++metrics_.handoffs_completed;

        log_sender::info("{} transfer of {} from {} {} to {} {} completed: sent {} objects in {:.2f} seconds",
                         to_string(request_.type),
                         request_.module,
                         request_.source_node,
                         request_.source_partition.str(),
                         request_.target_node,
                         request_.target_partition.str(),
                         _total_sent,
                         _elapsed);

        if (request_.type != transfer_type::repair) {
            notify(handoff_complete{});
        }

        transfer_result result;
        result.outcome = transfer_outcome::completed;
        result.total_sent = _total_sent;
        result.elapsed_seconds = _elapsed;

        return result;
    } // complete

    auto handoff_sender::reject(const std::error_code& _ec) -> transfer_result
    {
        set_state(sender_state::rejected);
        ++metrics_.handoffs_rejected;

        // An expected condition under load. The coordinator retries later.
        log_sender::debug("{} transfer of {} to {} {} rejected by receiver: max_concurrency",
                          to_string(request_.type),
                          request_.module,
                          request_.target_node,
                          request_.target_partition.str());

        transfer_result result;
        result.outcome = transfer_outcome::rejected_max_concurrency;
        result.error_kind = "max_concurrency";
        result.reason = _ec.message();
        result.error = _ec;

        return result;
    } // reject

    auto handoff_sender::time_out(std::uint64_t _total_sent, const std::error_code& _ec) -> transfer_result
    {
        set_state(sender_state::timed_out);
        ++metrics_.handoff_timeouts;

        log_failure("TCP recv timeout");

        transfer_result result;
        result.outcome = transfer_outcome::timed_out;
        result.total_sent = _total_sent;
        result.error_kind = "timeout";
        result.reason = _ec.message();
        result.error = _ec;

        return result;
    } // time_out

    auto handoff_sender::fail_transport(std::uint64_t _total_sent, const std::error_code& _ec) -> transfer_result
    {
        set_state(sender_state::failed);
        ++metrics_.handoffs_failed;

        const auto reason = _ec.message();

        log_failure(reason);
        notify(handoff_error{"fold_error", reason});

        transfer_result result;
        result.outcome = transfer_outcome::failed_fold_error;
        result.total_sent = _total_sent;
        result.error_kind = "fold_error";
        result.reason = reason;
        result.error = _ec;

        return result;
    } // fail_transport

    auto handoff_sender::fail_unexpected(std::uint64_t _total_sent,
                                         const std::string& _kind,
                                         const std::string& _reason,
                                         const std::error_code& _ec) -> transfer_result
    {
        set_state(sender_state::failed);
        ++metrics_.handoffs_failed;

        log_failure(fmt::format("{}: {}", _kind, _reason));
        notify(handoff_error{_kind, _reason});

        transfer_result result;
        result.outcome = transfer_outcome::failed_unexpected;
        result.total_sent = _total_sent;
        result.error_kind = _kind;
        result.reason = _reason;
        result.error = _ec;

        return result;
    } // fail_unexpected

    auto handoff_sender::log_failure(const std::string& _cause) const -> void
    {
        log_sender::error("{} transfer of {} from {} {} to {} {} failed because of {}",
                          to_string(request_.type),
                          request_.module,
                          request_.source_node,
                          request_.source_partition.str(),
                          request_.target_node,
                          request_.target_partition.str(),
                          _cause);
    } // log_failure

    auto start_sender(thread_pool& _pool,
                      transfer_request _request,
                      sender_collaborators _collaborators,
                      sender_options _options) -> std::future<transfer_result>
    {
        auto sender = std::make_shared<handoff_sender>(std::move(_request), _collaborators, std::move(_options));
        auto task = std::make_shared<std::packaged_task<transfer_result()>>([sender] { return sender->run(); });
        auto result = task->get_future();

        thread_pool::post(_pool, [task = std::move(task)] { (*task)(); });

        return result;
    } // start_sender
} // namespace handoff
