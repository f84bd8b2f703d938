#include "handoff/handoff_visitor.hpp"

#include "handoff/handoff_error_table.h"
#include "handoff/handoff_exception.hpp"
#include "handoff/handoff_logger.hpp"

#include <fmt/format.h>

namespace
{
    using log_sender = handoff::log::sender;

    constexpr std::string_view keep_alive_body = handoff::wire::sync_body;

    auto update_progress(const handoff::visit_context& _ctx, handoff::transfer_state& _state) -> void
    {
        handoff::maybe_send_status(_state.stats, _ctx.key, _ctx.sink, _ctx.clock(), _ctx.status_interval);
    } // update_progress
} // anonymous namespace

namespace handoff
{
    auto exchange_keep_alive(const visit_context& _ctx, transfer_state _state) -> transfer_state
    {
        _state.ack_count = 0;

        if (const auto ec = request_sync(_ctx.connection, wire::message_type::oldsync, keep_alive_body, _ctx.receive_timeout); ec) {
            log_sender::debug("keep-alive for [{}] failed after [{}] items: {}", _ctx.key.module, _state.total_sent, ec.message());
            _state.error = ec;
            return _state;
        }

        _state.error.clear();
        _state.stats.bytes += wire::message_size(keep_alive_body);
        update_progress(_ctx, _state);

        return _state;
    } // exchange_keep_alive

    auto send_item(const visit_context& _ctx, std::string_view _key, std::string_view _value, transfer_state _state)
        -> transfer_state
    {
        if (!accepts(_ctx.request, _key)) {
            ++_state.total_sent;
            return _state;
        }

        std::string payload;

        try {
            payload = _ctx.codec.encode(_key, _value);
        }
        catch (const handoff::exception&) {
            throw;
        }
        catch (const std::exception& e) {
            THROW(HANDOFF_ENCODING_ERR, fmt::format("cannot encode item of module [{}]: {}", _ctx.key.module, e.what()));
        }

        if (const auto ec = _ctx.connection.send(wire::message_type::object, payload); ec) {
            _state.error = ec;
            return _state;
        }

        ++_state.ack_count;
        ++_state.total_sent;
        ++_state.stats.objects;
        _state.stats.bytes += wire::message_size(payload);
        update_progress(_ctx, _state);

        return _state;
    } // send_item

    auto visit_item(const visit_context& _ctx, std::string_view _key, std::string_view _value, transfer_state _state)
        -> transfer_state
    {
        if (_state.error) {
            return _state;
        }

        if (_state.ack_count >= _ctx.ack_threshold) {
            _state = exchange_keep_alive(_ctx, std::move(_state));

            if (_state.error) {
                return _state;
            }
        }

        return send_item(_ctx, _key, _value, std::move(_state));
    } // visit_item

    auto make_visit_function(const visit_context& _ctx, std::uint64_t& _total_sent) -> visit_function
    {
        return [&_ctx, &_total_sent](std::string_view _key, std::string_view _value, transfer_state _state) {
            _total_sent = _state.total_sent;
            _state = visit_item(_ctx, _key, _value, std::move(_state));
            _total_sent = _state.total_sent;
            return _state;
        };
    } // make_visit_function
} // namespace handoff
