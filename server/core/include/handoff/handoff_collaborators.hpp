#ifndef HANDOFF_HANDOFF_COLLABORATORS_HPP
#define HANDOFF_HANDOFF_COLLABORATORS_HPP

/// \file

#include "handoff/transfer_state.hpp"
#include "handoff/wire_protocol.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace handoff
{
    /// Where a node's handoff listener accepts connections.
    struct listener_address
    {
        int port{};

        // Empty or "0.0.0.0" means the host part of the node identity is used.
        std::optional<std::string> ip;
    };

    /// Looks up the handoff listener of a cluster member.
    class listener_resolver
    {
    public:
        virtual ~listener_resolver() = default;

        /// \throws handoff::exception If the member cannot be reached.
        virtual auto resolve(const std::string& _node) -> listener_address = 0;
    }; // class listener_resolver

    /// Serializes a stored item into the body of an OBJ message.
    class item_codec
    {
    public:
        virtual ~item_codec() = default;

        /// \throws handoff::exception HANDOFF_ENCODING_ERR
        virtual auto encode(std::string_view _key, std::string_view _value) -> std::string = 0;
    }; // class item_codec

    using visit_function =
        std::function<transfer_state(std::string_view _key, std::string_view _value, transfer_state _state)>;

    /// Iterates the items of a partition, threading an accumulator through the visitor.
    class fold_engine
    {
    public:
        virtual ~fold_engine() = default;

        /// Invokes \p _visit once per stored item and returns the final accumulator.
        ///
        /// A storage failure may be reported by returning an accumulator whose error is
        /// set. Any exception is treated as a failure of the fold engine itself.
        virtual auto fold(const partition_id& _partition, const visit_function& _visit, transfer_state _initial)
            -> transfer_state = 0;
    }; // class fold_engine

    struct handoff_complete
    {
    };

    struct handoff_error
    {
        std::string kind;
        std::string reason;
    };

    using handoff_event = std::variant<handoff_complete, handoff_error>;

    /// The owner of a transfer. Receives at most one event per transfer.
    class coordinator
    {
    public:
        virtual ~coordinator() = default;

        virtual auto signal(const handoff_event& _event) -> void = 0;
    }; // class coordinator
} // namespace handoff

#endif // HANDOFF_HANDOFF_COLLABORATORS_HPP
