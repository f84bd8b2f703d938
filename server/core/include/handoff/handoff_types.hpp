#ifndef HANDOFF_HANDOFF_TYPES_HPP
#define HANDOFF_HANDOFF_TYPES_HPP

/// \file

#include "handoff/wire_protocol.hpp"

#include <functional>
#include <string>
#include <string_view>

namespace handoff
{
    /// The reason a partition is being transferred.
    ///
    /// Only \p repair changes how completion is reported.
    enum class transfer_type
    {
        ownership,
        hinted,
        repair,
        resize
    };

    auto to_string(transfer_type _type) noexcept -> const char*;

    /// \throws handoff::exception If \p _name does not name a transfer type.
    auto to_transfer_type(std::string_view _name) -> transfer_type;

    /// Decides whether the item stored under a key is transferred.
    using item_filter = std::function<bool(std::string_view _key)>;

    /// Everything needed to transfer one partition. Immutable once the transfer starts.
    struct transfer_request
    {
        std::string source_node;
        std::string target_node;
        std::string module;
        transfer_type type = transfer_type::ownership;

        // An empty filter accepts every key.
        item_filter filter;

        partition_id source_partition = 0;
        partition_id target_partition = 0;
    };

    inline auto accepts(const transfer_request& _request, std::string_view _key) -> bool
    {
        return !_request.filter || _request.filter(_key);
    }

    /// A node identity of the form "name@host".
    struct node_identity
    {
        std::string name;
        std::string host;
    };

    /// \throws handoff::exception HANDOFF_INVALID_NODE_NAME unless \p _node splits into
    ///                            exactly two non-empty tokens around '@'.
    auto parse_node_identity(std::string_view _node) -> node_identity;
} // namespace handoff

#endif // HANDOFF_HANDOFF_TYPES_HPP
