#include "handoff/handoff_types.hpp"

#include "handoff/handoff_error_table.h"
#include "handoff/handoff_exception.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <vector>

namespace handoff
{
    auto to_string(transfer_type _type) noexcept -> const char*
    {
        // clang-format off
        switch (_type) {
            case transfer_type::ownership: return "ownership";
            case transfer_type::hinted:    return "hinted";
            case transfer_type::repair:    return "repair";
            case transfer_type::resize:    return "resize";
        }
        // clang-format on

        return "unknown";
    } // to_string

    auto to_transfer_type(std::string_view _name) -> transfer_type
    {
        for (auto type : {transfer_type::ownership, transfer_type::hinted, transfer_type::repair, transfer_type::resize}) {
            if (_name == to_string(type)) {
                return type;
            }
        }

        THROW(SYS_INVALID_INPUT_PARAM, fmt::format("invalid transfer type [{}]", _name));
    } // to_transfer_type

    auto parse_node_identity(std::string_view _node) -> node_identity
    {
        const std::string node{_node};

        std::vector<std::string> tokens;
        boost::split(tokens, node, boost::is_any_of("@"), boost::token_compress_on);

        // Leading and trailing separators produce empty tokens.
        tokens.erase(std::remove(std::begin(tokens), std::end(tokens), std::string{}), std::end(tokens));

        if (tokens.size() != 2) {
            THROW(HANDOFF_INVALID_NODE_NAME, fmt::format("node identity [{}] is not of the form name@host", _node));
        }

        return {tokens[0], tokens[1]};
    } // parse_node_identity
} // namespace handoff
