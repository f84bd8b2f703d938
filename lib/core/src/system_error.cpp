#include "handoff/system_error.hpp"

#define MAKE_HANDOFF_ERROR_MAP
#include "handoff/handoff_error_table.h"

#include <fmt/format.h>

#include <cstdlib>
#include <cstring>
#include <limits>

namespace
{
    // Handoff codes are multiples of 1000. The remainder is an errno value.
    constexpr int errno_slot = 1000;

    constexpr int not_a_handoff_code = std::numeric_limits<int>::min();

    struct split_code
    {
        int base;
        int sys_errno;
    };

    constexpr auto split(int _value) noexcept -> split_code
    {
        const int base = _value / errno_slot * errno_slot;
        return {base, base - _value};
    } // split

    auto belongs_to_handoff(const std::error_code& _errc) noexcept -> bool
    {
        return &_errc.category() == &handoff::handoff_category();
    } // belongs_to_handoff

    auto name_of(int _base) -> const std::string*
    {
        using handoff_error_map_construction::handoff_error_map;

        const auto iter = handoff_error_map.find(_base);
        return iter == handoff_error_map.end() ? nullptr : &iter->second;
    } // name_of
} // anonymous namespace

namespace handoff
{
    auto error_category::message(int _condition) const -> std::string
    {
        const auto [base, sys_errno] = split(_condition);
        const auto* name = name_of(base);

        if (!name) {
            return fmt::format("Unknown error {}", _condition);
        }

        if (sys_errno == 0) {
            return *name;
        }

        return fmt::format("{} [errno={}: {}]", *name, sys_errno, std::strerror(sys_errno));
    } // error_category::message

    auto handoff_category() noexcept -> const error_category&
    {
        static const error_category category;
        return category;
    } // handoff_category

    auto make_error_code(int _ec) noexcept -> std::error_code
    {
        return {_ec, handoff_category()};
    } // make_error_code

    auto get_handoff_error_code(const std::error_code& _errc) -> int
    {
        return belongs_to_handoff(_errc) ? split(_errc.value()).base : not_a_handoff_code;
    } // get_handoff_error_code

    auto get_errno(const std::error_code& _errc) -> int
    {
        return belongs_to_handoff(_errc) ? split(_errc.value()).sys_errno : not_a_handoff_code;
    } // get_errno

    auto is_timeout(const std::error_code& _errc) -> bool
    {
        // The error table entries are not constant expressions in this
        // translation unit (MAKE_HANDOFF_ERROR_MAP), so they cannot be case labels.
        const int code = get_handoff_error_code(_errc);
        return code == SYS_SOCK_READ_TIMEDOUT ||
               code == SYS_SOCK_WRITE_TIMEDOUT ||
               code == HANDOFF_TIMEOUT;
    } // is_timeout

    auto is_connection_closed(const std::error_code& _errc) -> bool
    {
        return get_handoff_error_code(_errc) == SYS_SOCK_CLOSED;
    } // is_connection_closed
} // namespace handoff
