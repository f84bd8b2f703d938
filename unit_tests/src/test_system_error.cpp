#include <catch2/catch.hpp>

#include "handoff/handoff_error_table.h"
#include "handoff/handoff_exception.hpp"
#include "handoff/system_error.hpp"

#include <cerrno>
#include <cstring>
#include <limits>
#include <string>
#include <system_error>

TEST_CASE("handoff error category")
{
    SECTION("error codes carry the handoff category")
    {
        const auto ec = handoff::make_error_code(SYS_SOCK_CLOSED);

        CHECK(ec);
        CHECK(std::string{ec.category().name()} == "handoff");
        CHECK(ec.message() == "SYS_SOCK_CLOSED");
        CHECK(handoff::get_handoff_error_code(ec) == SYS_SOCK_CLOSED);
        CHECK(handoff::get_errno(ec) == 0);
    }

    SECTION("an embedded errno is reported separately")
    {
        const auto ec = handoff::make_error_code(SYS_SOCK_READ_ERR - ECONNABORTED);

        CHECK(handoff::get_handoff_error_code(ec) == SYS_SOCK_READ_ERR);
        CHECK(handoff::get_errno(ec) == ECONNABORTED);
        CHECK(ec.message() == "SYS_SOCK_READ_ERR [errno=" + std::to_string(ECONNABORTED) + ": " + std::strerror(ECONNABORTED) + "]");
    }

    SECTION("unknown codes are reported as such")
    {
        CHECK(handoff::make_error_code(-999'000).message() == "Unknown error -999000");
    }

    SECTION("read, write and protocol timeouts are timeouts")
    {
        CHECK(handoff::is_timeout(handoff::make_error_code(SYS_SOCK_READ_TIMEDOUT)));
        CHECK(handoff::is_timeout(handoff::make_error_code(SYS_SOCK_WRITE_TIMEDOUT)));
        CHECK(handoff::is_timeout(handoff::make_error_code(HANDOFF_TIMEOUT)));
        CHECK_FALSE(handoff::is_timeout(handoff::make_error_code(SYS_SOCK_CLOSED)));
        CHECK_FALSE(handoff::is_timeout(handoff::make_error_code(SYS_SOCK_CONNECT_TIMEDOUT)));
    }

    SECTION("closed and reset connections are recognized")
    {
        CHECK(handoff::is_connection_closed(handoff::make_error_code(SYS_SOCK_CLOSED)));
        CHECK_FALSE(handoff::is_connection_closed(handoff::make_error_code(SYS_SOCK_READ_ERR - ECONNABORTED)));
        CHECK_FALSE(handoff::is_connection_closed(std::make_error_code(std::errc::connection_reset)));
    }

    SECTION("codes of other categories are not interpreted")
    {
        const auto ec = std::make_error_code(std::errc::timed_out);

        CHECK_FALSE(handoff::is_timeout(ec));
        CHECK(handoff::get_errno(ec) == std::numeric_limits<int>::min());
    }
}

TEST_CASE("handoff exception")
{
    try {
        THROW(HANDOFF_ENCODING_ERR, "cannot encode item");
    }
    catch (const handoff::exception& e) {
        CHECK(e.code() == HANDOFF_ENCODING_ERR);
        CHECK(std::string{e.client_display_what()}.find("HANDOFF_ENCODING_ERR") != std::string::npos);
        CHECK(std::string{e.what()}.find("cannot encode item") != std::string::npos);
        REQUIRE(e.message_stack().size() == 1);
        CHECK(e.message_stack().front() == "cannot encode item");
    }
}
