#include <doctest/doctest.h>

#include <displaylist/config/DebugFlags.hpp>

#include <cstdlib>

using namespace DL;

TEST_SUITE("DebugFlags") {
    TEST_CASE("parse_truthy_values") {
        CHECK_FALSE(ParseTruthy(nullptr));
        CHECK(ParseTruthy(""));
        CHECK(ParseTruthy("1"));
        CHECK(ParseTruthy("yes"));
        CHECK(ParseTruthy("on"));
        CHECK_FALSE(ParseTruthy("0"));
        CHECK_FALSE(ParseTruthy("false"));
        CHECK_FALSE(ParseTruthy("OFF"));
        CHECK_FALSE(ParseTruthy(" No "));
    }

    TEST_CASE("logging_flag_reads_environment") {
        ::setenv("DISPLAYLIST_LOG", "0", 1);
        CHECK_FALSE(LoggingEnabledFromEnvironment());
        ::setenv("DISPLAYLIST_LOG", "1", 1);
        CHECK(LoggingEnabledFromEnvironment());
        ::unsetenv("DISPLAYLIST_LOG");
        CHECK_FALSE(LoggingEnabledFromEnvironment());
    }
}
