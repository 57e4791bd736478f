#include <catch2/catch_test_macros.hpp>
#include "workflow/Cron.hpp"

using namespace weft::workflow;

TEST_CASE("Standard five-field schedules", "[Cron]") {
    REQUIRE(isValidCron("* * * * *"));
    REQUIRE(isValidCron("0 9 * * 1-5"));
    REQUIRE(isValidCron("*/15 0-6 1,15 * *"));
    REQUIRE(isValidCron("30 2 * jan-mar MON"));
    REQUIRE(isValidCron("0 0 * * 7"));
}

TEST_CASE("Six fields carry trailing seconds", "[Cron]") {
    REQUIRE(isValidCron("0 12 * * * 30"));
    REQUIRE_FALSE(isValidCron("0 12 * * * 60"));
}

TEST_CASE("Shortcuts", "[Cron]") {
    REQUIRE(isValidCron("@daily"));
    REQUIRE(isValidCron("@hourly"));
    REQUIRE_FALSE(isValidCron("@fortnightly"));
}

TEST_CASE("Malformed schedules", "[Cron]") {
    REQUIRE_FALSE(isValidCron(""));
    REQUIRE_FALSE(isValidCron("* * * *"));
    REQUIRE_FALSE(isValidCron("60 * * * *"));
    REQUIRE_FALSE(isValidCron("* 24 * * *"));
    REQUIRE_FALSE(isValidCron("* * 0 * *"));
    REQUIRE_FALSE(isValidCron("* * * 13 *"));
    REQUIRE_FALSE(isValidCron("*/0 * * * *"));
    REQUIRE_FALSE(isValidCron("5-1 * * * *"));
    REQUIRE_FALSE(isValidCron("1,,2 * * * *"));
    REQUIRE_FALSE(isValidCron("every day"));
}
