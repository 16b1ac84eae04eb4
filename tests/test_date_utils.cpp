/**
 * @file test_date_utils.cpp
 * @brief Unit tests for ISO date arithmetic and reporting frequencies
 */

#include <catch2/catch_test_macros.hpp>
#include "perfbook/core/errors.hpp"
#include "perfbook/data/date_utils.hpp"

using namespace perfbook;
using namespace perfbook::data;

TEST_CASE("Date validation", "[DateUtils]") {
    SECTION("Accepts calendar dates") {
        REQUIRE(is_valid_date("2024-02-29"));
        REQUIRE(is_valid_date("2025-12-31"));
    }

    SECTION("Rejects malformed or impossible dates") {
        REQUIRE_FALSE(is_valid_date("2025-02-29"));
        REQUIRE_FALSE(is_valid_date("2025-13-01"));
        REQUIRE_FALSE(is_valid_date("2025/01/01"));
        REQUIRE_FALSE(is_valid_date("20250101"));
        REQUIRE_FALSE(is_valid_date(""));
    }

    SECTION("require_valid_date throws InvalidRequest") {
        REQUIRE_NOTHROW(require_valid_date("2025-01-31", "start_date"));
        REQUIRE_THROWS_AS(require_valid_date("2025-01-32", "start_date"), InvalidRequest);
        REQUIRE_THROWS_AS(require_valid_date("Jan 1", "end_date"), std::invalid_argument);
    }
}

TEST_CASE("Day arithmetic", "[DateUtils]") {
    SECTION("days_between across a leap year") {
        REQUIRE(days_between("2024-01-01", "2025-01-01") == 366);
        REQUIRE(days_between("2025-01-01", "2026-01-01") == 365);
        REQUIRE(days_between("2025-03-01", "2025-02-01") == -28);
    }

    SECTION("add_days crosses month and year boundaries") {
        REQUIRE(add_days("2024-12-31", 1) == "2025-01-01");
        REQUIRE(add_days("2024-03-01", -1) == "2024-02-29");
        REQUIRE(add_days("2025-01-15", -30) == "2024-12-16");
    }

    SECTION("Epoch round trip") {
        REQUIRE(days_since_epoch("1970-01-01") == 0);
        REQUIRE(date_from_days(days_since_epoch("2031-07-04")) == "2031-07-04");
    }

    SECTION("Field extraction") {
        REQUIRE(extract_year("2025-06-30") == 2025);
        REQUIRE(extract_month("2025-06-30") == 6);
        REQUIRE(extract_day("2025-06-30") == 30);
        REQUIRE(month_key("2025-06-30") == "2025-06");
        REQUIRE(date_part("2025-06-30T21:00:00Z") == "2025-06-30");
    }
}

TEST_CASE("Frequency parsing", "[DateUtils]") {
    REQUIRE(parse_frequency("daily") == Frequency::DAILY);
    REQUIRE(parse_frequency("Month_End") == Frequency::MONTH_END);
    REQUIRE(parse_frequency("monthly") == Frequency::MONTH_END);
    REQUIRE(to_string(Frequency::MONTH_END) == "month_end");

    REQUIRE(periods_per_year(Frequency::MONTH_END) == 12);
    REQUIRE(periods_per_year(Frequency::DAILY) == 252);

    REQUIRE_THROWS_AS(parse_frequency("weekly"), InvalidRequest);
}
