/**
 * @file test_return_calculator.cpp
 * @brief Unit tests for Modified Dietz, TWR, XIRR and Sharpe
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "perfbook/analytics/return_calculator.hpp"

#include <cmath>

using namespace perfbook::analytics;
using Catch::Matchers::WithinAbs;

TEST_CASE("Modified Dietz", "[ReturnCalculator]") {
    std::vector<std::string> warnings;

    SECTION("Happy path: mid-period contribution is day weighted") {
        auto r = ReturnCalculator::modified_dietz({"2025-01-01", 100.0}, {"2025-01-31", 115.0},
                                                  {{"2025-01-15", 10.0}}, warnings);
        REQUIRE(r.has_value());
        REQUIRE_THAT(r->value, WithinAbs(5.0 / (100.0 + 10.0 * 16.0 / 30.0), 1e-12));
        REQUIRE_THAT(r->net_flow, WithinAbs(10.0, 1e-12));
        REQUIRE_THAT(r->weighted_flow, WithinAbs(10.0 * 16.0 / 30.0, 1e-12));
        REQUIRE(warnings.empty());
    }

    SECTION("Flows on the begin date or outside the period are ignored") {
        auto r = ReturnCalculator::modified_dietz({"2025-01-01", 100.0}, {"2025-01-31", 110.0},
                                                  {{"2025-01-01", 50.0}, {"2025-02-05", 20.0}}, warnings);
        REQUIRE_THAT(r->value, WithinAbs(0.10, 1e-12));
    }

    SECTION("Flow on the end date has zero weight") {
        auto r = ReturnCalculator::modified_dietz({"2025-01-01", 100.0}, {"2025-01-31", 130.0},
                                                  {{"2025-01-31", 20.0}}, warnings);
        REQUIRE_THAT(r->value, WithinAbs(0.10, 1e-12));
    }

    SECTION("Same-day flows are netted") {
        auto r = ReturnCalculator::modified_dietz({"2025-01-01", 100.0}, {"2025-01-31", 100.0},
                                                  {{"2025-01-15", 10.0}, {"2025-01-15", -10.0}}, warnings);
        REQUIRE_THAT(r->value, WithinAbs(0.0, 1e-12));
    }

    SECTION("Zero begin value is skipped with a warning") {
        auto r = ReturnCalculator::modified_dietz({"2025-01-01", 0.0}, {"2025-01-31", 100.0}, {}, warnings);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(warnings.size() == 1);
        REQUIRE(warnings[0].find("begin value is zero") != std::string::npos);
    }

    SECTION("Reversed dates are skipped") {
        auto r = ReturnCalculator::modified_dietz({"2025-01-31", 100.0}, {"2025-01-01", 100.0}, {}, warnings);
        REQUIRE_FALSE(r.has_value());
        REQUIRE(warnings[0].find("invalid date ordering") != std::string::npos);
    }
}

TEST_CASE("Time-weighted return", "[ReturnCalculator]") {
    SECTION("Chain linking") {
        REQUIRE_THAT(*ReturnCalculator::chain_link({0.10, -0.05}), WithinAbs(1.10 * 0.95 - 1.0, 1e-12));
        REQUIRE_FALSE(ReturnCalculator::chain_link({}).has_value());
    }

    SECTION("Happy path: flows do not distort the return") {
        std::vector<ValuationPoint> values = {
            {"2025-03-31", 231.0},
            {"2025-01-31", 100.0},
            {"2025-02-28", 210.0},
        };
        // 100 deposited on the last day of February, already in that day's value
        auto result = ReturnCalculator::time_weighted_return(values, {{"2025-02-28", 100.0}});

        REQUIRE(result.subperiods.size() == 2);
        REQUIRE(result.subperiods[0].start_date == "2025-01-31");
        auto returns = result.returns();
        REQUIRE(returns.size() == 2);
        REQUIRE_THAT(returns[0], WithinAbs(0.10, 1e-12));
        REQUIRE_THAT(returns[1], WithinAbs(0.10, 1e-12));
        REQUIRE_THAT(*result.twr, WithinAbs(0.21, 1e-12));
        REQUIRE(result.warnings.empty());
    }

    SECTION("Without flows TWR equals the value ratio") {
        std::vector<ValuationPoint> values = {
            {"2025-01-31", 100.0},
            {"2025-02-28", 110.0},
            {"2025-03-31", 99.0},
        };
        auto result = ReturnCalculator::time_weighted_return(values, {});
        REQUIRE_THAT(*result.twr, WithinAbs(-0.01, 1e-12));
    }

    SECTION("Fewer than two points") {
        auto result = ReturnCalculator::time_weighted_return({{"2025-01-31", 100.0}}, {});
        REQUIRE_FALSE(result.twr.has_value());
        REQUIRE(result.warnings == std::vector<std::string>{"Need at least 2 valuation points."});
    }

    SECTION("Zero-value periods are skipped") {
        std::vector<ValuationPoint> values = {
            {"2025-01-31", 0.0},
            {"2025-02-28", 100.0},
            {"2025-03-31", 105.0},
        };
        auto result = ReturnCalculator::time_weighted_return(values, {{"2025-02-10", 100.0}});
        REQUIRE(result.subperiods.size() == 1);
        REQUIRE_THAT(*result.twr, WithinAbs(0.05, 1e-12));
        REQUIRE(result.warnings.size() == 1);
    }

    SECTION("Growth curve") {
        auto curve = ReturnCalculator::growth_curve({0.10, -0.05});
        REQUIRE(curve.size() == 3);
        REQUIRE(curve[0] == Catch::Approx(1.0));
        REQUIRE(curve[2] == Catch::Approx(1.045));
    }
}

TEST_CASE("XIRR", "[ReturnCalculator]") {
    SECTION("Happy path: one year at ten percent") {
        auto r = ReturnCalculator::xirr({{"2024-01-01", -100.0}, {"2024-12-31", 110.0}});
        REQUIRE(r.has_value());
        REQUIRE_THAT(*r, WithinAbs(0.10, 1e-6));
    }

    SECTION("Unsorted cash flows with an interim deposit") {
        std::vector<CashFlow> flows = {
            {"2025-12-31", 230.0},
            {"2025-01-01", -100.0},
            {"2025-07-02", -100.0},
        };
        auto r = ReturnCalculator::xirr(flows);
        REQUIRE(r.has_value());
        REQUIRE_THAT(ReturnCalculator::npv(*r, {{"2025-01-01", -100.0}, {"2025-07-02", -100.0}, {"2025-12-31", 230.0}}),
                     WithinAbs(0.0, 1e-5));
        REQUIRE(*r > 0.10);
        REQUIRE(*r < 0.25);
    }

    SECTION("Large loss still converges") {
        auto r = ReturnCalculator::xirr({{"2025-01-01", -1000.0}, {"2025-12-31", 100.0}});
        REQUIRE(r.has_value());
        REQUIRE(*r < -0.85);
    }

    SECTION("No sign change or too few flows") {
        REQUIRE_FALSE(ReturnCalculator::xirr({{"2025-01-01", -100.0}, {"2025-12-31", -10.0}}).has_value());
        REQUIRE_FALSE(ReturnCalculator::xirr({{"2025-01-01", -100.0}}).has_value());
        REQUIRE_FALSE(ReturnCalculator::xirr({}).has_value());
    }

    SECTION("NPV at zero is the plain sum") {
        REQUIRE_THAT(ReturnCalculator::npv(0.0, {{"2025-01-01", -100.0}, {"2025-06-01", 40.0}}), WithinAbs(-60.0, 1e-12));
        REQUIRE(std::isinf(ReturnCalculator::npv(-1.0, {{"2025-01-01", -100.0}})));
    }
}

TEST_CASE("Volatility and Sharpe", "[ReturnCalculator]") {
    const std::vector<double> returns = {0.01, 0.02, 0.03};

    SECTION("Happy path: monthly returns annualized") {
        REQUIRE_THAT(*ReturnCalculator::volatility(returns, 12), WithinAbs(0.01 * std::sqrt(12.0), 1e-12));
        REQUIRE_THAT(*ReturnCalculator::sharpe_ratio(returns, 0.0, 12), WithinAbs(2.0 * std::sqrt(12.0), 1e-9));
    }

    SECTION("Risk-free rate is de-annualized per period") {
        // 12% a year is 1% a month
        REQUIRE_THAT(*ReturnCalculator::sharpe_ratio(returns, 0.12, 12), WithinAbs(std::sqrt(12.0), 1e-9));
    }

    SECTION("Undefined cases") {
        REQUIRE_FALSE(ReturnCalculator::sharpe_ratio({0.01}, 0.0, 12).has_value());
        REQUIRE_FALSE(ReturnCalculator::sharpe_ratio({0.01, 0.01, 0.01}, 0.0, 12).has_value());
        REQUIRE_FALSE(ReturnCalculator::volatility({0.01}, 12).has_value());
        REQUIRE_THAT(*ReturnCalculator::volatility({0.01, 0.01}, 12), WithinAbs(0.0, 1e-12));
    }

    SECTION("Excess return needs both sides") {
        REQUIRE_THAT(*ReturnCalculator::excess_return(0.12, 0.10), WithinAbs(0.02, 1e-12));
        REQUIRE_FALSE(ReturnCalculator::excess_return(0.12, std::nullopt).has_value());
    }
}
