/**
 * @file test_performance_report.cpp
 * @brief Unit tests for PerformanceReportBuilder and report output
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "perfbook/analytics/performance_report.hpp"
#include "perfbook/analytics/risk_statistics.hpp"
#include "perfbook/core/errors.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace perfbook;
using namespace perfbook::analytics;
using Catch::Matchers::WithinAbs;

namespace {

const std::string TEST_DIR = "build/tmp/performance_report_test";

std::vector<data::Account> accounts()
{
    return {
        {1, 7, 10, "Brokerage", data::AccountType::TAXABLE},
        {2, 7, 20, "IRA", data::AccountType::TAX_ADVANTAGED},
        {3, 8, 30, "Joint", data::AccountType::TAXABLE},
    };
}

data::HoldingsSnapshot snapshot(int account, const std::string& as_of, double value)
{
    data::HoldingsSnapshot s;
    s.account_id = account;
    s.as_of = as_of;
    s.items = {{"VOO", value}};
    return s;
}

data::Transaction deposit(int id, int account, const std::string& date, double amount)
{
    data::Transaction t;
    t.id = id;
    t.account_id = account;
    t.date = date;
    t.type = data::TransactionType::TRANSFER;
    t.amount = amount;
    t.metadata["description"] = "ACH DEPOSIT";
    return t;
}

// Brokerage: +10%, +10% with a 1000 deposit on 2025-02-28, then -5%.
// IRA: first snapshot mid-February, too late for a baseline.
data::InMemorySnapshotSource snapshots()
{
    return data::InMemorySnapshotSource({
        snapshot(1, "2024-12-31", 1000.0),
        snapshot(1, "2025-01-31", 1100.0),
        snapshot(1, "2025-02-28", 2210.0),
        snapshot(1, "2025-03-31", 2099.5),
        snapshot(2, "2025-02-15", 500.0),
        snapshot(2, "2025-03-31", 520.0),
    });
}

ReportRequest request()
{
    ReportRequest r;
    r.scope = "taxpayer:7";
    r.start_date = "2025-01-01";
    r.end_date = "2025-03-31";
    r.frequency = data::Frequency::MONTH_END;
    r.benchmark_symbol = "SPY";
    r.baseline_grace_days = 14;
    return r;
}

bool has_warning(const std::vector<std::string>& warnings, const std::string& text)
{
    return std::find(warnings.begin(), warnings.end(), text) != warnings.end();
}

bool has_warning_containing(const std::vector<std::string>& warnings, const std::string& text)
{
    return std::any_of(warnings.begin(), warnings.end(),
                       [&text](const std::string& w) { return w.find(text) != std::string::npos; });
}

} // namespace

TEST_CASE("Report request validation", "[PerformanceReport]") {
    SECTION("Happy path: valid request") {
        REQUIRE_NOTHROW(request().validate());
        REQUIRE(request().label() == "SPY");
    }

    SECTION("Malformed dates") {
        auto r = request();
        r.start_date = "2025-13-01";
        REQUIRE_THROWS_AS(r.validate(), InvalidRequest);
        r.start_date = "01/01/2025";
        REQUIRE_THROWS_AS(r.validate(), InvalidRequest);
    }

    SECTION("End before start") {
        auto r = request();
        r.end_date = "2024-12-31";
        REQUIRE_THROWS_AS(r.validate(), InvalidRequest);
    }

    SECTION("Negative grace") {
        auto r = request();
        r.baseline_grace_days = -1;
        REQUIRE_THROWS_AS(r.validate(), InvalidRequest);
    }

    SECTION("From configuration") {
        ReportConfig config;
        config.start_date = "2025-01-01";
        config.end_date = "2025-12-31";
        config.frequency = "daily";
        config.benchmark_label = "S&P 500";
        auto r = ReportRequest::from_config(config);
        REQUIRE(r.frequency == data::Frequency::DAILY);
        REQUIRE(r.label() == "S&P 500");
        REQUIRE(r.scope == "all");

        config.frequency = "weekly";
        REQUIRE_THROWS_AS(ReportRequest::from_config(config), InvalidRequest);
    }
}

TEST_CASE("Account scopes", "[PerformanceReport]") {
    data::InMemoryTransactionSource txns;
    data::InMemorySnapshotSource snaps;
    PerformanceReportBuilder builder(accounts(), txns, snaps);

    REQUIRE(builder.accounts_in_scope("all").size() == 3);

    auto taxable = builder.accounts_in_scope("taxable");
    REQUIRE(taxable.size() == 2);
    REQUIRE(taxable[0].id == 1);
    REQUIRE(taxable[1].id == 3);

    auto sheltered = builder.accounts_in_scope("tax_advantaged");
    REQUIRE(sheltered.size() == 1);
    REQUIRE(sheltered[0].id == 2);

    REQUIRE(builder.accounts_in_scope("portfolio:20").front().id == 2);
    REQUIRE(builder.accounts_in_scope("taxpayer:8").front().id == 3);
    REQUIRE(builder.accounts_in_scope("taxpayer:99").empty());

    REQUIRE_THROWS_AS(builder.accounts_in_scope("portfolio:abc"), InvalidRequest);
    REQUIRE_THROWS_AS(builder.accounts_in_scope("portfolio:"), InvalidRequest);
    REQUIRE_THROWS_AS(builder.accounts_in_scope("everything"), InvalidRequest);
}

TEST_CASE("Build a performance report", "[PerformanceReport]") {
    data::InMemoryTransactionSource txns({deposit(1, 1, "2025-02-28", 1000.0)});
    data::InMemorySnapshotSource snaps = snapshots();
    data::InMemoryBenchmarkSource bench;
    bench.set_series("SPY", {
        {"2024-12-31", 100.0},
        {"2025-01-31", 102.0},
        {"2025-02-28", 101.0},
        {"2025-03-31", 104.0},
    });

    SECTION("Happy path: portfolio row metrics") {
        PerformanceReportBuilder builder(accounts(), txns, snaps, nullptr, &bench);
        auto report = builder.build(request());

        REQUIRE(report.rows.size() == 2);
        const auto& row = report.rows[0];
        REQUIRE(row.portfolio_id == 10);
        REQUIRE(row.portfolio_name == "Brokerage");
        REQUIRE(*row.begin_date == "2024-12-31");
        REQUIRE(*row.end_date == "2025-03-31");
        REQUIRE(row.valuation_points == 4);
        REQUIRE_THAT(*row.begin_value, WithinAbs(1000.0, 1e-9));
        REQUIRE_THAT(*row.end_value, WithinAbs(2099.5, 1e-9));
        REQUIRE_THAT(row.net_flow, WithinAbs(1000.0, 1e-9));
        REQUIRE_THAT(row.contributions, WithinAbs(1000.0, 1e-9));
        REQUIRE_THAT(*row.gain_value, WithinAbs(99.5, 1e-9));
        REQUIRE_THAT(*row.twr, WithinAbs(1.1 * 1.1 * 0.95 - 1.0, 1e-9));

        REQUIRE(row.xirr.has_value());
        std::vector<CashFlow> investor = {{"2024-12-31", -1000.0}, {"2025-02-28", -1000.0}, {"2025-03-31", 2099.5}};
        REQUIRE_THAT(ReturnCalculator::npv(*row.xirr, investor), WithinAbs(0.0, 1e-4));

        REQUIRE(row.sharpe.has_value());
        REQUIRE(row.volatility.has_value());
        REQUIRE(row.sortino.has_value());
        REQUIRE_THAT(*row.max_drawdown, WithinAbs(-0.05, 1e-9));
        REQUIRE(row.growth.size() == 4);
        REQUIRE(row.growth.back().value == Catch::Approx(1.1 * 1.1 * 0.95));

        REQUIRE_THAT(*row.benchmark_twr, WithinAbs(0.04, 1e-9));
        REQUIRE_THAT(*row.excess_twr, WithinAbs(1.1 * 1.1 * 0.95 - 1.0 - 0.04, 1e-9));
        REQUIRE(row.excess_sharpe.has_value());
        REQUIRE(has_warning(row.warnings, "Using begin snapshot at 2024-12-31 (target 2025-01-01)."));

        RiskStatistics expected({0.1, 0.1, -0.05}, 0.0, 12, {0.02, 101.0 / 102.0 - 1.0, 104.0 / 101.0 - 1.0});
        REQUIRE_THAT(*row.beta, WithinAbs(*expected.beta(), 1e-9));
        REQUIRE_THAT(*row.alpha, WithinAbs(*expected.alpha(), 1e-9));
        REQUIRE_THAT(*row.correlation, WithinAbs(*expected.correlation(), 1e-9));
        REQUIRE_THAT(*row.tracking_error, WithinAbs(*expected.tracking_error(), 1e-9));
        REQUIRE(report.combined->beta.has_value());

        REQUIRE_THAT(*report.benchmark_twr, WithinAbs(0.04, 1e-9));
        REQUIRE(*report.benchmark_coverage_start == "2024-12-31");
        REQUIRE(report.benchmark_growth.size() == 4);
    }

    SECTION("Portfolio without a baseline is blank and left out of the combined row") {
        PerformanceReportBuilder builder(accounts(), txns, snaps, nullptr, &bench);
        auto report = builder.build(request());

        const auto& ira = report.rows[1];
        REQUIRE(ira.portfolio_name == "IRA");
        REQUIRE_FALSE(ira.begin_value.has_value());
        REQUIRE_FALSE(ira.twr.has_value());
        REQUIRE_FALSE(ira.gain_value.has_value());
        REQUIRE(ira.benchmark_twr.has_value());
        REQUIRE_FALSE(ira.excess_twr.has_value());
        REQUIRE(has_warning_containing(ira.warnings, "Coverage starts at 2025-02-15"));

        REQUIRE(report.combined.has_value());
        const auto& combined = *report.combined;
        REQUIRE(combined.portfolio_id == 0);
        REQUIRE(combined.portfolio_name == "Combined");
        REQUIRE(has_warning(combined.warnings,
                            "Combined metrics exclude portfolios without a baseline snapshot near period start: IRA"));
        REQUIRE_THAT(*combined.twr, WithinAbs(*report.rows[0].twr, 1e-12));
        REQUIRE_THAT(combined.net_flow, WithinAbs(1000.0, 1e-9));
    }

    SECTION("Combined row can be switched off") {
        auto r = request();
        r.include_combined = false;
        auto report = PerformanceReportBuilder(accounts(), txns, snaps, nullptr, &bench).build(r);
        REQUIRE_FALSE(report.combined.has_value());
    }

    SECTION("No benchmark provider") {
        PerformanceReportBuilder builder(accounts(), txns, snaps);
        auto report = builder.build(request());
        REQUIRE(has_warning(report.warnings, "No benchmark provider configured; SPY metrics are blank."));
        REQUIRE_FALSE(report.benchmark_twr.has_value());
        REQUIRE(report.rows[0].twr.has_value());
        REQUIRE_FALSE(report.rows[0].excess_twr.has_value());
        REQUIRE_FALSE(report.rows[0].beta.has_value());
        REQUIRE_FALSE(has_warning_containing(report.rows[0].warnings, "Beta and tracking error"));
    }

    SECTION("Benchmark ending early leaves the regression blank") {
        data::InMemoryBenchmarkSource short_bench;
        short_bench.set_series("SPY", {
            {"2024-12-31", 100.0},
            {"2025-01-31", 102.0},
            {"2025-02-28", 101.0},
        });
        auto report = PerformanceReportBuilder(accounts(), txns, snaps, nullptr, &short_bench).build(request());
        const auto& row = report.rows[0];
        REQUIRE(row.twr.has_value());
        REQUIRE_FALSE(row.beta.has_value());
        REQUIRE_FALSE(row.tracking_error.has_value());
        REQUIRE(has_warning(row.warnings, "Beta and tracking error need SPY prices covering every valuation date."));
    }

    SECTION("Benchmark provider failure") {
        data::InMemoryBenchmarkSource empty_bench;
        auto report = PerformanceReportBuilder(accounts(), txns, snaps, nullptr, &empty_bench).build(request());
        REQUIRE(has_warning(report.warnings, "Benchmark SPY unavailable: No series loaded for SPY"));
    }

    SECTION("No snapshots at all") {
        data::InMemorySnapshotSource no_snaps;
        auto report = PerformanceReportBuilder(accounts(), txns, no_snaps, nullptr, &bench).build(request());
        REQUIRE(has_warning(report.warnings,
                            "No holdings snapshots found in the selected period; TWR/Sharpe will be blank."));
        REQUIRE(report.rows.size() == 2);
        REQUIRE_FALSE(report.rows[0].twr.has_value());
        REQUIRE_FALSE(report.combined.has_value());
        REQUIRE(report.benchmark_twr.has_value());
    }

    SECTION("Empty scope") {
        auto r = request();
        r.scope = "taxpayer:99";
        auto report = PerformanceReportBuilder(accounts(), txns, snaps).build(r);
        REQUIRE(report.rows.empty());
        REQUIRE(has_warning(report.warnings, "No accounts in scope 'taxpayer:99'."));
    }

    SECTION("Invalid request throws") {
        auto r = request();
        r.end_date = "2024-01-01";
        PerformanceReportBuilder builder(accounts(), txns, snaps);
        REQUIRE_THROWS_AS(builder.build(r), InvalidRequest);
        r = request();
        r.scope = "nobody";
        REQUIRE_THROWS_AS(builder.build(r), InvalidRequest);
    }
}

TEST_CASE("Report output", "[PerformanceReport]") {
    data::InMemoryTransactionSource txns({deposit(1, 1, "2025-02-28", 1000.0)});
    data::InMemorySnapshotSource snaps = snapshots();
    auto report = PerformanceReportBuilder(accounts(), txns, snaps).build(request());

    SECTION("JSON") {
        auto j = report.to_json();
        REQUIRE(j["requested_start"] == "2025-01-01");
        REQUIRE(j["frequency"] == "month_end");
        REQUIRE(j["rows"].size() == 2);
        REQUIRE(j["rows"][0]["portfolio_name"] == "Brokerage");
        REQUIRE(j["rows"][0]["twr"].get<double>() == Catch::Approx(1.1 * 1.1 * 0.95 - 1.0));
        REQUIRE(j["rows"][1]["twr"].is_null());
        REQUIRE(j["rows"][0]["flows"].size() == 1);
        REQUIRE(j["benchmark_twr"].is_null());
        REQUIRE(j["rows"][0]["beta"].is_null());
        REQUIRE(j["combined"]["portfolio_name"] == "Combined");
    }

    SECTION("Text summary") {
        auto text = report.summary();
        REQUIRE(text.find("Performance 2025-01-01 to 2025-03-31") != std::string::npos);
        REQUIRE(text.find("Brokerage") != std::string::npos);
        REQUIRE(text.find("Combined") != std::string::npos);
        REQUIRE(text.find("Benchmark TWR: n/a") != std::string::npos);
    }

    SECTION("CSV export") {
        const std::string path = TEST_DIR + "/report.csv";
        report.export_csv(path);

        std::ifstream in(path);
        REQUIRE(in.is_open());
        std::string header;
        std::getline(in, header);
        REQUIRE(header.rfind("portfolio_id,portfolio_name,", 0) == 0);
        REQUIRE(header.find("sortino,max_drawdown") != std::string::npos);
        REQUIRE(header.find("beta,alpha,correlation,tracking_error,warning_count") != std::string::npos);

        int lines = 0;
        std::string line;
        while (std::getline(in, line))
            ++lines;
        REQUIRE(lines == 3);

        std::filesystem::remove_all(TEST_DIR);
    }
}
