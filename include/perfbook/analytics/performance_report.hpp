/**
 * @file performance_report.hpp
 * @brief Period performance report: one row per portfolio plus a combined row.
 *
 * The builder pulls snapshots, transactions and benchmark prices from the
 * injected sources, anchors each portfolio's valuation series on the
 * requested window, classifies cash activity inside the anchored window and
 * computes gain, XIRR, TWR, volatility, Sharpe, benchmark excess and the
 * benchmark regression (beta, alpha, correlation, tracking error).
 *
 * Sparse data never aborts a report: each row carries its own warnings and
 * leaves the affected metrics empty. Only an invalid request throws.
 */

#ifndef PERFBOOK_ANALYTICS_PERFORMANCE_REPORT_HPP
#define PERFBOOK_ANALYTICS_PERFORMANCE_REPORT_HPP

#include "perfbook/analytics/return_calculator.hpp"
#include "perfbook/analytics/valuation_series.hpp"
#include "perfbook/data/data_loader.hpp"
#include "perfbook/data/date_utils.hpp"
#include "perfbook/data/sources.hpp"
#include "perfbook/data/transaction.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace perfbook
{
    namespace analytics
    {

        /**
         * @struct ReportRequest
         * @brief Validated parameters of one report.
         */
        struct ReportRequest
        {
            std::string scope = "all"; ///< all, taxable, tax_advantaged, portfolio:<id>, taxpayer:<id>
            std::string start_date;
            std::string end_date;
            data::Frequency frequency = data::Frequency::MONTH_END;
            std::string benchmark_symbol = "VOO";
            std::string benchmark_label; ///< Defaults to the symbol
            int baseline_grace_days = 14;
            double risk_free_rate_annual = 0.0;
            bool include_withholding_as_flow = false;
            bool include_combined = true;

            /**
             * @brief Build a request from the JSON report configuration.
             * @throws InvalidRequest On an unknown frequency.
             */
            static ReportRequest from_config(const ReportConfig &config);

            /**
             * @brief Reject malformed dates, end before start and negative grace.
             * @throws InvalidRequest
             */
            void validate() const;

            std::string label() const { return benchmark_label.empty() ? benchmark_symbol : benchmark_label; }
        };

        /**
         * @struct PerformanceRow
         * @brief Computed metrics of one portfolio (or the combined set).
         *
         * Monetary values are unrounded. Empty optionals mean "could not be
         * computed from the available data"; see warnings for why.
         */
        struct PerformanceRow
        {
            int portfolio_id = 0; ///< 0 for the combined row
            std::string portfolio_name;
            std::string period_start;
            std::string period_end;
            std::optional<std::string> coverage_start;
            std::optional<std::string> coverage_end;
            int valuation_points = 0;
            std::optional<std::string> begin_date;
            std::optional<std::string> end_date;
            std::optional<std::string> txn_start;
            std::optional<std::string> txn_end;
            int txn_count = 0;

            std::optional<double> begin_value;
            std::optional<double> end_value;
            double contributions = 0.0;
            double withdrawals = 0.0;
            double net_flow = 0.0;
            double fees = 0.0;
            double withholding = 0.0;
            double other_cash_out = 0.0;
            double total_cash_out = 0.0;
            std::optional<double> gain_value;

            std::optional<double> xirr;
            std::optional<double> twr;
            std::optional<double> volatility;
            std::optional<double> sharpe;
            std::optional<double> sortino;
            std::optional<double> max_drawdown; ///< Over the sub-period growth curve, <= 0
            std::optional<double> benchmark_twr;
            std::optional<double> benchmark_sharpe;
            std::optional<double> excess_twr;
            std::optional<double> excess_sharpe;
            std::optional<double> beta;           ///< Against benchmark returns over the same sub-periods
            std::optional<double> alpha;          ///< Per-period regression intercept
            std::optional<double> correlation;
            std::optional<double> tracking_error; ///< Annualized

            std::vector<CashFlow> flows;          ///< Investor flows used by the return math
            std::vector<ValuationPoint> growth;   ///< Growth of 1.0 over the TWR sub-periods
            std::vector<std::string> warnings;

            nlohmann::json to_json() const;
        };

        /**
         * @struct PerformanceReport
         * @brief Output of PerformanceReportBuilder::build().
         */
        struct PerformanceReport
        {
            std::vector<PerformanceRow> rows;
            std::optional<PerformanceRow> combined;
            std::vector<std::string> warnings;

            std::string requested_start;
            std::string requested_end;
            data::Frequency frequency = data::Frequency::MONTH_END;
            int baseline_grace_days = 0;
            double risk_free_rate_annual = 0.0;
            bool include_withholding_as_flow = false;

            std::string benchmark_label;
            std::optional<double> benchmark_twr;
            std::optional<double> benchmark_sharpe;
            std::optional<std::string> benchmark_coverage_start;
            std::optional<std::string> benchmark_coverage_end;
            std::vector<ValuationPoint> benchmark_growth;

            nlohmann::json to_json() const;

            /** @brief Fixed-width text table of the rows. */
            std::string summary() const;

            /**
             * @brief Write one CSV line per row (combined last).
             * @throws std::runtime_error If the file cannot be opened.
             */
            void export_csv(const std::string &filepath) const;
        };

        /**
         * @class PerformanceReportBuilder
         * @brief Computes PerformanceReport instances from injected sources.
         *
         * Holds no mutable state; build() may run concurrently for different
         * requests as long as the sources allow concurrent reads.
         */
        class PerformanceReportBuilder
        {
        public:
            static constexpr int BENCHMARK_LOOKBACK_DAYS = 31;

            /**
             * @param accounts All known accounts; the request scope selects among them.
             * @param transactions Ledger source (not owned).
             * @param snapshots Holdings snapshot source (not owned).
             * @param cash_balances Optional authoritative cash balances (not owned).
             * @param benchmark Optional benchmark provider (not owned).
             */
            PerformanceReportBuilder(std::vector<data::Account> accounts,
                                     const data::TransactionSource &transactions,
                                     const data::SnapshotSource &snapshots,
                                     const data::CashBalanceSource *cash_balances = nullptr,
                                     const data::BenchmarkPriceSource *benchmark = nullptr);

            /**
             * @brief Compute the report for @p request.
             * @throws InvalidRequest If the request fails validation or names an unknown scope.
             */
            PerformanceReport build(const ReportRequest &request) const;

            /**
             * @brief Accounts selected by a scope expression.
             * @throws InvalidRequest On an unrecognised scope.
             */
            std::vector<data::Account> accounts_in_scope(const std::string &scope) const;

        private:
            struct BenchmarkMetrics
            {
                std::optional<double> twr;
                std::optional<double> sharpe;
                std::vector<ValuationPoint> prices; ///< Aligned benchmark prices
            };

            PerformanceRow portfolio_row(const ReportRequest &request,
                                         int portfolio_id,
                                         const std::vector<data::Account> &members,
                                         const ValuationSeries &series,
                                         const BenchmarkMetrics &benchmark) const;

            std::optional<PerformanceRow> combined_row(const ReportRequest &request,
                                                       const std::vector<PerformanceRow> &rows,
                                                       const std::map<int, ValuationSeries> &series_by_portfolio,
                                                       const std::map<int, std::vector<data::Account>> &members,
                                                       const BenchmarkMetrics &benchmark) const;

            std::vector<data::Account> accounts_;
            const data::TransactionSource &transactions_;
            const data::SnapshotSource &snapshots_;
            const data::CashBalanceSource *cash_balances_;
            const data::BenchmarkPriceSource *benchmark_;
        };

    } // namespace analytics
} // namespace perfbook

#endif // PERFBOOK_ANALYTICS_PERFORMANCE_REPORT_HPP
