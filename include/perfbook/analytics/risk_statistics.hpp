/**
 * @file risk_statistics.hpp
 * @brief Risk statistics of a period return series, optionally against a benchmark.
 *
 * All statistics use sample (n - 1) moments and annualize with the
 * sampling frequency's periods per year. Statistics that are undefined for
 * the given data (too few points, zero variance, mismatched benchmark) are
 * empty optionals.
 */

#ifndef PERFBOOK_ANALYTICS_RISK_STATISTICS_HPP
#define PERFBOOK_ANALYTICS_RISK_STATISTICS_HPP

#include <optional>
#include <vector>

namespace perfbook
{
    namespace analytics
    {

        /**
         * @class RiskStatistics
         * @brief Volatility, Sharpe, Sortino, drawdown and benchmark regression.
         *
         * Usage:
         * @code
         *   RiskStatistics stats(monthly_returns, 0.02, 12, benchmark_returns);
         *   auto beta = stats.beta();
         * @endcode
         */
        class RiskStatistics
        {
        public:
            /**
             * @param returns Period returns of the portfolio.
             * @param risk_free_annual Annual risk-free rate.
             * @param periods_per_year Annualization factor (12 monthly, 252 daily).
             * @param benchmark_returns Benchmark returns over the same periods; the
             *        regression statistics need equal length and at least two points.
             * @throws std::invalid_argument If periods_per_year is not positive.
             */
            RiskStatistics(std::vector<double> returns,
                           double risk_free_annual,
                           int periods_per_year,
                           std::vector<double> benchmark_returns = {});

            std::optional<double> volatility() const;
            std::optional<double> sharpe() const;

            /**
             * @brief Sortino ratio using downside deviations min(0, r - rf_p).
             */
            std::optional<double> sortino() const;

            /**
             * @brief Worst peak-to-trough decline of the compounded series (<= 0).
             */
            std::optional<double> max_drawdown() const;

            /** @brief Cov(p, b) / Var(b). */
            std::optional<double> beta() const;

            /** @brief Per-period intercept mean(p) - beta * mean(b). */
            std::optional<double> alpha() const;

            std::optional<double> correlation() const;

            /** @brief Annualized standard deviation of p - b. */
            std::optional<double> tracking_error() const;

            int num_periods() const { return static_cast<int>(returns_.size()); }

        private:
            std::vector<double> returns_;
            std::vector<double> benchmark_returns_;
            double risk_free_annual_;
            int periods_per_year_;

            bool has_benchmark() const;
            double rf_per_period() const;
        };

    } // namespace analytics
} // namespace perfbook

#endif // PERFBOOK_ANALYTICS_RISK_STATISTICS_HPP
