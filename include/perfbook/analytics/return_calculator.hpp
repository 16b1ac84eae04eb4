/**
 * @file return_calculator.hpp
 * @brief Period return math: Modified Dietz, TWR, XIRR, volatility and Sharpe.
 *
 * Conventions:
 *  - Valuation flows (CashFlow passed to modified_dietz / time_weighted_return)
 *    are portfolio-perspective: contributions positive, withdrawals negative.
 *  - XIRR cashflows are investor-perspective: money put in is negative,
 *    money taken out (including the ending value) is positive.
 *  - Year fractions for discounting are days / 365.
 *
 * Metrics that cannot be computed come back as empty optionals, never as
 * exceptions.
 */

#ifndef PERFBOOK_ANALYTICS_RETURN_CALCULATOR_HPP
#define PERFBOOK_ANALYTICS_RETURN_CALCULATOR_HPP

#include <optional>
#include <string>
#include <vector>

namespace perfbook
{
    namespace analytics
    {

        /**
         * @struct CashFlow
         * @brief A dated cash amount.
         */
        struct CashFlow
        {
            std::string date;
            double amount = 0.0;
        };

        /**
         * @struct ValuationPoint
         * @brief Total portfolio (or benchmark) value on a date.
         */
        struct ValuationPoint
        {
            std::string date;
            double value = 0.0;
        };

        /**
         * @struct SubperiodReturn
         * @brief Modified Dietz return of one interval between valuation points.
         */
        struct SubperiodReturn
        {
            std::string start_date;
            std::string end_date;
            double begin_value = 0.0;
            double end_value = 0.0;
            double net_flow = 0.0;
            double weighted_flow = 0.0;
            double value = 0.0; ///< The return itself
        };

        /**
         * @struct TwrResult
         * @brief Chain-linked time-weighted return with its sub-periods.
         */
        struct TwrResult
        {
            std::optional<double> twr;
            std::vector<SubperiodReturn> subperiods;
            std::vector<std::string> warnings;

            /** @brief Sub-period returns in date order. */
            std::vector<double> returns() const;
        };

        /**
         * @class ReturnCalculator
         * @brief Stateless return and risk-adjusted return calculations.
         */
        class ReturnCalculator
        {
        public:
            static constexpr double VALUE_EPSILON = 1e-9;
            static constexpr int NEWTON_MAX_ITERATIONS = 50;
            static constexpr double NEWTON_NPV_TOLERANCE = 1e-6;
            static constexpr double NEWTON_STEP_TOLERANCE = 1e-9;
            static constexpr double RATE_FLOOR = -0.999999;
            static constexpr double BISECTION_LOW = -0.95;
            static constexpr double BISECTION_HIGH = 10.0;
            static constexpr int BISECTION_MAX_ITERATIONS = 200;
            static constexpr double MIN_VARIANCE = 1e-18; ///< Below this a return series is treated as flat

            // ---------------------------------------------------------------
            // Modified Dietz and TWR
            // ---------------------------------------------------------------

            /**
             * @brief Modified Dietz return for [begin.date, end.date].
             *
             * Flows dated in (begin.date, end.date] are aggregated per date and
             * weighted by clamp((d1 - fd) / (d1 - d0), 0, 1).
             *
             * @param warnings Receives a message when the interval is skipped.
             * @return Empty when begin value <= 0, dates are not increasing, or
             *         the denominator is within 1e-9 of zero.
             */
            static std::optional<SubperiodReturn> modified_dietz(const ValuationPoint &begin,
                                                                 const ValuationPoint &end,
                                                                 const std::vector<CashFlow> &flows,
                                                                 std::vector<std::string> &warnings);

            /**
             * @brief Geometric linking: prod(1 + r_i) - 1. Empty input gives no value.
             */
            static std::optional<double> chain_link(const std::vector<double> &returns);

            /**
             * @brief Time-weighted return over consecutive valuation points.
             *
             * Needs at least two points. Intervals that cannot be measured are
             * skipped with a warning; with no measurable interval the TWR is empty.
             */
            static TwrResult time_weighted_return(std::vector<ValuationPoint> values,
                                                  const std::vector<CashFlow> &flows);

            /**
             * @brief Cumulative growth of 1.0 through a return sequence (size n + 1).
             */
            static std::vector<double> growth_curve(const std::vector<double> &returns);

            // ---------------------------------------------------------------
            // Money-weighted return
            // ---------------------------------------------------------------

            /**
             * @brief Net present value of cashflows discounted to the first date.
             * @return +infinity when rate <= -0.999999.
             */
            static double npv(double rate, const std::vector<CashFlow> &cashflows);

            /**
             * @brief Annualized internal rate of return of dated cashflows.
             *
             * Newton-Raphson from seeds 0.1, 0.05, 0.2, 0.0, -0.2, then bisection
             * on [-0.95, 10]. Empty when fewer than two flows, flows of a single
             * sign, or no root is bracketed.
             */
            static std::optional<double> xirr(std::vector<CashFlow> cashflows);

            // ---------------------------------------------------------------
            // Risk-adjusted
            // ---------------------------------------------------------------

            /**
             * @brief Sample standard deviation scaled by sqrt(periods_per_year).
             */
            static std::optional<double> volatility(const std::vector<double> &returns, int periods_per_year);

            /**
             * @brief Annualized Sharpe ratio of period returns.
             *
             * Excess returns use rf / periods_per_year. Empty with fewer than two
             * returns or zero variance.
             */
            static std::optional<double> sharpe_ratio(const std::vector<double> &returns,
                                                      double risk_free_annual,
                                                      int periods_per_year);

            /** @brief portfolio - benchmark, empty if either side is. */
            static std::optional<double> excess_return(const std::optional<double> &portfolio,
                                                       const std::optional<double> &benchmark);
        };

    } // namespace analytics
} // namespace perfbook

#endif // PERFBOOK_ANALYTICS_RETURN_CALCULATOR_HPP
