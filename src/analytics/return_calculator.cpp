/**
 * @file return_calculator.cpp
 * @brief Implementation of ReturnCalculator.
 */

#include "perfbook/analytics/return_calculator.hpp"
#include "perfbook/data/date_utils.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>

namespace perfbook
{
    namespace analytics
    {

        namespace
        {

            bool by_date(const CashFlow &a, const CashFlow &b)
            {
                return a.date < b.date;
            }

            /**
             * @brief Mean and unbiased variance of a sample (n >= 2).
             */
            std::pair<double, double> sample_moments(const std::vector<double> &xs)
            {
                Eigen::Map<const Eigen::VectorXd> v(xs.data(), static_cast<Eigen::Index>(xs.size()));
                const double mean = v.mean();
                const double var = (v.array() - mean).square().sum() / static_cast<double>(xs.size() - 1);
                return {mean, var};
            }

        } // anonymous namespace

        std::vector<double> TwrResult::returns() const
        {
            std::vector<double> out;
            out.reserve(subperiods.size());
            for (const auto &s : subperiods)
            {
                out.push_back(s.value);
            }
            return out;
        }

        // ===================================================================
        // Modified Dietz and TWR
        // ===================================================================

        std::optional<SubperiodReturn> ReturnCalculator::modified_dietz(const ValuationPoint &begin,
                                                                        const ValuationPoint &end,
                                                                        const std::vector<CashFlow> &flows,
                                                                        std::vector<std::string> &warnings)
        {
            if (begin.value <= VALUE_EPSILON)
            {
                warnings.push_back("Skipped period starting " + begin.date + ": begin value is zero.");
                return std::nullopt;
            }
            if (end.date <= begin.date)
            {
                warnings.push_back("Skipped period starting " + begin.date + ": invalid date ordering.");
                return std::nullopt;
            }
            const double total_days = static_cast<double>(data::days_between(begin.date, end.date));
            if (total_days <= 0.0)
            {
                warnings.push_back("Skipped period starting " + begin.date + ": zero-length period.");
                return std::nullopt;
            }

            std::map<std::string, double> by_day;
            for (const auto &f : flows)
            {
                by_day[f.date] += f.amount;
            }

            SubperiodReturn r;
            r.start_date = begin.date;
            r.end_date = end.date;
            r.begin_value = begin.value;
            r.end_value = end.value;
            for (const auto &[date, amount] : by_day)
            {
                if (date <= begin.date || date > end.date)
                    continue;
                double w = static_cast<double>(data::days_between(date, end.date)) / total_days;
                w = std::clamp(w, 0.0, 1.0);
                r.net_flow += amount;
                r.weighted_flow += amount * w;
            }

            const double denom = begin.value + r.weighted_flow;
            if (std::abs(denom) <= VALUE_EPSILON)
            {
                warnings.push_back("Skipped period starting " + begin.date +
                                   ": denominator is zero (begin value + weighted flows).");
                return std::nullopt;
            }
            r.value = (end.value - begin.value - r.net_flow) / denom;
            return r;
        }

        std::optional<double> ReturnCalculator::chain_link(const std::vector<double> &returns)
        {
            if (returns.empty())
            {
                return std::nullopt;
            }
            double prod = 1.0;
            for (double r : returns)
            {
                prod *= (1.0 + r);
            }
            return prod - 1.0;
        }

        TwrResult ReturnCalculator::time_weighted_return(std::vector<ValuationPoint> values,
                                                         const std::vector<CashFlow> &flows)
        {
            TwrResult result;
            if (values.size() < 2)
            {
                result.warnings.push_back("Need at least 2 valuation points.");
                return result;
            }
            std::stable_sort(values.begin(), values.end(), [](const ValuationPoint &a, const ValuationPoint &b)
                             { return a.date < b.date; });

            for (size_t i = 1; i < values.size(); ++i)
            {
                auto r = modified_dietz(values[i - 1], values[i], flows, result.warnings);
                if (r)
                {
                    result.subperiods.push_back(*r);
                }
            }

            if (result.subperiods.empty())
            {
                if (result.warnings.empty())
                {
                    result.warnings.push_back("No valid subperiod returns.");
                }
                return result;
            }
            result.twr = chain_link(result.returns());
            return result;
        }

        std::vector<double> ReturnCalculator::growth_curve(const std::vector<double> &returns)
        {
            std::vector<double> curve;
            curve.reserve(returns.size() + 1);
            double level = 1.0;
            curve.push_back(level);
            for (double r : returns)
            {
                level *= (1.0 + r);
                curve.push_back(level);
            }
            return curve;
        }

        // ===================================================================
        // XIRR
        // ===================================================================

        double ReturnCalculator::npv(double rate, const std::vector<CashFlow> &cashflows)
        {
            if (rate <= RATE_FLOOR)
            {
                return std::numeric_limits<double>::infinity();
            }
            if (cashflows.empty())
            {
                return 0.0;
            }
            const long long d0 = data::days_since_epoch(cashflows.front().date);
            double total = 0.0;
            for (const auto &cf : cashflows)
            {
                const double years = static_cast<double>(data::days_since_epoch(cf.date) - d0) / 365.0;
                total += cf.amount / std::pow(1.0 + rate, years);
            }
            return total;
        }

        std::optional<double> ReturnCalculator::xirr(std::vector<CashFlow> cashflows)
        {
            std::stable_sort(cashflows.begin(), cashflows.end(), by_date);
            if (cashflows.size() < 2)
            {
                return std::nullopt;
            }
            const bool has_pos = std::any_of(cashflows.begin(), cashflows.end(), [](const CashFlow &c)
                                             { return c.amount > 0.0; });
            const bool has_neg = std::any_of(cashflows.begin(), cashflows.end(), [](const CashFlow &c)
                                             { return c.amount < 0.0; });
            if (!has_pos || !has_neg)
            {
                return std::nullopt;
            }

            static const double SEEDS[] = {0.1, 0.05, 0.2, 0.0, -0.2};
            const double eps = 1e-6;
            for (double seed : SEEDS)
            {
                double r = seed;
                for (int iter = 0; iter < NEWTON_MAX_ITERATIONS; ++iter)
                {
                    const double f = npv(r, cashflows);
                    if (std::abs(f) < NEWTON_NPV_TOLERANCE)
                    {
                        return r;
                    }
                    const double df = (npv(r + eps, cashflows) - f) / eps;
                    if (df == 0.0 || !std::isfinite(df))
                    {
                        break;
                    }
                    const double next = r - f / df;
                    if (next <= RATE_FLOOR || !std::isfinite(next))
                    {
                        break;
                    }
                    if (std::abs(next - r) < NEWTON_STEP_TOLERANCE)
                    {
                        return next;
                    }
                    r = next;
                }
            }

            // Bisection fallback; bounded by BISECTION_MAX_ITERATIONS.
            double lo = BISECTION_LOW;
            double hi = BISECTION_HIGH;
            double f_lo = npv(lo, cashflows);
            const double f_hi = npv(hi, cashflows);
            if (!std::isfinite(f_lo) || !std::isfinite(f_hi))
            {
                return std::nullopt;
            }
            if (f_lo == 0.0)
            {
                return lo;
            }
            if (f_hi == 0.0)
            {
                return hi;
            }
            if (f_lo * f_hi > 0.0)
            {
                return std::nullopt;
            }
            for (int iter = 0; iter < BISECTION_MAX_ITERATIONS; ++iter)
            {
                const double mid = 0.5 * (lo + hi);
                const double f_mid = npv(mid, cashflows);
                if (!std::isfinite(f_mid))
                {
                    hi = mid;
                    continue;
                }
                if (std::abs(f_mid) < NEWTON_NPV_TOLERANCE)
                {
                    return mid;
                }
                if (f_lo * f_mid <= 0.0)
                {
                    hi = mid;
                }
                else
                {
                    lo = mid;
                    f_lo = f_mid;
                }
                if (std::abs(hi - lo) < NEWTON_STEP_TOLERANCE)
                {
                    return 0.5 * (lo + hi);
                }
            }
            return std::nullopt;
        }

        // ===================================================================
        // Risk-adjusted
        // ===================================================================

        std::optional<double> ReturnCalculator::volatility(const std::vector<double> &returns, int periods_per_year)
        {
            if (returns.size() < 2)
            {
                return std::nullopt;
            }
            const double var = sample_moments(returns).second;
            if (var < 0.0)
            {
                return std::nullopt;
            }
            return std::sqrt(var) * std::sqrt(static_cast<double>(periods_per_year));
        }

        std::optional<double> ReturnCalculator::sharpe_ratio(const std::vector<double> &returns,
                                                             double risk_free_annual,
                                                             int periods_per_year)
        {
            if (returns.size() < 2)
            {
                return std::nullopt;
            }
            const double rf_p = risk_free_annual / static_cast<double>(periods_per_year);
            std::vector<double> excess(returns.size());
            std::transform(returns.begin(), returns.end(), excess.begin(), [rf_p](double r)
                           { return r - rf_p; });

            const auto [mean, var] = sample_moments(excess);
            if (var <= MIN_VARIANCE)
            {
                return std::nullopt;
            }
            return (mean / std::sqrt(var)) * std::sqrt(static_cast<double>(periods_per_year));
        }

        std::optional<double> ReturnCalculator::excess_return(const std::optional<double> &portfolio,
                                                              const std::optional<double> &benchmark)
        {
            if (!portfolio || !benchmark)
            {
                return std::nullopt;
            }
            return *portfolio - *benchmark;
        }

    } // namespace analytics
} // namespace perfbook
