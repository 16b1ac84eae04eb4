/**
 * @file risk_statistics.cpp
 * @brief Implementation of RiskStatistics.
 */

#include "perfbook/analytics/risk_statistics.hpp"
#include "perfbook/analytics/return_calculator.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <stdexcept>
#include <string>

namespace perfbook
{
    namespace analytics
    {

        namespace
        {

            Eigen::Map<const Eigen::VectorXd> as_vector(const std::vector<double> &xs)
            {
                return Eigen::Map<const Eigen::VectorXd>(xs.data(), static_cast<Eigen::Index>(xs.size()));
            }

            double sample_variance(const Eigen::VectorXd &v)
            {
                const double mean = v.mean();
                return (v.array() - mean).square().sum() / static_cast<double>(v.size() - 1);
            }

        } // anonymous namespace

        RiskStatistics::RiskStatistics(std::vector<double> returns,
                                       double risk_free_annual,
                                       int periods_per_year,
                                       std::vector<double> benchmark_returns)
            : returns_(std::move(returns)),
              benchmark_returns_(std::move(benchmark_returns)),
              risk_free_annual_(risk_free_annual),
              periods_per_year_(periods_per_year)
        {
            if (periods_per_year_ <= 0)
            {
                throw std::invalid_argument("Expected positive value for parameter 'periods_per_year', got: " +
                                            std::to_string(periods_per_year_));
            }
        }

        bool RiskStatistics::has_benchmark() const
        {
            return benchmark_returns_.size() == returns_.size() && returns_.size() >= 2;
        }

        double RiskStatistics::rf_per_period() const
        {
            return risk_free_annual_ / static_cast<double>(periods_per_year_);
        }

        // ===================================================================
        // Standalone statistics
        // ===================================================================

        std::optional<double> RiskStatistics::volatility() const
        {
            return ReturnCalculator::volatility(returns_, periods_per_year_);
        }

        std::optional<double> RiskStatistics::sharpe() const
        {
            return ReturnCalculator::sharpe_ratio(returns_, risk_free_annual_, periods_per_year_);
        }

        std::optional<double> RiskStatistics::sortino() const
        {
            if (returns_.size() < 2)
            {
                return std::nullopt;
            }
            const double rf_p = rf_per_period();
            const Eigen::VectorXd r = as_vector(returns_);
            const Eigen::VectorXd downside = (r.array() - rf_p).min(0.0).matrix();

            const double dvar = sample_variance(downside);
            if (dvar <= ReturnCalculator::MIN_VARIANCE)
            {
                return std::nullopt;
            }
            return ((r.mean() - rf_p) / std::sqrt(dvar)) * std::sqrt(static_cast<double>(periods_per_year_));
        }

        std::optional<double> RiskStatistics::max_drawdown() const
        {
            if (returns_.empty())
            {
                return std::nullopt;
            }
            double peak = 1.0;
            double equity = 1.0;
            double mdd = 0.0;
            for (double r : returns_)
            {
                equity *= (1.0 + r);
                peak = std::max(peak, equity);
                mdd = std::min(mdd, equity / peak - 1.0);
            }
            return mdd;
        }

        // ===================================================================
        // Benchmark-relative statistics
        // ===================================================================

        std::optional<double> RiskStatistics::beta() const
        {
            if (!has_benchmark())
            {
                return std::nullopt;
            }
            const Eigen::VectorXd x = as_vector(benchmark_returns_);
            const Eigen::VectorXd y = as_vector(returns_);
            const double n1 = static_cast<double>(x.size() - 1);
            const double cov = ((x.array() - x.mean()) * (y.array() - y.mean())).sum() / n1;
            const double var_x = sample_variance(x);
            if (var_x <= ReturnCalculator::MIN_VARIANCE)
            {
                return std::nullopt;
            }
            return cov / var_x;
        }

        std::optional<double> RiskStatistics::alpha() const
        {
            auto b = beta();
            if (!b)
            {
                return std::nullopt;
            }
            return as_vector(returns_).mean() - *b * as_vector(benchmark_returns_).mean();
        }

        std::optional<double> RiskStatistics::correlation() const
        {
            if (!has_benchmark())
            {
                return std::nullopt;
            }
            const Eigen::VectorXd x = as_vector(benchmark_returns_);
            const Eigen::VectorXd y = as_vector(returns_);
            const double n1 = static_cast<double>(x.size() - 1);
            const double cov = ((x.array() - x.mean()) * (y.array() - y.mean())).sum() / n1;
            const double var_x = sample_variance(x);
            const double var_y = sample_variance(y);
            if (var_x <= ReturnCalculator::MIN_VARIANCE || var_y <= ReturnCalculator::MIN_VARIANCE)
            {
                return std::nullopt;
            }
            return cov / std::sqrt(var_x * var_y);
        }

        std::optional<double> RiskStatistics::tracking_error() const
        {
            if (!has_benchmark())
            {
                return std::nullopt;
            }
            const Eigen::VectorXd active = as_vector(returns_) - as_vector(benchmark_returns_);
            return std::sqrt(sample_variance(active)) * std::sqrt(static_cast<double>(periods_per_year_));
        }

    } // namespace analytics
} // namespace perfbook
