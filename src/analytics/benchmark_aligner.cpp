/**
 * @file benchmark_aligner.cpp
 * @brief Implementation of BenchmarkAligner.
 */

#include "perfbook/analytics/benchmark_aligner.hpp"
#include "perfbook/data/sources.hpp"

#include <spdlog/spdlog.h>

#include <map>
#include <utility>

namespace perfbook
{
    namespace analytics
    {

        std::optional<std::string> AlignedBenchmark::coverage_start() const
        {
            if (points.empty())
            {
                return std::nullopt;
            }
            return points.front().date;
        }

        std::optional<std::string> AlignedBenchmark::coverage_end() const
        {
            if (points.empty())
            {
                return std::nullopt;
            }
            return points.back().date;
        }

        BenchmarkAligner::BenchmarkAligner(std::string label)
            : label_(std::move(label))
        {
        }

        AlignedBenchmark BenchmarkAligner::align(const data::PriceSeries &prices,
                                                 const std::string &start,
                                                 const std::string &end,
                                                 data::Frequency frequency) const
        {
            AlignedBenchmark result;
            if (prices.empty() || end < start)
            {
                return result;
            }
            const data::PriceSeries series = data::normalize_price_series(prices);
            if (series.empty())
            {
                return result;
            }

            std::optional<data::PricePoint> start_pt;
            std::optional<data::PricePoint> end_pt;
            for (const auto &p : series)
            {
                if (p.date <= start)
                {
                    start_pt = p;
                }
                if (p.date <= end)
                {
                    end_pt = p;
                }
            }
            if (!start_pt)
            {
                // No price on or before start: first price on or after it.
                start_pt = series.front();
            }
            if (!end_pt)
            {
                return result;
            }

            std::map<std::string, double> sampled;
            if (frequency == data::Frequency::MONTH_END)
            {
                std::map<std::string, data::PricePoint> by_month;
                for (const auto &p : series)
                {
                    if (p.date >= start && p.date <= end)
                    {
                        by_month[data::month_key(p.date)] = p;
                    }
                }
                for (const auto &m : by_month)
                {
                    sampled[m.second.date] = m.second.price;
                }
            }
            else
            {
                for (const auto &p : series)
                {
                    if (p.date >= start && p.date <= end)
                    {
                        sampled[p.date] = p.price;
                    }
                }
            }
            sampled[start_pt->date] = start_pt->price;
            sampled[end_pt->date] = end_pt->price;

            for (const auto &p : sampled)
            {
                result.points.push_back({p.first, p.second});
            }

            spdlog::debug("{} benchmark aligned to {} points ({} -> {})", label_, result.points.size(),
                          result.points.front().date, result.points.back().date);

            if (result.points.size() >= 2)
            {
                if (result.points.front().date > start)
                {
                    result.warnings.push_back(label_ + " benchmark coverage starts at " + result.points.front().date +
                                              " (missing earlier prices for selected period).");
                }
                if (result.points.back().date < end)
                {
                    result.warnings.push_back(label_ + " benchmark coverage ends at " + result.points.back().date +
                                              " (missing later prices for selected period).");
                }
            }
            return result;
        }

    } // namespace analytics
} // namespace perfbook
