/**
 * @file benchmark_aligner.hpp
 * @brief Aligns a raw benchmark price series to a reporting window.
 */

#ifndef PERFBOOK_ANALYTICS_BENCHMARK_ALIGNER_HPP
#define PERFBOOK_ANALYTICS_BENCHMARK_ALIGNER_HPP

#include "perfbook/analytics/return_calculator.hpp"
#include "perfbook/data/date_utils.hpp"
#include "perfbook/data/snapshot.hpp"

#include <optional>
#include <string>
#include <vector>

namespace perfbook
{
    namespace analytics
    {

        /**
         * @struct AlignedBenchmark
         * @brief Benchmark prices sampled over a reporting window.
         */
        struct AlignedBenchmark
        {
            std::vector<ValuationPoint> points; ///< Date ascending, unique dates
            std::vector<std::string> warnings;

            bool empty() const { return points.empty(); }
            std::optional<std::string> coverage_start() const;
            std::optional<std::string> coverage_end() const;
        };

        /**
         * @class BenchmarkAligner
         * @brief Anchors a benchmark series on the reporting window.
         *
         * The start anchor is the last price on or before the window start
         * (so a calendar-year return starts from the prior year's close),
         * falling back to the first price on or after it. The end anchor is
         * the last price on or before the window end. Both anchors are always
         * part of the output, whatever the sampling frequency.
         */
        class BenchmarkAligner
        {
        public:
            explicit BenchmarkAligner(std::string label = "Benchmark");

            /**
             * @brief Align @p prices to [start, end] at @p frequency.
             * @return Empty points when the series is empty, end < start, or
             *         no end anchor exists.
             */
            AlignedBenchmark align(const data::PriceSeries &prices,
                                   const std::string &start,
                                   const std::string &end,
                                   data::Frequency frequency) const;

            const std::string &label() const { return label_; }

        private:
            std::string label_;
        };

    } // namespace analytics
} // namespace perfbook

#endif // PERFBOOK_ANALYTICS_BENCHMARK_ALIGNER_HPP
