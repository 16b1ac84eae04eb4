/**
 * @file valuation_series.hpp
 * @brief Per-portfolio valuation series built from holdings snapshots.
 *
 * A valuation series maps ISO dates to total portfolio value. Snapshots are
 * captured per account; the aggregator keeps the latest capture per account
 * and day, values it, and rolls accounts up to their portfolio.
 */

#ifndef PERFBOOK_ANALYTICS_VALUATION_SERIES_HPP
#define PERFBOOK_ANALYTICS_VALUATION_SERIES_HPP

#include "perfbook/analytics/return_calculator.hpp"
#include "perfbook/data/date_utils.hpp"
#include "perfbook/data/snapshot.hpp"
#include "perfbook/data/sources.hpp"
#include "perfbook/data/transaction.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace perfbook
{
    namespace analytics
    {

        /// date -> total value, date ascending
        using ValuationSeries = std::map<std::string, double>;

        /**
         * @class SnapshotAggregator
         * @brief Turns holdings snapshots into one valuation series per portfolio.
         *
         * Valuation rules per account and day:
         *  - only the latest capture (by as_of) counts; equal captures go to
         *    the later snapshot in input order
         *  - a positive custodian total item wins outright
         *  - otherwise positions plus cash, where nonzero snapshot cash is
         *    used as is and zero cash is replaced by the authoritative cash
         *    balance on or before the day when one exists
         */
        class SnapshotAggregator
        {
        public:
            static constexpr double CASH_EPSILON = 1e-9;

            /**
             * @param accounts Accounts whose snapshots may be aggregated.
             * @param cash_balances Optional authoritative cash balances (not owned).
             */
            explicit SnapshotAggregator(const std::vector<data::Account> &accounts,
                                        const data::CashBalanceSource *cash_balances = nullptr);

            /** @brief Per-account valuation series. */
            std::map<int, ValuationSeries> by_account(const std::vector<data::HoldingsSnapshot> &snapshots) const;

            /** @brief Per-portfolio valuation series (accounts summed per day). */
            std::map<int, ValuationSeries> aggregate(const std::vector<data::HoldingsSnapshot> &snapshots) const;

        private:
            std::map<int, int> portfolio_of_; ///< account id -> portfolio id
            const data::CashBalanceSource *cash_balances_;
        };

        /**
         * @struct AnchorSelection
         * @brief Begin and end valuation points chosen for a reporting window.
         */
        struct AnchorSelection
        {
            std::optional<ValuationPoint> begin;
            std::optional<ValuationPoint> end;
            std::optional<std::string> coverage_start; ///< First valuation date available
            std::optional<std::string> coverage_end;   ///< Last valuation date available
            std::vector<std::string> warnings;

            bool complete() const { return begin.has_value() && end.has_value(); }
        };

        /**
         * @brief Choose begin/end anchors for [start, end] with a grace window.
         *
         * Begin: the last point <= start inside [start - g, start + g], else
         * the first point after start inside that window. End: the first
         * point >= end inside [end - g, end + g], else the last point before
         * end. A missing anchor leaves the optional empty and adds a warning.
         */
        AnchorSelection select_anchors(const ValuationSeries &series,
                                       const std::string &start,
                                       const std::string &end,
                                       int grace_days);

        /**
         * @brief Sample a series at the given frequency.
         *
         * Month-end sampling keeps the latest point of every calendar month
         * and re-adds the first and last points of the input.
         */
        std::vector<ValuationPoint> downsample(const ValuationSeries &series, data::Frequency frequency);

        /**
         * @brief Sampled points between the anchors, with both anchors present.
         * @return Empty unless both anchors exist and begin <= end.
         */
        std::vector<ValuationPoint> restrict_to_anchors(const ValuationSeries &series,
                                                        const AnchorSelection &anchors,
                                                        data::Frequency frequency);

        /** @brief Latest value dated on or before @p date. */
        std::optional<double> value_on_or_before(const ValuationSeries &series, const std::string &date);

        /**
         * @struct CombinedSeries
         * @brief Sum of several portfolio series on the union of their dates.
         */
        struct CombinedSeries
        {
            ValuationSeries values;
            std::vector<std::string> warnings;
        };

        /**
         * @brief Combine portfolio series, carrying each one forward to dates it lacks.
         *
         * A portfolio with no value on or before a date contributes nothing
         * to it and the date gets a warning.
         */
        CombinedSeries combine_series(const std::map<int, ValuationSeries> &series_by_portfolio,
                                      const std::vector<int> &portfolio_ids);

    } // namespace analytics
} // namespace perfbook

#endif // PERFBOOK_ANALYTICS_VALUATION_SERIES_HPP
