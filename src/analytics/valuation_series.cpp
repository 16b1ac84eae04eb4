/**
 * @file valuation_series.cpp
 * @brief Implementation of snapshot aggregation and anchor selection.
 */

#include "perfbook/analytics/valuation_series.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <utility>

namespace perfbook
{
    namespace analytics
    {

        namespace
        {

            /**
             * @brief Valued capture of one account on one day.
             */
            struct DayCapture
            {
                std::string as_of;
                double positions = 0.0;
                double cash = 0.0;
                bool is_total = false;
            };

        } // anonymous namespace

        // ===================================================================
        // SnapshotAggregator
        // ===================================================================

        SnapshotAggregator::SnapshotAggregator(const std::vector<data::Account> &accounts,
                                               const data::CashBalanceSource *cash_balances)
            : cash_balances_(cash_balances)
        {
            for (const auto &account : accounts)
            {
                portfolio_of_[account.id] = account.portfolio_id;
            }
        }

        std::map<int, ValuationSeries> SnapshotAggregator::by_account(
            const std::vector<data::HoldingsSnapshot> &snapshots) const
        {
            std::map<std::pair<int, std::string>, DayCapture> latest;

            for (const auto &snap : snapshots)
            {
                if (portfolio_of_.find(snap.account_id) == portfolio_of_.end())
                {
                    spdlog::debug("Ignoring snapshot for unknown account {}", snap.account_id);
                    continue;
                }

                DayCapture capture;
                capture.as_of = snap.as_of;
                bool has_positions = false;
                bool has_cash = false;

                for (const auto &item : snap.items)
                {
                    if (item.is_total && item.market_value > 0.0)
                    {
                        capture.is_total = true;
                        capture.positions = item.market_value;
                        capture.cash = 0.0;
                        break;
                    }
                    if (item.is_cash())
                    {
                        capture.cash += item.market_value;
                        has_cash = true;
                    }
                    else if (!item.symbol.empty())
                    {
                        capture.positions += item.market_value;
                        has_positions = true;
                    }
                }

                if (!capture.is_total && !has_positions && !has_cash)
                {
                    continue;
                }

                const auto key = std::make_pair(snap.account_id, data::date_part(snap.as_of));
                auto it = latest.find(key);
                if (it == latest.end() || snap.as_of >= it->second.as_of)
                {
                    latest[key] = capture;
                }
            }

            std::map<int, ValuationSeries> out;
            for (const auto &entry : latest)
            {
                const int account_id = entry.first.first;
                const std::string &day = entry.first.second;
                const DayCapture &capture = entry.second;

                double value = capture.positions;
                if (!capture.is_total)
                {
                    double cash = capture.cash;
                    if (std::abs(cash) <= CASH_EPSILON && cash_balances_ != nullptr)
                    {
                        const auto balance = cash_balances_->latest(account_id, day);
                        if (balance)
                        {
                            cash = *balance;
                        }
                    }
                    value += cash;
                }
                out[account_id][day] = value;
            }
            return out;
        }

        std::map<int, ValuationSeries> SnapshotAggregator::aggregate(
            const std::vector<data::HoldingsSnapshot> &snapshots) const
        {
            std::map<int, ValuationSeries> out;
            for (const auto &account_series : by_account(snapshots))
            {
                const int portfolio_id = portfolio_of_.at(account_series.first);
                auto &series = out[portfolio_id];
                for (const auto &point : account_series.second)
                {
                    series[point.first] += point.second;
                }
            }
            spdlog::debug("Aggregated {} snapshots into {} portfolio series", snapshots.size(), out.size());
            return out;
        }

        // ===================================================================
        // Anchors
        // ===================================================================

        AnchorSelection select_anchors(const ValuationSeries &series,
                                       const std::string &start,
                                       const std::string &end,
                                       int grace_days)
        {
            AnchorSelection result;
            const std::string begin_lo = data::add_days(start, -grace_days);
            const std::string begin_hi = data::add_days(start, grace_days);
            const std::string end_lo = data::add_days(end, -grace_days);
            const std::string end_hi = data::add_days(end, grace_days);

            if (!series.empty())
            {
                result.coverage_start = series.begin()->first;
                result.coverage_end = series.rbegin()->first;
            }

            // Begin: last point <= start in window, else first point > start.
            for (auto it = series.lower_bound(begin_lo); it != series.end() && it->first <= begin_hi; ++it)
            {
                if (it->first <= start)
                {
                    result.begin = ValuationPoint{it->first, it->second};
                }
                else if (!result.begin)
                {
                    result.begin = ValuationPoint{it->first, it->second};
                    break;
                }
                else
                {
                    break;
                }
            }

            // End: first point >= end in window, else last point < end.
            for (auto it = series.lower_bound(end_lo); it != series.end() && it->first <= end_hi; ++it)
            {
                result.end = ValuationPoint{it->first, it->second};
                if (it->first >= end)
                {
                    break;
                }
            }

            const std::string grace = std::to_string(grace_days);
            if (!result.coverage_start)
            {
                result.warnings.push_back("No valuation points (holdings snapshots) found in this period.");
            }
            else if (!result.begin)
            {
                result.warnings.push_back("Coverage starts at " + *result.coverage_start +
                                          "; upload a holdings snapshot near " + start + " (±~" + grace +
                                          " days) for true period-to-date performance.");
            }
            if (result.begin && result.begin->date != start)
            {
                result.warnings.push_back("Using begin snapshot at " + result.begin->date + " (target " + start + ").");
            }
            if (result.end && result.end->date != end)
            {
                result.warnings.push_back("Using end snapshot at " + result.end->date + " (target " + end + ").");
            }
            if (result.coverage_end && *result.coverage_end < end_lo)
            {
                result.warnings.push_back("Coverage ends at " + *result.coverage_end +
                                          "; upload a holdings snapshot near " + end + " (±~" + grace +
                                          " days) for true period-end performance.");
            }
            return result;
        }

        // ===================================================================
        // Sampling
        // ===================================================================

        std::vector<ValuationPoint> downsample(const ValuationSeries &series, data::Frequency frequency)
        {
            std::vector<ValuationPoint> out;
            if (series.empty())
            {
                return out;
            }
            if (frequency == data::Frequency::DAILY)
            {
                for (const auto &p : series)
                {
                    out.push_back({p.first, p.second});
                }
                return out;
            }

            // Map iteration is date ascending, so the last write per month is its latest point.
            std::map<std::string, ValuationPoint> by_month;
            for (const auto &p : series)
            {
                by_month[data::month_key(p.first)] = ValuationPoint{p.first, p.second};
            }
            for (const auto &m : by_month)
            {
                out.push_back(m.second);
            }

            const auto &first = *series.begin();
            const auto &last = *series.rbegin();
            if (out.front().date != first.first)
            {
                out.insert(out.begin(), ValuationPoint{first.first, first.second});
            }
            if (out.back().date != last.first)
            {
                out.push_back(ValuationPoint{last.first, last.second});
            }
            return out;
        }

        std::vector<ValuationPoint> restrict_to_anchors(const ValuationSeries &series,
                                                        const AnchorSelection &anchors,
                                                        data::Frequency frequency)
        {
            std::vector<ValuationPoint> out;
            if (!anchors.complete() || anchors.begin->date > anchors.end->date)
            {
                return out;
            }
            const ValuationPoint &begin = *anchors.begin;
            const ValuationPoint &end = *anchors.end;

            for (const auto &p : downsample(series, frequency))
            {
                if (p.date >= begin.date && p.date <= end.date)
                {
                    out.push_back(p);
                }
            }
            if (out.empty() || out.front().date != begin.date)
            {
                out.insert(out.begin(), begin);
            }
            if (out.back().date != end.date)
            {
                out.push_back(end);
            }
            return out;
        }

        std::optional<double> value_on_or_before(const ValuationSeries &series, const std::string &date)
        {
            auto it = series.upper_bound(date);
            if (it == series.begin())
            {
                return std::nullopt;
            }
            --it;
            return it->second;
        }

        // ===================================================================
        // Combined series
        // ===================================================================

        CombinedSeries combine_series(const std::map<int, ValuationSeries> &series_by_portfolio,
                                      const std::vector<int> &portfolio_ids)
        {
            CombinedSeries result;
            std::vector<const ValuationSeries *> members;
            for (int pid : portfolio_ids)
            {
                auto it = series_by_portfolio.find(pid);
                if (it == series_by_portfolio.end())
                {
                    continue;
                }
                members.push_back(&it->second);
                for (const auto &p : it->second)
                {
                    result.values[p.first] = 0.0;
                }
            }

            for (auto &point : result.values)
            {
                double total = 0.0;
                int missing = 0;
                for (const ValuationSeries *member : members)
                {
                    const auto v = value_on_or_before(*member, point.first);
                    if (!v)
                    {
                        ++missing;
                        continue;
                    }
                    total += *v;
                }
                if (missing > 0)
                {
                    result.warnings.push_back("Combined value on " + point.first + " missing " +
                                              std::to_string(missing) +
                                              " portfolio(s); using carry-forward where available.");
                }
                point.second = total;
            }
            return result;
        }

    } // namespace analytics
} // namespace perfbook
