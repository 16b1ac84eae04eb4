/**
 * @file sources.cpp
 * @brief In-memory, CSV and fallback implementations of the data sources.
 */

#include "perfbook/data/sources.hpp"
#include "perfbook/data/data_loader.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <set>

namespace perfbook
{
    namespace data
    {

        bool DateRange::contains(const std::string &date) const
        {
            if (!start.empty() && date < start)
                return false;
            if (!end.empty() && date > end)
                return false;
            return true;
        }

        PriceSeries normalize_price_series(const PriceSeries &raw)
        {
            std::map<std::string, double> by_date;
            for (const auto &p : raw)
            {
                if (p.price > 0.0)
                {
                    by_date[p.date] = p.price;
                }
            }
            PriceSeries out;
            out.reserve(by_date.size());
            for (const auto &[date, price] : by_date)
            {
                out.push_back({date, price});
            }
            return out;
        }

        PriceSeries slice_price_series(const PriceSeries &series, const DateRange &range)
        {
            PriceSeries out;
            for (const auto &p : series)
            {
                if (range.contains(p.date))
                {
                    out.push_back(p);
                }
            }
            return out;
        }

        // ===================================================================
        // Transactions
        // ===================================================================

        InMemoryTransactionSource::InMemoryTransactionSource(std::vector<Transaction> transactions)
            : transactions_(std::move(transactions))
        {
        }

        std::vector<Transaction> InMemoryTransactionSource::list(const std::vector<int> &account_ids,
                                                                 const DateRange &range) const
        {
            const std::set<int> wanted(account_ids.begin(), account_ids.end());
            std::vector<Transaction> out;
            for (const auto &t : transactions_)
            {
                if (wanted.count(t.account_id) && range.contains(t.date))
                {
                    out.push_back(t);
                }
            }
            std::stable_sort(out.begin(), out.end(), ledger_order);
            return out;
        }

        // ===================================================================
        // Snapshots and cash balances
        // ===================================================================

        InMemorySnapshotSource::InMemorySnapshotSource(std::vector<HoldingsSnapshot> snapshots)
            : snapshots_(std::move(snapshots))
        {
        }

        std::vector<HoldingsSnapshot> InMemorySnapshotSource::list(const std::vector<int> &account_ids,
                                                                   const DateRange &range) const
        {
            const std::set<int> wanted(account_ids.begin(), account_ids.end());
            std::vector<HoldingsSnapshot> out;
            for (const auto &s : snapshots_)
            {
                if (wanted.count(s.account_id) && range.contains(s.as_of.substr(0, 10)))
                {
                    out.push_back(s);
                }
            }
            return out;
        }

        InMemoryCashBalanceSource::InMemoryCashBalanceSource(const std::vector<CashBalance> &balances)
        {
            for (const auto &b : balances)
            {
                add(b);
            }
        }

        void InMemoryCashBalanceSource::add(const CashBalance &balance)
        {
            balances_[balance.account_id][balance.date] = balance.balance;
        }

        std::optional<double> InMemoryCashBalanceSource::latest(int account_id, const std::string &as_of) const
        {
            auto acct = balances_.find(account_id);
            if (acct == balances_.end() || acct->second.empty())
            {
                return std::nullopt;
            }
            auto it = acct->second.upper_bound(as_of);
            if (it == acct->second.begin())
            {
                return std::nullopt;
            }
            --it;
            return it->second;
        }

        // ===================================================================
        // Corporate actions
        // ===================================================================

        std::vector<CorporateActionEvent> CorporateActionSource::pending(int taxpayer_id, const std::string &as_of) const
        {
            std::vector<CorporateActionEvent> out;
            for (const auto &e : list(taxpayer_id))
            {
                if (!e.applied && e.action_date <= as_of)
                {
                    out.push_back(e);
                }
            }
            std::stable_sort(out.begin(), out.end(),
                             [](const CorporateActionEvent &a, const CorporateActionEvent &b)
                             { return a.action_date < b.action_date; });
            return out;
        }

        InMemoryCorporateActionSource::InMemoryCorporateActionSource(std::vector<CorporateActionEvent> events)
            : events_(std::move(events))
        {
        }

        std::vector<CorporateActionEvent> InMemoryCorporateActionSource::list(int taxpayer_id) const
        {
            std::vector<CorporateActionEvent> out;
            for (const auto &e : events_)
            {
                if (e.taxpayer_id == taxpayer_id)
                {
                    out.push_back(e);
                }
            }
            return out;
        }

        void InMemoryCorporateActionSource::update(const std::vector<CorporateActionEvent> &events)
        {
            for (const auto &updated : events)
            {
                for (auto &e : events_)
                {
                    if (e.id == updated.id)
                    {
                        e = updated;
                    }
                }
            }
        }

        // ===================================================================
        // Benchmark providers
        // ===================================================================

        InMemoryBenchmarkSource::InMemoryBenchmarkSource(std::string name)
            : name_(std::move(name))
        {
        }

        void InMemoryBenchmarkSource::set_series(const std::string &symbol, PriceSeries series)
        {
            series_[symbol] = normalize_price_series(series);
        }

        PriceFetchResult InMemoryBenchmarkSource::get(const std::string &symbol, const DateRange &range) const
        {
            PriceFetchResult result;
            result.provider = name_;
            result.symbol = symbol;

            auto it = series_.find(symbol);
            if (it == series_.end())
            {
                result.message = "No series loaded for " + symbol;
                return result;
            }
            result.series = slice_price_series(it->second, range);
            if (result.series.empty())
            {
                result.message = "No prices for " + symbol + " between " + range.start + " and " + range.end;
                return result;
            }
            result.success = true;
            return result;
        }

        CsvBenchmarkSource::CsvBenchmarkSource(std::string directory)
            : directory_(std::move(directory))
        {
        }

        PriceFetchResult CsvBenchmarkSource::get(const std::string &symbol, const DateRange &range) const
        {
            PriceFetchResult result;
            result.provider = name();
            result.symbol = symbol;

            const std::filesystem::path path = std::filesystem::path(directory_) / (symbol + ".csv");
            if (!std::filesystem::exists(path))
            {
                result.message = "Price file not found: " + path.string();
                return result;
            }

            try
            {
                result.series = slice_price_series(DataLoader::load_price_series(path.string()), range);
            }
            catch (const std::runtime_error &e)
            {
                result.message = e.what();
                return result;
            }

            if (result.series.empty())
            {
                result.message = "No prices for " + symbol + " in " + path.string();
                return result;
            }
            result.success = true;
            return result;
        }

        FallbackBenchmarkSource::FallbackBenchmarkSource(std::vector<std::shared_ptr<BenchmarkPriceSource>> providers)
            : providers_(std::move(providers))
        {
        }

        void FallbackBenchmarkSource::add_provider(std::shared_ptr<BenchmarkPriceSource> provider)
        {
            providers_.push_back(std::move(provider));
        }

        PriceFetchResult FallbackBenchmarkSource::get(const std::string &symbol, const DateRange &range) const
        {
            PriceFetchResult failure;
            failure.provider = name();
            failure.symbol = symbol;

            if (providers_.empty())
            {
                failure.message = "No benchmark providers configured";
                return failure;
            }

            std::string errors;
            for (const auto &provider : providers_)
            {
                PriceFetchResult r = provider->get(symbol, range);
                if (r.success)
                {
                    if (!errors.empty())
                    {
                        r.message = "Fell back to " + r.provider + " (" + errors + ")";
                    }
                    return r;
                }
                spdlog::warn("Benchmark provider {} failed for {}: {}", provider->name(), symbol, r.message);
                if (!errors.empty())
                {
                    errors += "; ";
                }
                errors += provider->name() + ": " + r.message;
            }

            failure.message = errors;
            return failure;
        }

    } // namespace data
} // namespace perfbook
