/**
 * @file sources.hpp
 * @brief Read interfaces to the collaborators that own ledger and market data.
 *
 * The engine never reaches into storage directly. Callers inject these
 * sources; in-memory implementations back the CLI loaders and the tests.
 * Benchmark providers follow an ordered-fallback model where every
 * provider returns a typed PriceFetchResult instead of throwing.
 */

#ifndef PERFBOOK_DATA_SOURCES_HPP
#define PERFBOOK_DATA_SOURCES_HPP

#include "perfbook/data/snapshot.hpp"
#include "perfbook/data/transaction.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace perfbook
{
    namespace data
    {

        /**
         * @struct DateRange
         * @brief Inclusive date window; an empty bound is unbounded.
         */
        struct DateRange
        {
            std::string start;
            std::string end;

            bool contains(const std::string &date) const;
        };

        // ===================================================================
        // Interfaces
        // ===================================================================

        /**
         * @class TransactionSource
         * @brief Ledger access. Results come back in (date, id) order.
         */
        class TransactionSource
        {
        public:
            virtual ~TransactionSource() = default;

            virtual std::vector<Transaction> list(const std::vector<int> &account_ids,
                                                  const DateRange &range) const = 0;
        };

        /**
         * @class SnapshotSource
         * @brief Holdings snapshots captured for a set of accounts.
         */
        class SnapshotSource
        {
        public:
            virtual ~SnapshotSource() = default;

            virtual std::vector<HoldingsSnapshot> list(const std::vector<int> &account_ids,
                                                       const DateRange &range) const = 0;
        };

        /**
         * @class CashBalanceSource
         * @brief Authoritative per-account cash balances.
         */
        class CashBalanceSource
        {
        public:
            virtual ~CashBalanceSource() = default;

            /** @brief Most recent balance dated on or before @p as_of. */
            virtual std::optional<double> latest(int account_id, const std::string &as_of) const = 0;
        };

        /**
         * @class CorporateActionSource
         * @brief Split and reverse-split events for a taxpayer.
         *
         * A rebuild replays every event for the taxpayer against a fresh lot
         * book and then records the outcome through update().
         */
        class CorporateActionSource
        {
        public:
            virtual ~CorporateActionSource() = default;

            virtual std::vector<CorporateActionEvent> list(int taxpayer_id) const = 0;
            virtual void update(const std::vector<CorporateActionEvent> &events) = 0;

            /** @brief Unapplied events dated on or before @p as_of, in date order. */
            std::vector<CorporateActionEvent> pending(int taxpayer_id, const std::string &as_of) const;
        };

        /**
         * @struct PriceFetchResult
         * @brief Outcome of one benchmark price request.
         */
        struct PriceFetchResult
        {
            bool success = false;
            std::string message; ///< Failure reason, or a note about the data used
            std::string provider;
            std::string symbol;
            PriceSeries series; ///< Date-ascending, one point per date
        };

        /**
         * @class BenchmarkPriceSource
         * @brief A benchmark price provider.
         */
        class BenchmarkPriceSource
        {
        public:
            virtual ~BenchmarkPriceSource() = default;

            virtual std::string name() const = 0;
            virtual PriceFetchResult get(const std::string &symbol, const DateRange &range) const = 0;
        };

        // ===================================================================
        // In-memory implementations
        // ===================================================================

        class InMemoryTransactionSource : public TransactionSource
        {
        public:
            InMemoryTransactionSource() = default;
            explicit InMemoryTransactionSource(std::vector<Transaction> transactions);

            void add(const Transaction &txn) { transactions_.push_back(txn); }
            size_t size() const { return transactions_.size(); }

            std::vector<Transaction> list(const std::vector<int> &account_ids,
                                          const DateRange &range) const override;

        private:
            std::vector<Transaction> transactions_;
        };

        class InMemorySnapshotSource : public SnapshotSource
        {
        public:
            InMemorySnapshotSource() = default;
            explicit InMemorySnapshotSource(std::vector<HoldingsSnapshot> snapshots);

            void add(const HoldingsSnapshot &snapshot) { snapshots_.push_back(snapshot); }

            std::vector<HoldingsSnapshot> list(const std::vector<int> &account_ids,
                                               const DateRange &range) const override;

        private:
            std::vector<HoldingsSnapshot> snapshots_;
        };

        class InMemoryCashBalanceSource : public CashBalanceSource
        {
        public:
            InMemoryCashBalanceSource() = default;
            explicit InMemoryCashBalanceSource(const std::vector<CashBalance> &balances);

            void add(const CashBalance &balance);

            std::optional<double> latest(int account_id, const std::string &as_of) const override;

        private:
            std::map<int, std::map<std::string, double>> balances_; ///< account -> date -> balance
        };

        class InMemoryCorporateActionSource : public CorporateActionSource
        {
        public:
            InMemoryCorporateActionSource() = default;
            explicit InMemoryCorporateActionSource(std::vector<CorporateActionEvent> events);

            void add(const CorporateActionEvent &event) { events_.push_back(event); }
            const std::vector<CorporateActionEvent> &events() const { return events_; }

            std::vector<CorporateActionEvent> list(int taxpayer_id) const override;
            void update(const std::vector<CorporateActionEvent> &events) override;

        private:
            std::vector<CorporateActionEvent> events_;
        };

        /**
         * @class InMemoryBenchmarkSource
         * @brief Benchmark provider over preloaded series, keyed by symbol.
         */
        class InMemoryBenchmarkSource : public BenchmarkPriceSource
        {
        public:
            explicit InMemoryBenchmarkSource(std::string name = "memory");

            void set_series(const std::string &symbol, PriceSeries series);

            std::string name() const override { return name_; }
            PriceFetchResult get(const std::string &symbol, const DateRange &range) const override;

        private:
            std::string name_;
            std::map<std::string, PriceSeries> series_;
        };

        /**
         * @class CsvBenchmarkSource
         * @brief Reads "<directory>/<SYMBOL>.csv" price files on demand.
         */
        class CsvBenchmarkSource : public BenchmarkPriceSource
        {
        public:
            explicit CsvBenchmarkSource(std::string directory);

            std::string name() const override { return "csv"; }
            PriceFetchResult get(const std::string &symbol, const DateRange &range) const override;

        private:
            std::string directory_;
        };

        /**
         * @class FallbackBenchmarkSource
         * @brief Tries providers in order and returns the first success.
         *
         * On total failure the result message lists every provider's error.
         */
        class FallbackBenchmarkSource : public BenchmarkPriceSource
        {
        public:
            FallbackBenchmarkSource() = default;
            explicit FallbackBenchmarkSource(std::vector<std::shared_ptr<BenchmarkPriceSource>> providers);

            void add_provider(std::shared_ptr<BenchmarkPriceSource> provider);

            std::string name() const override { return "fallback"; }
            PriceFetchResult get(const std::string &symbol, const DateRange &range) const override;

        private:
            std::vector<std::shared_ptr<BenchmarkPriceSource>> providers_;
        };

        /**
         * @brief Sort a price series by date, drop non-positive prices and
         *        keep the last observation for duplicated dates.
         */
        PriceSeries normalize_price_series(const PriceSeries &raw);

        /** @brief Restrict a date-ascending price series to @p range. */
        PriceSeries slice_price_series(const PriceSeries &series, const DateRange &range);

    } // namespace data
} // namespace perfbook

#endif // PERFBOOK_DATA_SOURCES_HPP
