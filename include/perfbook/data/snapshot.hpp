/**
 * @file snapshot.hpp
 * @brief Holdings snapshots, cash balances and price observations.
 */

#ifndef PERFBOOK_DATA_SNAPSHOT_HPP
#define PERFBOOK_DATA_SNAPSHOT_HPP

#include <string>
#include <vector>

namespace perfbook
{
    namespace data
    {

        /// Symbol prefix marking a cash line inside a snapshot ("CASH:USD").
        inline const std::string CASH_SYMBOL_PREFIX = "CASH:";

        /**
         * @struct SnapshotItem
         * @brief One line of a holdings snapshot.
         */
        struct SnapshotItem
        {
            std::string symbol;
            double market_value = 0.0;
            bool is_total = false; ///< Pre-aggregated account total reported by the custodian

            bool is_cash() const { return symbol.rfind(CASH_SYMBOL_PREFIX, 0) == 0; }
        };

        /**
         * @struct HoldingsSnapshot
         * @brief Positions and cash of one account as captured at @c as_of.
         */
        struct HoldingsSnapshot
        {
            int account_id = 0;
            std::string as_of; ///< ISO date or timestamp of capture
            std::vector<SnapshotItem> items;
        };

        /**
         * @struct CashBalance
         * @brief Authoritative end-of-day cash balance for an account.
         */
        struct CashBalance
        {
            int account_id = 0;
            std::string date;
            double balance = 0.0;
        };

        /**
         * @struct PricePoint
         * @brief Dated price observation of a benchmark or security.
         */
        struct PricePoint
        {
            std::string date;
            double price = 0.0;
        };

        using PriceSeries = std::vector<PricePoint>;

    } // namespace data
} // namespace perfbook

#endif // PERFBOOK_DATA_SNAPSHOT_HPP
