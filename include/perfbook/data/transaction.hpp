/**
 * @file transaction.hpp
 * @brief Normalized ledger records: accounts, transactions, corporate actions.
 *
 * These are the engine's inputs. Broker parsing happens upstream; by the
 * time a Transaction arrives here its type is one of the normalized
 * categories and its amount follows the cash convention (positive = cash
 * into the account).
 */

#ifndef PERFBOOK_DATA_TRANSACTION_HPP
#define PERFBOOK_DATA_TRANSACTION_HPP

#include <map>
#include <optional>
#include <string>

namespace perfbook
{
    namespace data
    {

        /**
         * @enum TransactionType
         * @brief Normalized transaction categories.
         */
        enum class TransactionType
        {
            BUY,
            SELL,
            TRANSFER,
            FEE,
            WITHHOLDING,
            DIVIDEND,
            OTHER
        };

        /**
         * @brief Parse a transaction type name (case-insensitive).
         *
         * Unrecognised names map to OTHER so that new upstream categories
         * never abort a rebuild.
         */
        TransactionType parse_transaction_type(const std::string &name);

        std::string to_string(TransactionType type);

        /**
         * @enum AccountType
         * @brief Tax treatment of an account.
         */
        enum class AccountType
        {
            TAXABLE,       ///< Brokerage account; lots and wash sales tracked
            TAX_ADVANTAGED ///< IRA/401k style; excluded from lot reconstruction
        };

        /**
         * @brief Parse an account type ("taxable", "ira", "roth", "401k", "tax_advantaged").
         * @throws std::invalid_argument If the name is not recognised.
         */
        AccountType parse_account_type(const std::string &name);

        std::string to_string(AccountType type);

        /**
         * @struct Account
         * @brief A custodial account owned by one taxpayer and reported under one portfolio.
         */
        struct Account
        {
            int id = 0;
            int taxpayer_id = 0;
            int portfolio_id = 0;
            std::string name;
            AccountType type = AccountType::TAXABLE;

            bool is_taxable() const { return type == AccountType::TAXABLE; }
        };

        /**
         * @struct Transaction
         * @brief One normalized ledger entry.
         *
         * Recognised metadata keys: description, additional_detail, raw_type,
         * basis_total, provider_account_id, provider_txn_id.
         */
        struct Transaction
        {
            int id = 0; ///< Ledger id, also the insertion order for same-day ties
            int account_id = 0;
            std::string date;
            TransactionType type = TransactionType::OTHER;
            std::optional<std::string> ticker;
            std::optional<double> quantity;
            double amount = 0.0; ///< Positive = cash into the account
            std::map<std::string, std::string> metadata;

            /** @brief Metadata value, or an empty string when absent. */
            std::string meta(const std::string &key) const;

            /** @brief Metadata value parsed as a number, if present and numeric. */
            std::optional<double> meta_number(const std::string &key) const;

            /**
             * @brief Provider-sourced unique key "provider_account_id|provider_txn_id".
             * @return Empty string unless both provider ids are present.
             */
            std::string dedup_key() const;

            /** @brief Trimmed, upper-cased ticker or an empty string. */
            std::string normalized_ticker() const;
        };

        /** @brief Ordering by (date, id), the ledger's replay order. */
        bool ledger_order(const Transaction &a, const Transaction &b);

        /**
         * @struct CorporateActionEvent
         * @brief A split or reverse split pending application to open lots.
         */
        struct CorporateActionEvent
        {
            int id = 0;
            int taxpayer_id = 0;
            std::string security_id;
            std::optional<int> account_id; ///< Restrict to one account when set
            std::string action_date;
            std::string action_type; ///< SPLIT, REVERSE_SPLIT or anything else (ignored)
            std::optional<double> ratio;
            bool applied = false;
            std::string apply_notes;
        };

    } // namespace data
} // namespace perfbook

#endif // PERFBOOK_DATA_TRANSACTION_HPP
