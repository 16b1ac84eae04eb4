/**
 * @file transaction.cpp
 * @brief Parsing and metadata helpers for ledger records.
 */

#include "perfbook/data/transaction.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace perfbook
{
    namespace data
    {

        namespace
        {

            std::string to_upper(std::string s)
            {
                std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                               { return static_cast<char>(std::toupper(c)); });
                return s;
            }

            std::string trim(const std::string &s)
            {
                const auto first = s.find_first_not_of(" \t\r\n");
                if (first == std::string::npos)
                {
                    return "";
                }
                const auto last = s.find_last_not_of(" \t\r\n");
                return s.substr(first, last - first + 1);
            }

        } // anonymous namespace

        TransactionType parse_transaction_type(const std::string &name)
        {
            const std::string s = to_upper(trim(name));
            if (s == "BUY")
                return TransactionType::BUY;
            if (s == "SELL")
                return TransactionType::SELL;
            if (s == "TRANSFER")
                return TransactionType::TRANSFER;
            if (s == "FEE")
                return TransactionType::FEE;
            if (s == "WITHHOLDING")
                return TransactionType::WITHHOLDING;
            if (s == "DIVIDEND")
                return TransactionType::DIVIDEND;
            return TransactionType::OTHER;
        }

        std::string to_string(TransactionType type)
        {
            switch (type)
            {
            case TransactionType::BUY:
                return "BUY";
            case TransactionType::SELL:
                return "SELL";
            case TransactionType::TRANSFER:
                return "TRANSFER";
            case TransactionType::FEE:
                return "FEE";
            case TransactionType::WITHHOLDING:
                return "WITHHOLDING";
            case TransactionType::DIVIDEND:
                return "DIVIDEND";
            case TransactionType::OTHER:
                return "OTHER";
            }
            return "OTHER";
        }

        AccountType parse_account_type(const std::string &name)
        {
            const std::string s = to_upper(trim(name));
            if (s == "TAXABLE" || s == "BROKERAGE")
                return AccountType::TAXABLE;
            if (s == "TAX_ADVANTAGED" || s == "IRA" || s == "ROTH" || s == "401K")
                return AccountType::TAX_ADVANTAGED;
            throw std::invalid_argument("Invalid account type: " + name);
        }

        std::string to_string(AccountType type)
        {
            return type == AccountType::TAXABLE ? "TAXABLE" : "TAX_ADVANTAGED";
        }

        // ===================================================================
        // Transaction
        // ===================================================================

        std::string Transaction::meta(const std::string &key) const
        {
            auto it = metadata.find(key);
            return it == metadata.end() ? std::string() : it->second;
        }

        std::optional<double> Transaction::meta_number(const std::string &key) const
        {
            const std::string raw = trim(meta(key));
            if (raw.empty())
            {
                return std::nullopt;
            }
            try
            {
                size_t consumed = 0;
                double value = std::stod(raw, &consumed);
                if (consumed != raw.size() || !std::isfinite(value))
                {
                    return std::nullopt;
                }
                return value;
            }
            catch (const std::exception &)
            {
                return std::nullopt;
            }
        }

        std::string Transaction::dedup_key() const
        {
            const std::string account = trim(meta("provider_account_id"));
            const std::string txn = trim(meta("provider_txn_id"));
            if (account.empty() || txn.empty())
            {
                return "";
            }
            return account + "|" + txn;
        }

        std::string Transaction::normalized_ticker() const
        {
            return ticker ? to_upper(trim(*ticker)) : std::string();
        }

        bool ledger_order(const Transaction &a, const Transaction &b)
        {
            if (a.date != b.date)
            {
                return a.date < b.date;
            }
            return a.id < b.id;
        }

    } // namespace data
} // namespace perfbook
