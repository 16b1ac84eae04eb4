/**
 * @file cash_flow_classifier.cpp
 * @brief Implementation of CashFlowClassifier.
 */

#include "perfbook/analytics/cash_flow_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <set>
#include <utility>

namespace perfbook
{
    namespace analytics
    {

        namespace
        {

            std::string upper_trimmed(const std::string &s)
            {
                const size_t first = s.find_first_not_of(" \t\r\n");
                if (first == std::string::npos)
                {
                    return "";
                }
                const size_t last = s.find_last_not_of(" \t\r\n");
                std::string out = s.substr(first, last - first + 1);
                std::transform(out.begin(), out.end(), out.begin(),
                               [](unsigned char c)
                               { return static_cast<char>(std::toupper(c)); });
                return out;
            }

            bool contains(const std::string &haystack, const char *needle)
            {
                return haystack.find(needle) != std::string::npos;
            }

        } // anonymous namespace

        CashFlowClassifier::CashFlowClassifier(bool include_withholding_as_flow)
            : include_withholding_as_flow_(include_withholding_as_flow)
        {
        }

        double CashFlowClassifier::round_cents(double value)
        {
            return std::round(value * 100.0) / 100.0;
        }

        std::string CashFlowClassifier::description_of(const data::Transaction &txn)
        {
            const std::string desc = upper_trimmed(txn.meta("description"));
            const std::string detail = upper_trimmed(txn.meta("additional_detail"));
            if (desc.empty())
            {
                return detail;
            }
            if (detail.empty())
            {
                return desc;
            }
            return desc + " " + detail;
        }

        bool CashFlowClassifier::is_internal_transfer(const std::string &raw_type, const std::string &description)
        {
            const std::string rt = upper_trimmed(raw_type);
            const std::string d = upper_trimmed(description);

            const bool multi_currency = contains(d, "MULTI") && contains(d, "CURRENCY");
            if (rt == "UNKNOWN" && multi_currency)
            {
                return true;
            }
            if (contains(d, "DEPOSIT SWEEP") || contains(d, "SHADO"))
            {
                return true;
            }
            // Custodian settlement shuttles
            if (contains(d, "REC FR SIS") || contains(d, "REC TRSF SIS") ||
                contains(d, "TRSF TO SIS") || contains(d, "TRSF SIS"))
            {
                return true;
            }
            if (contains(d, "FX") && (contains(d, "SETTLEMENT") || contains(d, "TRAD")))
            {
                return true;
            }
            if (multi_currency || contains(d, "MULTICURRENCY"))
            {
                return true;
            }
            return contains(d, "INTERNAL") && contains(d, "TRANSFER");
        }

        std::vector<CashFlow> CashFlowClassifier::filter_offsetting_pairs(const std::vector<CashFlow> &transfers)
        {
            struct Bucket
            {
                std::vector<double> pos;
                std::vector<double> neg;
            };
            std::map<std::pair<std::string, double>, Bucket> buckets;

            for (const auto &t : transfers)
            {
                const double a = round_cents(t.amount);
                if (std::abs(a) <= AMOUNT_EPSILON)
                {
                    continue;
                }
                auto &bucket = buckets[std::make_pair(t.date, round_cents(std::abs(a)))];
                if (a >= 0.0)
                {
                    bucket.pos.push_back(a);
                }
                else
                {
                    bucket.neg.push_back(a);
                }
            }

            std::vector<CashFlow> out;
            for (const auto &entry : buckets)
            {
                const Bucket &bucket = entry.second;
                const size_t pairs = std::min(bucket.pos.size(), bucket.neg.size());
                for (size_t i = pairs; i < bucket.pos.size(); ++i)
                {
                    out.push_back({entry.first.first, bucket.pos[i]});
                }
                for (size_t i = pairs; i < bucket.neg.size(); ++i)
                {
                    out.push_back({entry.first.first, bucket.neg[i]});
                }
            }

            std::sort(out.begin(), out.end(),
                      [](const CashFlow &a, const CashFlow &b)
                      {
                          if (a.date != b.date)
                          {
                              return a.date < b.date;
                          }
                          return a.amount < b.amount;
                      });
            return out;
        }

        CashFlowSummary CashFlowClassifier::classify(const std::vector<data::Transaction> &transactions,
                                                     const std::string &flow_start,
                                                     const std::string &flow_end) const
        {
            CashFlowSummary summary;
            std::vector<CashFlow> transfers;
            std::set<std::string> seen;

            std::vector<data::Transaction> ordered = transactions;
            std::stable_sort(ordered.begin(), ordered.end(), data::ledger_order);

            for (const auto &txn : ordered)
            {
                if (txn.date < flow_start || txn.date > flow_end)
                {
                    continue;
                }
                const std::string key = txn.dedup_key();
                if (!key.empty())
                {
                    if (!seen.insert(key).second)
                    {
                        continue;
                    }
                }

                ++summary.txn_count;
                if (!summary.txn_start || txn.date < *summary.txn_start)
                {
                    summary.txn_start = txn.date;
                }
                if (!summary.txn_end || txn.date > *summary.txn_end)
                {
                    summary.txn_end = txn.date;
                }

                switch (txn.type)
                {
                case data::TransactionType::TRANSFER:
                    if (!is_internal_transfer(txn.meta("raw_type"), description_of(txn)))
                    {
                        transfers.push_back({txn.date, txn.amount});
                    }
                    break;

                case data::TransactionType::WITHHOLDING:
                    if (include_withholding_as_flow_)
                    {
                        summary.flows.push_back({txn.date, txn.amount});
                    }
                    else
                    {
                        summary.withholding += std::abs(txn.amount);
                    }
                    break;

                case data::TransactionType::FEE:
                    if (txn.amount < 0.0)
                    {
                        summary.fees += std::abs(txn.amount);
                    }
                    break;

                case data::TransactionType::OTHER:
                    if (txn.amount < 0.0 && !is_internal_transfer(txn.meta("raw_type"), description_of(txn)))
                    {
                        summary.other_cash_out += std::abs(txn.amount);
                    }
                    break;

                default:
                    break;
                }
            }

            for (const auto &flow : filter_offsetting_pairs(transfers))
            {
                summary.flows.push_back(flow);
            }
            std::stable_sort(summary.flows.begin(), summary.flows.end(),
                             [](const CashFlow &a, const CashFlow &b)
                             { return a.date < b.date; });

            for (const auto &flow : summary.flows)
            {
                summary.net_flow += flow.amount;
                if (flow.amount >= 0.0)
                {
                    summary.contributions += flow.amount;
                }
                else
                {
                    summary.withdrawals += -flow.amount;
                }
            }

            if (summary.txn_count == 0)
            {
                summary.warnings.push_back("No transactions found in valuation window (" + flow_start + " to " +
                                           flow_end + ").");
            }
            else
            {
                if (*summary.txn_start > flow_start)
                {
                    summary.warnings.push_back("Transactions start at " + *summary.txn_start +
                                               " (missing earlier activity in valuation window).");
                }
                if (*summary.txn_end < flow_end)
                {
                    summary.warnings.push_back("Transactions end at " + *summary.txn_end +
                                               " (missing later activity in valuation window).");
                }
            }
            return summary;
        }

    } // namespace analytics
} // namespace perfbook
