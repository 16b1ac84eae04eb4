/**
 * @file wash_sale.cpp
 * @brief Wash-sale loss deferral over a reconstructed lot book
 */

#include "perfbook/lots/wash_sale.hpp"
#include "perfbook/data/date_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace perfbook {
namespace lots {

namespace {

std::string normalize(const std::string& ticker)
{
    std::string out;
    for (char c : ticker) {
        if (!std::isspace(static_cast<unsigned char>(c)))
            out += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace

// ---------------------------------------------------------------------------
// SecurityGroups
// ---------------------------------------------------------------------------

SecurityGroups::SecurityGroups(const std::map<std::string, std::vector<std::string>>& groups)
{
    for (const auto& [group, tickers] : groups) {
        for (const auto& t : tickers)
            add(group, t);
    }
}

void SecurityGroups::add(const std::string& group, const std::string& ticker)
{
    const std::string t = normalize(ticker);
    group_by_ticker_[t] = group;
    members_[group].insert(t);
}

std::set<std::string> SecurityGroups::equivalents(const std::string& ticker) const
{
    const std::string t = normalize(ticker);
    std::set<std::string> out{t};
    auto it = group_by_ticker_.find(t);
    if (it != group_by_ticker_.end()) {
        const auto& members = members_.at(it->second);
        out.insert(members.begin(), members.end());
    }
    return out;
}

// ---------------------------------------------------------------------------
// WashSaleEngine
// ---------------------------------------------------------------------------

WashSaleEngine::WashSaleEngine(WashSaleConfig config, SecurityGroups groups)
    : config_(config), groups_(std::move(groups)) {}

WashSaleResult WashSaleEngine::apply(int taxpayer_id,
                                     LotBook& book,
                                     const std::vector<data::Account>& accounts,
                                     const std::vector<data::Transaction>& transactions) const
{
    WashSaleResult result;

    std::map<int, const data::Account*> scope;
    std::set<int> taxable;
    for (const auto& a : accounts) {
        if (a.taxpayer_id != taxpayer_id)
            continue;
        if (a.is_taxable())
            taxable.insert(a.id);
        if (a.is_taxable() || config_.include_tax_advantaged)
            scope[a.id] = &a;
    }

    std::map<int, const data::Transaction*> txn_by_id;
    for (const auto& t : transactions)
        txn_by_id[t.id] = &t;

    // Loss per sale, in order of first disposal.
    std::vector<int> sale_ids;
    std::map<int, double> gain_by_sale;
    // Shares each sale took from the lot of each buy: sale id -> buy id -> qty.
    std::map<int, std::map<int, double>> consumed_qty_by_sale;
    for (const auto& d : book.disposals()) {
        auto& consumed = consumed_qty_by_sale[d.sell_txn_id];
        if (std::find(sale_ids.begin(), sale_ids.end(), d.sell_txn_id) == sale_ids.end())
            sale_ids.push_back(d.sell_txn_id);
        if (d.realized_gain)
            gain_by_sale[d.sell_txn_id] += *d.realized_gain;
        const TaxLot* lot = book.find_lot(d.tax_lot_id);
        if (lot && lot->created_from_txn_id)
            consumed[*lot->created_from_txn_id] += d.quantity_sold;
    }

    for (int sale_id : sale_ids) {
        auto sale_it = txn_by_id.find(sale_id);
        if (sale_it == txn_by_id.end())
            continue;
        const data::Transaction& sale = *sale_it->second;
        if (sale.type != data::TransactionType::SELL || !taxable.count(sale.account_id))
            continue;

        auto gain_it = gain_by_sale.find(sale_id);
        if (gain_it == gain_by_sale.end())
            continue;  // every disposal had unknown basis
        const double total_gain = gain_it->second;
        if (total_gain >= -config_.loss_threshold)
            continue;
        const double qty_sold = sale.quantity.value_or(0.0);
        if (qty_sold <= 0.0)
            continue;

        const double loss = -total_gain;
        const std::string window_start = data::add_days(sale.date, -config_.window_days);
        const std::string window_end = data::add_days(sale.date, config_.window_days);
        const auto tickers = groups_.equivalents(sale.normalized_ticker());
        const auto& consumed = consumed_qty_by_sale[sale_id];

        std::vector<const data::Transaction*> buys;
        for (const auto& t : transactions) {
            if (t.type != data::TransactionType::BUY || t.id == sale_id)
                continue;
            if (!scope.count(t.account_id) || !tickers.count(t.normalized_ticker()))
                continue;
            if (t.date < window_start || t.date > window_end)
                continue;
            buys.push_back(&t);
        }
        std::stable_sort(buys.begin(), buys.end(),
                         [](const data::Transaction* a, const data::Transaction* b) {
                             return data::ledger_order(*a, *b);
                         });

        double remaining = qty_sold;
        for (const data::Transaction* buy : buys) {
            double bqty = buy->quantity.value_or(0.0);
            auto used = consumed.find(buy->id);
            if (used != consumed.end())
                bqty -= used->second;
            if (bqty <= QTY_EPSILON || remaining <= QTY_EPSILON)
                continue;

            const double take = std::min(remaining, bqty);
            const double deferred = loss * (take / qty_sold);

            WashSaleAdjustment adj;
            adj.loss_sale_txn_id = sale_id;
            adj.replacement_buy_txn_id = buy->id;
            adj.deferred_loss = deferred;
            adj.replacement_shares = take;
            adj.window_start = window_start;
            adj.window_end = window_end;
            adj.status = WashStatus::APPLIED;

            const TaxLot* found = book.lot_from_txn(buy->id);
            if (found)
                adj.replacement_lot_id = found->id;

            if (!scope.at(buy->account_id)->is_taxable()) {
                adj.status = WashStatus::FLAGGED;
                adj.notes = "Replacement buy in tax-advantaged account; loss may be permanently disallowed (not modeled).";
            } else if (!found) {
                adj.status = WashStatus::FLAGGED;
                adj.notes = "No reconstructed lot for replacement buy.";
            }

            if (adj.status == WashStatus::APPLIED) {
                TaxLot* lot = book.find_lot(found->id);
                lot->basis_open = lot->basis_open.value_or(0.0) + deferred;
                lot->wash_basis_added += deferred;
                lot->notes.push_back("Wash sale basis +" + std::to_string(deferred) +
                                     " from sale txn_id=" + std::to_string(sale_id));
                adj.basis_increase = deferred;
            }

            book.add_adjustment(std::move(adj));
            ++result.adjustments_created;
            remaining -= take;
        }

        if (remaining > QTY_EPSILON && remaining <= qty_sold - QTY_EPSILON) {
            std::string msg = "Wash sale: not enough replacement shares to defer full loss for sale txn_id=" +
                              std::to_string(sale_id) + ".";
            spdlog::warn("{}", msg);
            result.warnings.push_back(msg);
        }
    }

    return result;
}

} // namespace lots
} // namespace perfbook
