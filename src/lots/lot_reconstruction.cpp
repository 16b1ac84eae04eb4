/**
 * @file lot_reconstruction.cpp
 * @brief FIFO replay of BUY/SELL/TRANSFER transactions into tax lots
 */

#include "perfbook/lots/lot_reconstruction.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <set>
#include <sstream>

namespace perfbook {
namespace lots {

namespace {

using LotKey = std::pair<int, std::string>;

std::string format_number(double v)
{
    std::ostringstream os;
    os << v;
    return os.str();
}

std::string to_upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return s;
}

bool is_replayed(data::TransactionType type)
{
    return type == data::TransactionType::BUY || type == data::TransactionType::SELL ||
           type == data::TransactionType::TRANSFER || type == data::TransactionType::OTHER;
}

class Replay {
public:
    Replay(int taxpayer_id, ReconstructionResult& result)
        : taxpayer_id_(taxpayer_id), result_(result) {}

    void apply_corporate_action(data::CorporateActionEvent& ev);
    void buy(const data::Transaction& t, const std::string& ticker);
    void transfer_in(const data::Transaction& t, const std::string& ticker);
    void sell(const data::Transaction& t, const std::string& ticker);

private:
    int open_lot(const data::Transaction& t, const std::string& ticker, double qty,
                 std::optional<double> basis);
    int sentinel_lot(const data::Transaction& t, const std::string& ticker);
    int scale_open_lots(const data::CorporateActionEvent& ev, double factor);
    void warn(const std::string& message);

    int taxpayer_id_;
    ReconstructionResult& result_;
    std::map<LotKey, std::vector<int>> open_;  ///< lot ids, oldest first
    std::map<LotKey, int> sentinel_;
};

void Replay::warn(const std::string& message)
{
    spdlog::warn("{}", message);
    result_.warnings.push_back(message);
}

int Replay::open_lot(const data::Transaction& t, const std::string& ticker, double qty,
                     std::optional<double> basis)
{
    TaxLot lot;
    lot.taxpayer_id = taxpayer_id_;
    lot.account_id = t.account_id;
    lot.security_id = ticker;
    lot.acquired_date = t.date;
    lot.original_quantity = qty;
    lot.quantity_open = qty;
    lot.basis_open = basis;
    lot.created_from_txn_id = t.id;

    int id = result_.book.add_lot(std::move(lot)).id;
    // replay is date-ordered, so appending keeps (acquired_date, id) order
    open_[{t.account_id, ticker}].push_back(id);
    ++result_.lots_created;
    return id;
}

int Replay::sentinel_lot(const data::Transaction& t, const std::string& ticker)
{
    LotKey key{t.account_id, ticker};
    auto it = sentinel_.find(key);
    if (it != sentinel_.end())
        return it->second;

    TaxLot lot;
    lot.taxpayer_id = taxpayer_id_;
    lot.account_id = t.account_id;
    lot.security_id = ticker;
    lot.acquired_date = t.date;
    lot.basis_unknown = true;
    lot.notes.push_back("Synthetic lot for missing history or short position.");

    int id = result_.book.add_lot(std::move(lot)).id;
    sentinel_[key] = id;
    return id;
}

void Replay::buy(const data::Transaction& t, const std::string& ticker)
{
    if (!t.quantity || *t.quantity <= 0.0) {
        warn("BUY txn missing qty: txn_id=" + std::to_string(t.id));
        return;
    }
    open_lot(t, ticker, *t.quantity, std::abs(t.amount));
}

void Replay::transfer_in(const data::Transaction& t, const std::string& ticker)
{
    if (!t.quantity || *t.quantity <= 0.0)
        return;

    std::optional<double> basis = t.meta_number("basis_total");
    if (!basis && std::abs(t.amount) > QTY_EPSILON)
        basis = std::abs(t.amount);

    int id = open_lot(t, ticker, *t.quantity, basis);
    result_.book.find_lot(id)->notes.push_back("Transfer-in lot reconstructed; verify basis.");
}

void Replay::sell(const data::Transaction& t, const std::string& ticker)
{
    if (!t.quantity || *t.quantity <= 0.0) {
        warn("SELL txn missing qty: txn_id=" + std::to_string(t.id));
        return;
    }

    const double qty = *t.quantity;
    const double proceeds = std::abs(t.amount);
    double remaining = qty;
    auto& fifo = open_[{t.account_id, ticker}];

    for (int lot_id : fifo) {
        if (remaining <= QTY_EPSILON)
            break;
        TaxLot* lot = result_.book.find_lot(lot_id);
        if (!lot->is_open())
            continue;

        const double take = std::min(remaining, lot->quantity_open);

        LotDisposal d;
        d.sell_txn_id = t.id;
        d.tax_lot_id = lot->id;
        d.account_id = t.account_id;
        d.security_id = ticker;
        d.sale_date = t.date;
        d.quantity_sold = take;
        d.proceeds_allocated = proceeds * (take / qty);

        if (lot->basis_open) {
            const double unit_basis = *lot->basis_open / lot->quantity_open;
            const double basis_alloc = unit_basis * take;
            d.basis_allocated = basis_alloc;
            d.realized_gain = d.proceeds_allocated - basis_alloc;
            d.term = term_for_holding(lot->acquired_date, t.date);
            lot->basis_open = std::max(0.0, *lot->basis_open - basis_alloc);
        } else {
            d.basis_unknown = true;
            warn("Basis unknown lot used for SELL txn_id=" + std::to_string(t.id) + " ticker=" + ticker + ".");
        }

        lot->quantity_open -= take;
        lot->quantity_disposed += take;
        if (lot->quantity_open <= QTY_EPSILON) {
            lot->quantity_disposed += lot->quantity_open;
            lot->quantity_open = 0.0;
        }

        result_.book.add_disposal(std::move(d));
        ++result_.disposals_created;
        remaining -= take;
    }

    fifo.erase(std::remove_if(fifo.begin(), fifo.end(),
                              [this](int id) { return !result_.book.find_lot(id)->is_open(); }),
               fifo.end());

    if (remaining > QTY_EPSILON) {
        warn("Insufficient lots for SELL txn_id=" + std::to_string(t.id) + " ticker=" + ticker +
             "; basis unknown for " + format_number(remaining) + ".");

        LotDisposal d;
        d.sell_txn_id = t.id;
        d.tax_lot_id = sentinel_lot(t, ticker);
        d.account_id = t.account_id;
        d.security_id = ticker;
        d.sale_date = t.date;
        d.quantity_sold = remaining;
        d.proceeds_allocated = proceeds * (remaining / qty);
        d.term = Term::UNKNOWN;
        d.basis_unknown = true;

        result_.book.add_disposal(std::move(d));
        ++result_.disposals_created;
    }
}

int Replay::scale_open_lots(const data::CorporateActionEvent& ev, double factor)
{
    int touched = 0;
    for (const auto& existing : result_.book.lots()) {
        if (existing.basis_unknown || !existing.is_open())
            continue;
        if (existing.security_id != ev.security_id)
            continue;
        if (ev.account_id && existing.account_id != *ev.account_id)
            continue;

        TaxLot* lot = result_.book.find_lot(existing.id);
        lot->quantity_open *= factor;
        lot->quantity_disposed *= factor;
        lot->original_quantity *= factor;
        lot->notes.push_back(ev.action_type + " factor " + format_number(factor) + " as of " + ev.action_date);
        ++touched;
    }
    return touched;
}

void Replay::apply_corporate_action(data::CorporateActionEvent& ev)
{
    ev.applied = true;

    if (ev.action_type != "SPLIT" && ev.action_type != "REVERSE_SPLIT") {
        ev.apply_notes = "Unsupported action_type " + ev.action_type + "; not applied.";
        return;
    }
    if (!ev.ratio) {
        ev.apply_notes = "Missing ratio; not applied.";
        warn("Corporate action missing ratio; marked applied but no change made.");
        return;
    }

    double factor = *ev.ratio;
    if (ev.action_type == "REVERSE_SPLIT") {
        if (factor == 0.0) {
            ev.apply_notes = "Invalid ratio";
            warn("Reverse split ratio=0; skipped.");
            return;
        }
        factor = 1.0 / factor;
    }
    if (factor <= 0.0) {
        ev.apply_notes = "Invalid ratio";
        warn("Corporate action split ratio <= 0; skipped.");
        return;
    }

    int touched = scale_open_lots(ev, factor);
    ev.apply_notes = "Applied " + ev.action_type + " ratio=" + format_number(*ev.ratio) +
                     " (effective factor " + format_number(factor) + ") to " +
                     std::to_string(touched) + " open lot(s).";
    spdlog::debug("Corporate action {}: {}", ev.id, ev.apply_notes);
}

} // namespace

ReconstructionResult LotReconstructionEngine::reconstruct(
    int taxpayer_id,
    const std::vector<data::Account>& accounts,
    const std::vector<data::Transaction>& transactions,
    std::vector<data::CorporateActionEvent> corporate_actions) const
{
    ReconstructionResult result;

    std::set<int> taxable;
    for (const auto& a : accounts) {
        if (a.taxpayer_id == taxpayer_id && a.is_taxable())
            taxable.insert(a.id);
    }
    result.accounts_included.assign(taxable.begin(), taxable.end());

    if (taxable.empty()) {
        result.warnings.push_back("No taxable accounts for taxpayer; no lots built.");
        return result;
    }

    std::vector<data::Transaction> txns;
    for (const auto& t : transactions) {
        if (taxable.count(t.account_id) && is_replayed(t.type) && !t.normalized_ticker().empty())
            txns.push_back(t);
    }
    std::stable_sort(txns.begin(), txns.end(), data::ledger_order);
    result.txns_scanned = static_cast<int>(txns.size());

    corporate_actions.erase(
        std::remove_if(corporate_actions.begin(), corporate_actions.end(),
                       [taxpayer_id](const data::CorporateActionEvent& e) { return e.taxpayer_id != taxpayer_id; }),
        corporate_actions.end());
    for (auto& ev : corporate_actions) {
        ev.security_id = to_upper(ev.security_id);
        ev.action_type = to_upper(ev.action_type);
        ev.applied = false;
        ev.apply_notes.clear();
    }
    std::stable_sort(corporate_actions.begin(), corporate_actions.end(),
                     [](const data::CorporateActionEvent& a, const data::CorporateActionEvent& b) {
                         if (a.action_date != b.action_date)
                             return a.action_date < b.action_date;
                         return a.id < b.id;
                     });

    Replay replay(taxpayer_id, result);
    size_t next_action = 0;

    for (const auto& t : txns) {
        while (next_action < corporate_actions.size() &&
               corporate_actions[next_action].action_date <= t.date) {
            replay.apply_corporate_action(corporate_actions[next_action]);
            ++next_action;
        }

        const std::string ticker = t.normalized_ticker();
        switch (t.type) {
            case data::TransactionType::BUY:
                replay.buy(t, ticker);
                break;
            case data::TransactionType::TRANSFER:
                replay.transfer_in(t, ticker);
                break;
            case data::TransactionType::SELL:
                replay.sell(t, ticker);
                break;
            default:
                break;
        }
    }

    // Actions dated after the last trade still apply to the lots left open.
    for (; next_action < corporate_actions.size(); ++next_action)
        replay.apply_corporate_action(corporate_actions[next_action]);

    result.corporate_actions = std::move(corporate_actions);
    return result;
}

} // namespace lots
} // namespace perfbook
