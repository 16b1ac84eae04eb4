#include "perfbook/lots/realized_pnl.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <sstream>

namespace perfbook {
namespace lots {

namespace {

struct OpenLot {
    std::string open_date;
    double quantity;
    double unit_cost;
};

constexpr double MATCH_EPSILON = 1e-12;

} // namespace

double RealizedPnlResult::total_pnl() const
{
    double total = 0.0;
    for (const auto& m : matches) {
        if (m.pnl)
            total += *m.pnl;
    }
    return total;
}

int RealizedPnlResult::carry_in_count() const
{
    return static_cast<int>(std::count_if(matches.begin(), matches.end(),
                                          [](const RealizedMatch& m) { return m.carry_in_basis_unknown; }));
}

RealizedPnlResult fifo_realized_pnl(const std::vector<data::Transaction>& transactions,
                                    const std::string& symbol)
{
    RealizedPnlResult result;

    std::vector<data::Transaction> txns;
    for (const auto& t : transactions) {
        if (t.normalized_ticker() == symbol &&
            (t.type == data::TransactionType::BUY || t.type == data::TransactionType::SELL))
            txns.push_back(t);
    }
    std::stable_sort(txns.begin(), txns.end(), data::ledger_order);

    std::deque<OpenLot> lots;
    int carry_in_sells = 0;
    double carry_in_shares = 0.0;
    std::string carry_in_first;
    std::string carry_in_last;

    for (const auto& t : txns) {
        const double qty = std::abs(t.quantity.value_or(0.0));
        if (qty == 0.0)
            continue;

        double price = std::abs(t.meta_number("price").value_or(0.0));
        if (price == 0.0)
            price = std::abs(t.amount) / qty;
        if (price == 0.0)
            continue;

        if (t.type == data::TransactionType::BUY) {
            lots.push_back({t.date, qty, price});
            continue;
        }

        const double proceeds = price * qty;
        double remaining = qty;
        double cost = 0.0;
        while (remaining > MATCH_EPSILON && !lots.empty()) {
            OpenLot& lot = lots.front();
            const double take = std::min(lot.quantity, remaining);
            cost += take * lot.unit_cost;
            lot.quantity -= take;
            remaining -= take;
            if (lot.quantity <= MATCH_EPSILON)
                lots.pop_front();
        }

        RealizedMatch m;
        m.symbol = symbol;
        m.sell_date = t.date;
        m.quantity = qty;
        m.proceeds = proceeds;

        if (remaining > MATCH_EPSILON) {
            ++carry_in_sells;
            carry_in_shares += remaining;
            if (carry_in_first.empty() || t.date < carry_in_first)
                carry_in_first = t.date;
            if (carry_in_last.empty() || t.date > carry_in_last)
                carry_in_last = t.date;
            m.carry_in_basis_unknown = true;
        } else {
            m.cost = cost;
            m.pnl = proceeds - cost;
        }
        result.matches.push_back(m);
    }

    if (carry_in_sells > 0) {
        std::ostringstream os;
        os << symbol << ": " << carry_in_sells << " SELL(s) exceed available lots by total "
           << carry_in_shares << " shares (carry-in basis unknown) (" << carry_in_first
           << " to " << carry_in_last << ").";
        result.warnings.push_back(os.str());
    }
    return result;
}

} // namespace lots
} // namespace perfbook
