#pragma once

#include "perfbook/data/transaction.hpp"

#include <optional>
#include <string>
#include <vector>

namespace perfbook {
namespace lots {

/**
 * Realized result of one SELL matched FIFO against prior BUYs of a symbol.
 * cost and pnl are empty when the sale exceeded the shares on record.
 */
struct RealizedMatch {
    std::string symbol;
    std::string sell_date;
    double quantity = 0.0;
    double proceeds = 0.0;
    std::optional<double> cost;
    std::optional<double> pnl;
    bool carry_in_basis_unknown = false;
};

struct RealizedPnlResult {
    std::vector<RealizedMatch> matches;
    std::vector<std::string> warnings;

    double total_pnl() const;       ///< known P&L only
    int carry_in_count() const;
};

/**
 * @brief FIFO realized P&L for a single symbol across the given transactions.
 *
 * Unit prices come from the "price" metadata when present, else from
 * |amount| / |quantity|. Transactions without a usable price are skipped.
 * A sale larger than the open lots is reported with unknown cost and pnl;
 * one summary warning names the count, share shortfall and date span.
 */
RealizedPnlResult fifo_realized_pnl(const std::vector<data::Transaction>& transactions,
                                    const std::string& symbol);

} // namespace lots
} // namespace perfbook
