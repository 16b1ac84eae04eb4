#pragma once

#include "perfbook/data/transaction.hpp"
#include "perfbook/lots/tax_lot.hpp"

#include <string>
#include <vector>

namespace perfbook {
namespace lots {

struct ReconstructionResult {
    LotBook book;
    std::vector<data::CorporateActionEvent> corporate_actions;  ///< with applied flag and notes set
    std::vector<int> accounts_included;
    int txns_scanned = 0;
    int lots_created = 0;
    int disposals_created = 0;
    std::vector<std::string> warnings;
};

/**
 * @class LotReconstructionEngine
 * @brief Replays a taxpayer's ledger into FIFO tax lots and disposals.
 *
 * Only taxable accounts of the taxpayer take part. BUY, SELL, TRANSFER and
 * OTHER transactions with a ticker are replayed in (date, id) order; before
 * each one, corporate actions dated on or before it are applied, and the
 * rest are applied after the last one. Every replay starts from an empty
 * book, so running it twice on the same input yields the same result.
 *
 * Business-data problems never throw. A missing quantity skips the
 * transaction, a sale without enough lots is booked against a per
 * (account, ticker) unknown-basis lot, and each case adds a warning.
 */
class LotReconstructionEngine {
public:
    LotReconstructionEngine() = default;
    ~LotReconstructionEngine() = default;

    ReconstructionResult reconstruct(int taxpayer_id,
                                     const std::vector<data::Account>& accounts,
                                     const std::vector<data::Transaction>& transactions,
                                     std::vector<data::CorporateActionEvent> corporate_actions) const;
};

} // namespace lots
} // namespace perfbook
