#pragma once

#include "perfbook/data/sources.hpp"
#include "perfbook/lots/lot_reconstruction.hpp"
#include "perfbook/lots/lot_store.hpp"
#include "perfbook/lots/wash_sale.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace perfbook {
namespace lots {

struct RebuildSummary {
    int taxpayer_id = 0;
    std::vector<int> accounts_included;
    int txns_scanned = 0;
    int lots_created = 0;
    int disposals_created = 0;
    int wash_adjustments_created = 0;
    int corporate_actions_applied = 0;  ///< events pending before this rebuild and applied by it
    std::vector<std::string> warnings;

    nlohmann::json to_json() const;
    std::string summary() const;
};

/**
 * @class LotRebuilder
 * @brief Rebuilds one taxpayer's lot book end to end.
 *
 * Reconstruction and wash-sale deferral run against a fresh LotBook which
 * then replaces the stored book in one swap. Corporate-action outcomes are
 * written back before the swap, so a source that fails to record them leaves
 * the previous book in place. Rebuilds of the same taxpayer
 * are serialized through the store's per-taxpayer mutex.
 */
class LotRebuilder {
public:
    LotRebuilder(LotStore& store,
                 const data::TransactionSource& transactions,
                 data::CorporateActionSource* corporate_actions = nullptr,
                 WashSaleEngine wash_engine = WashSaleEngine());

    RebuildSummary rebuild(int taxpayer_id, const std::vector<data::Account>& accounts);

private:
    LotStore& store_;
    const data::TransactionSource& transactions_;
    data::CorporateActionSource* corporate_actions_;
    LotReconstructionEngine reconstruction_;
    WashSaleEngine wash_engine_;
};

} // namespace lots
} // namespace perfbook
