/**
 * @file lot_rebuild.cpp
 * @brief Transactional replace-all rebuild of a taxpayer's lot book
 */

#include "perfbook/lots/lot_rebuild.hpp"

#include <spdlog/spdlog.h>

#include <mutex>
#include <set>
#include <sstream>

namespace perfbook {
namespace lots {

namespace {

constexpr const char* LATEST_DATE = "9999-12-31";

} // namespace

nlohmann::json RebuildSummary::to_json() const
{
    nlohmann::json j;
    j["taxpayer_id"] = taxpayer_id;
    j["accounts_included"] = accounts_included;
    j["txns_scanned"] = txns_scanned;
    j["lots_created"] = lots_created;
    j["disposals_created"] = disposals_created;
    j["wash_adjustments_created"] = wash_adjustments_created;
    j["corporate_actions_applied"] = corporate_actions_applied;
    j["warnings"] = warnings;
    return j;
}

std::string RebuildSummary::summary() const
{
    std::ostringstream os;
    os << "Lot Rebuild Summary\n";
    os << "-------------------\n";
    os << "Taxpayer:              " << taxpayer_id << "\n";
    os << "Accounts included:     " << accounts_included.size() << "\n";
    os << "Transactions scanned:  " << txns_scanned << "\n";
    os << "Lots created:          " << lots_created << "\n";
    os << "Disposals created:     " << disposals_created << "\n";
    os << "Wash adjustments:      " << wash_adjustments_created << "\n";
    os << "Corporate actions:     " << corporate_actions_applied << " newly applied\n";
    os << "Warnings:              " << warnings.size() << "\n";
    for (const auto& w : warnings)
        os << "  - " << w << "\n";
    return os.str();
}

LotRebuilder::LotRebuilder(LotStore& store,
                           const data::TransactionSource& transactions,
                           data::CorporateActionSource* corporate_actions,
                           WashSaleEngine wash_engine)
    : store_(store),
      transactions_(transactions),
      corporate_actions_(corporate_actions),
      wash_engine_(std::move(wash_engine)) {}

RebuildSummary LotRebuilder::rebuild(int taxpayer_id, const std::vector<data::Account>& accounts)
{
    std::lock_guard<std::mutex> guard(store_.rebuild_mutex(taxpayer_id));
    spdlog::info("Rebuilding tax lots for taxpayer {}", taxpayer_id);

    std::vector<data::Account> owned;
    std::vector<int> account_ids;
    for (const auto& a : accounts) {
        if (a.taxpayer_id == taxpayer_id) {
            owned.push_back(a);
            account_ids.push_back(a.id);
        }
    }

    // Tax-advantaged accounts are loaded too: they can hold wash-sale replacements.
    const auto txns = transactions_.list(account_ids, data::DateRange{});

    std::vector<data::CorporateActionEvent> events;
    std::set<int> pending_ids;
    if (corporate_actions_) {
        events = corporate_actions_->list(taxpayer_id);
        for (const auto& e : corporate_actions_->pending(taxpayer_id, LATEST_DATE))
            pending_ids.insert(e.id);
    }

    ReconstructionResult rebuilt = reconstruction_.reconstruct(taxpayer_id, owned, txns, std::move(events));
    WashSaleResult wash = wash_engine_.apply(taxpayer_id, rebuilt.book, owned, txns);

    RebuildSummary summary;
    summary.taxpayer_id = taxpayer_id;
    summary.accounts_included = rebuilt.accounts_included;
    summary.txns_scanned = rebuilt.txns_scanned;
    summary.lots_created = rebuilt.lots_created;
    summary.disposals_created = rebuilt.disposals_created;
    summary.wash_adjustments_created = wash.adjustments_created;
    summary.warnings = rebuilt.warnings;
    summary.warnings.insert(summary.warnings.end(), wash.warnings.begin(), wash.warnings.end());
    for (const auto& e : rebuilt.corporate_actions) {
        if (e.applied && pending_ids.count(e.id))
            ++summary.corporate_actions_applied;
    }

    // The source is written first: if it throws, the stored book is untouched.
    if (corporate_actions_ && !rebuilt.corporate_actions.empty())
        corporate_actions_->update(rebuilt.corporate_actions);
    store_.replace_all(taxpayer_id, std::move(rebuilt.book));

    spdlog::info("Rebuilt taxpayer {}: {} lots, {} disposals, {} wash adjustments, {} warnings",
                 taxpayer_id, summary.lots_created, summary.disposals_created,
                 summary.wash_adjustments_created, summary.warnings.size());
    return summary;
}

} // namespace lots
} // namespace perfbook
