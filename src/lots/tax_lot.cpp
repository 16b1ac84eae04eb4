/**
 * @file tax_lot.cpp
 * @brief LotBook arena and lot record helpers
 */

#include "perfbook/lots/tax_lot.hpp"
#include "perfbook/data/date_utils.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>

namespace perfbook {
namespace lots {

std::string to_string(Term term)
{
    switch (term) {
        case Term::SHORT_TERM: return "ST";
        case Term::LONG_TERM: return "LT";
        case Term::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::string to_string(LotSource source)
{
    switch (source) {
        case LotSource::RECONSTRUCTED: return "RECONSTRUCTED";
    }
    return "RECONSTRUCTED";
}

std::string to_string(WashStatus status)
{
    return status == WashStatus::APPLIED ? "APPLIED" : "FLAGGED";
}

Term term_for_holding(const std::string& acquired_date, const std::string& sale_date)
{
    return data::days_between(acquired_date, sale_date) >= LONG_TERM_DAYS ? Term::LONG_TERM
                                                                         : Term::SHORT_TERM;
}

// ---------------------------------------------------------------------------
// LotBook
// ---------------------------------------------------------------------------

TaxLot& LotBook::add_lot(TaxLot lot)
{
    lot.id = static_cast<int>(lots_.size()) + 1;
    lots_.push_back(std::move(lot));
    return lots_.back();
}

LotDisposal& LotBook::add_disposal(LotDisposal disposal)
{
    disposal.id = static_cast<int>(disposals_.size()) + 1;
    disposals_.push_back(std::move(disposal));
    return disposals_.back();
}

WashSaleAdjustment& LotBook::add_adjustment(WashSaleAdjustment adjustment)
{
    adjustment.id = static_cast<int>(adjustments_.size()) + 1;
    adjustments_.push_back(std::move(adjustment));
    return adjustments_.back();
}

TaxLot* LotBook::find_lot(int lot_id)
{
    if (lot_id < 1 || lot_id > static_cast<int>(lots_.size()))
        return nullptr;
    return &lots_[lot_id - 1];
}

const TaxLot* LotBook::find_lot(int lot_id) const
{
    if (lot_id < 1 || lot_id > static_cast<int>(lots_.size()))
        return nullptr;
    return &lots_[lot_id - 1];
}

const TaxLot* LotBook::lot_from_txn(int txn_id) const
{
    for (const auto& lot : lots_) {
        if (lot.created_from_txn_id && *lot.created_from_txn_id == txn_id)
            return &lot;
    }
    return nullptr;
}

std::vector<const TaxLot*> LotBook::open_lots(int account_id, const std::string& security_id) const
{
    std::vector<const TaxLot*> out;
    for (const auto& lot : lots_) {
        if (lot.account_id == account_id && lot.security_id == security_id && lot.is_open())
            out.push_back(&lot);
    }
    return out;
}

std::vector<LotDisposal> LotBook::disposals_for_sale(int sell_txn_id) const
{
    std::vector<LotDisposal> out;
    for (const auto& d : disposals_) {
        if (d.sell_txn_id == sell_txn_id)
            out.push_back(d);
    }
    return out;
}

std::vector<WashSaleAdjustment> LotBook::adjustments_for_sale(int sell_txn_id) const
{
    std::vector<WashSaleAdjustment> out;
    for (const auto& a : adjustments_) {
        if (a.loss_sale_txn_id == sell_txn_id)
            out.push_back(a);
    }
    return out;
}

int LotBook::num_lots() const
{
    int n = 0;
    for (const auto& lot : lots_) {
        if (!lot.basis_unknown)
            ++n;
    }
    return n;
}

double LotBook::total_realized_gain() const
{
    double total = 0.0;
    for (const auto& d : disposals_) {
        if (d.realized_gain)
            total += *d.realized_gain;
    }
    return total;
}

namespace {

void open_for_write(std::ofstream& out, const std::string& filepath)
{
    std::filesystem::path p(filepath);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }
    out.open(filepath);
    if (!out.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + filepath);
    }
    out << std::fixed << std::setprecision(8);
}

void write_optional(std::ofstream& out, const std::optional<double>& v)
{
    if (v)
        out << *v;
}

} // namespace

void LotBook::export_lots_csv(const std::string& filepath) const
{
    std::ofstream out;
    open_for_write(out, filepath);

    out << "lot_id,account_id,security_id,acquired_date,original_quantity,quantity_open,"
           "basis_open,basis_unknown,created_from_txn_id,wash_basis_added\n";
    for (const auto& lot : lots_) {
        out << lot.id << ',' << lot.account_id << ',' << lot.security_id << ','
            << lot.acquired_date << ',' << lot.original_quantity << ',' << lot.quantity_open << ',';
        write_optional(out, lot.basis_open);
        out << ',' << (lot.basis_unknown ? 1 : 0) << ',';
        if (lot.created_from_txn_id)
            out << *lot.created_from_txn_id;
        out << ',' << lot.wash_basis_added << '\n';
    }
}

void LotBook::export_disposals_csv(const std::string& filepath) const
{
    std::ofstream out;
    open_for_write(out, filepath);

    out << "disposal_id,sell_txn_id,tax_lot_id,account_id,security_id,sale_date,quantity_sold,"
           "proceeds_allocated,basis_allocated,realized_gain,term\n";
    for (const auto& d : disposals_) {
        out << d.id << ',' << d.sell_txn_id << ',' << d.tax_lot_id << ',' << d.account_id << ','
            << d.security_id << ',' << d.sale_date << ',' << d.quantity_sold << ','
            << d.proceeds_allocated << ',';
        write_optional(out, d.basis_allocated);
        out << ',';
        write_optional(out, d.realized_gain);
        out << ',' << to_string(d.term) << '\n';
    }
}

} // namespace lots
} // namespace perfbook
