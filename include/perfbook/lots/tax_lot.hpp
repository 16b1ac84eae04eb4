#pragma once

#include <optional>
#include <string>
#include <vector>

namespace perfbook {
namespace lots {

enum class Term {
    SHORT_TERM,
    LONG_TERM,
    UNKNOWN
};

enum class LotSource {
    RECONSTRUCTED
};

enum class WashStatus {
    APPLIED,
    FLAGGED
};

std::string to_string(Term term);
std::string to_string(LotSource source);
std::string to_string(WashStatus status);

/// Holding period of at least this many days is long term.
constexpr int LONG_TERM_DAYS = 365;

/// Quantities at or below this are treated as zero.
constexpr double QTY_EPSILON = 1e-9;

/**
 * @brief Term of a disposal given acquisition and sale dates (ISO strings).
 */
Term term_for_holding(const std::string& acquired_date, const std::string& sale_date);

/**
 * One tax lot. Lots live in a LotBook arena and are addressed by id.
 *
 * quantity_open + quantity_disposed == original_quantity holds at all
 * times; a split scales all three.
 */
struct TaxLot {
    int id = 0;
    int taxpayer_id = 0;
    int account_id = 0;
    std::string security_id;
    std::string acquired_date;
    double original_quantity = 0.0;
    double quantity_open = 0.0;
    double quantity_disposed = 0.0;
    std::optional<double> basis_open;   ///< empty = unknown basis
    LotSource source = LotSource::RECONSTRUCTED;
    std::optional<int> created_from_txn_id;
    bool basis_unknown = false;         ///< sentinel for shares sold without history
    double wash_basis_added = 0.0;
    std::vector<std::string> notes;

    bool is_open() const { return quantity_open > QTY_EPSILON; }
};

/**
 * One (sale, contributing lot) pair.
 */
struct LotDisposal {
    int id = 0;
    int sell_txn_id = 0;
    int tax_lot_id = 0;
    int account_id = 0;
    std::string security_id;
    std::string sale_date;
    double quantity_sold = 0.0;
    double proceeds_allocated = 0.0;
    std::optional<double> basis_allocated;
    std::optional<double> realized_gain;
    Term term = Term::UNKNOWN;
    bool basis_unknown = false;
};

struct WashSaleAdjustment {
    int id = 0;
    int loss_sale_txn_id = 0;
    int replacement_buy_txn_id = 0;
    std::optional<int> replacement_lot_id;
    double deferred_loss = 0.0;
    double basis_increase = 0.0;
    double replacement_shares = 0.0;
    std::string window_start;
    std::string window_end;
    WashStatus status = WashStatus::FLAGGED;
    std::string notes;
};

/**
 * Reconstructed lot ledger of one taxpayer: lots, disposals and wash-sale
 * adjustments, with ids assigned sequentially from 1 in creation order.
 */
class LotBook {
public:
    LotBook() = default;

    TaxLot& add_lot(TaxLot lot);
    LotDisposal& add_disposal(LotDisposal disposal);
    WashSaleAdjustment& add_adjustment(WashSaleAdjustment adjustment);

    TaxLot* find_lot(int lot_id);
    const TaxLot* find_lot(int lot_id) const;
    const TaxLot* lot_from_txn(int txn_id) const;

    const std::vector<TaxLot>& lots() const { return lots_; }
    const std::vector<LotDisposal>& disposals() const { return disposals_; }
    const std::vector<WashSaleAdjustment>& adjustments() const { return adjustments_; }

    std::vector<const TaxLot*> open_lots(int account_id, const std::string& security_id) const;
    std::vector<LotDisposal> disposals_for_sale(int sell_txn_id) const;
    std::vector<WashSaleAdjustment> adjustments_for_sale(int sell_txn_id) const;

    /// Real (non-sentinel) lots only.
    int num_lots() const;
    int num_disposals() const { return static_cast<int>(disposals_.size()); }
    int num_adjustments() const { return static_cast<int>(adjustments_.size()); }

    bool empty() const { return lots_.empty() && disposals_.empty() && adjustments_.empty(); }

    /// Sum of known realized gains; disposals with unknown basis are ignored.
    double total_realized_gain() const;

    void export_lots_csv(const std::string& filepath) const;
    void export_disposals_csv(const std::string& filepath) const;

private:
    std::vector<TaxLot> lots_;
    std::vector<LotDisposal> disposals_;
    std::vector<WashSaleAdjustment> adjustments_;
};

} // namespace lots
} // namespace perfbook
