#pragma once

#include "perfbook/data/transaction.hpp"
#include "perfbook/lots/tax_lot.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace perfbook {
namespace lots {

struct WashSaleConfig {
    int window_days = 30;                 ///< days before and after the loss sale
    bool include_tax_advantaged = false;  ///< look for replacements in IRA-style accounts
    double loss_threshold = 0.01;         ///< losses smaller than this are ignored
};

/**
 * @class SecurityGroups
 * @brief Substitute-security groups ("substantially identical" tickers).
 */
class SecurityGroups {
public:
    SecurityGroups() = default;
    explicit SecurityGroups(const std::map<std::string, std::vector<std::string>>& groups);

    void add(const std::string& group, const std::string& ticker);

    /// The ticker itself plus every member of its group, upper-cased.
    std::set<std::string> equivalents(const std::string& ticker) const;

private:
    std::map<std::string, std::string> group_by_ticker_;
    std::map<std::string, std::set<std::string>> members_;
};

struct WashSaleResult {
    int adjustments_created = 0;
    std::vector<std::string> warnings;
};

/**
 * @class WashSaleEngine
 * @brief Defers realized losses into replacement purchases made within the wash window.
 *
 * For each sale whose summed known realized gain is below -loss_threshold,
 * BUY transactions of the same or an equivalent ticker dated within
 * [sale - window, sale + window] absorb the loss chronologically, each in
 * proportion to the shares it replaces. Shares of a purchase that the sale
 * itself disposed of are not replacements; the rest of that purchase is.
 *
 * A replacement in a taxable account with a reconstructed lot raises that
 * lot's basis (APPLIED). A replacement in a tax-advantaged account, or one
 * without a lot, is recorded FLAGGED with no basis change.
 */
class WashSaleEngine {
public:
    explicit WashSaleEngine(WashSaleConfig config = WashSaleConfig(),
                            SecurityGroups groups = SecurityGroups());
    ~WashSaleEngine() = default;

    WashSaleResult apply(int taxpayer_id,
                         LotBook& book,
                         const std::vector<data::Account>& accounts,
                         const std::vector<data::Transaction>& transactions) const;

    const WashSaleConfig& config() const { return config_; }

private:
    WashSaleConfig config_;
    SecurityGroups groups_;
};

} // namespace lots
} // namespace perfbook
