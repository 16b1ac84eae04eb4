/**
 * @file data_loader.hpp
 * @brief Configuration and normalized-input loading
 *
 * Provides functionality to load the engine configuration from JSON and the
 * normalized ledger inputs (accounts, transactions, snapshots, cash
 * balances, corporate actions, price series) from CSV and JSON files.
 */

#ifndef PERFBOOK_DATA_LOADER_HPP
#define PERFBOOK_DATA_LOADER_HPP

#include "perfbook/data/snapshot.hpp"
#include "perfbook/data/transaction.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace perfbook {

/**
 * @struct ReportConfig
 * @brief Parameters of a performance report request
 */
struct ReportConfig {
    std::string scope = "all";                 ///< all, taxable, tax_advantaged, portfolio:<id>, taxpayer:<id>
    std::string start_date;                    ///< Period start (YYYY-MM-DD)
    std::string end_date;                      ///< Period end (YYYY-MM-DD)
    std::string frequency = "month_end";       ///< daily or month_end
    std::string benchmark_symbol = "VOO";      ///< Benchmark ticker
    std::string benchmark_label;               ///< Display label (defaults to the symbol)
    int baseline_grace_days = 14;              ///< Anchor search tolerance in days
    double risk_free_rate_annual = 0.0;        ///< Annual risk-free rate for Sharpe
    bool include_withholding_as_flow = false;  ///< Treat withholding as investor flow
    bool include_combined = true;              ///< Emit the combined portfolio row

    static ReportConfig from_json(const nlohmann::json& j);
};

/**
 * @struct RebuildConfig
 * @brief Parameters of a tax-lot rebuild
 */
struct RebuildConfig {
    int taxpayer_id = 0;                       ///< Taxpayer whose lots are rebuilt
    bool wash_include_tax_advantaged = false;  ///< Scan IRA-style accounts for replacements
    int wash_window_days = 30;                 ///< Days either side of a loss sale

    static RebuildConfig from_json(const nlohmann::json& j);
};

/**
 * @struct InputConfig
 * @brief Locations of the normalized input files
 */
struct InputConfig {
    std::string accounts;                      ///< JSON account list
    std::string transactions;                  ///< Transaction CSV
    std::string snapshots;                     ///< JSON holdings snapshots
    std::string cash_balances;                 ///< Cash balance CSV (optional)
    std::string corporate_actions;             ///< Corporate action CSV (optional)
    std::string benchmark_dir;                 ///< Directory of <SYMBOL>.csv price files
    std::string security_groups;               ///< JSON substitute-security groups (optional)

    static InputConfig from_json(const nlohmann::json& j);
};

/**
 * @struct EngineConfig
 * @brief Complete engine configuration
 */
struct EngineConfig {
    ReportConfig report;
    RebuildConfig rebuild;
    InputConfig inputs;
    std::string log_level = "info";

    /**
     * @brief Load complete configuration from JSON file
     */
    static EngineConfig load_from_file(const std::string& config_path);
};

/**
 * @class DataLoader
 * @brief Loads configuration and normalized ledger data from files
 *
 * All loaders throw std::runtime_error when a file cannot be opened or a
 * required column is missing. Individual malformed rows are skipped.
 */
class DataLoader {
public:
    DataLoader() = default;
    ~DataLoader() = default;

    // ========================================================================
    // Configuration Loading
    // ========================================================================

    /**
     * @brief Load JSON file
     * @param filepath Path to JSON file
     * @return JSON object
     * @throws std::runtime_error if file cannot be loaded
     */
    static nlohmann::json load_json(const std::string& filepath);

    /**
     * @brief Load complete engine configuration
     * @param config_path Path to config JSON file
     * @return EngineConfig struct
     */
    static EngineConfig load_config(const std::string& config_path);

    // ========================================================================
    // Ledger Inputs
    // ========================================================================

    /**
     * @brief Load accounts from a JSON array
     *
     * Expected format:
     * [{"id": 1, "taxpayer_id": 1, "portfolio_id": 1, "name": "Brokerage", "type": "taxable"}]
     */
    static std::vector<data::Account> load_accounts(const std::string& filepath);

    /**
     * @brief Load transactions from CSV
     *
     * Required columns: id, account_id, date, type, amount.
     * Optional columns: ticker, quantity. Any other column is kept as
     * transaction metadata under its header name.
     */
    static std::vector<data::Transaction> load_transactions(const std::string& filepath);

    /**
     * @brief Load holdings snapshots from a JSON array
     *
     * Expected format:
     * [{"account_id": 1, "as_of": "2025-01-31T21:00:00Z",
     *   "items": [{"symbol": "VOO", "market_value": 5000.0},
     *             {"symbol": "CASH:USD", "market_value": 120.0}]}]
     */
    static std::vector<data::HoldingsSnapshot> load_snapshots(const std::string& filepath);

    /**
     * @brief Load cash balances from CSV (account_id,date,balance)
     */
    static std::vector<data::CashBalance> load_cash_balances(const std::string& filepath);

    /**
     * @brief Load corporate actions from CSV
     *
     * Columns: id, taxpayer_id, security_id, account_id, action_date,
     * action_type, ratio. Empty account_id or ratio cells mean "not set".
     */
    static std::vector<data::CorporateActionEvent> load_corporate_actions(const std::string& filepath);

    /**
     * @brief Load a price series from CSV
     *
     * Needs a date column and one of adj_close, close, value or price.
     * Non-positive prices are dropped and duplicated dates keep the last row.
     */
    static data::PriceSeries load_price_series(const std::string& filepath);

    /**
     * @brief Load substitute-security groups from JSON
     *
     * Expected format: {"sp500": ["VOO", "IVV", "SPY"]}
     */
    static std::map<std::string, std::vector<std::string>> load_security_groups(const std::string& filepath);

private:
    static std::vector<std::string> parse_csv_line(const std::string& line);
    static std::map<std::string, size_t> index_header(const std::string& line);
    static bool is_valid_date_format(const std::string& date);
    static std::string trim(const std::string& str);
    static std::string to_lower(const std::string& str);
    static double safe_stod(const std::string& str);
    static std::string field(const std::vector<std::string>& fields,
                             const std::map<std::string, size_t>& header,
                             const std::string& name);
};

} // namespace perfbook

#endif // PERFBOOK_DATA_LOADER_HPP
