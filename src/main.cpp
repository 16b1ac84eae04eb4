/**
 * @file main.cpp
 * @brief Main entry point for perfbook
 *
 * Command-line application that loads configuration and normalized ledger
 * files, rebuilds tax lots for a taxpayer, and computes a period
 * performance report.
 */

#include "perfbook/analytics/performance_report.hpp"
#include "perfbook/data/data_loader.hpp"
#include "perfbook/data/sources.hpp"
#include "perfbook/lots/lot_rebuild.hpp"
#include "perfbook/lots/lot_store.hpp"
#include "perfbook/lots/realized_pnl.hpp"
#include "perfbook/lots/wash_sale.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace perfbook;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "perfbook v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --output PATH         Path to output directory (default: results/)\n"
              << "  --rebuild             Rebuild tax lots for the configured taxpayer\n"
              << "  --report              Compute the performance report\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nWith neither --rebuild nor --report, both run.\n"
              << "\nExample:\n"
              << "  " << program_name << " --config data/config/perfbook.json --verbose\n"
              << "  " << program_name << " --config data/config/perfbook.json --report\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       perfbook v1.0.0                                          \n"
              << "       Tax Lots and Portfolio Performance                       \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string output_dir = "results";
    bool rebuild = false;
    bool report = false;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_dir = argv[++i];
            }
            else if (arg == "--rebuild")
            {
                args.rebuild = true;
            }
            else if (arg == "--report")
            {
                args.report = true;
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        if (!args.rebuild && !args.report)
        {
            args.rebuild = true;
            args.report = true;
        }
        return args;
    }

    bool is_valid() const
    {
        return !show_help && !config_path.empty();
    }
};

/**
 * @brief Print realized P&L per ticker, straight from the ledger
 */
void print_realized_pnl(const std::vector<data::Transaction> &transactions)
{
    std::set<std::string> symbols;
    for (const auto &txn : transactions)
    {
        const std::string t = txn.normalized_ticker();
        if (!t.empty() && (txn.type == data::TransactionType::BUY || txn.type == data::TransactionType::SELL))
        {
            symbols.insert(t);
        }
    }

    std::cout << "\n  Realized P&L (FIFO, ledger only):\n";
    for (const auto &symbol : symbols)
    {
        const auto result = lots::fifo_realized_pnl(transactions, symbol);
        if (result.matches.empty())
        {
            continue;
        }
        std::cout << "  - " << symbol << ": " << result.matches.size() << " sale(s), P&L "
                  << result.total_pnl();
        if (result.carry_in_count() > 0)
        {
            std::cout << " (" << result.carry_in_count() << " with unknown basis)";
        }
        std::cout << "\n";
        for (const auto &w : result.warnings)
        {
            std::cout << "    ! " << w << "\n";
        }
    }
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/4] Loading configuration..." << std::endl;

        auto config = DataLoader::load_config(args.config_path);
        spdlog::set_level(args.verbose ? spdlog::level::debug : spdlog::level::from_str(config.log_level));

        if (args.verbose)
        {
            std::cout << "  - Scope: " << config.report.scope << "\n";
            std::cout << "  - Period: " << config.report.start_date
                      << " to " << config.report.end_date
                      << " (" << config.report.frequency << ")\n";
            std::cout << "  - Benchmark: " << config.report.benchmark_symbol << "\n";
            std::cout << "  - Taxpayer: " << config.rebuild.taxpayer_id << "\n";
        }

        // ====================================================================
        // 2. Load Ledger Inputs
        // ====================================================================
        std::cout << "[2/4] Loading ledger inputs..." << std::endl;

        const auto accounts = DataLoader::load_accounts(config.inputs.accounts);
        data::InMemoryTransactionSource transactions(DataLoader::load_transactions(config.inputs.transactions));

        data::InMemorySnapshotSource snapshots;
        if (!config.inputs.snapshots.empty())
        {
            snapshots = data::InMemorySnapshotSource(DataLoader::load_snapshots(config.inputs.snapshots));
        }

        std::unique_ptr<data::InMemoryCashBalanceSource> cash_balances;
        if (!config.inputs.cash_balances.empty())
        {
            cash_balances = std::make_unique<data::InMemoryCashBalanceSource>(
                DataLoader::load_cash_balances(config.inputs.cash_balances));
        }

        data::InMemoryCorporateActionSource corporate_actions;
        if (!config.inputs.corporate_actions.empty())
        {
            corporate_actions = data::InMemoryCorporateActionSource(
                DataLoader::load_corporate_actions(config.inputs.corporate_actions));
        }

        lots::SecurityGroups groups;
        if (!config.inputs.security_groups.empty())
        {
            groups = lots::SecurityGroups(DataLoader::load_security_groups(config.inputs.security_groups));
        }

        std::cout << "  - Loaded " << accounts.size() << " accounts, "
                  << transactions.size() << " transactions, "
                  << corporate_actions.events().size() << " corporate actions" << std::endl;

        std::filesystem::create_directories(args.output_dir);

        // ====================================================================
        // 3. Tax Lot Rebuild
        // ====================================================================
        if (args.rebuild)
        {
            std::cout << "[3/4] Rebuilding tax lots..." << std::endl;

            lots::WashSaleConfig wash_config;
            wash_config.window_days = config.rebuild.wash_window_days;
            wash_config.include_tax_advantaged = config.rebuild.wash_include_tax_advantaged;

            lots::LotStore store;
            lots::LotRebuilder rebuilder(store, transactions, &corporate_actions,
                                         lots::WashSaleEngine(wash_config, groups));
            const auto summary = rebuilder.rebuild(config.rebuild.taxpayer_id, accounts);
            std::cout << summary.summary();

            if (auto book = store.book(config.rebuild.taxpayer_id))
            {
                const std::string lots_file = args.output_dir + "/tax_lots.csv";
                const std::string disposals_file = args.output_dir + "/lot_disposals.csv";
                book->export_lots_csv(lots_file);
                book->export_disposals_csv(disposals_file);
                std::cout << "\n  Lots exported to: " << lots_file << "\n";
                std::cout << "  Disposals exported to: " << disposals_file << "\n";
            }

            if (args.verbose)
            {
                std::vector<int> account_ids;
                for (const auto &account : accounts)
                {
                    account_ids.push_back(account.id);
                }
                print_realized_pnl(transactions.list(account_ids, data::DateRange{}));
            }
        }
        else
        {
            std::cout << "[3/4] Skipping tax lot rebuild (use --rebuild to enable)\n";
        }

        // ====================================================================
        // 4. Performance Report
        // ====================================================================
        if (args.report)
        {
            std::cout << "\n[4/4] Computing performance report..." << std::endl;

            data::FallbackBenchmarkSource benchmark;
            if (!config.inputs.benchmark_dir.empty())
            {
                benchmark.add_provider(std::make_shared<data::CsvBenchmarkSource>(config.inputs.benchmark_dir));
            }

            analytics::PerformanceReportBuilder builder(accounts, transactions, snapshots,
                                                        cash_balances.get(), &benchmark);
            const auto report = builder.build(analytics::ReportRequest::from_config(config.report));

            std::cout << "\n" << report.summary();

            const std::string csv_file = args.output_dir + "/performance.csv";
            const std::string json_file = args.output_dir + "/performance.json";
            report.export_csv(csv_file);
            std::ofstream json_out(json_file);
            if (!json_out.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + json_file);
            }
            json_out << report.to_json().dump(2) << "\n";

            std::cout << "\n  Report exported to: " << csv_file << "\n";
            std::cout << "  Report JSON written to: " << json_file << "\n";
        }
        else
        {
            std::cout << "\n[4/4] Skipping performance report (use --report to enable)\n";
        }

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Completed successfully in " << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    auto args = CommandLineArgs::parse(argc, argv);

    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    print_banner();

    return run(args);
}
