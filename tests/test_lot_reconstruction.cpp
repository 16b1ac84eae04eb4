#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "perfbook/lots/lot_reconstruction.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace perfbook;
using namespace perfbook::lots;

namespace {

data::Transaction txn(int id, int account, const std::string& date, data::TransactionType type,
                      const std::string& ticker, std::optional<double> qty, double amount)
{
    data::Transaction t;
    t.id = id;
    t.account_id = account;
    t.date = date;
    t.type = type;
    t.ticker = ticker;
    t.quantity = qty;
    t.amount = amount;
    return t;
}

std::vector<data::Account> accounts()
{
    return {
        {1, 7, 1, "Brokerage", data::AccountType::TAXABLE},
        {2, 7, 2, "IRA", data::AccountType::TAX_ADVANTAGED},
    };
}

bool has_warning(const std::vector<std::string>& warnings, const std::string& text)
{
    return std::find(warnings.begin(), warnings.end(), text) != warnings.end();
}

} // namespace

using data::TransactionType;

TEST_CASE("FIFO lot consumption", "[LotReconstruction]") {
    LotReconstructionEngine engine;

    SECTION("Happy path: sale spans two lots") {
        std::vector<data::Transaction> txns = {
            txn(1, 1, "2024-01-02", TransactionType::BUY, "XYZ", 10.0, -100.0),
            txn(2, 1, "2024-02-01", TransactionType::BUY, "XYZ", 10.0, -200.0),
            txn(3, 1, "2024-03-01", TransactionType::SELL, "XYZ", 15.0, 450.0),
        };

        auto result = engine.reconstruct(7, accounts(), txns, {});
        const auto& book = result.book;

        REQUIRE(result.lots_created == 2);
        REQUIRE(result.disposals_created == 2);
        REQUIRE(result.warnings.empty());

        auto disposals = book.disposals_for_sale(3);
        REQUIRE(disposals.size() == 2);
        REQUIRE(disposals[0].quantity_sold == Catch::Approx(10.0));
        REQUIRE(*disposals[0].basis_allocated == Catch::Approx(100.0));
        REQUIRE(disposals[0].proceeds_allocated == Catch::Approx(300.0));
        REQUIRE(disposals[1].quantity_sold == Catch::Approx(5.0));
        REQUIRE(*disposals[1].basis_allocated == Catch::Approx(100.0));
        REQUIRE(disposals[1].proceeds_allocated == Catch::Approx(150.0));
        REQUIRE(disposals[0].term == Term::SHORT_TERM);

        REQUIRE(book.total_realized_gain() == Catch::Approx(250.0));

        const TaxLot* first = book.lot_from_txn(1);
        const TaxLot* second = book.lot_from_txn(2);
        REQUIRE(first != nullptr);
        REQUIRE(second != nullptr);
        REQUIRE_FALSE(first->is_open());
        REQUIRE(first->quantity_disposed == Catch::Approx(10.0));
        REQUIRE(second->quantity_open == Catch::Approx(5.0));
        REQUIRE(*second->basis_open == Catch::Approx(100.0));
        REQUIRE(second->original_quantity == Catch::Approx(10.0));

        auto open = book.open_lots(1, "XYZ");
        REQUIRE(open.size() == 1);
        REQUIRE(open[0]->id == second->id);
    }

    SECTION("Lots held a year or more are long term") {
        std::vector<data::Transaction> txns = {
            txn(1, 1, "2023-01-03", TransactionType::BUY, "XYZ", 10.0, -100.0),
            txn(2, 1, "2024-01-03", TransactionType::SELL, "XYZ", 10.0, 150.0),
        };
        auto result = engine.reconstruct(7, accounts(), txns, {});
        REQUIRE(result.book.disposals().at(0).term == Term::LONG_TERM);
    }

    SECTION("Tickers are normalized and accounts kept apart") {
        std::vector<data::Transaction> txns = {
            txn(1, 1, "2024-01-02", TransactionType::BUY, " xyz ", 10.0, -100.0),
            txn(2, 1, "2024-01-03", TransactionType::SELL, "XYZ", 10.0, 120.0),
        };
        auto result = engine.reconstruct(7, accounts(), txns, {});
        REQUIRE(result.warnings.empty());
        REQUIRE(result.book.total_realized_gain() == Catch::Approx(20.0));
    }
}

TEST_CASE("Missing history and bad quantities", "[LotReconstruction]") {
    LotReconstructionEngine engine;

    SECTION("Sale beyond open lots creates an unknown-basis disposal") {
        std::vector<data::Transaction> txns = {
            txn(1, 1, "2024-01-02", TransactionType::BUY, "XYZ", 5.0, -50.0),
            txn(2, 1, "2024-02-01", TransactionType::SELL, "XYZ", 8.0, 160.0),
        };
        auto result = engine.reconstruct(7, accounts(), txns, {});

        REQUIRE(has_warning(result.warnings, "Insufficient lots for SELL txn_id=2 ticker=XYZ; basis unknown for 3."));
        REQUIRE(result.lots_created == 1);
        REQUIRE(result.book.num_lots() == 1);
        REQUIRE(result.book.lots().size() == 2);

        auto disposals = result.book.disposals_for_sale(2);
        REQUIRE(disposals.size() == 2);
        REQUIRE(disposals[1].basis_unknown);
        REQUIRE_FALSE(disposals[1].basis_allocated.has_value());
        REQUIRE_FALSE(disposals[1].realized_gain.has_value());
        REQUIRE(disposals[1].term == Term::UNKNOWN);
        REQUIRE(disposals[1].quantity_sold == Catch::Approx(3.0));
        REQUIRE(disposals[1].proceeds_allocated == Catch::Approx(60.0));

        const TaxLot* sentinel = result.book.find_lot(disposals[1].tax_lot_id);
        REQUIRE(sentinel->basis_unknown);

        // Known part only
        REQUIRE(result.book.total_realized_gain() == Catch::Approx(50.0));
    }

    SECTION("Missing quantities are skipped with warnings") {
        std::vector<data::Transaction> txns = {
            txn(1, 1, "2024-01-02", TransactionType::BUY, "XYZ", std::nullopt, -50.0),
            txn(2, 1, "2024-01-03", TransactionType::SELL, "XYZ", std::nullopt, 60.0),
        };
        auto result = engine.reconstruct(7, accounts(), txns, {});
        REQUIRE(result.lots_created == 0);
        REQUIRE(result.disposals_created == 0);
        REQUIRE(has_warning(result.warnings, "BUY txn missing qty: txn_id=1"));
        REQUIRE(has_warning(result.warnings, "SELL txn missing qty: txn_id=2"));
    }

    SECTION("Transfer-in uses basis_total metadata") {
        auto in = txn(1, 1, "2024-01-02", TransactionType::TRANSFER, "XYZ", 4.0, 0.0);
        in.metadata["basis_total"] = "320";
        auto result = engine.reconstruct(7, accounts(), {in}, {});

        const TaxLot* lot = result.book.lot_from_txn(1);
        REQUIRE(lot != nullptr);
        REQUIRE(*lot->basis_open == Catch::Approx(320.0));
        REQUIRE_FALSE(lot->notes.empty());
    }

    SECTION("Transfer-in without any basis keeps basis unknown") {
        auto in = txn(1, 1, "2024-01-02", TransactionType::TRANSFER, "XYZ", 4.0, 0.0);
        auto out = txn(2, 1, "2024-03-02", TransactionType::SELL, "XYZ", 4.0, 100.0);
        auto result = engine.reconstruct(7, accounts(), {in, out}, {});

        REQUIRE_FALSE(result.book.lot_from_txn(1)->basis_open.has_value());
        REQUIRE(has_warning(result.warnings, "Basis unknown lot used for SELL txn_id=2 ticker=XYZ."));
        REQUIRE(result.book.disposals().at(0).basis_unknown);
    }
}

TEST_CASE("Account scope", "[LotReconstruction]") {
    LotReconstructionEngine engine;

    SECTION("Tax-advantaged and foreign accounts are ignored") {
        std::vector<data::Account> accts = accounts();
        accts.push_back({3, 8, 3, "Someone else", data::AccountType::TAXABLE});

        std::vector<data::Transaction> txns = {
            txn(1, 1, "2024-01-02", TransactionType::BUY, "XYZ", 1.0, -10.0),
            txn(2, 2, "2024-01-02", TransactionType::BUY, "XYZ", 1.0, -10.0),
            txn(3, 3, "2024-01-02", TransactionType::BUY, "XYZ", 1.0, -10.0),
            txn(4, 1, "2024-01-03", TransactionType::FEE, "XYZ", std::nullopt, -1.0),
        };
        auto result = engine.reconstruct(7, accts, txns, {});
        REQUIRE(result.accounts_included == std::vector<int>{1});
        REQUIRE(result.txns_scanned == 1);
        REQUIRE(result.lots_created == 1);
    }

    SECTION("No taxable accounts") {
        std::vector<data::Account> accts = {{2, 7, 2, "IRA", data::AccountType::TAX_ADVANTAGED}};
        auto result = engine.reconstruct(7, accts, {}, {});
        REQUIRE(result.book.empty());
        REQUIRE(has_warning(result.warnings, "No taxable accounts for taxpayer; no lots built."));
    }
}

TEST_CASE("Corporate actions", "[LotReconstruction]") {
    LotReconstructionEngine engine;

    std::vector<data::Transaction> txns = {
        txn(1, 1, "2024-01-02", TransactionType::BUY, "XYZ", 10.0, -1000.0),
        txn(2, 1, "2024-02-01", TransactionType::SELL, "XYZ", 4.0, 480.0),
        txn(3, 1, "2024-06-03", TransactionType::SELL, "XYZ", 2.0, 130.0),
    };

    auto action = [](int id, const std::string& type, std::optional<double> ratio) {
        data::CorporateActionEvent e;
        e.id = id;
        e.taxpayer_id = 7;
        e.security_id = "xyz";
        e.action_date = "2024-06-01";
        e.action_type = type;
        e.ratio = ratio;
        return e;
    };

    SECTION("Happy path: 2-for-1 split doubles quantities and keeps basis") {
        auto result = engine.reconstruct(7, accounts(), txns, {action(1, "split", 2.0)});

        REQUIRE(result.corporate_actions.size() == 1);
        REQUIRE(result.corporate_actions[0].applied);
        REQUIRE(result.corporate_actions[0].apply_notes.find("1 open lot(s)") != std::string::npos);

        const TaxLot* lot = result.book.lot_from_txn(1);
        REQUIRE(lot->original_quantity == Catch::Approx(20.0));
        // 6 open after the first sale, doubled to 12, then 2 more sold
        REQUIRE(lot->quantity_open == Catch::Approx(10.0));
        REQUIRE(lot->quantity_disposed == Catch::Approx(10.0));
        // 600 open basis before the split; the post-split sale takes 2/12
        REQUIRE(*lot->basis_open == Catch::Approx(500.0));

        auto later = result.book.disposals_for_sale(3);
        REQUIRE(*later.at(0).basis_allocated == Catch::Approx(100.0));
        REQUIRE(*later.at(0).realized_gain == Catch::Approx(30.0));
    }

    SECTION("Reverse split divides quantities") {
        auto result = engine.reconstruct(7, accounts(), {txns[0]}, {action(1, "REVERSE_SPLIT", 5.0)});
        REQUIRE(result.book.lot_from_txn(1)->quantity_open == Catch::Approx(2.0));
    }

    SECTION("Invalid ratios are skipped but marked applied") {
        auto result = engine.reconstruct(7, accounts(), txns,
                                         {action(1, "SPLIT", std::nullopt),
                                          action(2, "REVERSE_SPLIT", 0.0),
                                          action(3, "SPLIT", -1.0)});
        REQUIRE(has_warning(result.warnings, "Corporate action missing ratio; marked applied but no change made."));
        REQUIRE(has_warning(result.warnings, "Reverse split ratio=0; skipped."));
        REQUIRE(has_warning(result.warnings, "Corporate action split ratio <= 0; skipped."));
        for (const auto& e : result.corporate_actions)
            REQUIRE(e.applied);
        REQUIRE(result.book.lot_from_txn(1)->original_quantity == Catch::Approx(10.0));
    }

    SECTION("Unsupported action types are noted, not applied") {
        auto result = engine.reconstruct(7, accounts(), txns, {action(1, "MERGER", 1.5)});
        REQUIRE(result.corporate_actions[0].applied);
        REQUIRE(result.corporate_actions[0].apply_notes.find("Unsupported") != std::string::npos);
        REQUIRE(result.book.lot_from_txn(1)->original_quantity == Catch::Approx(10.0));
    }
}

TEST_CASE("LotBook CSV export", "[LotBook]") {
    LotReconstructionEngine engine;
    std::vector<data::Transaction> txns = {
        txn(1, 1, "2024-01-02", TransactionType::BUY, "XYZ", 10.0, -100.0),
        txn(2, 1, "2024-03-01", TransactionType::SELL, "XYZ", 5.0, 80.0),
    };
    auto result = engine.reconstruct(7, accounts(), txns, {});

    const std::string out = "build/tmp/lot_export_test/tax_lots.csv";
    std::filesystem::remove_all(std::filesystem::path(out).parent_path());
    result.book.export_lots_csv(out);
    result.book.export_disposals_csv("build/tmp/lot_export_test/disposals.csv");

    std::ifstream lots_in(out);
    REQUIRE(lots_in.is_open());
    std::string header;
    std::getline(lots_in, header);
    REQUIRE(header.find("quantity_open") != std::string::npos);
    int rows = 0;
    std::string line;
    while (std::getline(lots_in, line))
        ++rows;
    REQUIRE(rows == 1);

    std::ifstream disp_in("build/tmp/lot_export_test/disposals.csv");
    REQUIRE(disp_in.is_open());
}
