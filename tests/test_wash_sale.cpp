#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "perfbook/lots/lot_reconstruction.hpp"
#include "perfbook/lots/wash_sale.hpp"

using namespace perfbook;
using namespace perfbook::lots;
using data::TransactionType;

namespace {

data::Transaction txn(int id, int account, const std::string& date, TransactionType type,
                      const std::string& ticker, double qty, double amount)
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

struct Run {
    ReconstructionResult rebuilt;
    WashSaleResult wash;
};

Run run(const std::vector<data::Transaction>& txns, WashSaleEngine engine = WashSaleEngine())
{
    Run r;
    r.rebuilt = LotReconstructionEngine().reconstruct(7, accounts(), txns, {});
    r.wash = engine.apply(7, r.rebuilt.book, accounts(), txns);
    return r;
}

} // namespace

TEST_CASE("Wash sale deferral", "[WashSale]") {
    SECTION("Happy path: repurchase within the window defers the loss") {
        std::vector<data::Transaction> txns = {
            txn(1, 1, "2024-03-01", TransactionType::BUY, "XYZ", 10.0, -1000.0),
            txn(2, 1, "2024-03-10", TransactionType::SELL, "XYZ", 10.0, 800.0),
            txn(3, 1, "2024-03-25", TransactionType::BUY, "XYZ", 10.0, -900.0),
        };
        auto r = run(txns);

        REQUIRE(r.wash.adjustments_created == 1);
        REQUIRE(r.wash.warnings.empty());

        const auto& adj = r.rebuilt.book.adjustments().at(0);
        REQUIRE(adj.status == WashStatus::APPLIED);
        REQUIRE(adj.loss_sale_txn_id == 2);
        REQUIRE(adj.replacement_buy_txn_id == 3);
        REQUIRE(adj.deferred_loss == Catch::Approx(200.0));
        REQUIRE(adj.basis_increase == Catch::Approx(200.0));
        REQUIRE(adj.replacement_shares == Catch::Approx(10.0));
        REQUIRE(adj.window_start == "2024-02-09");
        REQUIRE(adj.window_end == "2024-04-09");

        const TaxLot* replacement = r.rebuilt.book.lot_from_txn(3);
        REQUIRE(adj.replacement_lot_id == replacement->id);
        REQUIRE(*replacement->basis_open == Catch::Approx(1100.0));
        REQUIRE(replacement->wash_basis_added == Catch::Approx(200.0));
        REQUIRE_FALSE(replacement->notes.empty());
    }

    SECTION("Large loss is deferred in full") {
        std::vector<data::Transaction> txns = {
            txn(1, 1, "2024-01-02", TransactionType::BUY, "XYZ", 100.0, -20000.0),
            txn(2, 1, "2024-06-03", TransactionType::SELL, "XYZ", 100.0, 10000.0),
            txn(3, 1, "2024-06-20", TransactionType::BUY, "XYZ", 100.0, -10500.0),
        };
        auto r = run(txns);

        REQUIRE(r.rebuilt.book.num_adjustments() == 1);
        const auto& adj = r.rebuilt.book.adjustments().at(0);
        REQUIRE(adj.status == WashStatus::APPLIED);
        REQUIRE(adj.deferred_loss == Catch::Approx(10000.0));
        REQUIRE(*r.rebuilt.book.lot_from_txn(3)->basis_open == Catch::Approx(20500.0));
    }

    SECTION("Repurchase before the sale also counts") {
        std::vector<data::Transaction> txns = {
            txn(1, 1, "2024-01-02", TransactionType::BUY, "XYZ", 10.0, -1000.0),
            txn(2, 1, "2024-05-20", TransactionType::BUY, "XYZ", 10.0, -700.0),
            txn(3, 1, "2024-06-03", TransactionType::SELL, "XYZ", 10.0, 600.0),
        };
        auto r = run(txns);

        // FIFO sells the January lot; the May buy is the replacement
        REQUIRE(r.wash.adjustments_created == 1);
        REQUIRE(r.rebuilt.book.adjustments().at(0).replacement_buy_txn_id == 2);
        REQUIRE(r.rebuilt.book.adjustments().at(0).deferred_loss == Catch::Approx(400.0));
    }

    SECTION("Partial replacement defers a proportional share") {
        std::vector<data::Transaction> txns = {
            txn(1, 1, "2024-03-01", TransactionType::BUY, "XYZ", 10.0, -1000.0),
            txn(2, 1, "2024-03-10", TransactionType::SELL, "XYZ", 10.0, 800.0),
            txn(3, 1, "2024-03-25", TransactionType::BUY, "XYZ", 4.0, -340.0),
        };
        auto r = run(txns);

        const auto& adj = r.rebuilt.book.adjustments().at(0);
        REQUIRE(adj.replacement_shares == Catch::Approx(4.0));
        REQUIRE(adj.deferred_loss == Catch::Approx(80.0));
        REQUIRE(r.wash.warnings.size() == 1);
        REQUIRE(r.wash.warnings[0] ==
                "Wash sale: not enough replacement shares to defer full loss for sale txn_id=2.");
    }

    SECTION("Shares left open in a partly sold lot replace the sale") {
        std::vector<data::Transaction> txns = {
            txn(1, 1, "2024-03-01", TransactionType::BUY, "XYZ", 100.0, -1000.0),
            txn(2, 1, "2024-03-10", TransactionType::SELL, "XYZ", 10.0, 50.0),
        };
        auto r = run(txns);

        REQUIRE(r.wash.adjustments_created == 1);
        REQUIRE(r.wash.warnings.empty());

        const auto& adj = r.rebuilt.book.adjustments().at(0);
        REQUIRE(adj.status == WashStatus::APPLIED);
        REQUIRE(adj.loss_sale_txn_id == 2);
        REQUIRE(adj.replacement_buy_txn_id == 1);
        REQUIRE(adj.replacement_shares == Catch::Approx(10.0));
        REQUIRE(adj.deferred_loss == Catch::Approx(50.0));
        REQUIRE(adj.basis_increase == Catch::Approx(50.0));

        const TaxLot* lot = r.rebuilt.book.lot_from_txn(1);
        REQUIRE(lot->quantity_open == Catch::Approx(90.0));
        REQUIRE(*lot->basis_open == Catch::Approx(950.0));
        REQUIRE(lot->wash_basis_added == Catch::Approx(50.0));
    }

    SECTION("Sold shares of a buy are not counted as its replacement shares") {
        std::vector<data::Transaction> txns = {
            txn(1, 1, "2024-03-01", TransactionType::BUY, "XYZ", 12.0, -1200.0),
            txn(2, 1, "2024-03-10", TransactionType::SELL, "XYZ", 10.0, 800.0),
        };
        auto r = run(txns);

        const auto& adj = r.rebuilt.book.adjustments().at(0);
        REQUIRE(adj.replacement_buy_txn_id == 1);
        REQUIRE(adj.replacement_shares == Catch::Approx(2.0));
        REQUIRE(adj.deferred_loss == Catch::Approx(40.0));
        REQUIRE(r.wash.warnings.size() == 1);
    }
}

TEST_CASE("Wash sale non-triggers", "[WashSale]") {
    SECTION("Gains are never deferred") {
        std::vector<data::Transaction> txns = {
            txn(1, 1, "2024-03-01", TransactionType::BUY, "XYZ", 10.0, -1000.0),
            txn(2, 1, "2024-03-10", TransactionType::SELL, "XYZ", 10.0, 1200.0),
            txn(3, 1, "2024-03-25", TransactionType::BUY, "XYZ", 10.0, -1100.0),
        };
        REQUIRE(run(txns).wash.adjustments_created == 0);
    }

    SECTION("Repurchase outside the window") {
        std::vector<data::Transaction> txns = {
            txn(1, 1, "2024-03-01", TransactionType::BUY, "XYZ", 10.0, -1000.0),
            txn(2, 1, "2024-03-10", TransactionType::SELL, "XYZ", 10.0, 800.0),
            txn(3, 1, "2024-04-10", TransactionType::BUY, "XYZ", 10.0, -900.0),
        };
        REQUIRE(run(txns).wash.adjustments_created == 0);
    }

    SECTION("Losses under the threshold") {
        std::vector<data::Transaction> txns = {
            txn(1, 1, "2024-03-01", TransactionType::BUY, "XYZ", 1.0, -100.0),
            txn(2, 1, "2024-03-10", TransactionType::SELL, "XYZ", 1.0, 99.995),
            txn(3, 1, "2024-03-25", TransactionType::BUY, "XYZ", 1.0, -100.0),
        };
        REQUIRE(run(txns).wash.adjustments_created == 0);
    }

    SECTION("Different security without a group") {
        std::vector<data::Transaction> txns = {
            txn(1, 1, "2024-03-01", TransactionType::BUY, "VOO", 10.0, -1000.0),
            txn(2, 1, "2024-03-10", TransactionType::SELL, "VOO", 10.0, 800.0),
            txn(3, 1, "2024-03-25", TransactionType::BUY, "IVV", 10.0, -900.0),
        };
        REQUIRE(run(txns).wash.adjustments_created == 0);
    }
}

TEST_CASE("Substitute securities and account types", "[WashSale]") {
    std::map<std::string, std::vector<std::string>> members = {{"sp500", {"VOO", "ivv", "SPY"}}};
    SecurityGroups groups(members);

    SECTION("Security groups") {
        REQUIRE(groups.equivalents("voo") == std::set<std::string>{"IVV", "SPY", "VOO"});
        REQUIRE(groups.equivalents("QQQ") == std::set<std::string>{"QQQ"});
    }

    SECTION("Group member repurchase is a wash sale") {
        std::vector<data::Transaction> txns = {
            txn(1, 1, "2024-03-01", TransactionType::BUY, "VOO", 10.0, -1000.0),
            txn(2, 1, "2024-03-10", TransactionType::SELL, "VOO", 10.0, 800.0),
            txn(3, 1, "2024-03-25", TransactionType::BUY, "IVV", 10.0, -900.0),
        };
        auto r = run(txns, WashSaleEngine(WashSaleConfig(), groups));
        REQUIRE(r.wash.adjustments_created == 1);
        REQUIRE(r.rebuilt.book.adjustments().at(0).status == WashStatus::APPLIED);
    }

    SECTION("IRA repurchase is flagged only when enabled") {
        std::vector<data::Transaction> txns = {
            txn(1, 1, "2024-03-01", TransactionType::BUY, "XYZ", 10.0, -1000.0),
            txn(2, 1, "2024-03-10", TransactionType::SELL, "XYZ", 10.0, 800.0),
            txn(3, 2, "2024-03-25", TransactionType::BUY, "XYZ", 10.0, -900.0),
        };
        REQUIRE(run(txns).wash.adjustments_created == 0);

        WashSaleConfig config;
        config.include_tax_advantaged = true;
        auto r = run(txns, WashSaleEngine(config));

        REQUIRE(r.wash.adjustments_created == 1);
        const auto& adj = r.rebuilt.book.adjustments().at(0);
        REQUIRE(adj.status == WashStatus::FLAGGED);
        REQUIRE(adj.basis_increase == Catch::Approx(0.0));
        REQUIRE_FALSE(adj.replacement_lot_id.has_value());
        REQUIRE(adj.notes.find("tax-advantaged") != std::string::npos);
    }

    SECTION("Custom window") {
        std::vector<data::Transaction> txns = {
            txn(1, 1, "2024-03-01", TransactionType::BUY, "XYZ", 10.0, -1000.0),
            txn(2, 1, "2024-03-10", TransactionType::SELL, "XYZ", 10.0, 800.0),
            txn(3, 1, "2024-03-25", TransactionType::BUY, "XYZ", 10.0, -900.0),
        };
        WashSaleConfig config;
        config.window_days = 10;
        REQUIRE(run(txns, WashSaleEngine(config)).wash.adjustments_created == 0);
    }
}
