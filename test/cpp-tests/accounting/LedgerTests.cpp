/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/accounting/Ledger.hpp"
#include "microsim/common/SimulationException.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace microsim;
using namespace microsim::accounting;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

// `buyer` lifts `seller`'s resting order.
book::Fill lift(FillID id, Owner buyer, Owner seller, decimal_t price, decimal_t quantity)
{
    return book::Fill{
        id, 100 + id, 200 + id, std::move(seller), std::move(buyer), Side::BUY, price, quantity, id};
}

}  // namespace

//-------------------------------------------------------------------------

struct LedgerTest : Test
{
    virtual void SetUp() override
    {
        ledger.apply(lift(0, "a", "b", DEC(0.4), 10_dec));
        ledger.apply(lift(1, "b", "c", DEC(0.6), 5_dec));
    }

    Ledger ledger;
};

//-------------------------------------------------------------------------

TEST_F(LedgerTest, TransfersAreZeroSum)
{
    const auto a = ledger.snapshot("a");
    const auto b = ledger.snapshot("b");
    const auto c = ledger.snapshot("c");

    EXPECT_EQ(a.cash, -4_dec);
    EXPECT_EQ(a.inventory, 10_dec);
    EXPECT_EQ(b.cash, 1_dec);
    EXPECT_EQ(b.inventory, -5_dec);
    EXPECT_EQ(c.cash, 3_dec);
    EXPECT_EQ(c.inventory, -5_dec);

    EXPECT_EQ(ledger.totalCashDelta(), 0_dec);
    EXPECT_EQ(ledger.totalInventoryDelta(), 0_dec);
    EXPECT_NO_THROW(ledger.reconcile());
    EXPECT_EQ(ledger.processedFills(), 2);

    const auto& entry = ledger.journal().front();
    EXPECT_EQ(entry.buyer, "a");
    EXPECT_EQ(entry.seller, "b");
    EXPECT_EQ(entry.buyerCashDelta, -entry.sellerCashDelta);
    EXPECT_EQ(entry.buyerInventoryDelta, -entry.sellerInventoryDelta);
}

//-------------------------------------------------------------------------

TEST_F(LedgerTest, MarkToMarketAndSettlement)
{
    EXPECT_THAT(
        ledger.markToMarket(DEC(0.5)),
        ElementsAre(Pair("a", 1_dec), Pair("b", DEC(-1.5)), Pair("c", DEC(0.5))));
    EXPECT_THAT(
        ledger.settlementPnl(DEC(1.0)),
        ElementsAre(Pair("a", 6_dec), Pair("b", -4_dec), Pair("c", -2_dec)));
    EXPECT_THAT(
        ledger.settlementPnl(DEC(0.0)),
        ElementsAre(Pair("a", -4_dec), Pair("b", 1_dec), Pair("c", 3_dec)));

    EXPECT_THROW(std::ignore = ledger.settlementPnl(DEC(1.5)), std::invalid_argument);
    EXPECT_THROW(std::ignore = ledger.settlementPnl(DEC(-0.1)), std::invalid_argument);
    EXPECT_EQ(ledger.snapshot("a").equity(DEC(0.5)), 1_dec);
}

//-------------------------------------------------------------------------

TEST_F(LedgerTest, InvalidFillIsFatalAndRecorded)
{
    try {
        ledger.apply(lift(7, "a", "c", 0_dec, 1_dec));
        FAIL() << "expected AccountingInvariantError";
    }
    catch (const AccountingInvariantError& exc) {
        EXPECT_THAT(exc.fillIds(), ElementsAre(7));
    }
    EXPECT_THROW(ledger.apply(lift(8, "a", "c", 1_dec, DEC(-1.0))), AccountingInvariantError);

    ASSERT_EQ(ledger.violations().size(), 2);
    EXPECT_EQ(ledger.violations()[0].code, "invalid_fill_price");
    EXPECT_EQ(ledger.violations()[1].code, "invalid_fill_size");
    EXPECT_EQ(ledger.processedFills(), 2);

    try {
        ledger.reconcile();
        FAIL() << "expected AccountingInvariantError";
    }
    catch (const AccountingInvariantError& exc) {
        EXPECT_THAT(exc.fillIds(), ElementsAre(7, 8));
    }

    ledger.reset();
    EXPECT_TRUE(ledger.violations().empty());
    EXPECT_NO_THROW(ledger.reconcile());
}

//-------------------------------------------------------------------------

TEST_F(LedgerTest, UnknownOwnerSnapshot)
{
    EXPECT_THROW(std::ignore = ledger.snapshot("nobody"), SimulationException);
    EXPECT_FALSE(ledger.hasAccount("nobody"));
    EXPECT_THAT(
        ledger.snapshots() | views::transform(&AccountSnapshot::owner) | ranges::to<std::vector>,
        ElementsAre("a", "b", "c"));
}

//-------------------------------------------------------------------------

struct RealizedPnlTestParams
{
    PnlConvention convention;
    decimal_t refRealized;
};

void PrintTo(const RealizedPnlTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.convention = {}, .refRealized = {}}}",
        magic_enum::enum_name(params.convention),
        params.refRealized);
}

struct RealizedPnlTest : TestWithParam<RealizedPnlTestParams> {};

TEST_P(RealizedPnlTest, WorksCorrectly)
{
    const auto [convention, refRealized] = GetParam();
    Ledger ledger{convention};
    ledger.apply(lift(0, "trader", "mm", DEC(0.4), 10_dec));
    ledger.apply(lift(1, "trader", "mm", DEC(0.6), 10_dec));
    ledger.apply(lift(2, "mm", "trader", DEC(0.7), 5_dec));

    EXPECT_EQ(ledger.snapshot("trader").realizedPnl, refRealized);
    EXPECT_EQ(ledger.snapshot("mm").realizedPnl, -refRealized);
    EXPECT_EQ(ledger.snapshot("trader").inventory, 15_dec);
    EXPECT_NO_THROW(ledger.reconcile());
}

INSTANTIATE_TEST_SUITE_P(
    LedgerTest,
    RealizedPnlTest,
    Values(
        RealizedPnlTestParams{.convention = PnlConvention::AVERAGE_COST, .refRealized = DEC(1.0)},
        RealizedPnlTestParams{.convention = PnlConvention::FIFO, .refRealized = DEC(1.5)}));

//-------------------------------------------------------------------------

TEST(LedgerOpeningTest, ConfiguredHoldings)
{
    Ledger ledger;
    ledger.openAccount({.owner = "mm-1", .cash = 1000_dec, .inventory = 50_dec});
    ledger.openAccount({.owner = "noise-1", .cash = 200_dec});
    EXPECT_THROW(ledger.openAccount({.owner = "mm-1"}), ConfigurationError);

    ledger.apply(lift(0, "noise-1", "mm-1", DEC(0.55), 20_dec));

    const auto mm = ledger.snapshot("mm-1");
    EXPECT_EQ(mm.cash, 1011_dec);
    EXPECT_EQ(mm.inventory, 30_dec);
    EXPECT_EQ(mm.cashDelta, 11_dec);
    EXPECT_EQ(mm.inventoryDelta, -20_dec);
    EXPECT_EQ(ledger.snapshot("noise-1").cash, 189_dec);
    EXPECT_NO_THROW(ledger.reconcile());

    // Settlement is measured against opening holdings, so it still nets out.
    const auto pnl = ledger.settlementPnl(1_dec);
    EXPECT_EQ(pnl.at("mm-1") + pnl.at("noise-1"), 0_dec);
    EXPECT_EQ(pnl.at("noise-1"), 9_dec);

    ledger.reset();
    EXPECT_EQ(ledger.snapshot("mm-1").cash, 1000_dec);
    EXPECT_EQ(ledger.snapshot("mm-1").inventory, 50_dec);
    EXPECT_TRUE(ledger.journal().empty());
}

//-------------------------------------------------------------------------

TEST(LedgerOpeningTest, LargeBalancesKeepFillPrecision)
{
    Ledger ledger;
    ledger.openAccount({.owner = "buyer", .cash = 1000000_dec});
    ledger.openAccount({.owner = "seller", .cash = 1000000_dec, .inventory = 10_dec});

    const auto fill = lift(0, "buyer", "seller", DEC(0.12345678), DEC(1.234));
    ASSERT_NO_THROW(ledger.apply(fill));
    EXPECT_NO_THROW(ledger.reconcile());
    EXPECT_TRUE(ledger.violations().empty());

    const auto& entry = ledger.journal().front();
    EXPECT_EQ(entry.buyerCashDelta, -entry.sellerCashDelta);
    EXPECT_EQ(entry.buyerCashDelta, DEC(-0.15234566652));
    EXPECT_EQ(ledger.snapshot("buyer").cashDelta, DEC(-0.15234566652));
    EXPECT_EQ(ledger.snapshot("seller").inventoryDelta, DEC(-1.234));

    std::map<Owner, decimal_t> pnl;
    ASSERT_NO_THROW(pnl = ledger.settlementPnl(DEC(0.37)));
    EXPECT_LE(util::abs(pnl.at("buyer") + pnl.at("seller")), Ledger::kDefaultTolerance);
}

//-------------------------------------------------------------------------

TEST(LedgerOpeningTest, SelfTradeNetsOut)
{
    Ledger ledger;
    ledger.apply(lift(0, "solo", "solo", 3_dec, 2_dec));

    const auto solo = ledger.snapshot("solo");
    EXPECT_EQ(solo.cash, 0_dec);
    EXPECT_EQ(solo.inventory, 0_dec);
    EXPECT_EQ(ledger.journal().size(), 1);
    EXPECT_NO_THROW(ledger.reconcile());
}

//-------------------------------------------------------------------------

TEST(LedgerOpeningTest, Serialization)
{
    Ledger ledger{PnlConvention::FIFO};
    ledger.apply(lift(0, "a", "b", DEC(0.25), 4_dec));

    rapidjson::Document json;
    ledger.jsonSerialize(json);
    EXPECT_STREQ(json["convention"].GetString(), "FIFO");
    EXPECT_EQ(json["processedFills"].GetUint64(), 1);
    ASSERT_EQ(json["accounts"].Size(), 2);
    EXPECT_DOUBLE_EQ(json["accounts"][0]["cash"].GetDouble(), -1.0);

    rapidjson::Document checkpoint;
    ledger.checkpointSerialize(checkpoint);
    EXPECT_EQ(
        util::unpackDecimal(checkpoint["accounts"][1]["cash"].GetUint64()), 1_dec);
}

//-------------------------------------------------------------------------
