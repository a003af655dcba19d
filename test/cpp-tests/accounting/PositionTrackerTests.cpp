/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/accounting/PositionTracker.hpp"
#include "microsim/common/SimulationException.hpp"
#include "test-common/formatting.hpp"

#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace microsim;
using namespace microsim::accounting;

using namespace testing;

//-------------------------------------------------------------------------

TEST(PositionTrackerTest, ConventionNames)
{
    EXPECT_EQ(str2convention("average-cost"), PnlConvention::AVERAGE_COST);
    EXPECT_EQ(str2convention("average_cost"), PnlConvention::AVERAGE_COST);
    EXPECT_EQ(str2convention("fifo"), PnlConvention::FIFO);
    EXPECT_THROW(std::ignore = str2convention("lifo"), ConfigurationError);
}

//-------------------------------------------------------------------------

TEST(AverageCostTrackerTest, BlendsEntriesAndRealizesOnReduction)
{
    AverageCostTracker tracker;
    EXPECT_EQ(tracker.onTrade(Side::BUY, 10_dec, DEC(0.4)), 0_dec);
    EXPECT_EQ(tracker.onTrade(Side::BUY, 10_dec, DEC(0.6)), 0_dec);
    EXPECT_EQ(tracker.averageCost(), DEC(0.5));

    EXPECT_EQ(tracker.onTrade(Side::SELL, 5_dec, DEC(0.7)), DEC(1.0));
    EXPECT_EQ(tracker.position(), 15_dec);
    EXPECT_EQ(tracker.averageCost(), DEC(0.5));
    EXPECT_EQ(tracker.unrealizedPnl(DEC(0.6)), DEC(1.5));
}

//-------------------------------------------------------------------------

TEST(AverageCostTrackerTest, FlipsThroughFlat)
{
    AverageCostTracker tracker;
    std::ignore = tracker.onTrade(Side::BUY, 5_dec, 10_dec);

    EXPECT_EQ(tracker.onTrade(Side::SELL, 8_dec, 12_dec), 10_dec);
    EXPECT_EQ(tracker.position(), -3_dec);
    EXPECT_EQ(tracker.averageCost(), 12_dec);

    EXPECT_EQ(tracker.onTrade(Side::BUY, 3_dec, 11_dec), 3_dec);
    EXPECT_EQ(tracker.position(), 0_dec);
    EXPECT_EQ(tracker.averageCost(), 0_dec);
}

//-------------------------------------------------------------------------

TEST(FifoLotTrackerTest, ClosesOldestLotsFirst)
{
    FifoLotTracker tracker;
    std::ignore = tracker.onTrade(Side::BUY, 10_dec, DEC(0.4));
    std::ignore = tracker.onTrade(Side::BUY, 10_dec, DEC(0.6));

    EXPECT_EQ(tracker.onTrade(Side::SELL, 5_dec, DEC(0.7)), DEC(1.5));
    ASSERT_EQ(tracker.lots().size(), 2);
    EXPECT_EQ(tracker.lots().front().quantity, 5_dec);
    EXPECT_EQ(tracker.lots().front().price, DEC(0.4));
    EXPECT_EQ(tracker.position(), 15_dec);

    EXPECT_EQ(tracker.onTrade(Side::SELL, 20_dec, DEC(0.5)), DEC(0.5) - DEC(1.0));
    ASSERT_EQ(tracker.lots().size(), 1);
    EXPECT_EQ(tracker.lots().front().quantity, -5_dec);
    EXPECT_EQ(tracker.position(), -5_dec);
    EXPECT_EQ(tracker.unrealizedPnl(DEC(0.4)), DEC(0.5));
}

//-------------------------------------------------------------------------

TEST(PositionTrackerTest, FactoryAndClone)
{
    auto tracker = makePositionTracker(PnlConvention::FIFO);
    std::ignore = tracker->onTrade(Side::BUY, 2_dec, 3_dec);
    const auto copy = tracker->clone();
    std::ignore = tracker->onTrade(Side::SELL, 2_dec, 4_dec);

    EXPECT_EQ(copy->position(), 2_dec);
    EXPECT_EQ(tracker->position(), 0_dec);
    EXPECT_NE(dynamic_cast<AverageCostTracker*>(makePositionTracker(PnlConvention::AVERAGE_COST).get()), nullptr);
}

//-------------------------------------------------------------------------
