/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/common/SimulationException.hpp"
#include "microsim/simulation/SimulationConfig.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fstream>

//-------------------------------------------------------------------------

using namespace microsim;
using namespace microsim::simulation;

using namespace testing;

//-------------------------------------------------------------------------

TEST(SimulationConfigTest, ParsesFullDocument)
{
    const auto config = SimulationConfig::fromString(R"(
        <Simulation seed="42" debug="true" logDir="run-logs" pnlConvention="fifo" tieBreak="randomized">
            <Latency submission="3" fill="0" cancel="2"/>
            <Book minPrice="0" maxPrice="1"/>
            <Accounts>
                <Account owner="mm-1" cash="1000" inventory="25"/>
                <Account owner="noise-1" cash="250.5"/>
            </Accounts>
        </Simulation>)");

    EXPECT_EQ(config.seed(), 42);
    EXPECT_TRUE(config.debug());
    EXPECT_EQ(config.logDir(), std::optional{fs::path{"run-logs"}});
    EXPECT_EQ(config.pnlConvention(), accounting::PnlConvention::FIFO);
    EXPECT_EQ(config.tieBreak(), book::TieBreakPolicy::RANDOMIZED);
    EXPECT_EQ(config.latency().submission, 3);
    EXPECT_EQ(config.latency().fill, 0);
    EXPECT_EQ(config.latency().cancel, 2);
    EXPECT_EQ(config.bookBounds().minPrice, std::optional{0_dec});
    EXPECT_EQ(config.bookBounds().maxPrice, std::optional{1_dec});

    ASSERT_EQ(config.accounts().size(), 2);
    EXPECT_EQ(config.accounts()[0].owner, "mm-1");
    EXPECT_EQ(config.accounts()[0].cash, 1000_dec);
    EXPECT_EQ(config.accounts()[0].inventory, 25_dec);
    EXPECT_EQ(config.accounts()[1].cash, DEC(250.5));
    EXPECT_EQ(config.accounts()[1].inventory, 0_dec);
}

//-------------------------------------------------------------------------

TEST(SimulationConfigTest, Defaults)
{
    const auto config = SimulationConfig::fromString(R"(<Simulation seed="7"/>)");
    EXPECT_FALSE(config.debug());
    EXPECT_FALSE(config.logDir().has_value());
    EXPECT_EQ(config.pnlConvention(), accounting::PnlConvention::AVERAGE_COST);
    EXPECT_EQ(config.tieBreak(), book::TieBreakPolicy::FIFO);
    EXPECT_EQ(config.latency().submission, 1);
    EXPECT_EQ(config.latency().fill, 1);
    EXPECT_EQ(config.latency().cancel, 1);
    EXPECT_FALSE(config.bookBounds().minPrice.has_value());
    EXPECT_TRUE(config.accounts().empty());
}

//-------------------------------------------------------------------------

struct InvalidConfigTest : TestWithParam<std::string> {};

TEST_P(InvalidConfigTest, Throws)
{
    EXPECT_THROW(std::ignore = SimulationConfig::fromString(GetParam()), ConfigurationError);
}

INSTANTIATE_TEST_SUITE_P(
    SimulationConfigTest,
    InvalidConfigTest,
    Values(
        R"(<Simulation/>)",
        R"(<Scenario seed="1"/>)",
        R"(<Simulation seed="1")",
        R"(<Simulation seed="1" pnlConvention="lifo"/>)",
        R"(<Simulation seed="1" tieBreak="coinflip"/>)",
        R"(<Simulation seed="1"><Latency fill="-1"/></Simulation>)",
        R"(<Simulation seed="1"><Book minPrice="2" maxPrice="1"/></Simulation>)",
        R"(<Simulation seed="1"><Accounts><Account cash="5"/></Accounts></Simulation>)",
        R"(<Simulation seed="1"><Accounts><Account owner="x"/><Account owner="x"/></Accounts></Simulation>)"));

//-------------------------------------------------------------------------

TEST(SimulationConfigTest, FromFile)
{
    const fs::path path = fs::temp_directory_path() / "microsim-config-test.xml";
    {
        std::ofstream ofs{path};
        ofs << R"(<Simulation seed="1234" tieBreak="FIFO"><Latency submission="5"/></Simulation>)";
    }
    const auto config = SimulationConfig::fromFile(path);
    EXPECT_EQ(config.seed(), 1234);
    EXPECT_EQ(config.latency().submission, 5);
    fs::remove(path);

    EXPECT_THROW(std::ignore = SimulationConfig::fromFile(path), ConfigurationError);
}

//-------------------------------------------------------------------------

TEST(SimulationConfigTest, Builders)
{
    SimulationConfig config;
    config.setSeed(3).addAccount({.owner = "a", .cash = 10_dec});
    EXPECT_THROW(config.addAccount({.owner = "a"}), ConfigurationError);
    EXPECT_THROW(config.addAccount({.owner = ""}), ConfigurationError);
    EXPECT_THROW(config.setLatency({.submission = -2}), ConfigurationError);
    EXPECT_EQ(config.seed(), 3);
    EXPECT_EQ(config.accounts().size(), 1);
}

//-------------------------------------------------------------------------
