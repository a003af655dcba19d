/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/accounting/Account.hpp"
#include "microsim/accounting/PositionTracker.hpp"
#include "microsim/book/MatchingEngine.hpp"
#include "microsim/book/OrderValidator.hpp"

#include <pugixml.hpp>

#include <optional>
#include <vector>

//-------------------------------------------------------------------------

namespace microsim::simulation
{

//-------------------------------------------------------------------------

struct LatencyConfig
{
    Timedelta submission{1};
    Timedelta fill{1};
    Timedelta cancel{1};

    [[nodiscard]] static LatencyConfig fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

/**
 * Immutable description of a run. Two simulations built from equal configs
 * and fed the same inputs produce identical event logs.
 *
 * <Simulation seed="42" debug="false" logDir="logs" pnlConvention="fifo" tieBreak="fifo">
 *   <Latency submission="1" fill="1" cancel="1"/>
 *   <Book minPrice="0" maxPrice="1"/>
 *   <Accounts>
 *     <Account owner="mm-1" cash="1000" inventory="0"/>
 *   </Accounts>
 * </Simulation>
 */
class SimulationConfig
{
public:
    SimulationConfig() noexcept = default;

    [[nodiscard]] uint64_t seed() const noexcept { return m_seed; }
    [[nodiscard]] bool debug() const noexcept { return m_debug; }
    [[nodiscard]] const std::optional<fs::path>& logDir() const noexcept { return m_logDir; }
    [[nodiscard]] accounting::PnlConvention pnlConvention() const noexcept { return m_pnlConvention; }
    [[nodiscard]] book::TieBreakPolicy tieBreak() const noexcept { return m_tieBreak; }
    [[nodiscard]] const LatencyConfig& latency() const noexcept { return m_latency; }
    [[nodiscard]] const book::OrderValidator::Parameters& bookBounds() const noexcept
    {
        return m_bookBounds;
    }
    [[nodiscard]] const std::vector<accounting::InitialHoldings>& accounts() const noexcept
    {
        return m_accounts;
    }

    SimulationConfig& setSeed(uint64_t seed) noexcept { m_seed = seed; return *this; }
    SimulationConfig& setDebug(bool flag) noexcept { m_debug = flag; return *this; }
    SimulationConfig& setLogDir(fs::path logDir) { m_logDir = std::move(logDir); return *this; }
    SimulationConfig& setPnlConvention(accounting::PnlConvention convention) noexcept
    {
        m_pnlConvention = convention;
        return *this;
    }
    SimulationConfig& setTieBreak(book::TieBreakPolicy tieBreak) noexcept
    {
        m_tieBreak = tieBreak;
        return *this;
    }
    SimulationConfig& setLatency(LatencyConfig latency);
    SimulationConfig& setBookBounds(book::OrderValidator::Parameters bounds) noexcept
    {
        m_bookBounds = bounds;
        return *this;
    }
    SimulationConfig& addAccount(accounting::InitialHoldings holdings);

    [[nodiscard]] static SimulationConfig fromXML(pugi::xml_node node);
    [[nodiscard]] static SimulationConfig fromFile(const fs::path& path);
    [[nodiscard]] static SimulationConfig fromString(std::string_view xml);

private:
    uint64_t m_seed{};
    bool m_debug{};
    std::optional<fs::path> m_logDir;
    accounting::PnlConvention m_pnlConvention{accounting::PnlConvention::AVERAGE_COST};
    book::TieBreakPolicy m_tieBreak{book::TieBreakPolicy::FIFO};
    LatencyConfig m_latency;
    book::OrderValidator::Parameters m_bookBounds;
    std::vector<accounting::InitialHoldings> m_accounts;
};

//-------------------------------------------------------------------------

[[nodiscard]] book::TieBreakPolicy str2tieBreak(std::string_view str);

//-------------------------------------------------------------------------

}  // namespace microsim::simulation

//-------------------------------------------------------------------------
