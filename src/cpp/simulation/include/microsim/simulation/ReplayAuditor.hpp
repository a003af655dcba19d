/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/simulation/Simulation.hpp"

#include <string>
#include <vector>

//-------------------------------------------------------------------------

namespace microsim::simulation
{

//-------------------------------------------------------------------------

struct ReplayOutcome
{
    // Fills produced by re-driving the logged order events, in execution order.
    std::vector<book::Fill> fills;
    // Fills settled by the logged fill events.
    std::vector<book::Fill> settledFills;
    std::vector<EventID> rejectedEvents;
    std::vector<accounting::AccountSnapshot> accounts;
    std::string book;
};

//-------------------------------------------------------------------------

/**
 * Rebuilds a fresh core from a run's configuration and replays an event log
 * against it. Only order, cancel and fill events drive state; order ids and
 * fills are taken from the log. Any disagreement raises ReplayDivergenceError
 * naming the first diverging event.
 */
class ReplayAuditor
{
public:
    explicit ReplayAuditor(SimulationConfig config);

    [[nodiscard]] const SimulationConfig& config() const noexcept { return m_config; }

    [[nodiscard]] ReplayOutcome replay(const event::EventLog& log) const;

    void audit(const Simulation& simulation) const;

    // Replay `log` and compare the result with the state held by `reference`.
    void audit(const event::EventLog& log, const Simulation& reference) const;

private:
    SimulationConfig m_config;
    std::shared_ptr<spdlog::logger> m_logger;
};

//-------------------------------------------------------------------------

}  // namespace microsim::simulation

//-------------------------------------------------------------------------
