/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/accounting/Ledger.hpp"
#include "microsim/book/MatchingEngine.hpp"
#include "microsim/event/EventLog.hpp"
#include "microsim/rng/StreamManager.hpp"
#include "microsim/scheduler/EventScheduler.hpp"
#include "microsim/simulation/SimulationConfig.hpp"
#include "microsim/simulation/SimulationSignals.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <vector>

//-------------------------------------------------------------------------

namespace microsim::simulation
{

//-------------------------------------------------------------------------

struct SubmitAck
{
    bool accepted{};
    std::optional<EventID> eventId;
    std::optional<OrderID> orderId;
    std::optional<book::OrderErrorCode> reason;
};

//-------------------------------------------------------------------------

/**
 * One deterministic run. Owns the random streams, the scheduler, the
 * matching engine, the ledger and the event log, and drives them through a
 * single-threaded discrete-event loop.
 */
class Simulation
{
public:
    explicit Simulation(SimulationConfig config);

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    [[nodiscard]] const SimulationConfig& config() const noexcept { return m_config; }
    [[nodiscard]] Timestamp now() const noexcept { return m_scheduler.now(); }
    [[nodiscard]] rng::StreamManager& streams() noexcept { return m_streams; }
    [[nodiscard]] rng::RNG& stream(std::string_view name) { return m_streams.stream(name); }
    [[nodiscard]] const book::MatchingEngine& engine() const noexcept { return m_engine; }
    [[nodiscard]] const accounting::Ledger& ledger() const noexcept { return m_ledger; }
    [[nodiscard]] const event::EventLog& eventLog() const noexcept { return m_eventLog; }
    [[nodiscard]] const scheduler::EventScheduler& scheduler() const noexcept { return m_scheduler; }
    [[nodiscard]] SimulationSignals& signals() noexcept { return m_signals; }
    [[nodiscard]] const std::shared_ptr<spdlog::logger>& logger() const noexcept { return m_logger; }

    [[nodiscard]] std::optional<decimal_t> bestBid() const noexcept { return m_engine.bestBid(); }
    [[nodiscard]] std::optional<decimal_t> bestAsk() const noexcept { return m_engine.bestAsk(); }
    [[nodiscard]] decimal_t depthAt(decimal_t price) const noexcept { return m_engine.depthAt(price); }
    [[nodiscard]] decimal_t depthAt(Side side, decimal_t price) const noexcept
    {
        return m_engine.depthAt(side, price);
    }
    // Every fill the engine produced, in execution order.
    [[nodiscard]] const std::vector<book::Fill>& fills() const noexcept { return m_fills; }
    [[nodiscard]] accounting::AccountSnapshot snapshot(const Owner& owner) const
    {
        return m_ledger.snapshot(owner);
    }
    [[nodiscard]] const std::vector<Rejection>& rejections() const noexcept { return m_rejections; }

    /**
     * Validate `intent` and schedule it as an order event after the
     * submission latency. An order id is assigned when `intent.orderId` is 0.
     * Invalid intents are acknowledged as not accepted and never scheduled.
     */
    SubmitAck submit(book::OrderIntent intent);

    event::Event cancel(event::CancelPayload payload);

    /**
     * Schedule an arbitrary event. Throws ConfigurationError if `atTime` is
     * before the current time.
     */
    event::Event schedule(event::Payload payload, Timestamp atTime, int32_t priority = 0);

    // Process the next event, if any.
    std::optional<event::Event> step();
    size_t run();
    size_t runUntil(Timestamp until);

    // Reconcile the ledger; throws AccountingInvariantError if it does not net out.
    void finish() const;

    template<typename... Args>
    void logDebug(fmt::format_string<Args...> fmt, Args&&... args) const
    {
        if (m_config.debug()) {
            fmt::print("[{}] {}\n", now(), fmt::format(fmt, std::forward<Args>(args)...));
        }
    }

private:
    [[nodiscard]] Timestamp after(Timedelta delay) const noexcept
    {
        return now() + static_cast<Timestamp>(delay);
    }

    void process(const event::Event& event);
    void processOrder(const event::Event& event);
    void processCancel(const event::Event& event);
    void processFill(const event::Event& event);
    void reject(const event::Event& event, const SimulationException& exc);

    SimulationConfig m_config;
    std::shared_ptr<spdlog::logger> m_logger;
    rng::StreamManager m_streams;
    scheduler::EventScheduler m_scheduler;
    book::MatchingEngine m_engine;
    accounting::Ledger m_ledger;
    event::EventLog m_eventLog;
    std::vector<book::Fill> m_fills;
    std::vector<Rejection> m_rejections;
    SimulationSignals m_signals;
    EventID m_eventIdCounter{};
    OrderID m_orderIdCounter{};
};

//-------------------------------------------------------------------------

}  // namespace microsim::simulation

//-------------------------------------------------------------------------
