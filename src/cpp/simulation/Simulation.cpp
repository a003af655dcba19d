/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/simulation/Simulation.hpp"

#include "microsim/common/SimulationException.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

//-------------------------------------------------------------------------

namespace microsim::simulation
{

//-------------------------------------------------------------------------

namespace
{

std::shared_ptr<spdlog::logger> makeLogger(const SimulationConfig& config)
{
    std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stderr_color_sink_st>()};
    if (const auto& logDir = config.logDir()) {
        fs::create_directories(*logDir);
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_st>(
            (*logDir / "microsim.log").string(), true));
    }
    auto logger = std::make_shared<spdlog::logger>("microsim", sinks.begin(), sinks.end());
    logger->set_level(config.debug() ? spdlog::level::debug : spdlog::level::warn);
    return logger;
}

}  // namespace

//-------------------------------------------------------------------------

Simulation::Simulation(SimulationConfig config)
    : m_config{std::move(config)},
      m_logger{makeLogger(m_config)},
      m_streams{m_config.seed()},
      m_engine{
          book::MatchingEngine::Parameters{
              .validation = m_config.bookBounds(),
              .tieBreak = m_config.tieBreak()},
          &m_streams,
          m_logger},
      m_ledger{m_config.pnlConvention()}
{
    for (const auto& holdings : m_config.accounts()) {
        m_ledger.openAccount(holdings);
    }
    if (const auto& logDir = m_config.logDir()) {
        m_eventLog.setWriter(std::make_unique<event::EventLogWriter>(*logDir / "events.jsonl"));
    }
    m_logger->debug(
        "Simulation configured: seed {}, {} accounts, tie-break {}, P&L {}",
        m_config.seed(),
        m_config.accounts().size(),
        magic_enum::enum_name(m_config.tieBreak()),
        magic_enum::enum_name(m_config.pnlConvention()));
}

//-------------------------------------------------------------------------

SubmitAck Simulation::submit(book::OrderIntent intent)
{
    if (const auto res = m_engine.validator().validate(intent); !res) {
        m_logger->warn(
            "Order intent from '{}' refused: {}", intent.owner, magic_enum::enum_name(res.error()));
        return SubmitAck{.accepted = false, .reason = res.error()};
    }

    if (intent.orderId == 0) {
        intent.orderId = ++m_orderIdCounter;
    } else {
        m_orderIdCounter = std::max(m_orderIdCounter, intent.orderId);
    }
    const OrderID orderId = intent.orderId;

    const auto event = schedule(
        event::OrderPayload{.intent = std::move(intent)}, after(m_config.latency().submission));

    return SubmitAck{.accepted = true, .eventId = event.eventId, .orderId = orderId};
}

//-------------------------------------------------------------------------

event::Event Simulation::cancel(event::CancelPayload payload)
{
    return schedule(std::move(payload), after(m_config.latency().cancel));
}

//-------------------------------------------------------------------------

event::Event Simulation::schedule(event::Payload payload, Timestamp atTime, int32_t priority)
{
    auto scheduled = m_scheduler.schedule(
        event::Event{.eventId = m_eventIdCounter + 1, .payload = std::move(payload)},
        atTime,
        priority);
    ++m_eventIdCounter;
    logDebug("Scheduled {}", scheduled);
    return scheduled;
}

//-------------------------------------------------------------------------

std::optional<event::Event> Simulation::step()
{
    if (m_scheduler.empty()) return std::nullopt;

    event::Event event = m_scheduler.advance();
    logDebug("Processing {}", event);
    process(event);
    m_eventLog.append(event);
    m_signals.step(event);

    return event;
}

//-------------------------------------------------------------------------

size_t Simulation::run()
{
    size_t processed{};
    while (step()) {
        ++processed;
    }
    return processed;
}

//-------------------------------------------------------------------------

size_t Simulation::runUntil(Timestamp until)
{
    size_t processed{};
    for (auto next = m_scheduler.nextTimestamp(); next && *next <= until;
         next = m_scheduler.nextTimestamp()) {
        step();
        ++processed;
    }
    return processed;
}

//-------------------------------------------------------------------------

void Simulation::finish() const
{
    try {
        m_ledger.reconcile();
    }
    catch (const AccountingInvariantError& exc) {
        m_logger->critical("Reconciliation failed at t={}: {}", now(), exc.what());
        throw;
    }
    m_logger->debug(
        "Run finished at t={}: {} events, {} fills, {} rejections",
        now(),
        m_eventLog.size(),
        m_fills.size(),
        m_rejections.size());
}

//-------------------------------------------------------------------------

void Simulation::process(const event::Event& event)
{
    switch (event.kind()) {
        case event::EventKind::ORDER:
            processOrder(event);
            break;
        case event::EventKind::CANCEL:
            processCancel(event);
            break;
        case event::EventKind::FILL:
            processFill(event);
            break;
        default:
            m_signals.external(event);
            break;
    }
}

//-------------------------------------------------------------------------

void Simulation::processOrder(const event::Event& event)
{
    const auto& intent = event.as<event::OrderPayload>().intent;
    book::MatchResult result;
    try {
        result = m_engine.process(intent, event.timestamp, event.sequence);
    }
    catch (const InvalidOrderError& exc) {
        reject(event, exc);
        return;
    }
    logDebug(
        "Order #{} {} with {} fill(s), {} remaining",
        result.orderId,
        magic_enum::enum_name(result.status),
        result.fills.size(),
        result.quantityRemaining);
    for (const auto& fill : result.fills) {
        m_fills.push_back(fill);
        schedule(event::FillPayload{.fill = fill}, after(m_config.latency().fill));
    }
}

//-------------------------------------------------------------------------

void Simulation::processCancel(const event::Event& event)
{
    const auto& payload = event.as<event::CancelPayload>();
    try {
        const auto result = m_engine.cancel(payload.orderId, payload.owner);
        logDebug("Order #{} canceled, {} released", result.orderId, result.canceledQuantity);
    }
    catch (const OrderNotFoundError& exc) {
        reject(event, exc);
    }
}

//-------------------------------------------------------------------------

void Simulation::processFill(const event::Event& event)
{
    const auto& fill = event.as<event::FillPayload>().fill;
    try {
        m_ledger.apply(fill);
    }
    catch (const AccountingInvariantError& exc) {
        m_logger->critical("Ledger rejected {}: {}", fill, exc.what());
        throw;
    }
    m_signals.fill(fill);
}

//-------------------------------------------------------------------------

void Simulation::reject(const event::Event& event, const SimulationException& exc)
{
    m_logger->warn("Rejected {}: {}", event, exc.what());
    Rejection& rejection = m_rejections.emplace_back(Rejection{
        .eventId = event.eventId,
        .timestamp = event.timestamp,
        .kind = event.kind(),
        .reason = exc.what()});
    m_signals.rejection(rejection);
}

//-------------------------------------------------------------------------

}  // namespace microsim::simulation

//-------------------------------------------------------------------------
