/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/simulation/ReplayAuditor.hpp"

#include "microsim/common/SimulationException.hpp"
#include "microsim/serialization/json_util.hpp"

#include <spdlog/sinks/null_sink.h>

#include <map>

//-------------------------------------------------------------------------

namespace microsim::simulation
{

//-------------------------------------------------------------------------

namespace
{

std::string bookCheckpoint(const book::Book& book)
{
    rapidjson::Document json;
    book.checkpointSerialize(json);
    return json::json2str(json);
}

}  // namespace

//-------------------------------------------------------------------------

ReplayAuditor::ReplayAuditor(SimulationConfig config)
    : m_config{std::move(config)},
      m_logger{std::make_shared<spdlog::logger>(
          "replay", std::make_shared<spdlog::sinks::null_sink_st>())}
{}

//-------------------------------------------------------------------------

ReplayOutcome ReplayAuditor::replay(const event::EventLog& log) const
{
    rng::StreamManager streams{m_config.seed()};
    book::MatchingEngine engine{
        book::MatchingEngine::Parameters{
            .validation = m_config.bookBounds(),
            .tieBreak = m_config.tieBreak()},
        &streams,
        m_logger};
    accounting::Ledger ledger{m_config.pnlConvention()};
    for (const auto& holdings : m_config.accounts()) {
        ledger.openAccount(holdings);
    }

    ReplayOutcome outcome;
    std::map<FillID, book::Fill> produced;
    const event::Event* previous{};

    for (const auto& event : log) {
        if (previous != nullptr && !(previous->orderKey() < event.orderKey())) {
            throw ReplayDivergenceError{
                fmt::format("{} is out of order after {}", event, *previous), event.eventId};
        }
        previous = &event;

        switch (event.kind()) {
            case event::EventKind::ORDER: {
                const auto& intent = event.as<event::OrderPayload>().intent;
                try {
                    auto result = engine.process(intent, event.timestamp, event.sequence);
                    for (auto& fill : result.fills) {
                        produced.emplace(fill.fillId, fill);
                        outcome.fills.push_back(std::move(fill));
                    }
                }
                catch (const InvalidOrderError&) {
                    outcome.rejectedEvents.push_back(event.eventId);
                }
                break;
            }
            case event::EventKind::CANCEL: {
                try {
                    const auto& payload = event.as<event::CancelPayload>();
                    engine.cancel(payload.orderId, payload.owner);
                }
                catch (const OrderNotFoundError&) {
                    outcome.rejectedEvents.push_back(event.eventId);
                }
                break;
            }
            case event::EventKind::FILL: {
                const auto& fill = event.as<event::FillPayload>().fill;
                auto it = produced.find(fill.fillId);
                if (it == produced.end()) {
                    throw ReplayDivergenceError{
                        fmt::format("Logged {} was never produced on replay", fill), event.eventId};
                }
                if (it->second != fill) {
                    throw ReplayDivergenceError{
                        fmt::format("Logged {} differs from replayed {}", fill, it->second),
                        event.eventId};
                }
                ledger.apply(fill);
                outcome.settledFills.push_back(fill);
                break;
            }
            default:
                break;
        }
    }

    outcome.accounts = ledger.snapshots();
    outcome.book = bookCheckpoint(engine.book());

    return outcome;
}

//-------------------------------------------------------------------------

void ReplayAuditor::audit(const Simulation& simulation) const
{
    audit(simulation.eventLog(), simulation);
}

//-------------------------------------------------------------------------

void ReplayAuditor::audit(const event::EventLog& log, const Simulation& reference) const
{
    const ReplayOutcome outcome = replay(log);

    const auto& fills = reference.fills();
    for (size_t i{}; i < std::min(fills.size(), outcome.fills.size()); ++i) {
        if (fills[i] != outcome.fills[i]) {
            throw ReplayDivergenceError{fmt::format(
                "Fill #{} diverged: run produced {}, replay produced {}",
                i,
                fills[i],
                outcome.fills[i])};
        }
    }
    if (fills.size() != outcome.fills.size()) {
        throw ReplayDivergenceError{fmt::format(
            "Run produced {} fills, replay produced {}", fills.size(), outcome.fills.size())};
    }

    const auto rejected = reference.rejections()
        | views::transform(&Rejection::eventId)
        | ranges::to<std::vector>;
    if (rejected != outcome.rejectedEvents) {
        throw ReplayDivergenceError{fmt::format(
            "Rejected events diverged: run [{}], replay [{}]",
            fmt::join(rejected, ", "),
            fmt::join(outcome.rejectedEvents, ", "))};
    }

    const auto accounts = reference.ledger().snapshots();
    if (accounts.size() != outcome.accounts.size()) {
        throw ReplayDivergenceError{fmt::format(
            "Run has {} accounts, replay has {}", accounts.size(), outcome.accounts.size())};
    }
    for (const auto& [expected, actual] : views::zip(accounts, outcome.accounts)) {
        if (expected != actual) {
            throw ReplayDivergenceError{
                fmt::format("Account diverged: run {}, replay {}", expected, actual)};
        }
    }

    if (bookCheckpoint(reference.engine().book()) != outcome.book) {
        throw ReplayDivergenceError{"Book contents diverged"};
    }
}

//-------------------------------------------------------------------------

}  // namespace microsim::simulation

//-------------------------------------------------------------------------
