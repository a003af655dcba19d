/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/scheduler/EventScheduler.hpp"

#include "microsim/common/SimulationException.hpp"

//-------------------------------------------------------------------------

namespace microsim::scheduler
{

//-------------------------------------------------------------------------

std::optional<Timestamp> EventScheduler::nextTimestamp() const
{
    if (m_queue.empty()) return std::nullopt;
    return m_queue.top().timestamp;
}

//-------------------------------------------------------------------------

event::Event EventScheduler::schedule(event::Event event, Timestamp atTime, int32_t priority)
{
    if (atTime < m_clock.now()) {
        throw ConfigurationError{fmt::format(
            "{}: Cannot schedule {} at t={}, current time is t={}",
            std::source_location::current().function_name(),
            event.kind(),
            atTime,
            m_clock.now())};
    }
    event.timestamp = atTime;
    event.priority = priority;
    event.sequence = ++m_sequenceCounter;
    m_queue.push(event);
    return event;
}

//-------------------------------------------------------------------------

const event::Event& EventScheduler::peek() const
{
    if (m_queue.empty()) {
        throw SimulationException{fmt::format(
            "{}: No pending events", std::source_location::current().function_name())};
    }
    return m_queue.top();
}

//-------------------------------------------------------------------------

event::Event EventScheduler::advance()
{
    event::Event event = peek();
    m_queue.pop();
    m_clock.advanceTo(event.timestamp);
    return event;
}

//-------------------------------------------------------------------------

void EventScheduler::clear() noexcept
{
    m_queue.clear();
}

//-------------------------------------------------------------------------

}  // namespace microsim::scheduler

//-------------------------------------------------------------------------
