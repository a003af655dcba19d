/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/scheduler/EventClock.hpp"
#include "microsim/scheduler/EventQueue.hpp"

#include <optional>

//-------------------------------------------------------------------------

namespace microsim::scheduler
{

//-------------------------------------------------------------------------

/**
 * Discrete-event scheduler. Each scheduled event is stamped with the next
 * global sequence number at the moment it is scheduled, so events sharing a
 * timestamp are processed in the order they were scheduled.
 */
class EventScheduler
{
public:
    explicit EventScheduler(Timestamp start = {}) noexcept : m_clock{start} {}

    [[nodiscard]] Timestamp now() const noexcept { return m_clock.now(); }
    [[nodiscard]] bool empty() const noexcept { return m_queue.empty(); }
    [[nodiscard]] size_t size() const noexcept { return m_queue.size(); }
    [[nodiscard]] SequenceNumber lastSequence() const noexcept { return m_sequenceCounter; }
    [[nodiscard]] std::optional<Timestamp> nextTimestamp() const;
    // The event `advance()` would return next; throws if none is pending.
    [[nodiscard]] const event::Event& peek() const;
    [[nodiscard]] std::vector<event::Event> pending() const { return m_queue.pending(); }

    /**
     * Stamp `event` with `atTime`, `priority` and a fresh sequence number and
     * enqueue it. Throws ConfigurationError if `atTime` is in the past.
     */
    event::Event schedule(event::Event event, Timestamp atTime, int32_t priority = 0);

    // Pop the next event and move the clock to its timestamp.
    event::Event advance();

    void clear() noexcept;

private:
    EventClock m_clock;
    EventQueue m_queue;
    SequenceNumber m_sequenceCounter{};
};

//-------------------------------------------------------------------------

}  // namespace microsim::scheduler

//-------------------------------------------------------------------------
