/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/event/Event.hpp"
#include "microsim/event/EventLogWriter.hpp"

#include <memory>
#include <vector>

//-------------------------------------------------------------------------

namespace microsim::event
{

//-------------------------------------------------------------------------

/**
 * Append-only record of every processed event, in processing order. This is
 * the canonical artifact of a run: replaying it against a fresh core must
 * reproduce the run's fills, accounts and book.
 */
class EventLog
{
public:
    using const_iterator = std::vector<Event>::const_iterator;

    EventLog() noexcept = default;

    void append(Event event);

    [[nodiscard]] const std::vector<Event>& events() const noexcept { return m_events; }
    [[nodiscard]] size_t size() const noexcept { return m_events.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_events.empty(); }
    [[nodiscard]] const_iterator begin() const noexcept { return m_events.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return m_events.end(); }

    [[nodiscard]] std::vector<book::Fill> fills() const;

    void setWriter(std::unique_ptr<EventLogWriter> writer) noexcept { m_writer = std::move(writer); }

    [[nodiscard]] std::string toJsonLines() const;
    void dump(const fs::path& path) const;

    [[nodiscard]] static EventLog fromJsonLines(std::string_view lines);
    [[nodiscard]] static EventLog load(const fs::path& path);

private:
    std::vector<Event> m_events;
    std::unique_ptr<EventLogWriter> m_writer;
};

//-------------------------------------------------------------------------

}  // namespace microsim::event

//-------------------------------------------------------------------------
