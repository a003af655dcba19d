/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/event/EventLog.hpp"

#include "microsim/common/SimulationException.hpp"
#include "microsim/common/util.hpp"

#include <fstream>
#include <sstream>

//-------------------------------------------------------------------------

namespace microsim::event
{

//-------------------------------------------------------------------------

void EventLog::append(Event event)
{
    if (!m_events.empty() && !(m_events.back().orderKey() < event.orderKey())) {
        throw SimulationException{fmt::format(
            "{}: {} does not follow {} in event order",
            std::source_location::current().function_name(),
            event,
            m_events.back())};
    }
    if (m_writer) {
        m_writer->write(event);
    }
    m_events.push_back(std::move(event));
}

//-------------------------------------------------------------------------

std::vector<book::Fill> EventLog::fills() const
{
    return m_events
        | views::filter([](const Event& event) { return event.kind() == EventKind::FILL; })
        | views::transform([](const Event& event) { return event.as<FillPayload>().fill; })
        | ranges::to<std::vector>;
}

//-------------------------------------------------------------------------

std::string EventLog::toJsonLines() const
{
    std::string lines;
    for (const auto& event : m_events) {
        rapidjson::Document json;
        event.checkpointSerialize(json);
        lines += json::json2str(json);
        lines += '\n';
    }
    return lines;
}

//-------------------------------------------------------------------------

void EventLog::dump(const fs::path& path) const
{
    std::ofstream ofs{path};
    if (!ofs) {
        throw SimulationException{fmt::format(
            "{}: Unable to open '{}' for writing",
            std::source_location::current().function_name(),
            path.c_str())};
    }
    ofs << toJsonLines();
}

//-------------------------------------------------------------------------

EventLog EventLog::fromJsonLines(std::string_view lines)
{
    EventLog log;
    size_t lineCounter{};
    for (const auto& line : util::split(lines, '\n')) {
        ++lineCounter;
        if (line.empty()) continue;
        try {
            log.append(Event::fromCheckpoint(json::str2json(line)));
        }
        catch (const std::invalid_argument& exc) {
            throw SimulationException{fmt::format(
                "{}: Malformed event log entry on line {}: {}",
                std::source_location::current().function_name(),
                lineCounter,
                exc.what())};
        }
    }
    return log;
}

//-------------------------------------------------------------------------

EventLog EventLog::load(const fs::path& path)
{
    std::ifstream ifs{path};
    if (!ifs) {
        throw SimulationException{fmt::format(
            "{}: Unable to open '{}'", std::source_location::current().function_name(), path.c_str())};
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return fromJsonLines(buffer.str());
}

//-------------------------------------------------------------------------

}  // namespace microsim::event

//-------------------------------------------------------------------------
