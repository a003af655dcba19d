/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/event/EventLogWriter.hpp"

//-------------------------------------------------------------------------

namespace microsim::event
{

//-------------------------------------------------------------------------

EventLogWriter::EventLogWriter(const fs::path& filepath)
    : m_filepath{filepath}
{
    m_logger = std::make_unique<spdlog::logger>(
        "EventLogWriter",
        std::make_unique<spdlog::sinks::basic_file_sink_st>(m_filepath.string(), true));
    m_logger->set_level(spdlog::level::trace);
    m_logger->set_pattern("%v");
}

//-------------------------------------------------------------------------

void EventLogWriter::write(const Event& event)
{
    rapidjson::Document json;
    event.checkpointSerialize(json);
    m_logger->trace(json::json2str(json));
    m_logger->flush();
}

//-------------------------------------------------------------------------

}  // namespace microsim::event

//-------------------------------------------------------------------------
