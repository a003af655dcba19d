/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/event/Event.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <memory>

//-------------------------------------------------------------------------

namespace microsim::event
{

//-------------------------------------------------------------------------

/**
 * Mirrors processed events to a JSON-lines file, one event per line.
 */
class EventLogWriter
{
public:
    explicit EventLogWriter(const fs::path& filepath);

    [[nodiscard]] const fs::path& filepath() const noexcept { return m_filepath; }

    void write(const Event& event);

private:
    std::unique_ptr<spdlog::logger> m_logger;
    fs::path m_filepath;
};

//-------------------------------------------------------------------------

}  // namespace microsim::event

//-------------------------------------------------------------------------
