/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/common/common.hpp"

#include <fmt/ranges.h>

#include <stdexcept>

//-------------------------------------------------------------------------

namespace microsim
{

//-------------------------------------------------------------------------

class SimulationException : public std::runtime_error
{
public:
    SimulationException(const std::string& message) : std::runtime_error(message) {}
    SimulationException(const SimulationException& exception) = default;
    SimulationException(SimulationException&& exception) = default;
};

//-------------------------------------------------------------------------

/**
 * Setup-time failure: stream manager used before initialization, malformed
 * configuration, scheduling into the past.
 */
class ConfigurationError : public SimulationException
{
public:
    using SimulationException::SimulationException;
};

//-------------------------------------------------------------------------

class InvalidOrderError : public SimulationException
{
public:
    using SimulationException::SimulationException;
};

//-------------------------------------------------------------------------

class OrderNotFoundError : public SimulationException
{
public:
    OrderNotFoundError(OrderID orderId, const std::string& message)
        : SimulationException{message}, m_orderId{orderId}
    {}

    [[nodiscard]] OrderID orderId() const noexcept { return m_orderId; }

private:
    OrderID m_orderId;
};

//-------------------------------------------------------------------------

/**
 * Fatal. Carries the ids of every fill involved in the violation so that the
 * offending part of the event log can be located.
 */
class AccountingInvariantError : public SimulationException
{
public:
    AccountingInvariantError(const std::string& message, std::vector<FillID> fillIds)
        : SimulationException{fmt::format("{} [fills: {}]", message, fmt::join(fillIds, ", "))},
          m_fillIds{std::move(fillIds)}
    {}

    [[nodiscard]] const std::vector<FillID>& fillIds() const noexcept { return m_fillIds; }

private:
    std::vector<FillID> m_fillIds;
};

//-------------------------------------------------------------------------

class ReplayDivergenceError : public SimulationException
{
public:
    ReplayDivergenceError(
        const std::string& message,
        std::optional<EventID> eventId = {},
        std::source_location sl = std::source_location::current())
        : SimulationException{fmt::format(
            "Replay divergence @ {}#L{}{}: {}",
            sl.file_name(),
            sl.line(),
            eventId ? fmt::format(" (event {})", *eventId) : "",
            message)},
          m_eventId{eventId}
    {}

    [[nodiscard]] std::optional<EventID> eventId() const noexcept { return m_eventId; }

private:
    std::optional<EventID> m_eventId;
};

//-------------------------------------------------------------------------

}  // namespace microsim

//-------------------------------------------------------------------------
