/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/event/Payloads.hpp"

#include <tuple>

//-------------------------------------------------------------------------

namespace microsim::event
{

//-------------------------------------------------------------------------

/**
 * Immutable record of simulated activity. Events are totally ordered by
 * (timestamp, priority, sequence); producers in the core all use priority 0,
 * which reduces the order to (timestamp, sequence).
 */
struct Event
{
    EventID eventId{};
    Timestamp timestamp{};
    SequenceNumber sequence{};
    int32_t priority{};
    Payload payload;

    [[nodiscard]] EventKind kind() const noexcept { return payloadKind(payload); }

    [[nodiscard]] auto orderKey() const noexcept
    {
        return std::make_tuple(timestamp, priority, sequence);
    }

    template<typename T>
    [[nodiscard]] const T& as() const;

    void checkpointSerialize(rapidjson::Document& json, const std::string& key = {}) const;
    [[nodiscard]] static Event fromCheckpoint(const rapidjson::Value& json);
};

//-------------------------------------------------------------------------

template<typename T>
const T& Event::as() const
{
    if (const T* pld = std::get_if<T>(&payload)) {
        return *pld;
    }
    throw std::invalid_argument{fmt::format(
        "{}: Event {} carries a '{}' payload",
        std::source_location::current().function_name(),
        eventId,
        kind())};
}

//-------------------------------------------------------------------------

}  // namespace microsim::event

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<microsim::event::Event>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const microsim::event::Event& event, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "Event #{} {} @ t={} seq={}",
            event.eventId,
            event.kind(),
            event.timestamp,
            event.sequence);
    }
};

//-------------------------------------------------------------------------
