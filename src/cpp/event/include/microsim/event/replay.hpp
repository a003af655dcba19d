/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/event/Event.hpp"

#include <algorithm>
#include <concepts>
#include <functional>
#include <vector>

//-------------------------------------------------------------------------

namespace microsim::event
{

//-------------------------------------------------------------------------

/**
 * Fold `reducer` over `events` in canonical event order. The incoming order
 * of `events` is irrelevant; ties on (timestamp, priority, sequence) are
 * broken by event id.
 */
template<typename State, typename Reducer>
requires std::invocable<Reducer&, State, const Event&>
[[nodiscard]] State replayEvents(std::vector<Event> events, State state, Reducer&& reducer)
{
    std::ranges::sort(events, {}, [](const Event& event) {
        return std::make_tuple(event.timestamp, event.priority, event.sequence, event.eventId);
    });
    for (const auto& event : events) {
        state = std::invoke(reducer, std::move(state), event);
    }
    return state;
}

//-------------------------------------------------------------------------

}  // namespace microsim::event

//-------------------------------------------------------------------------
