/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/scheduler/EventQueue.hpp"

#include <algorithm>

//-------------------------------------------------------------------------

namespace microsim::scheduler
{

//-------------------------------------------------------------------------

std::vector<event::Event> EventQueue::pending() const
{
    auto events = m_queue.underlying();
    std::ranges::sort(events, {}, &event::Event::orderKey);
    return events;
}

//-------------------------------------------------------------------------

}  // namespace microsim::scheduler

//-------------------------------------------------------------------------
