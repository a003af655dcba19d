/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/scheduler/EventClock.hpp"

#include "microsim/common/SimulationException.hpp"

//-------------------------------------------------------------------------

namespace microsim::scheduler
{

//-------------------------------------------------------------------------

Timestamp EventClock::advance(Timedelta delta)
{
    if (delta < 0) {
        throw ConfigurationError{fmt::format(
            "{}: Time cannot move backwards (delta {})",
            std::source_location::current().function_name(),
            delta)};
    }
    m_now += static_cast<Timestamp>(delta);
    return m_now;
}

//-------------------------------------------------------------------------

Timestamp EventClock::advanceTo(Timestamp timestamp)
{
    if (timestamp < m_now) {
        throw ConfigurationError{fmt::format(
            "{}: Cannot move from t={} back to t={}",
            std::source_location::current().function_name(),
            m_now,
            timestamp)};
    }
    m_now = timestamp;
    return m_now;
}

//-------------------------------------------------------------------------

}  // namespace microsim::scheduler

//-------------------------------------------------------------------------
