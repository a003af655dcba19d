/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/common/common.hpp"

//-------------------------------------------------------------------------

namespace microsim::scheduler
{

//-------------------------------------------------------------------------

class EventClock
{
public:
    explicit EventClock(Timestamp start = {}) noexcept : m_now{start} {}

    [[nodiscard]] Timestamp now() const noexcept { return m_now; }

    Timestamp advance(Timedelta delta);
    Timestamp advanceTo(Timestamp timestamp);

private:
    Timestamp m_now;
};

//-------------------------------------------------------------------------

}  // namespace microsim::scheduler

//-------------------------------------------------------------------------
