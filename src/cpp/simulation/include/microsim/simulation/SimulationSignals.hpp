/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/event/Event.hpp"

//-------------------------------------------------------------------------

namespace microsim::simulation
{

//-------------------------------------------------------------------------

/**
 * A locally recoverable failure while processing an event: an order that
 * failed validation at the engine or a cancel for an unknown or finished order.
 */
struct Rejection
{
    EventID eventId{};
    Timestamp timestamp{};
    event::EventKind kind{};
    std::string reason;
};

//-------------------------------------------------------------------------

struct SimulationSignals
{
    UnsyncSignal<void(const event::Event&)> step;
    UnsyncSignal<void(const book::Fill&)> fill;
    UnsyncSignal<void(const Rejection&)> rejection;
    // News, batch clears and RFQ traffic are not interpreted by the core.
    UnsyncSignal<void(const event::Event&)> external;
};

//-------------------------------------------------------------------------

}  // namespace microsim::simulation

//-------------------------------------------------------------------------
