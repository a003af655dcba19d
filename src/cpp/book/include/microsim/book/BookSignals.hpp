/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/book/Fill.hpp"
#include "microsim/book/Order.hpp"

//-------------------------------------------------------------------------

namespace microsim::book
{

struct BookSignals
{
    UnsyncSignal<void(const Fill&)> fill;
    UnsyncSignal<void(Order::Ptr)> rested;
    UnsyncSignal<void(Order::Ptr, decimal_t)> canceled;
    UnsyncSignal<void(const Fill&)> uncrossed;
};

}  // namespace microsim::book

//-------------------------------------------------------------------------
