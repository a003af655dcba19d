/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <cstdint>

//-------------------------------------------------------------------------

namespace microsim
{

using Timestamp = uint64_t;
using Timedelta = int64_t;

}  // namespace microsim

//-------------------------------------------------------------------------
