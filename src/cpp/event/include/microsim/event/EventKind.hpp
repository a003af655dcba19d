/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/common/common.hpp"

#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace microsim::event
{

enum class EventKind : uint32_t
{
    NEWS,
    ORDER,
    CANCEL,
    FILL,
    BATCH_CLEAR,
    RFQ_REQUEST,
    RFQ_QUOTE,
    RFQ_ACCEPT
};

// Wire names are the lower-cased enumerator names, e.g. "batch_clear".
[[nodiscard]] std::string kind2str(EventKind kind);
[[nodiscard]] EventKind str2kind(std::string_view str);

}  // namespace microsim::event

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<microsim::event::EventKind> : fmt::formatter<std::string_view>
{
    template<typename FormatContext>
    auto format(microsim::event::EventKind kind, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(microsim::event::kind2str(kind), ctx);
    }
};

//-------------------------------------------------------------------------
