/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/event/EventKind.hpp"

#include "microsim/common/SimulationException.hpp"

#include <cctype>

//-------------------------------------------------------------------------

namespace microsim::event
{

//-------------------------------------------------------------------------

std::string kind2str(EventKind kind)
{
    std::string name{magic_enum::enum_name(kind)};
    for (char& c : name) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return name;
}

//-------------------------------------------------------------------------

EventKind str2kind(std::string_view str)
{
    if (auto kind = magic_enum::enum_cast<EventKind>(str, magic_enum::case_insensitive)) {
        return *kind;
    }
    throw SimulationException{fmt::format(
        "{}: Unknown event kind '{}'", std::source_location::current().function_name(), str)};
}

//-------------------------------------------------------------------------

}  // namespace microsim::event

//-------------------------------------------------------------------------
