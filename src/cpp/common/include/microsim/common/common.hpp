/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/common/Timestamp.hpp"
#include "microsim/decimal/decimal.hpp"

#include <boost/signals2.hpp>
#include <fmt/core.h>
#include <fmt/format.h>
#include <magic_enum.hpp>
#include <range/v3/all.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

namespace bs2 = boost::signals2;
namespace views = ranges::views;

using namespace microsim::literals;

//-------------------------------------------------------------------------

namespace microsim
{

using OrderID = uint64_t;
using FillID = uint64_t;
using EventID = uint64_t;
using SequenceNumber = uint64_t;
using Owner = std::string;

template<typename SlotType>
requires requires { typename std::function<SlotType>; }
using UnsyncSignal =
    typename bs2::signal_type<SlotType, bs2::keywords::mutex_type<bs2::dummy_mutex>>::type;

//-------------------------------------------------------------------------

enum class Side : uint32_t
{
    BUY,
    SELL
};

[[nodiscard]] constexpr Side opposite(Side side) noexcept
{
    return side == Side::BUY ? Side::SELL : Side::BUY;
}

[[nodiscard]] constexpr std::string_view side2str(Side side) noexcept
{
    return side == Side::BUY ? "buy" : "sell";
}

}  // namespace microsim

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<microsim::Side> : fmt::formatter<std::string_view>
{
    template<typename FormatContext>
    auto format(microsim::Side side, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(microsim::side2str(side), ctx);
    }
};

//-------------------------------------------------------------------------
