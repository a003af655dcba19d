/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <bdldfp_decimal.h>
#include <bdldfp_decimalconvertutil.h>
#include <bdldfp_decimalutil.h>
#include <fmt/format.h>

#include <bit>
#include <cstdint>
#include <spanstream>

//-------------------------------------------------------------------------

#define DEC(lit) BDLDFP_DECIMAL_DD(lit)

//-------------------------------------------------------------------------

namespace microsim
{

using decimal_t = BloombergLP::bdldfp::Decimal64;

}  // namespace microsim

//-------------------------------------------------------------------------

namespace microsim::util
{

inline constexpr uint32_t kDefaultDecimalPlaces = 8;

[[nodiscard]] inline decimal_t round(
    decimal_t val, uint32_t decimalPlaces = kDefaultDecimalPlaces)
{
    return BloombergLP::bdldfp::DecimalUtil::trunc(val, decimalPlaces);
}

[[nodiscard]] inline double decimal2double(decimal_t val)
{
    return BloombergLP::bdldfp::DecimalConvertUtil::decimalToDouble(val);
}

[[nodiscard]] inline decimal_t double2decimal(
    double val, uint32_t decimalPlaces = kDefaultDecimalPlaces)
{
    return round(decimal_t{val}, decimalPlaces);
}

[[nodiscard]] inline uint64_t packDecimal(decimal_t val)
{
    uint64_t packed;
    BloombergLP::bdldfp::DecimalConvertUtil::decimalToDPD(
        std::bit_cast<uint8_t*>(&packed), val);
    return packed;
}

[[nodiscard]] inline decimal_t unpackDecimal(uint64_t val)
{
    decimal_t unpacked;
    BloombergLP::bdldfp::DecimalConvertUtil::decimalFromDPD(
        &unpacked, std::bit_cast<uint8_t*>(&val));
    return unpacked;
}

[[nodiscard]] inline decimal_t abs(decimal_t val) noexcept
{
    return val < decimal_t{} ? -val : val;
}

[[nodiscard]] inline decimal_t min(decimal_t lhs, decimal_t rhs) noexcept
{
    return rhs < lhs ? rhs : lhs;
}

}  // namespace microsim::util

//-------------------------------------------------------------------------

namespace microsim::literals
{

[[nodiscard]] constexpr decimal_t operator"" _dec(unsigned long long int val)
{
    return decimal_t{val};
}

}  // namespace microsim::literals

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<microsim::decimal_t>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(microsim::decimal_t val, FormatContext& ctx) const
    {
        using namespace microsim::literals;
        char buf[32]{};
        std::ospanstream oss{buf};
        if (val == 0_dec) [[unlikely]] {
            oss << "0.0";
        } else {
            oss << val;
        }
        return fmt::format_to(ctx.out(), "{}", buf);
    }
};

//-------------------------------------------------------------------------
