/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/decimal/decimal.hpp"

#include <magic_enum.hpp>
#include <rapidjson/document.h>

#include <functional>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace microsim::json
{

//-------------------------------------------------------------------------

// Doubles in readable output are cut at the decimal precision of the core.
inline constexpr uint32_t kMaxDecimalPlaces = util::kDefaultDecimalPlaces;

// Single line, no insignificant whitespace; one event log entry per call.
[[nodiscard]] std::string json2str(const rapidjson::Value& json);

/**
 * Throws std::invalid_argument on malformed input, quoting its beginning.
 */
[[nodiscard]] rapidjson::Document str2json(std::string_view str);

[[nodiscard]] const rapidjson::Value& getMember(const rapidjson::Value& json, const char* name);

// Typed member access; a missing or mistyped member throws std::invalid_argument.
[[nodiscard]] uint64_t getUint64(const rapidjson::Value& json, const char* name);
[[nodiscard]] uint32_t getUint(const rapidjson::Value& json, const char* name);
[[nodiscard]] int32_t getInt(const rapidjson::Value& json, const char* name);
[[nodiscard]] const char* getString(const rapidjson::Value& json, const char* name);

/**
 * Enums are stored either by name or by underlying value. Values outside
 * the enumeration are rejected rather than defaulted.
 */
template<typename E>
requires std::is_enum_v<E>
[[nodiscard]] E getEnum(const rapidjson::Value& json, const char* name)
{
    const auto& member = getMember(json, name);
    std::optional<E> value;
    if (member.IsString()) {
        value = magic_enum::enum_cast<E>(
            std::string_view{member.GetString(), member.GetStringLength()});
    } else if (member.IsUint()) {
        value = magic_enum::enum_cast<E>(member.GetUint());
    }
    if (!value) {
        throw std::invalid_argument{fmt::format(
            "{}: Member '{}' is not a valid {}",
            std::source_location::current().function_name(),
            name,
            magic_enum::enum_type_name<E>())};
    }
    return *value;
}

/**
 * Decimals round-trip exactly when stored packed (uint64); doubles are
 * accepted for hand-written input.
 */
[[nodiscard]] decimal_t getDecimal(const rapidjson::Value& json);

[[nodiscard]] inline rapidjson::Value packedDecimal(decimal_t val)
{
    return rapidjson::Value{util::packDecimal(val)};
}

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer);

//-------------------------------------------------------------------------

}  // namespace microsim::json

//-------------------------------------------------------------------------
