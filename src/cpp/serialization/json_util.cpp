/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/serialization/json_util.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace microsim::json
{

//-------------------------------------------------------------------------

std::string json2str(const rapidjson::Value& json)
{
    rapidjson::StringBuffer buffer;
    rapidjson::Writer writer{buffer};
    writer.SetMaxDecimalPlaces(kMaxDecimalPlaces);
    json.Accept(writer);
    return std::string{buffer.GetString(), buffer.GetSize()};
}

//-------------------------------------------------------------------------

rapidjson::Document str2json(std::string_view str)
{
    static constexpr size_t kMaxCharsShown = 120uz;

    rapidjson::Document json;
    json.Parse(str.data(), str.size());
    if (json.HasParseError()) {
        const auto shown = str.substr(0, kMaxCharsShown);
        throw std::invalid_argument{fmt::format(
            "{}: Malformed Json at offset {}: {}{}",
            std::source_location::current().function_name(),
            json.GetErrorOffset(),
            shown,
            shown.size() < str.size() ? "..." : "")};
    }
    return json;
}

//-------------------------------------------------------------------------

const rapidjson::Value& getMember(const rapidjson::Value& json, const char* name)
{
    if (!json.IsObject() || !json.HasMember(name)) {
        throw std::invalid_argument{fmt::format(
            "{}: Missing member '{}' in {}",
            std::source_location::current().function_name(),
            name,
            json2str(json))};
    }
    return json[name];
}

//-------------------------------------------------------------------------

namespace
{

[[noreturn]] void throwMistyped(
    const rapidjson::Value& json,
    const char* name,
    std::string_view expected,
    std::source_location loc = std::source_location::current())
{
    throw std::invalid_argument{fmt::format(
        "{}: Member '{}' should be {} in {}", loc.function_name(), name, expected, json2str(json))};
}

}  // namespace

//-------------------------------------------------------------------------

uint64_t getUint64(const rapidjson::Value& json, const char* name)
{
    const auto& member = getMember(json, name);
    if (!member.IsUint64()) {
        throwMistyped(json, name, "an unsigned integer");
    }
    return member.GetUint64();
}

//-------------------------------------------------------------------------

uint32_t getUint(const rapidjson::Value& json, const char* name)
{
    const auto& member = getMember(json, name);
    if (!member.IsUint()) {
        throwMistyped(json, name, "an unsigned integer");
    }
    return member.GetUint();
}

//-------------------------------------------------------------------------

int32_t getInt(const rapidjson::Value& json, const char* name)
{
    const auto& member = getMember(json, name);
    if (!member.IsInt()) {
        throwMistyped(json, name, "an integer");
    }
    return member.GetInt();
}

//-------------------------------------------------------------------------

const char* getString(const rapidjson::Value& json, const char* name)
{
    const auto& member = getMember(json, name);
    if (!member.IsString()) {
        throwMistyped(json, name, "a string");
    }
    return member.GetString();
}

//-------------------------------------------------------------------------

decimal_t getDecimal(const rapidjson::Value& json)
{
    if (json.IsUint64()) [[likely]] {
        return util::unpackDecimal(json.GetUint64());
    }
    if (json.IsNumber()) {
        return util::double2decimal(json.GetDouble());
    }
    throw std::invalid_argument{fmt::format(
        "{}: Cannot read a decimal from {}",
        std::source_location::current().function_name(),
        json2str(json))};
}

//-------------------------------------------------------------------------

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer)
{
    if (key.empty()) return serializer(json);
    if (!json.IsObject()) {
        json.SetObject();
    }
    auto& allocator = json.GetAllocator();
    rapidjson::Document subJson{&allocator};
    serializer(subJson);
    json.AddMember(rapidjson::Value{key.c_str(), allocator}, subJson, allocator);
}

//-------------------------------------------------------------------------

}  // namespace microsim::json

//-------------------------------------------------------------------------
