/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/event/Event.hpp"

//-------------------------------------------------------------------------

namespace microsim::event
{

//-------------------------------------------------------------------------

void Event::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("id", rapidjson::Value{eventId}, allocator);
        json.AddMember("ts", rapidjson::Value{timestamp}, allocator);
        json.AddMember("seq", rapidjson::Value{sequence}, allocator);
        json.AddMember("prio", rapidjson::Value{priority}, allocator);
        json.AddMember("kind", rapidjson::Value{kind2str(kind()).c_str(), allocator}, allocator);
        std::visit([&](const auto& pld) { pld.checkpointSerialize(json, "pld"); }, payload);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

Event Event::fromCheckpoint(const rapidjson::Value& json)
{
    const EventKind kind = str2kind(json::getString(json, "kind"));
    return Event{
        .eventId = json::getUint64(json, "id"),
        .timestamp = json::getUint64(json, "ts"),
        .sequence = json::getUint64(json, "seq"),
        .priority = json::getInt(json, "prio"),
        .payload = payloadFromCheckpoint(kind, json::getMember(json, "pld"))};
}

//-------------------------------------------------------------------------

}  // namespace microsim::event

//-------------------------------------------------------------------------
