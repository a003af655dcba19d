/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/event/Payloads.hpp"

#include "microsim/common/SimulationException.hpp"

//-------------------------------------------------------------------------

namespace microsim::event
{

//-------------------------------------------------------------------------

void NewsPayload::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("src", rapidjson::Value{source.c_str(), allocator}, allocator);
        json.AddMember("h", rapidjson::Value{headline.c_str(), allocator}, allocator);
        json.AddMember("sig", json::packedDecimal(signal), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

NewsPayload NewsPayload::fromCheckpoint(const rapidjson::Value& json)
{
    return NewsPayload{
        .source = json::getString(json, "src"),
        .headline = json::getString(json, "h"),
        .signal = json::getDecimal(json::getMember(json, "sig"))};
}

//-------------------------------------------------------------------------

void OrderPayload::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("i", rapidjson::Value{intent.orderId}, allocator);
        json.AddMember("o", rapidjson::Value{intent.owner.c_str(), allocator}, allocator);
        json.AddMember("d", rapidjson::Value{std::to_underlying(intent.side)}, allocator);
        json.AddMember("p", json::packedDecimal(intent.price), allocator);
        json.AddMember("q", json::packedDecimal(intent.quantity), allocator);
        json.AddMember(
            "f",
            rapidjson::Value{magic_enum::enum_name(intent.timeInForce).data(), allocator},
            allocator);
    };
    json::serializeHelper(json, key, serialize);
}

OrderPayload OrderPayload::fromCheckpoint(const rapidjson::Value& json)
{
    return OrderPayload{
        .intent = book::OrderIntent{
            .orderId = json::getUint64(json, "i"),
            .owner = json::getString(json, "o"),
            .side = json::getEnum<Side>(json, "d"),
            .price = json::getDecimal(json::getMember(json, "p")),
            .quantity = json::getDecimal(json::getMember(json, "q")),
            .timeInForce = json::getEnum<book::TimeInForce>(json, "f")}};
}

//-------------------------------------------------------------------------

void CancelPayload::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("i", rapidjson::Value{orderId}, allocator);
        json.AddMember("o", rapidjson::Value{owner.c_str(), allocator}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

CancelPayload CancelPayload::fromCheckpoint(const rapidjson::Value& json)
{
    return CancelPayload{.orderId = json::getUint64(json, "i"), .owner = json::getString(json, "o")};
}

//-------------------------------------------------------------------------

void FillPayload::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    fill.checkpointSerialize(json, key);
}

FillPayload FillPayload::fromCheckpoint(const rapidjson::Value& json)
{
    return FillPayload{.fill = book::Fill::fromCheckpoint(json)};
}

//-------------------------------------------------------------------------

void BatchClearPayload::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("p", json::packedDecimal(clearingPrice), allocator);
        json.AddMember("v", json::packedDecimal(volume), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

BatchClearPayload BatchClearPayload::fromCheckpoint(const rapidjson::Value& json)
{
    return BatchClearPayload{
        .clearingPrice = json::getDecimal(json::getMember(json, "p")), .volume = json::getDecimal(json::getMember(json, "v"))};
}

//-------------------------------------------------------------------------

void RfqRequestPayload::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("r", rapidjson::Value{requestId}, allocator);
        json.AddMember("o", rapidjson::Value{owner.c_str(), allocator}, allocator);
        json.AddMember("d", rapidjson::Value{std::to_underlying(side)}, allocator);
        json.AddMember("q", json::packedDecimal(quantity), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

RfqRequestPayload RfqRequestPayload::fromCheckpoint(const rapidjson::Value& json)
{
    return RfqRequestPayload{
        .requestId = json::getUint64(json, "r"),
        .owner = json::getString(json, "o"),
        .side = json::getEnum<Side>(json, "d"),
        .quantity = json::getDecimal(json::getMember(json, "q"))};
}

//-------------------------------------------------------------------------

void RfqQuotePayload::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("r", rapidjson::Value{requestId}, allocator);
        json.AddMember("qi", rapidjson::Value{quoteId}, allocator);
        json.AddMember("o", rapidjson::Value{owner.c_str(), allocator}, allocator);
        json.AddMember("p", json::packedDecimal(price), allocator);
        json.AddMember("q", json::packedDecimal(quantity), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

RfqQuotePayload RfqQuotePayload::fromCheckpoint(const rapidjson::Value& json)
{
    return RfqQuotePayload{
        .requestId = json::getUint64(json, "r"),
        .quoteId = json::getUint64(json, "qi"),
        .owner = json::getString(json, "o"),
        .price = json::getDecimal(json::getMember(json, "p")),
        .quantity = json::getDecimal(json::getMember(json, "q"))};
}

//-------------------------------------------------------------------------

void RfqAcceptPayload::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("r", rapidjson::Value{requestId}, allocator);
        json.AddMember("qi", rapidjson::Value{quoteId}, allocator);
        json.AddMember("o", rapidjson::Value{owner.c_str(), allocator}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

RfqAcceptPayload RfqAcceptPayload::fromCheckpoint(const rapidjson::Value& json)
{
    return RfqAcceptPayload{
        .requestId = json::getUint64(json, "r"),
        .quoteId = json::getUint64(json, "qi"),
        .owner = json::getString(json, "o")};
}

//-------------------------------------------------------------------------

Payload payloadFromCheckpoint(EventKind kind, const rapidjson::Value& json)
{
    switch (kind) {
        case EventKind::NEWS: return NewsPayload::fromCheckpoint(json);
        case EventKind::ORDER: return OrderPayload::fromCheckpoint(json);
        case EventKind::CANCEL: return CancelPayload::fromCheckpoint(json);
        case EventKind::FILL: return FillPayload::fromCheckpoint(json);
        case EventKind::BATCH_CLEAR: return BatchClearPayload::fromCheckpoint(json);
        case EventKind::RFQ_REQUEST: return RfqRequestPayload::fromCheckpoint(json);
        case EventKind::RFQ_QUOTE: return RfqQuotePayload::fromCheckpoint(json);
        case EventKind::RFQ_ACCEPT: return RfqAcceptPayload::fromCheckpoint(json);
    }
    throw SimulationException{fmt::format(
        "{}: Unhandled event kind {}",
        std::source_location::current().function_name(),
        std::to_underlying(kind))};
}

//-------------------------------------------------------------------------

}  // namespace microsim::event

//-------------------------------------------------------------------------
