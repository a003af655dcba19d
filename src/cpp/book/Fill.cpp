/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/book/Fill.hpp"

//-------------------------------------------------------------------------

namespace microsim::book
{

//-------------------------------------------------------------------------

Fill::Fill(
    FillID fillId,
    OrderID makerOrderId,
    OrderID takerOrderId,
    Owner makerOwner,
    Owner takerOwner,
    Side aggressorSide,
    decimal_t price,
    decimal_t quantity,
    Timestamp timestamp) noexcept
    : fillId{fillId},
      makerOrderId{makerOrderId},
      takerOrderId{takerOrderId},
      makerOwner{std::move(makerOwner)},
      takerOwner{std::move(takerOwner)},
      aggressorSide{aggressorSide},
      price{price},
      quantity{quantity},
      timestamp{timestamp}
{}

//-------------------------------------------------------------------------

bool Fill::operator==(const Fill& other) const noexcept
{
    return fillId == other.fillId
        && makerOrderId == other.makerOrderId
        && takerOrderId == other.takerOrderId
        && makerOwner == other.makerOwner
        && takerOwner == other.takerOwner
        && aggressorSide == other.aggressorSide
        && price == other.price
        && quantity == other.quantity
        && timestamp == other.timestamp;
}

//-------------------------------------------------------------------------

void Fill::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("fillId", rapidjson::Value{fillId}, allocator);
        json.AddMember("makerOrderId", rapidjson::Value{makerOrderId}, allocator);
        json.AddMember("takerOrderId", rapidjson::Value{takerOrderId}, allocator);
        json.AddMember("makerOwner", rapidjson::Value{makerOwner.c_str(), allocator}, allocator);
        json.AddMember("takerOwner", rapidjson::Value{takerOwner.c_str(), allocator}, allocator);
        json.AddMember(
            "aggressorSide", rapidjson::Value{side2str(aggressorSide).data(), allocator}, allocator);
        json.AddMember("price", rapidjson::Value{util::decimal2double(price)}, allocator);
        json.AddMember("quantity", rapidjson::Value{util::decimal2double(quantity)}, allocator);
        json.AddMember("timestamp", rapidjson::Value{timestamp}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void Fill::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("i", rapidjson::Value{fillId}, allocator);
        json.AddMember("m", rapidjson::Value{makerOrderId}, allocator);
        json.AddMember("k", rapidjson::Value{takerOrderId}, allocator);
        json.AddMember("mo", rapidjson::Value{makerOwner.c_str(), allocator}, allocator);
        json.AddMember("ko", rapidjson::Value{takerOwner.c_str(), allocator}, allocator);
        json.AddMember("d", rapidjson::Value{std::to_underlying(aggressorSide)}, allocator);
        json.AddMember("p", json::packedDecimal(price), allocator);
        json.AddMember("q", json::packedDecimal(quantity), allocator);
        json.AddMember("t", rapidjson::Value{timestamp}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

Fill Fill::fromCheckpoint(const rapidjson::Value& json)
{
    return Fill{
        json::getUint64(json, "i"),
        json::getUint64(json, "m"),
        json::getUint64(json, "k"),
        json::getString(json, "mo"),
        json::getString(json, "ko"),
        json::getEnum<Side>(json, "d"),
        json::getDecimal(json::getMember(json, "p")),
        json::getDecimal(json::getMember(json, "q")),
        json::getUint64(json, "t")};
}

//-------------------------------------------------------------------------

Fill FillFactory::makeRecord(
    OrderID makerOrderId,
    OrderID takerOrderId,
    Owner makerOwner,
    Owner takerOwner,
    Side aggressorSide,
    decimal_t price,
    decimal_t quantity,
    Timestamp timestamp) noexcept
{
    return Fill{
        m_idCounter++,
        makerOrderId,
        takerOrderId,
        std::move(makerOwner),
        std::move(takerOwner),
        aggressorSide,
        price,
        quantity,
        timestamp};
}

//-------------------------------------------------------------------------

void FillFactory::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        json.AddMember("idCounter", rapidjson::Value{m_idCounter}, json.GetAllocator());
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace microsim::book

//-------------------------------------------------------------------------
