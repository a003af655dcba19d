/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/book/PriceLevel.hpp"

//-------------------------------------------------------------------------

namespace microsim::book
{

//-------------------------------------------------------------------------

PriceLevel::PriceLevel(decimal_t price) noexcept
    : m_price{price}
{}

//-------------------------------------------------------------------------

void PriceLevel::insert(const value_type& order)
{
    // Arrivals are almost always the latest entry, so search from the back.
    auto it = ContainerType::end();
    while (it != ContainerType::begin() && order->enteredBefore(**std::prev(it))) {
        --it;
    }
    ContainerType::insert(it, order);
    m_volume += order->quantityRemaining();
}

//-------------------------------------------------------------------------

PriceLevel::iterator PriceLevel::erase(const_iterator pos)
{
    m_volume -= (*pos)->quantityRemaining();
    return ContainerType::erase(pos);
}

//-------------------------------------------------------------------------

size_t PriceLevel::frontTimestampRun() const noexcept
{
    if (empty()) return 0;
    const Timestamp frontTimestamp = front()->entryTimestamp();
    size_t run{};
    for (const auto& order : *this) {
        if (order->entryTimestamp() != frontTimestamp) break;
        ++run;
    }
    return run;
}

//-------------------------------------------------------------------------

void PriceLevel::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("price", rapidjson::Value{util::decimal2double(m_price)}, allocator);
        rapidjson::Value ordersJson{rapidjson::kArrayType};
        for (const auto& order : *this) {
            rapidjson::Document orderJson{&allocator};
            order->jsonSerialize(orderJson);
            orderJson.RemoveMember("price");
            ordersJson.PushBack(orderJson, allocator);
        }
        json.AddMember("orders", ordersJson, allocator);
        json.AddMember("volume", rapidjson::Value{util::decimal2double(m_volume)}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void PriceLevel::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("price", json::packedDecimal(m_price), allocator);
        rapidjson::Value ordersJson{rapidjson::kArrayType};
        for (const auto& order : *this) {
            rapidjson::Document orderJson{&allocator};
            order->checkpointSerialize(orderJson);
            ordersJson.PushBack(orderJson, allocator);
        }
        json.AddMember("orders", ordersJson, allocator);
        json.AddMember("volume", json::packedDecimal(m_volume), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace microsim::book

//-------------------------------------------------------------------------
