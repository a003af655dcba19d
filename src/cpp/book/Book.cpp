/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/book/Book.hpp"

#include "microsim/common/SimulationException.hpp"

//-------------------------------------------------------------------------

namespace microsim::book
{

//-------------------------------------------------------------------------

decimal_t Book::depthAt(decimal_t price) const noexcept
{
    return m_bids.depthAt(price) + m_asks.depthAt(price);
}

//-------------------------------------------------------------------------

decimal_t Book::depthAt(Side side, decimal_t price) const noexcept
{
    return this->side(side).depthAt(price);
}

//-------------------------------------------------------------------------

bool Book::isCrossed() const noexcept
{
    const auto bid = bestBid(), ask = bestAsk();
    return bid && ask && *bid >= *ask;
}

//-------------------------------------------------------------------------

std::optional<Order::Ptr> Book::getOrder(OrderID orderId) const
{
    if (auto it = m_orderIdMap.find(orderId); it != m_orderIdMap.end()) {
        return it->second;
    }
    return std::nullopt;
}

//-------------------------------------------------------------------------

void Book::rest(Order::Ptr order)
{
    if (m_orderIdMap.contains(order->id())) {
        throw SimulationException{fmt::format(
            "{}: Order #{} is already resting",
            std::source_location::current().function_name(),
            order->id())};
    }
    side(order->side()).add(order);
    m_orderIdMap.emplace(order->id(), order);
    m_signals.rested(order);
}

//-------------------------------------------------------------------------

bool Book::cancelOrderOpt(OrderID orderId)
{
    auto it = m_orderIdMap.find(orderId);
    if (it == m_orderIdMap.end()) return false;

    auto order = it->second;
    const decimal_t canceledQuantity = order->quantityRemaining();
    side(order->side()).remove(order);
    m_orderIdMap.erase(it);
    order->cancel();

    m_signals.canceled(order, canceledQuantity);

    return true;
}

//-------------------------------------------------------------------------

void Book::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        auto serializeSide = [&](const BookSide& side) {
            rapidjson::Value levelsJson{rapidjson::kArrayType};
            for (const PriceLevel* level : side.levels()) {
                rapidjson::Document levelJson{&allocator};
                level->jsonSerialize(levelJson);
                levelsJson.PushBack(levelJson, allocator);
            }
            return levelsJson;
        };
        json.AddMember("bid", serializeSide(m_bids), allocator);
        json.AddMember("ask", serializeSide(m_asks), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void Book::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        auto serializeSide = [&](const BookSide& side) {
            rapidjson::Value levelsJson{rapidjson::kArrayType};
            for (const PriceLevel* level : side.levels()) {
                rapidjson::Document levelJson{&allocator};
                level->checkpointSerialize(levelJson);
                levelsJson.PushBack(levelJson, allocator);
            }
            return levelsJson;
        };
        json.AddMember("bid", serializeSide(m_bids), allocator);
        json.AddMember("ask", serializeSide(m_asks), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace microsim::book

//-------------------------------------------------------------------------
