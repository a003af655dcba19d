/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/book/Order.hpp"

#include "microsim/common/SimulationException.hpp"

//-------------------------------------------------------------------------

namespace microsim::book
{

//-------------------------------------------------------------------------

Order::Order(
    OrderID id,
    Owner owner,
    Side side,
    decimal_t price,
    decimal_t quantity,
    Timestamp entryTimestamp,
    SequenceNumber entrySequence,
    TimeInForce timeInForce) noexcept
    : m_id{id},
      m_owner{std::move(owner)},
      m_side{side},
      m_price{price},
      m_quantityRemaining{quantity},
      m_quantityOriginal{quantity},
      m_entryTimestamp{entryTimestamp},
      m_entrySequence{entrySequence},
      m_timeInForce{timeInForce}
{}

//-------------------------------------------------------------------------

void Order::fill(decimal_t quantity)
{
    if (quantity <= 0_dec || quantity > m_quantityRemaining || isTerminal(m_status)) {
        throw SimulationException{fmt::format(
            "{}: Cannot fill {} against order {}",
            std::source_location::current().function_name(),
            quantity,
            *this)};
    }
    m_quantityRemaining -= quantity;
    m_status = m_quantityRemaining == 0_dec ? OrderStatus::FILLED : OrderStatus::PARTIALLY_FILLED;
}

//-------------------------------------------------------------------------

void Order::cancel()
{
    if (isTerminal(m_status)) {
        throw OrderNotFoundError{
            m_id,
            fmt::format(
                "{}: Order #{} is already {}",
                std::source_location::current().function_name(),
                m_id,
                magic_enum::enum_name(m_status))};
    }
    m_status = OrderStatus::CANCELED;
}

//-------------------------------------------------------------------------

void Order::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("orderId", rapidjson::Value{m_id}, allocator);
        json.AddMember("owner", rapidjson::Value{m_owner.c_str(), allocator}, allocator);
        json.AddMember(
            "side", rapidjson::Value{side2str(m_side).data(), allocator}, allocator);
        json.AddMember("price", rapidjson::Value{util::decimal2double(m_price)}, allocator);
        json.AddMember(
            "quantityRemaining",
            rapidjson::Value{util::decimal2double(m_quantityRemaining)},
            allocator);
        json.AddMember(
            "quantityOriginal",
            rapidjson::Value{util::decimal2double(m_quantityOriginal)},
            allocator);
        json.AddMember("entryTimestamp", rapidjson::Value{m_entryTimestamp}, allocator);
        json.AddMember("entrySequence", rapidjson::Value{m_entrySequence}, allocator);
        json.AddMember(
            "status",
            rapidjson::Value{magic_enum::enum_name(m_status).data(), allocator},
            allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void Order::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("i", rapidjson::Value{m_id}, allocator);
        json.AddMember("o", rapidjson::Value{m_owner.c_str(), allocator}, allocator);
        json.AddMember("d", rapidjson::Value{std::to_underlying(m_side)}, allocator);
        json.AddMember("p", json::packedDecimal(m_price), allocator);
        json.AddMember("r", json::packedDecimal(m_quantityRemaining), allocator);
        json.AddMember("q", json::packedDecimal(m_quantityOriginal), allocator);
        json.AddMember("t", rapidjson::Value{m_entryTimestamp}, allocator);
        json.AddMember("s", rapidjson::Value{m_entrySequence}, allocator);
        json.AddMember("f", rapidjson::Value{std::to_underlying(m_timeInForce)}, allocator);
        json.AddMember("x", rapidjson::Value{std::to_underlying(m_status)}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

Order::Ptr Order::fromCheckpoint(const rapidjson::Value& json)
{
    auto order = std::make_shared<Order>(
        json::getUint64(json, "i"),
        json::getString(json, "o"),
        json::getEnum<Side>(json, "d"),
        json::getDecimal(json::getMember(json, "p")),
        json::getDecimal(json::getMember(json, "q")),
        json::getUint64(json, "t"),
        json::getUint64(json, "s"),
        json::getEnum<TimeInForce>(json, "f"));
    order->m_quantityRemaining = json::getDecimal(json::getMember(json, "r"));
    order->m_status = json::getEnum<OrderStatus>(json, "x");
    return order;
}

//-------------------------------------------------------------------------

}  // namespace microsim::book

//-------------------------------------------------------------------------
