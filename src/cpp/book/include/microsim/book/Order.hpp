/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/common/common.hpp"
#include "microsim/serialization/CheckpointSerializable.hpp"
#include "microsim/serialization/JsonSerializable.hpp"

#include <memory>
#include <tuple>

//-------------------------------------------------------------------------

namespace microsim::book
{

//-------------------------------------------------------------------------

enum class OrderStatus : uint32_t
{
    RESTING,
    PARTIALLY_FILLED,
    FILLED,
    CANCELED,
    REJECTED
};

enum class TimeInForce : uint32_t
{
    GTC,
    IOC
};

enum class OrderErrorCode : uint32_t
{
    VALID,
    INVALID_PRICE,
    INVALID_QUANTITY,
    INVALID_SIDE,
    INVALID_TIME_IN_FORCE,
    PRICE_OUT_OF_BOUNDS,
    DUPLICATE_ORDER_ID,
    EMPTY_OWNER
};

[[nodiscard]] constexpr bool isTerminal(OrderStatus status) noexcept
{
    return status == OrderStatus::FILLED
        || status == OrderStatus::CANCELED
        || status == OrderStatus::REJECTED;
}

//-------------------------------------------------------------------------

struct OrderIntent
{
    OrderID orderId{};
    Owner owner;
    Side side{Side::BUY};
    decimal_t price{};
    decimal_t quantity{};
    TimeInForce timeInForce{TimeInForce::GTC};
};

//-------------------------------------------------------------------------

class Order : public JsonSerializable, public CheckpointSerializable
{
public:
    using Ptr = std::shared_ptr<Order>;

    Order(
        OrderID id,
        Owner owner,
        Side side,
        decimal_t price,
        decimal_t quantity,
        Timestamp entryTimestamp,
        SequenceNumber entrySequence,
        TimeInForce timeInForce = TimeInForce::GTC) noexcept;

    [[nodiscard]] OrderID id() const noexcept { return m_id; }
    [[nodiscard]] const Owner& owner() const noexcept { return m_owner; }
    [[nodiscard]] Side side() const noexcept { return m_side; }
    [[nodiscard]] decimal_t price() const noexcept { return m_price; }
    [[nodiscard]] decimal_t quantityRemaining() const noexcept { return m_quantityRemaining; }
    [[nodiscard]] decimal_t quantityOriginal() const noexcept { return m_quantityOriginal; }
    [[nodiscard]] decimal_t quantityFilled() const noexcept { return m_quantityOriginal - m_quantityRemaining; }
    [[nodiscard]] Timestamp entryTimestamp() const noexcept { return m_entryTimestamp; }
    [[nodiscard]] SequenceNumber entrySequence() const noexcept { return m_entrySequence; }
    [[nodiscard]] TimeInForce timeInForce() const noexcept { return m_timeInForce; }
    [[nodiscard]] OrderStatus status() const noexcept { return m_status; }

    // Strict price-time priority key within a level.
    [[nodiscard]] bool enteredBefore(const Order& other) const noexcept
    {
        return std::tie(m_entryTimestamp, m_entrySequence)
            < std::tie(other.m_entryTimestamp, other.m_entrySequence);
    }

    void fill(decimal_t quantity);
    void cancel();

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
    virtual void checkpointSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static Ptr fromCheckpoint(const rapidjson::Value& json);

private:
    OrderID m_id;
    Owner m_owner;
    Side m_side;
    decimal_t m_price;
    decimal_t m_quantityRemaining;
    decimal_t m_quantityOriginal;
    Timestamp m_entryTimestamp;
    SequenceNumber m_entrySequence;
    TimeInForce m_timeInForce;
    OrderStatus m_status{OrderStatus::RESTING};
};

//-------------------------------------------------------------------------

}  // namespace microsim::book

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<microsim::book::Order>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const microsim::book::Order& order, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "#{} {} {} {}/{} @ {} (t={}, seq={}, {})",
            order.id(),
            order.owner(),
            order.side(),
            order.quantityRemaining(),
            order.quantityOriginal(),
            order.price(),
            order.entryTimestamp(),
            order.entrySequence(),
            magic_enum::enum_name(order.status()));
    }
};

//-------------------------------------------------------------------------
