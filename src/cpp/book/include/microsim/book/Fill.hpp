/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/common/common.hpp"
#include "microsim/serialization/CheckpointSerializable.hpp"
#include "microsim/serialization/JsonSerializable.hpp"

//-------------------------------------------------------------------------

namespace microsim::book
{

//-------------------------------------------------------------------------

/**
 * One execution between a resting (maker) and an incoming (taker) order.
 * The price is always the maker's limit price.
 */
struct Fill : public JsonSerializable, public CheckpointSerializable
{
    FillID fillId{};
    OrderID makerOrderId{};
    OrderID takerOrderId{};
    Owner makerOwner;
    Owner takerOwner;
    Side aggressorSide{Side::BUY};
    decimal_t price{};
    decimal_t quantity{};
    Timestamp timestamp{};

    Fill() noexcept = default;

    Fill(
        FillID fillId,
        OrderID makerOrderId,
        OrderID takerOrderId,
        Owner makerOwner,
        Owner takerOwner,
        Side aggressorSide,
        decimal_t price,
        decimal_t quantity,
        Timestamp timestamp) noexcept;

    [[nodiscard]] const Owner& buyer() const noexcept
    {
        return aggressorSide == Side::BUY ? takerOwner : makerOwner;
    }

    [[nodiscard]] const Owner& seller() const noexcept
    {
        return aggressorSide == Side::BUY ? makerOwner : takerOwner;
    }

    [[nodiscard]] OrderID buyOrderId() const noexcept
    {
        return aggressorSide == Side::BUY ? takerOrderId : makerOrderId;
    }

    [[nodiscard]] OrderID sellOrderId() const noexcept
    {
        return aggressorSide == Side::BUY ? makerOrderId : takerOrderId;
    }

    [[nodiscard]] decimal_t notional() const noexcept { return price * quantity; }

    [[nodiscard]] bool operator==(const Fill& other) const noexcept;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
    virtual void checkpointSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static Fill fromCheckpoint(const rapidjson::Value& json);
};

//-------------------------------------------------------------------------

class FillFactory : public CheckpointSerializable
{
public:
    FillFactory() noexcept = default;

    [[nodiscard]] Fill makeRecord(
        OrderID makerOrderId,
        OrderID takerOrderId,
        Owner makerOwner,
        Owner takerOwner,
        Side aggressorSide,
        decimal_t price,
        decimal_t quantity,
        Timestamp timestamp) noexcept;

    [[nodiscard]] FillID nextId() const noexcept { return m_idCounter; }

    virtual void checkpointSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    FillID m_idCounter{};
};

//-------------------------------------------------------------------------

}  // namespace microsim::book

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<microsim::book::Fill>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const microsim::book::Fill& fill, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "Fill #{}: {} @ {} (maker #{} {}, taker #{} {} {}) t={}",
            fill.fillId,
            fill.quantity,
            fill.price,
            fill.makerOrderId,
            fill.makerOwner,
            fill.takerOrderId,
            fill.takerOwner,
            fill.aggressorSide,
            fill.timestamp);
    }
};

//-------------------------------------------------------------------------
