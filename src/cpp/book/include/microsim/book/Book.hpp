/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/book/BookSide.hpp"
#include "microsim/book/BookSignals.hpp"

#include <map>
#include <optional>

//-------------------------------------------------------------------------

namespace microsim::book
{

//-------------------------------------------------------------------------

class Book : public JsonSerializable, public CheckpointSerializable
{
public:
    Book() noexcept = default;

    [[nodiscard]] BookSide& bids() noexcept { return m_bids; }
    [[nodiscard]] const BookSide& bids() const noexcept { return m_bids; }
    [[nodiscard]] BookSide& asks() noexcept { return m_asks; }
    [[nodiscard]] const BookSide& asks() const noexcept { return m_asks; }
    [[nodiscard]] BookSide& side(Side side) noexcept { return side == Side::BUY ? m_bids : m_asks; }
    [[nodiscard]] const BookSide& side(Side side) const noexcept
    {
        return side == Side::BUY ? m_bids : m_asks;
    }
    [[nodiscard]] BookSignals& signals() noexcept { return m_signals; }

    [[nodiscard]] std::optional<decimal_t> bestBid() const noexcept { return m_bids.bestPrice(); }
    [[nodiscard]] std::optional<decimal_t> bestAsk() const noexcept { return m_asks.bestPrice(); }
    [[nodiscard]] decimal_t depthAt(decimal_t price) const noexcept;
    [[nodiscard]] decimal_t depthAt(Side side, decimal_t price) const noexcept;
    [[nodiscard]] bool isCrossed() const noexcept;

    [[nodiscard]] size_t orderCount() const noexcept { return m_orderIdMap.size(); }
    [[nodiscard]] bool contains(OrderID orderId) const noexcept { return m_orderIdMap.contains(orderId); }
    [[nodiscard]] std::optional<Order::Ptr> getOrder(OrderID orderId) const;

    void rest(Order::Ptr order);
    bool cancelOrderOpt(OrderID orderId);
    void unregisterOrder(OrderID orderId) noexcept { m_orderIdMap.erase(orderId); }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
    virtual void checkpointSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    BookSide m_bids{Side::BUY};
    BookSide m_asks{Side::SELL};
    std::map<OrderID, Order::Ptr> m_orderIdMap;
    BookSignals m_signals;
};

//-------------------------------------------------------------------------

}  // namespace microsim::book

//-------------------------------------------------------------------------
