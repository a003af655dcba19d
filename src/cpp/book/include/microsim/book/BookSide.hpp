/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/book/PriceLevel.hpp"

#include <deque>
#include <optional>

//-------------------------------------------------------------------------

namespace microsim::book
{

//-------------------------------------------------------------------------

/**
 * Price levels of one side, stored in ascending price order regardless of
 * side: the best bid is the back level, the best ask the front level.
 */
class BookSide : public std::deque<PriceLevel>
{
public:
    explicit BookSide(Side side) noexcept : m_side{side} {}

    [[nodiscard]] Side side() const noexcept { return m_side; }
    [[nodiscard]] decimal_t volume() const noexcept { return m_volume; }

    [[nodiscard]] PriceLevel& best();
    [[nodiscard]] const PriceLevel& best() const;
    [[nodiscard]] std::optional<decimal_t> bestPrice() const noexcept;

    [[nodiscard]] const PriceLevel* levelAt(decimal_t price) const noexcept;
    [[nodiscard]] decimal_t depthAt(decimal_t price) const noexcept;

    // Whether a counter order limited at `price` would trade with this side.
    [[nodiscard]] bool marketableAgainst(decimal_t price) const noexcept;

    void add(Order::Ptr order);
    void remove(const Order::Ptr& order);
    void reduce(PriceLevel& level, decimal_t quantity) noexcept;
    void dropBestIfEmpty();

    // Levels in priority order, best first.
    [[nodiscard]] std::vector<const PriceLevel*> levels() const;

private:
    Side m_side;
    decimal_t m_volume{};
};

//-------------------------------------------------------------------------

}  // namespace microsim::book

//-------------------------------------------------------------------------
