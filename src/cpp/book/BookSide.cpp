/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/book/BookSide.hpp"

#include "microsim/common/SimulationException.hpp"

#include <algorithm>

//-------------------------------------------------------------------------

namespace microsim::book
{

//-------------------------------------------------------------------------

PriceLevel& BookSide::best()
{
    if (empty()) {
        throw SimulationException{fmt::format(
            "{}: No {} levels", std::source_location::current().function_name(), m_side)};
    }
    return m_side == Side::BUY ? back() : front();
}

//-------------------------------------------------------------------------

const PriceLevel& BookSide::best() const
{
    return const_cast<BookSide*>(this)->best();
}

//-------------------------------------------------------------------------

std::optional<decimal_t> BookSide::bestPrice() const noexcept
{
    if (empty()) return std::nullopt;
    return m_side == Side::BUY ? back().price() : front().price();
}

//-------------------------------------------------------------------------

const PriceLevel* BookSide::levelAt(decimal_t price) const noexcept
{
    auto it = std::lower_bound(begin(), end(), price);
    if (it == end() || it->price() != price) return nullptr;
    return &*it;
}

//-------------------------------------------------------------------------

decimal_t BookSide::depthAt(decimal_t price) const noexcept
{
    const PriceLevel* level = levelAt(price);
    return level != nullptr ? level->volume() : decimal_t{};
}

//-------------------------------------------------------------------------

bool BookSide::marketableAgainst(decimal_t price) const noexcept
{
    const auto bestPrice = this->bestPrice();
    if (!bestPrice) return false;
    return m_side == Side::SELL ? *bestPrice <= price : *bestPrice >= price;
}

//-------------------------------------------------------------------------

void BookSide::add(Order::Ptr order)
{
    auto it = std::lower_bound(begin(), end(), order->price());
    if (it == end() || it->price() != order->price()) {
        it = emplace(it, order->price());
    }
    it->insert(order);
    m_volume += order->quantityRemaining();
}

//-------------------------------------------------------------------------

void BookSide::remove(const Order::Ptr& order)
{
    auto levelIt = std::lower_bound(begin(), end(), order->price());
    if (levelIt == end() || levelIt->price() != order->price()) {
        throw SimulationException{fmt::format(
            "{}: No level at {} for order {}",
            std::source_location::current().function_name(),
            order->price(),
            *order)};
    }
    auto orderIt = std::find(levelIt->begin(), levelIt->end(), order);
    if (orderIt == levelIt->end()) {
        throw SimulationException{fmt::format(
            "{}: Order {} not on its level",
            std::source_location::current().function_name(),
            *order)};
    }
    m_volume -= order->quantityRemaining();
    levelIt->erase(orderIt);
    if (levelIt->empty()) {
        erase(levelIt);
    }
}

//-------------------------------------------------------------------------

void BookSide::reduce(PriceLevel& level, decimal_t quantity) noexcept
{
    level.updateVolume(-quantity);
    m_volume -= quantity;
}

//-------------------------------------------------------------------------

void BookSide::dropBestIfEmpty()
{
    if (empty()) return;
    if (m_side == Side::BUY && back().empty()) {
        pop_back();
    } else if (m_side == Side::SELL && front().empty()) {
        pop_front();
    }
}

//-------------------------------------------------------------------------

std::vector<const PriceLevel*> BookSide::levels() const
{
    auto addresses = *this | views::transform([](const PriceLevel& level) { return &level; });
    if (m_side == Side::BUY) {
        return addresses | views::reverse | ranges::to<std::vector>;
    }
    return addresses | ranges::to<std::vector>;
}

//-------------------------------------------------------------------------

}  // namespace microsim::book

//-------------------------------------------------------------------------
