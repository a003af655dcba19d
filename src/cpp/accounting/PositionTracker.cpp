/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/accounting/PositionTracker.hpp"

#include "microsim/common/SimulationException.hpp"

#include <algorithm>

//-------------------------------------------------------------------------

namespace microsim::accounting
{

//-------------------------------------------------------------------------

PnlConvention str2convention(std::string_view str)
{
    if (str == "average-cost" || str == "average_cost") return PnlConvention::AVERAGE_COST;
    if (str == "fifo") return PnlConvention::FIFO;
    throw ConfigurationError{fmt::format(
        "{}: Unknown P&L convention '{}', expected 'average-cost' or 'fifo'",
        std::source_location::current().function_name(),
        str)};
}

//-------------------------------------------------------------------------

decimal_t AverageCostTracker::onTrade(Side side, decimal_t quantity, decimal_t price)
{
    const decimal_t signedQuantity = side == Side::BUY ? quantity : -quantity;
    const bool opening =
        m_position == 0_dec || (m_position > 0_dec) == (signedQuantity > 0_dec);

    if (opening) {
        const decimal_t size = util::abs(m_position);
        m_averageCost = (size * m_averageCost + quantity * price) / (size + quantity);
        m_position += signedQuantity;
        return {};
    }

    const decimal_t closing = util::min(quantity, util::abs(m_position));
    const decimal_t realized = m_position > 0_dec
        ? closing * (price - m_averageCost)
        : closing * (m_averageCost - price);
    m_position += m_position > 0_dec ? -closing : closing;

    const decimal_t remainder = quantity - closing;
    if (remainder > 0_dec) {
        m_position = side == Side::BUY ? remainder : -remainder;
        m_averageCost = price;
    } else if (m_position == 0_dec) {
        m_averageCost = {};
    }
    return realized;
}

//-------------------------------------------------------------------------

decimal_t AverageCostTracker::unrealizedPnl(decimal_t mark) const noexcept
{
    return m_position * (mark - m_averageCost);
}

//-------------------------------------------------------------------------

std::unique_ptr<PositionTracker> AverageCostTracker::clone() const
{
    return std::make_unique<AverageCostTracker>(*this);
}

//-------------------------------------------------------------------------

decimal_t FifoLotTracker::onTrade(Side side, decimal_t quantity, decimal_t price)
{
    const bool buying = side == Side::BUY;
    decimal_t remaining = quantity;
    decimal_t realized{};

    while (remaining > 0_dec && !m_lots.empty() && (m_lots.front().quantity > 0_dec) != buying) {
        Lot& lot = m_lots.front();
        const decimal_t closable = util::min(remaining, util::abs(lot.quantity));
        if (lot.quantity > 0_dec) {
            realized += closable * (price - lot.price);
            lot.quantity -= closable;
        } else {
            realized += closable * (lot.price - price);
            lot.quantity += closable;
        }
        remaining -= closable;
        if (lot.quantity == 0_dec) {
            m_lots.pop_front();
        }
    }

    if (remaining > 0_dec) {
        m_lots.push_back(Lot{.quantity = buying ? remaining : -remaining, .price = price});
    }
    return realized;
}

//-------------------------------------------------------------------------

decimal_t FifoLotTracker::position() const noexcept
{
    decimal_t position{};
    for (const auto& lot : m_lots) {
        position += lot.quantity;
    }
    return position;
}

//-------------------------------------------------------------------------

decimal_t FifoLotTracker::unrealizedPnl(decimal_t mark) const noexcept
{
    decimal_t pnl{};
    for (const auto& lot : m_lots) {
        pnl += lot.quantity * (mark - lot.price);
    }
    return pnl;
}

//-------------------------------------------------------------------------

std::unique_ptr<PositionTracker> FifoLotTracker::clone() const
{
    return std::make_unique<FifoLotTracker>(*this);
}

//-------------------------------------------------------------------------

std::unique_ptr<PositionTracker> makePositionTracker(PnlConvention convention)
{
    switch (convention) {
        case PnlConvention::AVERAGE_COST: return std::make_unique<AverageCostTracker>();
        case PnlConvention::FIFO: return std::make_unique<FifoLotTracker>();
    }
    throw ConfigurationError{fmt::format(
        "{}: Unhandled P&L convention {}",
        std::source_location::current().function_name(),
        std::to_underlying(convention))};
}

//-------------------------------------------------------------------------

}  // namespace microsim::accounting

//-------------------------------------------------------------------------
