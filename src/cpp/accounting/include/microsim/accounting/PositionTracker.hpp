/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/common/common.hpp"

#include <deque>
#include <memory>

//-------------------------------------------------------------------------

namespace microsim::accounting
{

//-------------------------------------------------------------------------

enum class PnlConvention : uint32_t
{
    AVERAGE_COST,
    FIFO
};

[[nodiscard]] PnlConvention str2convention(std::string_view str);

//-------------------------------------------------------------------------

/**
 * Tracks the traded position of one account and turns closing trades into
 * realized P&L. Positions are signed: negative is short.
 */
class PositionTracker
{
public:
    virtual ~PositionTracker() noexcept = default;

    // Returns the P&L realized by this trade.
    virtual decimal_t onTrade(Side side, decimal_t quantity, decimal_t price) = 0;

    [[nodiscard]] virtual decimal_t position() const noexcept = 0;
    [[nodiscard]] virtual decimal_t unrealizedPnl(decimal_t mark) const noexcept = 0;
    [[nodiscard]] virtual std::unique_ptr<PositionTracker> clone() const = 0;

protected:
    PositionTracker() noexcept = default;
};

//-------------------------------------------------------------------------

class AverageCostTracker : public PositionTracker
{
public:
    virtual decimal_t onTrade(Side side, decimal_t quantity, decimal_t price) override;

    [[nodiscard]] virtual decimal_t position() const noexcept override { return m_position; }
    [[nodiscard]] virtual decimal_t unrealizedPnl(decimal_t mark) const noexcept override;
    [[nodiscard]] virtual std::unique_ptr<PositionTracker> clone() const override;

    [[nodiscard]] decimal_t averageCost() const noexcept { return m_averageCost; }

private:
    decimal_t m_position{};
    decimal_t m_averageCost{};
};

//-------------------------------------------------------------------------

class FifoLotTracker : public PositionTracker
{
public:
    struct Lot
    {
        decimal_t quantity;
        decimal_t price;
    };

    virtual decimal_t onTrade(Side side, decimal_t quantity, decimal_t price) override;

    [[nodiscard]] virtual decimal_t position() const noexcept override;
    [[nodiscard]] virtual decimal_t unrealizedPnl(decimal_t mark) const noexcept override;
    [[nodiscard]] virtual std::unique_ptr<PositionTracker> clone() const override;

    [[nodiscard]] const std::deque<Lot>& lots() const noexcept { return m_lots; }

private:
    std::deque<Lot> m_lots;
};

//-------------------------------------------------------------------------

[[nodiscard]] std::unique_ptr<PositionTracker> makePositionTracker(PnlConvention convention);

//-------------------------------------------------------------------------

}  // namespace microsim::accounting

//-------------------------------------------------------------------------
