/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/accounting/PositionTracker.hpp"
#include "microsim/serialization/CheckpointSerializable.hpp"
#include "microsim/serialization/JsonSerializable.hpp"

#include <pugixml.hpp>

#include <memory>

//-------------------------------------------------------------------------

namespace microsim::accounting
{

//-------------------------------------------------------------------------

/**
 * Read-only view of an account handed out to external consumers.
 */
struct AccountSnapshot
{
    Owner owner;
    decimal_t cash{};
    decimal_t inventory{};
    decimal_t realizedPnl{};
    decimal_t cashDelta{};
    decimal_t inventoryDelta{};

    [[nodiscard]] decimal_t equity(decimal_t mark) const noexcept { return cash + inventory * mark; }

    [[nodiscard]] bool operator==(const AccountSnapshot& other) const noexcept
    {
        return owner == other.owner
            && cash == other.cash
            && inventory == other.inventory
            && realizedPnl == other.realizedPnl
            && cashDelta == other.cashDelta
            && inventoryDelta == other.inventoryDelta;
    }
};

//-------------------------------------------------------------------------

struct InitialHoldings
{
    Owner owner;
    decimal_t cash{};
    decimal_t inventory{};

    [[nodiscard]] static InitialHoldings fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

class Account : public JsonSerializable, public CheckpointSerializable
{
public:
    Account(InitialHoldings initial, PnlConvention convention);
    Account(const Account& other);
    Account& operator=(const Account& other);
    Account(Account&&) noexcept = default;
    Account& operator=(Account&&) noexcept = default;

    [[nodiscard]] const Owner& owner() const noexcept { return m_initial.owner; }
    [[nodiscard]] decimal_t cash() const noexcept { return m_initial.cash + m_cashDelta; }
    [[nodiscard]] decimal_t inventory() const noexcept { return m_initial.inventory + m_inventoryDelta; }
    [[nodiscard]] decimal_t realizedPnl() const noexcept { return m_realizedPnl; }
    [[nodiscard]] decimal_t cashDelta() const noexcept { return m_cashDelta; }
    [[nodiscard]] decimal_t inventoryDelta() const noexcept { return m_inventoryDelta; }
    [[nodiscard]] const InitialHoldings& initial() const noexcept { return m_initial; }
    [[nodiscard]] const PositionTracker& tracker() const noexcept { return *m_tracker; }

    // P&L of the traded position versus the opening holdings, valued at `mark`.
    [[nodiscard]] decimal_t markToMarket(decimal_t mark) const noexcept
    {
        return cashDelta() + inventoryDelta() * mark;
    }

    void applyTrade(Side side, decimal_t quantity, decimal_t price);
    void reset();

    [[nodiscard]] AccountSnapshot snapshot() const;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
    virtual void checkpointSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    InitialHoldings m_initial;
    PnlConvention m_convention;
    // Traded flows are kept apart from the opening holdings so that large
    // balances do not absorb the low digits of a fill.
    decimal_t m_cashDelta{};
    decimal_t m_inventoryDelta{};
    decimal_t m_realizedPnl{};
    std::unique_ptr<PositionTracker> m_tracker;
};

//-------------------------------------------------------------------------

}  // namespace microsim::accounting

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<microsim::accounting::AccountSnapshot>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const microsim::accounting::AccountSnapshot& snapshot, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "{}: cash {} inventory {} realized {}",
            snapshot.owner,
            snapshot.cash,
            snapshot.inventory,
            snapshot.realizedPnl);
    }
};

//-------------------------------------------------------------------------
