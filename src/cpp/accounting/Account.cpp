/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/accounting/Account.hpp"

#include "microsim/common/SimulationException.hpp"

//-------------------------------------------------------------------------

namespace microsim::accounting
{

//-------------------------------------------------------------------------

InitialHoldings InitialHoldings::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    InitialHoldings holdings{
        .owner = node.attribute("owner").as_string(),
        .cash = util::double2decimal(node.attribute("cash").as_double()),
        .inventory = util::double2decimal(node.attribute("inventory").as_double())};
    if (holdings.owner.empty()) {
        throw ConfigurationError{fmt::format(
            "{}: Account is missing the 'owner' attribute", ctx)};
    }
    return holdings;
}

//-------------------------------------------------------------------------

Account::Account(InitialHoldings initial, PnlConvention convention)
    : m_initial{std::move(initial)},
      m_convention{convention},
      m_tracker{makePositionTracker(convention)}
{}

//-------------------------------------------------------------------------

Account::Account(const Account& other)
    : m_initial{other.m_initial},
      m_convention{other.m_convention},
      m_cashDelta{other.m_cashDelta},
      m_inventoryDelta{other.m_inventoryDelta},
      m_realizedPnl{other.m_realizedPnl},
      m_tracker{other.m_tracker->clone()}
{}

//-------------------------------------------------------------------------

Account& Account::operator=(const Account& other)
{
    if (this != &other) {
        m_initial = other.m_initial;
        m_convention = other.m_convention;
        m_cashDelta = other.m_cashDelta;
        m_inventoryDelta = other.m_inventoryDelta;
        m_realizedPnl = other.m_realizedPnl;
        m_tracker = other.m_tracker->clone();
    }
    return *this;
}

//-------------------------------------------------------------------------

void Account::applyTrade(Side side, decimal_t quantity, decimal_t price)
{
    const decimal_t notional = price * quantity;
    if (side == Side::BUY) {
        m_cashDelta -= notional;
        m_inventoryDelta += quantity;
    } else {
        m_cashDelta += notional;
        m_inventoryDelta -= quantity;
    }
    m_realizedPnl += m_tracker->onTrade(side, quantity, price);
}

//-------------------------------------------------------------------------

void Account::reset()
{
    m_cashDelta = {};
    m_inventoryDelta = {};
    m_realizedPnl = {};
    m_tracker = makePositionTracker(m_convention);
}

//-------------------------------------------------------------------------

AccountSnapshot Account::snapshot() const
{
    return AccountSnapshot{
        .owner = owner(),
        .cash = cash(),
        .inventory = inventory(),
        .realizedPnl = m_realizedPnl,
        .cashDelta = cashDelta(),
        .inventoryDelta = inventoryDelta()};
}

//-------------------------------------------------------------------------

void Account::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("owner", rapidjson::Value{owner().c_str(), allocator}, allocator);
        json.AddMember("cash", rapidjson::Value{util::decimal2double(cash())}, allocator);
        json.AddMember("inventory", rapidjson::Value{util::decimal2double(inventory())}, allocator);
        json.AddMember(
            "realizedPnl", rapidjson::Value{util::decimal2double(m_realizedPnl)}, allocator);
        json.AddMember(
            "position", rapidjson::Value{util::decimal2double(m_tracker->position())}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void Account::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("owner", rapidjson::Value{owner().c_str(), allocator}, allocator);
        json.AddMember("cash", json::packedDecimal(cash()), allocator);
        json.AddMember("inventory", json::packedDecimal(inventory()), allocator);
        json.AddMember("realizedPnl", json::packedDecimal(m_realizedPnl), allocator);
        json.AddMember(
            "initialCash", json::packedDecimal(m_initial.cash), allocator);
        json.AddMember(
            "initialInventory", json::packedDecimal(m_initial.inventory), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace microsim::accounting

//-------------------------------------------------------------------------
