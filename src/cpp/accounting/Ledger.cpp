/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/accounting/Ledger.hpp"

#include "microsim/common/SimulationException.hpp"

//-------------------------------------------------------------------------

namespace microsim::accounting
{

//-------------------------------------------------------------------------

Ledger::Ledger(PnlConvention convention, decimal_t tolerance) noexcept
    : m_convention{convention},
      m_tolerance{tolerance}
{}

//-------------------------------------------------------------------------

void Ledger::openAccount(InitialHoldings initial)
{
    if (m_accounts.contains(initial.owner)) {
        throw ConfigurationError{fmt::format(
            "{}: Account '{}' already exists",
            std::source_location::current().function_name(),
            initial.owner)};
    }
    Owner owner = initial.owner;
    m_accounts.emplace(std::move(owner), Account{std::move(initial), m_convention});
}

//-------------------------------------------------------------------------

void Ledger::apply(const book::Fill& fill)
{
    if (!(fill.price > 0_dec)) {
        fail(
            fill.fillId,
            "invalid_fill_price",
            fmt::format("fill price must be positive, got {}", fill.price));
    }
    if (!(fill.quantity > 0_dec)) {
        fail(
            fill.fillId,
            "invalid_fill_size",
            fmt::format("fill quantity must be positive, got {}", fill.quantity));
    }

    const decimal_t priorCash = totalCashDelta();
    const decimal_t priorInventory = totalInventoryDelta();

    Account& buyer = account(fill.buyer());
    Account& seller = account(fill.seller());
    const decimal_t buyerCash = buyer.cashDelta(), sellerCash = seller.cashDelta();
    const decimal_t buyerInventory = buyer.inventoryDelta(), sellerInventory = seller.inventoryDelta();

    buyer.applyTrade(Side::BUY, fill.quantity, fill.price);
    seller.applyTrade(Side::SELL, fill.quantity, fill.price);

    JournalEntry entry{
        .fillId = fill.fillId,
        .buyer = fill.buyer(),
        .seller = fill.seller(),
        .buyerCashDelta = buyer.cashDelta() - buyerCash,
        .sellerCashDelta = seller.cashDelta() - sellerCash,
        .buyerInventoryDelta = buyer.inventoryDelta() - buyerInventory,
        .sellerInventoryDelta = seller.inventoryDelta() - sellerInventory};

    // A self-trade nets out on one account; both legs are still journaled.
    if (&buyer == &seller) {
        entry.buyerCashDelta = -fill.notional();
        entry.sellerCashDelta = fill.notional();
        entry.buyerInventoryDelta = fill.quantity;
        entry.sellerInventoryDelta = -fill.quantity;
    } else {
        if (exceedsTolerance(entry.buyerCashDelta + entry.sellerCashDelta)) {
            fail(
                fill.fillId,
                "cash_transfer_not_zero_sum",
                fmt::format(
                    "cash transfer drifted by {}", entry.buyerCashDelta + entry.sellerCashDelta));
        }
        if (exceedsTolerance(entry.buyerInventoryDelta + entry.sellerInventoryDelta)) {
            fail(
                fill.fillId,
                "inventory_transfer_not_zero_sum",
                fmt::format(
                    "inventory transfer drifted by {}",
                    entry.buyerInventoryDelta + entry.sellerInventoryDelta));
        }
    }
    if (const auto drift = totalCashDelta() - priorCash; exceedsTolerance(drift)) {
        fail(fill.fillId, "cash_conservation_violation", fmt::format("total cash drifted by {}", drift));
    }
    if (const auto drift = totalInventoryDelta() - priorInventory; exceedsTolerance(drift)) {
        fail(
            fill.fillId,
            "inventory_conservation_violation",
            fmt::format("total inventory drifted by {}", drift));
    }

    m_journal.push_back(std::move(entry));
}

//-------------------------------------------------------------------------

void Ledger::reconcile() const
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!m_violations.empty()) {
        throw AccountingInvariantError{
            fmt::format(
                "{}: {} invariant violation(s), first: {} ({})",
                ctx,
                m_violations.size(),
                m_violations.front().code,
                m_violations.front().message),
            m_violations
                | views::transform(&InvariantViolation::fillId)
                | ranges::to<std::vector>};
    }

    const decimal_t cashDrift = totalCashDelta();
    const decimal_t inventoryDrift = totalInventoryDelta();
    if (!exceedsTolerance(cashDrift) && !exceedsTolerance(inventoryDrift)) return;

    std::vector<FillID> offending = m_journal
        | views::filter([this](const JournalEntry& entry) {
              return exceedsTolerance(entry.buyerCashDelta + entry.sellerCashDelta)
                  || exceedsTolerance(entry.buyerInventoryDelta + entry.sellerInventoryDelta);
          })
        | views::transform(&JournalEntry::fillId)
        | ranges::to<std::vector>;
    if (offending.empty() && !m_journal.empty()) {
        offending.push_back(m_journal.back().fillId);
    }
    throw AccountingInvariantError{
        fmt::format(
            "{}: Ledger does not net to zero (cash {}, inventory {})", ctx, cashDrift, inventoryDrift),
        std::move(offending)};
}

//-------------------------------------------------------------------------

AccountSnapshot Ledger::snapshot(const Owner& owner) const
{
    auto it = m_accounts.find(owner);
    if (it == m_accounts.end()) {
        throw SimulationException{fmt::format(
            "{}: No account for '{}'", std::source_location::current().function_name(), owner)};
    }
    return it->second.snapshot();
}

//-------------------------------------------------------------------------

std::vector<AccountSnapshot> Ledger::snapshots() const
{
    return m_accounts
        | views::values
        | views::transform([](const Account& account) { return account.snapshot(); })
        | ranges::to<std::vector>;
}

//-------------------------------------------------------------------------

decimal_t Ledger::totalCashDelta() const noexcept
{
    decimal_t total{};
    for (const auto& [_, account] : m_accounts) {
        total += account.cashDelta();
    }
    return total;
}

//-------------------------------------------------------------------------

decimal_t Ledger::totalInventoryDelta() const noexcept
{
    decimal_t total{};
    for (const auto& [_, account] : m_accounts) {
        total += account.inventoryDelta();
    }
    return total;
}

//-------------------------------------------------------------------------

std::map<Owner, decimal_t> Ledger::markToMarket(decimal_t mark) const
{
    std::map<Owner, decimal_t> pnl;
    for (const auto& [owner, account] : m_accounts) {
        pnl.emplace(owner, account.markToMarket(mark));
    }
    return pnl;
}

//-------------------------------------------------------------------------

std::map<Owner, decimal_t> Ledger::settlementPnl(decimal_t outcome)
{
    if (!(outcome >= 0_dec && outcome <= 1_dec)) {
        throw std::invalid_argument{fmt::format(
            "{}: Outcome should be in [0, 1], was {}",
            std::source_location::current().function_name(),
            outcome)};
    }
    auto pnl = markToMarket(outcome);
    decimal_t total{};
    for (const auto& [_, value] : pnl) {
        total += value;
    }
    if (exceedsTolerance(total)) {
        fail(
            m_journal.empty() ? FillID{} : m_journal.back().fillId,
            "pnl_non_zero_sum",
            fmt::format("settlement P&L sum drifted by {}", total));
    }
    return pnl;
}

//-------------------------------------------------------------------------

void Ledger::reset()
{
    for (auto& [_, account] : m_accounts) {
        account.reset();
    }
    m_violations.clear();
    m_journal.clear();
}

//-------------------------------------------------------------------------

void Ledger::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember(
            "convention",
            rapidjson::Value{magic_enum::enum_name(m_convention).data(), allocator},
            allocator);
        json.AddMember("processedFills", rapidjson::Value{processedFills()}, allocator);
        rapidjson::Value accountsJson{rapidjson::kArrayType};
        for (const auto& [_, account] : m_accounts) {
            rapidjson::Document accountJson{&allocator};
            account.jsonSerialize(accountJson);
            accountsJson.PushBack(accountJson, allocator);
        }
        json.AddMember("accounts", accountsJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void Ledger::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("convention", rapidjson::Value{std::to_underlying(m_convention)}, allocator);
        json.AddMember("processedFills", rapidjson::Value{processedFills()}, allocator);
        rapidjson::Value accountsJson{rapidjson::kArrayType};
        for (const auto& [_, account] : m_accounts) {
            rapidjson::Document accountJson{&allocator};
            account.checkpointSerialize(accountJson);
            accountsJson.PushBack(accountJson, allocator);
        }
        json.AddMember("accounts", accountsJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

Account& Ledger::account(const Owner& owner)
{
    if (auto it = m_accounts.find(owner); it != m_accounts.end()) {
        return it->second;
    }
    auto [it, _] = m_accounts.emplace(
        owner, Account{InitialHoldings{.owner = owner}, m_convention});
    return it->second;
}

//-------------------------------------------------------------------------

void Ledger::fail(FillID fillId, std::string code, std::string message)
{
    m_violations.push_back(InvariantViolation{
        .fillId = fillId, .code = code, .message = message});
    throw AccountingInvariantError{
        fmt::format("Fill #{}: {}: {}", fillId, code, message), {fillId}};
}

//-------------------------------------------------------------------------

}  // namespace microsim::accounting

//-------------------------------------------------------------------------
