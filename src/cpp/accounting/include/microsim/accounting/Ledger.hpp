/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/accounting/Account.hpp"
#include "microsim/book/Fill.hpp"

#include <map>
#include <vector>

//-------------------------------------------------------------------------

namespace microsim::accounting
{

//-------------------------------------------------------------------------

struct InvariantViolation
{
    FillID fillId;
    std::string code;
    std::string message;
};

struct JournalEntry
{
    FillID fillId;
    Owner buyer;
    Owner seller;
    decimal_t buyerCashDelta;
    decimal_t sellerCashDelta;
    decimal_t buyerInventoryDelta;
    decimal_t sellerInventoryDelta;
};

//-------------------------------------------------------------------------

/**
 * Turns fills into account state. Every fill moves `price * quantity` of cash
 * from buyer to seller and `quantity` of inventory from seller to buyer, so
 * aggregate cash and inventory never change. Drift is measured against
 * `tolerance`, since notionals carry more digits than a decimal_t keeps.
 * Any breach is fatal: it is recorded and raised as an
 * AccountingInvariantError, never swallowed.
 */
class Ledger : public JsonSerializable, public CheckpointSerializable
{
public:
    static inline const decimal_t kDefaultTolerance = DEC(1e-9);

    explicit Ledger(
        PnlConvention convention = PnlConvention::AVERAGE_COST,
        decimal_t tolerance = kDefaultTolerance) noexcept;

    [[nodiscard]] PnlConvention convention() const noexcept { return m_convention; }
    [[nodiscard]] decimal_t tolerance() const noexcept { return m_tolerance; }
    [[nodiscard]] const std::map<Owner, Account>& accounts() const noexcept { return m_accounts; }
    [[nodiscard]] bool hasAccount(const Owner& owner) const noexcept { return m_accounts.contains(owner); }
    [[nodiscard]] const std::vector<InvariantViolation>& violations() const noexcept { return m_violations; }
    [[nodiscard]] const std::vector<JournalEntry>& journal() const noexcept { return m_journal; }
    [[nodiscard]] size_t processedFills() const noexcept { return m_journal.size(); }

    void openAccount(InitialHoldings initial);

    void apply(const book::Fill& fill);

    /**
     * Verify that cash and inventory deltas sum to zero across all accounts
     * and that no violation was recorded.
     */
    void reconcile() const;

    [[nodiscard]] AccountSnapshot snapshot(const Owner& owner) const;
    [[nodiscard]] std::vector<AccountSnapshot> snapshots() const;

    [[nodiscard]] decimal_t totalCashDelta() const noexcept;
    [[nodiscard]] decimal_t totalInventoryDelta() const noexcept;

    [[nodiscard]] std::map<Owner, decimal_t> markToMarket(decimal_t mark) const;

    // Payoff of a binary contract settling at `outcome`, which must lie in [0, 1].
    [[nodiscard]] std::map<Owner, decimal_t> settlementPnl(decimal_t outcome);

    // Restore every account to its opening holdings.
    void reset();

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
    virtual void checkpointSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    Account& account(const Owner& owner);

    [[nodiscard]] bool exceedsTolerance(decimal_t drift) const noexcept
    {
        return util::abs(drift) > m_tolerance;
    }
    [[noreturn]] void fail(FillID fillId, std::string code, std::string message);

    PnlConvention m_convention;
    decimal_t m_tolerance;
    std::map<Owner, Account> m_accounts;
    std::vector<InvariantViolation> m_violations;
    std::vector<JournalEntry> m_journal;
};

//-------------------------------------------------------------------------

}  // namespace microsim::accounting

//-------------------------------------------------------------------------
