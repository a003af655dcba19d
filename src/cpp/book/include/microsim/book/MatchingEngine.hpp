/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/book/Book.hpp"
#include "microsim/book/Fill.hpp"
#include "microsim/book/OrderValidator.hpp"
#include "microsim/rng/StreamManager.hpp"

#include <spdlog/spdlog.h>

#include <map>
#include <memory>
#include <optional>
#include <vector>

//-------------------------------------------------------------------------

namespace microsim::book
{

//-------------------------------------------------------------------------

enum class TieBreakPolicy : uint32_t
{
    FIFO,
    RANDOMIZED
};

//-------------------------------------------------------------------------

struct LevelUpdate
{
    Side side;
    decimal_t price;
    decimal_t depth;

    [[nodiscard]] bool operator==(const LevelUpdate& other) const noexcept
    {
        return side == other.side && price == other.price && depth == other.depth;
    }
};

/**
 * Price levels touched while processing one intent, with their depth once
 * processing completed. A depth of zero means the level is gone.
 */
class BookDelta
{
public:
    void touch(Side side, decimal_t price);
    void resolve(const Book& book);

    [[nodiscard]] const std::vector<LevelUpdate>& updates() const noexcept { return m_updates; }
    [[nodiscard]] bool empty() const noexcept { return m_updates.empty(); }

private:
    std::vector<LevelUpdate> m_updates;
};

//-------------------------------------------------------------------------

struct MatchResult
{
    OrderID orderId{};
    OrderStatus status{OrderStatus::RESTING};
    decimal_t quantityRemaining{};
    std::vector<Fill> fills;
    BookDelta delta;
};

struct CancelResult
{
    OrderID orderId{};
    decimal_t canceledQuantity{};
    BookDelta delta;
};

//-------------------------------------------------------------------------

/**
 * Continuous double auction with price-time priority. Incoming intents match
 * against the best opposite level until no longer marketable; any GTC
 * residual rests at its own price and entry priority. Fills always execute
 * at the resting order's price.
 */
class MatchingEngine
{
public:
    struct Parameters
    {
        OrderValidator::Parameters validation;
        TieBreakPolicy tieBreak = TieBreakPolicy::FIFO;
    };

    explicit MatchingEngine(
        Parameters params = {},
        rng::StreamManager* streams = nullptr,
        std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    [[nodiscard]] const Parameters& parameters() const noexcept { return m_params; }
    [[nodiscard]] const Book& book() const noexcept { return m_book; }
    [[nodiscard]] BookSignals& signals() noexcept { return m_book.signals(); }
    [[nodiscard]] const OrderValidator& validator() const noexcept { return m_validator; }
    [[nodiscard]] const FillFactory& fillFactory() const noexcept { return m_fillFactory; }

    [[nodiscard]] std::optional<decimal_t> bestBid() const noexcept { return m_book.bestBid(); }
    [[nodiscard]] std::optional<decimal_t> bestAsk() const noexcept { return m_book.bestAsk(); }
    [[nodiscard]] decimal_t depthAt(decimal_t price) const noexcept { return m_book.depthAt(price); }
    [[nodiscard]] decimal_t depthAt(Side side, decimal_t price) const noexcept
    {
        return m_book.depthAt(side, price);
    }

    // Any order ever accepted, resting or terminal.
    [[nodiscard]] std::optional<Order::Ptr> order(OrderID orderId) const;

    /**
     * Throws InvalidOrderError if the intent is malformed or reuses an id;
     * the book is untouched in that case.
     */
    MatchResult process(const OrderIntent& intent, Timestamp timestamp, SequenceNumber sequence);

    /**
     * Throws OrderNotFoundError for unknown or terminal orders, and for
     * orders that `owner` does not own. Fills already produced against the
     * order are unaffected.
     */
    CancelResult cancel(OrderID orderId, const Owner& owner);

    /**
     * Place an order without matching. Only for reconstructing externally
     * produced book states; may leave the book crossed.
     */
    void injectResting(Order::Ptr order);

    /**
     * Resolve a crossed book by repeatedly executing the earliest-entered of
     * the two best orders (as maker) against the other.
     */
    std::vector<Fill> uncross(Timestamp timestamp);

private:
    using LevelIterator = PriceLevel::iterator;

    [[nodiscard]] LevelIterator selectMaker(PriceLevel& level);

    Fill execute(
        Order::Ptr maker,
        Order::Ptr taker,
        decimal_t quantity,
        Timestamp timestamp);

    void settleResting(BookSide& side, LevelIterator orderIt, BookDelta& delta);

    std::vector<Fill> uncross(Timestamp timestamp, BookDelta& delta);

    Parameters m_params;
    OrderValidator m_validator;
    rng::StreamManager* m_streams;
    std::shared_ptr<spdlog::logger> m_logger;
    Book m_book;
    FillFactory m_fillFactory;
    std::map<OrderID, Order::Ptr> m_orders;
};

//-------------------------------------------------------------------------

}  // namespace microsim::book

//-------------------------------------------------------------------------
