/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/book/MatchingEngine.hpp"

#include "microsim/common/SimulationException.hpp"

#include <algorithm>
#include <iterator>

//-------------------------------------------------------------------------

namespace microsim::book
{

//-------------------------------------------------------------------------

void BookDelta::touch(Side side, decimal_t price)
{
    const bool seen = std::ranges::any_of(
        m_updates,
        [&](const LevelUpdate& update) { return update.side == side && update.price == price; });
    if (!seen) {
        m_updates.push_back(LevelUpdate{.side = side, .price = price, .depth = {}});
    }
}

//-------------------------------------------------------------------------

void BookDelta::resolve(const Book& book)
{
    for (auto& update : m_updates) {
        update.depth = book.depthAt(update.side, update.price);
    }
}

//-------------------------------------------------------------------------

MatchingEngine::MatchingEngine(
    Parameters params,
    rng::StreamManager* streams,
    std::shared_ptr<spdlog::logger> logger)
    : m_params{params},
      m_validator{params.validation},
      m_streams{streams},
      m_logger{std::move(logger)}
{
    if (m_params.tieBreak == TieBreakPolicy::RANDOMIZED && m_streams == nullptr) {
        throw ConfigurationError{fmt::format(
            "{}: Randomized tie-break requires a stream manager",
            std::source_location::current().function_name())};
    }
}

//-------------------------------------------------------------------------

std::optional<Order::Ptr> MatchingEngine::order(OrderID orderId) const
{
    if (auto it = m_orders.find(orderId); it != m_orders.end()) {
        return it->second;
    }
    return std::nullopt;
}

//-------------------------------------------------------------------------

MatchResult MatchingEngine::process(
    const OrderIntent& intent, Timestamp timestamp, SequenceNumber sequence)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (const auto res = m_validator.validate(intent); !res) {
        throw InvalidOrderError{fmt::format(
            "{}: Order #{} rejected: {}", ctx, intent.orderId, magic_enum::enum_name(res.error()))};
    }
    if (m_orders.contains(intent.orderId)) {
        throw InvalidOrderError{fmt::format(
            "{}: Order #{} rejected: {}",
            ctx,
            intent.orderId,
            magic_enum::enum_name(OrderErrorCode::DUPLICATE_ORDER_ID))};
    }

    auto taker = std::make_shared<Order>(
        intent.orderId,
        intent.owner,
        intent.side,
        intent.price,
        intent.quantity,
        timestamp,
        sequence,
        intent.timeInForce);
    m_orders.emplace(taker->id(), taker);

    MatchResult result{.orderId = taker->id()};
    BookSide& contra = m_book.side(opposite(taker->side()));

    while (taker->quantityRemaining() > 0_dec && contra.marketableAgainst(taker->price())) {
        PriceLevel& level = contra.best();
        const auto makerIt = selectMaker(level);
        const Order::Ptr maker = *makerIt;
        const decimal_t quantity = util::min(taker->quantityRemaining(), maker->quantityRemaining());
        result.fills.push_back(execute(maker, taker, quantity, timestamp));
        contra.reduce(level, quantity);
        settleResting(contra, makerIt, result.delta);
    }

    if (taker->quantityRemaining() > 0_dec) {
        if (taker->timeInForce() == TimeInForce::IOC) {
            taker->cancel();
        } else {
            m_book.rest(taker);
            result.delta.touch(taker->side(), taker->price());
        }
    }

    if (m_book.isCrossed()) [[unlikely]] {
        m_logger->error(
            "Book crossed after order #{} (bid {} >= ask {}), uncrossing",
            taker->id(),
            m_book.bestBid().value(),
            m_book.bestAsk().value());
        std::ranges::move(uncross(timestamp, result.delta), std::back_inserter(result.fills));
    }

    result.status = taker->status();
    result.quantityRemaining = taker->quantityRemaining();
    result.delta.resolve(m_book);

    return result;
}

//-------------------------------------------------------------------------

CancelResult MatchingEngine::cancel(OrderID orderId, const Owner& owner)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    auto it = m_orders.find(orderId);
    if (it == m_orders.end()) {
        throw OrderNotFoundError{orderId, fmt::format("{}: Unknown order #{}", ctx, orderId)};
    }
    const Order::Ptr order = it->second;
    if (order->owner() != owner) {
        throw OrderNotFoundError{
            orderId, fmt::format("{}: Order #{} is not owned by '{}'", ctx, orderId, owner)};
    }
    if (isTerminal(order->status())) {
        throw OrderNotFoundError{
            orderId,
            fmt::format(
                "{}: Order #{} is already {}", ctx, orderId, magic_enum::enum_name(order->status()))};
    }

    CancelResult result{.orderId = orderId, .canceledQuantity = order->quantityRemaining()};
    if (!m_book.cancelOrderOpt(orderId)) {
        throw SimulationException{fmt::format(
            "{}: Live order #{} missing from the book", ctx, orderId)};
    }
    result.delta.touch(order->side(), order->price());
    result.delta.resolve(m_book);

    return result;
}

//-------------------------------------------------------------------------

void MatchingEngine::injectResting(Order::Ptr order)
{
    if (m_orders.contains(order->id())) {
        throw InvalidOrderError{fmt::format(
            "{}: Order #{} rejected: {}",
            std::source_location::current().function_name(),
            order->id(),
            magic_enum::enum_name(OrderErrorCode::DUPLICATE_ORDER_ID))};
    }
    m_orders.emplace(order->id(), order);
    m_book.rest(order);
}

//-------------------------------------------------------------------------

std::vector<Fill> MatchingEngine::uncross(Timestamp timestamp)
{
    BookDelta delta;
    return uncross(timestamp, delta);
}

//-------------------------------------------------------------------------

std::vector<Fill> MatchingEngine::uncross(Timestamp timestamp, BookDelta& delta)
{
    std::vector<Fill> fills;
    while (m_book.isCrossed()) {
        BookSide& bids = m_book.bids();
        BookSide& asks = m_book.asks();
        const auto bidIt = bids.best().begin();
        const auto askIt = asks.best().begin();
        const Order::Ptr bid = *bidIt;
        const Order::Ptr ask = *askIt;

        const bool bidFirst = bid->enteredBefore(*ask);
        const Order::Ptr maker = bidFirst ? bid : ask;
        const Order::Ptr taker = bidFirst ? ask : bid;
        const decimal_t quantity = util::min(bid->quantityRemaining(), ask->quantityRemaining());

        Fill fill = execute(maker, taker, quantity, timestamp);
        m_book.signals().uncrossed(fill);
        fills.push_back(std::move(fill));

        bids.reduce(bids.best(), quantity);
        asks.reduce(asks.best(), quantity);
        settleResting(bids, bidIt, delta);
        settleResting(asks, askIt, delta);
    }
    return fills;
}

//-------------------------------------------------------------------------

MatchingEngine::LevelIterator MatchingEngine::selectMaker(PriceLevel& level)
{
    if (m_params.tieBreak == TieBreakPolicy::FIFO) {
        return level.begin();
    }
    // Only orders sharing the earliest entry timestamp compete; sequence
    // priority across distinct timestamps is never overridden.
    const size_t run = level.frontTimestampRun();
    if (run <= 1) {
        return level.begin();
    }
    const int64_t pick =
        m_streams->stream(rng::kMechanismStream).uniformInt(0, static_cast<int64_t>(run) - 1);
    return std::next(level.begin(), pick);
}

//-------------------------------------------------------------------------

Fill MatchingEngine::execute(
    Order::Ptr maker, Order::Ptr taker, decimal_t quantity, Timestamp timestamp)
{
    maker->fill(quantity);
    taker->fill(quantity);
    Fill fill = m_fillFactory.makeRecord(
        maker->id(),
        taker->id(),
        maker->owner(),
        taker->owner(),
        taker->side(),
        maker->price(),
        quantity,
        timestamp);
    m_book.signals().fill(fill);
    return fill;
}

//-------------------------------------------------------------------------

void MatchingEngine::settleResting(BookSide& side, LevelIterator orderIt, BookDelta& delta)
{
    PriceLevel& level = side.best();
    delta.touch(side.side(), level.price());
    const Order::Ptr order = *orderIt;
    if (order->status() != OrderStatus::FILLED) return;
    level.erase(orderIt);
    m_book.unregisterOrder(order->id());
    side.dropBestIfEmpty();
}

//-------------------------------------------------------------------------

}  // namespace microsim::book

//-------------------------------------------------------------------------
