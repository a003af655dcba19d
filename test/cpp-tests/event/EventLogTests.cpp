/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/common/SimulationException.hpp"
#include "microsim/event/EventLog.hpp"
#include "microsim/event/replay.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>

//-------------------------------------------------------------------------

using namespace microsim;
using namespace microsim::event;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

std::vector<Event> sampleEvents()
{
    return {
        Event{
            .eventId = 1,
            .timestamp = 1,
            .sequence = 1,
            .payload = NewsPayload{.source = "wire", .headline = "rate cut", .signal = DEC(-0.25)}},
        Event{
            .eventId = 2,
            .timestamp = 2,
            .sequence = 2,
            .payload = OrderPayload{.intent = book::OrderIntent{
                .orderId = 7,
                .owner = "alice",
                .side = Side::SELL,
                .price = DEC(101.1),
                .quantity = DEC(0.3),
                .timeInForce = book::TimeInForce::IOC}}},
        Event{
            .eventId = 3,
            .timestamp = 2,
            .sequence = 3,
            .payload = CancelPayload{.orderId = 7, .owner = "alice"}},
        Event{
            .eventId = 4,
            .timestamp = 3,
            .sequence = 4,
            .payload = FillPayload{.fill = book::Fill{
                0, 7, 8, "alice", "bob", Side::BUY, DEC(101.1), DEC(0.1), 3}}},
        Event{
            .eventId = 5,
            .timestamp = 4,
            .sequence = 5,
            .payload = BatchClearPayload{.clearingPrice = DEC(100.5), .volume = 12_dec}},
        Event{
            .eventId = 6,
            .timestamp = 5,
            .sequence = 6,
            .payload = RfqRequestPayload{
                .requestId = 1, .owner = "carol", .side = Side::BUY, .quantity = 3_dec}},
        Event{
            .eventId = 7,
            .timestamp = 5,
            .sequence = 7,
            .payload = RfqQuotePayload{
                .requestId = 1, .quoteId = 2, .owner = "dave", .price = DEC(99.9), .quantity = 3_dec}},
        Event{
            .eventId = 8,
            .timestamp = 6,
            .sequence = 8,
            .payload = RfqAcceptPayload{.requestId = 1, .quoteId = 2, .owner = "carol"}}};
}

}  // namespace

//-------------------------------------------------------------------------

TEST(EventKindTest, WireNames)
{
    EXPECT_EQ(kind2str(EventKind::BATCH_CLEAR), "batch_clear");
    EXPECT_EQ(kind2str(EventKind::RFQ_ACCEPT), "rfq_accept");
    EXPECT_EQ(str2kind("order"), EventKind::ORDER);
    EXPECT_EQ(str2kind("rfq_quote"), EventKind::RFQ_QUOTE);
    EXPECT_THROW(std::ignore = str2kind("trade"), SimulationException);
}

//-------------------------------------------------------------------------

TEST(EventTest, PayloadAccess)
{
    const auto events = sampleEvents();
    EXPECT_EQ(events[1].kind(), EventKind::ORDER);
    EXPECT_EQ(events[1].as<OrderPayload>().intent.owner, "alice");
    EXPECT_THROW(std::ignore = events[1].as<CancelPayload>(), std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST(EventLogTest, AppendEnforcesEventOrder)
{
    EventLog log;
    auto events = sampleEvents();
    log.append(events[0]);
    log.append(events[1]);

    EXPECT_THROW(log.append(events[0]), SimulationException);
    auto sameKey = events[2];
    sameKey.sequence = events[1].sequence;
    EXPECT_THROW(log.append(sameKey), SimulationException);
    EXPECT_EQ(log.size(), 2);
}

//-------------------------------------------------------------------------

TEST(EventLogTest, JsonLinesRoundTripPreservesEverything)
{
    EventLog log;
    for (auto& event : sampleEvents()) {
        log.append(std::move(event));
    }

    const std::string lines = log.toJsonLines();
    EXPECT_EQ(std::ranges::count(lines, '\n'), 8);

    const auto restored = EventLog::fromJsonLines(lines);
    ASSERT_EQ(restored.size(), log.size());
    EXPECT_EQ(restored.toJsonLines(), lines);

    const auto& news = restored.events()[0].as<NewsPayload>();
    EXPECT_EQ(news.headline, "rate cut");
    EXPECT_EQ(news.signal, DEC(-0.25));

    const auto& intent = restored.events()[1].as<OrderPayload>().intent;
    EXPECT_EQ(intent.orderId, 7);
    EXPECT_EQ(intent.side, Side::SELL);
    EXPECT_EQ(intent.price, DEC(101.1));
    EXPECT_EQ(intent.quantity, DEC(0.3));
    EXPECT_EQ(intent.timeInForce, book::TimeInForce::IOC);

    EXPECT_EQ(restored.events()[6].as<RfqQuotePayload>().price, DEC(99.9));
    EXPECT_EQ(restored.events()[7].kind(), EventKind::RFQ_ACCEPT);
}

//-------------------------------------------------------------------------

TEST(EventLogTest, FillsAreExtractedInLogOrder)
{
    EventLog log;
    for (auto& event : sampleEvents()) {
        log.append(std::move(event));
    }
    const auto fills = log.fills();
    ASSERT_EQ(fills.size(), 1);
    EXPECT_EQ(fills[0].buyer(), "bob");
    EXPECT_EQ(fills[0].seller(), "alice");
    EXPECT_EQ(fills[0].notional(), DEC(10.11));
}

//-------------------------------------------------------------------------

TEST(EventLogTest, MalformedLinesAreReported)
{
    EXPECT_THROW(std::ignore = EventLog::fromJsonLines("{\"id\": 1,"), SimulationException);
    EXPECT_THROW(
        std::ignore = EventLog::fromJsonLines("{\"id\": 1, \"ts\": 0, \"seq\": 1, \"prio\": 0}"),
        SimulationException);
    EXPECT_TRUE(EventLog::fromJsonLines("\n\n").empty());
}

//-------------------------------------------------------------------------

TEST(EventLogTest, MistypedFieldsAreReported)
{
    EventLog log;
    log.append(sampleEvents()[1]);
    const std::string line = log.toJsonLines();
    ASSERT_NE(line.find("\"id\":2"), std::string::npos);
    ASSERT_NE(line.find("\"IOC\""), std::string::npos);

    auto withReplaced = [&line](std::string_view from, std::string_view to) {
        std::string mutated = line;
        mutated.replace(mutated.find(from), from.size(), to);
        return mutated;
    };

    EXPECT_NO_THROW(std::ignore = EventLog::fromJsonLines(line));
    EXPECT_THROW(
        std::ignore = EventLog::fromJsonLines(withReplaced("\"id\":2", "\"id\":\"x\"")),
        SimulationException);
    EXPECT_THROW(
        std::ignore = EventLog::fromJsonLines(withReplaced("\"id\":2", "\"id\":-2")),
        SimulationException);
    EXPECT_THROW(
        std::ignore = EventLog::fromJsonLines(withReplaced("\"kind\":\"order\"", "\"kind\":7")),
        SimulationException);
    EXPECT_THROW(
        std::ignore = EventLog::fromJsonLines(withReplaced("\"IOC\"", "\"GTD\"")),
        SimulationException);
    EXPECT_THROW(
        std::ignore = EventLog::fromJsonLines(withReplaced("\"o\":\"alice\"", "\"o\":[]")),
        SimulationException);
}

//-------------------------------------------------------------------------

TEST(EventLogTest, WriterMirrorsAppendedEvents)
{
    const fs::path dir = fs::temp_directory_path() / "microsim-event-log-test";
    fs::create_directories(dir);
    const fs::path mirrored = dir / "mirror.jsonl";
    const fs::path dumped = dir / "dump.jsonl";

    EventLog log;
    log.setWriter(std::make_unique<EventLogWriter>(mirrored));
    for (auto& event : sampleEvents()) {
        log.append(std::move(event));
    }
    log.dump(dumped);

    const auto fromMirror = EventLog::load(mirrored);
    const auto fromDump = EventLog::load(dumped);
    EXPECT_EQ(fromMirror.toJsonLines(), log.toJsonLines());
    EXPECT_EQ(fromDump.toJsonLines(), log.toJsonLines());

    fs::remove_all(dir);
    EXPECT_THROW(std::ignore = EventLog::load(dir / "missing.jsonl"), SimulationException);
}

//-------------------------------------------------------------------------

TEST(ReplayTest, FoldsInTimestampSequenceOrder)
{
    auto events = sampleEvents();
    std::ranges::reverse(events);

    const auto visited = replayEvents(
        events,
        std::vector<EventID>{},
        [](std::vector<EventID> state, const Event& event) {
            state.push_back(event.eventId);
            return state;
        });

    EXPECT_THAT(visited, ElementsAre(1, 2, 3, 4, 5, 6, 7, 8));
}

//-------------------------------------------------------------------------
