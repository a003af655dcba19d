/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/common/SimulationException.hpp"
#include "microsim/scheduler/EventScheduler.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace microsim;
using namespace microsim::event;
using namespace microsim::scheduler;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

Event newsEvent(EventID id, std::string headline)
{
    return Event{
        .eventId = id,
        .payload = NewsPayload{.source = "wire", .headline = std::move(headline)}};
}

std::vector<EventID> drain(EventScheduler& scheduler)
{
    std::vector<EventID> ids;
    while (!scheduler.empty()) {
        ids.push_back(scheduler.advance().eventId);
    }
    return ids;
}

}  // namespace

//-------------------------------------------------------------------------

TEST(EventClockTest, Advance)
{
    EventClock clock;
    EXPECT_EQ(clock.now(), 0);
    EXPECT_EQ(clock.advance(5), 5);
    EXPECT_EQ(clock.advance(0), 5);
    EXPECT_EQ(clock.advanceTo(12), 12);
    EXPECT_THROW(clock.advance(-1), ConfigurationError);
    EXPECT_THROW(clock.advanceTo(11), ConfigurationError);
    EXPECT_EQ(clock.now(), 12);
}

//-------------------------------------------------------------------------

TEST(EventQueueTest, API)
{
    EventQueue queue;

    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(queue.size(), 0);

    static constexpr int pushCount = 4;
    for (int i = 0; i < pushCount; ++i) {
        auto event = newsEvent(i + 1, "x");
        event.sequence = i + 1;
        queue.push(event);
    }

    EXPECT_FALSE(queue.empty());
    EXPECT_EQ(queue.size(), pushCount);

    static constexpr int popCount = 3;
    for (int i = 0; i < popCount; ++i) {
        queue.pop();
    }

    EXPECT_EQ(queue.size(), pushCount - popCount);
    EXPECT_EQ(queue.top().eventId, 4);

    queue.clear();
    EXPECT_TRUE(queue.empty());
}

//-------------------------------------------------------------------------

TEST(EventQueueTest, PriorityLaneBreaksTimestampTies)
{
    EventQueue queue;
    for (auto [id, priority] : {std::pair{1, 2}, std::pair{2, 0}, std::pair{3, 1}}) {
        auto event = newsEvent(id, "x");
        event.timestamp = 10;
        event.sequence = id;
        event.priority = priority;
        queue.push(event);
    }

    const auto pending = queue.pending();
    EXPECT_THAT(
        pending | views::transform(&Event::eventId) | ranges::to<std::vector>,
        ElementsAre(2, 3, 1));
}

//-------------------------------------------------------------------------

TEST(EventSchedulerTest, EqualTimestampsProcessInSchedulingOrder)
{
    EventScheduler scheduler;
    for (EventID id : {1, 2, 3, 4}) {
        scheduler.schedule(newsEvent(id, "tie"), 5);
    }
    EXPECT_THAT(drain(scheduler), ElementsAre(1, 2, 3, 4));
    EXPECT_EQ(scheduler.now(), 5);
}

//-------------------------------------------------------------------------

TEST(EventSchedulerTest, TimestampOrderDominatesSchedulingOrder)
{
    EventScheduler scheduler;
    scheduler.schedule(newsEvent(1, "late"), 30);
    scheduler.schedule(newsEvent(2, "early"), 10);
    scheduler.schedule(newsEvent(3, "middle"), 20);
    scheduler.schedule(newsEvent(4, "early too"), 10);

    EXPECT_EQ(scheduler.nextTimestamp(), Timestamp{10});
    EXPECT_EQ(scheduler.peek().eventId, 2);
    EXPECT_EQ(scheduler.size(), 4);
    EXPECT_THAT(drain(scheduler), ElementsAre(2, 4, 3, 1));
    EXPECT_EQ(scheduler.now(), 30);
    EXPECT_FALSE(scheduler.nextTimestamp().has_value());
}

//-------------------------------------------------------------------------

TEST(EventSchedulerTest, SequenceNumbersAreAssignedAtSchedulingTime)
{
    EventScheduler scheduler;
    const auto first = scheduler.schedule(newsEvent(1, "a"), 100);
    const auto second = scheduler.schedule(newsEvent(2, "b"), 50);

    EXPECT_EQ(first.sequence, 1);
    EXPECT_EQ(second.sequence, 2);
    EXPECT_EQ(first.timestamp, 100);
    EXPECT_EQ(scheduler.lastSequence(), 2);

    // Processing does not reassign.
    EXPECT_EQ(scheduler.advance().sequence, 2);
    const auto third = scheduler.schedule(newsEvent(3, "c"), 50);
    EXPECT_EQ(third.sequence, 3);
    EXPECT_EQ(scheduler.advance().eventId, 3);
    EXPECT_EQ(scheduler.advance().eventId, 1);
}

//-------------------------------------------------------------------------

TEST(EventSchedulerTest, RejectsSchedulingIntoThePast)
{
    EventScheduler scheduler;
    scheduler.schedule(newsEvent(1, "a"), 10);
    std::ignore = scheduler.advance();

    EXPECT_THROW(scheduler.schedule(newsEvent(2, "b"), 9), ConfigurationError);
    EXPECT_TRUE(scheduler.empty());
    EXPECT_NO_THROW(scheduler.schedule(newsEvent(3, "c"), 10));
    EXPECT_EQ(scheduler.size(), 1);
}

//-------------------------------------------------------------------------

TEST(EventSchedulerTest, AdvanceOnEmptyThrows)
{
    EventScheduler scheduler;
    EXPECT_THROW(scheduler.advance(), SimulationException);
    EXPECT_THROW(std::ignore = scheduler.peek(), SimulationException);
}

//-------------------------------------------------------------------------
