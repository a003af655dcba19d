/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/event/Event.hpp"

#include <queue>
#include <vector>

//-------------------------------------------------------------------------

namespace microsim::scheduler
{

//-------------------------------------------------------------------------

/**
 * Min-heap of stamped events keyed on (timestamp, priority, sequence).
 */
class EventQueue
{
public:
    EventQueue() noexcept = default;

    [[nodiscard]] const event::Event& top() const { return m_queue.top(); }
    [[nodiscard]] bool empty() const { return m_queue.empty(); }
    [[nodiscard]] size_t size() const { return m_queue.size(); }

    void push(event::Event event) { m_queue.push(std::move(event)); }
    void pop() { m_queue.pop(); }
    void clear() { m_queue.clear(); }

    // Pending events in processing order.
    [[nodiscard]] std::vector<event::Event> pending() const;

private:
    struct CompareQueueEvents
    {
        bool operator()(const event::Event& lhs, const event::Event& rhs) const noexcept
        {
            return lhs.orderKey() > rhs.orderKey();
        }
    };

    using QueueType = std::priority_queue<
        event::Event,
        std::vector<event::Event>,
        CompareQueueEvents>;

    struct AccessiblePriorityQueue : public QueueType
    {
        [[nodiscard]] const container_type& underlying() const noexcept { return c; }

        void clear() { c.clear(); }
    };

    AccessiblePriorityQueue m_queue;
};

//-------------------------------------------------------------------------

}  // namespace microsim::scheduler

//-------------------------------------------------------------------------
