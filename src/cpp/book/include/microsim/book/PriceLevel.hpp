/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/book/Order.hpp"

#include <list>

//-------------------------------------------------------------------------

namespace microsim::book
{

//-------------------------------------------------------------------------

/**
 * All resting orders at one price, kept in (entry timestamp, entry sequence)
 * order. A partially filled order keeps its place.
 */
class PriceLevel
    : public std::list<Order::Ptr>,
      public JsonSerializable,
      public CheckpointSerializable
{
public:
    using ContainerType = std::list<value_type>;

    explicit PriceLevel(decimal_t price) noexcept;

    [[nodiscard]] decimal_t price() const noexcept { return m_price; }
    [[nodiscard]] decimal_t volume() const noexcept { return m_volume; }

    void updateVolume(decimal_t deltaVolume) noexcept { m_volume += deltaVolume; }

    bool operator<(const PriceLevel& rhs) const noexcept { return m_price < rhs.price(); }
    bool operator<(decimal_t price) const noexcept { return m_price < price; }

    void insert(const value_type& order);
    iterator erase(const_iterator pos);

    // Number of leading orders sharing the front order's entry timestamp.
    [[nodiscard]] size_t frontTimestampRun() const noexcept;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
    virtual void checkpointSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    decimal_t m_price;
    decimal_t m_volume{};
};

//-------------------------------------------------------------------------

}  // namespace microsim::book

//-------------------------------------------------------------------------
