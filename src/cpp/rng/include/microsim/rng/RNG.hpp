/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/serialization/CheckpointSerializable.hpp"

#include <cstdint>
#include <random>

//-------------------------------------------------------------------------

namespace microsim::rng
{

//-------------------------------------------------------------------------

class RNG : public std::mt19937_64, public CheckpointSerializable
{
public:
    explicit RNG(uint64_t seed = std::mt19937_64::default_seed) noexcept;

    std::mt19937_64::result_type operator()();

    [[nodiscard]] uint64_t seed() const noexcept { return m_seed; }
    [[nodiscard]] uint64_t callCount() const noexcept { return m_callCount; }

    [[nodiscard]] double uniform(double lo = 0.0, double hi = 1.0);
    [[nodiscard]] int64_t uniformInt(int64_t lo, int64_t hi);
    [[nodiscard]] double normal(double mean = 0.0, double stddev = 1.0);
    [[nodiscard]] bool bernoulli(double p);
    [[nodiscard]] double exponential(double rate);

    virtual void checkpointSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static RNG fromCheckpoint(const rapidjson::Value& json);

private:
    uint64_t m_callCount{};
    uint64_t m_seed;
};

//-------------------------------------------------------------------------

}  // namespace microsim::rng

//-------------------------------------------------------------------------
