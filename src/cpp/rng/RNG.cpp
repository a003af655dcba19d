/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/rng/RNG.hpp"

#include "microsim/common/SimulationException.hpp"

#include <boost/random/bernoulli_distribution.hpp>
#include <boost/random/exponential_distribution.hpp>
#include <boost/random/normal_distribution.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <boost/random/uniform_real_distribution.hpp>

//-------------------------------------------------------------------------

namespace microsim::rng
{

//-------------------------------------------------------------------------

namespace br = boost::random;

//-------------------------------------------------------------------------

RNG::RNG(uint64_t seed) noexcept
    : std::mt19937_64{seed}, m_seed{seed}
{}

//-------------------------------------------------------------------------

std::mt19937_64::result_type RNG::operator()()
{
    ++m_callCount;
    return std::mt19937_64::operator()();
}

//-------------------------------------------------------------------------

double RNG::uniform(double lo, double hi)
{
    if (!(lo < hi)) {
        throw ConfigurationError{fmt::format(
            "{}: Empty range [{}, {})", std::source_location::current().function_name(), lo, hi)};
    }
    return br::uniform_real_distribution<double>{lo, hi}(*this);
}

//-------------------------------------------------------------------------

int64_t RNG::uniformInt(int64_t lo, int64_t hi)
{
    if (lo > hi) {
        throw ConfigurationError{fmt::format(
            "{}: Empty range [{}, {}]", std::source_location::current().function_name(), lo, hi)};
    }
    return br::uniform_int_distribution<int64_t>{lo, hi}(*this);
}

//-------------------------------------------------------------------------

double RNG::normal(double mean, double stddev)
{
    return br::normal_distribution<double>{mean, stddev}(*this);
}

//-------------------------------------------------------------------------

bool RNG::bernoulli(double p)
{
    if (p < 0.0 || p > 1.0) {
        throw ConfigurationError{fmt::format(
            "{}: Probability {} outside [0, 1]", std::source_location::current().function_name(), p)};
    }
    return br::bernoulli_distribution<double>{p}(*this);
}

//-------------------------------------------------------------------------

double RNG::exponential(double rate)
{
    if (rate <= 0.0) {
        throw ConfigurationError{fmt::format(
            "{}: Rate should be positive, was {}", std::source_location::current().function_name(), rate)};
    }
    return br::exponential_distribution<double>{rate}(*this);
}

//-------------------------------------------------------------------------

void RNG::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("callCount", rapidjson::Value{m_callCount}, allocator);
        json.AddMember("seed", rapidjson::Value{m_seed}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

RNG RNG::fromCheckpoint(const rapidjson::Value& json)
{
    RNG rng{json["seed"].GetUint64()};
    rng.m_callCount = json["callCount"].GetUint64();
    rng.discard(rng.m_callCount);
    return rng;
}

//-------------------------------------------------------------------------

}  // namespace microsim::rng

//-------------------------------------------------------------------------
