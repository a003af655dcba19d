/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/common/common.hpp"
#include "microsim/rng/RNG.hpp"
#include "microsim/serialization/CheckpointSerializable.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace microsim::rng
{

//-------------------------------------------------------------------------

inline constexpr std::string_view kLatentStream = "latent";
inline constexpr std::string_view kMechanismStream = "mechanism";

[[nodiscard]] std::string agentStreamName(std::string_view agentId);

//-------------------------------------------------------------------------

/**
 * Owns one independent generator per named stream. A stream's seed is a pure
 * function of (root seed, name), so draws on one stream never depend on how
 * many draws were taken from any other.
 */
class StreamManager : public CheckpointSerializable
{
public:
    StreamManager() noexcept = default;
    explicit StreamManager(uint64_t rootSeed) noexcept;

    void initialize(uint64_t rootSeed) noexcept;

    [[nodiscard]] RNG& stream(std::string_view name);

    // Forget all streams; the next request restarts each from its derived seed.
    void reset() noexcept;

    [[nodiscard]] bool initialized() const noexcept { return m_rootSeed.has_value(); }
    [[nodiscard]] uint64_t rootSeed() const;
    [[nodiscard]] bool hasStream(std::string_view name) const;
    [[nodiscard]] std::vector<std::string> streamNames() const;

    [[nodiscard]] static uint64_t deriveStreamSeed(uint64_t rootSeed, std::string_view name);
    [[nodiscard]] static uint64_t deriveRepetitionSeed(
        uint64_t scenarioSeed, uint64_t repetitionIndex) noexcept;

    virtual void checkpointSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static StreamManager fromCheckpoint(const rapidjson::Value& json);

private:
    std::optional<uint64_t> m_rootSeed;
    std::map<std::string, RNG, std::less<>> m_streams;
};

//-------------------------------------------------------------------------

}  // namespace microsim::rng

//-------------------------------------------------------------------------
