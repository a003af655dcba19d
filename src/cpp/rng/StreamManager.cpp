/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/rng/StreamManager.hpp"

#include "microsim/common/SimulationException.hpp"
#include "microsim/common/util.hpp"

//-------------------------------------------------------------------------

namespace microsim::rng
{

//-------------------------------------------------------------------------

std::string agentStreamName(std::string_view agentId)
{
    return fmt::format("agents.{}", agentId);
}

//-------------------------------------------------------------------------

StreamManager::StreamManager(uint64_t rootSeed) noexcept
{
    initialize(rootSeed);
}

//-------------------------------------------------------------------------

void StreamManager::initialize(uint64_t rootSeed) noexcept
{
    m_rootSeed = rootSeed;
    m_streams.clear();
}

//-------------------------------------------------------------------------

RNG& StreamManager::stream(std::string_view name)
{
    if (!m_rootSeed) {
        throw ConfigurationError{fmt::format(
            "{}: Stream '{}' requested before initialization",
            std::source_location::current().function_name(),
            name)};
    }
    if (auto it = m_streams.find(name); it != m_streams.end()) {
        return it->second;
    }
    auto [it, _] = m_streams.emplace(std::string{name}, RNG{deriveStreamSeed(*m_rootSeed, name)});
    return it->second;
}

//-------------------------------------------------------------------------

void StreamManager::reset() noexcept
{
    m_streams.clear();
}

//-------------------------------------------------------------------------

uint64_t StreamManager::rootSeed() const
{
    if (!m_rootSeed) {
        throw ConfigurationError{fmt::format(
            "{}: Stream manager is not initialized", std::source_location::current().function_name())};
    }
    return *m_rootSeed;
}

//-------------------------------------------------------------------------

bool StreamManager::hasStream(std::string_view name) const
{
    return m_streams.contains(name);
}

//-------------------------------------------------------------------------

std::vector<std::string> StreamManager::streamNames() const
{
    return m_streams | views::keys | ranges::to<std::vector>;
}

//-------------------------------------------------------------------------

uint64_t StreamManager::deriveStreamSeed(uint64_t rootSeed, std::string_view name)
{
    if (name.empty()) {
        throw ConfigurationError{fmt::format(
            "{}: Stream name cannot be empty", std::source_location::current().function_name())};
    }
    return util::splitmix64(util::fnv1a(fmt::format("{}:{}", rootSeed, name)));
}

//-------------------------------------------------------------------------

uint64_t StreamManager::deriveRepetitionSeed(
    uint64_t scenarioSeed, uint64_t repetitionIndex) noexcept
{
    return util::splitmix64(util::splitmix64(scenarioSeed) ^ util::splitmix64(~repetitionIndex));
}

//-------------------------------------------------------------------------

void StreamManager::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        if (m_rootSeed) {
            json.AddMember("rootSeed", rapidjson::Value{*m_rootSeed}, allocator);
        } else {
            json.AddMember("rootSeed", rapidjson::Value{}.SetNull(), allocator);
        }
        json::serializeHelper(
            json,
            "streams",
            [this](rapidjson::Document& json) {
                json.SetObject();
                for (const auto& [name, rng] : m_streams) {
                    rng.checkpointSerialize(json, name);
                }
            });
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

StreamManager StreamManager::fromCheckpoint(const rapidjson::Value& json)
{
    StreamManager manager;
    if (json["rootSeed"].IsNull()) {
        return manager;
    }
    manager.initialize(json["rootSeed"].GetUint64());
    for (const auto& member : json["streams"].GetObject()) {
        manager.m_streams.emplace(member.name.GetString(), RNG::fromCheckpoint(member.value));
    }
    return manager;
}

//-------------------------------------------------------------------------

}  // namespace microsim::rng

//-------------------------------------------------------------------------
