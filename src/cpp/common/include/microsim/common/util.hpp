/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/common/common.hpp"

#include <pugixml.hpp>

#include <cstdint>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace microsim::util
{

//-------------------------------------------------------------------------

inline constexpr uint64_t kFnvOffsetBasis = 0xcbf29ce484222325ull;
inline constexpr uint64_t kFnvPrime = 0x100000001b3ull;

[[nodiscard]] constexpr uint64_t fnv1a(std::string_view str, uint64_t hash = kFnvOffsetBasis) noexcept
{
    for (char c : str) {
        hash ^= static_cast<uint8_t>(c);
        hash *= kFnvPrime;
    }
    return hash;
}

[[nodiscard]] constexpr uint64_t splitmix64(uint64_t x) noexcept
{
    x += 0x9e3779b97f4a7c15ull;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
    return x ^ (x >> 31);
}

[[nodiscard]] std::vector<std::string> split(std::string_view str, char delim) noexcept;

/**
 * Load an XML document and return its root node with the given name.
 * Throws ConfigurationError if the file is missing, malformed or lacks the root.
 */
[[nodiscard]] pugi::xml_node loadXmlRoot(
    pugi::xml_document& doc, const fs::path& path, const char* rootName);

[[nodiscard]] pugi::xml_node parseXmlRoot(
    pugi::xml_document& doc, std::string_view xml, const char* rootName);

//-------------------------------------------------------------------------

}  // namespace microsim::util

//-------------------------------------------------------------------------
