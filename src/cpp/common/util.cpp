/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/common/util.hpp"

#include "microsim/common/SimulationException.hpp"

//-------------------------------------------------------------------------

namespace microsim::util
{

//-------------------------------------------------------------------------

std::vector<std::string> split(std::string_view str, char delim) noexcept
{
    std::vector<std::string> res;
    size_t pos{};
    while (pos <= str.size()) {
        const size_t next = std::min(str.find(delim, pos), str.size());
        res.emplace_back(str.substr(pos, next - pos));
        pos = next + 1;
    }
    return res;
}

//-------------------------------------------------------------------------

pugi::xml_node loadXmlRoot(pugi::xml_document& doc, const fs::path& path, const char* rootName)
{
    static constexpr auto ctx = std::source_location::current().function_name();
    if (!fs::exists(path)) {
        throw ConfigurationError{fmt::format("{}: No such file '{}'", ctx, path.c_str())};
    }
    pugi::xml_parse_result parseResult = doc.load_file(path.c_str());
    if (!parseResult) {
        throw ConfigurationError{fmt::format(
            "{}: Unable to parse '{}': {}", ctx, path.c_str(), parseResult.description())};
    }
    pugi::xml_node root = doc.child(rootName);
    if (!root) {
        throw ConfigurationError{fmt::format(
            "{}: '{}' has no <{}> root element", ctx, path.c_str(), rootName)};
    }
    return root;
}

//-------------------------------------------------------------------------

pugi::xml_node parseXmlRoot(pugi::xml_document& doc, std::string_view xml, const char* rootName)
{
    static constexpr auto ctx = std::source_location::current().function_name();
    pugi::xml_parse_result parseResult = doc.load_buffer(xml.data(), xml.size());
    if (!parseResult) {
        throw ConfigurationError{fmt::format(
            "{}: Unable to parse XML: {}", ctx, parseResult.description())};
    }
    pugi::xml_node root = doc.child(rootName);
    if (!root) {
        throw ConfigurationError{fmt::format("{}: Missing <{}> root element", ctx, rootName)};
    }
    return root;
}

//-------------------------------------------------------------------------

}  // namespace microsim::util

//-------------------------------------------------------------------------
