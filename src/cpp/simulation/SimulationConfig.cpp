/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/simulation/SimulationConfig.hpp"

#include "microsim/common/SimulationException.hpp"
#include "microsim/common/util.hpp"

#include <algorithm>

//-------------------------------------------------------------------------

namespace microsim::simulation
{

//-------------------------------------------------------------------------

namespace
{

void checkLatency(Timedelta value, std::string_view name)
{
    if (value < 0) {
        throw ConfigurationError{fmt::format(
            "{}: Latency '{}' should be non-negative, was {}",
            std::source_location::current().function_name(),
            name,
            value)};
    }
}

}  // namespace

//-------------------------------------------------------------------------

LatencyConfig LatencyConfig::fromXML(pugi::xml_node node)
{
    LatencyConfig latency;
    if (!node) return latency;

    latency.submission = node.attribute("submission").as_llong(latency.submission);
    latency.fill = node.attribute("fill").as_llong(latency.fill);
    latency.cancel = node.attribute("cancel").as_llong(latency.cancel);

    checkLatency(latency.submission, "submission");
    checkLatency(latency.fill, "fill");
    checkLatency(latency.cancel, "cancel");

    return latency;
}

//-------------------------------------------------------------------------

SimulationConfig& SimulationConfig::setLatency(LatencyConfig latency)
{
    checkLatency(latency.submission, "submission");
    checkLatency(latency.fill, "fill");
    checkLatency(latency.cancel, "cancel");
    m_latency = latency;
    return *this;
}

//-------------------------------------------------------------------------

SimulationConfig& SimulationConfig::addAccount(accounting::InitialHoldings holdings)
{
    if (holdings.owner.empty()) {
        throw ConfigurationError{fmt::format(
            "{}: Account owner should not be empty",
            std::source_location::current().function_name())};
    }
    const bool duplicate = std::ranges::any_of(
        m_accounts,
        [&](const auto& account) { return account.owner == holdings.owner; });
    if (duplicate) {
        throw ConfigurationError{fmt::format(
            "{}: Duplicate account '{}'",
            std::source_location::current().function_name(),
            holdings.owner)};
    }
    m_accounts.push_back(std::move(holdings));
    return *this;
}

//-------------------------------------------------------------------------

SimulationConfig SimulationConfig::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    SimulationConfig config;

    pugi::xml_attribute attr;
    if (attr = node.attribute("seed"); attr.empty()) {
        throw ConfigurationError{fmt::format("{}: missing required attribute 'seed'", ctx)};
    }
    config.m_seed = attr.as_ullong();

    config.m_debug = node.attribute("debug").as_bool();

    if (attr = node.attribute("logDir"); !attr.empty()) {
        config.m_logDir = fs::path{attr.as_string()};
    }
    if (attr = node.attribute("pnlConvention"); !attr.empty()) {
        config.m_pnlConvention = accounting::str2convention(attr.as_string());
    }
    if (attr = node.attribute("tieBreak"); !attr.empty()) {
        config.m_tieBreak = str2tieBreak(attr.as_string());
    }

    config.m_latency = LatencyConfig::fromXML(node.child("Latency"));
    config.m_bookBounds = book::OrderValidator::Parameters::fromXML(node.child("Book"));

    for (pugi::xml_node accountNode : node.child("Accounts").children("Account")) {
        config.addAccount(accounting::InitialHoldings::fromXML(accountNode));
    }

    return config;
}

//-------------------------------------------------------------------------

SimulationConfig SimulationConfig::fromFile(const fs::path& path)
{
    pugi::xml_document doc;
    return fromXML(util::loadXmlRoot(doc, path, "Simulation"));
}

//-------------------------------------------------------------------------

SimulationConfig SimulationConfig::fromString(std::string_view xml)
{
    pugi::xml_document doc;
    return fromXML(util::parseXmlRoot(doc, xml, "Simulation"));
}

//-------------------------------------------------------------------------

book::TieBreakPolicy str2tieBreak(std::string_view str)
{
    if (auto policy = magic_enum::enum_cast<book::TieBreakPolicy>(str, magic_enum::case_insensitive)) {
        return *policy;
    }
    throw ConfigurationError{fmt::format(
        "{}: Unknown tie-break policy '{}'",
        std::source_location::current().function_name(),
        str)};
}

//-------------------------------------------------------------------------

}  // namespace microsim::simulation

//-------------------------------------------------------------------------
