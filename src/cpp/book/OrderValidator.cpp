/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/book/OrderValidator.hpp"

#include "microsim/common/SimulationException.hpp"

//-------------------------------------------------------------------------

namespace microsim::book
{

//-------------------------------------------------------------------------

OrderValidator::Parameters OrderValidator::Parameters::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    Parameters params;
    if (!node) return params;

    if (pugi::xml_attribute attr = node.attribute("minPrice")) {
        params.minPrice = util::double2decimal(attr.as_double());
        if (*params.minPrice < 0_dec) {
            throw ConfigurationError{fmt::format(
                "{}: Attribute 'minPrice' should be non-negative, was {}", ctx, *params.minPrice)};
        }
    }
    if (pugi::xml_attribute attr = node.attribute("maxPrice")) {
        params.maxPrice = util::double2decimal(attr.as_double());
        if (*params.maxPrice <= 0_dec) {
            throw ConfigurationError{fmt::format(
                "{}: Attribute 'maxPrice' should be positive, was {}", ctx, *params.maxPrice)};
        }
    }
    if (params.minPrice && params.maxPrice && *params.minPrice > *params.maxPrice) {
        throw ConfigurationError{fmt::format(
            "{}: 'minPrice' ({}) exceeds 'maxPrice' ({})", ctx, *params.minPrice, *params.maxPrice)};
    }

    return params;
}

//-------------------------------------------------------------------------

OrderValidator::ExpectedResult OrderValidator::validate(const OrderIntent& intent) const noexcept
{
    if (!magic_enum::enum_contains(intent.side)) {
        return std::unexpected{OrderErrorCode::INVALID_SIDE};
    }
    if (!magic_enum::enum_contains(intent.timeInForce)) {
        return std::unexpected{OrderErrorCode::INVALID_TIME_IN_FORCE};
    }
    if (intent.owner.empty()) {
        return std::unexpected{OrderErrorCode::EMPTY_OWNER};
    }
    if (!(intent.price > 0_dec)) {
        return std::unexpected{OrderErrorCode::INVALID_PRICE};
    }
    if (!(intent.quantity > 0_dec)) {
        return std::unexpected{OrderErrorCode::INVALID_QUANTITY};
    }
    if ((m_params.minPrice && intent.price < *m_params.minPrice)
        || (m_params.maxPrice && intent.price > *m_params.maxPrice)) {
        return std::unexpected{OrderErrorCode::PRICE_OUT_OF_BOUNDS};
    }
    return {};
}

//-------------------------------------------------------------------------

}  // namespace microsim::book

//-------------------------------------------------------------------------
