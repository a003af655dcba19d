/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/book/Order.hpp"

#include <pugixml.hpp>

#include <expected>
#include <optional>

//-------------------------------------------------------------------------

namespace microsim::book
{

//-------------------------------------------------------------------------

class OrderValidator
{
public:
    struct Parameters
    {
        std::optional<decimal_t> minPrice;
        std::optional<decimal_t> maxPrice;

        [[nodiscard]] static Parameters fromXML(pugi::xml_node node);
    };

    using ExpectedResult = std::expected<void, OrderErrorCode>;

    OrderValidator() noexcept = default;
    explicit OrderValidator(const Parameters& params) noexcept : m_params{params} {}

    [[nodiscard]] const Parameters& parameters() const noexcept { return m_params; }

    [[nodiscard]] ExpectedResult validate(const OrderIntent& intent) const noexcept;

private:
    Parameters m_params;
};

//-------------------------------------------------------------------------

}  // namespace microsim::book

//-------------------------------------------------------------------------
