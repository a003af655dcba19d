/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "microsim/book/OrderValidator.hpp"
#include "microsim/common/SimulationException.hpp"
#include "test-common/formatting.hpp"

#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace microsim;
using namespace microsim::book;

using namespace testing;

//-------------------------------------------------------------------------

struct ValidateTestParams
{
    OrderIntent intent;
    OrderErrorCode refCode;
};

void PrintTo(const ValidateTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.owner = '{}', .side = {}, .price = {}, .quantity = {}, .refCode = {}}}",
        params.intent.owner,
        std::to_underlying(params.intent.side),
        params.intent.price,
        params.intent.quantity,
        magic_enum::enum_name(params.refCode));
}

struct ValidateTest : TestWithParam<ValidateTestParams>
{
    // Binary contract bounds.
    OrderValidator validator{OrderValidator::Parameters{.minPrice = DEC(0.0), .maxPrice = DEC(1.0)}};
};

TEST_P(ValidateTest, WorksCorrectly)
{
    const auto [intent, refCode] = GetParam();
    const auto res = validator.validate(intent);
    if (refCode == OrderErrorCode::VALID) {
        EXPECT_TRUE(res.has_value());
        return;
    }
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error(), refCode);
}

INSTANTIATE_TEST_SUITE_P(
    OrderValidatorTest,
    ValidateTest,
    Values(
        ValidateTestParams{
            .intent = {.owner = "mm-1", .side = Side::BUY, .price = DEC(0.5), .quantity = 1_dec},
            .refCode = OrderErrorCode::VALID},
        ValidateTestParams{
            .intent = {.owner = "mm-1", .side = Side::SELL, .price = DEC(1.0), .quantity = DEC(0.1)},
            .refCode = OrderErrorCode::VALID},
        ValidateTestParams{
            .intent = {.owner = "mm-1", .side = Side::BUY, .price = DEC(1.5), .quantity = 1_dec},
            .refCode = OrderErrorCode::PRICE_OUT_OF_BOUNDS},
        ValidateTestParams{
            .intent = {.owner = "mm-1", .side = Side::BUY, .price = DEC(0.0), .quantity = 1_dec},
            .refCode = OrderErrorCode::INVALID_PRICE},
        ValidateTestParams{
            .intent = {.owner = "mm-1", .side = Side::BUY, .price = DEC(-0.2), .quantity = 1_dec},
            .refCode = OrderErrorCode::INVALID_PRICE},
        ValidateTestParams{
            .intent = {.owner = "mm-1", .side = Side::BUY, .price = DEC(0.5), .quantity = 0_dec},
            .refCode = OrderErrorCode::INVALID_QUANTITY},
        ValidateTestParams{
            .intent = {.owner = "mm-1", .side = Side{2}, .price = DEC(0.5), .quantity = 1_dec},
            .refCode = OrderErrorCode::INVALID_SIDE},
        ValidateTestParams{
            .intent = {.owner = "", .side = Side::SELL, .price = DEC(0.5), .quantity = 1_dec},
            .refCode = OrderErrorCode::EMPTY_OWNER},
        ValidateTestParams{
            .intent = {
                .owner = "mm-1",
                .side = Side::SELL,
                .price = DEC(0.5),
                .quantity = 1_dec,
                .timeInForce = TimeInForce{9}},
            .refCode = OrderErrorCode::INVALID_TIME_IN_FORCE}));

//-------------------------------------------------------------------------

TEST(OrderValidatorTest, ParametersFromXML)
{
    pugi::xml_document doc;
    ASSERT_TRUE(doc.load_string(R"(<Book minPrice="0.01" maxPrice="0.99"/>)"));
    const auto params = OrderValidator::Parameters::fromXML(doc.child("Book"));
    EXPECT_EQ(params.minPrice, std::optional{DEC(0.01)});
    EXPECT_EQ(params.maxPrice, std::optional{DEC(0.99)});

    const auto unbounded = OrderValidator::Parameters::fromXML(pugi::xml_node{});
    EXPECT_FALSE(unbounded.minPrice.has_value());
    EXPECT_FALSE(unbounded.maxPrice.has_value());

    for (const char* xml : {
            R"(<Book minPrice="-1"/>)",
            R"(<Book maxPrice="0"/>)",
            R"(<Book minPrice="2" maxPrice="1"/>)"}) {
        pugi::xml_document bad;
        ASSERT_TRUE(bad.load_string(xml));
        EXPECT_THROW(
            std::ignore = OrderValidator::Parameters::fromXML(bad.child("Book")), ConfigurationError);
    }
}

//-------------------------------------------------------------------------
