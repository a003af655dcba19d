/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/book/Fill.hpp"
#include "microsim/book/Order.hpp"
#include "microsim/event/EventKind.hpp"

#include <variant>

//-------------------------------------------------------------------------

namespace microsim::event
{

//-------------------------------------------------------------------------

struct NewsPayload
{
    std::string source;
    std::string headline;
    decimal_t signal{};

    void checkpointSerialize(rapidjson::Document& json, const std::string& key = {}) const;
    [[nodiscard]] static NewsPayload fromCheckpoint(const rapidjson::Value& json);
};

//-------------------------------------------------------------------------

struct OrderPayload
{
    book::OrderIntent intent;

    void checkpointSerialize(rapidjson::Document& json, const std::string& key = {}) const;
    [[nodiscard]] static OrderPayload fromCheckpoint(const rapidjson::Value& json);
};

//-------------------------------------------------------------------------

struct CancelPayload
{
    OrderID orderId{};
    Owner owner;

    void checkpointSerialize(rapidjson::Document& json, const std::string& key = {}) const;
    [[nodiscard]] static CancelPayload fromCheckpoint(const rapidjson::Value& json);
};

//-------------------------------------------------------------------------

struct FillPayload
{
    book::Fill fill;

    void checkpointSerialize(rapidjson::Document& json, const std::string& key = {}) const;
    [[nodiscard]] static FillPayload fromCheckpoint(const rapidjson::Value& json);
};

//-------------------------------------------------------------------------

struct BatchClearPayload
{
    decimal_t clearingPrice{};
    decimal_t volume{};

    void checkpointSerialize(rapidjson::Document& json, const std::string& key = {}) const;
    [[nodiscard]] static BatchClearPayload fromCheckpoint(const rapidjson::Value& json);
};

//-------------------------------------------------------------------------

struct RfqRequestPayload
{
    uint64_t requestId{};
    Owner owner;
    Side side{Side::BUY};
    decimal_t quantity{};

    void checkpointSerialize(rapidjson::Document& json, const std::string& key = {}) const;
    [[nodiscard]] static RfqRequestPayload fromCheckpoint(const rapidjson::Value& json);
};

//-------------------------------------------------------------------------

struct RfqQuotePayload
{
    uint64_t requestId{};
    uint64_t quoteId{};
    Owner owner;
    decimal_t price{};
    decimal_t quantity{};

    void checkpointSerialize(rapidjson::Document& json, const std::string& key = {}) const;
    [[nodiscard]] static RfqQuotePayload fromCheckpoint(const rapidjson::Value& json);
};

//-------------------------------------------------------------------------

struct RfqAcceptPayload
{
    uint64_t requestId{};
    uint64_t quoteId{};
    Owner owner;

    void checkpointSerialize(rapidjson::Document& json, const std::string& key = {}) const;
    [[nodiscard]] static RfqAcceptPayload fromCheckpoint(const rapidjson::Value& json);
};

//-------------------------------------------------------------------------

// Alternative index == EventKind value.
using Payload = std::variant<
    NewsPayload,
    OrderPayload,
    CancelPayload,
    FillPayload,
    BatchClearPayload,
    RfqRequestPayload,
    RfqQuotePayload,
    RfqAcceptPayload>;

static_assert(std::variant_size_v<Payload> == magic_enum::enum_count<EventKind>());

[[nodiscard]] constexpr EventKind payloadKind(const Payload& payload) noexcept
{
    return EventKind{static_cast<uint32_t>(payload.index())};
}

[[nodiscard]] Payload payloadFromCheckpoint(EventKind kind, const rapidjson::Value& json);

//-------------------------------------------------------------------------

}  // namespace microsim::event

//-------------------------------------------------------------------------
