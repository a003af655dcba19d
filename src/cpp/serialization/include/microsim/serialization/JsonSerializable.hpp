/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "microsim/serialization/json_util.hpp"

//-------------------------------------------------------------------------

namespace microsim
{

/**
 * Readable serialization for inspection; decimals are written as doubles.
 */
class JsonSerializable
{
public:
    virtual ~JsonSerializable() noexcept = default;

    virtual void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const = 0;

protected:
    JsonSerializable() noexcept = default;
};

}  // namespace microsim

//-------------------------------------------------------------------------
