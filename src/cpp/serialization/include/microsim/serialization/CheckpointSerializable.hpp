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
 * Exact serialization: everything needed to rebuild the object bit-for-bit.
 */
class CheckpointSerializable
{
public:
    virtual ~CheckpointSerializable() noexcept = default;

    virtual void checkpointSerialize(
        rapidjson::Document& json, const std::string& key = {}) const = 0;

protected:
    CheckpointSerializable() noexcept = default;
};

}  // namespace microsim

//-------------------------------------------------------------------------
