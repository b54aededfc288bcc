/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "json_util.hpp"

//-------------------------------------------------------------------------

namespace creditsim::json
{

//-------------------------------------------------------------------------

// Events, snapshots and reports all serialize through this member.
template<typename T>
concept IsJsonSerializable = requires (const T& t, rapidjson::Document& json, const std::string& key) {
    { t.jsonSerialize(json, key) };
};

[[nodiscard]] std::string jsonSerializable2str(
    const IsJsonSerializable auto& serializable, const FormatOptions& formatOptions = {})
{
    rapidjson::Document json;
    serializable.jsonSerialize(json);
    return json2str(json, formatOptions);
}

//-------------------------------------------------------------------------

}  // namespace creditsim::json

//-------------------------------------------------------------------------
