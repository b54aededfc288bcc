/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "creditsim/numeric/numeric.hpp"

#include <rapidjson/document.h>

#include <fstream>
#include <functional>
#include <optional>
#include <string>

//-------------------------------------------------------------------------

namespace creditsim::json
{

//-------------------------------------------------------------------------

struct IndentOptions
{
    char indentChar = ' ';
    uint8_t indentCharCount = 2;
};

struct FormatOptions
{
    std::optional<IndentOptions> indent = {};
};

[[nodiscard]] std::string json2str(
    const rapidjson::Value& json, const FormatOptions& formatOptions = {});

void dumpJson(
    const rapidjson::Value& json,
    std::ofstream& ofs,
    const FormatOptions& formatOptions = {});

// Token amounts overflow JSON numbers and go out as decimal strings.
[[nodiscard]] rapidjson::Value u256ToJson(
    const uint256_t& val, rapidjson::Document::AllocatorType& allocator);

[[nodiscard]] rapidjson::Value addressToJson(
    uint64_t address, rapidjson::Document::AllocatorType& allocator);

/**
 * Runs `serializer` on `json` itself when `key` is empty, otherwise on a
 * fresh sub-document attached to `json` under `key`.
 */
void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer);

template<typename T>
void setOptionalMember(rapidjson::Document& json, const std::string& key, const std::optional<T>& opt)
{
    auto& allocator = json.GetAllocator();
    rapidjson::Value value;
    if (opt.has_value()) {
        if constexpr (std::same_as<T, uint256_t>) {
            value = u256ToJson(*opt, allocator);
        } else if constexpr (std::same_as<T, std::string>) {
            value.SetString(opt->c_str(), allocator);
        } else {
            value = rapidjson::Value{*opt};
        }
    }
    json.AddMember(rapidjson::Value{key.c_str(), allocator}, value, allocator);
}

//-------------------------------------------------------------------------

}  // namespace creditsim::json

//-------------------------------------------------------------------------
