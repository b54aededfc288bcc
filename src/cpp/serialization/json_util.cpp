/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "json_util.hpp"

#include <fmt/format.h>
#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

//-------------------------------------------------------------------------

namespace creditsim::json
{

//-------------------------------------------------------------------------

namespace
{

template<typename OutputStream>
void write(const rapidjson::Value& json, OutputStream& os, const FormatOptions& formatOptions)
{
    if (!formatOptions.indent.has_value()) {
        rapidjson::Writer writer{os};
        json.Accept(writer);
        return;
    }
    const auto& [indentChar, indentCharCount] = *formatOptions.indent;
    rapidjson::PrettyWriter writer{os};
    writer.SetIndent(indentChar, indentCharCount);
    json.Accept(writer);
}

}  // namespace

//-------------------------------------------------------------------------

std::string json2str(const rapidjson::Value& json, const FormatOptions& formatOptions)
{
    rapidjson::StringBuffer buffer;
    write(json, buffer, formatOptions);
    return buffer.GetString();
}

//-------------------------------------------------------------------------

void dumpJson(const rapidjson::Value& json, std::ofstream& ofs, const FormatOptions& formatOptions)
{
    rapidjson::OStreamWrapper osw{ofs};
    write(json, osw, formatOptions);
}

//-------------------------------------------------------------------------

rapidjson::Value u256ToJson(const uint256_t& val, rapidjson::Document::AllocatorType& allocator)
{
    return rapidjson::Value{val.str().c_str(), allocator};
}

//-------------------------------------------------------------------------

rapidjson::Value addressToJson(uint64_t address, rapidjson::Document::AllocatorType& allocator)
{
    return rapidjson::Value{fmt::format("{:#x}", address).c_str(), allocator};
}

//-------------------------------------------------------------------------

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer)
{
    if (key.empty()) {
        serializer(json);
        return;
    }
    auto& allocator = json.GetAllocator();
    if (!json.IsObject()) {
        json.SetObject();
    }
    rapidjson::Document subJson{&allocator};
    serializer(subJson);
    json.AddMember(rapidjson::Value{key.c_str(), allocator}, subJson, allocator);
}

//-------------------------------------------------------------------------

}  // namespace creditsim::json

//-------------------------------------------------------------------------
