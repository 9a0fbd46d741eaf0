/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "json_util.hpp"

#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <source_location>

//-------------------------------------------------------------------------

namespace lendpool::json
{

//-------------------------------------------------------------------------

std::string json2str(const rapidjson::Value& json, const FormatOptions& formatOptions)
{
    const auto& [indent] = formatOptions;
    rapidjson::StringBuffer buffer;
    if (indent.has_value()) {
        const auto& opts = indent.value();
        rapidjson::PrettyWriter writer{buffer};
        writer.SetIndent(opts.indentChar, opts.indentCharCount);
        json.Accept(writer);
    } else {
        rapidjson::Writer writer{buffer};
        json.Accept(writer);
    }
    return buffer.GetString();
}

//-------------------------------------------------------------------------

void dumpJson(
    const rapidjson::Value& json,
    std::ofstream& ofs,
    const FormatOptions& formatOptions)
{
    const auto& [indent] = formatOptions;
    rapidjson::OStreamWrapper osw{ofs};
    if (indent.has_value()) {
        const auto& opts = indent.value();
        rapidjson::PrettyWriter writer{osw};
        writer.SetIndent(opts.indentChar, opts.indentCharCount);
        json.Accept(writer);
        return;
    }
    rapidjson::Writer writer{osw};
    json.Accept(writer);
}

//-------------------------------------------------------------------------

rapidjson::Value amount2json(
    const amount_t& amount, rapidjson::Document::AllocatorType& allocator)
{
    const std::string str = util::amount2str(amount);
    return rapidjson::Value{str.c_str(), static_cast<rapidjson::SizeType>(str.size()), allocator};
}

//-------------------------------------------------------------------------

amount_t getAmount(const rapidjson::Value& json)
{
    if (json.IsString()) [[likely]] {
        return util::str2amount(json.GetString());
    } else if (json.IsUint64()) {
        return amount_t{json.GetUint64()};
    } else {
        throw std::invalid_argument{fmt::format(
            "{}: Ill-formed Json value to form an amount with: {}",
            std::source_location::current().function_name(),
            json2str(json))};
    }
}

//-------------------------------------------------------------------------

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer)
{
    if (key.empty()) return serializer(json);
    auto& allocator = json.GetAllocator();
    rapidjson::Document subJson{&allocator};
    serializer(subJson);
    json.AddMember(rapidjson::Value{key.c_str(), allocator}, subJson, allocator);
}

//-------------------------------------------------------------------------

}  // namespace lendpool::json

//-------------------------------------------------------------------------
