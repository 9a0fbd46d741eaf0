/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendpool/amount/amount.hpp"

#include <rapidjson/document.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <string>

//-------------------------------------------------------------------------

namespace lendpool::json
{

//-------------------------------------------------------------------------

struct IndentOptions
{
    char indentChar = ' ';
    uint8_t indentCharCount = 4;
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

// Amounts exceed the 64-bit range of Json numbers and are kept as decimal strings.
[[nodiscard]] rapidjson::Value amount2json(
    const amount_t& amount, rapidjson::Document::AllocatorType& allocator);

[[nodiscard]] amount_t getAmount(const rapidjson::Value& json);

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer);

//-------------------------------------------------------------------------

}  // namespace lendpool::json

//-------------------------------------------------------------------------
