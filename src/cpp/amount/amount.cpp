/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendpool/amount/amount.hpp"

#include <algorithm>
#include <cctype>

//-------------------------------------------------------------------------

namespace lendpool::util
{

//-------------------------------------------------------------------------

amount_t str2amount(std::string_view str)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (str.empty()) {
        throw std::invalid_argument{fmt::format("{}: Empty amount string", ctx)};
    }
    if (!std::ranges::all_of(str, [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw std::invalid_argument{fmt::format(
            "{}: Amount should be a non-negative integer, was '{}'", ctx, str)};
    }

    amount_t result{};
    try {
        for (const char c : str) {
            result = result * 10u + static_cast<uint32_t>(c - '0');
        }
    }
    catch (const std::overflow_error&) {
        throw std::invalid_argument{fmt::format(
            "{}: Amount '{}' does not fit in 256 bits", ctx, str)};
    }
    return result;
}

//-------------------------------------------------------------------------

}  // namespace lendpool::util

//-------------------------------------------------------------------------
