/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>

#include <cstdint>
#include <limits>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace lendpool
{

// Overflow and unsigned underflow throw instead of wrapping.
using amount_t = boost::multiprecision::checked_uint256_t;

}  // namespace lendpool

//-------------------------------------------------------------------------

namespace lendpool::util
{

inline constexpr uint32_t kMaxPowerOf10 = 60;

// Intermediate for products of amounts, rates and decimal scales.
using wide_amount_t = boost::multiprecision::checked_uint1024_t;

[[nodiscard]] inline amount_t narrow(const wide_amount_t& val)
{
    static const wide_amount_t kMax{std::numeric_limits<amount_t>::max()};
    if (val > kMax) {
        throw std::overflow_error{fmt::format(
            "{}: {} does not fit in an amount",
            std::source_location::current().function_name(), val.str())};
    }
    return static_cast<amount_t>(val);
}

[[nodiscard]] inline bool sumOverflows(const amount_t& a, const amount_t& b) noexcept
{
    return a > std::numeric_limits<amount_t>::max() - b;
}

[[nodiscard]] inline amount_t pow10(uint32_t exponent)
{
    if (exponent > kMaxPowerOf10) {
        throw std::invalid_argument{fmt::format(
            "{}: exponent should be <= {}, was {}",
            std::source_location::current().function_name(), kMaxPowerOf10, exponent)};
    }
    amount_t result{1};
    for (uint32_t i = 0; i < exponent; ++i) {
        result *= 10u;
    }
    return result;
}

[[nodiscard]] inline amount_t mulDiv(amount_t a, amount_t b, amount_t denominator)
{
    return narrow(wide_amount_t{a} * wide_amount_t{b} / wide_amount_t{denominator});
}

[[nodiscard]] inline amount_t divUp(amount_t numerator, amount_t denominator)
{
    const amount_t quotient = numerator / denominator;
    return quotient * denominator == numerator ? quotient : amount_t{quotient + 1u};
}

[[nodiscard]] inline amount_t mulDivUp(amount_t a, amount_t b, amount_t denominator)
{
    const wide_amount_t numerator = wide_amount_t{a} * wide_amount_t{b};
    const wide_amount_t wideDenominator{denominator};
    wide_amount_t quotient = numerator / wideDenominator;
    if (quotient * wideDenominator != numerator) {
        ++quotient;
    }
    return narrow(quotient);
}

[[nodiscard]] inline amount_t saturatingSub(amount_t a, amount_t b) noexcept
{
    return a > b ? amount_t{a - b} : amount_t{};
}

[[nodiscard]] inline std::string amount2str(const amount_t& val)
{
    return val.str();
}

[[nodiscard]] amount_t str2amount(std::string_view str);

}  // namespace lendpool::util

//-------------------------------------------------------------------------

namespace lendpool::literals
{

[[nodiscard]] inline amount_t operator"" _amt(unsigned long long int val)
{
    return amount_t{val};
}

}  // namespace lendpool::literals

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lendpool::amount_t>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const lendpool::amount_t& val, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", val.str());
    }
};

//-------------------------------------------------------------------------
