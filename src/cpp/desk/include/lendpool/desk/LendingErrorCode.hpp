/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/format.h>
#include <magic_enum.hpp>

#include <cstdint>
#include <expected>
#include <string_view>

//-------------------------------------------------------------------------

namespace lendpool::desk
{

//-------------------------------------------------------------------------

enum class LendingErrorCode : uint32_t
{
    ZERO_AMOUNT,
    INSUFFICIENT_BALANCE,
    UNAVAILABLE,
    ALREADY_BORROWED,
    ZERO_COLLATERAL,
    INSUFFICIENT_COLLATERAL,
    INSUFFICIENT_LIQUIDITY,
    NO_ACTIVE_LOAN,
    ZERO_REPAY,
    SELF_LIQUIDATION,
    NO_COLLATERAL,
    NOT_YET_LIQUIDATABLE,
    UNKNOWN_POOL,
    REENTRANT_CALL,
    ORACLE_UNAVAILABLE,
    TRANSFER_FAILED,
    UNAUTHORIZED,
    INVALID_PARAMETER,
    AMOUNT_OVERFLOW
};

[[nodiscard]] constexpr std::string_view LendingErrorCode2StrView(LendingErrorCode ec) noexcept
{
    return magic_enum::enum_name(ec);
}

template<typename T>
using LendingResult = std::expected<T, LendingErrorCode>;

//-------------------------------------------------------------------------

}  // namespace lendpool::desk

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lendpool::desk::LendingErrorCode>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(lendpool::desk::LendingErrorCode ec, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", lendpool::desk::LendingErrorCode2StrView(ec));
    }
};

//-------------------------------------------------------------------------
