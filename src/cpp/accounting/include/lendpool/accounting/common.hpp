/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <fmt/format.h>
#include <magic_enum.hpp>

#include <cstdint>
#include <source_location>
#include <string_view>

//-------------------------------------------------------------------------

namespace lendpool::accounting
{

//-------------------------------------------------------------------------

enum class AssetKind : uint8_t
{
    A,
    B
};

// Names the asset posted as collateral; the other kind is deposited and borrowed.
enum class Orientation : uint8_t
{
    AssetAAsCollateral,
    AssetBAsCollateral
};

[[nodiscard]] constexpr AssetKind collateralAsset(Orientation orientation) noexcept
{
    return orientation == Orientation::AssetAAsCollateral ? AssetKind::A : AssetKind::B;
}

[[nodiscard]] constexpr AssetKind depositAsset(Orientation orientation) noexcept
{
    return orientation == Orientation::AssetAAsCollateral ? AssetKind::B : AssetKind::A;
}

//-------------------------------------------------------------------------

struct ScaleParams
{
    uint32_t decimalsA;
    uint32_t decimalsB;
    uint32_t rateDecimals;
};

inline constexpr uint32_t kMaxAssetDecimals = 30;
inline constexpr uint32_t kMaxRateDecimals = 18;

uint32_t validateDecimalPlaces(
    uint32_t decimalPlaces,
    uint32_t maxDecimalPlaces,
    std::source_location sl = std::source_location::current());

//-------------------------------------------------------------------------

}  // namespace lendpool::accounting

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lendpool::accounting::AssetKind>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(lendpool::accounting::AssetKind asset, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(asset));
    }
};

template<>
struct fmt::formatter<lendpool::accounting::Orientation>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(lendpool::accounting::Orientation orientation, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(orientation));
    }
};

//-------------------------------------------------------------------------
