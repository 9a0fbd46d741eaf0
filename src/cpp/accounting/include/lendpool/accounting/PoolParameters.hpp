/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendpool/accounting/common.hpp"

#include <pugixml.hpp>

#include <cstdint>

//-------------------------------------------------------------------------

namespace lendpool::accounting
{

//-------------------------------------------------------------------------

struct PoolParameters
{
    Orientation orientation{Orientation::AssetAAsCollateral};
    // Percent per year.
    uint8_t interestRate{};
    // Percent of the principal, charged once at origination.
    uint8_t reserveFeeRate{};
    // Percent of the collateral value that can be borrowed.
    uint8_t collateralFactor{};

    [[nodiscard]] bool operator==(const PoolParameters& other) const noexcept = default;

    [[nodiscard]] static PoolParameters fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

}  // namespace lendpool::accounting

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lendpool::accounting::PoolParameters>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const lendpool::accounting::PoolParameters& params, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "PoolParameters{{.orientation = {}, .interestRate = {}, "
            ".reserveFeeRate = {}, .collateralFactor = {}}}",
            params.orientation,
            params.interestRate,
            params.reserveFeeRate,
            params.collateralFactor);
    }
};

//-------------------------------------------------------------------------
