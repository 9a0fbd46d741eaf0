/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendpool/desk/MarketConfig.hpp"

//-------------------------------------------------------------------------

namespace lendpool::desk
{

MarketConfig makeMarketConfig(pugi::xml_node node)
{
    using accounting::kMaxAssetDecimals;
    using accounting::kMaxRateDecimals;
    using accounting::validateDecimalPlaces;

    static constexpr auto sl = std::source_location::current();

    const PrincipalId owner = node.attribute("owner").as_string();
    if (owner.empty()) {
        throw std::invalid_argument{fmt::format(
            "{}: Market requires a non-empty 'owner'", sl.function_name())};
    }

    return {
        .owner = owner,
        .scales = {
            .decimalsA = validateDecimalPlaces(
                node.attribute("decimalsA").as_uint(), kMaxAssetDecimals, sl),
            .decimalsB = validateDecimalPlaces(
                node.attribute("decimalsB").as_uint(), kMaxAssetDecimals, sl),
            .rateDecimals = validateDecimalPlaces(
                node.attribute("rateDecimals").as_uint(), kMaxRateDecimals, sl)
        }
    };
}

}  // namespace lendpool::desk

//-------------------------------------------------------------------------
