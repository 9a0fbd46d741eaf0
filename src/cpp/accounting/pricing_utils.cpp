/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendpool/accounting/pricing_utils.hpp"

#include <source_location>
#include <stdexcept>
#include <utility>

//-------------------------------------------------------------------------

namespace lendpool::accounting
{

//-------------------------------------------------------------------------

amount_t quoteCollateral(
    amount_t collateralAmount,
    uint32_t percent,
    amount_t rate,
    Orientation orientation,
    const ScaleParams& scales)
{
    if (rate == 0u) {
        throw std::invalid_argument{fmt::format(
            "{}: rate should be > 0",
            std::source_location::current().function_name())};
    }

    using util::wide_amount_t;

    const wide_amount_t value = wide_amount_t{collateralAmount} * percent;
    const wide_amount_t wideRate{rate};
    const wide_amount_t rateScale{util::pow10(scales.rateDecimals)};
    const wide_amount_t unitA{util::pow10(scales.decimalsA)};
    const wide_amount_t unitB{util::pow10(scales.decimalsB)};

    switch (orientation) {
        case Orientation::AssetAAsCollateral:
            return util::narrow(
                value * wideRate * unitB / (wide_amount_t{kPercentBase} * rateScale * unitA));
        case Orientation::AssetBAsCollateral:
            return util::narrow(
                value * rateScale * unitA / (wide_amount_t{kPercentBase} * wideRate * unitB));
        default:
            std::unreachable();
    }
}

//-------------------------------------------------------------------------

amount_t calculateBorrowable(
    amount_t collateralAmount,
    const PoolParameters& params,
    amount_t rate,
    const ScaleParams& scales)
{
    return quoteCollateral(
        collateralAmount, params.collateralFactor, rate, params.orientation, scales);
}

//-------------------------------------------------------------------------

amount_t calculatePayoff(
    amount_t collateralAmount,
    Orientation orientation,
    amount_t rate,
    const ScaleParams& scales)
{
    return quoteCollateral(
        collateralAmount, kLiquidationDiscountRate, rate, orientation, scales);
}

//-------------------------------------------------------------------------

}  // namespace lendpool::accounting

//-------------------------------------------------------------------------
