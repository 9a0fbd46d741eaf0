/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendpool/accounting/PoolParameters.hpp"
#include "lendpool/accounting/common.hpp"
#include "lendpool/amount/amount.hpp"

//-------------------------------------------------------------------------

namespace lendpool::accounting
{

inline constexpr uint32_t kPercentBase = 100;
inline constexpr uint32_t kLiquidationDiscountRate = 95;

/**
 * Values percent% of a collateral amount in the pool's deposit asset.
 *
 * The rate is a fixed-point count of asset-B units per asset-A unit, scaled by
 * 10^rateDecimals. Asset unit sizes differ by 10^decimalsA and 10^decimalsB.
 * The whole expression is reduced with a single floor division. Throws
 * std::overflow_error if the quote does not fit in an amount.
 */
[[nodiscard]] amount_t quoteCollateral(
    amount_t collateralAmount,
    uint32_t percent,
    amount_t rate,
    Orientation orientation,
    const ScaleParams& scales);

[[nodiscard]] amount_t calculateBorrowable(
    amount_t collateralAmount,
    const PoolParameters& params,
    amount_t rate,
    const ScaleParams& scales);

/**
 * Price a liquidator pays for the collateral, at kLiquidationDiscountRate percent
 * of its value.
 */
[[nodiscard]] amount_t calculatePayoff(
    amount_t collateralAmount,
    Orientation orientation,
    amount_t rate,
    const ScaleParams& scales);

}  // namespace lendpool::accounting

//-------------------------------------------------------------------------
