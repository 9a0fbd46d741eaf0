/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendpool/amount/amount.hpp"

//-------------------------------------------------------------------------

namespace lendpool::accounting
{

/**
 * Liquidity owned by depositors: outstanding debt plus the un-borrowed balance,
 * minus the fees held in reserve. Throws LedgerInvariantError if negative.
 */
[[nodiscard]] amount_t totalLiquidity(
    amount_t totalBorrowAmount, amount_t currentBalanceAmount, amount_t totalReserveAmount);

/**
 * Shares minted for a deposit of amount. An empty pool (no shares or no
 * liquidity) mints 1:1; otherwise the result is floored.
 */
[[nodiscard]] amount_t toShares(
    amount_t amount, amount_t totalAssetAmount, amount_t totalLiquidity);

/**
 * Asset amount redeemed for shares, rounded up.
 */
[[nodiscard]] amount_t toAmount(
    amount_t shares, amount_t totalLiquidity, amount_t totalAssetAmount);

}  // namespace lendpool::accounting

//-------------------------------------------------------------------------
