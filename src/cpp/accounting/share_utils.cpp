/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendpool/accounting/share_utils.hpp"

#include "LedgerInvariantError.hpp"

#include <source_location>

//-------------------------------------------------------------------------

namespace lendpool::accounting
{

//-------------------------------------------------------------------------

amount_t totalLiquidity(
    amount_t totalBorrowAmount, amount_t currentBalanceAmount, amount_t totalReserveAmount)
{
    const amount_t gross = totalBorrowAmount + currentBalanceAmount;
    if (totalReserveAmount > gross) [[unlikely]] {
        throw LedgerInvariantError{fmt::format(
            "{}: reserve {} exceeds borrowed {} + balance {}",
            std::source_location::current().function_name(),
            totalReserveAmount, totalBorrowAmount, currentBalanceAmount)};
    }
    return gross - totalReserveAmount;
}

//-------------------------------------------------------------------------

amount_t toShares(amount_t amount, amount_t totalAssetAmount, amount_t totalLiquidity)
{
    if (totalAssetAmount == 0u || totalLiquidity == 0u) {
        return amount;
    }
    return util::mulDiv(amount, totalAssetAmount, totalLiquidity);
}

//-------------------------------------------------------------------------

amount_t toAmount(amount_t shares, amount_t totalLiquidity, amount_t totalAssetAmount)
{
    if (totalAssetAmount == 0u) {
        return {};
    }
    return util::mulDivUp(shares, totalLiquidity, totalAssetAmount);
}

//-------------------------------------------------------------------------

}  // namespace lendpool::accounting

//-------------------------------------------------------------------------
