/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendpool/accounting/loan_terms.hpp"

#include "lendpool/accounting/pricing_utils.hpp"

//-------------------------------------------------------------------------

namespace lendpool::accounting
{

//-------------------------------------------------------------------------

amount_t calculateInterest(amount_t principal, uint32_t interestRate, Timestamp duration)
{
    const Timestamp days = duration / kSecondsPerDay;
    return principal * interestRate / kPercentBase / kDaysPerYear * days;
}

//-------------------------------------------------------------------------

amount_t calculateFee(amount_t principal, uint32_t reserveFeeRate)
{
    return principal * reserveFeeRate / kPercentBase;
}

//-------------------------------------------------------------------------

LoanTerms calculateLoanTerms(
    amount_t borrowable, const PoolParameters& params, Timestamp duration)
{
    LoanTerms terms{
        .borrowable = borrowable,
        .interestAmount = calculateInterest(borrowable, params.interestRate, duration),
        .feeAmount = calculateFee(borrowable, params.reserveFeeRate)
    };
    terms.repayAmount = terms.borrowable + terms.interestAmount + terms.feeAmount;
    return terms;
}

//-------------------------------------------------------------------------

LiquidationReserve settleLiquidationReserve(const LiquidationReserveDesc& desc)
{
    amount_t reserve = desc.totalReserveAmount;

    if (desc.payAmount > desc.repayAmount) {
        reserve += util::saturatingSub(
            desc.payAmount, desc.interestAmount + desc.borrowedAmount);
    }

    if (reserve < desc.feeAmount) {
        return {.totalReserveAmount = {}, .shortfall = desc.feeAmount - reserve};
    }
    return {.totalReserveAmount = reserve - desc.feeAmount};
}

//-------------------------------------------------------------------------

}  // namespace lendpool::accounting

//-------------------------------------------------------------------------
