/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Timestamp.hpp"
#include "lendpool/accounting/PoolParameters.hpp"
#include "lendpool/amount/amount.hpp"

//-------------------------------------------------------------------------

namespace lendpool::accounting
{

//-------------------------------------------------------------------------

inline constexpr uint32_t kDaysPerYear = 365;

struct LoanTerms
{
    amount_t borrowable{};
    amount_t interestAmount{};
    amount_t feeAmount{};
    amount_t repayAmount{};
};

// Simple daily interest; the daily amount is floored before scaling by whole days.
[[nodiscard]] amount_t calculateInterest(
    amount_t principal, uint32_t interestRate, Timestamp duration);

[[nodiscard]] amount_t calculateFee(amount_t principal, uint32_t reserveFeeRate);

[[nodiscard]] LoanTerms calculateLoanTerms(
    amount_t borrowable, const PoolParameters& params, Timestamp duration);

//-------------------------------------------------------------------------

struct LiquidationReserveDesc
{
    amount_t totalReserveAmount{};
    amount_t payAmount{};
    amount_t repayAmount{};
    amount_t borrowedAmount{};
    amount_t interestAmount{};
    amount_t feeAmount{};
};

struct LiquidationReserve
{
    amount_t totalReserveAmount{};
    // Part of the loan's fee the reserve could not give back.
    amount_t shortfall{};
};

/**
 * Removes the loan's origination fee from the reserve and, when the liquidator
 * paid more than the outstanding debt, credits the surplus over principal and
 * interest. The reserve saturates at zero.
 */
[[nodiscard]] LiquidationReserve settleLiquidationReserve(const LiquidationReserveDesc& desc);

//-------------------------------------------------------------------------

}  // namespace lendpool::accounting

//-------------------------------------------------------------------------
