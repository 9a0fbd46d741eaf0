/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "lendpool/desk/LendingErrorCode.hpp"

#include <variant>

//-------------------------------------------------------------------------

namespace lendpool::desk
{

//-------------------------------------------------------------------------

struct DepositEvent
{
    PoolId poolId;
    PrincipalId principal;
    amount_t amount;
    amount_t shares;
    Timestamp time;
};

struct WithdrawEvent
{
    PoolId poolId;
    PrincipalId principal;
    amount_t amount;
    amount_t shares;
    Timestamp time;
};

struct BorrowEvent
{
    PoolId poolId;
    PrincipalId principal;
    amount_t collateralAmount;
    amount_t borrowedAmount;
    amount_t repayAmount;
    Timestamp duration;
    Timestamp time;
};

struct RepayEvent
{
    PoolId poolId;
    PrincipalId principal;
    amount_t amount;
    amount_t remaining;
    amount_t collateralReleased;
    Timestamp time;
};

struct LiquidateEvent
{
    PoolId poolId;
    PrincipalId liquidator;
    PrincipalId borrower;
    amount_t payAmount;
    amount_t collateralAmount;
    amount_t reserveShortfall;
    Timestamp time;
};

struct ReserveWithdrawalEvent
{
    PoolId poolId;
    PrincipalId principal;
    amount_t amount;
    Timestamp time;
};

struct RejectionEvent
{
    std::string_view operation;
    PoolId poolId;
    PrincipalId principal;
    LendingErrorCode ec;
    Timestamp time;
};

using LendingEventItem = std::variant<
    DepositEvent,
    WithdrawEvent,
    BorrowEvent,
    RepayEvent,
    LiquidateEvent,
    ReserveWithdrawalEvent,
    RejectionEvent>;

struct LendingEvent
{
    LendingEventItem item;
    uint64_t id;
};

//-------------------------------------------------------------------------

struct LendingSignals
{
    UnsyncSignal<void(const DepositEvent&)> deposit;
    UnsyncSignal<void(const WithdrawEvent&)> withdraw;
    UnsyncSignal<void(const BorrowEvent&)> borrow;
    UnsyncSignal<void(const RepayEvent&)> repay;
    UnsyncSignal<void(const LiquidateEvent&)> liquidate;
    UnsyncSignal<void(const ReserveWithdrawalEvent&)> reserveWithdrawal;
    UnsyncSignal<void(const RejectionEvent&)> rejection;
    UnsyncSignal<void(const LendingEvent&)> any;
    uint64_t eventCounter{};

    LendingSignals() noexcept;
};

//-------------------------------------------------------------------------

}  // namespace lendpool::desk

//-------------------------------------------------------------------------
