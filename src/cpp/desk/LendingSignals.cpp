/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendpool/desk/LendingSignals.hpp"

//-------------------------------------------------------------------------

namespace lendpool::desk
{

//-------------------------------------------------------------------------

LendingSignals::LendingSignals() noexcept
{
    deposit.connect([this](const DepositEvent& item) {
        any({ .item = item, .id = eventCounter++ });
    });
    withdraw.connect([this](const WithdrawEvent& item) {
        any({ .item = item, .id = eventCounter++ });
    });
    borrow.connect([this](const BorrowEvent& item) {
        any({ .item = item, .id = eventCounter++ });
    });
    repay.connect([this](const RepayEvent& item) {
        any({ .item = item, .id = eventCounter++ });
    });
    liquidate.connect([this](const LiquidateEvent& item) {
        any({ .item = item, .id = eventCounter++ });
    });
    reserveWithdrawal.connect([this](const ReserveWithdrawalEvent& item) {
        any({ .item = item, .id = eventCounter++ });
    });
    rejection.connect([this](const RejectionEvent& item) {
        any({ .item = item, .id = eventCounter++ });
    });
}

//-------------------------------------------------------------------------

}  // namespace lendpool::desk

//-------------------------------------------------------------------------
