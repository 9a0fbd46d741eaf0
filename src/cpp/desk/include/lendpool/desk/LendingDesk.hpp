/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"
#include "lendpool/accounting/PoolParameters.hpp"
#include "lendpool/accounting/loan_terms.hpp"
#include "lendpool/custody/ICustody.hpp"
#include "lendpool/desk/ExecutionGuard.hpp"
#include "lendpool/desk/LendingErrorCode.hpp"
#include "lendpool/desk/LendingSignals.hpp"
#include "lendpool/desk/MarketConfig.hpp"
#include "lendpool/ledger/PoolRegistry.hpp"
#include "lendpool/oracle/PriceOracleAdapter.hpp"

//-------------------------------------------------------------------------

namespace lendpool::desk
{

//-------------------------------------------------------------------------

struct CallContext
{
    PrincipalId caller;
    Timestamp now{};
};

struct DepositResult
{
    amount_t shares;
};

struct WithdrawResult
{
    amount_t amount;
    amount_t shares;
};

struct BorrowResult
{
    amount_t borrowable;
    amount_t repayAmount;
};

struct RepayResult
{
    amount_t repaid;
    amount_t remaining;
    amount_t collateralReleased;
};

struct LiquidationResult
{
    amount_t collateralReleased;
    amount_t payAmount;
};

//-------------------------------------------------------------------------

/**
 * Entry point for every ledger operation. Mutating operations run under a
 * single desk-wide ExecutionGuard, validate before touching state, and commit
 * ledger changes only once all of their transfers went through.
 */
class LendingDesk : public JsonSerializable
{
public:
    LendingDesk(
        MarketConfig config,
        custody::ICustody* custody,
        oracle::PriceOracleAdapter oracle) noexcept;

    [[nodiscard]] const MarketConfig& config() const noexcept { return m_config; }
    [[nodiscard]] const ledger::PoolRegistry& registry() const noexcept { return m_registry; }
    [[nodiscard]] LendingSignals& signals() noexcept { return m_signals; }

    LendingResult<void> createPool(
        const CallContext& ctx, PoolId poolId, const accounting::PoolParameters& params);
    LendingResult<void> setPoolParameters(
        const CallContext& ctx, PoolId poolId, const accounting::PoolParameters& params);
    LendingResult<amount_t> withdrawReserve(
        const CallContext& ctx, PoolId poolId, const amount_t& amount);

    LendingResult<DepositResult> deposit(
        const CallContext& ctx, PoolId poolId, const amount_t& amount);
    LendingResult<WithdrawResult> withdraw(const CallContext& ctx, PoolId poolId);
    LendingResult<BorrowResult> borrow(
        const CallContext& ctx,
        PoolId poolId,
        const amount_t& collateralAmount,
        Timestamp duration);
    LendingResult<RepayResult> repay(
        const CallContext& ctx, PoolId poolId, const amount_t& amount);
    LendingResult<LiquidationResult> liquidate(
        const CallContext& ctx, PoolId poolId, const PrincipalId& borrower);

    [[nodiscard]] LendingResult<amount_t> payoffQuote(
        PoolId poolId, const PrincipalId& borrower) const;
    [[nodiscard]] LendingResult<accounting::LoanTerms> borrowQuote(
        PoolId poolId, const amount_t& collateralAmount, Timestamp duration) const;
    [[nodiscard]] LendingResult<amount_t> withdrawQuote(
        PoolId poolId, const PrincipalId& principal) const;
    [[nodiscard]] LendingResult<amount_t> totalLiquidity(PoolId poolId) const;

    [[nodiscard]] const ledger::Pool* pool(PoolId poolId) const noexcept;
    [[nodiscard]] std::optional<ledger::Loan> loan(
        PoolId poolId, const PrincipalId& principal) const noexcept;
    [[nodiscard]] amount_t shares(PoolId poolId, const PrincipalId& principal) const noexcept;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    [[nodiscard]] LendingResult<amount_t> readRate() const;

    std::unexpected<LendingErrorCode> reject(
        std::string_view operation,
        const CallContext& ctx,
        PoolId poolId,
        LendingErrorCode ec);

    MarketConfig m_config;
    custody::ICustody* m_custody;
    oracle::PriceOracleAdapter m_oracle;
    ledger::PoolRegistry m_registry;
    LendingSignals m_signals;
    ExecutionGuard m_guard;
};

//-------------------------------------------------------------------------

}  // namespace lendpool::desk

//-------------------------------------------------------------------------
