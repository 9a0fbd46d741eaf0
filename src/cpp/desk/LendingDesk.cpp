/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendpool/desk/LendingDesk.hpp"

#include "lendpool/accounting/pricing_utils.hpp"
#include "lendpool/accounting/share_utils.hpp"
#include "lendpool/custody/TransferJournal.hpp"
#include "json_util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

//-------------------------------------------------------------------------

namespace lendpool::desk
{

//-------------------------------------------------------------------------

namespace
{

// Runs a staging step, reporting whether its amounts stayed within 256 bits.
template<typename F>
[[nodiscard]] bool withinRange(std::string_view operation, F&& stage)
{
    try {
        std::forward<F>(stage)();
    }
    catch (const std::overflow_error& e) {
        spdlog::warn("{} exceeds the amount range: {}", operation, e.what());
        return false;
    }
    return true;
}

}  // namespace

//-------------------------------------------------------------------------

LendingDesk::LendingDesk(
    MarketConfig config,
    custody::ICustody* custody,
    oracle::PriceOracleAdapter oracle) noexcept
    : m_config{std::move(config)}, m_custody{custody}, m_oracle{oracle}
{}

//-------------------------------------------------------------------------

LendingResult<void> LendingDesk::createPool(
    const CallContext& ctx, PoolId poolId, const accounting::PoolParameters& params)
{
    static constexpr std::string_view op = "createPool";

    auto scope = m_guard.tryEnter();
    if (!scope) {
        return reject(op, ctx, poolId, LendingErrorCode::REENTRANT_CALL);
    }
    if (ctx.caller != m_config.owner) {
        return reject(op, ctx, poolId, LendingErrorCode::UNAUTHORIZED);
    }
    if (m_registry.contains(poolId)) {
        return reject(op, ctx, poolId, LendingErrorCode::INVALID_PARAMETER);
    }

    m_registry.create(poolId, params);
    spdlog::info("Created pool #{} with {}", poolId, params);
    return {};
}

//-------------------------------------------------------------------------

LendingResult<void> LendingDesk::setPoolParameters(
    const CallContext& ctx, PoolId poolId, const accounting::PoolParameters& params)
{
    static constexpr std::string_view op = "setPoolParameters";

    auto scope = m_guard.tryEnter();
    if (!scope) {
        return reject(op, ctx, poolId, LendingErrorCode::REENTRANT_CALL);
    }
    if (ctx.caller != m_config.owner) {
        return reject(op, ctx, poolId, LendingErrorCode::UNAUTHORIZED);
    }
    auto ledger = m_registry.find(poolId);
    if (ledger == nullptr) {
        return reject(op, ctx, poolId, LendingErrorCode::UNKNOWN_POOL);
    }
    if (params.orientation != ledger->pool.orientation()) {
        return reject(op, ctx, poolId, LendingErrorCode::INVALID_PARAMETER);
    }

    ledger->pool.setParameters(params);
    spdlog::info("Updated pool #{} to {}", poolId, params);
    return {};
}

//-------------------------------------------------------------------------

LendingResult<amount_t> LendingDesk::withdrawReserve(
    const CallContext& ctx, PoolId poolId, const amount_t& amount)
{
    static constexpr std::string_view op = "withdrawReserve";

    auto scope = m_guard.tryEnter();
    if (!scope) {
        return reject(op, ctx, poolId, LendingErrorCode::REENTRANT_CALL);
    }
    if (ctx.caller != m_config.owner) {
        return reject(op, ctx, poolId, LendingErrorCode::UNAUTHORIZED);
    }
    auto ledger = m_registry.find(poolId);
    if (ledger == nullptr) {
        return reject(op, ctx, poolId, LendingErrorCode::UNKNOWN_POOL);
    }
    if (amount == 0u) {
        return reject(op, ctx, poolId, LendingErrorCode::ZERO_AMOUNT);
    }
    if (amount > ledger->pool.totalReserveAmount()) {
        return reject(op, ctx, poolId, LendingErrorCode::INSUFFICIENT_BALANCE);
    }
    if (amount > ledger->pool.currentBalanceAmount()) {
        return reject(op, ctx, poolId, LendingErrorCode::UNAVAILABLE);
    }

    ledger::Pool pool = ledger->pool;
    pool.applyReserveWithdrawal(amount);

    custody::TransferJournal journal{m_custody};
    if (!journal.pushOut(pool.depositAsset(), ctx.caller, amount)) {
        return reject(op, ctx, poolId, LendingErrorCode::TRANSFER_FAILED);
    }

    ledger->pool = std::move(pool);
    journal.commit();
    ledger->checkConsistency();

    m_signals.reserveWithdrawal({
        .poolId = poolId,
        .principal = ctx.caller,
        .amount = amount,
        .time = ctx.now
    });
    return amount;
}

//-------------------------------------------------------------------------

LendingResult<DepositResult> LendingDesk::deposit(
    const CallContext& ctx, PoolId poolId, const amount_t& amount)
{
    static constexpr std::string_view op = "deposit";

    auto scope = m_guard.tryEnter();
    if (!scope) {
        return reject(op, ctx, poolId, LendingErrorCode::REENTRANT_CALL);
    }
    auto ledger = m_registry.find(poolId);
    if (ledger == nullptr) {
        return reject(op, ctx, poolId, LendingErrorCode::UNKNOWN_POOL);
    }
    if (amount == 0u) {
        return reject(op, ctx, poolId, LendingErrorCode::ZERO_AMOUNT);
    }
    const auto asset = ledger->pool.depositAsset();
    if (m_custody->balanceOf(asset, ctx.caller) < amount) {
        return reject(op, ctx, poolId, LendingErrorCode::INSUFFICIENT_BALANCE);
    }

    amount_t shares;
    if (!withinRange(op, [&] {
            shares = accounting::toShares(
                amount, ledger->pool.totalAssetAmount(), ledger->pool.totalLiquidity());
        })) {
        return reject(op, ctx, poolId, LendingErrorCode::AMOUNT_OVERFLOW);
    }
    // Dust too small to mint a share.
    if (shares == 0u) {
        return reject(op, ctx, poolId, LendingErrorCode::INVALID_PARAMETER);
    }

    ledger::Pool pool = ledger->pool;
    if (!withinRange(op, [&] { pool.applyDeposit(amount, shares); })) {
        return reject(op, ctx, poolId, LendingErrorCode::AMOUNT_OVERFLOW);
    }

    custody::TransferJournal journal{m_custody};
    if (!journal.pullIn(asset, ctx.caller, amount)) {
        return reject(op, ctx, poolId, LendingErrorCode::TRANSFER_FAILED);
    }

    ledger->pool = std::move(pool);
    ledger->depositors.credit(ctx.caller, shares);
    journal.commit();
    ledger->checkConsistency();

    m_signals.deposit({
        .poolId = poolId,
        .principal = ctx.caller,
        .amount = amount,
        .shares = shares,
        .time = ctx.now
    });
    return DepositResult{.shares = shares};
}

//-------------------------------------------------------------------------

LendingResult<WithdrawResult> LendingDesk::withdraw(const CallContext& ctx, PoolId poolId)
{
    static constexpr std::string_view op = "withdraw";

    auto scope = m_guard.tryEnter();
    if (!scope) {
        return reject(op, ctx, poolId, LendingErrorCode::REENTRANT_CALL);
    }
    auto ledger = m_registry.find(poolId);
    if (ledger == nullptr) {
        return reject(op, ctx, poolId, LendingErrorCode::UNKNOWN_POOL);
    }
    const amount_t shares = ledger->depositors.shares(ctx.caller);
    if (shares == 0u) {
        return reject(op, ctx, poolId, LendingErrorCode::ZERO_AMOUNT);
    }
    amount_t amount;
    if (!withinRange(op, [&] {
            amount = accounting::toAmount(
                shares, ledger->pool.totalLiquidity(), ledger->pool.totalAssetAmount());
        })) {
        return reject(op, ctx, poolId, LendingErrorCode::AMOUNT_OVERFLOW);
    }
    if (amount > ledger->pool.currentBalanceAmount()) {
        return reject(op, ctx, poolId, LendingErrorCode::UNAVAILABLE);
    }

    ledger::Pool pool = ledger->pool;
    pool.applyWithdrawal(amount, shares);

    custody::TransferJournal journal{m_custody};
    if (!journal.pushOut(pool.depositAsset(), ctx.caller, amount)) {
        return reject(op, ctx, poolId, LendingErrorCode::TRANSFER_FAILED);
    }

    ledger->pool = std::move(pool);
    ledger->depositors.redeemAll(ctx.caller);
    journal.commit();
    ledger->checkConsistency();

    m_signals.withdraw({
        .poolId = poolId,
        .principal = ctx.caller,
        .amount = amount,
        .shares = shares,
        .time = ctx.now
    });
    return WithdrawResult{.amount = amount, .shares = shares};
}

//-------------------------------------------------------------------------

LendingResult<BorrowResult> LendingDesk::borrow(
    const CallContext& ctx,
    PoolId poolId,
    const amount_t& collateralAmount,
    Timestamp duration)
{
    static constexpr std::string_view op = "borrow";

    auto scope = m_guard.tryEnter();
    if (!scope) {
        return reject(op, ctx, poolId, LendingErrorCode::REENTRANT_CALL);
    }
    auto ledger = m_registry.find(poolId);
    if (ledger == nullptr) {
        return reject(op, ctx, poolId, LendingErrorCode::UNKNOWN_POOL);
    }
    if (ledger->loans.get(ctx.caller).isActive()) {
        return reject(op, ctx, poolId, LendingErrorCode::ALREADY_BORROWED);
    }
    if (collateralAmount == 0u) {
        return reject(op, ctx, poolId, LendingErrorCode::ZERO_COLLATERAL);
    }
    if (duration > std::numeric_limits<Timestamp>::max() - ctx.now) {
        return reject(op, ctx, poolId, LendingErrorCode::INVALID_PARAMETER);
    }
    const auto collateralAsset = ledger->pool.collateralAsset();
    if (m_custody->balanceOf(collateralAsset, ctx.caller) < collateralAmount) {
        return reject(op, ctx, poolId, LendingErrorCode::INSUFFICIENT_COLLATERAL);
    }
    const auto rate = readRate();
    if (!rate) {
        return reject(op, ctx, poolId, rate.error());
    }

    const auto& params = ledger->pool.parameters();
    amount_t borrowable;
    if (!withinRange(op, [&] {
            borrowable = accounting::calculateBorrowable(
                collateralAmount, params, *rate, m_config.scales);
        })) {
        return reject(op, ctx, poolId, LendingErrorCode::AMOUNT_OVERFLOW);
    }
    if (borrowable == 0u) {
        return reject(op, ctx, poolId, LendingErrorCode::INSUFFICIENT_COLLATERAL);
    }
    if (ledger->pool.currentBalanceAmount() < borrowable) {
        return reject(op, ctx, poolId, LendingErrorCode::INSUFFICIENT_LIQUIDITY);
    }

    accounting::LoanTerms terms;
    ledger::Pool pool = ledger->pool;
    if (!withinRange(op, [&] {
            terms = accounting::calculateLoanTerms(borrowable, params, duration);
            pool.applyBorrow(terms);
        })) {
        return reject(op, ctx, poolId, LendingErrorCode::AMOUNT_OVERFLOW);
    }
    ledger::Loan loan{ledger::LoanDesc{
        .collateralAmount = collateralAmount,
        .borrowedAmount = terms.borrowable,
        .repayAmount = terms.repayAmount,
        .interestAmount = terms.interestAmount,
        .feeAmount = terms.feeAmount,
        .startTime = ctx.now,
        .duration = duration
    }};

    custody::TransferJournal journal{m_custody};
    if (!journal.pullIn(collateralAsset, ctx.caller, collateralAmount)
        || !journal.pushOut(pool.depositAsset(), ctx.caller, terms.borrowable)) {
        return reject(op, ctx, poolId, LendingErrorCode::TRANSFER_FAILED);
    }

    ledger->pool = std::move(pool);
    ledger->loans.put(ctx.caller, loan);
    journal.commit();
    ledger->checkConsistency();

    m_signals.borrow({
        .poolId = poolId,
        .principal = ctx.caller,
        .collateralAmount = collateralAmount,
        .borrowedAmount = terms.borrowable,
        .repayAmount = terms.repayAmount,
        .duration = duration,
        .time = ctx.now
    });
    return BorrowResult{.borrowable = terms.borrowable, .repayAmount = terms.repayAmount};
}

//-------------------------------------------------------------------------

LendingResult<RepayResult> LendingDesk::repay(
    const CallContext& ctx, PoolId poolId, const amount_t& amount)
{
    static constexpr std::string_view op = "repay";

    auto scope = m_guard.tryEnter();
    if (!scope) {
        return reject(op, ctx, poolId, LendingErrorCode::REENTRANT_CALL);
    }
    auto ledger = m_registry.find(poolId);
    if (ledger == nullptr) {
        return reject(op, ctx, poolId, LendingErrorCode::UNKNOWN_POOL);
    }
    ledger::Loan loan = ledger->loans.get(ctx.caller);
    if (loan.repayAmount() == 0u) {
        return reject(op, ctx, poolId, LendingErrorCode::NO_ACTIVE_LOAN);
    }
    const auto asset = ledger->pool.depositAsset();
    const amount_t balance = m_custody->balanceOf(asset, ctx.caller);
    if (amount == 0u || balance == 0u) {
        return reject(op, ctx, poolId, LendingErrorCode::ZERO_REPAY);
    }
    const amount_t applied = std::min(amount, loan.repayAmount());
    if (balance < applied) {
        return reject(op, ctx, poolId, LendingErrorCode::INSUFFICIENT_BALANCE);
    }

    const auto collateralAsset = ledger->pool.collateralAsset();
    const amount_t released = loan.repay(applied);
    ledger::Pool pool = ledger->pool;
    pool.applyRepayment(applied);

    custody::TransferJournal journal{m_custody};
    if (!journal.pullIn(asset, ctx.caller, applied)
        || !journal.pushOut(collateralAsset, ctx.caller, released)) {
        return reject(op, ctx, poolId, LendingErrorCode::TRANSFER_FAILED);
    }

    ledger->pool = std::move(pool);
    ledger->loans.put(ctx.caller, loan);
    journal.commit();
    ledger->checkConsistency();

    m_signals.repay({
        .poolId = poolId,
        .principal = ctx.caller,
        .amount = applied,
        .remaining = loan.repayAmount(),
        .collateralReleased = released,
        .time = ctx.now
    });
    return RepayResult{
        .repaid = applied,
        .remaining = loan.repayAmount(),
        .collateralReleased = released
    };
}

//-------------------------------------------------------------------------

LendingResult<LiquidationResult> LendingDesk::liquidate(
    const CallContext& ctx, PoolId poolId, const PrincipalId& borrower)
{
    static constexpr std::string_view op = "liquidate";

    auto scope = m_guard.tryEnter();
    if (!scope) {
        return reject(op, ctx, poolId, LendingErrorCode::REENTRANT_CALL);
    }
    auto ledger = m_registry.find(poolId);
    if (ledger == nullptr) {
        return reject(op, ctx, poolId, LendingErrorCode::UNKNOWN_POOL);
    }
    if (ctx.caller == borrower) {
        return reject(op, ctx, poolId, LendingErrorCode::SELF_LIQUIDATION);
    }
    ledger::Loan loan = ledger->loans.get(borrower);
    if (!loan.isActive()) {
        return reject(op, ctx, poolId, LendingErrorCode::NO_COLLATERAL);
    }
    if (!loan.isLiquidatable(ctx.now)) {
        return reject(op, ctx, poolId, LendingErrorCode::NOT_YET_LIQUIDATABLE);
    }
    const auto rate = readRate();
    if (!rate) {
        return reject(op, ctx, poolId, rate.error());
    }

    const auto depositAsset = ledger->pool.depositAsset();
    amount_t payAmount;
    if (!withinRange(op, [&] {
            payAmount = accounting::calculatePayoff(
                loan.collateralAmount(), ledger->pool.orientation(), *rate, m_config.scales);
        })) {
        return reject(op, ctx, poolId, LendingErrorCode::AMOUNT_OVERFLOW);
    }
    if (m_custody->balanceOf(depositAsset, ctx.caller) < payAmount) {
        return reject(op, ctx, poolId, LendingErrorCode::INSUFFICIENT_BALANCE);
    }

    accounting::LiquidationReserve reserve;
    ledger::Pool pool = ledger->pool;
    if (!withinRange(op, [&] {
            reserve = accounting::settleLiquidationReserve({
                .totalReserveAmount = ledger->pool.totalReserveAmount(),
                .payAmount = payAmount,
                .repayAmount = loan.repayAmount(),
                .borrowedAmount = loan.borrowedAmount(),
                .interestAmount = loan.interestAmount(),
                .feeAmount = loan.feeAmount()
            });
            pool.applyLiquidation({
                .payAmount = payAmount,
                .repayAmount = loan.repayAmount(),
                .totalReserveAmount = reserve.totalReserveAmount
            });
        })) {
        return reject(op, ctx, poolId, LendingErrorCode::AMOUNT_OVERFLOW);
    }
    const amount_t collateral = loan.liquidate();

    custody::TransferJournal journal{m_custody};
    if (!journal.pullIn(depositAsset, ctx.caller, payAmount)
        || !journal.pushOut(pool.collateralAsset(), ctx.caller, collateral)) {
        return reject(op, ctx, poolId, LendingErrorCode::TRANSFER_FAILED);
    }

    ledger->pool = std::move(pool);
    ledger->loans.put(borrower, loan);
    journal.commit();
    ledger->checkConsistency();

    if (reserve.shortfall > 0u) {
        spdlog::warn(
            "Liquidation of '{}' in pool #{} left a reserve shortfall of {}",
            borrower, poolId, reserve.shortfall);
    }
    m_signals.liquidate({
        .poolId = poolId,
        .liquidator = ctx.caller,
        .borrower = borrower,
        .payAmount = payAmount,
        .collateralAmount = collateral,
        .reserveShortfall = reserve.shortfall,
        .time = ctx.now
    });
    return LiquidationResult{.collateralReleased = collateral, .payAmount = payAmount};
}

//-------------------------------------------------------------------------

LendingResult<amount_t> LendingDesk::payoffQuote(
    PoolId poolId, const PrincipalId& borrower) const
{
    const auto ledger = m_registry.find(poolId);
    if (ledger == nullptr) {
        return std::unexpected{LendingErrorCode::UNKNOWN_POOL};
    }
    const auto loan = ledger->loans.find(borrower);
    if (!loan || !loan->get().isActive()) {
        return std::unexpected{LendingErrorCode::NO_COLLATERAL};
    }
    const auto rate = readRate();
    if (!rate) {
        return std::unexpected{rate.error()};
    }
    try {
        return accounting::calculatePayoff(
            loan->get().collateralAmount(), ledger->pool.orientation(), *rate, m_config.scales);
    }
    catch (const std::overflow_error&) {
        return std::unexpected{LendingErrorCode::AMOUNT_OVERFLOW};
    }
}

//-------------------------------------------------------------------------

LendingResult<accounting::LoanTerms> LendingDesk::borrowQuote(
    PoolId poolId, const amount_t& collateralAmount, Timestamp duration) const
{
    const auto ledger = m_registry.find(poolId);
    if (ledger == nullptr) {
        return std::unexpected{LendingErrorCode::UNKNOWN_POOL};
    }
    if (collateralAmount == 0u) {
        return std::unexpected{LendingErrorCode::ZERO_COLLATERAL};
    }
    const auto rate = readRate();
    if (!rate) {
        return std::unexpected{rate.error()};
    }
    const auto& params = ledger->pool.parameters();
    try {
        return accounting::calculateLoanTerms(
            accounting::calculateBorrowable(collateralAmount, params, *rate, m_config.scales),
            params,
            duration);
    }
    catch (const std::overflow_error&) {
        return std::unexpected{LendingErrorCode::AMOUNT_OVERFLOW};
    }
}

//-------------------------------------------------------------------------

LendingResult<amount_t> LendingDesk::withdrawQuote(
    PoolId poolId, const PrincipalId& principal) const
{
    const auto ledger = m_registry.find(poolId);
    if (ledger == nullptr) {
        return std::unexpected{LendingErrorCode::UNKNOWN_POOL};
    }
    try {
        return accounting::toAmount(
            ledger->depositors.shares(principal),
            ledger->pool.totalLiquidity(),
            ledger->pool.totalAssetAmount());
    }
    catch (const std::overflow_error&) {
        return std::unexpected{LendingErrorCode::AMOUNT_OVERFLOW};
    }
}

//-------------------------------------------------------------------------

LendingResult<amount_t> LendingDesk::totalLiquidity(PoolId poolId) const
{
    const auto ledger = m_registry.find(poolId);
    if (ledger == nullptr) {
        return std::unexpected{LendingErrorCode::UNKNOWN_POOL};
    }
    return ledger->pool.totalLiquidity();
}

//-------------------------------------------------------------------------

const ledger::Pool* LendingDesk::pool(PoolId poolId) const noexcept
{
    const auto ledger = m_registry.find(poolId);
    return ledger != nullptr ? &ledger->pool : nullptr;
}

//-------------------------------------------------------------------------

std::optional<ledger::Loan> LendingDesk::loan(
    PoolId poolId, const PrincipalId& principal) const noexcept
{
    const auto ledger = m_registry.find(poolId);
    if (ledger == nullptr) {
        return {};
    }
    if (const auto record = ledger->loans.find(principal)) {
        return record->get();
    }
    return {};
}

//-------------------------------------------------------------------------

amount_t LendingDesk::shares(PoolId poolId, const PrincipalId& principal) const noexcept
{
    const auto ledger = m_registry.find(poolId);
    return ledger != nullptr ? ledger->depositors.shares(principal) : amount_t{};
}

//-------------------------------------------------------------------------

void LendingDesk::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember(
            "owner",
            rapidjson::Value{
                m_config.owner.c_str(),
                static_cast<rapidjson::SizeType>(m_config.owner.size()),
                allocator},
            allocator);
        json.AddMember("decimalsA", rapidjson::Value{m_config.scales.decimalsA}, allocator);
        json.AddMember("decimalsB", rapidjson::Value{m_config.scales.decimalsB}, allocator);
        json.AddMember("rateDecimals", rapidjson::Value{m_config.scales.rateDecimals}, allocator);
        json.AddMember("eventCount", rapidjson::Value{m_signals.eventCounter}, allocator);
        m_registry.jsonSerialize(json, "pools");
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

LendingResult<amount_t> LendingDesk::readRate() const
{
    const auto rate = m_oracle.readRate();
    if (!rate) {
        return std::unexpected{LendingErrorCode::ORACLE_UNAVAILABLE};
    }
    return *rate;
}

//-------------------------------------------------------------------------

std::unexpected<LendingErrorCode> LendingDesk::reject(
    std::string_view operation,
    const CallContext& ctx,
    PoolId poolId,
    LendingErrorCode ec)
{
    spdlog::debug(
        "{} by '{}' on pool #{} at {} rejected: {}",
        operation, ctx.caller, poolId, ctx.now, ec);
    m_signals.rejection({
        .operation = operation,
        .poolId = poolId,
        .principal = ctx.caller,
        .ec = ec,
        .time = ctx.now
    });
    return std::unexpected{ec};
}

//-------------------------------------------------------------------------

}  // namespace lendpool::desk

//-------------------------------------------------------------------------
