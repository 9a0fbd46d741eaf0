/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "DeskFixture.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace lendpool;
using namespace lendpool::accounting;
using namespace lendpool::desk;
using namespace lendpool::literals;
using namespace lendpool::test;

using namespace testing;

//-------------------------------------------------------------------------

class BorrowRepayTest : public DeskFixture
{};

//-------------------------------------------------------------------------

TEST_F(BorrowRepayTest, TwoDepositorsOneBorrower)
{
    fund(AssetKind::B, "alice", 1'000_amt);
    fund(AssetKind::B, "carol", 1'000_amt);
    fund(AssetKind::A, "bob", 500_amt);

    ASSERT_TRUE(desk->deposit(as("alice"), kPoolA, 1'000_amt).has_value());
    ASSERT_TRUE(desk->deposit(as("carol"), kPoolA, 1'000_amt).has_value());

    const auto borrow = desk->borrow(as("bob", 100), kPoolA, 500_amt, 180 * kDay);
    ASSERT_TRUE(borrow.has_value());
    EXPECT_EQ(borrow->borrowable, 800_amt);
    EXPECT_EQ(borrow->repayAmount, 800_amt);

    const auto loan = desk->loan(kPoolA, "bob");
    ASSERT_TRUE(loan.has_value());
    EXPECT_EQ(loan->collateralAmount(), 500_amt);
    EXPECT_EQ(loan->interestAmount(), 0_amt);
    EXPECT_EQ(loan->startTime(), 100u);
    EXPECT_EQ(loan->duration(), 180 * kDay);
    EXPECT_EQ(custody->balanceOf(AssetKind::B, "bob"), 800_amt);
    EXPECT_EQ(pool(kPoolA).currentBalanceAmount(), 1'200_amt);
    EXPECT_EQ(pool(kPoolA).totalLiquidity(), 2'000_amt);

    const auto withdraw = desk->withdraw(as("alice"), kPoolA);
    ASSERT_TRUE(withdraw.has_value());
    EXPECT_EQ(withdraw->amount, 1'000_amt);

    const auto repay = desk->repay(as("bob"), kPoolA, 800_amt);
    ASSERT_TRUE(repay.has_value());
    EXPECT_EQ(repay->collateralReleased, 500_amt);
    EXPECT_EQ(custody->balanceOf(AssetKind::A, "bob"), 500_amt);
    EXPECT_FALSE(desk->loan(kPoolA, "bob").has_value());

    EXPECT_EQ(desk->withdraw(as("carol"), kPoolA)->amount, 1'000_amt);
    EXPECT_EQ(pool(kPoolA).totalLiquidity(), 0_amt);
}

TEST_F(BorrowRepayTest, BorrowRejectionsInOrder)
{
    fund(AssetKind::B, "alice", 1'000_amt);
    fund(AssetKind::A, "bob", 1'000_amt);

    EXPECT_EQ(
        desk->borrow(as("bob"), kPoolA, 0_amt, kDay).error(), LendingErrorCode::ZERO_COLLATERAL);
    EXPECT_EQ(
        desk->borrow(as("bob"), kPoolA, 1'001_amt, kDay).error(),
        LendingErrorCode::INSUFFICIENT_COLLATERAL);

    feed->invalidate();
    EXPECT_EQ(
        desk->borrow(as("bob"), kPoolA, 500_amt, kDay).error(),
        LendingErrorCode::ORACLE_UNAVAILABLE);
    feed->setRate(kRate);

    // Nothing to lend yet.
    EXPECT_EQ(
        desk->borrow(as("bob"), kPoolA, 500_amt, kDay).error(),
        LendingErrorCode::INSUFFICIENT_LIQUIDITY);

    ASSERT_TRUE(desk->deposit(as("alice"), kPoolA, 1'000_amt).has_value());
    EXPECT_EQ(
        desk->borrow(as("bob"), kPoolA, 626_amt, kDay).error(),
        LendingErrorCode::INSUFFICIENT_LIQUIDITY);
    ASSERT_TRUE(desk->borrow(as("bob"), kPoolA, 625_amt, kDay).has_value());
    EXPECT_EQ(pool(kPoolA).currentBalanceAmount(), 0_amt);

    EXPECT_EQ(
        desk->borrow(as("bob"), kPoolA, 0_amt, kDay).error(),
        LendingErrorCode::ALREADY_BORROWED);
    EXPECT_EQ(
        desk->borrow(as("bob"), 42, 1_amt, kDay).error(), LendingErrorCode::UNKNOWN_POOL);
}

TEST_F(BorrowRepayTest, CollateralWorthNothingIsInsufficient)
{
    fund(AssetKind::A, "alice", 1'000_amt);
    fund(AssetKind::B, "bob", 1_amt);
    ASSERT_TRUE(desk->deposit(as("alice"), kPoolB, 1'000_amt).has_value());

    EXPECT_EQ(
        desk->borrow(as("bob"), kPoolB, 1_amt, kDay).error(),
        LendingErrorCode::INSUFFICIENT_COLLATERAL);
    EXPECT_EQ(custody->balanceOf(AssetKind::B, "bob"), 1_amt);
}

TEST_F(BorrowRepayTest, OneActiveLoanPerPool)
{
    fund(AssetKind::B, "alice", 10'000_amt);
    fund(AssetKind::A, "alice", 10'000_amt);
    fund(AssetKind::A, "bob", 1'000_amt);
    fund(AssetKind::B, "bob", 1'000_amt);
    ASSERT_TRUE(desk->deposit(as("alice"), kPoolA, 10'000_amt).has_value());
    ASSERT_TRUE(desk->deposit(as("alice"), kPoolB, 10'000_amt).has_value());

    ASSERT_TRUE(desk->borrow(as("bob"), kPoolA, 500_amt, kDay).has_value());
    EXPECT_EQ(
        desk->borrow(as("bob"), kPoolA, 500_amt, kDay).error(),
        LendingErrorCode::ALREADY_BORROWED);
    EXPECT_TRUE(desk->borrow(as("bob"), kPoolB, 1'000_amt, kDay).has_value());

    EXPECT_EQ(desk->loan(kPoolA, "bob")->collateralAmount(), 500_amt);
    EXPECT_EQ(desk->loan(kPoolB, "bob")->collateralAmount(), 1'000_amt);
}

TEST_F(BorrowRepayTest, BorrowQuoteMatchesBorrow)
{
    fund(AssetKind::A, "alice", 1'000_amt);
    fund(AssetKind::B, "bob", 1'000_amt);
    ASSERT_TRUE(desk->deposit(as("alice"), kPoolB, 1'000_amt).has_value());

    const auto quote = desk->borrowQuote(kPoolB, 1'000_amt, 30 * kDay);
    ASSERT_TRUE(quote.has_value());
    EXPECT_EQ(quote->borrowable, 400_amt);
    EXPECT_EQ(quote->feeAmount, 4_amt);
    EXPECT_EQ(quote->repayAmount, 404_amt);

    const auto borrow = desk->borrow(as("bob"), kPoolB, 1'000_amt, 30 * kDay);
    ASSERT_TRUE(borrow.has_value());
    EXPECT_EQ(borrow->borrowable, quote->borrowable);
    EXPECT_EQ(borrow->repayAmount, quote->repayAmount);
    EXPECT_EQ(pool(kPoolB).totalReserveAmount(), 4_amt);
    EXPECT_EQ(custody->balanceOf(AssetKind::A, "bob"), 400_amt);

    EXPECT_EQ(
        desk->borrowQuote(kPoolB, 0_amt, kDay).error(), LendingErrorCode::ZERO_COLLATERAL);
    feed->invalidate();
    EXPECT_EQ(
        desk->borrowQuote(kPoolB, 1_amt, kDay).error(), LendingErrorCode::ORACLE_UNAVAILABLE);
}

TEST_F(BorrowRepayTest, BorrowIsSignalled)
{
    fund(AssetKind::B, "alice", 1'000_amt);
    fund(AssetKind::A, "bob", 500_amt);
    ASSERT_TRUE(desk->deposit(as("alice"), kPoolA, 1'000_amt).has_value());

    MockFunction<void(const BorrowEvent&)> callback;
    desk->signals().borrow.connect(callback.AsStdFunction());
    EXPECT_CALL(callback, Call(AllOf(
        Field(&BorrowEvent::poolId, kPoolA),
        Field(&BorrowEvent::principal, "bob"),
        Field(&BorrowEvent::collateralAmount, 500_amt),
        Field(&BorrowEvent::borrowedAmount, 800_amt),
        Field(&BorrowEvent::duration, kDay))));

    ASSERT_TRUE(desk->borrow(as("bob"), kPoolA, 500_amt, kDay).has_value());
}

//-------------------------------------------------------------------------

TEST_F(BorrowRepayTest, PartialThenClampedRepay)
{
    fund(AssetKind::B, "alice", 1'000'000_amt);
    fund(AssetKind::A, "bob", 500'000_amt);
    fund(AssetKind::B, "bob", 100'000_amt);
    ASSERT_TRUE(desk->deposit(as("alice"), kPoolA, 1'000'000_amt).has_value());

    const auto borrow = desk->borrow(as("bob"), kPoolA, 500'000_amt, 180 * kDay);
    ASSERT_TRUE(borrow.has_value());
    EXPECT_EQ(borrow->repayAmount, 839'420_amt);

    const auto partial = desk->repay(as("bob"), kPoolA, 400'000_amt);
    ASSERT_TRUE(partial.has_value());
    EXPECT_EQ(partial->repaid, 400'000_amt);
    EXPECT_EQ(partial->remaining, 439'420_amt);
    EXPECT_EQ(partial->collateralReleased, 0_amt);
    EXPECT_EQ(pool(kPoolA).totalBorrowAmount(), 439'420_amt);
    EXPECT_EQ(custody->balanceOf(AssetKind::A, "bob"), 0_amt);

    const auto full = desk->repay(as("bob"), kPoolA, 1'000'000_amt);
    ASSERT_TRUE(full.has_value());
    EXPECT_EQ(full->repaid, 439'420_amt);
    EXPECT_EQ(full->remaining, 0_amt);
    EXPECT_EQ(full->collateralReleased, 500'000_amt);
    EXPECT_EQ(custody->balanceOf(AssetKind::A, "bob"), 500'000_amt);
    EXPECT_EQ(custody->balanceOf(AssetKind::B, "bob"), 60'580_amt);
    EXPECT_EQ(pool(kPoolA).totalBorrowAmount(), 0_amt);

    EXPECT_EQ(
        desk->repay(as("bob"), kPoolA, 1_amt).error(), LendingErrorCode::NO_ACTIVE_LOAN);
}

TEST_F(BorrowRepayTest, RepayRejections)
{
    fund(AssetKind::A, "alice", 1'000_amt);
    fund(AssetKind::B, "bob", 1'000_amt);
    ASSERT_TRUE(desk->deposit(as("alice"), kPoolB, 1'000_amt).has_value());

    EXPECT_EQ(
        desk->repay(as("bob"), kPoolB, 1_amt).error(), LendingErrorCode::NO_ACTIVE_LOAN);

    ASSERT_TRUE(desk->borrow(as("bob"), kPoolB, 1'000_amt, kDay).has_value());
    EXPECT_EQ(desk->repay(as("bob"), kPoolB, 0_amt).error(), LendingErrorCode::ZERO_REPAY);

    // Owes 404 while holding the 400 borrowed.
    EXPECT_EQ(
        desk->repay(as("bob"), kPoolB, 404_amt).error(), LendingErrorCode::INSUFFICIENT_BALANCE);
    EXPECT_EQ(
        desk->repay(as("bob"), kPoolB, 1'000_amt).error(),
        LendingErrorCode::INSUFFICIENT_BALANCE);
    EXPECT_EQ(desk->loan(kPoolB, "bob")->repayAmount(), 404_amt);

    ASSERT_TRUE(custody->transferIn(AssetKind::A, "bob", 400_amt).has_value());
    EXPECT_EQ(desk->repay(as("bob"), kPoolB, 1_amt).error(), LendingErrorCode::ZERO_REPAY);
}

TEST_F(BorrowRepayTest, InsufficientBalanceInEitherOrientation)
{
    fund(AssetKind::B, "alice", 1'000'000_amt);
    fund(AssetKind::A, "carol", 1'000'000_amt);
    fund(AssetKind::A, "bob", 500'000_amt);
    fund(AssetKind::B, "bob", 1'000'000_amt);
    ASSERT_TRUE(desk->deposit(as("alice"), kPoolA, 1'000'000_amt).has_value());
    ASSERT_TRUE(desk->deposit(as("carol"), kPoolB, 1'000'000_amt).has_value());

    ASSERT_TRUE(desk->borrow(as("bob"), kPoolA, 500'000_amt, 365 * kDay).has_value());
    ASSERT_TRUE(desk->borrow(as("bob"), kPoolB, 1'000'000_amt, 365 * kDay).has_value());
    EXPECT_EQ(desk->loan(kPoolA, "bob")->repayAmount(), 879'935_amt);
    EXPECT_EQ(desk->loan(kPoolB, "bob")->repayAmount(), 443'785_amt);
    EXPECT_EQ(custody->balanceOf(AssetKind::B, "bob"), 800'000_amt);
    EXPECT_EQ(custody->balanceOf(AssetKind::A, "bob"), 400'000_amt);

    EXPECT_EQ(
        desk->repay(as("bob"), kPoolA, 879'935_amt).error(),
        LendingErrorCode::INSUFFICIENT_BALANCE);
    EXPECT_EQ(
        desk->repay(as("bob"), kPoolB, 443'785_amt).error(),
        LendingErrorCode::INSUFFICIENT_BALANCE);
    EXPECT_EQ(desk->loan(kPoolA, "bob")->repayAmount(), 879'935_amt);
    EXPECT_EQ(desk->loan(kPoolB, "bob")->repayAmount(), 443'785_amt);
}

TEST_F(BorrowRepayTest, CollateralPricedPastTheAmountRange)
{
    const amount_t collateralAmount = amount_t{1} << 255;
    fund(AssetKind::B, "alice", 1'000'000_amt);
    fund(AssetKind::A, "bob", collateralAmount);
    ASSERT_TRUE(desk->deposit(as("alice"), kPoolA, 1'000'000_amt).has_value());

    EXPECT_EQ(
        desk->borrowQuote(kPoolA, collateralAmount, 30 * kDay).error(),
        LendingErrorCode::AMOUNT_OVERFLOW);
    EXPECT_EQ(
        desk->borrow(as("bob"), kPoolA, collateralAmount, 30 * kDay).error(),
        LendingErrorCode::AMOUNT_OVERFLOW);
    EXPECT_FALSE(desk->loan(kPoolA, "bob").has_value());
    EXPECT_EQ(custody->balanceOf(AssetKind::A, "bob"), collateralAmount);
    EXPECT_EQ(pool(kPoolA).currentBalanceAmount(), 1'000'000_amt);
}

//-------------------------------------------------------------------------

class BorrowRepayLiquidityTest
    : public DeskFixture,
      public WithParamInterface<std::tuple<amount_t, Timestamp>>
{};

TEST_P(BorrowRepayLiquidityTest, FullRepaymentGrowsLiquidityByInterest)
{
    const auto [collateralAmount, duration] = GetParam();

    fund(AssetKind::A, "alice", 1'000'000'000_amt);
    fund(AssetKind::B, "bob", collateralAmount);
    ASSERT_TRUE(desk->deposit(as("alice"), kPoolB, 1'000'000'000_amt).has_value());
    const amount_t before = desk->totalLiquidity(kPoolB).value();
    const amount_t balanceBefore = pool(kPoolB).currentBalanceAmount();

    ASSERT_TRUE(desk->borrow(as("bob"), kPoolB, collateralAmount, duration).has_value());
    const auto loan = desk->loan(kPoolB, "bob").value();
    EXPECT_EQ(desk->totalLiquidity(kPoolB).value(), before + loan.interestAmount());

    fund(AssetKind::A, "bob", loan.interestAmount() + loan.feeAmount());
    const auto repay = desk->repay(as("bob"), kPoolB, loan.repayAmount());
    ASSERT_TRUE(repay.has_value());
    EXPECT_EQ(repay->collateralReleased, collateralAmount);
    EXPECT_EQ(
        pool(kPoolB).currentBalanceAmount(),
        balanceBefore + loan.repayAmount() - loan.borrowedAmount());

    EXPECT_EQ(desk->totalLiquidity(kPoolB).value(), before + loan.interestAmount());
    EXPECT_GE(desk->withdrawQuote(kPoolB, "alice").value(), 1'000'000'000_amt);
    EXPECT_EQ(pool(kPoolB).totalBorrowAmount(), 0_amt);
}

INSTANTIATE_TEST_SUITE_P(
    BorrowRepayTests,
    BorrowRepayLiquidityTest,
    Combine(
        Values(1'000_amt, 123'457_amt, 2'000'000'000_amt),
        Values(Timestamp{0}, kDay - 1, 30 * kDay, 365 * kDay)));

//-------------------------------------------------------------------------
