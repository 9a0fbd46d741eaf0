/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <benchmark/benchmark.h>
#include <fmt/format.h>

#include "lendpool/accounting/loan_terms.hpp"
#include "lendpool/accounting/pricing_utils.hpp"
#include "lendpool/accounting/share_utils.hpp"
#include "lendpool/custody/InMemoryCustody.hpp"
#include "lendpool/desk/LendingDesk.hpp"
#include "lendpool/oracle/StaticPriceFeed.hpp"
#include "lendpool/scenario/ScenarioRunner.hpp"

//-------------------------------------------------------------------------

using namespace lendpool;
using namespace lendpool::accounting;
using namespace lendpool::literals;

static const fs::path kTestDataPath{
    fs::path{__FILE__}.parent_path().parent_path() / "test" / "cpp-tests" / "data"};

static const ScaleParams kScales{.decimalsA = 18, .decimalsB = 6, .rateDecimals = 18};

static constexpr PoolParameters kParams{
    .orientation = Orientation::AssetAAsCollateral,
    .interestRate = 12,
    .reserveFeeRate = 1,
    .collateralFactor = 75
};

//-------------------------------------------------------------------------

static void BM_LoanTerms(benchmark::State& state)
{
    const amount_t collateral = util::pow10(18) * static_cast<uint64_t>(state.range(0));
    const amount_t rate = 3'000_amt * util::pow10(18);

    for (auto _ : state) {
        const auto borrowable = calculateBorrowable(collateral, kParams, rate, kScales);
        benchmark::DoNotOptimize(calculateLoanTerms(borrowable, kParams, 90 * kSecondsPerDay));
        benchmark::DoNotOptimize(
            calculatePayoff(collateral, kParams.orientation, rate, kScales));
    }
}
BENCHMARK(BM_LoanTerms)->Arg(1)->Arg(1'000)->Arg(1'000'000);

//-------------------------------------------------------------------------

static void BM_ShareConversion(benchmark::State& state)
{
    const amount_t totalLiquidity = 123'456'789'000_amt * util::pow10(6);
    const amount_t totalShares = 120'000'000'000_amt * util::pow10(6);

    for (auto _ : state) {
        const auto shares = toShares(1'000'000_amt, totalShares, totalLiquidity);
        benchmark::DoNotOptimize(toAmount(shares, totalLiquidity, totalShares));
    }
}
BENCHMARK(BM_ShareConversion);

//-------------------------------------------------------------------------

struct DeskFixture : benchmark::Fixture
{
    void SetUp(benchmark::State& state) override
    {
        custody = std::make_unique<custody::InMemoryCustody>();
        feed = std::make_unique<oracle::StaticPriceFeed>(2'0000'0000_amt);
        desk = std::make_unique<desk::LendingDesk>(
            desk::MarketConfig{
                .owner = "owner",
                .scales = {.decimalsA = 8, .decimalsB = 8, .rateDecimals = 8}},
            custody.get(),
            oracle::PriceOracleAdapter{feed.get()});
        if (!desk->createPool({.caller = "owner"}, 0, kParams)) {
            state.SkipWithError("Unable to create pool");
            return;
        }

        principals.clear();
        for (int64_t i = 0; i < state.range(0); ++i) {
            principals.push_back(fmt::format("principal{}", i));
            custody->mint(AssetKind::A, principals.back(), 1'000'000_amt);
            custody->mint(AssetKind::B, principals.back(), 1'000'000_amt);
        }
    }

    void TearDown(benchmark::State&) override
    {
        desk.reset();
        feed.reset();
        custody.reset();
    }

    std::unique_ptr<custody::InMemoryCustody> custody;
    std::unique_ptr<oracle::StaticPriceFeed> feed;
    std::unique_ptr<desk::LendingDesk> desk;
    std::vector<PrincipalId> principals;
};

//-------------------------------------------------------------------------

BENCHMARK_DEFINE_F(DeskFixture, DepositWithdrawCycle)(benchmark::State& state)
{
    for (auto _ : state) {
        for (const auto& principal : principals) {
            benchmark::DoNotOptimize(desk->deposit({.caller = principal}, 0, 1'000_amt));
        }
        for (const auto& principal : principals) {
            benchmark::DoNotOptimize(desk->withdraw({.caller = principal}, 0));
        }
    }
    state.SetItemsProcessed(state.iterations() * state.range(0) * 2);
}
BENCHMARK_REGISTER_F(DeskFixture, DepositWithdrawCycle)->Arg(10)->Arg(1'000);

BENCHMARK_DEFINE_F(DeskFixture, BorrowRepayCycle)(benchmark::State& state)
{
    if (!desk->deposit({.caller = principals.front()}, 0, 1'000'000_amt)) {
        state.SkipWithError("Unable to fund pool");
        return;
    }
    custody->mint(AssetKind::B, "borrower", 1'000'000_amt);
    custody->mint(AssetKind::A, "borrower", 100_amt);

    for (auto _ : state) {
        const auto borrow = desk->borrow({.caller = "borrower"}, 0, 100_amt, 30 * kSecondsPerDay);
        if (!borrow) {
            state.SkipWithError("Borrow failed");
            break;
        }
        benchmark::DoNotOptimize(desk->repay({.caller = "borrower"}, 0, borrow->repayAmount));
    }
}
BENCHMARK_REGISTER_F(DeskFixture, BorrowRepayCycle)->Arg(1);

//-------------------------------------------------------------------------

static void BM_ScenarioReplay(benchmark::State& state)
{
    for (auto _ : state) {
        auto runner = scenario::ScenarioRunner::fromFile(kTestDataPath / "Scenario.xml");
        benchmark::DoNotOptimize(runner->run());
    }
}
BENCHMARK(BM_ScenarioReplay);

//-------------------------------------------------------------------------

BENCHMARK_MAIN();

//-------------------------------------------------------------------------
