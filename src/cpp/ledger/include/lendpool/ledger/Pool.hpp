/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"
#include "lendpool/accounting/PoolParameters.hpp"
#include "lendpool/accounting/loan_terms.hpp"

//-------------------------------------------------------------------------

namespace lendpool::ledger
{

//-------------------------------------------------------------------------

struct LiquidationDelta
{
    amount_t payAmount{};
    amount_t repayAmount{};
    amount_t totalReserveAmount{};
};

//-------------------------------------------------------------------------

/**
 * Aggregate accounting of a single market. Every mutator keeps
 * totalBorrowAmount + currentBalanceAmount >= totalReserveAmount and throws
 * LedgerInvariantError otherwise.
 */
class Pool : public JsonSerializable
{
public:
    Pool() noexcept = default;
    Pool(PoolId id, const accounting::PoolParameters& params) noexcept;

    [[nodiscard]] PoolId id() const noexcept { return m_id; }
    [[nodiscard]] const accounting::PoolParameters& parameters() const noexcept { return m_params; }
    [[nodiscard]] accounting::Orientation orientation() const noexcept { return m_params.orientation; }
    [[nodiscard]] accounting::AssetKind depositAsset() const noexcept;
    [[nodiscard]] accounting::AssetKind collateralAsset() const noexcept;

    [[nodiscard]] const amount_t& totalBorrowAmount() const noexcept { return m_totalBorrowAmount; }
    [[nodiscard]] const amount_t& totalAssetAmount() const noexcept { return m_totalAssetAmount; }
    [[nodiscard]] const amount_t& totalReserveAmount() const noexcept { return m_totalReserveAmount; }
    [[nodiscard]] const amount_t& currentBalanceAmount() const noexcept { return m_currentBalanceAmount; }
    [[nodiscard]] amount_t totalLiquidity() const;

    void setParameters(const accounting::PoolParameters& params);

    void applyDeposit(const amount_t& amount, const amount_t& shares);
    void applyWithdrawal(const amount_t& amount, const amount_t& shares);
    void applyBorrow(const accounting::LoanTerms& terms);
    void applyRepayment(const amount_t& amount);
    void applyLiquidation(const LiquidationDelta& delta);
    void applyReserveWithdrawal(const amount_t& amount);

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    void checkConsistency(std::source_location sl) const;

    PoolId m_id{};
    accounting::PoolParameters m_params;
    amount_t m_totalBorrowAmount{};
    amount_t m_totalAssetAmount{};
    amount_t m_totalReserveAmount{};
    amount_t m_currentBalanceAmount{};
};

//-------------------------------------------------------------------------

}  // namespace lendpool::ledger

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lendpool::ledger::Pool>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const lendpool::ledger::Pool& pool, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "Pool #{} (borrow {} | shares {} | reserve {} | balance {})",
            pool.id(),
            pool.totalBorrowAmount(),
            pool.totalAssetAmount(),
            pool.totalReserveAmount(),
            pool.currentBalanceAmount());
    }
};

//-------------------------------------------------------------------------
