/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendpool/ledger/Pool.hpp"

#include "lendpool/accounting/share_utils.hpp"

//-------------------------------------------------------------------------

namespace lendpool::ledger
{

//-------------------------------------------------------------------------

Pool::Pool(PoolId id, const accounting::PoolParameters& params) noexcept
    : m_id{id}, m_params{params}
{}

//-------------------------------------------------------------------------

accounting::AssetKind Pool::depositAsset() const noexcept
{
    return accounting::depositAsset(m_params.orientation);
}

//-------------------------------------------------------------------------

accounting::AssetKind Pool::collateralAsset() const noexcept
{
    return accounting::collateralAsset(m_params.orientation);
}

//-------------------------------------------------------------------------

amount_t Pool::totalLiquidity() const
{
    return accounting::totalLiquidity(
        m_totalBorrowAmount, m_currentBalanceAmount, m_totalReserveAmount);
}

//-------------------------------------------------------------------------

void Pool::setParameters(const accounting::PoolParameters& params)
{
    if (params.orientation != m_params.orientation) {
        throw std::invalid_argument{fmt::format(
            "{}: orientation of pool #{} is fixed at {}, got {}",
            std::source_location::current().function_name(),
            m_id, m_params.orientation, params.orientation)};
    }
    m_params = params;
}

//-------------------------------------------------------------------------

void Pool::applyDeposit(const amount_t& amount, const amount_t& shares)
{
    m_currentBalanceAmount += amount;
    m_totalAssetAmount += shares;
    checkConsistency(std::source_location::current());
}

//-------------------------------------------------------------------------

void Pool::applyWithdrawal(const amount_t& amount, const amount_t& shares)
{
    m_currentBalanceAmount -= amount;
    m_totalAssetAmount -= shares;
    checkConsistency(std::source_location::current());
}

//-------------------------------------------------------------------------

void Pool::applyBorrow(const accounting::LoanTerms& terms)
{
    m_totalBorrowAmount += terms.repayAmount;
    m_totalReserveAmount += terms.feeAmount;
    m_currentBalanceAmount -= terms.borrowable;
    checkConsistency(std::source_location::current());
}

//-------------------------------------------------------------------------

void Pool::applyRepayment(const amount_t& amount)
{
    m_totalBorrowAmount -= amount;
    m_currentBalanceAmount += amount;
    checkConsistency(std::source_location::current());
}

//-------------------------------------------------------------------------

void Pool::applyLiquidation(const LiquidationDelta& delta)
{
    m_currentBalanceAmount += delta.payAmount;
    m_totalBorrowAmount -= delta.repayAmount;
    m_totalReserveAmount = delta.totalReserveAmount;
    checkConsistency(std::source_location::current());
}

//-------------------------------------------------------------------------

void Pool::applyReserveWithdrawal(const amount_t& amount)
{
    m_totalReserveAmount -= amount;
    m_currentBalanceAmount -= amount;
    checkConsistency(std::source_location::current());
}

//-------------------------------------------------------------------------

void Pool::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("id", rapidjson::Value{m_id}, allocator);
        const auto orientation = magic_enum::enum_name(m_params.orientation);
        json.AddMember(
            "orientation",
            rapidjson::Value{
                orientation.data(), static_cast<rapidjson::SizeType>(orientation.size()), allocator},
            allocator);
        json.AddMember("interestRate", rapidjson::Value{m_params.interestRate}, allocator);
        json.AddMember("reserveFeeRate", rapidjson::Value{m_params.reserveFeeRate}, allocator);
        json.AddMember("collateralFactor", rapidjson::Value{m_params.collateralFactor}, allocator);
        json.AddMember(
            "totalBorrowAmount", json::amount2json(m_totalBorrowAmount, allocator), allocator);
        json.AddMember(
            "totalAssetAmount", json::amount2json(m_totalAssetAmount, allocator), allocator);
        json.AddMember(
            "totalReserveAmount", json::amount2json(m_totalReserveAmount, allocator), allocator);
        json.AddMember(
            "currentBalanceAmount", json::amount2json(m_currentBalanceAmount, allocator), allocator);
        json.AddMember("totalLiquidity", json::amount2json(totalLiquidity(), allocator), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void Pool::checkConsistency(std::source_location sl) const
{
    if (m_totalReserveAmount > m_totalBorrowAmount + m_currentBalanceAmount) {
        throw LedgerInvariantError{fmt::format(
            "{}: Negative liquidity in {}", sl.function_name(), *this)};
    }
}

//-------------------------------------------------------------------------

}  // namespace lendpool::ledger

//-------------------------------------------------------------------------
