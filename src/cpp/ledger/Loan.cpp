/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendpool/ledger/Loan.hpp"

//-------------------------------------------------------------------------

namespace lendpool::ledger
{

//-------------------------------------------------------------------------

Loan::Loan(const LoanDesc& desc) noexcept
    : m{desc}
{}

//-------------------------------------------------------------------------

bool Loan::isClosed() const noexcept
{
    return m.collateralAmount == 0u && m.repayAmount == 0u;
}

//-------------------------------------------------------------------------

bool Loan::isLiquidatable(Timestamp now) const noexcept
{
    return isActive() && now >= maturity();
}

//-------------------------------------------------------------------------

amount_t Loan::repay(const amount_t& amount)
{
    if (amount > m.repayAmount) [[unlikely]] {
        throw LedgerInvariantError{fmt::format(
            "{}: amount ({}) greater than repayAmount ({})",
            std::source_location::current().function_name(), amount, m.repayAmount)};
    }

    m.repayAmount -= amount;
    if (m.repayAmount != 0u) {
        return {};
    }
    return std::exchange(m, {}).collateralAmount;
}

//-------------------------------------------------------------------------

amount_t Loan::liquidate() noexcept
{
    return std::exchange(m, {}).collateralAmount;
}

//-------------------------------------------------------------------------

bool Loan::operator==(const Loan& other) const noexcept
{
    return m.collateralAmount == other.m.collateralAmount
        && m.borrowedAmount == other.m.borrowedAmount
        && m.repayAmount == other.m.repayAmount
        && m.interestAmount == other.m.interestAmount
        && m.feeAmount == other.m.feeAmount
        && m.startTime == other.m.startTime
        && m.duration == other.m.duration;
}

//-------------------------------------------------------------------------

void Loan::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember(
            "collateralAmount", json::amount2json(m.collateralAmount, allocator), allocator);
        json.AddMember(
            "borrowedAmount", json::amount2json(m.borrowedAmount, allocator), allocator);
        json.AddMember("repayAmount", json::amount2json(m.repayAmount, allocator), allocator);
        json.AddMember(
            "interestAmount", json::amount2json(m.interestAmount, allocator), allocator);
        json.AddMember("feeAmount", json::amount2json(m.feeAmount, allocator), allocator);
        json.AddMember("startTime", rapidjson::Value{m.startTime}, allocator);
        json.AddMember("duration", rapidjson::Value{m.duration}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace lendpool::ledger

//-------------------------------------------------------------------------
