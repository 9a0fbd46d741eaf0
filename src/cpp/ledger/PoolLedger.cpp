/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendpool/ledger/PoolLedger.hpp"

//-------------------------------------------------------------------------

namespace lendpool::ledger
{

//-------------------------------------------------------------------------

PoolLedger::PoolLedger(PoolId id, const accounting::PoolParameters& params) noexcept
    : pool{id, params}
{}

//-------------------------------------------------------------------------

void PoolLedger::checkConsistency(std::source_location sl) const
{
    if (const auto shares = depositors.totalShares(); shares != pool.totalAssetAmount()) {
        throw LedgerInvariantError{fmt::format(
            "{}: total shares {} of {} do not match the sum of depositor shares {}",
            sl.function_name(), pool.totalAssetAmount(), pool, shares)};
    }
    if (const auto debt = loans.totalRepayAmount(); debt != pool.totalBorrowAmount()) {
        throw LedgerInvariantError{fmt::format(
            "{}: total borrow {} of {} does not match the sum of outstanding loans {}",
            sl.function_name(), pool.totalBorrowAmount(), pool, debt)};
    }
}

//-------------------------------------------------------------------------

void PoolLedger::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        pool.jsonSerialize(json, "pool");
        depositors.jsonSerialize(json, "depositors");
        loans.jsonSerialize(json, "loans");
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace lendpool::ledger

//-------------------------------------------------------------------------
