/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"
#include "lendpool/ledger/DepositorLedger.hpp"
#include "lendpool/ledger/LoanLedger.hpp"
#include "lendpool/ledger/Pool.hpp"

//-------------------------------------------------------------------------

namespace lendpool::ledger
{

//-------------------------------------------------------------------------

class PoolLedger : public JsonSerializable
{
public:
    PoolLedger() noexcept = default;
    PoolLedger(PoolId id, const accounting::PoolParameters& params) noexcept;

    Pool pool;
    DepositorLedger depositors;
    LoanLedger loans;

    // Verifies the pool aggregates against the sub-ledgers.
    void checkConsistency(std::source_location sl = std::source_location::current()) const;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

//-------------------------------------------------------------------------

}  // namespace lendpool::ledger

//-------------------------------------------------------------------------
