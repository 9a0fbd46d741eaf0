/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"
#include "lendpool/ledger/PoolLedger.hpp"

//-------------------------------------------------------------------------

namespace lendpool::ledger
{

//-------------------------------------------------------------------------

class PoolRegistry : public JsonSerializable
{
public:
    using ContainerType = std::map<PoolId, PoolLedger>;

    [[nodiscard]] PoolLedger& at(PoolId poolId);
    [[nodiscard]] const PoolLedger& at(PoolId poolId) const;
    [[nodiscard]] PoolLedger* find(PoolId poolId) noexcept;
    [[nodiscard]] const PoolLedger* find(PoolId poolId) const noexcept;
    [[nodiscard]] bool contains(PoolId poolId) const noexcept;
    [[nodiscard]] size_t size() const noexcept { return m_underlying.size(); }

    [[nodiscard]] auto begin() const noexcept { return m_underlying.begin(); }
    [[nodiscard]] auto end() const noexcept { return m_underlying.end(); }

    PoolLedger& create(PoolId poolId, const accounting::PoolParameters& params);

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    ContainerType m_underlying;
};

//-------------------------------------------------------------------------

}  // namespace lendpool::ledger

//-------------------------------------------------------------------------
