/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendpool/ledger/PoolRegistry.hpp"

//-------------------------------------------------------------------------

namespace lendpool::ledger
{

//-------------------------------------------------------------------------

PoolLedger& PoolRegistry::at(PoolId poolId)
{
    if (auto ledger = find(poolId)) {
        return *ledger;
    }
    throw std::out_of_range{fmt::format(
        "{}: No pool #{}", std::source_location::current().function_name(), poolId)};
}

//-------------------------------------------------------------------------

const PoolLedger& PoolRegistry::at(PoolId poolId) const
{
    if (auto ledger = find(poolId)) {
        return *ledger;
    }
    throw std::out_of_range{fmt::format(
        "{}: No pool #{}", std::source_location::current().function_name(), poolId)};
}

//-------------------------------------------------------------------------

PoolLedger* PoolRegistry::find(PoolId poolId) noexcept
{
    auto it = m_underlying.find(poolId);
    return it != m_underlying.end() ? &it->second : nullptr;
}

//-------------------------------------------------------------------------

const PoolLedger* PoolRegistry::find(PoolId poolId) const noexcept
{
    auto it = m_underlying.find(poolId);
    return it != m_underlying.end() ? &it->second : nullptr;
}

//-------------------------------------------------------------------------

bool PoolRegistry::contains(PoolId poolId) const noexcept
{
    return m_underlying.contains(poolId);
}

//-------------------------------------------------------------------------

PoolLedger& PoolRegistry::create(PoolId poolId, const accounting::PoolParameters& params)
{
    auto [it, inserted] = m_underlying.try_emplace(poolId, poolId, params);
    if (!inserted) {
        throw std::invalid_argument{fmt::format(
            "{}: Pool #{} already exists",
            std::source_location::current().function_name(), poolId)};
    }
    return it->second;
}

//-------------------------------------------------------------------------

void PoolRegistry::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        for (const auto& [poolId, ledger] : m_underlying) {
            ledger.jsonSerialize(json, std::to_string(poolId));
        }
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace lendpool::ledger

//-------------------------------------------------------------------------
