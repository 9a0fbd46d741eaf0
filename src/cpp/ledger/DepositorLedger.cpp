/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendpool/ledger/DepositorLedger.hpp"

//-------------------------------------------------------------------------

namespace lendpool::ledger
{

//-------------------------------------------------------------------------

amount_t DepositorLedger::shares(const PrincipalId& principal) const noexcept
{
    if (auto it = m_underlying.find(principal); it != m_underlying.end()) {
        return it->second;
    }
    return {};
}

//-------------------------------------------------------------------------

bool DepositorLedger::contains(const PrincipalId& principal) const noexcept
{
    return m_underlying.contains(principal);
}

//-------------------------------------------------------------------------

amount_t DepositorLedger::totalShares() const
{
    return ranges::accumulate(m_underlying | views::values, amount_t{});
}

//-------------------------------------------------------------------------

void DepositorLedger::credit(const PrincipalId& principal, const amount_t& shares)
{
    if (shares == 0u) return;
    m_underlying[principal] += shares;
}

//-------------------------------------------------------------------------

amount_t DepositorLedger::redeemAll(const PrincipalId& principal) noexcept
{
    auto node = m_underlying.extract(principal);
    return node.empty() ? amount_t{} : node.mapped();
}

//-------------------------------------------------------------------------

void DepositorLedger::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        for (const auto& [principal, shares] : m_underlying) {
            json.AddMember(
                rapidjson::Value{principal.c_str(), allocator},
                json::amount2json(shares, allocator),
                allocator);
        }
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace lendpool::ledger

//-------------------------------------------------------------------------
