/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

namespace lendpool::ledger
{

//-------------------------------------------------------------------------

class DepositorLedger : public JsonSerializable
{
public:
    using ContainerType = std::map<PrincipalId, amount_t>;

    [[nodiscard]] amount_t shares(const PrincipalId& principal) const noexcept;
    [[nodiscard]] bool contains(const PrincipalId& principal) const noexcept;
    [[nodiscard]] size_t size() const noexcept { return m_underlying.size(); }
    [[nodiscard]] amount_t totalShares() const;
    [[nodiscard]] const ContainerType& balances() const noexcept { return m_underlying; }

    void credit(const PrincipalId& principal, const amount_t& shares);
    // Removes the depositor and returns the shares they held.
    amount_t redeemAll(const PrincipalId& principal) noexcept;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    ContainerType m_underlying;
};

//-------------------------------------------------------------------------

}  // namespace lendpool::ledger

//-------------------------------------------------------------------------
