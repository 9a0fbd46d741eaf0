/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "lendpool/custody/ICustody.hpp"

//-------------------------------------------------------------------------

namespace lendpool::custody
{

//-------------------------------------------------------------------------

enum class TransferDirection : uint8_t
{
    IN,
    OUT
};

struct TransferEvent
{
    accounting::AssetKind asset;
    PrincipalId principal;
    amount_t amount;
    TransferDirection direction;
};

//-------------------------------------------------------------------------

class InMemoryCustody : public ICustody, public JsonSerializable
{
public:
    using Key = std::pair<accounting::AssetKind, PrincipalId>;

    [[nodiscard]] virtual amount_t balanceOf(
        accounting::AssetKind asset, const PrincipalId& principal) const override;

    [[nodiscard]] virtual std::expected<void, TransferError> transferIn(
        accounting::AssetKind asset, const PrincipalId& from, const amount_t& amount) override;

    [[nodiscard]] virtual std::expected<void, TransferError> transferOut(
        accounting::AssetKind asset, const PrincipalId& to, const amount_t& amount) override;

    [[nodiscard]] amount_t vaultBalance(accounting::AssetKind asset) const noexcept;

    void mint(accounting::AssetKind asset, const PrincipalId& principal, const amount_t& amount);

    // Fired after every completed transfer, before control returns to the caller.
    [[nodiscard]] UnsyncSignal<void(const TransferEvent&)>& transferred() noexcept
    {
        return m_transferred;
    }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static std::unique_ptr<InMemoryCustody> fromXML(pugi::xml_node node);

private:
    std::map<Key, amount_t> m_balances;
    std::map<accounting::AssetKind, amount_t> m_vault;
    UnsyncSignal<void(const TransferEvent&)> m_transferred;
};

//-------------------------------------------------------------------------

}  // namespace lendpool::custody

//-------------------------------------------------------------------------
