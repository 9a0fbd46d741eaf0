/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendpool/custody/InMemoryCustody.hpp"

//-------------------------------------------------------------------------

namespace lendpool::custody
{

//-------------------------------------------------------------------------

amount_t InMemoryCustody::balanceOf(
    accounting::AssetKind asset, const PrincipalId& principal) const
{
    if (auto it = m_balances.find({asset, principal}); it != m_balances.end()) {
        return it->second;
    }
    return {};
}

//-------------------------------------------------------------------------

std::expected<void, TransferError> InMemoryCustody::transferIn(
    accounting::AssetKind asset, const PrincipalId& from, const amount_t& amount)
{
    auto it = m_balances.find({asset, from});
    if (it == m_balances.end() || it->second < amount) {
        return std::unexpected{TransferError::INSUFFICIENT_FUNDS};
    }
    if (util::sumOverflows(vaultBalance(asset), amount)) {
        return std::unexpected{TransferError::REJECTED};
    }
    it->second -= amount;
    if (it->second == 0u) {
        m_balances.erase(it);
    }
    m_vault[asset] += amount;
    m_transferred(TransferEvent{
        .asset = asset,
        .principal = from,
        .amount = amount,
        .direction = TransferDirection::IN
    });
    return {};
}

//-------------------------------------------------------------------------

std::expected<void, TransferError> InMemoryCustody::transferOut(
    accounting::AssetKind asset, const PrincipalId& to, const amount_t& amount)
{
    auto& vault = m_vault[asset];
    if (vault < amount) {
        return std::unexpected{TransferError::INSUFFICIENT_FUNDS};
    }
    if (util::sumOverflows(balanceOf(asset, to), amount)) {
        return std::unexpected{TransferError::REJECTED};
    }
    vault -= amount;
    m_balances[{asset, to}] += amount;
    m_transferred(TransferEvent{
        .asset = asset,
        .principal = to,
        .amount = amount,
        .direction = TransferDirection::OUT
    });
    return {};
}

//-------------------------------------------------------------------------

amount_t InMemoryCustody::vaultBalance(accounting::AssetKind asset) const noexcept
{
    if (auto it = m_vault.find(asset); it != m_vault.end()) {
        return it->second;
    }
    return {};
}

//-------------------------------------------------------------------------

void InMemoryCustody::mint(
    accounting::AssetKind asset, const PrincipalId& principal, const amount_t& amount)
{
    if (amount == 0u) return;
    m_balances[{asset, principal}] += amount;
}

//-------------------------------------------------------------------------

void InMemoryCustody::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        rapidjson::Value balances{rapidjson::kArrayType};
        for (const auto& [assetAndPrincipal, amount] : m_balances) {
            const auto& [asset, principal] = assetAndPrincipal;
            const auto assetName = magic_enum::enum_name(asset);
            rapidjson::Value entry{rapidjson::kObjectType};
            entry.AddMember("principal", rapidjson::Value{principal.c_str(), allocator}, allocator);
            entry.AddMember(
                "asset",
                rapidjson::Value{
                    assetName.data(), static_cast<rapidjson::SizeType>(assetName.size()), allocator},
                allocator);
            entry.AddMember("amount", json::amount2json(amount, allocator), allocator);
            balances.PushBack(entry, allocator);
        }
        json.AddMember("balances", balances, allocator);
        rapidjson::Value vault{rapidjson::kObjectType};
        for (const auto& [asset, amount] : m_vault) {
            const auto assetName = magic_enum::enum_name(asset);
            vault.AddMember(
                rapidjson::Value{
                    assetName.data(), static_cast<rapidjson::SizeType>(assetName.size()), allocator},
                json::amount2json(amount, allocator),
                allocator);
        }
        json.AddMember("vault", vault, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

std::unique_ptr<InMemoryCustody> InMemoryCustody::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    auto custody = std::make_unique<InMemoryCustody>();
    for (pugi::xml_node balanceNode : node.children("Balance")) {
        const PrincipalId principal = balanceNode.attribute("principal").as_string();
        if (principal.empty()) {
            throw std::invalid_argument{fmt::format("{}: Balance without a principal", ctx)};
        }
        const std::string_view assetName = balanceNode.attribute("asset").as_string();
        const auto asset = magic_enum::enum_cast<accounting::AssetKind>(assetName);
        if (!asset.has_value()) {
            throw std::invalid_argument{fmt::format(
                "{}: Unknown asset '{}' for principal '{}'", ctx, assetName, principal)};
        }
        custody->mint(
            asset.value(),
            principal,
            util::str2amount(balanceNode.attribute("amount").as_string()));
    }
    return custody;
}

//-------------------------------------------------------------------------

}  // namespace lendpool::custody

//-------------------------------------------------------------------------
