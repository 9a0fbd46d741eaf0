/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendpool/custody/TransferJournal.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace lendpool::custody
{

//-------------------------------------------------------------------------

TransferJournal::TransferJournal(ICustody* custody) noexcept
    : m_custody{custody}
{}

//-------------------------------------------------------------------------

TransferJournal::~TransferJournal() noexcept
{
    if (!m_committed) {
        rollback();
    }
}

//-------------------------------------------------------------------------

std::expected<void, TransferError> TransferJournal::pullIn(
    accounting::AssetKind asset, const PrincipalId& from, const amount_t& amount)
{
    if (amount == 0u) return {};
    auto result = m_custody->transferIn(asset, from, amount);
    if (result.has_value()) {
        m_entries.push_back({
            .asset = asset, .principal = from, .amount = amount, .incoming = true});
    }
    return result;
}

//-------------------------------------------------------------------------

std::expected<void, TransferError> TransferJournal::pushOut(
    accounting::AssetKind asset, const PrincipalId& to, const amount_t& amount)
{
    if (amount == 0u) return {};
    auto result = m_custody->transferOut(asset, to, amount);
    if (result.has_value()) {
        m_entries.push_back({
            .asset = asset, .principal = to, .amount = amount, .incoming = false});
    }
    return result;
}

//-------------------------------------------------------------------------

void TransferJournal::rollback() noexcept
{
    for (const auto& entry : m_entries | views::reverse) {
        const auto result = entry.incoming
            ? m_custody->transferOut(entry.asset, entry.principal, entry.amount)
            : m_custody->transferIn(entry.asset, entry.principal, entry.amount);
        if (!result.has_value()) {
            spdlog::critical(
                "Unable to reverse {} transfer of {} {} for '{}': {}",
                entry.incoming ? "incoming" : "outgoing",
                entry.amount, entry.asset, entry.principal, result.error());
        }
    }
    m_entries.clear();
}

//-------------------------------------------------------------------------

}  // namespace lendpool::custody

//-------------------------------------------------------------------------
