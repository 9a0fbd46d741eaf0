/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendpool/custody/ICustody.hpp"

//-------------------------------------------------------------------------

namespace lendpool::custody
{

//-------------------------------------------------------------------------

/**
 * Records the transfers of one operation. Unless commit() is called, the
 * destructor reverses them in reverse order.
 */
class TransferJournal
{
public:
    explicit TransferJournal(ICustody* custody) noexcept;
    ~TransferJournal() noexcept;

    TransferJournal(const TransferJournal&) = delete;
    TransferJournal& operator=(const TransferJournal&) = delete;

    [[nodiscard]] std::expected<void, TransferError> pullIn(
        accounting::AssetKind asset, const PrincipalId& from, const amount_t& amount);
    [[nodiscard]] std::expected<void, TransferError> pushOut(
        accounting::AssetKind asset, const PrincipalId& to, const amount_t& amount);

    void commit() noexcept { m_committed = true; }

    [[nodiscard]] size_t size() const noexcept { return m_entries.size(); }

private:
    struct Entry
    {
        accounting::AssetKind asset;
        PrincipalId principal;
        amount_t amount;
        bool incoming;
    };

    void rollback() noexcept;

    ICustody* m_custody;
    std::vector<Entry> m_entries;
    bool m_committed{};
};

//-------------------------------------------------------------------------

}  // namespace lendpool::custody

//-------------------------------------------------------------------------
