/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "lendpool/accounting/common.hpp"

#include <expected>

//-------------------------------------------------------------------------

namespace lendpool::custody
{

//-------------------------------------------------------------------------

enum class TransferError : uint32_t
{
    INSUFFICIENT_FUNDS,
    REJECTED
};

//-------------------------------------------------------------------------

/**
 * Moves assets between principals and the pool vault. Transfers run foreign
 * code and are suspension points for the caller.
 */
class ICustody
{
public:
    virtual ~ICustody() = default;

    [[nodiscard]] virtual amount_t balanceOf(
        accounting::AssetKind asset, const PrincipalId& principal) const = 0;

    [[nodiscard]] virtual std::expected<void, TransferError> transferIn(
        accounting::AssetKind asset, const PrincipalId& from, const amount_t& amount) = 0;

    [[nodiscard]] virtual std::expected<void, TransferError> transferOut(
        accounting::AssetKind asset, const PrincipalId& to, const amount_t& amount) = 0;

protected:
    ICustody() = default;
};

//-------------------------------------------------------------------------

}  // namespace lendpool::custody

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lendpool::custody::TransferError>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(lendpool::custody::TransferError ec, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(ec));
    }
};

//-------------------------------------------------------------------------
