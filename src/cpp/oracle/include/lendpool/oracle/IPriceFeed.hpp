/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendpool/amount/amount.hpp"

#include <cstdint>
#include <expected>

//-------------------------------------------------------------------------

namespace lendpool::oracle
{

//-------------------------------------------------------------------------

enum class OracleError : uint32_t
{
    STALE_OR_UNAVAILABLE
};

//-------------------------------------------------------------------------

/**
 * External price source. Rates are fixed-point asset-B units per asset-A unit.
 */
class IPriceFeed
{
public:
    virtual ~IPriceFeed() = default;

    [[nodiscard]] virtual std::expected<amount_t, OracleError> currentRate() const = 0;

protected:
    IPriceFeed() = default;
};

//-------------------------------------------------------------------------

}  // namespace lendpool::oracle

//-------------------------------------------------------------------------
