/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendpool/oracle/IPriceFeed.hpp"

//-------------------------------------------------------------------------

namespace lendpool::oracle
{

//-------------------------------------------------------------------------

/**
 * Consumption side of the price feed. A zero rate is reported as unavailable,
 * since no collateral can be valued against it.
 */
class PriceOracleAdapter
{
public:
    explicit PriceOracleAdapter(const IPriceFeed* feed) noexcept;

    [[nodiscard]] std::expected<amount_t, OracleError> readRate() const;

private:
    const IPriceFeed* m_feed;
};

//-------------------------------------------------------------------------

}  // namespace lendpool::oracle

//-------------------------------------------------------------------------
