/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendpool/oracle/PriceOracleAdapter.hpp"

//-------------------------------------------------------------------------

namespace lendpool::oracle
{

//-------------------------------------------------------------------------

PriceOracleAdapter::PriceOracleAdapter(const IPriceFeed* feed) noexcept
    : m_feed{feed}
{}

//-------------------------------------------------------------------------

std::expected<amount_t, OracleError> PriceOracleAdapter::readRate() const
{
    if (m_feed == nullptr) {
        return std::unexpected{OracleError::STALE_OR_UNAVAILABLE};
    }
    auto rate = m_feed->currentRate();
    if (rate.has_value() && rate.value() == 0u) {
        return std::unexpected{OracleError::STALE_OR_UNAVAILABLE};
    }
    return rate;
}

//-------------------------------------------------------------------------

}  // namespace lendpool::oracle

//-------------------------------------------------------------------------
