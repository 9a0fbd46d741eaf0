/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendpool/oracle/StaticPriceFeed.hpp"

//-------------------------------------------------------------------------

namespace lendpool::oracle
{

//-------------------------------------------------------------------------

std::expected<amount_t, OracleError> StaticPriceFeed::currentRate() const
{
    if (!m_rate.has_value()) {
        return std::unexpected{OracleError::STALE_OR_UNAVAILABLE};
    }
    return m_rate.value();
}

//-------------------------------------------------------------------------

StaticPriceFeed StaticPriceFeed::fromXML(pugi::xml_node node)
{
    if (auto attr = node.attribute("rate"); !attr.empty()) {
        return StaticPriceFeed{util::str2amount(attr.as_string())};
    }
    return StaticPriceFeed{};
}

//-------------------------------------------------------------------------

}  // namespace lendpool::oracle

//-------------------------------------------------------------------------
