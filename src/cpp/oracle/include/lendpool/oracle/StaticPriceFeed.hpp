/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "lendpool/oracle/IPriceFeed.hpp"

#include <pugixml.hpp>

#include <optional>
#include <utility>

//-------------------------------------------------------------------------

namespace lendpool::oracle
{

//-------------------------------------------------------------------------

class StaticPriceFeed : public IPriceFeed
{
public:
    StaticPriceFeed() noexcept = default;
    explicit StaticPriceFeed(amount_t rate) noexcept : m_rate{std::move(rate)} {}

    [[nodiscard]] virtual std::expected<amount_t, OracleError> currentRate() const override;

    void setRate(amount_t rate) noexcept { m_rate = std::move(rate); }
    // Subsequent reads fail until a new rate is set.
    void invalidate() noexcept { m_rate.reset(); }

    [[nodiscard]] static StaticPriceFeed fromXML(pugi::xml_node node);

private:
    std::optional<amount_t> m_rate;
};

//-------------------------------------------------------------------------

}  // namespace lendpool::oracle

//-------------------------------------------------------------------------
