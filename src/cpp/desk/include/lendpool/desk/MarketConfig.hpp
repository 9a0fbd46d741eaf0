/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "lendpool/accounting/common.hpp"

#include <pugixml.hpp>

//-------------------------------------------------------------------------

namespace lendpool::desk
{

struct MarketConfig
{
    PrincipalId owner;
    accounting::ScaleParams scales;
};

[[nodiscard]] MarketConfig makeMarketConfig(pugi::xml_node node);

}  // namespace lendpool::desk

//-------------------------------------------------------------------------
