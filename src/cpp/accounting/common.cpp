/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendpool/accounting/common.hpp"

#include <stdexcept>

//-------------------------------------------------------------------------

namespace lendpool::accounting
{

uint32_t validateDecimalPlaces(
    uint32_t decimalPlaces, uint32_t maxDecimalPlaces, std::source_location sl)
{
    if (decimalPlaces > maxDecimalPlaces) {
        throw std::invalid_argument{fmt::format(
            "{}: decimalPlaces should be <= {}, was {}",
            sl.function_name(), maxDecimalPlaces, decimalPlaces)};
    }
    return decimalPlaces;
}

}  // namespace lendpool::accounting

//-------------------------------------------------------------------------
