/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendpool/accounting/PoolParameters.hpp"

#include <limits>
#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace lendpool::accounting
{

//-------------------------------------------------------------------------

PoolParameters PoolParameters::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const auto orientation = [&] {
        const std::string_view name = node.attribute("orientation").as_string();
        const auto parsed = magic_enum::enum_cast<Orientation>(name);
        if (!parsed.has_value()) {
            throw std::invalid_argument{fmt::format(
                "{}: Unknown orientation '{}', expected one of {}",
                ctx, name, fmt::join(magic_enum::enum_names<Orientation>(), ", "))};
        }
        return parsed.value();
    }();

    auto readPercent = [&](const char* name) -> uint8_t {
        const auto attr = node.attribute(name);
        if (attr.empty()) {
            throw std::invalid_argument{fmt::format("{}: Missing attribute '{}'", ctx, name)};
        }
        const uint32_t value = attr.as_uint();
        if (value > std::numeric_limits<uint8_t>::max()) {
            throw std::invalid_argument{fmt::format(
                "{}: '{}' should be in [0,255], was {}", ctx, name, value)};
        }
        return static_cast<uint8_t>(value);
    };

    return {
        .orientation = orientation,
        .interestRate = readPercent("interestRate"),
        .reserveFeeRate = readPercent("reserveFeeRate"),
        .collateralFactor = readPercent("collateralFactor")
    };
}

//-------------------------------------------------------------------------

}  // namespace lendpool::accounting

//-------------------------------------------------------------------------
