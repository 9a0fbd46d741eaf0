/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "LedgerInvariantError.hpp"
#include "Timestamp.hpp"
#include "lendpool/amount/amount.hpp"

#include <boost/signals2.hpp>
#include <fmt/core.h>
#include <fmt/format.h>
#include <magic_enum.hpp>
#include <pugixml.hpp>
#include <range/v3/all.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

namespace bs2 = boost::signals2;
namespace views = ranges::views;

using namespace lendpool::literals;

//-------------------------------------------------------------------------

using PoolId = uint32_t;
using PrincipalId = std::string;

template<typename SlotType>
requires requires { typename std::function<SlotType>; }
using UnsyncSignal = bs2::signal_type<SlotType, bs2::keywords::mutex_type<bs2::dummy_mutex>>::type;

//-------------------------------------------------------------------------
