/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "lendpool/desk/LendingSignals.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace lendpool::desk
{

//-------------------------------------------------------------------------

class OperationLogger
{
public:
    OperationLogger(const fs::path& filepath, decltype(LendingSignals::any)& signal) noexcept;

    [[nodiscard]] const fs::path& filepath() const noexcept { return m_filepath; }

    void log(const LendingEvent& event) const;

private:
    std::unique_ptr<spdlog::logger> m_logger;
    fs::path m_filepath;
    bs2::scoped_connection m_feed;
};

//-------------------------------------------------------------------------

}  // namespace lendpool::desk

//-------------------------------------------------------------------------
