/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <stdexcept>
#include <string>

class LedgerInvariantError : public std::runtime_error
{
public:
    LedgerInvariantError(const std::string& message) : std::runtime_error(message) {}
    LedgerInvariantError(const LedgerInvariantError& exception) = default;
    LedgerInvariantError(LedgerInvariantError&& exception) = default;
};
