/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendpool/desk/ExecutionGuard.hpp"

#include <utility>

//-------------------------------------------------------------------------

namespace lendpool::desk
{

//-------------------------------------------------------------------------

ExecutionGuard::Scope::~Scope() noexcept
{
    if (m_guard != nullptr) {
        m_guard->m_flag.clear(std::memory_order_release);
    }
}

//-------------------------------------------------------------------------

ExecutionGuard::Scope::Scope(Scope&& other) noexcept
    : m_guard{std::exchange(other.m_guard, nullptr)}
{}

//-------------------------------------------------------------------------

std::optional<ExecutionGuard::Scope> ExecutionGuard::tryEnter() noexcept
{
    if (m_flag.test_and_set(std::memory_order_acq_rel)) {
        return std::nullopt;
    }
    return Scope{this};
}

//-------------------------------------------------------------------------

}  // namespace lendpool::desk

//-------------------------------------------------------------------------
