/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <atomic>
#include <optional>

//-------------------------------------------------------------------------

namespace lendpool::desk
{

//-------------------------------------------------------------------------

/**
 * Single-flight guard shared by every mutating operation of a desk. Entering
 * while held fails at once instead of waiting.
 */
class ExecutionGuard
{
public:
    class Scope
    {
    public:
        ~Scope() noexcept;

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;
        Scope(Scope&& other) noexcept;
        Scope& operator=(Scope&&) = delete;

    private:
        explicit Scope(ExecutionGuard* guard) noexcept : m_guard{guard} {}

        ExecutionGuard* m_guard;

        friend class ExecutionGuard;
    };

    ExecutionGuard() noexcept = default;
    ExecutionGuard(const ExecutionGuard&) = delete;
    ExecutionGuard& operator=(const ExecutionGuard&) = delete;

    [[nodiscard]] std::optional<Scope> tryEnter() noexcept;
    [[nodiscard]] bool held() const noexcept { return m_flag.test(std::memory_order_acquire); }

private:
    std::atomic_flag m_flag;
};

//-------------------------------------------------------------------------

}  // namespace lendpool::desk

//-------------------------------------------------------------------------
