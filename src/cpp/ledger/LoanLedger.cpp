/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendpool/ledger/LoanLedger.hpp"

//-------------------------------------------------------------------------

namespace lendpool::ledger
{

//-------------------------------------------------------------------------

Loan LoanLedger::get(const PrincipalId& principal) const noexcept
{
    if (auto it = m_underlying.find(principal); it != m_underlying.end()) {
        return it->second;
    }
    return {};
}

//-------------------------------------------------------------------------

std::optional<std::reference_wrapper<const Loan>> LoanLedger::find(
    const PrincipalId& principal) const noexcept
{
    if (auto it = m_underlying.find(principal); it != m_underlying.end()) {
        return std::cref(it->second);
    }
    return std::nullopt;
}

//-------------------------------------------------------------------------

amount_t LoanLedger::totalRepayAmount() const
{
    return ranges::accumulate(
        m_underlying | views::values | views::transform(&Loan::repayAmount), amount_t{});
}

//-------------------------------------------------------------------------

void LoanLedger::put(const PrincipalId& principal, Loan loan)
{
    if (loan.isClosed()) {
        m_underlying.erase(principal);
        return;
    }
    m_underlying.insert_or_assign(principal, std::move(loan));
}

//-------------------------------------------------------------------------

void LoanLedger::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        for (const auto& [principal, loan] : m_underlying) {
            loan.jsonSerialize(json, principal);
        }
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace lendpool::ledger

//-------------------------------------------------------------------------
