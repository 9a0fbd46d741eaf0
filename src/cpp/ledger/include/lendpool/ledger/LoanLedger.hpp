/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"
#include "lendpool/ledger/Loan.hpp"

//-------------------------------------------------------------------------

namespace lendpool::ledger
{

//-------------------------------------------------------------------------

class LoanLedger : public JsonSerializable
{
public:
    using ContainerType = std::map<PrincipalId, Loan>;

    // A principal without a record holds an empty (closed) loan.
    [[nodiscard]] Loan get(const PrincipalId& principal) const noexcept;
    [[nodiscard]] std::optional<std::reference_wrapper<const Loan>> find(
        const PrincipalId& principal) const noexcept;
    [[nodiscard]] size_t size() const noexcept { return m_underlying.size(); }
    [[nodiscard]] amount_t totalRepayAmount() const;
    [[nodiscard]] const ContainerType& loans() const noexcept { return m_underlying; }

    // Stores the loan; closed loans are dropped.
    void put(const PrincipalId& principal, Loan loan);

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    ContainerType m_underlying;
};

//-------------------------------------------------------------------------

}  // namespace lendpool::ledger

//-------------------------------------------------------------------------
