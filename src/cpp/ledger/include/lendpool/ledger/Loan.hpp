/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

namespace lendpool::ledger
{

//-------------------------------------------------------------------------

struct LoanDesc
{
    amount_t collateralAmount{};
    amount_t borrowedAmount{};
    amount_t repayAmount{};
    amount_t interestAmount{};
    amount_t feeAmount{};
    Timestamp startTime{};
    Timestamp duration{};
};

//-------------------------------------------------------------------------

class Loan : public JsonSerializable
{
public:
    Loan() noexcept = default;
    explicit Loan(const LoanDesc& desc) noexcept;

    [[nodiscard]] const amount_t& collateralAmount() const noexcept { return m.collateralAmount; }
    [[nodiscard]] const amount_t& borrowedAmount() const noexcept { return m.borrowedAmount; }
    [[nodiscard]] const amount_t& repayAmount() const noexcept { return m.repayAmount; }
    [[nodiscard]] const amount_t& interestAmount() const noexcept { return m.interestAmount; }
    [[nodiscard]] const amount_t& feeAmount() const noexcept { return m.feeAmount; }
    [[nodiscard]] Timestamp startTime() const noexcept { return m.startTime; }
    [[nodiscard]] Timestamp duration() const noexcept { return m.duration; }

    [[nodiscard]] bool isActive() const noexcept { return m.collateralAmount > 0u; }
    [[nodiscard]] bool isClosed() const noexcept;
    [[nodiscard]] Timestamp maturity() const noexcept { return m.startTime + m.duration; }
    [[nodiscard]] bool isLiquidatable(Timestamp now) const noexcept;

    /**
     * Applies a repayment of at most repayAmount(). Returns the collateral to
     * release, which is non-zero only for the repayment that clears the debt;
     * the loan is reset at that point.
     */
    amount_t repay(const amount_t& amount);

    /**
     * Resets the loan and returns the collateral held.
     */
    amount_t liquidate() noexcept;

    [[nodiscard]] bool operator==(const Loan& other) const noexcept;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

private:
    LoanDesc m;
};

//-------------------------------------------------------------------------

}  // namespace lendpool::ledger

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lendpool::ledger::Loan>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const lendpool::ledger::Loan& loan, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "Loan{{.collateral = {}, .borrowed = {}, .repay = {}, .interest = {}, "
            ".fee = {}, .start = {}, .duration = {}}}",
            loan.collateralAmount(),
            loan.borrowedAmount(),
            loan.repayAmount(),
            loan.interestAmount(),
            loan.feeAmount(),
            loan.startTime(),
            loan.duration());
    }
};

//-------------------------------------------------------------------------
