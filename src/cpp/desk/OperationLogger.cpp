/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "OperationLogger.hpp"

#include <spdlog/sinks/basic_file_sink.h>

//-------------------------------------------------------------------------

namespace lendpool::desk
{

//-------------------------------------------------------------------------

namespace
{

struct CsvRow
{
    Timestamp time;
    std::string_view event;
    PoolId poolId;
    std::string_view principal;
    std::string amount;
    std::string detail;
};

CsvRow toRow(const DepositEvent& item)
{
    return {
        item.time, "deposit", item.poolId, item.principal,
        util::amount2str(item.amount), fmt::format("shares={}", item.shares)
    };
}

CsvRow toRow(const WithdrawEvent& item)
{
    return {
        item.time, "withdraw", item.poolId, item.principal,
        util::amount2str(item.amount), fmt::format("shares={}", item.shares)
    };
}

CsvRow toRow(const BorrowEvent& item)
{
    return {
        item.time, "borrow", item.poolId, item.principal,
        util::amount2str(item.borrowedAmount),
        fmt::format(
            "collateral={};repay={};duration={}",
            item.collateralAmount, item.repayAmount, item.duration)
    };
}

CsvRow toRow(const RepayEvent& item)
{
    return {
        item.time, "repay", item.poolId, item.principal,
        util::amount2str(item.amount),
        fmt::format("remaining={};released={}", item.remaining, item.collateralReleased)
    };
}

CsvRow toRow(const LiquidateEvent& item)
{
    return {
        item.time, "liquidate", item.poolId, item.liquidator,
        util::amount2str(item.payAmount),
        fmt::format(
            "borrower={};collateral={};shortfall={}",
            item.borrower, item.collateralAmount, item.reserveShortfall)
    };
}

CsvRow toRow(const ReserveWithdrawalEvent& item)
{
    return {
        item.time, "reserveWithdrawal", item.poolId, item.principal,
        util::amount2str(item.amount), {}
    };
}

CsvRow toRow(const RejectionEvent& item)
{
    return {
        item.time, "rejection", item.poolId, item.principal,
        {}, fmt::format("{}={}", item.operation, item.ec)
    };
}

}  // namespace

//-------------------------------------------------------------------------

OperationLogger::OperationLogger(
    const fs::path& filepath, decltype(LendingSignals::any)& signal) noexcept
    : m_filepath{filepath}
{
    m_logger = std::make_unique<spdlog::logger>(
        "OperationLogger", std::make_unique<spdlog::sinks::basic_file_sink_st>(m_filepath));
    m_logger->set_level(spdlog::level::trace);
    m_logger->set_pattern("%v");

    m_feed = signal.connect([this](const LendingEvent& event) { log(event); });

    m_logger->trace("time,event,pool,principal,amount,detail");
    m_logger->flush();
}

//-------------------------------------------------------------------------

void OperationLogger::log(const LendingEvent& event) const
{
    const auto row = std::visit([](const auto& item) { return toRow(item); }, event.item);
    m_logger->trace(
        "{},{},{},{},{},{}",
        row.time, row.event, row.poolId, row.principal, row.amount, row.detail);
    m_logger->flush();
}

//-------------------------------------------------------------------------

}  // namespace lendpool::desk

//-------------------------------------------------------------------------
