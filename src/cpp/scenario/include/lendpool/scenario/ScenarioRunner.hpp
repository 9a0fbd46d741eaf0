/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"
#include "lendpool/custody/InMemoryCustody.hpp"
#include "lendpool/desk/LendingDesk.hpp"
#include "lendpool/oracle/StaticPriceFeed.hpp"

#include <variant>

//-------------------------------------------------------------------------

namespace lendpool::desk
{
class OperationLogger;
}  // namespace lendpool::desk

//-------------------------------------------------------------------------

namespace lendpool::scenario
{

//-------------------------------------------------------------------------

struct DepositStep
{
    PoolId poolId;
    amount_t amount;
};

struct WithdrawStep
{
    PoolId poolId;
};

struct BorrowStep
{
    PoolId poolId;
    amount_t collateralAmount;
    Timestamp duration;
};

struct RepayStep
{
    PoolId poolId;
    amount_t amount;
};

struct LiquidateStep
{
    PoolId poolId;
    PrincipalId borrower;
};

// An empty rate makes the feed unavailable.
struct SetRateStep
{
    std::optional<amount_t> rate;
};

struct WithdrawReserveStep
{
    PoolId poolId;
    amount_t amount;
};

using StepAction = std::variant<
    DepositStep,
    WithdrawStep,
    BorrowStep,
    RepayStep,
    LiquidateStep,
    SetRateStep,
    WithdrawReserveStep>;

struct Step
{
    std::string type;
    desk::CallContext ctx;
    StepAction action;

    [[nodiscard]] static Step fromXML(pugi::xml_node node);
};

struct StepOutcome
{
    size_t index;
    std::string type;
    desk::CallContext ctx;
    desk::LendingResult<std::string> result;
};

//-------------------------------------------------------------------------

/**
 * Replays a scripted sequence of desk operations read from a <Scenario> document:
 *
 *   <Scenario>
 *     <Market owner="..." decimalsA="..." decimalsB="..." rateDecimals="...">
 *       <Pool id="..." orientation="..." .../>
 *     </Market>
 *     <Balances><Balance principal="..." asset="A|B" amount="..."/></Balances>
 *     <Oracle rate="..."/>
 *     <Steps><Step type="deposit" caller="..." time="..." pool="..." amount="..."/></Steps>
 *   </Scenario>
 */
class ScenarioRunner : public JsonSerializable
{
public:
    ScenarioRunner(
        const desk::MarketConfig& config,
        std::unique_ptr<custody::InMemoryCustody> custody,
        oracle::StaticPriceFeed feed,
        std::vector<Step> steps);
    ~ScenarioRunner() noexcept;

    ScenarioRunner(const ScenarioRunner&) = delete;
    ScenarioRunner& operator=(const ScenarioRunner&) = delete;

    [[nodiscard]] desk::LendingDesk& desk() noexcept { return m_desk; }
    [[nodiscard]] custody::InMemoryCustody& custody() noexcept { return *m_custody; }
    [[nodiscard]] oracle::StaticPriceFeed& feed() noexcept { return m_feed; }
    [[nodiscard]] const std::vector<Step>& steps() const noexcept { return m_steps; }

    void attachOperationLogger(const fs::path& filepath);

    std::vector<StepOutcome> run();

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static std::unique_ptr<ScenarioRunner> fromXML(pugi::xml_node node);
    [[nodiscard]] static std::unique_ptr<ScenarioRunner> fromFile(const fs::path& path);

private:
    [[nodiscard]] desk::LendingResult<std::string> execute(const Step& step);

    std::unique_ptr<custody::InMemoryCustody> m_custody;
    oracle::StaticPriceFeed m_feed;
    desk::LendingDesk m_desk;
    std::vector<Step> m_steps;
    std::unique_ptr<desk::OperationLogger> m_operationLogger;
};

//-------------------------------------------------------------------------

}  // namespace lendpool::scenario

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<lendpool::scenario::StepOutcome>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const lendpool::scenario::StepOutcome& outcome, FormatContext& ctx) const
    {
        if (outcome.result.has_value()) {
            return fmt::format_to(
                ctx.out(),
                "#{} [{}] {} by '{}': {}",
                outcome.index,
                outcome.ctx.now,
                outcome.type,
                outcome.ctx.caller,
                outcome.result.value());
        }
        return fmt::format_to(
            ctx.out(),
            "#{} [{}] {} by '{}' failed: {}",
            outcome.index,
            outcome.ctx.now,
            outcome.type,
            outcome.ctx.caller,
            outcome.result.error());
    }
};

//-------------------------------------------------------------------------
