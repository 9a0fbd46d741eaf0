/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendpool/scenario/ScenarioRunner.hpp"

#include "OperationLogger.hpp"
#include "json_util.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace lendpool::scenario
{

//-------------------------------------------------------------------------

namespace
{

struct StepExecutor
{
    desk::LendingDesk& desk;
    oracle::StaticPriceFeed& feed;
    const desk::CallContext& ctx;

    desk::LendingResult<std::string> operator()(const DepositStep& step) const
    {
        const auto res = desk.deposit(ctx, step.poolId, step.amount);
        if (!res) {
            return std::unexpected{res.error()};
        }
        return fmt::format("deposited {} into pool #{}, minted {} shares",
            step.amount, step.poolId, res->shares);
    }

    desk::LendingResult<std::string> operator()(const WithdrawStep& step) const
    {
        const auto res = desk.withdraw(ctx, step.poolId);
        if (!res) {
            return std::unexpected{res.error()};
        }
        return fmt::format("redeemed {} shares of pool #{} for {}",
            res->shares, step.poolId, res->amount);
    }

    desk::LendingResult<std::string> operator()(const BorrowStep& step) const
    {
        const auto res = desk.borrow(ctx, step.poolId, step.collateralAmount, step.duration);
        if (!res) {
            return std::unexpected{res.error()};
        }
        return fmt::format("borrowed {} from pool #{} against {}, owes {}",
            res->borrowable, step.poolId, step.collateralAmount, res->repayAmount);
    }

    desk::LendingResult<std::string> operator()(const RepayStep& step) const
    {
        const auto res = desk.repay(ctx, step.poolId, step.amount);
        if (!res) {
            return std::unexpected{res.error()};
        }
        return fmt::format("repaid {} to pool #{}, {} remaining, {} collateral released",
            res->repaid, step.poolId, res->remaining, res->collateralReleased);
    }

    desk::LendingResult<std::string> operator()(const LiquidateStep& step) const
    {
        const auto res = desk.liquidate(ctx, step.poolId, step.borrower);
        if (!res) {
            return std::unexpected{res.error()};
        }
        return fmt::format("paid {} to pool #{} for {} collateral of '{}'",
            res->payAmount, step.poolId, res->collateralReleased, step.borrower);
    }

    desk::LendingResult<std::string> operator()(const SetRateStep& step) const
    {
        if (!step.rate.has_value()) {
            feed.invalidate();
            return std::string{"rate unavailable"};
        }
        feed.setRate(*step.rate);
        return fmt::format("rate set to {}", *step.rate);
    }

    desk::LendingResult<std::string> operator()(const WithdrawReserveStep& step) const
    {
        const auto res = desk.withdrawReserve(ctx, step.poolId, step.amount);
        if (!res) {
            return std::unexpected{res.error()};
        }
        return fmt::format("withdrew {} from the reserve of pool #{}", *res, step.poolId);
    }
};

}  // namespace

//-------------------------------------------------------------------------

Step Step::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const std::string type = node.attribute("type").as_string();

    auto requireAttribute = [&](const char* name) {
        const auto attr = node.attribute(name);
        if (attr.empty()) {
            throw std::invalid_argument{fmt::format(
                "{}: Step '{}' is missing attribute '{}'", ctx, type, name)};
        }
        return attr;
    };
    auto poolId = [&] { return static_cast<PoolId>(requireAttribute("pool").as_uint()); };
    auto amount = [&](const char* name) {
        return util::str2amount(requireAttribute(name).as_string());
    };

    const desk::CallContext callCtx{
        .caller = node.attribute("caller").as_string(),
        .now = node.attribute("time").as_ullong()
    };

    if (type == "setRate") {
        const std::string_view rate = node.attribute("rate").as_string();
        return {
            .type = type,
            .ctx = callCtx,
            .action = SetRateStep{
                .rate = rate.empty() ? std::nullopt : std::optional{util::str2amount(rate)}
            }
        };
    }

    if (callCtx.caller.empty()) {
        throw std::invalid_argument{fmt::format("{}: Step '{}' requires a caller", ctx, type)};
    }

    if (type == "deposit") {
        return {type, callCtx, DepositStep{.poolId = poolId(), .amount = amount("amount")}};
    }
    if (type == "withdraw") {
        return {type, callCtx, WithdrawStep{.poolId = poolId()}};
    }
    if (type == "borrow") {
        return {
            type,
            callCtx,
            BorrowStep{
                .poolId = poolId(),
                .collateralAmount = amount("collateral"),
                .duration = requireAttribute("duration").as_ullong()
            }
        };
    }
    if (type == "repay") {
        return {type, callCtx, RepayStep{.poolId = poolId(), .amount = amount("amount")}};
    }
    if (type == "liquidate") {
        const PrincipalId borrower = requireAttribute("borrower").as_string();
        return {type, callCtx, LiquidateStep{.poolId = poolId(), .borrower = borrower}};
    }
    if (type == "withdrawReserve") {
        return {
            type, callCtx, WithdrawReserveStep{.poolId = poolId(), .amount = amount("amount")}
        };
    }

    throw std::invalid_argument{fmt::format("{}: Unknown step type '{}'", ctx, type)};
}

//-------------------------------------------------------------------------

ScenarioRunner::ScenarioRunner(
    const desk::MarketConfig& config,
    std::unique_ptr<custody::InMemoryCustody> custody,
    oracle::StaticPriceFeed feed,
    std::vector<Step> steps)
    : m_custody{std::move(custody)},
      m_feed{std::move(feed)},
      m_desk{config, m_custody.get(), oracle::PriceOracleAdapter{&m_feed}},
      m_steps{std::move(steps)}
{}

//-------------------------------------------------------------------------

ScenarioRunner::~ScenarioRunner() noexcept = default;

//-------------------------------------------------------------------------

void ScenarioRunner::attachOperationLogger(const fs::path& filepath)
{
    m_operationLogger = std::make_unique<desk::OperationLogger>(filepath, m_desk.signals().any);
}

//-------------------------------------------------------------------------

std::vector<StepOutcome> ScenarioRunner::run()
{
    std::vector<StepOutcome> outcomes;
    outcomes.reserve(m_steps.size());

    for (const auto& [index, step] : views::enumerate(m_steps)) {
        outcomes.push_back({
            .index = static_cast<size_t>(index),
            .type = step.type,
            .ctx = step.ctx,
            .result = execute(step)
        });
        spdlog::debug("{}", outcomes.back());
    }

    return outcomes;
}

//-------------------------------------------------------------------------

void ScenarioRunner::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        m_desk.jsonSerialize(json, "desk");
        m_custody->jsonSerialize(json, "custody");
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

std::unique_ptr<ScenarioRunner> ScenarioRunner::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    pugi::xml_node marketNode = node.child("Market");
    if (!marketNode) {
        throw std::invalid_argument{fmt::format("{}: Scenario without a Market", ctx)};
    }
    const auto config = desk::makeMarketConfig(marketNode);

    std::vector<Step> steps;
    for (pugi::xml_node stepNode : node.child("Steps").children("Step")) {
        steps.push_back(Step::fromXML(stepNode));
    }

    auto runner = std::make_unique<ScenarioRunner>(
        config,
        custody::InMemoryCustody::fromXML(node.child("Balances")),
        oracle::StaticPriceFeed::fromXML(node.child("Oracle")),
        std::move(steps));

    const desk::CallContext ownerCtx{.caller = config.owner};
    for (pugi::xml_node poolNode : marketNode.children("Pool")) {
        const auto poolId = static_cast<PoolId>(poolNode.attribute("id").as_uint());
        const auto res = runner->desk().createPool(
            ownerCtx, poolId, accounting::PoolParameters::fromXML(poolNode));
        if (!res) {
            throw std::invalid_argument{fmt::format(
                "{}: Could not create pool #{}: {}", ctx, poolId, res.error())};
        }
    }

    return runner;
}

//-------------------------------------------------------------------------

std::unique_ptr<ScenarioRunner> ScenarioRunner::fromFile(const fs::path& path)
{
    pugi::xml_document doc;
    const pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result) {
        throw std::invalid_argument{fmt::format(
            "{}: Could not parse '{}': {}",
            std::source_location::current().function_name(),
            path.c_str(),
            result.description())};
    }
    spdlog::info("'{}' loaded successfully", path.c_str());
    return fromXML(doc.child("Scenario"));
}

//-------------------------------------------------------------------------

desk::LendingResult<std::string> ScenarioRunner::execute(const Step& step)
{
    return std::visit(
        StepExecutor{.desk = m_desk, .feed = m_feed, .ctx = step.ctx}, step.action);
}

//-------------------------------------------------------------------------

}  // namespace lendpool::scenario

//-------------------------------------------------------------------------
