/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendpool/scenario/ScenarioRunner.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fstream>

//-------------------------------------------------------------------------

using namespace lendpool;
using namespace lendpool::accounting;
using namespace lendpool::desk;
using namespace lendpool::literals;
using namespace lendpool::scenario;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

const auto kTestDataPath = fs::path{__FILE__}.parent_path().parent_path() / "data";

pugi::xml_node parse(pugi::xml_document& doc, const char* xml)
{
    const auto result = doc.load_string(xml);
    if (!result) {
        throw std::runtime_error{result.description()};
    }
    return doc.first_child();
}

}  // namespace

//-------------------------------------------------------------------------

class ScenarioRunnerTest : public Test
{
protected:
    virtual void SetUp() override
    {
        runner = ScenarioRunner::fromFile(kTestDataPath / "Scenario.xml");
    }

    std::unique_ptr<ScenarioRunner> runner;
};

//-------------------------------------------------------------------------

TEST_F(ScenarioRunnerTest, LoadsMarketAndSteps)
{
    EXPECT_EQ(runner->desk().config().owner, "owner");
    EXPECT_EQ(runner->desk().registry().size(), 2u);
    EXPECT_EQ(
        runner->desk().pool(1)->parameters().orientation, Orientation::AssetBAsCollateral);
    EXPECT_EQ(runner->steps().size(), 15u);
    EXPECT_EQ(runner->custody().balanceOf(AssetKind::A, "dave"), 1'000'000_amt);
    EXPECT_EQ(runner->feed().currentRate().value(), 2'0000'0000_amt);
}

TEST_F(ScenarioRunnerTest, RunsEveryStep)
{
    const auto outcomes = runner->run();
    ASSERT_EQ(outcomes.size(), 15u);

    const std::map<size_t, LendingErrorCode> failures{
        {4, LendingErrorCode::UNAVAILABLE},
        {10, LendingErrorCode::ORACLE_UNAVAILABLE},
        {14, LendingErrorCode::UNAUTHORIZED}
    };
    for (const auto& outcome : outcomes) {
        if (const auto it = failures.find(outcome.index); it != failures.end()) {
            ASSERT_FALSE(outcome.result.has_value()) << fmt::format("{}", outcome);
            EXPECT_EQ(outcome.result.error(), it->second);
        } else {
            EXPECT_TRUE(outcome.result.has_value()) << fmt::format("{}", outcome);
        }
    }

    EXPECT_EQ(
        fmt::format("{}", outcomes[0]),
        "#0 [0] deposit by 'alice': deposited 1000 into pool #0, minted 1000 shares");
    EXPECT_EQ(
        fmt::format("{}", outcomes[4]), "#4 [40] withdraw by 'carol' failed: UNAVAILABLE");

    auto& custody = runner->custody();
    EXPECT_EQ(custody.balanceOf(AssetKind::B, "alice"), 1'000_amt);
    EXPECT_EQ(custody.balanceOf(AssetKind::B, "carol"), 1'000_amt);
    EXPECT_EQ(custody.balanceOf(AssetKind::A, "bob"), 500_amt);
    EXPECT_EQ(custody.balanceOf(AssetKind::B, "bob"), 0_amt);
    EXPECT_EQ(custody.balanceOf(AssetKind::A, "erin"), 400'000_amt);
    EXPECT_EQ(custody.balanceOf(AssetKind::A, "frank"), 25'000_amt);
    EXPECT_EQ(custody.balanceOf(AssetKind::B, "frank"), 1'000'000_amt);
    EXPECT_EQ(custody.balanceOf(AssetKind::A, "owner"), 75'000_amt);

    const auto& pool = *runner->desk().pool(1);
    EXPECT_EQ(pool.totalBorrowAmount(), 0_amt);
    EXPECT_EQ(pool.totalReserveAmount(), 0_amt);
    EXPECT_EQ(pool.currentBalanceAmount(), 1'000'000_amt);
    EXPECT_EQ(runner->desk().withdrawQuote(1, "dave").value(), 1'000'000_amt);
    EXPECT_EQ(runner->desk().pool(0)->totalLiquidity(), 0_amt);
}

TEST_F(ScenarioRunnerTest, OperationLogCoversEveryEvent)
{
    const auto filepath = fs::temp_directory_path() / "ScenarioRunnerTest.csv";
    fs::remove(filepath);
    runner->attachOperationLogger(filepath);
    std::ignore = runner->run();

    std::ifstream ifs{filepath};
    std::vector<std::string> lines;
    for (std::string line; std::getline(ifs, line);) {
        lines.push_back(line);
    }
    ASSERT_EQ(lines.size(), 14u);
    EXPECT_EQ(lines.front(), "time,event,pool,principal,amount,detail");
    EXPECT_EQ(lines.back(), "150,rejection,1,erin,,withdrawReserve=UNAUTHORIZED");
    fs::remove(filepath);
}

TEST_F(ScenarioRunnerTest, SerializesDeskAndCustody)
{
    std::ignore = runner->run();

    rapidjson::Document json;
    runner->jsonSerialize(json);
    ASSERT_TRUE(json.IsObject());
    ASSERT_TRUE(json.HasMember("desk"));
    ASSERT_TRUE(json.HasMember("custody"));
    EXPECT_EQ(json["desk"]["eventCount"].GetUint64(), 13u);
    EXPECT_TRUE(json["desk"]["pools"].HasMember("1"));
}

//-------------------------------------------------------------------------

TEST(StepTest, ParsesEachType)
{
    pugi::xml_document doc;

    const auto borrow = Step::fromXML(parse(
        doc, R"(<Step type="borrow" caller="bob" time="5" pool="3" collateral="42" duration="7"/>)"));
    EXPECT_EQ(borrow.type, "borrow");
    EXPECT_EQ(borrow.ctx.caller, "bob");
    EXPECT_EQ(borrow.ctx.now, 5u);
    const auto& action = std::get<BorrowStep>(borrow.action);
    EXPECT_EQ(action.poolId, 3u);
    EXPECT_EQ(action.collateralAmount, 42_amt);
    EXPECT_EQ(action.duration, 7u);

    const auto liquidate = Step::fromXML(parse(
        doc, R"(<Step type="liquidate" caller="carol" pool="1" borrower="bob"/>)"));
    EXPECT_EQ(std::get<LiquidateStep>(liquidate.action).borrower, "bob");

    const auto invalidate = Step::fromXML(parse(doc, R"(<Step type="setRate"/>)"));
    EXPECT_FALSE(std::get<SetRateStep>(invalidate.action).rate.has_value());
}

TEST(StepTest, RejectsMalformedSteps)
{
    pugi::xml_document doc;

    EXPECT_THROW(
        std::ignore = Step::fromXML(parse(doc, R"(<Step type="lend" caller="bob"/>)")),
        std::invalid_argument);
    EXPECT_THROW(
        std::ignore = Step::fromXML(parse(doc, R"(<Step type="deposit" pool="0" amount="1"/>)")),
        std::invalid_argument);
    EXPECT_THROW(
        std::ignore = Step::fromXML(parse(doc, R"(<Step type="deposit" caller="bob" pool="0"/>)")),
        std::invalid_argument);
    EXPECT_THROW(
        std::ignore = Step::fromXML(parse(doc, R"(<Step type="liquidate" caller="bob" pool="0"/>)")),
        std::invalid_argument);
}

TEST(ScenarioRunnerXmlTest, RejectsInvalidScenarios)
{
    pugi::xml_document doc;

    EXPECT_THROW(
        std::ignore = ScenarioRunner::fromXML(parse(doc, "<Scenario/>")),
        std::invalid_argument);
    EXPECT_THROW(
        std::ignore = ScenarioRunner::fromXML(parse(doc, R"(
            <Scenario>
              <Market owner="owner" decimalsA="8" decimalsB="8" rateDecimals="8">
                <Pool id="0" orientation="AssetAAsCollateral" interestRate="1" reserveFeeRate="0" collateralFactor="50"/>
                <Pool id="0" orientation="AssetBAsCollateral" interestRate="1" reserveFeeRate="0" collateralFactor="50"/>
              </Market>
            </Scenario>)")),
        std::invalid_argument);
    EXPECT_THROW(
        std::ignore = ScenarioRunner::fromFile(kTestDataPath / "missing.xml"),
        std::invalid_argument);
}

//-------------------------------------------------------------------------
