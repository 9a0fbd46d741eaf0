/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "DeskFixture.hpp"
#include "OperationLogger.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fstream>

//-------------------------------------------------------------------------

using namespace lendpool;
using namespace lendpool::accounting;
using namespace lendpool::desk;
using namespace lendpool::literals;
using namespace lendpool::test;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

std::vector<std::string> readLines(const fs::path& filepath)
{
    std::ifstream ifs{filepath};
    std::vector<std::string> lines;
    for (std::string line; std::getline(ifs, line);) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

//-------------------------------------------------------------------------

class OperationLoggerTest : public DeskFixture
{
protected:
    virtual void SetUp() override
    {
        DeskFixture::SetUp();
        filepath = fs::temp_directory_path()
            / fmt::format("{}.csv", UnitTest::GetInstance()->current_test_info()->name());
        fs::remove(filepath);
    }

    virtual void TearDown() override { fs::remove(filepath); }

    fs::path filepath;
};

//-------------------------------------------------------------------------

TEST_F(OperationLoggerTest, WritesOneRowPerEvent)
{
    fund(AssetKind::B, "alice", 1'000_amt);
    fund(AssetKind::A, "bob", 500_amt);
    {
        OperationLogger logger{filepath, desk->signals().any};
        EXPECT_EQ(logger.filepath(), filepath);

        ASSERT_TRUE(desk->deposit(as("alice", 10), kPoolA, 1'000_amt).has_value());
        ASSERT_TRUE(desk->borrow(as("bob", 20), kPoolA, 500_amt, kDay).has_value());
        ASSERT_FALSE(desk->withdraw(as("alice", 30), kPoolA).has_value());
        ASSERT_TRUE(desk->repay(as("bob", 40), kPoolA, 800_amt).has_value());
    }

    EXPECT_THAT(
        readLines(filepath),
        ElementsAre(
            "time,event,pool,principal,amount,detail",
            "10,deposit,0,alice,1000,shares=1000",
            "20,borrow,0,bob,800,collateral=500;repay=800;duration=86400",
            "30,rejection,0,alice,,withdraw=UNAVAILABLE",
            "40,repay,0,bob,800,remaining=0;released=500"));
}

TEST_F(OperationLoggerTest, StopsLoggingWhenDestroyed)
{
    fund(AssetKind::B, "alice", 2'000_amt);
    {
        OperationLogger logger{filepath, desk->signals().any};
        ASSERT_TRUE(desk->deposit(as("alice"), kPoolA, 1'000_amt).has_value());
    }
    ASSERT_TRUE(desk->deposit(as("alice"), kPoolA, 1'000_amt).has_value());

    EXPECT_EQ(readLines(filepath).size(), 2u);
}

//-------------------------------------------------------------------------
