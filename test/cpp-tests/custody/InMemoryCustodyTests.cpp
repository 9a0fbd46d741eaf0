/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "lendpool/custody/InMemoryCustody.hpp"
#include "formatting.hpp"
#include "json_util.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <pugixml.hpp>

//-------------------------------------------------------------------------

using namespace lendpool;
using namespace lendpool::accounting;
using namespace lendpool::custody;
using namespace lendpool::literals;

using namespace testing;

//-------------------------------------------------------------------------

TEST(InMemoryCustodyTests, TransfersMoveBetweenPrincipalAndVault)
{
    InMemoryCustody custody;
    custody.mint(AssetKind::B, "alice", 1'000_amt);

    ASSERT_TRUE(custody.transferIn(AssetKind::B, "alice", 400_amt).has_value());
    EXPECT_EQ(custody.balanceOf(AssetKind::B, "alice"), 600_amt);
    EXPECT_EQ(custody.vaultBalance(AssetKind::B), 400_amt);
    EXPECT_EQ(custody.vaultBalance(AssetKind::A), 0_amt);

    ASSERT_TRUE(custody.transferOut(AssetKind::B, "bob", 150_amt).has_value());
    EXPECT_EQ(custody.balanceOf(AssetKind::B, "bob"), 150_amt);
    EXPECT_EQ(custody.balanceOf(AssetKind::A, "bob"), 0_amt);
    EXPECT_EQ(custody.vaultBalance(AssetKind::B), 250_amt);
}

TEST(InMemoryCustodyTests, InsufficientFundsLeaveBalancesUntouched)
{
    InMemoryCustody custody;
    custody.mint(AssetKind::A, "alice", 10_amt);

    EXPECT_EQ(
        custody.transferIn(AssetKind::A, "alice", 11_amt).error(),
        TransferError::INSUFFICIENT_FUNDS);
    EXPECT_EQ(
        custody.transferIn(AssetKind::A, "nobody", 1_amt).error(),
        TransferError::INSUFFICIENT_FUNDS);
    EXPECT_EQ(
        custody.transferOut(AssetKind::A, "alice", 1_amt).error(),
        TransferError::INSUFFICIENT_FUNDS);

    EXPECT_EQ(custody.balanceOf(AssetKind::A, "alice"), 10_amt);
    EXPECT_EQ(custody.vaultBalance(AssetKind::A), 0_amt);
}

TEST(InMemoryCustodyTests, CreditsPastTheAmountRangeAreRejected)
{
    const amount_t max = std::numeric_limits<amount_t>::max();
    InMemoryCustody custody;
    custody.mint(AssetKind::A, "alice", max);
    custody.mint(AssetKind::A, "bob", 1_amt);

    ASSERT_TRUE(custody.transferIn(AssetKind::A, "alice", max).has_value());
    EXPECT_EQ(
        custody.transferIn(AssetKind::A, "bob", 1_amt).error(),
        TransferError::REJECTED);
    EXPECT_EQ(custody.balanceOf(AssetKind::A, "bob"), 1_amt);

    EXPECT_EQ(
        custody.transferOut(AssetKind::A, "bob", max).error(),
        TransferError::REJECTED);
    EXPECT_EQ(custody.vaultBalance(AssetKind::A), max);
}

TEST(InMemoryCustodyTests, SignalsCompletedTransfers)
{
    InMemoryCustody custody;
    custody.mint(AssetKind::A, "alice", 10_amt);

    MockFunction<void(const TransferEvent&)> callback;
    custody.transferred().connect(callback.AsStdFunction());

    EXPECT_CALL(callback, Call(AllOf(
        Field(&TransferEvent::asset, AssetKind::A),
        Field(&TransferEvent::principal, "alice"),
        Field(&TransferEvent::amount, 10_amt),
        Field(&TransferEvent::direction, TransferDirection::IN))));
    ASSERT_TRUE(custody.transferIn(AssetKind::A, "alice", 10_amt).has_value());

    EXPECT_FALSE(custody.transferOut(AssetKind::B, "alice", 1_amt).has_value());
}

TEST(InMemoryCustodyTests, FromXML)
{
    pugi::xml_document doc;
    ASSERT_TRUE(doc.load_string(
        R"(<Balances>)"
        R"(<Balance principal="alice" asset="B" amount="1000"/>)"
        R"(<Balance principal="bob" asset="A" amount="500"/>)"
        R"(<Balance principal="bob" asset="A" amount="1"/>)"
        R"(</Balances>)"));

    const auto custody = InMemoryCustody::fromXML(doc.child("Balances"));
    EXPECT_EQ(custody->balanceOf(AssetKind::B, "alice"), 1'000_amt);
    EXPECT_EQ(custody->balanceOf(AssetKind::A, "bob"), 501_amt);

    rapidjson::Document json;
    custody->jsonSerialize(json);
    ASSERT_TRUE(json["balances"].IsArray());
    EXPECT_EQ(json["balances"].Size(), 2u);
}

TEST(InMemoryCustodyTests, FromXMLRejectsBadInput)
{
    pugi::xml_document doc;
    ASSERT_TRUE(doc.load_string(
        R"(<UnknownAsset><Balance principal="alice" asset="C" amount="1"/></UnknownAsset>)"
        R"(<NoPrincipal><Balance asset="A" amount="1"/></NoPrincipal>)"
        R"(<BadAmount><Balance principal="alice" asset="A" amount="-1"/></BadAmount>)"));

    EXPECT_THROW((void) InMemoryCustody::fromXML(doc.child("UnknownAsset")), std::invalid_argument);
    EXPECT_THROW((void) InMemoryCustody::fromXML(doc.child("NoPrincipal")), std::invalid_argument);
    EXPECT_THROW((void) InMemoryCustody::fromXML(doc.child("BadAmount")), std::invalid_argument);
}

//-------------------------------------------------------------------------
