/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "MockPriceOracle.hpp"
#include "creditsim/accounting/CollateralLogic.hpp"
#include "creditsim/accounting/CreditLogic.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>

//-------------------------------------------------------------------------

using namespace creditsim;
using namespace creditsim::accounting;
using namespace testing;

using numeric::PERCENTAGE_FACTOR;
using numeric::RAY;

//-------------------------------------------------------------------------

namespace
{

inline constexpr Address kUnderlying = 10;
inline constexpr Address kTokenB = 20;
inline constexpr Address kQuoted = 30;
inline constexpr Address kDust = 40;

[[nodiscard]] uint256_t absDiff(const uint256_t& a, const uint256_t& b)
{
    return a > b ? a - b : b - a;
}

[[nodiscard]] uint256_t healthFactor(const CollateralResult& res, const uint256_t& totalDebtUSD)
{
    return numeric::mulDiv(res.twvUSD, PERCENTAGE_FACTOR, totalDebtUSD);
}

}  // namespace

//-------------------------------------------------------------------------

struct CollateralSweepTest : public Test
{
    virtual void SetUp() override
    {
        ON_CALL(oracle, convertToUSD).WillByDefault([this](const uint256_t& amount, Address token) {
            return amount * prices.at(token);
        });
    }

    [[nodiscard]] CollateralSources sources()
    {
        return CollateralSources{
            .collateralTokenByMask = [](const TokenMask& mask) {
                if (mask == 1) return CollateralToken{kUnderlying, 9'000};
                if (mask == 2) return CollateralToken{kTokenB, 8'000};
                if (mask == 4) return CollateralToken{kQuoted, 5'000};
                return CollateralToken{kDust, 7'000};
            },
            .balanceOf = [this](Address token) { return balances.at(token); },
            .quotaOf = [](Address) { return uint256_t{400}; },
            .priceOracle = oracle
        };
    }

    [[nodiscard]] CollateralCalcParams params() const
    {
        return CollateralCalcParams{
            .creditAccount = 1'000,
            .enabledTokensMask = TokenMask{0b1111},
            .quotedTokensMask = TokenMask{0b0100},
            .underlying = kUnderlying
        };
    }

    NiceMock<test::MockPriceOracle> oracle;
    std::map<Address, uint256_t> prices{
        {kUnderlying, 1},
        {kTokenB, 1},
        {kQuoted, 1},
        {kDust, 1}
    };
    std::map<Address, uint256_t> balances{
        {kUnderlying, 1'000},
        {kTokenB, 500},
        {kQuoted, 1'000},
        {kDust, 1}
    };
};

//-------------------------------------------------------------------------

TEST_F(CollateralSweepTest, HealthFactorNeverFallsWhenPricesRise)
{
    for (Address token : {kTokenB, kQuoted}) {
        SCOPED_TRACE(fmt::format("token {}", token));
        prices = {{kUnderlying, 1}, {kTokenB, 1}, {kQuoted, 1}, {kDust, 1}};

        uint256_t lastHealthFactor{};
        uint256_t lastTotalValue{};
        for (uint64_t price : {0, 1, 2, 3, 7, 40, 1'000, 250'000}) {
            prices[token] = price;
            const auto res = calcCollateral(params(), sources());

            EXPECT_GE(healthFactor(res, 2'000), lastHealthFactor) << "price " << price;
            EXPECT_GE(res.totalValueUSD, lastTotalValue) << "price " << price;
            lastHealthFactor = healthFactor(res, 2'000);
            lastTotalValue = res.totalValueUSD;
        }
    }
}

//-------------------------------------------------------------------------

TEST_F(CollateralSweepTest, HealthFactorNeverRisesWithDebt)
{
    const auto res = calcCollateral(params(), sources());

    uint256_t lastHealthFactor = healthFactor(res, 1);
    for (uint64_t debt : {2, 10, 999, 1'500, 1'501, 100'000}) {
        EXPECT_LE(healthFactor(res, debt), lastHealthFactor) << "debt " << debt;
        lastHealthFactor = healthFactor(res, debt);
    }
    // 1500 of TWV covers exactly 1500 of debt.
    EXPECT_EQ(healthFactor(res, 1'500), PERCENTAGE_FACTOR);
    EXPECT_LT(healthFactor(res, 1'501), PERCENTAGE_FACTOR);
}

//-------------------------------------------------------------------------

TEST_F(CollateralSweepTest, FullValuationIgnoresHintOrder)
{
    const auto baseline = calcCollateral(params(), sources());

    for (std::vector<TokenMask> hints : {
             std::vector{TokenMask{1}, TokenMask{2}, TokenMask{4}, TokenMask{8}},
             std::vector{TokenMask{2}, TokenMask{8}},
             std::vector{TokenMask{4}}}) {
        int permutation = 0;
        do {
            SCOPED_TRACE(fmt::format("{} hints, permutation {}", hints.size(), permutation++));
            auto p = params();
            p.collateralHints = hints;

            const auto res = calcCollateral(p, sources());

            EXPECT_EQ(res.totalValueUSD, baseline.totalValueUSD);
            EXPECT_EQ(res.twvUSD, baseline.twvUSD);
            EXPECT_EQ(res.tokensToDisable, baseline.tokensToDisable);
            EXPECT_EQ(res.tokensChecked, baseline.tokensChecked);
        } while (std::next_permutation(hints.begin(), hints.end()));
    }
}

//-------------------------------------------------------------------------

struct InterestPreservationTest : public TestWithParam<std::tuple<uint64_t, uint64_t, uint32_t, uint32_t>>
{
    virtual void SetUp() override
    {
        const auto [debtUnits, amountUnits, lastBps, growthBps] = GetParam();
        // Off-round amounts so that every division rounds.
        debt = uint256_t{debtUnits} * 1_wad + 7;
        amount = uint256_t{amountUnits} * 1_wad + 3;
        indexLastUpdate = RAY * lastBps / PERCENTAGE_FACTOR;
        indexNow = indexLastUpdate * growthBps / PERCENTAGE_FACTOR;
    }

    uint256_t debt;
    uint256_t amount;
    uint256_t indexLastUpdate;
    uint256_t indexNow;
};

INSTANTIATE_TEST_SUITE_P(
    CreditLogicTest,
    InterestPreservationTest,
    Combine(
        Values(uint64_t{1}, uint64_t{1'000}, uint64_t{123'457}),
        Values(uint64_t{0}, uint64_t{1}, uint64_t{999}, uint64_t{50'000}),
        Values(uint32_t{10'000}, uint32_t{10'500}),
        Values(uint32_t{10'000}, uint32_t{10'137}, uint32_t{11'000}, uint32_t{25'000})));

TEST_P(InterestPreservationTest, IncreaseKeepsAccruedInterest)
{
    const uint256_t interest = calcAccruedInterest(debt, indexLastUpdate, indexNow);

    const auto res = calcIncrease(amount, debt, indexNow, indexLastUpdate);

    EXPECT_EQ(res.newDebt, debt + amount);
    EXPECT_GE(res.newCumulativeIndex, indexLastUpdate);
    EXPECT_LE(res.newCumulativeIndex, indexNow);
    EXPECT_LE(absDiff(calcAccruedInterest(res.newDebt, res.newCumulativeIndex, indexNow), interest), 2);
}

TEST_P(InterestPreservationTest, PartialRepaymentLeavesTheRestAccruing)
{
    constexpr uint16_t kFeeInterest = 1'000;
    const uint256_t interest = calcAccruedInterest(debt, indexLastUpdate, indexNow);
    const uint256_t repayment = interest / 3;

    const auto res = calcDecrease(repayment, debt, indexNow, indexLastUpdate, 0, 0, kFeeInterest);

    const uint256_t amountToPool =
        numeric::mulDiv(repayment, PERCENTAGE_FACTOR, uint256_t{PERCENTAGE_FACTOR + kFeeInterest});
    EXPECT_EQ(res.newDebt, debt);
    EXPECT_EQ(res.profit, repayment - amountToPool);
    EXPECT_LE(
        absDiff(calcAccruedInterest(debt, res.newCumulativeIndex, indexNow), interest - amountToPool), 2);
}

//-------------------------------------------------------------------------
