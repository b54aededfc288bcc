/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "CreditException.hpp"
#include "creditsim/accounting/CreditLogic.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace creditsim;
using namespace creditsim::accounting;
using namespace testing;

using numeric::RAY;

//-------------------------------------------------------------------------

namespace
{

// 1.1 RAY
const uint256_t kIndexNow{"1100000000000000000000000000"};

[[nodiscard]] CreditFees feesFromPremiums()
{
    return CreditFees{
        .feeInterest = 1'000,
        .feeLiquidation = 1'000,
        .liquidationDiscount = 9'000,
        .feeLiquidationExpired = 500,
        .liquidationDiscountExpired = 9'500
    };
}

}  // namespace

//-------------------------------------------------------------------------

TEST(CreditLogicTest, AccruedInterest)
{
    EXPECT_EQ(calcAccruedInterest(1'000, RAY, kIndexNow), 100);
    EXPECT_EQ(calcAccruedInterest(0, RAY, kIndexNow), 0);
}

//-------------------------------------------------------------------------

TEST(CreditLogicTest, IncreaseKeepsAccruedInterest)
{
    const auto fresh = calcIncrease(500, 0, kIndexNow, RAY);
    EXPECT_EQ(fresh.newDebt, 500);
    EXPECT_EQ(fresh.newCumulativeIndex, kIndexNow);

    const auto res = calcIncrease(1'000, 1'000, kIndexNow, RAY);
    EXPECT_EQ(res.newDebt, 2'000);
    EXPECT_EQ(calcAccruedInterest(res.newDebt, res.newCumulativeIndex, kIndexNow), 100);
}

//-------------------------------------------------------------------------

TEST(CreditLogicTest, DecreaseRepaysInOrder)
{
    const auto res = calcDecrease(500, 1'000, kIndexNow, RAY, 50, 10, 1'000);

    // Fees 10, quota interest 50 + 5, base interest 100 + 10, principal 325.
    EXPECT_EQ(res.newQuotaFees, 0);
    EXPECT_EQ(res.newCumulativeQuotaInterest, 0);
    EXPECT_EQ(res.newCumulativeIndex, kIndexNow);
    EXPECT_EQ(res.profit, 25);
    EXPECT_EQ(res.newDebt, 675);
}

//-------------------------------------------------------------------------

TEST(CreditLogicTest, DecreaseCoveringOnlyFees)
{
    const auto res = calcDecrease(4, 1'000, kIndexNow, RAY, 50, 10, 1'000);

    EXPECT_EQ(res.newQuotaFees, 6);
    EXPECT_EQ(res.profit, 4);
    EXPECT_EQ(res.newCumulativeQuotaInterest, 50);
    EXPECT_EQ(res.newCumulativeIndex, RAY);
    EXPECT_EQ(res.newDebt, 1'000);
}

//-------------------------------------------------------------------------

TEST(CreditLogicTest, PartialInterestRepaymentMovesIndex)
{
    const auto res = calcDecrease(50, 1'000, kIndexNow, RAY, 0, 0, 0);

    EXPECT_EQ(res.newDebt, 1'000);
    EXPECT_EQ(res.profit, 0);
    EXPECT_EQ(calcAccruedInterest(res.newDebt, res.newCumulativeIndex, kIndexNow), 50);
}

//-------------------------------------------------------------------------

TEST(CreditLogicTest, OverRepaymentThrows)
{
    EXPECT_THROW(
        static_cast<void>(calcDecrease(2'000, 1'000, kIndexNow, RAY, 50, 10, 1'000)),
        IncorrectParameterException);
}

//-------------------------------------------------------------------------

TEST(CreditLogicTest, LiquidationParamsFollowClosureKind)
{
    const auto fees = feesFromPremiums();
    EXPECT_EQ(liquidationParams(ClosureKind::LIQUIDATE, fees), std::make_pair(uint16_t{9'000}, uint16_t{1'000}));
    EXPECT_EQ(
        liquidationParams(ClosureKind::LIQUIDATE_EXPIRED, fees),
        std::make_pair(uint16_t{9'500}, uint16_t{500}));
    EXPECT_EQ(liquidationParams(ClosureKind::CLOSE, fees), std::make_pair(uint16_t{10'000}, uint16_t{0}));
}

//-------------------------------------------------------------------------

TEST(CreditLogicTest, ClosePaysFullDebt)
{
    const CollateralDebtData cdd{
        .debt = 1'000,
        .accruedInterest = 100,
        .accruedFees = 10,
        .totalValue = 2'000
    };

    const auto res = calcClosePayments(ClosureKind::CLOSE, cdd, feesFromPremiums());

    EXPECT_EQ(res.amountToPool, 1'110);
    EXPECT_EQ(res.remainingFunds, 890);
    EXPECT_EQ(res.profit, 10);
    EXPECT_EQ(res.loss, 0);
}

//-------------------------------------------------------------------------

TEST(CreditLogicTest, LiquidationWithPremiumAndFee)
{
    const CollateralDebtData cdd{.debt = 1'000_wad, .totalValue = 1'500_wad};

    const auto res = calcClosePayments(ClosureKind::LIQUIDATE, cdd, feesFromPremiums());

    // debt * 9000 / 10000 + totalValue * 1000 / 10000
    EXPECT_EQ(res.amountToPool, 1'050_wad);
    EXPECT_EQ(res.remainingFunds, 450_wad);
    EXPECT_EQ(res.profit, 50_wad);
    EXPECT_EQ(res.loss, 0);
}

//-------------------------------------------------------------------------

TEST(CreditLogicTest, ExpiredLiquidationUsesExpiredParams)
{
    const CollateralDebtData cdd{.debt = 1'000_wad, .totalValue = 1'500_wad};

    const auto res = calcClosePayments(ClosureKind::LIQUIDATE_EXPIRED, cdd, feesFromPremiums());

    EXPECT_EQ(res.amountToPool, 1'025_wad);
    EXPECT_EQ(res.remainingFunds, 475_wad);
}

//-------------------------------------------------------------------------

TEST(CreditLogicTest, UnderwaterLiquidationReportsLoss)
{
    const CollateralDebtData cdd{.debt = 1'000_wad, .totalValue = 800_wad};

    const auto res = calcClosePayments(ClosureKind::LIQUIDATE, cdd, feesFromPremiums());

    EXPECT_EQ(res.amountToPool, 800_wad);
    EXPECT_EQ(res.remainingFunds, 0);
    EXPECT_EQ(res.loss, 180_wad);
    EXPECT_EQ(res.profit, 0);
}

//-------------------------------------------------------------------------

struct ClosePaymentsConservationTest
    : public TestWithParam<std::tuple<ClosureKind, uint64_t, uint64_t, uint16_t, uint16_t>>
{};

INSTANTIATE_TEST_SUITE_P(
    CreditLogicTest,
    ClosePaymentsConservationTest,
    Combine(
        Values(ClosureKind::CLOSE, ClosureKind::LIQUIDATE, ClosureKind::LIQUIDATE_EXPIRED),
        Values(uint64_t{1'000}, uint64_t{123'457}),
        Values(uint64_t{0}, uint64_t{900}, uint64_t{1'337}, uint64_t{250'000}),
        Values(uint16_t{8'000}, uint16_t{9'600}),
        Values(uint16_t{0}, uint16_t{150}, uint16_t{1'000})));

TEST_P(ClosePaymentsConservationTest, WorksCorrectly)
{
    const auto [kind, debt, totalValue, discount, fee] = GetParam();
    const CreditFees fees{
        .feeInterest = 1'000,
        .feeLiquidation = fee,
        .liquidationDiscount = discount,
        .feeLiquidationExpired = fee,
        .liquidationDiscountExpired = discount
    };
    const CollateralDebtData cdd{
        .debt = debt,
        .accruedInterest = debt / 10,
        .accruedFees = debt / 100,
        .totalValue = totalValue
    };

    const auto res = calcClosePayments(kind, cdd, fees);

    const uint256_t required = kind == ClosureKind::CLOSE
        ? calcTotalDebt(cdd)
        : numeric::percentMul(cdd.debt + cdd.accruedInterest, discount) + numeric::percentMul(cdd.totalValue, fee);
    EXPECT_EQ(res.amountToPool + res.remainingFunds + res.loss, std::max(cdd.totalValue, required));
    EXPECT_TRUE(res.loss == 0 || res.remainingFunds == 0);
    EXPECT_EQ(res.profit, numeric::saturatingSub(res.amountToPool, calcDebtWithInterest(cdd)));
    if (kind == ClosureKind::CLOSE) {
        // Closing always owes the full debt; any shortfall is pulled from the owner.
        EXPECT_EQ(res.amountToPool, required);
        EXPECT_EQ(res.loss, 0);
    }
}

//-------------------------------------------------------------------------
