/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "CreditSuiteFixture.hpp"
#include "creditsim/accounting/CreditLogic.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace creditsim;
using namespace creditsim::credit;
using namespace creditsim::test;
using namespace testing;

//-------------------------------------------------------------------------

// Liquidates an account holding 1 WETH against 1000 DAI of debt at a swept
// WETH price, with a liquidator that brings a swept amount of DAI.
struct LiquidationSettlementTest
    : public CreditSuiteTest,
      public WithParamInterface<std::tuple<uint64_t, uint64_t>>
{
    virtual void SetUp() override
    {
        CreditSuiteTest::SetUp();
        creditAccount = openAccountWith(1'000_wad, weth, amount("0.5"));
        multicall(creditAccount, {suite->swapAdapter().swapExactIn(dai, weth, 1'000_wad, 0)});
        nextBlock();
    }

    Address creditAccount{};
};

INSTANTIATE_TEST_SUITE_P(
    CreditFacadeTest,
    LiquidationSettlementTest,
    Combine(
        Values(uint64_t{800}, uint64_t{900}, uint64_t{1'000}, uint64_t{1'100}),
        Values(uint64_t{0}, uint64_t{500}, uint64_t{2'000})));

TEST_P(LiquidationSettlementTest, ValueIsConserved)
{
    const auto [price, funding] = GetParam();
    setPrice(weth, std::to_string(price));

    const Address liquidator = actor();
    fund(liquidator, dai, uint256_t{funding} * 1_wad);

    auto& pool = suite->pool();
    const uint256_t poolBefore = balance(dai, pool.address());
    const uint256_t lossesBefore = pool.totalLosses();
    const uint256_t treasuryBefore = pool.treasuryProfit();

    const auto cdd = creditManager().calcDebtAndCollateral(
        creditAccount, accounting::CollateralCalcTask::DEBT_COLLATERAL);
    ASSERT_LT(cdd.twvUSD, cdd.totalDebtUSD);
    ASSERT_EQ(cdd.totalValue, uint256_t{price} * 1_wad);
    const auto payments =
        accounting::calcClosePayments(accounting::ClosureKind::LIQUIDATE, cdd, creditManager().fees());

    static_cast<void>(facade().liquidateCreditAccount(liquidator, creditAccount, liquidator, 0, false));

    const uint256_t paidToPool = balance(dai, pool.address()) - poolBefore;
    const uint256_t loss = pool.totalLosses() - lossesBefore;
    const uint256_t spent = uint256_t{funding} * 1_wad - balance(dai, liquidator);
    const uint256_t toBorrower = balance(dai, borrower);

    // Everything the account was worth, plus what the liquidator brought,
    // ends up with the pool, the borrower, the liquidator or as dust.
    const uint256_t liquidatorValue = balance(weth, liquidator) * price;
    const uint256_t dustValue = balance(weth, creditAccount) * price + balance(dai, creditAccount);
    EXPECT_EQ(paidToPool + toBorrower + liquidatorValue + dustValue, cdd.totalValue + spent);

    // The pool is owed the full amount and books whatever it was not paid as loss.
    EXPECT_EQ(paidToPool + loss, payments.amountToPool + payments.loss);
    EXPECT_EQ(facade().cumulativeLoss(), loss);
    EXPECT_EQ(
        pool.treasuryProfit() - treasuryBefore,
        numeric::saturatingSub(paidToPool, accounting::calcDebtWithInterest(cdd)));
    EXPECT_TRUE(loss == 0 || toBorrower == 0);
    EXPECT_EQ(pool.totalBorrowed(), 0);
}

//-------------------------------------------------------------------------

// Closes an account holding 500 DAI and 1 WETH against 1000 DAI of debt.
struct CloseSettlementTest
    : public CreditSuiteTest,
      public WithParamInterface<uint64_t>
{};

INSTANTIATE_TEST_SUITE_P(
    CreditFacadeTest,
    CloseSettlementTest,
    Values(uint64_t{0}, uint64_t{400}, uint64_t{700}));

TEST_P(CloseSettlementTest, PoolIsRepaidInFull)
{
    const uint64_t swappedWeth = GetParam();
    const Address creditAccount = openAccountWith(1'000_wad, dai, 500_wad);
    fund(borrower, weth, 1_wad);
    multicall(creditAccount, {calls::addCollateral(facadeAddress(), weth, 1_wad)});
    if (swappedWeth > 0) {
        // Leaves less underlying on the account than the debt.
        multicall(
            creditAccount,
            {suite->swapAdapter().swapExactIn(dai, weth, uint256_t{swappedWeth} * 2 * 1_wad, 0)});
    }
    nextBlock();

    auto& pool = suite->pool();
    const uint256_t poolBefore = balance(dai, pool.address());
    const uint256_t accountDai = balance(dai, creditAccount);
    const uint256_t accountWeth = balance(weth, creditAccount);
    fund(borrower, dai, 2'000_wad);
    const Address recipient = actor();

    facade().closeCreditAccount(borrower, creditAccount, recipient, 0, false);

    const uint256_t paidToPool = balance(dai, pool.address()) - poolBefore;
    const uint256_t pulled = 2'000_wad - balance(dai, borrower);

    EXPECT_EQ(paidToPool, 1'000_wad);
    EXPECT_EQ(pool.totalLosses(), 0);
    EXPECT_EQ(balance(weth, recipient) + balance(weth, creditAccount), accountWeth);
    EXPECT_EQ(
        paidToPool + balance(dai, recipient) + balance(dai, creditAccount), accountDai + pulled);
}

//-------------------------------------------------------------------------
