/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "CreditException.hpp"
#include "CreditSuiteFixture.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace creditsim;
using namespace creditsim::credit;
using namespace creditsim::test;
using namespace testing;

using accounting::CollateralCalcTask;

//-------------------------------------------------------------------------

// Drives the credit manager directly, posing as its facade.
struct CreditManagerTest : public CreditSuiteTest
{
    virtual void SetUp() override
    {
        CreditSuiteTest::SetUp();
        cm = &creditManager();
        caller = facadeAddress();
        configuratorAddress = configurator().address();
    }

    CreditManager* cm{};
    Address caller{};
    Address configuratorAddress{};
};

//-------------------------------------------------------------------------

TEST_F(CreditManagerTest, AccountOperationsAreFacadeOnly)
{
    const Address stranger = actor();
    EXPECT_THROW(
        static_cast<void>(cm->openCreditAccount(stranger, 1'000_wad, borrower)), CallerNotCreditFacadeException);

    const Address creditAccount = cm->openCreditAccount(caller, 1'000_wad, borrower);
    EXPECT_THROW(
        static_cast<void>(cm->manageDebt(
            stranger, creditAccount, 1_wad, UNDERLYING_TOKEN_MASK, ManageDebtAction::INCREASE_DEBT)),
        CallerNotCreditFacadeException);
    EXPECT_THROW(cm->setFlagFor(stranger, creditAccount, 1, true), CallerNotCreditFacadeException);
    EXPECT_THROW(
        static_cast<void>(cm->withdrawCollateral(stranger, creditAccount, dai, 1, stranger)),
        CallerNotCreditFacadeException);
}

//-------------------------------------------------------------------------

TEST_F(CreditManagerTest, OpenRecordsAccount)
{
    const Address creditAccount = cm->openCreditAccount(caller, 1'000_wad, borrower);

    const auto& info = cm->creditAccountInfo(creditAccount);
    EXPECT_EQ(info.debt, 1'000_wad);
    EXPECT_EQ(info.borrower, borrower);
    EXPECT_EQ(info.since, suite->chain().blockNumber());
    EXPECT_EQ(info.enabledTokensMask, UNDERLYING_TOKEN_MASK);
    EXPECT_EQ(info.cumulativeIndexLastUpdate, suite->pool().baseInterestIndex());
    EXPECT_EQ(balance(dai, creditAccount), 1'000_wad);
    EXPECT_EQ(suite->pool().creditManagerBorrowed(cm->address()), 1'000_wad);
    EXPECT_THAT(cm->creditAccounts(), ElementsAre(creditAccount));

    const auto cdd = cm->calcDebtAndCollateral(creditAccount, CollateralCalcTask::DEBT_ONLY);
    EXPECT_THROW(
        static_cast<void>(cm->closeCreditAccount(
            caller, creditAccount, accounting::ClosureKind::CLOSE, cdd, borrower, borrower, 0, false)),
        OpenCloseAccountInOneBlockException);
}

//-------------------------------------------------------------------------

TEST_F(CreditManagerTest, ManageDebtWithZeroAmountIsNoop)
{
    const Address creditAccount = cm->openCreditAccount(caller, 1'000_wad, borrower);
    const auto res = cm->manageDebt(
        caller, creditAccount, 0, UNDERLYING_TOKEN_MASK, ManageDebtAction::INCREASE_DEBT);
    EXPECT_EQ(res.newDebt, 1'000_wad);
    EXPECT_EQ(suite->pool().totalBorrowed(), 1'000_wad);
}

//-------------------------------------------------------------------------

TEST_F(CreditManagerTest, CalcDebtAndCollateral)
{
    const Address creditAccount = openAccountWith(1'000_wad, dai, 500_wad);

    const auto generic = cm->calcDebtAndCollateral(creditAccount, CollateralCalcTask::GENERIC_PARAMS);
    EXPECT_EQ(generic.debt, 1'000_wad);
    EXPECT_EQ(generic.twvUSD, 0);

    const auto full = cm->calcDebtAndCollateral(creditAccount, CollateralCalcTask::DEBT_COLLATERAL);
    EXPECT_EQ(full.totalDebtUSD, usd("1000"));
    EXPECT_EQ(full.totalValueUSD, usd("1500"));
    EXPECT_EQ(full.twvUSD, usd("1395"));
    EXPECT_EQ(full.totalValue, 1'500_wad);

    EXPECT_THROW(
        static_cast<void>(cm->calcDebtAndCollateral(creditAccount, CollateralCalcTask::FULL_COLLATERAL_CHECK_LAZY)),
        IncorrectParameterException);
    EXPECT_THROW(
        static_cast<void>(cm->calcDebtAndCollateral(borrower, CollateralCalcTask::DEBT_ONLY)),
        AccountNotFoundException);

    EXPECT_FALSE(cm->isLiquidatable(creditAccount, numeric::PERCENTAGE_FACTOR));
    EXPECT_TRUE(cm->isLiquidatable(creditAccount, 14'000));
}

//-------------------------------------------------------------------------

TEST_F(CreditManagerTest, FullCollateralCheck)
{
    const Address creditAccount = openAccountWith(1'000_wad, dai, 500_wad);
    const std::vector<TokenMask> noHints;

    EXPECT_THROW(
        cm->fullCollateralCheck(caller, creditAccount, UNDERLYING_TOKEN_MASK, noHints, 9'999),
        CustomHealthFactorTooLowException);
    EXPECT_THROW(
        cm->fullCollateralCheck(caller, creditAccount, UNDERLYING_TOKEN_MASK, noHints, 15'000),
        NotEnoughCollateralException);
    EXPECT_NO_THROW(cm->fullCollateralCheck(caller, creditAccount, UNDERLYING_TOKEN_MASK, noHints, 13'000));

    // A hint outside the enabled mask is rejected.
    const std::vector<TokenMask> wethHint{TokenMask{2}};
    EXPECT_THROW(
        cm->fullCollateralCheck(caller, creditAccount, UNDERLYING_TOKEN_MASK, wethHint, 10'000),
        IncorrectTokenMaskException);

    // Hinted tokens are visited first; empty ones get disabled.
    cm->fullCollateralCheck(caller, creditAccount, TokenMask{3}, wethHint, 10'000);
    EXPECT_EQ(cm->enabledTokensMaskOf(creditAccount), UNDERLYING_TOKEN_MASK);
}

//-------------------------------------------------------------------------

TEST_F(CreditManagerTest, EnabledTokensAreCapped)
{
    const Address creditAccount = openAccountWith(1'000_wad, dai, 500_wad);
    configurator().setMaxEnabledTokens(admin, 1);

    EXPECT_THROW(
        cm->saveEnabledTokensMask(caller, creditAccount, TokenMask{3}), TooManyEnabledTokensException);
    EXPECT_NO_THROW(cm->saveEnabledTokensMask(caller, creditAccount, UNDERLYING_TOKEN_MASK));
}

//-------------------------------------------------------------------------

TEST_F(CreditManagerTest, CollateralMovements)
{
    const Address creditAccount = cm->openCreditAccount(caller, 1'000_wad, borrower);
    fund(borrower, weth, 2_wad);

    EXPECT_EQ(cm->addCollateral(caller, borrower, creditAccount, weth, 2_wad), TokenMask{2});
    EXPECT_EQ(balance(weth, creditAccount), 2_wad);

    EXPECT_EQ(cm->withdrawCollateral(caller, creditAccount, weth, 1_wad, borrower), TokenMask{2});
    EXPECT_EQ(balance(weth, borrower), 1_wad);

    const Address unknown = suite->ledger().addToken("UNI", 18);
    EXPECT_THROW(
        static_cast<void>(cm->addCollateral(caller, borrower, creditAccount, unknown, 1)),
        TokenNotAllowedException);
}

//-------------------------------------------------------------------------

TEST_F(CreditManagerTest, UpdateQuotaRequiresQuotedToken)
{
    const Address creditAccount = cm->openCreditAccount(caller, 1'000_wad, borrower);
    const uint256_t maxQuota = 20'000_wad;

    EXPECT_THROW(
        static_cast<void>(cm->updateQuota(caller, creditAccount, weth, int256_t{1_wad}, 0, maxQuota)),
        TokenIsNotQuotedException);

    const auto res = cm->updateQuota(caller, creditAccount, link, int256_t{100_wad}, 0, maxQuota);
    EXPECT_EQ(res.tokensToEnable, TokenMask{4});
    EXPECT_EQ(res.tokensToDisable, 0);

    EXPECT_THROW(
        static_cast<void>(cm->updateQuota(caller, creditAccount, link, int256_t{30'000_wad}, 0, maxQuota)),
        QuotaIsOutOfBoundsException);
}

//-------------------------------------------------------------------------

TEST_F(CreditManagerTest, ActiveAccountGuard)
{
    const Address creditAccount = cm->openCreditAccount(caller, 1'000_wad, borrower);
    EXPECT_THROW(static_cast<void>(cm->getActiveCreditAccountOrRevert()), ActiveCreditAccountNotSetException);

    {
        const auto guard = cm->activate(caller, creditAccount);
        EXPECT_EQ(cm->getActiveCreditAccountOrRevert(), creditAccount);
        EXPECT_THROW(
            static_cast<void>(cm->activate(caller, creditAccount)), ActiveCreditAccountOverriddenException);
    }

    EXPECT_EQ(cm->activeCreditAccount(), kInactiveCreditAccount);
}

//-------------------------------------------------------------------------

TEST_F(CreditManagerTest, AdapterOnlyCalls)
{
    const Address creditAccount = cm->openCreditAccount(caller, 1'000_wad, borrower);
    const Address adapter = suite->swapAdapter().address();

    EXPECT_THROW(cm->approveCreditAccount(borrower, dai, 1), CallerNotAdapterException);
    EXPECT_THROW(cm->approveCreditAccount(adapter, dai, 1), ActiveCreditAccountNotSetException);

    const auto guard = cm->activate(caller, creditAccount);
    cm->approveCreditAccount(adapter, dai, 10_wad);
    EXPECT_EQ(suite->ledger().allowance(dai, creditAccount, suite->swap().address()), 10_wad);

    const auto words = cm->execute(
        adapter, simulation::FixedRateSwap::encodeSwapExactIn(dai, weth, 10_wad, 0));
    ASSERT_THAT(words, SizeIs(1));
    EXPECT_EQ(words.front(), amount("0.005"));
    EXPECT_EQ(balance(weth, creditAccount), amount("0.005"));
}

//-------------------------------------------------------------------------

TEST_F(CreditManagerTest, RevokeAdapterAllowances)
{
    const Address creditAccount = cm->openCreditAccount(caller, 1'000_wad, borrower);
    const Address spender = suite->swap().address();
    suite->ledger().approve(dai, creditAccount, spender, 100_wad);

    const std::vector<RevocationPair> revocations{{.token = dai, .spender = spender}};
    cm->revokeAdapterAllowances(caller, creditAccount, revocations);
    EXPECT_EQ(suite->ledger().allowance(dai, creditAccount, spender), 0);

    const std::vector<RevocationPair> zeroSpender{{.token = dai, .spender = ADDRESS_ZERO}};
    EXPECT_THROW(
        cm->revokeAdapterAllowances(caller, creditAccount, zeroSpender), IncorrectParameterException);
}

//-------------------------------------------------------------------------

TEST_F(CreditManagerTest, TokenRegistry)
{
    EXPECT_EQ(cm->collateralTokensCount(), 4);
    EXPECT_EQ(cm->getTokenMaskOrRevert(dai), UNDERLYING_TOKEN_MASK);
    EXPECT_EQ(cm->getTokenMaskOrRevert(usdc), TokenMask{8});
    EXPECT_EQ(cm->collateralTokenByMask(TokenMask{4}).token, link);
    EXPECT_EQ(cm->quotedTokensMask(), TokenMask{4});
    EXPECT_EQ(cm->liquidationThreshold(dai), 9'300);
    EXPECT_EQ(cm->liquidationThreshold(weth), 8'500);
    EXPECT_THROW(static_cast<void>(cm->collateralTokenByMask(TokenMask{16})), TokenNotAllowedException);

    const Address uni = suite->ledger().addToken("UNI", 18);
    EXPECT_THROW(static_cast<void>(cm->addToken(admin, uni)), CallerNotConfiguratorException);
    EXPECT_THROW(static_cast<void>(cm->addToken(configuratorAddress, uni)), PriceFeedDoesNotExistException);
    EXPECT_THROW(static_cast<void>(cm->addToken(configuratorAddress, weth)), IncorrectParameterException);

    setPrice(uni, "5");
    EXPECT_EQ(cm->addToken(configuratorAddress, uni), TokenMask{16});
    EXPECT_TRUE(cm->isCollateralToken(uni));

    EXPECT_THROW(
        cm->setCollateralTokenData(configuratorAddress, uni, 10'001, 10'001, 0, 0),
        IncorrectLiquidationThresholdException);
    EXPECT_THROW(cm->setQuotedMask(configuratorAddress, TokenMask{5}), IncorrectParameterException);
}

//-------------------------------------------------------------------------

TEST_F(CreditManagerTest, RollsBackWithJournal)
{
    {
        auto tx = suite->chain().journal().begin();
        static_cast<void>(cm->openCreditAccount(caller, 1'000_wad, borrower));
    }
    EXPECT_THAT(cm->creditAccounts(), IsEmpty());
    EXPECT_EQ(suite->pool().totalBorrowed(), 0);
    EXPECT_EQ(suite->pool().availableLiquidity(), 1'000'000_wad);
}

//-------------------------------------------------------------------------
