/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "CreditException.hpp"
#include "CreditSuiteFixture.hpp"
#include "creditsim/credit/Permissions.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace creditsim;
using namespace creditsim::credit;
using namespace creditsim::test;
using namespace testing;

//-------------------------------------------------------------------------

struct MultiCallDecodeTest : public CreditSuiteTest
{
    [[nodiscard]] MultiCallAction decode(const MultiCall& call)
    {
        return decodeMultiCall(call, facadeAddress(), creditManager());
    }

    [[nodiscard]] MultiCall rawFacadeCall(FacadeSelector selector, std::vector<uint256_t> args)
    {
        return {facadeAddress(), {.selector = std::to_underlying(selector), .args = std::move(args)}};
    }
};

//-------------------------------------------------------------------------

TEST_F(MultiCallDecodeTest, DecodesFacadeCalls)
{
    const auto addCollateral = decode(calls::addCollateral(facadeAddress(), weth, 5_wad));
    const auto* item = std::get_if<action::AddCollateral>(&addCollateral);
    ASSERT_NE(item, nullptr);
    EXPECT_EQ(item->token, weth);
    EXPECT_EQ(item->amount, 5_wad);
    EXPECT_EQ(requiredPermission(addCollateral), ADD_COLLATERAL_PERMISSION);

    const auto withdraw = decode(calls::withdrawCollateral(facadeAddress(), dai, 3_wad, borrower));
    const auto* withdrawItem = std::get_if<action::WithdrawCollateral>(&withdraw);
    ASSERT_NE(withdrawItem, nullptr);
    EXPECT_EQ(withdrawItem->to, borrower);
    EXPECT_EQ(requiredPermission(withdraw), WITHDRAW_COLLATERAL_PERMISSION);

    EXPECT_EQ(requiredPermission(decode(calls::compareBalances(facadeAddress()))), 0);
}

//-------------------------------------------------------------------------

TEST_F(MultiCallDecodeTest, SignedQuotaChange)
{
    const auto decoded = decode(calls::updateQuota(facadeAddress(), link, -int256_t{7_wad}, 1_wad));
    const auto* item = std::get_if<action::UpdateQuota>(&decoded);
    ASSERT_NE(item, nullptr);
    EXPECT_EQ(item->token, link);
    EXPECT_EQ(item->quotaChange, -int256_t{7_wad});
    EXPECT_EQ(item->minQuota, 1_wad);
    EXPECT_EQ(requiredPermission(decoded), UPDATE_QUOTA_PERMISSION);
}

//-------------------------------------------------------------------------

TEST_F(MultiCallDecodeTest, FullCheckParams)
{
    const std::vector<TokenMask> hints{TokenMask{2}, TokenMask{8}};
    const auto decoded = decode(calls::setFullCheckParams(facadeAddress(), hints, 12'000));
    const auto* item = std::get_if<action::SetFullCheckParams>(&decoded);
    ASSERT_NE(item, nullptr);
    EXPECT_EQ(item->minHealthFactor, 12'000);
    EXPECT_THAT(item->collateralHints, ElementsAre(TokenMask{2}, TokenMask{8}));

    EXPECT_THROW(
        static_cast<void>(decode(rawFacadeCall(FacadeSelector::SET_FULL_CHECK_PARAMS, {}))),
        IncorrectParameterException);
    EXPECT_THROW(
        static_cast<void>(decode(rawFacadeCall(FacadeSelector::SET_FULL_CHECK_PARAMS, {uint256_t{70'000}}))),
        IncorrectParameterException);
}

//-------------------------------------------------------------------------

TEST_F(MultiCallDecodeTest, RejectsMalformedCalls)
{
    EXPECT_THROW(
        static_cast<void>(decode({facadeAddress(), {.selector = 999}})), UnknownMethodException);
    EXPECT_THROW(
        static_cast<void>(decode(rawFacadeCall(FacadeSelector::INCREASE_DEBT, {}))),
        IncorrectParameterException);
    EXPECT_THROW(
        static_cast<void>(decode(rawFacadeCall(FacadeSelector::ADD_COLLATERAL, {uint256_t{weth}}))),
        IncorrectParameterException);
    EXPECT_THROW(
        static_cast<void>(decode(rawFacadeCall(FacadeSelector::STORE_EXPECTED_BALANCES, {uint256_t{dai}}))),
        IncorrectParameterException);
    EXPECT_THROW(
        static_cast<void>(decode(rawFacadeCall(FacadeSelector::COMPARE_BALANCES, {1_wad}))),
        IncorrectParameterException);

    const std::vector<BalanceDelta> negative{{.token = dai, .amount = -int256_t{1_wad}}};
    EXPECT_THROW(
        static_cast<void>(decode(calls::revertIfReceivedLessThan(facadeAddress(), negative))),
        IncorrectParameterException);
    EXPECT_NO_THROW(static_cast<void>(decode(calls::storeExpectedBalances(facadeAddress(), negative))));
}

//-------------------------------------------------------------------------

TEST_F(MultiCallDecodeTest, ExternalCallsNeedAllowedAdapter)
{
    const auto swap = suite->swapAdapter().swapExactIn(dai, weth, 1_wad, 0);
    const auto decoded = decode(swap);
    const auto* item = std::get_if<action::ExternalCall>(&decoded);
    ASSERT_NE(item, nullptr);
    EXPECT_EQ(item->adapter, suite->swapAdapter().address());
    EXPECT_EQ(requiredPermission(decoded), EXTERNAL_CALLS_PERMISSION);

    EXPECT_THROW(
        static_cast<void>(decode({creditManager().address(), swap.callData})),
        TargetContractNotAllowedException);
    EXPECT_THROW(
        static_cast<void>(decode({suite->swap().address(), swap.callData})),
        TargetContractNotAllowedException);
}

//-------------------------------------------------------------------------

TEST(PermissionsTest, CallerPermissionSets)
{
    EXPECT_EQ(OPEN_CREDIT_ACCOUNT_PERMISSIONS & DECREASE_DEBT_PERMISSION, 0);
    EXPECT_NE(OPEN_CREDIT_ACCOUNT_PERMISSIONS & INCREASE_DEBT_PERMISSION, 0);
    EXPECT_EQ(CLOSE_CREDIT_ACCOUNT_PERMISSIONS & INCREASE_DEBT_PERMISSION, 0);
    EXPECT_NE(CLOSE_CREDIT_ACCOUNT_PERMISSIONS & DECREASE_DEBT_PERMISSION, 0);
    EXPECT_EQ(LIQUIDATE_CREDIT_ACCOUNT_PERMISSIONS, EXTERNAL_CALLS_PERMISSION | ADD_COLLATERAL_PERMISSION);
    EXPECT_EQ(EMERGENCY_LIQUIDATION_PERMISSIONS, ADD_COLLATERAL_PERMISSION);
}

//-------------------------------------------------------------------------

// Account with 1000 DAI debt plus 500 DAI and 1 WETH of collateral.
struct MultiCallExecutionTest : public CreditSuiteTest
{
    virtual void SetUp() override
    {
        CreditSuiteTest::SetUp();
        creditAccount = openAccountWith(1'000_wad, dai, 500_wad);
        nextBlock();
        fund(borrower, weth, 1_wad);
        multicall(creditAccount, {calls::addCollateral(facadeAddress(), weth, 1_wad)});
    }

    [[nodiscard]] TokenMask enabledTokens() const
    {
        return suite->creditManager().enabledTokensMaskOf(creditAccount);
    }

    Address creditAccount{};
};

//-------------------------------------------------------------------------

TEST_F(MultiCallExecutionTest, EnableAndDisableTokens)
{
    EXPECT_EQ(enabledTokens(), TokenMask{3});

    multicall(creditAccount, {calls::disableToken(facadeAddress(), weth)});
    EXPECT_EQ(enabledTokens(), UNDERLYING_TOKEN_MASK);
    EXPECT_EQ(balance(weth, creditAccount), 1_wad);

    multicall(creditAccount, {calls::enableToken(facadeAddress(), weth)});
    EXPECT_EQ(enabledTokens(), TokenMask{3});

    // Quoted tokens follow their quota; the underlying stays enabled.
    multicall(
        creditAccount,
        {calls::enableToken(facadeAddress(), link), calls::disableToken(facadeAddress(), dai)});
    EXPECT_EQ(enabledTokens(), TokenMask{3});

    EXPECT_THROW(
        multicall(creditAccount, {calls::enableToken(facadeAddress(), suite->ledger().addToken("UNI", 18))}),
        TokenNotAllowedException);
}

//-------------------------------------------------------------------------

TEST_F(MultiCallExecutionTest, RepeatedEnableAndDisableAreIdempotent)
{
    multicall(
        creditAccount, {calls::disableToken(facadeAddress(), weth), calls::disableToken(facadeAddress(), weth)});
    EXPECT_EQ(enabledTokens(), UNDERLYING_TOKEN_MASK);

    multicall(
        creditAccount, {calls::enableToken(facadeAddress(), weth), calls::enableToken(facadeAddress(), weth)});
    EXPECT_EQ(enabledTokens(), TokenMask{3});

    multicall(
        creditAccount,
        {calls::enableToken(facadeAddress(), weth),
         calls::disableToken(facadeAddress(), weth),
         calls::disableToken(facadeAddress(), weth),
         calls::enableToken(facadeAddress(), weth)});
    EXPECT_EQ(enabledTokens(), TokenMask{3});
    EXPECT_EQ(bitmask::calcEnabledTokens(enabledTokens()), 2u);
}

//-------------------------------------------------------------------------

TEST_F(MultiCallExecutionTest, WithdrawCollateral)
{
    multicall(creditAccount, {calls::withdrawCollateral(facadeAddress(), weth, amount("0.4"), borrower)});
    EXPECT_EQ(balance(weth, borrower), amount("0.4"));
    EXPECT_EQ(balance(weth, creditAccount), amount("0.6"));

    EXPECT_THROW(
        multicall(
            creditAccount,
            {calls::withdrawCollateral(facadeAddress(), weth, amount("0.6"), borrower),
             calls::withdrawCollateral(facadeAddress(), dai, 600_wad, borrower)}),
        NotEnoughCollateralException);
    EXPECT_EQ(balance(dai, creditAccount), 1'500_wad);
    EXPECT_EQ(balance(weth, creditAccount), amount("0.6"));
}

//-------------------------------------------------------------------------

TEST_F(MultiCallExecutionTest, ExpectedBalances)
{
    const auto swap = suite->swapAdapter().swapExactIn(dai, weth, 100_wad, 0);
    const std::vector<BalanceDelta> enough{{.token = weth, .amount = int256_t{amount("0.05")}}};
    const std::vector<BalanceDelta> tooMuch{{.token = weth, .amount = int256_t{amount("0.06")}}};

    multicall(
        creditAccount,
        {calls::storeExpectedBalances(facadeAddress(), enough), swap, calls::compareBalances(facadeAddress())});
    EXPECT_EQ(balance(weth, creditAccount), amount("1.05"));

    multicall(creditAccount, {calls::revertIfReceivedLessThan(facadeAddress(), enough), swap});
    EXPECT_EQ(balance(weth, creditAccount), amount("1.1"));

    EXPECT_THROW(
        multicall(creditAccount, {calls::revertIfReceivedLessThan(facadeAddress(), tooMuch), swap}),
        BalanceLessThanExpectedException);
    EXPECT_EQ(balance(weth, creditAccount), amount("1.1"));
    EXPECT_EQ(balance(dai, creditAccount), 1'300_wad);

    EXPECT_THROW(
        multicall(
            creditAccount,
            {calls::storeExpectedBalances(facadeAddress(), enough),
             calls::storeExpectedBalances(facadeAddress(), enough)}),
        ExpectedBalancesAlreadySetException);
    EXPECT_THROW(
        multicall(creditAccount, {calls::compareBalances(facadeAddress())}), ExpectedBalancesNotSetException);
}

//-------------------------------------------------------------------------

TEST_F(MultiCallExecutionTest, ExpectedBalancesStoredOncePerMulticall)
{
    const auto swap = suite->swapAdapter().swapExactIn(dai, weth, 100_wad, 0);
    const std::vector<BalanceDelta> enough{{.token = weth, .amount = int256_t{amount("0.05")}}};

    // A compare does not re-arm the snapshot within the same multicall.
    EXPECT_THROW(
        multicall(
            creditAccount,
            {calls::storeExpectedBalances(facadeAddress(), enough),
             swap,
             calls::compareBalances(facadeAddress()),
             calls::storeExpectedBalances(facadeAddress(), enough),
             swap}),
        ExpectedBalancesAlreadySetException);
    EXPECT_EQ(balance(weth, creditAccount), 1_wad);
    EXPECT_EQ(balance(dai, creditAccount), 1'500_wad);

    // The next multicall starts afresh.
    EXPECT_NO_THROW(multicall(
        creditAccount,
        {calls::storeExpectedBalances(facadeAddress(), enough), swap, calls::compareBalances(facadeAddress())}));
    EXPECT_EQ(balance(weth, creditAccount), amount("1.05"));
}

//-------------------------------------------------------------------------

TEST_F(MultiCallExecutionTest, FullCheckParams)
{
    // TWV = 1500 * 0.93 + 2000 * 0.85 = 3095 against 1000 of debt.
    const std::vector<TokenMask> noHints;
    const std::vector<TokenMask> wethFirst{TokenMask{2}};

    EXPECT_THROW(
        multicall(creditAccount, {calls::setFullCheckParams(facadeAddress(), noHints, 31'000)}),
        NotEnoughCollateralException);
    EXPECT_THROW(
        multicall(creditAccount, {calls::setFullCheckParams(facadeAddress(), noHints, 9'000)}),
        CustomHealthFactorTooLowException);
    EXPECT_NO_THROW(
        multicall(creditAccount, {calls::setFullCheckParams(facadeAddress(), wethFirst, 30'000)}));
    EXPECT_THROW(
        multicall(creditAccount, {calls::setFullCheckParams(facadeAddress(), std::vector{TokenMask{4}}, 10'000)}),
        IncorrectTokenMaskException);
}

//-------------------------------------------------------------------------

TEST_F(MultiCallExecutionTest, RevokeAdapterAllowances)
{
    const Address spender = suite->swap().address();
    suite->ledger().approve(dai, creditAccount, spender, 100_wad);

    const std::vector<RevocationPair> revocations{{.token = dai, .spender = spender}};
    multicall(creditAccount, {calls::revokeAdapterAllowances(facadeAddress(), revocations)});
    EXPECT_EQ(suite->ledger().allowance(dai, creditAccount, spender), 0);
}

//-------------------------------------------------------------------------

TEST_F(MultiCallExecutionTest, TargetsMustBeFacadeOrAdapter)
{
    const MultiCall direct{
        suite->swap().address(),
        simulation::FixedRateSwap::encodeSwapExactIn(dai, weth, 1_wad, 0)
    };
    EXPECT_THROW(multicall(creditAccount, {direct}), TargetContractNotAllowedException);
}

//-------------------------------------------------------------------------
