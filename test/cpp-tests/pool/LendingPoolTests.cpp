/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "CreditException.hpp"
#include "creditsim/pool/LendingPool.hpp"
#include "creditsim/simulation/Chain.hpp"
#include "creditsim/simulation/TokenLedger.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace creditsim;
using namespace creditsim::pool;
using namespace testing;

//-------------------------------------------------------------------------

struct LendingPoolTest : public Test
{
    virtual void SetUp() override
    {
        dai = chain.ledger().addToken("DAI", 18);
        provider = chain.allocateAddress();
        creditManager = chain.allocateAddress();
        creditAccount = chain.allocateAddress();

        pool = std::make_unique<LendingPool>(chain, LendingPoolDesc{
            .underlying = dai,
            .baseInterestRate = numeric::RAY / 10
        });
        chain.ledger().mint(dai, provider, 1'000_wad);
        pool->addLiquidity(provider, 1'000_wad);
        pool->addCreditManager(creditManager);
        pool->setCreditManagerDebtLimit(creditManager, 600_wad);
    }

    simulation::Chain chain;
    Address dai;
    Address provider;
    Address creditManager;
    Address creditAccount;
    std::unique_ptr<LendingPool> pool;
};

//-------------------------------------------------------------------------

TEST_F(LendingPoolTest, Liquidity)
{
    EXPECT_EQ(pool->availableLiquidity(), 1'000_wad);
    EXPECT_EQ(chain.ledger().balanceOf(dai, provider), uint256_t{});
    EXPECT_EQ(pool->creditManagerBorrowable(creditManager), 600_wad);
}

//-------------------------------------------------------------------------

TEST_F(LendingPoolTest, BaseIndexGrowsLinearly)
{
    EXPECT_EQ(pool->baseInterestIndex(), numeric::RAY);

    chain.warp(chain.timestamp() + numeric::SECONDS_PER_YEAR);
    EXPECT_EQ(pool->baseInterestIndex(), numeric::RAY * 11 / 10);

    // The index is checkpointed before the rate changes.
    pool->setBaseInterestRate(0);
    chain.warp(chain.timestamp() + numeric::SECONDS_PER_YEAR);
    EXPECT_EQ(pool->baseInterestIndex(), numeric::RAY * 11 / 10);
}

//-------------------------------------------------------------------------

TEST_F(LendingPoolTest, LendWithinLimits)
{
    pool->lendCreditAccount(creditManager, 400_wad, creditAccount);

    EXPECT_EQ(pool->creditManagerBorrowed(creditManager), 400_wad);
    EXPECT_EQ(pool->totalBorrowed(), 400_wad);
    EXPECT_EQ(pool->availableLiquidity(), 600_wad);
    EXPECT_EQ(chain.ledger().balanceOf(dai, creditAccount), 400_wad);
    EXPECT_EQ(pool->creditManagerBorrowable(creditManager), 200_wad);

    EXPECT_THROW(
        pool->lendCreditAccount(creditManager, 300_wad, creditAccount), BorrowLimitExceededException);
}

//-------------------------------------------------------------------------

TEST_F(LendingPoolTest, BorrowableIsCappedByLiquidity)
{
    pool->setCreditManagerDebtLimit(creditManager, 5'000_wad);
    EXPECT_EQ(pool->creditManagerBorrowable(creditManager), 1'000_wad);
}

//-------------------------------------------------------------------------

TEST_F(LendingPoolTest, RejectsUnknownCreditManager)
{
    const Address stranger = chain.allocateAddress();
    EXPECT_EQ(pool->creditManagerBorrowable(stranger), uint256_t{});
    EXPECT_EQ(pool->creditManagerBorrowed(stranger), uint256_t{});
    EXPECT_THROW(pool->lendCreditAccount(stranger, 1, creditAccount), CallerNotCreditManagerException);
    EXPECT_THROW(pool->repayCreditAccount(stranger, 0, 0, 0), CallerNotCreditManagerException);
}

//-------------------------------------------------------------------------

TEST_F(LendingPoolTest, RepayRecordsProfitAndLoss)
{
    pool->lendCreditAccount(creditManager, 400_wad, creditAccount);
    pool->repayCreditAccount(creditManager, 400_wad, 10_wad, 5_wad);

    EXPECT_EQ(pool->creditManagerBorrowed(creditManager), uint256_t{});
    EXPECT_EQ(pool->totalBorrowed(), uint256_t{});
    EXPECT_EQ(pool->treasuryProfit(), 10_wad);
    EXPECT_EQ(pool->totalLosses(), 5_wad);

    EXPECT_THROW(pool->repayCreditAccount(creditManager, 1, 0, 0), IncorrectParameterException);
}

//-------------------------------------------------------------------------

TEST_F(LendingPoolTest, RollsBackWithJournal)
{
    {
        auto tx = chain.journal().begin();
        pool->lendCreditAccount(creditManager, 400_wad, creditAccount);
    }
    EXPECT_EQ(pool->totalBorrowed(), uint256_t{});
    EXPECT_EQ(pool->availableLiquidity(), 1'000_wad);
    EXPECT_EQ(chain.ledger().balanceOf(dai, creditAccount), uint256_t{});
}

//-------------------------------------------------------------------------
