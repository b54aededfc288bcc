/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "CreditException.hpp"
#include "creditsim/simulation/Chain.hpp"
#include "creditsim/simulation/FixedRateSwap.hpp"
#include "creditsim/simulation/TokenLedger.hpp"
#include "creditsim/simulation/WETHGateway.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace creditsim;
using namespace creditsim::simulation;
using namespace testing;

//-------------------------------------------------------------------------

TEST(ChainTest, ClockMovesForwardOnly)
{
    Chain chain{ChainDesc{.blockNumber = 100, .timestamp = 1'000, .blockTime = 12}};

    chain.advance(5);
    EXPECT_EQ(chain.blockNumber(), 105);
    EXPECT_EQ(chain.timestamp(), 1'060);

    chain.roll(110);
    chain.warp(2'000);
    EXPECT_EQ(chain.blockNumber(), 110);
    EXPECT_EQ(chain.timestamp(), 2'000);

    EXPECT_THROW(chain.roll(109), std::invalid_argument);
    EXPECT_THROW(chain.warp(1'999), std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST(ChainTest, ZeroBlockTimeIsRejected)
{
    EXPECT_THROW(Chain{ChainDesc{.blockTime = 0}}, std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST(ChainTest, AddressesAreUnique)
{
    Chain chain;
    const Address first = chain.allocateAddress();
    const Address second = chain.allocateAddress();
    EXPECT_NE(first, second);
    EXPECT_NE(first, ADDRESS_ZERO);
}

//-------------------------------------------------------------------------

TEST(ChainTest, ContractRegistry)
{
    Chain chain;
    FixedRateSwap swap{chain};

    EXPECT_FALSE(chain.isContract(swap.address()));
    EXPECT_THROW(static_cast<void>(chain.contractAt(swap.address())), TargetContractNotAllowedException);

    chain.registerContract(&swap);
    EXPECT_TRUE(chain.isContract(swap.address()));
    EXPECT_EQ(&chain.contractAt(swap.address()), &swap);
    EXPECT_THROW(chain.registerContract(&swap), std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST(ChainTest, DebugTraceMayThrow)
{
    Chain chain;
    EXPECT_FALSE(noexcept(chain.logDebug("block {}", chain.blockNumber())));

    chain.setDebug(true);
    EXPECT_NO_THROW(chain.logDebug("block {}", chain.blockNumber()));
}

//-------------------------------------------------------------------------

TEST(WETHGatewayTest, WrapsAndUnwraps)
{
    Chain chain;
    auto& ledger = chain.ledger();
    const Address weth = ledger.addToken("WETH", 18);
    const Address eth = ledger.addToken("ETH", 18);
    WETHGateway gateway{chain, weth, eth};

    const Address alice = chain.allocateAddress();
    const Address bob = chain.allocateAddress();
    ledger.mint(eth, alice, 10_wad);

    gateway.deposit(alice, 4_wad);
    EXPECT_EQ(ledger.balanceOf(eth, alice), 6_wad);
    EXPECT_EQ(ledger.balanceOf(weth, alice), 4_wad);

    gateway.withdrawTo(alice, bob, 3_wad);
    EXPECT_EQ(ledger.balanceOf(weth, alice), 1_wad);
    EXPECT_EQ(ledger.balanceOf(eth, bob), 3_wad);
    EXPECT_EQ(ledger.totalSupply(weth), 1_wad);
    EXPECT_EQ(ledger.totalSupply(eth), 9_wad);
}

//-------------------------------------------------------------------------

struct FixedRateSwapTest : public Test
{
    virtual void SetUp() override
    {
        usdc = chain.ledger().addToken("USDC", 6);
        weth = chain.ledger().addToken("WETH", 18);
        trader = chain.allocateAddress();
        chain.ledger().mint(usdc, swap.address(), 1'000'000'000'000);
        chain.ledger().mint(weth, trader, 2_wad);
        chain.ledger().approve(weth, trader, swap.address(), TokenLedger::maxAllowance());
    }

    Chain chain;
    FixedRateSwap swap{chain};
    Address usdc;
    Address weth;
    Address trader;
};

TEST_F(FixedRateSwapTest, QuoteAndSwap)
{
    // 1 WETH -> 2000 USDC.
    swap.setRate(weth, usdc, 2'000'000'000);

    EXPECT_EQ(swap.quote(weth, usdc, 1_wad), 2'000'000'000);

    const auto out = swap.call(trader, FixedRateSwap::encodeSwapExactIn(weth, usdc, 1_wad, 2'000'000'000));
    EXPECT_THAT(out, ElementsAre(uint256_t{2'000'000'000}));
    EXPECT_EQ(chain.ledger().balanceOf(weth, trader), 1_wad);
    EXPECT_EQ(chain.ledger().balanceOf(usdc, trader), 2'000'000'000);
    EXPECT_EQ(chain.ledger().balanceOf(weth, swap.address()), 1_wad);
}

TEST_F(FixedRateSwapTest, SlippageGuard)
{
    // 1 WETH -> 2000 USDC.
    swap.setRate(weth, usdc, 2'000'000'000);
    EXPECT_THROW(
        swap.swapExactIn(trader, weth, usdc, 1_wad, 2'000'000'001), BalanceLessThanExpectedException);
    EXPECT_EQ(chain.ledger().balanceOf(weth, trader), 2_wad);
}

TEST_F(FixedRateSwapTest, RejectsUnknownCalls)
{
    EXPECT_THROW(swap.call(trader, CallData{.selector = 99}), UnknownMethodException);
    EXPECT_THROW(
        swap.call(trader, CallData{.selector = 1, .args = {weth}}), IncorrectParameterException);
    EXPECT_THROW(static_cast<void>(swap.rate(usdc, weth)), TokenNotAllowedException);
    EXPECT_THROW(swap.setRate(weth, weth, 1), std::invalid_argument);
}

//-------------------------------------------------------------------------
