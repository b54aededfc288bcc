/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/simulation/FixedRateSwap.hpp"

#include "CreditException.hpp"
#include "creditsim/simulation/Chain.hpp"
#include "creditsim/simulation/TokenLedger.hpp"

//-------------------------------------------------------------------------

namespace creditsim::simulation
{

//-------------------------------------------------------------------------

FixedRateSwap::FixedRateSwap(Chain& chain)
    : m_chain{chain}, m_address{chain.allocateAddress()}
{}

//-------------------------------------------------------------------------

std::vector<uint256_t> FixedRateSwap::call(Address caller, const CallData& data)
{
    if (data.selector != std::to_underlying(SwapSelector::SWAP_EXACT_IN)) {
        throw UnknownMethodException{fmt::format("FixedRateSwap: selector {:#010x}", data.selector)};
    }
    if (data.args.size() != 4) {
        throw IncorrectParameterException{fmt::format(
            "SWAP_EXACT_IN takes 4 arguments, got {}", data.args.size())};
    }
    return {swapExactIn(
        caller, argToAddress(data.args[0]), argToAddress(data.args[1]), data.args[2], data.args[3])};
}

//-------------------------------------------------------------------------

void FixedRateSwap::setRate(Address tokenIn, Address tokenOut, const uint256_t& rate)
{
    const auto& ledger = m_chain.ledger();
    if (!ledger.isToken(tokenIn) || !ledger.isToken(tokenOut) || tokenIn == tokenOut) {
        throw std::invalid_argument{fmt::format(
            "{}: Invalid pair {:#x}/{:#x}",
            std::source_location::current().function_name(), tokenIn, tokenOut)};
    }
    m_rates.insert_or_assign(std::make_pair(tokenIn, tokenOut), rate);
}

//-------------------------------------------------------------------------

uint256_t FixedRateSwap::rate(Address tokenIn, Address tokenOut) const
{
    auto it = m_rates.find(std::make_pair(tokenIn, tokenOut));
    if (it == m_rates.end()) {
        throw TokenNotAllowedException{fmt::format(
            "no rate for {}/{}", m_chain.ledger().symbol(tokenIn), m_chain.ledger().symbol(tokenOut))};
    }
    return it->second;
}

//-------------------------------------------------------------------------

uint256_t FixedRateSwap::quote(Address tokenIn, Address tokenOut, const uint256_t& amountIn) const
{
    return numeric::mulDiv(amountIn, rate(tokenIn, tokenOut), numeric::WAD);
}

//-------------------------------------------------------------------------

uint256_t FixedRateSwap::swapExactIn(
    Address caller,
    Address tokenIn,
    Address tokenOut,
    const uint256_t& amountIn,
    const uint256_t& minAmountOut)
{
    const uint256_t amountOut = quote(tokenIn, tokenOut, amountIn);
    if (amountOut < minAmountOut) {
        throw BalanceLessThanExpectedException{fmt::format(
            "swap returns {} {}, minimum {}", amountOut, m_chain.ledger().symbol(tokenOut), minAmountOut)};
    }

    auto& ledger = m_chain.ledger();
    ledger.transferFrom(tokenIn, m_address, caller, m_address, amountIn);
    ledger.transfer(tokenOut, m_address, caller, amountOut);

    m_chain.logDebug(
        "SWAP : {:#x} {} {} -> {} {}",
        caller, amountIn, ledger.symbol(tokenIn), amountOut, ledger.symbol(tokenOut));

    return amountOut;
}

//-------------------------------------------------------------------------

CallData FixedRateSwap::encodeSwapExactIn(
    Address tokenIn, Address tokenOut, const uint256_t& amountIn, const uint256_t& minAmountOut)
{
    return {
        .selector = std::to_underlying(SwapSelector::SWAP_EXACT_IN),
        .args = {tokenIn, tokenOut, amountIn, minAmountOut}
    };
}

//-------------------------------------------------------------------------

}  // namespace creditsim::simulation

//-------------------------------------------------------------------------
