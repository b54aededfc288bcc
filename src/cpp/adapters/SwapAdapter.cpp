/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/adapters/SwapAdapter.hpp"

#include "CreditException.hpp"
#include "creditsim/credit/CreditManager.hpp"
#include "creditsim/simulation/Chain.hpp"
#include "creditsim/simulation/FixedRateSwap.hpp"
#include "creditsim/simulation/TokenLedger.hpp"

//-------------------------------------------------------------------------

namespace creditsim::adapters
{

//-------------------------------------------------------------------------

SwapAdapter::SwapAdapter(
    simulation::Chain& chain,
    credit::CreditManager& creditManager,
    simulation::FixedRateSwap& swap)
    : m_chain{chain},
      m_creditManager{creditManager},
      m_swap{swap},
      m_address{chain.allocateAddress()}
{}

//-------------------------------------------------------------------------

Address SwapAdapter::targetContract() const noexcept
{
    return m_swap.address();
}

//-------------------------------------------------------------------------

Address SwapAdapter::creditManager() const noexcept
{
    return m_creditManager.address();
}

//-------------------------------------------------------------------------

std::vector<uint256_t> SwapAdapter::call(Address caller, const simulation::CallData& data)
{
    if (caller != m_creditManager.creditFacade()) {
        throw CallerNotCreditFacadeException{fmt::format("{:#x}", caller)};
    }

    const auto selector = magic_enum::enum_cast<SwapAdapterSelector>(data.selector);
    if (!selector.has_value()) {
        throw UnknownMethodException{fmt::format("SwapAdapter: selector {:#010x}", data.selector)};
    }
    const auto& args = data.args;

    switch (*selector) {
        case SwapAdapterSelector::SWAP_EXACT_IN: {
            if (args.size() != 4) {
                throw IncorrectParameterException{fmt::format(
                    "SWAP_EXACT_IN takes 4 arguments, got {}", args.size())};
            }
            return encodeResult(executeSwap(
                simulation::argToAddress(args[0]),
                simulation::argToAddress(args[1]),
                args[2],
                args[3],
                false));
        }
        case SwapAdapterSelector::SWAP_ALL: {
            if (args.size() != 3) {
                throw IncorrectParameterException{fmt::format(
                    "SWAP_ALL takes 3 arguments, got {}", args.size())};
            }
            const Address tokenIn = simulation::argToAddress(args[0]);
            const Address tokenOut = simulation::argToAddress(args[1]);
            const Address creditAccount = m_creditManager.getActiveCreditAccountOrRevert();
            const uint256_t balance = m_chain.ledger().balanceOf(tokenIn, creditAccount);
            if (balance <= 1) {
                return encodeResult({});
            }
            const uint256_t amountIn = balance - 1;
            return encodeResult(executeSwap(
                tokenIn,
                tokenOut,
                amountIn,
                numeric::mulDiv(amountIn, args[2], numeric::RAY),
                true));
        }
    }
    std::unreachable();
}

//-------------------------------------------------------------------------

credit::MultiCall SwapAdapter::swapExactIn(
    Address tokenIn, Address tokenOut, const uint256_t& amountIn, const uint256_t& minAmountOut) const
{
    return {
        .target = m_address,
        .callData = {
            .selector = std::to_underlying(SwapAdapterSelector::SWAP_EXACT_IN),
            .args = {tokenIn, tokenOut, amountIn, minAmountOut}
        }
    };
}

//-------------------------------------------------------------------------

credit::MultiCall SwapAdapter::swapAll(Address tokenIn, Address tokenOut, const uint256_t& minRateRAY) const
{
    return {
        .target = m_address,
        .callData = {
            .selector = std::to_underlying(SwapAdapterSelector::SWAP_ALL),
            .args = {tokenIn, tokenOut, minRateRAY}
        }
    };
}

//-------------------------------------------------------------------------

credit::AdapterResult SwapAdapter::executeSwap(
    Address tokenIn,
    Address tokenOut,
    const uint256_t& amountIn,
    const uint256_t& minAmountOut,
    bool disableTokenIn)
{
    const TokenMask tokenInMask = m_creditManager.getTokenMaskOrRevert(tokenIn);
    const TokenMask tokenOutMask = m_creditManager.getTokenMaskOrRevert(tokenOut);

    m_creditManager.approveCreditAccount(m_address, tokenIn, amountIn);
    const auto words = m_creditManager.execute(
        m_address, simulation::FixedRateSwap::encodeSwapExactIn(tokenIn, tokenOut, amountIn, minAmountOut));
    m_creditManager.approveCreditAccount(m_address, tokenIn, 1);

    m_chain.logDebug(
        "ADAPTER : Swapped {} {} for {} {}",
        amountIn,
        m_chain.ledger().symbol(tokenIn),
        words.empty() ? uint256_t{} : words.front(),
        m_chain.ledger().symbol(tokenOut));

    return {
        .tokensToEnable = tokenOutMask,
        .tokensToDisable = disableTokenIn ? tokenInMask : TokenMask{}
    };
}

//-------------------------------------------------------------------------

}  // namespace creditsim::adapters

//-------------------------------------------------------------------------
