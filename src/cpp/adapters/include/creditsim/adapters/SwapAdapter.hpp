/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "creditsim/credit/Adapter.hpp"
#include "creditsim/credit/MultiCall.hpp"

//-------------------------------------------------------------------------

namespace creditsim::simulation
{
class Chain;
class FixedRateSwap;
}  // namespace creditsim::simulation

namespace creditsim::credit
{
class CreditManager;
}  // namespace creditsim::credit

//-------------------------------------------------------------------------

namespace creditsim::adapters
{

//-------------------------------------------------------------------------

/**
 * Adapter methods. Argument words, in order:
 *   SWAP_EXACT_IN  tokenIn, tokenOut, amountIn, minAmountOut
 *   SWAP_ALL       tokenIn, tokenOut, minRate (RAY, tokenOut per tokenIn)
 */
enum class SwapAdapterSelector : uint32_t
{
    SWAP_EXACT_IN = 1,
    SWAP_ALL
};

//-------------------------------------------------------------------------

class SwapAdapter : public credit::Adapter
{
public:
    SwapAdapter(
        simulation::Chain& chain,
        credit::CreditManager& creditManager,
        simulation::FixedRateSwap& swap);

    [[nodiscard]] virtual Address address() const noexcept override { return m_address; }
    [[nodiscard]] virtual Address targetContract() const noexcept override;
    [[nodiscard]] virtual Address creditManager() const noexcept override;

    virtual std::vector<uint256_t> call(Address caller, const simulation::CallData& data) override;

    [[nodiscard]] credit::MultiCall swapExactIn(
        Address tokenIn, Address tokenOut, const uint256_t& amountIn, const uint256_t& minAmountOut) const;
    [[nodiscard]] credit::MultiCall swapAll(
        Address tokenIn, Address tokenOut, const uint256_t& minRateRAY) const;

private:
    credit::AdapterResult executeSwap(
        Address tokenIn,
        Address tokenOut,
        const uint256_t& amountIn,
        const uint256_t& minAmountOut,
        bool disableTokenIn);

    simulation::Chain& m_chain;
    credit::CreditManager& m_creditManager;
    simulation::FixedRateSwap& m_swap;
    Address m_address;
};

//-------------------------------------------------------------------------

}  // namespace creditsim::adapters

//-------------------------------------------------------------------------
