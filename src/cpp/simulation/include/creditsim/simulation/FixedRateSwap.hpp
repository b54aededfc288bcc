/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "creditsim/simulation/CallData.hpp"

//-------------------------------------------------------------------------

namespace creditsim::simulation
{

//-------------------------------------------------------------------------

class Chain;

enum class SwapSelector : uint32_t
{
    // tokenIn, tokenOut, amountIn, minAmountOut -> amountOut
    SWAP_EXACT_IN = 1
};

/**
 * Swap venue quoting every pair at a configured WAD rate of raw tokenOut
 * units per raw tokenIn unit. Output is paid from the reserves held at the
 * venue's address.
 */
class FixedRateSwap : public ExternalContract
{
public:
    explicit FixedRateSwap(Chain& chain);

    [[nodiscard]] virtual Address address() const noexcept override { return m_address; }

    virtual std::vector<uint256_t> call(Address caller, const CallData& data) override;

    void setRate(Address tokenIn, Address tokenOut, const uint256_t& rate);
    [[nodiscard]] uint256_t rate(Address tokenIn, Address tokenOut) const;
    [[nodiscard]] uint256_t quote(Address tokenIn, Address tokenOut, const uint256_t& amountIn) const;

    uint256_t swapExactIn(
        Address caller,
        Address tokenIn,
        Address tokenOut,
        const uint256_t& amountIn,
        const uint256_t& minAmountOut);

    [[nodiscard]] static CallData encodeSwapExactIn(
        Address tokenIn, Address tokenOut, const uint256_t& amountIn, const uint256_t& minAmountOut);

private:
    Chain& m_chain;
    Address m_address;
    std::map<std::pair<Address, Address>, uint256_t> m_rates;
};

//-------------------------------------------------------------------------

}  // namespace creditsim::simulation

//-------------------------------------------------------------------------
