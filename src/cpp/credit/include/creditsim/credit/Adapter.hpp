/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "BitMask.hpp"
#include "common.hpp"
#include "creditsim/simulation/CallData.hpp"

//-------------------------------------------------------------------------

namespace creditsim::credit
{

//-------------------------------------------------------------------------

struct AdapterResult
{
    TokenMask tokensToEnable;
    TokenMask tokensToDisable;
};

//-------------------------------------------------------------------------

/**
 * Registered proxy through which the active credit account calls a target
 * contract. Adapters never hold funds: they approve and execute through the
 * credit manager, which performs the call as the account.
 *
 * Called by the credit facade with the raw multicall data; the return words
 * are the masks of the tokens to enable and disable.
 */
class Adapter : public simulation::ExternalContract
{
public:
    [[nodiscard]] virtual Address targetContract() const noexcept = 0;
    [[nodiscard]] virtual Address creditManager() const noexcept = 0;

    [[nodiscard]] static std::vector<uint256_t> encodeResult(const AdapterResult& result);
    [[nodiscard]] static AdapterResult decodeResult(std::span<const uint256_t> words);

protected:
    Adapter() noexcept = default;
};

//-------------------------------------------------------------------------

}  // namespace creditsim::credit

//-------------------------------------------------------------------------
