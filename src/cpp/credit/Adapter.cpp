/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/credit/Adapter.hpp"

#include "CreditException.hpp"

//-------------------------------------------------------------------------

namespace creditsim::credit
{

//-------------------------------------------------------------------------

std::vector<uint256_t> Adapter::encodeResult(const AdapterResult& result)
{
    return {
        static_cast<uint256_t>(result.tokensToEnable),
        static_cast<uint256_t>(result.tokensToDisable)
    };
}

//-------------------------------------------------------------------------

AdapterResult Adapter::decodeResult(std::span<const uint256_t> words)
{
    if (words.size() != 2) {
        throw IncorrectParameterException{fmt::format(
            "adapter returned {} words, expected 2", words.size())};
    }
    return {
        .tokensToEnable = static_cast<TokenMask>(words[0]),
        .tokensToDisable = static_cast<TokenMask>(words[1])
    };
}

//-------------------------------------------------------------------------

}  // namespace creditsim::credit

//-------------------------------------------------------------------------
