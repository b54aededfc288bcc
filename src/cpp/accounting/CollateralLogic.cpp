/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/accounting/CollateralLogic.hpp"

#include "CreditException.hpp"

//-------------------------------------------------------------------------

namespace creditsim::accounting
{

//-------------------------------------------------------------------------

namespace
{

void validateHints(std::span<const TokenMask> hints, const TokenMask& enabledTokensMask)
{
    for (const auto& hint : hints) {
        if (!bitmask::isSingleBit(hint) || !bitmask::contains(enabledTokensMask, hint)) {
            throw IncorrectTokenMaskException{fmt::format(
                "collateral hint {} is not a single enabled token (enabled mask {})",
                hint, enabledTokensMask)};
        }
    }
}

}  // namespace

//-------------------------------------------------------------------------

CollateralResult calcCollateral(const CollateralCalcParams& params, const CollateralSources& sources)
{
    validateHints(params.collateralHints, params.enabledTokensMask);

    CollateralResult res{};

    auto targetReached = [&] {
        return params.targetUSD.has_value() && res.twvUSD >= *params.targetUSD;
    };

    auto processToken = [&](const TokenMask& mask) {
        const auto [token, lt] = sources.collateralTokenByMask(mask);
        const uint256_t balance = sources.balanceOf(token);
        ++res.tokensChecked;

        const bool quoted = bitmask::contains(params.quotedTokensMask, mask);
        if (balance <= kEmptyBalance) {
            if (!quoted && mask != UNDERLYING_TOKEN_MASK) {
                res.tokensToDisable |= mask;
            }
            return;
        }

        const uint256_t valueUSD = sources.priceOracle.convertToUSD(balance, token);
        res.totalValueUSD += valueUSD;

        if (quoted) {
            const uint256_t quotaUSD =
                sources.priceOracle.convertToUSD(sources.quotaOf(token), params.underlying);
            res.twvUSD += numeric::percentMul(std::min(valueUSD, quotaUSD), lt);
        } else {
            res.twvUSD += numeric::percentMul(valueUSD, lt);
        }
    };

    TokenMask remaining = params.enabledTokensMask;

    for (const auto& hint : params.collateralHints) {
        if ((remaining & hint) == 0) continue;
        if (targetReached()) return res;
        processToken(hint);
        remaining &= ~hint;
    }

    for (uint32_t index : bitmask::setBits(remaining)) {
        if (targetReached()) return res;
        processToken(bitmask::tokenMask(index));
    }

    return res;
}

//-------------------------------------------------------------------------

}  // namespace creditsim::accounting

//-------------------------------------------------------------------------
