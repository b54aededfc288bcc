/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "BitMask.hpp"
#include "common.hpp"
#include "creditsim/oracle/PriceOracle.hpp"

//-------------------------------------------------------------------------

namespace creditsim::accounting
{

//-------------------------------------------------------------------------

// Balances at or below this are treated as empty.
inline constexpr uint64_t kEmptyBalance = 1;

struct CollateralCalcParams
{
    Address creditAccount{};
    TokenMask enabledTokensMask{};
    TokenMask quotedTokensMask{};
    std::span<const TokenMask> collateralHints{};
    // When set, valuation stops as soon as the TWV reaches it.
    std::optional<uint256_t> targetUSD{};
    Address underlying{};
};

struct CollateralToken
{
    Address token;
    uint16_t liquidationThreshold;
};

struct CollateralSources
{
    std::function<CollateralToken(const TokenMask&)> collateralTokenByMask;
    std::function<uint256_t(Address token)> balanceOf;
    std::function<uint256_t(Address token)> quotaOf;
    const oracle::PriceOracle& priceOracle;
};

struct CollateralResult
{
    uint256_t totalValueUSD;
    uint256_t twvUSD;
    TokenMask tokensToDisable;
    uint32_t tokensChecked;
};

//-------------------------------------------------------------------------

/**
 * Values the enabled tokens of an account. Hinted tokens go first, in the
 * order given, then the remaining enabled tokens in ascending bit order.
 *
 * Every hint must be a single bit of `enabledTokensMask`, otherwise
 * IncorrectTokenMaskException is thrown before any lookup. Quoted tokens
 * contribute at most their quota to the TWV. Empty non-underlying, non-quoted
 * tokens are reported in `tokensToDisable`; nothing is mutated here.
 */
[[nodiscard]] CollateralResult calcCollateral(
    const CollateralCalcParams& params, const CollateralSources& sources);

//-------------------------------------------------------------------------

}  // namespace creditsim::accounting

//-------------------------------------------------------------------------
