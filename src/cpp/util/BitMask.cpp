/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "BitMask.hpp"

#include "CreditException.hpp"

//-------------------------------------------------------------------------

namespace creditsim::bitmask
{

//-------------------------------------------------------------------------

TokenMask tokenMask(uint32_t index)
{
    if (index >= kMaxTokenSlots) {
        throw IncorrectBitMaskException{fmt::format("token index {} is out of range", index)};
    }
    return TokenMask{1} << index;
}

//-------------------------------------------------------------------------

uint32_t calcIndex(const TokenMask& mask)
{
    if (!isSingleBit(mask)) {
        throw IncorrectBitMaskException{fmt::format("mask {} does not have exactly one bit set", mask)};
    }
    return static_cast<uint32_t>(boost::multiprecision::lsb(mask));
}

//-------------------------------------------------------------------------

uint32_t calcEnabledTokens(TokenMask mask) noexcept
{
    uint32_t count{};
    while (mask != 0) {
        mask &= mask - 1;
        ++count;
    }
    return count;
}

//-------------------------------------------------------------------------

TokenMask enableWithSkip(
    const TokenMask& mask, const TokenMask& bitsToEnable, const TokenMask& skipMask) noexcept
{
    return mask | (bitsToEnable & ~skipMask);
}

//-------------------------------------------------------------------------

TokenMask disableWithSkip(
    const TokenMask& mask, const TokenMask& bitsToDisable, const TokenMask& skipMask) noexcept
{
    return mask & ~(bitsToDisable & ~skipMask);
}

//-------------------------------------------------------------------------

}  // namespace creditsim::bitmask

//-------------------------------------------------------------------------
