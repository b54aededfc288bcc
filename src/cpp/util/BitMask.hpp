/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/iota.hpp>

#include <cstdint>

//-------------------------------------------------------------------------

namespace creditsim
{

using TokenMask = boost::multiprecision::uint256_t;

inline const TokenMask UNDERLYING_TOKEN_MASK{1};

inline constexpr uint32_t kMaxTokenSlots = 256;

}  // namespace creditsim

//-------------------------------------------------------------------------

namespace creditsim::bitmask
{

//-------------------------------------------------------------------------

[[nodiscard]] TokenMask tokenMask(uint32_t index);

/**
 * Position of the single set bit of `mask`. Throws IncorrectBitMaskException
 * when `mask` does not have exactly one bit set.
 */
[[nodiscard]] uint32_t calcIndex(const TokenMask& mask);

[[nodiscard]] uint32_t calcEnabledTokens(TokenMask mask) noexcept;

[[nodiscard]] inline TokenMask enable(const TokenMask& mask, const TokenMask& bits) noexcept
{
    return mask | bits;
}

[[nodiscard]] inline TokenMask disable(const TokenMask& mask, const TokenMask& bits) noexcept
{
    return mask & ~bits;
}

[[nodiscard]] inline bool contains(const TokenMask& mask, const TokenMask& bits) noexcept
{
    return bits != 0 && (mask & bits) == bits;
}

[[nodiscard]] inline bool isSingleBit(const TokenMask& mask) noexcept
{
    return mask != 0 && (mask & (mask - 1)) == 0;
}

[[nodiscard]] TokenMask enableWithSkip(
    const TokenMask& mask, const TokenMask& bitsToEnable, const TokenMask& skipMask) noexcept;

[[nodiscard]] TokenMask disableWithSkip(
    const TokenMask& mask, const TokenMask& bitsToDisable, const TokenMask& skipMask) noexcept;

//-------------------------------------------------------------------------

/**
 * Lazy ascending sequence of the positions of the set bits of `mask`.
 */
[[nodiscard]] inline auto setBits(const TokenMask& mask)
{
    const uint32_t end = mask == 0 ? 0u : static_cast<uint32_t>(boost::multiprecision::msb(mask)) + 1;
    return ranges::views::iota(0u, end)
        | ranges::views::filter([mask](uint32_t index) { return boost::multiprecision::bit_test(mask, index); });
}

//-------------------------------------------------------------------------

}  // namespace creditsim::bitmask

//-------------------------------------------------------------------------
