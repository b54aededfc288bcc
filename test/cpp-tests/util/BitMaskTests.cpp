/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "BitMask.hpp"
#include "CreditException.hpp"
#include "formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <range/v3/all.hpp>

//-------------------------------------------------------------------------

using namespace creditsim;
using namespace testing;

//-------------------------------------------------------------------------

TEST(BitMaskTest, TokenMaskAndIndexAreInverse)
{
    for (uint32_t index : {0u, 1u, 7u, 64u, 128u, 255u}) {
        EXPECT_EQ(bitmask::calcIndex(bitmask::tokenMask(index)), index);
    }
    EXPECT_EQ(bitmask::tokenMask(0), UNDERLYING_TOKEN_MASK);
    EXPECT_THROW(static_cast<void>(bitmask::tokenMask(kMaxTokenSlots)), IncorrectBitMaskException);
}

//-------------------------------------------------------------------------

TEST(BitMaskTest, CalcIndexRejectsMultipleBits)
{
    EXPECT_THROW(static_cast<void>(bitmask::calcIndex(TokenMask{0})), IncorrectBitMaskException);
    EXPECT_THROW(static_cast<void>(bitmask::calcIndex(TokenMask{0b110})), IncorrectBitMaskException);
}

//-------------------------------------------------------------------------

TEST(BitMaskTest, CalcEnabledTokens)
{
    EXPECT_EQ(bitmask::calcEnabledTokens(TokenMask{0}), 0);
    EXPECT_EQ(bitmask::calcEnabledTokens(TokenMask{0b1011}), 3);
    EXPECT_EQ(bitmask::calcEnabledTokens(bitmask::tokenMask(255) | bitmask::tokenMask(3)), 2);
}

//-------------------------------------------------------------------------

TEST(BitMaskTest, EnableDisableRespectSkipMask)
{
    const TokenMask mask{0b0011};

    EXPECT_EQ(bitmask::enable(mask, TokenMask{0b0100}), TokenMask{0b0111});
    EXPECT_EQ(bitmask::disable(mask, TokenMask{0b0001}), TokenMask{0b0010});

    EXPECT_EQ(bitmask::enableWithSkip(mask, TokenMask{0b1100}, TokenMask{0b1000}), TokenMask{0b0111});
    EXPECT_EQ(bitmask::disableWithSkip(mask, TokenMask{0b0011}, TokenMask{0b0001}), TokenMask{0b0001});
}

//-------------------------------------------------------------------------

TEST(BitMaskTest, SetBitsIteratesInAscendingOrder)
{
    const TokenMask mask = bitmask::tokenMask(9) | bitmask::tokenMask(0) | bitmask::tokenMask(200);

    std::vector<uint32_t> indices;
    for (uint32_t index : bitmask::setBits(mask)) {
        indices.push_back(index);
    }

    EXPECT_THAT(indices, ElementsAre(0u, 9u, 200u));
}

//-------------------------------------------------------------------------

TEST(BitMaskTest, SetBitsComposesWithViews)
{
    EXPECT_THAT(bitmask::setBits(TokenMask{}) | ranges::to<std::vector>(), IsEmpty());

    const TokenMask top = bitmask::tokenMask(kMaxTokenSlots - 1);
    EXPECT_THAT(bitmask::setBits(top) | ranges::to<std::vector>(), ElementsAre(kMaxTokenSlots - 1));

    const auto doubled = bitmask::setBits(TokenMask{0b1011})
        | ranges::views::transform([](uint32_t index) { return index * 2; })
        | ranges::to<std::vector>();
    EXPECT_THAT(doubled, ElementsAre(0u, 2u, 6u));
}

//-------------------------------------------------------------------------

struct EnableDisableIdempotenceTest : public TestWithParam<std::tuple<uint64_t, uint64_t, uint64_t>>
{};

INSTANTIATE_TEST_SUITE_P(
    BitMaskTest,
    EnableDisableIdempotenceTest,
    Combine(
        Values(uint64_t{0}, uint64_t{0b0001}, uint64_t{0b1011}, uint64_t{0xff00ff}),
        Values(uint64_t{0}, uint64_t{0b0010}, uint64_t{0b0110}, uint64_t{0xf0f0}),
        Values(uint64_t{0}, uint64_t{0b0001}, uint64_t{0b0100}, uint64_t{0xffff})));

TEST_P(EnableDisableIdempotenceTest, WorksCorrectly)
{
    const auto [maskBits, bits, skipBits] = GetParam();
    const TokenMask mask{maskBits};
    const TokenMask toggled{bits};
    const TokenMask skip{skipBits};

    const TokenMask enabled = bitmask::enableWithSkip(mask, toggled, skip);
    const TokenMask disabled = bitmask::disableWithSkip(mask, toggled, skip);

    EXPECT_EQ(bitmask::enableWithSkip(enabled, toggled, skip), enabled);
    EXPECT_EQ(bitmask::disableWithSkip(disabled, toggled, skip), disabled);
    EXPECT_EQ(bitmask::disableWithSkip(enabled, toggled, skip), disabled);
    EXPECT_EQ(bitmask::enableWithSkip(disabled, toggled, skip), enabled);
    EXPECT_EQ(bitmask::enable(bitmask::enable(mask, toggled), toggled), bitmask::enable(mask, toggled));
    EXPECT_EQ(bitmask::disable(bitmask::disable(mask, toggled), toggled), bitmask::disable(mask, toggled));

    // Skipped bits keep their state either way.
    EXPECT_EQ(enabled & skip, mask & skip);
    EXPECT_EQ(disabled & skip, mask & skip);
}

//-------------------------------------------------------------------------
