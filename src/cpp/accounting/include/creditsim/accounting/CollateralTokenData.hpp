/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "BitMask.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

namespace creditsim::accounting
{

//-------------------------------------------------------------------------

struct CollateralTokenData
{
    Address token{};
    TokenMask mask{};
    uint16_t ltInitial{};
    uint16_t ltFinal{};
    Timestamp timestampRampStart{};
    uint32_t rampDuration{};
};

/**
 * Liquidation threshold at `now`: linear from ltInitial to ltFinal over
 * [timestampRampStart, timestampRampStart + rampDuration], clamped outside.
 */
[[nodiscard]] uint16_t calcLiquidationThreshold(
    const CollateralTokenData& data, Timestamp now) noexcept;

//-------------------------------------------------------------------------

}  // namespace creditsim::accounting

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<creditsim::accounting::CollateralTokenData>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const creditsim::accounting::CollateralTokenData& data, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "CollateralTokenData{{.token = {:#x}, .mask = {}, .ltInitial = {}, .ltFinal = {}, "
            ".timestampRampStart = {}, .rampDuration = {}}}",
            data.token,
            data.mask,
            data.ltInitial,
            data.ltFinal,
            data.timestampRampStart,
            data.rampDuration);
    }
};

//-------------------------------------------------------------------------
