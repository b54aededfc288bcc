/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/accounting/CollateralTokenData.hpp"

//-------------------------------------------------------------------------

namespace creditsim::accounting
{

//-------------------------------------------------------------------------

uint16_t calcLiquidationThreshold(const CollateralTokenData& data, Timestamp now) noexcept
{
    if (now <= data.timestampRampStart) return data.ltInitial;

    const Timestamp end = data.timestampRampStart + data.rampDuration;
    if (now >= end) return data.ltFinal;

    return static_cast<uint16_t>(
        (uint64_t{data.ltInitial} * (end - now) + uint64_t{data.ltFinal} * (now - data.timestampRampStart))
        / data.rampDuration);
}

//-------------------------------------------------------------------------

}  // namespace creditsim::accounting

//-------------------------------------------------------------------------
