/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace creditsim::oracle
{

//-------------------------------------------------------------------------

/**
 * Token <-> USD conversion. USD values carry 8 decimals. Conversions must be
 * deterministic and monotonic in the amount for a given block.
 */
class PriceOracle
{
public:
    virtual ~PriceOracle() noexcept = default;

    [[nodiscard]] virtual uint256_t convertToUSD(const uint256_t& amount, Address token) const = 0;
    [[nodiscard]] virtual uint256_t convertFromUSD(const uint256_t& amount, Address token) const = 0;
    [[nodiscard]] virtual bool hasPriceFeed(Address token) const noexcept = 0;

    [[nodiscard]] uint256_t convert(const uint256_t& amount, Address tokenFrom, Address tokenTo) const
    {
        return convertFromUSD(convertToUSD(amount, tokenFrom), tokenTo);
    }

protected:
    PriceOracle() noexcept = default;
};

//-------------------------------------------------------------------------

}  // namespace creditsim::oracle

//-------------------------------------------------------------------------
