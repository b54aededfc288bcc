/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace creditsim::accounting
{

//-------------------------------------------------------------------------

// All values in bps.
struct CreditFees
{
    uint16_t feeInterest{};
    uint16_t feeLiquidation{};
    uint16_t liquidationDiscount{numeric::PERCENTAGE_FACTOR};
    uint16_t feeLiquidationExpired{};
    uint16_t liquidationDiscountExpired{numeric::PERCENTAGE_FACTOR};

    [[nodiscard]] bool operator==(const CreditFees& other) const noexcept = default;
};

//-------------------------------------------------------------------------

}  // namespace creditsim::accounting

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<creditsim::accounting::CreditFees>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const creditsim::accounting::CreditFees& fees, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "CreditFees{{.feeInterest = {}, .feeLiquidation = {}, .liquidationDiscount = {}, "
            ".feeLiquidationExpired = {}, .liquidationDiscountExpired = {}}}",
            fees.feeInterest,
            fees.feeLiquidation,
            fees.liquidationDiscount,
            fees.feeLiquidationExpired,
            fees.liquidationDiscountExpired);
    }
};

//-------------------------------------------------------------------------
