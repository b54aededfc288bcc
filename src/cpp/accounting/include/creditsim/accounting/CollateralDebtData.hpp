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

enum class CollateralCalcTask : uint8_t
{
    GENERIC_PARAMS,
    DEBT_ONLY,
    FULL_COLLATERAL_CHECK_LAZY,
    DEBT_COLLATERAL,
    // DEBT_COLLATERAL plus the value of withdrawals a liquidation would cancel.
    DEBT_COLLATERAL_CANCEL_WITHDRAWALS,
    DEBT_COLLATERAL_FORCE_CANCEL_WITHDRAWALS
};

/**
 * Snapshot of an account's debt and, depending on the task it was computed
 * for, its collateral. Values suffixed USD carry 8 decimals; the rest are in
 * underlying units.
 */
struct CollateralDebtData
{
    uint256_t debt{};
    uint256_t cumulativeIndexNow{};
    uint256_t cumulativeIndexLastUpdate{};
    uint256_t cumulativeQuotaInterest{};
    uint256_t quotaFees{};
    uint256_t accruedInterest{};
    uint256_t accruedFees{};
    uint256_t totalDebtUSD{};
    uint256_t totalValue{};
    uint256_t totalValueUSD{};
    uint256_t twvUSD{};
    TokenMask enabledTokensMask{};
    TokenMask quotedTokensMask{};
    std::vector<Address> quotedTokens;
};

//-------------------------------------------------------------------------

}  // namespace creditsim::accounting

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<creditsim::accounting::CollateralDebtData>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const creditsim::accounting::CollateralDebtData& cdd, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "CollateralDebtData{{.debt = {}, .accruedInterest = {}, .accruedFees = {}, "
            ".totalDebtUSD = {}, .totalValue = {}, .totalValueUSD = {}, .twvUSD = {}, "
            ".enabledTokensMask = {}}}",
            cdd.debt,
            cdd.accruedInterest,
            cdd.accruedFees,
            cdd.totalDebtUSD,
            cdd.totalValue,
            cdd.totalValueUSD,
            cdd.twvUSD,
            cdd.enabledTokensMask);
    }
};

//-------------------------------------------------------------------------
