/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "creditsim/accounting/CollateralDebtData.hpp"
#include "creditsim/accounting/Fees.hpp"

//-------------------------------------------------------------------------

namespace creditsim::accounting
{

//-------------------------------------------------------------------------

enum class ClosureKind : uint8_t
{
    CLOSE,
    LIQUIDATE,
    LIQUIDATE_EXPIRED
};

struct DebtIncrease
{
    uint256_t newDebt;
    uint256_t newCumulativeIndex;
};

struct DebtDecrease
{
    uint256_t newDebt;
    uint256_t newCumulativeIndex;
    uint256_t profit;
    uint256_t newCumulativeQuotaInterest;
    uint256_t newQuotaFees;
};

struct ClosePayments
{
    uint256_t amountToPool;
    uint256_t remainingFunds;
    uint256_t profit;
    uint256_t loss;
};

//-------------------------------------------------------------------------

[[nodiscard]] uint256_t calcAccruedInterest(
    const uint256_t& amount, const uint256_t& cumulativeIndexLastUpdate, const uint256_t& cumulativeIndexNow);

/**
 * Adds `amount` to the principal and moves the index so that the interest
 * accrued so far is unchanged.
 */
[[nodiscard]] DebtIncrease calcIncrease(
    const uint256_t& amount,
    const uint256_t& debt,
    const uint256_t& cumulativeIndexNow,
    const uint256_t& cumulativeIndexLastUpdate);

/**
 * Repays `amount` in the order quota fees, quota interest, base interest,
 * principal. Interest repayments carry the interest fee, which is reported as
 * profit. A partially repaid base interest moves the index so that the rest
 * keeps accruing.
 */
[[nodiscard]] DebtDecrease calcDecrease(
    const uint256_t& amount,
    const uint256_t& debt,
    const uint256_t& cumulativeIndexNow,
    const uint256_t& cumulativeIndexLastUpdate,
    const uint256_t& cumulativeQuotaInterest,
    const uint256_t& quotaFees,
    uint16_t feeInterest);

[[nodiscard]] uint256_t calcTotalDebt(const CollateralDebtData& cdd);

[[nodiscard]] uint256_t calcDebtWithInterest(const CollateralDebtData& cdd);

[[nodiscard]] std::pair<uint16_t, uint16_t> liquidationParams(
    ClosureKind kind, const CreditFees& fees) noexcept;

/**
 * Splits the account's total value between the pool, the borrower and the
 * shortfall:
 *   amountToPool + remainingFunds + loss == max(totalValue, required)
 */
[[nodiscard]] ClosePayments calcClosePayments(
    ClosureKind kind, const CollateralDebtData& cdd, const CreditFees& fees);

//-------------------------------------------------------------------------

}  // namespace creditsim::accounting

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<creditsim::accounting::ClosePayments>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const creditsim::accounting::ClosePayments& payments, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "ClosePayments{{.amountToPool = {}, .remainingFunds = {}, .profit = {}, .loss = {}}}",
            payments.amountToPool,
            payments.remainingFunds,
            payments.profit,
            payments.loss);
    }
};

//-------------------------------------------------------------------------
