/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/accounting/CreditLogic.hpp"

#include "CreditException.hpp"

//-------------------------------------------------------------------------

namespace creditsim::accounting
{

//-------------------------------------------------------------------------

using numeric::INDEX_PRECISION;
using numeric::PERCENTAGE_FACTOR;

//-------------------------------------------------------------------------

uint256_t calcAccruedInterest(
    const uint256_t& amount, const uint256_t& cumulativeIndexLastUpdate, const uint256_t& cumulativeIndexNow)
{
    if (amount == 0) return {};
    return numeric::mulDiv(amount, cumulativeIndexNow, cumulativeIndexLastUpdate) - amount;
}

//-------------------------------------------------------------------------

DebtIncrease calcIncrease(
    const uint256_t& amount,
    const uint256_t& debt,
    const uint256_t& cumulativeIndexNow,
    const uint256_t& cumulativeIndexLastUpdate)
{
    if (debt == 0) {
        return {.newDebt = amount, .newCumulativeIndex = cumulativeIndexNow};
    }
    const uint256_t newDebt = debt + amount;
    const uint256_t denominator =
        numeric::mulDiv(INDEX_PRECISION * cumulativeIndexNow, debt, cumulativeIndexLastUpdate)
        + INDEX_PRECISION * amount;
    return {
        .newDebt = newDebt,
        .newCumulativeIndex = numeric::mulDiv(cumulativeIndexNow, newDebt * INDEX_PRECISION, denominator)
    };
}

//-------------------------------------------------------------------------

DebtDecrease calcDecrease(
    const uint256_t& amount,
    const uint256_t& debt,
    const uint256_t& cumulativeIndexNow,
    const uint256_t& cumulativeIndexLastUpdate,
    const uint256_t& cumulativeQuotaInterest,
    const uint256_t& quotaFees,
    uint16_t feeInterest)
{
    DebtDecrease res{
        .newCumulativeIndex = cumulativeIndexLastUpdate,
        .newCumulativeQuotaInterest = cumulativeQuotaInterest,
        .newQuotaFees = quotaFees
    };
    uint256_t amountToRepay = amount;

    if (quotaFees != 0) {
        if (amountToRepay > quotaFees) {
            res.newQuotaFees = 0;
            amountToRepay -= quotaFees;
            res.profit = quotaFees;
        } else {
            res.newQuotaFees = quotaFees - amountToRepay;
            res.profit = amountToRepay;
            amountToRepay = 0;
        }
    }

    if (cumulativeQuotaInterest != 0 && amountToRepay != 0) {
        const uint256_t quotaProfit = numeric::percentMul(cumulativeQuotaInterest, feeInterest);
        if (amountToRepay >= cumulativeQuotaInterest + quotaProfit) {
            amountToRepay -= cumulativeQuotaInterest + quotaProfit;
            res.profit += quotaProfit;
            res.newCumulativeQuotaInterest = 0;
        } else {
            const uint256_t amountToPool = numeric::mulDiv(
                amountToRepay, PERCENTAGE_FACTOR, uint256_t{PERCENTAGE_FACTOR + feeInterest});
            res.profit += amountToRepay - amountToPool;
            res.newCumulativeQuotaInterest = cumulativeQuotaInterest - amountToPool;
            amountToRepay = 0;
        }
    }

    if (amountToRepay != 0) {
        const uint256_t interestAccrued =
            calcAccruedInterest(debt, cumulativeIndexLastUpdate, cumulativeIndexNow);
        const uint256_t profitFromInterest = numeric::percentMul(interestAccrued, feeInterest);
        if (amountToRepay >= interestAccrued + profitFromInterest) {
            amountToRepay -= interestAccrued + profitFromInterest;
            res.profit += profitFromInterest;
            res.newCumulativeIndex = cumulativeIndexNow;
        } else {
            const uint256_t amountToPool = numeric::mulDiv(
                amountToRepay, PERCENTAGE_FACTOR, uint256_t{PERCENTAGE_FACTOR + feeInterest});
            res.profit += amountToRepay - amountToPool;
            amountToRepay = 0;
            res.newCumulativeIndex = numeric::mulDiv(
                INDEX_PRECISION * cumulativeIndexNow,
                cumulativeIndexLastUpdate,
                INDEX_PRECISION * cumulativeIndexNow
                    - numeric::mulDiv(INDEX_PRECISION * amountToPool, cumulativeIndexLastUpdate, debt));
        }
    }

    if (amountToRepay > debt) {
        throw IncorrectParameterException{fmt::format(
            "repayment {} exceeds the total debt by {}", amount, amountToRepay - debt)};
    }
    res.newDebt = debt - amountToRepay;

    return res;
}

//-------------------------------------------------------------------------

uint256_t calcTotalDebt(const CollateralDebtData& cdd)
{
    return cdd.debt + cdd.accruedInterest + cdd.accruedFees;
}

//-------------------------------------------------------------------------

uint256_t calcDebtWithInterest(const CollateralDebtData& cdd)
{
    return cdd.debt + cdd.accruedInterest;
}

//-------------------------------------------------------------------------

std::pair<uint16_t, uint16_t> liquidationParams(ClosureKind kind, const CreditFees& fees) noexcept
{
    switch (kind) {
        case ClosureKind::LIQUIDATE_EXPIRED:
            return {fees.liquidationDiscountExpired, fees.feeLiquidationExpired};
        case ClosureKind::LIQUIDATE:
            return {fees.liquidationDiscount, fees.feeLiquidation};
        default:
            return {PERCENTAGE_FACTOR, 0};
    }
}

//-------------------------------------------------------------------------

ClosePayments calcClosePayments(ClosureKind kind, const CollateralDebtData& cdd, const CreditFees& fees)
{
    const uint256_t debtWithInterest = calcDebtWithInterest(cdd);
    const uint256_t& totalValue = cdd.totalValue;

    ClosePayments res{};

    if (kind == ClosureKind::CLOSE) {
        res.amountToPool = calcTotalDebt(cdd);
        res.remainingFunds = numeric::saturatingSub(totalValue, res.amountToPool);
    } else {
        const auto [discount, feeLiquidation] = liquidationParams(kind, fees);
        const uint256_t required = numeric::percentMul(debtWithInterest, discount)
            + numeric::percentMul(totalValue, feeLiquidation);
        if (totalValue >= required) {
            res.amountToPool = required;
            res.remainingFunds = totalValue - required;
        } else {
            res.amountToPool = totalValue;
            res.loss = required - totalValue;
        }
    }

    res.profit = numeric::saturatingSub(res.amountToPool, debtWithInterest);

    return res;
}

//-------------------------------------------------------------------------

}  // namespace creditsim::accounting

//-------------------------------------------------------------------------
