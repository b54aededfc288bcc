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

enum class DebtDirection : uint8_t
{
    NONE,
    INCREASE,
    DECREASE
};

inline constexpr uint16_t BOT_PERMISSIONS_SET_FLAG = 1;
inline constexpr uint16_t WITHDRAWAL_FLAG = 1 << 1;

//-------------------------------------------------------------------------

struct CreditAccountInfo
{
    uint256_t debt{};
    uint256_t cumulativeIndexLastUpdate{};
    uint256_t cumulativeQuotaInterest{};
    uint256_t quotaFees{};
    TokenMask enabledTokensMask{};
    uint16_t flags{};
    BlockNumber lastDebtUpdate{};
    DebtDirection lastDebtDirection{DebtDirection::NONE};
    Address borrower{};
    BlockNumber since{};
};

//-------------------------------------------------------------------------

}  // namespace creditsim::accounting

//-------------------------------------------------------------------------
