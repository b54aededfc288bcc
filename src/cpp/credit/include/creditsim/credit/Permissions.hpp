/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <cstdint>

//-------------------------------------------------------------------------

namespace creditsim::credit
{

//-------------------------------------------------------------------------

inline constexpr uint32_t ADD_COLLATERAL_PERMISSION = 1 << 0;
inline constexpr uint32_t INCREASE_DEBT_PERMISSION = 1 << 1;
inline constexpr uint32_t DECREASE_DEBT_PERMISSION = 1 << 2;
inline constexpr uint32_t ENABLE_TOKEN_PERMISSION = 1 << 3;
inline constexpr uint32_t DISABLE_TOKEN_PERMISSION = 1 << 4;
inline constexpr uint32_t WITHDRAW_COLLATERAL_PERMISSION = 1 << 5;
inline constexpr uint32_t UPDATE_QUOTA_PERMISSION = 1 << 6;
inline constexpr uint32_t REVOKE_ALLOWANCES_PERMISSION = 1 << 7;

inline constexpr uint32_t EXTERNAL_CALLS_PERMISSION = 1 << 16;

inline constexpr uint32_t ALL_CREDIT_FACADE_CALLS_PERMISSION =
    ADD_COLLATERAL_PERMISSION
    | INCREASE_DEBT_PERMISSION
    | DECREASE_DEBT_PERMISSION
    | ENABLE_TOKEN_PERMISSION
    | DISABLE_TOKEN_PERMISSION
    | WITHDRAW_COLLATERAL_PERMISSION
    | UPDATE_QUOTA_PERMISSION
    | REVOKE_ALLOWANCES_PERMISSION;

inline constexpr uint32_t ALL_PERMISSIONS = ALL_CREDIT_FACADE_CALLS_PERMISSION | EXTERNAL_CALLS_PERMISSION;

inline constexpr uint32_t OPEN_CREDIT_ACCOUNT_PERMISSIONS = ALL_PERMISSIONS & ~DECREASE_DEBT_PERMISSION;
inline constexpr uint32_t CLOSE_CREDIT_ACCOUNT_PERMISSIONS = ALL_PERMISSIONS & ~INCREASE_DEBT_PERMISSION;
inline constexpr uint32_t LIQUIDATE_CREDIT_ACCOUNT_PERMISSIONS =
    EXTERNAL_CALLS_PERMISSION | ADD_COLLATERAL_PERMISSION;
inline constexpr uint32_t EMERGENCY_LIQUIDATION_PERMISSIONS = ADD_COLLATERAL_PERMISSION;

//-------------------------------------------------------------------------

}  // namespace creditsim::credit

//-------------------------------------------------------------------------
