/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "CreditException.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

namespace creditsim::config
{

//-------------------------------------------------------------------------

namespace step
{

struct Fund
{
    std::string actor;
    std::string symbol;
    uint256_t amount;
};

struct Collateral
{
    std::string symbol;
    uint256_t amount;
};

struct QuotaChange
{
    std::string symbol;
    int256_t change;
};

struct Open
{
    std::string account;
    std::string owner;
    uint256_t debt;
    std::vector<Collateral> collateral;
    std::vector<QuotaChange> quotas;
};

struct AddCollateral
{
    std::string account;
    std::string symbol;
    uint256_t amount;
};

struct IncreaseDebt
{
    std::string account;
    uint256_t amount;
};

struct DecreaseDebt
{
    std::string account;
    uint256_t amount;
};

struct UpdateQuota
{
    std::string account;
    std::string symbol;
    int256_t change;
};

// Swaps the whole balance of tokenIn when no amount is given.
struct Swap
{
    std::string account;
    std::string tokenIn;
    std::string tokenOut;
    std::optional<uint256_t> amount;
    uint256_t minAmountOut;
};

struct Warp
{
    Timestamp seconds;
};

struct Roll
{
    BlockNumber blocks;
};

struct SetPrice
{
    std::string symbol;
    uint256_t price;
};

struct Close
{
    std::string account;
    std::optional<std::string> to;
    bool convertToETH;
};

struct Liquidate
{
    std::string account;
    std::string liquidator;
};

// Every open account when no account is named.
struct Snapshot
{
    std::optional<std::string> account;
};

}  // namespace step

//-------------------------------------------------------------------------

struct ScenarioStep
{
    using ItemType = std::variant<
        step::Fund,
        step::Open,
        step::AddCollateral,
        step::IncreaseDebt,
        step::DecreaseDebt,
        step::UpdateQuota,
        step::Swap,
        step::Warp,
        step::Roll,
        step::SetPrice,
        step::Close,
        step::Liquidate,
        step::Snapshot>;

    ItemType item;
    // The step must fail with this code.
    std::optional<ErrorCode> expectedError;
};

//-------------------------------------------------------------------------

}  // namespace creditsim::config

//-------------------------------------------------------------------------
