/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

namespace creditsim::suite
{

//-------------------------------------------------------------------------

class CreditSuite;

struct TokenBalance
{
    std::string symbol;
    uint256_t balance;
};

//-------------------------------------------------------------------------

/**
 * Point-in-time view of one credit account: debt breakdown, USD valuation
 * and the balances of its collateral tokens. Health factor is in bps and
 * absent when the account carries no debt.
 */
struct AccountSnapshot
{
    std::string name;
    Address creditAccount{};
    Address borrower{};
    BlockNumber blockNumber{};
    Timestamp timestamp{};
    uint256_t debt;
    uint256_t accruedInterest;
    uint256_t accruedFees;
    uint256_t totalDebtUSD;
    uint256_t totalValueUSD;
    uint256_t twvUSD;
    std::optional<uint256_t> healthFactor;
    std::vector<std::string> enabledTokens;
    std::vector<TokenBalance> balances;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    [[nodiscard]] static AccountSnapshot take(CreditSuite& suite, std::string name, Address creditAccount);
};

//-------------------------------------------------------------------------

}  // namespace creditsim::suite

//-------------------------------------------------------------------------
