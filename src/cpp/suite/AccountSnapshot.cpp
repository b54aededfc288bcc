/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/suite/AccountSnapshot.hpp"

#include "creditsim/suite/CreditSuite.hpp"

//-------------------------------------------------------------------------

namespace creditsim::suite
{

//-------------------------------------------------------------------------

void AccountSnapshot::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("name", rapidjson::Value{name.c_str(), allocator}, allocator);
        json.AddMember("creditAccount", json::addressToJson(creditAccount, allocator), allocator);
        json.AddMember("borrower", json::addressToJson(borrower, allocator), allocator);
        json.AddMember("blockNumber", rapidjson::Value{blockNumber}, allocator);
        json.AddMember("timestamp", rapidjson::Value{timestamp}, allocator);
        json.AddMember("debt", json::u256ToJson(debt, allocator), allocator);
        json.AddMember("accruedInterest", json::u256ToJson(accruedInterest, allocator), allocator);
        json.AddMember("accruedFees", json::u256ToJson(accruedFees, allocator), allocator);
        json.AddMember("totalDebtUSD", json::u256ToJson(totalDebtUSD, allocator), allocator);
        json.AddMember("totalValueUSD", json::u256ToJson(totalValueUSD, allocator), allocator);
        json.AddMember("twvUSD", json::u256ToJson(twvUSD, allocator), allocator);
        json::setOptionalMember(json, "healthFactor", healthFactor);

        rapidjson::Value enabledJson{rapidjson::kArrayType};
        for (const auto& symbol : enabledTokens) {
            enabledJson.PushBack(rapidjson::Value{symbol.c_str(), allocator}, allocator);
        }
        json.AddMember("enabledTokens", enabledJson, allocator);

        rapidjson::Value balancesJson{rapidjson::kObjectType};
        for (const auto& [symbol, balance] : balances) {
            balancesJson.AddMember(
                rapidjson::Value{symbol.c_str(), allocator},
                json::u256ToJson(balance, allocator),
                allocator);
        }
        json.AddMember("balances", balancesJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

AccountSnapshot AccountSnapshot::take(CreditSuite& suite, std::string name, Address creditAccount)
{
    auto& creditManager = suite.creditManager();
    const auto& ledger = suite.ledger();

    const auto cdd = creditManager.calcDebtAndCollateral(
        creditAccount, accounting::CollateralCalcTask::DEBT_COLLATERAL);

    AccountSnapshot snapshot{
        .name = std::move(name),
        .creditAccount = creditAccount,
        .borrower = creditManager.borrower(creditAccount),
        .blockNumber = suite.chain().blockNumber(),
        .timestamp = suite.chain().timestamp(),
        .debt = cdd.debt,
        .accruedInterest = cdd.accruedInterest,
        .accruedFees = cdd.accruedFees,
        .totalDebtUSD = cdd.totalDebtUSD,
        .totalValueUSD = cdd.totalValueUSD,
        .twvUSD = cdd.twvUSD
    };
    if (cdd.totalDebtUSD > 0) {
        snapshot.healthFactor = numeric::mulDiv(cdd.twvUSD, numeric::PERCENTAGE_FACTOR, cdd.totalDebtUSD);
    }

    for (uint32_t index : bitmask::setBits(cdd.enabledTokensMask)) {
        const Address token = creditManager.collateralTokenByMask(bitmask::tokenMask(index)).token;
        snapshot.enabledTokens.push_back(ledger.symbol(token));
    }
    for (uint32_t i = 0; i < creditManager.collateralTokensCount(); ++i) {
        const Address token = creditManager.collateralTokenByMask(bitmask::tokenMask(i)).token;
        if (uint256_t balance = ledger.balanceOf(token, creditAccount); balance > 0) {
            snapshot.balances.push_back({.symbol = ledger.symbol(token), .balance = balance});
        }
    }
    return snapshot;
}

//-------------------------------------------------------------------------

}  // namespace creditsim::suite

//-------------------------------------------------------------------------
