/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "BitMask.hpp"
#include "JsonSerializable.hpp"
#include "common.hpp"
#include "creditsim/accounting/CreditLogic.hpp"

//-------------------------------------------------------------------------

namespace creditsim::credit::event
{

//-------------------------------------------------------------------------

struct OpenCreditAccount
{
    Address creditAccount{};
    Address onBehalfOf{};
    Address caller{};
    uint256_t debt{};

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

struct CloseCreditAccount
{
    Address creditAccount{};
    Address borrower{};
    Address to{};

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

struct LiquidateCreditAccount
{
    Address creditAccount{};
    Address liquidator{};
    Address to{};
    accounting::ClosureKind closureKind{};
    uint256_t remainingFunds{};

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

struct StartMultiCall
{
    Address creditAccount{};
    Address caller{};

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

struct FinishMultiCall
{
    Address creditAccount{};

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

struct IncreaseDebt
{
    Address creditAccount{};
    uint256_t amount{};

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

struct DecreaseDebt
{
    Address creditAccount{};
    uint256_t amount{};

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

struct AddCollateral
{
    Address creditAccount{};
    Address token{};
    uint256_t amount{};

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

struct WithdrawCollateral
{
    Address creditAccount{};
    Address token{};
    uint256_t amount{};
    Address to{};

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

struct UpdateQuota
{
    Address creditAccount{};
    Address token{};
    int256_t quotaChange{};

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

struct Execute
{
    Address creditAccount{};
    Address targetContract{};

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

struct SetBotPermissions
{
    Address creditAccount{};
    Address bot{};
    uint32_t permissions{};

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

struct Paused
{
    Address account{};

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

struct Unpaused
{
    Address account{};

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

struct IncurLossOnLiquidation
{
    Address creditAccount{};
    uint256_t loss{};

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

//-------------------------------------------------------------------------

}  // namespace creditsim::credit::event

//-------------------------------------------------------------------------

namespace creditsim::credit
{

struct CreditEvent
{
    using ItemType = std::variant<
        event::OpenCreditAccount,
        event::CloseCreditAccount,
        event::LiquidateCreditAccount,
        event::StartMultiCall,
        event::FinishMultiCall,
        event::IncreaseDebt,
        event::DecreaseDebt,
        event::AddCollateral,
        event::WithdrawCollateral,
        event::UpdateQuota,
        event::Execute,
        event::SetBotPermissions,
        event::Paused,
        event::Unpaused,
        event::IncurLossOnLiquidation>;

    ItemType item;
    BlockNumber blockNumber{};
    uint64_t id{};

    [[nodiscard]] std::string_view name() const noexcept;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

}  // namespace creditsim::credit

//-------------------------------------------------------------------------
