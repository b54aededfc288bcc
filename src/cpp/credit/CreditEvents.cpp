/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/credit/CreditEvents.hpp"

#include <array>

//-------------------------------------------------------------------------

namespace creditsim::credit::event
{

//-------------------------------------------------------------------------

void OpenCreditAccount::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("creditAccount", json::addressToJson(creditAccount, allocator), allocator);
        json.AddMember("onBehalfOf", json::addressToJson(onBehalfOf, allocator), allocator);
        json.AddMember("caller", json::addressToJson(caller, allocator), allocator);
        json.AddMember("debt", json::u256ToJson(debt, allocator), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void CloseCreditAccount::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("creditAccount", json::addressToJson(creditAccount, allocator), allocator);
        json.AddMember("borrower", json::addressToJson(borrower, allocator), allocator);
        json.AddMember("to", json::addressToJson(to, allocator), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void LiquidateCreditAccount::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("creditAccount", json::addressToJson(creditAccount, allocator), allocator);
        json.AddMember("liquidator", json::addressToJson(liquidator, allocator), allocator);
        json.AddMember("to", json::addressToJson(to, allocator), allocator);
        json.AddMember(
            "closureKind",
            rapidjson::Value{magic_enum::enum_name(closureKind).data(), allocator},
            allocator);
        json.AddMember("remainingFunds", json::u256ToJson(remainingFunds, allocator), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void StartMultiCall::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("creditAccount", json::addressToJson(creditAccount, allocator), allocator);
        json.AddMember("caller", json::addressToJson(caller, allocator), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void FinishMultiCall::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("creditAccount", json::addressToJson(creditAccount, allocator), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void IncreaseDebt::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("creditAccount", json::addressToJson(creditAccount, allocator), allocator);
        json.AddMember("amount", json::u256ToJson(amount, allocator), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void DecreaseDebt::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("creditAccount", json::addressToJson(creditAccount, allocator), allocator);
        json.AddMember("amount", json::u256ToJson(amount, allocator), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void AddCollateral::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("creditAccount", json::addressToJson(creditAccount, allocator), allocator);
        json.AddMember("token", json::addressToJson(token, allocator), allocator);
        json.AddMember("amount", json::u256ToJson(amount, allocator), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void WithdrawCollateral::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("creditAccount", json::addressToJson(creditAccount, allocator), allocator);
        json.AddMember("token", json::addressToJson(token, allocator), allocator);
        json.AddMember("amount", json::u256ToJson(amount, allocator), allocator);
        json.AddMember("to", json::addressToJson(to, allocator), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void UpdateQuota::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("creditAccount", json::addressToJson(creditAccount, allocator), allocator);
        json.AddMember("token", json::addressToJson(token, allocator), allocator);
        json.AddMember(
            "quotaChange", rapidjson::Value{quotaChange.str().c_str(), allocator}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void Execute::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("creditAccount", json::addressToJson(creditAccount, allocator), allocator);
        json.AddMember("targetContract", json::addressToJson(targetContract, allocator), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void SetBotPermissions::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("creditAccount", json::addressToJson(creditAccount, allocator), allocator);
        json.AddMember("bot", json::addressToJson(bot, allocator), allocator);
        json.AddMember("permissions", rapidjson::Value{permissions}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void Paused::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("account", json::addressToJson(account, allocator), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void Unpaused::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("account", json::addressToJson(account, allocator), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void IncurLossOnLiquidation::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("creditAccount", json::addressToJson(creditAccount, allocator), allocator);
        json.AddMember("loss", json::u256ToJson(loss, allocator), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace creditsim::credit::event

//-------------------------------------------------------------------------

namespace creditsim::credit
{

//-------------------------------------------------------------------------

std::string_view CreditEvent::name() const noexcept
{
    static constexpr std::array<std::string_view, std::variant_size_v<decltype(item)>> s_names{
        "OpenCreditAccount",
        "CloseCreditAccount",
        "LiquidateCreditAccount",
        "StartMultiCall",
        "FinishMultiCall",
        "IncreaseDebt",
        "DecreaseDebt",
        "AddCollateral",
        "WithdrawCollateral",
        "UpdateQuota",
        "Execute",
        "SetBotPermissions",
        "Paused",
        "Unpaused",
        "IncurLossOnLiquidation"
    };
    return s_names[item.index()];
}

//-------------------------------------------------------------------------

void CreditEvent::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        std::visit([&](const json::IsJsonSerializable auto& entry) { entry.jsonSerialize(json); }, item);
        auto& allocator = json.GetAllocator();
        json.AddMember("event", rapidjson::Value{name().data(), allocator}, allocator);
        json.AddMember("block", rapidjson::Value{blockNumber}, allocator);
        json.AddMember("eventId", rapidjson::Value{id}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace creditsim::credit

//-------------------------------------------------------------------------
