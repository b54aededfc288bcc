/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/credit/MultiCall.hpp"

#include "CreditException.hpp"
#include "creditsim/credit/Permissions.hpp"

#include <limits>

//-------------------------------------------------------------------------

namespace creditsim::credit
{

//-------------------------------------------------------------------------

namespace
{

void expectArgs(FacadeSelector selector, const simulation::CallData& data, size_t count)
{
    if (data.args.size() != count) {
        throw IncorrectParameterException{fmt::format(
            "{} takes {} arguments, got {}", magic_enum::enum_name(selector), count, data.args.size())};
    }
}

void expectPairs(FacadeSelector selector, const simulation::CallData& data)
{
    if (data.args.size() % 2 != 0) {
        throw IncorrectParameterException{fmt::format(
            "{} takes argument pairs, got {} words", magic_enum::enum_name(selector), data.args.size())};
    }
}

std::vector<BalanceDelta> decodeDeltas(
    FacadeSelector selector, const simulation::CallData& data, bool receivedOnly)
{
    expectPairs(selector, data);
    std::vector<BalanceDelta> deltas;
    for (size_t i = 0; i < data.args.size(); i += 2) {
        BalanceDelta delta{
            .token = simulation::argToAddress(data.args[i]),
            .amount = numeric::decodeSigned(data.args[i + 1])
        };
        if (receivedOnly && delta.amount < 0) {
            throw IncorrectParameterException{fmt::format(
                "{} takes non-negative deltas, got {}", magic_enum::enum_name(selector), delta.amount)};
        }
        deltas.push_back(std::move(delta));
    }
    return deltas;
}

MultiCallAction decodeFacadeCall(const simulation::CallData& data)
{
    const auto selector = magic_enum::enum_cast<FacadeSelector>(data.selector);
    if (!selector.has_value()) {
        throw UnknownMethodException{fmt::format("selector {:#010x}", data.selector)};
    }
    const auto& args = data.args;

    switch (*selector) {
        case FacadeSelector::ADD_COLLATERAL:
            expectArgs(*selector, data, 2);
            return action::AddCollateral{
                .token = simulation::argToAddress(args[0]),
                .amount = args[1]
            };
        case FacadeSelector::INCREASE_DEBT:
            expectArgs(*selector, data, 1);
            return action::IncreaseDebt{.amount = args[0]};
        case FacadeSelector::DECREASE_DEBT:
            expectArgs(*selector, data, 1);
            return action::DecreaseDebt{.amount = args[0]};
        case FacadeSelector::ENABLE_TOKEN:
            expectArgs(*selector, data, 1);
            return action::EnableToken{.token = simulation::argToAddress(args[0])};
        case FacadeSelector::DISABLE_TOKEN:
            expectArgs(*selector, data, 1);
            return action::DisableToken{.token = simulation::argToAddress(args[0])};
        case FacadeSelector::WITHDRAW_COLLATERAL:
            expectArgs(*selector, data, 3);
            return action::WithdrawCollateral{
                .token = simulation::argToAddress(args[0]),
                .amount = args[1],
                .to = simulation::argToAddress(args[2])
            };
        case FacadeSelector::UPDATE_QUOTA:
            expectArgs(*selector, data, 3);
            return action::UpdateQuota{
                .token = simulation::argToAddress(args[0]),
                .quotaChange = numeric::decodeSigned(args[1]),
                .minQuota = args[2]
            };
        case FacadeSelector::REVOKE_ADAPTER_ALLOWANCES: {
            expectPairs(*selector, data);
            action::RevokeAdapterAllowances res;
            for (size_t i = 0; i < args.size(); i += 2) {
                res.revocations.push_back({
                    .token = simulation::argToAddress(args[i]),
                    .spender = simulation::argToAddress(args[i + 1])
                });
            }
            return res;
        }
        case FacadeSelector::REVERT_IF_RECEIVED_LESS_THAN:
            return action::StoreExpectedBalances{.deltas = decodeDeltas(*selector, data, true)};
        case FacadeSelector::STORE_EXPECTED_BALANCES:
            return action::StoreExpectedBalances{.deltas = decodeDeltas(*selector, data, false)};
        case FacadeSelector::COMPARE_BALANCES:
            expectArgs(*selector, data, 0);
            return action::CompareBalances{};
        case FacadeSelector::SET_FULL_CHECK_PARAMS: {
            if (args.empty()) {
                throw IncorrectParameterException{"SET_FULL_CHECK_PARAMS takes a health factor"};
            }
            if (args[0] > std::numeric_limits<uint16_t>::max()) {
                throw IncorrectParameterException{fmt::format("health factor {} is out of range", args[0])};
            }
            action::SetFullCheckParams res{.minHealthFactor = static_cast<uint16_t>(args[0])};
            for (size_t i = 1; i < args.size(); ++i) {
                res.collateralHints.push_back(static_cast<TokenMask>(args[i]));
            }
            return res;
        }
    }
    std::unreachable();
}

simulation::CallData facadeCallData(FacadeSelector selector, std::vector<uint256_t> args = {})
{
    return {.selector = std::to_underlying(selector), .args = std::move(args)};
}

}  // namespace

//-------------------------------------------------------------------------

MultiCallAction decodeMultiCall(
    const MultiCall& call, Address creditFacade, const CreditManager& creditManager)
{
    if (call.target == creditFacade) {
        return decodeFacadeCall(call.callData);
    }
    if (call.target == creditManager.address()
        || creditManager.adapterToContract(call.target) == ADDRESS_ZERO) {
        throw TargetContractNotAllowedException{fmt::format("{:#x}", call.target)};
    }
    return action::ExternalCall{.adapter = call.target, .callData = call.callData};
}

//-------------------------------------------------------------------------

uint32_t requiredPermission(const MultiCallAction& action) noexcept
{
    return std::visit(
        [](auto&& item) -> uint32_t {
            using T = std::remove_cvref_t<decltype(item)>;
            if constexpr (std::same_as<T, action::AddCollateral>) {
                return ADD_COLLATERAL_PERMISSION;
            } else if constexpr (std::same_as<T, action::IncreaseDebt>) {
                return INCREASE_DEBT_PERMISSION;
            } else if constexpr (std::same_as<T, action::DecreaseDebt>) {
                return DECREASE_DEBT_PERMISSION;
            } else if constexpr (std::same_as<T, action::EnableToken>) {
                return ENABLE_TOKEN_PERMISSION;
            } else if constexpr (std::same_as<T, action::DisableToken>) {
                return DISABLE_TOKEN_PERMISSION;
            } else if constexpr (std::same_as<T, action::WithdrawCollateral>) {
                return WITHDRAW_COLLATERAL_PERMISSION;
            } else if constexpr (std::same_as<T, action::UpdateQuota>) {
                return UPDATE_QUOTA_PERMISSION;
            } else if constexpr (std::same_as<T, action::RevokeAdapterAllowances>) {
                return REVOKE_ALLOWANCES_PERMISSION;
            } else if constexpr (std::same_as<T, action::ExternalCall>) {
                return EXTERNAL_CALLS_PERMISSION;
            } else {
                return 0;
            }
        },
        action);
}

//-------------------------------------------------------------------------

namespace calls
{

MultiCall addCollateral(Address creditFacade, Address token, const uint256_t& amount)
{
    return {creditFacade, facadeCallData(FacadeSelector::ADD_COLLATERAL, {token, amount})};
}

MultiCall increaseDebt(Address creditFacade, const uint256_t& amount)
{
    return {creditFacade, facadeCallData(FacadeSelector::INCREASE_DEBT, {amount})};
}

MultiCall decreaseDebt(Address creditFacade, const uint256_t& amount)
{
    return {creditFacade, facadeCallData(FacadeSelector::DECREASE_DEBT, {amount})};
}

MultiCall enableToken(Address creditFacade, Address token)
{
    return {creditFacade, facadeCallData(FacadeSelector::ENABLE_TOKEN, {token})};
}

MultiCall disableToken(Address creditFacade, Address token)
{
    return {creditFacade, facadeCallData(FacadeSelector::DISABLE_TOKEN, {token})};
}

MultiCall withdrawCollateral(Address creditFacade, Address token, const uint256_t& amount, Address to)
{
    return {creditFacade, facadeCallData(FacadeSelector::WITHDRAW_COLLATERAL, {token, amount, to})};
}

MultiCall updateQuota(
    Address creditFacade, Address token, const int256_t& quotaChange, const uint256_t& minQuota)
{
    return {
        creditFacade,
        facadeCallData(
            FacadeSelector::UPDATE_QUOTA, {token, numeric::encodeSigned(quotaChange), minQuota})
    };
}

MultiCall revokeAdapterAllowances(Address creditFacade, std::span<const RevocationPair> revocations)
{
    std::vector<uint256_t> args;
    for (const auto& [token, spender] : revocations) {
        args.emplace_back(token);
        args.emplace_back(spender);
    }
    return {creditFacade, facadeCallData(FacadeSelector::REVOKE_ADAPTER_ALLOWANCES, std::move(args))};
}

MultiCall revertIfReceivedLessThan(Address creditFacade, std::span<const BalanceDelta> deltas)
{
    std::vector<uint256_t> args;
    for (const auto& [token, amount] : deltas) {
        args.emplace_back(token);
        args.push_back(numeric::encodeSigned(amount));
    }
    return {creditFacade, facadeCallData(FacadeSelector::REVERT_IF_RECEIVED_LESS_THAN, std::move(args))};
}

MultiCall storeExpectedBalances(Address creditFacade, std::span<const BalanceDelta> deltas)
{
    std::vector<uint256_t> args;
    for (const auto& [token, amount] : deltas) {
        args.emplace_back(token);
        args.push_back(numeric::encodeSigned(amount));
    }
    return {creditFacade, facadeCallData(FacadeSelector::STORE_EXPECTED_BALANCES, std::move(args))};
}

MultiCall compareBalances(Address creditFacade)
{
    return {creditFacade, facadeCallData(FacadeSelector::COMPARE_BALANCES)};
}

MultiCall setFullCheckParams(
    Address creditFacade, std::span<const TokenMask> collateralHints, uint16_t minHealthFactor)
{
    std::vector<uint256_t> args{uint256_t{minHealthFactor}};
    for (const auto& hint : collateralHints) {
        args.push_back(static_cast<uint256_t>(hint));
    }
    return {creditFacade, facadeCallData(FacadeSelector::SET_FULL_CHECK_PARAMS, std::move(args))};
}

}  // namespace calls

//-------------------------------------------------------------------------

}  // namespace creditsim::credit

//-------------------------------------------------------------------------
