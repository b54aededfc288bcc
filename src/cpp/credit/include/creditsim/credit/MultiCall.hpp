/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "BitMask.hpp"
#include "common.hpp"
#include "creditsim/credit/CreditManager.hpp"
#include "creditsim/simulation/CallData.hpp"

//-------------------------------------------------------------------------

namespace creditsim::credit
{

//-------------------------------------------------------------------------

struct MultiCall
{
    Address target;
    simulation::CallData callData;
};

/**
 * Methods the credit facade accepts as multicall items addressed to itself.
 * Argument words, in order:
 *   ADD_COLLATERAL              token, amount
 *   INCREASE_DEBT               amount
 *   DECREASE_DEBT               amount
 *   ENABLE_TOKEN                token
 *   DISABLE_TOKEN               token
 *   WITHDRAW_COLLATERAL         token, amount, to
 *   UPDATE_QUOTA                token, change (two's complement), minQuota
 *   REVOKE_ADAPTER_ALLOWANCES   (token, spender)...
 *   REVERT_IF_RECEIVED_LESS_THAN (token, delta)...
 *   STORE_EXPECTED_BALANCES     (token, delta (two's complement))...
 *   COMPARE_BALANCES
 *   SET_FULL_CHECK_PARAMS       minHealthFactor, hint...
 */
enum class FacadeSelector : uint32_t
{
    ADD_COLLATERAL = 1,
    INCREASE_DEBT,
    DECREASE_DEBT,
    ENABLE_TOKEN,
    DISABLE_TOKEN,
    WITHDRAW_COLLATERAL,
    UPDATE_QUOTA,
    REVOKE_ADAPTER_ALLOWANCES,
    REVERT_IF_RECEIVED_LESS_THAN,
    STORE_EXPECTED_BALANCES,
    COMPARE_BALANCES,
    SET_FULL_CHECK_PARAMS
};

struct BalanceDelta
{
    Address token;
    int256_t amount;
};

//-------------------------------------------------------------------------

namespace action
{

struct AddCollateral
{
    Address token;
    uint256_t amount;
};

struct IncreaseDebt
{
    uint256_t amount;
};

struct DecreaseDebt
{
    uint256_t amount;
};

struct EnableToken
{
    Address token;
};

struct DisableToken
{
    Address token;
};

struct WithdrawCollateral
{
    Address token;
    uint256_t amount;
    Address to;
};

struct UpdateQuota
{
    Address token;
    int256_t quotaChange;
    uint256_t minQuota;
};

struct RevokeAdapterAllowances
{
    std::vector<RevocationPair> revocations;
};

struct StoreExpectedBalances
{
    std::vector<BalanceDelta> deltas;
};

struct CompareBalances {};

struct SetFullCheckParams
{
    std::vector<TokenMask> collateralHints;
    uint16_t minHealthFactor;
};

struct ExternalCall
{
    Address adapter;
    simulation::CallData callData;
};

}  // namespace action

using MultiCallAction = std::variant<
    action::AddCollateral,
    action::IncreaseDebt,
    action::DecreaseDebt,
    action::EnableToken,
    action::DisableToken,
    action::WithdrawCollateral,
    action::UpdateQuota,
    action::RevokeAdapterAllowances,
    action::StoreExpectedBalances,
    action::CompareBalances,
    action::SetFullCheckParams,
    action::ExternalCall>;

//-------------------------------------------------------------------------

/**
 * Classifies and decodes one multicall item. Items addressed to the facade
 * must carry a known selector (UnknownMethodException) and well-formed
 * arguments (IncorrectParameterException); items addressed to an allowed
 * adapter become external calls. Anything else, the credit manager included,
 * is rejected with TargetContractNotAllowedException.
 */
[[nodiscard]] MultiCallAction decodeMultiCall(
    const MultiCall& call, Address creditFacade, const CreditManager& creditManager);

// Zero for actions that need no permission.
[[nodiscard]] uint32_t requiredPermission(const MultiCallAction& action) noexcept;

//-------------------------------------------------------------------------

struct FullCheckParams
{
    std::vector<TokenMask> collateralHints;
    uint16_t minHealthFactor{numeric::PERCENTAGE_FACTOR};
};

struct ExpectedBalance
{
    Address token;
    uint256_t balance;
};

/**
 * Working state of one multicall.
 */
struct MultiCallContext
{
    Address creditAccount;
    Address caller;
    uint32_t permissions;
    TokenMask enabledTokensMask;
    std::optional<std::vector<ExpectedBalance>> expectedBalances;
    // Set by the first storeExpectedBalances and never cleared.
    bool expectedBalancesStored{};
    FullCheckParams fullCheckParams;
    std::map<Address, uint256_t> forbiddenBalances;
    bool revertOnForbiddenTokens{};
};

//-------------------------------------------------------------------------

/**
 * Encoders for multicall items addressed to the credit facade.
 */
namespace calls
{

[[nodiscard]] MultiCall addCollateral(Address creditFacade, Address token, const uint256_t& amount);
[[nodiscard]] MultiCall increaseDebt(Address creditFacade, const uint256_t& amount);
[[nodiscard]] MultiCall decreaseDebt(Address creditFacade, const uint256_t& amount);
[[nodiscard]] MultiCall enableToken(Address creditFacade, Address token);
[[nodiscard]] MultiCall disableToken(Address creditFacade, Address token);
[[nodiscard]] MultiCall withdrawCollateral(
    Address creditFacade, Address token, const uint256_t& amount, Address to);
[[nodiscard]] MultiCall updateQuota(
    Address creditFacade, Address token, const int256_t& quotaChange, const uint256_t& minQuota);
[[nodiscard]] MultiCall revokeAdapterAllowances(
    Address creditFacade, std::span<const RevocationPair> revocations);
[[nodiscard]] MultiCall revertIfReceivedLessThan(
    Address creditFacade, std::span<const BalanceDelta> deltas);
[[nodiscard]] MultiCall storeExpectedBalances(
    Address creditFacade, std::span<const BalanceDelta> deltas);
[[nodiscard]] MultiCall compareBalances(Address creditFacade);
[[nodiscard]] MultiCall setFullCheckParams(
    Address creditFacade, std::span<const TokenMask> collateralHints, uint16_t minHealthFactor);

}  // namespace calls

//-------------------------------------------------------------------------

}  // namespace creditsim::credit

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<creditsim::credit::MultiCall>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const creditsim::credit::MultiCall& call, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(), "MultiCall{{.target = {:#x}, .callData = {}}}", call.target, call.callData);
    }
};

//-------------------------------------------------------------------------
