/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <exception>

//-------------------------------------------------------------------------

namespace creditsim
{

//-------------------------------------------------------------------------

enum class ErrorCategory : uint8_t
{
    AUTHORIZATION,
    VALIDATION,
    SOLVENCY,
    STATE
};

enum class ErrorCode : uint32_t
{
    // Authorization.
    CALLER_NOT_CONFIGURATOR,
    CALLER_NOT_CONTROLLER,
    CALLER_NOT_PAUSABLE_ADMIN,
    CALLER_NOT_UNPAUSABLE_ADMIN,
    CALLER_NOT_CREDIT_FACADE,
    CALLER_NOT_CREDIT_MANAGER,
    CALLER_NOT_ADAPTER,
    CALLER_NOT_OWNER,
    CALLER_NOT_GAUGE,
    NO_PERMISSION,
    NOT_APPROVED_BOT,
    INVALID_BOT,
    UNEXPECTED_PERMISSIONS,
    TARGET_CONTRACT_NOT_ALLOWED,
    // Validation.
    INCORRECT_BIT_MASK,
    INCORRECT_TOKEN_MASK,
    INCORRECT_LIQUIDATION_THRESHOLD,
    INCORRECT_PARAMETER,
    INCORRECT_LIMITS,
    INCORRECT_EXPIRATION_DATE,
    TOKEN_NOT_ALLOWED,
    TOKEN_IS_NOT_QUOTED,
    PRICE_FEED_DOES_NOT_EXIST,
    UNKNOWN_METHOD,
    BORROW_AMOUNT_OUT_OF_LIMITS,
    BORROW_LIMIT_EXCEEDED,
    QUOTA_IS_OUT_OF_BOUNDS,
    CUSTOM_HEALTH_FACTOR_TOO_LOW,
    AMOUNT_CANT_BE_ZERO,
    TOO_MANY_ENABLED_TOKENS,
    // Solvency.
    NOT_ENOUGH_COLLATERAL,
    BALANCE_LESS_THAN_EXPECTED,
    INSUFFICIENT_BALANCE,
    INSUFFICIENT_ALLOWANCE,
    FORBIDDEN_TOKENS,
    // State.
    ACCOUNT_NOT_FOUND,
    ACTIVE_CREDIT_ACCOUNT_NOT_SET,
    ACTIVE_CREDIT_ACCOUNT_OVERRIDDEN,
    DEBT_UPDATED_TWICE_IN_ONE_BLOCK,
    OPEN_CLOSE_ACCOUNT_IN_ONE_BLOCK,
    EXPECTED_BALANCES_ALREADY_SET,
    EXPECTED_BALANCES_NOT_SET,
    CREDIT_ACCOUNT_NOT_LIQUIDATABLE,
    NOT_ALLOWED_AFTER_EXPIRATION,
    NOT_ALLOWED_WHEN_PAUSED,
    NOT_ALLOWED_WHEN_NOT_EXPIRABLE,
    NO_FREE_WITHDRAWAL_SLOTS
};

[[nodiscard]] constexpr ErrorCategory errorCategory(ErrorCode code) noexcept
{
    if (code <= ErrorCode::TARGET_CONTRACT_NOT_ALLOWED) return ErrorCategory::AUTHORIZATION;
    if (code <= ErrorCode::TOO_MANY_ENABLED_TOKENS) return ErrorCategory::VALIDATION;
    if (code <= ErrorCode::FORBIDDEN_TOKENS) return ErrorCategory::SOLVENCY;
    return ErrorCategory::STATE;
}

//-------------------------------------------------------------------------

class CreditException : public std::exception
{
public:
    CreditException(ErrorCode code, std::string_view detail);

    virtual const char* what() const noexcept override;

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }
    [[nodiscard]] ErrorCategory category() const noexcept { return errorCategory(m_code); }

private:
    ErrorCode m_code;
    std::string m_msg;
};

//-------------------------------------------------------------------------

template<ErrorCode Code>
class CreditError : public CreditException
{
public:
    static constexpr ErrorCode kCode = Code;

    explicit CreditError(std::string_view detail = {}) : CreditException{Code, detail} {}
};

//-------------------------------------------------------------------------

using CallerNotConfiguratorException = CreditError<ErrorCode::CALLER_NOT_CONFIGURATOR>;
using CallerNotControllerException = CreditError<ErrorCode::CALLER_NOT_CONTROLLER>;
using CallerNotPausableAdminException = CreditError<ErrorCode::CALLER_NOT_PAUSABLE_ADMIN>;
using CallerNotUnpausableAdminException = CreditError<ErrorCode::CALLER_NOT_UNPAUSABLE_ADMIN>;
using CallerNotCreditFacadeException = CreditError<ErrorCode::CALLER_NOT_CREDIT_FACADE>;
using CallerNotCreditManagerException = CreditError<ErrorCode::CALLER_NOT_CREDIT_MANAGER>;
using CallerNotAdapterException = CreditError<ErrorCode::CALLER_NOT_ADAPTER>;
using CallerNotOwnerException = CreditError<ErrorCode::CALLER_NOT_OWNER>;
using CallerNotGaugeException = CreditError<ErrorCode::CALLER_NOT_GAUGE>;
using NotApprovedBotException = CreditError<ErrorCode::NOT_APPROVED_BOT>;
using InvalidBotException = CreditError<ErrorCode::INVALID_BOT>;
using UnexpectedPermissionsException = CreditError<ErrorCode::UNEXPECTED_PERMISSIONS>;
using TargetContractNotAllowedException = CreditError<ErrorCode::TARGET_CONTRACT_NOT_ALLOWED>;

using IncorrectBitMaskException = CreditError<ErrorCode::INCORRECT_BIT_MASK>;
using IncorrectTokenMaskException = CreditError<ErrorCode::INCORRECT_TOKEN_MASK>;
using IncorrectLiquidationThresholdException = CreditError<ErrorCode::INCORRECT_LIQUIDATION_THRESHOLD>;
using IncorrectParameterException = CreditError<ErrorCode::INCORRECT_PARAMETER>;
using IncorrectLimitsException = CreditError<ErrorCode::INCORRECT_LIMITS>;
using IncorrectExpirationDateException = CreditError<ErrorCode::INCORRECT_EXPIRATION_DATE>;
using TokenNotAllowedException = CreditError<ErrorCode::TOKEN_NOT_ALLOWED>;
using TokenIsNotQuotedException = CreditError<ErrorCode::TOKEN_IS_NOT_QUOTED>;
using PriceFeedDoesNotExistException = CreditError<ErrorCode::PRICE_FEED_DOES_NOT_EXIST>;
using UnknownMethodException = CreditError<ErrorCode::UNKNOWN_METHOD>;
using BorrowAmountOutOfLimitsException = CreditError<ErrorCode::BORROW_AMOUNT_OUT_OF_LIMITS>;
using BorrowLimitExceededException = CreditError<ErrorCode::BORROW_LIMIT_EXCEEDED>;
using QuotaIsOutOfBoundsException = CreditError<ErrorCode::QUOTA_IS_OUT_OF_BOUNDS>;
using CustomHealthFactorTooLowException = CreditError<ErrorCode::CUSTOM_HEALTH_FACTOR_TOO_LOW>;
using AmountCantBeZeroException = CreditError<ErrorCode::AMOUNT_CANT_BE_ZERO>;
using TooManyEnabledTokensException = CreditError<ErrorCode::TOO_MANY_ENABLED_TOKENS>;

using NotEnoughCollateralException = CreditError<ErrorCode::NOT_ENOUGH_COLLATERAL>;
using BalanceLessThanExpectedException = CreditError<ErrorCode::BALANCE_LESS_THAN_EXPECTED>;
using InsufficientBalanceException = CreditError<ErrorCode::INSUFFICIENT_BALANCE>;
using InsufficientAllowanceException = CreditError<ErrorCode::INSUFFICIENT_ALLOWANCE>;
using ForbiddenTokensException = CreditError<ErrorCode::FORBIDDEN_TOKENS>;

using AccountNotFoundException = CreditError<ErrorCode::ACCOUNT_NOT_FOUND>;
using ActiveCreditAccountNotSetException = CreditError<ErrorCode::ACTIVE_CREDIT_ACCOUNT_NOT_SET>;
using ActiveCreditAccountOverriddenException = CreditError<ErrorCode::ACTIVE_CREDIT_ACCOUNT_OVERRIDDEN>;
using DebtUpdatedTwiceInOneBlockException = CreditError<ErrorCode::DEBT_UPDATED_TWICE_IN_ONE_BLOCK>;
using OpenCloseAccountInOneBlockException = CreditError<ErrorCode::OPEN_CLOSE_ACCOUNT_IN_ONE_BLOCK>;
using ExpectedBalancesAlreadySetException = CreditError<ErrorCode::EXPECTED_BALANCES_ALREADY_SET>;
using ExpectedBalancesNotSetException = CreditError<ErrorCode::EXPECTED_BALANCES_NOT_SET>;
using CreditAccountNotLiquidatableException = CreditError<ErrorCode::CREDIT_ACCOUNT_NOT_LIQUIDATABLE>;
using NotAllowedAfterExpirationException = CreditError<ErrorCode::NOT_ALLOWED_AFTER_EXPIRATION>;
using NotAllowedWhenPausedException = CreditError<ErrorCode::NOT_ALLOWED_WHEN_PAUSED>;
using NotAllowedWhenNotExpirableException = CreditError<ErrorCode::NOT_ALLOWED_WHEN_NOT_EXPIRABLE>;
using NoFreeWithdrawalSlotsException = CreditError<ErrorCode::NO_FREE_WITHDRAWAL_SLOTS>;

//-------------------------------------------------------------------------

/**
 * Raised when a multicall action requires a permission bit the caller does
 * not hold.
 */
class NoPermissionException : public CreditError<ErrorCode::NO_PERMISSION>
{
public:
    explicit NoPermissionException(uint32_t permission);

    [[nodiscard]] uint32_t permission() const noexcept { return m_permission; }

private:
    uint32_t m_permission;
};

//-------------------------------------------------------------------------

}  // namespace creditsim

//-------------------------------------------------------------------------
