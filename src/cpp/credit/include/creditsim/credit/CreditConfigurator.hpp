/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "creditsim/accounting/Fees.hpp"

//-------------------------------------------------------------------------

namespace creditsim::simulation
{
class Chain;
}  // namespace creditsim::simulation

//-------------------------------------------------------------------------

namespace creditsim::credit
{

//-------------------------------------------------------------------------

class AccessControl;
class Adapter;
class CreditFacade;
class CreditManager;

inline constexpr uint32_t kMinRampDuration = 7 * kSecondsPerDay;

// Fee parameters as governance sets them; discounts are derived from premiums.
struct FeeParams
{
    uint16_t feeInterest{};
    uint16_t feeLiquidation{};
    uint16_t liquidationPremium{};
    uint16_t feeLiquidationExpired{};
    uint16_t liquidationPremiumExpired{};
};

//-------------------------------------------------------------------------

/**
 * Governance front of one credit manager and its facade. Every setter checks
 * the caller's role, validates its parameters and applies them atomically.
 */
class CreditConfigurator
{
public:
    CreditConfigurator(
        simulation::Chain& chain,
        CreditManager& creditManager,
        CreditFacade& creditFacade,
        const AccessControl& accessControl);

    [[nodiscard]] Address address() const noexcept { return m_address; }

    // Configurator.
    TokenMask addCollateralToken(Address caller, Address token, uint16_t liquidationThreshold);
    void allowToken(Address caller, Address token);
    void makeTokenQuoted(Address caller, Address token);
    void allowAdapter(Address caller, const Adapter& adapter);
    void setFees(Address caller, const FeeParams& params);
    void setMaxCumulativeLoss(Address caller, const uint256_t& maxCumulativeLoss);
    void resetCumulativeLoss(Address caller);
    void setExpirationDate(Address caller, Timestamp expirationDate);
    void setWithdrawalDelay(Address caller, Timestamp delay);
    void addEmergencyLiquidator(Address caller, Address liquidator);
    void removeEmergencyLiquidator(Address caller, Address liquidator);

    // Controller.
    void setLiquidationThreshold(Address caller, Address token, uint16_t liquidationThreshold);
    void rampLiquidationThreshold(
        Address caller,
        Address token,
        uint16_t liquidationThresholdFinal,
        Timestamp rampStart,
        uint32_t rampDuration);
    void forbidAdapter(Address caller, Address adapter);
    void setDebtLimits(Address caller, const uint256_t& minDebt, const uint256_t& maxDebt);
    void setMaxDebtPerBlockMultiplier(Address caller, uint8_t multiplier);
    void setMaxEnabledTokens(Address caller, uint32_t maxEnabledTokens);

    // Pausable admin.
    void forbidToken(Address caller, Address token);
    void forbidBorrowing(Address caller);

private:
    void validateLiquidationThreshold(Address token, uint16_t liquidationThreshold) const;
    void checkNotUnderlying(Address token) const;
    void applyUnderlyingThreshold(uint16_t liquidationThreshold);

    simulation::Chain& m_chain;
    CreditManager& m_creditManager;
    CreditFacade& m_creditFacade;
    const AccessControl& m_accessControl;
    Address m_address;
};

//-------------------------------------------------------------------------

}  // namespace creditsim::credit

//-------------------------------------------------------------------------
