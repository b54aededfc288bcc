/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/credit/CreditConfigurator.hpp"

#include "CreditException.hpp"
#include "creditsim/credit/AccessControl.hpp"
#include "creditsim/credit/Adapter.hpp"
#include "creditsim/credit/CreditFacade.hpp"
#include "creditsim/credit/CreditManager.hpp"
#include "creditsim/pool/PoolQuotaKeeper.hpp"
#include "creditsim/simulation/Chain.hpp"
#include "creditsim/simulation/TokenLedger.hpp"

//-------------------------------------------------------------------------

namespace creditsim::credit
{

//-------------------------------------------------------------------------

using numeric::PERCENTAGE_FACTOR;

//-------------------------------------------------------------------------

CreditConfigurator::CreditConfigurator(
    simulation::Chain& chain,
    CreditManager& creditManager,
    CreditFacade& creditFacade,
    const AccessControl& accessControl)
    : m_chain{chain},
      m_creditManager{creditManager},
      m_creditFacade{creditFacade},
      m_accessControl{accessControl},
      m_address{chain.allocateAddress()}
{}

//-------------------------------------------------------------------------

TokenMask CreditConfigurator::addCollateralToken(
    Address caller, Address token, uint16_t liquidationThreshold)
{
    m_accessControl.checkRole(Role::CONFIGURATOR, caller);
    checkNotUnderlying(token);

    const TokenMask mask = util::atomically(m_chain.journal(), [&] {
        const TokenMask added = m_creditManager.addToken(m_address, token);
        validateLiquidationThreshold(token, liquidationThreshold);
        m_creditManager.setCollateralTokenData(
            m_address, token, liquidationThreshold, liquidationThreshold, 0, 0);
        return added;
    });

    m_chain.logDebug(
        "CONFIG : AddCollateralToken {} LT {}", m_chain.ledger().symbol(token), liquidationThreshold);

    return mask;
}

//-------------------------------------------------------------------------

void CreditConfigurator::allowToken(Address caller, Address token)
{
    m_accessControl.checkRole(Role::CONFIGURATOR, caller);
    checkNotUnderlying(token);
    m_creditFacade.setTokenAllowance(m_address, token, true);
    m_chain.logDebug("CONFIG : AllowToken {}", m_chain.ledger().symbol(token));
}

//-------------------------------------------------------------------------

void CreditConfigurator::forbidToken(Address caller, Address token)
{
    m_accessControl.checkRole(Role::PAUSABLE_ADMIN, caller);
    checkNotUnderlying(token);
    m_creditFacade.setTokenAllowance(m_address, token, false);
    m_chain.logDebug("CONFIG : ForbidToken {}", m_chain.ledger().symbol(token));
}

//-------------------------------------------------------------------------

void CreditConfigurator::makeTokenQuoted(Address caller, Address token)
{
    m_accessControl.checkRole(Role::CONFIGURATOR, caller);
    checkNotUnderlying(token);

    const TokenMask mask = m_creditManager.getTokenMaskOrRevert(token);
    if (!m_creditManager.poolQuotaKeeper().isQuotedToken(token)) {
        throw TokenIsNotQuotedException{m_chain.ledger().symbol(token)};
    }
    m_creditManager.setQuotedMask(m_address, m_creditManager.quotedTokensMask() | mask);

    m_chain.logDebug("CONFIG : MakeTokenQuoted {}", m_chain.ledger().symbol(token));
}

//-------------------------------------------------------------------------

void CreditConfigurator::allowAdapter(Address caller, const Adapter& adapter)
{
    m_accessControl.checkRole(Role::CONFIGURATOR, caller);

    if (adapter.creditManager() != m_creditManager.address()) {
        throw IncorrectParameterException{fmt::format(
            "adapter {:#x} serves credit manager {:#x}", adapter.address(), adapter.creditManager())};
    }
    const Address targetContract = adapter.targetContract();
    if (targetContract == ADDRESS_ZERO
        || targetContract == m_creditManager.address()
        || targetContract == m_creditFacade.address()) {
        throw TargetContractNotAllowedException{fmt::format("{:#x}", targetContract)};
    }

    util::atomically(m_chain.journal(), [&] {
        if (const Address previous = m_creditManager.contractToAdapter(targetContract);
            previous != ADDRESS_ZERO && previous != adapter.address()) {
            m_creditManager.setContractAllowance(m_address, previous, ADDRESS_ZERO);
        }
        m_creditManager.setContractAllowance(m_address, adapter.address(), targetContract);
    });

    m_chain.logDebug("CONFIG : AllowAdapter {:#x} -> {:#x}", adapter.address(), targetContract);
}

//-------------------------------------------------------------------------

void CreditConfigurator::forbidAdapter(Address caller, Address adapter)
{
    m_accessControl.checkControllerOrConfigurator(caller);
    if (m_creditManager.adapterToContract(adapter) == ADDRESS_ZERO) {
        throw IncorrectParameterException{fmt::format("adapter {:#x} is not registered", adapter)};
    }
    m_creditManager.setContractAllowance(m_address, adapter, ADDRESS_ZERO);
    m_chain.logDebug("CONFIG : ForbidAdapter {:#x}", adapter);
}

//-------------------------------------------------------------------------

void CreditConfigurator::setFees(Address caller, const FeeParams& params)
{
    m_accessControl.checkRole(Role::CONFIGURATOR, caller);

    if (params.feeInterest >= PERCENTAGE_FACTOR
        || params.liquidationPremium + params.feeLiquidation >= PERCENTAGE_FACTOR
        || params.liquidationPremiumExpired + params.feeLiquidationExpired >= PERCENTAGE_FACTOR) {
        throw IncorrectParameterException{fmt::format(
            "feeInterest {}, feeLiquidation {}, premium {}, feeLiquidationExpired {}, premiumExpired {}",
            params.feeInterest,
            params.feeLiquidation,
            params.liquidationPremium,
            params.feeLiquidationExpired,
            params.liquidationPremiumExpired)};
    }

    const accounting::CreditFees fees{
        .feeInterest = params.feeInterest,
        .feeLiquidation = params.feeLiquidation,
        .liquidationDiscount = static_cast<uint16_t>(PERCENTAGE_FACTOR - params.liquidationPremium),
        .feeLiquidationExpired = params.feeLiquidationExpired,
        .liquidationDiscountExpired =
            static_cast<uint16_t>(PERCENTAGE_FACTOR - params.liquidationPremiumExpired)
    };

    util::atomically(m_chain.journal(), [&] {
        applyUnderlyingThreshold(static_cast<uint16_t>(fees.liquidationDiscount - fees.feeLiquidation));
        m_creditManager.setFees(m_address, fees);
    });

    m_chain.logDebug("CONFIG : SetFees {}", fees);
}

//-------------------------------------------------------------------------

void CreditConfigurator::setMaxCumulativeLoss(Address caller, const uint256_t& maxCumulativeLoss)
{
    m_accessControl.checkRole(Role::CONFIGURATOR, caller);
    m_creditFacade.setMaxCumulativeLoss(m_address, maxCumulativeLoss);
    m_chain.logDebug("CONFIG : SetMaxCumulativeLoss {}", maxCumulativeLoss);
}

//-------------------------------------------------------------------------

void CreditConfigurator::resetCumulativeLoss(Address caller)
{
    m_accessControl.checkRole(Role::CONFIGURATOR, caller);
    m_creditFacade.resetCumulativeLoss(m_address);
    m_chain.logDebug("CONFIG : ResetCumulativeLoss");
}

//-------------------------------------------------------------------------

void CreditConfigurator::setExpirationDate(Address caller, Timestamp expirationDate)
{
    m_accessControl.checkRole(Role::CONFIGURATOR, caller);
    if (expirationDate <= m_chain.timestamp()) {
        throw IncorrectExpirationDateException{fmt::format(
            "{} is not after {}", expirationDate, m_chain.timestamp())};
    }
    m_creditFacade.setExpirationDate(m_address, expirationDate);
    m_chain.logDebug("CONFIG : SetExpirationDate {}", expirationDate);
}

//-------------------------------------------------------------------------

void CreditConfigurator::setWithdrawalDelay(Address caller, Timestamp delay)
{
    m_accessControl.checkRole(Role::CONFIGURATOR, caller);
    WithdrawalManager* withdrawalManager = m_creditManager.withdrawalManager();
    if (withdrawalManager == nullptr) {
        throw IncorrectParameterException{"credit manager has no withdrawal manager"};
    }
    withdrawalManager->setWithdrawalDelay(m_address, delay);
    m_chain.logDebug("CONFIG : SetWithdrawalDelay {}", delay);
}

//-------------------------------------------------------------------------

void CreditConfigurator::addEmergencyLiquidator(Address caller, Address liquidator)
{
    m_accessControl.checkRole(Role::CONFIGURATOR, caller);
    m_creditFacade.setEmergencyLiquidator(m_address, liquidator, true);
    m_chain.logDebug("CONFIG : AddEmergencyLiquidator {:#x}", liquidator);
}

//-------------------------------------------------------------------------

void CreditConfigurator::removeEmergencyLiquidator(Address caller, Address liquidator)
{
    m_accessControl.checkRole(Role::CONFIGURATOR, caller);
    m_creditFacade.setEmergencyLiquidator(m_address, liquidator, false);
    m_chain.logDebug("CONFIG : RemoveEmergencyLiquidator {:#x}", liquidator);
}

//-------------------------------------------------------------------------

void CreditConfigurator::setLiquidationThreshold(
    Address caller, Address token, uint16_t liquidationThreshold)
{
    m_accessControl.checkControllerOrConfigurator(caller);
    checkNotUnderlying(token);
    validateLiquidationThreshold(token, liquidationThreshold);
    m_creditManager.setCollateralTokenData(
        m_address, token, liquidationThreshold, liquidationThreshold, 0, 0);
    m_chain.logDebug(
        "CONFIG : SetLiquidationThreshold {} {}", m_chain.ledger().symbol(token), liquidationThreshold);
}

//-------------------------------------------------------------------------

void CreditConfigurator::rampLiquidationThreshold(
    Address caller,
    Address token,
    uint16_t liquidationThresholdFinal,
    Timestamp rampStart,
    uint32_t rampDuration)
{
    m_accessControl.checkControllerOrConfigurator(caller);
    checkNotUnderlying(token);
    validateLiquidationThreshold(token, liquidationThresholdFinal);
    if (rampDuration < kMinRampDuration) {
        throw IncorrectParameterException{fmt::format(
            "ramp duration {} is shorter than {}", rampDuration, kMinRampDuration)};
    }

    const uint16_t liquidationThresholdInitial = m_creditManager.liquidationThreshold(token);
    if (liquidationThresholdInitial == liquidationThresholdFinal) return;

    const Timestamp start = std::max(rampStart, m_chain.timestamp());
    m_creditManager.setCollateralTokenData(
        m_address, token, liquidationThresholdInitial, liquidationThresholdFinal, start, rampDuration);

    m_chain.logDebug(
        "CONFIG : RampLiquidationThreshold {} {} -> {} from {} over {}s",
        m_chain.ledger().symbol(token),
        liquidationThresholdInitial,
        liquidationThresholdFinal,
        start,
        rampDuration);
}

//-------------------------------------------------------------------------

void CreditConfigurator::setDebtLimits(Address caller, const uint256_t& minDebt, const uint256_t& maxDebt)
{
    m_accessControl.checkControllerOrConfigurator(caller);
    m_creditFacade.setDebtLimits(m_address, minDebt, maxDebt);
    m_chain.logDebug("CONFIG : SetDebtLimits [{}, {}]", minDebt, maxDebt);
}

//-------------------------------------------------------------------------

void CreditConfigurator::setMaxDebtPerBlockMultiplier(Address caller, uint8_t multiplier)
{
    m_accessControl.checkControllerOrConfigurator(caller);
    m_creditFacade.setMaxDebtPerBlockMultiplier(m_address, multiplier);
    m_chain.logDebug("CONFIG : SetMaxDebtPerBlockMultiplier {}", multiplier);
}

//-------------------------------------------------------------------------

void CreditConfigurator::forbidBorrowing(Address caller)
{
    m_accessControl.checkRole(Role::PAUSABLE_ADMIN, caller);
    m_creditFacade.setMaxDebtPerBlockMultiplier(m_address, 0);
    m_chain.logDebug("CONFIG : ForbidBorrowing");
}

//-------------------------------------------------------------------------

void CreditConfigurator::setMaxEnabledTokens(Address caller, uint32_t maxEnabledTokens)
{
    m_accessControl.checkControllerOrConfigurator(caller);
    if (maxEnabledTokens == 0) {
        throw IncorrectParameterException{"at least one token must be enableable"};
    }
    m_creditManager.setMaxEnabledTokens(m_address, maxEnabledTokens);
    m_chain.logDebug("CONFIG : SetMaxEnabledTokens {}", maxEnabledTokens);
}

//-------------------------------------------------------------------------

void CreditConfigurator::validateLiquidationThreshold(Address token, uint16_t liquidationThreshold) const
{
    const uint16_t underlyingThreshold = m_creditManager.liquidationThreshold(m_creditManager.underlying());
    if (liquidationThreshold > underlyingThreshold) {
        throw IncorrectLiquidationThresholdException{fmt::format(
            "{} LT {} exceeds the underlying LT {}",
            m_chain.ledger().symbol(token),
            liquidationThreshold,
            underlyingThreshold)};
    }
}

//-------------------------------------------------------------------------

void CreditConfigurator::checkNotUnderlying(Address token) const
{
    if (token == m_creditManager.underlying()) {
        throw TokenNotAllowedException{"the underlying cannot be configured as collateral"};
    }
}

//-------------------------------------------------------------------------

void CreditConfigurator::applyUnderlyingThreshold(uint16_t liquidationThreshold)
{
    const Address underlying = m_creditManager.underlying();
    m_creditManager.setCollateralTokenData(
        m_address, underlying, liquidationThreshold, liquidationThreshold, 0, 0);

    for (uint32_t index = 1; index < m_creditManager.collateralTokensCount(); ++index) {
        const auto& data = m_creditManager.collateralTokenByMask(bitmask::tokenMask(index));
        if (data.ltInitial > liquidationThreshold || data.ltFinal > liquidationThreshold) {
            m_creditManager.setCollateralTokenData(
                m_address, data.token, liquidationThreshold, liquidationThreshold, 0, 0);
        }
    }
}

//-------------------------------------------------------------------------

}  // namespace creditsim::credit

//-------------------------------------------------------------------------
