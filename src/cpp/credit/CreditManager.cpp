/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/credit/CreditManager.hpp"

#include "CreditException.hpp"
#include "creditsim/pool/AccountFactory.hpp"
#include "creditsim/pool/LendingPool.hpp"
#include "creditsim/pool/PoolQuotaKeeper.hpp"
#include "creditsim/simulation/Chain.hpp"
#include "creditsim/simulation/TokenLedger.hpp"
#include "creditsim/simulation/WETHGateway.hpp"

//-------------------------------------------------------------------------

namespace creditsim::credit
{

//-------------------------------------------------------------------------

using accounting::ClosureKind;
using accounting::CollateralCalcTask;
using accounting::CollateralDebtData;
using accounting::CollateralTokenData;
using accounting::CreditAccountInfo;
using accounting::DebtDirection;

using numeric::PERCENTAGE_FACTOR;

//-------------------------------------------------------------------------

ActiveCreditAccountGuard::~ActiveCreditAccountGuard() noexcept
{
    m_creditManager.deactivate();
}

//-------------------------------------------------------------------------

CreditManager::CreditManager(
    simulation::Chain& chain,
    pool::LendingPool& pool,
    pool::PoolQuotaKeeper& poolQuotaKeeper,
    pool::AccountFactory& accountFactory,
    const oracle::PriceOracle& priceOracle,
    const CreditManagerDesc& desc)
    : m_chain{chain},
      m_pool{pool},
      m_poolQuotaKeeper{poolQuotaKeeper},
      m_accountFactory{accountFactory},
      m_priceOracle{priceOracle},
      m_wethGateway{desc.wethGateway},
      m_withdrawalManager{desc.withdrawalManager},
      m_address{chain.allocateAddress()},
      m_underlying{pool.underlying()},
      m_state{
          .maxEnabledTokens = desc.maxEnabledTokens,
          .creditConfigurator = desc.creditConfigurator
      },
      m_journalEntry{chain.journal(), this}
{
    if (!m_priceOracle.hasPriceFeed(m_underlying)) {
        throw PriceFeedDoesNotExistException{fmt::format(
            "no price feed for the underlying {}", m_chain.ledger().symbol(m_underlying))};
    }
    m_state.collateralTokens.push_back(CollateralTokenData{
        .token = m_underlying,
        .mask = UNDERLYING_TOKEN_MASK
    });
    m_state.tokenIndices.emplace(m_underlying, 0);
    m_pool.addCreditManager(m_address);
    m_poolQuotaKeeper.addCreditManager(m_address);
}

//-------------------------------------------------------------------------

Address CreditManager::openCreditAccount(Address caller, const uint256_t& debt, Address onBehalfOf)
{
    checkCreditFacade(caller);

    const Address creditAccount = m_accountFactory.takeCreditAccount();
    const BlockNumber block = m_chain.blockNumber();

    m_state.accounts.insert_or_assign(creditAccount, CreditAccountInfo{
        .debt = debt,
        .cumulativeIndexLastUpdate = m_pool.baseInterestIndex(),
        .enabledTokensMask = UNDERLYING_TOKEN_MASK,
        .lastDebtUpdate = block,
        .lastDebtDirection = DebtDirection::INCREASE,
        .borrower = onBehalfOf,
        .since = block
    });

    m_pool.lendCreditAccount(m_address, debt, creditAccount);

    m_chain.logDebug(
        "CM : OpenCreditAccount {:#x} for {:#x} with debt {}", creditAccount, onBehalfOf, debt);

    return creditAccount;
}

//-------------------------------------------------------------------------

CloseResult CreditManager::closeCreditAccount(
    Address caller,
    Address creditAccount,
    ClosureKind closureKind,
    const CollateralDebtData& collateralDebtData,
    Address payer,
    Address to,
    const TokenMask& skipTokensMask,
    bool convertToETH)
{
    checkCreditFacade(caller);

    const auto& info = accountInfo(creditAccount);
    if (info.since == m_chain.blockNumber()) {
        throw OpenCloseAccountInOneBlockException{fmt::format("{:#x}", creditAccount)};
    }
    const Address borrower = info.borrower;
    const bool isClose = closureKind == ClosureKind::CLOSE;

    const auto payments =
        accounting::calcClosePayments(closureKind, collateralDebtData, m_state.fees);

    auto& ledger = m_chain.ledger();

    uint256_t underlyingBalance = ledger.balanceOf(m_underlying, creditAccount);
    const uint256_t distributedFunds =
        payments.amountToPool + (isClose ? uint256_t{} : payments.remainingFunds) + accounting::kEmptyBalance;

    if (underlyingBalance < distributedFunds) {
        const uint256_t shortfall = distributedFunds - underlyingBalance;
        const uint256_t pulled = isClose
            ? shortfall
            : std::min({
                shortfall,
                ledger.balanceOf(m_underlying, payer),
                ledger.allowance(m_underlying, payer, m_address)});
        if (pulled > 0) {
            ledger.transferFrom(m_underlying, m_address, payer, creditAccount, pulled);
            underlyingBalance += pulled;
        }
    }

    const uint256_t spendable = numeric::saturatingSub(underlyingBalance, accounting::kEmptyBalance);
    const uint256_t paidToPool = std::min(payments.amountToPool, spendable);
    const uint256_t toBorrower =
        isClose ? uint256_t{} : std::min(payments.remainingFunds, spendable - paidToPool);

    ledger.transfer(m_underlying, creditAccount, m_pool.address(), paidToPool);

    // Loss is the payer shortfall against the full amount owed to the pool;
    // a liquidation discount below debt + interest is not a loss.
    const uint256_t requiredToPool = payments.amountToPool + payments.loss;
    const uint256_t loss = isClose ? uint256_t{} : numeric::saturatingSub(requiredToPool, paidToPool);
    const uint256_t profit =
        numeric::saturatingSub(paidToPool, accounting::calcDebtWithInterest(collateralDebtData));
    m_pool.repayCreditAccount(m_address, collateralDebtData.debt, profit, loss);

    if (toBorrower > 0) {
        ledger.transfer(m_underlying, creditAccount, borrower, toBorrower);
    }

    std::vector<Address> accountQuotedTokens;
    for (uint32_t index :
         bitmask::setBits(collateralDebtData.enabledTokensMask & m_state.quotedTokensMask)) {
        accountQuotedTokens.push_back(m_state.collateralTokens.at(index).token);
    }
    m_poolQuotaKeeper.removeQuotas(m_address, creditAccount, accountQuotedTokens, loss > 0);

    batchTokensTransfer(
        creditAccount, to, convertToETH, collateralDebtData.enabledTokensMask & ~skipTokensMask);

    m_state.accounts.erase(creditAccount);
    m_accountFactory.returnCreditAccount(creditAccount);

    m_chain.logDebug(
        "CM : CloseCreditAccount {:#x} ({}) paid {} to pool, profit {}, loss {}",
        creditAccount, magic_enum::enum_name(closureKind), paidToPool, profit, loss);

    return {
        .remainingFunds = isClose ? payments.remainingFunds : toBorrower,
        .loss = loss
    };
}

//-------------------------------------------------------------------------

ManageDebtResult CreditManager::manageDebt(
    Address caller,
    Address creditAccount,
    const uint256_t& amount,
    const TokenMask& enabledTokensMask,
    ManageDebtAction action)
{
    checkCreditFacade(caller);

    auto& info = accountInfo(creditAccount);

    const auto direction = action == ManageDebtAction::INCREASE_DEBT
        ? DebtDirection::INCREASE : DebtDirection::DECREASE;
    const BlockNumber block = m_chain.blockNumber();
    if (info.lastDebtUpdate == block
        && info.lastDebtDirection != DebtDirection::NONE
        && info.lastDebtDirection != direction) {
        throw DebtUpdatedTwiceInOneBlockException{fmt::format(
            "{:#x} changed debt by {} earlier in block {}",
            creditAccount, magic_enum::enum_name(info.lastDebtDirection), block)};
    }

    if (amount == 0) return {.newDebt = info.debt};

    const auto cdd = calcDebtData(creditAccount, info, enabledTokensMask);

    ManageDebtResult res{};

    if (action == ManageDebtAction::INCREASE_DEBT) {
        const auto [newDebt, newCumulativeIndex] = accounting::calcIncrease(
            amount, info.debt, cdd.cumulativeIndexNow, info.cumulativeIndexLastUpdate);
        m_pool.lendCreditAccount(m_address, amount, creditAccount);
        info.debt = newDebt;
        info.cumulativeIndexLastUpdate = newCumulativeIndex;
        info.cumulativeQuotaInterest = cdd.cumulativeQuotaInterest;
        res.tokensToEnable = UNDERLYING_TOKEN_MASK;
    } else {
        const uint256_t repayment = std::min(amount, accounting::calcTotalDebt(cdd));
        m_chain.ledger().transfer(m_underlying, creditAccount, m_pool.address(), repayment);
        const auto decrease = accounting::calcDecrease(
            repayment,
            info.debt,
            cdd.cumulativeIndexNow,
            info.cumulativeIndexLastUpdate,
            cdd.cumulativeQuotaInterest,
            cdd.quotaFees,
            m_state.fees.feeInterest);
        m_pool.repayCreditAccount(m_address, info.debt - decrease.newDebt, decrease.profit, {});
        info.debt = decrease.newDebt;
        info.cumulativeIndexLastUpdate = decrease.newCumulativeIndex;
        info.cumulativeQuotaInterest = decrease.newCumulativeQuotaInterest;
        info.quotaFees = decrease.newQuotaFees;
    }

    m_poolQuotaKeeper.accrueQuotaInterest(m_address, creditAccount, cdd.quotedTokens);

    info.lastDebtUpdate = block;
    info.lastDebtDirection = direction;
    res.newDebt = info.debt;

    m_chain.logDebug(
        "CM : ManageDebt {:#x} {} {} -> debt {}",
        creditAccount, magic_enum::enum_name(action), amount, info.debt);

    return res;
}

//-------------------------------------------------------------------------

TokenMask CreditManager::addCollateral(
    Address caller, Address payer, Address creditAccount, Address token, const uint256_t& amount)
{
    checkCreditFacade(caller);
    static_cast<void>(accountInfo(creditAccount));
    const TokenMask mask = getTokenMaskOrRevert(token);
    m_chain.ledger().transferFrom(token, m_address, payer, creditAccount, amount);
    m_chain.logDebug("CM : AddCollateral {:#x} {} {}", creditAccount, m_chain.ledger().symbol(token), amount);
    return mask;
}

//-------------------------------------------------------------------------

TokenMask CreditManager::withdrawCollateral(
    Address caller, Address creditAccount, Address token, const uint256_t& amount, Address to)
{
    checkCreditFacade(caller);
    auto& info = accountInfo(creditAccount);
    const TokenMask mask = getTokenMaskOrRevert(token);
    auto& ledger = m_chain.ledger();

    if (m_withdrawalManager == nullptr || m_withdrawalManager->delay() == 0) {
        ledger.transfer(token, creditAccount, to, amount);
        m_chain.logDebug(
            "CM : WithdrawCollateral {:#x} {} {} to {:#x}", creditAccount, ledger.symbol(token), amount, to);
        return mask;
    }

    ledger.transfer(token, creditAccount, m_withdrawalManager->address(), amount);
    m_withdrawalManager->addScheduledWithdrawal(
        m_address, creditAccount, token, amount, static_cast<uint8_t>(bitmask::calcIndex(mask)));
    info.flags |= accounting::WITHDRAWAL_FLAG;

    m_chain.logDebug(
        "CM : ScheduleWithdrawal {:#x} {} {}", creditAccount, ledger.symbol(token), amount);
    return mask;
}

//-------------------------------------------------------------------------

TokenMask CreditManager::claimWithdrawals(
    Address caller, Address creditAccount, Address to, ClaimAction action)
{
    checkCreditFacade(caller);
    auto& info = accountInfo(creditAccount);
    if (m_withdrawalManager == nullptr || (info.flags & accounting::WITHDRAWAL_FLAG) == 0) {
        return {};
    }

    const auto res = m_withdrawalManager->claimScheduledWithdrawals(m_address, creditAccount, to, action);
    if (!res.hasScheduled) {
        info.flags &= static_cast<uint16_t>(~accounting::WITHDRAWAL_FLAG);
    }
    return res.tokensToEnable;
}

//-------------------------------------------------------------------------

QuotaChangeResult CreditManager::updateQuota(
    Address caller,
    Address creditAccount,
    Address token,
    const int256_t& quotaChange,
    const uint256_t& minQuota,
    const uint256_t& maxQuota)
{
    checkCreditFacade(caller);

    auto& info = accountInfo(creditAccount);
    const TokenMask mask = getTokenMaskOrRevert(token);
    if ((mask & m_state.quotedTokensMask) == 0) {
        throw TokenIsNotQuotedException{fmt::format(
            "{} is not quoted in the credit manager", m_chain.ledger().symbol(token))};
    }

    const auto update = m_poolQuotaKeeper.updateQuota(
        m_address, creditAccount, token, quotaChange, minQuota, maxQuota);

    info.cumulativeQuotaInterest += update.caQuotaInterestChange;
    info.quotaFees += update.fees;

    return {
        .tokensToEnable = update.enableToken ? mask : TokenMask{},
        .tokensToDisable = update.disableToken ? mask : TokenMask{}
    };
}

//-------------------------------------------------------------------------

void CreditManager::fullCollateralCheck(
    Address caller,
    Address creditAccount,
    const TokenMask& enabledTokensMask,
    std::span<const TokenMask> collateralHints,
    uint16_t minHealthFactor)
{
    checkCreditFacade(caller);

    if (minHealthFactor < PERCENTAGE_FACTOR) {
        throw CustomHealthFactorTooLowException{fmt::format("{}", minHealthFactor)};
    }

    auto& info = accountInfo(creditAccount);
    const auto cdd = calcDebtData(creditAccount, info, enabledTokensMask);

    const uint256_t totalDebtUSD =
        m_priceOracle.convertToUSD(accounting::calcTotalDebt(cdd), m_underlying);
    const uint256_t targetUSD = numeric::percentMul(totalDebtUSD, minHealthFactor);

    const auto collateral = accounting::calcCollateral(
        {
            .creditAccount = creditAccount,
            .enabledTokensMask = enabledTokensMask,
            .quotedTokensMask = cdd.quotedTokensMask,
            .collateralHints = collateralHints,
            .targetUSD = targetUSD,
            .underlying = m_underlying
        },
        collateralSources(creditAccount));

    if (collateral.twvUSD < targetUSD) {
        throw NotEnoughCollateralException{fmt::format(
            "{:#x}: twv {} < target {} (debt {} USD, hf {})",
            creditAccount, collateral.twvUSD, targetUSD, totalDebtUSD, minHealthFactor)};
    }

    saveEnabledTokensMask(info, bitmask::disable(enabledTokensMask, collateral.tokensToDisable));
}

//-------------------------------------------------------------------------

void CreditManager::saveEnabledTokensMask(
    Address caller, Address creditAccount, const TokenMask& enabledTokensMask)
{
    checkCreditFacade(caller);
    saveEnabledTokensMask(accountInfo(creditAccount), enabledTokensMask);
}

//-------------------------------------------------------------------------

void CreditManager::revokeAdapterAllowances(
    Address caller, Address creditAccount, std::span<const RevocationPair> revocations)
{
    checkCreditFacade(caller);
    static_cast<void>(accountInfo(creditAccount));
    for (const auto& [token, spender] : revocations) {
        static_cast<void>(getTokenMaskOrRevert(token));
        if (spender == ADDRESS_ZERO) {
            throw IncorrectParameterException{"cannot revoke the allowance of the zero address"};
        }
        m_chain.ledger().approve(token, creditAccount, spender, 0);
    }
}

//-------------------------------------------------------------------------

void CreditManager::setFlagFor(Address caller, Address creditAccount, uint16_t flag, bool value)
{
    checkCreditFacade(caller);
    auto& info = accountInfo(creditAccount);
    info.flags = value ? info.flags | flag : info.flags & ~flag;
}

//-------------------------------------------------------------------------

ActiveCreditAccountGuard CreditManager::activate(Address caller, Address creditAccount)
{
    checkCreditFacade(caller);
    static_cast<void>(accountInfo(creditAccount));
    if (m_activeCreditAccount != kInactiveCreditAccount) {
        throw ActiveCreditAccountOverriddenException{fmt::format(
            "{:#x} is active, cannot activate {:#x}", m_activeCreditAccount, creditAccount)};
    }
    m_activeCreditAccount = creditAccount;
    return ActiveCreditAccountGuard{*this};
}

//-------------------------------------------------------------------------

Address CreditManager::getActiveCreditAccountOrRevert() const
{
    if (m_activeCreditAccount == kInactiveCreditAccount) {
        throw ActiveCreditAccountNotSetException{};
    }
    return m_activeCreditAccount;
}

//-------------------------------------------------------------------------

void CreditManager::approveCreditAccount(Address caller, Address token, const uint256_t& amount)
{
    const Address targetContract = checkAdapter(caller);
    const Address creditAccount = getActiveCreditAccountOrRevert();
    static_cast<void>(getTokenMaskOrRevert(token));
    m_chain.ledger().approve(token, creditAccount, targetContract, amount);
}

//-------------------------------------------------------------------------

std::vector<uint256_t> CreditManager::execute(Address caller, const simulation::CallData& data)
{
    const Address targetContract = checkAdapter(caller);
    const Address creditAccount = getActiveCreditAccountOrRevert();
    m_chain.logDebug("CM : Execute {:#x} -> {:#x} {}", creditAccount, targetContract, data);
    return m_chain.contractAt(targetContract).call(creditAccount, data);
}

//-------------------------------------------------------------------------

TokenMask CreditManager::addToken(Address caller, Address token)
{
    checkCreditConfigurator(caller);

    static_cast<void>(m_chain.ledger().tokenInfo(token));
    if (m_state.tokenIndices.contains(token)) {
        throw IncorrectParameterException{fmt::format(
            "{} is already a collateral token", m_chain.ledger().symbol(token))};
    }
    if (m_state.collateralTokens.size() >= kMaxTokenSlots) {
        throw IncorrectParameterException{fmt::format(
            "all {} collateral token slots are taken", kMaxTokenSlots)};
    }
    if (!m_priceOracle.hasPriceFeed(token)) {
        throw PriceFeedDoesNotExistException{m_chain.ledger().symbol(token)};
    }

    const auto index = static_cast<uint32_t>(m_state.collateralTokens.size());
    const TokenMask mask = bitmask::tokenMask(index);
    m_state.collateralTokens.push_back(CollateralTokenData{.token = token, .mask = mask});
    m_state.tokenIndices.emplace(token, index);

    m_chain.logDebug("CM : AddToken {} at bit {}", m_chain.ledger().symbol(token), index);

    return mask;
}

//-------------------------------------------------------------------------

void CreditManager::setCollateralTokenData(
    Address caller,
    Address token,
    uint16_t ltInitial,
    uint16_t ltFinal,
    Timestamp timestampRampStart,
    uint32_t rampDuration)
{
    checkCreditConfigurator(caller);

    if (ltInitial > PERCENTAGE_FACTOR || ltFinal > PERCENTAGE_FACTOR) {
        throw IncorrectLiquidationThresholdException{fmt::format("{} -> {}", ltInitial, ltFinal)};
    }
    auto& data = m_state.collateralTokens.at(bitmask::calcIndex(getTokenMaskOrRevert(token)));
    data.ltInitial = ltInitial;
    data.ltFinal = ltFinal;
    data.timestampRampStart = timestampRampStart;
    data.rampDuration = rampDuration;
}

//-------------------------------------------------------------------------

void CreditManager::setQuotedMask(Address caller, const TokenMask& quotedTokensMask)
{
    checkCreditConfigurator(caller);
    if ((quotedTokensMask & UNDERLYING_TOKEN_MASK) != 0) {
        throw IncorrectParameterException{"the underlying cannot be quoted"};
    }
    m_state.quotedTokensMask = quotedTokensMask;
}

//-------------------------------------------------------------------------

void CreditManager::setMaxEnabledTokens(Address caller, uint32_t maxEnabledTokens)
{
    checkCreditConfigurator(caller);
    m_state.maxEnabledTokens = maxEnabledTokens;
}

//-------------------------------------------------------------------------

void CreditManager::setFees(Address caller, const accounting::CreditFees& fees)
{
    checkCreditConfigurator(caller);
    m_state.fees = fees;
}

//-------------------------------------------------------------------------

void CreditManager::setContractAllowance(Address caller, Address adapter, Address targetContract)
{
    checkCreditConfigurator(caller);

    if (targetContract == ADDRESS_ZERO) {
        auto it = m_state.adapterToContract.find(adapter);
        if (it == m_state.adapterToContract.end()) return;
        m_state.contractToAdapter.erase(it->second);
        m_state.adapterToContract.erase(it);
        return;
    }
    m_state.adapterToContract.insert_or_assign(adapter, targetContract);
    m_state.contractToAdapter.insert_or_assign(targetContract, adapter);
}

//-------------------------------------------------------------------------

void CreditManager::setCreditFacade(Address caller, Address creditFacade)
{
    checkCreditConfigurator(caller);
    m_state.creditFacade = creditFacade;
}

//-------------------------------------------------------------------------

void CreditManager::setCreditConfigurator(Address caller, Address creditConfigurator)
{
    checkCreditConfigurator(caller);
    m_state.creditConfigurator = creditConfigurator;
}

//-------------------------------------------------------------------------

CollateralDebtData CreditManager::calcDebtAndCollateral(
    Address creditAccount, CollateralCalcTask task) const
{
    auto it = m_state.accounts.find(creditAccount);
    if (it == m_state.accounts.end()) {
        throw AccountNotFoundException{fmt::format("{:#x}", creditAccount)};
    }
    const auto& info = it->second;

    switch (task) {
        case CollateralCalcTask::GENERIC_PARAMS:
            return {
                .debt = info.debt,
                .cumulativeIndexNow = m_pool.baseInterestIndex(),
                .cumulativeIndexLastUpdate = info.cumulativeIndexLastUpdate,
                .cumulativeQuotaInterest = info.cumulativeQuotaInterest,
                .quotaFees = info.quotaFees,
                .enabledTokensMask = info.enabledTokensMask,
                .quotedTokensMask = m_state.quotedTokensMask
            };
        case CollateralCalcTask::DEBT_ONLY:
            return calcDebtData(creditAccount, info, info.enabledTokensMask);
        case CollateralCalcTask::DEBT_COLLATERAL: {
            auto cdd = calcDebtData(creditAccount, info, info.enabledTokensMask);
            cdd.totalDebtUSD = m_priceOracle.convertToUSD(accounting::calcTotalDebt(cdd), m_underlying);
            const auto collateral = accounting::calcCollateral(
                {
                    .creditAccount = creditAccount,
                    .enabledTokensMask = cdd.enabledTokensMask,
                    .quotedTokensMask = cdd.quotedTokensMask,
                    .underlying = m_underlying
                },
                collateralSources(creditAccount));
            cdd.totalValueUSD = collateral.totalValueUSD;
            cdd.twvUSD = collateral.twvUSD;
            cdd.totalValue = m_priceOracle.convertFromUSD(cdd.totalValueUSD, m_underlying);
            return cdd;
        }
        case CollateralCalcTask::DEBT_COLLATERAL_CANCEL_WITHDRAWALS:
        case CollateralCalcTask::DEBT_COLLATERAL_FORCE_CANCEL_WITHDRAWALS: {
            auto cdd = calcDebtAndCollateral(creditAccount, CollateralCalcTask::DEBT_COLLATERAL);
            if (m_withdrawalManager == nullptr || (info.flags & accounting::WITHDRAWAL_FLAG) == 0) {
                return cdd;
            }
            const bool isForceCancel = task == CollateralCalcTask::DEBT_COLLATERAL_FORCE_CANCEL_WITHDRAWALS;
            for (const auto& [token, amount] :
                 m_withdrawalManager->cancellableScheduledWithdrawals(creditAccount, isForceCancel)) {
                cdd.totalValueUSD += m_priceOracle.convertToUSD(amount, token);
            }
            cdd.totalValue = m_priceOracle.convertFromUSD(cdd.totalValueUSD, m_underlying);
            return cdd;
        }
        default:
            throw IncorrectParameterException{fmt::format(
                "task {} is only run by the full collateral check", magic_enum::enum_name(task))};
    }
}

//-------------------------------------------------------------------------

bool CreditManager::isLiquidatable(Address creditAccount, uint16_t minHealthFactor) const
{
    const auto cdd = calcDebtAndCollateral(creditAccount, CollateralCalcTask::DEBT_COLLATERAL);
    return cdd.twvUSD < numeric::percentMul(cdd.totalDebtUSD, minHealthFactor);
}

//-------------------------------------------------------------------------

uint32_t CreditManager::collateralTokensCount() const noexcept
{
    return static_cast<uint32_t>(m_state.collateralTokens.size());
}

//-------------------------------------------------------------------------

const CollateralTokenData& CreditManager::collateralTokenByMask(const TokenMask& mask) const
{
    const uint32_t index = bitmask::calcIndex(mask);
    if (index >= m_state.collateralTokens.size()) {
        throw TokenNotAllowedException{fmt::format("no collateral token at bit {}", index)};
    }
    return m_state.collateralTokens[index];
}

//-------------------------------------------------------------------------

const CollateralTokenData& CreditManager::collateralTokenData(Address token) const
{
    return m_state.collateralTokens[bitmask::calcIndex(getTokenMaskOrRevert(token))];
}

//-------------------------------------------------------------------------

uint16_t CreditManager::liquidationThreshold(Address token) const
{
    return accounting::calcLiquidationThreshold(collateralTokenData(token), m_chain.timestamp());
}

//-------------------------------------------------------------------------

TokenMask CreditManager::getTokenMaskOrRevert(Address token) const
{
    auto it = m_state.tokenIndices.find(token);
    if (it == m_state.tokenIndices.end()) {
        throw TokenNotAllowedException{fmt::format("{:#x} is not a collateral token", token)};
    }
    return bitmask::tokenMask(it->second);
}

//-------------------------------------------------------------------------

bool CreditManager::isCollateralToken(Address token) const noexcept
{
    return m_state.tokenIndices.contains(token);
}

//-------------------------------------------------------------------------

const CreditAccountInfo& CreditManager::creditAccountInfo(Address creditAccount) const
{
    auto it = m_state.accounts.find(creditAccount);
    if (it == m_state.accounts.end()) {
        throw AccountNotFoundException{fmt::format("{:#x}", creditAccount)};
    }
    return it->second;
}

//-------------------------------------------------------------------------

bool CreditManager::hasCreditAccount(Address creditAccount) const noexcept
{
    return m_state.accounts.contains(creditAccount);
}

//-------------------------------------------------------------------------

Address CreditManager::borrower(Address creditAccount) const
{
    return creditAccountInfo(creditAccount).borrower;
}

//-------------------------------------------------------------------------

TokenMask CreditManager::enabledTokensMaskOf(Address creditAccount) const
{
    return creditAccountInfo(creditAccount).enabledTokensMask;
}

//-------------------------------------------------------------------------

uint16_t CreditManager::flagsOf(Address creditAccount) const
{
    return creditAccountInfo(creditAccount).flags;
}

//-------------------------------------------------------------------------

std::vector<Address> CreditManager::creditAccounts() const
{
    return m_state.accounts | views::keys | ranges::to<std::vector>();
}

//-------------------------------------------------------------------------

Address CreditManager::adapterToContract(Address adapter) const noexcept
{
    auto it = m_state.adapterToContract.find(adapter);
    return it != m_state.adapterToContract.end() ? it->second : ADDRESS_ZERO;
}

//-------------------------------------------------------------------------

Address CreditManager::contractToAdapter(Address targetContract) const noexcept
{
    auto it = m_state.contractToAdapter.find(targetContract);
    return it != m_state.contractToAdapter.end() ? it->second : ADDRESS_ZERO;
}

//-------------------------------------------------------------------------

util::RestoreFn CreditManager::checkpoint()
{
    return [this, state = m_state] { m_state = state; };
}

//-------------------------------------------------------------------------

void CreditManager::checkCreditFacade(Address caller) const
{
    if (caller != m_state.creditFacade || caller == ADDRESS_ZERO) {
        throw CallerNotCreditFacadeException{fmt::format("{:#x}", caller)};
    }
}

//-------------------------------------------------------------------------

void CreditManager::checkCreditConfigurator(Address caller) const
{
    if (caller != m_state.creditConfigurator) {
        throw CallerNotConfiguratorException{fmt::format("{:#x}", caller)};
    }
}

//-------------------------------------------------------------------------

Address CreditManager::checkAdapter(Address caller) const
{
    const Address targetContract = adapterToContract(caller);
    if (targetContract == ADDRESS_ZERO) {
        throw CallerNotAdapterException{fmt::format("{:#x}", caller)};
    }
    return targetContract;
}

//-------------------------------------------------------------------------

CreditAccountInfo& CreditManager::accountInfo(Address creditAccount)
{
    auto it = m_state.accounts.find(creditAccount);
    if (it == m_state.accounts.end()) {
        throw AccountNotFoundException{fmt::format("{:#x}", creditAccount)};
    }
    return it->second;
}

//-------------------------------------------------------------------------

CollateralDebtData CreditManager::calcDebtData(
    Address creditAccount, const CreditAccountInfo& info, const TokenMask& enabledTokensMask) const
{
    CollateralDebtData cdd{
        .debt = info.debt,
        .cumulativeIndexNow = m_pool.baseInterestIndex(),
        .cumulativeIndexLastUpdate = info.cumulativeIndexLastUpdate,
        .cumulativeQuotaInterest = info.cumulativeQuotaInterest,
        .quotaFees = info.quotaFees,
        .enabledTokensMask = enabledTokensMask,
        .quotedTokensMask = m_state.quotedTokensMask
    };

    for (uint32_t index : bitmask::setBits(enabledTokensMask & m_state.quotedTokensMask)) {
        const Address token = m_state.collateralTokens.at(index).token;
        cdd.quotedTokens.push_back(token);
        cdd.cumulativeQuotaInterest +=
            m_poolQuotaKeeper.getQuotaAndOutstandingInterest(creditAccount, token).outstandingInterest;
    }

    cdd.accruedInterest =
        accounting::calcAccruedInterest(cdd.debt, cdd.cumulativeIndexLastUpdate, cdd.cumulativeIndexNow)
        + cdd.cumulativeQuotaInterest;
    cdd.accruedFees = cdd.quotaFees + numeric::percentMul(cdd.accruedInterest, m_state.fees.feeInterest);

    return cdd;
}

//-------------------------------------------------------------------------

accounting::CollateralSources CreditManager::collateralSources(Address creditAccount) const
{
    return {
        .collateralTokenByMask = [this](const TokenMask& mask) {
            const auto& data = collateralTokenByMask(mask);
            return accounting::CollateralToken{
                .token = data.token,
                .liquidationThreshold = accounting::calcLiquidationThreshold(data, m_chain.timestamp())
            };
        },
        .balanceOf = [this, creditAccount](Address token) {
            return m_chain.ledger().balanceOf(token, creditAccount);
        },
        .quotaOf = [this, creditAccount](Address token) {
            return m_poolQuotaKeeper.getQuota(creditAccount, token);
        },
        .priceOracle = m_priceOracle
    };
}

//-------------------------------------------------------------------------

void CreditManager::saveEnabledTokensMask(CreditAccountInfo& info, const TokenMask& enabledTokensMask)
{
    if (const auto enabled = bitmask::calcEnabledTokens(enabledTokensMask); enabled > m_state.maxEnabledTokens) {
        throw TooManyEnabledTokensException{fmt::format(
            "{} enabled, at most {} allowed", enabled, m_state.maxEnabledTokens)};
    }
    info.enabledTokensMask = enabledTokensMask;
}

//-------------------------------------------------------------------------

void CreditManager::batchTokensTransfer(
    Address creditAccount, Address to, bool convertToETH, const TokenMask& tokensMask)
{
    auto& ledger = m_chain.ledger();
    for (uint32_t index : bitmask::setBits(tokensMask)) {
        const Address token = m_state.collateralTokens.at(index).token;
        const uint256_t balance = ledger.balanceOf(token, creditAccount);
        if (balance <= accounting::kEmptyBalance) continue;
        const uint256_t amount = balance - accounting::kEmptyBalance;
        if (convertToETH && m_wethGateway != nullptr && token == m_wethGateway->weth()) {
            m_wethGateway->withdrawTo(creditAccount, to, amount);
        } else {
            ledger.transfer(token, creditAccount, to, amount);
        }
    }
}

//-------------------------------------------------------------------------

void CreditManager::deactivate() noexcept
{
    m_activeCreditAccount = kInactiveCreditAccount;
}

//-------------------------------------------------------------------------

}  // namespace creditsim::credit

//-------------------------------------------------------------------------
