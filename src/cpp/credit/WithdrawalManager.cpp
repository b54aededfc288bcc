/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/credit/WithdrawalManager.hpp"

#include "CreditException.hpp"
#include "creditsim/simulation/Chain.hpp"
#include "creditsim/simulation/TokenLedger.hpp"

//-------------------------------------------------------------------------

namespace creditsim::credit
{

//-------------------------------------------------------------------------

WithdrawalManager::WithdrawalManager(simulation::Chain& chain, Address configurator, Timestamp delay)
    : m_chain{chain},
      m_address{chain.allocateAddress()},
      m_state{.delay = delay, .configurator = configurator},
      m_journalEntry{chain.journal(), this}
{}

//-------------------------------------------------------------------------

void WithdrawalManager::addCreditManager(Address caller, Address creditManager)
{
    checkConfigurator(caller);
    m_state.creditManagers.insert(creditManager);
}

//-------------------------------------------------------------------------

void WithdrawalManager::setWithdrawalDelay(Address caller, Timestamp delay)
{
    checkConfigurator(caller);
    if (delay == m_state.delay) return;
    m_state.delay = delay;
    m_chain.logDebug("WITHDRAWALS : SetWithdrawalDelay {}", delay);
}

//-------------------------------------------------------------------------

void WithdrawalManager::setConfigurator(Address caller, Address configurator)
{
    checkConfigurator(caller);
    m_state.configurator = configurator;
}

//-------------------------------------------------------------------------

void WithdrawalManager::addImmediateWithdrawal(
    Address caller, Address token, Address to, const uint256_t& amount)
{
    checkCreditManager(caller);
    creditImmediate(token, to, amount);
}

//-------------------------------------------------------------------------

void WithdrawalManager::addScheduledWithdrawal(
    Address caller, Address creditAccount, Address token, const uint256_t& amount, uint8_t tokenIndex)
{
    checkCreditManager(caller);
    if (amount == 0) {
        throw AmountCantBeZeroException{fmt::format("scheduled withdrawal of {:#x}", token)};
    }

    auto& slots = m_state.scheduled[creditAccount];
    auto slot = ranges::find_if(slots, &ScheduledWithdrawal::empty);
    if (slot == slots.end()) {
        throw NoFreeWithdrawalSlotsException{fmt::format("{:#x}", creditAccount)};
    }

    *slot = ScheduledWithdrawal{
        .tokenIndex = tokenIndex,
        .maturity = m_chain.timestamp() + m_state.delay,
        .token = token,
        .amount = amount
    };

    m_chain.logDebug(
        "WITHDRAWALS : AddScheduledWithdrawal {:#x} {} {} maturing at {}",
        creditAccount, m_chain.ledger().symbol(token), amount, slot->maturity);
}

//-------------------------------------------------------------------------

ClaimResult WithdrawalManager::claimScheduledWithdrawals(
    Address caller, Address creditAccount, Address to, ClaimAction action)
{
    checkCreditManager(caller);

    ClaimResult res{};
    auto it = m_state.scheduled.find(creditAccount);
    if (it == m_state.scheduled.end()) return res;

    auto& ledger = m_chain.ledger();
    const Timestamp now = m_chain.timestamp();
    const bool liquidation = action == ClaimAction::CANCEL || action == ClaimAction::FORCE_CANCEL;

    for (auto& withdrawal : it->second) {
        if (withdrawal.empty()) continue;

        const bool matured = withdrawal.maturity <= now;
        const bool claim = action == ClaimAction::FORCE_CLAIM
            || (matured && (action == ClaimAction::CLAIM || action == ClaimAction::CANCEL));
        const bool cancel = !claim && liquidation;

        if (claim) {
            if (liquidation) {
                creditImmediate(withdrawal.token, to, withdrawal.amount);
            } else {
                ledger.transfer(withdrawal.token, m_address, to, withdrawal.amount);
            }
            m_chain.logDebug(
                "WITHDRAWALS : ClaimScheduledWithdrawal {:#x} {} {} to {:#x}",
                creditAccount, ledger.symbol(withdrawal.token), withdrawal.amount, to);
        } else if (cancel) {
            ledger.transfer(withdrawal.token, m_address, creditAccount, withdrawal.amount);
            res.tokensToEnable |= bitmask::tokenMask(withdrawal.tokenIndex);
            m_chain.logDebug(
                "WITHDRAWALS : CancelScheduledWithdrawal {:#x} {} {}",
                creditAccount, ledger.symbol(withdrawal.token), withdrawal.amount);
        } else {
            res.hasScheduled = true;
            continue;
        }
        withdrawal = ScheduledWithdrawal{};
    }

    if (!res.hasScheduled) {
        m_state.scheduled.erase(it);
    }

    return res;
}

//-------------------------------------------------------------------------

uint256_t WithdrawalManager::claimImmediateWithdrawal(Address caller, Address token, Address to)
{
    auto it = m_state.immediate.find({caller, token});
    if (it == m_state.immediate.end()) return 0;

    const uint256_t amount = it->second;
    m_state.immediate.erase(it);
    m_chain.ledger().transfer(token, m_address, to, amount);

    m_chain.logDebug(
        "WITHDRAWALS : ClaimImmediateWithdrawal {:#x} {} {} to {:#x}",
        caller, m_chain.ledger().symbol(token), amount, to);

    return amount;
}

//-------------------------------------------------------------------------

std::vector<CancellableWithdrawal> WithdrawalManager::cancellableScheduledWithdrawals(
    Address creditAccount, bool isForceCancel) const
{
    auto it = m_state.scheduled.find(creditAccount);
    if (it == m_state.scheduled.end()) return {};

    const Timestamp now = m_chain.timestamp();
    return it->second
        | views::filter([&](const ScheduledWithdrawal& withdrawal) {
              return !withdrawal.empty() && (isForceCancel || withdrawal.maturity > now);
          })
        | views::transform([](const ScheduledWithdrawal& withdrawal) {
              return CancellableWithdrawal{.token = withdrawal.token, .amount = withdrawal.amount};
          })
        | ranges::to<std::vector>();
}

//-------------------------------------------------------------------------

std::array<ScheduledWithdrawal, kScheduledWithdrawalSlots> WithdrawalManager::scheduledWithdrawals(
    Address creditAccount) const
{
    auto it = m_state.scheduled.find(creditAccount);
    if (it == m_state.scheduled.end()) return {};
    return it->second;
}

//-------------------------------------------------------------------------

uint256_t WithdrawalManager::immediateWithdrawal(Address holder, Address token) const
{
    auto it = m_state.immediate.find({holder, token});
    return it != m_state.immediate.end() ? it->second : uint256_t{};
}

//-------------------------------------------------------------------------

bool WithdrawalManager::isCreditManager(Address account) const noexcept
{
    return m_state.creditManagers.contains(account);
}

//-------------------------------------------------------------------------

util::RestoreFn WithdrawalManager::checkpoint()
{
    return [this, state = m_state] { m_state = state; };
}

//-------------------------------------------------------------------------

void WithdrawalManager::checkConfigurator(Address caller) const
{
    if (caller != m_state.configurator) {
        throw CallerNotConfiguratorException{fmt::format("{:#x}", caller)};
    }
}

//-------------------------------------------------------------------------

void WithdrawalManager::checkCreditManager(Address caller) const
{
    if (!isCreditManager(caller)) {
        throw CallerNotCreditManagerException{fmt::format("{:#x}", caller)};
    }
}

//-------------------------------------------------------------------------

void WithdrawalManager::creditImmediate(Address token, Address to, const uint256_t& amount)
{
    if (amount == 0) return;
    m_state.immediate[{to, token}] += amount;
    m_chain.logDebug(
        "WITHDRAWALS : AddImmediateWithdrawal {} {} for {:#x}", m_chain.ledger().symbol(token), amount, to);
}

//-------------------------------------------------------------------------

}  // namespace creditsim::credit

//-------------------------------------------------------------------------
