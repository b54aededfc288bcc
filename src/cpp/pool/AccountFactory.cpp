/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/pool/AccountFactory.hpp"

#include "CreditException.hpp"
#include "creditsim/simulation/Chain.hpp"

//-------------------------------------------------------------------------

namespace creditsim::pool
{

//-------------------------------------------------------------------------

AccountFactory::AccountFactory(simulation::Chain& chain, Timestamp delay)
    : m_chain{chain},
      m_delay{delay},
      m_journalEntry{chain.journal(), this}
{}

//-------------------------------------------------------------------------

Address AccountFactory::takeCreditAccount()
{
    if (!m_state.queue.empty() && m_state.queue.front().reusableAfter <= m_chain.timestamp()) {
        const Address creditAccount = m_state.queue.front().creditAccount;
        m_state.queue.pop_front();
        m_state.inUse.insert(creditAccount);
        m_chain.logDebug("FACTORY : TakeCreditAccount {:#x}", creditAccount);
        return creditAccount;
    }
    const Address creditAccount = m_chain.allocateAddress();
    m_state.deployed.insert(creditAccount);
    m_state.inUse.insert(creditAccount);
    m_chain.logDebug("FACTORY : DeployCreditAccount {:#x}", creditAccount);
    return creditAccount;
}

//-------------------------------------------------------------------------

void AccountFactory::returnCreditAccount(Address creditAccount)
{
    if (m_state.inUse.erase(creditAccount) == 0) {
        throw AccountNotFoundException{fmt::format(
            "{:#x} is not an account in use", creditAccount)};
    }
    m_state.queue.push_back({
        .creditAccount = creditAccount,
        .reusableAfter = m_chain.timestamp() + m_delay
    });
    m_chain.logDebug("FACTORY : ReturnCreditAccount {:#x}", creditAccount);
}

//-------------------------------------------------------------------------

bool AccountFactory::isCreditAccount(Address account) const noexcept
{
    return m_state.deployed.contains(account);
}

//-------------------------------------------------------------------------

util::RestoreFn AccountFactory::checkpoint()
{
    return [this, state = m_state] { m_state = state; };
}

//-------------------------------------------------------------------------

}  // namespace creditsim::pool

//-------------------------------------------------------------------------
