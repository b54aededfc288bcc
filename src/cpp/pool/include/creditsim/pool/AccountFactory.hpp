/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Journal.hpp"
#include "common.hpp"

#include <deque>

//-------------------------------------------------------------------------

namespace creditsim::simulation
{
class Chain;
}  // namespace creditsim::simulation

//-------------------------------------------------------------------------

namespace creditsim::pool
{

//-------------------------------------------------------------------------

struct QueuedAccount
{
    Address creditAccount;
    Timestamp reusableAfter;
};

inline constexpr Timestamp kDefaultReuseDelay = 3 * kSecondsPerDay;

//-------------------------------------------------------------------------

/**
 * Hands out credit account addresses. Returned accounts are queued and reused
 * once their delay has passed; otherwise a fresh account is deployed.
 */
class AccountFactory : public util::Journaled
{
public:
    explicit AccountFactory(simulation::Chain& chain, Timestamp delay = kDefaultReuseDelay);

    [[nodiscard]] Address takeCreditAccount();
    void returnCreditAccount(Address creditAccount);

    [[nodiscard]] Timestamp delay() const noexcept { return m_delay; }
    [[nodiscard]] const std::deque<QueuedAccount>& queue() const noexcept { return m_state.queue; }
    [[nodiscard]] size_t deployedAccounts() const noexcept { return m_state.deployed.size(); }
    [[nodiscard]] bool isCreditAccount(Address account) const noexcept;

    [[nodiscard]] virtual util::RestoreFn checkpoint() override;

private:
    struct State
    {
        std::deque<QueuedAccount> queue;
        std::set<Address> deployed;
        std::set<Address> inUse;
    };

    simulation::Chain& m_chain;
    Timestamp m_delay;
    State m_state;
    util::JournalEntry m_journalEntry;
};

//-------------------------------------------------------------------------

}  // namespace creditsim::pool

//-------------------------------------------------------------------------
