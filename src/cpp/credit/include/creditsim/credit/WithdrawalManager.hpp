/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "BitMask.hpp"
#include "Journal.hpp"
#include "common.hpp"

#include <array>

//-------------------------------------------------------------------------

namespace creditsim::simulation
{
class Chain;
}  // namespace creditsim::simulation

//-------------------------------------------------------------------------

namespace creditsim::credit
{

//-------------------------------------------------------------------------

inline constexpr size_t kScheduledWithdrawalSlots = 2;

enum class ClaimAction : uint8_t
{
    // Claim matured withdrawals, keep the rest.
    CLAIM,
    // Claim matured withdrawals, return the rest to the account.
    CANCEL,
    // Claim everything regardless of maturity.
    FORCE_CLAIM,
    // Return everything to the account regardless of maturity.
    FORCE_CANCEL
};

struct ScheduledWithdrawal
{
    uint8_t tokenIndex{};
    Timestamp maturity{};
    Address token{};
    uint256_t amount{};

    [[nodiscard]] bool empty() const noexcept { return amount == 0; }
};

struct CancellableWithdrawal
{
    Address token;
    uint256_t amount;
};

struct ClaimResult
{
    bool hasScheduled{};
    TokenMask tokensToEnable{};
};

//-------------------------------------------------------------------------

/**
 * Custody of collateral withdrawn from credit accounts. With a non-zero
 * delay, withdrawals are parked in one of two slots per account until they
 * mature; until then they can be cancelled back to the account, which is
 * what a liquidation does. Immediate withdrawals are balances owed to a
 * holder that the holder claims at will.
 */
class WithdrawalManager : public util::Journaled
{
public:
    WithdrawalManager(simulation::Chain& chain, Address configurator, Timestamp delay);

    [[nodiscard]] Address address() const noexcept { return m_address; }
    [[nodiscard]] Timestamp delay() const noexcept { return m_state.delay; }
    [[nodiscard]] Address configurator() const noexcept { return m_state.configurator; }

    // Configurator.
    void addCreditManager(Address caller, Address creditManager);
    void setWithdrawalDelay(Address caller, Timestamp delay);
    void setConfigurator(Address caller, Address configurator);

    // Credit managers. Tokens must already sit at address().
    void addImmediateWithdrawal(Address caller, Address token, Address to, const uint256_t& amount);
    void addScheduledWithdrawal(
        Address caller, Address creditAccount, Address token, const uint256_t& amount, uint8_t tokenIndex);

    /**
     * Settles the scheduled withdrawals of `creditAccount` according to
     * `action`. Claimed funds are transferred to `to`, except on the cancel
     * paths used by liquidations, where they are booked as immediate
     * withdrawals of `to`. Cancelled funds go back to the account and their
     * token bits are returned in `tokensToEnable`.
     */
    ClaimResult claimScheduledWithdrawals(
        Address caller, Address creditAccount, Address to, ClaimAction action);

    // Sends the caller's immediate balance of `token` to `to` and returns it.
    uint256_t claimImmediateWithdrawal(Address caller, Address token, Address to);

    [[nodiscard]] std::vector<CancellableWithdrawal> cancellableScheduledWithdrawals(
        Address creditAccount, bool isForceCancel) const;
    [[nodiscard]] std::array<ScheduledWithdrawal, kScheduledWithdrawalSlots> scheduledWithdrawals(
        Address creditAccount) const;
    [[nodiscard]] uint256_t immediateWithdrawal(Address holder, Address token) const;
    [[nodiscard]] bool isCreditManager(Address account) const noexcept;

    [[nodiscard]] virtual util::RestoreFn checkpoint() override;

private:
    using Slots = std::array<ScheduledWithdrawal, kScheduledWithdrawalSlots>;

    void checkConfigurator(Address caller) const;
    void checkCreditManager(Address caller) const;
    void creditImmediate(Address token, Address to, const uint256_t& amount);

    struct State
    {
        Timestamp delay{};
        Address configurator{};
        std::set<Address> creditManagers;
        std::map<Address, Slots> scheduled;
        std::map<std::pair<Address, Address>, uint256_t> immediate;
    };

    simulation::Chain& m_chain;
    Address m_address;
    State m_state;
    util::JournalEntry m_journalEntry;
};

//-------------------------------------------------------------------------

}  // namespace creditsim::credit

//-------------------------------------------------------------------------
