/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Journal.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

namespace creditsim::simulation
{
class Chain;
}  // namespace creditsim::simulation

//-------------------------------------------------------------------------

namespace creditsim::credit
{

//-------------------------------------------------------------------------

struct BotPermissions
{
    uint32_t permissions{};
    uint256_t fundingAmount{};
    uint256_t weeklyAllowance{};
};

struct BotStatus
{
    uint32_t permissions;
    bool forbidden;
};

//-------------------------------------------------------------------------

/**
 * Permissions that account owners grant to third-party bots. Grants are
 * made through an approved credit facade; forbidding a bot is reserved to
 * the owner of the list.
 */
class BotList : public util::Journaled
{
public:
    BotList(simulation::Chain& chain, Address owner);

    [[nodiscard]] Address address() const noexcept { return m_address; }
    [[nodiscard]] Address owner() const noexcept { return m_owner; }

    void approveCreditFacade(Address caller, Address creditFacade);

    /**
     * Grants `permissions` to `bot` on `creditAccount`; zero permissions
     * revoke the grant. Returns the number of bots still active on the account.
     */
    uint32_t setBotPermissions(
        Address caller,
        Address creditAccount,
        Address bot,
        uint32_t permissions,
        const uint256_t& fundingAmount,
        const uint256_t& weeklyAllowance);

    void eraseAllBotPermissions(Address caller, Address creditAccount);

    void setBotForbiddenStatus(Address caller, Address bot, bool forbidden);

    [[nodiscard]] BotStatus botStatus(Address bot, Address creditAccount) const;
    [[nodiscard]] std::optional<BotPermissions> botPermissions(Address bot, Address creditAccount) const;
    [[nodiscard]] std::vector<Address> activeBots(Address creditAccount) const;
    [[nodiscard]] bool isForbidden(Address bot) const noexcept;

    [[nodiscard]] virtual util::RestoreFn checkpoint() override;

private:
    void checkCreditFacade(Address caller) const;

    struct State
    {
        std::map<std::pair<Address, Address>, BotPermissions> permissions;
        std::map<Address, std::set<Address>> activeBots;
        std::set<Address> forbiddenBots;
        std::set<Address> creditFacades;
    };

    simulation::Chain& m_chain;
    Address m_address;
    Address m_owner;
    State m_state;
    util::JournalEntry m_journalEntry;
};

//-------------------------------------------------------------------------

}  // namespace creditsim::credit

//-------------------------------------------------------------------------
