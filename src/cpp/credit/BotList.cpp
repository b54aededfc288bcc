/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/credit/BotList.hpp"

#include "CreditException.hpp"
#include "creditsim/credit/Permissions.hpp"
#include "creditsim/simulation/Chain.hpp"

//-------------------------------------------------------------------------

namespace creditsim::credit
{

//-------------------------------------------------------------------------

BotList::BotList(simulation::Chain& chain, Address owner)
    : m_chain{chain},
      m_address{chain.allocateAddress()},
      m_owner{owner},
      m_journalEntry{chain.journal(), this}
{}

//-------------------------------------------------------------------------

void BotList::approveCreditFacade(Address caller, Address creditFacade)
{
    if (caller != m_owner) {
        throw CallerNotOwnerException{fmt::format("{:#x} does not own the bot list", caller)};
    }
    m_state.creditFacades.insert(creditFacade);
}

//-------------------------------------------------------------------------

uint32_t BotList::setBotPermissions(
    Address caller,
    Address creditAccount,
    Address bot,
    uint32_t permissions,
    const uint256_t& fundingAmount,
    const uint256_t& weeklyAllowance)
{
    checkCreditFacade(caller);

    if ((permissions & ~ALL_PERMISSIONS) != 0) {
        throw UnexpectedPermissionsException{fmt::format("{:#x}", permissions)};
    }

    auto& active = m_state.activeBots[creditAccount];

    if (permissions == 0) {
        m_state.permissions.erase({bot, creditAccount});
        active.erase(bot);
    } else {
        if (m_state.forbiddenBots.contains(bot)) {
            throw InvalidBotException{fmt::format("bot {:#x} is forbidden", bot)};
        }
        m_state.permissions.insert_or_assign(
            std::pair{bot, creditAccount},
            BotPermissions{
                .permissions = permissions,
                .fundingAmount = fundingAmount,
                .weeklyAllowance = weeklyAllowance
            });
        active.insert(bot);
    }

    m_chain.logDebug(
        "BOTS : SetBotPermissions account {:#x} bot {:#x} -> {:#x}", creditAccount, bot, permissions);

    return static_cast<uint32_t>(active.size());
}

//-------------------------------------------------------------------------

void BotList::eraseAllBotPermissions(Address caller, Address creditAccount)
{
    checkCreditFacade(caller);

    auto it = m_state.activeBots.find(creditAccount);
    if (it == m_state.activeBots.end()) return;

    for (Address bot : it->second) {
        m_state.permissions.erase({bot, creditAccount});
    }
    m_state.activeBots.erase(it);

    m_chain.logDebug("BOTS : EraseAllBotPermissions account {:#x}", creditAccount);
}

//-------------------------------------------------------------------------

void BotList::setBotForbiddenStatus(Address caller, Address bot, bool forbidden)
{
    if (caller != m_owner) {
        throw CallerNotOwnerException{fmt::format("{:#x} does not own the bot list", caller)};
    }
    if (forbidden) {
        m_state.forbiddenBots.insert(bot);
    } else {
        m_state.forbiddenBots.erase(bot);
    }
    m_chain.logDebug("BOTS : SetBotForbiddenStatus {:#x} -> {}", bot, forbidden);
}

//-------------------------------------------------------------------------

BotStatus BotList::botStatus(Address bot, Address creditAccount) const
{
    auto it = m_state.permissions.find({bot, creditAccount});
    return {
        .permissions = it != m_state.permissions.end() ? it->second.permissions : 0u,
        .forbidden = isForbidden(bot)
    };
}

//-------------------------------------------------------------------------

std::optional<BotPermissions> BotList::botPermissions(Address bot, Address creditAccount) const
{
    auto it = m_state.permissions.find({bot, creditAccount});
    if (it == m_state.permissions.end()) return {};
    return it->second;
}

//-------------------------------------------------------------------------

std::vector<Address> BotList::activeBots(Address creditAccount) const
{
    auto it = m_state.activeBots.find(creditAccount);
    if (it == m_state.activeBots.end()) return {};
    return it->second | ranges::to<std::vector>();
}

//-------------------------------------------------------------------------

bool BotList::isForbidden(Address bot) const noexcept
{
    return m_state.forbiddenBots.contains(bot);
}

//-------------------------------------------------------------------------

util::RestoreFn BotList::checkpoint()
{
    return [this, state = m_state] { m_state = state; };
}

//-------------------------------------------------------------------------

void BotList::checkCreditFacade(Address caller) const
{
    if (!m_state.creditFacades.contains(caller)) {
        throw CallerNotCreditFacadeException{fmt::format("{:#x} is not an approved credit facade", caller)};
    }
}

//-------------------------------------------------------------------------

}  // namespace creditsim::credit

//-------------------------------------------------------------------------
