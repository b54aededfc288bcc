/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/credit/AccessControl.hpp"

#include "CreditException.hpp"

//-------------------------------------------------------------------------

namespace creditsim::credit
{

//-------------------------------------------------------------------------

AccessControl::AccessControl(Address configurator)
{
    m_roles[Role::CONFIGURATOR].insert(configurator);
}

//-------------------------------------------------------------------------

void AccessControl::grantRole(Address caller, Role role, Address account)
{
    checkRole(Role::CONFIGURATOR, caller);
    m_roles[role].insert(account);
}

//-------------------------------------------------------------------------

void AccessControl::revokeRole(Address caller, Role role, Address account)
{
    checkRole(Role::CONFIGURATOR, caller);
    m_roles[role].erase(account);
}

//-------------------------------------------------------------------------

bool AccessControl::hasRole(Role role, Address account) const noexcept
{
    auto it = m_roles.find(role);
    return it != m_roles.end() && it->second.contains(account);
}

//-------------------------------------------------------------------------

void AccessControl::checkRole(Role role, Address caller) const
{
    if (hasRole(role, caller)) return;

    const auto detail = fmt::format("{:#x} lacks role {}", caller, magic_enum::enum_name(role));
    switch (role) {
        case Role::CONFIGURATOR:
            throw CallerNotConfiguratorException{detail};
        case Role::CONTROLLER:
            throw CallerNotControllerException{detail};
        case Role::PAUSABLE_ADMIN:
            throw CallerNotPausableAdminException{detail};
        case Role::UNPAUSABLE_ADMIN:
            throw CallerNotUnpausableAdminException{detail};
    }
    std::unreachable();
}

//-------------------------------------------------------------------------

void AccessControl::checkControllerOrConfigurator(Address caller) const
{
    if (hasRole(Role::CONFIGURATOR, caller)) return;
    checkRole(Role::CONTROLLER, caller);
}

//-------------------------------------------------------------------------

}  // namespace creditsim::credit

//-------------------------------------------------------------------------
