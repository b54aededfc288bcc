/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace creditsim::credit
{

//-------------------------------------------------------------------------

enum class Role : uint8_t
{
    CONFIGURATOR,
    CONTROLLER,
    PAUSABLE_ADMIN,
    UNPAUSABLE_ADMIN
};

//-------------------------------------------------------------------------

/**
 * Governance role registry. Only configurators grant and revoke roles; the
 * address passed at construction starts out as the sole configurator.
 */
class AccessControl
{
public:
    explicit AccessControl(Address configurator);

    void grantRole(Address caller, Role role, Address account);
    void revokeRole(Address caller, Role role, Address account);

    [[nodiscard]] bool hasRole(Role role, Address account) const noexcept;

    /**
     * Throws the CallerNot* exception of `role` unless `caller` holds it.
     */
    void checkRole(Role role, Address caller) const;

    // Controller-level setters are open to configurators as well.
    void checkControllerOrConfigurator(Address caller) const;

private:
    std::map<Role, std::set<Address>> m_roles;
};

//-------------------------------------------------------------------------

}  // namespace creditsim::credit

//-------------------------------------------------------------------------
