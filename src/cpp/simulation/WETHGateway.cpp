/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/simulation/WETHGateway.hpp"

#include "creditsim/simulation/Chain.hpp"
#include "creditsim/simulation/TokenLedger.hpp"

//-------------------------------------------------------------------------

namespace creditsim::simulation
{

//-------------------------------------------------------------------------

WETHGateway::WETHGateway(Chain& chain, Address weth, Address native)
    : m_chain{chain},
      m_address{chain.allocateAddress()},
      m_weth{weth},
      m_native{native}
{
    static_cast<void>(chain.ledger().tokenInfo(weth));
    static_cast<void>(chain.ledger().tokenInfo(native));
}

//-------------------------------------------------------------------------

void WETHGateway::deposit(Address from, const uint256_t& amount)
{
    auto& ledger = m_chain.ledger();
    ledger.burn(m_native, from, amount);
    ledger.mint(m_weth, from, amount);
    m_chain.logDebug("WETH : Deposit {} from {:#x}", amount, from);
}

//-------------------------------------------------------------------------

void WETHGateway::withdrawTo(Address holder, Address to, const uint256_t& amount)
{
    auto& ledger = m_chain.ledger();
    ledger.burn(m_weth, holder, amount);
    ledger.mint(m_native, to, amount);
    m_chain.logDebug("WETH : Withdraw {} from {:#x} to {:#x}", amount, holder, to);
}

//-------------------------------------------------------------------------

}  // namespace creditsim::simulation

//-------------------------------------------------------------------------
