/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace creditsim::simulation
{

//-------------------------------------------------------------------------

class Chain;

/**
 * Wraps the native pseudo-token into WETH and back one for one. The
 * combined supply of the pair is preserved.
 */
class WETHGateway
{
public:
    WETHGateway(Chain& chain, Address weth, Address native);

    void deposit(Address from, const uint256_t& amount);
    void withdrawTo(Address holder, Address to, const uint256_t& amount);

    [[nodiscard]] Address address() const noexcept { return m_address; }
    [[nodiscard]] Address weth() const noexcept { return m_weth; }
    [[nodiscard]] Address native() const noexcept { return m_native; }

private:
    Chain& m_chain;
    Address m_address;
    Address m_weth;
    Address m_native;
};

//-------------------------------------------------------------------------

}  // namespace creditsim::simulation

//-------------------------------------------------------------------------
