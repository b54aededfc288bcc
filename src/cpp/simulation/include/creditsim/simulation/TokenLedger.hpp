/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Journal.hpp"
#include "common.hpp"

#include <tuple>

//-------------------------------------------------------------------------

namespace creditsim::simulation
{

//-------------------------------------------------------------------------

class Chain;

struct TokenInfo
{
    std::string symbol;
    uint32_t decimals;
};

//-------------------------------------------------------------------------

/**
 * ERC-20 style balances and allowances for every token on the chain.
 */
class TokenLedger : public util::Journaled
{
public:
    explicit TokenLedger(Chain& chain);

    [[nodiscard]] Address addToken(std::string symbol, uint32_t decimals);

    [[nodiscard]] bool isToken(Address token) const noexcept;
    [[nodiscard]] const TokenInfo& tokenInfo(Address token) const;
    [[nodiscard]] std::optional<Address> tokenBySymbol(std::string_view symbol) const noexcept;
    [[nodiscard]] uint32_t decimals(Address token) const { return tokenInfo(token).decimals; }
    [[nodiscard]] const std::string& symbol(Address token) const { return tokenInfo(token).symbol; }

    [[nodiscard]] uint256_t balanceOf(Address token, Address holder) const;
    [[nodiscard]] uint256_t allowance(Address token, Address owner, Address spender) const;
    [[nodiscard]] uint256_t totalSupply(Address token) const;

    void transfer(Address token, Address from, Address to, const uint256_t& amount);
    void approve(Address token, Address owner, Address spender, const uint256_t& amount);
    void transferFrom(
        Address token, Address spender, Address from, Address to, const uint256_t& amount);
    void mint(Address token, Address to, const uint256_t& amount);
    void burn(Address token, Address from, const uint256_t& amount);

    [[nodiscard]] virtual util::RestoreFn checkpoint() override;

    [[nodiscard]] static const uint256_t& maxAllowance();

private:
    void debit(Address token, Address holder, const uint256_t& amount);
    void credit(Address token, Address holder, const uint256_t& amount);

    struct State
    {
        std::map<Address, TokenInfo> tokens;
        std::map<std::pair<Address, Address>, uint256_t> balances;
        std::map<std::tuple<Address, Address, Address>, uint256_t> allowances;
        std::map<Address, uint256_t> totalSupply;
    };

    Chain& m_chain;
    State m_state;
    util::JournalEntry m_journalEntry;
};

//-------------------------------------------------------------------------

}  // namespace creditsim::simulation

//-------------------------------------------------------------------------
