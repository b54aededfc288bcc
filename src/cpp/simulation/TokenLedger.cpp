/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/simulation/TokenLedger.hpp"

#include "CreditException.hpp"
#include "creditsim/simulation/Chain.hpp"

#include <limits>

//-------------------------------------------------------------------------

namespace creditsim::simulation
{

//-------------------------------------------------------------------------

TokenLedger::TokenLedger(Chain& chain)
    : m_chain{chain},
      m_journalEntry{chain.journal(), this}
{}

//-------------------------------------------------------------------------

Address TokenLedger::addToken(std::string symbol, uint32_t decimals)
{
    if (decimals > 36) {
        throw std::invalid_argument{fmt::format(
            "{}: Token '{}' cannot have {} decimals",
            std::source_location::current().function_name(), symbol, decimals)};
    }
    if (tokenBySymbol(symbol).has_value()) {
        throw std::invalid_argument{fmt::format(
            "{}: Token '{}' already exists",
            std::source_location::current().function_name(), symbol)};
    }
    const Address token = m_chain.allocateAddress();
    m_chain.logDebug("LEDGER : Added token {} ({} decimals) at {:#x}", symbol, decimals, token);
    m_state.tokens.emplace(token, TokenInfo{.symbol = std::move(symbol), .decimals = decimals});
    return token;
}

//-------------------------------------------------------------------------

bool TokenLedger::isToken(Address token) const noexcept
{
    return m_state.tokens.contains(token);
}

//-------------------------------------------------------------------------

const TokenInfo& TokenLedger::tokenInfo(Address token) const
{
    auto it = m_state.tokens.find(token);
    if (it == m_state.tokens.end()) {
        throw TokenNotAllowedException{fmt::format("{:#x} is not a token", token)};
    }
    return it->second;
}

//-------------------------------------------------------------------------

std::optional<Address> TokenLedger::tokenBySymbol(std::string_view symbol) const noexcept
{
    for (const auto& [token, info] : m_state.tokens) {
        if (info.symbol == symbol) return token;
    }
    return std::nullopt;
}

//-------------------------------------------------------------------------

uint256_t TokenLedger::balanceOf(Address token, Address holder) const
{
    auto it = m_state.balances.find({token, holder});
    return it != m_state.balances.end() ? it->second : uint256_t{};
}

//-------------------------------------------------------------------------

uint256_t TokenLedger::allowance(Address token, Address owner, Address spender) const
{
    auto it = m_state.allowances.find({token, owner, spender});
    return it != m_state.allowances.end() ? it->second : uint256_t{};
}

//-------------------------------------------------------------------------

uint256_t TokenLedger::totalSupply(Address token) const
{
    auto it = m_state.totalSupply.find(token);
    return it != m_state.totalSupply.end() ? it->second : uint256_t{};
}

//-------------------------------------------------------------------------

void TokenLedger::transfer(Address token, Address from, Address to, const uint256_t& amount)
{
    debit(token, from, amount);
    credit(token, to, amount);
}

//-------------------------------------------------------------------------

void TokenLedger::approve(Address token, Address owner, Address spender, const uint256_t& amount)
{
    static_cast<void>(tokenInfo(token));
    if (amount == 0) {
        m_state.allowances.erase({token, owner, spender});
        return;
    }
    m_state.allowances[{token, owner, spender}] = amount;
}

//-------------------------------------------------------------------------

void TokenLedger::transferFrom(
    Address token, Address spender, Address from, Address to, const uint256_t& amount)
{
    if (spender != from) {
        const uint256_t allowed = allowance(token, from, spender);
        if (allowed < amount) {
            throw InsufficientAllowanceException{fmt::format(
                "{:#x} allowed {} {} to {:#x}, {} requested",
                from, allowed, symbol(token), spender, amount)};
        }
        if (allowed != maxAllowance()) {
            approve(token, from, spender, allowed - amount);
        }
    }
    transfer(token, from, to, amount);
}

//-------------------------------------------------------------------------

void TokenLedger::mint(Address token, Address to, const uint256_t& amount)
{
    credit(token, to, amount);
    m_state.totalSupply[token] += amount;
}

//-------------------------------------------------------------------------

void TokenLedger::burn(Address token, Address from, const uint256_t& amount)
{
    debit(token, from, amount);
    m_state.totalSupply[token] -= amount;
}

//-------------------------------------------------------------------------

util::RestoreFn TokenLedger::checkpoint()
{
    return [this, state = m_state] { m_state = state; };
}

//-------------------------------------------------------------------------

const uint256_t& TokenLedger::maxAllowance()
{
    static const uint256_t s_max = std::numeric_limits<uint256_t>::max();
    return s_max;
}

//-------------------------------------------------------------------------

void TokenLedger::debit(Address token, Address holder, const uint256_t& amount)
{
    const uint256_t balance = balanceOf(token, holder);
    if (balance < amount) {
        throw InsufficientBalanceException{fmt::format(
            "{:#x} holds {} {}, {} requested", holder, balance, symbol(token), amount)};
    }
    if (balance == amount) {
        m_state.balances.erase({token, holder});
        return;
    }
    m_state.balances[{token, holder}] = balance - amount;
}

//-------------------------------------------------------------------------

void TokenLedger::credit(Address token, Address holder, const uint256_t& amount)
{
    static_cast<void>(tokenInfo(token));
    if (amount == 0) return;
    m_state.balances[{token, holder}] += amount;
}

//-------------------------------------------------------------------------

}  // namespace creditsim::simulation

//-------------------------------------------------------------------------
