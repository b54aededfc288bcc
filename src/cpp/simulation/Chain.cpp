/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/simulation/Chain.hpp"

#include "CreditException.hpp"
#include "creditsim/simulation/TokenLedger.hpp"

//-------------------------------------------------------------------------

namespace creditsim::simulation
{

//-------------------------------------------------------------------------

Chain::Chain(const ChainDesc& desc)
    : m_blockNumber{desc.blockNumber},
      m_timestamp{desc.timestamp},
      m_blockTime{desc.blockTime},
      m_debug{desc.debug}
{
    if (m_blockTime == 0) {
        throw std::invalid_argument{fmt::format(
            "{}: Block time must be positive",
            std::source_location::current().function_name())};
    }
    m_ledger = std::make_unique<TokenLedger>(*this);
}

//-------------------------------------------------------------------------

Chain::~Chain() noexcept = default;

//-------------------------------------------------------------------------

void Chain::roll(BlockNumber blockNumber)
{
    if (blockNumber < m_blockNumber) {
        throw std::invalid_argument{fmt::format(
            "{}: Cannot roll back from block {} to {}",
            std::source_location::current().function_name(), m_blockNumber, blockNumber)};
    }
    m_blockNumber = blockNumber;
}

//-------------------------------------------------------------------------

void Chain::warp(Timestamp timestamp)
{
    if (timestamp < m_timestamp) {
        throw std::invalid_argument{fmt::format(
            "{}: Cannot warp back from {} to {}",
            std::source_location::current().function_name(), m_timestamp, timestamp)};
    }
    m_timestamp = timestamp;
}

//-------------------------------------------------------------------------

void Chain::advance(BlockNumber blocks)
{
    m_blockNumber += blocks;
    m_timestamp += blocks * m_blockTime;
}

//-------------------------------------------------------------------------

Address Chain::allocateAddress() noexcept
{
    return m_nextAddress++;
}

//-------------------------------------------------------------------------

void Chain::registerContract(ExternalContract* contract)
{
    auto [it, inserted] = m_contracts.emplace(contract->address(), contract);
    if (!inserted) {
        throw std::invalid_argument{fmt::format(
            "{}: A contract is already registered at {:#x}",
            std::source_location::current().function_name(), contract->address())};
    }
}

//-------------------------------------------------------------------------

bool Chain::isContract(Address address) const noexcept
{
    return m_contracts.contains(address);
}

//-------------------------------------------------------------------------

ExternalContract& Chain::contractAt(Address address) const
{
    auto it = m_contracts.find(address);
    if (it == m_contracts.end()) {
        throw TargetContractNotAllowedException{fmt::format("no contract at {:#x}", address)};
    }
    return *it->second;
}

//-------------------------------------------------------------------------

}  // namespace creditsim::simulation

//-------------------------------------------------------------------------
