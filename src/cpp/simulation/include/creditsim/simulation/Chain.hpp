/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Journal.hpp"
#include "common.hpp"
#include "creditsim/simulation/CallData.hpp"

#include <unordered_map>

//-------------------------------------------------------------------------

namespace creditsim::simulation
{

//-------------------------------------------------------------------------

class TokenLedger;

struct ChainDesc
{
    BlockNumber blockNumber{1};
    Timestamp timestamp{1'700'000'000};
    Timestamp blockTime{12};
    bool debug{};
};

//-------------------------------------------------------------------------

/**
 * The host ledger: block clock, address space, contract registry, token
 * ledger and the journal that makes each entry point atomic.
 */
class Chain
{
public:
    explicit Chain(const ChainDesc& desc = {});
    ~Chain() noexcept;

    Chain(const Chain&) = delete;
    Chain& operator=(const Chain&) = delete;

    [[nodiscard]] BlockNumber blockNumber() const noexcept { return m_blockNumber; }
    [[nodiscard]] Timestamp timestamp() const noexcept { return m_timestamp; }
    [[nodiscard]] Timestamp blockTime() const noexcept { return m_blockTime; }

    void roll(BlockNumber blockNumber);
    void warp(Timestamp timestamp);
    void advance(BlockNumber blocks = 1);

    [[nodiscard]] Address allocateAddress() noexcept;

    void registerContract(ExternalContract* contract);
    [[nodiscard]] bool isContract(Address address) const noexcept;
    [[nodiscard]] ExternalContract& contractAt(Address address) const;

    [[nodiscard]] util::Journal& journal() noexcept { return m_journal; }
    [[nodiscard]] TokenLedger& ledger() noexcept { return *m_ledger; }
    [[nodiscard]] const TokenLedger& ledger() const noexcept { return *m_ledger; }

    template<typename... Args>
    void logDebug(fmt::format_string<Args...> fmt, Args&&... args) const
    {
        if (m_debug) {
            fmt::print("{} | {}\n", m_blockNumber, fmt::format(fmt, std::forward<Args>(args)...));
        }
    }

    void setDebug(bool flag) noexcept { m_debug = flag; }
    [[nodiscard]] bool debug() const noexcept { return m_debug; }

private:
    BlockNumber m_blockNumber;
    Timestamp m_timestamp;
    Timestamp m_blockTime;
    bool m_debug;
    Address m_nextAddress{0x1'0000'0000};
    std::unordered_map<Address, ExternalContract*> m_contracts;
    util::Journal m_journal;
    std::unique_ptr<TokenLedger> m_ledger;
};

//-------------------------------------------------------------------------

}  // namespace creditsim::simulation

//-------------------------------------------------------------------------
