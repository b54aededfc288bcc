/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Journal.hpp"
#include "common.hpp"

#include <unordered_set>

//-------------------------------------------------------------------------

namespace creditsim::simulation
{
class Chain;
}  // namespace creditsim::simulation

//-------------------------------------------------------------------------

namespace creditsim::pool
{

//-------------------------------------------------------------------------

struct TokenQuotaParams
{
    // Annual quota rate, bps.
    uint16_t rate{};
    uint256_t cumulativeIndexLU{};
    // One-off fee on quota increases, bps.
    uint16_t quotaIncreaseFee{};
    uint256_t totalQuoted{};
    uint256_t limit{};
};

struct AccountQuota
{
    uint256_t quota{};
    uint256_t cumulativeIndexLU{};
};

struct QuotaUpdate
{
    uint256_t caQuotaInterestChange;
    uint256_t fees;
    bool enableToken;
    bool disableToken;
};

struct QuotaAndInterest
{
    uint256_t quoted;
    uint256_t outstandingInterest;
};

struct QuotaRateUpdate
{
    Address token;
    uint16_t rate;
};

//-------------------------------------------------------------------------

/**
 * Per-token exposure caps layered on top of plain collateral accounting.
 * Each quoted token accrues interest through its own linear index.
 */
class PoolQuotaKeeper : public util::Journaled
{
public:
    PoolQuotaKeeper(simulation::Chain& chain, Address gauge);

    [[nodiscard]] Address address() const noexcept { return m_address; }
    [[nodiscard]] Address gauge() const noexcept { return m_gauge; }

    void addCreditManager(Address creditManager);

    void addQuotaToken(Address token);
    void updateRates(Address caller, std::span<const QuotaRateUpdate> rates);
    void setTokenLimit(Address token, const uint256_t& limit);
    void setTokenQuotaIncreaseFee(Address token, uint16_t fee);

    [[nodiscard]] QuotaUpdate updateQuota(
        Address caller,
        Address creditAccount,
        Address token,
        const int256_t& quotaChange,
        const uint256_t& minQuota,
        const uint256_t& maxQuota);

    void removeQuotas(
        Address caller, Address creditAccount, std::span<const Address> tokens, bool setLimitsToZero);

    void accrueQuotaInterest(Address caller, Address creditAccount, std::span<const Address> tokens);

    [[nodiscard]] QuotaAndInterest getQuotaAndOutstandingInterest(
        Address creditAccount, Address token) const;
    [[nodiscard]] uint256_t getQuota(Address creditAccount, Address token) const;
    [[nodiscard]] uint256_t cumulativeIndex(Address token) const;
    [[nodiscard]] uint16_t getQuotaRate(Address token) const;
    [[nodiscard]] const TokenQuotaParams& tokenQuotaParams(Address token) const;
    [[nodiscard]] bool isQuotedToken(Address token) const noexcept;
    [[nodiscard]] std::vector<Address> quotedTokens() const;

    [[nodiscard]] virtual util::RestoreFn checkpoint() override;

    [[nodiscard]] static uint256_t cumulativeIndexSince(
        const uint256_t& cumulativeIndexLU, uint16_t rate, Timestamp elapsed);
    [[nodiscard]] static uint256_t calcAccruedQuotaInterest(
        const uint256_t& quoted, const uint256_t& cumulativeIndexNow, const uint256_t& cumulativeIndexLU);

    static const int256_t kRemoveAllQuota;

private:
    void checkCreditManager(Address caller) const;
    [[nodiscard]] TokenQuotaParams& tokenParams(Address token);

    struct State
    {
        std::map<Address, TokenQuotaParams> tokens;
        std::map<std::pair<Address, Address>, AccountQuota> accountQuotas;
        Timestamp lastQuotaRateUpdate;
    };

    simulation::Chain& m_chain;
    Address m_address;
    Address m_gauge;
    std::unordered_set<Address> m_creditManagers;
    State m_state;
    util::JournalEntry m_journalEntry;
};

//-------------------------------------------------------------------------

}  // namespace creditsim::pool

//-------------------------------------------------------------------------
