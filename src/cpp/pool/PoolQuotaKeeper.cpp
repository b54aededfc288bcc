/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/pool/PoolQuotaKeeper.hpp"

#include "CreditException.hpp"
#include "creditsim/simulation/Chain.hpp"

//-------------------------------------------------------------------------

namespace creditsim::pool
{

//-------------------------------------------------------------------------

const int256_t PoolQuotaKeeper::kRemoveAllQuota = -(int256_t{1} << 95);

//-------------------------------------------------------------------------

PoolQuotaKeeper::PoolQuotaKeeper(simulation::Chain& chain, Address gauge)
    : m_chain{chain},
      m_address{chain.allocateAddress()},
      m_gauge{gauge},
      m_state{.lastQuotaRateUpdate = chain.timestamp()},
      m_journalEntry{chain.journal(), this}
{}

//-------------------------------------------------------------------------

void PoolQuotaKeeper::addCreditManager(Address creditManager)
{
    m_creditManagers.insert(creditManager);
}

//-------------------------------------------------------------------------

void PoolQuotaKeeper::addQuotaToken(Address token)
{
    if (m_state.tokens.contains(token)) {
        throw IncorrectParameterException{fmt::format("token {:#x} is already quoted", token)};
    }
    m_state.tokens.emplace(token, TokenQuotaParams{});
    m_chain.logDebug("QUOTA : Added quota token {:#x}", token);
}

//-------------------------------------------------------------------------

void PoolQuotaKeeper::updateRates(Address caller, std::span<const QuotaRateUpdate> rates)
{
    if (caller != m_gauge) {
        throw CallerNotGaugeException{fmt::format("{:#x}", caller)};
    }
    const Timestamp elapsed = m_chain.timestamp() - m_state.lastQuotaRateUpdate;
    for (auto& [token, params] : m_state.tokens) {
        params.cumulativeIndexLU = cumulativeIndexSince(params.cumulativeIndexLU, params.rate, elapsed);
    }
    for (const auto& [token, rate] : rates) {
        tokenParams(token).rate = rate;
        m_chain.logDebug("QUOTA : UpdateTokenQuotaRate {:#x} -> {} bps", token, rate);
    }
    m_state.lastQuotaRateUpdate = m_chain.timestamp();
}

//-------------------------------------------------------------------------

void PoolQuotaKeeper::setTokenLimit(Address token, const uint256_t& limit)
{
    tokenParams(token).limit = limit;
    m_chain.logDebug("QUOTA : SetTokenLimit {:#x} -> {}", token, limit);
}

//-------------------------------------------------------------------------

void PoolQuotaKeeper::setTokenQuotaIncreaseFee(Address token, uint16_t fee)
{
    if (fee > numeric::PERCENTAGE_FACTOR) {
        throw IncorrectParameterException{fmt::format("quota increase fee {} exceeds 100%", fee)};
    }
    tokenParams(token).quotaIncreaseFee = fee;
    m_chain.logDebug("QUOTA : SetQuotaIncreaseFee {:#x} -> {} bps", token, fee);
}

//-------------------------------------------------------------------------

QuotaUpdate PoolQuotaKeeper::updateQuota(
    Address caller,
    Address creditAccount,
    Address token,
    const int256_t& quotaChange,
    const uint256_t& minQuota,
    const uint256_t& maxQuota)
{
    checkCreditManager(caller);
    auto& params = tokenParams(token);
    auto& accountQuota = m_state.accountQuotas[{creditAccount, token}];

    const uint256_t quoted = accountQuota.quota;
    const uint256_t cumulativeIndexNow = cumulativeIndex(token);

    QuotaUpdate res{
        .caQuotaInterestChange = calcAccruedQuotaInterest(
            quoted, cumulativeIndexNow, accountQuota.cumulativeIndexLU)
    };

    uint256_t newQuoted;
    if (quotaChange > 0) {
        const uint256_t change =
            std::min(numeric::magnitude(quotaChange), numeric::saturatingSub(params.limit, params.totalQuoted));
        res.fees = numeric::percentMul(change, params.quotaIncreaseFee);
        newQuoted = quoted + change;
        res.enableToken = quoted == 0 && newQuoted > 0;
        params.totalQuoted += change;
    } else {
        const uint256_t change =
            quotaChange == kRemoveAllQuota ? quoted : numeric::magnitude(quotaChange);
        if (change > quoted) {
            throw QuotaIsOutOfBoundsException{fmt::format(
                "cannot decrease quota {} of {:#x} by {}", quoted, token, change)};
        }
        newQuoted = quoted - change;
        res.disableToken = quoted > 0 && newQuoted == 0;
        params.totalQuoted -= change;
    }

    if (newQuoted < minQuota || newQuoted > maxQuota) {
        throw QuotaIsOutOfBoundsException{fmt::format(
            "quota {} of {:#x} is outside [{}, {}]", newQuoted, token, minQuota, maxQuota)};
    }

    accountQuota.quota = newQuoted;
    accountQuota.cumulativeIndexLU = cumulativeIndexNow;

    m_chain.logDebug(
        "QUOTA : UpdateQuota account {:#x} token {:#x} change {} -> {}",
        creditAccount, token, quotaChange, newQuoted);

    return res;
}

//-------------------------------------------------------------------------

void PoolQuotaKeeper::removeQuotas(
    Address caller, Address creditAccount, std::span<const Address> tokens, bool setLimitsToZero)
{
    checkCreditManager(caller);
    for (Address token : tokens) {
        auto& params = tokenParams(token);
        auto it = m_state.accountQuotas.find({creditAccount, token});
        if (it != m_state.accountQuotas.end()) {
            params.totalQuoted -= it->second.quota;
            m_state.accountQuotas.erase(it);
        }
        if (setLimitsToZero) {
            params.limit = 0;
            m_chain.logDebug("QUOTA : SetTokenLimit {:#x} -> 0", token);
        }
    }
}

//-------------------------------------------------------------------------

void PoolQuotaKeeper::accrueQuotaInterest(
    Address caller, Address creditAccount, std::span<const Address> tokens)
{
    checkCreditManager(caller);
    for (Address token : tokens) {
        auto it = m_state.accountQuotas.find({creditAccount, token});
        if (it == m_state.accountQuotas.end()) continue;
        it->second.cumulativeIndexLU = cumulativeIndex(token);
    }
}

//-------------------------------------------------------------------------

QuotaAndInterest PoolQuotaKeeper::getQuotaAndOutstandingInterest(
    Address creditAccount, Address token) const
{
    auto it = m_state.accountQuotas.find({creditAccount, token});
    if (it == m_state.accountQuotas.end()) return {};
    const auto& [quota, cumulativeIndexLU] = it->second;
    return {
        .quoted = quota,
        .outstandingInterest = calcAccruedQuotaInterest(quota, cumulativeIndex(token), cumulativeIndexLU)
    };
}

//-------------------------------------------------------------------------

uint256_t PoolQuotaKeeper::getQuota(Address creditAccount, Address token) const
{
    auto it = m_state.accountQuotas.find({creditAccount, token});
    return it != m_state.accountQuotas.end() ? it->second.quota : uint256_t{};
}

//-------------------------------------------------------------------------

uint256_t PoolQuotaKeeper::cumulativeIndex(Address token) const
{
    const auto& params = tokenQuotaParams(token);
    return cumulativeIndexSince(
        params.cumulativeIndexLU, params.rate, m_chain.timestamp() - m_state.lastQuotaRateUpdate);
}

//-------------------------------------------------------------------------

uint16_t PoolQuotaKeeper::getQuotaRate(Address token) const
{
    return tokenQuotaParams(token).rate;
}

//-------------------------------------------------------------------------

const TokenQuotaParams& PoolQuotaKeeper::tokenQuotaParams(Address token) const
{
    auto it = m_state.tokens.find(token);
    if (it == m_state.tokens.end()) {
        throw TokenIsNotQuotedException{fmt::format("{:#x}", token)};
    }
    return it->second;
}

//-------------------------------------------------------------------------

bool PoolQuotaKeeper::isQuotedToken(Address token) const noexcept
{
    return m_state.tokens.contains(token);
}

//-------------------------------------------------------------------------

std::vector<Address> PoolQuotaKeeper::quotedTokens() const
{
    return m_state.tokens | views::keys | ranges::to<std::vector>();
}

//-------------------------------------------------------------------------

util::RestoreFn PoolQuotaKeeper::checkpoint()
{
    return [this, state = m_state] { m_state = state; };
}

//-------------------------------------------------------------------------

uint256_t PoolQuotaKeeper::cumulativeIndexSince(
    const uint256_t& cumulativeIndexLU, uint16_t rate, Timestamp elapsed)
{
    static const uint256_t s_rayDividedByPercentage = numeric::RAY / numeric::PERCENTAGE_FACTOR;
    return cumulativeIndexLU
        + s_rayDividedByPercentage * elapsed * rate / numeric::SECONDS_PER_YEAR;
}

//-------------------------------------------------------------------------

uint256_t PoolQuotaKeeper::calcAccruedQuotaInterest(
    const uint256_t& quoted, const uint256_t& cumulativeIndexNow, const uint256_t& cumulativeIndexLU)
{
    if (quoted == 0) return {};
    return numeric::mulDiv(quoted, cumulativeIndexNow - cumulativeIndexLU, numeric::RAY);
}

//-------------------------------------------------------------------------

void PoolQuotaKeeper::checkCreditManager(Address caller) const
{
    if (!m_creditManagers.contains(caller)) {
        throw CallerNotCreditManagerException{fmt::format("{:#x}", caller)};
    }
}

//-------------------------------------------------------------------------

TokenQuotaParams& PoolQuotaKeeper::tokenParams(Address token)
{
    auto it = m_state.tokens.find(token);
    if (it == m_state.tokens.end()) {
        throw TokenIsNotQuotedException{fmt::format("{:#x}", token)};
    }
    return it->second;
}

//-------------------------------------------------------------------------

}  // namespace creditsim::pool

//-------------------------------------------------------------------------
