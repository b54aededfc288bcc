/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/pool/LendingPool.hpp"

#include "CreditException.hpp"
#include "creditsim/simulation/Chain.hpp"
#include "creditsim/simulation/TokenLedger.hpp"

//-------------------------------------------------------------------------

namespace creditsim::pool
{

//-------------------------------------------------------------------------

LendingPool::LendingPool(simulation::Chain& chain, const LendingPoolDesc& desc)
    : m_chain{chain},
      m_address{chain.allocateAddress()},
      m_underlying{desc.underlying},
      m_state{
          .baseInterestRate = desc.baseInterestRate,
          .cumulativeIndexLU = numeric::RAY,
          .timestampLU = chain.timestamp()
      },
      m_journalEntry{chain.journal(), this}
{
    static_cast<void>(chain.ledger().tokenInfo(m_underlying));
}

//-------------------------------------------------------------------------

void LendingPool::addLiquidity(Address provider, const uint256_t& amount)
{
    m_chain.ledger().transfer(m_underlying, provider, m_address, amount);
    m_chain.logDebug("POOL : Liquidity +{} from {:#x}", amount, provider);
}

//-------------------------------------------------------------------------

uint256_t LendingPool::availableLiquidity() const
{
    return m_chain.ledger().balanceOf(m_underlying, m_address);
}

//-------------------------------------------------------------------------

uint256_t LendingPool::baseInterestIndex() const
{
    const Timestamp dt = m_chain.timestamp() - m_state.timestampLU;
    if (dt == 0) return m_state.cumulativeIndexLU;
    const uint256_t linearGrowth =
        numeric::RAY + m_state.baseInterestRate * dt / numeric::SECONDS_PER_YEAR;
    return numeric::mulDiv(m_state.cumulativeIndexLU, linearGrowth, numeric::RAY);
}

//-------------------------------------------------------------------------

void LendingPool::setBaseInterestRate(const uint256_t& rate)
{
    m_state.cumulativeIndexLU = baseInterestIndex();
    m_state.timestampLU = m_chain.timestamp();
    m_state.baseInterestRate = rate;
    m_chain.logDebug("POOL : Base rate set to {} (index {})", rate, m_state.cumulativeIndexLU);
}

//-------------------------------------------------------------------------

void LendingPool::addCreditManager(Address creditManager)
{
    m_state.creditManagers.try_emplace(creditManager);
}

//-------------------------------------------------------------------------

void LendingPool::setCreditManagerDebtLimit(Address creditManager, const uint256_t& limit)
{
    creditManagerDebt(creditManager).limit = limit;
}

//-------------------------------------------------------------------------

uint256_t LendingPool::creditManagerBorrowable(Address creditManager) const
{
    auto it = m_state.creditManagers.find(creditManager);
    if (it == m_state.creditManagers.end()) return {};
    const auto& [borrowed, limit] = it->second;
    return std::min(numeric::saturatingSub(limit, borrowed), availableLiquidity());
}

//-------------------------------------------------------------------------

uint256_t LendingPool::creditManagerBorrowed(Address creditManager) const
{
    auto it = m_state.creditManagers.find(creditManager);
    return it != m_state.creditManagers.end() ? it->second.borrowed : uint256_t{};
}

//-------------------------------------------------------------------------

void LendingPool::lendCreditAccount(Address caller, const uint256_t& amount, Address creditAccount)
{
    auto& cmDebt = creditManagerDebt(caller);
    if (amount > creditManagerBorrowable(caller)) {
        throw BorrowLimitExceededException{fmt::format(
            "credit manager {:#x} cannot borrow {} (borrowed {}, limit {}, liquidity {})",
            caller, amount, cmDebt.borrowed, cmDebt.limit, availableLiquidity())};
    }
    cmDebt.borrowed += amount;
    m_state.totalBorrowed += amount;
    m_chain.ledger().transfer(m_underlying, m_address, creditAccount, amount);
    m_chain.logDebug("POOL : Lent {} to {:#x}", amount, creditAccount);
}

//-------------------------------------------------------------------------

void LendingPool::repayCreditAccount(
    Address caller, const uint256_t& repaidAmount, const uint256_t& profit, const uint256_t& loss)
{
    auto& cmDebt = creditManagerDebt(caller);
    if (cmDebt.borrowed < repaidAmount) {
        throw IncorrectParameterException{fmt::format(
            "credit manager {:#x} repays {} but borrowed {}", caller, repaidAmount, cmDebt.borrowed)};
    }
    cmDebt.borrowed -= repaidAmount;
    m_state.totalBorrowed -= repaidAmount;
    m_state.treasuryProfit += profit;
    m_state.totalLosses += loss;
    m_chain.logDebug("POOL : Repaid {} (profit {}, loss {})", repaidAmount, profit, loss);
}

//-------------------------------------------------------------------------

util::RestoreFn LendingPool::checkpoint()
{
    return [this, state = m_state] { m_state = state; };
}

//-------------------------------------------------------------------------

LendingPool::CreditManagerDebt& LendingPool::creditManagerDebt(Address creditManager)
{
    auto it = m_state.creditManagers.find(creditManager);
    if (it == m_state.creditManagers.end()) {
        throw CallerNotCreditManagerException{fmt::format(
            "{:#x} is not connected to the pool", creditManager)};
    }
    return it->second;
}

//-------------------------------------------------------------------------

}  // namespace creditsim::pool

//-------------------------------------------------------------------------
