/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Journal.hpp"
#include "common.hpp"

#include <unordered_map>

//-------------------------------------------------------------------------

namespace creditsim::simulation
{
class Chain;
}  // namespace creditsim::simulation

//-------------------------------------------------------------------------

namespace creditsim::pool
{

//-------------------------------------------------------------------------

struct LendingPoolDesc
{
    Address underlying;
    // Base borrow rate per year, RAY-scaled.
    uint256_t baseInterestRate{};
};

//-------------------------------------------------------------------------

/**
 * Capital source for credit managers. Tracks a linearly compounding base
 * interest index and per-manager borrowing.
 */
class LendingPool : public util::Journaled
{
public:
    LendingPool(simulation::Chain& chain, const LendingPoolDesc& desc);

    [[nodiscard]] Address address() const noexcept { return m_address; }
    [[nodiscard]] Address underlying() const noexcept { return m_underlying; }

    void addLiquidity(Address provider, const uint256_t& amount);
    [[nodiscard]] uint256_t availableLiquidity() const;

    [[nodiscard]] uint256_t baseInterestIndex() const;
    [[nodiscard]] const uint256_t& baseInterestRate() const noexcept { return m_state.baseInterestRate; }
    void setBaseInterestRate(const uint256_t& rate);

    void addCreditManager(Address creditManager);
    void setCreditManagerDebtLimit(Address creditManager, const uint256_t& limit);
    [[nodiscard]] uint256_t creditManagerBorrowable(Address creditManager) const;
    [[nodiscard]] uint256_t creditManagerBorrowed(Address creditManager) const;

    void lendCreditAccount(Address caller, const uint256_t& amount, Address creditAccount);
    void repayCreditAccount(
        Address caller, const uint256_t& repaidAmount, const uint256_t& profit, const uint256_t& loss);

    [[nodiscard]] const uint256_t& totalBorrowed() const noexcept { return m_state.totalBorrowed; }
    [[nodiscard]] const uint256_t& treasuryProfit() const noexcept { return m_state.treasuryProfit; }
    [[nodiscard]] const uint256_t& totalLosses() const noexcept { return m_state.totalLosses; }

    [[nodiscard]] virtual util::RestoreFn checkpoint() override;

private:
    struct CreditManagerDebt
    {
        uint256_t borrowed;
        uint256_t limit;
    };

    struct State
    {
        uint256_t baseInterestRate;
        uint256_t cumulativeIndexLU;
        Timestamp timestampLU;
        uint256_t totalBorrowed;
        uint256_t treasuryProfit;
        uint256_t totalLosses;
        std::unordered_map<Address, CreditManagerDebt> creditManagers;
    };

    [[nodiscard]] CreditManagerDebt& creditManagerDebt(Address creditManager);

    simulation::Chain& m_chain;
    Address m_address;
    Address m_underlying;
    State m_state;
    util::JournalEntry m_journalEntry;
};

//-------------------------------------------------------------------------

}  // namespace creditsim::pool

//-------------------------------------------------------------------------
