/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "BitMask.hpp"
#include "Journal.hpp"
#include "common.hpp"
#include "creditsim/accounting/CollateralDebtData.hpp"
#include "creditsim/accounting/CollateralLogic.hpp"
#include "creditsim/accounting/CollateralTokenData.hpp"
#include "creditsim/accounting/CreditAccountInfo.hpp"
#include "creditsim/accounting/CreditLogic.hpp"
#include "creditsim/accounting/Fees.hpp"
#include "creditsim/oracle/PriceOracle.hpp"
#include "creditsim/credit/WithdrawalManager.hpp"
#include "creditsim/simulation/CallData.hpp"

#include <unordered_map>

//-------------------------------------------------------------------------

namespace creditsim::simulation
{
class Chain;
class WETHGateway;
}  // namespace creditsim::simulation

namespace creditsim::pool
{
class AccountFactory;
class LendingPool;
class PoolQuotaKeeper;
}  // namespace creditsim::pool

//-------------------------------------------------------------------------

namespace creditsim::credit
{

//-------------------------------------------------------------------------

inline constexpr Address kInactiveCreditAccount = 1;
inline constexpr uint32_t kDefaultMaxEnabledTokens = 12;

enum class ManageDebtAction : uint8_t
{
    INCREASE_DEBT,
    DECREASE_DEBT
};

struct ManageDebtResult
{
    uint256_t newDebt;
    TokenMask tokensToEnable;
    TokenMask tokensToDisable;
};

struct QuotaChangeResult
{
    TokenMask tokensToEnable;
    TokenMask tokensToDisable;
};

struct CloseResult
{
    uint256_t remainingFunds;
    uint256_t loss;
};

struct RevocationPair
{
    Address token;
    Address spender;

    [[nodiscard]] bool operator==(const RevocationPair& other) const noexcept = default;
};

struct CreditManagerDesc
{
    Address creditConfigurator;
    uint32_t maxEnabledTokens{kDefaultMaxEnabledTokens};
    simulation::WETHGateway* wethGateway{};
    WithdrawalManager* withdrawalManager{};
};

//-------------------------------------------------------------------------

class CreditManager;

/**
 * Holds the credit manager's active account slot for the duration of an
 * adapter call and re-arms it to kInactiveCreditAccount on every exit path.
 */
class ActiveCreditAccountGuard
{
public:
    ~ActiveCreditAccountGuard() noexcept;

    ActiveCreditAccountGuard(const ActiveCreditAccountGuard&) = delete;
    ActiveCreditAccountGuard& operator=(const ActiveCreditAccountGuard&) = delete;
    ActiveCreditAccountGuard(ActiveCreditAccountGuard&&) = delete;
    ActiveCreditAccountGuard& operator=(ActiveCreditAccountGuard&&) = delete;

private:
    explicit ActiveCreditAccountGuard(CreditManager& creditManager) noexcept
        : m_creditManager{creditManager}
    {}

    CreditManager& m_creditManager;

    friend class CreditManager;
};

//-------------------------------------------------------------------------

/**
 * Owns every credit account of one underlying: debt and interest indices,
 * the collateral token registry, enabled token masks, settlement and the
 * adapter registry. Account operations are reserved to the credit facade,
 * parameter changes to the credit configurator, approvals and external calls
 * to allowed adapters.
 */
class CreditManager : public util::Journaled
{
public:
    CreditManager(
        simulation::Chain& chain,
        pool::LendingPool& pool,
        pool::PoolQuotaKeeper& poolQuotaKeeper,
        pool::AccountFactory& accountFactory,
        const oracle::PriceOracle& priceOracle,
        const CreditManagerDesc& desc);

    // Credit facade.
    [[nodiscard]] Address openCreditAccount(Address caller, const uint256_t& debt, Address onBehalfOf);

    CloseResult closeCreditAccount(
        Address caller,
        Address creditAccount,
        accounting::ClosureKind closureKind,
        const accounting::CollateralDebtData& collateralDebtData,
        Address payer,
        Address to,
        const TokenMask& skipTokensMask,
        bool convertToETH);

    ManageDebtResult manageDebt(
        Address caller,
        Address creditAccount,
        const uint256_t& amount,
        const TokenMask& enabledTokensMask,
        ManageDebtAction action);

    TokenMask addCollateral(
        Address caller, Address payer, Address creditAccount, Address token, const uint256_t& amount);

    /**
     * Sends `amount` of `token` to `to` straight away when there is no
     * withdrawal delay; otherwise moves it to the withdrawal manager as a
     * scheduled withdrawal that matures after the delay.
     */
    TokenMask withdrawCollateral(
        Address caller, Address creditAccount, Address token, const uint256_t& amount, Address to);

    // Returns the tokens to re-enable for cancelled withdrawals.
    TokenMask claimWithdrawals(Address caller, Address creditAccount, Address to, ClaimAction action);

    QuotaChangeResult updateQuota(
        Address caller,
        Address creditAccount,
        Address token,
        const int256_t& quotaChange,
        const uint256_t& minQuota,
        const uint256_t& maxQuota);

    /**
     * Throws NotEnoughCollateralException unless the TWV of `enabledTokensMask`
     * covers total debt * minHealthFactor / 10000. Valuation is lazy: hinted
     * tokens go first and the scan stops once the target is reached. On
     * success the mask, minus tokens found empty, is saved.
     */
    void fullCollateralCheck(
        Address caller,
        Address creditAccount,
        const TokenMask& enabledTokensMask,
        std::span<const TokenMask> collateralHints,
        uint16_t minHealthFactor);

    void saveEnabledTokensMask(Address caller, Address creditAccount, const TokenMask& enabledTokensMask);
    void revokeAdapterAllowances(
        Address caller, Address creditAccount, std::span<const RevocationPair> revocations);
    void setFlagFor(Address caller, Address creditAccount, uint16_t flag, bool value);

    [[nodiscard]] ActiveCreditAccountGuard activate(Address caller, Address creditAccount);

    // Adapters.
    [[nodiscard]] Address getActiveCreditAccountOrRevert() const;
    void approveCreditAccount(Address caller, Address token, const uint256_t& amount);
    std::vector<uint256_t> execute(Address caller, const simulation::CallData& data);

    // Credit configurator.
    TokenMask addToken(Address caller, Address token);
    void setCollateralTokenData(
        Address caller,
        Address token,
        uint16_t ltInitial,
        uint16_t ltFinal,
        Timestamp timestampRampStart,
        uint32_t rampDuration);
    void setQuotedMask(Address caller, const TokenMask& quotedTokensMask);
    void setMaxEnabledTokens(Address caller, uint32_t maxEnabledTokens);
    void setFees(Address caller, const accounting::CreditFees& fees);
    void setContractAllowance(Address caller, Address adapter, Address targetContract);
    void setCreditFacade(Address caller, Address creditFacade);
    void setCreditConfigurator(Address caller, Address creditConfigurator);

    // Views.
    [[nodiscard]] accounting::CollateralDebtData calcDebtAndCollateral(
        Address creditAccount, accounting::CollateralCalcTask task) const;
    [[nodiscard]] bool isLiquidatable(Address creditAccount, uint16_t minHealthFactor) const;

    [[nodiscard]] Address address() const noexcept { return m_address; }
    [[nodiscard]] Address underlying() const noexcept { return m_underlying; }
    [[nodiscard]] pool::LendingPool& pool() noexcept { return m_pool; }
    [[nodiscard]] pool::PoolQuotaKeeper& poolQuotaKeeper() noexcept { return m_poolQuotaKeeper; }
    [[nodiscard]] WithdrawalManager* withdrawalManager() noexcept { return m_withdrawalManager; }
    [[nodiscard]] const oracle::PriceOracle& priceOracle() const noexcept { return m_priceOracle; }
    [[nodiscard]] Address creditFacade() const noexcept { return m_state.creditFacade; }
    [[nodiscard]] Address creditConfigurator() const noexcept { return m_state.creditConfigurator; }
    [[nodiscard]] const accounting::CreditFees& fees() const noexcept { return m_state.fees; }
    [[nodiscard]] uint32_t maxEnabledTokens() const noexcept { return m_state.maxEnabledTokens; }
    [[nodiscard]] const TokenMask& quotedTokensMask() const noexcept { return m_state.quotedTokensMask; }
    [[nodiscard]] uint32_t collateralTokensCount() const noexcept;
    [[nodiscard]] const accounting::CollateralTokenData& collateralTokenByMask(const TokenMask& mask) const;
    [[nodiscard]] const accounting::CollateralTokenData& collateralTokenData(Address token) const;
    [[nodiscard]] uint16_t liquidationThreshold(Address token) const;
    [[nodiscard]] TokenMask getTokenMaskOrRevert(Address token) const;
    [[nodiscard]] bool isCollateralToken(Address token) const noexcept;
    [[nodiscard]] const accounting::CreditAccountInfo& creditAccountInfo(Address creditAccount) const;
    [[nodiscard]] bool hasCreditAccount(Address creditAccount) const noexcept;
    [[nodiscard]] Address borrower(Address creditAccount) const;
    [[nodiscard]] TokenMask enabledTokensMaskOf(Address creditAccount) const;
    [[nodiscard]] uint16_t flagsOf(Address creditAccount) const;
    [[nodiscard]] std::vector<Address> creditAccounts() const;
    [[nodiscard]] Address adapterToContract(Address adapter) const noexcept;
    [[nodiscard]] Address contractToAdapter(Address targetContract) const noexcept;
    [[nodiscard]] Address activeCreditAccount() const noexcept { return m_activeCreditAccount; }

    [[nodiscard]] virtual util::RestoreFn checkpoint() override;

private:
    struct State
    {
        std::map<Address, accounting::CreditAccountInfo> accounts;
        std::vector<accounting::CollateralTokenData> collateralTokens;
        std::unordered_map<Address, uint32_t> tokenIndices;
        TokenMask quotedTokensMask;
        accounting::CreditFees fees;
        uint32_t maxEnabledTokens;
        std::unordered_map<Address, Address> adapterToContract;
        std::unordered_map<Address, Address> contractToAdapter;
        Address creditFacade;
        Address creditConfigurator;
    };

    void checkCreditFacade(Address caller) const;
    void checkCreditConfigurator(Address caller) const;
    [[nodiscard]] Address checkAdapter(Address caller) const;

    [[nodiscard]] accounting::CreditAccountInfo& accountInfo(Address creditAccount);
    [[nodiscard]] accounting::CollateralDebtData calcDebtData(
        Address creditAccount,
        const accounting::CreditAccountInfo& info,
        const TokenMask& enabledTokensMask) const;
    [[nodiscard]] accounting::CollateralSources collateralSources(Address creditAccount) const;
    void saveEnabledTokensMask(accounting::CreditAccountInfo& info, const TokenMask& enabledTokensMask);
    void batchTokensTransfer(Address creditAccount, Address to, bool convertToETH, const TokenMask& tokensMask);
    void deactivate() noexcept;

    simulation::Chain& m_chain;
    pool::LendingPool& m_pool;
    pool::PoolQuotaKeeper& m_poolQuotaKeeper;
    pool::AccountFactory& m_accountFactory;
    const oracle::PriceOracle& m_priceOracle;
    simulation::WETHGateway* m_wethGateway;
    WithdrawalManager* m_withdrawalManager;
    Address m_address;
    Address m_underlying;
    Address m_activeCreditAccount{kInactiveCreditAccount};
    State m_state;
    util::JournalEntry m_journalEntry;

    friend class ActiveCreditAccountGuard;
};

//-------------------------------------------------------------------------

}  // namespace creditsim::credit

//-------------------------------------------------------------------------
