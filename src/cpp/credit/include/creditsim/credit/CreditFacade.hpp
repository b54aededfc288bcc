/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "BitMask.hpp"
#include "Journal.hpp"
#include "common.hpp"
#include "creditsim/credit/CreditEvents.hpp"
#include "creditsim/credit/CreditManager.hpp"
#include "creditsim/credit/MultiCall.hpp"

#include <limits>

//-------------------------------------------------------------------------

namespace creditsim::credit
{

//-------------------------------------------------------------------------

class AccessControl;
class BotList;

// Multiplier value lifting the per-block borrowing cap.
inline constexpr uint8_t kUnlimitedDebtPerBlock = std::numeric_limits<uint8_t>::max();

struct CreditFacadeDesc
{
    bool expirable{};
    Timestamp expirationDate{};
};

struct DebtLimits
{
    uint256_t minDebt;
    uint256_t maxDebt;
};

//-------------------------------------------------------------------------

/**
 * User-facing entry point of a credit manager. Every public mutating method
 * is one transaction on the chain journal: on any exception all journaled
 * state is restored and the events it buffered are dropped; on success the
 * events are published through `signal()`.
 */
class CreditFacade : public util::Journaled
{
public:
    CreditFacade(
        simulation::Chain& chain,
        CreditManager& creditManager,
        BotList& botList,
        const AccessControl& accessControl,
        const CreditFacadeDesc& desc);

    [[nodiscard]] Address openCreditAccount(
        Address caller, const uint256_t& debt, Address onBehalfOf, std::span<const MultiCall> calls = {});

    void closeCreditAccount(
        Address caller,
        Address creditAccount,
        Address to,
        const TokenMask& skipTokensMask,
        bool convertToETH,
        std::span<const MultiCall> calls = {});

    /**
     * Liquidates an account whose TWV is below its total debt, or any account
     * once the facade has expired. Returns the funds paid to the borrower.
     */
    uint256_t liquidateCreditAccount(
        Address caller,
        Address creditAccount,
        Address to,
        const TokenMask& skipTokensMask,
        bool convertToETH,
        std::span<const MultiCall> calls = {});

    void multicall(Address caller, Address creditAccount, std::span<const MultiCall> calls);
    void botMulticall(Address caller, Address creditAccount, std::span<const MultiCall> calls);

    void setBotPermissions(
        Address caller,
        Address creditAccount,
        Address bot,
        uint32_t permissions,
        const uint256_t& fundingAmount,
        const uint256_t& weeklyAllowance);

    void pause(Address caller);
    void unpause(Address caller);

    // Credit configurator.
    void setDebtLimits(Address caller, const uint256_t& minDebt, const uint256_t& maxDebt);
    void setMaxDebtPerBlockMultiplier(Address caller, uint8_t multiplier);
    void setTokenAllowance(Address caller, Address token, bool allowed);
    void setExpirationDate(Address caller, Timestamp expirationDate);
    void setEmergencyLiquidator(Address caller, Address liquidator, bool allowed);
    void setMaxCumulativeLoss(Address caller, const uint256_t& maxCumulativeLoss);
    void resetCumulativeLoss(Address caller);

    [[nodiscard]] Address address() const noexcept { return m_address; }
    [[nodiscard]] CreditManager& creditManager() noexcept { return m_creditManager; }
    [[nodiscard]] bool paused() const noexcept { return m_state.paused; }
    [[nodiscard]] bool expirable() const noexcept { return m_expirable; }
    [[nodiscard]] Timestamp expirationDate() const noexcept { return m_state.expirationDate; }
    [[nodiscard]] bool expired() const noexcept;
    [[nodiscard]] DebtLimits debtLimits() const noexcept { return {m_state.minDebt, m_state.maxDebt}; }
    [[nodiscard]] uint8_t maxDebtPerBlockMultiplier() const noexcept { return m_state.maxDebtPerBlockMultiplier; }
    [[nodiscard]] const TokenMask& forbiddenTokenMask() const noexcept { return m_state.forbiddenTokenMask; }
    [[nodiscard]] const uint256_t& cumulativeLoss() const noexcept { return m_state.cumulativeLoss; }
    [[nodiscard]] const uint256_t& maxCumulativeLoss() const noexcept { return m_state.maxCumulativeLoss; }
    [[nodiscard]] bool isEmergencyLiquidator(Address account) const noexcept;
    [[nodiscard]] const uint256_t& totalBorrowedInBlock() const noexcept { return m_state.totalBorrowedInBlock; }

    [[nodiscard]] UnsyncSignal<void(const CreditEvent&)>& signal() noexcept { return m_signal; }

    [[nodiscard]] virtual util::RestoreFn checkpoint() override;

private:
    struct State
    {
        bool paused{};
        Timestamp expirationDate{};
        uint256_t minDebt{};
        uint256_t maxDebt{};
        uint8_t maxDebtPerBlockMultiplier{};
        BlockNumber lastBlockBorrowed{};
        uint256_t totalBorrowedInBlock{};
        TokenMask forbiddenTokenMask{};
        uint256_t cumulativeLoss{};
        uint256_t maxCumulativeLoss{};
        std::set<Address> emergencyLiquidators;
    };

    enum class CheckMode : uint8_t
    {
        FULL_COLLATERAL_CHECK,
        SKIP_COLLATERAL_CHECK
    };

    template<typename Fn>
    decltype(auto) transact(Fn&& fn);

    void emit(CreditEvent::ItemType item);

    void checkCreditConfigurator(Address caller) const;
    void checkAccountOwner(Address caller, Address creditAccount) const;
    void checkNotPaused() const;
    void checkNotExpired() const;

    TokenMask runMultiCall(
        Address caller,
        Address creditAccount,
        std::span<const MultiCall> calls,
        TokenMask enabledTokensMask,
        uint32_t permissions,
        CheckMode checkMode);

    void execute(MultiCallContext& ctx, const MultiCallAction& action);

    void addCollateral(MultiCallContext& ctx, const action::AddCollateral& item);
    void increaseDebt(MultiCallContext& ctx, const action::IncreaseDebt& item);
    void decreaseDebt(MultiCallContext& ctx, const action::DecreaseDebt& item);
    void enableToken(MultiCallContext& ctx, const action::EnableToken& item);
    void disableToken(MultiCallContext& ctx, const action::DisableToken& item);
    void withdrawCollateral(MultiCallContext& ctx, const action::WithdrawCollateral& item);
    void updateQuota(MultiCallContext& ctx, const action::UpdateQuota& item);
    void revokeAdapterAllowances(MultiCallContext& ctx, const action::RevokeAdapterAllowances& item);
    void storeExpectedBalances(MultiCallContext& ctx, const action::StoreExpectedBalances& item);
    void compareBalances(MultiCallContext& ctx);
    void setFullCheckParams(MultiCallContext& ctx, const action::SetFullCheckParams& item);
    void externalCall(MultiCallContext& ctx, const action::ExternalCall& item);

    void checkDebtLimits(const uint256_t& debt) const;
    void trackBorrowedInBlock(const uint256_t& amount);
    void snapshotForbiddenBalances(MultiCallContext& ctx) const;
    void checkForbiddenBalances(const MultiCallContext& ctx) const;
    void fullCollateralCheck(const MultiCallContext& ctx);
    void absorbLoss(Address creditAccount, const uint256_t& loss);

    simulation::Chain& m_chain;
    CreditManager& m_creditManager;
    BotList& m_botList;
    const AccessControl& m_accessControl;
    Address m_address;
    bool m_expirable;
    State m_state;
    std::vector<CreditEvent> m_pendingEvents;
    uint64_t m_eventCounter{};
    UnsyncSignal<void(const CreditEvent&)> m_signal;
    util::JournalEntry m_journalEntry;
};

//-------------------------------------------------------------------------

}  // namespace creditsim::credit

//-------------------------------------------------------------------------
