/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/credit/CreditFacade.hpp"

#include "CreditException.hpp"
#include "creditsim/credit/AccessControl.hpp"
#include "creditsim/credit/Adapter.hpp"
#include "creditsim/credit/BotList.hpp"
#include "creditsim/credit/Permissions.hpp"
#include "creditsim/simulation/Chain.hpp"
#include "creditsim/simulation/TokenLedger.hpp"

//-------------------------------------------------------------------------

namespace creditsim::credit
{

//-------------------------------------------------------------------------

using accounting::ClosureKind;
using accounting::CollateralCalcTask;

//-------------------------------------------------------------------------

CreditFacade::CreditFacade(
    simulation::Chain& chain,
    CreditManager& creditManager,
    BotList& botList,
    const AccessControl& accessControl,
    const CreditFacadeDesc& desc)
    : m_chain{chain},
      m_creditManager{creditManager},
      m_botList{botList},
      m_accessControl{accessControl},
      m_address{chain.allocateAddress()},
      m_expirable{desc.expirable},
      m_state{.expirationDate = desc.expirationDate},
      m_journalEntry{chain.journal(), this}
{}

//-------------------------------------------------------------------------

template<typename Fn>
decltype(auto) CreditFacade::transact(Fn&& fn)
{
    auto tx = m_chain.journal().begin();
    const size_t pending = m_pendingEvents.size();

    auto publish = [&] {
        if (!tx.outermost()) return;
        auto events = std::exchange(m_pendingEvents, {});
        for (auto& event : events) {
            event.id = m_eventCounter++;
            m_signal(event);
        }
    };

    try {
        if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
            fn();
            tx.commit();
            publish();
        } else {
            auto res = fn();
            tx.commit();
            publish();
            return res;
        }
    }
    catch (...) {
        tx.rollback();
        m_pendingEvents.resize(pending);
        throw;
    }
}

//-------------------------------------------------------------------------

Address CreditFacade::openCreditAccount(
    Address caller, const uint256_t& debt, Address onBehalfOf, std::span<const MultiCall> calls)
{
    return transact([&] {
        checkNotPaused();
        checkNotExpired();
        checkDebtLimits(debt);
        trackBorrowedInBlock(debt);

        const Address creditAccount = m_creditManager.openCreditAccount(m_address, debt, onBehalfOf);

        emit(event::OpenCreditAccount{
            .creditAccount = creditAccount,
            .onBehalfOf = onBehalfOf,
            .caller = caller,
            .debt = debt
        });

        runMultiCall(
            caller,
            creditAccount,
            calls,
            UNDERLYING_TOKEN_MASK,
            OPEN_CREDIT_ACCOUNT_PERMISSIONS,
            CheckMode::FULL_COLLATERAL_CHECK);

        return creditAccount;
    });
}

//-------------------------------------------------------------------------

void CreditFacade::closeCreditAccount(
    Address caller,
    Address creditAccount,
    Address to,
    const TokenMask& skipTokensMask,
    bool convertToETH,
    std::span<const MultiCall> calls)
{
    transact([&] {
        checkNotPaused();
        checkAccountOwner(caller, creditAccount);

        if (!calls.empty()) {
            runMultiCall(
                caller,
                creditAccount,
                calls,
                m_creditManager.enabledTokensMaskOf(creditAccount),
                CLOSE_CREDIT_ACCOUNT_PERMISSIONS,
                CheckMode::SKIP_COLLATERAL_CHECK);
        }

        static_cast<void>(
            m_creditManager.claimWithdrawals(m_address, creditAccount, to, ClaimAction::FORCE_CLAIM));

        const auto cdd = m_creditManager.calcDebtAndCollateral(creditAccount, CollateralCalcTask::DEBT_ONLY);

        if ((m_creditManager.flagsOf(creditAccount) & accounting::BOT_PERMISSIONS_SET_FLAG) != 0) {
            m_botList.eraseAllBotPermissions(m_address, creditAccount);
        }

        const Address borrower = m_creditManager.borrower(creditAccount);
        m_creditManager.closeCreditAccount(
            m_address, creditAccount, ClosureKind::CLOSE, cdd, caller, to, skipTokensMask, convertToETH);

        emit(event::CloseCreditAccount{
            .creditAccount = creditAccount,
            .borrower = borrower,
            .to = to
        });
    });
}

//-------------------------------------------------------------------------

uint256_t CreditFacade::liquidateCreditAccount(
    Address caller,
    Address creditAccount,
    Address to,
    const TokenMask& skipTokensMask,
    bool convertToETH,
    std::span<const MultiCall> calls)
{
    return transact([&] {
        uint32_t permissions = LIQUIDATE_CREDIT_ACCOUNT_PERMISSIONS;
        if (m_state.paused) {
            if (!m_state.emergencyLiquidators.contains(caller)) {
                throw NotAllowedWhenPausedException{fmt::format(
                    "{:#x} is not an emergency liquidator", caller)};
            }
            permissions = EMERGENCY_LIQUIDATION_PERMISSIONS;
        }

        // Emergency liquidations return every scheduled withdrawal to the account.
        const bool emergency = m_state.paused;
        auto cdd = m_creditManager.calcDebtAndCollateral(
            creditAccount,
            emergency ? CollateralCalcTask::DEBT_COLLATERAL_FORCE_CANCEL_WITHDRAWALS
                      : CollateralCalcTask::DEBT_COLLATERAL_CANCEL_WITHDRAWALS);

        const bool unhealthy = cdd.twvUSD < cdd.totalDebtUSD;
        if (!unhealthy && !expired()) {
            throw CreditAccountNotLiquidatableException{fmt::format(
                "{:#x}: twv {} covers debt {}", creditAccount, cdd.twvUSD, cdd.totalDebtUSD)};
        }
        const auto closureKind = unhealthy ? ClosureKind::LIQUIDATE : ClosureKind::LIQUIDATE_EXPIRED;

        const Address borrower = m_creditManager.borrower(creditAccount);
        cdd.enabledTokensMask |= m_creditManager.claimWithdrawals(
            m_address,
            creditAccount,
            borrower,
            emergency ? ClaimAction::FORCE_CANCEL : ClaimAction::CANCEL);

        if (!calls.empty()) {
            cdd.enabledTokensMask = runMultiCall(
                caller,
                creditAccount,
                calls,
                cdd.enabledTokensMask,
                permissions,
                CheckMode::SKIP_COLLATERAL_CHECK);
        }

        if ((m_creditManager.flagsOf(creditAccount) & accounting::BOT_PERMISSIONS_SET_FLAG) != 0) {
            m_botList.eraseAllBotPermissions(m_address, creditAccount);
        }

        const auto [remainingFunds, loss] = m_creditManager.closeCreditAccount(
            m_address, creditAccount, closureKind, cdd, caller, to, skipTokensMask, convertToETH);

        if (loss > 0) {
            absorbLoss(creditAccount, loss);
        }

        emit(event::LiquidateCreditAccount{
            .creditAccount = creditAccount,
            .liquidator = caller,
            .to = to,
            .closureKind = closureKind,
            .remainingFunds = remainingFunds
        });

        return remainingFunds;
    });
}

//-------------------------------------------------------------------------

void CreditFacade::multicall(Address caller, Address creditAccount, std::span<const MultiCall> calls)
{
    transact([&] {
        checkNotPaused();
        checkNotExpired();
        checkAccountOwner(caller, creditAccount);
        static_cast<void>(
            m_creditManager.claimWithdrawals(m_address, creditAccount, caller, ClaimAction::CLAIM));
        runMultiCall(
            caller,
            creditAccount,
            calls,
            m_creditManager.enabledTokensMaskOf(creditAccount),
            ALL_PERMISSIONS,
            CheckMode::FULL_COLLATERAL_CHECK);
    });
}

//-------------------------------------------------------------------------

void CreditFacade::botMulticall(Address caller, Address creditAccount, std::span<const MultiCall> calls)
{
    transact([&] {
        checkNotPaused();
        checkNotExpired();

        const auto [permissions, forbidden] = m_botList.botStatus(caller, creditAccount);
        if (permissions == 0
            || forbidden
            || (m_creditManager.flagsOf(creditAccount) & accounting::BOT_PERMISSIONS_SET_FLAG) == 0) {
            throw NotApprovedBotException{fmt::format(
                "bot {:#x} on account {:#x}", caller, creditAccount)};
        }

        static_cast<void>(m_creditManager.claimWithdrawals(
            m_address, creditAccount, m_creditManager.borrower(creditAccount), ClaimAction::CLAIM));

        runMultiCall(
            caller,
            creditAccount,
            calls,
            m_creditManager.enabledTokensMaskOf(creditAccount),
            permissions & ALL_PERMISSIONS,
            CheckMode::FULL_COLLATERAL_CHECK);
    });
}

//-------------------------------------------------------------------------

void CreditFacade::setBotPermissions(
    Address caller,
    Address creditAccount,
    Address bot,
    uint32_t permissions,
    const uint256_t& fundingAmount,
    const uint256_t& weeklyAllowance)
{
    transact([&] {
        checkAccountOwner(caller, creditAccount);
        const uint32_t activeBots = m_botList.setBotPermissions(
            m_address, creditAccount, bot, permissions, fundingAmount, weeklyAllowance);
        m_creditManager.setFlagFor(
            m_address, creditAccount, accounting::BOT_PERMISSIONS_SET_FLAG, activeBots > 0);
        emit(event::SetBotPermissions{
            .creditAccount = creditAccount,
            .bot = bot,
            .permissions = permissions
        });
    });
}

//-------------------------------------------------------------------------

void CreditFacade::pause(Address caller)
{
    transact([&] {
        m_accessControl.checkRole(Role::PAUSABLE_ADMIN, caller);
        if (m_state.paused) return;
        m_state.paused = true;
        emit(event::Paused{.account = caller});
    });
}

//-------------------------------------------------------------------------

void CreditFacade::unpause(Address caller)
{
    transact([&] {
        m_accessControl.checkRole(Role::UNPAUSABLE_ADMIN, caller);
        if (!m_state.paused) return;
        m_state.paused = false;
        emit(event::Unpaused{.account = caller});
    });
}

//-------------------------------------------------------------------------

void CreditFacade::setDebtLimits(Address caller, const uint256_t& minDebt, const uint256_t& maxDebt)
{
    checkCreditConfigurator(caller);
    if (minDebt > maxDebt) {
        throw IncorrectLimitsException{fmt::format("minDebt {} > maxDebt {}", minDebt, maxDebt)};
    }
    m_state.minDebt = minDebt;
    m_state.maxDebt = maxDebt;
}

//-------------------------------------------------------------------------

void CreditFacade::setMaxDebtPerBlockMultiplier(Address caller, uint8_t multiplier)
{
    checkCreditConfigurator(caller);
    m_state.maxDebtPerBlockMultiplier = multiplier;
}

//-------------------------------------------------------------------------

void CreditFacade::setTokenAllowance(Address caller, Address token, bool allowed)
{
    checkCreditConfigurator(caller);
    const TokenMask mask = m_creditManager.getTokenMaskOrRevert(token);
    m_state.forbiddenTokenMask = allowed
        ? bitmask::disable(m_state.forbiddenTokenMask, mask)
        : bitmask::enable(m_state.forbiddenTokenMask, mask);
}

//-------------------------------------------------------------------------

void CreditFacade::setExpirationDate(Address caller, Timestamp expirationDate)
{
    checkCreditConfigurator(caller);
    if (!m_expirable) {
        throw NotAllowedWhenNotExpirableException{};
    }
    m_state.expirationDate = expirationDate;
}

//-------------------------------------------------------------------------

void CreditFacade::setEmergencyLiquidator(Address caller, Address liquidator, bool allowed)
{
    checkCreditConfigurator(caller);
    if (allowed) {
        m_state.emergencyLiquidators.insert(liquidator);
    } else {
        m_state.emergencyLiquidators.erase(liquidator);
    }
}

//-------------------------------------------------------------------------

void CreditFacade::setMaxCumulativeLoss(Address caller, const uint256_t& maxCumulativeLoss)
{
    checkCreditConfigurator(caller);
    m_state.maxCumulativeLoss = maxCumulativeLoss;
}

//-------------------------------------------------------------------------

void CreditFacade::resetCumulativeLoss(Address caller)
{
    checkCreditConfigurator(caller);
    m_state.cumulativeLoss = 0;
}

//-------------------------------------------------------------------------

bool CreditFacade::expired() const noexcept
{
    return m_expirable && m_chain.timestamp() >= m_state.expirationDate;
}

//-------------------------------------------------------------------------

bool CreditFacade::isEmergencyLiquidator(Address account) const noexcept
{
    return m_state.emergencyLiquidators.contains(account);
}

//-------------------------------------------------------------------------

util::RestoreFn CreditFacade::checkpoint()
{
    return [this, state = m_state] { m_state = state; };
}

//-------------------------------------------------------------------------

void CreditFacade::emit(CreditEvent::ItemType item)
{
    m_pendingEvents.push_back(CreditEvent{
        .item = std::move(item),
        .blockNumber = m_chain.blockNumber()
    });
}

//-------------------------------------------------------------------------

void CreditFacade::checkCreditConfigurator(Address caller) const
{
    if (caller != m_creditManager.creditConfigurator()) {
        throw CallerNotConfiguratorException{fmt::format("{:#x}", caller)};
    }
}

//-------------------------------------------------------------------------

void CreditFacade::checkAccountOwner(Address caller, Address creditAccount) const
{
    if (m_creditManager.borrower(creditAccount) != caller) {
        throw CallerNotOwnerException{fmt::format(
            "{:#x} does not own {:#x}", caller, creditAccount)};
    }
}

//-------------------------------------------------------------------------

void CreditFacade::checkNotPaused() const
{
    if (m_state.paused) {
        throw NotAllowedWhenPausedException{};
    }
}

//-------------------------------------------------------------------------

void CreditFacade::checkNotExpired() const
{
    if (expired()) {
        throw NotAllowedAfterExpirationException{fmt::format(
            "expired at {}", m_state.expirationDate)};
    }
}

//-------------------------------------------------------------------------

TokenMask CreditFacade::runMultiCall(
    Address caller,
    Address creditAccount,
    std::span<const MultiCall> calls,
    TokenMask enabledTokensMask,
    uint32_t permissions,
    CheckMode checkMode)
{
    MultiCallContext ctx{
        .creditAccount = creditAccount,
        .caller = caller,
        .permissions = permissions,
        .enabledTokensMask = enabledTokensMask
    };

    emit(event::StartMultiCall{.creditAccount = creditAccount, .caller = caller});

    if ((m_state.forbiddenTokenMask & ctx.enabledTokensMask) != 0) {
        snapshotForbiddenBalances(ctx);
    }

    for (const auto& call : calls) {
        const auto action = decodeMultiCall(call, m_address, m_creditManager);
        if (const uint32_t permission = requiredPermission(action);
            permission != 0 && (ctx.permissions & permission) == 0) {
            throw NoPermissionException{permission};
        }
        execute(ctx, action);
    }

    if (ctx.expectedBalances.has_value()) {
        compareBalances(ctx);
    }

    emit(event::FinishMultiCall{.creditAccount = creditAccount});

    if (checkMode == CheckMode::FULL_COLLATERAL_CHECK) {
        fullCollateralCheck(ctx);
        checkForbiddenBalances(ctx);
    } else {
        m_creditManager.saveEnabledTokensMask(m_address, creditAccount, ctx.enabledTokensMask);
    }

    return m_creditManager.enabledTokensMaskOf(creditAccount);
}

//-------------------------------------------------------------------------

void CreditFacade::execute(MultiCallContext& ctx, const MultiCallAction& action)
{
    std::visit(
        [&](auto&& item) {
            using T = std::remove_cvref_t<decltype(item)>;
            if constexpr (std::same_as<T, action::AddCollateral>) {
                addCollateral(ctx, item);
            } else if constexpr (std::same_as<T, action::IncreaseDebt>) {
                increaseDebt(ctx, item);
            } else if constexpr (std::same_as<T, action::DecreaseDebt>) {
                decreaseDebt(ctx, item);
            } else if constexpr (std::same_as<T, action::EnableToken>) {
                enableToken(ctx, item);
            } else if constexpr (std::same_as<T, action::DisableToken>) {
                disableToken(ctx, item);
            } else if constexpr (std::same_as<T, action::WithdrawCollateral>) {
                withdrawCollateral(ctx, item);
            } else if constexpr (std::same_as<T, action::UpdateQuota>) {
                updateQuota(ctx, item);
            } else if constexpr (std::same_as<T, action::RevokeAdapterAllowances>) {
                revokeAdapterAllowances(ctx, item);
            } else if constexpr (std::same_as<T, action::StoreExpectedBalances>) {
                storeExpectedBalances(ctx, item);
            } else if constexpr (std::same_as<T, action::CompareBalances>) {
                compareBalances(ctx);
            } else if constexpr (std::same_as<T, action::SetFullCheckParams>) {
                setFullCheckParams(ctx, item);
            } else if constexpr (std::same_as<T, action::ExternalCall>) {
                externalCall(ctx, item);
            }
        },
        action);
}

//-------------------------------------------------------------------------

void CreditFacade::addCollateral(MultiCallContext& ctx, const action::AddCollateral& item)
{
    const TokenMask mask = m_creditManager.addCollateral(
        m_address, ctx.caller, ctx.creditAccount, item.token, item.amount);
    ctx.enabledTokensMask = bitmask::enableWithSkip(
        ctx.enabledTokensMask, mask, m_creditManager.quotedTokensMask());
    emit(event::AddCollateral{
        .creditAccount = ctx.creditAccount,
        .token = item.token,
        .amount = item.amount
    });
}

//-------------------------------------------------------------------------

void CreditFacade::increaseDebt(MultiCallContext& ctx, const action::IncreaseDebt& item)
{
    checkNotExpired();
    if ((ctx.enabledTokensMask & m_state.forbiddenTokenMask) != 0) {
        throw ForbiddenTokensException{fmt::format(
            "forbidden tokens {} are enabled", ctx.enabledTokensMask & m_state.forbiddenTokenMask)};
    }
    trackBorrowedInBlock(item.amount);

    const auto res = m_creditManager.manageDebt(
        m_address, ctx.creditAccount, item.amount, ctx.enabledTokensMask, ManageDebtAction::INCREASE_DEBT);
    checkDebtLimits(res.newDebt);

    ctx.enabledTokensMask = bitmask::enable(ctx.enabledTokensMask, res.tokensToEnable);
    ctx.revertOnForbiddenTokens = true;

    emit(event::IncreaseDebt{.creditAccount = ctx.creditAccount, .amount = item.amount});
}

//-------------------------------------------------------------------------

void CreditFacade::decreaseDebt(MultiCallContext& ctx, const action::DecreaseDebt& item)
{
    const auto res = m_creditManager.manageDebt(
        m_address, ctx.creditAccount, item.amount, ctx.enabledTokensMask, ManageDebtAction::DECREASE_DEBT);
    if (res.newDebt == 0) {
        throw BorrowAmountOutOfLimitsException{"debt cannot be fully repaid outside of closure"};
    }
    checkDebtLimits(res.newDebt);

    ctx.enabledTokensMask = bitmask::disable(
        bitmask::enable(ctx.enabledTokensMask, res.tokensToEnable), res.tokensToDisable);

    emit(event::DecreaseDebt{.creditAccount = ctx.creditAccount, .amount = item.amount});
}

//-------------------------------------------------------------------------

void CreditFacade::enableToken(MultiCallContext& ctx, const action::EnableToken& item)
{
    ctx.enabledTokensMask = bitmask::enableWithSkip(
        ctx.enabledTokensMask,
        m_creditManager.getTokenMaskOrRevert(item.token),
        m_creditManager.quotedTokensMask());
}

//-------------------------------------------------------------------------

void CreditFacade::disableToken(MultiCallContext& ctx, const action::DisableToken& item)
{
    ctx.enabledTokensMask = bitmask::disableWithSkip(
        ctx.enabledTokensMask,
        m_creditManager.getTokenMaskOrRevert(item.token),
        m_creditManager.quotedTokensMask() | UNDERLYING_TOKEN_MASK);
}

//-------------------------------------------------------------------------

void CreditFacade::withdrawCollateral(MultiCallContext& ctx, const action::WithdrawCollateral& item)
{
    m_creditManager.withdrawCollateral(m_address, ctx.creditAccount, item.token, item.amount, item.to);
    ctx.revertOnForbiddenTokens = true;
    emit(event::WithdrawCollateral{
        .creditAccount = ctx.creditAccount,
        .token = item.token,
        .amount = item.amount,
        .to = item.to
    });
}

//-------------------------------------------------------------------------

void CreditFacade::updateQuota(MultiCallContext& ctx, const action::UpdateQuota& item)
{
    if (item.quotaChange > 0
        && (m_creditManager.getTokenMaskOrRevert(item.token) & m_state.forbiddenTokenMask) != 0) {
        throw ForbiddenTokensException{fmt::format(
            "cannot increase the quota of forbidden token {:#x}", item.token)};
    }

    const auto res = m_creditManager.updateQuota(
        m_address,
        ctx.creditAccount,
        item.token,
        item.quotaChange,
        item.minQuota,
        m_state.maxDebt * 2);

    ctx.enabledTokensMask = bitmask::disable(
        bitmask::enable(ctx.enabledTokensMask, res.tokensToEnable), res.tokensToDisable);

    emit(event::UpdateQuota{
        .creditAccount = ctx.creditAccount,
        .token = item.token,
        .quotaChange = item.quotaChange
    });
}

//-------------------------------------------------------------------------

void CreditFacade::revokeAdapterAllowances(
    MultiCallContext& ctx, const action::RevokeAdapterAllowances& item)
{
    m_creditManager.revokeAdapterAllowances(m_address, ctx.creditAccount, item.revocations);
}

//-------------------------------------------------------------------------

void CreditFacade::storeExpectedBalances(MultiCallContext& ctx, const action::StoreExpectedBalances& item)
{
    if (ctx.expectedBalancesStored) {
        throw ExpectedBalancesAlreadySetException{};
    }
    const auto& ledger = m_chain.ledger();
    std::vector<ExpectedBalance> expected;
    for (const auto& [token, amount] : item.deltas) {
        const uint256_t balance = ledger.balanceOf(token, ctx.creditAccount);
        expected.push_back({
            .token = token,
            .balance = amount >= 0
                ? balance + numeric::magnitude(amount)
                : numeric::saturatingSub(balance, numeric::magnitude(amount))
        });
    }
    ctx.expectedBalances = std::move(expected);
    ctx.expectedBalancesStored = true;
}

//-------------------------------------------------------------------------

void CreditFacade::compareBalances(MultiCallContext& ctx)
{
    if (!ctx.expectedBalances.has_value()) {
        throw ExpectedBalancesNotSetException{};
    }
    const auto& ledger = m_chain.ledger();
    for (const auto& [token, expected] : *ctx.expectedBalances) {
        if (const auto balance = ledger.balanceOf(token, ctx.creditAccount); balance < expected) {
            throw BalanceLessThanExpectedException{fmt::format(
                "{} balance {} < expected {}", ledger.symbol(token), balance, expected)};
        }
    }
    ctx.expectedBalances.reset();
}

//-------------------------------------------------------------------------

void CreditFacade::setFullCheckParams(MultiCallContext& ctx, const action::SetFullCheckParams& item)
{
    if (item.minHealthFactor < numeric::PERCENTAGE_FACTOR) {
        throw CustomHealthFactorTooLowException{fmt::format("{}", item.minHealthFactor)};
    }
    ctx.fullCheckParams = {
        .collateralHints = item.collateralHints,
        .minHealthFactor = item.minHealthFactor
    };
}

//-------------------------------------------------------------------------

void CreditFacade::externalCall(MultiCallContext& ctx, const action::ExternalCall& item)
{
    const Address targetContract = m_creditManager.adapterToContract(item.adapter);

    AdapterResult res;
    {
        const auto guard = m_creditManager.activate(m_address, ctx.creditAccount);
        res = Adapter::decodeResult(m_chain.contractAt(item.adapter).call(m_address, item.callData));
    }

    const TokenMask& quotedTokensMask = m_creditManager.quotedTokensMask();
    ctx.enabledTokensMask = bitmask::disableWithSkip(
        bitmask::enableWithSkip(ctx.enabledTokensMask, res.tokensToEnable, quotedTokensMask),
        res.tokensToDisable,
        quotedTokensMask | UNDERLYING_TOKEN_MASK);

    emit(event::Execute{.creditAccount = ctx.creditAccount, .targetContract = targetContract});
}

//-------------------------------------------------------------------------

void CreditFacade::checkDebtLimits(const uint256_t& debt) const
{
    if (debt < m_state.minDebt || debt > m_state.maxDebt) {
        throw BorrowAmountOutOfLimitsException{fmt::format(
            "debt {} outside [{}, {}]", debt, m_state.minDebt, m_state.maxDebt)};
    }
}

//-------------------------------------------------------------------------

void CreditFacade::trackBorrowedInBlock(const uint256_t& amount)
{
    const uint8_t multiplier = m_state.maxDebtPerBlockMultiplier;
    if (multiplier == 0) {
        throw BorrowLimitExceededException{"borrowing is forbidden"};
    }
    if (multiplier == kUnlimitedDebtPerBlock) return;

    const BlockNumber block = m_chain.blockNumber();
    if (m_state.lastBlockBorrowed != block) {
        m_state.lastBlockBorrowed = block;
        m_state.totalBorrowedInBlock = 0;
    }
    const uint256_t total = m_state.totalBorrowedInBlock + amount;
    if (const uint256_t cap = m_state.maxDebt * multiplier; total > cap) {
        throw BorrowLimitExceededException{fmt::format(
            "{} borrowed in block {}, cap {}", total, block, cap)};
    }
    m_state.totalBorrowedInBlock = total;
}

//-------------------------------------------------------------------------

void CreditFacade::snapshotForbiddenBalances(MultiCallContext& ctx) const
{
    const auto& ledger = m_chain.ledger();
    for (uint32_t index : bitmask::setBits(m_state.forbiddenTokenMask & ctx.enabledTokensMask)) {
        const Address token = m_creditManager.collateralTokenByMask(bitmask::tokenMask(index)).token;
        ctx.forbiddenBalances.insert_or_assign(token, ledger.balanceOf(token, ctx.creditAccount));
    }
}

//-------------------------------------------------------------------------

void CreditFacade::checkForbiddenBalances(const MultiCallContext& ctx) const
{
    if (!ctx.revertOnForbiddenTokens) return;

    const auto& ledger = m_chain.ledger();
    const TokenMask enabledForbidden = m_state.forbiddenTokenMask & ctx.enabledTokensMask;
    for (uint32_t index : bitmask::setBits(enabledForbidden)) {
        const Address token = m_creditManager.collateralTokenByMask(bitmask::tokenMask(index)).token;
        auto it = ctx.forbiddenBalances.find(token);
        if (it == ctx.forbiddenBalances.end()) {
            throw ForbiddenTokensException{fmt::format(
                "forbidden token {} was enabled", ledger.symbol(token))};
        }
        if (const auto balance = ledger.balanceOf(token, ctx.creditAccount); balance > it->second) {
            throw ForbiddenTokensException{fmt::format(
                "forbidden token {} balance grew from {} to {}", ledger.symbol(token), it->second, balance)};
        }
    }
}

//-------------------------------------------------------------------------

void CreditFacade::fullCollateralCheck(const MultiCallContext& ctx)
{
    m_creditManager.fullCollateralCheck(
        m_address,
        ctx.creditAccount,
        ctx.enabledTokensMask,
        ctx.fullCheckParams.collateralHints,
        ctx.fullCheckParams.minHealthFactor);
}

//-------------------------------------------------------------------------

void CreditFacade::absorbLoss(Address creditAccount, const uint256_t& loss)
{
    m_state.maxDebtPerBlockMultiplier = 0;
    m_state.cumulativeLoss += loss;
    emit(event::IncurLossOnLiquidation{.creditAccount = creditAccount, .loss = loss});

    m_chain.logDebug(
        "FACADE : Loss {} on {:#x}, cumulative {} of {}",
        loss, creditAccount, m_state.cumulativeLoss, m_state.maxCumulativeLoss);

    if (m_state.cumulativeLoss > m_state.maxCumulativeLoss && !m_state.paused) {
        m_state.paused = true;
        emit(event::Paused{.account = m_address});
    }
}

//-------------------------------------------------------------------------

}  // namespace creditsim::credit

//-------------------------------------------------------------------------
