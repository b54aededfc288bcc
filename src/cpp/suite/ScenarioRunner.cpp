/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/suite/ScenarioRunner.hpp"

#include "CreditException.hpp"
#include "StaticPriceOracle.hpp"
#include "creditsim/credit/MultiCall.hpp"
#include "creditsim/suite/CreditSuite.hpp"

#include <array>

//-------------------------------------------------------------------------

namespace creditsim::suite
{

//-------------------------------------------------------------------------

void ScenarioReport::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("stepsRun", rapidjson::Value{stepsRun}, allocator);
        json.AddMember("expectedFailures", rapidjson::Value{expectedFailures}, allocator);
        json.AddMember("blockNumber", rapidjson::Value{blockNumber}, allocator);
        json.AddMember("timestamp", rapidjson::Value{timestamp}, allocator);
        json.AddMember("totalBorrowed", json::u256ToJson(totalBorrowed, allocator), allocator);
        json.AddMember("treasuryProfit", json::u256ToJson(treasuryProfit, allocator), allocator);
        json.AddMember("totalLosses", json::u256ToJson(totalLosses, allocator), allocator);
        json.AddMember("cumulativeLoss", json::u256ToJson(cumulativeLoss, allocator), allocator);
        json.AddMember("paused", rapidjson::Value{paused}, allocator);
        json::serializeHelper(
            json,
            "snapshots",
            [this](rapidjson::Document& json) {
                json.SetArray();
                auto& allocator = json.GetAllocator();
                for (const auto& snapshot : snapshots) {
                    rapidjson::Document subJson{&allocator};
                    snapshot.jsonSerialize(subJson);
                    json.PushBack(subJson, allocator);
                }
            });
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

ScenarioReport ScenarioRunner::run()
{
    return run(m_suite.parameters().scenario);
}

//-------------------------------------------------------------------------

ScenarioReport ScenarioRunner::run(std::span<const config::ScenarioStep> steps)
{
    for (const auto& step : steps) {
        runStep(step);
    }
    return report();
}

//-------------------------------------------------------------------------

void ScenarioRunner::runStep(const config::ScenarioStep& step)
{
    const uint32_t index = m_stepsRun++;

    if (!step.expectedError.has_value()) {
        execute(step.item);
        return;
    }

    const auto expected = *step.expectedError;
    try {
        execute(step.item);
    }
    catch (const CreditException& e) {
        if (e.code() != expected) {
            throw ScenarioException{fmt::format(
                "Step #{} <{}> expected to fail with {}, failed with {}",
                index, stepName(step.item), magic_enum::enum_name(expected), e.what())};
        }
        m_suite.chain().logDebug(
            "SCENARIO : Step #{} <{}> failed as expected with {}",
            index, stepName(step.item), magic_enum::enum_name(expected));
        ++m_expectedFailures;
        return;
    }
    throw ScenarioException{fmt::format(
        "Step #{} <{}> expected to fail with {}, succeeded",
        index, stepName(step.item), magic_enum::enum_name(expected))};
}

//-------------------------------------------------------------------------

Address ScenarioRunner::actor(std::string_view name)
{
    if (auto it = m_actors.find(name); it != m_actors.end()) {
        return it->second;
    }

    auto& ledger = m_suite.ledger();
    const Address creditManager = m_suite.creditManager().address();
    const Address address = m_suite.chain().allocateAddress();

    const auto& params = m_suite.parameters();
    for (const auto& token : params.tokens) {
        ledger.approve(m_suite.token(token.symbol), address, creditManager, ledger.maxAllowance());
    }
    m_actors.emplace(std::string{name}, address);
    m_suite.chain().logDebug("SCENARIO : Actor '{}' at {:#x}", name, address);
    return address;
}

//-------------------------------------------------------------------------

Address ScenarioRunner::account(std::string_view name) const
{
    auto it = m_accounts.find(name);
    if (it == m_accounts.end()) {
        throw std::invalid_argument{fmt::format("Unknown credit account '{}'", name)};
    }
    return it->second;
}

//-------------------------------------------------------------------------

bool ScenarioRunner::hasAccount(std::string_view name) const noexcept
{
    return m_accounts.contains(name);
}

//-------------------------------------------------------------------------

std::string_view ScenarioRunner::stepName(const config::ScenarioStep::ItemType& item) noexcept
{
    static constexpr std::array<std::string_view, std::variant_size_v<config::ScenarioStep::ItemType>>
        kNames{
            "Fund",
            "Open",
            "AddCollateral",
            "IncreaseDebt",
            "DecreaseDebt",
            "UpdateQuota",
            "Swap",
            "Warp",
            "Roll",
            "SetPrice",
            "Close",
            "Liquidate",
            "Snapshot"
        };
    return kNames[item.index()];
}

//-------------------------------------------------------------------------

void ScenarioRunner::execute(const config::ScenarioStep::ItemType& item)
{
    auto& chain = m_suite.chain();
    auto& facade = m_suite.creditFacade();
    auto& creditManager = m_suite.creditManager();
    const Address facadeAddress = facade.address();

    std::visit(
        [&](auto&& item) {
            using T = std::remove_cvref_t<decltype(item)>;
            if constexpr (std::same_as<T, config::step::Fund>) {
                m_suite.ledger().mint(m_suite.token(item.symbol), actor(item.actor), item.amount);
            }
            else if constexpr (std::same_as<T, config::step::Open>) {
                const Address owner = actor(item.owner);
                std::vector<credit::MultiCall> calls;
                for (const auto& collateral : item.collateral) {
                    calls.push_back(credit::calls::addCollateral(
                        facadeAddress, m_suite.token(collateral.symbol), collateral.amount));
                }
                for (const auto& quota : item.quotas) {
                    calls.push_back(credit::calls::updateQuota(
                        facadeAddress, m_suite.token(quota.symbol), quota.change, 0));
                }
                const Address creditAccount = facade.openCreditAccount(owner, item.debt, owner, calls);
                m_accounts.insert_or_assign(item.account, creditAccount);
                chain.logDebug("SCENARIO : Account '{}' at {:#x}", item.account, creditAccount);
            }
            else if constexpr (std::same_as<T, config::step::AddCollateral>) {
                const Address creditAccount = account(item.account);
                const std::array calls{credit::calls::addCollateral(
                    facadeAddress, m_suite.token(item.symbol), item.amount)};
                facade.multicall(creditManager.borrower(creditAccount), creditAccount, calls);
            }
            else if constexpr (std::same_as<T, config::step::IncreaseDebt>) {
                const Address creditAccount = account(item.account);
                const std::array calls{credit::calls::increaseDebt(facadeAddress, item.amount)};
                facade.multicall(creditManager.borrower(creditAccount), creditAccount, calls);
            }
            else if constexpr (std::same_as<T, config::step::DecreaseDebt>) {
                const Address creditAccount = account(item.account);
                const std::array calls{credit::calls::decreaseDebt(facadeAddress, item.amount)};
                facade.multicall(creditManager.borrower(creditAccount), creditAccount, calls);
            }
            else if constexpr (std::same_as<T, config::step::UpdateQuota>) {
                const Address creditAccount = account(item.account);
                const std::array calls{credit::calls::updateQuota(
                    facadeAddress, m_suite.token(item.symbol), item.change, 0)};
                facade.multicall(creditManager.borrower(creditAccount), creditAccount, calls);
            }
            else if constexpr (std::same_as<T, config::step::Swap>) {
                const Address creditAccount = account(item.account);
                const Address tokenIn = m_suite.token(item.tokenIn);
                const Address tokenOut = m_suite.token(item.tokenOut);
                auto& adapter = m_suite.swapAdapter();
                const std::array calls{
                    item.amount.has_value()
                        ? adapter.swapExactIn(tokenIn, tokenOut, *item.amount, item.minAmountOut)
                        : adapter.swapAll(tokenIn, tokenOut, 0)};
                facade.multicall(creditManager.borrower(creditAccount), creditAccount, calls);
            }
            else if constexpr (std::same_as<T, config::step::Warp>) {
                chain.warp(chain.timestamp() + item.seconds);
            }
            else if constexpr (std::same_as<T, config::step::Roll>) {
                chain.advance(item.blocks);
            }
            else if constexpr (std::same_as<T, config::step::SetPrice>) {
                auto oracle = dynamic_cast<oracle::StaticPriceOracle*>(&m_suite.priceOracle());
                if (oracle == nullptr) {
                    throw std::invalid_argument{"<SetPrice> requires a static price oracle"};
                }
                oracle->setPrice(m_suite.token(item.symbol), item.price);
            }
            else if constexpr (std::same_as<T, config::step::Close>) {
                const Address creditAccount = account(item.account);
                const Address owner = creditManager.borrower(creditAccount);
                const Address to = item.to.has_value() ? actor(*item.to) : owner;
                facade.closeCreditAccount(owner, creditAccount, to, 0, item.convertToETH);
                m_accounts.erase(item.account);
            }
            else if constexpr (std::same_as<T, config::step::Liquidate>) {
                const Address creditAccount = account(item.account);
                const Address liquidator = actor(item.liquidator);
                static_cast<void>(facade.liquidateCreditAccount(liquidator, creditAccount, liquidator, 0, false));
                m_accounts.erase(item.account);
            }
            else if constexpr (std::same_as<T, config::step::Snapshot>) {
                snapshot(item);
            }
            else {
                static_assert(false, "Non-exhaustive visitor");
            }
        },
        item);
}

//-------------------------------------------------------------------------

void ScenarioRunner::snapshot(const config::step::Snapshot& item)
{
    if (item.account.has_value()) {
        m_snapshots.push_back(AccountSnapshot::take(m_suite, *item.account, account(*item.account)));
        return;
    }
    for (const auto& [name, creditAccount] : m_accounts) {
        m_snapshots.push_back(AccountSnapshot::take(m_suite, name, creditAccount));
    }
}

//-------------------------------------------------------------------------

ScenarioReport ScenarioRunner::report() const
{
    auto& suite = m_suite;
    return ScenarioReport{
        .stepsRun = m_stepsRun,
        .expectedFailures = m_expectedFailures,
        .blockNumber = suite.chain().blockNumber(),
        .timestamp = suite.chain().timestamp(),
        .totalBorrowed = suite.pool().totalBorrowed(),
        .treasuryProfit = suite.pool().treasuryProfit(),
        .totalLosses = suite.pool().totalLosses(),
        .cumulativeLoss = suite.creditFacade().cumulativeLoss(),
        .paused = suite.creditFacade().paused(),
        .snapshots = m_snapshots
    };
}

//-------------------------------------------------------------------------

}  // namespace creditsim::suite

//-------------------------------------------------------------------------
