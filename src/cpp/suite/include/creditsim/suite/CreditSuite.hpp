/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "creditsim/adapters/SwapAdapter.hpp"
#include "creditsim/config/CreditConfig.hpp"
#include "creditsim/credit/AccessControl.hpp"
#include "creditsim/credit/BotList.hpp"
#include "creditsim/credit/CreditConfigurator.hpp"
#include "creditsim/credit/CreditEventLogger.hpp"
#include "creditsim/credit/CreditFacade.hpp"
#include "creditsim/credit/CreditManager.hpp"
#include "creditsim/credit/WithdrawalManager.hpp"
#include "creditsim/oracle/PriceOracle.hpp"
#include "creditsim/pool/AccountFactory.hpp"
#include "creditsim/pool/LendingPool.hpp"
#include "creditsim/pool/PoolQuotaKeeper.hpp"
#include "creditsim/simulation/Chain.hpp"
#include "creditsim/simulation/FixedRateSwap.hpp"
#include "creditsim/simulation/TokenLedger.hpp"
#include "creditsim/simulation/WETHGateway.hpp"

//-------------------------------------------------------------------------

namespace creditsim::suite
{

//-------------------------------------------------------------------------

/**
 * One fully wired credit suite: chain, tokens, oracle, pool, quota keeper,
 * account factory, credit manager with its facade and configurator, bot
 * list and a swap venue reachable through its adapter. The admin address
 * holds every governance role and doubles as the quota gauge.
 */
class CreditSuite
{
public:
    CreditSuite(config::CreditConfig config, pugi::xml_node oracleNode);

    CreditSuite(const CreditSuite&) = delete;
    CreditSuite& operator=(const CreditSuite&) = delete;

    void attachEventLogger(const fs::path& path);

    [[nodiscard]] Address admin() const noexcept { return m_admin; }
    [[nodiscard]] Address token(std::string_view symbol) const;
    [[nodiscard]] const config::CreditConfig& config() const noexcept { return m_config; }
    [[nodiscard]] const config::CreditConfig::Parameters& parameters() const noexcept
    {
        return m_config.parameters();
    }

    [[nodiscard]] simulation::Chain& chain() noexcept { return *m_chain; }
    [[nodiscard]] simulation::TokenLedger& ledger() noexcept { return m_chain->ledger(); }
    [[nodiscard]] simulation::WETHGateway* wethGateway() noexcept { return m_wethGateway.get(); }
    [[nodiscard]] oracle::PriceOracle& priceOracle() noexcept { return *m_priceOracle; }
    [[nodiscard]] pool::LendingPool& pool() noexcept { return *m_pool; }
    [[nodiscard]] pool::PoolQuotaKeeper& poolQuotaKeeper() noexcept { return *m_poolQuotaKeeper; }
    [[nodiscard]] pool::AccountFactory& accountFactory() noexcept { return *m_accountFactory; }
    [[nodiscard]] credit::AccessControl& accessControl() noexcept { return *m_accessControl; }
    [[nodiscard]] credit::BotList& botList() noexcept { return *m_botList; }
    [[nodiscard]] credit::WithdrawalManager& withdrawalManager() noexcept { return *m_withdrawalManager; }
    [[nodiscard]] credit::CreditManager& creditManager() noexcept { return *m_creditManager; }
    [[nodiscard]] credit::CreditFacade& creditFacade() noexcept { return *m_creditFacade; }
    [[nodiscard]] credit::CreditConfigurator& creditConfigurator() noexcept { return *m_creditConfigurator; }
    [[nodiscard]] simulation::FixedRateSwap& swap() noexcept { return *m_swap; }
    [[nodiscard]] adapters::SwapAdapter& swapAdapter() noexcept { return *m_swapAdapter; }
    [[nodiscard]] credit::CreditEventLogger* eventLogger() noexcept { return m_eventLogger.get(); }

    [[nodiscard]] static std::unique_ptr<CreditSuite> fromXML(pugi::xml_node node);
    [[nodiscard]] static std::unique_ptr<CreditSuite> fromConfig(const fs::path& path);

private:
    void setupTokens();
    void setupPool();
    void setupCreditManager();
    void setupCollateralTokens();
    void setupSwap();

    config::CreditConfig m_config;
    std::unique_ptr<simulation::Chain> m_chain;
    Address m_admin;
    std::map<std::string, Address, std::less<>> m_tokens;
    std::unique_ptr<simulation::WETHGateway> m_wethGateway;
    std::unique_ptr<oracle::PriceOracle> m_priceOracle;
    std::unique_ptr<pool::LendingPool> m_pool;
    std::unique_ptr<pool::PoolQuotaKeeper> m_poolQuotaKeeper;
    std::unique_ptr<pool::AccountFactory> m_accountFactory;
    std::unique_ptr<credit::AccessControl> m_accessControl;
    std::unique_ptr<credit::BotList> m_botList;
    std::unique_ptr<credit::WithdrawalManager> m_withdrawalManager;
    std::unique_ptr<credit::CreditManager> m_creditManager;
    std::unique_ptr<credit::CreditFacade> m_creditFacade;
    std::unique_ptr<credit::CreditConfigurator> m_creditConfigurator;
    std::unique_ptr<simulation::FixedRateSwap> m_swap;
    std::unique_ptr<adapters::SwapAdapter> m_swapAdapter;
    std::unique_ptr<credit::CreditEventLogger> m_eventLogger;
};

//-------------------------------------------------------------------------

}  // namespace creditsim::suite

//-------------------------------------------------------------------------
