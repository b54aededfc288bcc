/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/suite/CreditSuite.hpp"

#include "PriceOracleFactory.hpp"

//-------------------------------------------------------------------------

namespace creditsim::suite
{

//-------------------------------------------------------------------------

CreditSuite::CreditSuite(config::CreditConfig config, pugi::xml_node oracleNode)
    : m_config{std::move(config)}
{
    const auto& params = m_config.parameters();

    m_chain = std::make_unique<simulation::Chain>(params.chain);
    m_admin = m_chain->allocateAddress();

    setupTokens();
    m_priceOracle = oracle::PriceOracleFactory::createFromXML(oracleNode, m_chain->ledger());
    setupPool();
    setupCreditManager();
    setupCollateralTokens();
    setupSwap();

    m_chain->logDebug("SUITE : Credit suite ready, credit manager {:#x}", m_creditManager->address());
}

//-------------------------------------------------------------------------

void CreditSuite::attachEventLogger(const fs::path& path)
{
    m_eventLogger = std::make_unique<credit::CreditEventLogger>(path, m_creditFacade->signal());
}

//-------------------------------------------------------------------------

Address CreditSuite::token(std::string_view symbol) const
{
    auto it = m_tokens.find(symbol);
    if (it == m_tokens.end()) {
        throw std::invalid_argument{fmt::format("Unknown token '{}'", symbol)};
    }
    return it->second;
}

//-------------------------------------------------------------------------

std::unique_ptr<CreditSuite> CreditSuite::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    auto config = config::makeCreditConfig(node);
    pugi::xml_node oracleNode = node.child("PriceOracle");
    if (oracleNode.empty()) {
        throw config::CreditConfigException{fmt::format(
            "{}: Missing required node <PriceOracle>", ctx)};
    }
    return std::make_unique<CreditSuite>(std::move(config), oracleNode);
}

//-------------------------------------------------------------------------

std::unique_ptr<CreditSuite> CreditSuite::fromConfig(const fs::path& path)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result) {
        throw config::CreditConfigException{fmt::format(
            "{}: Error loading '{}': {}", ctx, path.c_str(), result.description())};
    }
    auto suite = fromXML(doc.child("CreditSuite"));
    fmt::print(" - '{}' loaded successfully\n", path.c_str());
    return suite;
}

//-------------------------------------------------------------------------

void CreditSuite::setupTokens()
{
    const auto& params = m_config.parameters();
    auto& ledger = m_chain->ledger();

    for (const auto& token : params.tokens) {
        m_tokens.emplace(token.symbol, ledger.addToken(token.symbol, token.decimals));
    }
    if (params.native.has_value()) {
        const Address weth = token(params.native->wrapped);
        const Address native = ledger.addToken(params.native->symbol, ledger.decimals(weth));
        m_tokens.emplace(params.native->symbol, native);
        m_wethGateway = std::make_unique<simulation::WETHGateway>(*m_chain, weth, native);
    }
}

//-------------------------------------------------------------------------

void CreditSuite::setupPool()
{
    const auto& params = m_config.parameters();
    const Address underlying = token(params.underlying);

    m_pool = std::make_unique<pool::LendingPool>(*m_chain, pool::LendingPoolDesc{
        .underlying = underlying,
        .baseInterestRate = params.baseInterestRate
    });
    if (params.poolLiquidity > 0) {
        m_chain->ledger().mint(underlying, m_admin, params.poolLiquidity);
        m_pool->addLiquidity(m_admin, params.poolLiquidity);
    }
    m_poolQuotaKeeper = std::make_unique<pool::PoolQuotaKeeper>(*m_chain, m_admin);
    m_accountFactory = std::make_unique<pool::AccountFactory>(*m_chain, params.accountReuseDelay);
}

//-------------------------------------------------------------------------

void CreditSuite::setupCreditManager()
{
    const auto& params = m_config.parameters();

    m_accessControl = std::make_unique<credit::AccessControl>(m_admin);
    m_accessControl->grantRole(m_admin, credit::Role::CONTROLLER, m_admin);
    m_accessControl->grantRole(m_admin, credit::Role::PAUSABLE_ADMIN, m_admin);
    m_accessControl->grantRole(m_admin, credit::Role::UNPAUSABLE_ADMIN, m_admin);

    m_botList = std::make_unique<credit::BotList>(*m_chain, m_admin);
    m_withdrawalManager = std::make_unique<credit::WithdrawalManager>(*m_chain, m_admin, params.withdrawalDelay);

    m_creditManager = std::make_unique<credit::CreditManager>(
        *m_chain,
        *m_pool,
        *m_poolQuotaKeeper,
        *m_accountFactory,
        *m_priceOracle,
        credit::CreditManagerDesc{
            .creditConfigurator = m_admin,
            .maxEnabledTokens = params.maxEnabledTokens,
            .wethGateway = m_wethGateway.get(),
            .withdrawalManager = m_withdrawalManager.get()
        });
    m_withdrawalManager->addCreditManager(m_admin, m_creditManager->address());
    m_pool->setCreditManagerDebtLimit(m_creditManager->address(), params.creditManagerDebtLimit);

    m_creditFacade = std::make_unique<credit::CreditFacade>(
        *m_chain,
        *m_creditManager,
        *m_botList,
        *m_accessControl,
        credit::CreditFacadeDesc{
            .expirable = params.expirable,
            .expirationDate = params.expirationDate
        });
    m_creditManager->setCreditFacade(m_admin, m_creditFacade->address());
    m_botList->approveCreditFacade(m_admin, m_creditFacade->address());

    m_creditConfigurator = std::make_unique<credit::CreditConfigurator>(
        *m_chain, *m_creditManager, *m_creditFacade, *m_accessControl);
    // The configurator contract takes over from the bootstrap admin.
    m_creditManager->setCreditConfigurator(m_admin, m_creditConfigurator->address());
    m_withdrawalManager->setConfigurator(m_admin, m_creditConfigurator->address());

    m_creditConfigurator->setFees(m_admin, params.fees);
    m_creditConfigurator->setMaxCumulativeLoss(m_admin, params.maxCumulativeLoss);
    m_creditConfigurator->setDebtLimits(m_admin, params.minDebt, params.maxDebt);
    m_creditConfigurator->setMaxDebtPerBlockMultiplier(m_admin, params.maxDebtPerBlockMultiplier);
}

//-------------------------------------------------------------------------

void CreditSuite::setupCollateralTokens()
{
    const auto& params = m_config.parameters();
    std::vector<pool::QuotaRateUpdate> rates;

    for (const auto& collateral : params.collateralTokens) {
        const Address collateralToken = token(collateral.symbol);
        if (collateral.quota.has_value()) {
            m_poolQuotaKeeper->addQuotaToken(collateralToken);
            m_poolQuotaKeeper->setTokenLimit(collateralToken, collateral.quota->limit);
            m_poolQuotaKeeper->setTokenQuotaIncreaseFee(collateralToken, collateral.quota->increaseFee);
            rates.push_back({.token = collateralToken, .rate = collateral.quota->rate});
        }
        static_cast<void>(m_creditConfigurator->addCollateralToken(
            m_admin, collateralToken, collateral.liquidationThreshold));
        if (collateral.quota.has_value()) {
            m_creditConfigurator->makeTokenQuoted(m_admin, collateralToken);
        }
    }
    if (!rates.empty()) {
        m_poolQuotaKeeper->updateRates(m_admin, rates);
    }

    for (const auto& collateral : params.collateralTokens) {
        if (collateral.forbidden) {
            m_creditConfigurator->forbidToken(m_admin, token(collateral.symbol));
        }
    }
    m_creditConfigurator->setMaxEnabledTokens(m_admin, params.maxEnabledTokens);
}

//-------------------------------------------------------------------------

void CreditSuite::setupSwap()
{
    const auto& params = m_config.parameters();

    m_swap = std::make_unique<simulation::FixedRateSwap>(*m_chain);
    m_chain->registerContract(m_swap.get());
    for (const auto& rate : params.swapRates) {
        m_swap->setRate(token(rate.tokenIn), token(rate.tokenOut), rate.rate);
    }
    for (const auto& reserve : params.swapReserves) {
        m_chain->ledger().mint(token(reserve.symbol), m_swap->address(), reserve.amount);
    }

    m_swapAdapter = std::make_unique<adapters::SwapAdapter>(*m_chain, *m_creditManager, *m_swap);
    m_chain->registerContract(m_swapAdapter.get());
    m_creditConfigurator->allowAdapter(m_admin, *m_swapAdapter);
}

//-------------------------------------------------------------------------

}  // namespace creditsim::suite

//-------------------------------------------------------------------------
