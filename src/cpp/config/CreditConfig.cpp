/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/config/CreditConfig.hpp"

#include <limits>

//-------------------------------------------------------------------------

namespace creditsim::config
{

//-------------------------------------------------------------------------

namespace
{

std::string_view requiredAttribute(pugi::xml_node node, const char* attrName)
{
    pugi::xml_attribute attr = node.attribute(attrName);
    if (attr.empty() || std::string_view{attr.as_string()}.empty()) {
        throw CreditConfigException{fmt::format(
            "Missing required attribute '{}' on <{}>", attrName, node.name())};
    }
    return attr.as_string();
}

pugi::xml_node requiredChild(pugi::xml_node node, const char* childName)
{
    pugi::xml_node child = node.child(childName);
    if (child.empty()) {
        throw CreditConfigException{fmt::format(
            "Missing required node <{}> under <{}>", childName, node.name())};
    }
    return child;
}

std::optional<std::string> optionalAttribute(pugi::xml_node node, const char* attrName)
{
    pugi::xml_attribute attr = node.attribute(attrName);
    if (attr.empty()) return std::nullopt;
    return std::string{attr.as_string()};
}

}  // namespace

//-------------------------------------------------------------------------

void CreditConfig::configure(pugi::xml_node node)
{
    try {
        if (node.empty()) {
            throw CreditConfigException{"Missing root node <CreditSuite>"};
        }
        setChain(node.child("Chain"));
        setTokens(requiredChild(node, "Tokens"));
        setPool(requiredChild(node, "Pool"));
        setCreditManager(requiredChild(node, "CreditManager"));
        setSwap(node.child("Swap"));
        setScenario(node.child("Scenario"));
    }
    catch (...) {
        handleException();
    }
}

//-------------------------------------------------------------------------

uint32_t CreditConfig::decimalsOf(std::string_view symbol) const
{
    auto it = m_decimals.find(std::string{symbol});
    if (it == m_decimals.end()) {
        throw CreditConfigException{fmt::format("Unknown token '{}'", symbol)};
    }
    return it->second;
}

//-------------------------------------------------------------------------

void CreditConfig::setChain(pugi::xml_node node)
{
    if (node.empty()) return;

    auto& chain = m_parameters.chain;
    chain.blockNumber = node.attribute("blockNumber").as_ullong(chain.blockNumber);
    chain.timestamp = node.attribute("timestamp").as_ullong(chain.timestamp);
    chain.blockTime = node.attribute("blockTime").as_ullong(chain.blockTime);
    chain.debug = node.attribute("debug").as_bool(chain.debug);

    if (chain.blockTime == 0) {
        throw CreditConfigException{"Value of attribute 'blockTime' should be positive"};
    }
}

//-------------------------------------------------------------------------

void CreditConfig::setTokens(pugi::xml_node node)
{
    for (pugi::xml_node tokenNode : node.children("Token")) {
        TokenParams token{
            .symbol = std::string{requiredAttribute(tokenNode, "symbol")},
            .decimals = tokenNode.attribute("decimals").as_uint(18)
        };
        if (token.decimals > Parameters::kMaxTokenDecimals) {
            throw CreditConfigException{fmt::format(
                "Value of attribute 'decimals' should be at most {}, was {}",
                Parameters::kMaxTokenDecimals,
                token.decimals)};
        }
        if (!m_decimals.emplace(token.symbol, token.decimals).second) {
            throw CreditConfigException{fmt::format("Duplicate token '{}'", token.symbol)};
        }
        m_parameters.tokens.push_back(std::move(token));
    }
    if (m_parameters.tokens.empty()) {
        throw CreditConfigException{"<Tokens> should define at least one <Token>"};
    }

    if (pugi::xml_node nativeNode = node.child("Native"); !nativeNode.empty()) {
        NativeParams native{
            .symbol = std::string{requiredAttribute(nativeNode, "symbol")},
            .wrapped = std::string{requiredAttribute(nativeNode, "wrapped")}
        };
        const uint32_t decimals = decimalsOf(native.wrapped);
        if (!m_decimals.emplace(native.symbol, decimals).second) {
            throw CreditConfigException{fmt::format("Duplicate token '{}'", native.symbol)};
        }
        m_parameters.native = std::move(native);
    }
}

//-------------------------------------------------------------------------

void CreditConfig::setPool(pugi::xml_node node)
{
    m_parameters.underlying = std::string{requiredAttribute(node, "underlying")};
    static_cast<void>(decimalsOf(m_parameters.underlying));

    if (auto rate = optionalAttribute(node, "baseInterestRate"); rate.has_value()) {
        m_parameters.baseInterestRate = numeric::parseAmount(*rate, 27);
    }
    m_parameters.poolLiquidity = amountAttribute(node, "liquidity", m_parameters.underlying);
    m_parameters.creditManagerDebtLimit = node.attribute("creditManagerDebtLimit").empty()
        ? m_parameters.poolLiquidity
        : amountAttribute(node, "creditManagerDebtLimit", m_parameters.underlying);
    m_parameters.accountReuseDelay = node.attribute("accountReuseDelay").as_ullong(
        m_parameters.accountReuseDelay);
}

//-------------------------------------------------------------------------

void CreditConfig::setCreditManager(pugi::xml_node node)
{
    m_parameters.maxEnabledTokens = node.attribute("maxEnabledTokens").as_uint(m_parameters.maxEnabledTokens);
    if (m_parameters.maxEnabledTokens == 0) {
        throw CreditConfigException{"Value of attribute 'maxEnabledTokens' should be positive"};
    }

    if (uint32_t value = node.attribute("maxDebtPerBlockMultiplier").as_uint(
            m_parameters.maxDebtPerBlockMultiplier);
        value > std::numeric_limits<uint8_t>::max()) {
        throw CreditConfigException{fmt::format(
            "Value of attribute 'maxDebtPerBlockMultiplier' should be at most {}, was {}",
            std::numeric_limits<uint8_t>::max(),
            value)};
    } else {
        m_parameters.maxDebtPerBlockMultiplier = static_cast<uint8_t>(value);
    }

    m_parameters.maxCumulativeLoss = node.attribute("maxCumulativeLoss").empty()
        ? std::numeric_limits<uint256_t>::max()
        : amountAttribute(node, "maxCumulativeLoss", m_parameters.underlying);

    if (pugi::xml_attribute attr = node.attribute("expirationDate"); !attr.empty()) {
        m_parameters.expirable = true;
        m_parameters.expirationDate = attr.as_ullong();
        if (m_parameters.expirationDate <= m_parameters.chain.timestamp) {
            throw CreditConfigException{fmt::format(
                "Value of attribute 'expirationDate' should be after {}, was {}",
                m_parameters.chain.timestamp,
                m_parameters.expirationDate)};
        }
    }

    m_parameters.withdrawalDelay = node.attribute("withdrawalDelay").as_ullong(m_parameters.withdrawalDelay);

    setFees(node.child("Fees"));
    setDebtLimits(requiredChild(node, "DebtLimits"));

    for (pugi::xml_node tokenNode : node.children("CollateralToken")) {
        setCollateralToken(tokenNode);
    }
}

//-------------------------------------------------------------------------

void CreditConfig::setFees(pugi::xml_node node)
{
    if (node.empty()) return;

    auto& fees = m_parameters.fees;
    fees.feeInterest = bpsAttribute(node, "feeInterest", fees.feeInterest);
    fees.feeLiquidation = bpsAttribute(node, "feeLiquidation", fees.feeLiquidation);
    fees.liquidationPremium = bpsAttribute(node, "liquidationPremium", fees.liquidationPremium);
    fees.feeLiquidationExpired = bpsAttribute(node, "feeLiquidationExpired", fees.feeLiquidationExpired);
    fees.liquidationPremiumExpired = bpsAttribute(
        node, "liquidationPremiumExpired", fees.liquidationPremiumExpired);

    if (fees.feeLiquidation + fees.liquidationPremium >= numeric::PERCENTAGE_FACTOR
        || fees.feeLiquidationExpired + fees.liquidationPremiumExpired >= numeric::PERCENTAGE_FACTOR) {
        throw CreditConfigException{"Liquidation fee and premium should sum to less than 10000 bps"};
    }
}

//-------------------------------------------------------------------------

void CreditConfig::setDebtLimits(pugi::xml_node node)
{
    m_parameters.minDebt = amountAttribute(node, "min", m_parameters.underlying);
    m_parameters.maxDebt = amountAttribute(node, "max", m_parameters.underlying);
    if (m_parameters.minDebt > m_parameters.maxDebt) {
        throw CreditConfigException{fmt::format(
            "Debt limits are inverted: min {} > max {}", m_parameters.minDebt, m_parameters.maxDebt)};
    }
}

//-------------------------------------------------------------------------

void CreditConfig::setCollateralToken(pugi::xml_node node)
{
    CollateralTokenParams token{
        .symbol = std::string{requiredAttribute(node, "symbol")},
        .liquidationThreshold = bpsAttribute(node, "lt", 0),
        .forbidden = node.attribute("forbidden").as_bool()
    };
    static_cast<void>(decimalsOf(token.symbol));
    if (token.symbol == m_parameters.underlying) {
        throw CreditConfigException{fmt::format(
            "The underlying '{}' cannot be listed as <CollateralToken>", token.symbol)};
    }
    if (ranges::any_of(m_parameters.collateralTokens, [&](const auto& other) {
            return other.symbol == token.symbol;
        })) {
        throw CreditConfigException{fmt::format("Duplicate collateral token '{}'", token.symbol)};
    }

    if (node.attribute("quoted").as_bool()) {
        token.quota = QuotaParams{
            .rate = bpsAttribute(node, "quotaRate", 0),
            .increaseFee = bpsAttribute(node, "quotaIncreaseFee", 0),
            .limit = amountAttribute(node, "quotaLimit", m_parameters.underlying)
        };
    }

    m_parameters.collateralTokens.push_back(std::move(token));
}

//-------------------------------------------------------------------------

void CreditConfig::setSwap(pugi::xml_node node)
{
    if (node.empty()) return;

    for (pugi::xml_node rateNode : node.children("Rate")) {
        SwapRateParams rate{
            .tokenIn = std::string{requiredAttribute(rateNode, "from")},
            .tokenOut = std::string{requiredAttribute(rateNode, "to")}
        };
        const uint32_t decimalsIn = decimalsOf(rate.tokenIn);
        const uint32_t decimalsOut = decimalsOf(rate.tokenOut);
        rate.rate = numeric::parseAmount(requiredAttribute(rateNode, "price"), 18 + decimalsOut)
            / boost::multiprecision::pow(uint256_t{10}, decimalsIn);
        m_parameters.swapRates.push_back(std::move(rate));
    }
    for (pugi::xml_node reserveNode : node.children("Reserve")) {
        const std::string symbol{requiredAttribute(reserveNode, "symbol")};
        m_parameters.swapReserves.push_back({
            .symbol = symbol,
            .amount = amountAttribute(reserveNode, "amount", symbol)
        });
    }
}

//-------------------------------------------------------------------------

void CreditConfig::setScenario(pugi::xml_node node)
{
    if (node.empty()) return;

    for (pugi::xml_node stepNode : node.children()) {
        if (stepNode.type() != pugi::node_element) continue;

        ScenarioStep step{.item = parseStep(stepNode)};
        if (auto expected = optionalAttribute(stepNode, "expectError"); expected.has_value()) {
            step.expectedError = magic_enum::enum_cast<ErrorCode>(*expected);
            if (!step.expectedError.has_value()) {
                throw CreditConfigException{fmt::format(
                    "Unknown error code '{}' on <{}>", *expected, stepNode.name())};
            }
        }
        m_parameters.scenario.push_back(std::move(step));
    }
}

//-------------------------------------------------------------------------

ScenarioStep::ItemType CreditConfig::parseStep(pugi::xml_node node) const
{
    const std::string_view name = node.name();
    const std::string& underlying = m_parameters.underlying;

    auto account = [&] { return std::string{requiredAttribute(node, "account")}; };

    if (name == "Fund") {
        const std::string symbol{requiredAttribute(node, "symbol")};
        return step::Fund{
            .actor = std::string{requiredAttribute(node, "actor")},
            .symbol = symbol,
            .amount = amountAttribute(node, "amount", symbol)
        };
    }
    if (name == "Open") {
        step::Open open{
            .account = account(),
            .owner = std::string{requiredAttribute(node, "owner")},
            .debt = amountAttribute(node, "debt", underlying)
        };
        for (pugi::xml_node child : node.children("Collateral")) {
            const std::string symbol{requiredAttribute(child, "symbol")};
            open.collateral.push_back({.symbol = symbol, .amount = amountAttribute(child, "amount", symbol)});
        }
        for (pugi::xml_node child : node.children("Quota")) {
            open.quotas.push_back({
                .symbol = std::string{requiredAttribute(child, "symbol")},
                .change = signedAmountAttribute(child, "change", underlying)
            });
        }
        return open;
    }
    if (name == "AddCollateral") {
        const std::string symbol{requiredAttribute(node, "symbol")};
        return step::AddCollateral{
            .account = account(),
            .symbol = symbol,
            .amount = amountAttribute(node, "amount", symbol)
        };
    }
    if (name == "IncreaseDebt") {
        return step::IncreaseDebt{.account = account(), .amount = amountAttribute(node, "amount", underlying)};
    }
    if (name == "DecreaseDebt") {
        return step::DecreaseDebt{.account = account(), .amount = amountAttribute(node, "amount", underlying)};
    }
    if (name == "UpdateQuota") {
        return step::UpdateQuota{
            .account = account(),
            .symbol = std::string{requiredAttribute(node, "symbol")},
            .change = signedAmountAttribute(node, "change", underlying)
        };
    }
    if (name == "Swap") {
        step::Swap swap{
            .account = account(),
            .tokenIn = std::string{requiredAttribute(node, "from")},
            .tokenOut = std::string{requiredAttribute(node, "to")}
        };
        static_cast<void>(decimalsOf(swap.tokenOut));
        if (!node.attribute("amount").empty()) {
            swap.amount = amountAttribute(node, "amount", swap.tokenIn);
        }
        if (!node.attribute("minAmountOut").empty()) {
            swap.minAmountOut = amountAttribute(node, "minAmountOut", swap.tokenOut);
        }
        return swap;
    }
    if (name == "Warp") {
        return step::Warp{.seconds = node.attribute("seconds").as_ullong()};
    }
    if (name == "Roll") {
        return step::Roll{.blocks = node.attribute("blocks").as_ullong(1)};
    }
    if (name == "SetPrice") {
        const std::string symbol{requiredAttribute(node, "symbol")};
        static_cast<void>(decimalsOf(symbol));
        return step::SetPrice{
            .symbol = symbol,
            .price = numeric::parseAmount(requiredAttribute(node, "price"), numeric::kUSDDecimals)
        };
    }
    if (name == "Close") {
        return step::Close{
            .account = account(),
            .to = optionalAttribute(node, "to"),
            .convertToETH = node.attribute("convertToETH").as_bool()
        };
    }
    if (name == "Liquidate") {
        return step::Liquidate{
            .account = account(),
            .liquidator = std::string{requiredAttribute(node, "liquidator")}
        };
    }
    if (name == "Snapshot") {
        return step::Snapshot{.account = optionalAttribute(node, "account")};
    }

    throw CreditConfigException{fmt::format("Unknown scenario step <{}>", name)};
}

//-------------------------------------------------------------------------

uint256_t CreditConfig::amountAttribute(
    pugi::xml_node node, const char* attrName, std::string_view symbol) const
{
    return numeric::parseAmount(requiredAttribute(node, attrName), decimalsOf(symbol));
}

//-------------------------------------------------------------------------

int256_t CreditConfig::signedAmountAttribute(
    pugi::xml_node node, const char* attrName, std::string_view symbol) const
{
    std::string_view str = requiredAttribute(node, attrName);
    const bool negative = str.starts_with('-');
    if (negative) {
        str.remove_prefix(1);
    }
    const int256_t magnitude{numeric::parseAmount(str, decimalsOf(symbol))};
    return negative ? int256_t{-magnitude} : magnitude;
}

//-------------------------------------------------------------------------

uint16_t CreditConfig::bpsAttribute(pugi::xml_node node, const char* attrName, uint16_t fallback) const
{
    pugi::xml_attribute attr = node.attribute(attrName);
    if (attr.empty()) return fallback;

    if (uint32_t value = attr.as_uint(); value > numeric::PERCENTAGE_FACTOR) {
        throw CreditConfigException{fmt::format(
            "Value of attribute '{}' should be at most {}, was {}",
            attrName,
            numeric::PERCENTAGE_FACTOR,
            value)};
    } else {
        return static_cast<uint16_t>(value);
    }
}

//-------------------------------------------------------------------------

void CreditConfig::handleException()
{
    try {
        throw;
    }
    catch (const CreditConfigException& exc) {
        fmt::print("{}\n", exc.what());
        throw;
    }
    catch (const std::invalid_argument& exc) {
        fmt::print("{}\n", exc.what());
        throw CreditConfigException{exc.what()};
    }
}

//-------------------------------------------------------------------------

CreditConfigException::CreditConfigException(std::string msg) noexcept
    : m_msg{std::move(msg)}
{}

//-------------------------------------------------------------------------

const char* CreditConfigException::what() const noexcept
{
    return m_msg.c_str();
}

//-------------------------------------------------------------------------

CreditConfig makeCreditConfig(pugi::xml_node node)
{
    CreditConfig config;
    config.configure(node);
    return config;
}

//-------------------------------------------------------------------------

}  // namespace creditsim::config

//-------------------------------------------------------------------------
