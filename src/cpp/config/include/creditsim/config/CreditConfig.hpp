/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "creditsim/config/ScenarioStep.hpp"
#include "creditsim/credit/CreditConfigurator.hpp"
#include "creditsim/simulation/Chain.hpp"

#include <exception>
#include <unordered_map>

//-------------------------------------------------------------------------

namespace creditsim::config
{

//-------------------------------------------------------------------------

struct TokenParams
{
    std::string symbol;
    uint32_t decimals;
};

struct NativeParams
{
    std::string symbol;
    std::string wrapped;
};

struct QuotaParams
{
    uint16_t rate{};
    uint16_t increaseFee{};
    uint256_t limit{};
};

struct CollateralTokenParams
{
    std::string symbol;
    uint16_t liquidationThreshold{};
    bool forbidden{};
    std::optional<QuotaParams> quota;
};

struct SwapRateParams
{
    std::string tokenIn;
    std::string tokenOut;
    // WAD-scaled raw tokenOut units per raw tokenIn unit.
    uint256_t rate;
};

struct SwapReserveParams
{
    std::string symbol;
    uint256_t amount;
};

//-------------------------------------------------------------------------

class CreditConfig
{
public:
    struct Parameters
    {
        static inline constexpr uint32_t kMaxTokenDecimals = 36;

        simulation::ChainDesc chain;
        std::vector<TokenParams> tokens;
        std::optional<NativeParams> native;

        std::string underlying;
        uint256_t baseInterestRate{};
        uint256_t poolLiquidity{};
        uint256_t creditManagerDebtLimit{};
        Timestamp accountReuseDelay{3 * kSecondsPerDay};

        uint32_t maxEnabledTokens{12};
        credit::FeeParams fees;
        uint256_t minDebt{};
        uint256_t maxDebt{};
        uint8_t maxDebtPerBlockMultiplier{255};
        uint256_t maxCumulativeLoss{};
        bool expirable{};
        Timestamp expirationDate{};
        Timestamp withdrawalDelay{};
        std::vector<CollateralTokenParams> collateralTokens;

        std::vector<SwapRateParams> swapRates;
        std::vector<SwapReserveParams> swapReserves;
        std::vector<ScenarioStep> scenario;
    };

    CreditConfig() noexcept = default;

    void configure(pugi::xml_node node);

    [[nodiscard]] const Parameters& parameters() const noexcept { return m_parameters; }

    [[nodiscard]] uint32_t decimalsOf(std::string_view symbol) const;

private:
    void setChain(pugi::xml_node node);
    void setTokens(pugi::xml_node node);
    void setPool(pugi::xml_node node);
    void setCreditManager(pugi::xml_node node);
    void setFees(pugi::xml_node node);
    void setDebtLimits(pugi::xml_node node);
    void setCollateralToken(pugi::xml_node node);
    void setSwap(pugi::xml_node node);
    void setScenario(pugi::xml_node node);

    [[nodiscard]] ScenarioStep::ItemType parseStep(pugi::xml_node node) const;
    [[nodiscard]] uint256_t amountAttribute(
        pugi::xml_node node, const char* attrName, std::string_view symbol) const;
    [[nodiscard]] int256_t signedAmountAttribute(
        pugi::xml_node node, const char* attrName, std::string_view symbol) const;
    [[nodiscard]] uint16_t bpsAttribute(pugi::xml_node node, const char* attrName, uint16_t fallback) const;

    void handleException();

    Parameters m_parameters;
    std::unordered_map<std::string, uint32_t> m_decimals;
};

//-------------------------------------------------------------------------

class CreditConfigException : public std::exception
{
public:
    explicit CreditConfigException(std::string msg) noexcept;

    virtual const char* what() const noexcept override;

private:
    std::string m_msg;
};

//-------------------------------------------------------------------------

[[nodiscard]] CreditConfig makeCreditConfig(pugi::xml_node node);

//-------------------------------------------------------------------------

}  // namespace creditsim::config

//-------------------------------------------------------------------------
