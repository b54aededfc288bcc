/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "CreditSuiteFixture.hpp"
#include "creditsim/config/CreditConfig.hpp"
#include "formatting.hpp"

#include <boost/algorithm/string/replace.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <pugixml.hpp>

//-------------------------------------------------------------------------

using namespace creditsim;
using namespace creditsim::config;
using namespace creditsim::test;
using namespace testing;

//-------------------------------------------------------------------------

namespace
{

CreditConfig parseConfig(const std::string& xml)
{
    pugi::xml_document doc;
    if (pugi::xml_parse_result result = doc.load_string(xml.c_str()); !result) {
        throw std::invalid_argument{fmt::format("Malformed test XML: {}", result.description())};
    }
    return makeCreditConfig(doc.child("CreditSuite"));
}

std::string withScenario(std::string_view scenario)
{
    std::string xml{kCreditSuiteXML};
    boost::replace_first(xml, "</CreditSuite>", fmt::format("<Scenario>{}</Scenario></CreditSuite>", scenario));
    return xml;
}

}  // namespace

//-------------------------------------------------------------------------

TEST(CreditConfigTest, ParsesSuite)
{
    const auto config = parseConfig(std::string{kCreditSuiteXML});
    const auto& params = config.parameters();

    EXPECT_EQ(params.chain.blockNumber, 100);
    EXPECT_EQ(params.chain.timestamp, 1'700'000'000);
    EXPECT_EQ(params.chain.blockTime, 12);

    EXPECT_THAT(params.tokens, SizeIs(4));
    ASSERT_TRUE(params.native.has_value());
    EXPECT_EQ(params.native->symbol, "ETH");
    EXPECT_EQ(params.native->wrapped, "WETH");
    EXPECT_EQ(config.decimalsOf("USDC"), 6);
    EXPECT_EQ(config.decimalsOf("ETH"), 18);

    EXPECT_EQ(params.underlying, "DAI");
    EXPECT_EQ(params.baseInterestRate, numeric::RAY * 5 / 100);
    EXPECT_EQ(params.poolLiquidity, 1'000'000_wad);
    EXPECT_EQ(params.creditManagerDebtLimit, 500'000_wad);

    EXPECT_EQ(params.maxEnabledTokens, 4);
    EXPECT_EQ(params.fees.feeInterest, 1'000);
    EXPECT_EQ(params.fees.liquidationPremium, 400);
    EXPECT_EQ(params.fees.liquidationPremiumExpired, 200);
    EXPECT_EQ(params.minDebt, 100_wad);
    EXPECT_EQ(params.maxDebt, 10'000_wad);
    EXPECT_EQ(params.maxDebtPerBlockMultiplier, 255);
    EXPECT_EQ(params.maxCumulativeLoss, std::numeric_limits<uint256_t>::max());
    EXPECT_FALSE(params.expirable);

    ASSERT_THAT(params.collateralTokens, SizeIs(3));
    const auto& link = params.collateralTokens[1];
    EXPECT_EQ(link.symbol, "LINK");
    EXPECT_EQ(link.liquidationThreshold, 7'000);
    ASSERT_TRUE(link.quota.has_value());
    EXPECT_EQ(link.quota->rate, 500);
    EXPECT_EQ(link.quota->limit, 50'000_wad);
    EXPECT_FALSE(params.collateralTokens[0].quota.has_value());

    ASSERT_THAT(params.swapRates, SizeIs(3));
    EXPECT_EQ(params.swapRates[1].rate, 2'000_wad);
    // One DAI unit buys one USDC unit: 10^6 raw USDC per 10^18 raw DAI.
    EXPECT_EQ(params.swapRates[2].rate, uint256_t{1'000'000});
    EXPECT_THAT(params.swapReserves, SizeIs(3));
    EXPECT_THAT(params.scenario, IsEmpty());
}

//-------------------------------------------------------------------------

TEST(CreditConfigTest, ParsesScenarioSteps)
{
    const auto config = parseConfig(withScenario(R"(
        <Fund actor="alice" symbol="USDC" amount="1.5"/>
        <Open account="a" owner="alice" debt="1000">
          <Collateral symbol="WETH" amount="0.5"/>
          <Quota symbol="LINK" change="250"/>
        </Open>
        <!-- comments are skipped -->
        <UpdateQuota account="a" symbol="LINK" change="-100"/>
        <Swap account="a" from="WETH" to="DAI"/>
        <Roll/>
        <Warp seconds="86400"/>
        <SetPrice symbol="WETH" price="1850.5"/>
        <Liquidate account="a" liquidator="bob" expectError="CREDIT_ACCOUNT_NOT_LIQUIDATABLE"/>
        <Close account="a" convertToETH="true"/>
        <Snapshot/>
    )"));
    const auto& scenario = config.parameters().scenario;
    ASSERT_THAT(scenario, SizeIs(10));

    const auto& fund = std::get<step::Fund>(scenario[0].item);
    EXPECT_EQ(fund.actor, "alice");
    EXPECT_EQ(fund.amount, uint256_t{1'500'000});

    const auto& open = std::get<step::Open>(scenario[1].item);
    EXPECT_EQ(open.owner, "alice");
    EXPECT_EQ(open.debt, 1'000_wad);
    ASSERT_THAT(open.collateral, SizeIs(1));
    EXPECT_EQ(open.collateral[0].amount, amount("0.5"));
    ASSERT_THAT(open.quotas, SizeIs(1));
    EXPECT_EQ(open.quotas[0].change, int256_t{250_wad});

    EXPECT_EQ(std::get<step::UpdateQuota>(scenario[2].item).change, -int256_t{100_wad});

    const auto& swap = std::get<step::Swap>(scenario[3].item);
    EXPECT_FALSE(swap.amount.has_value());
    EXPECT_EQ(swap.minAmountOut, 0);

    EXPECT_EQ(std::get<step::Roll>(scenario[4].item).blocks, 1);
    EXPECT_EQ(std::get<step::Warp>(scenario[5].item).seconds, kSecondsPerDay);
    EXPECT_EQ(std::get<step::SetPrice>(scenario[6].item).price, usd("1850.5"));

    EXPECT_TRUE(std::holds_alternative<step::Liquidate>(scenario[7].item));
    EXPECT_EQ(scenario[7].expectedError, ErrorCode::CREDIT_ACCOUNT_NOT_LIQUIDATABLE);
    EXPECT_FALSE(scenario[1].expectedError.has_value());

    const auto& close = std::get<step::Close>(scenario[8].item);
    EXPECT_TRUE(close.convertToETH);
    EXPECT_FALSE(close.to.has_value());

    EXPECT_FALSE(std::get<step::Snapshot>(scenario[9].item).account.has_value());
}

//-------------------------------------------------------------------------

TEST(CreditConfigTest, ExpirationDate)
{
    std::string xml{kCreditSuiteXML};
    boost::replace_first(
        xml, R"(<CreditManager maxEnabledTokens="4">)",
        R"(<CreditManager maxEnabledTokens="4" expirationDate="1700086400" maxCumulativeLoss="2500">)");
    const auto config = parseConfig(xml);
    EXPECT_TRUE(config.parameters().expirable);
    EXPECT_EQ(config.parameters().expirationDate, 1'700'086'400);
    EXPECT_EQ(config.parameters().maxCumulativeLoss, 2'500_wad);
}

//-------------------------------------------------------------------------

TEST(CreditConfigTest, MissingRoot)
{
    EXPECT_THROW(static_cast<void>(makeCreditConfig(pugi::xml_node{})), CreditConfigException);
}

//-------------------------------------------------------------------------

// Replaces the first occurrence of `first` in the suite XML with `second`.
using XmlEdit = std::pair<std::string, std::string>;

struct InvalidCreditConfigTest : public TestWithParam<XmlEdit>
{};

TEST_P(InvalidCreditConfigTest, Rejected)
{
    const auto& [from, to] = GetParam();
    std::string xml{kCreditSuiteXML};
    ASSERT_NE(xml.find(from), std::string::npos);
    boost::replace_first(xml, from, to);
    EXPECT_THROW(static_cast<void>(parseConfig(xml)), CreditConfigException);
}

INSTANTIATE_TEST_SUITE_P(
    CreditConfig,
    InvalidCreditConfigTest,
    Values(
        XmlEdit{R"(blockTime="12")", R"(blockTime="0")"},
        XmlEdit{R"(decimals="6")", R"(decimals="40")"},
        XmlEdit{R"(<Token symbol="LINK")", R"(<Token symbol="DAI")"},
        XmlEdit{R"(wrapped="WETH")", R"(wrapped="WBTC")"},
        XmlEdit{R"(underlying="DAI")", R"(underlying="GBP")"},
        XmlEdit{R"(liquidity="1000000")", R"(liquidity="1,000,000")"},
        XmlEdit{R"(maxEnabledTokens="4")", R"(maxEnabledTokens="0")"},
        XmlEdit{R"(maxEnabledTokens="4")", R"(maxEnabledTokens="4" maxDebtPerBlockMultiplier="300")"},
        XmlEdit{R"(maxEnabledTokens="4")", R"(maxEnabledTokens="4" expirationDate="1600000000")"},
        XmlEdit{R"(liquidationPremium="400")", R"(liquidationPremium="9800")"},
        XmlEdit{R"(feeInterest="1000")", R"(feeInterest="10001")"},
        XmlEdit{R"(min="100")", R"(min="20000")"},
        XmlEdit{R"(<DebtLimits min="100" max="10000"/>)", ""},
        XmlEdit{R"(lt="8500")", R"(lt="10001")"},
        XmlEdit{R"(<CollateralToken symbol="USDC")", R"(<CollateralToken symbol="DAI")"},
        XmlEdit{R"(<CollateralToken symbol="USDC")", R"(<CollateralToken symbol="WETH")"},
        XmlEdit{R"(quotaLimit="50000")", ""},
        XmlEdit{R"(<Rate from="DAI" to="USDC")", R"(<Rate from="DAI" to="GBP")"},
        XmlEdit{R"(price="0.0005")", R"(price="1/2000")"},
        XmlEdit{"</CreditSuite>", "<Scenario><Teleport/></Scenario></CreditSuite>"},
        XmlEdit{"</CreditSuite>", R"(<Scenario><Roll expectError="OOPS"/></Scenario></CreditSuite>)"},
        XmlEdit{"</CreditSuite>", R"(<Scenario><Open account="a" debt="1000"/></Scenario></CreditSuite>)"}));

//-------------------------------------------------------------------------
