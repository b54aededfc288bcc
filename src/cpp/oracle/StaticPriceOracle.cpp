/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "StaticPriceOracle.hpp"

#include "CreditException.hpp"

//-------------------------------------------------------------------------

namespace creditsim::oracle
{

//-------------------------------------------------------------------------

uint256_t StaticPriceOracle::convertToUSD(const uint256_t& amount, Address token) const
{
    const auto& [price, decimals] = feedOf(token);
    return numeric::mulDiv(amount, price, numeric::pow10(decimals));
}

//-------------------------------------------------------------------------

uint256_t StaticPriceOracle::convertFromUSD(const uint256_t& amount, Address token) const
{
    const auto& [price, decimals] = feedOf(token);
    return numeric::mulDiv(amount, numeric::pow10(decimals), price);
}

//-------------------------------------------------------------------------

bool StaticPriceOracle::hasPriceFeed(Address token) const noexcept
{
    return m_feeds.contains(token);
}

//-------------------------------------------------------------------------

void StaticPriceOracle::setPrice(Address token, const uint256_t& price)
{
    if (price == 0) {
        throw IncorrectParameterException{fmt::format(
            "price of {} must be positive", m_ledger.symbol(token))};
    }
    m_feeds.insert_or_assign(token, PriceFeed{.price = price, .decimals = m_ledger.decimals(token)});
}

//-------------------------------------------------------------------------

const uint256_t& StaticPriceOracle::priceOf(Address token) const
{
    return feedOf(token).price;
}

//-------------------------------------------------------------------------

std::unique_ptr<StaticPriceOracle> StaticPriceOracle::fromXML(
    pugi::xml_node node, const simulation::TokenLedger& ledger)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    auto oracle = std::make_unique<StaticPriceOracle>(ledger);
    for (pugi::xml_node feed : node.children("Feed")) {
        const std::string_view symbol = feed.attribute("symbol").as_string();
        const auto token = ledger.tokenBySymbol(symbol);
        if (!token.has_value()) {
            throw std::invalid_argument{fmt::format("{}: Unknown token '{}'", ctx, symbol)};
        }
        oracle->setPrice(
            *token, numeric::parseAmount(feed.attribute("price").as_string(), numeric::kUSDDecimals));
    }
    return oracle;
}

//-------------------------------------------------------------------------

const PriceFeed& StaticPriceOracle::feedOf(Address token) const
{
    auto it = m_feeds.find(token);
    if (it == m_feeds.end()) {
        throw PriceFeedDoesNotExistException{fmt::format("no price feed for {:#x}", token)};
    }
    return it->second;
}

//-------------------------------------------------------------------------

}  // namespace creditsim::oracle

//-------------------------------------------------------------------------
