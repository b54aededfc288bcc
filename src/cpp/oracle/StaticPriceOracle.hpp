/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "creditsim/oracle/PriceOracle.hpp"
#include "creditsim/simulation/TokenLedger.hpp"

#include <unordered_map>

//-------------------------------------------------------------------------

namespace creditsim::oracle
{

//-------------------------------------------------------------------------

struct PriceFeed
{
    uint256_t price;
    uint32_t decimals;
};

//-------------------------------------------------------------------------

class StaticPriceOracle : public PriceOracle
{
public:
    explicit StaticPriceOracle(const simulation::TokenLedger& ledger) noexcept : m_ledger{ledger} {}

    virtual uint256_t convertToUSD(const uint256_t& amount, Address token) const override;
    virtual uint256_t convertFromUSD(const uint256_t& amount, Address token) const override;
    virtual bool hasPriceFeed(Address token) const noexcept override;

    void setPrice(Address token, const uint256_t& price);

    [[nodiscard]] const uint256_t& priceOf(Address token) const;

    [[nodiscard]] static std::unique_ptr<StaticPriceOracle> fromXML(
        pugi::xml_node node, const simulation::TokenLedger& ledger);

private:
    [[nodiscard]] const PriceFeed& feedOf(Address token) const;

    const simulation::TokenLedger& m_ledger;
    std::unordered_map<Address, PriceFeed> m_feeds;
};

//-------------------------------------------------------------------------

}  // namespace creditsim::oracle

//-------------------------------------------------------------------------
