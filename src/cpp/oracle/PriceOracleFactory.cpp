/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "PriceOracleFactory.hpp"

#include "StaticPriceOracle.hpp"

//-------------------------------------------------------------------------

namespace creditsim::oracle
{

//-------------------------------------------------------------------------

std::unique_ptr<PriceOracle> PriceOracleFactory::createFromXML(
    pugi::xml_node node, const simulation::TokenLedger& ledger)
{
    std::string_view oracleType = node.attribute("type").as_string("static");

    if (oracleType == "static") {
        return StaticPriceOracle::fromXML(node, ledger);
    }

    throw std::invalid_argument{fmt::format(
        "{}: Unknown price oracle type '{}'",
        std::source_location::current().function_name(), oracleType)};
}

//-------------------------------------------------------------------------

}  // namespace creditsim::oracle

//-------------------------------------------------------------------------
