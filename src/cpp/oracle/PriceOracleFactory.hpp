/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "creditsim/oracle/PriceOracle.hpp"
#include "creditsim/simulation/TokenLedger.hpp"

//-------------------------------------------------------------------------

namespace creditsim::oracle
{

//-------------------------------------------------------------------------

struct PriceOracleFactory
{
    [[nodiscard]] static std::unique_ptr<PriceOracle> createFromXML(
        pugi::xml_node node, const simulation::TokenLedger& ledger);
};

//-------------------------------------------------------------------------

}  // namespace creditsim::oracle

//-------------------------------------------------------------------------
