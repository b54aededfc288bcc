/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "creditsim/oracle/PriceOracle.hpp"

#include <gmock/gmock.h>

//-------------------------------------------------------------------------

namespace creditsim::test
{

class MockPriceOracle : public oracle::PriceOracle
{
public:
    MOCK_METHOD(uint256_t, convertToUSD, (const uint256_t& amount, Address token), (const, override));
    MOCK_METHOD(uint256_t, convertFromUSD, (const uint256_t& amount, Address token), (const, override));
    MOCK_METHOD(bool, hasPriceFeed, (Address token), (const, noexcept, override));
};

}  // namespace creditsim::test

//-------------------------------------------------------------------------
