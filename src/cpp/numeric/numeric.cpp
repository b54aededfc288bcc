/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/numeric/numeric.hpp"

#include <algorithm>
#include <cctype>
#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace creditsim::numeric
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] uint512_t twoPow256()
{
    return uint512_t{1} << 256;
}

[[nodiscard]] uint256_t twoPow255()
{
    return uint256_t{1} << 255;
}

}  // namespace

//-------------------------------------------------------------------------

uint256_t pow10(uint32_t exponent)
{
    if (exponent > 77) {
        throw std::invalid_argument{fmt::format(
            "{}: 10^{} does not fit into 256 bits",
            std::source_location::current().function_name(), exponent)};
    }
    uint256_t res{1};
    for (uint32_t i = 0; i < exponent; ++i) {
        res *= 10;
    }
    return res;
}

//-------------------------------------------------------------------------

uint256_t mulDiv(const uint256_t& a, const uint256_t& b, const uint256_t& denominator)
{
    if (denominator == 0) {
        throw std::invalid_argument{fmt::format(
            "{}: Division by zero ({} * {} / 0)",
            std::source_location::current().function_name(), a, b)};
    }
    return static_cast<uint256_t>(uint512_t{a} * uint512_t{b} / uint512_t{denominator});
}

//-------------------------------------------------------------------------

uint256_t percentMul(const uint256_t& value, uint32_t bps)
{
    return mulDiv(value, uint256_t{bps}, uint256_t{PERCENTAGE_FACTOR});
}

//-------------------------------------------------------------------------

uint256_t saturatingSub(const uint256_t& a, const uint256_t& b) noexcept
{
    return a > b ? uint256_t{a - b} : uint256_t{};
}

//-------------------------------------------------------------------------

uint256_t parseAmount(std::string_view str, uint32_t decimals)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const auto dot = str.find('.');
    const std::string_view whole = str.substr(0, dot);
    const std::string_view frac = dot == std::string_view::npos ? std::string_view{} : str.substr(dot + 1);

    const auto isDigits = [](std::string_view s) {
        return std::ranges::all_of(s, [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
    };

    if (whole.empty() && frac.empty()) {
        throw std::invalid_argument{fmt::format("{}: Empty amount '{}'", ctx, str)};
    }
    if (!isDigits(whole) || !isDigits(frac)) {
        throw std::invalid_argument{fmt::format("{}: Malformed amount '{}'", ctx, str)};
    }
    if (frac.size() > decimals) {
        throw std::invalid_argument{fmt::format(
            "{}: Amount '{}' has more than {} decimal places", ctx, str, decimals)};
    }

    std::string digits{whole};
    digits.append(frac);
    digits.append(decimals - frac.size(), '0');
    digits.erase(0, std::min(digits.find_first_not_of('0'), digits.size()));

    return digits.empty() ? uint256_t{} : uint256_t{digits};
}

//-------------------------------------------------------------------------

std::string formatAmount(const uint256_t& amount, uint32_t decimals)
{
    const uint256_t unit = pow10(decimals);
    std::string frac = uint256_t{amount % unit}.str();
    frac.insert(0, decimals - frac.size(), '0');
    while (!frac.empty() && frac.back() == '0') {
        frac.pop_back();
    }
    const std::string whole = uint256_t{amount / unit}.str();
    return frac.empty() ? whole : fmt::format("{}.{}", whole, frac);
}

//-------------------------------------------------------------------------

uint256_t encodeSigned(const int256_t& val)
{
    const uint256_t abs = magnitude(val);
    if (val >= 0) {
        if (abs >= twoPow255()) {
            throw std::invalid_argument{fmt::format(
                "{}: {} does not fit into a signed 256-bit word",
                std::source_location::current().function_name(), val)};
        }
        return abs;
    }
    if (abs > twoPow255()) {
        throw std::invalid_argument{fmt::format(
            "{}: {} does not fit into a signed 256-bit word",
            std::source_location::current().function_name(), val)};
    }
    return static_cast<uint256_t>(twoPow256() - uint512_t{abs});
}

//-------------------------------------------------------------------------

int256_t decodeSigned(const uint256_t& word)
{
    if (word < twoPow255()) {
        return int256_t{word};
    }
    return -int256_t{static_cast<uint256_t>(twoPow256() - uint512_t{word})};
}

//-------------------------------------------------------------------------

uint256_t magnitude(const int256_t& val)
{
    return static_cast<uint256_t>(val < 0 ? int256_t{-val} : val);
}

//-------------------------------------------------------------------------

}  // namespace creditsim::numeric

//-------------------------------------------------------------------------
