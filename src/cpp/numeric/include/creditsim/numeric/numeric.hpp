/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace creditsim
{

namespace bmp = boost::multiprecision;

using uint256_t = bmp::number<
    bmp::cpp_int_backend<256, 256, bmp::unsigned_magnitude, bmp::checked, void>,
    bmp::et_off>;

using uint512_t = bmp::number<
    bmp::cpp_int_backend<512, 512, bmp::unsigned_magnitude, bmp::checked, void>,
    bmp::et_off>;

using int256_t = bmp::number<
    bmp::cpp_int_backend<256, 256, bmp::signed_magnitude, bmp::checked, void>,
    bmp::et_off>;

}  // namespace creditsim

//-------------------------------------------------------------------------

namespace creditsim::numeric
{

inline const uint256_t WAD{1'000'000'000'000'000'000ull};
inline const uint256_t RAY = uint256_t{1'000'000'000ull} * 1'000'000'000ull * 1'000'000'000ull;
inline const uint256_t INDEX_PRECISION{1'000'000'000ull};

inline constexpr uint16_t PERCENTAGE_FACTOR = 10'000;
inline constexpr uint64_t SECONDS_PER_YEAR = 365 * 24 * 60 * 60;

inline constexpr uint32_t kUSDDecimals = 8;

[[nodiscard]] uint256_t pow10(uint32_t exponent);

/**
 * Computes floor(a * b / denominator) with a 512-bit intermediate, so that only
 * the final quotient must fit into 256 bits.
 */
[[nodiscard]] uint256_t mulDiv(const uint256_t& a, const uint256_t& b, const uint256_t& denominator);

[[nodiscard]] uint256_t percentMul(const uint256_t& value, uint32_t bps);

[[nodiscard]] uint256_t saturatingSub(const uint256_t& a, const uint256_t& b) noexcept;

/**
 * Parses a decimal string such as "1200" or "0.25" into base units with the
 * given number of decimals. Throws std::invalid_argument on malformed input or
 * excess precision.
 */
[[nodiscard]] uint256_t parseAmount(std::string_view str, uint32_t decimals);

[[nodiscard]] std::string formatAmount(const uint256_t& amount, uint32_t decimals);

/**
 * Two's complement mapping between signed values and 256-bit words, as used
 * for signed call arguments.
 */
[[nodiscard]] uint256_t encodeSigned(const int256_t& val);
[[nodiscard]] int256_t decodeSigned(const uint256_t& word);

[[nodiscard]] uint256_t magnitude(const int256_t& val);

}  // namespace creditsim::numeric

//-------------------------------------------------------------------------

namespace creditsim::literals
{

[[nodiscard]] inline uint256_t operator"" _u256(const char* str)
{
    return uint256_t{str};
}

[[nodiscard]] inline uint256_t operator"" _wad(unsigned long long int val)
{
    return uint256_t{val} * numeric::WAD;
}

}  // namespace creditsim::literals

//-------------------------------------------------------------------------

template<typename Backend, boost::multiprecision::expression_template_option ET>
struct fmt::formatter<boost::multiprecision::number<Backend, ET>>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const boost::multiprecision::number<Backend, ET>& val, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", val.str());
    }
};

//-------------------------------------------------------------------------
