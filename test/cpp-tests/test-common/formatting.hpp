/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "creditsim/numeric/numeric.hpp"

#include <ostream>

//-------------------------------------------------------------------------

namespace boost::multiprecision
{

template<typename Backend, expression_template_option ET>
inline void PrintTo(const number<Backend, ET>& val, std::ostream* os)
{
    *os << fmt::format("{}", val);
}

}  // namespace boost::multiprecision

//-------------------------------------------------------------------------
