/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <cstdint>

//-------------------------------------------------------------------------

using Timestamp = uint64_t;
using BlockNumber = uint64_t;

inline constexpr Timestamp kSecondsPerDay = 24 * 60 * 60;

//-------------------------------------------------------------------------
