/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "CreditException.hpp"
#include "common.hpp"

#include <limits>

//-------------------------------------------------------------------------

namespace creditsim::simulation
{

//-------------------------------------------------------------------------

struct CallData
{
    uint32_t selector{};
    std::vector<uint256_t> args;

    [[nodiscard]] bool operator==(const CallData& other) const = default;
};

//-------------------------------------------------------------------------

class ExternalContract
{
public:
    virtual ~ExternalContract() noexcept = default;

    [[nodiscard]] virtual Address address() const noexcept = 0;

    virtual std::vector<uint256_t> call(Address caller, const CallData& data) = 0;

protected:
    ExternalContract() noexcept = default;
};

//-------------------------------------------------------------------------

[[nodiscard]] inline Address argToAddress(const uint256_t& arg)
{
    if (arg > std::numeric_limits<Address>::max()) {
        throw IncorrectParameterException{fmt::format("{} is not an address", arg)};
    }
    return static_cast<Address>(arg);
}

//-------------------------------------------------------------------------

}  // namespace creditsim::simulation

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<creditsim::simulation::CallData>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const creditsim::simulation::CallData& data, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "CallData{{.selector = {:#010x}, .args = [{}]}}",
            data.selector,
            fmt::join(data.args, ", "));
    }
};

//-------------------------------------------------------------------------
