/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "CreditException.hpp"

//-------------------------------------------------------------------------

namespace creditsim
{

//-------------------------------------------------------------------------

CreditException::CreditException(ErrorCode code, std::string_view detail)
    : m_code{code},
      m_msg{detail.empty()
          ? std::string{magic_enum::enum_name(code)}
          : fmt::format("{}: {}", magic_enum::enum_name(code), detail)}
{}

//-------------------------------------------------------------------------

const char* CreditException::what() const noexcept
{
    return m_msg.c_str();
}

//-------------------------------------------------------------------------

NoPermissionException::NoPermissionException(uint32_t permission)
    : CreditError{fmt::format("missing permission {:#x}", permission)},
      m_permission{permission}
{}

//-------------------------------------------------------------------------

}  // namespace creditsim

//-------------------------------------------------------------------------
