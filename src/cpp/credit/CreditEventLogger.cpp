/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "creditsim/credit/CreditEventLogger.hpp"

#include "json_util.hpp"

//-------------------------------------------------------------------------

namespace creditsim::credit
{

//-------------------------------------------------------------------------

CreditEventLogger::CreditEventLogger(
    const fs::path& filepath, UnsyncSignal<void(const CreditEvent&)>& signal)
    : m_filepath{filepath}
{
    m_logger = std::make_unique<spdlog::logger>(
        "CreditEventLogger", std::make_shared<spdlog::sinks::basic_file_sink_st>(m_filepath.string(), true));
    m_logger->set_level(spdlog::level::trace);
    m_logger->set_pattern("%v");

    m_feed = signal.connect([this](const CreditEvent& event) { log(event); });
}

//-------------------------------------------------------------------------

void CreditEventLogger::log(const CreditEvent& event)
{
    m_logger->trace(json::jsonSerializable2str(event));
    m_logger->flush();
    ++m_eventsLogged;
}

//-------------------------------------------------------------------------

}  // namespace creditsim::credit

//-------------------------------------------------------------------------
