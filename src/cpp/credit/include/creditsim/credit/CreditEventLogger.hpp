/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "creditsim/credit/CreditEvents.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <memory>

//-------------------------------------------------------------------------

namespace creditsim::credit
{

//-------------------------------------------------------------------------

/**
 * Writes every published credit event as one JSON line.
 */
class CreditEventLogger
{
public:
    CreditEventLogger(
        const fs::path& filepath, UnsyncSignal<void(const CreditEvent&)>& signal);

    [[nodiscard]] const fs::path& filepath() const noexcept { return m_filepath; }
    [[nodiscard]] uint64_t eventsLogged() const noexcept { return m_eventsLogged; }

private:
    void log(const CreditEvent& event);

    std::unique_ptr<spdlog::logger> m_logger;
    fs::path m_filepath;
    bs2::scoped_connection m_feed;
    uint64_t m_eventsLogged{};
};

//-------------------------------------------------------------------------

}  // namespace creditsim::credit

//-------------------------------------------------------------------------
