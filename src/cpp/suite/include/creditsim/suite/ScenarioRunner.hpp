/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "creditsim/config/ScenarioStep.hpp"
#include "creditsim/suite/AccountSnapshot.hpp"

//-------------------------------------------------------------------------

namespace creditsim::suite
{

//-------------------------------------------------------------------------

class CreditSuite;

struct ScenarioReport
{
    uint32_t stepsRun{};
    uint32_t expectedFailures{};
    BlockNumber blockNumber{};
    Timestamp timestamp{};
    uint256_t totalBorrowed;
    uint256_t treasuryProfit;
    uint256_t totalLosses;
    uint256_t cumulativeLoss;
    bool paused{};
    std::vector<AccountSnapshot> snapshots;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;
};

//-------------------------------------------------------------------------

/**
 * Drives a CreditSuite through a list of scenario steps. Actors are
 * created on first mention and approve the credit manager for every
 * token; accounts are named by the step that opened them.
 */
class ScenarioRunner
{
public:
    explicit ScenarioRunner(CreditSuite& suite) noexcept : m_suite{suite} {}

    ScenarioReport run();
    ScenarioReport run(std::span<const config::ScenarioStep> steps);

    void runStep(const config::ScenarioStep& step);

    [[nodiscard]] Address actor(std::string_view name);
    [[nodiscard]] Address account(std::string_view name) const;
    [[nodiscard]] bool hasAccount(std::string_view name) const noexcept;
    [[nodiscard]] const std::vector<AccountSnapshot>& snapshots() const noexcept { return m_snapshots; }

    [[nodiscard]] static std::string_view stepName(const config::ScenarioStep::ItemType& item) noexcept;

private:
    void execute(const config::ScenarioStep::ItemType& item);
    void snapshot(const config::step::Snapshot& item);

    [[nodiscard]] ScenarioReport report() const;

    CreditSuite& m_suite;
    std::map<std::string, Address, std::less<>> m_actors;
    std::map<std::string, Address, std::less<>> m_accounts;
    std::vector<AccountSnapshot> m_snapshots;
    uint32_t m_stepsRun{};
    uint32_t m_expectedFailures{};
};

//-------------------------------------------------------------------------

class ScenarioException : public std::exception
{
public:
    explicit ScenarioException(std::string msg) noexcept : m_msg{std::move(msg)} {}

    virtual const char* what() const noexcept override { return m_msg.c_str(); }

private:
    std::string m_msg;
};

//-------------------------------------------------------------------------

}  // namespace creditsim::suite

//-------------------------------------------------------------------------
