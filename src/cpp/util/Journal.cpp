/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "Journal.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <source_location>
#include <stdexcept>
#include <utility>

//-------------------------------------------------------------------------

namespace creditsim::util
{

//-------------------------------------------------------------------------

void Journal::attach(Journaled* entry)
{
    if (m_depth > 0) {
        throw std::logic_error{fmt::format(
            "{}: Cannot attach to a journal with an open transaction",
            std::source_location::current().function_name())};
    }
    if (std::ranges::find(m_entries, entry) == m_entries.end()) {
        m_entries.push_back(entry);
    }
}

//-------------------------------------------------------------------------

void Journal::detach(Journaled* entry) noexcept
{
    std::erase(m_entries, entry);
}

//-------------------------------------------------------------------------

Transaction Journal::begin()
{
    return Transaction{*this};
}

//-------------------------------------------------------------------------

Transaction::Transaction(Journal& journal)
    : m_journal{&journal},
      m_outermost{journal.m_depth == 0}
{
    if (m_outermost) {
        m_restores.reserve(journal.m_entries.size());
        for (auto* entry : journal.m_entries) {
            m_restores.push_back(entry->checkpoint());
        }
    }
    ++journal.m_depth;
}

//-------------------------------------------------------------------------

Transaction::Transaction(Transaction&& other) noexcept
    : m_journal{std::exchange(other.m_journal, nullptr)},
      m_restores{std::move(other.m_restores)},
      m_outermost{other.m_outermost},
      m_committed{other.m_committed},
      m_rolledBack{other.m_rolledBack}
{}

//-------------------------------------------------------------------------

Transaction::~Transaction() noexcept
{
    if (m_journal == nullptr) return;
    --m_journal->m_depth;
    if (m_committed || m_rolledBack || !m_outermost) return;
    restore();
}

//-------------------------------------------------------------------------

void Transaction::commit() noexcept
{
    m_committed = true;
    m_restores.clear();
}

//-------------------------------------------------------------------------

void Transaction::rollback()
{
    if (m_committed || m_rolledBack || !m_outermost) return;
    m_rolledBack = true;
    restore();
}

//-------------------------------------------------------------------------

void Transaction::restore()
{
    auto restores = std::exchange(m_restores, {});
    for (auto it = restores.rbegin(); it != restores.rend(); ++it) {
        (*it)();
    }
}

//-------------------------------------------------------------------------

}  // namespace creditsim::util

//-------------------------------------------------------------------------
