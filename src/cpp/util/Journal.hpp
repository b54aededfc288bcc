/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <cstdint>
#include <functional>
#include <type_traits>
#include <vector>

//-------------------------------------------------------------------------

namespace creditsim::util
{

//-------------------------------------------------------------------------

using RestoreFn = std::function<void()>;

/**
 * A component whose mutable state can be captured at the start of a
 * transaction and restored if the transaction does not commit.
 */
class Journaled
{
public:
    virtual ~Journaled() noexcept = default;

    [[nodiscard]] virtual RestoreFn checkpoint() = 0;

protected:
    Journaled() noexcept = default;
};

//-------------------------------------------------------------------------

class Transaction;

class Journal
{
public:
    void attach(Journaled* entry);
    void detach(Journaled* entry) noexcept;

    [[nodiscard]] Transaction begin();

    [[nodiscard]] uint32_t depth() const noexcept { return m_depth; }
    [[nodiscard]] size_t size() const noexcept { return m_entries.size(); }

private:
    std::vector<Journaled*> m_entries;
    uint32_t m_depth{};

    friend class Transaction;
};

//-------------------------------------------------------------------------

/**
 * Scoped all-or-nothing unit of work. Only the outermost transaction takes
 * snapshots. Error paths call rollback() to restore them in reverse order;
 * a transaction destroyed without commit() or rollback() restores them from
 * its destructor. Nested transactions fold into the outermost one.
 */
class Transaction
{
public:
    explicit Transaction(Journal& journal);
    ~Transaction() noexcept;

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&& other) noexcept;
    Transaction& operator=(Transaction&&) = delete;

    void commit() noexcept;

    /**
     * Restores the snapshots of an outermost transaction; a no-op for nested
     * ones and after commit(). Restoring may throw, unlike the destructor.
     */
    void rollback();

    [[nodiscard]] bool outermost() const noexcept { return m_outermost; }
    [[nodiscard]] bool committed() const noexcept { return m_committed; }
    [[nodiscard]] bool rolledBack() const noexcept { return m_rolledBack; }

private:
    void restore();

    Journal* m_journal;
    std::vector<RestoreFn> m_restores;
    bool m_outermost{};
    bool m_committed{};
    bool m_rolledBack{};
};

//-------------------------------------------------------------------------

/**
 * Runs `fn` in a transaction: commits on return, rolls back and rethrows
 * on exception.
 */
template<typename Fn>
decltype(auto) atomically(Journal& journal, Fn&& fn)
{
    auto tx = journal.begin();
    try {
        if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
            std::invoke(std::forward<Fn>(fn));
            tx.commit();
        } else {
            auto res = std::invoke(std::forward<Fn>(fn));
            tx.commit();
            return res;
        }
    }
    catch (...) {
        tx.rollback();
        throw;
    }
}

//-------------------------------------------------------------------------

/**
 * RAII attachment of a component to a journal.
 */
class JournalEntry
{
public:
    JournalEntry(Journal& journal, Journaled* entry) : m_journal{&journal}, m_entry{entry}
    {
        m_journal->attach(m_entry);
    }

    ~JournalEntry() noexcept { m_journal->detach(m_entry); }

    JournalEntry(const JournalEntry&) = delete;
    JournalEntry& operator=(const JournalEntry&) = delete;

private:
    Journal* m_journal;
    Journaled* m_entry;
};

//-------------------------------------------------------------------------

}  // namespace creditsim::util

//-------------------------------------------------------------------------
