// Copyright (c) 2022, The Monero Project
//
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without modification, are
// permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this list of
//    conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice, this list
//    of conditions and the following disclaimer in the documentation and/or other
//    materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its contributors may be
//    used to endorse or promote products derived from this software without specific
//    prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF
// MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL
// THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
// PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT,
// STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF
// THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

//paired header
#include "account_state.h"

//local headers
#include "client_errors.h"
#include "crypto_capability.h"
#include "misc_log_ex.h"
#include "zkpool_core/ledger_entry_types.h"

//third party headers
#include <boost/thread/locks.hpp>
#include <boost/thread/shared_mutex.hpp>

//standard headers
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "zkpool.sync"

namespace zkpool
{
//-------------------------------------------------------------------------------------------------------------------
std::uint64_t AccountState::next_tree_index() const
{
    boost::shared_lock<boost::shared_mutex> lock{m_state_mutex};

    return m_next_tree_index;
}
//-------------------------------------------------------------------------------------------------------------------
amount_t AccountState::account_balance() const
{
    boost::shared_lock<boost::shared_mutex> lock{m_state_mutex};

    return m_account_balance;
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<OwnedNoteV1> AccountState::usable_notes() const
{
    boost::shared_lock<boost::shared_mutex> lock{m_state_mutex};

    return m_usable_notes;
}
//-------------------------------------------------------------------------------------------------------------------
amount_t AccountState::notes_balance() const
{
    boost::shared_lock<boost::shared_mutex> lock{m_state_mutex};

    return notes_balance_impl();
}
//-------------------------------------------------------------------------------------------------------------------
amount_t AccountState::total_balance() const
{
    boost::shared_lock<boost::shared_mutex> lock{m_state_mutex};

    return m_account_balance + notes_balance_impl();
}
//-------------------------------------------------------------------------------------------------------------------
void AccountState::get_snapshot(AccountSnapshotV1 &snapshot_out) const
{
    boost::shared_lock<boost::shared_mutex> lock{m_state_mutex};

    snapshot_out.m_next_tree_index = m_next_tree_index;
    snapshot_out.m_account_balance = m_account_balance;
    snapshot_out.m_usable_notes    = m_usable_notes;
}
//-------------------------------------------------------------------------------------------------------------------
void AccountState::apply(const StateUpdateV1 &update)
{
    boost::unique_lock<boost::shared_mutex> lock{m_state_mutex};

    // 1. validate the delta before touching anything
    THROW_ZKPOOL_EXCEPTION_IF(update.m_next_index < m_next_tree_index, error::internal_error,
        "applying state update: next tree index would decrease (" + std::to_string(m_next_tree_index) + " -> " +
        std::to_string(update.m_next_index) + ")");

    std::uint64_t min_allowed_index{m_next_tree_index};
    if (!m_usable_notes.empty())
        min_allowed_index = std::max(min_allowed_index, m_usable_notes.back().m_index + 1);

    for (const OwnedNoteV1 &new_note : update.m_new_notes)
    {
        THROW_ZKPOOL_EXCEPTION_IF(new_note.m_index < min_allowed_index, error::internal_error,
            "applying state update: note index " + std::to_string(new_note.m_index) +
            " is already covered by the local state");
        THROW_ZKPOOL_EXCEPTION_IF(new_note.m_index >= update.m_next_index, error::internal_error,
            "applying state update: note index " + std::to_string(new_note.m_index) +
            " is beyond the update's next index");

        min_allowed_index = new_note.m_index + 1;
    }

    // 2. add new notes
    m_usable_notes.insert(m_usable_notes.end(), update.m_new_notes.begin(), update.m_new_notes.end());

    // 3. the latest account consumes every note below its watermark
    if (update.m_new_account)
    {
        const std::uint64_t watermark{update.m_new_account->m_spent_note_watermark};

        m_usable_notes.erase(
                std::remove_if(m_usable_notes.begin(), m_usable_notes.end(),
                        [watermark](const OwnedNoteV1 &note) -> bool
                        {
                            return note.m_index < watermark;
                        }
                    ),
                m_usable_notes.end()
            );

        m_account_balance = update.m_new_account->m_balance;
    }

    // 4. advance
    m_next_tree_index = update.m_next_index;

    MDEBUG("Account state: next index " << m_next_tree_index << ", account balance " << m_account_balance
        << ", " << m_usable_notes.size() << " usable notes.");
}
//-------------------------------------------------------------------------------------------------------------------
void AccountState::clear()
{
    boost::unique_lock<boost::shared_mutex> lock{m_state_mutex};

    m_next_tree_index = 0;
    m_account_balance = 0;
    m_usable_notes.clear();
}
//-------------------------------------------------------------------------------------------------------------------
amount_t AccountState::notes_balance_impl() const
{
    amount_t notes_balance{0};

    for (const OwnedNoteV1 &note : m_usable_notes)
        notes_balance += note.m_amount;

    return notes_balance;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace zkpool
