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

// The owner's account and spendable notes for one asset pool.


#pragma once

//local headers
#include "crypto_capability.h"
#include "zkpool_core/ledger_entry_types.h"

//third party headers
#include <boost/thread/shared_mutex.hpp>

//standard headers
#include <cstdint>
#include <vector>

//forward declarations


namespace zkpool
{

struct AccountSnapshotV1 final
{
    std::uint64_t m_next_tree_index;
    amount_t m_account_balance;
    /// ascending index
    std::vector<OwnedNoteV1> m_usable_notes;
};

////
// AccountState
// - mutated only by applying state deltas derived from mined memos
// - invariants:
//   - next tree index never decreases
//   - usable notes are kept in ascending index order (the canonical spend order)
///
class AccountState final
{
public:
//member functions
    std::uint64_t next_tree_index() const;
    amount_t account_balance() const;
    std::vector<OwnedNoteV1> usable_notes() const;
    /// sum of usable notes
    amount_t notes_balance() const;
    /// account + notes
    amount_t total_balance() const;
    /// read every field under one lock
    void get_snapshot(AccountSnapshotV1 &snapshot_out) const;

    /**
    * brief: apply - apply a state delta from a batch of mined txs
    *   - throws error::internal_error if the delta would move the state backwards (nothing is applied)
    * param: update -
    */
    void apply(const StateUpdateV1 &update);
    /// forget everything (client teardown)
    void clear();

private:
    amount_t notes_balance_impl() const;

//member variables
    /// protects all state
    mutable boost::shared_mutex m_state_mutex;

    std::uint64_t m_next_tree_index{0};
    amount_t m_account_balance{0};
    std::vector<OwnedNoteV1> m_usable_notes;
};

} //namespace zkpool
