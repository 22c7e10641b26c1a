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

#include "zkpool_core/ledger_entry_types.h"
#include "zkpool_core/zkpool_config.h"
#include "zkpool_main/account_state.h"
#include "zkpool_main/client_errors.h"
#include "zkpool_main/crypto_capability.h"

#include <boost/optional/optional.hpp>
#include "gtest/gtest.h"

#include <cstdint>
#include <vector>

//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static zkpool::OwnedNoteV1 make_note(const std::uint64_t index, const zkpool::amount_t amount)
{
    return zkpool::OwnedNoteV1{index, amount, "note" + std::to_string(index)};
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static zkpool::StateUpdateV1 make_update(const boost::optional<zkpool::AccountUpdateV1> &new_account,
    const std::vector<zkpool::OwnedNoteV1> &new_notes,
    const std::uint64_t next_index)
{
    return zkpool::StateUpdateV1{new_account, new_notes, next_index};
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
TEST(zkpool_account_state, initial)
{
    const zkpool::AccountState account_state;

    EXPECT_EQ(account_state.next_tree_index(), 0);
    EXPECT_EQ(account_state.account_balance(), 0);
    EXPECT_TRUE(account_state.usable_notes().empty());
    EXPECT_EQ(account_state.total_balance(), 0);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(zkpool_account_state, apply_updates)
{
    const std::uint64_t stride{config::ZKPOOL_INDEX_STRIDE};
    zkpool::AccountState account_state;

    // 1. a deposit
    ASSERT_NO_THROW(account_state.apply(make_update(zkpool::AccountUpdateV1{1000, 0}, {}, stride)));
    EXPECT_EQ(account_state.next_tree_index(), stride);
    EXPECT_EQ(account_state.account_balance(), 1000);

    // 2. incoming notes
    ASSERT_NO_THROW(account_state.apply(
            make_update(boost::none, {make_note(stride + 1, 30), make_note(stride + 2, 40)}, 3 * stride)
        ));
    EXPECT_EQ(account_state.next_tree_index(), 3 * stride);
    EXPECT_EQ(account_state.notes_balance(), 70);
    EXPECT_EQ(account_state.total_balance(), 1070);

    // 3. a spend of the first note, plus a new note
    ASSERT_NO_THROW(account_state.apply(
            make_update(zkpool::AccountUpdateV1{900, stride + 2}, {make_note(3 * stride + 5, 10)}, 4 * stride)
        ));

    const std::vector<zkpool::OwnedNoteV1> expected_notes{make_note(stride + 2, 40), make_note(3 * stride + 5, 10)};
    EXPECT_TRUE(account_state.usable_notes() == expected_notes);
    EXPECT_EQ(account_state.account_balance(), 900);
    EXPECT_EQ(account_state.total_balance(), 950);

    zkpool::AccountSnapshotV1 snapshot;
    account_state.get_snapshot(snapshot);
    EXPECT_EQ(snapshot.m_next_tree_index, 4 * stride);
    EXPECT_EQ(snapshot.m_account_balance, 900);
    EXPECT_TRUE(snapshot.m_usable_notes == expected_notes);

    // 4. an update that only advances the index
    ASSERT_NO_THROW(account_state.apply(make_update(boost::none, {}, 5 * stride)));
    EXPECT_EQ(account_state.next_tree_index(), 5 * stride);
    EXPECT_EQ(account_state.total_balance(), 950);

    // 5. clear
    account_state.clear();
    EXPECT_EQ(account_state.next_tree_index(), 0);
    EXPECT_EQ(account_state.total_balance(), 0);
    EXPECT_TRUE(account_state.usable_notes().empty());
}
//-------------------------------------------------------------------------------------------------------------------
TEST(zkpool_account_state, rejected_updates)
{
    const std::uint64_t stride{config::ZKPOOL_INDEX_STRIDE};
    zkpool::AccountState account_state;

    ASSERT_NO_THROW(account_state.apply(make_update(zkpool::AccountUpdateV1{100, 0}, {make_note(1, 5)}, 2 * stride)));

    // next index can't move backwards
    EXPECT_THROW(account_state.apply(make_update(boost::none, {}, stride)), zkpool::error::internal_error);

    // notes already covered by the local state
    EXPECT_THROW(account_state.apply(make_update(boost::none, {make_note(stride + 1, 5)}, 3 * stride)),
        zkpool::error::internal_error);

    // notes beyond the update's next index
    EXPECT_THROW(account_state.apply(make_update(boost::none, {make_note(3 * stride, 5)}, 3 * stride)),
        zkpool::error::internal_error);

    // notes out of order
    EXPECT_THROW(account_state.apply(
            make_update(boost::none, {make_note(2 * stride + 2, 5), make_note(2 * stride + 1, 5)}, 3 * stride)
        ),
        zkpool::error::internal_error);

    // nothing was applied
    EXPECT_EQ(account_state.next_tree_index(), 2 * stride);
    EXPECT_EQ(account_state.account_balance(), 100);
    ASSERT_EQ(account_state.usable_notes().size(), 1);
    EXPECT_EQ(account_state.usable_notes()[0].m_index, 1);

    // re-applying the same index range is fine if it adds nothing
    EXPECT_NO_THROW(account_state.apply(make_update(boost::none, {}, 2 * stride)));
}
//-------------------------------------------------------------------------------------------------------------------
