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

#include "misc_log_ex.h"
#include "zkpool_core/ledger_entry_types.h"
#include "zkpool_core/ledger_entry_utils.h"
#include "zkpool_core/zkpool_config.h"

#include "gtest/gtest.h"

#include <cstdint>
#include <string>
#include <vector>

//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static std::string hex_field(const char fill)
{
    return std::string(64, fill);
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static std::string make_test_entry(const bool mined, const char tag, const std::string &memo)
{
    return zkpool::make_raw_ledger_entry_v1(mined, hex_field(tag), hex_field('c'), memo);
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
TEST(zkpool_ledger_entry, parse_fixed_offsets)
{
    const std::string raw_entry{"1" + hex_field('a') + hex_field('b') + "68656c6c6f"};

    zkpool::LedgerEntryV1 entry;
    ASSERT_NO_THROW(zkpool::parse_ledger_entry_v1(raw_entry, 256, entry));

    EXPECT_EQ(entry.m_index, 256);
    EXPECT_TRUE(entry.m_mined);
    EXPECT_EQ(entry.m_tx_hash, hex_field('a'));
    EXPECT_EQ(entry.m_commitment, hex_field('b'));
    EXPECT_EQ(entry.m_memo, "hello");

    // a pending entry without a memo
    ASSERT_NO_THROW(zkpool::parse_ledger_entry_v1("0" + hex_field('1') + hex_field('2'), 0, entry));
    EXPECT_FALSE(entry.m_mined);
    EXPECT_TRUE(entry.m_memo.empty());
}
//-------------------------------------------------------------------------------------------------------------------
TEST(zkpool_ledger_entry, make_and_parse)
{
    const std::string memo{"\x00\x01\xfe\xff", 4};
    const std::string raw_entry{make_test_entry(false, 'd', memo)};

    EXPECT_EQ(raw_entry.size(), config::ZKPOOL_ENTRY_MEMO_OFFSET + 2 * memo.size());

    zkpool::LedgerEntryV1 entry;
    ASSERT_NO_THROW(zkpool::parse_ledger_entry_v1(raw_entry, 0, entry));
    EXPECT_FALSE(entry.m_mined);
    EXPECT_EQ(entry.m_tx_hash, hex_field('d'));
    EXPECT_EQ(entry.m_memo, memo);

    // tx hash and commitment must have their fixed size
    EXPECT_ANY_THROW(zkpool::make_raw_ledger_entry_v1(true, "abcd", hex_field('c'), memo));
    EXPECT_ANY_THROW(zkpool::make_raw_ledger_entry_v1(true, hex_field('a'), "", memo));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(zkpool_ledger_entry, malformed_entries)
{
    zkpool::LedgerEntryV1 entry;

    // too short
    EXPECT_ANY_THROW(zkpool::parse_ledger_entry_v1("1" + hex_field('a'), 0, entry));
    EXPECT_ANY_THROW(zkpool::check_v1_raw_ledger_entry_semantics_v1(""));

    // unknown flag
    EXPECT_ANY_THROW(zkpool::parse_ledger_entry_v1("2" + hex_field('a') + hex_field('b'), 0, entry));

    // odd memo
    EXPECT_ANY_THROW(zkpool::parse_ledger_entry_v1("1" + hex_field('a') + hex_field('b') + "abc", 0, entry));

    // non-hex fields
    EXPECT_ANY_THROW(zkpool::parse_ledger_entry_v1("1" + hex_field('x') + hex_field('b'), 0, entry));
    EXPECT_ANY_THROW(zkpool::parse_ledger_entry_v1("1" + hex_field('a') + hex_field('z'), 0, entry));
    EXPECT_ANY_THROW(zkpool::parse_ledger_entry_v1("1" + hex_field('a') + hex_field('b') + "zz", 0, entry));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(zkpool_ledger_entry, classify)
{
    // mined, mined, pending, starting at the second tx of the log
    const std::vector<std::string> raw_entries{
            make_test_entry(true, '1', "m1"),
            make_test_entry(true, '2', "m2"),
            make_test_entry(false, '3', "p1")
        };
    const std::uint64_t first_index{config::ZKPOOL_INDEX_STRIDE};

    zkpool::ClassifiedEntriesV1 classified;
    ASSERT_NO_THROW(zkpool::classify_ledger_entries_v1(raw_entries, first_index, classified));

    ASSERT_EQ(classified.m_mined_txs.size(), 2);
    ASSERT_EQ(classified.m_pending_txs.size(), 1);

    EXPECT_EQ(classified.m_mined_txs[0].m_index, first_index);
    EXPECT_EQ(classified.m_mined_txs[0].m_memo, "m1");
    EXPECT_EQ(classified.m_mined_txs[1].m_index, first_index + config::ZKPOOL_INDEX_STRIDE);
    EXPECT_EQ(classified.m_mined_txs[1].m_memo, "m2");
    EXPECT_EQ(classified.m_pending_txs[0].m_index, first_index + 2 * config::ZKPOOL_INDEX_STRIDE);
    EXPECT_EQ(classified.m_pending_txs[0].m_commitment, hex_field('c'));

    EXPECT_EQ(classified.m_max_mined_index, static_cast<std::int64_t>(first_index + config::ZKPOOL_INDEX_STRIDE));
    EXPECT_EQ(classified.m_max_pending_index,
        static_cast<std::int64_t>(first_index + 2 * config::ZKPOOL_INDEX_STRIDE));

    ASSERT_EQ(classified.m_tx_hashes.size(), 3);
    EXPECT_EQ(classified.m_tx_hashes.at(first_index), hex_field('1'));
    EXPECT_EQ(classified.m_tx_hashes.at(first_index + 2 * config::ZKPOOL_INDEX_STRIDE), hex_field('3'));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(zkpool_ledger_entry, classify_edge_cases)
{
    zkpool::ClassifiedEntriesV1 classified;

    // empty batch
    ASSERT_NO_THROW(zkpool::classify_ledger_entries_v1({}, 0, classified));
    EXPECT_TRUE(classified.m_mined_txs.empty());
    EXPECT_TRUE(classified.m_pending_txs.empty());
    EXPECT_EQ(classified.m_max_mined_index, zkpool::NO_INDEX);
    EXPECT_EQ(classified.m_max_pending_index, zkpool::NO_INDEX);

    // pending only
    ASSERT_NO_THROW(zkpool::classify_ledger_entries_v1({make_test_entry(false, '1', "p")}, 0, classified));
    EXPECT_EQ(classified.m_max_mined_index, zkpool::NO_INDEX);
    EXPECT_EQ(classified.m_max_pending_index, 0);

    // a mined entry after a pending entry is malformed
    EXPECT_ANY_THROW(zkpool::classify_ledger_entries_v1(
            {make_test_entry(false, '1', "p"), make_test_entry(true, '2', "m")},
            0,
            classified
        ));
}
//-------------------------------------------------------------------------------------------------------------------
