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
#include "ledger_entry_utils.h"

//local headers
#include "ledger_entry_types.h"
#include "misc_log_ex.h"
#include "string_tools.h"
#include "zkpool_config.h"

//third party headers

//standard headers
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "zkpool"

namespace zkpool
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static bool is_hex_field(const std::string &raw_entry, const std::size_t offset, const std::size_t size)
{
    std::string dummy;
    return epee::string_tools::parse_hexstr_to_binbuff(raw_entry.substr(offset, size), dummy);
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
void check_v1_raw_ledger_entry_semantics_v1(const std::string &raw_entry)
{
    CHECK_AND_ASSERT_THROW_MES(raw_entry.size() >= config::ZKPOOL_ENTRY_MEMO_OFFSET,
        "raw ledger entry semantics check: entry is shorter than its fixed header.");
    CHECK_AND_ASSERT_THROW_MES((raw_entry.size() - config::ZKPOOL_ENTRY_MEMO_OFFSET) % 2 == 0,
        "raw ledger entry semantics check: memo has an odd number of hex chars.");

    const char mined_flag{raw_entry[config::ZKPOOL_ENTRY_MINED_FLAG_OFFSET]};
    CHECK_AND_ASSERT_THROW_MES(mined_flag == '1' || mined_flag == '0',
        "raw ledger entry semantics check: unknown mined flag.");

    CHECK_AND_ASSERT_THROW_MES(is_hex_field(raw_entry,
            config::ZKPOOL_ENTRY_TX_HASH_OFFSET,
            config::ZKPOOL_ENTRY_TX_HASH_HEX_SIZE),
        "raw ledger entry semantics check: tx hash is not hex.");
    CHECK_AND_ASSERT_THROW_MES(is_hex_field(raw_entry,
            config::ZKPOOL_ENTRY_COMMITMENT_OFFSET,
            config::ZKPOOL_ENTRY_COMMITMENT_HEX_SIZE),
        "raw ledger entry semantics check: commitment is not hex.");
}
//-------------------------------------------------------------------------------------------------------------------
void parse_ledger_entry_v1(const std::string &raw_entry, const std::uint64_t index, LedgerEntryV1 &entry_out)
{
    check_v1_raw_ledger_entry_semantics_v1(raw_entry);

    entry_out.m_index = index;
    entry_out.m_mined = raw_entry[config::ZKPOOL_ENTRY_MINED_FLAG_OFFSET] == '1';
    entry_out.m_tx_hash = raw_entry.substr(config::ZKPOOL_ENTRY_TX_HASH_OFFSET, config::ZKPOOL_ENTRY_TX_HASH_HEX_SIZE);
    entry_out.m_commitment =
        raw_entry.substr(config::ZKPOOL_ENTRY_COMMITMENT_OFFSET, config::ZKPOOL_ENTRY_COMMITMENT_HEX_SIZE);

    entry_out.m_memo.clear();
    CHECK_AND_ASSERT_THROW_MES(
            epee::string_tools::parse_hexstr_to_binbuff(raw_entry.substr(config::ZKPOOL_ENTRY_MEMO_OFFSET),
                entry_out.m_memo),
        "parsing ledger entry: memo is not hex.");
}
//-------------------------------------------------------------------------------------------------------------------
std::string make_raw_ledger_entry_v1(const bool mined,
    const std::string &tx_hash,
    const std::string &commitment,
    const std::string &memo)
{
    CHECK_AND_ASSERT_THROW_MES(tx_hash.size() == config::ZKPOOL_ENTRY_TX_HASH_HEX_SIZE,
        "making raw ledger entry: unexpected tx hash size.");
    CHECK_AND_ASSERT_THROW_MES(commitment.size() == config::ZKPOOL_ENTRY_COMMITMENT_HEX_SIZE,
        "making raw ledger entry: unexpected commitment size.");

    std::string raw_entry;
    raw_entry.reserve(config::ZKPOOL_ENTRY_MEMO_OFFSET + 2 * memo.size());
    raw_entry += mined ? '1' : '0';
    raw_entry += tx_hash;
    raw_entry += commitment;
    raw_entry += epee::string_tools::buff_to_hex_nodelimer(memo);

    return raw_entry;
}
//-------------------------------------------------------------------------------------------------------------------
void classify_ledger_entries_v1(const std::vector<std::string> &raw_entries,
    const std::uint64_t first_index,
    ClassifiedEntriesV1 &classified_out)
{
    classified_out = ClassifiedEntriesV1{};
    classified_out.m_mined_txs.reserve(raw_entries.size());

    LedgerEntryV1 entry;
    std::uint64_t index{first_index};

    for (const std::string &raw_entry : raw_entries)
    {
        parse_ledger_entry_v1(raw_entry, index, entry);

        if (entry.m_mined)
        {
            // the relayer appends pending txs after the mined ones
            CHECK_AND_ASSERT_THROW_MES(classified_out.m_pending_txs.empty(),
                "classifying ledger entries: a mined entry follows a pending entry.");

            classified_out.m_max_mined_index = static_cast<std::int64_t>(index);
            classified_out.m_mined_txs.emplace_back(
                    IndexedTxV1{index, std::move(entry.m_memo), std::move(entry.m_commitment)}
                );
        }
        else
        {
            classified_out.m_max_pending_index = static_cast<std::int64_t>(index);
            classified_out.m_pending_txs.emplace_back(
                    IndexedTxV1{index, std::move(entry.m_memo), std::move(entry.m_commitment)}
                );
        }

        classified_out.m_tx_hashes[index] = std::move(entry.m_tx_hash);
        index += config::ZKPOOL_INDEX_STRIDE;
    }
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace zkpool
