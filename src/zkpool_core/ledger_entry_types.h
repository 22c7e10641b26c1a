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

// Raw relayer log entries and the indexed txs extracted from them.


#pragma once

//local headers

//third party headers

//standard headers
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

//forward declarations


namespace zkpool
{

/// amount inside the pool (shielded units)
typedef std::uint64_t amount_t;

/// sentinel for "no index seen" in signed index aggregates
const constexpr std::int64_t NO_INDEX{-1};

enum class TxKind : unsigned char
{
    DEPOSIT,
    TRANSFER,
    WITHDRAW
};

////
// LedgerEntryV1
// - one entry of the relayer's commitment log, decoded at its fixed offsets
// - transient: only lives until its batch is classified
///
struct LedgerEntryV1 final
{
    /// log index of the entry's first commitment slot
    std::uint64_t m_index;
    /// confirmed by the underlying ledger (false: accepted by the relayer only)
    bool m_mined;
    /// tx hash (hex)
    std::string m_tx_hash;
    /// out commitment (hex)
    std::string m_commitment;
    /// encrypted memo (binary)
    std::string m_memo;
};

////
// IndexedTxV1
// - the unit handed to memo decryption
///
struct IndexedTxV1 final
{
    std::uint64_t m_index;
    /// encrypted memo (binary)
    std::string m_memo;
    /// out commitment (hex)
    std::string m_commitment;
};

////
// OwnedNoteV1
// - an output note decrypted for the owner, spendable by a later tx
///
struct OwnedNoteV1 final
{
    /// commitment slot of the note
    std::uint64_t m_index;
    amount_t m_amount;
    /// opaque note payload (passed back to the tx data builder when spending)
    std::string m_payload;
};

inline bool operator==(const OwnedNoteV1 &a, const OwnedNoteV1 &b)
{
    return a.m_index == b.m_index && a.m_amount == b.m_amount && a.m_payload == b.m_payload;
}

////
// ClassifiedEntriesV1
// - a batch of log entries split into mined and pending txs (arrival order is preserved in each list)
///
struct ClassifiedEntriesV1 final
{
    std::vector<IndexedTxV1> m_mined_txs;
    std::vector<IndexedTxV1> m_pending_txs;
    /// tx hash of every classified entry (mapped to index)
    std::unordered_map<std::uint64_t, std::string> m_tx_hashes;
    /// highest mined/pending index in the batch (NO_INDEX if none)
    std::int64_t m_max_mined_index{NO_INDEX};
    std::int64_t m_max_pending_index{NO_INDEX};
};

} //namespace zkpool
