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

// Dependency injector for memo decryption and tx proving.


#pragma once

//local headers
#include "wipeable_string.h"
#include "zkpool_core/ledger_entry_types.h"

//third party headers
#include <boost/optional/optional.hpp>

//standard headers
#include <cstdint>
#include <string>
#include <vector>

//forward declarations


namespace zkpool
{

////
// AccountUpdateV1
// - the owner's account as of a decrypted tx
///
struct AccountUpdateV1 final
{
    amount_t m_balance;
    /// notes with an index below this are spent
    std::uint64_t m_spent_note_watermark;
};

////
// StateUpdateV1
// - state delta derived from a batch of mined memos
///
struct StateUpdateV1 final
{
    /// latest account found in the batch
    boost::optional<AccountUpdateV1> m_new_account;
    /// owned notes found in the batch (ascending index)
    std::vector<OwnedNoteV1> m_new_notes;
    /// tree index following the last tx of the batch
    std::uint64_t m_next_index;
};

////
// DecryptedMemoV1
// - a memo that belongs to the owner
///
struct DecryptedMemoV1 final
{
    std::uint64_t m_index;
    /// set by the caller from the log entry (decryption only sees the memo)
    std::string m_tx_hash;
    /// the memo carries the owner's account, i.e. the owner created this tx
    bool m_account_present;
    TxKind m_kind;
    /// amount moved by the tx (for txs created by the owner: amount leaving the account, fee excluded)
    amount_t m_amount;
    amount_t m_fee;
    boost::optional<amount_t> m_account_balance;
    std::vector<OwnedNoteV1> m_owned_notes;
};

struct DecryptionResultV1 final
{
    std::vector<DecryptedMemoV1> m_memos;
    StateUpdateV1 m_state_update;
};

struct TxProofV1 final
{
    /// public inputs the proof commits to
    std::string m_inputs;
    std::string m_proof;
};

////
// CryptoCapability
// - decrypts memos for the owner of a secret key, proves and verifies txs
///
class CryptoCapability
{
public:
//destructor
    virtual ~CryptoCapability() = default;

//overloaded operators
    /// disable copy/move (this is a pure virtual base class)
    CryptoCapability& operator=(CryptoCapability&&) = delete;

//member functions
    /// decrypt the memos of a run of txs; memos that don't belong to the owner are skipped
    virtual void decrypt(const epee::wipeable_string &secret_key,
        const std::vector<IndexedTxV1> &txs,
        DecryptionResultV1 &result_out) const = 0;
    /// prove a tx
    virtual TxProofV1 prove(const std::string &public_inputs, const std::string &secret_inputs) const = 0;
    /// verify a proof
    virtual bool verify(const TxProofV1 &proof) const = 0;
};

} //namespace zkpool
