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

// Deterministic crypto capability for tests: memos are plain-text sections tagged with their owner.


#pragma once

//local headers
#include "wipeable_string.h"
#include "zkpool_core/ledger_entry_types.h"
#include "zkpool_main/crypto_capability.h"

//third party headers

//standard headers
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

//forward declarations


namespace zkpool
{
namespace mocks
{

////
// MockMemoSectionV1
// - the part of a mock memo readable by one owner
// - memo layout: sections joined by '#', each 'tag;kind;account;amount;fee;balance;watermark;slot:amount,...'
///
struct MockMemoSectionV1 final
{
    /// see mock_owner_tag()
    std::string m_owner_tag;
    TxKind m_kind;
    bool m_account_present;
    amount_t m_amount;
    amount_t m_fee;
    /// ignored unless the account is present
    amount_t m_account_balance;
    std::uint64_t m_spent_note_watermark;
    /// {output slot in [1, outputs per tx], amount}
    std::vector<std::pair<std::uint64_t, amount_t>> m_notes;
};

/// public tag of a mock key (also serves as the owner's shielded address)
std::string mock_owner_tag(const epee::wipeable_string &secret_key);
/// encode a memo
std::string make_mock_memo(const std::vector<MockMemoSectionV1> &sections);

class CryptoCapabilityMock final : public CryptoCapability
{
public:
//member functions
    void decrypt(const epee::wipeable_string &secret_key,
        const std::vector<IndexedTxV1> &txs,
        DecryptionResultV1 &result_out) const override;
    /// proof: 'valid:<public inputs>' (or garbage if invalid proofs were requested)
    TxProofV1 prove(const std::string &public_inputs, const std::string &secret_inputs) const override;
    bool verify(const TxProofV1 &proof) const override;

    /// make prove() return proofs that fail verification
    void set_produce_invalid_proofs(const bool produce_invalid_proofs) { m_produce_invalid_proofs = produce_invalid_proofs; }
    std::size_t num_decrypt_calls() const { return m_num_decrypt_calls.load(); }

//member variables
private:
    std::atomic<bool> m_produce_invalid_proofs{false};
    mutable std::atomic<std::size_t> m_num_decrypt_calls{0};
};

} //namespace mocks
} //namespace zkpool
