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
#include "crypto_capability_mock.h"

//local headers
#include "misc_log_ex.h"
#include "wipeable_string.h"
#include "zkpool_core/ledger_entry_types.h"
#include "zkpool_core/zkpool_config.h"
#include "zkpool_main/crypto_capability.h"

//third party headers
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/functional/hash.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/optional/optional.hpp>

//standard headers
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "zkpool.mocks"

namespace zkpool
{
namespace mocks
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static std::string tx_kind_to_string(const TxKind kind)
{
    switch (kind)
    {
        case TxKind::DEPOSIT:  return "deposit";
        case TxKind::TRANSFER: return "transfer";
        case TxKind::WITHDRAW: return "withdraw";
        default:               return "unknown";
    }
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static TxKind tx_kind_from_string(const std::string &kind)
{
    if (kind == "deposit")
        return TxKind::DEPOSIT;
    if (kind == "transfer")
        return TxKind::TRANSFER;

    CHECK_AND_ASSERT_THROW_MES(kind == "withdraw", "mock memo: unknown tx kind '" << kind << "'.");
    return TxKind::WITHDRAW;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static bool try_decrypt_section(const std::string &owner_tag,
    const IndexedTxV1 &tx,
    DecryptedMemoV1 &memo_out,
    boost::optional<AccountUpdateV1> &account_out)
{
    std::vector<std::string> sections;
    boost::split(sections, tx.m_memo, boost::is_any_of("#"));

    for (const std::string &section : sections)
    {
        std::vector<std::string> fields;
        boost::split(fields, section, boost::is_any_of(";"));

        if (fields.empty() || fields[0] != owner_tag)
            continue;

        CHECK_AND_ASSERT_THROW_MES(fields.size() == 8, "mock memo: malformed section at index " << tx.m_index << ".");

        memo_out = DecryptedMemoV1{};
        memo_out.m_index           = tx.m_index;
        memo_out.m_kind            = tx_kind_from_string(fields[1]);
        memo_out.m_account_present = fields[2] == "1";
        memo_out.m_amount          = boost::lexical_cast<amount_t>(fields[3]);
        memo_out.m_fee             = boost::lexical_cast<amount_t>(fields[4]);

        account_out = boost::none;
        if (memo_out.m_account_present)
        {
            memo_out.m_account_balance = boost::lexical_cast<amount_t>(fields[5]);
            account_out = AccountUpdateV1{
                    *memo_out.m_account_balance,
                    boost::lexical_cast<std::uint64_t>(fields[6])
                };
        }

        if (!fields[7].empty())
        {
            std::vector<std::string> notes;
            boost::split(notes, fields[7], boost::is_any_of(","));

            for (const std::string &note : notes)
            {
                std::vector<std::string> note_fields;
                boost::split(note_fields, note, boost::is_any_of(":"));
                CHECK_AND_ASSERT_THROW_MES(note_fields.size() == 2, "mock memo: malformed note.");

                const std::uint64_t slot{boost::lexical_cast<std::uint64_t>(note_fields[0])};
                CHECK_AND_ASSERT_THROW_MES(slot >= 1 && slot <= config::ZKPOOL_OUTPUTS_PER_TX,
                    "mock memo: note slot out of range.");

                memo_out.m_owned_notes.emplace_back(
                        OwnedNoteV1{
                                tx.m_index + slot,
                                boost::lexical_cast<amount_t>(note_fields[1]),
                                tx.m_commitment + ":" + note_fields[0]
                            }
                    );
            }
        }

        return true;
    }

    return false;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
std::string mock_owner_tag(const epee::wipeable_string &secret_key)
{
    return "owner" + std::to_string(boost::hash_range(secret_key.data(), secret_key.data() + secret_key.size()));
}
//-------------------------------------------------------------------------------------------------------------------
std::string make_mock_memo(const std::vector<MockMemoSectionV1> &sections)
{
    std::vector<std::string> encoded_sections;

    for (const MockMemoSectionV1 &section : sections)
    {
        std::vector<std::string> notes;
        for (const auto &note : section.m_notes)
            notes.emplace_back(std::to_string(note.first) + ":" + std::to_string(note.second));

        encoded_sections.emplace_back(
                section.m_owner_tag + ";" +
                tx_kind_to_string(section.m_kind) + ";" +
                (section.m_account_present ? "1" : "0") + ";" +
                std::to_string(section.m_amount) + ";" +
                std::to_string(section.m_fee) + ";" +
                std::to_string(section.m_account_balance) + ";" +
                std::to_string(section.m_spent_note_watermark) + ";" +
                boost::algorithm::join(notes, ",")
            );
    }

    return boost::algorithm::join(encoded_sections, "#");
}
//-------------------------------------------------------------------------------------------------------------------
void CryptoCapabilityMock::decrypt(const epee::wipeable_string &secret_key,
    const std::vector<IndexedTxV1> &txs,
    DecryptionResultV1 &result_out) const
{
    ++m_num_decrypt_calls;

    result_out = DecryptionResultV1{};
    result_out.m_state_update.m_next_index = 0;

    const std::string owner_tag{mock_owner_tag(secret_key)};
    DecryptedMemoV1 memo;
    boost::optional<AccountUpdateV1> account;

    for (const IndexedTxV1 &tx : txs)
    {
        result_out.m_state_update.m_next_index = tx.m_index + config::ZKPOOL_INDEX_STRIDE;

        if (!try_decrypt_section(owner_tag, tx, memo, account))
            continue;

        // the latest account wins
        if (account)
            result_out.m_state_update.m_new_account = account;

        result_out.m_state_update.m_new_notes.insert(result_out.m_state_update.m_new_notes.end(),
            memo.m_owned_notes.begin(),
            memo.m_owned_notes.end());
        result_out.m_memos.emplace_back(std::move(memo));
    }
}
//-------------------------------------------------------------------------------------------------------------------
TxProofV1 CryptoCapabilityMock::prove(const std::string &public_inputs, const std::string &secret_inputs) const
{
    if (m_produce_invalid_proofs.load())
        return TxProofV1{public_inputs, "invalid"};

    return TxProofV1{public_inputs, "valid:" + public_inputs + "|" + std::to_string(secret_inputs.size())};
}
//-------------------------------------------------------------------------------------------------------------------
bool CryptoCapabilityMock::verify(const TxProofV1 &proof) const
{
    const std::string expected_prefix{"valid:" + proof.m_inputs + "|"};

    return proof.m_proof.compare(0, expected_prefix.size(), expected_prefix) == 0;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace mocks
} //namespace zkpool
