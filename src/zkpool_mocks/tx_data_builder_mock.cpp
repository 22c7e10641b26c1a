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
#include "tx_data_builder_mock.h"

//local headers
#include "crypto_capability_mock.h"
#include "misc_log_ex.h"
#include "string_tools.h"
#include "zkpool_core/ledger_entry_types.h"
#include "zkpool_core/zkpool_config.h"
#include "zkpool_main/account_state.h"
#include "zkpool_main/tx_data_builder.h"

//third party headers
#include <boost/functional/hash.hpp>

//standard headers
#include <cstddef>
#include <cstdint>
#include <map>
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
static amount_t spendable_amount(const TxPartInputsV1 &inputs)
{
    amount_t spendable{inputs.m_account_limit};

    for (const OwnedNoteV1 &note : inputs.m_notes)
        spendable += note.m_amount;

    return spendable;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static std::uint64_t spent_note_watermark(const TxPartInputsV1 &inputs)
{
    return inputs.m_notes.empty() ? 0 : inputs.m_notes.back().m_index + 1;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static std::string secret_inputs_for(const TxPartInputsV1 &inputs)
{
    std::string secret_inputs{"account:" + std::to_string(inputs.m_account_limit)};

    for (const OwnedNoteV1 &note : inputs.m_notes)
        secret_inputs += ";note:" + note.m_payload;

    return secret_inputs;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static std::string mock_nullifier(const std::string &public_inputs)
{
    const std::size_t nullifier_seed{boost::hash_value(public_inputs)};

    return epee::string_tools::pad_string(std::to_string(nullifier_seed), 64, '0', true);
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
TxDataBuilderMock::TxDataBuilderMock(const epee::wipeable_string &secret_key, const AccountState &account_state) :
    m_secret_key{secret_key},
    m_account_state{account_state}
{}
//-------------------------------------------------------------------------------------------------------------------
TxDataV1 TxDataBuilderMock::make_deposit(const amount_t amount, const amount_t fee) const
{
    const std::string owner_tag{mock_owner_tag(m_secret_key)};

    MockMemoSectionV1 section{owner_tag, TxKind::DEPOSIT, true, amount, fee, 0, 0, {}};
    section.m_account_balance = m_account_state.account_balance() + amount;

    TxDataV1 tx_data;
    tx_data.m_kind          = TxKind::DEPOSIT;
    tx_data.m_public_inputs = "deposit;" + owner_tag + ";" + std::to_string(amount) + ";" + std::to_string(fee);
    tx_data.m_secret_inputs = "account:" + std::to_string(m_account_state.account_balance());
    tx_data.m_memo          = make_mock_memo({section});
    tx_data.m_nullifier     = mock_nullifier(tx_data.m_public_inputs);

    return tx_data;
}
//-------------------------------------------------------------------------------------------------------------------
TxDataV1 TxDataBuilderMock::make_transfer(const std::vector<TransferOutputV1> &outputs,
    const TxPartInputsV1 &inputs,
    const amount_t fee) const
{
    CHECK_AND_ASSERT_THROW_MES(!outputs.empty(), "mock transfer: no outputs.");
    CHECK_AND_ASSERT_THROW_MES(outputs.size() <= config::ZKPOOL_OUTPUTS_PER_TX, "mock transfer: too many outputs.");

    const std::string owner_tag{mock_owner_tag(m_secret_key)};

    // 1. sender section, recipient sections
    MockMemoSectionV1 sender_section{owner_tag, TxKind::TRANSFER, true, 0, fee, 0, spent_note_watermark(inputs), {}};
    std::map<std::string, MockMemoSectionV1> recipient_sections;
    std::string public_inputs{"transfer;" + owner_tag + ";" + std::to_string(fee)};

    for (std::size_t output_index{0}; output_index < outputs.size(); ++output_index)
    {
        const TransferOutputV1 &output{outputs[output_index]};
        const std::uint64_t slot{output_index + 1};

        sender_section.m_amount += output.m_amount;
        public_inputs += ";" + output.m_to + ":" + std::to_string(output.m_amount);

        if (output.m_to == owner_tag)
        {
            sender_section.m_notes.emplace_back(slot, output.m_amount);
            continue;
        }

        auto inserted = recipient_sections.emplace(output.m_to,
                MockMemoSectionV1{output.m_to, TxKind::TRANSFER, false, 0, 0, 0, 0, {}}
            );
        inserted.first->second.m_amount += output.m_amount;
        inserted.first->second.m_notes.emplace_back(slot, output.m_amount);
    }

    // 2. the account keeps the change
    const amount_t spendable{spendable_amount(inputs)};
    CHECK_AND_ASSERT_THROW_MES(spendable >= sender_section.m_amount + fee, "mock transfer: inputs don't cover outputs.");
    sender_section.m_account_balance = spendable - sender_section.m_amount - fee;

    std::vector<MockMemoSectionV1> sections{sender_section};
    for (const auto &recipient_section : recipient_sections)
        sections.emplace_back(recipient_section.second);

    TxDataV1 tx_data;
    tx_data.m_kind          = TxKind::TRANSFER;
    tx_data.m_public_inputs = std::move(public_inputs);
    tx_data.m_secret_inputs = secret_inputs_for(inputs);
    tx_data.m_memo          = make_mock_memo(sections);
    tx_data.m_nullifier     = mock_nullifier(tx_data.m_public_inputs);

    return tx_data;
}
//-------------------------------------------------------------------------------------------------------------------
TxDataV1 TxDataBuilderMock::make_withdraw(const std::string &to_address,
    const amount_t amount,
    const TxPartInputsV1 &inputs,
    const amount_t fee) const
{
    const std::string owner_tag{mock_owner_tag(m_secret_key)};

    const amount_t spendable{spendable_amount(inputs)};
    CHECK_AND_ASSERT_THROW_MES(spendable >= amount + fee, "mock withdraw: inputs don't cover the amount.");

    const MockMemoSectionV1 section{owner_tag,
        TxKind::WITHDRAW,
        true,
        amount,
        fee,
        spendable - amount - fee,
        spent_note_watermark(inputs),
        {}};

    TxDataV1 tx_data;
    tx_data.m_kind          = TxKind::WITHDRAW;
    tx_data.m_public_inputs =
        "withdraw;" + owner_tag + ";" + to_address + ";" + std::to_string(amount) + ";" + std::to_string(fee);
    tx_data.m_secret_inputs = secret_inputs_for(inputs);
    tx_data.m_memo          = make_mock_memo({section});
    tx_data.m_nullifier     = mock_nullifier(tx_data.m_public_inputs);

    return tx_data;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace mocks
} //namespace zkpool
