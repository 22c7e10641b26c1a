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

// Dependency injector for building the data of account txs.


#pragma once

//local headers
#include "zkpool_core/ledger_entry_types.h"

//third party headers

//standard headers
#include <string>
#include <vector>

//forward declarations


namespace zkpool
{

struct TransferOutputV1 final
{
    /// shielded address
    std::string m_to;
    amount_t m_amount;
};

////
// TxPartInputsV1
// - what a single tx part may spend
///
struct TxPartInputsV1 final
{
    /// max amount taken from the account
    amount_t m_account_limit;
    std::vector<OwnedNoteV1> m_notes;
};

////
// TxDataV1
// - unproven tx: proof inputs plus the data the relayer needs
///
struct TxDataV1 final
{
    TxKind m_kind;
    std::string m_public_inputs;
    std::string m_secret_inputs;
    /// encrypted memo (binary)
    std::string m_memo;
    /// nullifier of the spent account (hex), signed by the depositor for deposits
    std::string m_nullifier;
};

////
// TxDataBuilder
// - builds txs for the owner's account
///
class TxDataBuilder
{
public:
//destructor
    virtual ~TxDataBuilder() = default;

//overloaded operators
    /// disable copy/move (this is a pure virtual base class)
    TxDataBuilder& operator=(TxDataBuilder&&) = delete;

//member functions
    virtual TxDataV1 make_deposit(const amount_t amount, const amount_t fee) const = 0;
    virtual TxDataV1 make_transfer(const std::vector<TransferOutputV1> &outputs,
        const TxPartInputsV1 &inputs,
        const amount_t fee) const = 0;
    /// to_address: native ledger address (hex)
    virtual TxDataV1 make_withdraw(const std::string &to_address,
        const amount_t amount,
        const TxPartInputsV1 &inputs,
        const amount_t fee) const = 0;
};

} //namespace zkpool
