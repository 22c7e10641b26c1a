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

// Tx data builder for tests: produces mock memos readable by CryptoCapabilityMock.


#pragma once

//local headers
#include "wipeable_string.h"
#include "zkpool_core/ledger_entry_types.h"
#include "zkpool_main/tx_data_builder.h"

//third party headers

//standard headers
#include <string>
#include <vector>

//forward declarations
namespace zkpool { class AccountState; }


namespace zkpool
{
namespace mocks
{

////
// TxDataBuilderMock
// - shielded addresses are mock owner tags
// - the account balance after a tx is 'account limit + spent notes - outputs - fee'
///
class TxDataBuilderMock final : public TxDataBuilder
{
public:
//constructors
    /// the referenced objects must outlive the builder
    TxDataBuilderMock(const epee::wipeable_string &secret_key, const AccountState &account_state);

//member functions
    TxDataV1 make_deposit(const amount_t amount, const amount_t fee) const override;
    TxDataV1 make_transfer(const std::vector<TransferOutputV1> &outputs,
        const TxPartInputsV1 &inputs,
        const amount_t fee) const override;
    TxDataV1 make_withdraw(const std::string &to_address,
        const amount_t amount,
        const TxPartInputsV1 &inputs,
        const amount_t fee) const override;

//member variables
private:
    const epee::wipeable_string &m_secret_key;
    const AccountState &m_account_state;
};

} //namespace mocks
} //namespace zkpool
