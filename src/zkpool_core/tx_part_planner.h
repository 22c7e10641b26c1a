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

// Decompose a requested amount into a sequence of pool txs that each spend a bounded number of notes.


#pragma once

//local headers
#include "ledger_entry_types.h"
#include "zkpool_config.h"

//third party headers

//standard headers
#include <cstddef>
#include <vector>

//forward declarations


namespace zkpool
{

struct TxPlannerConfig final
{
    /// max notes a single tx can spend
    std::size_t m_max_inputs{config::ZKPOOL_MAX_INPUTS_PER_TX};
    /// smallest amount (plus fee) a tx may move
    amount_t m_min_tx_amount{config::ZKPOOL_DEFAULT_MIN_TX_AMOUNT};
};

////
// TxPartV1
// - one elementary tx of a multi-part transfer
///
struct TxPartV1 final
{
    /// amount delivered by this part (fee excluded)
    amount_t m_amount;
    amount_t m_fee;
    /// amount of the account balance this part may consume (only the first part draws on the account)
    amount_t m_account_limit;
};

inline bool operator==(const TxPartV1 &a, const TxPartV1 &b)
{
    return a.m_amount == b.m_amount && a.m_fee == b.m_fee && a.m_account_limit == b.m_account_limit;
}

/**
* brief: plan_tx_parts_v1 - split a target amount into tx parts
*   - the account balance contributes to the first part only
*   - notes are consumed in order, at most 'max_inputs' per part
*   - the final part is clamped so nothing is overpaid
*   - all-or-nothing: if the target can't be covered, no parts are returned
* param: target_amount - amount to deliver (fees excluded)
* param: fee_per_tx - fee charged by each part
* param: usable_notes - spendable notes in canonical spend order (ascending index)
* param: account_balance -
* param: config -
* return: ordered tx parts (empty if infeasible)
*/
std::vector<TxPartV1> plan_tx_parts_v1(const amount_t target_amount,
    const amount_t fee_per_tx,
    const std::vector<OwnedNoteV1> &usable_notes,
    const amount_t account_balance,
    const TxPlannerConfig &config);
/**
* brief: estimate_tx_part_count_v1 - upper-bound estimate of the parts needed to spend every note
* param: note_count -
* param: max_inputs -
* return: 1 + ceil(max(0, note_count - max_inputs) / max_inputs)
*/
std::size_t estimate_tx_part_count_v1(const std::size_t note_count, const std::size_t max_inputs);

} //namespace zkpool
