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

// Fee and transfer-limit estimates for the owner's account, derived from the tx part planner.


#pragma once

//local headers
#include "zkpool_core/ledger_entry_types.h"
#include "zkpool_core/tx_part_planner.h"

//third party headers

//standard headers
#include <cstddef>
#include <vector>

//forward declarations
namespace zkpool { class AccountState; }


namespace zkpool
{

struct FeeEstimateV1 final
{
    amount_t m_total;
    amount_t m_per_tx;
    std::size_t m_part_count;
};

////
// FeeEstimator
// - reads the account state as of the last completed sync (callers sync first)
///
class FeeEstimator final
{
public:
//constructors
    FeeEstimator(const AccountState &account_state,
        const amount_t fee_per_tx,
        const TxPlannerConfig &planner_config);

//overloaded operators
    /// disable copy/move (references are held)
    FeeEstimator& operator=(FeeEstimator&&) = delete;

//member functions
    amount_t fee_per_tx() const { return m_fee_per_tx; }
    const TxPlannerConfig& planner_config() const { return m_planner_config; }

    /**
    * brief: get_transaction_parts - plan the parts of a transfer/withdrawal against the current state
    * param: amount - amount to deliver (fees excluded)
    * return: ordered tx parts (empty if the account can't cover the amount)
    */
    std::vector<TxPartV1> get_transaction_parts(const amount_t amount) const;
    /**
    * brief: fee_estimate - total fee for moving an amount
    *   - deposits are a single tx
    *   - transfers and withdrawals are planned (simulated) against the current state
    *   - throws error::insufficient_funds if the plan is infeasible
    * param: amount -
    * param: kind -
    * return: total fee, fee per tx, number of txs
    */
    FeeEstimateV1 fee_estimate(const amount_t amount, const TxKind kind) const;
    /**
    * brief: calc_max_available_transfer - the largest amount the account can send (after fees)
    * return: max(0, balance + notes - fee_per_tx * estimated part count)
    */
    amount_t calc_max_available_transfer() const;

//member variables
private:
    const AccountState &m_account_state;
    const amount_t m_fee_per_tx;
    const TxPlannerConfig m_planner_config;
};

} //namespace zkpool
