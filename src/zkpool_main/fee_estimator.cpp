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
#include "fee_estimator.h"

//local headers
#include "account_state.h"
#include "client_errors.h"
#include "misc_log_ex.h"
#include "zkpool_core/ledger_entry_types.h"
#include "zkpool_core/tx_part_planner.h"

//third party headers
#include "boost/multiprecision/cpp_int.hpp"

//standard headers
#include <cstddef>
#include <limits>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "zkpool"

namespace zkpool
{
//-------------------------------------------------------------------------------------------------------------------
FeeEstimator::FeeEstimator(const AccountState &account_state,
    const amount_t fee_per_tx,
    const TxPlannerConfig &planner_config) :
        m_account_state{account_state},
        m_fee_per_tx{fee_per_tx},
        m_planner_config{planner_config}
{}
//-------------------------------------------------------------------------------------------------------------------
std::vector<TxPartV1> FeeEstimator::get_transaction_parts(const amount_t amount) const
{
    AccountSnapshotV1 snapshot;
    m_account_state.get_snapshot(snapshot);

    return plan_tx_parts_v1(amount,
        m_fee_per_tx,
        snapshot.m_usable_notes,
        snapshot.m_account_balance,
        m_planner_config);
}
//-------------------------------------------------------------------------------------------------------------------
FeeEstimateV1 FeeEstimator::fee_estimate(const amount_t amount, const TxKind kind) const
{
    if (kind == TxKind::DEPOSIT)
        return FeeEstimateV1{m_fee_per_tx, m_fee_per_tx, 1};

    const std::vector<TxPartV1> tx_parts{this->get_transaction_parts(amount)};

    THROW_ZKPOOL_EXCEPTION_IF(tx_parts.empty(), error::insufficient_funds,
        amount + m_fee_per_tx,
        m_account_state.total_balance());

    return FeeEstimateV1{m_fee_per_tx * tx_parts.size(), m_fee_per_tx, tx_parts.size()};
}
//-------------------------------------------------------------------------------------------------------------------
amount_t FeeEstimator::calc_max_available_transfer() const
{
    AccountSnapshotV1 snapshot;
    m_account_state.get_snapshot(snapshot);

    boost::multiprecision::uint128_t available{snapshot.m_account_balance};
    for (const OwnedNoteV1 &note : snapshot.m_usable_notes)
        available += note.m_amount;

    const boost::multiprecision::uint128_t total_fee{
            boost::multiprecision::uint128_t{m_fee_per_tx} *
                estimate_tx_part_count_v1(snapshot.m_usable_notes.size(), m_planner_config.m_max_inputs)
        };

    if (available <= total_fee)
        return 0;
    if (available - total_fee > std::numeric_limits<amount_t>::max())
        return std::numeric_limits<amount_t>::max();

    return static_cast<amount_t>(available - total_fee);
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace zkpool
