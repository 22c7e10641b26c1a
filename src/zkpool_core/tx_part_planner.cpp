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
#include "tx_part_planner.h"

//local headers
#include "ledger_entry_types.h"
#include "misc_log_ex.h"

//third party headers
#include "boost/multiprecision/cpp_int.hpp"

//standard headers
#include <algorithm>
#include <cstddef>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "zkpool"

namespace zkpool
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static boost::multiprecision::uint128_t sum_note_chunk(const std::vector<OwnedNoteV1> &usable_notes,
    const std::size_t chunk_begin,
    const std::size_t chunk_end)
{
    boost::multiprecision::uint128_t chunk_sum{0};

    for (std::size_t note_index{chunk_begin}; note_index < chunk_end; ++note_index)
        chunk_sum += usable_notes[note_index].m_amount;

    return chunk_sum;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
std::vector<TxPartV1> plan_tx_parts_v1(const amount_t target_amount,
    const amount_t fee_per_tx,
    const std::vector<OwnedNoteV1> &usable_notes,
    const amount_t account_balance,
    const TxPlannerConfig &config)
{
    CHECK_AND_ASSERT_THROW_MES(config.m_max_inputs > 0, "planning tx parts: max inputs must be positive.");

    // 1. the account alone covers the target
    if (boost::multiprecision::uint128_t{account_balance} >=
            boost::multiprecision::uint128_t{target_amount} + fee_per_tx)
        return {TxPartV1{target_amount, fee_per_tx, account_balance}};

    // 2. fill parts chunk by chunk
    std::vector<TxPartV1> tx_parts;
    boost::multiprecision::uint128_t remaining{target_amount};
    boost::multiprecision::uint128_t pool{account_balance};

    for (std::size_t chunk_begin{0};
        chunk_begin < usable_notes.size() && remaining > 0;
        chunk_begin += config.m_max_inputs)
    {
        const std::size_t chunk_end{std::min(chunk_begin + config.m_max_inputs, usable_notes.size())};
        pool += sum_note_chunk(usable_notes, chunk_begin, chunk_end);

        // a. don't overpay on the final part
        if (pool > remaining + fee_per_tx)
            pool = remaining + fee_per_tx;

        // b. the remaining notes can't fund another part
        if (pool < fee_per_tx ||
            pool < config.m_min_tx_amount)
            break;

        const amount_t part_amount{static_cast<amount_t>(pool - fee_per_tx)};
        tx_parts.emplace_back(TxPartV1{part_amount, fee_per_tx, tx_parts.empty() ? account_balance : 0});

        remaining -= part_amount;
        pool = 0;
    }

    // 3. all-or-nothing
    if (remaining > 0)
    {
        MDEBUG("Planning tx parts: " << remaining << " of " << target_amount << " could not be covered.");
        return {};
    }

    return tx_parts;
}
//-------------------------------------------------------------------------------------------------------------------
std::size_t estimate_tx_part_count_v1(const std::size_t note_count, const std::size_t max_inputs)
{
    CHECK_AND_ASSERT_THROW_MES(max_inputs > 0, "estimating tx part count: max inputs must be positive.");

    const std::size_t excess_notes{note_count > max_inputs ? note_count - max_inputs : 0};

    return 1 + (excess_notes + max_inputs - 1) / max_inputs;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace zkpool
