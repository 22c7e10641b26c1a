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

// The owner's tx history for one asset pool: confirmed records plus pending records that may still be dropped.


#pragma once

//local headers
#include "zkpool_core/ledger_entry_types.h"

//third party headers
#include <boost/thread/shared_mutex.hpp>

//standard headers
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

//forward declarations


namespace zkpool
{

enum class HistoryRecordType : unsigned char
{
    DEPOSIT,
    WITHDRAWAL,
    TRANSFER_IN,
    TRANSFER_OUT
};

struct HistoryRecordV1 final
{
    HistoryRecordType m_type;
    amount_t m_amount;
    amount_t m_fee;
    /// accepted by the relayer but not mined yet
    bool m_pending;
    std::string m_tx_hash;
    std::uint64_t m_index;
};

bool operator==(const HistoryRecordV1 &a, const HistoryRecordV1 &b);

/// deposits and incoming transfers add to the owner's balance
bool is_incoming(const HistoryRecordType type);

class HistoryLedger final
{
public:
//member functions
    /**
    * brief: append - add a record
    *   - a record at an index that is already known replaces the old one (a pending record is reaffirmed or
    *     becomes confirmed)
    *   - a confirmed record is never replaced by a pending record
    * param: record -
    */
    void append(const HistoryRecordV1 &record);
    /**
    * brief: mark_confirmed - flag the record at an index as mined
    * param: index -
    * return: true if a record exists at the index
    */
    bool mark_confirmed(const std::uint64_t index);
    /**
    * brief: trim_stale - drop pending records that the latest sync cycle didn't reaffirm
    *   - pending records at or below the cycle's max mined index were superseded by mined txs
    *   - pending records above the cycle's max pending index are gone from the relayer
    * param: max_mined_index - -1 if no mined txs were seen
    * param: max_pending_index - -1 if no pending txs were seen
    * return: number of records dropped
    */
    std::size_t trim_stale(const std::int64_t max_mined_index, const std::int64_t max_pending_index);
    /**
    * brief: optimistic_balance - balance including the effect of pending records
    * param: confirmed_balance -
    * return: confirmed + pending incoming - (pending outgoing + fees), floored at 0
    */
    amount_t optimistic_balance(const amount_t confirmed_balance) const;

    /// all records in index order
    std::vector<HistoryRecordV1> get_records() const;
    /// the latest 'n' records (index 0 is the most recent)
    std::vector<HistoryRecordV1> get_last_n(const std::size_t n) const;
    std::size_t size() const;
    void clear();

//member variables
private:
    /// protects the records
    mutable boost::shared_mutex m_history_mutex;

    /// [ index : record ]
    std::map<std::uint64_t, HistoryRecordV1> m_records;
};

} //namespace zkpool
