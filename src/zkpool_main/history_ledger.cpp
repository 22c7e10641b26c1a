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
#include "history_ledger.h"

//local headers
#include "misc_log_ex.h"
#include "zkpool_core/ledger_entry_types.h"

//third party headers
#include <boost/multiprecision/cpp_int.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/shared_mutex.hpp>

//standard headers
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "zkpool.sync"

namespace zkpool
{
//-------------------------------------------------------------------------------------------------------------------
bool operator==(const HistoryRecordV1 &a, const HistoryRecordV1 &b)
{
    return a.m_type == b.m_type &&
        a.m_amount  == b.m_amount &&
        a.m_fee     == b.m_fee &&
        a.m_pending == b.m_pending &&
        a.m_tx_hash == b.m_tx_hash &&
        a.m_index   == b.m_index;
}
//-------------------------------------------------------------------------------------------------------------------
bool is_incoming(const HistoryRecordType type)
{
    return type == HistoryRecordType::DEPOSIT || type == HistoryRecordType::TRANSFER_IN;
}
//-------------------------------------------------------------------------------------------------------------------
void HistoryLedger::append(const HistoryRecordV1 &record)
{
    boost::unique_lock<boost::shared_mutex> lock{m_history_mutex};

    auto existing_record = m_records.find(record.m_index);

    if (existing_record == m_records.end())
    {
        m_records.emplace(record.m_index, record);
        return;
    }

    if (!existing_record->second.m_pending && record.m_pending)
    {
        MWARNING("History ledger: ignoring pending record at index " << record.m_index
            << " (a confirmed record exists).");
        return;
    }

    existing_record->second = record;
}
//-------------------------------------------------------------------------------------------------------------------
bool HistoryLedger::mark_confirmed(const std::uint64_t index)
{
    boost::unique_lock<boost::shared_mutex> lock{m_history_mutex};

    auto record = m_records.find(index);
    if (record == m_records.end())
        return false;

    record->second.m_pending = false;
    return true;
}
//-------------------------------------------------------------------------------------------------------------------
std::size_t HistoryLedger::trim_stale(const std::int64_t max_mined_index, const std::int64_t max_pending_index)
{
    boost::unique_lock<boost::shared_mutex> lock{m_history_mutex};

    std::size_t num_dropped{0};

    for (auto record_it = m_records.begin(); record_it != m_records.end();)
    {
        const std::int64_t index{static_cast<std::int64_t>(record_it->first)};

        if (record_it->second.m_pending &&
            (index <= max_mined_index || index > max_pending_index))
        {
            MDEBUG("History ledger: dropping stale pending record at index " << index << ".");
            record_it = m_records.erase(record_it);
            ++num_dropped;
        }
        else
            ++record_it;
    }

    return num_dropped;
}
//-------------------------------------------------------------------------------------------------------------------
amount_t HistoryLedger::optimistic_balance(const amount_t confirmed_balance) const
{
    boost::shared_lock<boost::shared_mutex> lock{m_history_mutex};

    boost::multiprecision::int128_t balance{confirmed_balance};

    for (const auto &record : m_records)
    {
        if (!record.second.m_pending)
            continue;

        if (is_incoming(record.second.m_type))
            balance += record.second.m_amount;
        else
        {
            balance -= record.second.m_amount;
            balance -= record.second.m_fee;
        }
    }

    if (balance < 0)
        return 0;

    return static_cast<amount_t>(balance);
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<HistoryRecordV1> HistoryLedger::get_records() const
{
    boost::shared_lock<boost::shared_mutex> lock{m_history_mutex};

    std::vector<HistoryRecordV1> records;
    records.reserve(m_records.size());

    for (const auto &record : m_records)
        records.emplace_back(record.second);

    return records;
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<HistoryRecordV1> HistoryLedger::get_last_n(const std::size_t n) const
{
    boost::shared_lock<boost::shared_mutex> lock{m_history_mutex};

    std::vector<HistoryRecordV1> last_records;
    last_records.reserve(std::min(n, m_records.size()));

    for (auto record_it = m_records.rbegin(); record_it != m_records.rend() && last_records.size() < n; ++record_it)
        last_records.emplace_back(record_it->second);

    return last_records;
}
//-------------------------------------------------------------------------------------------------------------------
std::size_t HistoryLedger::size() const
{
    boost::shared_lock<boost::shared_mutex> lock{m_history_mutex};

    return m_records.size();
}
//-------------------------------------------------------------------------------------------------------------------
void HistoryLedger::clear()
{
    boost::unique_lock<boost::shared_mutex> lock{m_history_mutex};

    m_records.clear();
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace zkpool
