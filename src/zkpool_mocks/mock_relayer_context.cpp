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
#include "mock_relayer_context.h"

//local headers
#include "misc_log_ex.h"
#include "zkpool_core/ledger_entry_types.h"
#include "zkpool_core/ledger_entry_utils.h"
#include "zkpool_core/zkpool_config.h"
#include "zkpool_main/client_errors.h"
#include "zkpool_main/relayer_context.h"

//third party headers
#include <boost/optional/optional.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/shared_mutex.hpp>

//standard headers
#include <algorithm>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <sstream>
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
static std::string make_mock_hex_field(const char prefix, const std::uint64_t counter)
{
    std::ostringstream ss;
    ss << prefix << std::setfill('0') << std::setw(config::ZKPOOL_ENTRY_TX_HASH_HEX_SIZE - 1) << std::hex << counter;

    return ss.str();
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
void MockRelayerContext::fetch_transactions(const std::uint64_t offset,
    const std::uint64_t limit,
    std::vector<std::string> &raw_entries_out) const
{
    ++m_num_fetch_calls;

    std::function<void(std::uint64_t)> fetch_hook;
    {
        boost::shared_lock<boost::shared_mutex> lock{m_context_mutex};
        fetch_hook = m_fetch_hook;
    }

    if (fetch_hook)
        fetch_hook(offset);

    boost::shared_lock<boost::shared_mutex> lock{m_context_mutex};

    THROW_ZKPOOL_EXCEPTION_IF(m_failing_fetch_offset && *m_failing_fetch_offset == offset, error::network_error,
        "mock relayer");
    THROW_ZKPOOL_EXCEPTION_IF(offset % config::ZKPOOL_INDEX_STRIDE != 0, error::relayer_error, 400,
        "offset is not aligned to a tx");

    raw_entries_out.clear();

    const std::uint64_t first_entry{offset / config::ZKPOOL_INDEX_STRIDE};
    const std::uint64_t end_entry{std::min(first_entry + limit, num_log_entries_impl())};

    for (std::uint64_t entry_index{first_entry}; entry_index < end_entry; ++entry_index)
    {
        const bool mined{entry_index < m_mined_log.size()};
        const MockLogEntry &entry{
                mined ? m_mined_log[entry_index] : m_pending_log[entry_index - m_mined_log.size()]
            };

        raw_entries_out.emplace_back(make_raw_ledger_entry_v1(mined, entry.m_tx_hash, entry.m_commitment, entry.m_memo));
    }
}
//-------------------------------------------------------------------------------------------------------------------
RelayerInfoV1 MockRelayerContext::get_info() const
{
    ++m_num_info_calls;

    std::function<void()> info_hook;
    {
        boost::shared_lock<boost::shared_mutex> lock{m_context_mutex};
        info_hook = m_info_hook;
    }

    if (info_hook)
        info_hook();

    boost::shared_lock<boost::shared_mutex> lock{m_context_mutex};

    THROW_ZKPOOL_EXCEPTION_IF(m_fail_info, error::network_error, "mock relayer");

    // note: uint64{-1} if the mined log is empty
    return RelayerInfoV1{
            "root" + std::to_string(m_mined_log.size()),
            m_mined_log.size() * config::ZKPOOL_INDEX_STRIDE - 1
        };
}
//-------------------------------------------------------------------------------------------------------------------
std::string MockRelayerContext::send_transactions(const std::vector<RelayerTxRequestV1> &txs)
{
    boost::unique_lock<boost::shared_mutex> lock{m_context_mutex};

    THROW_ZKPOOL_EXCEPTION_IF(txs.empty(), error::relayer_error, 400, "no txs");

    RelayerJobV1 job{RelayerJobState::COMPLETED, {}, ""};

    for (const RelayerTxRequestV1 &tx : txs)
    {
        THROW_ZKPOOL_EXCEPTION_IF(tx.m_proof.m_proof.empty(), error::relayer_error, 400, "missing proof");
        THROW_ZKPOOL_EXCEPTION_IF(tx.m_kind == TxKind::DEPOSIT && !tx.m_deposit_signature,
            error::relayer_error, 400, "missing deposit signature");

        m_submitted_txs.emplace_back(tx);

        if (m_job_behavior == MockJobBehavior::COMPLETE_PENDING ||
            m_job_behavior == MockJobBehavior::COMPLETE_MINED)
        {
            MockLogEntry entry{make_log_entry_impl(tx.m_memo)};
            job.m_tx_hashes.emplace_back(entry.m_tx_hash);

            if (m_job_behavior == MockJobBehavior::COMPLETE_MINED)
            {
                THROW_ZKPOOL_EXCEPTION_IF(!m_pending_log.empty(), error::internal_error,
                    "mock relayer: can't mine a tx ahead of pending txs");
                m_mined_log.emplace_back(std::move(entry));
            }
            else
                m_pending_log.emplace_back(std::move(entry));
        }
    }

    if (m_job_behavior == MockJobBehavior::FAIL)
    {
        job.m_state = RelayerJobState::FAILED;
        job.m_failure_reason = "mock relayer rejected the txs";
    }

    const std::string job_id{"job" + std::to_string(++m_job_counter)};

    if (m_job_behavior != MockJobBehavior::LOSE)
        m_jobs[job_id] = std::make_pair(std::move(job), m_job_pending_polls);

    return job_id;
}
//-------------------------------------------------------------------------------------------------------------------
boost::optional<RelayerJobV1> MockRelayerContext::try_get_job(const std::string &job_id) const
{
    ++m_num_job_polls;

    boost::unique_lock<boost::shared_mutex> lock{m_context_mutex};

    auto job = m_jobs.find(job_id);
    if (job == m_jobs.end())
        return boost::none;

    if (job->second.second > 0)
    {
        --job->second.second;
        return RelayerJobV1{RelayerJobState::PENDING, {}, ""};
    }

    return job->second.first;
}
//-------------------------------------------------------------------------------------------------------------------
std::uint64_t MockRelayerContext::add_mined_tx(const std::string &memo)
{
    boost::unique_lock<boost::shared_mutex> lock{m_context_mutex};

    CHECK_AND_ASSERT_THROW_MES(m_pending_log.empty(), "mock relayer: can't mine a tx ahead of pending txs.");

    m_mined_log.emplace_back(make_log_entry_impl(memo));

    return (m_mined_log.size() - 1) * config::ZKPOOL_INDEX_STRIDE;
}
//-------------------------------------------------------------------------------------------------------------------
std::uint64_t MockRelayerContext::add_pending_tx(const std::string &memo)
{
    boost::unique_lock<boost::shared_mutex> lock{m_context_mutex};

    m_pending_log.emplace_back(make_log_entry_impl(memo));

    return (num_log_entries_impl() - 1) * config::ZKPOOL_INDEX_STRIDE;
}
//-------------------------------------------------------------------------------------------------------------------
void MockRelayerContext::mine_pending_txs()
{
    boost::unique_lock<boost::shared_mutex> lock{m_context_mutex};

    m_mined_log.insert(m_mined_log.end(), m_pending_log.begin(), m_pending_log.end());
    m_pending_log.clear();
}
//-------------------------------------------------------------------------------------------------------------------
void MockRelayerContext::drop_pending_txs()
{
    boost::unique_lock<boost::shared_mutex> lock{m_context_mutex};

    m_pending_log.clear();
}
//-------------------------------------------------------------------------------------------------------------------
std::uint64_t MockRelayerContext::num_mined_txs() const
{
    boost::shared_lock<boost::shared_mutex> lock{m_context_mutex};

    return m_mined_log.size();
}
//-------------------------------------------------------------------------------------------------------------------
std::uint64_t MockRelayerContext::num_pending_txs() const
{
    boost::shared_lock<boost::shared_mutex> lock{m_context_mutex};

    return m_pending_log.size();
}
//-------------------------------------------------------------------------------------------------------------------
void MockRelayerContext::set_fetch_failure(const boost::optional<std::uint64_t> failing_offset)
{
    boost::unique_lock<boost::shared_mutex> lock{m_context_mutex};

    m_failing_fetch_offset = failing_offset;
}
//-------------------------------------------------------------------------------------------------------------------
void MockRelayerContext::set_info_failure(const bool fail_info)
{
    boost::unique_lock<boost::shared_mutex> lock{m_context_mutex};

    m_fail_info = fail_info;
}
//-------------------------------------------------------------------------------------------------------------------
void MockRelayerContext::set_fetch_hook(std::function<void(std::uint64_t)> fetch_hook)
{
    boost::unique_lock<boost::shared_mutex> lock{m_context_mutex};

    m_fetch_hook = std::move(fetch_hook);
}
//-------------------------------------------------------------------------------------------------------------------
void MockRelayerContext::set_info_hook(std::function<void()> info_hook)
{
    boost::unique_lock<boost::shared_mutex> lock{m_context_mutex};

    m_info_hook = std::move(info_hook);
}
//-------------------------------------------------------------------------------------------------------------------
void MockRelayerContext::set_job_behavior(const MockJobBehavior behavior, const std::size_t pending_polls)
{
    boost::unique_lock<boost::shared_mutex> lock{m_context_mutex};

    m_job_behavior      = behavior;
    m_job_pending_polls = pending_polls;
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<RelayerTxRequestV1> MockRelayerContext::submitted_txs() const
{
    boost::shared_lock<boost::shared_mutex> lock{m_context_mutex};

    return m_submitted_txs;
}
//-------------------------------------------------------------------------------------------------------------------
MockRelayerContext::MockLogEntry MockRelayerContext::make_log_entry_impl(const std::string &memo)
{
    ++m_tx_counter;

    return MockLogEntry{make_mock_hex_field('a', m_tx_counter), make_mock_hex_field('c', m_tx_counter), memo};
}
//-------------------------------------------------------------------------------------------------------------------
std::uint64_t MockRelayerContext::num_log_entries_impl() const
{
    return m_mined_log.size() + m_pending_log.size();
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace mocks
} //namespace zkpool
