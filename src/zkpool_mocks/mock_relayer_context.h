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

// Mock relayer: an in-memory commitment log with tx submission, for testing.
// note: submitted txs aren't validated (aside from their proofs being present)


#pragma once

//local headers
#include "zkpool_core/ledger_entry_types.h"
#include "zkpool_main/relayer_context.h"

//third party headers
#include <boost/optional/optional.hpp>
#include <boost/thread/shared_mutex.hpp>

//standard headers
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

//forward declarations


namespace zkpool
{
namespace mocks
{

/// what the mock does with submitted jobs
enum class MockJobBehavior : unsigned char
{
    /// append the txs to the pending log, then report completion
    COMPLETE_PENDING,
    /// append the txs to the mined log, then report completion
    COMPLETE_MINED,
    /// report failure
    FAIL,
    /// forget the job
    LOSE
};

class MockRelayerContext final : public RelayerContext
{
    struct MockLogEntry final
    {
        std::string m_tx_hash;
        std::string m_commitment;
        std::string m_memo;
    };

public:
//member functions
    /// RelayerContext
    void fetch_transactions(const std::uint64_t offset,
        const std::uint64_t limit,
        std::vector<std::string> &raw_entries_out) const override;
    RelayerInfoV1 get_info() const override;
    std::string send_transactions(const std::vector<RelayerTxRequestV1> &txs) override;
    boost::optional<RelayerJobV1> try_get_job(const std::string &job_id) const override;

    /**
    * brief: add_mined_tx - append a tx to the mined log
    *   - WARNING: the mined log must stay in front of the pending log, so this fails if there are pending txs
    * param: memo - binary memo
    * return: log index of the new tx
    */
    std::uint64_t add_mined_tx(const std::string &memo);
    /**
    * brief: add_pending_tx - append a tx to the pending log
    * param: memo - binary memo
    * return: log index of the new tx
    */
    std::uint64_t add_pending_tx(const std::string &memo);
    /// move every pending tx to the mined log (indices are unchanged)
    void mine_pending_txs();
    /// forget every pending tx (e.g. the relayer's txs were rejected by the ledger)
    void drop_pending_txs();

    std::uint64_t num_mined_txs() const;
    std::uint64_t num_pending_txs() const;

    /// fetches at this log index throw a network error
    void set_fetch_failure(const boost::optional<std::uint64_t> failing_offset);
    /// get_info() throws a network error
    void set_info_failure(const bool fail_info);
    /// called at the start of each fetch (outside the context lock)
    void set_fetch_hook(std::function<void(std::uint64_t)> fetch_hook);
    /// called at the start of each get_info() (outside the context lock)
    void set_info_hook(std::function<void()> info_hook);
    /// job handling, 'pending_polls' polls report a pending job before the outcome shows
    void set_job_behavior(const MockJobBehavior behavior, const std::size_t pending_polls);

    std::size_t num_fetch_calls() const { return m_num_fetch_calls.load(); }
    std::size_t num_info_calls() const { return m_num_info_calls.load(); }
    std::size_t num_job_polls() const { return m_num_job_polls.load(); }
    /// every tx submitted so far
    std::vector<RelayerTxRequestV1> submitted_txs() const;

private:
    MockLogEntry make_log_entry_impl(const std::string &memo);
    std::uint64_t num_log_entries_impl() const;

//member variables
    /// protects all the state
    mutable boost::shared_mutex m_context_mutex;

    std::vector<MockLogEntry> m_mined_log;
    std::vector<MockLogEntry> m_pending_log;
    std::uint64_t m_tx_counter{0};

    boost::optional<std::uint64_t> m_failing_fetch_offset;
    bool m_fail_info{false};
    std::function<void(std::uint64_t)> m_fetch_hook;
    std::function<void()> m_info_hook;

    MockJobBehavior m_job_behavior{MockJobBehavior::COMPLETE_PENDING};
    std::size_t m_job_pending_polls{0};
    std::size_t m_job_counter{0};
    /// [ job id : {job, pending polls left} ]
    mutable std::map<std::string, std::pair<RelayerJobV1, std::size_t>> m_jobs;
    std::vector<RelayerTxRequestV1> m_submitted_txs;

    mutable std::atomic<std::size_t> m_num_fetch_calls{0};
    mutable std::atomic<std::size_t> m_num_info_calls{0};
    mutable std::atomic<std::size_t> m_num_job_polls{0};
};

} //namespace mocks
} //namespace zkpool
