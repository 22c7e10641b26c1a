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

// Reconcile the local account state and history with the relayer's commitment log.


#pragma once

//local headers
#include "wipeable_string.h"
#include "zkpool_core/ledger_entry_types.h"
#include "zkpool_core/zkpool_config.h"

//third party headers
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/mutex.hpp>

//standard headers
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>

//forward declarations
namespace zkpool
{
    class AccountState;
    class CryptoCapability;
    class HistoryLedger;
    class RelayerContext;
}

namespace zkpool
{

struct SyncConfig final
{
    /// max number of log entries per relayer fetch
    std::uint64_t m_batch_size{config::ZKPOOL_DEFAULT_SYNC_BATCH_SIZE};
    /// max number of batches fetched and decrypted at the same time
    std::size_t m_max_concurrent_batches{config::ZKPOOL_DEFAULT_MAX_CONCURRENT_BATCHES};
};

////
// SyncResultV1
// - what a batch (or a whole cycle) saw
///
struct SyncResultV1 final
{
    /// number of log entries classified
    std::uint64_t m_processed_count{0};
    std::int64_t m_max_mined_index{NO_INDEX};
    std::int64_t m_max_pending_index{NO_INDEX};
};

/// reduce: sum the counts, max the indices
void merge_sync_results(const SyncResultV1 &result, SyncResultV1 &result_inout);

////
// SyncCoordinator
// - drives sync cycles for one (client, asset) pair
// - single-flight: callers that arrive while a cycle is running wait for it and observe its outcome
// - a cycle:
//   1. compares the local next tree index with the relayer's delta index
//   2. fetches, classifies and decrypts batches of log entries on a bounded pool of worker threads, always
//      including the batch at the first unconfirmed index
//   3. applies batch results in ascending index order (mined -> account state + confirmed history, pending ->
//      pending history), then drains the log one batch at a time while the last batch came back full
//   4. trims pending history records that weren't reaffirmed
///
class SyncCoordinator final
{
    struct InFlightCycle;

public:
//constructors
    /// the referenced objects must outlive the coordinator
    SyncCoordinator(const SyncConfig &config,
        const RelayerContext &relayer_context,
        const CryptoCapability &crypto_capability,
        const epee::wipeable_string &secret_key,
        AccountState &account_state_inout,
        HistoryLedger &history_ledger_inout);

//overloaded operators
    /// disable copy/move (references are held)
    SyncCoordinator& operator=(SyncCoordinator&&) = delete;

//member functions
    /**
    * brief: update_state - run a sync cycle (or join the one in flight)
    *   - throws on failure; batches applied before the failing batch stay applied
    * return: true if the account has no unconfirmed outgoing tx (ready to transact)
    */
    bool update_state();
    /**
    * brief: wait_until_ready - sync repeatedly until the account is ready to transact
    * param: max_attempts -
    * param: interval_ms - delay between attempts
    * return: false if the account is still not ready after 'max_attempts' syncs
    */
    bool wait_until_ready(const std::size_t max_attempts, const std::uint64_t interval_ms);

    /// result of the last completed cycle
    SyncResultV1 last_sync_result() const;
    /// number of callers currently waiting on the cycle in flight
    std::size_t num_waiting_callers() const;

private:
    bool run_sync_cycle();

//member variables
    SyncConfig m_config;
    const RelayerContext &m_relayer_context;
    const CryptoCapability &m_crypto_capability;
    const epee::wipeable_string &m_secret_key;
    AccountState &m_account_state;
    HistoryLedger &m_history_ledger;

    /// single-flight guard
    mutable boost::mutex m_flight_mutex;
    boost::condition_variable m_flight_cv;
    std::shared_ptr<InFlightCycle> m_in_flight;
    std::size_t m_num_waiting_callers{0};
    SyncResultV1 m_last_sync_result;
};

} //namespace zkpool
