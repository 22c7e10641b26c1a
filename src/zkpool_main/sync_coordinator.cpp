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
#include "sync_coordinator.h"

//local headers
#include "account_state.h"
#include "client_errors.h"
#include "crypto_capability.h"
#include "history_ledger.h"
#include "misc_log_ex.h"
#include "relayer_context.h"
#include "zkpool_core/ledger_entry_types.h"
#include "zkpool_core/ledger_entry_utils.h"
#include "zkpool_core/zkpool_config.h"

//third party headers
#include <boost/chrono/duration.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/thread.hpp>

//standard headers
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "zkpool.sync"

namespace zkpool
{

////
// SyncCoordinator::InFlightCycle
// - outcome slot shared by the leader of a cycle and the callers waiting on it
///
struct SyncCoordinator::InFlightCycle final
{
    bool m_done{false};
    bool m_ready{false};
    std::exception_ptr m_error;
};

namespace
{

////
// SyncBatchV1
// - one fetched, classified and decrypted range of the log
///
struct SyncBatchV1 final
{
    /// log index of the batch's first entry
    std::uint64_t m_start_index;
    bool m_has_mined{false};
    DecryptionResultV1 m_mined;
    DecryptionResultV1 m_pending;
    SyncResultV1 m_sync_result;
};

struct SyncBatchOutcomeV1 final
{
    SyncBatchV1 m_batch;
    std::exception_ptr m_error;
};

} //anonymous namespace

//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static HistoryRecordType history_record_type(const DecryptedMemoV1 &memo)
{
    switch (memo.m_kind)
    {
        case TxKind::DEPOSIT:  return HistoryRecordType::DEPOSIT;
        case TxKind::WITHDRAW: return HistoryRecordType::WITHDRAWAL;
        case TxKind::TRANSFER:
        default:
            return memo.m_account_present ? HistoryRecordType::TRANSFER_OUT : HistoryRecordType::TRANSFER_IN;
    }
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static HistoryRecordV1 make_history_record(const DecryptedMemoV1 &memo, const bool pending)
{
    return HistoryRecordV1{
            history_record_type(memo),
            memo.m_amount,
            memo.m_fee,
            pending,
            memo.m_tx_hash,
            memo.m_index
        };
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void decrypt_indexed_txs(const CryptoCapability &crypto_capability,
    const epee::wipeable_string &secret_key,
    const std::vector<IndexedTxV1> &txs,
    const std::unordered_map<std::uint64_t, std::string> &tx_hashes,
    DecryptionResultV1 &result_out)
{
    result_out = DecryptionResultV1{};

    if (txs.empty())
        return;

    crypto_capability.decrypt(secret_key, txs, result_out);

    // decryption only sees memos, so attach the tx hashes here
    for (DecryptedMemoV1 &memo : result_out.m_memos)
    {
        const auto tx_hash = tx_hashes.find(memo.m_index);
        THROW_ZKPOOL_EXCEPTION_IF(tx_hash == tx_hashes.end(), error::internal_error,
            "decrypted memo at index " + std::to_string(memo.m_index) + " does not match any log entry");

        memo.m_tx_hash = tx_hash->second;
    }
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void fetch_sync_batch(const RelayerContext &relayer_context,
    const CryptoCapability &crypto_capability,
    const epee::wipeable_string &secret_key,
    const std::uint64_t start_index,
    const std::uint64_t batch_size,
    SyncBatchV1 &batch_out)
{
    batch_out = SyncBatchV1{};
    batch_out.m_start_index = start_index;

    // 1. fetch
    std::vector<std::string> raw_entries;
    relayer_context.fetch_transactions(start_index, batch_size, raw_entries);

    // 2. classify
    ClassifiedEntriesV1 classified_entries;
    classify_ledger_entries_v1(raw_entries, start_index, classified_entries);

    // 3. decrypt mined and pending txs separately
    decrypt_indexed_txs(crypto_capability,
        secret_key,
        classified_entries.m_mined_txs,
        classified_entries.m_tx_hashes,
        batch_out.m_mined);
    decrypt_indexed_txs(crypto_capability,
        secret_key,
        classified_entries.m_pending_txs,
        classified_entries.m_tx_hashes,
        batch_out.m_pending);

    batch_out.m_has_mined = !classified_entries.m_mined_txs.empty();
    batch_out.m_sync_result.m_processed_count   = raw_entries.size();
    batch_out.m_sync_result.m_max_mined_index   = classified_entries.m_max_mined_index;
    batch_out.m_sync_result.m_max_pending_index = classified_entries.m_max_pending_index;

    MDEBUG("Sync batch at index " << start_index << ": " << classified_entries.m_mined_txs.size() << " mined, "
        << classified_entries.m_pending_txs.size() << " pending, " << batch_out.m_mined.m_memos.size() +
        batch_out.m_pending.m_memos.size() << " owned.");
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void apply_sync_batch(const SyncBatchV1 &batch,
    AccountState &account_state_inout,
    HistoryLedger &history_ledger_inout,
    bool &ready_inout)
{
    // 1. mined txs: advance the account state
    if (batch.m_has_mined)
    {
        const std::uint64_t expected_next_index{
                static_cast<std::uint64_t>(batch.m_sync_result.m_max_mined_index) + config::ZKPOOL_INDEX_STRIDE
            };

        THROW_ZKPOOL_EXCEPTION_IF(batch.m_start_index != account_state_inout.next_tree_index(),
            error::internal_error,
            "sync batch at index " + std::to_string(batch.m_start_index) +
            " is not contiguous with the account state (next index " +
            std::to_string(account_state_inout.next_tree_index()) + ")");
        THROW_ZKPOOL_EXCEPTION_IF(batch.m_mined.m_state_update.m_next_index != expected_next_index,
            error::internal_error,
            "state update for sync batch at index " + std::to_string(batch.m_start_index) +
            " has an unexpected next index");

        account_state_inout.apply(batch.m_mined.m_state_update);
    }

    for (const DecryptedMemoV1 &memo : batch.m_mined.m_memos)
        history_ledger_inout.append(make_history_record(memo, false));

    // 2. pending txs: history only
    for (const DecryptedMemoV1 &memo : batch.m_pending.m_memos)
    {
        history_ledger_inout.append(make_history_record(memo, true));

        // an unconfirmed tx that spends our account will change the state we would plan against
        if (memo.m_account_present)
        {
            MINFO("Unconfirmed outgoing tx at index " << memo.m_index << ", account not ready.");
            ready_inout = false;
        }
    }
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
void merge_sync_results(const SyncResultV1 &result, SyncResultV1 &result_inout)
{
    result_inout.m_processed_count  += result.m_processed_count;
    result_inout.m_max_mined_index   = std::max(result_inout.m_max_mined_index, result.m_max_mined_index);
    result_inout.m_max_pending_index = std::max(result_inout.m_max_pending_index, result.m_max_pending_index);
}
//-------------------------------------------------------------------------------------------------------------------
SyncCoordinator::SyncCoordinator(const SyncConfig &config,
    const RelayerContext &relayer_context,
    const CryptoCapability &crypto_capability,
    const epee::wipeable_string &secret_key,
    AccountState &account_state_inout,
    HistoryLedger &history_ledger_inout) :
        m_config{config},
        m_relayer_context{relayer_context},
        m_crypto_capability{crypto_capability},
        m_secret_key{secret_key},
        m_account_state{account_state_inout},
        m_history_ledger{history_ledger_inout}
{
    CHECK_AND_ASSERT_THROW_MES(m_config.m_batch_size > 0, "sync coordinator: batch size must be positive.");
    CHECK_AND_ASSERT_THROW_MES(m_config.m_max_concurrent_batches > 0,
        "sync coordinator: max concurrent batches must be positive.");
}
//-------------------------------------------------------------------------------------------------------------------
bool SyncCoordinator::update_state()
{
    std::shared_ptr<InFlightCycle> cycle;

    {
        boost::unique_lock<boost::mutex> lock{m_flight_mutex};

        // join the cycle in flight
        if (m_in_flight)
        {
            cycle = m_in_flight;

            ++m_num_waiting_callers;
            while (!cycle->m_done)
                m_flight_cv.wait(lock);
            --m_num_waiting_callers;

            if (cycle->m_error)
                std::rethrow_exception(cycle->m_error);

            return cycle->m_ready;
        }

        // or lead a new one
        m_in_flight = std::make_shared<InFlightCycle>();
        cycle = m_in_flight;
    }

    bool ready{false};
    std::exception_ptr error;

    try { ready = run_sync_cycle(); }
    catch (...) { error = std::current_exception(); }

    {
        boost::lock_guard<boost::mutex> lock{m_flight_mutex};

        cycle->m_ready = ready;
        cycle->m_error = error;
        cycle->m_done  = true;
        m_in_flight.reset();
    }
    m_flight_cv.notify_all();

    if (error)
        std::rethrow_exception(error);

    return ready;
}
//-------------------------------------------------------------------------------------------------------------------
bool SyncCoordinator::wait_until_ready(const std::size_t max_attempts, const std::uint64_t interval_ms)
{
    for (std::size_t attempt{0}; attempt < max_attempts; ++attempt)
    {
        if (this->update_state())
            return true;

        if (attempt + 1 < max_attempts)
        {
            MDEBUG("Account not ready, retrying sync in " << interval_ms << " ms.");
            boost::this_thread::sleep_for(boost::chrono::milliseconds(interval_ms));
        }
    }

    MWARNING("Account still not ready after " << max_attempts << " sync attempts.");
    return false;
}
//-------------------------------------------------------------------------------------------------------------------
SyncResultV1 SyncCoordinator::last_sync_result() const
{
    boost::lock_guard<boost::mutex> lock{m_flight_mutex};

    return m_last_sync_result;
}
//-------------------------------------------------------------------------------------------------------------------
std::size_t SyncCoordinator::num_waiting_callers() const
{
    boost::lock_guard<boost::mutex> lock{m_flight_mutex};

    return m_num_waiting_callers;
}
//-------------------------------------------------------------------------------------------------------------------
bool SyncCoordinator::run_sync_cycle()
{
    // 1. where we are vs where the relayer is
    const std::uint64_t start_index{m_account_state.next_tree_index()};
    const RelayerInfoV1 relayer_info{m_relayer_context.get_info()};

    // note: the delta index is uint64{-1} for an empty log, so the lookahead wraps to 0
    const std::uint64_t optimistic_index{relayer_info.m_delta_index + config::ZKPOOL_OPTIMISTIC_INDEX_LOOKAHEAD};

    // 2. partition [start index, delta index] into batches, plus one batch past the last confirmed entry
    // note: the relayer has no pending index, so the first unconfirmed slot is always fetched
    const std::uint64_t num_confirmed_entries{
            optimistic_index > start_index
            ? (optimistic_index - start_index + config::ZKPOOL_INDEX_STRIDE - 1) / config::ZKPOOL_INDEX_STRIDE
            : 0
        };
    const std::size_t num_batches{static_cast<std::size_t>(num_confirmed_entries / m_config.m_batch_size + 1)};
    const std::uint64_t batch_index_span{m_config.m_batch_size * config::ZKPOOL_INDEX_STRIDE};

    MINFO("Sync: fetching " << num_confirmed_entries << " confirmed entries from index " << start_index << " in "
        << num_batches << " batches.");

    // 3. fetch, classify and decrypt the batches in parallel
    std::vector<SyncBatchOutcomeV1> batch_outcomes(num_batches);
    std::atomic<std::size_t> next_batch{0};
    std::atomic<bool> batch_failed{false};

    auto batch_worker =
        [&]()
        {
            while (!batch_failed.load())
            {
                const std::size_t batch_index{next_batch++};
                if (batch_index >= num_batches)
                    return;

                try
                {
                    fetch_sync_batch(m_relayer_context,
                        m_crypto_capability,
                        m_secret_key,
                        start_index + batch_index * batch_index_span,
                        m_config.m_batch_size,
                        batch_outcomes[batch_index].m_batch);
                }
                catch (...)
                {
                    batch_outcomes[batch_index].m_error = std::current_exception();
                    batch_failed = true;
                }
            }
        };

    boost::thread_group batch_workers;
    const std::size_t num_workers{std::min(num_batches, m_config.m_max_concurrent_batches)};

    try
    {
        for (std::size_t worker_index{0}; worker_index < num_workers; ++worker_index)
            batch_workers.create_thread(batch_worker);
    }
    catch (...)
    {
        // workers that did start still reference this frame
        batch_failed = true;
        batch_workers.join_all();
        throw;
    }
    batch_workers.join_all();

    // 4. apply in index order
    // note: batches are handed out in index order, so every batch before the first failure was fetched
    bool ready{true};
    SyncResultV1 cycle_result;
    bool seen_pending{false};
    bool last_batch_full{false};

    auto apply_batch =
        [&](const SyncBatchV1 &batch) -> bool
        {
            // entries were mined between two fetches, the next cycle picks them up
            if (seen_pending && batch.m_has_mined)
            {
                MDEBUG("Sync: batch at index " << batch.m_start_index << " has mined entries past a pending "
                    "entry, deferring it to the next cycle.");
                return false;
            }

            apply_sync_batch(batch, m_account_state, m_history_ledger, ready);
            merge_sync_results(batch.m_sync_result, cycle_result);

            seen_pending = seen_pending || batch.m_sync_result.m_max_pending_index >= 0;
            last_batch_full = batch.m_sync_result.m_processed_count >= m_config.m_batch_size;
            return true;
        };

    bool applied_all{true};
    for (std::size_t batch_index{0}; batch_index < num_batches; ++batch_index)
    {
        const SyncBatchOutcomeV1 &outcome{batch_outcomes[batch_index]};

        if (outcome.m_error)
        {
            MERROR("Sync: batch " << batch_index << " of " << num_batches << " failed, " << batch_index
                << " batches were applied.");
            std::rethrow_exception(outcome.m_error);
        }

        if (!apply_batch(outcome.m_batch))
        {
            applied_all = false;
            break;
        }
    }

    // 5. a full final batch means the log continues past it, so drain the rest one batch at a time
    for (std::uint64_t tail_index{start_index + num_batches * batch_index_span};
        applied_all && last_batch_full;
        tail_index += batch_index_span)
    {
        SyncBatchV1 tail_batch;
        fetch_sync_batch(m_relayer_context,
            m_crypto_capability,
            m_secret_key,
            tail_index,
            m_config.m_batch_size,
            tail_batch);

        applied_all = apply_batch(tail_batch);
    }

    // 6. drop pending records that weren't reaffirmed
    const std::size_t num_trimmed{
            m_history_ledger.trim_stale(cycle_result.m_max_mined_index, cycle_result.m_max_pending_index)
        };

    {
        boost::lock_guard<boost::mutex> lock{m_flight_mutex};
        m_last_sync_result = cycle_result;
    }

    MINFO("Sync: processed " << cycle_result.m_processed_count << " entries (max mined index "
        << cycle_result.m_max_mined_index << ", max pending index " << cycle_result.m_max_pending_index << "), "
        << num_trimmed << " stale pending records dropped, next index " << m_account_state.next_tree_index()
        << (ready ? "." : ", not ready."));

    return ready;
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace zkpool
