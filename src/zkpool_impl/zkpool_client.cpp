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
#include "zkpool_client.h"

//local headers
#include "misc_log_ex.h"
#include "relayer_context_http.h"
#include "zkpool_core/amount_utils.h"
#include "zkpool_core/ledger_entry_types.h"
#include "zkpool_core/tx_part_planner.h"
#include "zkpool_core/zkpool_config.h"
#include "zkpool_main/account_state.h"
#include "zkpool_main/client_errors.h"
#include "zkpool_main/crypto_capability.h"
#include "zkpool_main/fee_estimator.h"
#include "zkpool_main/history_ledger.h"
#include "zkpool_main/relayer_context.h"
#include "zkpool_main/sync_coordinator.h"
#include "zkpool_main/tx_data_builder.h"

//third party headers
#include <boost/chrono/duration.hpp>
#include <boost/optional/optional.hpp>
#include <boost/thread/thread.hpp>

//standard headers
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "zkpool.client"

namespace zkpool
{

////
// ZkPoolClient::AssetContext
// - everything the client keeps for one asset pool
// - member order matters: the sync coordinator and fee estimator reference the members declared before them
///
struct ZkPoolClient::AssetContext final
{
    AssetConfig m_config;
    std::unique_ptr<RelayerContext> m_relayer_context;
    AccountState m_account_state;
    HistoryLedger m_history_ledger;
    std::unique_ptr<TxDataBuilder> m_tx_data_builder;
    std::unique_ptr<SyncCoordinator> m_sync_coordinator;
    std::unique_ptr<FeeEstimator> m_fee_estimator;
};

//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void check_tx_amount(const amount_t amount, const TxPlannerConfig &planner_config)
{
    THROW_ZKPOOL_EXCEPTION_IF(amount < planner_config.m_min_tx_amount, error::tx_small_amount,
        amount,
        planner_config.m_min_tx_amount);
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static std::vector<std::vector<TransferOutputV1>> distribute_transfer_outputs(
    const std::vector<TransferOutputV1> &outputs,
    const std::vector<TxPartV1> &tx_parts)
{
    // fill the parts in order, splitting an output where a part boundary falls inside it
    std::vector<std::vector<TransferOutputV1>> part_outputs(tx_parts.size());
    std::size_t output_index{0};
    amount_t output_remaining{outputs.empty() ? 0 : outputs[0].m_amount};

    for (std::size_t part_index{0}; part_index < tx_parts.size(); ++part_index)
    {
        amount_t part_remaining{tx_parts[part_index].m_amount};

        while (part_remaining > 0 && output_index < outputs.size())
        {
            const amount_t share{std::min(part_remaining, output_remaining)};
            part_outputs[part_index].emplace_back(TransferOutputV1{outputs[output_index].m_to, share});
            part_remaining   -= share;
            output_remaining -= share;

            if (output_remaining == 0 && ++output_index < outputs.size())
                output_remaining = outputs[output_index].m_amount;
        }

        CHECK_AND_ASSERT_THROW_MES(part_remaining == 0,
            "zkpool client: tx parts exceed the transfer outputs.");

        // a zero-amount part still needs a recipient
        if (part_outputs[part_index].empty())
        {
            const std::size_t recipient_index{std::min(output_index, outputs.size() - 1)};
            part_outputs[part_index].emplace_back(TransferOutputV1{outputs[recipient_index].m_to, 0});
        }
    }

    CHECK_AND_ASSERT_THROW_MES(output_index == outputs.size(),
        "zkpool client: tx parts don't cover the transfer outputs.");

    return part_outputs;
}
//-------------------------------------------------------------------------------------------------------------------
RelayerContextFactory make_http_relayer_context_factory(const std::uint64_t timeout_ms)
{
    return
        [timeout_ms](const AssetConfig &asset_config) -> std::unique_ptr<RelayerContext>
        {
            return make_relayer_context_http(asset_config.m_relayer_url, std::chrono::milliseconds{timeout_ms});
        };
}
//-------------------------------------------------------------------------------------------------------------------
ZkPoolClient::ZkPoolClient(ClientConfig config,
    const CryptoCapability &crypto_capability,
    const RelayerContextFactory &relayer_context_factory,
    const TxDataBuilderFactory &tx_data_builder_factory) :
        m_config{std::move(config)},
        m_crypto_capability{crypto_capability}
{
    THROW_ZKPOOL_EXCEPTION_IF(m_config.m_secret_key.empty(), error::tx_invalid_argument, "empty secret key");

    for (const AssetConfig &asset_config : m_config.m_assets)
    {
        THROW_ZKPOOL_EXCEPTION_IF(m_assets.find(asset_config.m_asset_id) != m_assets.end(),
            error::tx_invalid_argument, "duplicate asset '" + asset_config.m_asset_id + "'");
        THROW_ZKPOOL_EXCEPTION_IF(asset_config.m_denominator == 0, error::tx_invalid_argument,
            "zero denominator for asset '" + asset_config.m_asset_id + "'");

        std::unique_ptr<AssetContext> asset{std::make_unique<AssetContext>()};
        asset->m_config = asset_config;
        asset->m_relayer_context = relayer_context_factory(asset->m_config);
        asset->m_tx_data_builder = tx_data_builder_factory(m_config.m_secret_key, asset->m_account_state);

        CHECK_AND_ASSERT_THROW_MES(asset->m_relayer_context && asset->m_tx_data_builder,
            "zkpool client: asset factories returned nothing.");

        asset->m_sync_coordinator = std::make_unique<SyncCoordinator>(asset->m_config.m_sync_config,
                *asset->m_relayer_context,
                m_crypto_capability,
                m_config.m_secret_key,
                asset->m_account_state,
                asset->m_history_ledger);
        asset->m_fee_estimator = std::make_unique<FeeEstimator>(asset->m_account_state,
                asset->m_config.m_fee_per_tx,
                asset->m_config.m_planner_config);

        MINFO("zkpool client: added asset " << asset_config.m_asset_id << " (relayer " << asset_config.m_relayer_url
            << ").");

        m_assets.emplace(asset_config.m_asset_id, std::move(asset));
    }
}
//-------------------------------------------------------------------------------------------------------------------
ZkPoolClient::~ZkPoolClient()
{
    this->free();
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<std::string> ZkPoolClient::assets() const
{
    std::vector<std::string> asset_ids;
    asset_ids.reserve(m_assets.size());

    for (const auto &asset : m_assets)
        asset_ids.emplace_back(asset.first);

    std::sort(asset_ids.begin(), asset_ids.end());
    return asset_ids;
}
//-------------------------------------------------------------------------------------------------------------------
bool ZkPoolClient::update_state(const std::string &asset_id)
{
    return this->asset_context(asset_id).m_sync_coordinator->update_state();
}
//-------------------------------------------------------------------------------------------------------------------
bool ZkPoolClient::wait_until_ready(const std::string &asset_id)
{
    AssetContext &asset{this->asset_context(asset_id)};

    return asset.m_sync_coordinator->wait_until_ready(asset.m_config.m_ready_poll_attempts,
        asset.m_config.m_ready_poll_interval_ms);
}
//-------------------------------------------------------------------------------------------------------------------
native_amount_t ZkPoolClient::get_total_balance(const std::string &asset_id)
{
    AssetContext &asset{this->asset_context(asset_id)};
    asset.m_sync_coordinator->update_state();

    return shielded_to_native(asset.m_account_state.total_balance(), asset.m_config.m_denominator);
}
//-------------------------------------------------------------------------------------------------------------------
BalancesV1 ZkPoolClient::get_balances(const std::string &asset_id)
{
    AssetContext &asset{this->asset_context(asset_id)};
    asset.m_sync_coordinator->update_state();

    AccountSnapshotV1 snapshot;
    asset.m_account_state.get_snapshot(snapshot);

    amount_t notes_balance{0};
    for (const OwnedNoteV1 &note : snapshot.m_usable_notes)
        notes_balance += note.m_amount;

    BalancesV1 balances;
    balances.m_account = shielded_to_native(snapshot.m_account_balance, asset.m_config.m_denominator);
    balances.m_notes   = shielded_to_native(notes_balance, asset.m_config.m_denominator);
    balances.m_total   = balances.m_account + balances.m_notes;

    return balances;
}
//-------------------------------------------------------------------------------------------------------------------
native_amount_t ZkPoolClient::get_optimistic_total_balance(const std::string &asset_id)
{
    AssetContext &asset{this->asset_context(asset_id)};
    asset.m_sync_coordinator->update_state();

    return shielded_to_native(
            asset.m_history_ledger.optimistic_balance(asset.m_account_state.total_balance()),
            asset.m_config.m_denominator
        );
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<HistoryRecordV1> ZkPoolClient::get_history(const std::string &asset_id)
{
    AssetContext &asset{this->asset_context(asset_id)};
    asset.m_sync_coordinator->update_state();

    return asset.m_history_ledger.get_records();
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<HistoryRecordV1> ZkPoolClient::get_last_history(const std::string &asset_id, const std::size_t n)
{
    AssetContext &asset{this->asset_context(asset_id)};
    asset.m_sync_coordinator->update_state();

    return asset.m_history_ledger.get_last_n(n);
}
//-------------------------------------------------------------------------------------------------------------------
FeeEstimateV1 ZkPoolClient::fee_estimate(const std::string &asset_id,
    const native_amount_t &amount,
    const TxKind kind)
{
    AssetContext &asset{this->asset_context(asset_id)};
    const amount_t shielded_amount{this->to_shielded_checked(asset, amount)};

    asset.m_sync_coordinator->update_state();

    return asset.m_fee_estimator->fee_estimate(shielded_amount, kind);
}
//-------------------------------------------------------------------------------------------------------------------
native_amount_t ZkPoolClient::calc_max_available_transfer(const std::string &asset_id)
{
    AssetContext &asset{this->asset_context(asset_id)};
    asset.m_sync_coordinator->update_state();

    return shielded_to_native(asset.m_fee_estimator->calc_max_available_transfer(), asset.m_config.m_denominator);
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<TxPartV1> ZkPoolClient::get_transaction_parts(const std::string &asset_id, const native_amount_t &amount)
{
    AssetContext &asset{this->asset_context(asset_id)};
    const amount_t shielded_amount{this->to_shielded_checked(asset, amount)};

    asset.m_sync_coordinator->update_state();

    return asset.m_fee_estimator->get_transaction_parts(shielded_amount);
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<std::string> ZkPoolClient::deposit(const std::string &asset_id,
    const native_amount_t &amount,
    const DepositSigner &sign,
    const boost::optional<std::string> &from_address)
{
    THROW_ZKPOOL_EXCEPTION_IF(!sign, error::tx_invalid_argument, "no deposit signer");

    AssetContext &asset{this->asset_context(asset_id)};
    const amount_t shielded_amount{this->to_shielded_checked(asset, amount)};
    check_tx_amount(shielded_amount, asset.m_config.m_planner_config);

    asset.m_sync_coordinator->update_state();

    // 1. build and prove
    const TxDataV1 tx_data{asset.m_tx_data_builder->make_deposit(shielded_amount, asset.m_config.m_fee_per_tx)};
    std::vector<RelayerTxRequestV1> requests{this->prove_txs({tx_data})};

    // 2. the depositor authorizes the transfer of native funds by signing the nullifier
    std::string signature{sign("0x" + tx_data.m_nullifier)};
    THROW_ZKPOOL_EXCEPTION_IF(signature.empty(), error::tx_invalid_argument, "empty deposit signature");

    if (from_address)
        signature = *from_address + signature;

    requests.front().m_deposit_signature = std::move(signature);

    MINFO("zkpool client: depositing " << shielded_amount << " into " << asset_id << ".");

    return this->send_txs_and_wait(asset, requests);
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<std::string> ZkPoolClient::transfer_multi(const std::string &asset_id,
    const std::string &to,
    const native_amount_t &amount)
{
    return this->transfer_multi(asset_id, {NativeTransferOutputV1{to, amount}});
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<std::string> ZkPoolClient::transfer_multi(const std::string &asset_id,
    const std::vector<NativeTransferOutputV1> &outputs)
{
    THROW_ZKPOOL_EXCEPTION_IF(outputs.empty(), error::tx_invalid_argument, "no transfer outputs");
    THROW_ZKPOOL_EXCEPTION_IF(outputs.size() > config::ZKPOOL_OUTPUTS_PER_TX, error::tx_invalid_argument,
        "too many transfer outputs");

    AssetContext &asset{this->asset_context(asset_id)};

    // 1. convert the outputs and sum them
    std::vector<TransferOutputV1> shielded_outputs;
    shielded_outputs.reserve(outputs.size());
    amount_t shielded_amount{0};

    for (const NativeTransferOutputV1 &output : outputs)
    {
        THROW_ZKPOOL_EXCEPTION_IF(output.m_to.empty(), error::tx_invalid_argument, "empty shielded address");

        const amount_t output_amount{this->to_shielded_checked(asset, output.m_amount)};
        THROW_ZKPOOL_EXCEPTION_IF(output_amount == 0, error::tx_invalid_argument,
            "transfer output to " + output.m_to + " is zero");
        THROW_ZKPOOL_EXCEPTION_IF(output_amount > std::numeric_limits<amount_t>::max() - shielded_amount,
            error::tx_invalid_argument, "transfer outputs are out of range");

        shielded_outputs.emplace_back(TransferOutputV1{output.m_to, output_amount});
        shielded_amount += output_amount;
    }

    // 2. plan against the total
    std::vector<TxPartInputsV1> part_inputs;
    const std::vector<TxPartV1> tx_parts{this->prepare_multi_part_tx(asset, shielded_amount, part_inputs)};

    // 3. one tx per part, each carrying its share of the outputs
    const std::vector<std::vector<TransferOutputV1>> part_outputs{
            distribute_transfer_outputs(shielded_outputs, tx_parts)
        };

    std::vector<TxDataV1> txs;
    txs.reserve(tx_parts.size());

    for (std::size_t part_index{0}; part_index < tx_parts.size(); ++part_index)
    {
        txs.emplace_back(
                asset.m_tx_data_builder->make_transfer(part_outputs[part_index],
                    part_inputs[part_index],
                    tx_parts[part_index].m_fee)
            );
    }

    MINFO("zkpool client: transferring " << shielded_amount << " of " << asset_id << " to " << outputs.size()
        << " recipients in " << tx_parts.size() << " txs.");

    return this->send_txs_and_wait(asset, this->prove_txs(txs));
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<std::string> ZkPoolClient::withdraw_multi(const std::string &asset_id,
    const std::string &to_address,
    const native_amount_t &amount)
{
    THROW_ZKPOOL_EXCEPTION_IF(to_address.empty(), error::tx_invalid_argument, "empty withdrawal address");

    AssetContext &asset{this->asset_context(asset_id)};
    const amount_t shielded_amount{this->to_shielded_checked(asset, amount)};

    std::vector<TxPartInputsV1> part_inputs;
    const std::vector<TxPartV1> tx_parts{this->prepare_multi_part_tx(asset, shielded_amount, part_inputs)};

    std::vector<TxDataV1> txs;
    txs.reserve(tx_parts.size());

    for (std::size_t part_index{0}; part_index < tx_parts.size(); ++part_index)
    {
        txs.emplace_back(
                asset.m_tx_data_builder->make_withdraw(to_address,
                    tx_parts[part_index].m_amount,
                    part_inputs[part_index],
                    tx_parts[part_index].m_fee)
            );
    }

    MINFO("zkpool client: withdrawing " << shielded_amount << " of " << asset_id << " in " << tx_parts.size()
        << " txs.");

    return this->send_txs_and_wait(asset, this->prove_txs(txs));
}
//-------------------------------------------------------------------------------------------------------------------
void ZkPoolClient::free()
{
    for (auto &asset : m_assets)
    {
        asset.second->m_account_state.clear();
        asset.second->m_history_ledger.clear();
    }

    m_assets.clear();
    m_config.m_secret_key.wipe();
}
//-------------------------------------------------------------------------------------------------------------------
ZkPoolClient::AssetContext& ZkPoolClient::asset_context(const std::string &asset_id)
{
    auto asset = m_assets.find(asset_id);
    THROW_ZKPOOL_EXCEPTION_IF(asset == m_assets.end(), error::tx_invalid_argument, "unknown asset '" + asset_id + "'");

    return *asset->second;
}
//-------------------------------------------------------------------------------------------------------------------
amount_t ZkPoolClient::to_shielded_checked(const AssetContext &asset, const native_amount_t &amount) const
{
    THROW_ZKPOOL_EXCEPTION_IF(amount / asset.m_config.m_denominator > std::numeric_limits<amount_t>::max(),
        error::tx_invalid_argument, "amount is out of range");

    return native_to_shielded(amount, asset.m_config.m_denominator);
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<TxPartV1> ZkPoolClient::prepare_multi_part_tx(AssetContext &asset,
    const amount_t amount,
    std::vector<TxPartInputsV1> &part_inputs_out)
{
    const TxPlannerConfig &planner_config{asset.m_config.m_planner_config};
    const amount_t fee_per_tx{asset.m_config.m_fee_per_tx};

    // 1. validate the amount
    check_tx_amount(amount, planner_config);

    // 2. an unconfirmed outgoing tx would invalidate the plan
    THROW_ZKPOOL_EXCEPTION_IF(!asset.m_sync_coordinator->wait_until_ready(asset.m_config.m_ready_poll_attempts,
            asset.m_config.m_ready_poll_interval_ms),
        error::not_ready_error);

    // 3. plan against a consistent view of the state
    AccountSnapshotV1 snapshot;
    asset.m_account_state.get_snapshot(snapshot);

    const amount_t max_available{asset.m_fee_estimator->calc_max_available_transfer()};
    THROW_ZKPOOL_EXCEPTION_IF(amount > max_available, error::tx_limit_error, amount, max_available);

    const std::vector<TxPartV1> tx_parts{
            plan_tx_parts_v1(amount, fee_per_tx, snapshot.m_usable_notes, snapshot.m_account_balance, planner_config)
        };

    THROW_ZKPOOL_EXCEPTION_IF(tx_parts.empty(), error::insufficient_funds,
        amount + fee_per_tx,
        asset.m_account_state.total_balance());

    // 4. what each part spends: the account alone, or the account (first part only) plus the part's note chunk
    const bool account_only{snapshot.m_account_balance >= amount && snapshot.m_account_balance - amount >= fee_per_tx};

    part_inputs_out.clear();
    part_inputs_out.reserve(tx_parts.size());

    for (std::size_t part_index{0}; part_index < tx_parts.size(); ++part_index)
    {
        check_tx_amount(tx_parts[part_index].m_amount, planner_config);

        TxPartInputsV1 inputs;
        inputs.m_account_limit = tx_parts[part_index].m_account_limit;

        if (!account_only)
        {
            const std::size_t chunk_begin{part_index * planner_config.m_max_inputs};
            const std::size_t chunk_end{
                    std::min(chunk_begin + planner_config.m_max_inputs, snapshot.m_usable_notes.size())
                };

            inputs.m_notes.assign(snapshot.m_usable_notes.begin() + chunk_begin,
                snapshot.m_usable_notes.begin() + chunk_end);
        }

        part_inputs_out.emplace_back(std::move(inputs));
    }

    return tx_parts;
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<RelayerTxRequestV1> ZkPoolClient::prove_txs(const std::vector<TxDataV1> &txs) const
{
    std::vector<RelayerTxRequestV1> requests;
    requests.reserve(txs.size());

    for (const TxDataV1 &tx_data : txs)
    {
        TxProofV1 proof{m_crypto_capability.prove(tx_data.m_public_inputs, tx_data.m_secret_inputs)};

        THROW_ZKPOOL_EXCEPTION_IF(!m_crypto_capability.verify(proof), error::tx_proof_error);

        requests.emplace_back(RelayerTxRequestV1{tx_data.m_kind, tx_data.m_memo, std::move(proof), boost::none});
    }

    return requests;
}
//-------------------------------------------------------------------------------------------------------------------
std::vector<std::string> ZkPoolClient::send_txs_and_wait(AssetContext &asset,
    const std::vector<RelayerTxRequestV1> &txs)
{
    const std::string job_id{asset.m_relayer_context->send_transactions(txs)};

    for (std::size_t poll_attempt{0}; poll_attempt < asset.m_config.m_job_poll_attempts; ++poll_attempt)
    {
        const boost::optional<RelayerJobV1> job{asset.m_relayer_context->try_get_job(job_id)};

        THROW_ZKPOOL_EXCEPTION_IF(!job, error::relayer_job_not_found, job_id);
        THROW_ZKPOOL_EXCEPTION_IF(job->m_state == RelayerJobState::FAILED, error::relayer_job_error,
            job_id,
            job->m_failure_reason);

        if (job->m_state == RelayerJobState::COMPLETED)
        {
            MINFO("zkpool client: job " << job_id << " completed (" << job->m_tx_hashes.size() << " txs).");
            return job->m_tx_hashes;
        }

        boost::this_thread::sleep_for(boost::chrono::milliseconds(asset.m_config.m_job_poll_interval_ms));
    }

    THROW_ZKPOOL_EXCEPTION(error::relayer_job_error, job_id,
        "job did not complete after " + std::to_string(asset.m_config.m_job_poll_attempts) + " polls");

    return {};
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace zkpool
