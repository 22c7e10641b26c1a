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

// Multi-asset shielded pool client: sync, balances, history, fee estimates and tx submission per asset.


#pragma once

//local headers
#include "wipeable_string.h"
#include "zkpool_core/amount_utils.h"
#include "zkpool_core/ledger_entry_types.h"
#include "zkpool_core/tx_part_planner.h"
#include "zkpool_core/zkpool_config.h"
#include "zkpool_main/fee_estimator.h"
#include "zkpool_main/history_ledger.h"
#include "zkpool_main/relayer_context.h"
#include "zkpool_main/sync_coordinator.h"
#include "zkpool_main/tx_data_builder.h"

//third party headers
#include <boost/optional/optional.hpp>

//standard headers
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

//forward declarations
namespace zkpool
{
    class AccountState;
    class CryptoCapability;
}

namespace zkpool
{

struct AssetConfig final
{
    /// e.g. the token contract address
    std::string m_asset_id;
    std::string m_relayer_url;
    /// native units per shielded unit
    native_amount_t m_denominator{1};
    /// relayer fee per tx (shielded units)
    amount_t m_fee_per_tx{0};
    TxPlannerConfig m_planner_config;
    SyncConfig m_sync_config;

    std::size_t m_ready_poll_attempts{config::ZKPOOL_DEFAULT_READY_POLL_ATTEMPTS};
    std::uint64_t m_ready_poll_interval_ms{config::ZKPOOL_DEFAULT_READY_POLL_INTERVAL_MS};
    std::size_t m_job_poll_attempts{config::ZKPOOL_DEFAULT_JOB_POLL_ATTEMPTS};
    std::uint64_t m_job_poll_interval_ms{config::ZKPOOL_DEFAULT_JOB_POLL_INTERVAL_MS};
};

struct ClientConfig final
{
    /// spending key
    epee::wipeable_string m_secret_key;
    std::vector<AssetConfig> m_assets;
    std::uint64_t m_relayer_timeout_ms{config::ZKPOOL_DEFAULT_RELAYER_TIMEOUT_MS};
};

/// native units
struct BalancesV1 final
{
    native_amount_t m_total;
    native_amount_t m_account;
    native_amount_t m_notes;
};

/// one recipient of a shielded transfer (native units)
struct NativeTransferOutputV1 final
{
    /// shielded address
    std::string m_to;
    native_amount_t m_amount;
};

/// make the relayer context of an asset
using RelayerContextFactory = std::function<std::unique_ptr<RelayerContext>(const AssetConfig&)>;
/// make the tx data builder of an asset
using TxDataBuilderFactory =
    std::function<std::unique_ptr<TxDataBuilder>(const epee::wipeable_string&, const AccountState&)>;
/// sign a deposit's nullifier ('0x'-prefixed hex) with the depositor's native ledger key
using DepositSigner = std::function<std::string(const std::string&)>;

/// relayer contexts over http (the default)
RelayerContextFactory make_http_relayer_context_factory(const std::uint64_t timeout_ms);

////
// ZkPoolClient
// - amounts moved and balances are in native units (converted with the asset's denominator)
// - fees, tx parts and history records are in shielded units
// - operations on an asset sync that asset first
///
class ZkPoolClient final
{
    struct AssetContext;

public:
//constructors
    /// the crypto capability must outlive the client
    ZkPoolClient(ClientConfig config,
        const CryptoCapability &crypto_capability,
        const RelayerContextFactory &relayer_context_factory,
        const TxDataBuilderFactory &tx_data_builder_factory);

//destructor
    ~ZkPoolClient();

//overloaded operators
    /// disable copy/move (asset contexts hold references into the client)
    ZkPoolClient& operator=(ZkPoolClient&&) = delete;

//member functions
    std::vector<std::string> assets() const;

    /// sync an asset, returns true if the account is ready to transact
    bool update_state(const std::string &asset_id);
    /// sync until ready (bounded by the asset's ready-poll settings)
    bool wait_until_ready(const std::string &asset_id);

    native_amount_t get_total_balance(const std::string &asset_id);
    BalancesV1 get_balances(const std::string &asset_id);
    /// total balance including unconfirmed history records
    native_amount_t get_optimistic_total_balance(const std::string &asset_id);
    /// all history records in index order
    std::vector<HistoryRecordV1> get_history(const std::string &asset_id);
    /// the latest 'n' history records (most recent first)
    std::vector<HistoryRecordV1> get_last_history(const std::string &asset_id, const std::size_t n);

    FeeEstimateV1 fee_estimate(const std::string &asset_id, const native_amount_t &amount, const TxKind kind);
    native_amount_t calc_max_available_transfer(const std::string &asset_id);
    std::vector<TxPartV1> get_transaction_parts(const std::string &asset_id, const native_amount_t &amount);

    /**
    * brief: deposit - move native funds into the owner's account
    * param: asset_id -
    * param: amount - native units
    * param: sign - signs the deposit's nullifier
    * param: from_address - native address the funds come from (prefixed to the signature if set)
    * return: hashes of the mined txs
    */
    std::vector<std::string> deposit(const std::string &asset_id,
        const native_amount_t &amount,
        const DepositSigner &sign,
        const boost::optional<std::string> &from_address = boost::none);
    /**
    * brief: transfer_multi - send an amount to a shielded address, split into as many txs as needed
    * param: asset_id -
    * param: to - shielded address
    * param: amount - native units (fees excluded)
    * return: hashes of the mined txs
    */
    std::vector<std::string> transfer_multi(const std::string &asset_id,
        const std::string &to,
        const native_amount_t &amount);
    /**
    * brief: transfer_multi - send amounts to several shielded addresses, split into as many txs as needed
    * param: asset_id -
    * param: outputs - recipients in order (at most ZKPOOL_OUTPUTS_PER_TX), each amount in native units
    * return: hashes of the mined txs
    */
    std::vector<std::string> transfer_multi(const std::string &asset_id,
        const std::vector<NativeTransferOutputV1> &outputs);
    /**
    * brief: withdraw_multi - withdraw an amount to a native address, split into as many txs as needed
    * param: asset_id -
    * param: to_address - native address (hex)
    * param: amount - native units (fees excluded)
    * return: hashes of the mined txs
    */
    std::vector<std::string> withdraw_multi(const std::string &asset_id,
        const std::string &to_address,
        const native_amount_t &amount);

    /// tear down every asset's state and wipe the secret key (the client is unusable afterwards)
    void free();

private:
    AssetContext& asset_context(const std::string &asset_id);
    amount_t to_shielded_checked(const AssetContext &asset, const native_amount_t &amount) const;
    /// sync until ready and plan a transfer/withdrawal (throws if the account can't send 'amount')
    std::vector<TxPartV1> prepare_multi_part_tx(AssetContext &asset,
        const amount_t amount,
        std::vector<TxPartInputsV1> &part_inputs_out);
    /// prove and locally verify txs (throws error::tx_proof_error, nothing is submitted)
    std::vector<RelayerTxRequestV1> prove_txs(const std::vector<TxDataV1> &txs) const;
    /// submit txs, then wait for the relayer's job to finish
    std::vector<std::string> send_txs_and_wait(AssetContext &asset, const std::vector<RelayerTxRequestV1> &txs);

//member variables
    ClientConfig m_config;
    const CryptoCapability &m_crypto_capability;

    /// [ asset id : context ]
    std::unordered_map<std::string, std::unique_ptr<AssetContext>> m_assets;
};

} //namespace zkpool
