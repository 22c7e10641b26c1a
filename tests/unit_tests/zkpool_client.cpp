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

#include "wipeable_string.h"
#include "zkpool_core/ledger_entry_types.h"
#include "zkpool_core/tx_part_planner.h"
#include "zkpool_core/zkpool_config.h"
#include "zkpool_impl/zkpool_client.h"
#include "zkpool_main/account_state.h"
#include "zkpool_main/client_errors.h"
#include "zkpool_main/history_ledger.h"
#include "zkpool_main/relayer_context.h"
#include "zkpool_main/tx_data_builder.h"
#include "zkpool_mocks/crypto_capability_mock.h"
#include "zkpool_mocks/mock_relayer_context.h"
#include "zkpool_mocks/tx_data_builder_mock.h"

#include <boost/optional/optional.hpp>
#include "gtest/gtest.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <string>
#include <vector>

using zkpool::HistoryRecordType;
using zkpool::TxKind;
using zkpool::mocks::MockJobBehavior;

namespace
{

/// native units per shielded unit
const zkpool::amount_t TEST_DENOMINATOR{1000};
const zkpool::amount_t TEST_FEE{10};

////
// relayer context handle for a mock relayer shared by several clients
///
class SharedRelayerContext final : public zkpool::RelayerContext
{
public:
    explicit SharedRelayerContext(zkpool::mocks::MockRelayerContext &relayer) : m_relayer{relayer} {}

    void fetch_transactions(const std::uint64_t offset,
        const std::uint64_t limit,
        std::vector<std::string> &raw_entries_out) const override
    {
        m_relayer.fetch_transactions(offset, limit, raw_entries_out);
    }
    zkpool::RelayerInfoV1 get_info() const override { return m_relayer.get_info(); }
    std::string send_transactions(const std::vector<zkpool::RelayerTxRequestV1> &txs) override
    {
        return m_relayer.send_transactions(txs);
    }
    boost::optional<zkpool::RelayerJobV1> try_get_job(const std::string &job_id) const override
    {
        return m_relayer.try_get_job(job_id);
    }

private:
    zkpool::mocks::MockRelayerContext &m_relayer;
};

////
// mock pool: one relayer per asset, shared by every client made from the pool
///
struct MockPool final
{
    zkpool::mocks::MockRelayerContext& relayer(const std::string &asset_id)
    {
        std::unique_ptr<zkpool::mocks::MockRelayerContext> &relayer_context = m_relayers[asset_id];
        if (!relayer_context)
        {
            relayer_context = std::make_unique<zkpool::mocks::MockRelayerContext>();
            relayer_context->set_job_behavior(MockJobBehavior::COMPLETE_MINED, 0);
        }

        return *relayer_context;
    }

    zkpool::mocks::CryptoCapabilityMock m_crypto;
    std::map<std::string, std::unique_ptr<zkpool::mocks::MockRelayerContext>> m_relayers;
};

} //anonymous namespace

//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static zkpool::native_amount_t native(const zkpool::amount_t shielded_amount)
{
    return zkpool::native_amount_t{shielded_amount} * TEST_DENOMINATOR;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static std::string test_signer(const std::string &message)
{
    return "sig(" + message + ")";
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static std::string owner_tag(const std::string &secret_key)
{
    return zkpool::mocks::mock_owner_tag(epee::wipeable_string{secret_key});
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static zkpool::AssetConfig make_asset_config(const std::string &asset_id, const zkpool::amount_t min_tx_amount)
{
    zkpool::AssetConfig asset_config;
    asset_config.m_asset_id                     = asset_id;
    asset_config.m_relayer_url                  = "http://relayer.test/" + asset_id;
    asset_config.m_denominator                  = TEST_DENOMINATOR;
    asset_config.m_fee_per_tx                   = TEST_FEE;
    asset_config.m_planner_config.m_max_inputs  = 3;
    asset_config.m_planner_config.m_min_tx_amount = min_tx_amount;
    asset_config.m_ready_poll_attempts          = 1;
    asset_config.m_ready_poll_interval_ms       = 1;
    asset_config.m_job_poll_attempts            = 5;
    asset_config.m_job_poll_interval_ms         = 1;

    return asset_config;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static std::unique_ptr<zkpool::ZkPoolClient> make_client(MockPool &pool,
    const std::string &secret_key,
    const std::vector<zkpool::AssetConfig> &asset_configs)
{
    zkpool::ClientConfig client_config;
    client_config.m_secret_key = epee::wipeable_string{secret_key};
    client_config.m_assets     = asset_configs;

    return std::make_unique<zkpool::ZkPoolClient>(client_config,
            pool.m_crypto,
            [&pool](const zkpool::AssetConfig &asset_config) -> std::unique_ptr<zkpool::RelayerContext>
            {
                return std::make_unique<SharedRelayerContext>(pool.relayer(asset_config.m_asset_id));
            },
            [](const epee::wipeable_string &key,
                const zkpool::AccountState &account_state) -> std::unique_ptr<zkpool::TxDataBuilder>
            {
                return std::make_unique<zkpool::mocks::TxDataBuilderMock>(key, account_state);
            });
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static std::unique_ptr<zkpool::ZkPoolClient> make_client(MockPool &pool,
    const std::string &secret_key,
    const zkpool::amount_t min_tx_amount = 0)
{
    return make_client(pool, secret_key, {make_asset_config("token", min_tx_amount)});
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
TEST(zkpool_client, deposit)
{
    MockPool pool;
    std::unique_ptr<zkpool::ZkPoolClient> alice{make_client(pool, "alice")};

    // 1. deposit (the remainder below one shielded unit is dropped)
    std::string signed_message;
    const std::vector<std::string> tx_hashes{
            alice->deposit("token",
                native(1000) + 500,
                [&signed_message](const std::string &message) -> std::string
                {
                    signed_message = message;
                    return test_signer(message);
                },
                std::string{"0xfrom"})
        };

    ASSERT_EQ(tx_hashes.size(), 1);
    EXPECT_EQ(signed_message.size(), 66);
    EXPECT_EQ(signed_message.substr(0, 2), "0x");

    const std::vector<zkpool::RelayerTxRequestV1> submitted_txs{pool.relayer("token").submitted_txs()};
    ASSERT_EQ(submitted_txs.size(), 1);
    EXPECT_EQ(submitted_txs[0].m_kind, TxKind::DEPOSIT);
    ASSERT_TRUE(submitted_txs[0].m_deposit_signature);
    EXPECT_EQ(*submitted_txs[0].m_deposit_signature, "0xfrom" + test_signer(signed_message));
    EXPECT_TRUE(pool.m_crypto.verify(submitted_txs[0].m_proof));

    // 2. balances
    EXPECT_EQ(alice->get_total_balance("token"), native(1000));

    const zkpool::BalancesV1 balances{alice->get_balances("token")};
    EXPECT_EQ(balances.m_total, native(1000));
    EXPECT_EQ(balances.m_account, native(1000));
    EXPECT_EQ(balances.m_notes, 0);

    // 3. history
    const std::vector<zkpool::HistoryRecordV1> history{alice->get_history("token")};
    ASSERT_EQ(history.size(), 1);
    EXPECT_EQ(history[0].m_type, HistoryRecordType::DEPOSIT);
    EXPECT_EQ(history[0].m_amount, 1000);
    EXPECT_EQ(history[0].m_fee, TEST_FEE);
    EXPECT_FALSE(history[0].m_pending);
    EXPECT_EQ(history[0].m_tx_hash, tx_hashes[0]);

    // 4. a second deposit adds to the account
    ASSERT_NO_THROW(alice->deposit("token", native(500), test_signer));
    EXPECT_EQ(alice->get_total_balance("token"), native(1500));

    const zkpool::FeeEstimateV1 estimate{alice->fee_estimate("token", native(100), TxKind::DEPOSIT)};
    EXPECT_EQ(estimate.m_total, TEST_FEE);
    EXPECT_EQ(estimate.m_part_count, 1);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(zkpool_client, transfer_and_withdraw)
{
    MockPool pool;
    std::unique_ptr<zkpool::ZkPoolClient> alice{make_client(pool, "alice")};
    std::unique_ptr<zkpool::ZkPoolClient> bob{make_client(pool, "bob")};

    ASSERT_NO_THROW(alice->deposit("token", native(1000), test_signer));

    // 1. alice -> bob (paid from alice's account)
    const std::vector<zkpool::TxPartV1> expected_parts{{300, TEST_FEE, 1000}};
    EXPECT_TRUE(alice->get_transaction_parts("token", native(300)) == expected_parts);

    std::vector<std::string> tx_hashes;
    ASSERT_NO_THROW(tx_hashes = alice->transfer_multi("token", owner_tag("bob"), native(300)));
    EXPECT_EQ(tx_hashes.size(), 1);

    EXPECT_EQ(alice->get_total_balance("token"), native(690));

    const zkpool::BalancesV1 bob_balances{bob->get_balances("token")};
    EXPECT_EQ(bob_balances.m_total, native(300));
    EXPECT_EQ(bob_balances.m_account, 0);
    EXPECT_EQ(bob_balances.m_notes, native(300));

    const std::vector<zkpool::HistoryRecordV1> alice_history{alice->get_history("token")};
    ASSERT_EQ(alice_history.size(), 2);
    EXPECT_EQ(alice_history[1].m_type, HistoryRecordType::TRANSFER_OUT);
    EXPECT_EQ(alice_history[1].m_amount, 300);
    EXPECT_EQ(alice_history[1].m_fee, TEST_FEE);

    const std::vector<zkpool::HistoryRecordV1> bob_history{bob->get_last_history("token", 10)};
    ASSERT_EQ(bob_history.size(), 1);
    EXPECT_EQ(bob_history[0].m_type, HistoryRecordType::TRANSFER_IN);
    EXPECT_EQ(bob_history[0].m_amount, 300);

    // 2. bob withdraws from his note
    EXPECT_EQ(bob->calc_max_available_transfer("token"), native(290));
    ASSERT_NO_THROW(bob->withdraw_multi("token", "0xdead", native(200)));

    EXPECT_EQ(bob->get_total_balance("token"), native(90));
    EXPECT_EQ(bob->get_balances("token").m_notes, 0);

    const std::vector<zkpool::HistoryRecordV1> bob_last{bob->get_last_history("token", 1)};
    ASSERT_EQ(bob_last.size(), 1);
    EXPECT_EQ(bob_last[0].m_type, HistoryRecordType::WITHDRAWAL);
    EXPECT_EQ(bob_last[0].m_amount, 200);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(zkpool_client, multi_part_withdraw)
{
    MockPool pool;
    std::unique_ptr<zkpool::ZkPoolClient> alice{make_client(pool, "alice")};
    std::unique_ptr<zkpool::ZkPoolClient> bob{make_client(pool, "bob")};

    // bob receives five notes of 100
    ASSERT_NO_THROW(alice->deposit("token", native(1000), test_signer));
    for (std::size_t transfer_index{0}; transfer_index < 5; ++transfer_index)
        ASSERT_NO_THROW(alice->transfer_multi("token", owner_tag("bob"), native(100)));

    EXPECT_EQ(alice->get_total_balance("token"), native(450));
    EXPECT_EQ(bob->get_total_balance("token"), native(500));

    // 1. plan: three notes, then two
    const std::vector<zkpool::TxPartV1> expected_parts{{290, TEST_FEE, 0}, {60, TEST_FEE, 0}};
    EXPECT_TRUE(bob->get_transaction_parts("token", native(350)) == expected_parts);

    const zkpool::FeeEstimateV1 estimate{bob->fee_estimate("token", native(350), TxKind::WITHDRAW)};
    EXPECT_EQ(estimate.m_total, 2 * TEST_FEE);
    EXPECT_EQ(estimate.m_part_count, 2);

    // 2. both parts go out in one job
    const std::size_t num_submitted_before{pool.relayer("token").submitted_txs().size()};

    std::vector<std::string> tx_hashes;
    ASSERT_NO_THROW(tx_hashes = bob->withdraw_multi("token", "0xdead", native(350)));
    EXPECT_EQ(tx_hashes.size(), 2);

    const std::vector<zkpool::RelayerTxRequestV1> submitted_txs{pool.relayer("token").submitted_txs()};
    ASSERT_EQ(submitted_txs.size(), num_submitted_before + 2);
    EXPECT_EQ(submitted_txs[num_submitted_before].m_kind, TxKind::WITHDRAW);
    EXPECT_EQ(submitted_txs[num_submitted_before + 1].m_kind, TxKind::WITHDRAW);

    // 3. every note is spent, the change stays in the account
    const zkpool::BalancesV1 balances{bob->get_balances("token")};
    EXPECT_EQ(balances.m_total, native(130));
    EXPECT_EQ(balances.m_account, native(130));
    EXPECT_EQ(balances.m_notes, 0);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(zkpool_client, multi_recipient_transfer)
{
    MockPool pool;
    std::unique_ptr<zkpool::ZkPoolClient> alice{make_client(pool, "alice")};
    std::unique_ptr<zkpool::ZkPoolClient> bob{make_client(pool, "bob")};
    std::unique_ptr<zkpool::ZkPoolClient> carol{make_client(pool, "carol")};
    std::unique_ptr<zkpool::ZkPoolClient> dave{make_client(pool, "dave")};

    ASSERT_NO_THROW(alice->deposit("token", native(1000), test_signer));

    // 1. two recipients in one tx
    const std::vector<zkpool::NativeTransferOutputV1> alice_outputs{
            {owner_tag("carol"), native(100)},
            {owner_tag("dave"), native(50)}
        };

    std::vector<std::string> tx_hashes;
    ASSERT_NO_THROW(tx_hashes = alice->transfer_multi("token", alice_outputs));
    EXPECT_EQ(tx_hashes.size(), 1);

    EXPECT_EQ(alice->get_total_balance("token"), native(840));
    EXPECT_EQ(carol->get_total_balance("token"), native(100));
    EXPECT_EQ(dave->get_total_balance("token"), native(50));

    const std::vector<zkpool::HistoryRecordV1> alice_last{alice->get_last_history("token", 1)};
    ASSERT_EQ(alice_last.size(), 1);
    EXPECT_EQ(alice_last[0].m_type, HistoryRecordType::TRANSFER_OUT);
    EXPECT_EQ(alice_last[0].m_amount, 150);

    // 2. bob pays two recipients from five notes: parts of 290 and 60, dave's output spans both
    for (std::size_t transfer_index{0}; transfer_index < 5; ++transfer_index)
        ASSERT_NO_THROW(alice->transfer_multi("token", owner_tag("bob"), native(100)));

    const std::vector<zkpool::NativeTransferOutputV1> bob_outputs{
            {owner_tag("carol"), native(200)},
            {owner_tag("dave"), native(150)}
        };

    ASSERT_NO_THROW(tx_hashes = bob->transfer_multi("token", bob_outputs));
    EXPECT_EQ(tx_hashes.size(), 2);

    EXPECT_EQ(bob->get_total_balance("token"), native(130));
    EXPECT_EQ(carol->get_total_balance("token"), native(300));
    EXPECT_EQ(dave->get_total_balance("token"), native(200));

    const std::vector<zkpool::HistoryRecordV1> bob_last{bob->get_last_history("token", 2)};
    ASSERT_EQ(bob_last.size(), 2);
    EXPECT_EQ(bob_last[0].m_amount + bob_last[1].m_amount, 350);

    const std::vector<zkpool::HistoryRecordV1> dave_history{dave->get_history("token")};
    ASSERT_EQ(dave_history.size(), 3);
    EXPECT_EQ(dave_history[0].m_amount, 50);
    EXPECT_EQ(dave_history[1].m_amount, 90);
    EXPECT_EQ(dave_history[2].m_amount, 60);

    // 3. bad output lists
    EXPECT_THROW(alice->transfer_multi("token", std::vector<zkpool::NativeTransferOutputV1>{}),
        zkpool::error::tx_invalid_argument);
    EXPECT_THROW(alice->transfer_multi("token", {zkpool::NativeTransferOutputV1{owner_tag("carol"), 0}}),
        zkpool::error::tx_invalid_argument);
    EXPECT_THROW(alice->transfer_multi("token", {zkpool::NativeTransferOutputV1{"", native(10)}}),
        zkpool::error::tx_invalid_argument);
    EXPECT_EQ(alice->get_total_balance("token"), native(290));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(zkpool_client, amount_errors)
{
    MockPool pool;
    std::unique_ptr<zkpool::ZkPoolClient> alice{make_client(pool, "alice")};
    std::unique_ptr<zkpool::ZkPoolClient> bob{make_client(pool, "bob", 60)};

    // 1. below the minimum
    EXPECT_THROW(bob->deposit("token", native(59), test_signer), zkpool::error::tx_small_amount);
    EXPECT_THROW(bob->transfer_multi("token", owner_tag("alice"), native(59)), zkpool::error::tx_small_amount);
    EXPECT_TRUE(pool.relayer("token").submitted_txs().empty());

    // 2. beyond the transfer limit
    ASSERT_NO_THROW(alice->deposit("token", native(1000), test_signer));
    try
    {
        alice->transfer_multi("token", owner_tag("bob"), native(995));
        FAIL() << "expected a transfer limit error";
    }
    catch (const zkpool::error::tx_limit_error &e)
    {
        EXPECT_EQ(e.amount(), 995);
        EXPECT_EQ(e.limit(), 990);
    }

    // 3. within the limit, but the last note chunk is below the minimum
    for (const zkpool::amount_t amount : {100, 100, 100, 50})
        ASSERT_NO_THROW(alice->transfer_multi("token", owner_tag("bob"), native(amount)));

    EXPECT_EQ(bob->calc_max_available_transfer("token"), native(330));
    EXPECT_THROW(bob->withdraw_multi("token", "0xdead", native(330)), zkpool::error::insufficient_funds);
    EXPECT_THROW(bob->fee_estimate("token", native(330), TxKind::WITHDRAW), zkpool::error::insufficient_funds);

    // 4. out of the pool's amount range
    const zkpool::native_amount_t huge_amount{
            zkpool::native_amount_t{std::numeric_limits<zkpool::amount_t>::max()} * TEST_DENOMINATOR * 2
        };
    EXPECT_THROW(alice->deposit("token", huge_amount, test_signer), zkpool::error::tx_invalid_argument);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(zkpool_client, not_ready)
{
    MockPool pool;
    std::unique_ptr<zkpool::ZkPoolClient> alice{make_client(pool, "alice")};

    ASSERT_NO_THROW(alice->deposit("token", native(1000), test_signer));

    // an unconfirmed withdrawal made elsewhere with alice's key
    pool.relayer("token").add_pending_tx(
            zkpool::mocks::make_mock_memo({
                    zkpool::mocks::MockMemoSectionV1{owner_tag("alice"), TxKind::WITHDRAW, true, 100, 10, 890, 0, {}}
                })
        );

    EXPECT_THROW(alice->transfer_multi("token", owner_tag("bob"), native(100)), zkpool::error::not_ready_error);
    EXPECT_EQ(pool.relayer("token").submitted_txs().size(), 1);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(zkpool_client, relayer_job_errors)
{
    MockPool pool;
    std::unique_ptr<zkpool::ZkPoolClient> alice{make_client(pool, "alice")};
    zkpool::mocks::MockRelayerContext &relayer{pool.relayer("token")};

    // 1. failed job
    relayer.set_job_behavior(MockJobBehavior::FAIL, 0);
    try
    {
        alice->deposit("token", native(100), test_signer);
        FAIL() << "expected a relayer job error";
    }
    catch (const zkpool::error::relayer_job_error &e)
    {
        EXPECT_EQ(e.reason(), "mock relayer rejected the txs");
    }

    // 2. lost job
    relayer.set_job_behavior(MockJobBehavior::LOSE, 0);
    EXPECT_THROW(alice->deposit("token", native(100), test_signer), zkpool::error::relayer_job_not_found);

    // 3. a job that stays pending longer than the client polls
    relayer.set_job_behavior(MockJobBehavior::COMPLETE_MINED, 10);
    const std::size_t num_job_polls{relayer.num_job_polls()};

    EXPECT_THROW(alice->deposit("token", native(100), test_signer), zkpool::error::relayer_job_error);
    EXPECT_EQ(relayer.num_job_polls(), num_job_polls + 5);

    // 4. a job that completes after a few polls
    relayer.set_job_behavior(MockJobBehavior::COMPLETE_MINED, 2);

    std::vector<std::string> tx_hashes;
    ASSERT_NO_THROW(tx_hashes = alice->deposit("token", native(100), test_signer));
    EXPECT_EQ(tx_hashes.size(), 1);
    EXPECT_EQ(relayer.num_job_polls(), num_job_polls + 5 + 3);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(zkpool_client, invalid_proof)
{
    MockPool pool;
    std::unique_ptr<zkpool::ZkPoolClient> alice{make_client(pool, "alice")};

    ASSERT_NO_THROW(alice->deposit("token", native(1000), test_signer));
    const std::size_t num_submitted{pool.relayer("token").submitted_txs().size()};

    // a proof that fails local verification is never sent
    pool.m_crypto.set_produce_invalid_proofs(true);

    EXPECT_THROW(alice->deposit("token", native(100), test_signer), zkpool::error::tx_proof_error);
    EXPECT_THROW(alice->withdraw_multi("token", "0xdead", native(100)), zkpool::error::tx_proof_error);
    EXPECT_EQ(pool.relayer("token").submitted_txs().size(), num_submitted);

    pool.m_crypto.set_produce_invalid_proofs(false);
    EXPECT_NO_THROW(alice->withdraw_multi("token", "0xdead", native(100)));
    EXPECT_EQ(alice->get_total_balance("token"), native(890));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(zkpool_client, optimistic_balance)
{
    MockPool pool;
    std::unique_ptr<zkpool::ZkPoolClient> alice{make_client(pool, "alice")};
    std::unique_ptr<zkpool::ZkPoolClient> bob{make_client(pool, "bob")};

    ASSERT_NO_THROW(alice->deposit("token", native(1000), test_signer));

    // the transfer is accepted by the relayer but not mined
    pool.relayer("token").set_job_behavior(MockJobBehavior::COMPLETE_PENDING, 0);
    ASSERT_NO_THROW(alice->transfer_multi("token", owner_tag("bob"), native(300)));

    EXPECT_EQ(bob->get_optimistic_total_balance("token"), native(300));
    EXPECT_EQ(bob->get_total_balance("token"), 0);

    const std::vector<zkpool::HistoryRecordV1> bob_last{bob->get_last_history("token", 1)};
    ASSERT_EQ(bob_last.size(), 1);
    EXPECT_EQ(bob_last[0].m_type, HistoryRecordType::TRANSFER_IN);
    EXPECT_TRUE(bob_last[0].m_pending);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(zkpool_client, assets)
{
    MockPool pool;
    std::unique_ptr<zkpool::ZkPoolClient> alice{
            make_client(pool, "alice", {make_asset_config("tokenB", 0), make_asset_config("tokenA", 0)})
        };

    const std::vector<std::string> expected_assets{"tokenA", "tokenB"};
    EXPECT_TRUE(alice->assets() == expected_assets);

    // assets are independent
    ASSERT_NO_THROW(alice->deposit("tokenA", native(1000), test_signer));
    EXPECT_EQ(alice->get_total_balance("tokenA"), native(1000));
    EXPECT_EQ(alice->get_total_balance("tokenB"), 0);
    EXPECT_EQ(pool.relayer("tokenB").num_mined_txs(), 0);

    // unknown asset
    EXPECT_THROW(alice->get_total_balance("tokenC"), zkpool::error::tx_invalid_argument);

    // duplicate asset
    EXPECT_THROW(make_client(pool, "bob", {make_asset_config("tokenA", 0), make_asset_config("tokenA", 0)}),
        zkpool::error::tx_invalid_argument);

    // teardown
    alice->free();
    EXPECT_TRUE(alice->assets().empty());
    EXPECT_THROW(alice->get_total_balance("tokenA"), zkpool::error::tx_invalid_argument);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(zkpool_client, invalid_arguments)
{
    MockPool pool;
    std::unique_ptr<zkpool::ZkPoolClient> alice{make_client(pool, "alice")};

    EXPECT_THROW(alice->deposit("token", native(100), zkpool::DepositSigner{}), zkpool::error::tx_invalid_argument);
    EXPECT_THROW(alice->deposit("token", native(100), [](const std::string&) { return std::string{}; }),
        zkpool::error::tx_invalid_argument);
    EXPECT_THROW(alice->transfer_multi("token", "", native(100)), zkpool::error::tx_invalid_argument);
    EXPECT_THROW(alice->withdraw_multi("token", "", native(100)), zkpool::error::tx_invalid_argument);
    EXPECT_THROW(make_client(pool, ""), zkpool::error::tx_invalid_argument);
}
//-------------------------------------------------------------------------------------------------------------------
