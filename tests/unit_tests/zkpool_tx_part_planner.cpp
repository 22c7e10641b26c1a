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

#include "misc_log_ex.h"
#include "zkpool_core/ledger_entry_types.h"
#include "zkpool_core/tx_part_planner.h"
#include "zkpool_core/zkpool_config.h"

#include "gtest/gtest.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static std::vector<zkpool::OwnedNoteV1> make_notes(const std::vector<zkpool::amount_t> &amounts)
{
    std::vector<zkpool::OwnedNoteV1> notes;

    for (std::size_t note_index{0}; note_index < amounts.size(); ++note_index)
        notes.emplace_back(zkpool::OwnedNoteV1{note_index + 1, amounts[note_index], ""});

    return notes;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static zkpool::TxPlannerConfig make_planner_config(const std::size_t max_inputs, const zkpool::amount_t min_tx_amount)
{
    zkpool::TxPlannerConfig planner_config;
    planner_config.m_max_inputs    = max_inputs;
    planner_config.m_min_tx_amount = min_tx_amount;

    return planner_config;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void tx_part_planner_test(const zkpool::amount_t target_amount,
    const zkpool::amount_t fee_per_tx,
    const std::vector<zkpool::amount_t> &note_amounts,
    const zkpool::amount_t account_balance,
    const zkpool::TxPlannerConfig &planner_config,
    const std::vector<zkpool::TxPartV1> &expected_parts)
{
    const std::vector<zkpool::TxPartV1> tx_parts{
            zkpool::plan_tx_parts_v1(target_amount,
                fee_per_tx,
                make_notes(note_amounts),
                account_balance,
                planner_config)
        };

    // 1. expected parts in expected order
    CHECK_AND_ASSERT_THROW_MES(tx_parts == expected_parts, "unexpected tx parts");

    if (tx_parts.empty())
        return;

    // 2. the parts deliver exactly the target and each pays the flat fee
    zkpool::amount_t total_delivered{0};
    for (const zkpool::TxPartV1 &tx_part : tx_parts)
    {
        CHECK_AND_ASSERT_THROW_MES(tx_part.m_fee == fee_per_tx, "unexpected part fee");
        total_delivered += tx_part.m_amount;
    }

    CHECK_AND_ASSERT_THROW_MES(total_delivered == target_amount, "parts don't deliver the target");

    // 3. only the first part draws on the account
    for (std::size_t part_index{1}; part_index < tx_parts.size(); ++part_index)
        CHECK_AND_ASSERT_THROW_MES(tx_parts[part_index].m_account_limit == 0, "a later part draws on the account");
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
TEST(zkpool_tx_part_planner, account_covers_target)
{
    //test(target, fee, notes, balance, config, expected parts)
    const zkpool::TxPlannerConfig planner_config{make_planner_config(3, 0)};

    // balance exactly covers target + fee
    EXPECT_NO_THROW(tx_part_planner_test(90, 10, {}, 100, planner_config, {{90, 10, 100}}));

    // notes are ignored when the account suffices
    EXPECT_NO_THROW(tx_part_planner_test(50, 10, {100, 100}, 100, planner_config, {{50, 10, 100}}));

    // zero fee
    EXPECT_NO_THROW(tx_part_planner_test(100, 0, {}, 100, planner_config, {{100, 0, 100}}));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(zkpool_tx_part_planner, note_chunks)
{
    //test(target, fee, notes, balance, config, expected parts)
    const zkpool::TxPlannerConfig planner_config{make_planner_config(3, 0)};

    // five notes of 100 in chunks of 3: the first chunk covers 250 + 10
    EXPECT_NO_THROW(tx_part_planner_test(250, 10, {100, 100, 100, 100, 100}, 0, planner_config, {{250, 10, 0}}));

    // the target spills into the second chunk
    EXPECT_NO_THROW(tx_part_planner_test(350, 10, {100, 100, 100, 100, 100}, 0, planner_config,
        {{290, 10, 0}, {60, 10, 0}}));

    // every note is consumed
    EXPECT_NO_THROW(tx_part_planner_test(480, 10, {100, 100, 100, 100, 100}, 0, planner_config,
        {{290, 10, 0}, {190, 10, 0}}));

    // the account balance joins the first chunk
    EXPECT_NO_THROW(tx_part_planner_test(400, 10, {100, 100, 100, 100}, 50, planner_config,
        {{340, 10, 50}, {60, 10, 0}}));

    // single-input chunks
    EXPECT_NO_THROW(tx_part_planner_test(150, 5, {60, 60, 60}, 0, make_planner_config(1, 0),
        {{55, 5, 0}, {55, 5, 0}, {40, 5, 0}}));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(zkpool_tx_part_planner, infeasible)
{
    //test(target, fee, notes, balance, config, expected parts)
    const zkpool::TxPlannerConfig planner_config{make_planner_config(3, 0)};

    // the notes don't cover target + fees
    EXPECT_NO_THROW(tx_part_planner_test(500, 10, {100, 100, 100, 100, 100}, 0, planner_config, {}));

    // nothing to spend
    EXPECT_NO_THROW(tx_part_planner_test(1, 0, {}, 0, planner_config, {}));

    // the last chunk can't pay its own fee
    EXPECT_NO_THROW(tx_part_planner_test(295, 10, {100, 100, 100, 5}, 0, planner_config, {}));

    // a chunk below the minimum tx amount stops planning
    EXPECT_NO_THROW(tx_part_planner_test(320, 10, {100, 100, 100, 40}, 0, make_planner_config(3, 50), {}));
    EXPECT_NO_THROW(tx_part_planner_test(320, 10, {100, 100, 100, 40}, 0, make_planner_config(3, 40),
        {{290, 10, 0}, {30, 10, 0}}));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(zkpool_tx_part_planner, large_amounts)
{
    //test(target, fee, notes, balance, config, expected parts)
    const zkpool::amount_t max_amount{std::numeric_limits<zkpool::amount_t>::max()};
    const zkpool::TxPlannerConfig planner_config{make_planner_config(3, 0)};

    // target + fee overflows 64 bits: the account can't cover it
    EXPECT_NO_THROW(tx_part_planner_test(max_amount, 1, {}, max_amount, planner_config, {}));

    // note sums beyond 64 bits are clamped to the remaining target
    EXPECT_NO_THROW(tx_part_planner_test(max_amount - 1, 1, {max_amount, max_amount}, 0, planner_config,
        {{max_amount - 1, 1, 0}}));
}
//-------------------------------------------------------------------------------------------------------------------
TEST(zkpool_tx_part_planner, deterministic)
{
    const zkpool::TxPlannerConfig planner_config{make_planner_config(2, 0)};
    const std::vector<zkpool::OwnedNoteV1> notes{make_notes({70, 20, 90, 10, 40})};

    const std::vector<zkpool::TxPartV1> tx_parts{zkpool::plan_tx_parts_v1(200, 5, notes, 15, planner_config)};

    for (std::size_t attempt{0}; attempt < 10; ++attempt)
        EXPECT_TRUE(zkpool::plan_tx_parts_v1(200, 5, notes, 15, planner_config) == tx_parts);
}
//-------------------------------------------------------------------------------------------------------------------
TEST(zkpool_tx_part_planner, estimate_part_count)
{
    EXPECT_EQ(zkpool::estimate_tx_part_count_v1(0, 3), 1);
    EXPECT_EQ(zkpool::estimate_tx_part_count_v1(3, 3), 1);
    EXPECT_EQ(zkpool::estimate_tx_part_count_v1(4, 3), 2);
    EXPECT_EQ(zkpool::estimate_tx_part_count_v1(6, 3), 2);
    EXPECT_EQ(zkpool::estimate_tx_part_count_v1(7, 3), 3);
    EXPECT_EQ(zkpool::estimate_tx_part_count_v1(5, 1), 5);

    EXPECT_ANY_THROW(zkpool::estimate_tx_part_count_v1(5, 0));
    EXPECT_ANY_THROW(zkpool::plan_tx_parts_v1(1, 0, {}, 0, make_planner_config(0, 0)));
}
//-------------------------------------------------------------------------------------------------------------------
