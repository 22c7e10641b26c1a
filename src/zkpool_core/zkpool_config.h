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

// Protocol constants for the shielded pool and its relayer.


#pragma once

#include <cstddef>
#include <cstdint>

namespace config
{
  // each pool tx occupies one commitment slot for the account plus one per output
  const constexpr std::uint64_t ZKPOOL_OUTPUTS_PER_TX = 127;
  const constexpr std::uint64_t ZKPOOL_INDEX_STRIDE = ZKPOOL_OUTPUTS_PER_TX + 1;

  // notes spendable by a single tx (the account is an additional implicit input)
  const constexpr std::size_t ZKPOOL_MAX_INPUTS_PER_TX = 3;

  // smallest amount a tx may move (shielded units)
  const constexpr std::uint64_t ZKPOOL_DEFAULT_MIN_TX_AMOUNT = 50000000;

  // raw relayer entry layout: [mined flag][tx hash hex][commitment hex][memo hex]
  const constexpr std::size_t ZKPOOL_ENTRY_MINED_FLAG_OFFSET = 0;
  const constexpr std::size_t ZKPOOL_ENTRY_TX_HASH_OFFSET = 1;
  const constexpr std::size_t ZKPOOL_ENTRY_TX_HASH_HEX_SIZE = 64;
  const constexpr std::size_t ZKPOOL_ENTRY_COMMITMENT_OFFSET =
    ZKPOOL_ENTRY_TX_HASH_OFFSET + ZKPOOL_ENTRY_TX_HASH_HEX_SIZE;
  const constexpr std::size_t ZKPOOL_ENTRY_COMMITMENT_HEX_SIZE = 64;
  const constexpr std::size_t ZKPOOL_ENTRY_MEMO_OFFSET =
    ZKPOOL_ENTRY_COMMITMENT_OFFSET + ZKPOOL_ENTRY_COMMITMENT_HEX_SIZE;

  // The relayer only reports the delta index of the latest confirmed entry; it has no field for the tip of its
  // pending log. The sync process looks one slot past that index and always fetches a batch from there, reading on
  // until a batch comes back short.
  // todo: replace with the relayer's pending index once the relayer exposes one
  const constexpr std::uint64_t ZKPOOL_OPTIMISTIC_INDEX_LOOKAHEAD = 1;

  // relayer fetch limits
  const constexpr std::uint64_t ZKPOOL_DEFAULT_SYNC_BATCH_SIZE = 100;
  const constexpr std::size_t ZKPOOL_DEFAULT_MAX_CONCURRENT_BATCHES = 4;

  // polling
  const constexpr std::size_t ZKPOOL_DEFAULT_READY_POLL_ATTEMPTS = 20;
  const constexpr std::uint64_t ZKPOOL_DEFAULT_READY_POLL_INTERVAL_MS = 5000;
  const constexpr std::size_t ZKPOOL_DEFAULT_JOB_POLL_ATTEMPTS = 120;
  const constexpr std::uint64_t ZKPOOL_DEFAULT_JOB_POLL_INTERVAL_MS = 1000;
  const constexpr std::uint64_t ZKPOOL_DEFAULT_RELAYER_TIMEOUT_MS = 30000;
}
