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

// Dependency injector for the relayer that holds the pool's commitment log.


#pragma once

//local headers
#include "crypto_capability.h"
#include "zkpool_core/ledger_entry_types.h"

//third party headers
#include <boost/optional/optional.hpp>

//standard headers
#include <cstdint>
#include <string>
#include <vector>

//forward declarations


namespace zkpool
{

struct RelayerInfoV1 final
{
    /// merkle root of the confirmed commitment tree (decimal or hex, as reported)
    std::string m_root;
    /// index of the last confirmed commitment slot (uint64 max when the log is empty)
    std::uint64_t m_delta_index;
};

enum class RelayerJobState : unsigned char
{
    PENDING,
    FAILED,
    COMPLETED
};

struct RelayerJobV1 final
{
    RelayerJobState m_state;
    /// hashes of the txs the job put on the ledger
    std::vector<std::string> m_tx_hashes;
    /// reported when the job failed
    std::string m_failure_reason;
};

struct RelayerTxRequestV1 final
{
    TxKind m_kind;
    /// encrypted memo (binary)
    std::string m_memo;
    TxProofV1 m_proof;
    /// deposits only
    boost::optional<std::string> m_deposit_signature;
};

////
// RelayerContext
// - read access to the relayer's commitment log, plus tx submission
///
class RelayerContext
{
public:
//destructor
    virtual ~RelayerContext() = default;

//overloaded operators
    /// disable copy/move (this is a pure virtual base class)
    RelayerContext& operator=(RelayerContext&&) = delete;

//member functions
    /// get up to 'limit' raw log entries, starting at log index 'offset' (mined entries first)
    virtual void fetch_transactions(const std::uint64_t offset,
        const std::uint64_t limit,
        std::vector<std::string> &raw_entries_out) const = 0;
    virtual RelayerInfoV1 get_info() const = 0;
    /// submit txs, returns a job id
    virtual std::string send_transactions(const std::vector<RelayerTxRequestV1> &txs) = 0;
    /// returns boost::none if the relayer doesn't know the job
    virtual boost::optional<RelayerJobV1> try_get_job(const std::string &job_id) const = 0;
};

} //namespace zkpool
