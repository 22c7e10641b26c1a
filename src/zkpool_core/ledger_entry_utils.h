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

// Utilities for decoding and classifying raw relayer log entries.


#pragma once

//local headers
#include "ledger_entry_types.h"

//third party headers

//standard headers
#include <cstdint>
#include <string>
#include <vector>

//forward declarations


namespace zkpool
{

/**
* brief: check_v1_raw_ledger_entry_semantics_v1 - validate the fixed-offset layout of a raw log entry
*   - throws on failure
* param: raw_entry - [mined flag][tx hash hex][commitment hex][memo hex]
*/
void check_v1_raw_ledger_entry_semantics_v1(const std::string &raw_entry);
/**
* brief: parse_ledger_entry_v1 - decode a raw log entry
* param: raw_entry -
* param: index - log index assigned to the entry
* outparam: entry_out -
*/
void parse_ledger_entry_v1(const std::string &raw_entry, const std::uint64_t index, LedgerEntryV1 &entry_out);
/**
* brief: make_raw_ledger_entry_v1 - encode a log entry in the relayer's raw layout
* param: mined -
* param: tx_hash - 64 hex chars
* param: commitment - 64 hex chars
* param: memo - binary memo
* return: raw entry
*/
std::string make_raw_ledger_entry_v1(const bool mined,
    const std::string &tx_hash,
    const std::string &commitment,
    const std::string &memo);
/**
* brief: classify_ledger_entries_v1 - split a contiguous run of raw entries into mined and pending txs
*   - entry i is assigned index 'first_index + i * stride'
*   - a mined entry may not follow a pending entry
* param: raw_entries - entries in arrival order
* param: first_index - index of the first entry
* outparam: classified_out -
*/
void classify_ledger_entries_v1(const std::vector<std::string> &raw_entries,
    const std::uint64_t first_index,
    ClassifiedEntriesV1 &classified_out);

} //namespace zkpool
