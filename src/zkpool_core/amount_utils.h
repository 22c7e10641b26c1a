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

// Conversions between native asset units and shielded pool units.


#pragma once

//local headers
#include "ledger_entry_types.h"

//third party headers
#include "boost/multiprecision/cpp_int.hpp"

//standard headers

//forward declarations


namespace zkpool
{

/// native asset amount (e.g. wei)
typedef boost::multiprecision::uint256_t native_amount_t;

/**
* brief: shielded_to_native - convert a pool amount to native units
* param: amount - shielded units
* param: denominator - native units per shielded unit
* return: amount * denominator
*/
native_amount_t shielded_to_native(const amount_t amount, const native_amount_t &denominator);
/**
* brief: native_to_shielded - convert a native amount to pool units
*   - the remainder below one shielded unit is dropped
*   - throws if the result does not fit in a pool amount
* param: native_amount -
* param: denominator - native units per shielded unit
* return: native_amount / denominator
*/
amount_t native_to_shielded(const native_amount_t &native_amount, const native_amount_t &denominator);

} //namespace zkpool
