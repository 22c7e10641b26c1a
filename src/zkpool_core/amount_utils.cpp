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
#include "amount_utils.h"

//local headers
#include "ledger_entry_types.h"
#include "misc_log_ex.h"

//third party headers
#include "boost/multiprecision/cpp_int.hpp"

//standard headers
#include <limits>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "zkpool"

namespace zkpool
{
//-------------------------------------------------------------------------------------------------------------------
native_amount_t shielded_to_native(const amount_t amount, const native_amount_t &denominator)
{
    CHECK_AND_ASSERT_THROW_MES(denominator > 0, "shielded to native: denominator is zero.");

    return native_amount_t{amount} * denominator;
}
//-------------------------------------------------------------------------------------------------------------------
amount_t native_to_shielded(const native_amount_t &native_amount, const native_amount_t &denominator)
{
    CHECK_AND_ASSERT_THROW_MES(denominator > 0, "native to shielded: denominator is zero.");

    const native_amount_t shielded_amount{native_amount / denominator};
    CHECK_AND_ASSERT_THROW_MES(shielded_amount <= std::numeric_limits<amount_t>::max(),
        "native to shielded: amount does not fit in the pool's amount range.");

    return static_cast<amount_t>(shielded_amount);
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace zkpool
