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

// Exceptions reported by the pool client.


#pragma once

//local headers
#include "misc_log_ex.h"
#include "zkpool_core/ledger_entry_types.h"

//third party headers

//standard headers
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <typeinfo>
#include <utility>

//forward declarations


namespace zkpool
{
namespace error
{
// zkpool_error_base
//   zkpool_logic_error
//     internal_error
//   zkpool_runtime_error
//     network_error
//     relayer_error
//     relayer_job_error
//     relayer_job_not_found
//     not_ready_error
//     tx_error
//       tx_small_amount
//       tx_limit_error
//       insufficient_funds
//       tx_proof_error
//       tx_invalid_argument

template<typename Base>
struct zkpool_error_base : public Base
{
    const std::string& location() const { return m_loc; }

    std::string to_string() const
    {
        std::ostringstream ss;
        ss << m_loc << ':' << typeid(*this).name() << ": " << Base::what();
        return ss.str();
    }

protected:
    zkpool_error_base(std::string &&loc, const std::string &message) :
        Base(message),
        m_loc(std::move(loc))
    {}

private:
    std::string m_loc;
};
//----------------------------------------------------------------------------------------------------
typedef zkpool_error_base<std::logic_error> zkpool_logic_error;
typedef zkpool_error_base<std::runtime_error> zkpool_runtime_error;
//----------------------------------------------------------------------------------------------------
struct internal_error : public zkpool_logic_error
{
    explicit internal_error(std::string &&loc, const std::string &message) :
        zkpool_logic_error(std::move(loc), message)
    {}
};
//----------------------------------------------------------------------------------------------------
struct network_error : public zkpool_runtime_error
{
    explicit network_error(std::string &&loc, const std::string &host, const std::string &message = "network error") :
        zkpool_runtime_error(std::move(loc), message + " (" + host + ")"),
        m_host(host)
    {}

    const std::string& host() const { return m_host; }

private:
    std::string m_host;
};
//----------------------------------------------------------------------------------------------------
struct relayer_error : public zkpool_runtime_error
{
    explicit relayer_error(std::string &&loc, const int code, const std::string &message) :
        zkpool_runtime_error(std::move(loc), "relayer error " + std::to_string(code) + ": " + message),
        m_code(code)
    {}

    int code() const { return m_code; }

private:
    int m_code;
};
//----------------------------------------------------------------------------------------------------
struct relayer_job_error : public zkpool_runtime_error
{
    explicit relayer_job_error(std::string &&loc, const std::string &job_id, const std::string &reason) :
        zkpool_runtime_error(std::move(loc), "relayer job " + job_id + " failed: " + reason),
        m_job_id(job_id),
        m_reason(reason)
    {}

    const std::string& job_id() const { return m_job_id; }
    const std::string& reason() const { return m_reason; }

private:
    std::string m_job_id;
    std::string m_reason;
};
//----------------------------------------------------------------------------------------------------
struct relayer_job_not_found : public zkpool_runtime_error
{
    explicit relayer_job_not_found(std::string &&loc, const std::string &job_id) :
        zkpool_runtime_error(std::move(loc), "relayer job " + job_id + " not found"),
        m_job_id(job_id)
    {}

    const std::string& job_id() const { return m_job_id; }

private:
    std::string m_job_id;
};
//----------------------------------------------------------------------------------------------------
struct not_ready_error : public zkpool_runtime_error
{
    explicit not_ready_error(std::string &&loc) :
        zkpool_runtime_error(std::move(loc), "account has an unconfirmed outgoing tx")
    {}
};
//----------------------------------------------------------------------------------------------------
struct tx_error : public zkpool_runtime_error
{
protected:
    explicit tx_error(std::string &&loc, const std::string &message) :
        zkpool_runtime_error(std::move(loc), message)
    {}
};
//----------------------------------------------------------------------------------------------------
struct tx_small_amount : public tx_error
{
    explicit tx_small_amount(std::string &&loc, const amount_t amount, const amount_t min_amount) :
        tx_error(std::move(loc),
            "amount " + std::to_string(amount) + " is below the minimum of " + std::to_string(min_amount)),
        m_amount(amount),
        m_min_amount(min_amount)
    {}

    amount_t amount() const { return m_amount; }
    amount_t min_amount() const { return m_min_amount; }

private:
    amount_t m_amount;
    amount_t m_min_amount;
};
//----------------------------------------------------------------------------------------------------
struct tx_limit_error : public tx_error
{
    explicit tx_limit_error(std::string &&loc, const amount_t amount, const amount_t limit) :
        tx_error(std::move(loc),
            "amount " + std::to_string(amount) + " exceeds the transfer limit of " + std::to_string(limit)),
        m_amount(amount),
        m_limit(limit)
    {}

    amount_t amount() const { return m_amount; }
    amount_t limit() const { return m_limit; }

private:
    amount_t m_amount;
    amount_t m_limit;
};
//----------------------------------------------------------------------------------------------------
struct insufficient_funds : public tx_error
{
    explicit insufficient_funds(std::string &&loc, const amount_t needed, const amount_t available) :
        tx_error(std::move(loc),
            "insufficient funds: needed " + std::to_string(needed) + ", available " + std::to_string(available)),
        m_needed(needed),
        m_available(available)
    {}

    amount_t needed() const { return m_needed; }
    amount_t available() const { return m_available; }

private:
    amount_t m_needed;
    amount_t m_available;
};
//----------------------------------------------------------------------------------------------------
struct tx_proof_error : public tx_error
{
    explicit tx_proof_error(std::string &&loc) :
        tx_error(std::move(loc), "invalid tx proof")
    {}
};
//----------------------------------------------------------------------------------------------------
struct tx_invalid_argument : public tx_error
{
    explicit tx_invalid_argument(std::string &&loc, const std::string &message) :
        tx_error(std::move(loc), "invalid argument: " + message)
    {}
};
//----------------------------------------------------------------------------------------------------
template<typename TException, typename... TArgs>
void throw_zkpool_ex(std::string &&loc, const TArgs&... args)
{
    TException e(std::move(loc), args...);
    LOG_PRINT_L0(e.to_string());
    throw e;
}
//----------------------------------------------------------------------------------------------------
} //namespace error
} //namespace zkpool

#define ZKPOOL_STRINGIZE_DETAIL(x) #x
#define ZKPOOL_STRINGIZE(x) ZKPOOL_STRINGIZE_DETAIL(x)

#define THROW_ZKPOOL_EXCEPTION(err_type, ...)                                                                   \
    do {                                                                                                        \
        LOG_ERROR("THROW EXCEPTION: " << #err_type);                                                            \
        zkpool::error::throw_zkpool_ex<err_type>(std::string(__FILE__ ":" ZKPOOL_STRINGIZE(__LINE__)), ## __VA_ARGS__); \
    } while(0)

#define THROW_ZKPOOL_EXCEPTION_IF(cond, err_type, ...)                                                          \
    if (cond)                                                                                                   \
    {                                                                                                           \
        LOG_ERROR(#cond << ". THROW EXCEPTION: " << #err_type);                                                 \
        zkpool::error::throw_zkpool_ex<err_type>(std::string(__FILE__ ":" ZKPOOL_STRINGIZE(__LINE__)), ## __VA_ARGS__); \
    }
