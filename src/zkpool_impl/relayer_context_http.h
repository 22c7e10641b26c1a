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

// Relayer context backed by the relayer's HTTP/JSON API.


#pragma once

//local headers
#include "net/abstract_http_client.h"
#include "zkpool_main/relayer_context.h"

//third party headers
#include <boost/optional/optional.hpp>
#include <boost/thread/mutex.hpp>

//standard headers
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

//forward declarations


namespace zkpool
{

/// response parsing and request encoding (throw error::relayer_error on malformed input)
void parse_transactions_response(const std::string &body, std::vector<std::string> &raw_entries_out);
RelayerInfoV1 parse_info_response(const std::string &body);
std::string make_send_transactions_request(const std::vector<RelayerTxRequestV1> &txs);
std::string parse_send_transactions_response(const std::string &body);
/// a JSON string body means the relayer doesn't know the job
boost::optional<RelayerJobV1> parse_job_response(const std::string &body);

////
// RelayerContextHttp
// - endpoints: GET /transactions?offset=&limit=, GET /info, POST /sendTransactions, GET /job/{id}
// - requests are serialized over one http client
///
class RelayerContextHttp final : public RelayerContext
{
public:
//constructors
    /// relayer_url: e.g. 'https://relayer.example.com/pool'
    RelayerContextHttp(const std::string &relayer_url,
        std::unique_ptr<epee::net_utils::http::abstract_http_client> http_client,
        const std::chrono::milliseconds timeout);

//member functions
    void fetch_transactions(const std::uint64_t offset,
        const std::uint64_t limit,
        std::vector<std::string> &raw_entries_out) const override;
    RelayerInfoV1 get_info() const override;
    std::string send_transactions(const std::vector<RelayerTxRequestV1> &txs) override;
    boost::optional<RelayerJobV1> try_get_job(const std::string &job_id) const override;

private:
    /// perform a request, returns the response body (2xx only)
    std::string invoke_impl(const std::string &path, const std::string &method, const std::string &body) const;

//member variables
    /// relayer host (for error reports)
    std::string m_host;
    /// uri prefix of every endpoint
    std::string m_base_path;
    std::chrono::milliseconds m_timeout;

    mutable boost::mutex m_http_mutex;
    std::unique_ptr<epee::net_utils::http::abstract_http_client> m_http_client;
};

/// relayer context over a plain epee http client
std::unique_ptr<RelayerContext> make_relayer_context_http(const std::string &relayer_url,
    const std::chrono::milliseconds timeout);

} //namespace zkpool
