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
#include "relayer_context_http.h"

//local headers
#include "misc_log_ex.h"
#include "net/http_base.h"
#include "net/http_client.h"
#include "net/net_parse_helpers.h"
#include "net/net_ssl.h"
#include "string_tools.h"
#include "zkpool_core/ledger_entry_types.h"
#include "zkpool_main/client_errors.h"
#include "zkpool_main/relayer_context.h"

//third party headers
#include <boost/lexical_cast.hpp>
#include <boost/optional/optional.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/mutex.hpp>
#include "rapidjson/document.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

//standard headers
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#undef MONERO_DEFAULT_LOG_CATEGORY
#define MONERO_DEFAULT_LOG_CATEGORY "zkpool.relayer"

namespace zkpool
{
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static void parse_json_document(const std::string &body, rapidjson::Document &document_out)
{
    document_out.Parse(body.c_str(), body.size());

    THROW_ZKPOOL_EXCEPTION_IF(document_out.HasParseError(), error::relayer_error, 200, "response is not JSON");
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static std::string json_string(const rapidjson::Value &value)
{
    return std::string{value.GetString(), value.GetStringLength()};
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static std::uint64_t json_uint64(const rapidjson::Value &value, const char *field_name)
{
    if (value.IsUint64())
        return value.GetUint64();

    THROW_ZKPOOL_EXCEPTION_IF(!value.IsString(), error::relayer_error, 200,
        std::string{"field '"} + field_name + "' is not an integer");

    try { return boost::lexical_cast<std::uint64_t>(json_string(value)); }
    catch (const boost::bad_lexical_cast&)
    {
        THROW_ZKPOOL_EXCEPTION(error::relayer_error, 200,
            std::string{"field '"} + field_name + "' is not an integer");
    }

    return 0;
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
static const char* tx_kind_to_relayer_type(const TxKind kind)
{
    switch (kind)
    {
        case TxKind::DEPOSIT:  return "0000";
        case TxKind::TRANSFER: return "0001";
        case TxKind::WITHDRAW: return "0002";
        default:               return "";
    }
}
//-------------------------------------------------------------------------------------------------------------------
//-------------------------------------------------------------------------------------------------------------------
void parse_transactions_response(const std::string &body, std::vector<std::string> &raw_entries_out)
{
    rapidjson::Document document;
    parse_json_document(body, document);

    THROW_ZKPOOL_EXCEPTION_IF(!document.IsArray(), error::relayer_error, 200, "transactions response is not an array");

    raw_entries_out.clear();
    raw_entries_out.reserve(document.Size());

    for (rapidjson::SizeType entry_index{0}; entry_index < document.Size(); ++entry_index)
    {
        THROW_ZKPOOL_EXCEPTION_IF(!document[entry_index].IsString(), error::relayer_error, 200,
            "transactions response has a non-string entry");

        raw_entries_out.emplace_back(json_string(document[entry_index]));
    }
}
//-------------------------------------------------------------------------------------------------------------------
RelayerInfoV1 parse_info_response(const std::string &body)
{
    rapidjson::Document document;
    parse_json_document(body, document);

    THROW_ZKPOOL_EXCEPTION_IF(!document.IsObject() ||
            !document.HasMember("root") ||
            !document.HasMember("deltaIndex"),
        error::relayer_error, 200, "info response is missing fields");

    RelayerInfoV1 info;
    info.m_delta_index = json_uint64(document["deltaIndex"], "deltaIndex");

    const rapidjson::Value &root{document["root"]};
    info.m_root = root.IsString() ? json_string(root) : std::to_string(json_uint64(root, "root"));

    return info;
}
//-------------------------------------------------------------------------------------------------------------------
std::string make_send_transactions_request(const std::vector<RelayerTxRequestV1> &txs)
{
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer{buffer};

    writer.StartArray();
    for (const RelayerTxRequestV1 &tx : txs)
    {
        const std::string memo_hex{epee::string_tools::buff_to_hex_nodelimer(tx.m_memo)};

        writer.StartObject();
        writer.Key("proof");
        writer.StartObject();
        writer.Key("inputs");
        writer.String(tx.m_proof.m_inputs.c_str(), tx.m_proof.m_inputs.size());
        writer.Key("proof");
        writer.String(tx.m_proof.m_proof.c_str(), tx.m_proof.m_proof.size());
        writer.EndObject();
        writer.Key("memo");
        writer.String(memo_hex.c_str(), memo_hex.size());
        writer.Key("txType");
        writer.String(tx_kind_to_relayer_type(tx.m_kind));
        if (tx.m_deposit_signature)
        {
            writer.Key("depositSignature");
            writer.String(tx.m_deposit_signature->c_str(), tx.m_deposit_signature->size());
        }
        writer.EndObject();
    }
    writer.EndArray();

    return std::string{buffer.GetString(), buffer.GetSize()};
}
//-------------------------------------------------------------------------------------------------------------------
std::string parse_send_transactions_response(const std::string &body)
{
    rapidjson::Document document;
    parse_json_document(body, document);

    THROW_ZKPOOL_EXCEPTION_IF(!document.IsObject() || !document.HasMember("jobId"),
        error::relayer_error, 200, "send transactions response has no job id");

    const rapidjson::Value &job_id{document["jobId"]};

    return job_id.IsString() ? json_string(job_id) : std::to_string(json_uint64(job_id, "jobId"));
}
//-------------------------------------------------------------------------------------------------------------------
boost::optional<RelayerJobV1> parse_job_response(const std::string &body)
{
    rapidjson::Document document;
    parse_json_document(body, document);

    if (document.IsString())
        return boost::none;

    THROW_ZKPOOL_EXCEPTION_IF(!document.IsObject() ||
            !document.HasMember("state") ||
            !document["state"].IsString(),
        error::relayer_error, 200, "job response has no state");

    RelayerJobV1 job{RelayerJobState::PENDING, {}, ""};

    const std::string state{json_string(document["state"])};
    if (state == "completed")
        job.m_state = RelayerJobState::COMPLETED;
    else if (state == "failed")
        job.m_state = RelayerJobState::FAILED;

    // tx hashes: one string or an array of strings
    if (document.HasMember("txHash"))
    {
        const rapidjson::Value &tx_hash{document["txHash"]};

        if (tx_hash.IsString())
            job.m_tx_hashes.emplace_back(json_string(tx_hash));
        else if (tx_hash.IsArray())
        {
            for (rapidjson::SizeType hash_index{0}; hash_index < tx_hash.Size(); ++hash_index)
            {
                if (tx_hash[hash_index].IsString())
                    job.m_tx_hashes.emplace_back(json_string(tx_hash[hash_index]));
            }
        }
    }

    if (document.HasMember("failedReason") && document["failedReason"].IsString())
        job.m_failure_reason = json_string(document["failedReason"]);

    return job;
}
//-------------------------------------------------------------------------------------------------------------------
RelayerContextHttp::RelayerContextHttp(const std::string &relayer_url,
    std::unique_ptr<epee::net_utils::http::abstract_http_client> http_client,
    const std::chrono::milliseconds timeout) :
        m_timeout{timeout},
        m_http_client{std::move(http_client)}
{
    CHECK_AND_ASSERT_THROW_MES(m_http_client, "relayer http context: no http client.");

    epee::net_utils::http::url_content url;
    THROW_ZKPOOL_EXCEPTION_IF(!epee::net_utils::parse_url(relayer_url, url), error::tx_invalid_argument,
        "invalid relayer url '" + relayer_url + "'");

    const bool use_ssl{url.schema == "https"};
    const std::uint64_t port{url.port != 0 ? url.port : (use_ssl ? 443 : 80)};

    m_host      = url.host;
    m_base_path = url.uri;
    while (!m_base_path.empty() && m_base_path.back() == '/')
        m_base_path.pop_back();

    m_http_client->set_server(url.host,
        std::to_string(port),
        boost::none,
        use_ssl ? epee::net_utils::ssl_support_t::e_ssl_support_enabled
                : epee::net_utils::ssl_support_t::e_ssl_support_disabled);

    MINFO("Relayer http context: " << m_host << ":" << port << (use_ssl ? " (ssl)" : "") << ", base path '"
        << m_base_path << "'.");
}
//-------------------------------------------------------------------------------------------------------------------
void RelayerContextHttp::fetch_transactions(const std::uint64_t offset,
    const std::uint64_t limit,
    std::vector<std::string> &raw_entries_out) const
{
    const std::string body{
            this->invoke_impl("/transactions?offset=" + std::to_string(offset) + "&limit=" + std::to_string(limit),
                "GET",
                "")
        };

    parse_transactions_response(body, raw_entries_out);
}
//-------------------------------------------------------------------------------------------------------------------
RelayerInfoV1 RelayerContextHttp::get_info() const
{
    return parse_info_response(this->invoke_impl("/info", "GET", ""));
}
//-------------------------------------------------------------------------------------------------------------------
std::string RelayerContextHttp::send_transactions(const std::vector<RelayerTxRequestV1> &txs)
{
    const std::string job_id{
            parse_send_transactions_response(
                    this->invoke_impl("/sendTransactions", "POST", make_send_transactions_request(txs))
                )
        };

    MINFO("Relayer accepted " << txs.size() << " txs as job " << job_id << ".");

    return job_id;
}
//-------------------------------------------------------------------------------------------------------------------
boost::optional<RelayerJobV1> RelayerContextHttp::try_get_job(const std::string &job_id) const
{
    return parse_job_response(this->invoke_impl("/job/" + job_id, "GET", ""));
}
//-------------------------------------------------------------------------------------------------------------------
std::string RelayerContextHttp::invoke_impl(const std::string &path,
    const std::string &method,
    const std::string &body) const
{
    boost::lock_guard<boost::mutex> lock{m_http_mutex};

    const std::string uri{m_base_path + path};
    const epee::net_utils::http::http_response_info *response{nullptr};

    MDEBUG("Relayer request: " << method << " " << uri);

    const bool invoke_succeeded{
            method == "POST"
            ? m_http_client->invoke_post(uri, body, m_timeout, &response)
            : m_http_client->invoke_get(uri, m_timeout, body, &response)
        };

    THROW_ZKPOOL_EXCEPTION_IF(!invoke_succeeded || response == nullptr, error::network_error, m_host,
        method + " " + uri + " failed");
    THROW_ZKPOOL_EXCEPTION_IF(response->m_response_code < 200 || response->m_response_code >= 300,
        error::relayer_error, response->m_response_code, response->m_body);

    return response->m_body;
}
//-------------------------------------------------------------------------------------------------------------------
std::unique_ptr<RelayerContext> make_relayer_context_http(const std::string &relayer_url,
    const std::chrono::milliseconds timeout)
{
    std::unique_ptr<epee::net_utils::http::abstract_http_client> http_client{
            std::make_unique<epee::net_utils::http::http_simple_client>()
        };

    return std::make_unique<RelayerContextHttp>(relayer_url, std::move(http_client), timeout);
}
//-------------------------------------------------------------------------------------------------------------------
} //namespace zkpool
