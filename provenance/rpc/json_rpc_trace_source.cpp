// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "json_rpc_trace_source.hpp"

#include <string>
#include <system_error>
#include <utility>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <nlohmann/json.hpp>

#include <provenance/core/common/util.hpp>
#include <provenance/core/types/evmc_bytes32.hpp>
#include <provenance/infra/common/log.hpp>
#include <provenance/rpc/common/rpc_error.hpp>
#include <provenance/rpc/json/trace.hpp>

namespace provenance::rpc {

static constexpr const char* kTraceMethod{"trace_transaction"};

static bool is_method_unsupported(const JsonRpcError& error) {
    if (error.code == kMethodNotFoundCode) {
        return true;
    }
    const std::string message{absl::AsciiStrToLower(error.message)};
    return absl::StrContains(message, "method not found") || absl::StrContains(message, "does not exist") ||
           absl::StrContains(message, "not available") || absl::StrContains(message, "not supported");
}

static JsonRpcError decode_error(const nlohmann::json& error_json) {
    JsonRpcError error;
    if (const auto code{error_json.find("code")}; code != error_json.end() && code->is_number_integer()) {
        error.code = code->get<int>();
    }
    if (const auto message{error_json.find("message")}; message != error_json.end() && message->is_string()) {
        error.message = message->get<std::string>();
    }
    return error;
}

JsonRpcTraceSource::JsonRpcTraceSource(Endpoint endpoint, std::unique_ptr<http::Transport> transport)
    : endpoint_{std::move(endpoint)}, transport_{std::move(transport)} {}

TraceEntries JsonRpcTraceSource::fetch_trace(const evmc::bytes32& tx_hash) {
    const uint64_t request_id{next_request_id_++};
    const nlohmann::json request{
        {"jsonrpc", "2.0"},
        {"id", request_id},
        {"method", kTraceMethod},
        {"params", nlohmann::json::array({to_hex(tx_hash, /*with_prefix=*/true)})},
    };
    PROV_DEBUG_M("Fetching trace", {"endpoint", to_string(endpoint_), "tx", to_hex(tx_hash, true)});

    const http::Response response{transport_->post(endpoint_, request.dump())};
    PROV_TRACE_M("Trace reply", {"status", std::to_string(response.status), "body", abridge(response.body, 512)});

    const auto reply = nlohmann::json::parse(response.body, /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (reply.is_discarded() || !reply.is_object()) {
        if (!response.is_success()) {
            throw RpcError{RpcErrorKind::kHttpStatus, "node replied with HTTP status " + std::to_string(response.status)};
        }
        throw RpcError{RpcErrorKind::kMalformedResponse, "reply is not a JSON object: " + abridge(response.body, 80)};
    }

    if (const auto error_it{reply.find("error")}; error_it != reply.end() && !error_it->is_null()) {
        if (!error_it->is_object()) {
            throw RpcError{RpcErrorKind::kMalformedResponse, "invalid error object: " + abridge(error_it->dump(), 80)};
        }
        JsonRpcError error{decode_error(*error_it)};
        const auto kind{is_method_unsupported(error) ? RpcErrorKind::kMethodUnsupported : RpcErrorKind::kJsonRpc};
        throw RpcError{kind, std::move(error)};
    }
    if (!response.is_success()) {
        throw RpcError{RpcErrorKind::kHttpStatus, "node replied with HTTP status " + std::to_string(response.status)};
    }
    if (const auto id_it{reply.find("id")}; id_it != reply.end() && *id_it != nlohmann::json(request_id)) {
        throw RpcError{RpcErrorKind::kMalformedResponse, "reply id " + id_it->dump() + " does not match request id " +
                                                             std::to_string(request_id)};
    }

    const auto result_it{reply.find("result")};
    if (result_it == reply.end()) {
        throw RpcError{RpcErrorKind::kMalformedResponse, "reply has neither result nor error"};
    }
    // A null result means the node does not know the transaction
    if (result_it->is_null()) {
        PROV_DEBUG_M("Transaction unknown to node", {"tx", to_hex(tx_hash, true)});
        return {};
    }
    if (!result_it->is_array()) {
        throw RpcError{RpcErrorKind::kMalformedResponse, "trace result is not an array"};
    }

    TraceEntries entries;
    entries.reserve(result_it->size());
    for (size_t i{0}; i < result_it->size(); ++i) {
        try {
            entries.push_back((*result_it)[i].get<TraceEntry>());
        } catch (const nlohmann::json::exception& e) {
            throw RpcError{RpcErrorKind::kMalformedResponse, "trace entry " + std::to_string(i) + ": " + e.what()};
        } catch (const std::system_error& e) {
            throw RpcError{RpcErrorKind::kMalformedResponse, "trace entry " + std::to_string(i) + ": " + e.what()};
        }
    }
    PROV_DEBUG_M("Trace fetched", {"entries", std::to_string(entries.size())});
    return entries;
}

}  // namespace provenance::rpc
