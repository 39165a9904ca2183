// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace provenance::rpc {

enum class RpcErrorKind {
    kTransport,          // connection, TLS or timeout failure
    kHttpStatus,         // non-success HTTP status without a JSON-RPC error object
    kJsonRpc,            // JSON-RPC error object returned by the node
    kMethodUnsupported,  // node does not expose the trace API
    kMalformedResponse,  // response body is not a valid trace reply
    kInvalidEndpoint,    // endpoint URL cannot be used
};

//! Error object carried by a JSON-RPC reply
struct JsonRpcError {
    int code{0};
    std::string message;
};

std::ostream& operator<<(std::ostream& out, const JsonRpcError& error);

//! Failure while talking to the JSON-RPC node
class RpcError : public std::runtime_error {
  public:
    RpcError(RpcErrorKind kind, const std::string& message);
    RpcError(RpcErrorKind kind, JsonRpcError error);

    RpcErrorKind kind() const noexcept { return kind_; }
    const std::optional<JsonRpcError>& json_rpc_error() const noexcept { return json_rpc_error_; }

  private:
    RpcErrorKind kind_;
    std::optional<JsonRpcError> json_rpc_error_;
};

std::ostream& operator<<(std::ostream& out, RpcErrorKind kind);

}  // namespace provenance::rpc
