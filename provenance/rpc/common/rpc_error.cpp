// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "rpc_error.hpp"

#include <sstream>

#include <magic_enum.hpp>

namespace provenance::rpc {

static std::string describe(const JsonRpcError& error) {
    std::stringstream ss;
    ss << error;
    return ss.str();
}

RpcError::RpcError(RpcErrorKind kind, const std::string& message) : std::runtime_error{message}, kind_{kind} {}

RpcError::RpcError(RpcErrorKind kind, JsonRpcError error)
    : std::runtime_error{describe(error)}, kind_{kind}, json_rpc_error_{std::move(error)} {}

std::ostream& operator<<(std::ostream& out, const JsonRpcError& error) {
    out << "JSON-RPC error " << error.code << ": " << error.message;
    return out;
}

std::ostream& operator<<(std::ostream& out, RpcErrorKind kind) {
    out << magic_enum::enum_name(kind).substr(1);
    return out;
}

}  // namespace provenance::rpc
