// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <memory>

#include <provenance/rpc/common/endpoint.hpp>
#include <provenance/rpc/http/transport.hpp>
#include <provenance/rpc/trace_source.hpp>

namespace provenance::rpc {

inline constexpr int kMethodNotFoundCode{-32601};

//! TraceSource issuing a trace_transaction call to a JSON-RPC node
class JsonRpcTraceSource : public TraceSource {
  public:
    JsonRpcTraceSource(Endpoint endpoint, std::unique_ptr<http::Transport> transport);

    TraceEntries fetch_trace(const evmc::bytes32& tx_hash) override;

  private:
    Endpoint endpoint_;
    std::unique_ptr<http::Transport> transport_;
    uint64_t next_request_id_{1};
};

}  // namespace provenance::rpc
