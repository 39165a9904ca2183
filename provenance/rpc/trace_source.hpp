// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.hpp>

#include <provenance/core/trace/trace_entry.hpp>

namespace provenance::rpc {

//! Source of the full execution trace of a transaction
class TraceSource {
  public:
    virtual ~TraceSource() = default;

    //! \brief Fetches every trace entry of the given transaction, in node order
    //! \return an empty list if the node does not know the transaction
    //! \throws RpcError on transport, protocol or decoding failures (never retried)
    virtual TraceEntries fetch_trace(const evmc::bytes32& tx_hash) = 0;
};

}  // namespace provenance::rpc
