// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <provenance/rpc/common/endpoint.hpp>

namespace provenance::rpc::http {

struct Response {
    unsigned status{0};
    std::string body;

    bool is_success() const noexcept { return status >= 200 && status < 300; }
};

//! Posts a request body to an endpoint and returns the raw reply
class Transport {
  public:
    virtual ~Transport() = default;

    //! \throws RpcError with kind kTransport on connection, TLS and timeout failures
    virtual Response post(const Endpoint& endpoint, const std::string& body) = 0;
};

}  // namespace provenance::rpc::http
