// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <provenance/rpc/http/transport.hpp>
#include <provenance/rpc/settings.hpp>

namespace provenance::rpc::http {

//! HTTP/1.1 client issuing one request per connection over plain TCP or TLS
class Client : public Transport {
  public:
    explicit Client(ClientSettings settings) : settings_{std::move(settings)} {}

    Response post(const Endpoint& endpoint, const std::string& body) override;

  private:
    ClientSettings settings_;
};

}  // namespace provenance::rpc::http
