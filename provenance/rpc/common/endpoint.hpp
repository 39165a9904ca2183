// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace provenance::rpc {

//! HTTP(S) location of a JSON-RPC node
struct Endpoint {
    bool secure{false};
    std::string host;
    std::string port;
    std::string target{"/"};

    bool operator==(const Endpoint&) const = default;
};

//! \brief Parses an absolute http:// or https:// URL (e.g. "https://node.example:8545/rpc?key=abc")
//! \return the endpoint or std::nullopt if scheme, host or port are not valid
std::optional<Endpoint> parse_endpoint(std::string_view url);

//! \brief Endpoint without query string, suitable for logging (i.e. API keys in the query are not leaked)
std::string to_string(const Endpoint& endpoint);

std::ostream& operator<<(std::ostream& out, const Endpoint& endpoint);

}  // namespace provenance::rpc
