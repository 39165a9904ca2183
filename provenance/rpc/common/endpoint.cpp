// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "endpoint.hpp"

#include <regex>

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>

namespace provenance::rpc {

std::optional<Endpoint> parse_endpoint(std::string_view url) {
    static const std::regex kUrlPattern{R"(^([A-Za-z]+)://([A-Za-z0-9\.\-_]+)(?::([0-9]{1,5}))?(/[^#\s]*)?$)"};

    std::match_results<std::string_view::const_iterator> matches;
    if (!std::regex_match(url.begin(), url.end(), matches, kUrlPattern)) {
        return std::nullopt;
    }

    Endpoint endpoint;
    const std::string scheme{absl::AsciiStrToLower(matches[1].str())};
    if (scheme == "https") {
        endpoint.secure = true;
    } else if (scheme != "http") {
        return std::nullopt;
    }
    endpoint.host = matches[2].str();
    if (matches[3].matched) {
        uint32_t port{0};
        if (!absl::SimpleAtoi(matches[3].str(), &port) || port < 1 || port > 65535) {
            return std::nullopt;
        }
        endpoint.port = std::to_string(port);
    } else {
        endpoint.port = endpoint.secure ? "443" : "80";
    }
    if (matches[4].matched) {
        endpoint.target = matches[4].str();
    }
    return endpoint;
}

std::string to_string(const Endpoint& endpoint) {
    const auto path_end{endpoint.target.find('?')};
    return (endpoint.secure ? "https://" : "http://") + endpoint.host + ":" + endpoint.port +
           endpoint.target.substr(0, path_end);
}

std::ostream& operator<<(std::ostream& out, const Endpoint& endpoint) {
    out << to_string(endpoint);
    return out;
}

}  // namespace provenance::rpc
