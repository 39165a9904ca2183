// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <string>

namespace provenance::rpc {

inline constexpr std::chrono::seconds kDefaultRequestTimeout{30};

struct ClientSettings {
    //! Deadline for connecting plus each read or write on the node connection
    std::chrono::milliseconds request_timeout{kDefaultRequestTimeout};
    //! Whether the node certificate is verified on https endpoints
    bool verify_tls{true};
    std::string user_agent{"provenance/verify_deployment"};
};

}  // namespace provenance::rpc
