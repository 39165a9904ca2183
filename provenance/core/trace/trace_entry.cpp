// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "trace_entry.hpp"

#include <magic_enum.hpp>

namespace provenance {

std::optional<evmc::address> TraceEntry::created_address() const noexcept {
    if (action_type != ActionType::kCreate || !result) {
        return std::nullopt;
    }
    return result->address;
}

std::optional<std::string> TraceEntry::init_code() const {
    if (action_type != ActionType::kCreate) {
        return std::nullopt;
    }
    return action.init;
}

std::ostream& operator<<(std::ostream& out, ActionType type) {
    out << magic_enum::enum_name(type);
    return out;
}

std::string to_string(const std::vector<int32_t>& trace_address) {
    std::string out{"["};
    for (size_t i{0}; i < trace_address.size(); ++i) {
        if (i != 0) {
            out += ", ";
        }
        out += std::to_string(trace_address[i]);
    }
    out += "]";
    return out;
}

}  // namespace provenance
