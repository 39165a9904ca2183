// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <evmc/evmc.hpp>
#include <tl/expected.hpp>

#include <provenance/core/trace/trace_entry.hpp>

namespace provenance {

//! The single trace step selected as the deployment of the target contract
struct CreationRecord {
    evmc::address created_address;
    std::optional<std::string> init_code;
    std::optional<evmc::address> deployer;
    std::vector<int32_t> trace_address;
    size_t trace_index{0};
};

enum class [[nodiscard]] LocateError {
    kNotFound,   // No successful creation of the target address in the trace
    kAmbiguous,  // The target address has been created more than once
};

//! Reason why no single creation record could be selected, with trace statistics for reporting
struct LocateFailure {
    LocateError error{LocateError::kNotFound};
    size_t total_entries{0};
    size_t creations{0};
    size_t creations_without_result{0};
    size_t matches{0};
};

using LocateResult = tl::expected<CreationRecord, LocateFailure>;

//! \brief Selects the unique successful creation step whose resulting address is target
//! \return the creation record when exactly one step matches, LocateError::kNotFound when none does and
//! LocateError::kAmbiguous when more than one does
LocateResult locate_creation(const TraceEntries& traces, const evmc::address& target);

//! \brief Human-readable explanation of a locate failure
std::string describe(const LocateFailure& failure);

std::ostream& operator<<(std::ostream& out, LocateError error);

}  // namespace provenance
