// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <provenance/core/common/base.hpp>

namespace provenance {

//! Kind of step recorded by the node in a transaction trace (i.e. the "type" of a trace_transaction entry)
enum class ActionType {
    kCall,
    kCreate,
    kSuicide,
    kReward,
};

//! Action payload of call and create steps
//! \remarks input and init are kept as the hex text returned by the node, validation happens on comparison
struct TraceAction {
    std::optional<std::string> call_type;
    std::optional<std::string> creation_method;
    std::optional<evmc::address> from;
    std::optional<evmc::address> to;
    int64_t gas{0};
    std::optional<std::string> input;
    std::optional<std::string> init;
    intx::uint256 value{0};
};

struct TraceResult {
    std::optional<evmc::address> address;
    std::optional<std::string> code;
    std::optional<std::string> output;
    int64_t gas_used{0};
};

//! One step of a transaction execution as reported by the trace_transaction API
struct TraceEntry {
    ActionType action_type{ActionType::kCall};
    TraceAction action;
    std::optional<TraceResult> result;  // absent for reverted or failed steps
    int32_t sub_traces{0};
    std::vector<int32_t> trace_address;
    std::optional<std::string> error;
    std::optional<evmc::bytes32> block_hash;
    std::optional<BlockNum> block_num;
    std::optional<evmc::bytes32> transaction_hash;
    std::optional<uint32_t> transaction_position;

    bool has_result() const noexcept { return result.has_value(); }

    //! The address created by this step, only for successful creations
    std::optional<evmc::address> created_address() const noexcept;

    //! The initialization code of this step, only for creations
    std::optional<std::string> init_code() const;
};

using TraceEntries = std::vector<TraceEntry>;

std::ostream& operator<<(std::ostream& out, ActionType type);

//! \brief Formats the position of a step in the call tree (e.g. "[0, 2]")
std::string to_string(const std::vector<int32_t>& trace_address);

}  // namespace provenance
