// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <evmc/evmc.hpp>

#include <provenance/core/trace/trace_entry.hpp>

namespace provenance::test_util {

using namespace evmc::literals;

inline constexpr evmc::address kDeployer{0xf39fd6e51aad88f6f4ce6ab8827279cfffb92266_address};
inline constexpr evmc::address kTargetContract{0x5fbdb2315678afecb367f032d93f642f64180aa3_address};
inline constexpr evmc::address kOtherContract{0xe7f1725e7734ce288f8367e1bb143e90bb3f0512_address};

//! Init code of a minimal contract followed by solc CBOR metadata
inline const std::string kSampleInitCode{
    "0x6080604052348015600f57600080fd5b50603f80601d6000396000f3fe6080604052600080fd"
    "a2646970667358221220aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa64736f6c63430008130033"};

//! Same contract, metadata of a different build (e.g. other source path)
inline const std::string kSampleBuildOutput{
    "0x6080604052348015600f57600080fd5b50603f80601d6000396000f3fe6080604052600080fd"
    "a2646970667358221220bbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb64736f6c63430008130033"};

inline TraceEntry sample_call(const evmc::address& to) {
    TraceEntry entry{.action_type = ActionType::kCall};
    entry.action.call_type = "call";
    entry.action.from = kDeployer;
    entry.action.to = to;
    entry.action.input = "0x";
    entry.result = TraceResult{.output = "0x"};
    return entry;
}

inline TraceEntry sample_creation(const evmc::address& created, const std::string& init_code = kSampleInitCode) {
    TraceEntry entry{.action_type = ActionType::kCreate};
    entry.action.from = kDeployer;
    entry.action.init = init_code;
    entry.result = TraceResult{.address = created, .code = "0x6080604052600080fd"};
    return entry;
}

inline TraceEntry sample_failed_creation(const std::string& init_code = kSampleInitCode) {
    TraceEntry entry{.action_type = ActionType::kCreate};
    entry.action.from = kDeployer;
    entry.action.init = init_code;
    entry.error = "Reverted";
    return entry;
}

}  // namespace provenance::test_util
