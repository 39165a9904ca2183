// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "trace.hpp"

#include <string>

#include <provenance/rpc/json/types.hpp>

namespace provenance {

using rpc::from_quantity;
using rpc::throw_invalid_field;

template <typename T>
static std::optional<T> optional_field(const nlohmann::json& json, const char* key) {
    const auto it{json.find(key)};
    if (it == json.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

static std::optional<std::string> optional_string(const nlohmann::json& json, const char* key) {
    const auto it{json.find(key)};
    if (it == json.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw_invalid_field(key, *it);
    }
    return it->get<std::string>();
}

static int64_t optional_gas(const nlohmann::json& json, const char* key) {
    const auto it{json.find(key)};
    if (it == json.end() || it->is_null()) {
        return 0;
    }
    return static_cast<int64_t>(from_quantity(*it));
}

void from_json(const nlohmann::json& json, ActionType& type) {
    if (!json.is_string()) {
        throw_invalid_field("type", json);
    }
    const auto& name{json.get_ref<const std::string&>()};
    if (name == "call") {
        type = ActionType::kCall;
    } else if (name == "create") {
        type = ActionType::kCreate;
    } else if (name == "suicide") {
        type = ActionType::kSuicide;
    } else if (name == "reward") {
        type = ActionType::kReward;
    } else {
        throw_invalid_field("type", json);
    }
}

static TraceAction action_from_json(const nlohmann::json& json, ActionType type) {
    if (!json.is_object()) {
        throw_invalid_field("action", json);
    }
    TraceAction action;
    switch (type) {
        case ActionType::kCall:
            action.call_type = optional_string(json, "callType");
            action.from = optional_field<evmc::address>(json, "from");
            action.to = optional_field<evmc::address>(json, "to");
            action.input = optional_string(json, "input");
            break;
        case ActionType::kCreate:
            action.creation_method = optional_string(json, "creationMethod");
            action.from = optional_field<evmc::address>(json, "from");
            action.init = optional_string(json, "init");
            break;
        case ActionType::kSuicide:
            // Self-destructing contract and beneficiary of its balance
            action.from = optional_field<evmc::address>(json, "address");
            action.to = optional_field<evmc::address>(json, "refundAddress");
            action.value = optional_field<intx::uint256>(json, "balance").value_or(0);
            return action;
        case ActionType::kReward:
            action.to = optional_field<evmc::address>(json, "author");
            break;
    }
    action.gas = optional_gas(json, "gas");
    action.value = optional_field<intx::uint256>(json, "value").value_or(0);
    return action;
}

static TraceResult result_from_json(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw_invalid_field("result", json);
    }
    TraceResult result;
    result.address = optional_field<evmc::address>(json, "address");
    result.code = optional_string(json, "code");
    result.output = optional_string(json, "output");
    result.gas_used = optional_gas(json, "gasUsed");
    return result;
}

void from_json(const nlohmann::json& json, TraceEntry& entry) {
    if (!json.is_object()) {
        throw_invalid_field("trace", json);
    }
    entry.action_type = json.at("type").get<ActionType>();
    entry.action = action_from_json(json.at("action"), entry.action_type);

    const auto result_it{json.find("result")};
    if (result_it != json.end() && !result_it->is_null()) {
        entry.result = result_from_json(*result_it);
    } else {
        entry.result.reset();
    }

    if (const auto it{json.find("subtraces")}; it != json.end() && !it->is_null()) {
        entry.sub_traces = static_cast<int32_t>(from_quantity(*it));
    }
    if (const auto it{json.find("traceAddress")}; it != json.end() && !it->is_null()) {
        if (!it->is_array()) {
            throw_invalid_field("traceAddress", *it);
        }
        entry.trace_address.clear();
        for (const auto& index : *it) {
            entry.trace_address.push_back(static_cast<int32_t>(from_quantity(index)));
        }
    }
    entry.error = optional_string(json, "error");
    entry.block_hash = optional_field<evmc::bytes32>(json, "blockHash");
    if (const auto it{json.find("blockNumber")}; it != json.end() && !it->is_null()) {
        entry.block_num = from_quantity(*it);
    }
    entry.transaction_hash = optional_field<evmc::bytes32>(json, "transactionHash");
    if (const auto it{json.find("transactionPosition")}; it != json.end() && !it->is_null()) {
        entry.transaction_position = static_cast<uint32_t>(from_quantity(*it));
    }
}

}  // namespace provenance
