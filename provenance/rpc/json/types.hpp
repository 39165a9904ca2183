// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string_view>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

//! Strict JSON decoders: malformed values raise std::system_error with errc::invalid_argument

namespace evmc {

void from_json(const nlohmann::json& json, address& addr);

void from_json(const nlohmann::json& json, bytes32& b32);

}  // namespace evmc

namespace intx {

void from_json(const nlohmann::json& json, uint256& ui256);

}  // namespace intx

namespace provenance::rpc {

//! \brief Decodes a JSON-RPC quantity given either as hex string (e.g. "0x1f") or as plain number
uint64_t from_quantity(const nlohmann::json& json);

[[noreturn]] void throw_invalid_field(std::string_view field, const nlohmann::json& json);

}  // namespace provenance::rpc
