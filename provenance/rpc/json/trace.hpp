// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <nlohmann/json.hpp>

#include <provenance/core/trace/trace_entry.hpp>

namespace provenance {

//! Decodes one entry of a trace_transaction reply (OpenEthereum/Erigon trace format)
void from_json(const nlohmann::json& json, TraceEntry& entry);

void from_json(const nlohmann::json& json, ActionType& type);

}  // namespace provenance
