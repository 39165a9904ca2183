// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <boost/asio/thread_pool.hpp>

namespace provenance::concurrency {

//! Verification runs at most the trace branch and the build branch at the same time
inline constexpr uint32_t kDefaultNumWorkers{2};

//! Pool of worker threads dedicated to blocking tasks (i.e. network calls and external processes)
using WorkerPool = boost::asio::thread_pool;

}  // namespace provenance::concurrency
