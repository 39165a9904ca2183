// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <provenance/infra/common/terminal.hpp>

namespace provenance::log {

//! \brief Available verbosity levels
enum class Level {
    kNone,      // Simple logging line with no severity (e.g. the verification report)
    kCritical,  // An error there's no way we can recover from
    kError,     // A stage failed, the run cannot reach a classification
    kWarning,   // Something the auditor should look at (e.g. opcode advisories)
    kInfo,      // Progress of the verification stages
    kDebug,     // Commands, requests and intermediate values
    kTrace      // Raw payloads
};

//! \brief Holds logging configuration
struct Settings {
    //! Whether console logging goes to std::cout or std::cerr (default)
    bool log_std_out{false};
    //! Whether timestamps should be in UTC or imbue local timezone
    bool log_utc{true};
    //! Whether to disable colorized output
    bool log_nocolor{false};
    //! Whether to print thread ids in log lines
    bool log_threads{false};
    //! Log verbosity level
    Level log_verbosity{Level::kInfo};
    //! Log to file
    std::string log_file;
};

//! \brief Initializes logging facilities
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void init(const Settings& settings = {});

//! \brief Get the current logging verbosity
Level get_verbosity();

//! \brief Sets logging verbosity
//! \note This function is not thread safe as it's meant to be used at start of process or in tests
void set_verbosity(Level level);

//! \brief Sets the name for this thread when logging traces also threads (e.g. "trace", "build")
void set_thread_name(std::string_view name);

//! \brief Checks if provided log level will be effectively printed on behalf of current settings
bool test_verbosity(Level level);

//! \brief Sets a file output for log teeing
void tee_file(const std::filesystem::path& path);

//! Key-value pairs appended to a log line: {"key1", "value1", "key2", "value2", ...}
using Args = std::vector<std::string>;

class BufferBase {
  public:
    explicit BufferBase(Level level);
    BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase() { flush(); }

    BufferBase(const BufferBase&) = delete;
    BufferBase& operator=(const BufferBase&) = delete;

    template <class T>
    BufferBase& operator<<(const T& t) {
        if (should_print_) ss_ << t;
        return *this;
    }
    BufferBase& operator<<(const Args& args) {
        append("", args);
        return *this;
    }

  protected:
    void append(std::string_view msg, const Args& args);
    void flush();

    const bool should_print_;
    std::stringstream ss_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    explicit LogBuffer() : BufferBase(level) {}
    explicit LogBuffer(std::string_view msg, const Args& args = {}) : BufferBase(level, msg, args) {}
};

using Trace = LogBuffer<Level::kTrace>;
using Debug = LogBuffer<Level::kDebug>;
using Info = LogBuffer<Level::kInfo>;
using Warning = LogBuffer<Level::kWarning>;
using Error = LogBuffer<Level::kError>;
using Critical = LogBuffer<Level::kCritical>;
using Message = LogBuffer<Level::kNone>;

}  // namespace provenance::log

#define PROV_LOGBUFFER(level_, ...)                   \
    if (!provenance::log::test_verbosity(level_)) { \
    } else                                          \
        provenance::log::LogBuffer<level_>(__VA_ARGS__)

#define PROV_TRACE_M(...) PROV_LOGBUFFER(provenance::log::Level::kTrace, __VA_ARGS__)
#define PROV_DEBUG_M(...) PROV_LOGBUFFER(provenance::log::Level::kDebug, __VA_ARGS__)
#define PROV_INFO_M(...) PROV_LOGBUFFER(provenance::log::Level::kInfo, __VA_ARGS__)
#define PROV_WARN_M(...) PROV_LOGBUFFER(provenance::log::Level::kWarning, __VA_ARGS__)
#define PROV_ERROR_M(...) PROV_LOGBUFFER(provenance::log::Level::kError, __VA_ARGS__)

#define PROV_TRACE PROV_TRACE_M()
#define PROV_DEBUG PROV_DEBUG_M()
#define PROV_INFO PROV_INFO_M()
#define PROV_WARN PROV_WARN_M()
#define PROV_ERROR PROV_ERROR_M()
