// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <regex>
#include <stdexcept>
#include <thread>

#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace provenance::log {

//! The fixed size for thread name in log traces
static constexpr size_t kThreadNameFixedSize = 7;

static Settings settings_{};
static std::mutex out_mtx{};
static std::unique_ptr<std::fstream> file_{nullptr};
static bool is_terminal{false};
thread_local std::string thread_name_{};

void init(const Settings& settings) {
    settings_ = settings;
    if (!settings_.log_file.empty()) {
        tee_file(std::filesystem::path(settings.log_file));
        // Forcibly disable colorized output to avoid escape char sequences into log file
        settings_.log_nocolor = true;
    } else {
        file_.reset();
    }
    is_terminal = settings_.log_std_out ? is_terminal_stdout() : is_terminal_stderr();
    settings_.log_nocolor = settings_.log_nocolor || !is_terminal;
}

void tee_file(const std::filesystem::path& path) {
    file_ = std::make_unique<std::fstream>(path.string(), std::ios::out | std::ios::app);
    if (!file_->is_open()) {
        file_.reset();
        throw std::runtime_error("Could not open file " + path.string());
    }
}

Level get_verbosity() { return settings_.log_verbosity; }

void set_verbosity(Level level) { settings_.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= settings_.log_verbosity; }

void set_thread_name(std::string_view name) {
    thread_name_ = std::string{name};
    thread_name_.resize(kThreadNameFixedSize, ' ');
}

static const std::string& get_thread_name() {
    if (thread_name_.empty()) {
        std::stringstream ss;
        ss << std::this_thread::get_id();
        thread_name_ = ss.str();
    }
    return thread_name_;
}

static std::pair<std::string_view, std::string_view> get_level_settings(Level level) {
    switch (level) {
        case Level::kTrace:
            return {"TRACE", kColorCoal};
        case Level::kDebug:
            return {"DEBUG", kBackgroundPurple};
        case Level::kInfo:
            return {" INFO", kColorGreen};
        case Level::kWarning:
            return {" WARN", kColorOrangeHigh};
        case Level::kError:
            return {"ERROR", kColorRed};
        case Level::kCritical:
            return {" CRIT", kBackgroundRed};
        default:
            return {"", kColorReset};
    }
}

BufferBase::BufferBase(Level level) : should_print_(level <= settings_.log_verbosity) {
    if (!should_print_) return;

    // Plain messages (i.e. the final report) carry neither severity nor timestamp
    if (level == Level::kNone) return;

    auto [log_tag, color] = get_level_settings(level);
    ss_ << kColorReset << " " << color << log_tag << kColorReset << " ";

    static const absl::TimeZone kTz{settings_.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    ss_ << kColorWhite << "[" << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), kTz) << "] " << kColorReset;

    if (settings_.log_threads) {
        ss_ << "[" << get_thread_name() << "] ";
    }
}

BufferBase::BufferBase(Level level, std::string_view msg, const Args& args) : BufferBase(level) {
    append(msg, args);
}

void BufferBase::append(std::string_view msg, const Args& args) {
    if (!should_print_) return;
    ss_ << std::left << std::setw(36) << std::setfill(' ') << msg;
    bool is_key{true};
    for (const auto& arg : args) {
        ss_ << (is_key ? kColorGreen : kColorWhite) << arg << kColorReset << (is_key ? "=" : " ") << kColorReset;
        is_key = !is_key;
    }
}

void BufferBase::flush() {
    if (!should_print_) return;

    // Pattern to identify colorization
    static const std::regex kColorPattern("(\\\x1b\\[[0-9;]{1,}m)");

    std::string line{ss_.str()};
    if (settings_.log_nocolor) {
        line = std::regex_replace(line, kColorPattern, "");
    }
    std::scoped_lock out_lck{out_mtx};
    auto& out = settings_.log_std_out ? std::cout : std::cerr;
    out << line << '\n';
    if (file_ && file_->is_open()) {
        *file_ << std::regex_replace(line, kColorPattern, "") << '\n';
    }
}

}  // namespace provenance::log
