// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "directories.hpp"

#include <random>
#include <stdexcept>
#include <system_error>

namespace provenance {

static std::string random_string(size_t len) {
    static constexpr std::string_view kAlphaNum{
        "0123456789"
        "abcdefghijklmnopqrstuvwxyz"};

    thread_local std::mt19937_64 generator{std::random_device{}()};
    std::uniform_int_distribution<size_t> distr{0, kAlphaNum.length() - 1};

    std::string s;
    s.reserve(len);
    for (size_t i{0}; i < len; ++i) {
        s += kAlphaNum[distr(generator)];
    }
    return s;
}

Directory::Directory(const std::filesystem::path& directory_path, bool must_create) {
    if (directory_path.empty()) {
        path_ = std::filesystem::current_path();
    } else {
        path_ = directory_path;
    }
    if (must_create) {
        create();
    }
}

bool Directory::exists() const { return std::filesystem::exists(path_) && std::filesystem::is_directory(path_); }

bool Directory::is_empty() const { return exists() && std::filesystem::is_empty(path_); }

bool Directory::contains_file(std::string_view relative_path) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path_ / relative_path, ec);
}

void Directory::clear() const {
    if (!exists()) {
        return;
    }
    for (const auto& item : std::filesystem::directory_iterator(path_)) {
        std::filesystem::remove_all(item.path());
    }
}

void Directory::create() {
    if (exists()) {
        return;
    }
    std::error_code ec;
    std::filesystem::create_directories(path_, ec);
    if (ec) {
        throw std::invalid_argument("Directory " + path_.string() + " does not exist and could not be created");
    }
}

TemporaryDirectory::~TemporaryDirectory() {
    // Checkouts may contain read-only files (e.g. git objects): never throw from here
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TemporaryDirectory::get_os_temporary_path() { return std::filesystem::temp_directory_path(); }

std::filesystem::path TemporaryDirectory::get_unique_temporary_path(const std::filesystem::path& base_path,
                                                                    std::string_view prefix) {
    if (base_path.empty()) {
        throw std::invalid_argument("Temporary base path is empty");
    }

    const auto absolute_base_path{std::filesystem::absolute(base_path)};
    if (!std::filesystem::exists(absolute_base_path) || !std::filesystem::is_directory(absolute_base_path)) {
        throw std::invalid_argument("Path " + absolute_base_path.string() + " does not exist or is not a directory");
    }

    for (int i = 0; i < 1000; ++i) {
        auto candidate{absolute_base_path / (std::string{prefix} + random_string(10))};
        if (!std::filesystem::exists(candidate)) {
            return candidate;
        }
    }

    throw std::runtime_error("Unable to find a valid unique non-existent path");
}

}  // namespace provenance
