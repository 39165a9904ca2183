// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace provenance {

//! \brief Directory class acts as a wrapper around common functions and properties of a filesystem directory object
class Directory {
  public:
    //! Creates an instance of a Directory object provided the path
    //! \param [in] directory_path : the path of the directory
    //! \param [in] must_create : whether the directory must be created on filesystem should not exist
    explicit Directory(const std::filesystem::path& directory_path, bool must_create = false);
    virtual ~Directory() = default;

    // Not copyable nor movable
    Directory(const Directory&) = delete;
    Directory& operator=(const Directory&) = delete;

    //! \brief Returns whether this Directory exists on filesystem
    bool exists() const;

    //! \brief Returns whether this Directory is empty
    bool is_empty() const;

    //! \brief Returns whether a regular file exists at the given path relative to this Directory
    bool contains_file(std::string_view relative_path) const;

    //! \brief Returns the std::filesystem::path of this Directory instance
    const std::filesystem::path& path() const { return path_; }

    //! \brief Removes all contained files and subdirectories
    void clear() const;

    //! \brief Creates the directory on filesystem should not exist
    void create();

  protected:
    std::filesystem::path path_;
};

//! \brief TemporaryDirectory is a Directory which is automatically deleted on destructor of the instance.
//! The full path is the base path plus a unique non-existent sub-path made of a prefix and a random suffix.
//! Should no base path be given, the OS temporary storage location is used
class TemporaryDirectory final : public Directory {
  public:
    explicit TemporaryDirectory(const std::filesystem::path& base_path, std::string_view prefix = "prov-")
        : Directory(get_unique_temporary_path(base_path, prefix), true) {}

    TemporaryDirectory() : Directory(get_unique_temporary_path(get_os_temporary_path(), "prov-"), true) {}

    ~TemporaryDirectory() final;

    //! \brief Returns the path to OS provided temporary storage location
    static std::filesystem::path get_os_temporary_path();

    //! \brief Builds a unique non-existent path under base_path
    //! \throws std::invalid_argument if base_path is empty or is not an existing directory
    static std::filesystem::path get_unique_temporary_path(const std::filesystem::path& base_path,
                                                           std::string_view prefix);
};

}  // namespace provenance
