// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>

namespace rollup {

//! \brief Directory deleted along with its content when the instance is destroyed
//! \details The full path is the given base path plus a random non-existent sub-path. Should no base path be given,
//! the temporary storage location of the host OS is used.
class TemporaryDirectory final {
  public:
    //! \throws std::invalid_argument if \p base_path is empty or not an existing directory
    explicit TemporaryDirectory(const std::filesystem::path& base_path);
    TemporaryDirectory() : TemporaryDirectory(std::filesystem::temp_directory_path()) {}
    ~TemporaryDirectory();

    // Not copyable nor movable
    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }

    //! \brief Builds a non-existent path below \p base_path
    static std::filesystem::path get_unique_temporary_path(const std::filesystem::path& base_path);

  private:
    std::filesystem::path path_;
};

}  // namespace rollup
