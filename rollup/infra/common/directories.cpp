// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "directories.hpp"

#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace rollup {

static std::string random_string(size_t length) {
    static constexpr std::string_view kAlphaNum{"0123456789abcdefghijklmnopqrstuvwxyz"};
    thread_local std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<size_t> distribution{0, kAlphaNum.size() - 1};
    std::string result;
    result.reserve(length);
    for (size_t i{0}; i < length; ++i) {
        result.push_back(kAlphaNum[distribution(generator)]);
    }
    return result;
}

TemporaryDirectory::TemporaryDirectory(const std::filesystem::path& base_path)
    : path_{get_unique_temporary_path(base_path)} {
    std::filesystem::create_directories(path_);
}

TemporaryDirectory::~TemporaryDirectory() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TemporaryDirectory::get_unique_temporary_path(const std::filesystem::path& base_path) {
    if (base_path.empty()) {
        throw std::invalid_argument("Temporary base path is empty");
    }

    const auto absolute_base_path{std::filesystem::absolute(base_path)};
    if (!std::filesystem::exists(absolute_base_path) || !std::filesystem::is_directory(absolute_base_path)) {
        throw std::invalid_argument("Path " + absolute_base_path.string() + " does not exist or is not a directory");
    }

    for (int i = 0; i < 1000; ++i) {
        auto new_absolute_base_path{absolute_base_path / random_string(10)};
        if (!std::filesystem::exists(new_absolute_base_path)) {
            return new_absolute_base_path;
        }
    }

    throw std::runtime_error("Unable to find a valid unique non-existent path");
}

}  // namespace rollup
