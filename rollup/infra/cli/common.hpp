// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <string>

#include <CLI/CLI.hpp>

#include <rollup/infra/common/log.hpp>

namespace rollup::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up an option expressed in milliseconds for the given duration
void add_option_duration(CLI::App& cli, const std::string& name, std::chrono::milliseconds& duration,
                         const std::string& description);

//! \brief Set up an option for an HTTP endpoint (i.e. http://host:port[/target])
void add_option_http_url(CLI::App& cli, const std::string& name, std::string& url, const std::string& description);

}  // namespace rollup::cmd::common
