// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "common.hpp"

#include <map>
#include <regex>

namespace rollup::cmd::common {

//! CLI11 validator for HTTP endpoints
struct HttpUrlValidator : public CLI::Validator {
    HttpUrlValidator() {
        description("HTTP URL in the form http://host:port[/target]");
        func_ = [](const std::string& value) -> std::string {
            static const std::regex kPattern{R"(^http://[A-Za-z0-9\.\-]+(:[0-9]{1,5})?(/.*)?$)"};
            if (!std::regex_match(value, kPattern)) {
                return "Value " + value + " is not a valid HTTP URL";
            }
            return {};
        };
    }
};

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    std::map<std::string, log::Level> level_mapping{
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->check(CLI::Range(log::Level::kCritical, log::Level::kTrace))
        ->transform(CLI::Transformer(level_mapping, CLI::ignore_case))
        ->default_val(log::Level::kInfo);
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Outputs to std::out instead of std::err");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("--log.utc", log_settings.log_utc, "Prints log timings in UTC");
    log_opts.add_flag("--log.threads", log_settings.log_threads, "Prints thread names");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

void add_option_duration(CLI::App& cli, const std::string& name, std::chrono::milliseconds& duration,
                         const std::string& description) {
    cli.add_option_function<uint64_t>(
           name,
           [&duration](const uint64_t& value) { duration = std::chrono::milliseconds{value}; },
           description + " (milliseconds)")
        ->check(CLI::PositiveNumber)
        ->default_str(std::to_string(duration.count()));
}

void add_option_http_url(CLI::App& cli, const std::string& name, std::string& url, const std::string& description) {
    cli.add_option(name, url, description)
        ->check(HttpUrlValidator{})
        ->capture_default_str();
}

}  // namespace rollup::cmd::common
