// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <fstream>
#include <iostream>
#include <locale>
#include <memory>
#include <mutex>
#include <regex>
#include <stdexcept>
#include <thread>
#include <utility>

#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace rollup::log {

//! The fixed size for thread name in log lines
static constexpr size_t kThreadNameFixedSize = 11;

//! The fixed width of the message column preceding key/value pairs
static constexpr int kMessageColumnWidth = 41;

static Settings settings_{};
static std::mutex out_mtx{};
static std::unique_ptr<std::fstream> file_{nullptr};
static bool is_terminal{false};
thread_local std::string thread_name_{};

void init(const Settings& settings) {
    settings_ = settings;
    if (!settings_.log_file.empty()) {
        tee_file(std::filesystem::path{settings_.log_file});
        // Escape sequences must never reach the log file
        settings_.log_nocolor = true;
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

void set_thread_name(const char* name) {
    thread_name_ = std::string(name);
    thread_name_.resize(kThreadNameFixedSize, ' ');
}

std::string get_thread_name() {
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
            return {"     ", kColorReset};
    }
}

struct SeparateThousands : std::numpunct<char> {
    char separator;
    explicit SeparateThousands(char sep) : separator(sep) {}
    char do_thousands_sep() const override { return separator; }
    string_type do_grouping() const override { return "\3"; }
};

BufferBase::BufferBase(Level level) : should_print_(level <= settings_.log_verbosity) {
    if (!should_print_) return;

    if (settings_.log_thousands_sep != 0) {
        ss_.imbue(std::locale(ss_.getloc(), new SeparateThousands(settings_.log_thousands_sep)));
    }

    auto [log_tag, color] = get_level_settings(level);
    ss_ << kColorReset << " " << color << log_tag << kColorReset << " ";

    static const absl::TimeZone kTz{settings_.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    const std::string timezone{settings_.log_timezone ? " " + kTz.name() : ""};
    ss_ << kColorWhite << "[" << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), kTz) << timezone << "] "
        << kColorReset;

    if (settings_.log_threads) {
        ss_ << "[" << get_thread_name() << "] ";
    }
}

BufferBase::BufferBase(Level level, std::string_view msg, const Args& args) : BufferBase(level) {
    append_args(msg, args);
}

void BufferBase::append_args(std::string_view msg, const Args& args) {
    if (!should_print_) return;
    ss_ << std::left << std::setw(kMessageColumnWidth) << std::setfill(' ') << msg;
    bool key{true};
    for (const auto& arg : args) {
        ss_ << (key ? kColorGreen : kColorWhite) << arg << kColorReset << (key ? "=" : " ");
        key = !key;
    }
}

void BufferBase::flush() {
    if (!should_print_) return;

    static const std::regex kColorPattern("(\\\x1b\\[[0-9;]{1,}m)");

    std::string line{ss_.str()};
    const bool colorized{!settings_.log_nocolor};
    if (!colorized) {
        line = std::regex_replace(line, kColorPattern, "");
    }
    std::scoped_lock out_lck{out_mtx};
    auto& out = settings_.log_std_out ? std::cout : std::cerr;
    out << line << '\n';
    if (file_ && file_->is_open()) {
        *file_ << (colorized ? std::regex_replace(line, kColorPattern, "") : line) << '\n';
    }
}

}  // namespace rollup::log
