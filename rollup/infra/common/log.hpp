// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <rollup/infra/common/terminal.hpp>

namespace rollup::log {

//! \brief Available verbosity levels
enum class Level {
    kNone,      // Simple logging line with no severity (e.g. build info)
    kCritical,  // An error there's no way we can recover from
    kError,     // We encountered an error which we might be able to recover from
    kWarning,   // Something happened and user might have the possibility to amend the situation
    kInfo,      // Info messages on regular operations
    kDebug,     // Debug information
    kTrace      // Trace calls to functions
};

//! \brief Holds logging configuration
struct Settings {
    //! Whether console logging goes to std::cout or std::cerr (default)
    bool log_std_out{false};
    //! Whether timestamps should be in UTC or imbue local timezone
    bool log_utc{true};
    //! Whether timestamps should include the timezone identifier
    bool log_timezone{true};
    //! Whether to disable colorized output
    bool log_nocolor{false};
    //! Whether to print thread names in log lines
    bool log_threads{false};
    //! Log verbosity level
    Level log_verbosity{Level::kInfo};
    //! Log to file
    std::string log_file;
    //! Thousands separator
    char log_thousands_sep{'\''};
};

//! \brief Initializes logging facilities
//! \note This function is not thread safe as it's meant to be used at start of process and never called again
void init(const Settings& settings = {});

//! \brief Get the current logging verbosity
Level get_verbosity();

//! \brief Sets logging verbosity
//! \note This function is not thread safe as it's meant to be used at start of process or in tests
void set_verbosity(Level level);

//! \brief Sets the name for this thread when logging traces also threads
void set_thread_name(const char* name);

//! \brief Returns the currently set name for the thread or the thread id
std::string get_thread_name();

//! \brief Checks if provided log level will be effectively printed on behalf of current settings
bool test_verbosity(Level level);

//! \brief Sets a file output for log teeing
void tee_file(const std::filesystem::path& path);

using Args = std::vector<std::string>;

class BufferBase {
  public:
    explicit BufferBase(Level level);
    BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase() { flush(); }

    BufferBase(const BufferBase&) = delete;
    BufferBase& operator=(const BufferBase&) = delete;

    template <class T>
    void append(const T& t) {
        if (should_print_) ss_ << t;
    }
    template <class T>
    BufferBase& operator<<(const T& t) {
        append(t);
        return *this;
    }
    BufferBase& operator<<(const Args& args) {
        append_args("", args);
        return *this;
    }

  protected:
    //! Message is left-aligned on a fixed width, then key=value pairs follow
    void append_args(std::string_view msg, const Args& args);
    void flush();

    const bool should_print_;
    std::stringstream ss_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    LogBuffer() : BufferBase(level) {}
    explicit LogBuffer(std::string_view msg, const Args& args = {}) : BufferBase(level, msg, args) {}
};

using Trace = LogBuffer<Level::kTrace>;
using Debug = LogBuffer<Level::kDebug>;
using Info = LogBuffer<Level::kInfo>;
using Warning = LogBuffer<Level::kWarning>;
using Error = LogBuffer<Level::kError>;
using Critical = LogBuffer<Level::kCritical>;
using Message = LogBuffer<Level::kNone>;

}  // namespace rollup::log

#define ROLLUP_LOGBUFFER(level_, ...)           \
    if (!rollup::log::test_verbosity(level_)) { \
    } else                                      \
        rollup::log::LogBuffer<level_>(__VA_ARGS__)

#define ROLLUP_TRACE_M(...) ROLLUP_LOGBUFFER(rollup::log::Level::kTrace, __VA_ARGS__)
#define ROLLUP_DEBUG_M(...) ROLLUP_LOGBUFFER(rollup::log::Level::kDebug, __VA_ARGS__)
#define ROLLUP_INFO_M(...) ROLLUP_LOGBUFFER(rollup::log::Level::kInfo, __VA_ARGS__)
#define ROLLUP_WARN_M(...) ROLLUP_LOGBUFFER(rollup::log::Level::kWarning, __VA_ARGS__)
#define ROLLUP_ERROR_M(...) ROLLUP_LOGBUFFER(rollup::log::Level::kError, __VA_ARGS__)
#define ROLLUP_CRIT_M(...) ROLLUP_LOGBUFFER(rollup::log::Level::kCritical, __VA_ARGS__)

#define ROLLUP_TRACE ROLLUP_TRACE_M()
#define ROLLUP_DEBUG ROLLUP_DEBUG_M()
#define ROLLUP_INFO ROLLUP_INFO_M()
#define ROLLUP_WARN ROLLUP_WARN_M()
#define ROLLUP_ERROR ROLLUP_ERROR_M()
#define ROLLUP_CRIT ROLLUP_CRIT_M()
