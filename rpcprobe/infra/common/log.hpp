// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace rpcprobe::log {

//! \brief Verbosity levels, ordered from the least to the most verbose
enum class Level {
    kNone,      // Unconditional lines without severity tag (e.g. banners)
    kCritical,  // The process cannot go on
    kError,     // An operation failed
    kWarning,   // Something unexpected the user may want to fix
    kInfo,      // Regular progress
    kDebug,     // Per-call details
    kTrace      // Wire-level details
};

std::string_view to_string(Level level);
std::optional<Level> level_from_string(std::string_view name);

//! \brief Logging configuration shared by the executables
struct Settings {
    //! Maximum verbosity printed
    Level verbosity{Level::kInfo};
    //! Print on std::cout instead of std::cerr
    bool to_stdout{false};
    //! Never emit ANSI colors, even on a terminal
    bool no_color{false};
    //! Timestamps in UTC instead of local time
    bool utc{true};
    //! Tag each line with the name of the emitting thread
    bool thread_names{false};
    //! Also append every line (uncolored) to this file when not empty
    std::filesystem::path file;
};

//! \brief Applies the settings
//! \note Not thread safe: call once at process start
void init(const Settings& settings = {});

Level get_verbosity();

//! \note Not thread safe: meant for process start and tests
void set_verbosity(Level level);

//! \brief Whether a line at the given level would be printed
bool test_verbosity(Level level);

//! \brief Names the calling thread in log lines
void set_thread_name(std::string_view name);

//! \brief Collects one log line and prints it on destruction
class Line {
  public:
    explicit Line(Level level);
    ~Line();

    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;

    template <class T>
    Line& operator<<(const T& value) {
        body_ << value;
        return *this;
    }

  private:
    Level level_;
    std::ostringstream body_;
};

}  // namespace rpcprobe::log

#define PROBE_LOG_AT(level_)                        \
    if (!rpcprobe::log::test_verbosity(level_)) { \
    } else                                          \
        rpcprobe::log::Line(level_)

#define PROBE_TRACE PROBE_LOG_AT(rpcprobe::log::Level::kTrace)
#define PROBE_DEBUG PROBE_LOG_AT(rpcprobe::log::Level::kDebug)
#define PROBE_INFO PROBE_LOG_AT(rpcprobe::log::Level::kInfo)
#define PROBE_WARN PROBE_LOG_AT(rpcprobe::log::Level::kWarning)
#define PROBE_ERROR PROBE_LOG_AT(rpcprobe::log::Level::kError)
#define PROBE_CRIT PROBE_LOG_AT(rpcprobe::log::Level::kCritical)
#define PROBE_LOG PROBE_LOG_AT(rpcprobe::log::Level::kNone)
