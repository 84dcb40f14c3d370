// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

#include <absl/strings/ascii.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

#include <rpcprobe/infra/common/config_error.hpp>
#include <rpcprobe/infra/common/terminal.hpp>

namespace rpcprobe::log {

static Settings settings_{};
static bool colorize_{false};
static std::mutex output_mutex_;
static std::unique_ptr<std::ofstream> file_;
thread_local std::string thread_name_;

struct LevelStyle {
    std::string_view tag;
    std::string_view color;
};

static LevelStyle style_of(Level level) {
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
        case Level::kNone:
            break;
    }
    return {"     ", kColorReset};
}

std::string_view to_string(Level level) {
    switch (level) {
        case Level::kNone:
            return "none";
        case Level::kCritical:
            return "critical";
        case Level::kError:
            return "error";
        case Level::kWarning:
            return "warning";
        case Level::kInfo:
            return "info";
        case Level::kDebug:
            return "debug";
        case Level::kTrace:
            return "trace";
    }
    return "unknown";
}

std::optional<Level> level_from_string(std::string_view name) {
    const auto lowered = absl::AsciiStrToLower(name);
    for (const auto level : {Level::kNone, Level::kCritical, Level::kError, Level::kWarning, Level::kInfo, Level::kDebug, Level::kTrace}) {
        if (to_string(level) == lowered) {
            return level;
        }
    }
    return std::nullopt;
}

void init(const Settings& settings) {
    settings_ = settings;
    file_.reset();
    if (!settings_.file.empty()) {
        file_ = std::make_unique<std::ofstream>(settings_.file, std::ios::out | std::ios::app);
        if (!file_->is_open()) {
            file_.reset();
            throw ConfigError{"cannot open log file " + settings_.file.string()};
        }
    }
    const bool terminal = settings_.to_stdout ? is_terminal_stdout() : is_terminal_stderr();
    colorize_ = terminal && !settings_.no_color;
}

Level get_verbosity() { return settings_.verbosity; }

void set_verbosity(Level level) { settings_.verbosity = level; }

bool test_verbosity(Level level) { return level <= settings_.verbosity; }

void set_thread_name(std::string_view name) {
    thread_name_ = name;
}

static const std::string& thread_name() {
    if (thread_name_.empty()) {
        std::ostringstream id;
        id << std::this_thread::get_id();
        thread_name_ = id.str();
    }
    return thread_name_;
}

// Severity tag, timestamp and optional thread name
static std::string header(Level level, bool colored) {
    static const absl::TimeZone kZone{settings_.utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    const auto [tag, color] = style_of(level);

    std::ostringstream out;
    if (colored) {
        out << color << tag << kColorReset << " " << kColorWhite;
    } else {
        out << tag << " ";
    }
    out << "[" << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), kZone) << "]";
    if (colored) {
        out << kColorReset;
    }
    out << " ";
    if (settings_.thread_names) {
        out << "[" << thread_name() << "] ";
    }
    return out.str();
}

Line::Line(Level level) : level_{level} {}

Line::~Line() {
    const auto body = body_.str();
    std::scoped_lock lock{output_mutex_};
    auto& out = settings_.to_stdout ? std::cout : std::cerr;
    out << header(level_, colorize_) << body << '\n';
    if (file_) {
        *file_ << header(level_, false) << body << '\n';
        file_->flush();
    }
}

}  // namespace rpcprobe::log
