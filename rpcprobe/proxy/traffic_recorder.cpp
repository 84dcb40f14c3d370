// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "traffic_recorder.hpp"

#include <spdlog/sinks/rotating_file_sink.h>

#include <rpcprobe/infra/common/config_error.hpp>

namespace rpcprobe::proxy {

inline constexpr size_t kMebi{1024 * 1024};

TrafficRecorder::TrafficRecorder(RecorderSettings settings) : settings_{std::move(settings)} {
    if (settings_.name.empty()) {
        throw ConfigError{"traffic recording needs a file name"};
    }
    std::error_code ec;
    std::filesystem::create_directories(settings_.folder, ec);
    if (ec) {
        throw ConfigError{"cannot create recording folder " + settings_.folder.string() + ": " + ec.message()};
    }
    path_ = settings_.folder / (settings_.name + ".log");

    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path_.string(), settings_.max_file_size_mb * kMebi, settings_.max_files);
    logger_ = std::make_shared<spdlog::logger>(settings_.name, std::move(sink));
    // All-or-nothing: the recording ignores the verbosity of the application log
    logger_->set_level(spdlog::level::info);
    logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
}

TrafficRecorder::~TrafficRecorder() {
    logger_->flush();
}

template <typename... Args>
void TrafficRecorder::write(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    logger_->info(fmt, std::forward<Args>(args)...);
    if (settings_.auto_flush) {
        logger_->flush();
    }
}

void TrafficRecorder::record_request(std::string_view body) {
    write("REQ -> {}", body);
}

void TrafficRecorder::record_upstream(const UpstreamOutcome& outcome) {
    if (!settings_.include_replies) return;
    if (outcome.result) {
        write("UPS {} <- {}", outcome.upstream, outcome.result->dump());
    } else {
        write("UPS {} !! {}", outcome.upstream, failures_to_json({outcome}).front().dump());
    }
}

void TrafficRecorder::record_reply(unsigned int status, std::string_view body) {
    if (!settings_.include_replies) return;
    write("RSP {} <- {}", status, body);
}

void TrafficRecorder::flush() {
    logger_->flush();
}

}  // namespace rpcprobe::proxy
