// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <fstream>
#include <string>

#include <absl/strings/match.h>
#include <catch2/catch.hpp>

#include <rpcprobe/infra/common/config_error.hpp>
#include <rpcprobe/infra/test_util/temporary_file.hpp>

namespace rpcprobe::log {

TEST_CASE("log level names", "[infra][common][log]") {
    CHECK(to_string(Level::kWarning) == "warning");
    CHECK(level_from_string("TRACE") == Level::kTrace);
    CHECK(level_from_string("info") == Level::kInfo);
    CHECK_FALSE(level_from_string("verbose"));
}

TEST_CASE("log verbosity filter", "[infra][common][log]") {
    const auto saved = get_verbosity();
    set_verbosity(Level::kWarning);
    CHECK(test_verbosity(Level::kError));
    CHECK(test_verbosity(Level::kWarning));
    CHECK_FALSE(test_verbosity(Level::kInfo));
    set_verbosity(saved);
}

TEST_CASE("log lines are appended uncolored to the log file", "[infra][common][log]") {
    test_util::TemporaryFile file;
    init({.verbosity = Level::kDebug, .thread_names = true, .file = file.path()});
    set_thread_name("log-test");

    PROBE_DEBUG << "answer is " << 42;
    PROBE_TRACE << "not printed";

    std::ifstream stream{file.path()};
    std::string line;
    REQUIRE(std::getline(stream, line));
    CHECK(absl::StartsWith(line, "DEBUG ["));
    CHECK(absl::StrContains(line, "[log-test] answer is 42"));
    CHECK_FALSE(absl::StrContains(line, "\x1b["));
    CHECK_FALSE(std::getline(stream, line));

    init({.verbosity = Level::kNone});
}

TEST_CASE("log init fails on an unwritable file", "[infra][common][log]") {
    CHECK_THROWS_AS(init({.file = "/nonexistent-dir/rpcprobe.log"}), ConfigError);
    init({.verbosity = Level::kNone});
}

}  // namespace rpcprobe::log
