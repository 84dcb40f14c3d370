// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <rpcprobe/infra/concurrency/task.hpp>

#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace rpcprobe::engine {

inline constexpr std::chrono::milliseconds kDefaultFixtureTimeout{60'000};

//! One invocation of an external fixture-generation binary
struct FixtureInvocation {
    //! Absolute path or name looked up in PATH
    std::string program;
    std::vector<std::string> args;
    //! JSON output is read from this file when set, from the standard output otherwise
    std::optional<std::filesystem::path> output_file;
    std::optional<std::filesystem::path> working_dir;
    std::chrono::milliseconds timeout{kDefaultFixtureTimeout};

    //! Build from {"program", "args", "output_file", "working_dir", "timeout_ms"}, throw ConfigError if malformed
    static FixtureInvocation from_json(const nlohmann::json& json);
};

using FixtureResult = tl::expected<nlohmann::json, std::string>;

//! Runner of external fixture tools producing JSON values (deployed accounts, declared classes...)
class FixtureTool {
  public:
    virtual ~FixtureTool() = default;

    //! Run to completion: exit code must be 0 and output must be JSON
    virtual Task<FixtureResult> run(const FixtureInvocation& invocation) = 0;
};

//! Fixture tool spawning child processes, waited on a dedicated thread pool
class ProcessFixtureTool : public FixtureTool {
  public:
    explicit ProcessFixtureTool(size_t num_threads = 1);
    ~ProcessFixtureTool() override;

    Task<FixtureResult> run(const FixtureInvocation& invocation) override;

    //! Spawn the process and wait for its completion on the calling thread
    static FixtureResult run_blocking(const FixtureInvocation& invocation);

  private:
    boost::asio::thread_pool pool_;
};

}  // namespace rpcprobe::engine
