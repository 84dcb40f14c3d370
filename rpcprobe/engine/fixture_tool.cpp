// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "fixture_tool.hpp"

#include <fstream>
#include <random>
#include <sstream>
#include <system_error>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/process/args.hpp>
#include <boost/process/child.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/io.hpp>
#include <boost/process/search_path.hpp>
#include <boost/process/start_dir.hpp>

#include <rpcprobe/infra/common/config_error.hpp>
#include <rpcprobe/infra/common/log.hpp>

namespace rpcprobe::engine {

namespace bp = boost::process;

static constexpr size_t kMaxErrorExcerpt{512};

//! Scratch file in the temporary directory removed on destruction
class ScratchFile {
  public:
    explicit ScratchFile(std::string_view prefix) {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() / absl::StrCat(prefix, rd(), "-", rd());
    }
    ~ScratchFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    ScratchFile(const ScratchFile&) = delete;
    ScratchFile& operator=(const ScratchFile&) = delete;

    const std::filesystem::path& path() const { return path_; }

  private:
    std::filesystem::path path_;
};

static std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream stream{path, std::ios::binary};
    if (!stream) {
        return std::nullopt;
    }
    std::stringstream content;
    content << stream.rdbuf();
    return content.str();
}

FixtureInvocation FixtureInvocation::from_json(const nlohmann::json& json) {
    if (!json.is_object() || !json.contains("program") || !json["program"].is_string()) {
        throw ConfigError{absl::StrCat("fixture invocation requires a program: ", json.dump())};
    }
    FixtureInvocation invocation;
    invocation.program = json["program"].get<std::string>();
    try {
        if (json.contains("args")) {
            invocation.args = json["args"].get<std::vector<std::string>>();
        }
        if (json.contains("output_file")) {
            invocation.output_file = json["output_file"].get<std::string>();
        }
        if (json.contains("working_dir")) {
            invocation.working_dir = json["working_dir"].get<std::string>();
        }
        if (json.contains("timeout_ms")) {
            invocation.timeout = std::chrono::milliseconds{json["timeout_ms"].get<uint32_t>()};
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError{absl::StrCat("invalid fixture invocation of ", invocation.program, ": ", e.what())};
    }
    return invocation;
}

ProcessFixtureTool::ProcessFixtureTool(size_t num_threads) : pool_{num_threads} {}

ProcessFixtureTool::~ProcessFixtureTool() {
    pool_.join();
}

Task<FixtureResult> ProcessFixtureTool::run(const FixtureInvocation& invocation) {
    co_return co_await boost::asio::co_spawn(
        pool_,
        [&invocation]() -> Task<FixtureResult> { co_return run_blocking(invocation); },
        boost::asio::use_awaitable);
}

FixtureResult ProcessFixtureTool::run_blocking(const FixtureInvocation& invocation) {
    std::string program{invocation.program};
    if (program.find('/') == std::string::npos) {
        program = bp::search_path(invocation.program).string();
        if (program.empty()) {
            return tl::make_unexpected(absl::StrCat("fixture program not found in PATH: ", invocation.program));
        }
    }

    const ScratchFile stdout_file{"rpcprobe-fixture-out-"};
    const ScratchFile stderr_file{"rpcprobe-fixture-err-"};
    const auto working_dir = invocation.working_dir.value_or(std::filesystem::current_path());

    PROBE_DEBUG << "ProcessFixtureTool: running " << program << " " << absl::StrJoin(invocation.args, " ");
    std::error_code ec;
    bp::child child{
        bp::exe = program,
        bp::args = invocation.args,
        bp::start_dir = working_dir.string(),
        bp::std_in < bp::null,
        bp::std_out > stdout_file.path().string(),
        bp::std_err > stderr_file.path().string(),
        ec};
    if (ec) {
        return tl::make_unexpected(absl::StrCat("cannot start ", program, ": ", ec.message()));
    }

    if (!child.wait_for(invocation.timeout, ec)) {
        std::error_code terminate_ec;
        child.terminate(terminate_ec);
        if (ec) {
            return tl::make_unexpected(absl::StrCat("cannot wait for ", program, ": ", ec.message()));
        }
        return tl::make_unexpected(absl::StrCat(program, " timed out after ", invocation.timeout.count(), " ms"));
    }

    if (const int exit_code = child.exit_code(); exit_code != 0) {
        auto error_output = read_file(stderr_file.path()).value_or("");
        if (error_output.size() > kMaxErrorExcerpt) {
            error_output.resize(kMaxErrorExcerpt);
        }
        return tl::make_unexpected(absl::StrCat(program, " exited with code ", exit_code, ": ", error_output));
    }

    const auto& output_path = invocation.output_file ? *invocation.output_file : stdout_file.path();
    const auto output = read_file(output_path);
    if (!output) {
        return tl::make_unexpected(absl::StrCat("cannot read output of ", program, " from ", output_path.string()));
    }
    auto json = nlohmann::json::parse(*output, nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded()) {
        return tl::make_unexpected(absl::StrCat("output of ", program, " is not JSON"));
    }
    PROBE_TRACE << "ProcessFixtureTool: " << program << " produced " << json.dump();
    return json;
}

}  // namespace rpcprobe::engine
