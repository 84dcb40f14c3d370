// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include <rpcprobe/rpc/transport/transport.hpp>
#include <rpcprobe/validation/method_spec.hpp>

#include "fixture_tool.hpp"
#include "result.hpp"
#include "settings.hpp"
#include "suite.hpp"
#include "target_registry.hpp"

namespace rpcprobe::engine {

/**
 * Conformance run: load the OpenRPC documents, the targets and the suite, execute the suite against every target
 * and report the result tree.
 */
class Runner {
  public:
    //! Execute the whole run and return the process exit code
    static int run(const RunnerSettings& settings);

    //! Load everything the run needs, throw ConfigError if anything is malformed
    explicit Runner(const RunnerSettings& settings,
                    std::shared_ptr<rpc::Transport> transport = nullptr,
                    std::shared_ptr<FixtureTool> fixture_tool = nullptr);

    //! Execute the suite on the runner thread pool, blocking until the result tree is complete
    ResultNode execute();

    const Suite& suite() const { return suite_; }
    const TargetRegistry& targets() const { return targets_; }

  private:
    const RunnerSettings& settings_;
    std::shared_ptr<const validation::Specification> spec_;
    TargetRegistry targets_;
    Suite suite_;
    std::shared_ptr<rpc::Transport> transport_;
    std::shared_ptr<FixtureTool> fixture_tool_;
    boost::asio::thread_pool pool_;
};

}  // namespace rpcprobe::engine
