// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

#include "result.hpp"

namespace rpcprobe::engine {

//! Case counts of a finished result tree
struct Summary {
    size_t total{0};
    std::map<Verdict, size_t> verdicts;
    //! Non-passing cases that affect the aggregate status
    size_t required_failures{0};
    Status status{Status::kPass};

    size_t count(Verdict verdict) const;
};

class Reporter {
  public:
    explicit Reporter(const ResultNode& root);

    //! Report artifact: the result tree with aggregate status at every level
    nlohmann::json to_json() const;

    //! Write the report artifact, throw std::system_error if the file cannot be written
    void write_json(const std::filesystem::path& path) const;

    //! Human readable summary: failing cases with their details, then the counts per verdict
    void print_summary(std::ostream& out, bool colored) const;

    const Summary& summary() const { return summary_; }

    //! Process exit code of the run: 0 when the aggregate status is Pass, 1 otherwise
    int exit_code() const;

  private:
    static nlohmann::json node_to_json(const ResultNode& node);
    static void count(const ResultNode& node, bool required, Summary& summary);
    static void print_failures(std::ostream& out, const ResultNode& node, const std::string& prefix, bool colored);

    const ResultNode& root_;
    Summary summary_;
};

}  // namespace rpcprobe::engine
