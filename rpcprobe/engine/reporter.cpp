// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#include "reporter.hpp"

#include <cerrno>
#include <fstream>
#include <system_error>

#include <absl/strings/str_cat.h>

#include <rpcprobe/infra/common/log.hpp>
#include <rpcprobe/infra/common/terminal.hpp>

namespace rpcprobe::engine {

static constexpr Verdict kAllVerdicts[]{
    Verdict::kPass,
    Verdict::kSchemaViolation,
    Verdict::kSemanticViolation,
    Verdict::kTransportError,
    Verdict::kSkipped,
};

static std::string_view verdict_color(Verdict verdict) {
    switch (verdict) {
        case Verdict::kPass:
            return kColorGreen;
        case Verdict::kSkipped:
            return kColorYellow;
        default:
            return kColorRed;
    }
}

size_t Summary::count(Verdict verdict) const {
    const auto it = verdicts.find(verdict);
    return it != verdicts.end() ? it->second : 0;
}

Reporter::Reporter(const ResultNode& root) : root_{root} {
    count(root_, /*required=*/true, summary_);
    summary_.status = root_.status();
}

void Reporter::count(const ResultNode& node, bool required, Summary& summary) {
    const bool node_required = required && node.required;
    if (node.case_result) {
        ++summary.total;
        ++summary.verdicts[node.case_result->verdict];
        if (node_required && node.case_result->verdict != Verdict::kPass) {
            ++summary.required_failures;
        }
    }
    for (const auto& child : node.children) {
        count(child, node_required, summary);
    }
}

nlohmann::json Reporter::node_to_json(const ResultNode& node) {
    nlohmann::json json{
        {"name", node.name},
        {"kind", to_string(node.kind)},
        {"target", node.target},
        {"status", to_string(node.status())},
        {"required", node.required},
    };
    if (node.setup_failure) {
        json["setup_failure"] = *node.setup_failure;
    }
    if (!node.notes.empty()) {
        json["notes"] = node.notes;
    }
    if (const auto& result = node.case_result) {
        json["method"] = result->method;
        json["verdict"] = to_string(result->verdict);
        json["details"] = result->details;
        json["notes"] = result->notes;
        json["elapsed_ms"] = result->elapsed.count();
        json["attempts"] = result->attempts;
        json["request"] = result->request;
        json["response"] = result->response;
        auto violations = nlohmann::json::array();
        for (const auto& violation : result->violations) {
            violations.push_back({{"path", violation.path}, {"expected", violation.expected}, {"actual", violation.actual}});
        }
        json["violations"] = std::move(violations);
    }
    auto children = nlohmann::json::array();
    for (const auto& child : node.children) {
        children.push_back(node_to_json(child));
    }
    json["children"] = std::move(children);
    return json;
}

nlohmann::json Reporter::to_json() const {
    auto json = node_to_json(root_);
    nlohmann::json counts = nlohmann::json::object();
    for (const auto verdict : kAllVerdicts) {
        counts[std::string{to_string(verdict)}] = summary_.count(verdict);
    }
    json["summary"] = {
        {"total", summary_.total},
        {"verdicts", std::move(counts)},
        {"required_failures", summary_.required_failures},
    };
    return json;
}

void Reporter::write_json(const std::filesystem::path& path) const {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream stream{path, std::ios::trunc};
    if (!stream) {
        throw std::system_error{errno, std::generic_category(), absl::StrCat("cannot write report ", path.string())};
    }
    stream << to_json().dump(2) << "\n";
    stream.flush();
    if (!stream) {
        throw std::system_error{errno, std::generic_category(), absl::StrCat("cannot write report ", path.string())};
    }
    PROBE_INFO << "Reporter: report written to " << path.string();
}

void Reporter::print_failures(std::ostream& out, const ResultNode& node, const std::string& prefix, bool colored) {
    const auto path = prefix.empty() ? node.name : absl::StrCat(prefix, "/", node.name);
    if (node.setup_failure) {
        out << (colored ? kColorRed : "") << "  " << path << ": " << *node.setup_failure << (colored ? kColorReset : "") << "\n";
    }
    for (const auto& note : node.notes) {
        out << "  " << path << ": " << note << "\n";
    }
    if (const auto& result = node.case_result; result && result->verdict != Verdict::kPass) {
        out << "  " << (colored ? verdict_color(result->verdict) : "") << to_string(result->verdict) << (colored ? kColorReset : "")
            << " " << path << (node.required ? "" : " (optional)");
        if (!result->details.empty()) {
            out << ": " << result->details;
        }
        out << "\n";
    }
    for (const auto& child : node.children) {
        print_failures(out, child, path, colored);
    }
}

void Reporter::print_summary(std::ostream& out, bool colored) const {
    for (const auto& child : root_.children) {
        print_failures(out, child, "", colored);
    }
    out << "\n" << summary_.total << " cases:";
    for (const auto verdict : kAllVerdicts) {
        const auto count = summary_.count(verdict);
        if (count == 0) continue;
        out << " " << (colored ? verdict_color(verdict) : "") << to_string(verdict) << "=" << count << (colored ? kColorReset : "");
    }
    out << "\n";
    const bool pass = summary_.status == Status::kPass;
    out << "Status: " << (colored ? (pass ? kColorGreenHigh : kColorRedHigh) : "") << to_string(summary_.status)
        << (colored ? kColorReset : "") << "\n";
}

int Reporter::exit_code() const {
    return summary_.status == Status::kPass ? 0 : 1;
}

}  // namespace rpcprobe::engine
