// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <fstream>
#include <ios>
#include <random>
#include <string>
#include <string_view>
#include <variant>

namespace rpcprobe::test_util {

//! Temporary file flushing data after any insertion, removed on destruction
class TemporaryFile {
  public:
    TemporaryFile()
        : TemporaryFile{std::filesystem::temp_directory_path() / unique_name(), std::monostate{}} {}
    explicit TemporaryFile(const std::string& filename)
        : TemporaryFile{std::filesystem::temp_directory_path() / filename, std::monostate{}} {}
    ~TemporaryFile() {
        stream_.close();
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    const std::filesystem::path& path() const noexcept { return path_; }

    void write(std::string_view data) {
        stream_.write(data.data(), static_cast<std::streamsize>(data.size()));
        stream_.flush();
    }

  private:
    TemporaryFile(std::filesystem::path path, std::monostate /*sentinel*/)
        : path_{std::move(path)},
          stream_{path_, std::ios::binary} {
        stream_.exceptions(std::ios::failbit | std::ios::badbit);
    }

    static std::string unique_name() {
        static constexpr std::string_view kAlphabet{"abcdefghijklmnopqrstuvwxyz0123456789"};
        std::random_device rd;
        std::uniform_int_distribution<size_t> dist{0, kAlphabet.size() - 1};
        std::string name{"rpcprobe-"};
        for (int i = 0; i < 12; ++i) {
            name += kAlphabet[dist(rd)];
        }
        return name;
    }

    std::filesystem::path path_;
    std::ofstream stream_;
};

}  // namespace rpcprobe::test_util
