// Copyright 2025 The Rpcprobe Authors
// SPDX-License-Identifier: Apache-2.0

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>
#include <gmock/gmock.h>

int main(int argc, char* argv[]) {
    // Make gMock expectation failures surface as Catch2 test failures
    ::testing::GTEST_FLAG(throw_on_failure) = true;
    ::testing::InitGoogleMock(&argc, argv);

    return Catch::Session().run(argc, argv);
}
