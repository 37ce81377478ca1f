//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "gtest_printer.hpp"

#include <gtest/gtest.h>

int main(int argc, char** const argv)
{
    // Logging goes first, so that `SPDLOG_LEVEL=...` arguments are applied
    // before GoogleTest sees (and ignores) them.
    typebind::GtestPrinter::setupLogging(argc, argv, "typebind_tests");
    testing::InitGoogleTest(&argc, argv);

    // Listeners are owned by GoogleTest.
    testing::UnitTest::GetInstance()->listeners().Append(new typebind::GtestPrinter);

    const int result = RUN_ALL_TESTS();
    spdlog::info("typebind_tests finished (result={}).", result);
    return result;
}
