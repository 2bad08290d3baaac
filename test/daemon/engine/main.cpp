//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "gtest_printer.hpp"

#include <gtest/gtest.h>

#include <memory>

int main(int argc, char** const argv)
{
    zfsx::GtestPrinter::setupLogging(argc, argv, "engine_tests");

    testing::InitGoogleTest(&argc, argv);

    // GoogleTest takes ownership of the listener.
    auto printer = std::make_unique<zfsx::GtestPrinter>();
    testing::UnitTest::GetInstance()->listeners().Append(printer.release());

    return RUN_ALL_TESTS();
}
