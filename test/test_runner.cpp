// test/test_runner.cpp
// -----------------------------------------------------------
// Google Test entry point for the PrivacyGuard unit tests in test/unit/.

#include <gtest/gtest.h>

#include "util/logger.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    // Warnings are part of several tested paths; keep the rest quiet.
    privacyguard::util::logger::setLogLevel(privacyguard::util::logger::LogLevel::ERROR);
    return RUN_ALL_TESTS();
}
