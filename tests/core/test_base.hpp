//===== test_base.hpp =====
#pragma once

#include <gtest/gtest.h>
#include "tablewright/core/logger.hpp"

namespace tablewright {
namespace testing {

/**
 * Quiet console logger for suites that exercise logging components.
 */
class TestBase : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();
        LoggerConfig config;
        config.destination = LogDestination::CONSOLE;
        config.min_level = LogLevel::ERR;
        Logger::instance().initialize(config);
    }

    void TearDown() override {
        Logger::reset_for_tests();
    }
};

}  // namespace testing
}  // namespace tablewright
