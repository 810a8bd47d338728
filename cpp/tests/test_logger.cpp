// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <molham/utils/logger.hpp>
#include <sstream>

using namespace molham::utils;

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override { Logger::set_global_level(LogLevel::trace); }

  void TearDown() override { Logger::set_global_level(LogLevel::info); }
};

TEST_F(LoggerTest, GetLoggerReturnsNamedLogger) {
  auto logger = Logger::get();
  ASSERT_NE(logger, nullptr);
  EXPECT_EQ(logger->name(), "molham");
}

TEST_F(LoggerTest, GetLoggerReturnsSameInstance) {
  auto logger1 = Logger::get();
  auto logger2 = Logger::get();
  EXPECT_EQ(logger1.get(), logger2.get());
}

TEST_F(LoggerTest, RawLoggerMacroReturnsGlobalLogger) {
  auto logger = MOLHAM_RAW_LOGGER();
  ASSERT_NE(logger, nullptr);
  EXPECT_EQ(logger.get(), Logger::get().get());
}

TEST_F(LoggerTest, ContextLoggerLevelsWork) {
  EXPECT_NO_THROW({
    MOLHAM_LOGGER().trace("trace message");
    MOLHAM_LOGGER().debug("debug message");
    MOLHAM_LOGGER().info("info message");
    MOLHAM_LOGGER().warn("warning message");
    MOLHAM_LOGGER().error("error message");
    MOLHAM_LOGGER().critical("critical message");
  });
}

TEST_F(LoggerTest, GlobalLevelControl) {
  Logger::set_global_level(LogLevel::info);
  EXPECT_EQ(Logger::get_global_level(), LogLevel::info);
  EXPECT_EQ(Logger::get()->level(), spdlog::level::info);

  Logger::set_global_level(LogLevel::warn);
  EXPECT_FALSE(Logger::get()->should_log(spdlog::level::info));
  EXPECT_TRUE(Logger::get()->should_log(spdlog::level::warn));

  Logger::disable_all();
  EXPECT_EQ(Logger::get_global_level(), LogLevel::off);
  EXPECT_NO_THROW({ MOLHAM_LOGGER().critical("suppressed"); });
}

TEST_F(LoggerTest, FormattedAndRuntimeMessages) {
  std::ostringstream oss;
  oss << "Dynamic message with value: " << 123;
  EXPECT_NO_THROW({
    MOLHAM_LOGGER().info("norb = {}, constant = {:.6f}", 4, 1.25);
    MOLHAM_LOGGER().info(oss.str());
  });
}

void function_logging_entry() { MOLHAM_LOG_TRACE_ENTERING(); }

TEST_F(LoggerTest, LogTraceEntering) {
  EXPECT_NO_THROW({ log_trace_entering(); });
  EXPECT_NO_THROW({ function_logging_entry(); });

  Logger::set_global_level(LogLevel::info);
  EXPECT_NO_THROW({ function_logging_entry(); });
}

TEST_F(LoggerTest, PathToColonString) {
  EXPECT_EQ(detail::path_to_colon_string(
                "/work/repo/cpp/src/molham/utils/orbital_rotation.cpp"),
            "molham:utils:orbital_rotation");
  EXPECT_EQ(detail::path_to_colon_string("molham/data/settings.cpp"),
            "molham:data:settings");
  EXPECT_EQ(detail::path_to_colon_string("/work/repo/cpp/tests/test_logger.cpp"),
            "");
  EXPECT_EQ(
      detail::path_to_colon_string("/work/molham_tests/x.cpp", "molham"), "");
}

TEST_F(LoggerTest, SourceContextIsNeverEmpty) {
  EXPECT_FALSE(Logger::get_source_context().empty());
}

TEST_F(LoggerTest, ExtractMethodName) {
  EXPECT_EQ(detail::extract_method_name("void MyClass::myMethod(int)"),
            "myMethod");
  EXPECT_EQ(detail::extract_method_name("MyClass::MyClass()"),
            "MyClass constructor");
  EXPECT_EQ(detail::extract_method_name("globalFunction(std::string)"),
            "globalFunction");
  EXPECT_EQ(detail::extract_method_name(
                "molham::data::MolecularHamiltonian molham::utils::"
                "rotate_hamiltonian(const int&)"),
            "rotate_hamiltonian");
}
