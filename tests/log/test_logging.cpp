#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

#include "airmon/error/exception.hpp"
#include "airmon/log/logging.hpp"

namespace airmon::log::test {

TEST(LoggingTest, ParsesLevelNames) {
    EXPECT_EQ(parseLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(parseLevel("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(parseLevel("warning"), spdlog::level::warn);
    EXPECT_EQ(parseLevel("err"), spdlog::level::err);
    EXPECT_EQ(parseLevel("off"), spdlog::level::off);
    EXPECT_THROW((void)parseLevel("verbose"), error::InvalidArgument);
    EXPECT_THROW((void)parseLevel(""), error::InvalidArgument);
}

TEST(LoggingTest, InstallsDefaultLoggerWithFileSink) {
    const auto path =
        std::filesystem::temp_directory_path() / "airmon_logging_test.log";
    std::filesystem::remove(path);

    LogSettings settings;
    settings.level = "debug";
    settings.file = path.string();
    auto logger = initLogging(settings);
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->name(), LOGGER_NAME);
    EXPECT_EQ(spdlog::default_logger(), logger);
    EXPECT_EQ(logger->level(), spdlog::level::debug);
    EXPECT_EQ(logger->sinks().size(), 2U);

    spdlog::debug("hello from the test");
    logger->flush();
    std::ifstream in(path);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("hello from the test"), std::string::npos);

    setLevel("error");
    EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::err);

    initLogging(LogSettings{});
    std::filesystem::remove(path);
}

TEST(LoggingTest, ReinitializingReplacesLogger) {
    auto first = initLogging(LogSettings{});
    auto second = initLogging(LogSettings{});
    EXPECT_NE(first, second);
    EXPECT_EQ(spdlog::default_logger(), second);
    EXPECT_EQ(second->sinks().size(), 1U);
}

}  // namespace airmon::log::test
