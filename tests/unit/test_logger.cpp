#include <gtest/gtest.h>
#include "common/logger.h"
#include "config/client_config.h"
#include "config/config_loader.h"
#include <cstdio>
#include <fstream>
#include <string>

using namespace darwin::client;

namespace {

size_t countLines(const std::string& path, const std::string& needle) {
    std::ifstream in(path);
    std::string line;
    size_t n = 0;
    while (std::getline(in, line)) {
        if (line.find(needle) != std::string::npos) ++n;
    }
    return n;
}

} // namespace

TEST(LoggingTest, ReconfiguringKeepsASingleFileSink) {
    const std::string path = "darwin_client_logging_test.log";
    std::remove(path.c_str());

    config::LoggingConfig logging;
    logging.level = "info";
    logging.file = path;
    configureLogging(logging);
    configureLogging(logging);

    auto existing = getLogger(LogCategory::CLIENT);
    auto created_later = getLogger("LOGGING_TEST");
    existing->info("first marker");
    created_later->info("second marker");

    // Dropping the file closes it; later lines go to the console only.
    logging.file.clear();
    configureLogging(logging);
    existing->info("third marker");

    EXPECT_EQ(countLines(path, "first marker"), 1u);
    EXPECT_EQ(countLines(path, "second marker"), 1u);
    EXPECT_EQ(countLines(path, "third marker"), 0u);
    EXPECT_EQ(countLines(path, "[CLIENT] [info] first marker"), 1u);
    std::remove(path.c_str());
}

TEST(LoggingTest, LevelAppliesToEveryLogger) {
    config::LoggingConfig logging;
    logging.level = "debug";
    configureLogging(logging);
    EXPECT_EQ(getLogger(LogCategory::WIRE)->level(), spdlog::level::debug);
    EXPECT_EQ(getLogger("LOGGING_TEST_LEVEL")->level(), spdlog::level::debug);

    logging.level = "verbose";
    EXPECT_THROW(configureLogging(logging), config::ConfigValidationError);

    logging.level = "info";
    configureLogging(logging);
    EXPECT_EQ(getLogger(LogCategory::WIRE)->level(), spdlog::level::info);
}
