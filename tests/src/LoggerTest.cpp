#include "gtest/gtest.h"
#include "logger/Logger.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        folder = fs::temp_directory_path() / "escpos_logger_test";
        fs::remove_all(folder);
    }

    void TearDown() override {
        Logger::shutdown();
        Logger::setLevel(LogLevel::Info);
        std::error_code ec;
        fs::remove_all(folder, ec);
    }

    std::vector<fs::path> logFiles() const {
        std::vector<fs::path> files;
        for (const auto &entry: fs::directory_iterator(folder)) {
            files.push_back(entry.path());
        }
        return files;
    }

    fs::path folder;
};

TEST_F(LoggerTest, LevelNames) {
    EXPECT_EQ(Logger::levelFromString("debug"), LogLevel::Debug);
    EXPECT_EQ(Logger::levelFromString("WARN"), LogLevel::Warning);
    EXPECT_EQ(Logger::levelFromString("Error"), LogLevel::Error);
    EXPECT_EQ(Logger::levelFromString("whatever"), LogLevel::Info);
}

TEST_F(LoggerTest, FileReceivesMessagesAboveThreshold) {
    Logger::init(folder.string(), LogLevel::Info);
    Logger::logDebug("[LoggerTest] hidden");
    Logger::logInfo("[LoggerTest] visible");
    Logger::shutdown();

    const auto files = logFiles();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].filename().string().rfind("escpos_", 0), 0u);
    EXPECT_EQ(files[0].extension(), ".log");

    std::ifstream in(files[0]);
    const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("[INFO]"), std::string::npos);
    EXPECT_NE(content.find("visible"), std::string::npos);
    EXPECT_EQ(content.find("hidden"), std::string::npos);
}
