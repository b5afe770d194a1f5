#include "gtest/gtest.h"
#include "application/config/ConfigManager.hpp"

#include <algorithm>
#include <cstdlib>

using escpos::config::ConfigManager;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ConfigManager::getInstance().reset();
    }

    void TearDown() override {
        unsetenv("ESCPOS_DRIVER_TYPE");
        unsetenv("ESCPOS_NETWORK_PORT");
        ConfigManager::getInstance().reset();
    }

    static bool hasError(const ConfigManager::ValidationResult &result, const std::string &fragment) {
        return std::any_of(result.errors.begin(), result.errors.end(), [&fragment](const std::string &error) {
            return error.find(fragment) != std::string::npos;
        });
    }

    ConfigManager &config = ConfigManager::getInstance();
};

TEST_F(ConfigManagerTest, DefaultsAreValid) {
    const auto driver = config.getDriverConfig();
    EXPECT_EQ(driver.type, "console");
    EXPECT_EQ(driver.networkPort, 9100);
    EXPECT_EQ(config.getPrinterConfig().charactersPerLine, 42);
    EXPECT_EQ(config.getLoggingConfig().level, "info");
    EXPECT_TRUE(config.validate().isValid);
}

TEST_F(ConfigManagerTest, NestedJsonIsFlattened) {
    ASSERT_TRUE(config.loadFromString(R"({
        "driver": {"type": "network", "network": {"host": "10.0.0.5", "port": 9101}},
        "printer": {"page": {"code": "PC858"}, "strict": {"encoding": true}}
    })"));

    const auto driver = config.getDriverConfig();
    EXPECT_EQ(driver.type, "network");
    EXPECT_EQ(driver.networkHost, "10.0.0.5");
    EXPECT_EQ(driver.networkPort, 9101);

    const auto printer = config.getPrinterConfig();
    EXPECT_EQ(printer.pageCode, "PC858");
    EXPECT_TRUE(printer.strictEncoding);
    EXPECT_TRUE(config.validate().isValid);
}

TEST_F(ConfigManagerTest, MalformedJsonLeavesConfigUnchanged) {
    EXPECT_FALSE(config.loadFromString("{\"driver\": "));
    EXPECT_FALSE(config.loadFromString("[1, 2]"));
    EXPECT_EQ(config.getDriverConfig().type, "console");
}

TEST_F(ConfigManagerTest, ValidationReportsEveryProblem) {
    config.set("driver.type", "usb");
    config.set("driver.network.port", "70000");
    config.set("printer.page.code", "PC999");
    config.set("printer.debug.mode", "binary");
    config.set("printer.characters.per.line", "0");

    const auto result = config.validate();
    EXPECT_FALSE(result.isValid);
    EXPECT_EQ(result.errors.size(), 5u);
    EXPECT_TRUE(hasError(result, "driver.type"));
    EXPECT_TRUE(hasError(result, "driver.network.port"));
    EXPECT_TRUE(hasError(result, "printer.page.code"));
    EXPECT_TRUE(hasError(result, "printer.debug.mode"));
    EXPECT_TRUE(hasError(result, "printer.characters.per.line"));
}

TEST_F(ConfigManagerTest, FileDriverNeedsPath) {
    config.set("driver.type", "file");
    config.set("driver.file.path", "");
    EXPECT_TRUE(hasError(config.validate(), "driver.file.path"));
}

TEST_F(ConfigManagerTest, NonNumericValueFallsBackToDefault) {
    config.set("driver.serial.baudrate", "fast");
    EXPECT_EQ(config.getDriverConfig().serialBaudrate, 9600);
}

TEST_F(ConfigManagerTest, EnvironmentOverridesFile) {
    ASSERT_TRUE(config.loadFromString(R"({"driver": {"type": "file"}})"));
    setenv("ESCPOS_DRIVER_TYPE", "network", 1);
    setenv("ESCPOS_NETWORK_PORT", "9200", 1);
    config.loadFromEnv();

    EXPECT_EQ(config.getDriverConfig().type, "network");
    EXPECT_EQ(config.getDriverConfig().networkPort, 9200);
}

TEST_F(ConfigManagerTest, ResetRestoresDefaults) {
    config.set("logging.level", "debug");
    config.reset();
    EXPECT_EQ(config.getLoggingConfig().level, "info");
}
