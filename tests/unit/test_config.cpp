/**
 * @file test_config.cpp
 * @brief Config store and ConsoleSettings tests
 */

#include <gtest/gtest.h>
#include "Config.h"
#include "ConsoleSettings.h"
#include "ErrorCodes.h"
#include "PathUtils.h"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace ConsoleGate;

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() /
                ("consolegate_config_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + ".conf");
    }

    void TearDown() override {
        std::filesystem::remove(path_);
    }

    void write(const std::string& content) {
        std::ofstream out(path_);
        out << content;
    }

    std::filesystem::path path_;
};

// ============================================================================
// Config
// ============================================================================

TEST(ConfigTest, BasicOperations) {
    Config config;
    config.set("key1", "value1");
    EXPECT_EQ(config.get("key1"), "value1");
    EXPECT_TRUE(config.hasKey("key1"));
    EXPECT_FALSE(config.hasKey("key2"));
    EXPECT_EQ(config.get("key2", "fallback"), "fallback");

    config.setInt("intKey", 42);
    EXPECT_EQ(config.getInt("intKey"), 42);

    config.setBool("boolKey", true);
    EXPECT_TRUE(config.getBool("boolKey"));

    config.setSize("sizeKey", 1048576);
    EXPECT_EQ(config.getSize("sizeKey"), 1048576u);
}

TEST(ConfigTest, TypedGettersFallBackOnGarbage) {
    Config config;
    config.set("port", "80x");
    config.set("huge", "99999999999999999999");
    config.set("flag", "maybe");
    config.set("negative", "-5");

    EXPECT_EQ(config.getInt("port", 7363), 7363);
    EXPECT_EQ(config.getInt("huge", 1), 1);
    EXPECT_TRUE(config.getBool("flag", true));
    EXPECT_EQ(config.getSize("negative", 10), 10u);
}

TEST(ConfigTest, BoolSpellings) {
    Config config;
    for (const char* yes : {"1", "true", "TRUE", "yes", "on"}) {
        config.set("b", yes);
        EXPECT_TRUE(config.getBool("b", false)) << yes;
    }
    for (const char* no : {"0", "false", "No", "off"}) {
        config.set("b", no);
        EXPECT_FALSE(config.getBool("b", true)) << no;
    }
}

TEST(ConfigTest, OverridesReplaceValues) {
    Config config;
    config.set("port", "7363");
    config.applyOverrides({{"port", "9000"}, {"demo_mode", "true"}});
    EXPECT_EQ(config.getInt("port"), 9000);
    EXPECT_TRUE(config.getBool("demo_mode"));
}

TEST(ConfigTest, UnknownKeysAreSorted) {
    Config config;
    config.set("port", "1");
    config.set("prot", "2");
    config.set("demo", "true");
    auto unknown = config.unknownKeys(ConsoleSettings::knownKeys());
    ASSERT_EQ(unknown.size(), 2u);
    EXPECT_EQ(unknown[0], "demo");
    EXPECT_EQ(unknown[1], "prot");
}

TEST_F(ConfigFileTest, LoadSkipsCommentsAndTrims) {
    write("# comment\n"
          "  port = 9000  \n"
          "\n"
          "no_delimiter_line\n"
          "trusted_binary=\n"
          "listen_address=0.0.0.0\n");

    Config config;
    ASSERT_TRUE(config.loadFromFile(path_.string()));
    EXPECT_EQ(config.getInt("port"), 9000);
    EXPECT_TRUE(config.hasKey("trusted_binary"));
    EXPECT_EQ(config.get("trusted_binary", "x"), "");
    EXPECT_EQ(config.get("listen_address"), "0.0.0.0");
    EXPECT_FALSE(config.hasKey("no_delimiter_line"));
    EXPECT_EQ(config.skippedLines(), 1u);
}

TEST_F(ConfigFileTest, SaveAndReload) {
    Config config;
    config.set("port", "8080");
    config.set("demo_mode", "true");
    ASSERT_TRUE(config.saveToFile(path_.string()));

    Config reloaded;
    ASSERT_TRUE(reloaded.loadFromFile(path_.string()));
    EXPECT_EQ(reloaded.get("port"), "8080");
    EXPECT_TRUE(reloaded.getBool("demo_mode"));
}

TEST_F(ConfigFileTest, NoOverrideKeepsExisting) {
    write("port=1\n");
    Config config;
    config.set("port", "2");
    ASSERT_TRUE(config.loadFromFile(path_.string(), false));
    EXPECT_EQ(config.get("port"), "2");
}

TEST(ConfigTest, MissingFileFails) {
    Config config;
    EXPECT_FALSE(config.loadFromFile("/nonexistent/consolegate/console.conf"));
    EXPECT_EQ(config.skippedLines(), 0u);
}

// ============================================================================
// ConsoleSettings
// ============================================================================

TEST(ConsoleSettingsTest, DefaultsWhenEmpty) {
    Config config;
    auto settings = ConsoleSettings::fromConfig(config);
    EXPECT_EQ(settings.listenAddress, "127.0.0.1");
    EXPECT_EQ(settings.port, 7363);
    EXPECT_EQ(settings.execTimeoutSeconds, 30);
    EXPECT_FALSE(settings.demoMode);
    EXPECT_EQ(settings.trustedBinary, "");
    EXPECT_TRUE(settings.pathFallback);
    EXPECT_EQ(settings.maxRequestBytes, 1048576u);
    EXPECT_TRUE(settings.validate().isOk());
}

TEST(ConsoleSettingsTest, ReadsOverrides) {
    Config config;
    config.set("port", "9001");
    config.set("exec_timeout_seconds", "5");
    config.set("demo_mode", "true");
    config.set("path_fallback", "false");
    config.set("trusted_binary", "/bin/echo");

    auto settings = ConsoleSettings::fromConfig(config);
    EXPECT_EQ(settings.port, 9001);
    EXPECT_EQ(settings.execTimeoutSeconds, 5);
    EXPECT_TRUE(settings.demoMode);
    EXPECT_FALSE(settings.pathFallback);
    EXPECT_EQ(settings.trustedBinary, "/bin/echo");
    EXPECT_TRUE(settings.validate().isOk());
}

TEST(ConsoleSettingsTest, RejectsInvalidValues) {
    ConsoleSettings base;

    auto badAddress = base;
    badAddress.listenAddress = "localhost";
    EXPECT_TRUE(badAddress.validate().isError());

    auto badPort = base;
    badPort.port = 70000;
    EXPECT_TRUE(badPort.validate().isError());

    auto badTimeout = base;
    badTimeout.execTimeoutSeconds = 0;
    EXPECT_TRUE(badTimeout.validate().isError());

    auto relativeBinary = base;
    relativeBinary.trustedBinary = "bin/tool";
    auto result = relativeBinary.validate();
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, Core::toInt(Core::ErrorCode::INVALID_CONFIGURATION));

    auto missingBinary = base;
    missingBinary.trustedBinary = "/nonexistent/tool";
    EXPECT_TRUE(missingBinary.validate().isError());
}

TEST_F(ConfigFileTest, TemplateParsesToDefaults) {
    write(ConsoleSettings::configTemplate());
    Config config;
    ASSERT_TRUE(config.loadFromFile(path_.string()));

    auto fromTemplate = ConsoleSettings::fromConfig(config);
    ConsoleSettings defaults;
    EXPECT_EQ(fromTemplate.port, defaults.port);
    EXPECT_EQ(fromTemplate.listenAddress, defaults.listenAddress);
    EXPECT_EQ(fromTemplate.execTimeoutSeconds, defaults.execTimeoutSeconds);
    EXPECT_EQ(fromTemplate.pathFallback, defaults.pathFallback);
    EXPECT_EQ(fromTemplate.maxRequestBytes, defaults.maxRequestBytes);
    EXPECT_EQ(fromTemplate.trustedBinary, "");
    EXPECT_TRUE(config.unknownKeys(ConsoleSettings::knownKeys()).empty());
    EXPECT_EQ(config.skippedLines(), 0u);
}

// ============================================================================
// PathUtils
// ============================================================================

TEST(PathUtilsTest, HonorsXdgVariables) {
    const char* oldConfig = std::getenv("XDG_CONFIG_HOME");
    const char* oldData = std::getenv("XDG_DATA_HOME");
    std::string savedConfig = oldConfig ? oldConfig : "";
    std::string savedData = oldData ? oldData : "";

    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg-config", 1);
    ::setenv("XDG_DATA_HOME", "/tmp/xdg-data", 1);
    EXPECT_EQ(PathUtils::getConfigPath(), std::filesystem::path("/tmp/xdg-config/consolegate/console.conf"));
    EXPECT_EQ(PathUtils::getLogPath(), std::filesystem::path("/tmp/xdg-data/consolegate/logs/consolegate.log"));

    if (oldConfig) ::setenv("XDG_CONFIG_HOME", savedConfig.c_str(), 1); else ::unsetenv("XDG_CONFIG_HOME");
    if (oldData) ::setenv("XDG_DATA_HOME", savedData.c_str(), 1); else ::unsetenv("XDG_DATA_HOME");
}
