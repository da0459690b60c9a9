#include <gtest/gtest.h>
#include <filesystem>
#include <map>
#include "config_manager.h"
#include "global_config.h"

using namespace zc;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(ConfigManager::getInstance().initialize(":memory:"));
    }

    void TearDown() override {
        ConfigManager::getInstance().close();
    }
};

TEST_F(ConfigManagerTest, SetGetDelete) {
    ConfigManager& config = ConfigManager::getInstance();
    EXPECT_TRUE(config.isReady());
    EXPECT_TRUE(config.getConfig("history_capacity").is_null());

    ASSERT_TRUE(config.setConfig("history_capacity", 250));
    EXPECT_EQ(config.getConfig("history_capacity"), 250);

    ASSERT_TRUE(config.setConfig("history_capacity", 300));
    EXPECT_EQ(config.getConfig("history_capacity"), 300);

    ASSERT_TRUE(config.setConfig("cameras", nlohmann::json::array({"gate", "dock"})));
    nlohmann::json all = config.getAllConfig();
    EXPECT_EQ(all.size(), 2u);
    EXPECT_EQ(all["cameras"][1], "dock");

    ASSERT_TRUE(config.deleteConfig("history_capacity"));
    EXPECT_TRUE(config.getConfig("history_capacity").is_null());
}

TEST(ConfigManagerFileTest, ValuesSurviveReopen) {
    auto dir = std::filesystem::temp_directory_path() / "zonecounter_config_test";
    std::filesystem::remove_all(dir);
    const std::string path = (dir / "config.db").string();

    ConfigManager& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.initialize(path));
    ASSERT_TRUE(config.setConfig("sample_anchor", "CENTER"));
    config.close();
    EXPECT_FALSE(config.isReady());
    EXPECT_FALSE(config.setConfig("port", 9000));

    ASSERT_TRUE(config.initialize(path));
    EXPECT_EQ(config.getConfig("sample_anchor"), "CENTER");
    EXPECT_EQ(config.getDatabasePath(), path);
    config.close();

    std::filesystem::remove_all(dir);
}

namespace {

GlobalConfig::EnvLookup fakeEnv(std::map<std::string, std::string> values) {
    return [values](const std::string& name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

} // namespace

TEST(GlobalConfigTest, DefaultsComeFromCommandLine) {
    EngineSettings commandLine;
    commandLine.port = 9100;

    EngineSettings settings = GlobalConfig::resolve(commandLine, nlohmann::json::object(), fakeEnv({}));
    EXPECT_EQ(settings.port, 9100);
    EXPECT_FLOAT_EQ(settings.referenceWidth, 1300.0f);
    EXPECT_FLOAT_EQ(settings.referenceHeight, 720.0f);
    EXPECT_EQ(settings.historyCapacity, 500u);
    EXPECT_EQ(settings.trackIdleTimeoutMs, 30000);
    EXPECT_FALSE(settings.syntheticExitOnTimeout);
    EXPECT_EQ(settings.cameras, std::vector<std::string>{"camera1"});
    EXPECT_EQ(settings.sampleAnchor, Position::BOTTOM_CENTER);
}

TEST(GlobalConfigTest, EnvironmentOverridesStoreOverridesCommandLine) {
    nlohmann::json stored = {
        {"history_capacity", 100},
        {"reference_width", 1920},
        {"cameras", {"gate", "dock"}},
        {"sample_anchor", "CENTER"},
        {"log_level", "debug"}
    };
    auto env = fakeEnv({
        {"ZC_HISTORY_CAPACITY", "42"},
        {"ZC_SYNTHETIC_EXIT", "true"},
        {"ZC_CAMERAS", " north , south "}
    });

    EngineSettings settings = GlobalConfig::resolve(EngineSettings(), stored, env);
    EXPECT_EQ(settings.historyCapacity, 42u);
    EXPECT_FLOAT_EQ(settings.referenceWidth, 1920.0f);
    EXPECT_TRUE(settings.syntheticExitOnTimeout);
    EXPECT_EQ(settings.cameras, (std::vector<std::string>{"north", "south"}));
    EXPECT_EQ(settings.sampleAnchor, Position::CENTER);
    EXPECT_EQ(settings.logLevel, "debug");
}

TEST(GlobalConfigTest, InvalidValuesFallThrough) {
    nlohmann::json stored = {
        {"history_capacity", -5},
        {"reference_height", "tall"},
        {"track_idle_timeout_ms", 1500},
        {"sample_anchor", "MIDDLE"}
    };
    auto env = fakeEnv({
        {"ZC_TRACK_IDLE_TIMEOUT_MS", "soon"},
        {"ZC_REFERENCE_WIDTH", "0"},
        {"ZC_PORT", "70000"},
        {"ZC_LOG_LEVEL", "chatty"}
    });

    EngineSettings settings = GlobalConfig::resolve(EngineSettings(), stored, env);
    EXPECT_EQ(settings.historyCapacity, 500u);
    EXPECT_FLOAT_EQ(settings.referenceHeight, 720.0f);
    EXPECT_EQ(settings.trackIdleTimeoutMs, 1500);
    EXPECT_FLOAT_EQ(settings.referenceWidth, 1300.0f);
    EXPECT_EQ(settings.port, 8080);
    EXPECT_EQ(settings.logLevel, "info");
    EXPECT_EQ(settings.sampleAnchor, Position::BOTTOM_CENTER);
}

TEST(GlobalConfigTest, PortMustFitTcpRange) {
    EXPECT_TRUE(GlobalConfig::isValidPort(1));
    EXPECT_TRUE(GlobalConfig::isValidPort(65535));
    EXPECT_FALSE(GlobalConfig::isValidPort(0));
    EXPECT_FALSE(GlobalConfig::isValidPort(65536));

    nlohmann::json stored = {{"port", 70000}};
    EngineSettings settings = GlobalConfig::resolve(EngineSettings(), stored, fakeEnv({{"ZC_PORT", "80x"}}));
    EXPECT_EQ(settings.port, 8080);

    nlohmann::json storedValid = {{"port", 9443}};
    settings = GlobalConfig::resolve(EngineSettings(), storedValid, fakeEnv({{"ZC_PORT", "65536"}}));
    EXPECT_EQ(settings.port, 9443);
}
