#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "geometry/geometry.h"

namespace zc {

/**
 * @brief Resolved engine settings
 */
struct EngineSettings {
    float referenceWidth = 1300.0f;
    float referenceHeight = 720.0f;
    size_t historyCapacity = 500;
    int64_t trackIdleTimeoutMs = 30000;
    bool syntheticExitOnTimeout = false;
    size_t subscriberQueueCapacity = 64;
    int64_t sweepIntervalMs = 1000;
    Position sampleAnchor = Position::BOTTOM_CENTER;
    std::vector<std::string> cameras{"camera1"};
    int port = 8080;
    std::string logLevel = "info";
};

/**
 * @brief Global configuration for the application
 *
 * Every setting is taken from, in order of precedence: the environment, the
 * settings database (ConfigManager), the command line or built-in default.
 * Values that fail validation are logged and the next source is used.
 */
class GlobalConfig {
public:
    /// Returns the value of an environment variable, if set and non-empty
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    static GlobalConfig& getInstance();

    /**
     * @brief Resolve settings from the process environment and ConfigManager
     *
     * @param commandLine Values given on the command line (or defaults)
     */
    void initialize(const EngineSettings& commandLine);

    /**
     * @brief Resolve settings from explicit sources
     *
     * @param commandLine Lowest-precedence values
     * @param stored Object of stored settings keyed by setting name
     * @param env Environment lookup
     */
    static EngineSettings resolve(const EngineSettings& commandLine,
                                  const nlohmann::json& stored,
                                  const EnvLookup& env);

    /**
     * @brief Environment lookup backed by getenv()
     */
    static EnvLookup processEnvironment();

    /**
     * @brief True for a TCP port number the server can bind (1..65535)
     */
    static bool isValidPort(int64_t port);

    EngineSettings getSettings() const;

    /**
     * @brief Update the runtime log level and persist it when the store is open
     *
     * @return false if the level name is unknown
     */
    bool setLogLevel(const std::string& level);

private:
    GlobalConfig() = default;

    GlobalConfig(const GlobalConfig&) = delete;
    GlobalConfig& operator=(const GlobalConfig&) = delete;
    GlobalConfig(GlobalConfig&&) = delete;
    GlobalConfig& operator=(GlobalConfig&&) = delete;

    EngineSettings settings_;
    mutable std::mutex mutex_;
};

} // namespace zc
