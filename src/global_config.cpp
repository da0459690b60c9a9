#include "global_config.h"
#include "config_manager.h"
#include "logger.h"
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <sstream>

namespace zc {

namespace {

/**
 * Picks the first valid value among environment, store and command line for
 * one setting. parseText reads the environment form, parseJson the stored form.
 */
template <typename T>
T pick(const char* key,
       const char* envName,
       const nlohmann::json& stored,
       const GlobalConfig::EnvLookup& env,
       const T& fallback,
       const std::function<std::optional<T>(const std::string&)>& parseText,
       const std::function<std::optional<T>(const nlohmann::json&)>& parseJson) {
    if (envName) {
        if (auto text = env(envName)) {
            if (auto value = parseText(*text)) {
                LOG_INFO("GlobalConfig", std::string("Using ") + key + " from environment " + envName);
                return *value;
            }
            LOG_WARN("GlobalConfig", std::string("Ignoring invalid ") + envName + "=" + *text);
        }
    }

    if (stored.is_object() && stored.contains(key)) {
        if (auto value = parseJson(stored[key])) {
            LOG_INFO("GlobalConfig", std::string("Using ") + key + " from settings database");
            return *value;
        }
        LOG_WARN("GlobalConfig", std::string("Ignoring invalid stored ") + key + ": " + stored[key].dump());
    }

    return fallback;
}

std::optional<int64_t> positiveInteger(const std::string& text) {
    try {
        size_t used = 0;
        long long value = std::stoll(text, &used);
        if (used == text.size() && value > 0) {
            return static_cast<int64_t>(value);
        }
    } catch (const std::logic_error&) {
        // not a number, or out of range
    }
    return std::nullopt;
}

std::optional<int64_t> positiveIntegerJson(const nlohmann::json& value) {
    if (value.is_number_integer() && value.get<int64_t>() > 0) {
        return value.get<int64_t>();
    }
    return std::nullopt;
}

std::optional<float> positiveNumber(const std::string& text) {
    try {
        size_t used = 0;
        float value = std::stof(text, &used);
        if (used == text.size() && std::isfinite(value) && value > 0) {
            return value;
        }
    } catch (const std::logic_error&) {
        // not a number, or out of range
    }
    return std::nullopt;
}

std::optional<float> positiveNumberJson(const nlohmann::json& value) {
    if (value.is_number() && std::isfinite(value.get<double>()) && value.get<double>() > 0) {
        return value.get<float>();
    }
    return std::nullopt;
}

std::optional<bool> boolean(const std::string& text) {
    if (text == "1" || text == "true" || text == "TRUE" || text == "yes") {
        return true;
    }
    if (text == "0" || text == "false" || text == "FALSE" || text == "no") {
        return false;
    }
    return std::nullopt;
}

std::optional<bool> booleanJson(const nlohmann::json& value) {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    return std::nullopt;
}

std::optional<std::vector<std::string>> cameraList(const std::string& text) {
    std::vector<std::string> cameras;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto first = item.find_first_not_of(" \t");
        auto last = item.find_last_not_of(" \t");
        if (first != std::string::npos) {
            cameras.push_back(item.substr(first, last - first + 1));
        }
    }
    if (cameras.empty()) {
        return std::nullopt;
    }
    return cameras;
}

std::optional<std::vector<std::string>> cameraListJson(const nlohmann::json& value) {
    if (!value.is_array() || value.empty()) {
        return std::nullopt;
    }
    std::vector<std::string> cameras;
    for (const auto& item : value) {
        if (!item.is_string() || item.get<std::string>().empty()) {
            return std::nullopt;
        }
        cameras.push_back(item.get<std::string>());
    }
    return cameras;
}

std::optional<int64_t> portText(const std::string& text) {
    auto value = positiveInteger(text);
    if (value && GlobalConfig::isValidPort(*value)) {
        return value;
    }
    return std::nullopt;
}

std::optional<int64_t> portJson(const nlohmann::json& value) {
    auto port = positiveIntegerJson(value);
    if (port && GlobalConfig::isValidPort(*port)) {
        return port;
    }
    return std::nullopt;
}

std::optional<Position> anchorJson(const nlohmann::json& value) {
    Position anchor;
    if (value.is_string() && StringToPosition(value.get<std::string>(), anchor)) {
        return anchor;
    }
    return std::nullopt;
}

std::optional<std::string> levelJson(const nlohmann::json& value) {
    LogLevel level;
    if (value.is_string() && Logger::parseLevel(value.get<std::string>(), level)) {
        return value.get<std::string>();
    }
    return std::nullopt;
}

std::optional<std::string> levelText(const std::string& text) {
    LogLevel level;
    if (Logger::parseLevel(text, level)) {
        return text;
    }
    return std::nullopt;
}

} // namespace

GlobalConfig& GlobalConfig::getInstance() {
    static GlobalConfig instance;
    return instance;
}

GlobalConfig::EnvLookup GlobalConfig::processEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value && value[0] != '\0') {
            return std::string(value);
        }
        return std::nullopt;
    };
}

EngineSettings GlobalConfig::resolve(const EngineSettings& commandLine,
                                     const nlohmann::json& stored,
                                     const EnvLookup& env) {
    EngineSettings settings;

    settings.referenceWidth = pick<float>("reference_width", "ZC_REFERENCE_WIDTH", stored, env,
        commandLine.referenceWidth, positiveNumber, positiveNumberJson);
    settings.referenceHeight = pick<float>("reference_height", "ZC_REFERENCE_HEIGHT", stored, env,
        commandLine.referenceHeight, positiveNumber, positiveNumberJson);
    settings.historyCapacity = static_cast<size_t>(pick<int64_t>("history_capacity", "ZC_HISTORY_CAPACITY",
        stored, env, static_cast<int64_t>(commandLine.historyCapacity), positiveInteger, positiveIntegerJson));
    settings.trackIdleTimeoutMs = pick<int64_t>("track_idle_timeout_ms", "ZC_TRACK_IDLE_TIMEOUT_MS",
        stored, env, commandLine.trackIdleTimeoutMs, positiveInteger, positiveIntegerJson);
    settings.syntheticExitOnTimeout = pick<bool>("synthetic_exit_on_timeout", "ZC_SYNTHETIC_EXIT",
        stored, env, commandLine.syntheticExitOnTimeout, boolean, booleanJson);
    settings.subscriberQueueCapacity = static_cast<size_t>(pick<int64_t>("subscriber_queue_capacity",
        "ZC_SUBSCRIBER_QUEUE", stored, env, static_cast<int64_t>(commandLine.subscriberQueueCapacity),
        positiveInteger, positiveIntegerJson));
    settings.sweepIntervalMs = pick<int64_t>("sweep_interval_ms", nullptr, stored, env,
        commandLine.sweepIntervalMs, positiveInteger, positiveIntegerJson);
    settings.sampleAnchor = pick<Position>("sample_anchor", nullptr, stored, env,
        commandLine.sampleAnchor, [](const std::string&) { return std::optional<Position>(); }, anchorJson);
    settings.cameras = pick<std::vector<std::string>>("cameras", "ZC_CAMERAS", stored, env,
        commandLine.cameras, cameraList, cameraListJson);
    settings.port = static_cast<int>(pick<int64_t>("port", "ZC_PORT", stored, env,
        commandLine.port, portText, portJson));
    settings.logLevel = pick<std::string>("log_level", "ZC_LOG_LEVEL", stored, env,
        commandLine.logLevel, levelText, levelJson);

    return settings;
}

void GlobalConfig::initialize(const EngineSettings& commandLine) {
    nlohmann::json stored = nlohmann::json::object();
    if (ConfigManager::getInstance().isReady()) {
        stored = ConfigManager::getInstance().getAllConfig();
    } else {
        LOG_INFO("GlobalConfig", "Settings database not open, using environment and command line only");
    }

    EngineSettings settings = resolve(commandLine, stored, processEnvironment());

    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = settings;
    LOG_INFO("GlobalConfig", "Reference space " + std::to_string(static_cast<int>(settings_.referenceWidth)) +
             "x" + std::to_string(static_cast<int>(settings_.referenceHeight)) +
             ", history capacity " + std::to_string(settings_.historyCapacity) +
             ", idle timeout " + std::to_string(settings_.trackIdleTimeoutMs) + " ms" +
             ", anchor " + PositionToString(settings_.sampleAnchor));
}

EngineSettings GlobalConfig::getSettings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

bool GlobalConfig::isValidPort(int64_t port) {
    return port >= 1 && port <= 65535;
}

bool GlobalConfig::setLogLevel(const std::string& level) {
    LogLevel parsed;
    if (!Logger::parseLevel(level, parsed)) {
        return false;
    }

    Logger::getInstance().setLogLevel(parsed);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_.logLevel = Logger::levelName(parsed);
    }

    if (ConfigManager::getInstance().isReady()) {
        if (!ConfigManager::getInstance().setConfig("log_level", Logger::levelName(parsed))) {
            LOG_WARN("GlobalConfig", "Could not persist log level");
        }
    }
    LOG_INFO("GlobalConfig", "Log level set to " + Logger::levelName(parsed));
    return true;
}

} // namespace zc
