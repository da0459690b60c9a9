#include <iostream>
#include <memory>
#include <csignal>
#include <cstdlib>
#include <chrono>
#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include "api.h"
#include "adapters/sample_adapter.h"
#include "config_manager.h"
#include "global_config.h"
#include "logger.h"
#include "session/session_coordinator.h"
#include "session/track_sweeper.h"

namespace po = boost::program_options;
using namespace zc;

// Global API object for signal handling
std::unique_ptr<Api> apiServer;

// Signal handler for graceful shutdown
void signalHandler(int signal) {
    static bool shutdownInProgress = false;

    if (shutdownInProgress) {
        std::cout << "Shutdown already in progress. Press Ctrl+C again to force exit." << std::endl;
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        return;
    }

    shutdownInProgress = true;
    std::cout << "\nReceived signal " << signal << " ("
              << (signal == SIGINT ? "SIGINT" : signal == SIGTERM ? "SIGTERM" : "unknown")
              << "), shutting down..." << std::endl;

    if (apiServer) {
        apiServer->stop();
    }
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "Show help message")
        ("port,p", po::value<int>()->default_value(8080), "Port to listen on")
        ("config-db", po::value<std::string>(), "Settings database path (default: $HOME/.zonecounter/config.db)")
        ("camera,c", po::value<std::vector<std::string>>()->composing(), "Camera to register at startup (repeatable)")
        ("threads,t", po::value<int>()->default_value(4), "Number of worker threads")
        ("log-level", po::value<std::string>()->default_value("info"), "Log level (trace, debug, info, warn, error, fatal, off)")
        ("log-file", po::value<std::string>(), "Log file path");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << "zonecounter - zone occupancy and line crossing counter" << std::endl;
            std::cout << desc << std::endl;
            return 0;
        }
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cout << desc << std::endl;
        return 1;
    }

    EngineSettings commandLine;
    commandLine.port = vm["port"].as<int>();
    if (!GlobalConfig::isValidPort(commandLine.port)) {
        std::cerr << "Invalid port: " << commandLine.port << " (expected 1-65535)" << std::endl;
        return 1;
    }
    commandLine.logLevel = vm["log-level"].as<std::string>();
    if (vm.count("camera")) {
        commandLine.cameras = vm["camera"].as<std::vector<std::string>>();
    }

    LogLevel cliLevel;
    if (!Logger::parseLevel(commandLine.logLevel, cliLevel)) {
        std::cerr << "Invalid log level: " << commandLine.logLevel << std::endl;
        return 1;
    }
    Logger::getInstance().setLogLevel(cliLevel);

    if (vm.count("log-file")) {
        std::string logFilePath = vm["log-file"].as<std::string>();
        if (!Logger::getInstance().setOutputFile(logFilePath)) {
            std::cerr << "Failed to open log file: " << logFilePath << std::endl;
            return 1;
        }
        LOG_INFO("Main", "Logging to file: " + logFilePath);
    }

    std::string configDbPath;
    if (vm.count("config-db")) {
        configDbPath = vm["config-db"].as<std::string>();
    } else {
        const char* homeDir = getenv("HOME");
        configDbPath = homeDir ? std::string(homeDir) + "/.zonecounter/config.db" : "/tmp/zonecounter/config.db";
    }

    if (!ConfigManager::getInstance().initialize(configDbPath)) {
        LOG_WARN("Main", "Failed to open settings database, continuing without stored settings");
    }

    try {
        GlobalConfig::getInstance().initialize(commandLine);
        EngineSettings settings = GlobalConfig::getInstance().getSettings();

        LogLevel level;
        if (Logger::parseLevel(settings.logLevel, level)) {
            Logger::getInstance().setLogLevel(level);
        }

        CoordinatorOptions options;
        options.state.space = ReferenceSpace(settings.referenceWidth, settings.referenceHeight);
        options.state.historyCapacity = settings.historyCapacity;
        options.state.syntheticExitOnTimeout = settings.syntheticExitOnTimeout;
        options.trackIdleTimeoutMs = settings.trackIdleTimeoutMs;
        options.subscriberQueueCapacity = settings.subscriberQueueCapacity;

        SessionCoordinator coordinator(options);
        for (const auto& cameraId : settings.cameras) {
            coordinator.registerCamera(cameraId);
        }

        SampleAdapter samples(settings.sampleAnchor);
        TrackSweeper sweeper(coordinator, std::chrono::milliseconds(settings.sweepIntervalMs));
        sweeper.start();

        int threads = vm["threads"].as<int>();
        apiServer = std::make_unique<Api>(coordinator, samples, settings.port,
                                          static_cast<unsigned int>(threads > 0 ? threads : 1));

        LOG_INFO("Main", "zonecounter ready with " + std::to_string(settings.cameras.size()) +
                 " camera(s), active camera " + coordinator.activeCamera());

        bool serverFailed = false;
        try {
            apiServer->start(true);
        } catch (const std::exception& e) {
            LOG_FATAL("Main", std::string("API server failed: ") + e.what());
            serverFailed = true;
        }

        // The server refers to the coordinator, so it goes first
        sweeper.shutdown();
        apiServer.reset();
        if (serverFailed) {
            return 1;
        }
    } catch (const std::exception& e) {
        LOG_FATAL("Main", std::string("Fatal error: ") + e.what());
        return 1;
    }

    ConfigManager::getInstance().close();
    LOG_INFO("Main", "zonecounter shut down successfully");
    return 0;
}
