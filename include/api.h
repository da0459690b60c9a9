#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <crow.h>
#include <crow/middlewares/cors.h>
#include <nlohmann/json.hpp>
#include "adapters/command_adapter.h"
#include "adapters/sample_adapter.h"
#include "session/session_coordinator.h"

namespace zc {

/**
 * @brief API Logging Middleware for Crow
 *
 * Logs every request at DEBUG and requests slower than the configured
 * threshold at WARN.
 */
class ApiLoggingMiddleware {
public:
    struct context {
        std::chrono::steady_clock::time_point start_time;
        std::string method;
        std::string url;
        uint64_t request_id = 0;
    };

    void before_handle(crow::request& req, crow::response& res, context& ctx);
    void after_handle(crow::request& req, crow::response& res, context& ctx);
};

/**
 * @brief HTTP and WebSocket front end of the counting engine
 *
 * REST routes expose queries, operator commands and sample ingestion. The
 * `/ws` route gives every connection its own subscription: commands come in
 * as JSON text, notifications go out from a delivery thread that drains the
 * subscription mailboxes.
 */
class Api {
public:
    /**
     * @brief Construct a new Api object
     *
     * @param coordinator Engine the routes operate on
     * @param samples Parser for inbound samples
     * @param port Port to listen on
     * @param threads Number of Crow worker threads
     */
    Api(SessionCoordinator& coordinator, const SampleAdapter& samples, int port, unsigned int threads);

    ~Api();

    /**
     * @brief Start the notification delivery thread and run the server
     *
     * Blocks until stop() is called, then stops delivery and closes every
     * WebSocket subscription.
     *
     * @param threaded Run Crow multithreaded if true
     */
    void start(bool threaded = true);

    /**
     * @brief Ask the server to stop; start() returns once it has
     */
    void stop();

private:
    crow::App<crow::CORSHandler, ApiLoggingMiddleware> app_; ///< Crow application with CORS support and API logging
    SessionCoordinator& coordinator_;
    const SampleAdapter& samples_;
    CommandAdapter commands_;
    int port_;

    std::mutex sessionsMutex_;
    std::unordered_map<crow::websocket::connection*, SubscriptionPtr> sessions_;

    std::thread deliveryThread_;
    std::mutex deliveryMutex_;
    std::condition_variable deliveryCv_;
    bool deliveryPending_;
    std::atomic<bool> running_;

    void setupRoutes();
    void setupCameraRoutes();
    void setupZoneRoutes();
    void setupLineRoutes();
    void setupHistoryRoutes();
    void setupSampleRoutes();
    void setupManagementRoutes();
    void setupWebSocketRoutes();
    void setupCORS();

    /**
     * @brief Wake the delivery thread; safe to call under engine locks
     */
    void signalDelivery();

    void deliveryLoop();
    void deliverPending();
    void shutdownDelivery();
};

} // namespace zc
