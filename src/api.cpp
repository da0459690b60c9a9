#include "api.h"
#include "adapters/json_codec.h"
#include "config_manager.h"
#include "global_config.h"
#include "logger.h"
#include <initializer_list>
#include <limits>
#include <sstream>
#include <stdexcept>

using namespace std::chrono_literals;

namespace zc {

// API Logging Configuration Structure
struct ApiLoggingConfig {
    bool enabled = true;
    int slow_request_threshold_ms = 1000;

    void loadFromConfig() {
        auto& configManager = ConfigManager::getInstance();
        if (!configManager.isReady()) {
            return;
        }

        auto enabledConfig = configManager.getConfig("api_logging_enabled");
        if (enabledConfig.is_boolean()) {
            enabled = enabledConfig.get<bool>();
        }

        auto slowThresholdConfig = configManager.getConfig("api_logging_slow_threshold_ms");
        if (slowThresholdConfig.is_number_integer()) {
            slow_request_threshold_ms = slowThresholdConfig.get<int>();
        }
    }
};

static ApiLoggingConfig g_apiLoggingConfig;
static std::atomic<uint64_t> g_nextRequestId{1};

void ApiLoggingMiddleware::before_handle(crow::request& req, crow::response& res, context& ctx) {
    (void)res;
    ctx.start_time = std::chrono::steady_clock::now();
    ctx.method = crow::method_name(req.method);
    ctx.url = req.url;
    ctx.request_id = g_nextRequestId++;

    if (!g_apiLoggingConfig.enabled) return;

    LOG_DEBUG("API", "[" + std::to_string(ctx.request_id) + "] " + ctx.method + " " + ctx.url +
              " (" + std::to_string(req.body.size()) + " bytes)");
}

void ApiLoggingMiddleware::after_handle(crow::request& req, crow::response& res, context& ctx) {
    (void)req;
    if (!g_apiLoggingConfig.enabled) return;

    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - ctx.start_time).count();

    std::stringstream logMsg;
    logMsg << "[" << ctx.request_id << "] " << ctx.method << " " << ctx.url
           << " -> " << res.code << " (" << duration_ms << "ms)";

    if (duration_ms >= g_apiLoggingConfig.slow_request_threshold_ms) {
        LOG_WARN("API", logMsg.str() + " [SLOW]");
    } else {
        LOG_DEBUG("API", logMsg.str());
    }
}

// Helper function to create properly formatted JSON responses
crow::response createJsonResponse(const nlohmann::json& data, int status_code = 200) {
    crow::response res(status_code, data.dump(2));
    res.set_header("Content-Type", "application/json");
    return res;
}

static int statusFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::UNKNOWN_ENTITY: return 404;
        case ErrorCode::VALIDATION:
        case ErrorCode::TRANSIENT_INGEST: return 400;
        default: return 500;
    }
}

static crow::response errorResponse(const CounterError& error) {
    return createJsonResponse(json_codec::errorToJson(error), statusFor(error.code()));
}

static crow::response badRequest(const std::string& message) {
    return errorResponse(ValidationError(message));
}

static crow::response mutationResponse(const MutationResult& result) {
    return createJsonResponse(json_codec::mutationResultToJson(result),
                              result.success ? 200 : statusFor(result.code));
}

static nlohmann::json parseBody(const crow::request& req) {
    try {
        return nlohmann::json::parse(req.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError(std::string("Invalid JSON body: ") + e.what());
    }
}

static std::string cameraIdFromBody(const nlohmann::json& body) {
    for (const char* key : {"camera_id", "id"}) {
        if (body.contains(key) && body[key].is_string()) {
            return body[key].get<std::string>();
        }
    }
    throw ValidationError("Missing required key: camera_id");
}

static const nlohmann::json& requireField(const nlohmann::json& body, const char* key) {
    if (!body.is_object() || !body.contains(key)) {
        throw ValidationError(std::string("Missing required key: ") + key);
    }
    return body[key];
}

static int64_t integerParam(const crow::request& req, const char* name) {
    const char* value = req.url_params.get(name);
    try {
        size_t used = 0;
        long long parsed = std::stoll(value, &used);
        if (used != std::string(value).size()) {
            throw ValidationError(std::string("Query parameter '") + name + "' must be an integer");
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw ValidationError(std::string("Query parameter '") + name + "' must be an integer");
    }
}

static HistoryQuery historyQueryFrom(const crow::request& req) {
    HistoryQuery query;

    if (req.url_params.get("after")) {
        int64_t after = integerParam(req, "after");
        if (after < 0) {
            throw ValidationError("Query parameter 'after' must not be negative");
        }
        query.afterSequence = static_cast<uint64_t>(after);
    }
    if (req.url_params.get("since")) {
        query.since = integerParam(req, "since");
    }
    if (const char* name = req.url_params.get("name")) {
        query.entityName = std::string(name);
    }
    if (const char* kind = req.url_params.get("kind")) {
        std::string value(kind);
        if (value == "zone") {
            query.kind = EntityKind::ZONE;
        } else if (value == "line") {
            query.kind = EntityKind::LINE;
        } else {
            throw ValidationError("Query parameter 'kind' must be 'zone' or 'line'");
        }
    }
    if (const char* action = req.url_params.get("action")) {
        HistoryAction parsed;
        if (!historyActionFromString(action, parsed)) {
            throw ValidationError("Query parameter 'action' must be ENTER, EXIT, IN or OUT");
        }
        query.action = parsed;
    }
    if (req.url_params.get("track_id")) {
        int64_t trackId = integerParam(req, "track_id");
        if (trackId < std::numeric_limits<int>::min() || trackId > std::numeric_limits<int>::max()) {
            throw ValidationError("Query parameter 'track_id' is out of range");
        }
        query.trackId = static_cast<int>(trackId);
    }
    if (req.url_params.get("limit")) {
        int64_t limit = integerParam(req, "limit");
        if (limit < 0) {
            throw ValidationError("Query parameter 'limit' must not be negative");
        }
        query.limit = static_cast<size_t>(limit);
    }

    return query;
}

Api::Api(SessionCoordinator& coordinator, const SampleAdapter& samples, int port, unsigned int threads)
    : coordinator_(coordinator),
      samples_(samples),
      commands_(coordinator, samples),
      port_(port),
      deliveryPending_(false),
      running_(false) {
    app_.port(static_cast<uint16_t>(port_));
    app_.concurrency(threads > 0 ? threads : 1);
    app_.server_name("zonecounter/1.0");

    g_apiLoggingConfig.loadFromConfig();
    setupCORS();
    setupRoutes();
}

Api::~Api() {
    running_ = false;
    shutdownDelivery();
}

void Api::start(bool threaded) {
    running_ = true;
    deliveryThread_ = std::thread(&Api::deliveryLoop, this);

    LOG_INFO("API", "Starting API server on port " + std::to_string(port_));
    if (threaded) {
        app_.multithreaded().run();
    } else {
        app_.run();
    }

    running_ = false;
    shutdownDelivery();
    LOG_INFO("API", "API server stopped");
}

void Api::stop() {
    running_ = false;
    app_.stop();
}

void Api::shutdownDelivery() {
    deliveryCv_.notify_all();
    if (deliveryThread_.joinable()) {
        deliveryThread_.join();
    }

    std::unordered_map<crow::websocket::connection*, SubscriptionPtr> sessions;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        sessions.swap(sessions_);
    }
    for (auto& pair : sessions) {
        coordinator_.unsubscribe(pair.second);
    }
}

void Api::setupCORS() {
    auto& cors = app_.get_middleware<crow::CORSHandler>();
    cors.global()
        .headers("*")
        .methods("GET"_method, "POST"_method, "DELETE"_method, "PUT"_method, "OPTIONS"_method)
        .origin("*");
}

void Api::setupRoutes() {
    LOG_INFO("API", "Setting up all API routes");

    CROW_ROUTE(app_, "/health")
        .methods("GET"_method, "HEAD"_method)
    ([this](const crow::request& req) {
        if (req.method == "HEAD"_method) {
            return crow::response(crow::status::OK);
        }

        nlohmann::json response;
        response["status"] = "ok";
        response["cameras"] = coordinator_.listCameras().cameras.size();
        response["subscribers"] = coordinator_.subscriberCount();
        return createJsonResponse(response);
    });

    setupCameraRoutes();
    setupZoneRoutes();
    setupLineRoutes();
    setupHistoryRoutes();
    setupSampleRoutes();
    setupManagementRoutes();
    setupWebSocketRoutes();
}

void Api::setupCameraRoutes() {
    CROW_ROUTE(app_, "/api/v1/cameras")
        .methods("GET"_method)
    ([this]() {
        return createJsonResponse(json_codec::cameraListingToJson(coordinator_.listCameras()));
    });

    // Register a camera
    CROW_ROUTE(app_, "/api/v1/cameras")
        .methods("POST"_method)
    ([this](const crow::request& req) {
        try {
            auto body = parseBody(req);
            bool created = coordinator_.registerCamera(cameraIdFromBody(body));

            nlohmann::json response = json_codec::cameraListingToJson(coordinator_.listCameras());
            response["created"] = created;
            return createJsonResponse(response, created ? 201 : 200);
        } catch (const CounterError& e) {
            return errorResponse(e);
        }
    });

    CROW_ROUTE(app_, "/api/v1/cameras/active")
        .methods("PUT"_method)
    ([this](const crow::request& req) {
        try {
            auto body = parseBody(req);
            coordinator_.setActiveCamera(cameraIdFromBody(body));
            return createJsonResponse(json_codec::cameraListingToJson(coordinator_.listCameras()));
        } catch (const CounterError& e) {
            return errorResponse(e);
        }
    });

    // Full snapshot of one camera
    CROW_ROUTE(app_, "/api/v1/cameras/<string>")
        .methods("GET"_method)
    ([this](const std::string& cameraId) {
        try {
            return createJsonResponse(json_codec::cameraSnapshotToJson(coordinator_.snapshot(cameraId)));
        } catch (const CounterError& e) {
            return errorResponse(e);
        }
    });
}

void Api::setupZoneRoutes() {
    CROW_ROUTE(app_, "/api/v1/cameras/<string>/zones")
        .methods("GET"_method)
    ([this](const std::string& cameraId) {
        try {
            return createJsonResponse(json_codec::zonesToJson(coordinator_.snapshot(cameraId)));
        } catch (const CounterError& e) {
            return errorResponse(e);
        }
    });

    CROW_ROUTE(app_, "/api/v1/cameras/<string>/zones/<string>")
        .methods("GET"_method)
    ([this](const std::string& cameraId, const std::string& name) {
        try {
            return createJsonResponse(json_codec::zoneSnapshotToJson(coordinator_.zoneSnapshot(cameraId, name)));
        } catch (const CounterError& e) {
            return errorResponse(e);
        }
    });

    // Create or replace a zone
    CROW_ROUTE(app_, "/api/v1/cameras/<string>/zones/<string>")
        .methods("PUT"_method)
    ([this](const crow::request& req, const std::string& cameraId, const std::string& name) {
        try {
            auto body = parseBody(req);
            Point topLeft = json_codec::pointFromJson(requireField(body, "top_left"), "top_left");
            Point bottomRight = json_codec::pointFromJson(requireField(body, "bottom_right"), "bottom_right");
            return mutationResponse(coordinator_.defineZone(cameraId, name, topLeft, bottomRight));
        } catch (const CounterError& e) {
            return errorResponse(e);
        }
    });

    CROW_ROUTE(app_, "/api/v1/cameras/<string>/zones/<string>")
        .methods("DELETE"_method)
    ([this](const std::string& cameraId, const std::string& name) {
        return mutationResponse(coordinator_.deleteZone(cameraId, name));
    });

    CROW_ROUTE(app_, "/api/v1/cameras/<string>/zones/<string>/reset")
        .methods("POST"_method)
    ([this](const std::string& cameraId, const std::string& name) {
        return mutationResponse(coordinator_.resetZone(cameraId, name));
    });
}

void Api::setupLineRoutes() {
    CROW_ROUTE(app_, "/api/v1/cameras/<string>/lines")
        .methods("GET"_method)
    ([this](const std::string& cameraId) {
        try {
            return createJsonResponse(json_codec::lineDefinitionsToJson(coordinator_.snapshot(cameraId)));
        } catch (const CounterError& e) {
            return errorResponse(e);
        }
    });

    CROW_ROUTE(app_, "/api/v1/cameras/<string>/lines/<string>")
        .methods("GET"_method)
    ([this](const std::string& cameraId, const std::string& name) {
        try {
            return createJsonResponse(json_codec::lineSnapshotToJson(coordinator_.lineSnapshot(cameraId, name)));
        } catch (const CounterError& e) {
            return errorResponse(e);
        }
    });

    // Create or replace a line
    CROW_ROUTE(app_, "/api/v1/cameras/<string>/lines/<string>")
        .methods("PUT"_method)
    ([this](const crow::request& req, const std::string& cameraId, const std::string& name) {
        try {
            auto body = parseBody(req);
            Point start = json_codec::pointFromJson(requireField(body, "start"), "start");
            Point end = json_codec::pointFromJson(requireField(body, "end"), "end");
            return mutationResponse(coordinator_.defineLine(cameraId, name, start, end));
        } catch (const CounterError& e) {
            return errorResponse(e);
        }
    });

    CROW_ROUTE(app_, "/api/v1/cameras/<string>/lines/<string>")
        .methods("DELETE"_method)
    ([this](const std::string& cameraId, const std::string& name) {
        return mutationResponse(coordinator_.deleteLine(cameraId, name));
    });

    CROW_ROUTE(app_, "/api/v1/cameras/<string>/lines/<string>/reset")
        .methods("POST"_method)
    ([this](const std::string& cameraId, const std::string& name) {
        return mutationResponse(coordinator_.resetLine(cameraId, name));
    });
}

void Api::setupHistoryRoutes() {
    CROW_ROUTE(app_, "/api/v1/cameras/<string>/history")
        .methods("GET"_method)
    ([this](const crow::request& req, const std::string& cameraId) {
        try {
            HistoryQuery query = historyQueryFrom(req);
            return createJsonResponse(json_codec::historyPageToJson(coordinator_.history(cameraId, query)));
        } catch (const CounterError& e) {
            return errorResponse(e);
        }
    });
}

void Api::setupSampleRoutes() {
    // One sample object or an array of samples
    CROW_ROUTE(app_, "/api/v1/samples")
        .methods("POST"_method)
    ([this](const crow::request& req) {
        try {
            auto body = parseBody(req);

            size_t rejected = 0;
            std::vector<TrackSample> samples = samples_.parseBatch(body, rejected);

            size_t accepted = 0;
            size_t events = 0;
            for (const auto& sample : samples) {
                IngestResult result = coordinator_.ingest(sample);
                if (result.accepted) {
                    accepted++;
                    events += result.events;
                } else {
                    rejected++;
                }
            }

            nlohmann::json response;
            response["accepted"] = accepted;
            response["rejected"] = rejected;
            response["events"] = events;
            return createJsonResponse(response, accepted > 0 || rejected == 0 ? 200 : 400);
        } catch (const CounterError& e) {
            return errorResponse(e);
        }
    });
}

void Api::setupManagementRoutes() {
    CROW_ROUTE(app_, "/api/v1/system/log-level")
        .methods("GET"_method)
    ([]() {
        nlohmann::json response;
        response["level"] = Logger::levelName(Logger::getInstance().getLogLevel());
        return createJsonResponse(response);
    });

    CROW_ROUTE(app_, "/api/v1/system/log-level")
        .methods("PUT"_method)
    ([](const crow::request& req) {
        try {
            auto body = parseBody(req);
            const auto& level = requireField(body, "level");
            if (!level.is_string()) {
                return badRequest("level must be a string");
            }

            std::string previous = Logger::levelName(Logger::getInstance().getLogLevel());
            if (!GlobalConfig::getInstance().setLogLevel(level.get<std::string>())) {
                return badRequest("Invalid log level. Valid values: trace, debug, info, warn, error, fatal, off");
            }

            nlohmann::json response;
            response["success"] = true;
            response["previous_level"] = previous;
            response["current_level"] = Logger::levelName(Logger::getInstance().getLogLevel());
            return createJsonResponse(response);
        } catch (const CounterError& e) {
            return errorResponse(e);
        }
    });
}

void Api::setupWebSocketRoutes() {
    CROW_WEBSOCKET_ROUTE(app_, "/ws")
        .onopen([this](crow::websocket::connection& conn) {
            SubscriptionPtr subscription = coordinator_.subscribe();
            subscription->setReadyCallback([this]() { signalDelivery(); });
            {
                std::lock_guard<std::mutex> lock(sessionsMutex_);
                sessions_[&conn] = subscription;
            }
            signalDelivery();
        })
        .onclose([this](crow::websocket::connection& conn, const std::string& reason) {
            SubscriptionPtr subscription;
            {
                std::lock_guard<std::mutex> lock(sessionsMutex_);
                auto it = sessions_.find(&conn);
                if (it == sessions_.end()) {
                    return;
                }
                subscription = it->second;
                sessions_.erase(it);
            }
            LOG_DEBUG("API", "WebSocket closed: " + reason);
            coordinator_.unsubscribe(subscription);
        })
        .onmessage([this](crow::websocket::connection& conn, const std::string& data, bool is_binary) {
            if (is_binary) {
                conn.send_text(json_codec::errorToJson(ValidationError("Binary messages are not supported")).dump());
                return;
            }

            SubscriptionPtr subscription;
            {
                std::lock_guard<std::mutex> lock(sessionsMutex_);
                auto it = sessions_.find(&conn);
                if (it != sessions_.end()) {
                    subscription = it->second;
                }
            }

            nlohmann::json response = commands_.handleText(data, subscription);
            response["event"] = "command_response";
            conn.send_text(response.dump());
        });
}

void Api::signalDelivery() {
    {
        std::lock_guard<std::mutex> lock(deliveryMutex_);
        deliveryPending_ = true;
    }
    deliveryCv_.notify_one();
}

void Api::deliveryLoop() {
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(deliveryMutex_);
            deliveryCv_.wait_for(lock, 250ms, [this] { return deliveryPending_ || !running_; });
            deliveryPending_ = false;
        }

        if (!running_) {
            break;
        }
        deliverPending();
    }
}

void Api::deliverPending() {
    std::lock_guard<std::mutex> lock(sessionsMutex_);

    for (auto& pair : sessions_) {
        Notification notification;
        while (pair.second->tryPop(notification)) {
            pair.first->send_text(json_codec::notificationToJson(notification).dump());
        }
    }
}

} // namespace zc
