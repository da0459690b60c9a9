#include "session/track_sweeper.h"
#include "session/session_coordinator.h"
#include "logger.h"

namespace zc {

TrackSweeper::TrackSweeper(SessionCoordinator& coordinator, std::chrono::milliseconds interval)
    : coordinator_(coordinator),
      interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(1000)),
      running_(false) {
}

TrackSweeper::~TrackSweeper() {
    shutdown();
}

void TrackSweeper::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }

    running_ = true;
    workerThread_ = std::thread(&TrackSweeper::workerThread, this);
    LOG_INFO("TrackSweeper", "Idle track sweeper started, interval " +
             std::to_string(interval_.count()) + " ms");
}

void TrackSweeper::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }

    cv_.notify_all();

    if (workerThread_.joinable()) {
        workerThread_.join();
    }

    LOG_INFO("TrackSweeper", "Idle track sweeper stopped");
}

bool TrackSweeper::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void TrackSweeper::workerThread() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, interval_, [this] { return !running_; });
            if (!running_) {
                break;
            }
        }

        try {
            coordinator_.evictIdleTracks();
        } catch (const std::exception& e) {
            LOG_ERROR("TrackSweeper", "Idle track sweep failed: " + std::string(e.what()));
        }
    }
}

} // namespace zc
