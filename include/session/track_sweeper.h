#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace zc {

class SessionCoordinator;

/**
 * @brief Background thread that periodically evicts idle tracks
 */
class TrackSweeper {
public:
    TrackSweeper(SessionCoordinator& coordinator, std::chrono::milliseconds interval);
    ~TrackSweeper();

    /**
     * @brief Start the sweeper thread; does nothing if already running
     */
    void start();

    /**
     * @brief Stop the sweeper thread and wait for it to exit
     */
    void shutdown();

    bool isRunning() const;

private:
    TrackSweeper(const TrackSweeper&) = delete;
    TrackSweeper& operator=(const TrackSweeper&) = delete;

    void workerThread();

    SessionCoordinator& coordinator_;
    std::chrono::milliseconds interval_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool running_;
    std::thread workerThread_;
};

} // namespace zc
