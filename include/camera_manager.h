#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "state/camera_state.h"

namespace zc {

/**
 * @brief A camera's state behind its exclusive mutation path
 *
 * Every read and write of the camera's zones, lines, tracks and history
 * happens under this channel's mutex. Channels of different cameras never
 * share a lock.
 */
class CameraChannel {
public:
    CameraChannel(const std::string& id, const CameraStateOptions& options);

    const std::string& getId() const { return id_; }

    /**
     * @brief Run fn with exclusive access to the camera state
     *
     * @param fn Callable taking CameraState&
     * @return Whatever fn returns
     */
    template <typename Fn>
    auto withState(Fn&& fn) -> decltype(fn(std::declval<CameraState&>())) {
        std::lock_guard<std::mutex> lock(mutex_);
        return fn(state_);
    }

    /**
     * @brief Run fn with read-only access to the camera state
     */
    template <typename Fn>
    auto withStateConst(Fn&& fn) const -> decltype(fn(std::declval<const CameraState&>())) {
        std::lock_guard<std::mutex> lock(mutex_);
        return fn(state_);
    }

    /**
     * @brief Consistent copy of the camera state
     */
    CameraSnapshot snapshot() const;

    /**
     * @brief Record that a sample just arrived; call with the state lock held
     */
    void markArrival() { lastArrival_ = std::chrono::steady_clock::now(); }

    /**
     * @brief Current time on the camera's sample clock; call with the state lock held
     *
     * The newest sample timestamp advanced by the wall time elapsed since that
     * sample arrived, so idle detection works for both live and replayed streams.
     */
    int64_t clockNow() const;

private:
    std::string id_;
    mutable std::mutex mutex_;
    CameraState state_;
    std::chrono::steady_clock::time_point lastArrival_;
};

/**
 * @brief Registry of all cameras known to the engine
 *
 * The registry lock only guards lookups; camera state is guarded by each
 * CameraChannel. Cameras are never removed during the process lifetime.
 */
class CameraManager {
public:
    explicit CameraManager(const CameraStateOptions& options);

    /**
     * @brief Register a camera
     *
     * @param id Camera ID, must not be empty
     * @return true if the camera was added, false if it already existed
     * @throws ValidationError on an empty ID
     */
    bool registerCamera(const std::string& id);

    /**
     * @brief Get a camera by ID
     *
     * @param id Camera ID
     * @return std::shared_ptr<CameraChannel> The camera, or nullptr if not found
     */
    std::shared_ptr<CameraChannel> getCamera(const std::string& id) const;

    /**
     * @brief IDs of all cameras, sorted
     */
    std::vector<std::string> getCameraIds() const;

    /**
     * @brief All camera channels
     */
    std::vector<std::shared_ptr<CameraChannel>> getAllCameras() const;

private:
    CameraManager(const CameraManager&) = delete;
    CameraManager& operator=(const CameraManager&) = delete;

    CameraStateOptions options_;
    std::unordered_map<std::string, std::shared_ptr<CameraChannel>> cameras_;
    mutable std::mutex camerasMutex_;
};

} // namespace zc
