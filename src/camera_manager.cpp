#include "camera_manager.h"
#include "errors.h"
#include "logger.h"
#include <algorithm>

namespace zc {

CameraChannel::CameraChannel(const std::string& id, const CameraStateOptions& options)
    : id_(id),
      state_(id, options),
      lastArrival_(std::chrono::steady_clock::now()) {
}

CameraSnapshot CameraChannel::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.snapshot();
}

int64_t CameraChannel::clockNow() const {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - lastArrival_).count();
    return state_.latestSampleTimestamp() + elapsed;
}

CameraManager::CameraManager(const CameraStateOptions& options)
    : options_(options) {
}

bool CameraManager::registerCamera(const std::string& id) {
    if (id.empty()) {
        throw ValidationError("Camera ID must not be empty");
    }

    std::lock_guard<std::mutex> lock(camerasMutex_);

    if (cameras_.find(id) != cameras_.end()) {
        return false;
    }

    cameras_[id] = std::make_shared<CameraChannel>(id, options_);
    LOG_INFO("CameraManager", "Registered camera " + id);
    return true;
}

std::shared_ptr<CameraChannel> CameraManager::getCamera(const std::string& id) const {
    std::lock_guard<std::mutex> lock(camerasMutex_);

    auto it = cameras_.find(id);
    if (it == cameras_.end()) {
        return nullptr;
    }

    return it->second;
}

std::vector<std::string> CameraManager::getCameraIds() const {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(camerasMutex_);
        for (const auto& pair : cameras_) {
            ids.push_back(pair.first);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<std::shared_ptr<CameraChannel>> CameraManager::getAllCameras() const {
    std::lock_guard<std::mutex> lock(camerasMutex_);

    std::vector<std::shared_ptr<CameraChannel>> cameras;
    for (const auto& pair : cameras_) {
        cameras.push_back(pair.second);
    }

    return cameras;
}

} // namespace zc
