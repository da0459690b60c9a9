#include "session/subscription.h"
#include <algorithm>

namespace zc {

Subscription::Subscription(uint64_t id, size_t capacity)
    : id_(id),
      capacity_(std::max<size_t>(1, capacity)),
      nextSequence_(1),
      dropped_(0),
      closed_(false) {
}

bool Subscription::push(Notification notification) {
    std::function<void()> callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }

        notification.sequence = nextSequence_++;
        queue_.push_back(std::move(notification));
        while (queue_.size() > capacity_) {
            queue_.pop_front();
            dropped_++;
        }
        callback = readyCallback_;
    }
    cv_.notify_one();

    if (callback) {
        callback();
    }
    return true;
}

bool Subscription::tryPop(Notification& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return false;
    }
    out = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

bool Subscription::waitPop(Notification& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });

    if (queue_.empty()) {
        return false;
    }
    out = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

void Subscription::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        queue_.clear();
        readyCallback_ = nullptr;
    }
    cv_.notify_all();
}

bool Subscription::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t Subscription::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

uint64_t Subscription::droppedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

std::string Subscription::getViewedCamera() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return viewedCamera_;
}

void Subscription::setViewedCamera(const std::string& cameraId) {
    std::lock_guard<std::mutex> lock(mutex_);
    viewedCamera_ = cameraId;
}

bool Subscription::accepts(const Notification& notification) const {
    if (notification.kind == NotificationKind::CAMERA_CHANGED) {
        return true;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    return viewedCamera_.empty() || viewedCamera_ == notification.cameraId;
}

void Subscription::setReadyCallback(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    readyCallback_ = std::move(callback);
}

} // namespace zc
