#pragma once

#include "session/notification.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace zc {

/**
 * @brief A connected viewer's bounded mailbox
 *
 * push() never blocks: when the mailbox is full the oldest queued
 * notification is dropped, so the newest snapshot always survives.
 * Every push is stamped with the next sequence of this subscription,
 * so a gap between two received sequences is the number dropped.
 */
class Subscription {
public:
    Subscription(uint64_t id, size_t capacity);

    uint64_t getId() const { return id_; }

    /**
     * @brief Stamp the notification with the next sequence and queue it
     *
     * @return false if the subscription is closed
     */
    bool push(Notification notification);

    /**
     * @brief Take the oldest queued notification without waiting
     *
     * @return false if the mailbox is empty
     */
    bool tryPop(Notification& out);

    /**
     * @brief Wait up to timeout for a notification
     *
     * @return false on timeout or when the subscription is closed and empty
     */
    bool waitPop(Notification& out, std::chrono::milliseconds timeout);

    /**
     * @brief Close the mailbox, drop queued notifications and wake waiters
     */
    void close();

    bool isClosed() const;
    size_t pending() const;

    /**
     * @brief Number of notifications dropped because the mailbox was full
     */
    uint64_t droppedCount() const;

    /**
     * @brief Camera this subscriber renders; empty means every camera
     */
    std::string getViewedCamera() const;
    void setViewedCamera(const std::string& cameraId);

    /**
     * @brief Whether a broadcast notification is in this subscriber's scope
     *
     * CAMERA_CHANGED always is; camera-scoped kinds only when the subscriber
     * views that camera or views every camera.
     */
    bool accepts(const Notification& notification) const;

    /**
     * @brief Hook invoked (outside the mailbox lock) after each successful push
     */
    void setReadyCallback(std::function<void()> callback);

private:
    uint64_t id_;
    size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Notification> queue_;
    std::string viewedCamera_;
    uint64_t nextSequence_;
    uint64_t dropped_;
    bool closed_;
    std::function<void()> readyCallback_;
};

using SubscriptionPtr = std::shared_ptr<Subscription>;

} // namespace zc
