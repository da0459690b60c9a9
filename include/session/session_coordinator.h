#pragma once

#include "camera_manager.h"
#include "errors.h"
#include "session/notification.h"
#include "session/subscription.h"
#include "state/camera_state.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace zc {

/**
 * @brief Engine-wide settings of the coordinator
 */
struct CoordinatorOptions {
    CameraStateOptions state;
    int64_t trackIdleTimeoutMs = 30000;
    size_t subscriberQueueCapacity = 64;
};

/**
 * @brief Outcome of a mutation command
 *
 * On success `snapshot` is the camera state right after the mutation.
 */
struct MutationResult {
    bool success = false;
    ErrorCode code = ErrorCode::NONE;
    std::string message;
    std::shared_ptr<const CameraSnapshot> snapshot;
};

/**
 * @brief Outcome of one ingested sample
 */
struct IngestResult {
    bool accepted = false;
    std::string cameraId;
    size_t events = 0;
    std::string message;   ///< Why the sample was dropped
};

/**
 * @brief Registered cameras and the active one
 */
struct CameraListing {
    std::vector<std::string> cameras;
    std::string activeCamera;
};

/**
 * @brief Central entry point for commands, samples, queries and subscriptions
 *
 * Lock order: active-change mutex, then one camera mutex, then the leaf
 * mutexes (active camera name, subscriber list). Notifications are fanned
 * out while the camera mutex is held, so every subscriber sees one camera's
 * notifications in mutation order. Mailbox pushes never block.
 */
class SessionCoordinator {
public:
    explicit SessionCoordinator(const CoordinatorOptions& options);
    ~SessionCoordinator();

    /**
     * @brief Register a camera; the first camera registered becomes active
     *
     * Broadcasts CAMERA_CHANGED with the updated camera list when added.
     *
     * @return true if added, false if it already existed
     * @throws ValidationError on an empty ID
     */
    bool registerCamera(const std::string& cameraId);

    /**
     * @brief Select the camera whose state viewers see by default
     *
     * @throws UnknownEntityError if the camera is not registered
     */
    void setActiveCamera(const std::string& cameraId);

    std::string activeCamera() const;

    /**
     * @brief Open a subscription and queue its INITIAL_DATA
     *
     * @param viewedCamera Camera to follow; empty follows every camera and
     *        receives the active camera as initial data
     * @throws UnknownEntityError if viewedCamera is not registered
     */
    SubscriptionPtr subscribe(const std::string& viewedCamera = "");

    /**
     * @brief Close a subscription and release its mailbox
     */
    void unsubscribe(const SubscriptionPtr& subscription);

    /**
     * @brief Change a subscriber's scope and queue CURRENT_DATA for it
     *
     * @param cameraId Camera to follow, empty for every camera
     * @throws UnknownEntityError if the camera is not registered
     */
    void setViewedCamera(const SubscriptionPtr& subscription, const std::string& cameraId);

    /**
     * @brief Queue CURRENT_DATA for one subscriber
     *
     * @param cameraId Camera to send; empty means the subscriber's viewed
     *        camera, or the active camera
     * @return false (and an ERROR notification) if the camera is unknown
     */
    bool sendCurrentData(const SubscriptionPtr& subscription, const std::string& cameraId = "");

    /**
     * @brief Run fn on a camera's state under its lock and broadcast the result
     *
     * On success the post-mutation snapshot is broadcast with `kind`. On a
     * CounterError nothing is broadcast; the requester (if any) gets an ERROR
     * notification and the error is returned.
     */
    MutationResult applyMutation(const std::string& cameraId,
                                 NotificationKind kind,
                                 const std::string& entityName,
                                 const std::function<void(CameraState&)>& fn,
                                 const SubscriptionPtr& requester = nullptr);

    MutationResult defineZone(const std::string& cameraId, const std::string& name,
                              const Point& topLeft, const Point& bottomRight,
                              const SubscriptionPtr& requester = nullptr);
    MutationResult defineLine(const std::string& cameraId, const std::string& name,
                              const Point& start, const Point& end,
                              const SubscriptionPtr& requester = nullptr);
    MutationResult resetZone(const std::string& cameraId, const std::string& name,
                             const SubscriptionPtr& requester = nullptr);
    MutationResult resetLine(const std::string& cameraId, const std::string& name,
                             const SubscriptionPtr& requester = nullptr);
    MutationResult deleteZone(const std::string& cameraId, const std::string& name,
                              const SubscriptionPtr& requester = nullptr);
    MutationResult deleteLine(const std::string& cameraId, const std::string& name,
                              const SubscriptionPtr& requester = nullptr);

    /**
     * @brief Push a notification to every subscriber whose scope accepts it
     *
     * Sequence (and the active camera, when unset) are filled in here.
     */
    void notify(Notification notification);

    /**
     * @brief Route a sample to its camera and update zones and lines
     *
     * A sample without a camera goes to the active camera. Samples for an
     * unknown camera or outside the reference space are dropped and logged.
     * Broadcasts UPDATE_COUNTS when the sample produced events.
     */
    IngestResult ingest(const TrackSample& sample);

    /**
     * @brief Evict idle tracks on every camera using each camera's sample clock
     *
     * @return Number of tracks evicted
     */
    size_t evictIdleTracks();

    /**
     * @brief Evict idle tracks on every camera relative to an explicit time
     */
    size_t evictIdleTracks(int64_t now);

    CameraListing listCameras() const;

    /// @throws UnknownEntityError if the camera is not registered
    CameraSnapshot snapshot(const std::string& cameraId) const;

    /// @throws UnknownEntityError if the camera or zone does not exist
    ZoneSnapshot zoneSnapshot(const std::string& cameraId, const std::string& name) const;

    /// @throws UnknownEntityError if the camera or line does not exist
    LineSnapshot lineSnapshot(const std::string& cameraId, const std::string& name) const;

    /// @throws UnknownEntityError if the camera is not registered
    HistoryPage history(const std::string& cameraId, const HistoryQuery& query) const;

    size_t subscriberCount() const;

private:
    SessionCoordinator(const SessionCoordinator&) = delete;
    SessionCoordinator& operator=(const SessionCoordinator&) = delete;

    MutationResult mutate(const std::string& cameraId,
                          NotificationKind kind,
                          const std::string& entityName,
                          const std::function<void(CameraState&)>& fn,
                          const SubscriptionPtr& requester,
                          bool unknownCameraIsValidation);

    std::shared_ptr<CameraChannel> requireCamera(const std::string& cameraId) const;
    Notification makeNotification(NotificationKind kind,
                                  const std::string& cameraId,
                                  const std::string& entityName,
                                  std::shared_ptr<const CameraSnapshot> snapshot);
    void sendTo(const SubscriptionPtr& subscription, Notification notification);
    void sendError(const SubscriptionPtr& requester, const std::string& cameraId, const CounterError& error);
    void broadcastCameraChange(const std::string& cameraId);
    size_t sweep(const std::function<int64_t(CameraChannel&)>& clock);

    CoordinatorOptions options_;
    CameraManager cameraManager_;

    std::mutex activeChangeMutex_;
    mutable std::mutex activeMutex_;
    std::string activeCamera_;

    mutable std::mutex subscribersMutex_;
    std::map<uint64_t, SubscriptionPtr> subscribers_;

    std::atomic<uint64_t> nextSubscriptionId_;
};

} // namespace zc
