#include "session/session_coordinator.h"
#include "logger.h"

namespace zc {

SessionCoordinator::SessionCoordinator(const CoordinatorOptions& options)
    : options_(options),
      cameraManager_(options.state),
      nextSubscriptionId_(1) {
}

SessionCoordinator::~SessionCoordinator() {
    std::lock_guard<std::mutex> lock(subscribersMutex_);
    for (auto& pair : subscribers_) {
        pair.second->close();
    }
    subscribers_.clear();
}

bool SessionCoordinator::registerCamera(const std::string& cameraId) {
    if (!cameraManager_.registerCamera(cameraId)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(activeChangeMutex_);
    {
        std::lock_guard<std::mutex> activeLock(activeMutex_);
        if (activeCamera_.empty()) {
            activeCamera_ = cameraId;
            LOG_INFO("SessionCoordinator", "Active camera set to " + cameraId);
        }
    }

    broadcastCameraChange(activeCamera());
    return true;
}

void SessionCoordinator::setActiveCamera(const std::string& cameraId) {
    requireCamera(cameraId);

    std::lock_guard<std::mutex> lock(activeChangeMutex_);
    {
        std::lock_guard<std::mutex> activeLock(activeMutex_);
        activeCamera_ = cameraId;
    }

    LOG_INFO("SessionCoordinator", "Active camera set to " + cameraId);
    broadcastCameraChange(cameraId);
}

std::string SessionCoordinator::activeCamera() const {
    std::lock_guard<std::mutex> lock(activeMutex_);
    return activeCamera_;
}

SubscriptionPtr SessionCoordinator::subscribe(const std::string& viewedCamera) {
    if (!viewedCamera.empty()) {
        requireCamera(viewedCamera);
    }

    std::lock_guard<std::mutex> lock(activeChangeMutex_);

    auto subscription = std::make_shared<Subscription>(nextSubscriptionId_++,
                                                       options_.subscriberQueueCapacity);
    subscription->setViewedCamera(viewedCamera);

    const std::string target = viewedCamera.empty() ? activeCamera() : viewedCamera;
    auto registerWith = [this, &subscription](Notification initial) {
        initial.cameras = cameraManager_.getCameraIds();
        sendTo(subscription, std::move(initial));

        std::lock_guard<std::mutex> subscribersLock(subscribersMutex_);
        subscribers_[subscription->getId()] = subscription;
    };

    auto channel = cameraManager_.getCamera(target);
    if (channel) {
        // Registered under the camera lock so no update can overtake the initial data
        channel->withState([&](CameraState& state) {
            auto snap = std::make_shared<const CameraSnapshot>(state.snapshot());
            registerWith(makeNotification(NotificationKind::INITIAL_DATA, target, "", snap));
        });
    } else {
        registerWith(makeNotification(NotificationKind::INITIAL_DATA, "", "", nullptr));
    }

    LOG_INFO("SessionCoordinator", "Subscriber " + std::to_string(subscription->getId()) +
             " connected" + (viewedCamera.empty() ? "" : " viewing " + viewedCamera));
    return subscription;
}

void SessionCoordinator::unsubscribe(const SubscriptionPtr& subscription) {
    if (!subscription) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(subscribersMutex_);
        subscribers_.erase(subscription->getId());
    }
    subscription->close();

    if (subscription->droppedCount() > 0) {
        LOG_INFO("SessionCoordinator", "Subscriber " + std::to_string(subscription->getId()) +
                 " disconnected, " + std::to_string(subscription->droppedCount()) +
                 " notifications were dropped");
    } else {
        LOG_INFO("SessionCoordinator", "Subscriber " + std::to_string(subscription->getId()) + " disconnected");
    }
}

void SessionCoordinator::setViewedCamera(const SubscriptionPtr& subscription, const std::string& cameraId) {
    if (!subscription) {
        return;
    }

    if (cameraId.empty()) {
        subscription->setViewedCamera("");
        sendCurrentData(subscription);
        return;
    }

    auto channel = requireCamera(cameraId);
    channel->withState([&](CameraState& state) {
        subscription->setViewedCamera(cameraId);

        Notification current = makeNotification(NotificationKind::CURRENT_DATA, cameraId, "",
            std::make_shared<const CameraSnapshot>(state.snapshot()));
        current.cameras = cameraManager_.getCameraIds();
        sendTo(subscription, std::move(current));
    });
}

bool SessionCoordinator::sendCurrentData(const SubscriptionPtr& subscription, const std::string& cameraId) {
    if (!subscription) {
        return false;
    }

    std::string target = cameraId;
    if (target.empty()) {
        target = subscription->getViewedCamera();
    }
    if (target.empty()) {
        target = activeCamera();
    }

    auto channel = cameraManager_.getCamera(target);
    if (!channel) {
        sendError(subscription, target, UnknownEntityError("Unknown camera: " + target));
        return false;
    }

    channel->withState([&](CameraState& state) {
        Notification current = makeNotification(NotificationKind::CURRENT_DATA, target, "",
            std::make_shared<const CameraSnapshot>(state.snapshot()));
        current.cameras = cameraManager_.getCameraIds();
        sendTo(subscription, std::move(current));
    });
    return true;
}

MutationResult SessionCoordinator::applyMutation(const std::string& cameraId,
                                                 NotificationKind kind,
                                                 const std::string& entityName,
                                                 const std::function<void(CameraState&)>& fn,
                                                 const SubscriptionPtr& requester) {
    return mutate(cameraId, kind, entityName, fn, requester, false);
}

MutationResult SessionCoordinator::defineZone(const std::string& cameraId, const std::string& name,
                                              const Point& topLeft, const Point& bottomRight,
                                              const SubscriptionPtr& requester) {
    return mutate(cameraId, NotificationKind::ZONE_UPDATED, name,
                  [&](CameraState& state) { state.defineZone(name, topLeft, bottomRight); },
                  requester, true);
}

MutationResult SessionCoordinator::defineLine(const std::string& cameraId, const std::string& name,
                                              const Point& start, const Point& end,
                                              const SubscriptionPtr& requester) {
    return mutate(cameraId, NotificationKind::LINE_UPDATED, name,
                  [&](CameraState& state) { state.defineLine(name, start, end); },
                  requester, true);
}

MutationResult SessionCoordinator::resetZone(const std::string& cameraId, const std::string& name,
                                             const SubscriptionPtr& requester) {
    return mutate(cameraId, NotificationKind::COUNT_RESET, name,
                  [&](CameraState& state) { state.resetZone(name); },
                  requester, false);
}

MutationResult SessionCoordinator::resetLine(const std::string& cameraId, const std::string& name,
                                             const SubscriptionPtr& requester) {
    return mutate(cameraId, NotificationKind::LINE_COUNT_RESET, name,
                  [&](CameraState& state) { state.resetLine(name); },
                  requester, false);
}

MutationResult SessionCoordinator::deleteZone(const std::string& cameraId, const std::string& name,
                                              const SubscriptionPtr& requester) {
    return mutate(cameraId, NotificationKind::ZONE_DELETED, name,
                  [&](CameraState& state) { state.deleteZone(name); },
                  requester, false);
}

MutationResult SessionCoordinator::deleteLine(const std::string& cameraId, const std::string& name,
                                              const SubscriptionPtr& requester) {
    return mutate(cameraId, NotificationKind::LINE_DELETED, name,
                  [&](CameraState& state) { state.deleteLine(name); },
                  requester, false);
}

MutationResult SessionCoordinator::mutate(const std::string& cameraId,
                                          NotificationKind kind,
                                          const std::string& entityName,
                                          const std::function<void(CameraState&)>& fn,
                                          const SubscriptionPtr& requester,
                                          bool unknownCameraIsValidation) {
    MutationResult result;

    try {
        auto channel = cameraManager_.getCamera(cameraId);
        if (!channel) {
            if (unknownCameraIsValidation) {
                throw ValidationError("Unknown camera: " + cameraId);
            }
            throw UnknownEntityError("Unknown camera: " + cameraId);
        }

        result.snapshot = channel->withState([&](CameraState& state) {
            fn(state);
            auto snap = std::make_shared<const CameraSnapshot>(state.snapshot());
            notify(makeNotification(kind, cameraId, entityName, snap));
            return snap;
        });
        result.success = true;
    } catch (const CounterError& e) {
        result.code = e.code();
        result.message = e.what();
        LOG_WARN("SessionCoordinator", notificationKindToString(kind) + " on camera " + cameraId +
                 " rejected: " + result.message);
        sendError(requester, cameraId, e);
    }

    return result;
}

void SessionCoordinator::notify(Notification notification) {
    if (notification.activeCamera.empty()) {
        notification.activeCamera = activeCamera();
    }

    std::lock_guard<std::mutex> lock(subscribersMutex_);

    for (auto& pair : subscribers_) {
        if (pair.second->accepts(notification)) {
            pair.second->push(notification);
        }
    }
}

IngestResult SessionCoordinator::ingest(const TrackSample& sample) {
    IngestResult result;

    TrackSample routed = sample;
    if (routed.cameraId.empty()) {
        routed.cameraId = activeCamera();
    }
    result.cameraId = routed.cameraId;

    auto channel = cameraManager_.getCamera(routed.cameraId);
    if (!channel) {
        result.message = "Unknown camera: " + (routed.cameraId.empty() ? std::string("<none>") : routed.cameraId);
        LOG_WARN("SessionCoordinator", "Dropped sample of track " + std::to_string(sample.trackId) +
                 ": " + result.message);
        return result;
    }

    try {
        result.events = channel->withState([&](CameraState& state) {
            auto events = state.ingest(routed);
            channel->markArrival();

            if (!events.empty()) {
                notify(makeNotification(NotificationKind::UPDATE_COUNTS, routed.cameraId, "",
                                        std::make_shared<const CameraSnapshot>(state.snapshot())));
            }
            return events.size();
        });
        result.accepted = true;
    } catch (const CounterError& e) {
        result.message = e.what();
        LOG_WARN("SessionCoordinator", "Dropped sample of track " + std::to_string(sample.trackId) +
                 " on camera " + routed.cameraId + ": " + result.message);
    }

    return result;
}

size_t SessionCoordinator::evictIdleTracks() {
    return sweep([](CameraChannel& channel) { return channel.clockNow(); });
}

size_t SessionCoordinator::evictIdleTracks(int64_t now) {
    return sweep([now](CameraChannel&) { return now; });
}

size_t SessionCoordinator::sweep(const std::function<int64_t(CameraChannel&)>& clock) {
    size_t evicted = 0;

    for (auto& channel : cameraManager_.getAllCameras()) {
        evicted += channel->withState([&](CameraState& state) {
            EvictionResult eviction = state.evictIdleTracks(clock(*channel), options_.trackIdleTimeoutMs);

            if (eviction.occupancyChanged || !eviction.syntheticExits.empty()) {
                notify(makeNotification(NotificationKind::UPDATE_COUNTS, channel->getId(), "",
                                        std::make_shared<const CameraSnapshot>(state.snapshot())));
            }
            return eviction.evictedTracks;
        });
    }

    if (evicted > 0) {
        LOG_DEBUG("SessionCoordinator", "Evicted " + std::to_string(evicted) + " idle tracks");
    }
    return evicted;
}

CameraListing SessionCoordinator::listCameras() const {
    CameraListing listing;
    listing.cameras = cameraManager_.getCameraIds();
    listing.activeCamera = activeCamera();
    return listing;
}

CameraSnapshot SessionCoordinator::snapshot(const std::string& cameraId) const {
    return requireCamera(cameraId)->snapshot();
}

ZoneSnapshot SessionCoordinator::zoneSnapshot(const std::string& cameraId, const std::string& name) const {
    return requireCamera(cameraId)->withStateConst([&](const CameraState& state) {
        return state.zoneSnapshot(name);
    });
}

LineSnapshot SessionCoordinator::lineSnapshot(const std::string& cameraId, const std::string& name) const {
    return requireCamera(cameraId)->withStateConst([&](const CameraState& state) {
        return state.lineSnapshot(name);
    });
}

HistoryPage SessionCoordinator::history(const std::string& cameraId, const HistoryQuery& query) const {
    return requireCamera(cameraId)->withStateConst([&](const CameraState& state) {
        return state.history(query);
    });
}

size_t SessionCoordinator::subscriberCount() const {
    std::lock_guard<std::mutex> lock(subscribersMutex_);
    return subscribers_.size();
}

std::shared_ptr<CameraChannel> SessionCoordinator::requireCamera(const std::string& cameraId) const {
    auto channel = cameraManager_.getCamera(cameraId);
    if (!channel) {
        throw UnknownEntityError("Unknown camera: " + cameraId);
    }
    return channel;
}

Notification SessionCoordinator::makeNotification(NotificationKind kind,
                                                  const std::string& cameraId,
                                                  const std::string& entityName,
                                                  std::shared_ptr<const CameraSnapshot> snapshot) {
    Notification notification;
    notification.kind = kind;
    notification.cameraId = cameraId;
    notification.activeCamera = activeCamera();
    notification.entityName = entityName;
    notification.snapshot = std::move(snapshot);
    return notification;
}

void SessionCoordinator::sendError(const SubscriptionPtr& requester,
                                   const std::string& cameraId,
                                   const CounterError& error) {
    if (!requester) {
        return;
    }

    Notification notification = makeNotification(NotificationKind::ERROR, cameraId, "", nullptr);
    notification.message = error.what();
    notification.errorCode = error.code();
    sendTo(requester, std::move(notification));
}

void SessionCoordinator::sendTo(const SubscriptionPtr& subscription, Notification notification) {
    subscription->push(std::move(notification));
}

void SessionCoordinator::broadcastCameraChange(const std::string& cameraId) {
    auto channel = cameraManager_.getCamera(cameraId);
    if (!channel) {
        return;
    }

    channel->withState([&](CameraState& state) {
        Notification changed = makeNotification(NotificationKind::CAMERA_CHANGED, cameraId, "",
            std::make_shared<const CameraSnapshot>(state.snapshot()));
        changed.cameras = cameraManager_.getCameraIds();
        notify(std::move(changed));
    });
}

} // namespace zc
