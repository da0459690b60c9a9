#pragma once

#include "errors.h"
#include "state/snapshot.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace zc {

/**
 * @brief Closed set of notification kinds pushed to subscribers
 */
enum class NotificationKind {
    INITIAL_DATA,      ///< Sent once to a new subscriber
    CURRENT_DATA,      ///< Answer to an explicit refresh request, requester only
    ZONE_UPDATED,
    ZONE_DELETED,
    LINE_UPDATED,
    LINE_DELETED,
    UPDATE_COUNTS,     ///< Detector or idle sweep changed counts/occupancy
    COUNT_RESET,       ///< Zone counters reset
    LINE_COUNT_RESET,
    CAMERA_CHANGED,
    ERROR              ///< Requester only
};

std::string notificationKindToString(NotificationKind kind);

/**
 * @brief One message on the notification channel
 *
 * Every kind except ERROR carries a snapshot of `cameraId`; ERROR carries
 * `message` and `errorCode` instead. Snapshots are shared and immutable.
 */
struct Notification {
    NotificationKind kind = NotificationKind::UPDATE_COUNTS;
    uint64_t sequence = 0;                 ///< Per-subscription delivery order, set on push
    std::string cameraId;
    std::string activeCamera;
    std::string entityName;                ///< Zone or line concerned, if any
    std::shared_ptr<const CameraSnapshot> snapshot;
    std::vector<std::string> cameras;      ///< Camera list, for INITIAL_DATA/CURRENT_DATA/CAMERA_CHANGED
    std::string message;
    ErrorCode errorCode = ErrorCode::NONE;
};

} // namespace zc
