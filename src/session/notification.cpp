#include "session/notification.h"

namespace zc {

std::string notificationKindToString(NotificationKind kind) {
    switch (kind) {
        case NotificationKind::INITIAL_DATA: return "initial_data";
        case NotificationKind::CURRENT_DATA: return "current_data";
        case NotificationKind::ZONE_UPDATED: return "zone_updated";
        case NotificationKind::ZONE_DELETED: return "zone_deleted";
        case NotificationKind::LINE_UPDATED: return "line_updated";
        case NotificationKind::LINE_DELETED: return "line_deleted";
        case NotificationKind::UPDATE_COUNTS: return "update_counts";
        case NotificationKind::COUNT_RESET: return "count_reset";
        case NotificationKind::LINE_COUNT_RESET: return "line_count_reset";
        case NotificationKind::CAMERA_CHANGED: return "camera_changed";
        case NotificationKind::ERROR: return "error";
        default: return "unknown";
    }
}

} // namespace zc
