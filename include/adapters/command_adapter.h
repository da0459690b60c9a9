#pragma once

#include "adapters/sample_adapter.h"
#include "session/session_coordinator.h"
#include <nlohmann/json.hpp>
#include <string>

namespace zc {

/**
 * @brief Executes operator commands received as JSON
 *
 * A command is `{"command": name, "payload": {...}}`; payload fields may also
 * sit at the top level. The reply is
 * `{"command", "status": "success"|"failed", "error", "code", "data"?}`.
 *
 * Commands: define_zone (set_zone), define_line (set_line), reset_zone
 * (reset_zone_counts), reset_line (reset_line_counts), delete_zone,
 * delete_line, set_active_camera, register_camera, list_cameras,
 * view_camera, get_current_data, ingest.
 */
class CommandAdapter {
public:
    CommandAdapter(SessionCoordinator& coordinator, const SampleAdapter& samples);

    /**
     * @brief Run one command
     *
     * @param command Parsed command
     * @param requester Subscription of the sender, if it has one; it receives
     *        ERROR and CURRENT_DATA notifications
     * @return Reply object; never throws on bad input
     */
    nlohmann::json handle(const nlohmann::json& command, const SubscriptionPtr& requester = nullptr);

    /**
     * @brief Parse and run a command given as text
     */
    nlohmann::json handleText(const std::string& text, const SubscriptionPtr& requester = nullptr);

private:
    nlohmann::json dispatch(const std::string& name, const nlohmann::json& payload,
                            const SubscriptionPtr& requester);

    SessionCoordinator& coordinator_;
    const SampleAdapter& samples_;
};

} // namespace zc
