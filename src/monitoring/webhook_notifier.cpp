/**
 * @file webhook_notifier.cpp
 * @brief Реализация отправки алертов на webhook
 */

#include "webhook_notifier.hpp"
#include "http_client.hpp"
#include "../core/json.hpp"
#include "../log/logger.hpp"

#include <chrono>
#include <sstream>

namespace loadmesh::monitoring {

namespace {

constexpr std::string_view COMPONENT = "WebhookNotifier";

} // namespace

std::string alert_to_json(const Alert& alert) {
    auto timestamp_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        alert.timestamp.time_since_epoch()
    ).count();

    std::ostringstream out;
    out << "{";
    out << "\"id\":" << alert.id << ",";
    out << "\"category\":\"" << to_string(alert.category) << "\",";
    out << "\"severity\":\"" << to_string(alert.severity) << "\",";
    out << "\"node_id\":\"" << json::escape(alert.node_id) << "\",";
    out << "\"threshold\":" << alert.threshold << ",";
    out << "\"observed_value\":" << alert.observed_value << ",";
    out << "\"message\":\"" << json::escape(alert.message) << "\",";
    out << "\"timestamp\":" << timestamp_ms;
    out << "}";
    return out.str();
}

WebhookNotifier::WebhookNotifier(std::string url, uint32_t timeout_ms)
    : url_(std::move(url))
    , timeout_ms_(timeout_ms)
{
}

Result<void> WebhookNotifier::notify(const Alert& alert) const {
    auto response = http_post_json(url_, alert_to_json(alert), timeout_ms_);
    if (!response) {
        return std::unexpected(response.error());
    }

    if (!response->ok()) {
        std::ostringstream msg;
        msg << "webhook вернул HTTP " << response->status;
        return Err<void>(ErrorCode::HttpBadStatus, msg.str());
    }

    return {};
}

AlertCallback WebhookNotifier::callback() const {
    return [notifier = *this](const Alert& alert) {
        if (auto result = notifier.notify(alert); !result) {
            log::warn(COMPONENT) << "алерт #" << alert.id << " не отправлен: "
                                 << result.error().message;
        }
    };
}

} // namespace loadmesh::monitoring
