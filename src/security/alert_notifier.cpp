/*
 * warden C++17 - Alert Delivery
 */
#include <warden/security/alert_notifier.hpp>
#include <warden/core/logger.hpp>
#include <warden/core/utils.hpp>

namespace warden {

AlertNotifier::AlertNotifier(const std::string& webhook_url, int timeout_seconds)
    : webhook_url_(webhook_url)
    , http_(timeout_seconds) {}

bool AlertNotifier::send(const SecurityIncident& incident, const std::string& urgency, std::string& error) {
    if (!enabled()) {
        error = "alert webhook not configured";
        return false;
    }

    Json body = {
        {"incident", to_json(incident)},
        {"urgency", urgency},
        {"sent_at", format_timestamp_ms(current_timestamp_ms())}
    };
    HttpResponse response = http_.post_json(webhook_url_, dump_json(body));

    if (response.status_code == 0) {
        error = "request failed: " + response.error;
        LOG_ERROR("[AlertNotifier] Alert for %s not delivered: %s", incident.id.c_str(), error.c_str());
        return false;
    }
    if (!response.ok()) {
        error = "webhook returned HTTP " + std::to_string(response.status_code);
        LOG_ERROR("[AlertNotifier] Alert for %s rejected: %s", incident.id.c_str(), error.c_str());
        return false;
    }
    LOG_INFO("[AlertNotifier] Alert for %s delivered (%s)", incident.id.c_str(), urgency.c_str());
    return true;
}

} // namespace warden
