/*
 * warden C++17 - Alert delivery
 *
 * POSTs incident alerts to the configured webhook. Delivery failures are
 * logged and reported to the caller, never thrown.
 */
#ifndef warden_SECURITY_ALERT_NOTIFIER_HPP
#define warden_SECURITY_ALERT_NOTIFIER_HPP

#include <warden/security/incident.hpp>
#include <warden/core/http_client.hpp>

#include <string>

namespace warden {

class AlertNotifier {
public:
    AlertNotifier(const std::string& webhook_url, int timeout_seconds);

    bool enabled() const { return !webhook_url_.empty(); }

    // urgency: "normal", "high" or "emergency"
    bool send(const SecurityIncident& incident, const std::string& urgency, std::string& error);

private:
    std::string webhook_url_;
    HttpClient http_;
};

} // namespace warden

#endif // warden_SECURITY_ALERT_NOTIFIER_HPP
