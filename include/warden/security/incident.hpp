/*
 * warden C++17 - Security incidents
 *
 * Lifecycle: detected -> investigating -> {contained | resolved}, with
 * escalated reachable from any unresolved state for critical incidents.
 * An operator may still resolve a contained or escalated incident.
 */
#ifndef warden_SECURITY_INCIDENT_HPP
#define warden_SECURITY_INCIDENT_HPP

#include <warden/core/json.hpp>
#include <warden/security/types.hpp>

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace warden {

struct SecurityIncident {
    std::string id;
    int64_t timestamp_ms;
    IncidentType incident_type;
    Severity severity;
    std::string source_system;
    std::optional<std::string> project_id;
    std::string description;
    Json evidence;
    std::vector<std::string> response_actions;
    IncidentStatus status;
    std::optional<int64_t> resolved_at_ms;
    uint64_t trigger_event_id;

    SecurityIncident()
        : timestamp_ms(0)
        , incident_type(IncidentType::POLICY_VIOLATION)
        , severity(Severity::LOW)
        , evidence(Json::object())
        , status(IncidentStatus::DETECTED)
        , trigger_event_id(0) {}
};

Json to_json(const SecurityIncident& incident);

bool is_valid_transition(IncidentStatus from, IncidentStatus to, Severity severity);

// States that stamp resolved_at
bool is_terminal(IncidentStatus status);

// Moves the incident to `to` and stamps resolved_at on terminal states.
// Throws std::logic_error for a transition the lifecycle does not allow.
void transition(SecurityIncident& incident, IncidentStatus to);

} // namespace warden

#endif // warden_SECURITY_INCIDENT_HPP
