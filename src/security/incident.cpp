/*
 * warden C++17 - Incident Lifecycle and Response Policy
 */
#include <warden/security/incident.hpp>
#include <warden/core/utils.hpp>

#include <stdexcept>

namespace warden {

Json to_json(const SecurityIncident& incident) {
    return Json{
        {"id", incident.id},
        {"timestamp", format_timestamp_ms(incident.timestamp_ms)},
        {"incident_type", to_string(incident.incident_type)},
        {"severity", to_string(incident.severity)},
        {"source_system", incident.source_system},
        {"project_id", incident.project_id ? Json(*incident.project_id) : Json(nullptr)},
        {"description", sanitize_utf8(incident.description)},
        {"evidence", incident.evidence},
        {"response_actions", incident.response_actions},
        {"status", to_string(incident.status)},
        {"resolved_at", incident.resolved_at_ms ? Json(format_timestamp_ms(*incident.resolved_at_ms))
                                                : Json(nullptr)},
        {"trigger_event_id", incident.trigger_event_id}
    };
}

bool is_valid_transition(IncidentStatus from, IncidentStatus to, Severity severity) {
    bool critical = severity == Severity::CRITICAL;
    switch (from) {
        case IncidentStatus::DETECTED:
            return to == IncidentStatus::INVESTIGATING ||
                   (to == IncidentStatus::ESCALATED && critical);
        case IncidentStatus::INVESTIGATING:
            return to == IncidentStatus::CONTAINED ||
                   to == IncidentStatus::RESOLVED ||
                   (to == IncidentStatus::ESCALATED && critical);
        case IncidentStatus::CONTAINED:
            return to == IncidentStatus::RESOLVED ||
                   (to == IncidentStatus::ESCALATED && critical);
        case IncidentStatus::ESCALATED:
            return to == IncidentStatus::RESOLVED;
        case IncidentStatus::RESOLVED:
            return false;
    }
    return false;
}

bool is_terminal(IncidentStatus status) {
    return status == IncidentStatus::CONTAINED ||
           status == IncidentStatus::RESOLVED ||
           status == IncidentStatus::ESCALATED;
}

void transition(SecurityIncident& incident, IncidentStatus to) {
    if (!is_valid_transition(incident.status, to, incident.severity)) {
        throw std::logic_error("Incident " + incident.id + ": illegal transition " +
                               to_string(incident.status) + " -> " + to_string(to));
    }
    incident.status = to;
    if (is_terminal(to)) {
        incident.resolved_at_ms = current_timestamp_ms();
    }
}

} // namespace warden
