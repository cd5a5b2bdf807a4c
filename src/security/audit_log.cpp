/*
 * warden C++17 - Incident Audit Log
 */
#include <warden/security/audit_log.hpp>
#include <warden/core/logger.hpp>
#include <warden/core/utils.hpp>

#include <cerrno>
#include <cstring>

namespace warden {

AuditLog::AuditLog(const std::string& path) : path_(path) {}

bool AuditLog::record(const SecurityIncident& incident) {
    Json line = {
        {"timestamp", format_timestamp_ms(incident.timestamp_ms)},
        {"id", incident.id},
        {"type", to_string(incident.incident_type)},
        {"severity", to_string(incident.severity)},
        {"source", incident.source_system},
        {"project_id", incident.project_id ? Json(*incident.project_id) : Json(nullptr)},
        {"description", sanitize_utf8(incident.description)}
    };

    std::lock_guard<std::mutex> lock(mutex_);
    if (!append_line(path_, dump_json(line))) {
        LOG_ERROR("[AuditLog] Failed to append %s: %s", path_.c_str(), strerror(errno));
        return false;
    }
    return true;
}

} // namespace warden
