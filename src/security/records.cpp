#include <warden/security/records.hpp>
#include <warden/core/utils.hpp>

namespace warden {

Json to_json(const SafePath& p) {
    Json j;
    j["original_path"] = sanitize_utf8(p.original_path);
    j["sanitized_path"] = sanitize_utf8(p.sanitized_path);
    j["is_safe"] = p.is_safe;
    Json violations = Json::array();
    for (const auto& v : p.violations) {
        violations.push_back(sanitize_utf8(v));
    }
    j["violations"] = violations;
    j["recommended_path"] = sanitize_utf8(p.recommended_path);
    j["attack_type"] = p.attack_type ? Json(to_string(*p.attack_type)) : Json();
    j["severity"] = to_string(p.severity);
    j["blocked"] = p.blocked;
    return j;
}

Json to_json(const PathTraversalAttempt& a) {
    Json j;
    j["id"] = a.id;
    j["timestamp"] = format_timestamp_ms(a.timestamp_ms);
    j["attack_type"] = a.attack_type ? Json(to_string(*a.attack_type)) : Json();
    j["original_path"] = sanitize_utf8(a.original_path);
    j["normalized_path"] = sanitize_utf8(a.normalized_path);
    j["intended_target"] = a.intended_target;
    j["severity"] = to_string(a.severity);
    j["blocked"] = a.blocked;
    j["project_id"] = a.project_id ? Json(*a.project_id) : Json();
    j["evidence"] = a.evidence;
    return j;
}

Json to_json(const BoundaryRule& r) {
    Json conditions = Json::array();
    for (auto c : r.conditions) {
        conditions.push_back(to_string(c));
    }
    return Json{
        {"rule_id", r.rule_id},
        {"source_pattern", r.source_pattern},
        {"target_pattern", r.target_pattern},
        {"action", to_string(r.action)},
        {"enforcement_level", to_string(r.enforcement_level)},
        {"conditions", conditions},
        {"enabled", r.enabled},
        {"priority", r.priority}
    };
}

Json to_json(const BoundaryViolation& v) {
    Json j;
    j["id"] = v.id;
    j["timestamp"] = format_timestamp_ms(v.timestamp_ms);
    j["violation_type"] = v.violation_type;
    j["source_path"] = sanitize_utf8(v.source_path);
    j["target_path"] = sanitize_utf8(v.target_path);
    j["project_id"] = v.project_id ? Json(*v.project_id) : Json();
    j["severity"] = to_string(v.severity);
    j["blocked"] = v.blocked;
    j["remediation_action"] = v.remediation_action;
    j["boundary_id"] = v.boundary_id;
    j["rule_id"] = v.rule_id;
    j["action"] = to_string(v.action);
    j["enforcement_level"] = to_string(v.enforcement_level);
    j["evidence"] = v.evidence;
    return j;
}

} // namespace warden
