/*
 * warden C++17 - Threat Rule Catalog
 */
#include <warden/security/threat_rules.hpp>

namespace warden {

const std::vector<ThreatDetectionRule>& default_threat_rules() {
    static const std::vector<ThreatDetectionRule> rules = {
        {
            "cross_project_file_access", "lateral_movement",
            {
                {"file_access", "cross=yes", Severity::HIGH, 0.9}
            },
            {
                {"block_access", 1, true, false},
                {"quarantine_project", 2, false, true}
            }
        },
        {
            "framework_core_write_attempt", "privilege_escalation",
            {
                {"file_access", "op=(create|modify|executable_creation|delete) .*zone=framework_core",
                 Severity::CRITICAL, 0.95}
            },
            {
                {"immediate_block", 1, true, false},
                {"alert_security_team", 1, true, false}
            }
        },
        {
            "configuration_tampering", "configuration_tampering",
            {
                {"file_access", "op=(create|modify|executable_creation|delete) .*path=.*/\\.warden/config/",
                 Severity::HIGH, 0.85}
            },
            {
                {"block_modification", 1, true, false},
                {"backup_configuration", 2, true, false}
            }
        },
        {
            "resource_exhaustion_attack", "resource_exhaustion",
            {
                {"activity_rate", "create:200", Severity::MEDIUM, 0.8}
            },
            {
                {"rate_limit", 1, true, false},
                {"resource_monitoring", 2, true, false}
            }
        },
        {
            "privilege_escalation_commands", "privilege_escalation",
            {
                {"process_behavior", "(^|[\\s/;|&])(sudo|su|pkexec|doas|setcap|chown|passwd|visudo)(\\s|$)",
                 Severity::CRITICAL, 0.9}
            },
            {
                {"alert_security_team", 1, true, false},
                {"quarantine_project", 2, false, true}
            }
        },
    };
    return rules;
}

Json to_json(const ThreatDetectionRule& rule) {
    Json patterns = Json::array();
    for (const auto& p : rule.detection_patterns) {
        patterns.push_back({
            {"pattern_type", p.pattern_type},
            {"pattern", p.pattern},
            {"severity", to_string(p.severity)},
            {"confidence", p.confidence}
        });
    }
    Json actions = Json::array();
    for (const auto& a : rule.response_actions) {
        actions.push_back({
            {"action", a.action},
            {"priority", a.priority},
            {"automatic", a.automatic},
            {"requires_approval", a.requires_approval}
        });
    }
    return Json{
        {"rule_id", rule.rule_id},
        {"threat_category", rule.threat_category},
        {"detection_patterns", patterns},
        {"response_actions", actions}
    };
}

} // namespace warden
