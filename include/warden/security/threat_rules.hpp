/*
 * warden C++17 - Threat detection rules
 *
 * Static catalog evaluated by ZeroTrustIsolation against each project's
 * recent activity. Pattern types:
 *   file_access       regex over ActivityRecord::descriptor()
 *   activity_rate     "<operation>:<count>" within one scan cycle
 *   process_behavior  regex over recorded process command lines
 */
#ifndef warden_SECURITY_THREAT_RULES_HPP
#define warden_SECURITY_THREAT_RULES_HPP

#include <warden/core/json.hpp>
#include <warden/security/types.hpp>

#include <string>
#include <vector>

namespace warden {

struct DetectionPattern {
    std::string pattern_type;
    std::string pattern;
    Severity severity;
    double confidence;
};

struct ResponseAction {
    std::string action;
    int priority;
    bool automatic;
    bool requires_approval;
};

struct ThreatDetectionRule {
    std::string rule_id;
    std::string threat_category;
    std::vector<DetectionPattern> detection_patterns;
    std::vector<ResponseAction> response_actions;
};

const std::vector<ThreatDetectionRule>& default_threat_rules();

Json to_json(const ThreatDetectionRule& rule);

} // namespace warden

#endif // warden_SECURITY_THREAT_RULES_HPP
