/*
 * warden C++17 - Security records
 *
 * Value types produced by PathGuard and BoundaryEngine and carried by events.
 */
#ifndef warden_SECURITY_RECORDS_HPP
#define warden_SECURITY_RECORDS_HPP

#include <warden/core/json.hpp>
#include <warden/security/types.hpp>

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace warden {

// Result of validating one path. Deterministic for a given input and
// filesystem state: it carries no id or timestamp.
struct SafePath {
    std::string original_path;
    std::string sanitized_path;
    bool is_safe;
    std::vector<std::string> violations;
    std::string recommended_path;
    std::optional<AttackType> attack_type;
    Severity severity;
    bool blocked;

    SafePath() : is_safe(false), severity(Severity::LOW), blocked(false) {}

    bool operator==(const SafePath& other) const {
        return original_path == other.original_path &&
               sanitized_path == other.sanitized_path &&
               is_safe == other.is_safe &&
               violations == other.violations &&
               recommended_path == other.recommended_path &&
               attack_type == other.attack_type &&
               severity == other.severity &&
               blocked == other.blocked;
    }
    bool operator!=(const SafePath& other) const { return !(*this == other); }
};

// Recorded for every unsafe validation. attack_type is empty when the path
// was rejected only for leaving its allowed roots or touching a protected path.
struct PathTraversalAttempt {
    std::string id;
    int64_t timestamp_ms;
    std::optional<AttackType> attack_type;
    std::string original_path;
    std::string normalized_path;
    std::string intended_target;
    Severity severity;
    bool blocked;
    std::optional<std::string> project_id;
    Json evidence;

    PathTraversalAttempt()
        : timestamp_ms(0)
        , severity(Severity::MEDIUM)
        , blocked(true)
        , evidence(Json::object()) {}
};

struct BoundaryRule {
    std::string rule_id;
    std::string source_pattern;
    std::string target_pattern;
    RuleAction action;
    EnforcementLevel enforcement_level;
    std::vector<Condition> conditions;
    bool enabled;
    int priority;

    BoundaryRule()
        : action(RuleAction::AUDIT)
        , enforcement_level(EnforcementLevel::ADVISORY)
        , enabled(true)
        , priority(100) {}

    BoundaryRule(const std::string& id, const std::string& source, const std::string& target,
                 RuleAction act, EnforcementLevel level,
                 std::vector<Condition> conds, int prio, bool on = true)
        : rule_id(id)
        , source_pattern(source)
        , target_pattern(target)
        , action(act)
        , enforcement_level(level)
        , conditions(std::move(conds))
        , enabled(on)
        , priority(prio) {}
};

struct BoundaryViolation {
    std::string id;
    int64_t timestamp_ms;
    std::string violation_type;
    std::string source_path;
    std::string target_path;
    std::optional<std::string> project_id;
    Severity severity;
    bool blocked;
    std::string remediation_action;
    std::string boundary_id;
    std::string rule_id;
    RuleAction action;
    EnforcementLevel enforcement_level;
    Json evidence;

    BoundaryViolation()
        : timestamp_ms(0)
        , severity(Severity::MEDIUM)
        , blocked(false)
        , action(RuleAction::DENY)
        , enforcement_level(EnforcementLevel::BLOCKING)
        , evidence(Json::object()) {}
};

Json to_json(const SafePath& p);
Json to_json(const PathTraversalAttempt& a);
Json to_json(const BoundaryRule& r);
Json to_json(const BoundaryViolation& v);

} // namespace warden

#endif // warden_SECURITY_RECORDS_HPP
