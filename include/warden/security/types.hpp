/*
 * warden C++17 - Security enumerations
 *
 * Closed vocabularies shared by all subsystems. Each enum has a to_string()
 * rendering (the wire/audit spelling) and a parse_*() that throws
 * std::invalid_argument on an unknown spelling.
 */
#ifndef warden_SECURITY_TYPES_HPP
#define warden_SECURITY_TYPES_HPP

#include <string>

namespace warden {

enum class Operation {
    READ,
    WRITE,
    DELETE,
    EXECUTE
};

enum class AttackType {
    BASIC_TRAVERSAL,
    ENCODED_TRAVERSAL,
    UNICODE_TRAVERSAL,
    SYMLINK_TRAVERSAL,
    DOUBLE_ENCODING,
    NULL_BYTE_INJECTION,
    WINDOWS_TRAVERSAL,
    MIXED_SEPARATORS
};

enum class Severity {
    LOW = 0,
    MEDIUM = 1,
    HIGH = 2,
    CRITICAL = 3
};

enum class RuleAction {
    ALLOW,
    DENY,
    AUDIT,
    QUARANTINE
};

enum class EnforcementLevel {
    ADVISORY,
    BLOCKING,
    QUARANTINE
};

enum class BoundaryType {
    FRAMEWORK_CORE,
    PROJECT_SANDBOX,
    SHARED_RESOURCE,
    QUARANTINE
};

// Rule predicates; a rule matches only if every listed condition holds
enum class Condition {
    ALWAYS,
    WRITE_OPERATION,
    READ_OPERATION,
    DELETE_OPERATION,
    IS_EXECUTABLE,
    CROSSES_PROJECT_BOUNDARY,
    PATH_TRAVERSAL,
    IS_SYMLINK,
    FORBIDDEN_PATH
};

enum class FileOperation {
    CREATE,
    MODIFY,
    DELETE,
    EXECUTABLE_CREATION,
    READ
};

enum class SecurityLevel {
    STANDARD,
    ENHANCED,
    MAXIMUM
};

enum class IsolationType {
    PHYSICAL,
    LOGICAL,
    TEMPORAL,
    CREDENTIAL
};

enum class MechanismStrength {
    WEAK,
    MEDIUM,
    STRONG,
    CRYPTOGRAPHIC
};

enum class CheckFrequency {
    CONTINUOUS,
    PERIODIC,
    ON_ACCESS,
    ON_CHANGE
};

enum class FailureAction {
    LOG,
    ALERT,
    BLOCK,
    QUARANTINE
};

enum class IncidentType {
    BOUNDARY_VIOLATION,
    PATH_TRAVERSAL_ATTACK,
    PRIVILEGE_ESCALATION,
    UNAUTHORIZED_ACCESS,
    DATA_EXFILTRATION,
    SYSTEM_COMPROMISE,
    POLICY_VIOLATION
};

enum class IncidentStatus {
    DETECTED,
    INVESTIGATING,
    CONTAINED,
    RESOLVED,
    ESCALATED
};

enum class ComplianceStatus {
    COMPLIANT,
    WARNING,
    VIOLATION,
    CRITICAL
};

std::string to_string(Operation v);
std::string to_string(AttackType v);
std::string to_string(Severity v);
std::string to_string(RuleAction v);
std::string to_string(EnforcementLevel v);
std::string to_string(BoundaryType v);
std::string to_string(Condition v);
std::string to_string(FileOperation v);
std::string to_string(SecurityLevel v);
std::string to_string(IsolationType v);
std::string to_string(MechanismStrength v);
std::string to_string(CheckFrequency v);
std::string to_string(FailureAction v);
std::string to_string(IncidentType v);
std::string to_string(IncidentStatus v);
std::string to_string(ComplianceStatus v);

Operation parse_operation(const std::string& s);
AttackType parse_attack_type(const std::string& s);
Severity parse_severity(const std::string& s);
RuleAction parse_rule_action(const std::string& s);
EnforcementLevel parse_enforcement_level(const std::string& s);
BoundaryType parse_boundary_type(const std::string& s);
Condition parse_condition(const std::string& s);
SecurityLevel parse_security_level(const std::string& s);
FailureAction parse_failure_action(const std::string& s);
IncidentType parse_incident_type(const std::string& s);
IncidentStatus parse_incident_status(const std::string& s);

// One level up, saturating at CRITICAL
Severity escalate(Severity s);

inline bool is_write_like(Operation op) {
    return op == Operation::WRITE || op == Operation::EXECUTE;
}

} // namespace warden

#endif // warden_SECURITY_TYPES_HPP
