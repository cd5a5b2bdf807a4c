#include <warden/security/types.hpp>
#include <stdexcept>
#include <utility>

namespace warden {

namespace {

template<typename E, size_t N>
std::string lookup_name(const std::pair<E, const char*> (&table)[N], E value) {
    for (size_t i = 0; i < N; ++i) {
        if (table[i].first == value) return table[i].second;
    }
    return "unknown";
}

template<typename E, size_t N>
E lookup_value(const std::pair<E, const char*> (&table)[N], const std::string& name, const char* what) {
    for (size_t i = 0; i < N; ++i) {
        if (name == table[i].second) return table[i].first;
    }
    throw std::invalid_argument(std::string("invalid ") + what + ": '" + name + "'");
}

const std::pair<Operation, const char*> kOperations[] = {
    {Operation::READ, "read"},
    {Operation::WRITE, "write"},
    {Operation::DELETE, "delete"},
    {Operation::EXECUTE, "execute"},
};

const std::pair<AttackType, const char*> kAttackTypes[] = {
    {AttackType::BASIC_TRAVERSAL, "basic_traversal"},
    {AttackType::ENCODED_TRAVERSAL, "encoded_traversal"},
    {AttackType::UNICODE_TRAVERSAL, "unicode_traversal"},
    {AttackType::SYMLINK_TRAVERSAL, "symlink_traversal"},
    {AttackType::DOUBLE_ENCODING, "double_encoding"},
    {AttackType::NULL_BYTE_INJECTION, "null_byte_injection"},
    {AttackType::WINDOWS_TRAVERSAL, "windows_traversal"},
    {AttackType::MIXED_SEPARATORS, "mixed_separators"},
};

const std::pair<Severity, const char*> kSeverities[] = {
    {Severity::LOW, "low"},
    {Severity::MEDIUM, "medium"},
    {Severity::HIGH, "high"},
    {Severity::CRITICAL, "critical"},
};

const std::pair<RuleAction, const char*> kRuleActions[] = {
    {RuleAction::ALLOW, "allow"},
    {RuleAction::DENY, "deny"},
    {RuleAction::AUDIT, "audit"},
    {RuleAction::QUARANTINE, "quarantine"},
};

const std::pair<EnforcementLevel, const char*> kEnforcementLevels[] = {
    {EnforcementLevel::ADVISORY, "advisory"},
    {EnforcementLevel::BLOCKING, "blocking"},
    {EnforcementLevel::QUARANTINE, "quarantine"},
};

const std::pair<BoundaryType, const char*> kBoundaryTypes[] = {
    {BoundaryType::FRAMEWORK_CORE, "framework_core"},
    {BoundaryType::PROJECT_SANDBOX, "project_sandbox"},
    {BoundaryType::SHARED_RESOURCE, "shared_resource"},
    {BoundaryType::QUARANTINE, "quarantine"},
};

const std::pair<Condition, const char*> kConditions[] = {
    {Condition::ALWAYS, "always"},
    {Condition::WRITE_OPERATION, "write_operation"},
    {Condition::READ_OPERATION, "read_operation"},
    {Condition::DELETE_OPERATION, "delete_operation"},
    {Condition::IS_EXECUTABLE, "is_executable"},
    {Condition::CROSSES_PROJECT_BOUNDARY, "crosses_project_boundary"},
    {Condition::PATH_TRAVERSAL, "path_traversal"},
    {Condition::IS_SYMLINK, "is_symlink"},
    {Condition::FORBIDDEN_PATH, "forbidden_path"},
};

const std::pair<FileOperation, const char*> kFileOperations[] = {
    {FileOperation::CREATE, "create"},
    {FileOperation::MODIFY, "modify"},
    {FileOperation::DELETE, "delete"},
    {FileOperation::EXECUTABLE_CREATION, "executable_creation"},
    {FileOperation::READ, "read"},
};

const std::pair<SecurityLevel, const char*> kSecurityLevels[] = {
    {SecurityLevel::STANDARD, "standard"},
    {SecurityLevel::ENHANCED, "enhanced"},
    {SecurityLevel::MAXIMUM, "maximum"},
};

const std::pair<IsolationType, const char*> kIsolationTypes[] = {
    {IsolationType::PHYSICAL, "physical"},
    {IsolationType::LOGICAL, "logical"},
    {IsolationType::TEMPORAL, "temporal"},
    {IsolationType::CREDENTIAL, "credential"},
};

const std::pair<MechanismStrength, const char*> kStrengths[] = {
    {MechanismStrength::WEAK, "weak"},
    {MechanismStrength::MEDIUM, "medium"},
    {MechanismStrength::STRONG, "strong"},
    {MechanismStrength::CRYPTOGRAPHIC, "cryptographic"},
};

const std::pair<CheckFrequency, const char*> kFrequencies[] = {
    {CheckFrequency::CONTINUOUS, "continuous"},
    {CheckFrequency::PERIODIC, "periodic"},
    {CheckFrequency::ON_ACCESS, "on_access"},
    {CheckFrequency::ON_CHANGE, "on_change"},
};

const std::pair<FailureAction, const char*> kFailureActions[] = {
    {FailureAction::LOG, "log"},
    {FailureAction::ALERT, "alert"},
    {FailureAction::BLOCK, "block"},
    {FailureAction::QUARANTINE, "quarantine"},
};

const std::pair<IncidentType, const char*> kIncidentTypes[] = {
    {IncidentType::BOUNDARY_VIOLATION, "boundary_violation"},
    {IncidentType::PATH_TRAVERSAL_ATTACK, "path_traversal_attack"},
    {IncidentType::PRIVILEGE_ESCALATION, "privilege_escalation"},
    {IncidentType::UNAUTHORIZED_ACCESS, "unauthorized_access"},
    {IncidentType::DATA_EXFILTRATION, "data_exfiltration"},
    {IncidentType::SYSTEM_COMPROMISE, "system_compromise"},
    {IncidentType::POLICY_VIOLATION, "policy_violation"},
};

const std::pair<IncidentStatus, const char*> kIncidentStatuses[] = {
    {IncidentStatus::DETECTED, "detected"},
    {IncidentStatus::INVESTIGATING, "investigating"},
    {IncidentStatus::CONTAINED, "contained"},
    {IncidentStatus::RESOLVED, "resolved"},
    {IncidentStatus::ESCALATED, "escalated"},
};

const std::pair<ComplianceStatus, const char*> kComplianceStatuses[] = {
    {ComplianceStatus::COMPLIANT, "compliant"},
    {ComplianceStatus::WARNING, "warning"},
    {ComplianceStatus::VIOLATION, "violation"},
    {ComplianceStatus::CRITICAL, "critical"},
};

} // anonymous namespace

std::string to_string(Operation v) { return lookup_name(kOperations, v); }
std::string to_string(AttackType v) { return lookup_name(kAttackTypes, v); }
std::string to_string(Severity v) { return lookup_name(kSeverities, v); }
std::string to_string(RuleAction v) { return lookup_name(kRuleActions, v); }
std::string to_string(EnforcementLevel v) { return lookup_name(kEnforcementLevels, v); }
std::string to_string(BoundaryType v) { return lookup_name(kBoundaryTypes, v); }
std::string to_string(Condition v) { return lookup_name(kConditions, v); }
std::string to_string(FileOperation v) { return lookup_name(kFileOperations, v); }
std::string to_string(SecurityLevel v) { return lookup_name(kSecurityLevels, v); }
std::string to_string(IsolationType v) { return lookup_name(kIsolationTypes, v); }
std::string to_string(MechanismStrength v) { return lookup_name(kStrengths, v); }
std::string to_string(CheckFrequency v) { return lookup_name(kFrequencies, v); }
std::string to_string(FailureAction v) { return lookup_name(kFailureActions, v); }
std::string to_string(IncidentType v) { return lookup_name(kIncidentTypes, v); }
std::string to_string(IncidentStatus v) { return lookup_name(kIncidentStatuses, v); }
std::string to_string(ComplianceStatus v) { return lookup_name(kComplianceStatuses, v); }

Operation parse_operation(const std::string& s) {
    return lookup_value(kOperations, s, "operation");
}

AttackType parse_attack_type(const std::string& s) {
    return lookup_value(kAttackTypes, s, "attack type");
}

Severity parse_severity(const std::string& s) {
    return lookup_value(kSeverities, s, "severity");
}

RuleAction parse_rule_action(const std::string& s) {
    return lookup_value(kRuleActions, s, "rule action");
}

EnforcementLevel parse_enforcement_level(const std::string& s) {
    return lookup_value(kEnforcementLevels, s, "enforcement level");
}

BoundaryType parse_boundary_type(const std::string& s) {
    return lookup_value(kBoundaryTypes, s, "boundary type");
}

Condition parse_condition(const std::string& s) {
    return lookup_value(kConditions, s, "condition");
}

SecurityLevel parse_security_level(const std::string& s) {
    return lookup_value(kSecurityLevels, s, "security level");
}

FailureAction parse_failure_action(const std::string& s) {
    return lookup_value(kFailureActions, s, "failure action");
}

IncidentType parse_incident_type(const std::string& s) {
    return lookup_value(kIncidentTypes, s, "incident type");
}

IncidentStatus parse_incident_status(const std::string& s) {
    return lookup_value(kIncidentStatuses, s, "incident status");
}

Severity escalate(Severity s) {
    switch (s) {
        case Severity::LOW: return Severity::MEDIUM;
        case Severity::MEDIUM: return Severity::HIGH;
        default: return Severity::CRITICAL;
    }
}

} // namespace warden
