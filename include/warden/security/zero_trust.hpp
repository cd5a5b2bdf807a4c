/*
 * warden C++17 - ZeroTrustIsolation
 *
 * One isolation boundary per project. Verification checks run at their
 * declared frequency (continuous checks inline from the access gate, periodic
 * checks from poll(), on-change checks from the activity journal). Failures
 * decay the project's integrity score and, once a check's consecutive-failure
 * threshold is reached, run its failure action. A threat scan matches the
 * threat rule catalog against recent activity.
 */
#ifndef warden_SECURITY_ZERO_TRUST_HPP
#define warden_SECURITY_ZERO_TRUST_HPP

#include <warden/security/events.hpp>
#include <warden/security/security_config.hpp>
#include <warden/security/threat_rules.hpp>
#include <warden/core/rate_limiter.hpp>

#include <string>
#include <vector>
#include <map>
#include <set>
#include <deque>
#include <mutex>
#include <optional>
#include <cstdint>

namespace warden {

class PathGuard;
class BoundaryEngine;

struct EnforcementMechanism {
    std::string mechanism;
    MechanismStrength strength;
    bool monitoring_enabled;
    bool automatic_remediation;
};

struct VerificationCheck {
    std::string check_name;
    CheckFrequency frequency;
    FailureAction failure_action;
    std::vector<std::string> remediation_steps;
    int64_t interval_ms;        // periodic checks only
    int failure_threshold;      // consecutive failures before the action runs
};

struct IsolationMetrics {
    double boundary_integrity_score;
    int breach_attempts;
    int64_t last_verification_ms;
    int verification_failures;

    IsolationMetrics()
        : boundary_integrity_score(100.0), breach_attempts(0)
        , last_verification_ms(0), verification_failures(0) {}
};

struct ProjectIsolationBoundary {
    std::string boundary_id;
    std::string project_id;
    std::string root_path;
    std::string engine_boundary_id;
    SecurityLevel security_level;
    IsolationType boundary_type;
    std::vector<EnforcementMechanism> enforcement_mechanisms;
    std::vector<VerificationCheck> verification_checks;
    IsolationMetrics metrics;
    int64_t created_ms;

    ProjectIsolationBoundary()
        : security_level(SecurityLevel::STANDARD)
        , boundary_type(IsolationType::PHYSICAL)
        , created_ms(0) {}
};

Json to_json(const ProjectIsolationBoundary& b);

struct PendingApproval {
    std::string approval_id;
    std::string project_id;
    std::string rule_id;
    std::string action;
    int64_t requested_ms;
};

// Outcome of a single verification check
enum class CheckResult {
    PASS,
    FAIL,
    INCONCLUSIVE
};

class ZeroTrustIsolation {
public:
    ZeroTrustIsolation(const SecurityConfig& config, PathGuard& path_guard,
                       BoundaryEngine& engine, EventQueue& events);

    // Throws std::invalid_argument for a bad id, a duplicate, or an unsafe root;
    // std::runtime_error if the project directory cannot be prepared
    ProjectIsolationBoundary create_project_isolation(const std::string& project_id,
                                                      const std::string& project_path,
                                                      SecurityLevel level);
    bool remove_project_isolation(const std::string& project_id);

    bool has_project(const std::string& project_id) const;
    std::optional<ProjectIsolationBoundary> isolation(const std::string& project_id) const;
    std::vector<std::string> project_ids() const;
    bool is_quarantined(const std::string& project_id) const;
    bool is_blocked(const std::string& project_id) const;

    // Per-access gate. Throws std::out_of_range for an unknown project.
    bool validate_project_access(const std::string& project_id, Operation operation,
                                 const std::string& target_path);

    // Run one verification check now (periodic context). Returns false on failure.
    bool run_check(const std::string& project_id, const std::string& check_name);

    void quarantine_project(const std::string& project_id, const std::string& reason,
                            bool raise_event = true);
    bool enhance_monitoring(const std::string& project_id);

    // Deny every access until a later clean periodic verification round.
    // False for an unknown or quarantined project.
    bool block_project(const std::string& project_id, const std::string& reason);

    void record_process_activity(const std::string& project_id, const std::string& command);

    // Periodic checks, on-change checks and the threat scan, as they fall due
    void poll(int64_t now_ms);
    void run_threat_scan();

    // ---- approvals ----
    std::vector<PendingApproval> pending_approvals() const;
    bool approve(const std::string& approval_id);
    void authorize(const std::string& project_id, const std::string& action);
    void set_auto_approve(bool enabled);

    Json compliance_report() const;
    double health_score() const;

    static std::vector<EnforcementMechanism> mechanisms_for(SecurityLevel level);
    static std::vector<VerificationCheck> checks_for(SecurityLevel level);

private:
    struct ProcessRecord {
        uint64_t seq;
        int64_t timestamp_ms;
        std::string command;
    };

    struct CheckState {
        int consecutive_failures;
        int64_t first_failure_ms;
        int64_t last_run_ms;

        CheckState() : consecutive_failures(0), first_failure_ms(0), last_run_ms(0) {}
    };

    struct ProjectState {
        ProjectIsolationBoundary boundary;
        std::map<std::string, std::string> content_manifest;  // relative path -> sha256
        std::string config_hash;
        uint64_t integrity_cursor;
        uint64_t change_cursor;
        uint64_t process_cursor;
        std::map<std::string, CheckState> checks;
        std::deque<ProcessRecord> process_activity;
        uint64_t next_process_seq;
        std::set<std::string> authorized_actions;
        bool blocked;
        bool rate_limited;
        bool enhanced;
        bool compromised_reported;
        bool quarantined;

        ProjectState()
            : integrity_cursor(0), change_cursor(0), process_cursor(0), next_process_seq(1)
            , blocked(false), rate_limited(false), enhanced(false)
            , compromised_reported(false), quarantined(false) {}
    };

    struct AccessContext {
        bool inline_access;
        Operation operation;
        std::string target;

        AccessContext() : inline_access(false), operation(Operation::READ) {}
    };

    std::string config_file_path(const ProjectState& state) const;

    CheckResult execute_check(ProjectState& state, const VerificationCheck& check,
                              const AccessContext& ctx, std::string& detail);
    CheckResult check_filesystem_integrity(ProjectState& state, std::string& detail);
    CheckResult check_cross_project_access(ProjectState& state, const AccessContext& ctx, std::string& detail);
    CheckResult check_privilege_escalation(ProjectState& state, const AccessContext& ctx, std::string& detail);
    CheckResult check_configuration_integrity(ProjectState& state, std::string& detail);

    // Runs the check and applies failure accounting; false on failure
    bool verify(ProjectState& state, const VerificationCheck& check, const AccessContext& ctx);
    void apply_failure_action(ProjectState& state, const VerificationCheck& check,
                              const std::string& detail, const AccessContext& ctx);
    void update_compromise(ProjectState& state);

    void run_periodic_checks(ProjectState& state, int64_t now_ms);
    void run_threat_scan_locked();
    void respond_to_threat(ProjectState& state, const ThreatDetectionRule& rule);
    bool execute_action(ProjectState& state, const std::string& action, const std::string& rule_id);
    bool backup_configuration(ProjectState& state);

    void quarantine_locked(ProjectState& state, const std::string& reason, bool raise_event);
    void purge_quarantined_locked();

    SecurityConfig config_;
    PathGuard& path_guard_;
    BoundaryEngine& engine_;
    EventQueue& events_;

    mutable std::mutex mutex_;
    std::map<std::string, ProjectState> projects_;
    std::map<std::string, std::string> quarantined_;
    std::vector<PendingApproval> approvals_;
    bool auto_approve_;
    uint64_t scan_cursor_;
    int64_t last_scan_ms_;
    KeyedRateLimiter limiter_;
};

} // namespace warden

#endif // warden_SECURITY_ZERO_TRUST_HPP
