/*
 * warden C++17 - SecurityOrchestrator
 *
 * Owns the three security subsystems and the shared event queue. Every
 * drained event becomes exactly one SecurityIncident, whose response
 * actions run independently of each other; critical incidents also run the
 * emergency protocol. validate_secure_access() is the single gate external
 * callers consult before mutating a project file.
 */
#ifndef warden_SECURITY_ORCHESTRATOR_HPP
#define warden_SECURITY_ORCHESTRATOR_HPP

#include <warden/security/events.hpp>
#include <warden/security/security_config.hpp>
#include <warden/security/path_guard.hpp>
#include <warden/security/boundary_engine.hpp>
#include <warden/security/zero_trust.hpp>
#include <warden/security/incident.hpp>
#include <warden/security/incident_store.hpp>
#include <warden/security/audit_log.hpp>
#include <warden/security/alert_notifier.hpp>

#include <string>
#include <vector>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <functional>
#include <utility>
#include <optional>
#include <cstdint>

namespace warden {

struct SecurityPosture {
    double overall_score;
    double path_protection_score;
    double boundary_enforcement_score;
    double zero_trust_score;
    double incident_response_score;
    int active_threats;
    ComplianceStatus compliance_status;
    std::vector<std::string> recommendations;
    int64_t timestamp_ms;

    SecurityPosture()
        : overall_score(100.0), path_protection_score(100.0)
        , boundary_enforcement_score(100.0), zero_trust_score(100.0)
        , incident_response_score(100.0), active_threats(0)
        , compliance_status(ComplianceStatus::COMPLIANT), timestamp_ms(0) {}
};

Json to_json(const SecurityPosture& posture);

struct SecureAccessResult {
    bool allowed;
    std::string reason;
    std::optional<SecurityIncident> incident;

    SecureAccessResult() : allowed(false) {}
};

struct SecureProjectResult {
    bool success;
    Json security_context;
    std::string error;

    SecureProjectResult() : success(false) {}
};

// >= 95 compliant, >= 85 warning, >= 70 violation, else critical
ComplianceStatus compliance_for(double score);

// Fixed {incident_type, severity} -> response action policy
std::vector<std::string> response_policy(IncidentType type, Severity severity);

// Combines the four subsystem scores into the overall score
using PostureAggregator = std::function<double(const std::vector<double>&)>;

// Plain unweighted mean
double mean_score(const std::vector<double>& scores);

// Egress events: securityIncident, emergencyProtocol, projectQuarantined,
// projectAccessBlocked, networkIsolated, securityPostureUpdated, operationsPaused
using EgressListener = std::function<void(const std::string& kind, const Json& payload)>;

class SecurityOrchestrator {
public:
    explicit SecurityOrchestrator(const SecurityConfig& config);
    ~SecurityOrchestrator();

    SecurityOrchestrator(const SecurityOrchestrator&) = delete;
    SecurityOrchestrator& operator=(const SecurityOrchestrator&) = delete;

    // Open the incident archive and start filesystem monitoring
    bool start();
    void stop();
    bool running() const { return running_.load(); }

    // One scheduler tick: subsystem polls, event dispatch, due posture assessment
    void poll(int64_t now_ms);

    // Turn every queued event into an incident; returns the number handled
    size_t dispatch_pending();

    // ---- ingress ----
    // Throws std::out_of_range for a project that was never isolated
    SecureAccessResult validate_secure_access(const std::string& project_id, Operation operation,
                                              const std::string& target_path);
    SecureProjectResult create_secure_project(const std::string& project_id,
                                              const std::string& project_path,
                                              SecurityLevel level);
    bool remove_project_isolation(const std::string& project_id);

    // ---- posture and reporting ----
    SecurityPosture assess_posture();
    SecurityPosture posture() const;
    void set_posture_aggregator(PostureAggregator aggregator);
    Json export_comprehensive_security_report();
    Json security_status();

    // ---- incidents ----
    std::vector<SecurityIncident> incidents(size_t limit = 100) const;
    std::vector<SecurityIncident> active_incidents() const;
    std::vector<SecurityIncident> critical_incidents() const;
    std::vector<SecurityIncident> resolved_incidents() const;
    std::optional<SecurityIncident> incident(const std::string& incident_id) const;

    // False for an unknown incident; std::logic_error for an illegal transition
    bool contain_incident(const std::string& incident_id);
    bool resolve_incident(const std::string& incident_id);

    // ---- emergency state ----
    bool operations_paused() const { return paused_.load(); }
    void resume_operations();

    void set_listener(EgressListener listener);

    PathGuard& path_guard() { return path_guard_; }
    BoundaryEngine& boundary_engine() { return engine_; }
    ZeroTrustIsolation& zero_trust() { return zero_trust_; }
    EventQueue& events() { return events_; }
    const SecurityConfig& config() const { return config_; }

private:
    struct ActionOutcome {
        bool success;
        std::string detail;

        ActionOutcome() : success(false) {}
        ActionOutcome(bool ok, const std::string& d) : success(ok), detail(d) {}
    };

    void prepare_directories();
    void handle_event(const SecurityEvent& event);
    void escalate_to_zero_trust(const SecurityEvent& event);

    ActionOutcome run_action(const std::string& action, SecurityIncident& incident);
    ActionOutcome quarantine_project(const SecurityIncident& incident);
    ActionOutcome block_access(const SecurityIncident& incident);
    ActionOutcome backup_project_state(const SecurityIncident& incident);
    ActionOutcome forensic_analysis(const SecurityIncident& incident);
    ActionOutcome alert_security_team(const SecurityIncident& incident);
    ActionOutcome isolate_network_access(const SecurityIncident& incident);

    void emergency_protocol(SecurityIncident& incident);
    bool write_evidence_bundle(const SecurityIncident& incident);

    void record_incident(const SecurityIncident& incident);
    void persist_status(const SecurityIncident& incident);
    bool change_status(const std::string& incident_id, IncidentStatus to);

    std::shared_ptr<std::mutex> project_lock(const std::string& project_id);
    std::string project_root_for(const std::string& project_id) const;
    double incident_response_score() const;

    void emit(const std::string& kind, const Json& payload);
    void flush_egress();

    SecurityConfig config_;
    EventQueue events_;
    PathGuard path_guard_;
    BoundaryEngine engine_;
    ZeroTrustIsolation zero_trust_;
    IncidentStore store_;
    AuditLog audit_;
    AlertNotifier notifier_;

    std::atomic<bool> running_;
    std::atomic<bool> paused_;
    int64_t last_posture_ms_;

    std::mutex dispatch_mutex_;

    mutable std::mutex incidents_mutex_;
    std::deque<SecurityIncident> incidents_;

    mutable std::mutex posture_mutex_;
    SecurityPosture posture_;
    PostureAggregator aggregator_;

    std::mutex locks_mutex_;
    std::map<std::string, std::shared_ptr<std::mutex>> project_locks_;

    std::mutex listener_mutex_;
    EgressListener listener_;
    std::vector<std::pair<std::string, Json>> egress_;
};

} // namespace warden

#endif // warden_SECURITY_ORCHESTRATOR_HPP
