/*
 * warden C++17 - SecurityOrchestrator Implementation
 */
#include <warden/security/orchestrator.hpp>
#include <warden/core/logger.hpp>
#include <warden/core/utils.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <unistd.h>

namespace warden {

// ============================================================================
// Policy
// ============================================================================

ComplianceStatus compliance_for(double score) {
    if (score >= 95.0) return ComplianceStatus::COMPLIANT;
    if (score >= 85.0) return ComplianceStatus::WARNING;
    if (score >= 70.0) return ComplianceStatus::VIOLATION;
    return ComplianceStatus::CRITICAL;
}

std::vector<std::string> response_policy(IncidentType type, Severity severity) {
    std::vector<std::string> actions;
    actions.push_back("alert_security_team");

    switch (severity) {
        case Severity::CRITICAL:
            actions.push_back("quarantine_project");
            actions.push_back("backup_project_state");
            actions.push_back("forensic_analysis");
            break;
        case Severity::HIGH:
            actions.push_back("block_access");
            actions.push_back("enhance_monitoring");
            actions.push_back("backup_project_state");
            break;
        case Severity::MEDIUM:
            actions.push_back("enhance_monitoring");
            break;
        case Severity::LOW:
            break;
    }

    if (type == IncidentType::PATH_TRAVERSAL_ATTACK) {
        actions.push_back("isolate_network_access");
    }
    return actions;
}

double mean_score(const std::vector<double>& scores) {
    if (scores.empty()) return 100.0;
    double sum = 0.0;
    for (double s : scores) sum += s;
    return sum / static_cast<double>(scores.size());
}

Json to_json(const SecurityPosture& posture) {
    return Json{
        {"overall_score", posture.overall_score},
        {"subsystem_scores", {
            {"path_protection", posture.path_protection_score},
            {"boundary_enforcement", posture.boundary_enforcement_score},
            {"zero_trust", posture.zero_trust_score},
            {"incident_response", posture.incident_response_score}
        }},
        {"active_threats", posture.active_threats},
        {"compliance_status", to_string(posture.compliance_status)},
        {"recommendations", posture.recommendations},
        {"timestamp", format_timestamp_ms(posture.timestamp_ms)}
    };
}

// ============================================================================
// Event -> incident mapping
// ============================================================================

namespace {

std::string fixed1(double value) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%.1f", value);
    return buf;
}

struct IncidentDraft {
    IncidentType type;
    Severity severity;
    std::string source;
    std::optional<std::string> project_id;
    std::string description;
};

IncidentType incident_type_for_threat(const std::string& category) {
    if (category == "lateral_movement") return IncidentType::BOUNDARY_VIOLATION;
    if (category == "privilege_escalation") return IncidentType::PRIVILEGE_ESCALATION;
    if (category == "data_exfiltration") return IncidentType::DATA_EXFILTRATION;
    if (category == "persistence" || category == "code_injection") return IncidentType::SYSTEM_COMPROMISE;
    return IncidentType::POLICY_VIOLATION;
}

struct DraftVisitor {
    IncidentDraft operator()(const TraversalAttemptEvent& e) const {
        const PathTraversalAttempt& a = e.attempt;
        std::string kind = a.attack_type ? to_string(*a.attack_type) : "unclassified";
        return IncidentDraft{
            IncidentType::PATH_TRAVERSAL_ATTACK, a.severity, "path_protection", a.project_id,
            "Path traversal attack (" + kind + ") against '" + a.original_path +
                "' targeting " + a.intended_target
        };
    }
    IncidentDraft operator()(const UnsafePathEvent& e) const {
        std::string why = e.result.violations.empty() ? "" : ": " + e.result.violations.front();
        return IncidentDraft{
            IncidentType::UNAUTHORIZED_ACCESS, Severity::MEDIUM, "path_protection", e.project_id,
            "Unsafe " + to_string(e.operation) + " path '" + e.result.original_path + "' rejected" + why
        };
    }
    IncidentDraft operator()(const ViolationDetectedEvent& e) const {
        const BoundaryViolation& v = e.violation;
        return IncidentDraft{
            IncidentType::BOUNDARY_VIOLATION, v.severity, "boundary_enforcement", v.project_id,
            "Boundary violation (" + v.violation_type + ") on " + v.target_path +
                " in " + v.boundary_id + " (rule " + v.rule_id + ")"
        };
    }
    IncidentDraft operator()(const IntegrityViolationEvent& e) const {
        return IncidentDraft{
            IncidentType::SYSTEM_COMPROMISE, Severity::CRITICAL, "boundary_enforcement", e.project_id,
            "Integrity violation in boundary " + e.boundary_id +
                ": content changed without recorded activity"
        };
    }
    IncidentDraft operator()(const ThreatDetectedEvent& e) const {
        return IncidentDraft{
            incident_type_for_threat(e.threat_category), e.severity, "zero_trust", e.project_id,
            "Threat detected by rule " + e.rule_id + " (" + e.threat_category +
                ", confidence " + fixed1(e.confidence * 100.0) + "%)"
        };
    }
    IncidentDraft operator()(const BoundaryCompromisedEvent& e) const {
        return IncidentDraft{
            IncidentType::SYSTEM_COMPROMISE, Severity::CRITICAL, "zero_trust", e.project_id,
            "Isolation boundary " + e.boundary_id + " compromised (integrity score " +
                fixed1(e.integrity_score) + ")"
        };
    }
    IncidentDraft operator()(const ProjectQuarantinedEvent& e) const {
        return IncidentDraft{
            IncidentType::SYSTEM_COMPROMISE, Severity::CRITICAL, "zero_trust", e.project_id,
            "Project " + e.project_id + " quarantined: " + e.reason
        };
    }
    IncidentDraft operator()(const SecurityAlertEvent& e) const {
        return IncidentDraft{
            IncidentType::POLICY_VIOLATION, e.severity, e.source,
            e.project_id.empty() ? std::optional<std::string>() : std::optional<std::string>(e.project_id),
            "Security alert from " + e.source + ": " + e.message
        };
    }
    IncidentDraft operator()(const UnauthorizedAccessEvent& e) const {
        return IncidentDraft{
            IncidentType::UNAUTHORIZED_ACCESS, Severity::HIGH, "zero_trust", e.project_id,
            "Unauthorized " + to_string(e.operation) + " of " + e.target_path + " denied: " + e.reason
        };
    }
};

Json process_snapshot() {
    Json snap;
    snap["pid"] = static_cast<int64_t>(getpid());
    snap["ppid"] = static_cast<int64_t>(getppid());
    snap["uid"] = static_cast<int64_t>(getuid());
    snap["cwd"] = sanitize_utf8(current_directory());

    std::string status;
    if (read_file("/proc/self/status", status)) {
        for (const auto& line : split(status, '\n')) {
            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;
            std::string key = line.substr(0, colon);
            if (key == "Name" || key == "State" || key == "VmRSS" || key == "VmSize" || key == "Threads") {
                snap[to_lower(key)] = trim(line.substr(colon + 1));
            }
        }
    }

    std::string cmdline;
    if (read_file("/proc/self/cmdline", cmdline)) {
        std::replace(cmdline.begin(), cmdline.end(), '\0', ' ');
        snap["cmdline"] = sanitize_utf8(trim(cmdline));
    }
    return snap;
}

bool is_active(const SecurityIncident& incident) {
    return incident.status == IncidentStatus::DETECTED ||
           incident.status == IncidentStatus::INVESTIGATING ||
           incident.status == IncidentStatus::ESCALATED;
}

} // anonymous namespace

// ============================================================================
// Lifecycle
// ============================================================================

SecurityOrchestrator::SecurityOrchestrator(const SecurityConfig& config)
    : config_(config)
    , path_guard_(config_, events_)
    , engine_(config_, path_guard_, events_)
    , zero_trust_(config_, path_guard_, engine_, events_)
    , audit_(config_.audit_log_path())
    , notifier_(config_.alert_webhook_url, config_.alert_timeout_seconds)
    , running_(false)
    , paused_(false)
    , last_posture_ms_(0)
    , aggregator_(mean_score)
{
    prepare_directories();
}

SecurityOrchestrator::~SecurityOrchestrator() {
    if (running_.load()) {
        stop();
    }
}

void SecurityOrchestrator::prepare_directories() {
    const std::string dirs[] = {
        config_.security_dir(),
        config_.forensics_dir(),
        config_.evidence_dir(),
        config_.backups_dir()
    };
    for (const auto& dir : dirs) {
        if (!ensure_directory(dir, 0700)) {
            LOG_ERROR("[Orchestrator] Cannot create %s: %s", dir.c_str(), strerror(errno));
        }
    }
}

bool SecurityOrchestrator::start() {
    if (running_.load()) return true;

    prepare_directories();
    if (!store_.open(config_.incident_db_path())) {
        LOG_WARN("[Orchestrator] Incident archive unavailable, incidents kept in memory only");
    }

    bool monitoring = engine_.start();
    if (!monitoring) {
        LOG_ERROR("[Orchestrator] Filesystem monitoring failed to start");
    }

    running_ = true;
    last_posture_ms_ = 0;
    assess_posture();
    LOG_INFO("[Orchestrator] Security orchestrator started (home: %s)", config_.home_dir.c_str());
    return monitoring;
}

void SecurityOrchestrator::stop() {
    if (!running_.exchange(false)) return;
    engine_.stop();
    dispatch_pending();
    store_.close();
    LOG_INFO("[Orchestrator] Security orchestrator stopped");
}

void SecurityOrchestrator::poll(int64_t now_ms) {
    engine_.poll(now_ms);
    zero_trust_.poll(now_ms);
    dispatch_pending();

    if (last_posture_ms_ == 0 || now_ms - last_posture_ms_ >= config_.posture_interval_ms) {
        last_posture_ms_ = now_ms;
        assess_posture();
    }
}

void SecurityOrchestrator::set_listener(EgressListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

// Queued until flush_egress(); the listener never runs under dispatch_mutex_
void SecurityOrchestrator::emit(const std::string& kind, const Json& payload) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    if (!listener_) return;
    egress_.push_back(std::make_pair(kind, payload));
}

void SecurityOrchestrator::flush_egress() {
    EgressListener listener;
    std::vector<std::pair<std::string, Json>> pending;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
        pending.swap(egress_);
    }
    if (!listener) return;
    for (const auto& item : pending) {
        try {
            listener(item.first, item.second);
        } catch (const std::exception& e) {
            LOG_ERROR("[Orchestrator] Listener failed on %s: %s", item.first.c_str(), e.what());
        }
    }
}

// ============================================================================
// Dispatch
// ============================================================================

size_t SecurityOrchestrator::dispatch_pending() {
    size_t handled = 0;
    {
        std::lock_guard<std::mutex> lock(dispatch_mutex_);

        // Response actions may raise follow-up events; bound the cascade per tick
        for (int round = 0; round < 8; ++round) {
            std::vector<SecurityEvent> batch = events_.drain();
            if (batch.empty()) break;
            for (const auto& event : batch) {
                handle_event(event);
                ++handled;
            }
        }
    }
    flush_egress();
    return handled;
}

void SecurityOrchestrator::escalate_to_zero_trust(const SecurityEvent& event) {
    std::optional<std::string> project;

    if (const auto* v = std::get_if<ViolationDetectedEvent>(&event.payload)) {
        if (v->violation.severity >= Severity::HIGH) {
            project = v->violation.project_id;
        }
    } else if (const auto* t = std::get_if<TraversalAttemptEvent>(&event.payload)) {
        const auto& type = t->attempt.attack_type;
        if (type && (*type == AttackType::DOUBLE_ENCODING ||
                     *type == AttackType::UNICODE_TRAVERSAL ||
                     *type == AttackType::SYMLINK_TRAVERSAL)) {
            project = t->attempt.project_id;
        }
    }

    if (project && zero_trust_.enhance_monitoring(*project)) {
        LOG_DEBUG("[Orchestrator] Escalated monitoring for %s after %s",
                  project->c_str(), event_kind(event.payload).c_str());
    }
}

void SecurityOrchestrator::handle_event(const SecurityEvent& event) {
    escalate_to_zero_trust(event);

    IncidentDraft draft = std::visit(DraftVisitor(), event.payload);

    SecurityIncident incident;
    incident.id = make_record_id("incident");
    incident.timestamp_ms = current_timestamp_ms();
    incident.incident_type = draft.type;
    incident.severity = draft.severity;
    incident.source_system = draft.source;
    incident.project_id = draft.project_id;
    incident.description = draft.description;
    incident.evidence["trigger_event"] = to_json(event);
    incident.response_actions = response_policy(draft.type, draft.severity);
    incident.trigger_event_id = event.id;

    LOG_WARN("[Orchestrator] Incident %s: %s [%s] %s",
             incident.id.c_str(), to_string(incident.incident_type).c_str(),
             to_string(incident.severity).c_str(), incident.description.c_str());

    // Observability first: the audit line and archive row do not depend on remediation
    if (!audit_.record(incident)) {
        incident.evidence["audit_log"] = "append failed";
    }
    if (store_.is_open() && !store_.insert(incident)) {
        LOG_ERROR("[Orchestrator] Failed to archive incident %s", incident.id.c_str());
    }
    emit("securityIncident", to_json(incident));

    // Quarantined by zero trust itself; the response action below finds it already done
    if (const auto* q = std::get_if<ProjectQuarantinedEvent>(&event.payload)) {
        emit("projectQuarantined", Json{
            {"project_id", q->project_id},
            {"incident_id", incident.id},
            {"reason", sanitize_utf8(q->reason)}
        });
    }

    Json results = Json::array();
    bool blocked = false;
    for (const auto& action : incident.response_actions) {
        ActionOutcome outcome;
        try {
            outcome = run_action(action, incident);
        } catch (const std::exception& e) {
            outcome = ActionOutcome(false, std::string("exception: ") + e.what());
        }
        if (!outcome.success) {
            LOG_WARN("[Orchestrator] Response action %s failed for %s: %s",
                     action.c_str(), incident.id.c_str(), outcome.detail.c_str());
        }
        if (action == "block_access" && outcome.success) {
            blocked = true;
        }
        results.push_back({
            {"action", action},
            {"success", outcome.success},
            {"detail", sanitize_utf8(outcome.detail)}
        });
    }
    incident.evidence["response_results"] = results;

    transition(incident, IncidentStatus::INVESTIGATING);
    if (incident.severity == Severity::CRITICAL) {
        emergency_protocol(incident);
    } else if (incident.severity == Severity::HIGH && blocked) {
        transition(incident, IncidentStatus::CONTAINED);
    }

    persist_status(incident);
    record_incident(incident);
}

// ============================================================================
// Response actions
// ============================================================================

SecurityOrchestrator::ActionOutcome SecurityOrchestrator::run_action(const std::string& action,
                                                                     SecurityIncident& incident) {
    if (action == "alert_security_team") return alert_security_team(incident);
    if (action == "quarantine_project") return quarantine_project(incident);
    if (action == "block_access") return block_access(incident);
    if (action == "backup_project_state") return backup_project_state(incident);
    if (action == "forensic_analysis") return forensic_analysis(incident);
    if (action == "isolate_network_access") return isolate_network_access(incident);
    if (action == "enhance_monitoring") {
        if (!incident.project_id) return ActionOutcome(false, "no project implicated");
        if (zero_trust_.enhance_monitoring(*incident.project_id)) {
            return ActionOutcome(true, "monitoring enhanced");
        }
        return ActionOutcome(false, "project not under isolation");
    }
    return ActionOutcome(false, "unknown response action");
}

SecurityOrchestrator::ActionOutcome SecurityOrchestrator::quarantine_project(const SecurityIncident& incident) {
    if (!incident.project_id) return ActionOutcome(false, "no project implicated");
    const std::string& id = *incident.project_id;

    auto lock = project_lock(id);
    std::lock_guard<std::mutex> guard(*lock);

    if (zero_trust_.is_quarantined(id)) {
        return ActionOutcome(true, "project already quarantined");
    }
    if (!zero_trust_.has_project(id)) {
        return ActionOutcome(false, "project not under isolation");
    }

    zero_trust_.quarantine_project(id, "incident " + incident.id + ": " + incident.description, false);
    emit("projectQuarantined", Json{
        {"project_id", id},
        {"incident_id", incident.id},
        {"reason", sanitize_utf8(incident.description)}
    });
    return ActionOutcome(true, "project quarantined");
}

SecurityOrchestrator::ActionOutcome SecurityOrchestrator::block_access(const SecurityIncident& incident) {
    if (!incident.project_id) return ActionOutcome(false, "no project implicated");
    const std::string& id = *incident.project_id;

    if (!zero_trust_.block_project(id, "incident " + incident.id)) {
        return ActionOutcome(false, "project not under isolation");
    }
    emit("projectAccessBlocked", Json{
        {"project_id", id},
        {"incident_id", incident.id},
        {"reason", sanitize_utf8(incident.description)}
    });
    return ActionOutcome(true, "project access blocked");
}

SecurityOrchestrator::ActionOutcome SecurityOrchestrator::backup_project_state(const SecurityIncident& incident) {
    if (!incident.project_id) return ActionOutcome(false, "no project implicated");
    const std::string& id = *incident.project_id;

    std::string root = project_root_for(id);
    if (!is_directory(root)) {
        return ActionOutcome(false, "project root missing: " + root);
    }

    auto lock = project_lock(id);
    std::lock_guard<std::mutex> guard(*lock);

    std::string dest = join_path(join_path(config_.backups_dir(), id),
                                 compact_timestamp_ms(current_timestamp_ms()));
    if (file_exists(dest)) {
        dest += "-" + random_hex(2);
    }
    if (!copy_tree(root, dest)) {
        LOG_ERROR("[Orchestrator] Backup of %s to %s failed: %s", root.c_str(), dest.c_str(), strerror(errno));
        return ActionOutcome(false, "backup failed: " + dest);
    }
    LOG_INFO("[Orchestrator] Backed up project %s to %s", id.c_str(), dest.c_str());
    return ActionOutcome(true, dest);
}

SecurityOrchestrator::ActionOutcome SecurityOrchestrator::forensic_analysis(const SecurityIncident& incident) {
    Json report;
    report["incident"] = to_json(incident);
    report["process"] = process_snapshot();
    report["collected_at"] = format_timestamp_ms(current_timestamp_ms());

    if (incident.project_id) {
        const std::string& id = *incident.project_id;
        Json attempts = Json::array();
        for (const auto& a : path_guard_.attempts_for_project(id)) {
            attempts.push_back(to_json(a));
        }
        Json violations = Json::array();
        for (const auto& v : engine_.violations(std::nullopt, std::nullopt, 1000)) {
            if (v.project_id && *v.project_id == id) {
                violations.push_back(to_json(v));
                if (violations.size() >= 50) break;
            }
        }
        report["traversal_attempts"] = attempts;
        report["boundary_violations"] = violations;

        auto isolation = zero_trust_.isolation(id);
        report["isolation"] = isolation ? to_json(*isolation) : Json(nullptr);
    }

    std::string path = join_path(config_.forensics_dir(), incident.id + ".json");
    if (!write_file(path, dump_json(report, 2))) {
        LOG_ERROR("[Orchestrator] Cannot write forensic report %s: %s", path.c_str(), strerror(errno));
        return ActionOutcome(false, "cannot write " + path);
    }
    return ActionOutcome(true, path);
}

SecurityOrchestrator::ActionOutcome SecurityOrchestrator::alert_security_team(const SecurityIncident& incident) {
    std::string urgency = "normal";
    if (incident.severity == Severity::CRITICAL) {
        urgency = "emergency";
    } else if (incident.severity == Severity::HIGH) {
        urgency = "high";
    }

    if (!notifier_.enabled()) {
        LOG_WARN("[Orchestrator] SECURITY ALERT (%s) %s: %s",
                 urgency.c_str(), incident.id.c_str(), incident.description.c_str());
        return ActionOutcome(true, "alert logged, no webhook configured");
    }

    std::string error;
    if (!notifier_.send(incident, urgency, error)) {
        return ActionOutcome(false, error);
    }
    return ActionOutcome(true, "alert delivered");
}

SecurityOrchestrator::ActionOutcome SecurityOrchestrator::isolate_network_access(const SecurityIncident& incident) {
    emit("networkIsolated", Json{
        {"project_id", incident.project_id ? Json(*incident.project_id) : Json(nullptr)},
        {"incident_id", incident.id}
    });
    LOG_WARN("[Orchestrator] Network isolation requested for %s",
             incident.project_id ? incident.project_id->c_str() : "(no project)");
    return ActionOutcome(true, "network isolation requested");
}

// ============================================================================
// Emergency protocol
// ============================================================================

void SecurityOrchestrator::emergency_protocol(SecurityIncident& incident) {
    LOG_ERROR("[Orchestrator] EMERGENCY PROTOCOL for incident %s: %s",
              incident.id.c_str(), incident.description.c_str());

    Json steps = Json::object();

    if (!paused_.exchange(true)) {
        emit("operationsPaused", Json{
            {"incident_id", incident.id},
            {"reason", sanitize_utf8(incident.description)}
        });
    }
    steps["operations_paused"] = true;

    if (incident.project_id) {
        ActionOutcome q;
        try {
            q = quarantine_project(incident);
        } catch (const std::exception& e) {
            q = ActionOutcome(false, std::string("exception: ") + e.what());
        }
        steps["quarantine"] = {{"success", q.success}, {"detail", q.detail}};
    }

    steps["evidence_preserved"] = write_evidence_bundle(incident);

    ActionOutcome alert = alert_security_team(incident);
    steps["alert"] = {{"success", alert.success}, {"detail", alert.detail}};

    incident.evidence["emergency_protocol"] = steps;
    transition(incident, IncidentStatus::ESCALATED);

    emit("emergencyProtocol", Json{
        {"incident_id", incident.id},
        {"project_id", incident.project_id ? Json(*incident.project_id) : Json(nullptr)},
        {"steps", steps}
    });
}

bool SecurityOrchestrator::write_evidence_bundle(const SecurityIncident& incident) {
    std::string path = join_path(config_.evidence_dir(), incident.id + ".json");
    if (file_exists(path)) {
        return true;
    }

    Json recent = Json::array();
    {
        std::lock_guard<std::mutex> lock(incidents_mutex_);
        size_t start = incidents_.size() > 50 ? incidents_.size() - 50 : 0;
        for (size_t i = start; i < incidents_.size(); ++i) {
            recent.push_back(to_json(incidents_[i]));
        }
    }

    Json logs = Json::array();
    for (const auto& line : Logger::instance().recent_lines(200)) {
        logs.push_back(sanitize_utf8(line));
    }

    Json bundle = {
        {"incident", to_json(incident)},
        {"process", process_snapshot()},
        {"recent_logs", logs},
        {"recent_incidents", recent},
        {"preserved_at", format_timestamp_ms(current_timestamp_ms())}
    };

    if (!write_file(path, dump_json(bundle, 2))) {
        LOG_ERROR("[Orchestrator] Cannot preserve evidence %s: %s", path.c_str(), strerror(errno));
        return false;
    }
    LOG_INFO("[Orchestrator] Evidence preserved: %s", path.c_str());
    return true;
}

void SecurityOrchestrator::resume_operations() {
    if (paused_.exchange(false)) {
        LOG_INFO("[Orchestrator] Operations resumed");
    }
}

// ============================================================================
// Incident bookkeeping
// ============================================================================

void SecurityOrchestrator::record_incident(const SecurityIncident& incident) {
    std::lock_guard<std::mutex> lock(incidents_mutex_);
    incidents_.push_back(incident);
    while (incidents_.size() > config_.incident_retention) {
        incidents_.pop_front();
    }
}

void SecurityOrchestrator::persist_status(const SecurityIncident& incident) {
    if (store_.is_open() && !store_.update(incident)) {
        LOG_ERROR("[Orchestrator] Failed to update archived incident %s", incident.id.c_str());
    }
}

bool SecurityOrchestrator::change_status(const std::string& incident_id, IncidentStatus to) {
    SecurityIncident updated;
    {
        std::lock_guard<std::mutex> lock(incidents_mutex_);
        auto it = std::find_if(incidents_.begin(), incidents_.end(),
                               [&](const SecurityIncident& i) { return i.id == incident_id; });
        if (it == incidents_.end()) return false;
        transition(*it, to);
        updated = *it;
    }
    persist_status(updated);
    LOG_INFO("[Orchestrator] Incident %s is now %s", incident_id.c_str(), to_string(to).c_str());
    return true;
}

bool SecurityOrchestrator::contain_incident(const std::string& incident_id) {
    return change_status(incident_id, IncidentStatus::CONTAINED);
}

bool SecurityOrchestrator::resolve_incident(const std::string& incident_id) {
    return change_status(incident_id, IncidentStatus::RESOLVED);
}

std::vector<SecurityIncident> SecurityOrchestrator::incidents(size_t limit) const {
    std::lock_guard<std::mutex> lock(incidents_mutex_);
    std::vector<SecurityIncident> out;
    for (auto it = incidents_.rbegin(); it != incidents_.rend() && out.size() < limit; ++it) {
        out.push_back(*it);
    }
    return out;
}

std::vector<SecurityIncident> SecurityOrchestrator::active_incidents() const {
    std::lock_guard<std::mutex> lock(incidents_mutex_);
    std::vector<SecurityIncident> out;
    for (const auto& i : incidents_) {
        if (is_active(i)) out.push_back(i);
    }
    return out;
}

std::vector<SecurityIncident> SecurityOrchestrator::critical_incidents() const {
    std::lock_guard<std::mutex> lock(incidents_mutex_);
    std::vector<SecurityIncident> out;
    for (const auto& i : incidents_) {
        if (i.severity == Severity::CRITICAL) out.push_back(i);
    }
    return out;
}

std::vector<SecurityIncident> SecurityOrchestrator::resolved_incidents() const {
    std::lock_guard<std::mutex> lock(incidents_mutex_);
    std::vector<SecurityIncident> out;
    for (const auto& i : incidents_) {
        if (i.status == IncidentStatus::RESOLVED) out.push_back(i);
    }
    return out;
}

std::optional<SecurityIncident> SecurityOrchestrator::incident(const std::string& incident_id) const {
    std::lock_guard<std::mutex> lock(incidents_mutex_);
    for (const auto& i : incidents_) {
        if (i.id == incident_id) return i;
    }
    return std::nullopt;
}

std::shared_ptr<std::mutex> SecurityOrchestrator::project_lock(const std::string& project_id) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& slot = project_locks_[project_id];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

std::string SecurityOrchestrator::project_root_for(const std::string& project_id) const {
    auto isolation = zero_trust_.isolation(project_id);
    if (isolation) return isolation->root_path;
    return path_guard_.project_root(project_id);
}

// ============================================================================
// Ingress
// ============================================================================

SecureAccessResult SecurityOrchestrator::validate_secure_access(const std::string& project_id,
                                                                Operation operation,
                                                                const std::string& target_path) {
    SecureAccessResult result;
    uint64_t mark = events_.last_id();

    SafePath safe = path_guard_.validate(target_path, project_id, operation);
    if (!safe.is_safe) {
        result.reason = safe.violations.empty() ? "path rejected" : safe.violations.front();
    } else {
        AccessDecision decision = engine_.validate_file_access(safe.sanitized_path, operation, project_id);
        if (!decision.allowed) {
            result.reason = decision.reason;
        } else if (!zero_trust_.validate_project_access(project_id, operation, safe.sanitized_path)) {
            result.reason = "zero-trust verification failed";
        } else {
            result.allowed = true;
        }
    }

    if (result.allowed) {
        return result;
    }

    LOG_WARN("[Orchestrator] Denied %s of '%s' for %s: %s", to_string(operation).c_str(),
             target_path.c_str(), project_id.c_str(), result.reason.c_str());

    dispatch_pending();

    std::lock_guard<std::mutex> lock(incidents_mutex_);
    for (const auto& i : incidents_) {
        if (i.trigger_event_id > mark && (!i.project_id || *i.project_id == project_id)) {
            result.incident = i;
            break;
        }
    }
    return result;
}

SecureProjectResult SecurityOrchestrator::create_secure_project(const std::string& project_id,
                                                                const std::string& project_path,
                                                                SecurityLevel level) {
    SecureProjectResult result;
    try {
        ProjectIsolationBoundary isolation =
            zero_trust_.create_project_isolation(project_id, project_path, level);

        auto boundary = engine_.boundary(isolation.engine_boundary_id);
        result.security_context = {
            {"project_id", project_id},
            {"project_root", isolation.root_path},
            {"security_level", to_string(level)},
            {"isolation", to_json(isolation)},
            {"filesystem_boundary", boundary ? to_json(*boundary) : Json(nullptr)}
        };
        result.success = true;
        LOG_INFO("[Orchestrator] Secure project %s created at %s",
                 project_id.c_str(), isolation.root_path.c_str());
    } catch (const std::invalid_argument& e) {
        result.error = e.what();
        LOG_WARN("[Orchestrator] Refused to create project %s: %s", project_id.c_str(), e.what());
    } catch (const std::runtime_error& e) {
        result.error = e.what();
        LOG_ERROR("[Orchestrator] Failed to create project %s: %s", project_id.c_str(), e.what());
    }
    return result;
}

bool SecurityOrchestrator::remove_project_isolation(const std::string& project_id) {
    bool removed = zero_trust_.remove_project_isolation(project_id);
    if (removed) {
        std::lock_guard<std::mutex> lock(locks_mutex_);
        project_locks_.erase(project_id);
    }
    return removed;
}

// ============================================================================
// Posture and reporting
// ============================================================================

double SecurityOrchestrator::incident_response_score() const {
    std::lock_guard<std::mutex> lock(incidents_mutex_);
    int critical = 0;
    int high = 0;
    for (const auto& i : incidents_) {
        if (!is_active(i)) continue;
        if (i.severity == Severity::CRITICAL) ++critical;
        else if (i.severity == Severity::HIGH) ++high;
    }
    return clamp(100.0 - 10.0 * critical - 2.0 * high, 0.0, 100.0);
}

void SecurityOrchestrator::set_posture_aggregator(PostureAggregator aggregator) {
    std::lock_guard<std::mutex> lock(posture_mutex_);
    aggregator_ = aggregator ? std::move(aggregator) : PostureAggregator(mean_score);
}

SecurityPosture SecurityOrchestrator::assess_posture() {
    SecurityPosture p;
    p.timestamp_ms = current_timestamp_ms();
    p.path_protection_score = path_guard_.health_score();
    p.boundary_enforcement_score = engine_.health_score();
    p.zero_trust_score = zero_trust_.health_score();
    p.incident_response_score = incident_response_score();

    PostureAggregator aggregator;
    {
        std::lock_guard<std::mutex> lock(posture_mutex_);
        aggregator = aggregator_;
    }
    std::vector<double> scores = {
        p.path_protection_score,
        p.boundary_enforcement_score,
        p.zero_trust_score,
        p.incident_response_score
    };
    p.overall_score = clamp(aggregator(scores), 0.0, 100.0);
    p.compliance_status = compliance_for(p.overall_score);

    for (const auto& i : active_incidents()) {
        if (i.severity >= Severity::HIGH) ++p.active_threats;
    }

    if (p.overall_score < 95.0) {
        p.recommendations.push_back("Overall security score is " + fixed1(p.overall_score) +
                                    "; review recent incidents and subsystem reports");
    }
    if (p.active_threats > 0) {
        p.recommendations.push_back(std::to_string(p.active_threats) +
                                    " active threat(s) require investigation");
    }
    if (p.path_protection_score < 90.0) {
        p.recommendations.push_back("Path protection score is low; review traversal attempts");
    }
    if (p.boundary_enforcement_score < 90.0) {
        p.recommendations.push_back("Boundary enforcement score is low; review boundary violations");
    }
    if (p.zero_trust_score < 90.0) {
        p.recommendations.push_back("Zero-trust integrity is degraded; verify project isolation boundaries");
    }
    if (p.incident_response_score < 90.0) {
        p.recommendations.push_back("Contain or resolve open high and critical incidents");
    }

    {
        std::lock_guard<std::mutex> lock(posture_mutex_);
        posture_ = p;
    }

    LOG_DEBUG("[Orchestrator] Posture %.1f (%s), %d active threat(s)",
              p.overall_score, to_string(p.compliance_status).c_str(), p.active_threats);
    emit("securityPostureUpdated", to_json(p));
    flush_egress();
    return p;
}

SecurityPosture SecurityOrchestrator::posture() const {
    std::lock_guard<std::mutex> lock(posture_mutex_);
    return posture_;
}

Json SecurityOrchestrator::export_comprehensive_security_report() {
    SecurityPosture p = assess_posture();

    Json recent = Json::array();
    for (const auto& i : incidents(100)) {
        recent.push_back(to_json(i));
    }
    Json threats = Json::array();
    for (const auto& i : active_incidents()) {
        if (i.severity >= Severity::HIGH) {
            threats.push_back(to_json(i));
        }
    }

    return Json{
        {"generated_at", format_timestamp_ms(current_timestamp_ms())},
        {"posture", to_json(p)},
        {"path_protection", path_guard_.export_report()},
        {"boundary_enforcement", engine_.export_report()},
        {"zero_trust", zero_trust_.compliance_report()},
        {"incidents", recent},
        {"active_threats", threats},
        {"recommendations", p.recommendations},
        {"operations_paused", operations_paused()},
        {"archived_incidents", store_.count()}
    };
}

Json SecurityOrchestrator::security_status() {
    size_t total = 0;
    size_t active = 0;
    size_t critical = 0;
    {
        std::lock_guard<std::mutex> lock(incidents_mutex_);
        total = incidents_.size();
        for (const auto& i : incidents_) {
            if (is_active(i)) ++active;
            if (i.severity == Severity::CRITICAL) ++critical;
        }
    }

    Json projects = Json::array();
    for (const auto& id : zero_trust_.project_ids()) {
        projects.push_back(id);
    }

    return Json{
        {"running", running()},
        {"operations_paused", operations_paused()},
        {"projects", projects},
        {"boundaries", engine_.status()},
        {"incidents", {
            {"in_memory", total},
            {"active", active},
            {"critical", critical},
            {"archived", store_.count()}
        }},
        {"pending_approvals", zero_trust_.pending_approvals().size()},
        {"posture", to_json(posture())}
    };
}

} // namespace warden
