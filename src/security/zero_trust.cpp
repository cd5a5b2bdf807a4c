/*
 * warden C++17 - ZeroTrustIsolation Implementation
 */
#include <warden/security/zero_trust.hpp>
#include <warden/security/path_guard.hpp>
#include <warden/security/boundary_engine.hpp>
#include <warden/core/logger.hpp>
#include <warden/core/utils.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <regex>
#include <stdexcept>

namespace warden {

namespace {

const char* kProjectConfigFile = ".warden-project.json";
const double kCompromiseThreshold = 70.0;
const size_t kProcessHistory = 1000;
const size_t kMaxMatchedActivity = 20;

std::map<std::string, std::string> hash_manifest(const std::string& root) {
    std::map<std::string, std::string> manifest;
    for (const auto& rel : list_files_recursive(root)) {
        manifest[rel] = sha256_file(join_path(root, rel));
    }
    return manifest;
}

bool touched_by(const std::string& path, const std::vector<std::string>& touched) {
    for (const auto& t : touched) {
        if (path_is_under(path, t)) return true;
    }
    return false;
}

const char* kGitignoreEntries[] = {
    ".warden/",
    ".warden-*",
    "*.warden.log"
};

const std::regex& escalation_binary() {
    static const std::regex re("^(sudo|su|pkexec|doas|setcap|chown|passwd|visudo)$");
    return re;
}

const std::regex& escalation_target() {
    static const std::regex re("^/etc/(sudoers(\\.d)?|shadow|passwd)(/.*)?$");
    return re;
}

const std::regex& escalation_command() {
    static const std::regex re("(^|[\\s/;|&])(sudo|su|pkexec|doas|setcap|chown|passwd|visudo)(\\s|$)");
    return re;
}

VerificationCheck make_check(const std::string& name, CheckFrequency freq, FailureAction action,
                             int64_t interval_ms, int threshold,
                             std::vector<std::string> steps) {
    VerificationCheck c;
    c.check_name = name;
    c.frequency = freq;
    c.failure_action = action;
    c.interval_ms = interval_ms;
    c.failure_threshold = threshold;
    c.remediation_steps = std::move(steps);
    return c;
}

bool extend_gitignore(const std::string& root) {
    std::string path = join_path(root, ".gitignore");
    std::string existing;
    if (file_exists(path) && !read_file(path, existing)) {
        return false;
    }
    std::vector<std::string> lines = split(existing, '\n');
    for (auto& l : lines) l = trim(l);

    std::string additions;
    for (const char* entry : kGitignoreEntries) {
        if (std::find(lines.begin(), lines.end(), entry) == lines.end()) {
            additions += entry;
            additions += "\n";
        }
    }
    if (additions.empty()) return true;
    if (!existing.empty() && existing.back() != '\n') {
        existing += "\n";
    }
    return write_file(path, existing + additions);
}

} // namespace

Json to_json(const ProjectIsolationBoundary& b) {
    Json mechanisms = Json::array();
    for (const auto& m : b.enforcement_mechanisms) {
        mechanisms.push_back({
            {"mechanism", m.mechanism},
            {"strength", to_string(m.strength)},
            {"monitoring_enabled", m.monitoring_enabled},
            {"automatic_remediation", m.automatic_remediation}
        });
    }
    Json checks = Json::array();
    for (const auto& c : b.verification_checks) {
        checks.push_back({
            {"check_name", c.check_name},
            {"frequency", to_string(c.frequency)},
            {"failure_action", to_string(c.failure_action)},
            {"remediation_steps", c.remediation_steps},
            {"interval_ms", c.interval_ms},
            {"failure_threshold", c.failure_threshold}
        });
    }
    return Json{
        {"boundary_id", b.boundary_id},
        {"project_id", b.project_id},
        {"root_path", sanitize_utf8(b.root_path)},
        {"engine_boundary_id", b.engine_boundary_id},
        {"security_level", to_string(b.security_level)},
        {"boundary_type", to_string(b.boundary_type)},
        {"enforcement_mechanisms", mechanisms},
        {"verification_checks", checks},
        {"metrics", {
            {"boundary_integrity_score", b.metrics.boundary_integrity_score},
            {"breach_attempts", b.metrics.breach_attempts},
            {"last_verification", b.metrics.last_verification_ms > 0
                                      ? Json(format_timestamp_ms(b.metrics.last_verification_ms))
                                      : Json(nullptr)},
            {"verification_failures", b.metrics.verification_failures}
        }},
        {"created", format_timestamp_ms(b.created_ms)}
    };
}

// ============================================================================
// Catalogs
// ============================================================================

std::vector<EnforcementMechanism> ZeroTrustIsolation::mechanisms_for(SecurityLevel level) {
    std::vector<EnforcementMechanism> m = {
        {"filesystem_sandbox", MechanismStrength::STRONG, true, true},
        {"credential_isolation", MechanismStrength::MEDIUM, true, false},
    };
    if (level == SecurityLevel::ENHANCED || level == SecurityLevel::MAXIMUM) {
        m.push_back({"process_isolation", MechanismStrength::STRONG, true, true});
        m.push_back({"memory_isolation", MechanismStrength::MEDIUM, true, false});
    }
    if (level == SecurityLevel::MAXIMUM) {
        m[0].strength = MechanismStrength::CRYPTOGRAPHIC;
        m.push_back({"network_segmentation", MechanismStrength::CRYPTOGRAPHIC, true, true});
    }
    return m;
}

std::vector<VerificationCheck> ZeroTrustIsolation::checks_for(SecurityLevel level) {
    const std::vector<std::string> integrity_steps = {
        "rehash_project_root", "compare_with_baseline", "quarantine_project"
    };
    const std::vector<std::string> cross_steps = {
        "deny_access", "record_breach_attempt"
    };
    const std::vector<std::string> privilege_steps = {
        "deny_access", "alert_security_team"
    };
    const std::vector<std::string> config_steps = {
        "rehash_configuration", "alert_security_team", "restore_from_backup"
    };

    std::vector<VerificationCheck> checks;
    switch (level) {
        case SecurityLevel::STANDARD:
            checks.push_back(make_check("filesystem_integrity", CheckFrequency::PERIODIC,
                                        FailureAction::QUARANTINE, 60000, 3, integrity_steps));
            checks.push_back(make_check("cross_project_access", CheckFrequency::CONTINUOUS,
                                        FailureAction::BLOCK, 0, 1, cross_steps));
            checks.push_back(make_check("configuration_integrity", CheckFrequency::PERIODIC,
                                        FailureAction::ALERT, 120000, 1, config_steps));
            break;
        case SecurityLevel::ENHANCED:
            checks.push_back(make_check("filesystem_integrity", CheckFrequency::PERIODIC,
                                        FailureAction::QUARANTINE, 30000, 3, integrity_steps));
            checks.push_back(make_check("cross_project_access", CheckFrequency::CONTINUOUS,
                                        FailureAction::BLOCK, 0, 1, cross_steps));
            checks.push_back(make_check("privilege_escalation", CheckFrequency::CONTINUOUS,
                                        FailureAction::BLOCK, 0, 1, privilege_steps));
            checks.push_back(make_check("configuration_integrity", CheckFrequency::PERIODIC,
                                        FailureAction::ALERT, 60000, 1, config_steps));
            break;
        case SecurityLevel::MAXIMUM:
            checks.push_back(make_check("filesystem_integrity", CheckFrequency::PERIODIC,
                                        FailureAction::QUARANTINE, 15000, 3, integrity_steps));
            checks.push_back(make_check("cross_project_access", CheckFrequency::CONTINUOUS,
                                        FailureAction::BLOCK, 0, 1, cross_steps));
            checks.push_back(make_check("privilege_escalation", CheckFrequency::CONTINUOUS,
                                        FailureAction::QUARANTINE, 0, 1, privilege_steps));
            checks.push_back(make_check("configuration_integrity", CheckFrequency::ON_CHANGE,
                                        FailureAction::BLOCK, 0, 1, config_steps));
            break;
    }
    return checks;
}

// ============================================================================
// Construction and project lifecycle
// ============================================================================

ZeroTrustIsolation::ZeroTrustIsolation(const SecurityConfig& config, PathGuard& path_guard,
                                       BoundaryEngine& engine, EventQueue& events)
    : config_(config)
    , path_guard_(path_guard)
    , engine_(engine)
    , events_(events)
    , auto_approve_(config.auto_approve_actions)
    , scan_cursor_(0)
    , last_scan_ms_(monotonic_ms())
    , limiter_(KeyedRateLimiter::TOKEN_BUCKET, 20, 5)
{
    LOG_INFO("[ZeroTrust] Initialized with %zu threat rules", default_threat_rules().size());
}

std::string ZeroTrustIsolation::config_file_path(const ProjectState& state) const {
    return join_path(state.boundary.root_path, kProjectConfigFile);
}

ProjectIsolationBoundary ZeroTrustIsolation::create_project_isolation(const std::string& project_id,
                                                                      const std::string& project_path,
                                                                      SecurityLevel level) {
    if (!is_valid_project_id(project_id)) {
        throw std::invalid_argument("Invalid project id: '" + project_id + "'");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (projects_.count(project_id)) {
        throw std::invalid_argument("Project already isolated: " + project_id);
    }
    if (quarantined_.count(project_id)) {
        throw std::invalid_argument("Project is quarantined: " + project_id);
    }

    SafePath safe = path_guard_.validate(project_path, std::nullopt, Operation::WRITE);
    if (!safe.is_safe) {
        throw std::invalid_argument("Unsafe project path: " +
                                    (safe.violations.empty() ? project_path : safe.violations.front()));
    }
    const std::string root = safe.sanitized_path;
    if (path_is_under(root, normalize_path(config_.framework_root)) ||
        path_is_under(root, normalize_path(config_.home_dir))) {
        throw std::invalid_argument("Project root may not lie inside the framework: " + root);
    }
    for (const auto& sandbox : config_.sandbox_roots) {
        if (normalize_path(sandbox) == root) {
            throw std::invalid_argument("Project root may not be a sandbox root: " + root);
        }
    }
    for (const auto& entry : projects_) {
        const std::string& other = entry.second.boundary.root_path;
        if (path_is_under(root, other) || path_is_under(other, root)) {
            throw std::invalid_argument("Project root overlaps project " + entry.first);
        }
    }

    // Physical boundary
    if (!ensure_directory(root)) {
        throw std::runtime_error("Cannot create project directory " + root + ": " + strerror(errno));
    }
    if (!extend_gitignore(root)) {
        LOG_ERROR("[ZeroTrust] Failed to update .gitignore in %s: %s", root.c_str(), strerror(errno));
    }

    ProjectState state;
    ProjectIsolationBoundary& b = state.boundary;
    b.boundary_id = make_record_id("zt_boundary");
    b.project_id = project_id;
    b.root_path = root;
    b.security_level = level;
    b.boundary_type = IsolationType::PHYSICAL;
    b.enforcement_mechanisms = mechanisms_for(level);
    b.verification_checks = checks_for(level);
    b.created_ms = current_timestamp_ms();

    // Logical boundary
    Json mechanisms = Json::array();
    for (const auto& m : b.enforcement_mechanisms) mechanisms.push_back(m.mechanism);
    Json checks = Json::array();
    for (const auto& c : b.verification_checks) checks.push_back(c.check_name);
    Json project_config = {
        {"projectId", project_id},
        {"isolationLevel", to_string(level)},
        {"boundaryId", b.boundary_id},
        {"securityPolicy", {
            {"principles", {"never_trust_always_verify", "least_privilege", "assume_breach"}},
            {"mechanisms", mechanisms},
            {"verificationChecks", checks}
        }},
        {"created", format_timestamp_ms(b.created_ms)}
    };
    if (!write_file(config_file_path(state), dump_json(project_config, 2))) {
        throw std::runtime_error("Cannot write " + config_file_path(state) + ": " + strerror(errno));
    }

    path_guard_.register_project_root(project_id, root);
    try {
        b.engine_boundary_id = engine_.add_project_boundary(project_id, root, level == SecurityLevel::STANDARD);
    } catch (const std::invalid_argument&) {
        path_guard_.unregister_project_root(project_id);
        throw;
    }

    state.config_hash = sha256_file(config_file_path(state));
    state.content_manifest = hash_manifest(root);
    uint64_t head = engine_.last_activity_seq();
    state.integrity_cursor = head;
    state.change_cursor = head;
    int64_t now = monotonic_ms();
    for (const auto& c : b.verification_checks) {
        state.checks[c.check_name].last_run_ms = now;
    }

    ProjectIsolationBoundary result = b;
    projects_[project_id] = std::move(state);

    LOG_INFO("[ZeroTrust] Isolated project %s at %s (%s, %zu checks)",
             project_id.c_str(), root.c_str(), to_string(level).c_str(), result.verification_checks.size());
    return result;
}

bool ZeroTrustIsolation::remove_project_isolation(const std::string& project_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = projects_.find(project_id);
    if (it == projects_.end()) return false;
    engine_.remove_project_boundary(project_id);
    path_guard_.unregister_project_root(project_id);
    limiter_.reset(project_id);
    projects_.erase(it);
    approvals_.erase(std::remove_if(approvals_.begin(), approvals_.end(),
                                    [&](const PendingApproval& a) { return a.project_id == project_id; }),
                     approvals_.end());
    LOG_INFO("[ZeroTrust] Removed isolation for project %s", project_id.c_str());
    return true;
}

bool ZeroTrustIsolation::has_project(const std::string& project_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = projects_.find(project_id);
    return it != projects_.end() && !it->second.quarantined;
}

std::optional<ProjectIsolationBoundary> ZeroTrustIsolation::isolation(const std::string& project_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = projects_.find(project_id);
    if (it == projects_.end() || it->second.quarantined) return std::nullopt;
    return it->second.boundary;
}

std::vector<std::string> ZeroTrustIsolation::project_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& entry : projects_) {
        if (!entry.second.quarantined) ids.push_back(entry.first);
    }
    return ids;
}

bool ZeroTrustIsolation::is_quarantined(const std::string& project_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return quarantined_.count(project_id) > 0;
}

bool ZeroTrustIsolation::is_blocked(const std::string& project_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = projects_.find(project_id);
    return it != projects_.end() && it->second.blocked;
}

// ============================================================================
// Verification checks
// ============================================================================

CheckResult ZeroTrustIsolation::check_filesystem_integrity(ProjectState& state, std::string& detail) {
    const std::string& root = state.boundary.root_path;
    const std::string& id = state.boundary.project_id;

    if (engine_.has_pending_events(root)) {
        detail = "filesystem changes still settling";
        return CheckResult::INCONCLUSIVE;
    }
    for (const char* forbidden : {".warden", ".warden-framework"}) {
        if (is_directory(join_path(root, forbidden))) {
            detail = std::string("forbidden framework directory present: ") + forbidden;
            return CheckResult::FAIL;
        }
    }

    uint64_t head = engine_.last_activity_seq();
    std::vector<std::string> touched;
    for (const auto& rec : engine_.activity_since(state.integrity_cursor)) {
        if (rec.seq > head) break;
        if (rec.owner_project == id && rec.allowed && rec.operation != FileOperation::READ) {
            touched.push_back(rec.path);
        }
    }
    state.integrity_cursor = head;

    // Only paths with recorded activity move the baseline; any other delta fails
    std::map<std::string, std::string> current = hash_manifest(root);
    std::map<std::string, std::string>& baseline = state.content_manifest;
    std::set<std::string> paths;
    for (const auto& entry : current) paths.insert(entry.first);
    for (const auto& entry : baseline) paths.insert(entry.first);

    std::vector<std::string> unexplained;
    for (const auto& rel : paths) {
        auto cur = current.find(rel);
        auto base = baseline.find(rel);
        bool in_current = cur != current.end();
        bool in_baseline = base != baseline.end();
        if (in_current && in_baseline && cur->second == base->second) continue;

        if (!touched_by(join_path(root, rel), touched)) {
            unexplained.push_back(rel);
        } else if (in_current) {
            baseline[rel] = cur->second;
        } else {
            baseline.erase(rel);
        }
    }

    if (!unexplained.empty()) {
        detail = "project content changed without recorded activity: " + unexplained.front();
        if (unexplained.size() > 1) {
            detail += " (+" + std::to_string(unexplained.size() - 1) + " more)";
        }
        return CheckResult::FAIL;
    }
    return CheckResult::PASS;
}

CheckResult ZeroTrustIsolation::check_cross_project_access(ProjectState& state, const AccessContext& ctx,
                                                           std::string& detail) {
    const std::string& id = state.boundary.project_id;
    if (!ctx.target.empty()) {
        std::string resolved = path_guard_.resolve(ctx.target, id);
        std::optional<std::string> owner = engine_.project_for_path(resolved);
        if (owner && *owner != id) {
            detail = "target belongs to project " + *owner;
            return CheckResult::FAIL;
        }
    }
    std::optional<std::string> context = engine_.execution_context();
    if (context && *context != id) {
        detail = "execution context belongs to project " + *context;
        return CheckResult::FAIL;
    }
    return CheckResult::PASS;
}

CheckResult ZeroTrustIsolation::check_privilege_escalation(ProjectState& state, const AccessContext& ctx,
                                                           std::string& detail) {
    if (!ctx.target.empty()) {
        std::string resolved = path_guard_.resolve(ctx.target, state.boundary.project_id);
        if (ctx.operation == Operation::EXECUTE &&
            std::regex_match(base_name(resolved), escalation_binary())) {
            detail = "execution of privileged binary " + base_name(resolved);
            return CheckResult::FAIL;
        }
        if (std::regex_match(resolved, escalation_target())) {
            detail = "access to credential store " + resolved;
            return CheckResult::FAIL;
        }
        return CheckResult::PASS;
    }

    for (const auto& rec : state.process_activity) {
        if (rec.seq <= state.process_cursor) continue;
        if (std::regex_search(rec.command, escalation_command())) {
            detail = "privileged command: " + truncate_safe(rec.command, 200);
            return CheckResult::FAIL;
        }
    }
    return CheckResult::PASS;
}

CheckResult ZeroTrustIsolation::check_configuration_integrity(ProjectState& state, std::string& detail) {
    std::string current = sha256_file(config_file_path(state));
    if (current != state.config_hash) {
        detail = current.empty() ? "project configuration missing" : "project configuration modified";
        return CheckResult::FAIL;
    }
    return CheckResult::PASS;
}

CheckResult ZeroTrustIsolation::execute_check(ProjectState& state, const VerificationCheck& check,
                                              const AccessContext& ctx, std::string& detail) {
    if (check.check_name == "filesystem_integrity") return check_filesystem_integrity(state, detail);
    if (check.check_name == "cross_project_access") return check_cross_project_access(state, ctx, detail);
    if (check.check_name == "privilege_escalation") return check_privilege_escalation(state, ctx, detail);
    if (check.check_name == "configuration_integrity") return check_configuration_integrity(state, detail);
    throw std::invalid_argument("Unknown verification check: " + check.check_name);
}

bool ZeroTrustIsolation::verify(ProjectState& state, const VerificationCheck& check, const AccessContext& ctx) {
    std::string detail;
    CheckResult result = execute_check(state, check, ctx, detail);
    int64_t now = monotonic_ms();
    CheckState& cs = state.checks[check.check_name];
    cs.last_run_ms = now;
    state.boundary.metrics.last_verification_ms = current_timestamp_ms();

    if (result == CheckResult::INCONCLUSIVE) {
        LOG_DEBUG("[ZeroTrust] %s/%s inconclusive: %s",
                  state.boundary.project_id.c_str(), check.check_name.c_str(), detail.c_str());
        return true;
    }
    if (result == CheckResult::PASS) {
        cs.consecutive_failures = 0;
        return true;
    }

    IsolationMetrics& metrics = state.boundary.metrics;
    metrics.verification_failures++;
    metrics.boundary_integrity_score = std::max(0.0, 100.0 - 10.0 * metrics.verification_failures);

    if (cs.consecutive_failures == 0 || now - cs.first_failure_ms > config_.failure_window_ms) {
        cs.consecutive_failures = 1;
        cs.first_failure_ms = now;
    } else {
        cs.consecutive_failures++;
    }

    if (cs.consecutive_failures >= check.failure_threshold) {
        LOG_WARN("[ZeroTrust] %s/%s failed (%d/%d): %s; running %s",
                 state.boundary.project_id.c_str(), check.check_name.c_str(),
                 cs.consecutive_failures, check.failure_threshold, detail.c_str(),
                 to_string(check.failure_action).c_str());
        cs.consecutive_failures = 0;
        apply_failure_action(state, check, detail, ctx);
    } else {
        LOG_WARN("[ZeroTrust] %s/%s failed (%d/%d): %s",
                 state.boundary.project_id.c_str(), check.check_name.c_str(),
                 cs.consecutive_failures, check.failure_threshold, detail.c_str());
    }

    update_compromise(state);
    return false;
}

void ZeroTrustIsolation::apply_failure_action(ProjectState& state, const VerificationCheck& check,
                                              const std::string& detail, const AccessContext& ctx) {
    const std::string& id = state.boundary.project_id;
    switch (check.failure_action) {
        case FailureAction::LOG:
            break;
        case FailureAction::ALERT: {
            SecurityAlertEvent ev;
            ev.project_id = id;
            ev.source = "zero_trust";
            ev.message = "Verification check " + check.check_name + " failed: " + detail;
            ev.severity = Severity::HIGH;
            events_.push(std::move(ev));
            break;
        }
        case FailureAction::BLOCK:
            // An inline failure already denies the triggering access
            if (!ctx.inline_access) {
                state.blocked = true;
                LOG_WARN("[ZeroTrust] Project %s blocked until a clean verification", id.c_str());
            }
            break;
        case FailureAction::QUARANTINE:
            quarantine_locked(state, check.check_name + " verification failed: " + detail, true);
            break;
    }
}

void ZeroTrustIsolation::update_compromise(ProjectState& state) {
    const IsolationMetrics& metrics = state.boundary.metrics;
    if (metrics.boundary_integrity_score >= kCompromiseThreshold || state.compromised_reported) {
        return;
    }
    state.compromised_reported = true;

    BoundaryCompromisedEvent ev;
    ev.project_id = state.boundary.project_id;
    ev.boundary_id = state.boundary.boundary_id;
    ev.integrity_score = metrics.boundary_integrity_score;
    ev.verification_failures = metrics.verification_failures;
    events_.push(std::move(ev));

    LOG_ERROR("[ZeroTrust] Boundary of project %s compromised (integrity %.1f)",
              state.boundary.project_id.c_str(), metrics.boundary_integrity_score);
    if (!state.enhanced) {
        state.enhanced = true;
        LOG_INFO("[ZeroTrust] Enhanced monitoring for project %s", state.boundary.project_id.c_str());
    }
}

bool ZeroTrustIsolation::run_check(const std::string& project_id, const std::string& check_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = projects_.find(project_id);
    if (it == projects_.end() || it->second.quarantined) {
        throw std::out_of_range("Unknown project: " + project_id);
    }
    ProjectState& state = it->second;
    const auto& checks = state.boundary.verification_checks;
    auto check = std::find_if(checks.begin(), checks.end(),
                              [&](const VerificationCheck& c) { return c.check_name == check_name; });
    if (check == checks.end()) {
        throw std::invalid_argument("Check " + check_name + " not configured for project " + project_id);
    }
    VerificationCheck copy = *check;
    bool passed = verify(state, copy, AccessContext());
    if (check_name == "privilege_escalation" && !state.quarantined) {
        state.process_cursor = state.next_process_seq - 1;
    }
    purge_quarantined_locked();
    return passed;
}

// ============================================================================
// Access gate
// ============================================================================

bool ZeroTrustIsolation::validate_project_access(const std::string& project_id, Operation operation,
                                                 const std::string& target_path) {
    std::string reason;
    bool allowed = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto q = quarantined_.find(project_id);
        if (q != quarantined_.end()) {
            allowed = false;
            reason = "project is quarantined: " + q->second;
        } else {
            auto it = projects_.find(project_id);
            if (it == projects_.end()) {
                throw std::out_of_range("Unknown project: " + project_id);
            }
            ProjectState& state = it->second;

            if (state.blocked) {
                allowed = false;
                reason = "project access blocked pending clean verification";
            } else if (state.rate_limited && !limiter_.try_acquire(project_id)) {
                allowed = false;
                reason = "rate limit exceeded";
            } else {
                AccessContext ctx;
                ctx.inline_access = true;
                ctx.operation = operation;
                ctx.target = target_path;
                std::vector<VerificationCheck> checks = state.boundary.verification_checks;
                for (const auto& check : checks) {
                    if (check.frequency != CheckFrequency::CONTINUOUS &&
                        check.frequency != CheckFrequency::ON_ACCESS) {
                        continue;
                    }
                    if (!verify(state, check, ctx)) {
                        allowed = false;
                        reason = check.check_name + " verification failed";
                        break;
                    }
                }
            }

            if (!allowed && !state.quarantined) {
                state.boundary.metrics.breach_attempts++;
            }
            purge_quarantined_locked();
        }
    }

    if (!allowed) {
        LOG_WARN("[ZeroTrust] Denied %s of %s for project %s: %s",
                 to_string(operation).c_str(), target_path.c_str(), project_id.c_str(), reason.c_str());
        UnauthorizedAccessEvent ev;
        ev.project_id = project_id;
        ev.operation = operation;
        ev.target_path = target_path;
        ev.reason = reason;
        events_.push(std::move(ev));
    }
    return allowed;
}

// ============================================================================
// Quarantine and monitoring
// ============================================================================

void ZeroTrustIsolation::quarantine_locked(ProjectState& state, const std::string& reason, bool raise_event) {
    if (state.quarantined) return;
    const std::string id = state.boundary.project_id;
    state.quarantined = true;
    quarantined_[id] = reason;

    engine_.remove_project_boundary(id);
    path_guard_.unregister_project_root(id);
    limiter_.reset(id);

    LOG_ERROR("[ZeroTrust] Project %s quarantined: %s", id.c_str(), reason.c_str());
    if (raise_event) {
        ProjectQuarantinedEvent ev;
        ev.project_id = id;
        ev.reason = reason;
        events_.push(std::move(ev));
    }
}

void ZeroTrustIsolation::purge_quarantined_locked() {
    for (auto it = projects_.begin(); it != projects_.end(); ) {
        if (it->second.quarantined) {
            const std::string id = it->first;
            approvals_.erase(std::remove_if(approvals_.begin(), approvals_.end(),
                                            [&](const PendingApproval& a) { return a.project_id == id; }),
                             approvals_.end());
            it = projects_.erase(it);
        } else {
            ++it;
        }
    }
}

void ZeroTrustIsolation::quarantine_project(const std::string& project_id, const std::string& reason,
                                            bool raise_event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (quarantined_.count(project_id)) return;
    auto it = projects_.find(project_id);
    if (it == projects_.end()) {
        throw std::out_of_range("Unknown project: " + project_id);
    }
    quarantine_locked(it->second, reason, raise_event);
    purge_quarantined_locked();
}

bool ZeroTrustIsolation::enhance_monitoring(const std::string& project_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = projects_.find(project_id);
    if (it == projects_.end() || it->second.quarantined) return false;
    if (!it->second.enhanced) {
        it->second.enhanced = true;
        LOG_INFO("[ZeroTrust] Enhanced monitoring for project %s", project_id.c_str());
    }
    return true;
}

bool ZeroTrustIsolation::block_project(const std::string& project_id, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = projects_.find(project_id);
    if (it == projects_.end() || it->second.quarantined) return false;
    if (!it->second.blocked) {
        it->second.blocked = true;
        LOG_WARN("[ZeroTrust] Access blocked for project %s: %s", project_id.c_str(), reason.c_str());
    }
    return true;
}

void ZeroTrustIsolation::record_process_activity(const std::string& project_id, const std::string& command) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = projects_.find(project_id);
    if (it == projects_.end() || it->second.quarantined) {
        throw std::out_of_range("Unknown project: " + project_id);
    }
    ProjectState& state = it->second;
    ProcessRecord rec;
    rec.seq = state.next_process_seq++;
    rec.timestamp_ms = current_timestamp_ms();
    rec.command = command;
    state.process_activity.push_back(rec);
    while (state.process_activity.size() > kProcessHistory) {
        state.process_activity.pop_front();
    }
}

// ============================================================================
// Scheduling
// ============================================================================

void ZeroTrustIsolation::run_periodic_checks(ProjectState& state, int64_t now_ms) {
    std::vector<VerificationCheck> checks = state.boundary.verification_checks;
    bool ran = false;
    bool clean = true;

    for (const auto& check : checks) {
        if (state.quarantined) return;
        CheckState& cs = state.checks[check.check_name];

        if (check.frequency == CheckFrequency::PERIODIC) {
            int64_t interval = state.enhanced ? check.interval_ms / 2 : check.interval_ms;
            if (now_ms - cs.last_run_ms < interval) continue;
            ran = true;
            if (!verify(state, check, AccessContext())) clean = false;
        } else if (check.frequency == CheckFrequency::ON_CHANGE) {
            std::string config_path = config_file_path(state);
            bool touched = false;
            uint64_t head = engine_.last_activity_seq();
            for (const auto& rec : engine_.activity_since(state.change_cursor)) {
                if (rec.seq > head) break;
                if (rec.path == config_path && rec.operation != FileOperation::READ) {
                    touched = true;
                }
            }
            state.change_cursor = head;
            if (!touched) continue;
            ran = true;
            if (!verify(state, check, AccessContext())) clean = false;
        }
    }

    if (ran && clean && state.blocked && !state.quarantined) {
        state.blocked = false;
        LOG_INFO("[ZeroTrust] Project %s unblocked after clean verification",
                 state.boundary.project_id.c_str());
    }
}

void ZeroTrustIsolation::poll(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : projects_) {
        if (!entry.second.quarantined) {
            run_periodic_checks(entry.second, now_ms);
        }
    }
    if (now_ms - last_scan_ms_ >= config_.threat_scan_interval_ms) {
        last_scan_ms_ = now_ms;
        run_threat_scan_locked();
    }
    purge_quarantined_locked();
}

void ZeroTrustIsolation::run_threat_scan() {
    std::lock_guard<std::mutex> lock(mutex_);
    run_threat_scan_locked();
    purge_quarantined_locked();
}

void ZeroTrustIsolation::run_threat_scan_locked() {
    uint64_t head = engine_.last_activity_seq();
    std::map<std::string, std::vector<ActivityRecord>> by_project;
    for (const auto& rec : engine_.activity_since(scan_cursor_)) {
        if (rec.seq > head) break;
        const std::string& who = !rec.source_project.empty() ? rec.source_project : rec.owner_project;
        if (!who.empty()) by_project[who].push_back(rec);
    }
    scan_cursor_ = head;

    for (auto& entry : projects_) {
        ProjectState& state = entry.second;
        if (state.quarantined) continue;
        const std::vector<ActivityRecord>& records = by_project[entry.first];

        std::vector<std::string> descriptors;
        for (const auto& rec : records) descriptors.push_back(rec.descriptor());

        std::vector<std::string> commands;
        uint64_t process_head = state.process_cursor;
        for (const auto& rec : state.process_activity) {
            if (rec.seq > state.process_cursor) {
                commands.push_back(rec.command);
                process_head = std::max(process_head, rec.seq);
            }
        }
        state.process_cursor = process_head;

        if (descriptors.empty() && commands.empty()) continue;

        for (const auto& rule : default_threat_rules()) {
            if (state.quarantined) break;

            const DetectionPattern* hit = nullptr;
            std::vector<std::string> matched;
            for (const auto& pattern : rule.detection_patterns) {
                std::vector<std::string> found;
                if (pattern.pattern_type == "file_access") {
                    std::regex re(pattern.pattern);
                    for (const auto& d : descriptors) {
                        if (std::regex_search(d, re)) found.push_back(d);
                    }
                } else if (pattern.pattern_type == "process_behavior") {
                    std::regex re(pattern.pattern);
                    for (const auto& c : commands) {
                        if (std::regex_search(c, re)) found.push_back(c);
                    }
                } else if (pattern.pattern_type == "activity_rate") {
                    std::vector<std::string> parts = split(pattern.pattern, ':');
                    if (parts.size() != 2) continue;
                    size_t limit = static_cast<size_t>(std::stoul(parts[1]));
                    for (size_t i = 0; i < records.size(); ++i) {
                        if (to_string(records[i].operation) == parts[0]) found.push_back(descriptors[i]);
                    }
                    if (found.size() < limit) found.clear();
                }
                if (found.empty() || pattern.confidence < config_.threat_confidence_threshold) continue;
                if (!hit || pattern.severity > hit->severity) {
                    hit = &pattern;
                    matched = found;
                }
            }
            if (!hit) continue;

            if (matched.size() > kMaxMatchedActivity) matched.resize(kMaxMatchedActivity);
            ThreatDetectedEvent ev;
            ev.project_id = entry.first;
            ev.rule_id = rule.rule_id;
            ev.threat_category = rule.threat_category;
            ev.severity = hit->severity;
            ev.confidence = hit->confidence;
            ev.pattern = hit->pattern;
            ev.matched_activity = matched;
            events_.push(std::move(ev));

            LOG_WARN("[ZeroTrust] Threat %s (%s) detected in project %s, %zu matching records",
                     rule.rule_id.c_str(), rule.threat_category.c_str(), entry.first.c_str(), matched.size());
            respond_to_threat(state, rule);
        }
    }
}

// ============================================================================
// Threat response
// ============================================================================

void ZeroTrustIsolation::respond_to_threat(ProjectState& state, const ThreatDetectionRule& rule) {
    std::vector<ResponseAction> actions = rule.response_actions;
    std::stable_sort(actions.begin(), actions.end(),
                     [](const ResponseAction& a, const ResponseAction& b) { return a.priority < b.priority; });

    for (const auto& action : actions) {
        if (state.quarantined) break;
        bool approved = !action.requires_approval || auto_approve_ ||
                        state.authorized_actions.count(action.action) > 0;
        if (!approved) {
            PendingApproval pending;
            pending.approval_id = make_record_id("approval");
            pending.project_id = state.boundary.project_id;
            pending.rule_id = rule.rule_id;
            pending.action = action.action;
            pending.requested_ms = current_timestamp_ms();
            approvals_.push_back(pending);
            LOG_INFO("[ZeroTrust] Action %s for project %s awaits approval (%s)",
                     action.action.c_str(), pending.project_id.c_str(), pending.approval_id.c_str());
            continue;
        }
        execute_action(state, action.action, rule.rule_id);
    }
}

bool ZeroTrustIsolation::backup_configuration(ProjectState& state) {
    const std::string& id = state.boundary.project_id;
    std::string dest = join_path(join_path(config_.backups_dir(), id),
                                 compact_timestamp_ms(current_timestamp_ms()) + "-config");
    if (!ensure_directory(dest, 0700)) {
        LOG_ERROR("[ZeroTrust] Cannot create backup directory %s: %s", dest.c_str(), strerror(errno));
        return false;
    }
    bool ok = true;
    std::string content;
    if (read_file(config_file_path(state), content)) {
        ok = write_file(join_path(dest, kProjectConfigFile), content);
    }
    std::string config_dir = join_path(state.boundary.root_path, ".warden/config");
    if (is_directory(config_dir)) {
        ok = copy_tree(config_dir, join_path(dest, "config")) && ok;
    }
    if (!ok) {
        LOG_ERROR("[ZeroTrust] Configuration backup for %s incomplete", id.c_str());
    }
    return ok;
}

bool ZeroTrustIsolation::execute_action(ProjectState& state, const std::string& action,
                                        const std::string& rule_id) {
    const std::string& id = state.boundary.project_id;
    LOG_INFO("[ZeroTrust] Executing %s for project %s (rule %s)", action.c_str(), id.c_str(), rule_id.c_str());

    if (action == "block_access" || action == "immediate_block" || action == "block_modification") {
        state.blocked = true;
        return true;
    }
    if (action == "quarantine_project") {
        quarantine_locked(state, "threat rule " + rule_id, true);
        return true;
    }
    if (action == "alert_security_team" || action == "alert") {
        SecurityAlertEvent ev;
        ev.project_id = id;
        ev.source = "zero_trust";
        ev.message = "Threat rule " + rule_id + " matched";
        ev.severity = Severity::HIGH;
        events_.push(std::move(ev));
        return true;
    }
    if (action == "backup_configuration") {
        return backup_configuration(state);
    }
    if (action == "rate_limit") {
        state.rate_limited = true;
        return true;
    }
    if (action == "resource_monitoring") {
        state.enhanced = true;
        return true;
    }
    LOG_WARN("[ZeroTrust] Unknown response action %s", action.c_str());
    return false;
}

std::vector<PendingApproval> ZeroTrustIsolation::pending_approvals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return approvals_;
}

bool ZeroTrustIsolation::approve(const std::string& approval_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(approvals_.begin(), approvals_.end(),
                           [&](const PendingApproval& a) { return a.approval_id == approval_id; });
    if (it == approvals_.end()) {
        throw std::out_of_range("Unknown approval: " + approval_id);
    }
    PendingApproval pending = *it;
    approvals_.erase(it);

    auto project = projects_.find(pending.project_id);
    if (project == projects_.end() || project->second.quarantined) {
        LOG_WARN("[ZeroTrust] Approval %s refers to project %s which is no longer isolated",
                 approval_id.c_str(), pending.project_id.c_str());
        return false;
    }
    bool ok = execute_action(project->second, pending.action, pending.rule_id);
    purge_quarantined_locked();
    return ok;
}

void ZeroTrustIsolation::authorize(const std::string& project_id, const std::string& action) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = projects_.find(project_id);
    if (it == projects_.end() || it->second.quarantined) {
        throw std::out_of_range("Unknown project: " + project_id);
    }
    it->second.authorized_actions.insert(action);
}

void ZeroTrustIsolation::set_auto_approve(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto_approve_ = enabled;
}

// ============================================================================
// Reporting
// ============================================================================

double ZeroTrustIsolation::health_score() const {
    std::lock_guard<std::mutex> lock(mutex_);
    double sum = 0.0;
    size_t n = 0;
    for (const auto& entry : projects_) {
        if (entry.second.quarantined) continue;
        sum += entry.second.boundary.metrics.boundary_integrity_score;
        ++n;
    }
    return n == 0 ? 100.0 : sum / static_cast<double>(n);
}

Json ZeroTrustIsolation::compliance_report() const {
    Json projects = Json::array();
    Json quarantined = Json::array();
    Json approvals = Json::array();
    int compromised = 0;
    int breach_attempts = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : projects_) {
            const ProjectState& s = entry.second;
            if (s.quarantined) continue;
            Json j = to_json(s.boundary);
            j["blocked"] = s.blocked;
            j["rate_limited"] = s.rate_limited;
            j["enhanced_monitoring"] = s.enhanced;
            projects.push_back(j);
            if (s.boundary.metrics.boundary_integrity_score < kCompromiseThreshold) ++compromised;
            breach_attempts += s.boundary.metrics.breach_attempts;
        }
        for (const auto& entry : quarantined_) {
            quarantined.push_back({{"project_id", entry.first}, {"reason", entry.second}});
        }
        for (const auto& a : approvals_) {
            approvals.push_back({
                {"approval_id", a.approval_id},
                {"project_id", a.project_id},
                {"rule_id", a.rule_id},
                {"action", a.action},
                {"requested_at", format_timestamp_ms(a.requested_ms)}
            });
        }
    }

    Json rules = Json::array();
    for (const auto& rule : default_threat_rules()) {
        rules.push_back(to_json(rule));
    }

    return Json{
        {"generated_at", format_timestamp_ms(current_timestamp_ms())},
        {"principles", {"never_trust_always_verify", "least_privilege", "assume_breach",
                        "verify_explicitly", "microsegmentation"}},
        {"project_boundaries", projects},
        {"quarantined_projects", quarantined},
        {"threat_rules", rules},
        {"pending_approvals", approvals},
        {"summary", {
            {"isolated_projects", projects.size()},
            {"compromised_boundaries", compromised},
            {"breach_attempts", breach_attempts},
            {"health_score", health_score()}
        }}
    };
}

} // namespace warden
