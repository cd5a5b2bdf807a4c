/*
 * warden C++17 - BoundaryEngine Implementation
 */
#include <warden/security/boundary_engine.hpp>
#include <warden/security/path_guard.hpp>
#include <warden/security/glob.hpp>
#include <warden/core/logger.hpp>
#include <warden/core/utils.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <sys/stat.h>

namespace warden {

namespace {

const int64_t kSuppressMs = 5000;

const char* kExecutableExtensions[] = {
    ".sh", ".bash", ".exe", ".bat", ".cmd", ".ps1"
};

bool is_write_operation(FileOperation op) {
    return op == FileOperation::CREATE || op == FileOperation::MODIFY ||
           op == FileOperation::EXECUTABLE_CREATION;
}

bool has_condition(const BoundaryRule& rule, Condition c) {
    return std::find(rule.conditions.begin(), rule.conditions.end(), c) != rule.conditions.end();
}

// Derived from the matched rule, most specific condition first
std::string violation_type_for(const BoundaryRule& rule, FileOperation op) {
    if (has_condition(rule, Condition::IS_EXECUTABLE)) return "executable_creation";
    if (has_condition(rule, Condition::CROSSES_PROJECT_BOUNDARY)) {
        return is_write_operation(op) || op == FileOperation::DELETE ? "cross_boundary_write"
                                                                     : "cross_boundary_access";
    }
    if (has_condition(rule, Condition::PATH_TRAVERSAL)) return "path_traversal";
    if (has_condition(rule, Condition::IS_SYMLINK)) return "symlink_attack";
    if (has_condition(rule, Condition::FORBIDDEN_PATH)) return "forbidden_path_access";
    return "unauthorized_access";
}

std::string yes_no(bool v) {
    return v ? "yes" : "no";
}

} // namespace

// ============================================================================
// Records
// ============================================================================

Json to_json(const FileSystemBoundary& b) {
    Json rules = Json::array();
    for (const auto& r : b.access_rules) {
        rules.push_back(to_json(r));
    }
    return Json{
        {"boundary_id", b.boundary_id},
        {"boundary_type", to_string(b.boundary_type)},
        {"root_path", sanitize_utf8(b.root_path)},
        {"allowed_paths", b.allowed_paths},
        {"forbidden_paths", b.forbidden_paths},
        {"access_rules", rules},
        {"integrity_hash", b.integrity_hash},
        {"last_integrity_check", b.last_integrity_check_ms > 0
                                     ? Json(format_timestamp_ms(b.last_integrity_check_ms))
                                     : Json(nullptr)},
        {"enforcement_level", to_string(b.enforcement_level)},
        {"monitoring_enabled", b.monitoring_enabled},
        {"project_id", b.project_id ? Json(*b.project_id) : Json(nullptr)}
    };
}

std::string ActivityRecord::descriptor() const {
    bool cross = !source_project.empty() && !owner_project.empty() && source_project != owner_project;
    return "op=" + to_string(operation) +
           " scope=" + (source_project.empty() ? "-" : source_project) +
           " owner=" + (owner_project.empty() ? "-" : owner_project) +
           " cross=" + yes_no(cross) +
           " zone=" + zone +
           " exec=" + yes_no(executable) +
           " gate=" + yes_no(gate) +
           " allowed=" + yes_no(allowed) +
           " path=" + path;
}

// ============================================================================
// Construction and lifecycle
// ============================================================================

BoundaryEngine::BoundaryEngine(const SecurityConfig& config, PathGuard& path_guard, EventQueue& events)
    : config_(config)
    , path_guard_(path_guard)
    , events_(events)
    , running_(false)
    , last_integrity_run_ms_(monotonic_ms())
    , started_ms_(monotonic_ms())
    , total_violations_(0)
    , next_seq_(1)
{
    seed_default_boundaries();
}

BoundaryEngine::~BoundaryEngine() {
    stop();
}

void BoundaryEngine::seed_default_boundaries() {
    const std::string fw = config_.framework_root;

    FileSystemBoundary core;
    core.boundary_id = "framework_core";
    core.boundary_type = BoundaryType::FRAMEWORK_CORE;
    core.root_path = fw;
    core.allowed_paths = { join_path(fw, "docs"), join_path(fw, "examples") };
    core.enforcement_level = EnforcementLevel::BLOCKING;
    core.monitoring_enabled = true;
    core.access_rules = {
        BoundaryRule("fw_deny_project_write", "**", join_path(fw, "**"),
                     RuleAction::DENY, EnforcementLevel::BLOCKING,
                     {Condition::WRITE_OPERATION, Condition::CROSSES_PROJECT_BOUNDARY}, 1),
        BoundaryRule("fw_prevent_contamination", "**", join_path(fw, ".warden/**"),
                     RuleAction::DENY, EnforcementLevel::BLOCKING,
                     {Condition::WRITE_OPERATION}, 1),
        BoundaryRule("fw_prevent_executable_creation", "**", join_path(fw, "**"),
                     RuleAction::DENY, EnforcementLevel::BLOCKING,
                     {Condition::WRITE_OPERATION, Condition::IS_EXECUTABLE}, 2),
    };
    install_boundary(core);

    const std::string qdir = config_.quarantine_dir();
    if (!ensure_directory(qdir, 0700)) {
        LOG_ERROR("[BoundaryEngine] Cannot create quarantine directory %s: %s",
                  qdir.c_str(), strerror(errno));
    }
    FileSystemBoundary quarantine;
    quarantine.boundary_id = "quarantine";
    quarantine.boundary_type = BoundaryType::QUARANTINE;
    quarantine.root_path = qdir;
    quarantine.enforcement_level = EnforcementLevel::QUARANTINE;
    quarantine.monitoring_enabled = false;
    quarantine.access_rules = {
        BoundaryRule("quarantine_deny_executables", "**", join_path(qdir, "**"),
                     RuleAction::DENY, EnforcementLevel::BLOCKING,
                     {Condition::IS_EXECUTABLE}, 1),
        BoundaryRule("quarantine_deny_project_access", "**", join_path(qdir, "**"),
                     RuleAction::DENY, EnforcementLevel::BLOCKING,
                     {Condition::CROSSES_PROJECT_BOUNDARY}, 2),
        BoundaryRule("quarantine_audit_all", "**", join_path(qdir, "**"),
                     RuleAction::AUDIT, EnforcementLevel::ADVISORY,
                     {Condition::ALWAYS}, 10),
    };
    install_boundary(quarantine);
}

void BoundaryEngine::install_boundary(FileSystemBoundary boundary) {
    boundary.root_path = normalize_path(boundary.root_path);
    const std::string id = boundary.boundary_id;
    const std::string root = boundary.root_path;
    const bool monitored = boundary.monitoring_enabled;
    {
        std::lock_guard<std::mutex> lock(boundaries_mutex_);
        boundaries_[id] = std::move(boundary);
        dirty_.erase(id);
    }
    if (monitored) {
        std::lock_guard<std::mutex> lock(watch_mutex_);
        if (running_ && watcher_) {
            watcher_->add_tree(root);
        }
    }
    LOG_INFO("[BoundaryEngine] Registered boundary %s at %s", id.c_str(), root.c_str());
}

bool BoundaryEngine::start() {
    std::vector<std::string> roots;
    {
        std::lock_guard<std::mutex> lock(boundaries_mutex_);
        for (const auto& entry : boundaries_) {
            if (entry.second.monitoring_enabled) {
                roots.push_back(entry.second.root_path);
            }
        }
    }

    std::lock_guard<std::mutex> lock(watch_mutex_);
    if (running_) return true;

    watcher_ = std::make_unique<FileWatcher>();
    if (!watcher_->valid()) {
        watcher_.reset();
        LOG_ERROR("[BoundaryEngine] Filesystem monitoring unavailable");
        return false;
    }
    for (const auto& root : roots) {
        watcher_->add_tree(root);
    }
    running_ = true;
    LOG_INFO("[BoundaryEngine] Monitoring %zu boundaries (%zu directories)",
             roots.size(), watcher_->watch_count());
    return true;
}

void BoundaryEngine::stop() {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    if (!running_) return;
    running_ = false;
    if (watcher_) {
        watcher_->remove_all();
        watcher_.reset();
    }
    pending_.clear();
    LOG_INFO("[BoundaryEngine] Monitoring stopped");
}

// ============================================================================
// Registry
// ============================================================================

std::string BoundaryEngine::add_project_boundary(const std::string& project_id, const std::string& root,
                                                 bool allow_executables) {
    std::string id = "project_" + project_id;
    {
        std::lock_guard<std::mutex> lock(boundaries_mutex_);
        if (boundaries_.count(id)) {
            throw std::invalid_argument("Boundary already exists: " + id);
        }
    }

    std::string r = normalize_path(root);
    std::string target = join_path(r, "**");

    FileSystemBoundary b;
    b.boundary_id = id;
    b.boundary_type = BoundaryType::PROJECT_SANDBOX;
    b.root_path = r;
    b.project_id = project_id;
    b.enforcement_level = EnforcementLevel::BLOCKING;
    b.monitoring_enabled = true;
    b.allowed_paths = { r };
    b.forbidden_paths = { join_path(r, ".warden/**"), join_path(r, ".warden-framework/**") };
    b.access_rules = {
        BoundaryRule("proj_deny_cross_access", "**", target,
                     RuleAction::DENY, EnforcementLevel::BLOCKING,
                     {Condition::CROSSES_PROJECT_BOUNDARY}, 1),
        BoundaryRule("proj_prevent_traversal", "**", target,
                     RuleAction::QUARANTINE, EnforcementLevel::QUARANTINE,
                     {Condition::PATH_TRAVERSAL}, 1),
        BoundaryRule("proj_prevent_symlink", "**", target,
                     RuleAction::DENY, EnforcementLevel::BLOCKING,
                     {Condition::IS_SYMLINK, Condition::WRITE_OPERATION}, 2),
        BoundaryRule("proj_deny_executables", "**", target,
                     RuleAction::DENY, EnforcementLevel::BLOCKING,
                     {Condition::WRITE_OPERATION, Condition::IS_EXECUTABLE}, 3, !allow_executables),
    };
    install_boundary(b);
    return id;
}

std::string BoundaryEngine::add_shared_resource(const std::string& resource_id, const std::string& root) {
    std::string id = "shared_" + resource_id;
    std::string r = normalize_path(root);
    std::string target = join_path(r, "**");

    FileSystemBoundary b;
    b.boundary_id = id;
    b.boundary_type = BoundaryType::SHARED_RESOURCE;
    b.root_path = r;
    b.enforcement_level = EnforcementLevel::BLOCKING;
    b.monitoring_enabled = true;
    b.allowed_paths = { r };
    b.access_rules = {
        BoundaryRule("shared_read_only", "**", target,
                     RuleAction::ALLOW, EnforcementLevel::ADVISORY,
                     {Condition::READ_OPERATION}, 3),
        BoundaryRule("shared_deny_write", "**", target,
                     RuleAction::DENY, EnforcementLevel::BLOCKING,
                     {Condition::WRITE_OPERATION, Condition::CROSSES_PROJECT_BOUNDARY}, 5),
    };
    install_boundary(b);
    path_guard_.add_allowed_root(r);
    return id;
}

bool BoundaryEngine::remove_boundary(const std::string& boundary_id) {
    std::string root;
    {
        std::lock_guard<std::mutex> lock(boundaries_mutex_);
        auto it = boundaries_.find(boundary_id);
        if (it == boundaries_.end()) return false;
        root = it->second.root_path;
        boundaries_.erase(it);
        dirty_.erase(boundary_id);
    }
    {
        std::lock_guard<std::mutex> lock(watch_mutex_);
        if (watcher_) {
            watcher_->remove_tree(root);
        }
        for (auto it = pending_.begin(); it != pending_.end(); ) {
            if (path_is_under(it->first, root)) {
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }
    }
    LOG_INFO("[BoundaryEngine] Removed boundary %s", boundary_id.c_str());
    return true;
}

bool BoundaryEngine::remove_project_boundary(const std::string& project_id) {
    return remove_boundary("project_" + project_id);
}

std::optional<FileSystemBoundary> BoundaryEngine::boundary(const std::string& boundary_id) const {
    std::lock_guard<std::mutex> lock(boundaries_mutex_);
    auto it = boundaries_.find(boundary_id);
    if (it == boundaries_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> BoundaryEngine::boundary_ids() const {
    std::lock_guard<std::mutex> lock(boundaries_mutex_);
    std::vector<std::string> ids;
    for (const auto& entry : boundaries_) {
        ids.push_back(entry.first);
    }
    return ids;
}

void BoundaryEngine::add_rule(const std::string& boundary_id, const BoundaryRule& rule) {
    std::lock_guard<std::mutex> lock(boundaries_mutex_);
    auto it = boundaries_.find(boundary_id);
    if (it == boundaries_.end()) {
        throw std::out_of_range("Unknown boundary: " + boundary_id);
    }
    auto& rules = it->second.access_rules;
    auto existing = std::find_if(rules.begin(), rules.end(),
                                 [&](const BoundaryRule& r) { return r.rule_id == rule.rule_id; });
    if (existing != rules.end()) {
        *existing = rule;
    } else {
        rules.push_back(rule);
    }
}

bool BoundaryEngine::set_rule_enabled(const std::string& boundary_id, const std::string& rule_id, bool enabled) {
    std::lock_guard<std::mutex> lock(boundaries_mutex_);
    auto it = boundaries_.find(boundary_id);
    if (it == boundaries_.end()) {
        throw std::out_of_range("Unknown boundary: " + boundary_id);
    }
    for (auto& r : it->second.access_rules) {
        if (r.rule_id == rule_id) {
            r.enabled = enabled;
            return true;
        }
    }
    return false;
}

void BoundaryEngine::set_execution_context(const std::optional<std::string>& project_id) {
    std::lock_guard<std::mutex> lock(context_mutex_);
    execution_context_ = project_id;
}

std::optional<std::string> BoundaryEngine::execution_context() const {
    std::lock_guard<std::mutex> lock(context_mutex_);
    return execution_context_;
}

const FileSystemBoundary* BoundaryEngine::find_boundary_locked(const std::string& path) const {
    const FileSystemBoundary* best = nullptr;
    for (const auto& entry : boundaries_) {
        const FileSystemBoundary& b = entry.second;
        if (!path_is_under(path, b.root_path)) continue;
        if (!best || b.root_path.size() > best->root_path.size()) {
            best = &b;
        }
    }
    return best;
}

std::optional<std::string> BoundaryEngine::project_for_path(const std::string& path) const {
    std::string n = normalize_path(path);
    std::lock_guard<std::mutex> lock(boundaries_mutex_);
    const FileSystemBoundary* best = nullptr;
    for (const auto& entry : boundaries_) {
        const FileSystemBoundary& b = entry.second;
        if (b.boundary_type != BoundaryType::PROJECT_SANDBOX || !b.project_id) continue;
        if (!path_is_under(n, b.root_path)) continue;
        if (!best || b.root_path.size() > best->root_path.size()) {
            best = &b;
        }
    }
    if (!best) return std::nullopt;
    return best->project_id;
}

// ============================================================================
// Rule evaluation
// ============================================================================

bool BoundaryEngine::is_executable_path(const std::string& path) {
    struct stat st;
    if (lstat(path.c_str(), &st) == 0) {
        if (!S_ISREG(st.st_mode)) return false;
        if (st.st_mode & (S_IXUSR | S_IXGRP | S_IXOTH)) return true;
    }
    std::string lower = to_lower(path);
    for (const char* ext : kExecutableExtensions) {
        if (ends_with(lower, ext)) return true;
    }
    return false;
}

std::string BoundaryEngine::source_path_for(const std::string& project_id) const {
    if (project_id.empty()) return "";
    return path_guard_.project_root(project_id);
}

bool BoundaryEngine::condition_holds(Condition condition, const FileSystemBoundary& boundary,
                                     const RuleContext& ctx) const {
    switch (condition) {
        case Condition::ALWAYS:
            return true;
        case Condition::WRITE_OPERATION:
            return is_write_operation(ctx.operation);
        case Condition::READ_OPERATION:
            return ctx.operation == FileOperation::READ;
        case Condition::DELETE_OPERATION:
            return ctx.operation == FileOperation::DELETE;
        case Condition::IS_EXECUTABLE:
            return ctx.executable;
        case Condition::CROSSES_PROJECT_BOUNDARY:
            return !ctx.source_project.empty() && ctx.source_project != ctx.owner_project;
        case Condition::PATH_TRAVERSAL:
            return path_guard_.inspect(ctx.target, std::nullopt, Operation::READ).attack_type.has_value();
        case Condition::IS_SYMLINK:
            return is_symlink(ctx.target);
        case Condition::FORBIDDEN_PATH:
            for (const auto& pattern : boundary.forbidden_paths) {
                if (glob_match(pattern, ctx.target)) return true;
            }
            return false;
    }
    return false;
}

std::optional<BoundaryRule> BoundaryEngine::evaluate_rules(const FileSystemBoundary& boundary,
                                                           const RuleContext& ctx) const {
    std::vector<BoundaryRule> rules = boundary.access_rules;
    std::stable_sort(rules.begin(), rules.end(), [](const BoundaryRule& a, const BoundaryRule& b) {
        if (a.priority != b.priority) return a.priority < b.priority;
        return a.rule_id < b.rule_id;
    });

    const std::string source = source_path_for(ctx.source_project);
    std::optional<BoundaryRule> winner;
    for (const auto& rule : rules) {
        if (!rule.enabled) continue;
        if (!glob_match(rule.source_pattern, source)) continue;
        if (!glob_match(rule.target_pattern, ctx.target)) continue;
        bool all = true;
        for (auto c : rule.conditions) {
            if (!condition_holds(c, boundary, ctx)) {
                all = false;
                break;
            }
        }
        if (all) {
            winner = rule;
            break;
        }
    }

    bool denies = winner && (winner->action == RuleAction::DENY || winner->action == RuleAction::QUARANTINE);
    if (!denies) {
        for (const auto& pattern : boundary.forbidden_paths) {
            if (glob_match(pattern, ctx.target)) {
                return BoundaryRule("forbidden_path", "**", pattern,
                                    RuleAction::DENY, EnforcementLevel::BLOCKING,
                                    {Condition::FORBIDDEN_PATH}, 0);
            }
        }
    }
    return winner;
}

BoundaryViolation BoundaryEngine::make_violation(const FileSystemBoundary& boundary, const BoundaryRule& rule,
                                                 const RuleContext& ctx) const {
    BoundaryViolation v;
    v.id = make_record_id("violation");
    v.timestamp_ms = current_timestamp_ms();
    v.violation_type = violation_type_for(rule, ctx.operation);
    v.source_path = source_path_for(ctx.source_project);
    v.target_path = ctx.target;
    if (!ctx.source_project.empty()) {
        v.project_id = ctx.source_project;
    } else if (!ctx.owner_project.empty()) {
        v.project_id = ctx.owner_project;
    }
    v.boundary_id = boundary.boundary_id;
    v.rule_id = rule.rule_id;
    v.action = rule.action;
    v.enforcement_level = rule.enforcement_level;

    bool prot = path_guard_.is_protected(ctx.target);
    if (rule.action == RuleAction::QUARANTINE) {
        v.severity = Severity::CRITICAL;
    } else if (boundary.boundary_type == BoundaryType::SHARED_RESOURCE) {
        v.severity = prot ? Severity::HIGH : Severity::MEDIUM;
    } else {
        v.severity = prot ? Severity::CRITICAL : Severity::HIGH;
    }

    if (rule.enforcement_level == EnforcementLevel::ADVISORY) {
        v.remediation_action = "log_violation";
    } else if (rule.action == RuleAction::QUARANTINE) {
        v.remediation_action = "quarantine_artifact";
    } else {
        v.remediation_action = "delete_artifact";
    }

    Json conditions = Json::array();
    for (auto c : rule.conditions) {
        conditions.push_back(to_string(c));
    }
    v.evidence = Json{
        {"file_operation", to_string(ctx.operation)},
        {"boundary_type", to_string(boundary.boundary_type)},
        {"boundary_root", boundary.root_path},
        {"rule_priority", rule.priority},
        {"matched_conditions", conditions},
        {"executable", ctx.executable},
        {"protected_path", prot},
        {"source_project", ctx.source_project.empty() ? Json(nullptr) : Json(ctx.source_project)},
        {"owner_project", ctx.owner_project.empty() ? Json(nullptr) : Json(ctx.owner_project)}
    };
    return v;
}

void BoundaryEngine::store_violation(const BoundaryViolation& violation) {
    std::lock_guard<std::mutex> lock(violations_mutex_);
    violations_.push_back(violation);
    while (violations_.size() > config_.attempt_ring_size) {
        violations_.pop_front();
    }
    ++total_violations_;
}

void BoundaryEngine::record_activity(const RuleContext& ctx, const std::string& zone, bool allowed, bool gate) {
    ActivityRecord rec;
    rec.timestamp_ms = current_timestamp_ms();
    rec.source_project = ctx.source_project;
    rec.owner_project = ctx.owner_project;
    rec.zone = zone;
    rec.operation = ctx.operation;
    rec.path = ctx.target;
    rec.allowed = allowed;
    rec.executable = ctx.executable;
    rec.gate = gate;

    std::lock_guard<std::mutex> lock(activity_mutex_);
    rec.seq = next_seq_++;
    activity_.push_back(rec);
    while (activity_.size() > config_.activity_journal_size) {
        activity_.pop_front();
    }
}

void BoundaryEngine::mark_dirty(const std::string& path) {
    std::lock_guard<std::mutex> lock(boundaries_mutex_);
    for (const auto& entry : boundaries_) {
        if (path_is_under(path, entry.second.root_path)) {
            dirty_.insert(entry.first);
        }
    }
}

void BoundaryEngine::suppress(const std::string& path) {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    suppressed_[path] = monotonic_ms() + kSuppressMs;
    pending_.erase(path);
}

// ============================================================================
// Event handling and enforcement
// ============================================================================

std::optional<BoundaryViolation> BoundaryEngine::handle_filesystem_event(const FileEvent& event) {
    RuleContext ctx;
    ctx.target = normalize_path(event.path);
    ctx.operation = event.operation;
    ctx.source_project = event.source_project.value_or("");
    ctx.executable = event.operation == FileOperation::EXECUTABLE_CREATION ||
                     (event.operation != FileOperation::DELETE && is_executable_path(ctx.target));

    FileSystemBoundary boundary;
    {
        std::lock_guard<std::mutex> lock(boundaries_mutex_);
        const FileSystemBoundary* b = find_boundary_locked(ctx.target);
        if (!b) return std::nullopt;
        boundary = *b;
    }
    ctx.owner_project = boundary.project_id.value_or("");
    mark_dirty(ctx.target);

    std::optional<BoundaryRule> rule = evaluate_rules(boundary, ctx);
    bool denied = rule && (rule->action == RuleAction::DENY || rule->action == RuleAction::QUARANTINE);
    record_activity(ctx, to_string(boundary.boundary_type), !denied, false);

    if (!rule || rule->action == RuleAction::ALLOW) {
        return std::nullopt;
    }
    if (rule->action == RuleAction::AUDIT) {
        LOG_INFO("[BoundaryEngine] Audit %s %s in %s (rule %s)",
                 to_string(ctx.operation).c_str(), ctx.target.c_str(),
                 boundary.boundary_id.c_str(), rule->rule_id.c_str());
        return std::nullopt;
    }

    BoundaryViolation violation = make_violation(boundary, *rule, ctx);
    bool enforced = enforce(violation);
    violation.blocked = enforced && violation.enforcement_level != EnforcementLevel::ADVISORY;
    violation.evidence["enforcement"] = Json{
        {"action", violation.remediation_action},
        {"success", enforced}
    };

    LOG_WARN("[BoundaryEngine] %s: %s %s in %s (rule %s, %s)",
             violation.violation_type.c_str(), to_string(ctx.operation).c_str(),
             ctx.target.c_str(), boundary.boundary_id.c_str(), rule->rule_id.c_str(),
             to_string(violation.severity).c_str());

    store_violation(violation);
    ViolationDetectedEvent ev;
    ev.violation = violation;
    events_.push(std::move(ev));
    return violation;
}

bool BoundaryEngine::quarantine_artifact(const BoundaryViolation& violation, std::string& detail) {
    const std::string& target = violation.target_path;
    const std::string qdir = config_.quarantine_dir();
    if (!ensure_directory(qdir, 0700)) {
        detail = std::string("cannot create quarantine directory: ") + strerror(errno);
        return false;
    }

    int64_t now = current_timestamp_ms();
    std::string dest = join_path(qdir, compact_timestamp_ms(now) + "-" + base_name(target));
    std::string digest = sha256_file(target);
    if (!move_file(target, dest)) {
        detail = std::string("move failed: ") + strerror(errno);
        return false;
    }

    Json metadata = {
        {"original_path", sanitize_utf8(target)},
        {"quarantined_at", format_timestamp_ms(now)},
        {"violation_id", violation.id},
        {"rule_id", violation.rule_id},
        {"project_id", violation.project_id ? Json(*violation.project_id) : Json(nullptr)},
        {"sha256", digest}
    };
    if (!write_file(dest + ".metadata.json", dump_json(metadata, 2))) {
        LOG_ERROR("[BoundaryEngine] Failed to write quarantine metadata for %s: %s",
                  dest.c_str(), strerror(errno));
    }
    detail = dest;
    return true;
}

bool BoundaryEngine::enforce(const BoundaryViolation& violation) {
    const std::string& target = violation.target_path;

    if (violation.enforcement_level == EnforcementLevel::ADVISORY) {
        if (!append_line(config_.violations_log_path(), dump_json(to_json(violation)))) {
            LOG_ERROR("[BoundaryEngine] Failed to append %s: %s",
                      config_.violations_log_path().c_str(), strerror(errno));
            return false;
        }
        return true;
    }

    suppress(target);
    mark_dirty(target);

    if (violation.action == RuleAction::QUARANTINE) {
        mark_dirty(config_.quarantine_dir());
        std::string detail;
        if (!quarantine_artifact(violation, detail)) {
            LOG_ERROR("[BoundaryEngine] Failed to quarantine %s: %s", target.c_str(), detail.c_str());
            return false;
        }
        LOG_WARN("[BoundaryEngine] Quarantined %s -> %s", target.c_str(), detail.c_str());
        return true;
    }

    if (!remove_recursive(target)) {
        LOG_ERROR("[BoundaryEngine] Failed to remove %s: %s", target.c_str(), strerror(errno));
        return false;
    }
    LOG_WARN("[BoundaryEngine] Removed %s", target.c_str());
    return true;
}

AccessDecision BoundaryEngine::validate_file_access(const std::string& path, Operation operation,
                                                    const std::string& project_id) {
    AccessDecision decision;
    SafePath safe = path_guard_.inspect(path, project_id, operation);

    RuleContext ctx;
    ctx.target = safe.sanitized_path;
    ctx.source_project = project_id;
    switch (operation) {
        case Operation::READ:
            ctx.operation = FileOperation::READ;
            break;
        case Operation::WRITE:
            ctx.operation = file_exists(ctx.target) ? FileOperation::MODIFY : FileOperation::CREATE;
            break;
        case Operation::DELETE:
            ctx.operation = FileOperation::DELETE;
            break;
        case Operation::EXECUTE:
            ctx.operation = FileOperation::READ;
            break;
    }
    ctx.executable = operation == Operation::EXECUTE ||
                     (operation != Operation::DELETE && is_executable_path(ctx.target));

    FileSystemBoundary boundary;
    bool found = false;
    {
        std::lock_guard<std::mutex> lock(boundaries_mutex_);
        const FileSystemBoundary* b = find_boundary_locked(ctx.target);
        if (b) {
            boundary = *b;
            found = true;
        }
    }
    if (found) {
        ctx.owner_project = boundary.project_id.value_or("");
    }
    const std::string zone = found ? to_string(boundary.boundary_type) : std::string("none");

    // Rejected paths are journaled too so threat rules see the attempt
    if (!safe.is_safe) {
        decision.allowed = false;
        decision.reason = safe.violations.empty() ? "Unsafe path" : safe.violations.front();
        record_activity(ctx, zone, false, true);
        return decision;
    }
    if (!found) {
        decision.reason = "No boundary governs path";
        record_activity(ctx, zone, true, true);
        return decision;
    }

    std::optional<BoundaryRule> rule = evaluate_rules(boundary, ctx);
    bool denied = rule && (rule->action == RuleAction::DENY || rule->action == RuleAction::QUARANTINE);
    record_activity(ctx, zone, !denied, true);

    if (!denied) {
        if (rule && rule->action == RuleAction::AUDIT) {
            LOG_INFO("[BoundaryEngine] Audit gate %s %s (rule %s)",
                     to_string(operation).c_str(), ctx.target.c_str(), rule->rule_id.c_str());
        }
        if (ctx.operation != FileOperation::READ) {
            mark_dirty(ctx.target);
        }
        decision.reason = rule ? "Allowed by rule " + rule->rule_id : "No matching rule";
        return decision;
    }

    BoundaryViolation violation = make_violation(boundary, *rule, ctx);
    violation.blocked = true;
    violation.remediation_action = "access_denied";
    violation.evidence["gate"] = true;
    violation.evidence["requested_operation"] = to_string(operation);

    LOG_WARN("[BoundaryEngine] Denied %s of %s for project %s (rule %s)",
             to_string(operation).c_str(), ctx.target.c_str(), project_id.c_str(), rule->rule_id.c_str());

    store_violation(violation);
    ViolationDetectedEvent ev;
    ev.violation = violation;
    events_.push(std::move(ev));

    decision.allowed = false;
    decision.reason = "Denied by rule " + rule->rule_id + " (" + violation.violation_type + ")";
    decision.violation = violation;
    return decision;
}

// ============================================================================
// Watch loop
// ============================================================================

void BoundaryEngine::queue_change(const WatchEvent& event, int64_t now_ms) {
    if (event.is_directory) return;
    std::string path = normalize_path(event.path);
    if (path_is_under(path, config_.security_dir())) return;

    auto sup = suppressed_.find(path);
    if (sup != suppressed_.end()) {
        if (sup->second > monotonic_ms()) return;
        suppressed_.erase(sup);
    }

    struct stat st;
    int64_t size = 0, mtime = 0;
    if (lstat(path.c_str(), &st) == 0) {
        size = static_cast<int64_t>(st.st_size);
        mtime = static_cast<int64_t>(st.st_mtime);
    }

    auto it = pending_.find(path);
    switch (event.kind) {
        case WatchEvent::CREATED:
            if (it != pending_.end() && it->second.operation == FileOperation::DELETE) {
                it->second = PendingChange{FileOperation::MODIFY, now_ms, size, mtime};
            } else {
                pending_[path] = PendingChange{FileOperation::CREATE, now_ms, size, mtime};
            }
            break;
        case WatchEvent::MODIFIED:
            if (it != pending_.end() && it->second.operation == FileOperation::CREATE) {
                it->second.last_change_ms = now_ms;
                it->second.size = size;
                it->second.mtime = mtime;
            } else {
                pending_[path] = PendingChange{FileOperation::MODIFY, now_ms, size, mtime};
            }
            break;
        case WatchEvent::DELETED:
            if (it != pending_.end() && it->second.operation == FileOperation::CREATE) {
                // Transient file: created and removed within the debounce window
                pending_.erase(it);
            } else {
                pending_[path] = PendingChange{FileOperation::DELETE, now_ms, 0, 0};
            }
            break;
    }
}

void BoundaryEngine::process_due_changes(int64_t now_ms) {
    std::vector<FileEvent> due;
    std::optional<std::string> source = execution_context();
    {
        std::lock_guard<std::mutex> lock(watch_mutex_);
        for (auto it = pending_.begin(); it != pending_.end(); ) {
            PendingChange& change = it->second;
            if (now_ms - change.last_change_ms < config_.debounce_ms) {
                ++it;
                continue;
            }
            FileOperation op = change.operation;
            if (op != FileOperation::DELETE) {
                struct stat st;
                if (lstat(it->first.c_str(), &st) != 0) {
                    it = pending_.erase(it);
                    continue;
                }
                if (static_cast<int64_t>(st.st_size) != change.size ||
                    static_cast<int64_t>(st.st_mtime) != change.mtime) {
                    // Still being written
                    change.size = static_cast<int64_t>(st.st_size);
                    change.mtime = static_cast<int64_t>(st.st_mtime);
                    change.last_change_ms = now_ms;
                    ++it;
                    continue;
                }
                if (is_executable_path(it->first)) {
                    op = FileOperation::EXECUTABLE_CREATION;
                }
            }
            due.push_back(FileEvent(it->first, op, source));
            it = pending_.erase(it);
        }
    }

    for (const auto& ev : due) {
        handle_filesystem_event(ev);
    }
}

void BoundaryEngine::poll(int64_t now_ms) {
    {
        std::lock_guard<std::mutex> lock(watch_mutex_);
        if (running_ && watcher_) {
            for (const auto& ev : watcher_->poll()) {
                queue_change(ev, now_ms);
            }
        }
    }
    process_due_changes(now_ms);

    if (now_ms - last_integrity_run_ms_ >= config_.integrity_check_interval_ms) {
        last_integrity_run_ms_ = now_ms;
        check_all_integrity();
    }
}

bool BoundaryEngine::has_pending_events(const std::string& root) const {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    for (const auto& entry : pending_) {
        if (path_is_under(entry.first, root)) return true;
    }
    return false;
}

// ============================================================================
// Integrity
// ============================================================================

bool BoundaryEngine::check_integrity(const std::string& boundary_id) {
    std::string root;
    bool was_dirty = false;
    {
        std::lock_guard<std::mutex> lock(boundaries_mutex_);
        auto it = boundaries_.find(boundary_id);
        if (it == boundaries_.end()) {
            throw std::out_of_range("Unknown boundary: " + boundary_id);
        }
        root = it->second.root_path;
        was_dirty = dirty_.erase(boundary_id) > 0;
    }

    if (has_pending_events(root)) {
        LOG_DEBUG("[BoundaryEngine] Integrity check of %s deferred, changes pending", boundary_id.c_str());
        if (was_dirty) {
            std::lock_guard<std::mutex> lock(boundaries_mutex_);
            dirty_.insert(boundary_id);
        }
        return true;
    }

    std::string current = hash_directory(root);

    IntegrityViolationEvent ev;
    {
        std::lock_guard<std::mutex> lock(boundaries_mutex_);
        auto it = boundaries_.find(boundary_id);
        if (it == boundaries_.end()) return true;
        FileSystemBoundary& b = it->second;
        b.last_integrity_check_ms = current_timestamp_ms();

        if (b.integrity_hash.empty() || was_dirty || dirty_.count(boundary_id)) {
            b.integrity_hash = current;
            return true;
        }
        if (current == b.integrity_hash) {
            return true;
        }

        ev.boundary_id = b.boundary_id;
        ev.boundary_type = b.boundary_type;
        ev.root_path = b.root_path;
        ev.expected_hash = b.integrity_hash;
        ev.actual_hash = current;
        ev.project_id = b.project_id;
        b.integrity_hash = current;
    }

    LOG_ERROR("[BoundaryEngine] Integrity violation in %s (%s): content changed outside monitored activity",
              boundary_id.c_str(), root.c_str());
    events_.push(std::move(ev));
    return false;
}

void BoundaryEngine::check_all_integrity() {
    for (const auto& id : boundary_ids()) {
        check_integrity(id);
    }
}

// ============================================================================
// Queries
// ============================================================================

std::vector<ActivityRecord> BoundaryEngine::activity_since(uint64_t seq) const {
    std::lock_guard<std::mutex> lock(activity_mutex_);
    std::vector<ActivityRecord> out;
    for (const auto& rec : activity_) {
        if (rec.seq > seq) out.push_back(rec);
    }
    return out;
}

uint64_t BoundaryEngine::last_activity_seq() const {
    std::lock_guard<std::mutex> lock(activity_mutex_);
    return next_seq_ - 1;
}

std::vector<BoundaryViolation> BoundaryEngine::violations(const std::optional<std::string>& boundary_id,
                                                          const std::optional<Severity>& severity,
                                                          size_t limit) const {
    std::lock_guard<std::mutex> lock(violations_mutex_);
    std::vector<BoundaryViolation> out;
    for (auto it = violations_.rbegin(); it != violations_.rend() && out.size() < limit; ++it) {
        if (boundary_id && it->boundary_id != *boundary_id) continue;
        if (severity && it->severity != *severity) continue;
        out.push_back(*it);
    }
    return out;
}

size_t BoundaryEngine::total_violations() const {
    std::lock_guard<std::mutex> lock(violations_mutex_);
    return total_violations_;
}

double BoundaryEngine::health_score() const {
    double hours = static_cast<double>(monotonic_ms() - started_ms_) / 3600000.0;
    double rate = static_cast<double>(total_violations()) / std::max(1.0, hours);
    if (rate == 0.0) return 100.0;
    if (rate < 1.0) return 95.0;
    if (rate < 5.0) return 85.0;
    return 70.0;
}

Json BoundaryEngine::status() const {
    Json boundaries = Json::array();
    {
        std::lock_guard<std::mutex> lock(boundaries_mutex_);
        for (const auto& entry : boundaries_) {
            const FileSystemBoundary& b = entry.second;
            boundaries.push_back({
                {"boundary_id", b.boundary_id},
                {"boundary_type", to_string(b.boundary_type)},
                {"root_path", sanitize_utf8(b.root_path)},
                {"monitoring_enabled", b.monitoring_enabled},
                {"rules", b.access_rules.size()},
                {"integrity_hash", b.integrity_hash}
            });
        }
    }
    size_t watched = 0, pending = 0;
    bool running = false;
    {
        std::lock_guard<std::mutex> lock(watch_mutex_);
        running = running_;
        watched = watcher_ ? watcher_->watch_count() : 0;
        pending = pending_.size();
    }
    return Json{
        {"running", running},
        {"boundaries", boundaries},
        {"watched_directories", watched},
        {"pending_events", pending},
        {"total_violations", total_violations()},
        {"uptime_ms", monotonic_ms() - started_ms_},
        {"execution_context", execution_context() ? Json(*execution_context()) : Json(nullptr)}
    };
}

Json BoundaryEngine::export_report() const {
    Json boundaries = Json::array();
    {
        std::lock_guard<std::mutex> lock(boundaries_mutex_);
        for (const auto& entry : boundaries_) {
            boundaries.push_back(to_json(entry.second));
        }
    }

    Json by_type = Json::object();
    Json by_severity = Json::object();
    Json recent = Json::array();
    {
        std::lock_guard<std::mutex> lock(violations_mutex_);
        for (const auto& v : violations_) {
            by_type[v.violation_type] = by_type.value(v.violation_type, 0) + 1;
            std::string sev = to_string(v.severity);
            by_severity[sev] = by_severity.value(sev, 0) + 1;
        }
        size_t n = 0;
        for (auto it = violations_.rbegin(); it != violations_.rend() && n < 100; ++it, ++n) {
            recent.push_back(to_json(*it));
        }
    }

    return Json{
        {"generated_at", format_timestamp_ms(current_timestamp_ms())},
        {"status", status()},
        {"boundaries", boundaries},
        {"violations_by_type", by_type},
        {"violations_by_severity", by_severity},
        {"recent_violations", recent},
        {"health_score", health_score()}
    };
}

} // namespace warden
