/*
 * warden C++17 - BoundaryEngine
 *
 * Registry of filesystem boundaries (framework core, project sandboxes,
 * shared resources, quarantine), each with an ordered rule set. Observed
 * filesystem changes are debounced, classified and evaluated against the
 * owning boundary; deny/quarantine matches become BoundaryViolations that
 * are enforced through the single enforce() entry point.
 */
#ifndef warden_SECURITY_BOUNDARY_ENGINE_HPP
#define warden_SECURITY_BOUNDARY_ENGINE_HPP

#include <warden/security/events.hpp>
#include <warden/security/security_config.hpp>
#include <warden/security/file_watcher.hpp>

#include <string>
#include <vector>
#include <map>
#include <set>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <cstdint>

namespace warden {

class PathGuard;

struct FileSystemBoundary {
    std::string boundary_id;
    BoundaryType boundary_type;
    std::string root_path;
    std::vector<std::string> allowed_paths;
    std::vector<std::string> forbidden_paths;   // globs
    std::vector<BoundaryRule> access_rules;
    std::string integrity_hash;
    int64_t last_integrity_check_ms;
    EnforcementLevel enforcement_level;
    bool monitoring_enabled;
    std::optional<std::string> project_id;

    FileSystemBoundary()
        : boundary_type(BoundaryType::PROJECT_SANDBOX)
        , last_integrity_check_ms(0)
        , enforcement_level(EnforcementLevel::BLOCKING)
        , monitoring_enabled(true) {}
};

Json to_json(const FileSystemBoundary& b);

// One classified filesystem change
struct FileEvent {
    std::string path;
    FileOperation operation;
    std::optional<std::string> source_project;

    FileEvent() : operation(FileOperation::MODIFY) {}
    FileEvent(const std::string& p, FileOperation op,
              const std::optional<std::string>& source = std::nullopt)
        : path(p), operation(op), source_project(source) {}
};

struct AccessDecision {
    bool allowed;
    std::string reason;
    std::optional<BoundaryViolation> violation;

    AccessDecision() : allowed(true) {}
};

// Journal entry for every evaluated event and every gate decision
struct ActivityRecord {
    uint64_t seq;
    int64_t timestamp_ms;
    std::string source_project;   // empty when unscoped
    std::string owner_project;    // empty outside project sandboxes
    std::string zone;             // boundary type, or "none"
    FileOperation operation;
    std::string path;
    bool allowed;
    bool executable;
    bool gate;

    ActivityRecord()
        : seq(0), timestamp_ms(0), operation(FileOperation::READ)
        , allowed(true), executable(false), gate(false) {}

    // "op=create scope=p1 owner=p2 cross=yes zone=project_sandbox exec=no gate=no allowed=no path=/x"
    std::string descriptor() const;
};

class BoundaryEngine {
public:
    BoundaryEngine(const SecurityConfig& config, PathGuard& path_guard, EventQueue& events);
    ~BoundaryEngine();

    BoundaryEngine(const BoundaryEngine&) = delete;
    BoundaryEngine& operator=(const BoundaryEngine&) = delete;

    // Install watches on every monitored boundary
    bool start();
    void stop();
    bool running() const { return running_; }

    // Drain the watcher, process debounced changes, run due integrity checks
    void poll(int64_t now_ms);

    // ---- registry ----
    std::string add_project_boundary(const std::string& project_id, const std::string& root,
                                     bool allow_executables);
    std::string add_shared_resource(const std::string& resource_id, const std::string& root);
    bool remove_boundary(const std::string& boundary_id);
    bool remove_project_boundary(const std::string& project_id);

    std::optional<FileSystemBoundary> boundary(const std::string& boundary_id) const;
    std::vector<std::string> boundary_ids() const;

    // Throws std::out_of_range for an unknown boundary
    void add_rule(const std::string& boundary_id, const BoundaryRule& rule);
    bool set_rule_enabled(const std::string& boundary_id, const std::string& rule_id, bool enabled);

    // Project on whose behalf filesystem changes are currently produced
    void set_execution_context(const std::optional<std::string>& project_id);
    std::optional<std::string> execution_context() const;

    // ---- enforcement ----
    std::optional<BoundaryViolation> handle_filesystem_event(const FileEvent& event);

    // Apply the violation's remediation; returns false if it failed
    bool enforce(const BoundaryViolation& violation);

    // Synchronous check used by the access gate; never touches watcher state
    AccessDecision validate_file_access(const std::string& path, Operation operation,
                                        const std::string& project_id);

    // ---- integrity ----
    // False only when the content hash changed without recorded activity
    bool check_integrity(const std::string& boundary_id);
    void check_all_integrity();
    bool has_pending_events(const std::string& root) const;

    // ---- queries ----
    std::optional<std::string> project_for_path(const std::string& path) const;
    std::vector<ActivityRecord> activity_since(uint64_t seq) const;
    uint64_t last_activity_seq() const;

    std::vector<BoundaryViolation> violations(const std::optional<std::string>& boundary_id = std::nullopt,
                                              const std::optional<Severity>& severity = std::nullopt,
                                              size_t limit = 100) const;
    size_t total_violations() const;
    Json status() const;
    Json export_report() const;
    double health_score() const;

    static bool is_executable_path(const std::string& path);

private:
    struct PendingChange {
        FileOperation operation;
        int64_t last_change_ms;
        int64_t size;
        int64_t mtime;
    };

    struct RuleContext {
        std::string target;
        FileOperation operation;
        std::string source_project;
        std::string owner_project;
        bool executable;
    };

    void seed_default_boundaries();
    void install_boundary(FileSystemBoundary boundary);

    // Most specific boundary containing path; requires boundaries_mutex_
    const FileSystemBoundary* find_boundary_locked(const std::string& path) const;

    std::optional<BoundaryRule> evaluate_rules(const FileSystemBoundary& boundary,
                                               const RuleContext& ctx) const;
    bool condition_holds(Condition condition, const FileSystemBoundary& boundary,
                         const RuleContext& ctx) const;
    std::string source_path_for(const std::string& project_id) const;

    BoundaryViolation make_violation(const FileSystemBoundary& boundary, const BoundaryRule& rule,
                                     const RuleContext& ctx) const;
    void store_violation(const BoundaryViolation& violation);

    void record_activity(const RuleContext& ctx, const std::string& zone, bool allowed, bool gate);
    void mark_dirty(const std::string& path);
    void suppress(const std::string& path);

    bool quarantine_artifact(const BoundaryViolation& violation, std::string& detail);

    void queue_change(const WatchEvent& event, int64_t now_ms);
    void process_due_changes(int64_t now_ms);

    SecurityConfig config_;
    PathGuard& path_guard_;
    EventQueue& events_;

    mutable std::mutex boundaries_mutex_;
    std::map<std::string, FileSystemBoundary> boundaries_;
    std::set<std::string> dirty_;

    mutable std::mutex context_mutex_;
    std::optional<std::string> execution_context_;

    mutable std::mutex watch_mutex_;
    std::unique_ptr<FileWatcher> watcher_;
    std::map<std::string, PendingChange> pending_;
    std::map<std::string, int64_t> suppressed_;
    bool running_;
    int64_t last_integrity_run_ms_;
    int64_t started_ms_;

    mutable std::mutex violations_mutex_;
    std::deque<BoundaryViolation> violations_;
    size_t total_violations_;

    mutable std::mutex activity_mutex_;
    std::deque<ActivityRecord> activity_;
    uint64_t next_seq_;
};

} // namespace warden

#endif // warden_SECURITY_BOUNDARY_ENGINE_HPP
